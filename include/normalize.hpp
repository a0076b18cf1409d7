#ifndef __NORMALIZE_HPP__
#define __NORMALIZE_HPP__

#include <map>
#include <string>
#include <vector>

#include "laitools.hpp"
#include "dates.hpp"
#include "raster.hpp"
#include "zonal.hpp"

namespace laitools {

    namespace lai {

        // A per-class scale factor and how it was derived.
        class L_DLL_EXPORT Factor {
        public:
            enum Status {
                Ratio = 0,              // base.mean / predicted.mean
                ZeroPredictedMean = 1,  // predicted mean is zero; factor is 1.0
                NoBasePixels = 2,       // undefined
                NoPredictedPixels = 3   // undefined
            };

            Status status;
            double value;   // NaN when undefined.

            Factor();
            Factor(Status status, double value);

            bool defined() const;

            static std::string statusName(Status status);
        };

        // Recorded (not raised) when a class has no defined factor on a date.
        class L_DLL_EXPORT UndefinedFactorWarning {
        public:
            laitools::util::Date date;
            int classId;
            Factor::Status reason;

            UndefinedFactorWarning(const laitools::util::Date &date, int classId, Factor::Status reason);

            std::string message() const;
        };

        class L_DLL_EXPORT NormalizationEngine {
        public:

            // Derive the factor that scales predicted-period LAI to the base period.
            Factor deriveFactor(const ClassStatistics &base, const ClassStatistics &predicted) const;

            // Derive factors for every class present in both maps. Only defined factors
            // are returned; the others are appended to warnings.
            std::map<int, double> deriveFactors(const laitools::util::Date &date,
                const std::map<int, ClassStatistics> &base,
                const std::map<int, ClassStatistics> &predicted,
                std::vector<UndefinedFactorWarning> &warnings) const;

            // Multiply each forecast pixel by the factor of its class. Pixels that are
            // nodata in either raster, or whose class has no factor, become nodata. The
            // rasters must be co-registered, otherwise GridMismatchError is thrown.
            laitools::raster::MemRaster apply(const laitools::raster::MemRaster &forecast,
                const laitools::raster::MemRaster &classes,
                const std::map<int, double> &factors) const;
        };

    } // lai

} // laitools

#endif
