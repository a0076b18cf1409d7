#ifndef __ZONAL_HPP__
#define __ZONAL_HPP__

#include <map>
#include <vector>

#include "laitools.hpp"
#include "raster.hpp"
#include "reclass.hpp"

namespace laitools {

    namespace lai {

        // Summary of the LAI values of one class on one date. When count is
        // zero, every other member is NaN.
        class L_DLL_EXPORT ClassStatistics {
        public:
            long count;
            double mean;
            double stddev;  // Population standard deviation.
            double min;
            double q1;
            double median;
            double q3;
            double max;

            ClassStatistics();
        };

        namespace util {

            // Accumulates the values of a single class. Values are kept in
            // the order they were added, which fixes the summation order.
            class Stat {
            private:
                std::vector<double> m_values;

            public:

                void add(double value);

                long count() const;

                // Computes the statistics. Sums are taken in insertion order;
                // quantiles interpolate linearly between closest ranks.
                ClassStatistics compute() const;

                // The p-quantile (0 <= p <= 1) of sorted values.
                static double quantile(const std::vector<double> &sorted, double p);
            };

        } // util

        // Per-class statistics of a LAI raster over a class raster.
        class L_DLL_EXPORT ZonalAggregator {
        private:
            VegetationClasses m_classes;

        public:

            ZonalAggregator(const VegetationClasses &classes);

            // Aggregate lai by class. A pixel counts toward class c if the mask is
            // non-zero, the class is c and the LAI value is not nodata. There is an
            // entry for every declared class. The three rasters must be co-registered,
            // otherwise GridMismatchError is thrown.
            std::map<int, ClassStatistics> aggregate(const laitools::raster::MemRaster &lai,
                const laitools::raster::MemRaster &classes,
                const laitools::raster::MemRaster &mask) const;

        };

    } // lai

} // laitools

#endif
