#ifndef __ALIGN_HPP__
#define __ALIGN_HPP__

#include "laitools.hpp"
#include "raster.hpp"

namespace laitools {

    namespace raster {

        enum Resample {
            Nearest = 0,    // For class rasters; preserves labels.
            Bilinear = 1    // For continuous rasters.
        };

        // Brings a raster onto the grid of a reference raster: same transform,
        // CRS and shape. Inputs are never modified.
        class L_DLL_EXPORT GridAligner {
        public:

            // Returns target resampled (and reprojected if the CRSs differ) onto
            // the grid of reference. A target that is already co-registered is
            // returned as a copy. Throws GridMismatchError if either CRS is
            // undefined, the CRSs cannot be related, or no valid pixel results.
            MemRaster align(const MemRaster &reference, const MemRaster &target,
                Resample method) const;

            // As above, using only the reference's properties.
            MemRaster align(const GridProps &reference, const MemRaster &target,
                Resample method) const;

        };

    } // raster

} // laitools

#endif
