/*
 * boundary.hpp
 *
 * The study area boundary: a vector data set rasterized onto a grid to
 * produce the study area mask.
 */

#ifndef INCLUDE_BOUNDARY_HPP_
#define INCLUDE_BOUNDARY_HPP_

#include <memory>
#include <string>
#include <vector>

#include <ogrsf_frmts.h>

#include "laitools.hpp"
#include "raster.hpp"

namespace laitools {

    namespace lai {

        class L_DLL_EXPORT Boundary {
        private:
            std::string m_filename;
            std::string m_projection;       // WKT of the layer CRS. May be empty.
            std::vector<std::unique_ptr<OGRGeometry> > m_geoms;

        public:

            /**
             * Load the geometries of the first layer of the given vector file.
             * Throws BoundaryReadError if the file can't be opened or contains
             * no geometries.
             *
             * \param filename A vector file readable by OGR.
             */
            Boundary(const std::string &filename);

            Boundary(const Boundary&) = delete;
            Boundary& operator=(const Boundary&) = delete;

            /**
             * Rasterize the boundary onto the given grid. Cells covered by the boundary
             * (by centre) are 1, all others are 0. The geometries are reprojected to the
             * grid CRS if the two differ. If either CRS is undefined, the geometries are
             * used as they are.
             *
             * \param props The grid properties.
             * \return The study area mask.
             */
            laitools::raster::MemRaster mask(const laitools::raster::GridProps &props) const;

            // Return the number of geometries.
            size_t size() const;

            const std::string& projection() const;

            const std::string& filename() const;

            // A mask of ones covering the whole grid. Used when no boundary is given.
            static laitools::raster::MemRaster fullMask(const laitools::raster::GridProps &props);

        };

    } // lai

} // laitools

#endif
