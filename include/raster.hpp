/**
 * raster.hpp
 *
 * Grid properties, in-memory rasters and the GDAL-backed raster store.
 */

#ifndef INCLUDE_RASTER_HPP_
#define INCLUDE_RASTER_HPP_

#include <string>
#include <vector>

#include <gdal_priv.h>
#include <ogr_spatialref.h>

#include "laitools.hpp"

namespace laitools {

    namespace raster {

		enum DataType {
			Float64 = 7, Float32 = 6, UInt32 = 5, UInt16 = 4, Byte = 3, Int32 = 2, Int16 = 1, None = 0
		};

		// Properties of a grid: geotransform, size, CRS and nodata value.
    	class L_DLL_EXPORT GridProps {
    	private:
    		double m_trans[6];			// The geotransform properties.
    		int m_cols, m_rows;			// The number of rows and columns.
            int m_bands;           		// The number of bands.
            bool m_writable;            // True if the raster is writable
            double m_nodata;			// The nodata value. May be NaN.
    		DataType m_type;
    		std::string m_projection;	// The WKT representation of the projection

    	public:

    		GridProps();

    		double nodata() const;

    		void setNoData(double nodata);

    		// Returns true if the value is equal to the nodata value or NaN.
    		bool isNodata(double value) const;

    		// Return the number of columns.
            int cols() const;

            // Return the number of rows.
            int rows() const;

            // Returns true if the cell is in the raster.
            bool hasCell(int col, int row) const;

            // Returns the row for a given y-coordinate.
            int toRow(double y) const;

            // Returns the column for a given x-coordinate.
            int toCol(double x) const;

            // Returns the x-coordinate for the cell centroid of a given column.
            double toCentroidX(int col) const;

            // Returns the y-coordinate for the cell centorid of a given row.
            double toCentroidY(int row) const;

            // Returns the number of pixels.
            long size() const;

            // Set the data type of the raster.
    		void setDataType(DataType type);

    		// Get the data type of the raster.
    		DataType dataType() const;

    		// Set the size of the raster in columns, rows.
    		void setSize(int cols, int rows);

    		// Set the WKT projection.
    		void setProjection(const std::string &proj);

    		// Get the WKT projection.
    		std::string projection() const;

    		// Set the geo transform properties.
    		void setTrans(const double trans[6]);

    		// Get the geo transform properties.
    		void trans(double trans[6]) const;

    		// Get the horizontal resolution.
    		double resolutionX() const;

    		// Get the vertical resolution (negative for north-up grids).
    		double resolutionY() const;

    		double tlx() const;

    		double tly() const;

    		// Returns true if the grid has rotation terms.
    		bool isRotated() const;

    		// Set the number of bands.
    		void setBands(int bands);

    		// Get the number of bands.
    		int bands() const;

    		// Set the writable state of the raster.
    		void setWritable(bool writable);

    		// Get the writable state of the raster.
    		bool writable() const;

    		// Returns true if both grids have a CRS and the CRSs are equivalent.
    		bool sameProjection(const GridProps &other) const;

    		// Returns true if the transform, CRS and shape match exactly.
    		bool isCoregistered(const GridProps &other) const;
    	};

        // An immutable-by-convention grid of values held in memory.
        // Samples are stored row-major as doubles regardless of the
        // nominal data type.
        class L_DLL_EXPORT MemRaster {
        private:
            std::vector<double> m_grid;
            GridProps m_props;

        public:
            MemRaster();

            MemRaster(const GridProps &props);

            const GridProps& props() const;

            // Initialize with the given properties. (Re)allocates memory for
            // the internal grid and fills it with nodata.
            void init(const GridProps &props);

            // Fill the entire dataset with the given value.
            void fillFloat(double value);

            // Return the value held at the given index in the grid.
            int getInt(long idx) const;
            int getInt(int col, int row) const;
            double getFloat(long idx) const;
            double getFloat(int col, int row) const;

            // Set the value held at the given index in the grid.
            void setInt(long idx, int value);
            void setInt(int col, int row, int value);
            void setFloat(long idx, double value);
            void setFloat(int col, int row, double value);

            // Returns true if the pixel at idx is nodata.
            bool isNodata(long idx) const;

            // Return a pointer to the allocated memory.
            double* grid();
            const double* grid() const;

            // Returns the number of pixels that are not nodata.
            long validCount() const;

        };

        // A GDAL dataset on disk.
        class L_DLL_EXPORT Raster {
        private:
            GDALDataset *m_ds;          // GDAL dataset
            std::string m_filename;     // Raster filename
            GridProps m_props;

            Raster(const Raster&) = delete;
            Raster& operator=(const Raster&) = delete;

        public:

            // Create a new GeoTIFF for writing with a template.
            Raster(const std::string &filename, const GridProps &props);

            // Open the given raster for reading.
            explicit Raster(const std::string &filename);

            // Return the grid properties object.
            const GridProps& props() const;

            // Return the filename for this raster.
            std::string filename() const;

            // Read the whole band into the grid, which must have the same size.
            void readBlock(MemRaster &grd, int band = 1);

            // Write the whole grid into the band. Sizes must match.
            void writeBlock(const MemRaster &grd, int band = 1);

            // Flush the current block to the dataset.
            void flush();

            ~Raster();

        };

        // Read the first band of a raster file. Fails with RasterReadError if the file
        // is missing, unreadable or has no CRS. If negativeAsNodata is true, negative
        // samples are replaced by nodata.
        L_DLL_EXPORT MemRaster readRaster(const std::string &filename, bool negativeAsNodata = false);

        // Write the grid as a single-band Float32 GeoTIFF with its transform, CRS and
        // nodata. Fails with RasterWriteError. A partially-written file is removed.
        L_DLL_EXPORT void writeRaster(const std::string &filename, const MemRaster &grd);

    } // raster

} // laitools


#endif
