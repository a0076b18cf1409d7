#include <string>
#include <cmath>
#include <algorithm>

#include <cpl_string.h>
#include <cpl_port.h>

#include "laitools.hpp"
#include "util.hpp"
#include "raster.hpp"

using namespace laitools::util;
using namespace laitools::raster;

namespace {

	GDALDataType _dataType2GDT(DataType type) {
		switch(type) {
		case DataType::Byte:  	return GDT_Byte;
		case DataType::UInt16: 	return GDT_UInt16;
		case DataType::UInt32:	return GDT_UInt32;
		case DataType::Int16:	return GDT_Int16;
		case DataType::Int32:	return GDT_Int32;
		case DataType::Float64:	return GDT_Float64;
		case DataType::Float32:	return GDT_Float32;
		case DataType::None:
		default:
			break;
		}
		return GDT_Unknown;
	}

	DataType _gdt2DataType(GDALDataType type) {
		switch(type) {
		case GDT_Byte:	  	return DataType::Byte;
		case GDT_UInt16: 	return DataType::UInt16;
		case GDT_UInt32:	return DataType::UInt32;
		case GDT_Int16:		return DataType::Int16;
		case GDT_Int32:		return DataType::Int32;
		case GDT_Float64:	return DataType::Float64;
		case GDT_Float32:	return DataType::Float32;
		default:
			break;
		}
		return DataType::None;
	}

} // anon

GridProps::GridProps() :
		m_cols(0), m_rows(0),
		m_bands(1),           		// The number of bands
		m_writable(false),			// True if the grid is writable
		m_nodata(L_NODATA),
		m_type(DataType::Float64) {	// The data type.
	// North-up unit grid at the origin.
	m_trans[0] = 0;
	m_trans[1] = 1;
	m_trans[2] = 0;
	m_trans[3] = 0;
	m_trans[4] = 0;
	m_trans[5] = -1;
}

double GridProps::nodata() const {
	return m_nodata;
}

void GridProps::setNoData(double nodata) {
	m_nodata = nodata;
}

bool GridProps::isNodata(double value) const {
	return std::isnan(value) || value == m_nodata;
}

bool GridProps::hasCell(int col, int row) const {
	return !(col < 0 || row < 0 || row >= m_rows || col >= m_cols);
}

int GridProps::toRow(double y) const {
	return (int) std::floor((y - m_trans[3]) / m_trans[5]);
}

int GridProps::toCol(double x) const {
	return (int) std::floor((x - m_trans[0]) / m_trans[1]);
}

double GridProps::toCentroidX(int col) const {
	return m_trans[0] + (col + 0.5) * m_trans[1];
}

double GridProps::toCentroidY(int row) const {
	return m_trans[3] + (row + 0.5) * m_trans[5];
}

long GridProps::size() const {
	return (long) m_cols * m_rows;
}

double GridProps::resolutionX() const {
	return m_trans[1];
}

double GridProps::resolutionY() const {
	return m_trans[5];
}

double GridProps::tlx() const {
	return m_trans[0];
}

double GridProps::tly() const {
	return m_trans[3];
}

bool GridProps::isRotated() const {
	return m_trans[2] != 0 || m_trans[4] != 0;
}

void GridProps::setDataType(DataType type) {
	m_type = type;
}

DataType GridProps::dataType() const {
	return m_type;
}

void GridProps::setSize(int cols, int rows) {
	m_cols = cols;
	m_rows = rows;
}

int GridProps::cols() const {
	return m_cols;
}

int GridProps::rows() const {
	return m_rows;
}

void GridProps::setProjection(const std::string &proj) {
	m_projection = proj;
}

std::string GridProps::projection() const {
	return m_projection;
}

void GridProps::setTrans(const double trans[6]) {
	for(int i = 0; i < 6; ++i)
		m_trans[i] = trans[i];
}

void GridProps::trans(double trans[6]) const {
	for(int i = 0; i < 6; ++i)
		trans[i] = m_trans[i];
}

void GridProps::setBands(int bands) {
	m_bands = bands;
}

int GridProps::bands() const {
	return m_bands;
}

void GridProps::setWritable(bool writable) {
	m_writable = writable;
}

bool GridProps::writable() const {
	return m_writable;
}

bool GridProps::sameProjection(const GridProps &other) const {
	if (m_projection.empty() || other.m_projection.empty())
		return false;
	if (m_projection == other.m_projection)
		return true;
	OGRSpatialReference a;
	OGRSpatialReference b;
	if (a.importFromWkt(m_projection.c_str()) != OGRERR_NONE
			|| b.importFromWkt(other.m_projection.c_str()) != OGRERR_NONE)
		return false;
	return a.IsSame(&b) != 0;
}

bool GridProps::isCoregistered(const GridProps &other) const {
	if (m_cols != other.m_cols || m_rows != other.m_rows)
		return false;
	for (int i = 0; i < 6; ++i) {
		if (m_trans[i] != other.m_trans[i])
			return false;
	}
	return sameProjection(other);
}

// Implementations for MemRaster

MemRaster::MemRaster() {
}

MemRaster::MemRaster(const GridProps &props) {
	init(props);
}

const GridProps& MemRaster::props() const {
	return m_props;
}

void MemRaster::init(const GridProps &pr) {
	if (pr.cols() < 0 || pr.rows() < 0)
		l_argerr("Columns and rows must not be negative.");
	m_props = pr;
	m_grid.assign((size_t) pr.size(), pr.nodata());
}

void MemRaster::fillFloat(double value) {
	std::fill(m_grid.begin(), m_grid.end(), value);
}

double MemRaster::getFloat(long idx) const {
	if (idx < 0 || idx >= props().size())
		l_argerr("Index out of bounds: " << idx << "; size: " << props().size());
	return m_grid[(size_t) idx];
}

double MemRaster::getFloat(int col, int row) const {
	if (!props().hasCell(col, row))
		l_argerr("Cell out of bounds: " << col << ", " << row);
	return m_grid[(size_t) row * props().cols() + col];
}

int MemRaster::getInt(long idx) const {
	return (int) getFloat(idx);
}

int MemRaster::getInt(int col, int row) const {
	return (int) getFloat(col, row);
}

void MemRaster::setFloat(long idx, double value) {
	if (idx < 0 || idx >= props().size())
		l_argerr("Index out of bounds: " << idx << "; size: " << props().size()
				<< "; value: " << value);
	m_grid[(size_t) idx] = value;
}

void MemRaster::setFloat(int col, int row, double value) {
	if (!props().hasCell(col, row))
		l_argerr("Cell out of bounds: " << col << ", " << row);
	m_grid[(size_t) row * props().cols() + col] = value;
}

void MemRaster::setInt(long idx, int value) {
	setFloat(idx, (double) value);
}

void MemRaster::setInt(int col, int row, int value) {
	setFloat(col, row, (double) value);
}

bool MemRaster::isNodata(long idx) const {
	return m_props.isNodata(getFloat(idx));
}

double* MemRaster::grid() {
	return m_grid.data();
}

const double* MemRaster::grid() const {
	return m_grid.data();
}

long MemRaster::validCount() const {
	long count = 0;
	for (double v : m_grid) {
		if (!m_props.isNodata(v))
			++count;
	}
	return count;
}

// Implementations for Raster

Raster::Raster(const std::string &filename, const GridProps &props) :
		m_ds(nullptr) {

	if (props.resolutionX() == 0 || props.resolutionY() == 0)
		l_argerr("Resolution must not be zero.");
	if (props.cols() <= 0 || props.rows() <= 0)
		l_argerr("Columns and rows must be larger than zero.");
	if (filename.empty())
		l_argerr("Filename must be given.");

	m_props = props;
	m_props.setWritable(true);
	m_filename = filename;

	// Create GDAL dataset.
	char **opts = NULL;
	opts = CSLSetNameValue(opts, "COMPRESS", "LZW");
	opts = CSLSetNameValue(opts, "BIGTIFF", "IF_SAFER");
	GDALAllRegister();
	GDALDriver *drv = GetGDALDriverManager()->GetDriverByName("GTiff");
	if (!drv) {
		CSLDestroy(opts);
		l_writeerr("The GTiff driver is not available.");
	}
	m_ds = drv->Create(filename.c_str(), m_props.cols(), m_props.rows(), m_props.bands(),
			_dataType2GDT(m_props.dataType()), opts);
	CSLDestroy(opts);
	if (!m_ds)
		l_writeerr("Failed to create file: " << filename);

	// Initialize geotransform.
	double trans[6];
	m_props.trans(trans);
	m_ds->SetGeoTransform(trans);

	// Set projection.
	std::string proj = m_props.projection();
	if (!proj.empty())
		m_ds->SetProjection(proj.c_str());

	for (int b = 1; b <= m_props.bands(); ++b)
		m_ds->GetRasterBand(b)->SetNoDataValue(m_props.nodata());
}

Raster::Raster(const std::string &filename) :
		m_ds(nullptr) {

	if (filename.empty())
		l_argerr("Filename must be given.");

	m_filename = filename;

	// Attempt to open the dataset.
	GDALAllRegister();
	m_ds = (GDALDataset *) GDALOpen(filename.c_str(), GA_ReadOnly);
	if (m_ds == NULL)
		l_readerr("Failed to open raster: " << filename);
	if (m_ds->GetRasterCount() < 1) {
		GDALClose(m_ds);
		m_ds = nullptr;
		l_readerr("Raster has no bands: " << filename);
	}

	// Save some raster properties
	double trans[6];
	if (m_ds->GetGeoTransform(trans) != CE_None) {
		GDALClose(m_ds);
		m_ds = nullptr;
		l_readerr("Raster has no geotransform: " << filename);
	}
	m_props.setTrans(trans);
	m_props.setSize(m_ds->GetRasterXSize(), m_ds->GetRasterYSize());
	m_props.setDataType(_gdt2DataType(m_ds->GetRasterBand(1)->GetRasterDataType()));
	m_props.setBands(m_ds->GetRasterCount());
	m_props.setWritable(false);
	const char *proj = m_ds->GetProjectionRef();
	m_props.setProjection(proj ? std::string(proj) : std::string());
	int hasNodata = 0;
	double nodata = m_ds->GetRasterBand(1)->GetNoDataValue(&hasNodata);
	m_props.setNoData(hasNodata ? nodata : L_NODATA);
}

const GridProps& Raster::props() const {
	return m_props;
}

std::string Raster::filename() const {
	return m_filename;
}

void Raster::readBlock(MemRaster &grd, int band) {
	if (band < 1 || band > props().bands())
		l_argerr("Invalid source band: " << band);
	if (grd.props().cols() != props().cols() || grd.props().rows() != props().rows())
		l_argerr("Grid size does not match raster size.");
	if (CE_None != m_ds->GetRasterBand(band)->RasterIO(GF_Read, 0, 0, props().cols(), props().rows(),
			grd.grid(), props().cols(), props().rows(), GDT_Float64, 0, 0))
		l_readerr("Failed to read from: " << filename());
}

void Raster::writeBlock(const MemRaster &grd, int band) {
	if (!props().writable())
		l_writeerr("This raster is not writable.");
	if (band < 1 || band > props().bands())
		l_argerr("Invalid destination band: " << band);
	if (grd.props().cols() != props().cols() || grd.props().rows() != props().rows())
		l_argerr("Grid size does not match raster size.");
	// RasterIO does not modify the buffer on write.
	if (CE_None != m_ds->GetRasterBand(band)->RasterIO(GF_Write, 0, 0, props().cols(), props().rows(),
			const_cast<double*>(grd.grid()), props().cols(), props().rows(), GDT_Float64, 0, 0))
		l_writeerr("Failed to write to: " << filename());
}

void Raster::flush() {
	m_ds->FlushCache();
	if (CPLGetLastErrorType() == CE_Failure && props().writable())
		l_writeerr("Failed to flush: " << filename() << "; " << CPLGetLastErrorMsg());
}

Raster::~Raster() {
	if (m_ds)
		GDALClose(m_ds);
}

MemRaster laitools::raster::readRaster(const std::string &filename, bool negativeAsNodata) {
	if (!Util::exists(filename))
		l_readerr("Raster file does not exist: " << filename);
	Raster rast(filename);
	if (rast.props().projection().empty())
		l_readerr("Raster has an undefined CRS: " << filename);
	if (rast.props().isRotated())
		l_readerr("Rotated rasters are not supported: " << filename);
	GridProps props(rast.props());
	props.setBands(1);
	props.setWritable(false);
	MemRaster grd(props);
	rast.readBlock(grd);
	if (negativeAsNodata) {
		double nodata = props.nodata();
		for (long i = 0; i < props.size(); ++i) {
			if (grd.getFloat(i) < 0)
				grd.setFloat(i, nodata);
		}
	}
	l_debug("Read " << filename << " (" << props.cols() << "x" << props.rows() << ")");
	return grd;
}

void laitools::raster::writeRaster(const std::string &filename, const MemRaster &grd) {
	GridProps props(grd.props());
	props.setDataType(DataType::Float32);
	props.setBands(1);
	try {
		CPLErrorReset();
		Raster rast(filename, props);
		rast.writeBlock(grd);
		rast.flush();
	} catch (const std::exception &ex) {
		Util::rm(filename);
		l_writeerr("Failed to write raster " << filename << ": " << ex.what());
	}
	l_debug("Wrote " << filename);
}
