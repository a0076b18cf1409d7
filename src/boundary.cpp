/*
 * boundary.cpp
 */

#include <vector>

#include <gdal_priv.h>
#include <gdal_alg.h>
#include <ogrsf_frmts.h>
#include <ogr_spatialref.h>
#include <cpl_conv.h>

#include "laitools.hpp"
#include "util.hpp"
#include "boundary.hpp"

using namespace laitools::raster;
using namespace laitools::lai;

namespace {

	class DSCloser {
	public:
		void operator()(GDALDataset *ds) const {
			GDALClose(ds);
		}
	};

	class CTDeleter {
	public:
		void operator()(OGRCoordinateTransformation *ct) const {
			OGRCoordinateTransformation::DestroyCT(ct);
		}
	};

} // anon

Boundary::Boundary(const std::string &filename) :
	m_filename(filename) {

	if (!laitools::util::Util::exists(filename))
		l_boundaryerr("The boundary file does not exist: " << filename);

	GDALAllRegister();

	std::unique_ptr<GDALDataset, DSCloser> ds((GDALDataset *) GDALOpenEx(filename.c_str(),
			GDAL_OF_VECTOR | GDAL_OF_READONLY, NULL, NULL, NULL));
	if (!ds)
		l_boundaryerr("Failed to open the boundary file: " << filename);

	OGRLayer *layer = ds->GetLayer(0);
	if (!layer)
		l_boundaryerr("No layer was found in the boundary file: " << filename);

	OGRSpatialReference *srs = layer->GetSpatialRef();
	if (srs) {
		char *wkt = nullptr;
		if (srs->exportToWkt(&wkt) == OGRERR_NONE && wkt)
			m_projection = wkt;
		CPLFree(wkt);
	}

	layer->ResetReading();
	OGRFeature *feat;
	while ((feat = layer->GetNextFeature()) != nullptr) {
		OGRGeometry *geom = feat->GetGeometryRef();
		if (geom && !geom->IsEmpty())
			m_geoms.push_back(std::unique_ptr<OGRGeometry>(geom->clone()));
		OGRFeature::DestroyFeature(feat);
	}

	if (m_geoms.empty())
		l_boundaryerr("The boundary file contains no geometries: " << filename);

	l_debug("Loaded " << m_geoms.size() << " boundary geometries from " << filename);
}

MemRaster Boundary::mask(const GridProps &props) const {

	GDALDriver *drv = GetGDALDriverManager()->GetDriverByName("MEM");
	if (!drv)
		l_runerr("The MEM driver is not available.");

	std::unique_ptr<GDALDataset, DSCloser> ds(drv->Create("", props.cols(), props.rows(), 1, GDT_Byte, NULL));
	if (!ds)
		l_runerr("Failed to create the mask dataset.");
	double trans[6];
	props.trans(trans);
	ds->SetGeoTransform(trans);
	ds->GetRasterBand(1)->Fill(0);

	// Clone the geometries so they can be reprojected to the grid.
	std::vector<std::unique_ptr<OGRGeometry> > geoms;
	for (const std::unique_ptr<OGRGeometry> &g : m_geoms)
		geoms.push_back(std::unique_ptr<OGRGeometry>(g->clone()));

	if (m_projection.empty() || props.projection().empty()) {
		l_warn("The boundary or grid CRS is undefined; using the boundary coordinates as they are.");
	} else {
		OGRSpatialReference src;
		OGRSpatialReference dst;
		if (src.importFromWkt(m_projection.c_str()) != OGRERR_NONE)
			l_boundaryerr("Failed to parse the boundary CRS.");
		if (dst.importFromWkt(props.projection().c_str()) != OGRERR_NONE)
			l_boundaryerr("Failed to parse the grid CRS.");
		src.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
		dst.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
		if (!src.IsSame(&dst)) {
			std::unique_ptr<OGRCoordinateTransformation, CTDeleter> ct(OGRCreateCoordinateTransformation(&src, &dst));
			if (!ct)
				l_boundaryerr("Failed to create a transformation from the boundary CRS to the grid CRS.");
			for (std::unique_ptr<OGRGeometry> &g : geoms) {
				if (g->transform(ct.get()) != OGRERR_NONE)
					l_boundaryerr("Failed to reproject a boundary geometry.");
			}
		}
	}

	std::vector<OGRGeometryH> handles;
	for (std::unique_ptr<OGRGeometry> &g : geoms)
		handles.push_back((OGRGeometryH) g.get());
	std::vector<double> burn(handles.size(), 1.0);
	int band = 1;

	if (CE_None != GDALRasterizeGeometries((GDALDatasetH) ds.get(), 1, &band, (int) handles.size(), handles.data(),
			NULL, NULL, burn.data(), NULL, NULL, NULL))
		l_runerr("Failed to rasterize the boundary.");

	GridProps mprops(props);
	mprops.setDataType(DataType::Byte);
	mprops.setNoData(L_NODATA);
	MemRaster out(mprops);
	if (CE_None != ds->GetRasterBand(1)->RasterIO(GF_Read, 0, 0, props.cols(), props.rows(),
			out.grid(), props.cols(), props.rows(), GDT_Float64, 0, 0))
		l_runerr("Failed to read the rasterized boundary.");

	long inside = 0;
	for (long i = 0; i < mprops.size(); ++i) {
		if (out.getFloat(i) == 1)
			++inside;
	}
	l_debug("The study area mask covers " << inside << " of " << mprops.size() << " cells");
	return out;
}

MemRaster Boundary::fullMask(const GridProps &props) {
	GridProps mprops(props);
	mprops.setDataType(DataType::Byte);
	mprops.setNoData(L_NODATA);
	MemRaster out(mprops);
	out.fillFloat(1);
	return out;
}

size_t Boundary::size() const {
	return m_geoms.size();
}

const std::string& Boundary::projection() const {
	return m_projection;
}

const std::string& Boundary::filename() const {
	return m_filename;
}
