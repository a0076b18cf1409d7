#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <ogr_spatialref.h>

#include "boundary.hpp"
#include "testutil.hpp"

using namespace laitools;
using namespace laitools::raster;
using namespace laitools::lai;
using namespace laitools::test;

namespace {

	// Write polygons given as WKT to a shapefile, with a CRS if one is given.
	void writeShapefile(const std::string &filename, const std::vector<std::string> &wkts,
			const std::string &crs = "") {
		GDALAllRegister();
		GDALDriver *drv = GetGDALDriverManager()->GetDriverByName("ESRI Shapefile");
		REQUIRE(drv != nullptr);
		GDALDataset *ds = drv->Create(filename.c_str(), 0, 0, 0, GDT_Unknown, NULL);
		REQUIRE(ds != nullptr);
		OGRSpatialReference srs;
		if (!crs.empty())
			REQUIRE(srs.importFromWkt(crs.c_str()) == OGRERR_NONE);
		OGRLayer *layer = ds->CreateLayer("boundary", crs.empty() ? NULL : &srs, wkbPolygon, NULL);
		REQUIRE(layer != nullptr);
		for (const std::string &wkt : wkts) {
			OGRGeometry *geom = nullptr;
			REQUIRE(OGRGeometryFactory::createFromWkt(wkt.c_str(), NULL, &geom) == OGRERR_NONE);
			OGRFeature *feat = OGRFeature::CreateFeature(layer->GetLayerDefn());
			feat->SetGeometryDirectly(geom);
			REQUIRE(layer->CreateFeature(feat) == OGRERR_NONE);
			OGRFeature::DestroyFeature(feat);
		}
		GDALClose(ds);
	}

} // anon

TEST_CASE("The boundary is rasterized onto the grid", "[boundary][io]") {
	TempDir tmp;
	std::string file = tmp.file("boundary.shp");
	// Covers the left half of a 4x2 grid whose top-left corner is (0, 0).
	writeShapefile(file, {"POLYGON ((0 0, 2 0, 2 -2, 0 -2, 0 0))"});

	Boundary boundary(file);
	REQUIRE(boundary.size() == 1);
	REQUIRE(boundary.projection().empty());

	GridProps props = makeProps(4, 2);
	MemRaster mask = boundary.mask(props);

	REQUIRE(mask.props().isCoregistered(props));
	REQUIRE(mask.getFloat(0, 0) == 1);
	REQUIRE(mask.getFloat(1, 1) == 1);
	REQUIRE(mask.getFloat(2, 0) == 0);
	REQUIRE(mask.getFloat(3, 1) == 0);
}

TEST_CASE("A boundary in another CRS is reprojected onto the grid", "[boundary][io][crs]") {
	TempDir tmp;
	std::string file = tmp.file("geographic.shp");
	// The degree west of the 123W meridian, which is the central meridian of UTM 10N.
	writeShapefile(file, {"POLYGON ((-124 46, -123 46, -123 44, -124 44, -124 46))"}, WGS84_WKT);

	Boundary boundary(file);
	REQUIRE_FALSE(boundary.projection().empty());

	// Four 1 km columns, two either side of the meridian.
	GridProps props = makeProps(4, 2, 1000.0, 498000.0, 5000000.0, UTM10N_WKT);
	MemRaster mask = boundary.mask(props);

	REQUIRE(mask.props().isCoregistered(props));
	for (int r = 0; r < 2; ++r) {
		REQUIRE(mask.getFloat(0, r) == 1);
		REQUIRE(mask.getFloat(1, r) == 1);
		REQUIRE(mask.getFloat(2, r) == 0);
		REQUIRE(mask.getFloat(3, r) == 0);
	}
}

TEST_CASE("Missing or empty boundaries are errors", "[boundary][io]") {
	TempDir tmp;
	REQUIRE_THROWS_AS(Boundary(tmp.file("missing.shp")), BoundaryReadError);

	std::string empty = tmp.file("empty.shp");
	writeShapefile(empty, {});
	REQUIRE_THROWS_AS(Boundary(empty), BoundaryReadError);
}

TEST_CASE("Without a boundary the mask covers the grid", "[boundary]") {
	GridProps props = makeProps(3, 2);
	MemRaster mask = Boundary::fullMask(props);
	REQUIRE(mask.props().isCoregistered(props));
	for (long i = 0; i < props.size(); ++i)
		REQUIRE(mask.getFloat(i) == 1);
}
