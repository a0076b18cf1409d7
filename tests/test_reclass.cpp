#include <stdexcept>

#include <catch2/catch.hpp>

#include "reclass.hpp"
#include "testutil.hpp"

using namespace laitools::raster;
using namespace laitools::lai;
using namespace laitools::test;

TEST_CASE("Vegetation classes are declared in order", "[reclass]") {
	VegetationClasses classes = VegetationClasses::parse("620=grassland, 610=forest,700");

	REQUIRE(classes.size() == 3);
	REQUIRE(classes.ids() == std::vector<int>({620, 610, 700}));
	REQUIRE(classes.contains(610));
	REQUIRE_FALSE(classes.contains(611));
	REQUIRE(classes.name(610) == "forest");
	REQUIRE(classes.name(700) == "700");
	REQUIRE(classes.toString() == "620=grassland,610=forest,700");

	REQUIRE_THROWS_AS(VegetationClasses::parse("610,610"), std::invalid_argument);
	REQUIRE_THROWS_AS(VegetationClasses::parse("0"), std::invalid_argument);
	REQUIRE_THROWS_AS(VegetationClasses::parse("x=forest"), std::invalid_argument);
	REQUIRE(VegetationClasses::parse("").empty());
}

TEST_CASE("Raw codes are reduced to declared classes", "[reclass]") {
	VegetationClasses classes = VegetationClasses::parse("610,620");
	std::map<int, int> repl = {{611, 610}, {612, 610}, {613, 610}};
	Reclassifier reclass(classes, {1, 2, 3}, repl);
	GridProps props = makeProps(1, 1);
	props.setNoData(-1);

	SECTION("digits are selected then replaced") {
		REQUIRE(reclass.reclassify(6110, props) == 610);
		REQUIRE(reclass.reclassify(6135, props) == 610);
		REQUIRE(reclass.reclassify(6209, props) == 620);
		REQUIRE(reclass.reclassify(610, props) == 610);
	}

	SECTION("undeclared, nodata and negative values have no class") {
		REQUIRE(reclass.reclassify(7001, props) == NO_CLASS);
		REQUIRE(reclass.reclassify(-1, props) == NO_CLASS);
		REQUIRE(reclass.reclassify(-6100, props) == NO_CLASS);
		REQUIRE(reclass.reclassify(L_NODATA, props) == NO_CLASS);
		REQUIRE(reclass.reclassify(61, props) == NO_CLASS);
	}

	SECTION("without digits the code is used as is") {
		Reclassifier plain(classes);
		REQUIRE(plain.reclassify(620, props) == 620);
		REQUIRE(plain.reclassify(6200, props) == NO_CLASS);
	}

	SECTION("codes beyond the integer range have no class") {
		REQUIRE(reclass.reclassify(3.0e9, props) == NO_CLASS);
		REQUIRE(reclass.reclassify(1.0e300, props) == NO_CLASS);
		Reclassifier plain(classes);
		REQUIRE(plain.reclassify(1.0e12, props) == NO_CLASS);
		// Eleven copies of the first digit do not fit in an int.
		Reclassifier repeated(classes, std::vector<int>(11, 1));
		REQUIRE(repeated.reclassify(6, props) == NO_CLASS);
	}

	SECTION("digit positions are 1-based") {
		REQUIRE_THROWS_AS(Reclassifier(classes, {0, 1}), std::invalid_argument);
	}
}

TEST_CASE("Reclassified rasters use the no-class value as nodata", "[reclass]") {
	VegetationClasses classes = VegetationClasses::parse("610,620");
	Reclassifier reclass(classes, {1, 2, 3}, {{611, 610}});
	MemRaster raw = makeRaster(2, 2, {6110, 6201, L_NODATA, 9999});
	MemRaster out = reclass.reclassify(raw);

	REQUIRE(out.props().nodata() == NO_CLASS);
	REQUIRE(out.props().isCoregistered(raw.props()));
	REQUIRE(out.getInt(0L) == 610);
	REQUIRE(out.getInt(1L) == 620);
	REQUIRE(out.isNodata(2));
	REQUIRE(out.isNodata(3));
	REQUIRE(out.validCount() == 2);
}
