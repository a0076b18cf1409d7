#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "laimodel.hpp"
#include "util.hpp"
#include "testutil.hpp"

using namespace laitools;
using namespace laitools::raster;
using namespace laitools::lai;
using namespace laitools::lai::config;
using namespace laitools::util;
using namespace laitools::test;

namespace {

	std::shared_ptr<RasterSource> source(const MemRaster &rast) {
		return std::shared_ptr<RasterSource>(new MemRasterSource(rast));
	}

	// Keeps what it is given.
	class RecordingSink : public RasterSink {
	public:
		std::mutex mtx;
		std::vector<Date> dates;

		void put(const Date &date, const MemRaster &) {
			std::lock_guard<std::mutex> lk(mtx);
			dates.push_back(date);
		}
	};

	class FailingSink : public RasterSink {
	public:
		void put(const Date &, const MemRaster &) {
			throw RasterWriteError("disk full");
		}
	};

	class CountingCallbacks : public Callbacks {
	public:
		mutable float lastStep;
		mutable int statuses;

		CountingCallbacks() : lastStep(0), statuses(0) {}

		void stepCallback(float status) const {
			lastStep = status;
		}
		void overallCallback(float) const {}
		void statusCallback(const std::string &) const {
			++statuses;
		}
	};

	// The four-pixel example: two classes, one matched date and one base-only date.
	class Scenario {
	public:
		MemRaster classes;
		MemRaster mask;
		DailyCollection base;
		DailyCollection forecast;
		Date day;
		Date baseOnly;

		Scenario() :
			classes(makeClasses(2, 2, {1, 1, 2, 2})),
			mask(makeMask(2, 2)),
			day(2019, 5, 1),
			baseOnly(2019, 5, 2) {
			base[day] = source(makeRaster(2, 2, {2.0, 4.0, 10.0, 10.0}));
			base[baseOnly] = source(makeRaster(2, 2, {1.0, 1.0, 1.0, 1.0}));
			forecast[day] = source(makeRaster(2, 2, {1.0, 1.0, 5.0, 5.0}));
		}
	};

	std::string csv(const StatsTable &table) {
		std::stringstream ss;
		table.write(ss);
		return ss.str();
	}

} // anon

TEST_CASE("Forecast LAI is normalized per class", "[pipeline]") {
	Scenario sc;
	DailyPipeline pipeline(VegetationClasses::parse("1,2"));
	PipelineResult result = pipeline.run(sc.classes, sc.classes, sc.mask, sc.base, sc.forecast);

	REQUIRE(result.rasters.size() == 1);
	const MemRaster &out = result.rasters.at(sc.day);
	REQUIRE(out.getFloat(0L) == 3.0);
	REQUIRE(out.getFloat(1L) == 3.0);
	REQUIRE(out.getFloat(2L) == 10.0);
	REQUIRE(out.getFloat(3L) == 10.0);

	SECTION("base and predicted rows are emitted for every class") {
		const std::vector<StatsRow> &rows = result.table.rows();
		REQUIRE(rows.size() == 4);
		REQUIRE(rows[0].period == StatsTable::BASE);
		REQUIRE(rows[0].classId == 1);
		REQUIRE(rows[0].stats.mean == 3.0);
		REQUIRE(rows[1].classId == 2);
		REQUIRE(rows[1].stats.mean == 10.0);
		REQUIRE(rows[2].period == StatsTable::PREDICTED);
		REQUIRE(rows[2].stats.mean == 1.0);
		REQUIRE(rows[3].stats.mean == 5.0);
		for (const StatsRow &row : rows)
			REQUIRE(row.date == sc.day);
	}

	SECTION("a base date without a forecast is skipped") {
		const RunSummary &summary = result.summary;
		REQUIRE(summary.processed() == 1);
		REQUIRE(summary.skipped() == 1);
		REQUIRE(summary.failed() == 0);
		REQUIRE(summary.outcomes.size() == 2);
		REQUIRE(summary.outcomes[0].date == sc.day);
		REQUIRE(summary.outcomes[1].date == sc.baseOnly);
		REQUIRE(summary.outcomes[1].status == DayResult::Skipped);
		REQUIRE(summary.outcomes[1].message == "no matching forecast date");
		REQUIRE(summary.warnings.empty());
	}
}

TEST_CASE("A forecast date without a base date is skipped", "[pipeline]") {
	Scenario sc;
	Date extra(2019, 4, 30);
	sc.forecast[extra] = source(makeRaster(2, 2, {1.0, 1.0, 1.0, 1.0}));
	DailyPipeline pipeline(VegetationClasses::parse("1,2"));
	PipelineResult result = pipeline.run(sc.classes, sc.classes, sc.mask, sc.base, sc.forecast);

	REQUIRE(result.summary.outcomes.size() == 3);
	REQUIRE(result.summary.outcomes[0].date == extra);
	REQUIRE(result.summary.outcomes[0].message == "no matching base date");
	REQUIRE(result.rasters.count(extra) == 0);
}

TEST_CASE("Classes without predicted pixels become nodata", "[pipeline]") {
	Scenario sc;
	// The forecast-period map has no class 2 pixels inside the study area.
	MemRaster fclasses = makeClasses(2, 2, {1, 1, 1, 2});
	MemRaster mask = makeMask(2, 2);
	mask.setFloat(3L, 0);
	DailyPipeline pipeline(VegetationClasses::parse("1,2"));
	PipelineResult result = pipeline.run(sc.classes, fclasses, mask, sc.base, sc.forecast);

	const MemRaster &out = result.rasters.at(sc.day);
	REQUIRE(out.isNodata(3));
	REQUIRE_FALSE(out.isNodata(0));
	REQUIRE(result.summary.warnings.size() == 1);
	REQUIRE(result.summary.warnings[0].classId == 2);
	REQUIRE(result.summary.warnings[0].reason == Factor::NoPredictedPixels);
}

TEST_CASE("Pixels outside the study area are not normalized", "[pipeline]") {
	Scenario sc;
	MemRaster mask = makeMask(2, 2);
	mask.setFloat(3L, 0);
	DailyPipeline pipeline(VegetationClasses::parse("1,2"));
	PipelineResult result = pipeline.run(sc.classes, sc.classes, mask, sc.base, sc.forecast);

	const MemRaster &out = result.rasters.at(sc.day);
	REQUIRE(out.getFloat(0L) == 3.0);
	REQUIRE(out.getFloat(2L) == 10.0);
	REQUIRE(out.isNodata(3));
	REQUIRE(result.summary.warnings.empty());
}

TEST_CASE("Base nodata drops the pixel from the base statistics only", "[pipeline]") {
	Scenario sc;
	sc.base[sc.day] = source(makeRaster(2, 2, {2.0, L_NODATA, 10.0, 10.0}));
	DailyPipeline pipeline(VegetationClasses::parse("1,2"));
	PipelineResult result = pipeline.run(sc.classes, sc.classes, sc.mask, sc.base, sc.forecast);

	const std::vector<StatsRow> &rows = result.table.rows();
	REQUIRE(rows[0].period == StatsTable::BASE);
	REQUIRE(rows[0].classId == 1);
	REQUIRE(rows[0].stats.count == 1);
	REQUIRE(rows[0].stats.mean == 2.0);
	REQUIRE(rows[2].period == StatsTable::PREDICTED);
	REQUIRE(rows[2].stats.count == 2);

	// The class 1 factor is 2 / 1, and applies to the pixel with no base value.
	const MemRaster &out = result.rasters.at(sc.day);
	REQUIRE(out.getFloat(0L) == 2.0);
	REQUIRE(out.getFloat(1L) == 2.0);
}

TEST_CASE("Runs are repeatable", "[pipeline]") {
	Scenario sc;
	for (int d = 10; d < 20; ++d) {
		Date date(2019, 6, d);
		sc.base[date] = source(makeRaster(2, 2, {d * 0.1, 2.0, 3.0, d * 0.3}));
		sc.forecast[date] = source(makeRaster(2, 2, {1.0, d * 0.2, 0.5, 4.0}));
	}
	DailyPipeline single(VegetationClasses::parse("1,2"));
	DailyPipeline multi(VegetationClasses::parse("1,2"), Calendar, 4);
	PipelineResult a = single.run(sc.classes, sc.classes, sc.mask, sc.base, sc.forecast);
	PipelineResult b = single.run(sc.classes, sc.classes, sc.mask, sc.base, sc.forecast);
	PipelineResult c = multi.run(sc.classes, sc.classes, sc.mask, sc.base, sc.forecast);

	REQUIRE(a.table.size() == 44);
	REQUIRE(csv(a.table) == csv(b.table));
	REQUIRE(csv(a.table) == csv(c.table));
	REQUIRE(a.rasters.size() == 11);
	for (const auto &it : a.rasters) {
		for (long i = 0; i < 4; ++i) {
			REQUIRE(it.second.getFloat(i) == b.rasters.at(it.first).getFloat(i));
			REQUIRE(it.second.getFloat(i) == c.rasters.at(it.first).getFloat(i));
		}
	}
}

TEST_CASE("A failing date does not stop the others", "[pipeline]") {
	Scenario sc;
	Date bad(2019, 5, 3);
	GridProps nocrs = makeProps(2, 2, 1.0, 0.0, 0.0, "");
	sc.base[bad] = source(makeRaster(2, 2, {1.0, 1.0, 1.0, 1.0}));
	sc.forecast[bad] = source(makeRaster(nocrs, {1.0, 1.0, 1.0, 1.0}));
	DailyPipeline pipeline(VegetationClasses::parse("1,2"));
	PipelineResult result = pipeline.run(sc.classes, sc.classes, sc.mask, sc.base, sc.forecast);

	REQUIRE(result.summary.processed() == 1);
	REQUIRE(result.summary.failed() == 1);
	REQUIRE(result.summary.outcomes.back().date == bad);
	REQUIRE_FALSE(result.summary.outcomes.back().message.empty());
	REQUIRE(result.rasters.count(bad) == 0);
	REQUIRE(result.table.size() == 4);
}

TEST_CASE("Dates can be matched by day of year", "[pipeline]") {
	Scenario sc;
	DailyCollection forecast;
	// Both are day 121.
	Date fday(2020, 4, 30);
	forecast[fday] = sc.forecast[sc.day];
	DailyPipeline pipeline(VegetationClasses::parse("1,2"), DayOfYear);
	PipelineResult result = pipeline.run(sc.classes, sc.classes, sc.mask, sc.base, forecast);

	REQUIRE(result.summary.processed() == 1);
	REQUIRE(result.rasters.count(fday) == 1);
	REQUIRE(result.table.rows()[0].date == sc.day);
	REQUIRE(result.table.rows()[2].date == fday);
}

TEST_CASE("A base date shared by several forecast years is reported once", "[pipeline]") {
	Scenario sc;
	DailyCollection base;
	base[sc.day] = sc.base[sc.day];
	DailyCollection forecast;
	Date first(2030, 5, 1);
	Date second(2031, 5, 1);
	forecast[first] = sc.forecast[sc.day];
	forecast[second] = sc.forecast[sc.day];
	DailyPipeline pipeline(VegetationClasses::parse("1,2"), DayOfYear, 2);
	PipelineResult result = pipeline.run(sc.classes, sc.classes, sc.mask, base, forecast);

	REQUIRE(result.summary.processed() == 2);
	REQUIRE(result.rasters.count(first) == 1);
	REQUIRE(result.rasters.count(second) == 1);

	const std::vector<StatsRow> &rows = result.table.rows();
	REQUIRE(rows.size() == 6);
	int baseRows = 0;
	for (const StatsRow &row : rows) {
		if (row.period == StatsTable::BASE) {
			++baseRows;
			REQUIRE(row.date == sc.day);
		}
	}
	REQUIRE(baseRows == 2);
	REQUIRE(rows[4].date == second);
	REQUIRE(rows[5].date == second);
}

TEST_CASE("Normalized rasters can be handed to a sink", "[pipeline]") {
	Scenario sc;
	DailyPipeline pipeline(VegetationClasses::parse("1,2"));

	SECTION("rasters go to the sink instead of the result") {
		RecordingSink sink;
		pipeline.setSink(&sink);
		PipelineResult result = pipeline.run(sc.classes, sc.classes, sc.mask, sc.base, sc.forecast);
		REQUIRE(result.rasters.empty());
		REQUIRE(sink.dates.size() == 1);
		REQUIRE(sink.dates[0] == sc.day);
	}

	SECTION("a sink failure fails the date") {
		FailingSink sink;
		pipeline.setSink(&sink);
		PipelineResult result = pipeline.run(sc.classes, sc.classes, sc.mask, sc.base, sc.forecast);
		REQUIRE(result.summary.failed() == 1);
		REQUIRE(result.table.size() == 0);
	}
}

TEST_CASE("Cancelled runs skip the remaining dates", "[pipeline]") {
	Scenario sc;
	bool cancel = true;
	CountingCallbacks callbacks;
	DailyPipeline pipeline(VegetationClasses::parse("1,2"));
	pipeline.setCallbacks(&callbacks);
	PipelineResult result = pipeline.run(sc.classes, sc.classes, sc.mask, sc.base, sc.forecast, &cancel);

	REQUIRE(result.summary.processed() == 0);
	REQUIRE(result.summary.skipped() == 2);
	REQUIRE(result.summary.outcomes[0].message == "cancelled");
	REQUIRE(result.table.size() == 0);
	REQUIRE(callbacks.lastStep == 1.0f);
	REQUIRE(callbacks.statuses > 0);
}

TEST_CASE("The model runs from files", "[pipeline][io]") {
	TempDir tmp;
	Util::mkdir(tmp.file("base"));
	Util::mkdir(tmp.file("forecast"));

	GridProps props = makeProps(2, 2, 30.0, 500000.0, 5400000.0, UTM10N_WKT);
	writeRaster(tmp.file("veg_base.tif"), makeRaster(props, {6110, 6120, 6200, 6201}));
	writeRaster(tmp.file("veg_forecast.tif"), makeRaster(props, {6100, 6130, 6209, 6200}));
	writeRaster(tmp.file("base/LAI_2019121.tif"), makeRaster(props, {2.0, 4.0, 10.0, 10.0}));
	writeRaster(tmp.file("base/LAI_2019122.tif"), makeRaster(props, {2.0, 4.0, 10.0, 10.0}));
	writeRaster(tmp.file("forecast/LAI_20190501.tif"), makeRaster(props, {1.0, 1.0, 5.0, -5.0}));

	LaiModelConfig config;
	config.baseClasses = tmp.file("veg_base.tif");
	config.forecastClasses = tmp.file("veg_forecast.tif");
	config.baseLaiDir = tmp.file("base");
	config.forecastLaiDir = tmp.file("forecast");
	config.outputDir = tmp.file("out");
	config.outputPrefix = "norm";
	config.negativeAsNodata = true;
	config.setClasses("610=forest,620=grassland");

	LaiModel model;
	RunSummary summary = model.run(config);

	REQUIRE(summary.processed() == 1);
	REQUIRE(summary.skipped() == 1);

	MemRaster out = readRaster(tmp.file("out/norm_2019121.tif"));
	REQUIRE(out.getFloat(0L) == 3.0);
	REQUIRE(out.getFloat(1L) == 3.0);
	REQUIRE(out.getFloat(2L) == 10.0);
	REQUIRE(out.isNodata(3));

	MemRaster bclasses = readRaster(config.classesPath("base"));
	REQUIRE(bclasses.getFloat(0L) == 610);
	REQUIRE(bclasses.getFloat(1L) == 610);
	REQUIRE(bclasses.getFloat(2L) == 620);
	REQUIRE(bclasses.getFloat(3L) == 620);
	MemRaster fclasses = readRaster(config.classesPath("forecast"));
	REQUIRE(fclasses.getFloat(0L) == 610);
	REQUIRE(fclasses.getFloat(1L) == 610);
	REQUIRE(fclasses.getFloat(3L) == 620);
	REQUIRE(Util::exists(tmp.file("out/norm_classes_base.tif")));

	std::ifstream in(config.statsPath());
	REQUIRE(in.good());
	std::string line;
	int lines = 0;
	while (std::getline(in, line))
		++lines;
	REQUIRE(lines == 5);
}

TEST_CASE("Incomplete configurations are rejected", "[pipeline]") {
	LaiModelConfig config;
	REQUIRE_THROWS_AS(config.check(), std::invalid_argument);

	LaiModel model;
	REQUIRE_THROWS_AS(model.run(config), std::invalid_argument);

	config.baseClasses = "a.tif";
	config.forecastClasses = "b.tif";
	config.baseLaiDir = "base";
	config.forecastLaiDir = "forecast";
	config.outputDir = "out";
	REQUIRE_THROWS_AS(config.check(), std::invalid_argument);
	config.setClasses("610");
	REQUIRE_NOTHROW(config.check());
	config.threads = 0;
	REQUIRE_THROWS_AS(config.check(), std::invalid_argument);

	REQUIRE_THROWS_AS(config.setMatch("weekly"), std::invalid_argument);
	REQUIRE_THROWS_AS(config.setReplacements("611=x"), std::invalid_argument);
}
