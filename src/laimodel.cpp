/*
 * laimodel.cpp
 *
 * The daily pipeline and the file-level model run.
 */

#include <algorithm>
#include <cstdlib>
#include <set>
#include <thread>

#include <omp.h>

#include "laitools.hpp"
#include "util.hpp"
#include "align.hpp"
#include "zonal.hpp"
#include "boundary.hpp"
#include "filelist.hpp"
#include "laimodel.hpp"

using namespace laitools::util;
using namespace laitools::raster;
using namespace laitools::lai;
using namespace laitools::lai::config;

namespace {

	bool _cancel = false;

	// The result of one matched date, filled by a single worker.
	class Fragment {
	public:
		DayResult result;
		std::vector<StatsRow> rows;
		std::vector<UndefinedFactorWarning> warnings;
		MemRaster raster;
		bool hasRaster;

		Fragment() :
			hasRaster(false) {
		}
	};

	int _threads(int threads) {
		int tmax = (int) std::thread::hardware_concurrency();
		if (threads < 1) {
			l_warn("Too few threads specified. Using 1.");
			threads = 1;
		}
		if (threads > tmax && tmax > 0) {
			l_warn("Too many threads specified. Using " << tmax << ".");
			threads = tmax;
		}
		return threads;
	}

	bool _dateResultLess(const DayResult &a, const DayResult &b) {
		if (a.date != b.date)
			return a.date < b.date;
		return a.baseDate < b.baseDate;
	}

} // anon

// Config

LaiModelConfig::LaiModelConfig() :
	laiExtension(".tif"),
	outputPrefix("normalized_lai"),
	digits({1, 2, 3}),
	replacements({{611, 610}, {612, 610}, {613, 610}}),
	match(Calendar),
	negativeAsNodata(false),
	threads(1) {
}

void LaiModelConfig::setClasses(const std::string &str) {
	classes = VegetationClasses::parse(str);
}

void LaiModelConfig::setDigits(const std::string &str) {
	std::vector<int> d;
	Util::intSplit(d, str.c_str());
	digits.swap(d);
}

void LaiModelConfig::setReplacements(const std::string &str) {
	std::map<std::string, std::string> items;
	Util::mapSplit(str, items);
	std::map<int, int> r;
	for (const auto &it : items) {
		std::vector<int> from;
		std::vector<int> to;
		Util::intSplit(from, it.first.c_str());
		Util::intSplit(to, it.second.c_str());
		if (from.size() != 1 || to.size() != 1)
			l_argerr("Invalid replacement: " << it.first << "=" << it.second);
		r[from[0]] = to[0];
	}
	replacements.swap(r);
}

void LaiModelConfig::setMatch(const std::string &str) {
	std::string m = Util::lower(Util::trim(str));
	if (m == "calendar") {
		match = Calendar;
	} else if (m == "doy" || m == "day-of-year") {
		match = DayOfYear;
	} else {
		l_argerr("Unknown date match mode: " << str);
	}
}

std::string LaiModelConfig::statsPath() const {
	if (!statsFile.empty())
		return statsFile;
	return Util::join(outputDir, outputPrefix + "_stats.csv");
}

std::string LaiModelConfig::classesPath(const std::string &period) const {
	return Util::join(outputDir, outputPrefix + "_classes_" + period + ".tif");
}

void LaiModelConfig::check() const {
	if (baseClasses.empty())
		l_argerr("A base-period vegetation raster is required.");
	if (forecastClasses.empty())
		l_argerr("A forecast-period vegetation raster is required.");
	if (baseLaiDir.empty())
		l_argerr("A base-period LAI directory is required.");
	if (forecastLaiDir.empty())
		l_argerr("A forecast-period LAI directory is required.");
	if (outputDir.empty())
		l_argerr("An output directory is required.");
	if (outputPrefix.empty())
		l_argerr("An output prefix is required.");
	if (classes.empty())
		l_argerr("At least one vegetation class must be declared.");
	for (int d : digits) {
		if (d < 1)
			l_argerr("Digit indices are 1-based: " << d);
	}
	if (threads < 1)
		l_argerr("The thread count must be at least 1.");
}

// Sources and sinks

RasterSource::~RasterSource() {}

FileRasterSource::FileRasterSource(const std::string &filename, bool negativeAsNodata) :
	m_filename(filename),
	m_negativeAsNodata(negativeAsNodata) {
}

MemRaster FileRasterSource::load() const {
	return readRaster(m_filename, m_negativeAsNodata);
}

std::string FileRasterSource::name() const {
	return m_filename;
}

MemRasterSource::MemRasterSource(const MemRaster &raster, const std::string &name) :
	m_raster(raster),
	m_name(name) {
}

MemRaster MemRasterSource::load() const {
	return m_raster;
}

std::string MemRasterSource::name() const {
	return m_name;
}

RasterSink::~RasterSink() {}

FileRasterSink::FileRasterSink(const std::string &dir, const std::string &prefix) :
	m_dir(dir),
	m_prefix(prefix) {
}

std::string FileRasterSink::filename(const Date &date) const {
	return Util::join(m_dir, m_prefix + "_" + Dates::yearDoy(date) + ".tif");
}

void FileRasterSink::put(const Date &date, const MemRaster &raster) {
	writeRaster(filename(date), raster);
}

// Results

DayResult::DayResult() :
	status(DayResult::Skipped) {
}

DayResult::DayResult(const Date &date, const Date &baseDate, Status status, const std::string &message) :
	date(date),
	baseDate(baseDate),
	status(status),
	message(message) {
}

std::string DayResult::statusName(Status status) {
	switch(status) {
	case DayResult::Processed: return "processed";
	case DayResult::Skipped: return "skipped";
	case DayResult::Failed: return "failed";
	default: return "unknown";
	}
}

int RunSummary::processed() const {
	int n = 0;
	for (const DayResult &r : outcomes) {
		if (r.status == DayResult::Processed)
			++n;
	}
	return n;
}

int RunSummary::skipped() const {
	int n = 0;
	for (const DayResult &r : outcomes) {
		if (r.status == DayResult::Skipped)
			++n;
	}
	return n;
}

int RunSummary::failed() const {
	int n = 0;
	for (const DayResult &r : outcomes) {
		if (r.status == DayResult::Failed)
			++n;
	}
	return n;
}

void RunSummary::log() const {
	for (const DayResult &r : outcomes) {
		if (r.status == DayResult::Skipped) {
			l_warn("Skipped " << Dates::iso(r.date) << ": " << r.message);
		} else if (r.status == DayResult::Failed) {
			l_error("Failed " << Dates::iso(r.date) << ": " << r.message);
		}
	}
	for (const UndefinedFactorWarning &w : warnings)
		l_warn(w.message());
	l_warn("Processed " << processed() << ", skipped " << skipped() << ", failed " << failed()
			<< " dates with " << warnings.size() << " undefined factors.");
}

// Pipeline

DailyPipeline::DailyPipeline(const VegetationClasses &classes, DateMatch match, int threads) :
	m_classes(classes),
	m_match(match),
	m_threads(threads),
	m_callbacks(nullptr),
	m_sink(nullptr) {
}

void DailyPipeline::setCallbacks(const Callbacks *callbacks) {
	m_callbacks = callbacks;
}

void DailyPipeline::setSink(RasterSink *sink) {
	m_sink = sink;
}

std::vector<std::pair<Date, Date> > DailyPipeline::matchDates(const DailyCollection &baseLai,
		const DailyCollection &forecastLai, std::vector<DayResult> &skipped) const {

	std::vector<std::pair<Date, Date> > pairs;
	std::map<Date, bool> baseUsed;
	for (const auto &it : baseLai)
		baseUsed[it.first] = false;

	if (m_match == Calendar) {
		for (const auto &it : forecastLai) {
			auto bit = baseUsed.find(it.first);
			if (bit == baseUsed.end()) {
				skipped.push_back(DayResult(it.first, Date(), DayResult::Skipped, "no matching base date"));
			} else {
				bit->second = true;
				pairs.push_back(std::make_pair(it.first, it.first));
			}
		}
	} else {
		// The earliest base date wins for each day of year.
		std::map<int, Date> byDoy;
		for (const auto &it : baseLai) {
			int doy = it.first.day_of_year();
			if (byDoy.find(doy) == byDoy.end())
				byDoy[doy] = it.first;
		}
		for (const auto &it : forecastLai) {
			auto bit = byDoy.find(it.first.day_of_year());
			if (bit == byDoy.end()) {
				skipped.push_back(DayResult(it.first, Date(), DayResult::Skipped, "no matching base date"));
			} else {
				baseUsed[bit->second] = true;
				pairs.push_back(std::make_pair(bit->second, it.first));
			}
		}
	}

	for (const auto &it : baseUsed) {
		if (!it.second)
			skipped.push_back(DayResult(it.first, it.first, DayResult::Skipped, "no matching forecast date"));
	}
	return pairs;
}

PipelineResult DailyPipeline::run(const MemRaster &baseClasses, const MemRaster &forecastClasses,
		const MemRaster &mask, const DailyCollection &baseLai, const DailyCollection &forecastLai,
		bool *cancel) const {

	if (!cancel)
		cancel = &_cancel;

	PipelineResult result;
	std::vector<DayResult> outcomes;
	std::vector<std::pair<Date, Date> > pairs = matchDates(baseLai, forecastLai, outcomes);

	l_debug("Matched " << pairs.size() << " dates; " << outcomes.size() << " unmatched");
	if (m_callbacks)
		m_callbacks->statusCallback("Aligning class maps");

	// The shared inputs are aligned once. The base class grid is the working grid.
	GridAligner aligner;
	const GridProps &grid = baseClasses.props();
	MemRaster fclasses = aligner.align(grid, forecastClasses, Nearest);
	MemRaster amask = aligner.align(grid, mask, Nearest);

	ZonalAggregator aggregator(m_classes);
	NormalizationEngine engine;

	std::vector<Fragment> fragments(pairs.size());
	int done = 0;

	omp_set_dynamic(1);
	omp_set_num_threads(_threads(m_threads));

	if (m_callbacks)
		m_callbacks->statusCallback("Normalizing");

	#pragma omp parallel for schedule(dynamic)
	for (int i = 0; i < (int) pairs.size(); ++i) {
		const Date &bdate = pairs[i].first;
		const Date &fdate = pairs[i].second;
		Fragment &frag = fragments[i];
		if (*cancel) {
			frag.result = DayResult(fdate, bdate, DayResult::Skipped, "cancelled");
			continue;
		}
		try {
			MemRaster blai = aligner.align(grid, baseLai.at(bdate)->load(), Bilinear);
			MemRaster flai = aligner.align(grid, forecastLai.at(fdate)->load(), Bilinear);

			std::map<int, ClassStatistics> bstats = aggregator.aggregate(blai, baseClasses, amask);
			std::map<int, ClassStatistics> pstats = aggregator.aggregate(flai, fclasses, amask);

			std::map<int, double> factors = engine.deriveFactors(fdate, bstats, pstats, frag.warnings);
			MemRaster out = engine.apply(flai, fclasses, factors);
			for (long j = 0; j < out.props().size(); ++j) {
				if (amask.getFloat(j) != 1)
					out.setFloat(j, out.props().nodata());
			}

			for (int id : m_classes.ids())
				frag.rows.push_back(StatsRow(bdate, id, StatsTable::BASE, bstats[id]));
			for (int id : m_classes.ids())
				frag.rows.push_back(StatsRow(fdate, id, StatsTable::PREDICTED, pstats[id]));

			if (m_sink) {
				m_sink->put(fdate, out);
			} else {
				frag.raster = out;
				frag.hasRaster = true;
			}
			frag.result = DayResult(fdate, bdate, DayResult::Processed);
			l_debug("Processed " << Dates::iso(fdate));
		} catch (const std::exception &ex) {
			frag.rows.clear();
			frag.warnings.clear();
			frag.hasRaster = false;
			frag.result = DayResult(fdate, bdate, DayResult::Failed, ex.what());
		}
		#pragma omp critical(__lai_progress)
		{
			++done;
			if (m_callbacks)
				m_callbacks->stepCallback((float) done / pairs.size());
		}
	}

	// Merge in forecast-date order. The pairs are already ordered. When several
	// forecast dates share a base date, its rows are kept once.
	std::set<Date> baseDates;
	for (Fragment &frag : fragments) {
		if (!frag.rows.empty() && !baseDates.insert(frag.result.baseDate).second) {
			for (const StatsRow &row : frag.rows) {
				if (row.period != StatsTable::BASE)
					result.table.append(row);
			}
		} else {
			result.table.append(frag.rows);
		}
		result.summary.warnings.insert(result.summary.warnings.end(),
				frag.warnings.begin(), frag.warnings.end());
		if (frag.hasRaster)
			result.rasters[frag.result.date] = frag.raster;
		outcomes.push_back(frag.result);
	}
	std::stable_sort(outcomes.begin(), outcomes.end(), _dateResultLess);
	result.summary.outcomes.swap(outcomes);

	if (m_callbacks)
		m_callbacks->stepCallback(1.0f);

	return result;
}

// Model

LaiModel::LaiModel() :
	m_callbacks(nullptr) {
}

void LaiModel::setCallbacks(const Callbacks *callbacks) {
	m_callbacks = callbacks;
}

RunSummary LaiModel::run(const LaiModelConfig &config, bool *cancel) {

	if (!cancel)
		cancel = &_cancel;

	config.check();

	Status status(m_callbacks, 0.0f, 1.0f);

	if (m_callbacks)
		m_callbacks->statusCallback("Loading vegetation maps");

	Reclassifier reclass(config.classes, config.digits, config.replacements);
	MemRaster baseClasses = reclass.reclassify(readRaster(config.baseClasses));
	MemRaster forecastClasses = reclass.reclassify(readRaster(config.forecastClasses));

	if (!Util::mkdir(config.outputDir))
		l_runerr("Failed to create the output directory: " << config.outputDir);

	// The reclassified maps are kept for inspection.
	writeRaster(config.classesPath("base"), baseClasses);
	writeRaster(config.classesPath("forecast"), forecastClasses);
	status.update(0.1f);

	MemRaster mask;
	if (config.boundary.empty()) {
		l_warn("No boundary given; using the whole grid.");
		mask = Boundary::fullMask(baseClasses.props());
	} else {
		Boundary boundary(config.boundary);
		mask = boundary.mask(baseClasses.props());
	}
	status.update(0.15f);

	if (*cancel)
		return RunSummary();

	if (m_callbacks)
		m_callbacks->statusCallback("Listing LAI rasters");

	DailyCollection baseLai;
	DailyCollection forecastLai;
	{
		DailyFileList files(config.baseLaiDir, config.laiExtension);
		for (const auto &it : files.files())
			baseLai[it.first].reset(new FileRasterSource(it.second, config.negativeAsNodata));
	}
	{
		DailyFileList files(config.forecastLaiDir, config.laiExtension);
		for (const auto &it : files.files())
			forecastLai[it.first].reset(new FileRasterSource(it.second, config.negativeAsNodata));
	}
	l_debug("Found " << baseLai.size() << " base and " << forecastLai.size() << " forecast rasters");
	status.update(0.2f);

	FileRasterSink sink(config.outputDir, config.outputPrefix);
	DailyPipeline pipeline(config.classes, config.match, config.threads);
	pipeline.setSink(&sink);
	pipeline.setCallbacks(m_callbacks);
	PipelineResult result = pipeline.run(baseClasses, forecastClasses, mask, baseLai, forecastLai, cancel);
	status.update(0.95f);

	if (m_callbacks)
		m_callbacks->statusCallback("Writing statistics");

	result.table.write(config.statsPath());
	status.update(1.0f);

	result.summary.log();
	return result.summary;
}
