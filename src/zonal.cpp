/*
 * Computes basic statistics of LAI values aggregated by vegetation class.
 * Pixels are visited in row-major order, so results are reproducible
 * bit for bit.
 */

#include <algorithm>
#include <cmath>

#include "laitools.hpp"
#include "zonal.hpp"

using namespace laitools::raster;
using namespace laitools::lai;
using namespace laitools::lai::util;

ClassStatistics::ClassStatistics() :
	count(0),
	mean(L_NODATA), stddev(L_NODATA),
	min(L_NODATA), q1(L_NODATA), median(L_NODATA), q3(L_NODATA), max(L_NODATA) {
}

void Stat::add(double value) {
	m_values.push_back(value);
}

long Stat::count() const {
	return (long) m_values.size();
}

double Stat::quantile(const std::vector<double> &sorted, double p) {
	if (sorted.empty())
		return L_NODATA;
	double pos = p * (sorted.size() - 1);
	size_t lo = (size_t) std::floor(pos);
	size_t hi = (size_t) std::ceil(pos);
	double frac = pos - lo;
	return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

ClassStatistics Stat::compute() const {
	ClassStatistics st;
	if (m_values.empty())
		return st;
	st.count = count();
	double sum = 0.0;
	for (double v : m_values)
		sum += v;
	st.mean = sum / st.count;
	double ss = 0.0;
	for (double v : m_values)
		ss += l_sq(v - st.mean);
	st.stddev = std::sqrt(ss / st.count);
	std::vector<double> sorted(m_values);
	std::sort(sorted.begin(), sorted.end());
	st.min = sorted.front();
	st.max = sorted.back();
	st.q1 = quantile(sorted, 0.25);
	st.median = quantile(sorted, 0.5);
	st.q3 = quantile(sorted, 0.75);
	return st;
}

ZonalAggregator::ZonalAggregator(const VegetationClasses &classes) :
	m_classes(classes) {
}

std::map<int, ClassStatistics> ZonalAggregator::aggregate(const MemRaster &lai,
		const MemRaster &classes, const MemRaster &mask) const {

	const GridProps &lprops = lai.props();
	if (!lprops.isCoregistered(classes.props()))
		l_griderr("The LAI and class rasters are not co-registered.");
	if (!lprops.isCoregistered(mask.props()))
		l_griderr("The LAI raster and study area mask are not co-registered.");

	std::map<int, Stat> stats;
	for (int id : m_classes.ids())
		stats[id];

	const GridProps &cprops = classes.props();
	const GridProps &mprops = mask.props();
	for (long i = 0; i < lprops.size(); ++i) {
		double m = mask.getFloat(i);
		if (mprops.isNodata(m) || m == 0)
			continue;
		double c = classes.getFloat(i);
		if (cprops.isNodata(c))
			continue;
		double v = lai.getFloat(i);
		if (lprops.isNodata(v))
			continue;
		auto it = stats.find((int) c);
		if (it != stats.end())
			it->second.add(v);
	}

	std::map<int, ClassStatistics> result;
	for (const auto &it : stats)
		result[it.first] = it.second.compute();
	return result;
}
