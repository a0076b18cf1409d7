/*
 * statstable.cpp
 */

#include <cmath>
#include <fstream>
#include <iomanip>

#include "laitools.hpp"
#include "statstable.hpp"

using namespace laitools::util;
using namespace laitools::lai;

namespace {

	void _writeValue(std::ostream &out, double v) {
		out << ',';
		if (!std::isnan(v))
			out << v;
	}

} // anon

const std::string StatsTable::BASE = "base";
const std::string StatsTable::PREDICTED = "predicted";

StatsRow::StatsRow(const Date &date, int classId, const std::string &period, const ClassStatistics &stats) :
	date(date),
	classId(classId),
	period(period),
	stats(stats) {
}

StatsTable::StatsTable(int precision) :
	m_precision(precision) {
}

void StatsTable::append(const StatsRow &row) {
	m_rows.push_back(row);
}

void StatsTable::append(const std::vector<StatsRow> &rows) {
	m_rows.insert(m_rows.end(), rows.begin(), rows.end());
}

const std::vector<StatsRow>& StatsTable::rows() const {
	return m_rows;
}

size_t StatsTable::size() const {
	return m_rows.size();
}

void StatsTable::write(std::ostream &out) const {
	out << "date,vegetation_class,pixel_count,mean_lai,std_lai,period,min_lai,q1_lai,median_lai,q3_lai,max_lai\n";
	out << std::fixed << std::setprecision(m_precision);
	for (const StatsRow &row : m_rows) {
		const ClassStatistics &st = row.stats;
		out << Dates::iso(row.date) << ',' << row.classId << ',' << st.count;
		_writeValue(out, st.mean);
		_writeValue(out, st.stddev);
		out << ',' << row.period;
		_writeValue(out, st.min);
		_writeValue(out, st.q1);
		_writeValue(out, st.median);
		_writeValue(out, st.q3);
		_writeValue(out, st.max);
		out << '\n';
	}
}

void StatsTable::write(const std::string &filename) const {
	std::ofstream out(filename, std::ios::out | std::ios::trunc);
	if (!out.good())
		l_writeerr("Failed to open the statistics file for writing: " << filename);
	write(out);
	out.flush();
	if (!out.good())
		l_writeerr("Failed to write the statistics file: " << filename);
}
