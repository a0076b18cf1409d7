#include <fstream>
#include <sstream>
#include <string>

#include <catch2/catch.hpp>

#include "statstable.hpp"
#include "testutil.hpp"

using namespace laitools;
using namespace laitools::lai;
using namespace laitools::util;
using namespace laitools::test;

namespace {

	ClassStatistics sample() {
		ClassStatistics st;
		st.count = 2;
		st.mean = 3.0;
		st.stddev = 1.0;
		st.min = 2.0;
		st.q1 = 2.5;
		st.median = 3.0;
		st.q3 = 3.5;
		st.max = 4.0;
		return st;
	}

} // anon

TEST_CASE("Statistics are written as delimited text", "[statstable]") {
	StatsTable table(2);
	table.append(StatsRow(Date(2019, 2, 1), 610, StatsTable::BASE, sample()));
	table.append(StatsRow(Date(2019, 2, 1), 620, StatsTable::PREDICTED, ClassStatistics()));

	std::stringstream ss;
	table.write(ss);

	std::string line;
	std::getline(ss, line);
	REQUIRE(line == "date,vegetation_class,pixel_count,mean_lai,std_lai,period,min_lai,q1_lai,median_lai,q3_lai,max_lai");
	std::getline(ss, line);
	REQUIRE(line == "2019-02-01,610,2,3.00,1.00,base,2.00,2.50,3.00,3.50,4.00");
	std::getline(ss, line);
	REQUIRE(line == "2019-02-01,620,0,,,predicted,,,,,");
	REQUIRE_FALSE(static_cast<bool>(std::getline(ss, line)));
}

TEST_CASE("Statistics files are replaced on write", "[statstable]") {
	TempDir tmp;
	std::string file = tmp.file("stats.csv");
	{
		std::ofstream out(file);
		out << "old\nold\nold\nold\n";
	}

	StatsTable table;
	table.append(StatsRow(Date(2019, 2, 1), 610, StatsTable::BASE, sample()));
	table.write(file);

	std::ifstream in(file);
	std::string line;
	int lines = 0;
	while (std::getline(in, line))
		++lines;
	REQUIRE(lines == 2);

	REQUIRE_THROWS_AS(table.write(tmp.file("missing/stats.csv")), RasterWriteError);
}
