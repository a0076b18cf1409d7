#include <cctype>
#include <cstdlib>
#include <sstream>
#include <iomanip>

#include "dates.hpp"

using namespace laitools::util;

std::string Dates::iso(const Date &date) {
	return boost::gregorian::to_iso_extended_string(date);
}

std::string Dates::yearDoy(const Date &date) {
	std::stringstream ss;
	ss << date.year() << std::setw(3) << std::setfill('0') << date.day_of_year();
	return ss.str();
}

bool Dates::parse(const std::string &token, Date &date) {
	if (token.size() != 7 && token.size() != 8)
		return false;
	for (char c : token) {
		if (!std::isdigit((unsigned char) c))
			return false;
	}
	int year = std::atoi(token.substr(0, 4).c_str());
	try {
		if (token.size() == 7) {
			int doy = std::atoi(token.substr(4).c_str());
			int days = boost::gregorian::gregorian_calendar::is_leap_year(year) ? 366 : 365;
			if (doy < 1 || doy > days)
				return false;
			date = Date(year, 1, 1) + boost::gregorian::days(doy - 1);
		} else {
			int month = std::atoi(token.substr(4, 2).c_str());
			int day = std::atoi(token.substr(6, 2).c_str());
			date = Date(year, month, day);
		}
	} catch (const std::out_of_range&) {
		// Boost reports bad years, months and days as out_of_range.
		return false;
	}
	return true;
}
