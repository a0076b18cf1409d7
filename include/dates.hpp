#ifndef __DATES_HPP__
#define __DATES_HPP__

#include <string>

#include <boost/date_time/gregorian/gregorian.hpp>

#include "laitools.hpp"

namespace laitools {

    namespace util {

        typedef boost::gregorian::date Date;

        class L_DLL_EXPORT Dates {
        public:

            // Returns YYYY-MM-DD.
            static std::string iso(const Date &date);

            // Returns YYYYDDD (year and zero-padded day of year).
            static std::string yearDoy(const Date &date);

            // Parses YYYYDDD or YYYYMMDD. Returns false if the token is
            // neither or does not name a valid day.
            static bool parse(const std::string &token, Date &date);

        };

    } // util

} // laitools

#endif
