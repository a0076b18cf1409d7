/*
 * statstable.hpp
 *
 * Per-date, per-class statistics rows and their CSV serialization.
 */

#ifndef INCLUDE_STATSTABLE_HPP_
#define INCLUDE_STATSTABLE_HPP_

#include <ostream>
#include <string>
#include <vector>

#include "laitools.hpp"
#include "dates.hpp"
#include "zonal.hpp"

namespace laitools {

    namespace lai {

        class L_DLL_EXPORT StatsRow {
        public:
            laitools::util::Date date;
            int classId;
            std::string period;         // "base" or "predicted".
            ClassStatistics stats;

            StatsRow(const laitools::util::Date &date, int classId,
                const std::string &period, const ClassStatistics &stats);
        };

        class L_DLL_EXPORT StatsTable {
        private:
            std::vector<StatsRow> m_rows;
            int m_precision;

        public:

            static const std::string BASE;
            static const std::string PREDICTED;

            StatsTable(int precision = 6);

            void append(const StatsRow &row);

            void append(const std::vector<StatsRow> &rows);

            const std::vector<StatsRow>& rows() const;

            size_t size() const;

            // Write a header and one line per row. Undefined statistics are written as empty fields.
            void write(std::ostream &out) const;

            // Write the table to a file, replacing it. Throws RasterWriteError on failure.
            void write(const std::string &filename) const;

        };

    } // lai

} // laitools

#endif
