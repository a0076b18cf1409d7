/*
 * filelist.hpp
 *
 * Enumerates a directory of daily LAI rasters, keyed by the date
 * encoded in each file name.
 */

#ifndef INCLUDE_FILELIST_HPP_
#define INCLUDE_FILELIST_HPP_

#include <map>
#include <string>
#include <vector>

#include "laitools.hpp"
#include "dates.hpp"

namespace laitools {

    namespace util {

        class L_DLL_EXPORT DailyFileList {
        private:
            std::string m_dir;
            std::string m_ext;
            std::map<Date, std::string> m_files;
            std::vector<std::string> m_ignored;

        public:

            /**
             * Scan dir for files with the given extension. The date is taken from the first
             * underscore-separated token of the file stem that parses as YYYYDDD or YYYYMMDD.
             * Files without a date are ignored with a warning; if two files carry the same
             * date, the first in sorted order wins.
             *
             * \param dir The directory to scan.
             * \param ext The extension, including the dot (e.g. ".tif").
             */
            DailyFileList(const std::string &dir, const std::string &ext = ".tif");

            // Return the date extracted from the file name, or false.
            static bool dateFromName(const std::string &filename, Date &date);

            const std::map<Date, std::string>& files() const;

            // The files that were skipped because no date could be extracted.
            const std::vector<std::string>& ignored() const;

            const std::string& dir() const;

        };

    } // util

} // laitools

#endif
