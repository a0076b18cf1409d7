#ifndef __UTIL_HPP__
#define __UTIL_HPP__

#include <set>
#include <list>
#include <vector>
#include <map>
#include <string>

#include "laitools.hpp"

namespace laitools {

    namespace util {

        // Provides methods for handling status callbacks.
        class Callbacks {
        public:
            virtual ~Callbacks() = 0;
            virtual void stepCallback(float status) const = 0;
            virtual void overallCallback(float status) const = 0;
            virtual void statusCallback(const std::string &msg) const = 0;
        };

        // Simple class for capturing status from utility functions.
        // Maps a step in [0, 1] into the range start -> end of the
        // overall status.
        class Status {
        public:
            const Callbacks *callbacks;
            float start, end;

            Status(const Callbacks *callbacks, float start, float end);

            void update(float s);
        };

        class L_DLL_EXPORT Util {
        public:

            // Split a comma-delimited string into a list of integers.
            static void intSplit(std::vector<int> &values, const char *str);

            // Split a comma-delimited string into a list of trimmed, non-empty tokens.
            static void splitString(const std::string &str, std::vector<std::string> &lst, char delim = ',');

            // Split a comma-delimited list of key=value pairs into a map.
            // Throws invalid_argument if an item has no '='.
            static void mapSplit(const std::string &str, std::map<std::string, std::string> &map);

            static std::string join(const std::vector<std::string> &lst, const std::string &delim);

            static std::string lower(const std::string &str);

            static std::string trim(const std::string &str);

            // Returns true if the file exists.
            static bool exists(const std::string &name);

            static bool rm(const std::string &name);

            // Creates the directory and any missing parents. Returns true
            // if the directory exists afterwards.
            static bool mkdir(const std::string &dir);

            // Returns the lower-case extension of the file, including the dot.
            static std::string extension(const std::string &filename);

            // Returns the file name without the directory or extension.
            static std::string stem(const std::string &filename);

            static std::string join(const std::string &dir, const std::string &filename);

            // Populates the vector with the files contained in dir, recursively. If ext is
            // specified, filters the files by that extension (case-insensitive). If dir is a
            // file, it is added to the list. The list is sorted. Returns the number of files found.
            static size_t dirlist(const std::string &dir, std::vector<std::string> &files,
                const std::string &ext = std::string());

        };

    } // util

} // laitools

#endif
