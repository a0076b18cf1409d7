#ifndef __RECLASS_HPP__
#define __RECLASS_HPP__

#include <map>
#include <string>
#include <vector>

#include "laitools.hpp"
#include "raster.hpp"

namespace laitools {

    namespace lai {

        // The class value used for cells that belong to no declared class.
        const int NO_CLASS = 0;

        // The closed enumeration of vegetation classes for a run. Statistics
        // are emitted for every declared class, in declaration order.
        class L_DLL_EXPORT VegetationClasses {
        private:
            std::vector<int> m_ids;
            std::map<int, std::string> m_names;

        public:

            VegetationClasses();

            // Declare a class. IDs must be positive and unique.
            void add(int id, const std::string &name = std::string());

            // Parse a comma-delimited list of id=name pairs or bare ids,
            // e.g. "610=forest,620=grassland,700".
            static VegetationClasses parse(const std::string &str);

            bool contains(int id) const;

            // The class name, or the id as a string if it has none.
            std::string name(int id) const;

            const std::vector<int>& ids() const;

            size_t size() const;

            bool empty() const;

            // Returns the list as it would be given to parse.
            std::string toString() const;
        };

        // Reduces raw vegetation codes to the declared classes by keeping
        // selected decimal digits of each code, then applying a replacement
        // table. Cells that end up outside the enumeration get NO_CLASS.
        class L_DLL_EXPORT Reclassifier {
        private:
            std::vector<int> m_digits;
            std::map<int, int> m_replacements;
            VegetationClasses m_classes;

        public:

            // digits are 1-based positions into the decimal representation
            // of a code; positions past its end are ignored.
            Reclassifier(const VegetationClasses &classes,
                const std::vector<int> &digits = std::vector<int>(),
                const std::map<int, int> &replacements = std::map<int, int>());

            // Reclassify a single raw value. Nodata and negative values give NO_CLASS.
            int reclassify(double value, const laitools::raster::GridProps &props) const;

            // Return a new class raster with NO_CLASS as nodata.
            laitools::raster::MemRaster reclassify(const laitools::raster::MemRaster &raw) const;
        };

    } // lai

} // laitools

#endif
