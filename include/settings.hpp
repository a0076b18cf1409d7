/*
 * settings.hpp
 *
 * Loads and saves run configurations as key:value files.
 */

#ifndef INCLUDE_SETTINGS_HPP_
#define INCLUDE_SETTINGS_HPP_

#include <string>
#include <unordered_map>

#include "laimodel.hpp"

namespace laitools {
namespace lai {
namespace config {

typedef std::unordered_map<std::string, std::string> smap;

/**
 * A class for loading and saving settings. A settings file holds one
 * key:value pair per line. Blank lines and lines starting with '#' are
 * ignored.
 */
class L_DLL_EXPORT Settings {
public:

	/**
	 * Load the settings contained in filename into the LaiModelConfig object.
	 * Keys missing from the file leave the corresponding field unchanged.
	 * If false is returned, there is no settings file available.
	 *
	 * \param config A LaiModelConfig instance.
	 * \param filename A path to a settings file.
	 * \return False if no file is available. True otherwise.
	 */
	static bool load(LaiModelConfig& config, const std::string& filename);

	/**
	 * Save the settings contained in the LaiModelConfig object to the
	 * given file. Throws runtime_error if the file can't be written.
	 *
	 * \param config A LaiModelConfig instance.
	 * \param filename A path to a settings file.
	 */
	static void save(const LaiModelConfig& config, const std::string& filename);

};

} // config
} // lai
} // laitools

#endif /* INCLUDE_SETTINGS_HPP_ */
