/*
 * settings.cpp
 */

#include <cstdlib>
#include <fstream>
#include <unordered_map>

#include "util.hpp"
#include "settings.hpp"

using namespace laitools::util;
using namespace laitools::lai;
using namespace laitools::lai::config;

namespace {

	/**
	 * Load the key-value file contents into a map.
	 *
	 * \param filename The source file.
	 * \param map The map.
	 */
	bool loadMap(const std::string& filename, smap& map) {
		if (filename.empty())
			return false;
		std::ifstream ins(filename, std::ios::in);
		if (!ins.good())
			return false;
		std::string line;
		while (std::getline(ins, line)) {
			line = Util::trim(line);
			if (line.empty() || line[0] == '#')
				continue;
			size_t pos = line.find(':');
			if (pos == std::string::npos)
				l_argerr("Expected key:value in " << filename << ", got: " << line);
			map[Util::trim(line.substr(0, pos))] = Util::trim(line.substr(pos + 1));
		}
		return true;
	}

	/**
	 * Save the map as a key-value file.
	 *
	 * \param filename The target file.
	 * \param map The map.
	 */
	void saveMap(const std::string& filename, const smap& map) {
		std::ofstream ofs(filename, std::ios::out);
		if (!ofs.good())
			l_runerr("Failed to open settings file for writing: " << filename);
		for (auto& it : map)
			ofs << it.first << ":" << it.second << "\n";
		if (!ofs.good())
			l_runerr("Failed to write settings file: " << filename);
	}

	/**
	 * Return the map value corresponding to the given key as an integer.
	 * Return the alternate if the key doesn't exist.
	 *
	 * \param map The map.
	 * \param key The key.
	 * \param alt The alternate value.
	 */
	int geti(const smap& map, const std::string& key, int alt) {
		if (map.find(key) == map.end()) {
			return alt;
		}
		else {
			return atoi(map.at(key).c_str());
		}
	}

	/**
	 * Return the map value corresponding to the given key as a boolean.
	 * Return the alternate if the key doesn't exist.
	 * Allowed values are anything that starts with 't' or 'T' or '1'.
	 *
	 * \param map The map.
	 * \param key The key.
	 * \param alt The alternate value.
	 */
	bool getb(const smap& map, const std::string& key, bool alt) {
		if (map.find(key) == map.end()) {
			return alt;
		}
		else {
			const std::string& val = map.at(key);
			return !val.empty() && (val[0] == 't' || val[0] == 'T' || val[0] == '1');
		}
	}

	/**
	 * Return the map value corresponding to the given key as a string.
	 * Return the alternate if the key doesn't exist.
	 *
	 * \param map The map.
	 * \param key The key.
	 * \param alt The alternate value.
	 */
	std::string gets(const smap& map, const std::string& key, const std::string& alt) {
		if (map.find(key) == map.end()) {
			return alt;
		}
		else {
			return map.at(key);
		}
	}

	std::string joinInts(const std::vector<int>& values) {
		std::vector<std::string> items;
		for (int v : values)
			items.push_back(std::to_string(v));
		return Util::join(items, ",");
	}

} // anon

bool Settings::load(LaiModelConfig& config, const std::string& filename) {

	smap map;
	if(!loadMap(filename, map))
		return false;

	config.baseClasses = gets(map, "base_classes", config.baseClasses);
	config.forecastClasses = gets(map, "forecast_classes", config.forecastClasses);
	config.boundary = gets(map, "boundary", config.boundary);
	config.baseLaiDir = gets(map, "base_lai_dir", config.baseLaiDir);
	config.forecastLaiDir = gets(map, "forecast_lai_dir", config.forecastLaiDir);
	config.laiExtension = gets(map, "lai_extension", config.laiExtension);
	config.outputDir = gets(map, "output_dir", config.outputDir);
	config.outputPrefix = gets(map, "output_prefix", config.outputPrefix);
	config.statsFile = gets(map, "stats_file", config.statsFile);

	if (map.find("classes") != map.end())
		config.setClasses(map.at("classes"));
	if (map.find("digits") != map.end())
		config.setDigits(map.at("digits"));
	if (map.find("replace") != map.end())
		config.setReplacements(map.at("replace"));
	if (map.find("match") != map.end())
		config.setMatch(map.at("match"));

	config.negativeAsNodata = getb(map, "negative_as_nodata", config.negativeAsNodata);
	config.threads = geti(map, "threads", config.threads);

	l_debug("Loaded settings from " << filename);
	return true;
}

void Settings::save(const LaiModelConfig& config, const std::string& filename) {
	smap map;
	map["base_classes"] = config.baseClasses;
	map["forecast_classes"] = config.forecastClasses;
	map["boundary"] = config.boundary;
	map["base_lai_dir"] = config.baseLaiDir;
	map["forecast_lai_dir"] = config.forecastLaiDir;
	map["lai_extension"] = config.laiExtension;
	map["output_dir"] = config.outputDir;
	map["output_prefix"] = config.outputPrefix;
	map["stats_file"] = config.statsFile;

	map["classes"] = config.classes.toString();
	map["digits"] = joinInts(config.digits);
	std::vector<std::string> repl;
	for (const auto& it : config.replacements)
		repl.push_back(std::to_string(it.first) + "=" + std::to_string(it.second));
	map["replace"] = Util::join(repl, ",");
	map["match"] = config.match == DayOfYear ? "doy" : "calendar";

	map["negative_as_nodata"] = std::to_string(config.negativeAsNodata);
	map["threads"] = std::to_string(config.threads);

	saveMap(filename, map);
}
