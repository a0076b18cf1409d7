#include <cstdlib>
#include <iostream>
#include <string>

#include "laitools.hpp"
#include "laimodel.hpp"
#include "settings.hpp"

using namespace laitools::lai;
using namespace laitools::lai::config;

void usage() {
	std::cerr
			<< "Usage: laimodel [options]\n"
			<< " -c <file>                   Load settings from a key:value file. Options given\n"
			<< "                             after it override the file.\n"
			<< " -s <file>                   Save the effective settings to a file and exit.\n"
			<< " --base-classes <file>       The base-period vegetation raster.\n"
			<< " --forecast-classes <file>   The forecast-period vegetation raster.\n"
			<< " --boundary <file>           The study area boundary (vector). Optional.\n"
			<< " --base-lai <dir>            The directory of base-period daily LAI rasters.\n"
			<< " --forecast-lai <dir>        The directory of forecast-period daily LAI rasters.\n"
			<< " --ext <ext>                 The LAI raster extension. Default .tif.\n"
			<< " --out <dir>                 The output directory.\n"
			<< " --prefix <prefix>           The output raster prefix. Default normalized_lai.\n"
			<< " --stats <file>              The statistics table. Default <out>/<prefix>_stats.csv.\n"
			<< " --classes <list>            The vegetation classes, e.g. 610=forest,620=grass.\n"
			<< " --digits <list>             1-based digits kept from vegetation codes. Default 1,2,3.\n"
			<< " --replace <list>            Class replacements. Default 611=610,612=610,613=610.\n"
			<< " --match <calendar|doy>      How base and forecast dates are paired. Default calendar.\n"
			<< " --negative-nodata           Treat negative LAI as nodata.\n"
			<< " --threads <n>               The number of threads to use. Default 1.\n"
			<< " -v                          Verbose output.\n"
			<< " -h                          Print this message.\n";
}

// Writes progress to the debug log.
class LogCallbacks : public laitools::util::Callbacks {
public:
	void stepCallback(float status) const {
		l_debug("Step: " << (int) (status * 100) << "%");
	}
	void overallCallback(float status) const {
		l_debug("Overall: " << (int) (status * 100) << "%");
	}
	void statusCallback(const std::string &msg) const {
		l_debug(msg);
	}
};

// Return the value following the option at i, advancing i.
std::string value(int argc, char **argv, int &i) {
	if (i + 1 >= argc)
		l_argerr("Missing value for " << argv[i]);
	return std::string(argv[++i]);
}

int main(int argc, char **argv) {

	try {

		LaiModelConfig config;
		std::string saveFile;

		for (int i = 1; i < argc; ++i) {
			std::string s(argv[i]);
			if (s == "-h") {
				usage();
				return 0;
			} else if (s == "-v") {
				l_loglevel(L_LOG_DEBUG);
			} else if (s == "-c") {
				std::string file = value(argc, argv, i);
				if (!Settings::load(config, file))
					l_argerr("Failed to load settings from " << file);
			} else if (s == "-s") {
				saveFile = value(argc, argv, i);
			} else if (s == "--base-classes") {
				config.baseClasses = value(argc, argv, i);
			} else if (s == "--forecast-classes") {
				config.forecastClasses = value(argc, argv, i);
			} else if (s == "--boundary") {
				config.boundary = value(argc, argv, i);
			} else if (s == "--base-lai") {
				config.baseLaiDir = value(argc, argv, i);
			} else if (s == "--forecast-lai") {
				config.forecastLaiDir = value(argc, argv, i);
			} else if (s == "--ext") {
				config.laiExtension = value(argc, argv, i);
			} else if (s == "--out") {
				config.outputDir = value(argc, argv, i);
			} else if (s == "--prefix") {
				config.outputPrefix = value(argc, argv, i);
			} else if (s == "--stats") {
				config.statsFile = value(argc, argv, i);
			} else if (s == "--classes") {
				config.setClasses(value(argc, argv, i));
			} else if (s == "--digits") {
				config.setDigits(value(argc, argv, i));
			} else if (s == "--replace") {
				config.setReplacements(value(argc, argv, i));
			} else if (s == "--match") {
				config.setMatch(value(argc, argv, i));
			} else if (s == "--negative-nodata") {
				config.negativeAsNodata = true;
			} else if (s == "--threads") {
				config.threads = atoi(value(argc, argv, i).c_str());
			} else {
				l_argerr("Unknown option: " << s);
			}
		}

		if (!saveFile.empty()) {
			Settings::save(config, saveFile);
			return 0;
		}

		LogCallbacks callbacks;
		LaiModel model;
		model.setCallbacks(&callbacks);
		RunSummary summary = model.run(config);
		if (summary.failed() > 0)
			return 2;

	} catch (const std::exception &ex) {
		l_error(ex.what());
		usage();
		return 1;
	}

	return 0;
}
