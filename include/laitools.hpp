/*
 * laitools.hpp
 *
 * Common macros, logging and exception types for the laitools library.
 */

#ifndef __LAITOOLS_HPP__
#define __LAITOOLS_HPP__

#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <limits>

#ifdef _MSC_VER
#define L_DLL_EXPORT __declspec(dllexport)
#else
#define L_DLL_EXPORT
#endif

#define L_LOG_DEBUG 0
#define L_LOG_WARN 1
#define L_LOG_ERROR 2
#define L_LOG_NONE 3

#define L_NODATA std::numeric_limits<double>::quiet_NaN()

// The current log level. Messages below this level are discarded.
extern int l__loglevel;

#define l_loglevel(x) {l__loglevel = x;}

// Each message is assembled before it is written so that lines from
// worker threads are not interleaved.
#define l__log(level, prefix, x) { \
	if(l__loglevel <= level) { \
		std::stringstream _ls; \
		_ls << std::setprecision(12) << prefix << x << "\n"; \
		std::cerr << _ls.str(); \
	} \
}

#define l_debug(x) l__log(L_LOG_DEBUG, "DEBUG: ", x)
#define l_warn(x) l__log(L_LOG_WARN, "WARNING: ", x)
#define l_error(x) l__log(L_LOG_ERROR, "ERROR: ", x)

#define l__throw(type, x) { \
	std::stringstream _ss; \
	_ss << x; \
	throw type(_ss.str()); \
}

#define l_runerr(x) l__throw(std::runtime_error, x)
#define l_argerr(x) l__throw(std::invalid_argument, x)
#define l_griderr(x) l__throw(laitools::GridMismatchError, x)
#define l_readerr(x) l__throw(laitools::RasterReadError, x)
#define l_writeerr(x) l__throw(laitools::RasterWriteError, x)
#define l_boundaryerr(x) l__throw(laitools::BoundaryReadError, x)

#define l_sq(a) ((a) * (a))

namespace laitools {

	// Rasters that should share a grid do not, and could not be made to.
	class L_DLL_EXPORT GridMismatchError : public std::runtime_error {
	public:
		GridMismatchError(const std::string &msg) : std::runtime_error(msg) {}
	};

	// A raster could not be opened, decoded or has no CRS.
	class L_DLL_EXPORT RasterReadError : public std::runtime_error {
	public:
		RasterReadError(const std::string &msg) : std::runtime_error(msg) {}
	};

	// A raster could not be created or written.
	class L_DLL_EXPORT RasterWriteError : public std::runtime_error {
	public:
		RasterWriteError(const std::string &msg) : std::runtime_error(msg) {}
	};

	// The study area boundary is absent or empty.
	class L_DLL_EXPORT BoundaryReadError : public std::runtime_error {
	public:
		BoundaryReadError(const std::string &msg) : std::runtime_error(msg) {}
	};

} // laitools

#endif
