#include <algorithm>
#include <cstdlib>

#include <boost/filesystem.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "laitools.hpp"
#include "util.hpp"

using namespace laitools::util;

int l__loglevel = L_LOG_WARN;

Callbacks::~Callbacks() {}

Status::Status(const Callbacks *callbacks, float start, float end) :
	callbacks(callbacks),
	start(start), end(end) {
}

void Status::update(float s) {
	if (callbacks)
		callbacks->overallCallback(start + (end - start) * s);
}

void Util::intSplit(std::vector<int> &values, const char *str) {
	std::vector<std::string> tokens;
	splitString(std::string(str), tokens);
	for (const std::string &tok : tokens) {
		char *end;
		long v = std::strtol(tok.c_str(), &end, 10);
		if (*end != '\0')
			l_argerr("Not an integer: " << tok);
		values.push_back((int) v);
	}
}

void Util::splitString(const std::string &str, std::vector<std::string> &lst, char delim) {
	std::stringstream ss(str);
	std::string item;
	while (std::getline(ss, item, delim)) {
		item = trim(item);
		if (!item.empty())
			lst.push_back(item);
	}
}

void Util::mapSplit(const std::string &str, std::map<std::string, std::string> &map) {
	std::vector<std::string> items;
	splitString(str, items);
	for (const std::string &item : items) {
		size_t pos = item.find('=');
		if (pos == std::string::npos)
			l_argerr("Expected key=value, got: " << item);
		map[trim(item.substr(0, pos))] = trim(item.substr(pos + 1));
	}
}

std::string Util::join(const std::vector<std::string> &lst, const std::string &delim) {
	return boost::algorithm::join(lst, delim);
}

std::string Util::lower(const std::string &str) {
	return boost::algorithm::to_lower_copy(str);
}

std::string Util::trim(const std::string &str) {
	return boost::algorithm::trim_copy(str);
}

bool Util::exists(const std::string &name) {
	return boost::filesystem::exists(boost::filesystem::path(name));
}

bool Util::rm(const std::string &name) {
	boost::system::error_code ec;
	return boost::filesystem::remove(boost::filesystem::path(name), ec);
}

bool Util::mkdir(const std::string &dir) {
	using namespace boost::filesystem;
	path p(dir);
	boost::system::error_code ec;
	if (!boost::filesystem::exists(p))
		create_directories(p, ec);
	return is_directory(p);
}

std::string Util::extension(const std::string &filename) {
	return lower(boost::filesystem::path(filename).extension().string());
}

std::string Util::stem(const std::string &filename) {
	return boost::filesystem::path(filename).stem().string();
}

std::string Util::join(const std::string &dir, const std::string &filename) {
	return (boost::filesystem::path(dir) / filename).string();
}

size_t Util::dirlist(const std::string &dir, std::vector<std::string> &files, const std::string &ext) {
	using namespace boost::filesystem;
	std::string lext = lower(ext);
	path p(dir);
	size_t count = 0;
	if (is_regular_file(p)) {
		files.push_back(p.string());
		return 1;
	}
	if (!is_directory(p))
		return 0;
	std::vector<std::string> found;
	recursive_directory_iterator end;
	for (recursive_directory_iterator it(p); it != end; ++it) {
		if (!is_regular_file(it->status()))
			continue;
		std::string f = it->path().string();
		if (lext.empty() || extension(f) == lext) {
			found.push_back(f);
			++count;
		}
	}
	std::sort(found.begin(), found.end());
	files.insert(files.end(), found.begin(), found.end());
	return count;
}
