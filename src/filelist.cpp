/*
 * filelist.cpp
 */

#include <string>
#include <vector>

#include "laitools.hpp"
#include "util.hpp"
#include "filelist.hpp"

using namespace laitools::util;

DailyFileList::DailyFileList(const std::string &dir, const std::string &ext) :
	m_dir(dir),
	m_ext(ext) {

	if (!Util::exists(dir))
		l_runerr("The LAI directory does not exist: " << dir);

	std::vector<std::string> files;
	Util::dirlist(dir, files, ext);
	for (const std::string &file : files) {
		Date date;
		if (!dateFromName(file, date)) {
			l_warn("No date in file name; ignoring " << file);
			m_ignored.push_back(file);
			continue;
		}
		if (m_files.find(date) != m_files.end()) {
			l_warn("Duplicate date " << Dates::iso(date) << "; ignoring " << file);
			m_ignored.push_back(file);
			continue;
		}
		m_files[date] = file;
	}
	l_debug("Found " << m_files.size() << " dated files in " << dir);
}

bool DailyFileList::dateFromName(const std::string &filename, Date &date) {
	std::vector<std::string> tokens;
	Util::splitString(Util::stem(filename), tokens, '_');
	for (const std::string &tok : tokens) {
		if (Dates::parse(tok, date))
			return true;
	}
	return false;
}

const std::map<Date, std::string>& DailyFileList::files() const {
	return m_files;
}

const std::vector<std::string>& DailyFileList::ignored() const {
	return m_ignored;
}

const std::string& DailyFileList::dir() const {
	return m_dir;
}
