#include <climits>
#include <cmath>
#include <cstdlib>
#include <sstream>

#include "laitools.hpp"
#include "util.hpp"
#include "reclass.hpp"

using namespace laitools::util;
using namespace laitools::raster;
using namespace laitools::lai;

VegetationClasses::VegetationClasses() {
}

void VegetationClasses::add(int id, const std::string &name) {
	if (id <= NO_CLASS)
		l_argerr("Vegetation class IDs must be positive: " << id);
	if (contains(id))
		l_argerr("Duplicate vegetation class: " << id);
	m_ids.push_back(id);
	m_names[id] = name;
}

VegetationClasses VegetationClasses::parse(const std::string &str) {
	VegetationClasses classes;
	std::vector<std::string> items;
	Util::splitString(str, items);
	for (const std::string &item : items) {
		size_t pos = item.find('=');
		std::string id = Util::trim(item.substr(0, pos));
		std::string name = pos == std::string::npos ? "" : Util::trim(item.substr(pos + 1));
		char *end;
		long v = std::strtol(id.c_str(), &end, 10);
		if (id.empty() || *end != '\0')
			l_argerr("Invalid vegetation class: " << item);
		classes.add((int) v, name);
	}
	return classes;
}

bool VegetationClasses::contains(int id) const {
	return m_names.find(id) != m_names.end();
}

std::string VegetationClasses::name(int id) const {
	auto it = m_names.find(id);
	if (it == m_names.end() || it->second.empty())
		return std::to_string(id);
	return it->second;
}

const std::vector<int>& VegetationClasses::ids() const {
	return m_ids;
}

size_t VegetationClasses::size() const {
	return m_ids.size();
}

bool VegetationClasses::empty() const {
	return m_ids.empty();
}

std::string VegetationClasses::toString() const {
	std::vector<std::string> items;
	for (int id : m_ids) {
		const std::string &name = m_names.at(id);
		items.push_back(name.empty() ? std::to_string(id) : std::to_string(id) + "=" + name);
	}
	return Util::join(items, ",");
}

Reclassifier::Reclassifier(const VegetationClasses &classes,
		const std::vector<int> &digits, const std::map<int, int> &replacements) :
	m_digits(digits),
	m_replacements(replacements),
	m_classes(classes) {
	for (int d : m_digits) {
		if (d < 1)
			l_argerr("Digit indices are 1-based: " << d);
	}
}

int Reclassifier::reclassify(double value, const GridProps &props) const {
	if (props.isNodata(value) || !std::isfinite(value) || value < 0 || value > INT_MAX)
		return NO_CLASS;
	std::string code = std::to_string((int) value);
	int cls;
	if (m_digits.empty()) {
		cls = (int) value;
	} else {
		std::string sel;
		for (int d : m_digits) {
			if ((size_t) d <= code.size())
				sel += code[d - 1];
		}
		if (sel.empty())
			return NO_CLASS;
		// Repeated digit positions can select more digits than an int holds.
		long long v = std::strtoll(sel.c_str(), nullptr, 10);
		if (v > INT_MAX)
			return NO_CLASS;
		cls = (int) v;
	}
	auto it = m_replacements.find(cls);
	if (it != m_replacements.end())
		cls = it->second;
	return m_classes.contains(cls) ? cls : NO_CLASS;
}

MemRaster Reclassifier::reclassify(const MemRaster &raw) const {
	GridProps props(raw.props());
	props.setNoData(NO_CLASS);
	props.setDataType(DataType::Int32);
	MemRaster out(props);
	const GridProps &rprops = raw.props();
	std::map<int, long> counts;
	for (long i = 0; i < rprops.size(); ++i) {
		int cls = reclassify(raw.getFloat(i), rprops);
		out.setInt(i, cls);
		++counts[cls];
	}
	for (const auto &it : counts)
		l_debug("Reclassified " << it.second << " cells to class " << it.first);
	return out;
}
