#include <sstream>

#include "laitools.hpp"
#include "normalize.hpp"

using namespace laitools::util;
using namespace laitools::raster;
using namespace laitools::lai;

Factor::Factor() :
	status(Factor::NoPredictedPixels),
	value(L_NODATA) {
}

Factor::Factor(Status status, double value) :
	status(status),
	value(value) {
}

bool Factor::defined() const {
	return status == Factor::Ratio || status == Factor::ZeroPredictedMean;
}

std::string Factor::statusName(Status status) {
	switch(status) {
	case Factor::Ratio: return "ratio";
	case Factor::ZeroPredictedMean: return "zero predicted mean";
	case Factor::NoBasePixels: return "no base-period pixels";
	case Factor::NoPredictedPixels: return "no predicted-period pixels";
	default: return "unknown";
	}
}

UndefinedFactorWarning::UndefinedFactorWarning(const Date &date, int classId, Factor::Status reason) :
	date(date),
	classId(classId),
	reason(reason) {
}

std::string UndefinedFactorWarning::message() const {
	std::stringstream ss;
	ss << "Undefined factor for class " << classId << " on " << Dates::iso(date)
			<< ": " << Factor::statusName(reason);
	return ss.str();
}

Factor NormalizationEngine::deriveFactor(const ClassStatistics &base, const ClassStatistics &predicted) const {
	if (predicted.count == 0)
		return Factor(Factor::NoPredictedPixels, L_NODATA);
	if (base.count == 0)
		return Factor(Factor::NoBasePixels, L_NODATA);
	if (predicted.mean == 0)
		return Factor(Factor::ZeroPredictedMean, 1.0);
	return Factor(Factor::Ratio, base.mean / predicted.mean);
}

std::map<int, double> NormalizationEngine::deriveFactors(const Date &date,
		const std::map<int, ClassStatistics> &base,
		const std::map<int, ClassStatistics> &predicted,
		std::vector<UndefinedFactorWarning> &warnings) const {
	std::map<int, double> factors;
	for (const auto &it : base) {
		auto pit = predicted.find(it.first);
		if (pit == predicted.end())
			continue;
		Factor f = deriveFactor(it.second, pit->second);
		if (f.defined()) {
			factors[it.first] = f.value;
		} else {
			warnings.push_back(UndefinedFactorWarning(date, it.first, f.status));
		}
	}
	return factors;
}

MemRaster NormalizationEngine::apply(const MemRaster &forecast, const MemRaster &classes,
		const std::map<int, double> &factors) const {
	const GridProps &fprops = forecast.props();
	const GridProps &cprops = classes.props();
	if (!fprops.isCoregistered(cprops))
		l_griderr("The forecast and class rasters are not co-registered.");

	GridProps props(fprops);
	props.setDataType(DataType::Float32);
	MemRaster out(props);
	double nodata = props.nodata();
	for (long i = 0; i < fprops.size(); ++i) {
		double v = forecast.getFloat(i);
		double c = classes.getFloat(i);
		if (fprops.isNodata(v) || cprops.isNodata(c)) {
			out.setFloat(i, nodata);
			continue;
		}
		auto it = factors.find((int) c);
		out.setFloat(i, it == factors.end() ? nodata : v * it->second);
	}
	return out;
}
