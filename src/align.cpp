/*
 * Resamples rasters onto a reference grid. Destination cell centres are
 * mapped into the source grid (through a CRS transformation when the
 * projections differ) and sampled there.
 */

#include <cmath>
#include <memory>
#include <vector>

#include <ogr_spatialref.h>

#include "laitools.hpp"
#include "align.hpp"

using namespace laitools::raster;

namespace {

	// Samples the cell containing the fractional column/row.
	double _nearest(const MemRaster &src, double fc, double fr) {
		int c = (int) std::floor(fc);
		int r = (int) std::floor(fr);
		if (!src.props().hasCell(c, r))
			return src.props().nodata();
		return src.getFloat(c, r);
	}

	// Interpolates between the four cell centres around the fractional
	// column/row. Falls back to the nearest cell at the edges or where
	// a neighbour is nodata.
	double _bilinear(const MemRaster &src, double fc, double fr) {
		const GridProps &props = src.props();
		double x = fc - 0.5;
		double y = fr - 0.5;
		int c0 = (int) std::floor(x);
		int r0 = (int) std::floor(y);
		if (c0 < 0 || r0 < 0 || c0 + 1 >= props.cols() || r0 + 1 >= props.rows())
			return _nearest(src, fc, fr);
		double v00 = src.getFloat(c0, r0);
		double v10 = src.getFloat(c0 + 1, r0);
		double v01 = src.getFloat(c0, r0 + 1);
		double v11 = src.getFloat(c0 + 1, r0 + 1);
		if (props.isNodata(v00) || props.isNodata(v10) || props.isNodata(v01) || props.isNodata(v11))
			return _nearest(src, fc, fr);
		double dx = x - c0;
		double dy = y - r0;
		return v00 * (1.0 - dx) * (1.0 - dy) + v10 * dx * (1.0 - dy)
				+ v01 * (1.0 - dx) * dy + v11 * dx * dy;
	}

	class CTDeleter {
	public:
		void operator()(OGRCoordinateTransformation *ct) const {
			OGRCoordinateTransformation::DestroyCT(ct);
		}
	};

	typedef std::unique_ptr<OGRCoordinateTransformation, CTDeleter> CTPtr;

	// Builds a transformation from the reference CRS to the target CRS.
	CTPtr _transformation(const GridProps &reference, const GridProps &target) {
		OGRSpatialReference dst;
		OGRSpatialReference src;
		if (dst.importFromWkt(reference.projection().c_str()) != OGRERR_NONE)
			l_griderr("Failed to parse the reference CRS.");
		if (src.importFromWkt(target.projection().c_str()) != OGRERR_NONE)
			l_griderr("Failed to parse the target CRS.");
		dst.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
		src.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
		CTPtr ct(OGRCreateCoordinateTransformation(&dst, &src));
		if (!ct)
			l_griderr("Failed to create a coordinate transformation between the grids.");
		return ct;
	}

} // anon

MemRaster GridAligner::align(const MemRaster &reference, const MemRaster &target,
		Resample method) const {
	return align(reference.props(), target, method);
}

MemRaster GridAligner::align(const GridProps &reference, const MemRaster &target,
		Resample method) const {

	const GridProps &tprops = target.props();

	if (reference.projection().empty())
		l_griderr("The reference grid has an undefined CRS.");
	if (tprops.projection().empty())
		l_griderr("The target grid has an undefined CRS.");
	if (reference.isRotated() || tprops.isRotated())
		l_griderr("Rotated grids are not supported.");

	if (reference.isCoregistered(tprops))
		return target;

	GridProps props(reference);
	props.setNoData(tprops.nodata());
	props.setDataType(tprops.dataType());
	props.setBands(1);
	MemRaster out(props);

	bool reproject = !reference.sameProjection(tprops);
	CTPtr ct;
	if (reproject) {
		l_debug("Reprojecting " << tprops.cols() << "x" << tprops.rows() << " grid onto "
				<< props.cols() << "x" << props.rows() << " reference.");
		ct = _transformation(reference, tprops);
	}

	int cols = props.cols();
	int rows = props.rows();
	std::vector<double> xs(cols);
	std::vector<double> ys(cols);
	std::vector<int> ok(cols, TRUE);
	long valid = 0;

	for (int r = 0; r < rows; ++r) {
		for (int c = 0; c < cols; ++c) {
			xs[c] = props.toCentroidX(c);
			ys[c] = props.toCentroidY(r);
			ok[c] = TRUE;
		}
		if (reproject)
			ct->Transform(cols, xs.data(), ys.data(), nullptr, ok.data());
		for (int c = 0; c < cols; ++c) {
			if (!ok[c])
				continue;
			double fc = (xs[c] - tprops.tlx()) / tprops.resolutionX();
			double fr = (ys[c] - tprops.tly()) / tprops.resolutionY();
			double v = method == Resample::Bilinear ? _bilinear(target, fc, fr) : _nearest(target, fc, fr);
			if (!tprops.isNodata(v)) {
				out.setFloat(c, r, v);
				++valid;
			}
		}
	}

	if (valid == 0)
		l_griderr("Alignment produced no valid pixels; the grids do not overlap.");

	return out;
}
