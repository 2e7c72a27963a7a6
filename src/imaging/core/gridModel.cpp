#include "imaging/core/gridModel.hpp"

#include "imaging/core/errors.hpp"

#include "wellLattice.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace wellgrid::imaging::core {

//! Enable verbose grid diagnostics via environment variable.
static bool gridDebugEnabled() {
	const char* env = std::getenv("WELLGRID_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

WellGrid::WellGrid(TilingSpec tiling, std::vector<WellCenter> centers, GridFit fit)
    : m_tiling{tiling}, m_centers{std::move(centers)}, m_fit{std::move(fit)} {
}

const WellCenter& WellGrid::at(const WellIndex& index) const {
	if (!isInside(index, m_tiling)) {
		throw std::out_of_range("Well index outside of the tiling.");
	}
	return m_centers.at(flatIndex(index, m_tiling));
}

//! Bilinear interpolation of the fitted corners. At tx, ty in {0, 1} this returns the corner itself.
static cv::Point2d interpolate(const ParallelogramFit& fit, const double tx, const double ty) {
	return (1.0 - tx) * (1.0 - ty) * fit.topLeft + tx * (1.0 - ty) * fit.topRight + (1.0 - tx) * ty * fit.bottomLeft + tx * ty * fit.bottomRight;
}

WellGrid computeCenters(const CornerSet& corners, const TilingSpec& tiling, const GridFitConfig& config) {
	// 0. Guard. Nothing below may run on a bad configuration.
	validateTiling(tiling);
	validateCorners(corners, tiling);
	if (!std::isfinite(config.maxCornerResidualPx) || config.maxCornerResidualPx < 0.0) {
		throw ConfigError("The corner residual tolerance must be finite and non-negative.");
	}

	// 1. Parallelogram through the corners. Reject corners that do not agree with each other.
	const ParallelogramFit frame = fitParallelogram(corners);
	if (frame.residual > config.maxCornerResidualPx) {
		std::ostringstream os;
		os << "Corner residual of " << frame.residual << " px exceeds the tolerance of " << config.maxCornerResidualPx
		   << " px. The bottom-right corner is off by (" << frame.defect.x << ", " << frame.defect.y << ") px from the other three.";
		throw FitError(os.str(), frame.residual);
	}

	// 2. Solve both axes in 1D.
	const double spanX         = cv::norm(frame.topRight - frame.topLeft);
	const double spanY         = cv::norm(frame.bottomLeft - frame.topLeft);
	const AxisLattice latticeX = solveAxisLattice(spanX, tiling.subarrayDims.cols, tiling.tileDims.cols, tiling.intraTileSpacing.x,
	                                              config.maxCornerResidualPx, "x");
	const AxisLattice latticeY = solveAxisLattice(spanY, tiling.subarrayDims.rows, tiling.tileDims.rows, tiling.intraTileSpacing.y,
	                                              config.maxCornerResidualPx, "y");

	// 3. Place every well. i/j are the global well column/row over all subarrays.
	std::vector<WellCenter> centers;
	centers.reserve(wellCount(tiling));
	for (const WellIndex& index: enumerateWells(tiling)) {
		const std::size_t i = static_cast<std::size_t>(index.subarrayCol) * tiling.tileDims.cols + index.wellCol;
		const std::size_t j = static_cast<std::size_t>(index.subarrayRow) * tiling.tileDims.rows + index.wellRow;
		centers.push_back({index, interpolate(frame, latticeX.fractions[i], latticeY.fractions[j])});
	}

	GridFit fit{};
	fit.fittedCorners = {frame.topLeft, frame.topRight, frame.bottomLeft, frame.bottomRight};
	fit.residual      = frame.residual;
	fit.intraStep     = {latticeX.intraStep, latticeY.intraStep};
	fit.stepVectorX   = spanX > 0.0 ? (frame.topRight - frame.topLeft) * (latticeX.intraStep / spanX) : cv::Point2d{};
	fit.stepVectorY   = spanY > 0.0 ? (frame.bottomLeft - frame.topLeft) * (latticeY.intraStep / spanY) : cv::Point2d{};

	std::cout << "Grid fit: " << centers.size() << " wells, corner residual " << fit.residual << " px, intra-subarray step (" << fit.intraStep.x
	          << ", " << fit.intraStep.y << ") px\n";
	if (gridDebugEnabled()) {
		for (const auto& c: centers) {
			std::cout << "  well sc=" << c.index.subarrayCol << " sr=" << c.index.subarrayRow << " wc=" << c.index.wellCol << " wr=" << c.index.wellRow
			          << " -> (" << c.position.x << ", " << c.position.y << ")\n";
		}
	}

	return WellGrid{tiling, std::move(centers), fit};
}

} // namespace wellgrid::imaging::core
