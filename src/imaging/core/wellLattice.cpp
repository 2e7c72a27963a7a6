#include "wellLattice.hpp"

#include "imaging/core/errors.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <string>

/**
 * @brief Closed-form lattice model of a tiled well array.
 *
 * Geometry is handled in two separable steps:
 *  1) the four measured corners are reduced to a parallelogram (fitParallelogram), which defines the two array axes,
 *  2) along each axis the well positions are solved in 1D from the corner span and the subarray gap (solveAxisLattice).
 *
 * Every well center is then an affine combination of the fitted corners. Nothing is fitted iteratively.
 */
namespace wellgrid::imaging::core {

ParallelogramFit fitParallelogram(const CornerSet& corners) {
	// 1. Defect of the parallelogram constraint TL + BR - TR - BL = 0.
	const cv::Point2d defect  = corners.topLeft + corners.bottomRight - corners.topRight - corners.bottomLeft;
	const cv::Point2d quarter = defect * 0.25; //!< Per-corner correction

	// 2. Project onto the constraint. Signs follow the constraint coefficients (+1 for TL/BR, -1 for TR/BL).
	ParallelogramFit fit{};
	fit.topLeft     = corners.topLeft - quarter;
	fit.topRight    = corners.topRight + quarter;
	fit.bottomLeft  = corners.bottomLeft + quarter;
	fit.bottomRight = corners.bottomRight - quarter;
	fit.defect      = defect;
	fit.residual    = cv::norm(quarter); // every corner moves by the same distance -> RMS == |quarter|
	return fit;
}

AxisLattice solveAxisLattice(const double span, const unsigned subarrays, const unsigned wellsPerSubarray, const double gap, const double tolerancePx,
                             const std::string_view axisName) {
	const unsigned n = subarrays;        //!< Subarrays on this axis
	const unsigned m = wellsPerSubarray; //!< Wells per subarray on this axis

	AxisLattice lattice{};
	lattice.span = span;
	lattice.fractions.reserve(static_cast<std::size_t>(n) * m);

	// 0. A single well on this axis: nothing to solve, the corners must coincide.
	if (n == 1u && m == 1u) {
		if (span > tolerancePx) {
			std::ostringstream os;
			os << "The " << axisName << " axis holds a single well but the corners are " << span << " px apart.";
			throw FitError(os.str(), span);
		}
		lattice.fractions.push_back(0.0);
		return lattice;
	}

	// 1. One well per subarray: only the subarray pitch exists and the corners fix it. The configured gap is redundant.
	if (m == 1u) {
		const double impliedGap = span / static_cast<double>(n - 1u);
		if (std::abs(impliedGap - gap) > tolerancePx) {
			std::cerr << "[Warning] " << axisName << " axis: corner span implies a subarray gap of " << impliedGap << " px, configured " << gap
			          << " px. Using the corner span.\n";
		}
		for (unsigned k = 0u; k < n; ++k) {
			lattice.fractions.push_back(static_cast<double>(k) / static_cast<double>(n - 1u));
		}
		lattice.gap              = impliedGap;
		lattice.fractions.back() = 1.0;
		return lattice;
	}

	// 2. Solve the intra-subarray step: span = n * (m - 1) * step + (n - 1) * gap.
	const double gapTotal = static_cast<double>(n - 1u) * gap;                    //!< Sum of all subarray gaps (px)
	const double steps    = static_cast<double>(n) * static_cast<double>(m - 1u); //!< Intra-subarray steps over the axis
	const double step     = (span - gapTotal) / steps;                            //!< Intra-subarray step (px)
	if (!std::isfinite(step) || step <= 0.0) {
		std::ostringstream os;
		os << "The " << axisName << " axis span of " << span << " px cannot hold " << n - 1u << " subarray gaps of " << gap << " px plus "
		   << steps << " well steps.";
		throw FitError(os.str(), 0.0);
	}

	lattice.intraStep = step;
	lattice.gap       = gap;

	// 3. Positions: k full subarrays (m - 1 steps + one gap each) plus w steps inside subarray k.
	const double pitch = static_cast<double>(m - 1u) * step + gap; //!< Subarray pitch (first well to first well)
	for (unsigned k = 0u; k < n; ++k) {
		for (unsigned w = 0u; w < m; ++w) {
			const double offset = static_cast<double>(k) * pitch + static_cast<double>(w) * step; // px from the first well
			lattice.fractions.push_back(offset / span);
		}
	}

	// The far corner is measured. Pin it so rounding cannot move it.
	lattice.fractions.back() = 1.0;
	return lattice;
}

} // namespace wellgrid::imaging::core
