#pragma once

#include "imaging/core/tiling.hpp"

#include <opencv2/core/types.hpp>

#include <array>
#include <vector>

// The grid model is the first step of stage 1.
// Input:  Four hand-picked corner wells and the chip layout.
// Output: The center of every well in the fixed enumeration order (see tiling.hpp).
// Process:
//   1) Reduce the four corners to a parallelogram. The four points over-determine it, the mismatch is reported as residual and
//      rejected if it exceeds the tolerance.
//   2) Per axis, solve the intra-subarray well step from the corner span and the known subarray gap.
//   3) Place every well by interpolating the fitted corners at its solved axis fractions.
namespace wellgrid::imaging::core {

//! Tolerances of the grid fit.
struct GridFitConfig {
	double maxCornerResidualPx{3.0}; //!< Largest accepted RMS corner displacement of the parallelogram fit (px).
};

//! Diagnostics of one grid fit.
struct GridFit {
	std::array<cv::Point2d, 4> fittedCorners{}; //!< TL, TR, BL, BR after the parallelogram fit.
	double residual{0.0};                       //!< RMS corner displacement (px).
	cv::Point2d intraStep{};                    //!< Solved step between neighbouring wells inside a subarray, x and y axis (px).
	cv::Point2d stepVectorX{};                  //!< Image-space vector of one intra-subarray step along the array x axis.
	cv::Point2d stepVectorY{};                  //!< Image-space vector of one intra-subarray step along the array y axis.
};

//! Every well center of one chip image.
class WellGrid {
public:
	WellGrid(TilingSpec tiling, std::vector<WellCenter> centers, GridFit fit);

	const TilingSpec& tiling() const {
		return m_tiling;
	}
	const std::vector<WellCenter>& centers() const {
		return m_centers;
	} //!< All centers in enumeration order.
	const GridFit& fit() const {
		return m_fit;
	}
	std::size_t size() const {
		return m_centers.size();
	}

	//! Center of the given well. Throws std::out_of_range if the index is outside the tiling.
	const WellCenter& at(const WellIndex& index) const;

private:
	TilingSpec m_tiling;
	std::vector<WellCenter> m_centers;
	GridFit m_fit;
};

/*! Compute the center of every well from the four outside corners.
 * \param [in] corners Centers of the four extreme wells (source image pixels).
 * \param [in] tiling  Chip layout.
 * \param [in] config  Fit tolerances.
 * \return     Well grid with exactly wellCount(tiling) centers in enumeration order.
 * \throws     ConfigError for invalid tiling or degenerate corners, FitError if the corners do not describe the tiling.
 */
WellGrid computeCenters(const CornerSet& corners, const TilingSpec& tiling, const GridFitConfig& config = GridFitConfig{});

} // namespace wellgrid::imaging::core
