#pragma once

#include "imaging/core/tiling.hpp"

#include <opencv2/core/types.hpp>

#include <string_view>
#include <vector>

namespace wellgrid::imaging::core {

//! Least-squares parallelogram through four measured corners.
struct ParallelogramFit {
	cv::Point2d topLeft;
	cv::Point2d topRight;
	cv::Point2d bottomLeft;
	cv::Point2d bottomRight;
	cv::Point2d defect; //!< TL + BR - TR - BL of the measured corners. Zero for a perfect parallelogram.
	double residual;    //!< RMS displacement of the corners by the fit (px).
};

/*! Fit a parallelogram to the four measured corners.
 *  A parallelogram satisfies TL + BR = TR + BL. The least-squares correction of the measured corners with respect to this single
 *  linear constraint moves every corner by a quarter of the defect (signs -,+,+,- for TL,TR,BL,BR). The fitted corners are the measured
 *  ones if the corners are already consistent.
 *
 * \param [in] corners Measured corners.
 * \return     Fitted corners and the residual.
 */
ParallelogramFit fitParallelogram(const CornerSet& corners);

//! Solved 1D lattice along one axis of the array.
struct AxisLattice {
	std::vector<double> fractions; //!< Well positions as fraction of the span, in well order over all subarrays. front() = 0, back() = 1.
	double span{0.0};              //!< Distance between the first and the last well center (px).
	double intraStep{0.0};         //!< Solved distance between neighbouring wells inside a subarray (px).
	double gap{0.0};               //!< Distance between the facing edge wells of neighbouring subarrays (px).
};

/*! Solve the well lattice along one axis.
 *  The span is covered by subarrays * (wellsPerSubarray - 1) intra-subarray steps and (subarrays - 1) gaps:
 *    span = subarrays * (wellsPerSubarray - 1) * step + (subarrays - 1) * gap
 *  With the gap given, the step is the only unknown and follows by division.
 *
 * \param [in] span             Distance between the first and last well center on this axis (px).
 * \param [in] subarrays        Subarrays along this axis (>= 1).
 * \param [in] wellsPerSubarray Wells per subarray along this axis (>= 1).
 * \param [in] gap              Gap between neighbouring subarrays (px).
 * \param [in] tolerancePx      Allowed mismatch where the layout over-determines the span.
 * \param [in] axisName         Used in messages only.
 * \throws     FitError if the span cannot hold the layout.
 */
AxisLattice solveAxisLattice(double span, unsigned subarrays, unsigned wellsPerSubarray, double gap, double tolerancePx, std::string_view axisName);

} // namespace wellgrid::imaging::core
