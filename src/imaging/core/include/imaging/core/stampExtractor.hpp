#pragma once

#include "imaging/core/debugVisualizer.hpp"
#include "imaging/core/gridModel.hpp"
#include "imaging/core/tiling.hpp"

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace wellgrid::imaging::core {

//! How a stamp relates to the source image.
enum class StampStatus {
	Ok,      //!< Crop fully inside the image.
	Clipped, //!< Crop partially outside the image. Missing pixels hold the fill value.
	Outside, //!< Crop entirely outside the image. All pixels hold the fill value.
};

//! The fixed-size crop around one well.
struct WellStamp {
	WellIndex index;
	cv::Point2d center; //!< Predicted well center (source image pixels).
	cv::Mat image;      //!< stampWidth x stampWidth, same type as the source image.
	StampStatus status{StampStatus::Ok};

	bool valid() const {
		return status == StampStatus::Ok;
	}
};

//! One row of the coordinate table. Row k describes stamp k of the stack.
struct CoordinateRow {
	WellIndex index;
	cv::Point2d center;
	bool valid{true};
	StampStatus status{StampStatus::Ok};
	std::string source; //!< Identifier of the source image.
};

using CoordinateTable = std::vector<CoordinateRow>;

//! Stamp extraction parameters.
struct StampConfig {
	double fillValue{0.0}; //!< Value of padded pixels for crops that leave the image.
};

//! Counts reported at the end of stage 1.
struct ExtractionSummary {
	std::size_t total{0u};
	std::size_t valid{0u};
	std::size_t clipped{0u};
	std::size_t outside{0u};
};

//! Output of the stamp extraction. stack[k] and table[k] always describe the same well.
struct ExtractionResult {
	std::vector<WellStamp> stack;
	CoordinateTable table;
	ExtractionSummary summary;
};

//! Text form used in tables and logs ("ok", "clipped", "outside").
std::string toString(StampStatus status);

//! Inverse of toString(StampStatus). Throws ConfigError for unknown text.
StampStatus stampStatusFromString(const std::string& text);

//! Crop rectangle of a stamp centered on a well (may reach outside the image).
cv::Rect stampRect(const cv::Point2d& center, int stampWidth);

/*! Crop one stamp around a center. Pixels outside the image are padded with the fill value.
 * \param [in]  image      Source image.
 * \param [in]  center     Well center (source image pixels).
 * \param [in]  stampWidth Side length of the stamp (px).
 * \param [in]  fillValue  Value of padded pixels.
 * \param [out] status     Ok, Clipped or Outside.
 * \return      stampWidth x stampWidth image of the source type.
 */
cv::Mat cropStamp(const cv::Mat& image, const cv::Point2d& center, int stampWidth, double fillValue, StampStatus& status);

/*! Crop one stamp per well of the grid and build the matching coordinate table.
 *  Wells are independent and are cropped in parallel. A crop leaving the image never fails the run, it is padded and flagged.
 *
 * \param [in]     image    Source image (grayscale, any depth).
 * \param [in]     grid     Well centers from computeCenters().
 * \param [in]     sourceId Identifier of the image, copied to every table row.
 * \param [in]     config   Extraction parameters.
 * \param [in,out] debugger Optional debug visualizer for overlays.
 * \return         Stack and table in enumeration order, plus counts.
 * \throws         ConfigError if the image is empty.
 */
ExtractionResult extractStamps(const cv::Mat& image, const WellGrid& grid, const std::string& sourceId, const StampConfig& config = StampConfig{},
                               DebugVisualizer* debugger = nullptr);

//! Count valid / clipped / outside stamps.
ExtractionSummary summarize(const std::vector<WellStamp>& stack);

/*! Lay out all stamps at their position on the chip. Subarrays are separated by a gutter.
 * \param [in] stack  Stamps in any order (placed by their WellIndex).
 * \param [in] tiling Chip layout the stamps were cut with.
 * \param [in] gutter Gap between subarrays (px).
 * \return     Summary image of the source type, empty for an empty stack.
 */
cv::Mat buildStampMosaic(const std::vector<WellStamp>& stack, const TilingSpec& tiling, int gutter = 4);

} // namespace wellgrid::imaging::core
