#pragma once

#include "imaging/core/stampExtractor.hpp"
#include "imaging/core/tiling.hpp"

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

// Stage 2 postprocessing: a pure per-well map over a stamp stack.
// A sample is "above threshold" if its value is strictly greater than the threshold. Multi-channel stamps use the same threshold on
// every channel.
namespace wellgrid::imaging::core {

//! What the output image of a well contains.
enum class ThresholdMode {
	Binarize,    //!< Full scale above the threshold, 0 otherwise.
	Mask,        //!< Original value above the threshold, 0 otherwise.
	Passthrough, //!< Unchanged copy.
};

//! What happens to wells that fail the occupancy test.
enum class GatePolicy {
	Keep,           //!< All processed wells produce an image.
	DiscardFailing, //!< Wells below the occupancy cutoff produce no image.
};

struct ThresholdConfig {
	double thresholdValue{128.0}; //!< Intensity threshold in the units of the stack.
	ThresholdMode mode{ThresholdMode::Binarize};
	double occupancyCutoff{0.5}; //!< Fraction of samples above the threshold needed to pass (0..1).
	GatePolicy gate{GatePolicy::Keep};
	bool skipInvalid{true}; //!< Do not process padded (clipped / outside) stamps.
};

//! Result for one well.
struct ThresholdResult {
	WellIndex index;
	bool valid{true};          //!< Validity copied from the coordinate table.
	bool processed{false};     //!< False if the well was skipped.
	cv::Mat image;             //!< Same size and type as the stamp. Empty if skipped or discarded.
	double fractionAbove{0.0}; //!< Share of samples above the threshold.
	bool pass{false};          //!< fractionAbove >= occupancyCutoff.
	bool kept{false};          //!< An image is written for this well.
	double meanIntensity{0.0}; //!< Mean stamp intensity over all channels.
};

//! Counts reported at the end of stage 2.
struct ThresholdSummary {
	std::size_t total{0u};
	std::size_t processed{0u};
	std::size_t skipped{0u};
	std::size_t passed{0u};
	std::size_t kept{0u};
	double meanFraction{0.0};   //!< Mean fractionAbove over processed wells.
	double medianFraction{0.0}; //!< Median fractionAbove over processed wells.
};

std::string toString(ThresholdMode mode);
std::string toString(GatePolicy gate);
ThresholdMode thresholdModeFromString(const std::string& text); //!< Throws ConfigError for unknown text.
GatePolicy gatePolicyFromString(const std::string& text);       //!< Throws ConfigError for unknown text.

//! Full-scale value of an image depth (255 for 8-bit, 65535 for 16-bit). Throws ConfigError for other depths.
double fullScale(int depth);

//! Check the depth independent parts of the config (finite values, cutoff in [0, 1], threshold within the 16-bit range).
void validateThreshold(const ThresholdConfig& config);

//! Check the config against the stack depth. Throws ConfigError if the threshold is outside [0, fullScale(depth)].
void validateThreshold(const ThresholdConfig& config, int depth);

/*! Threshold one stamp.
 * \param [in] stamp  Stamp image (8- or 16-bit unsigned, any channel count).
 * \param [in] config Threshold settings.
 * \return     Result with image, fractionAbove, pass, kept and meanIntensity filled. index/valid are left default.
 */
ThresholdResult thresholdStamp(const cv::Mat& stamp, const ThresholdConfig& config);

/*! Threshold every stamp of a stack.
 *  The stack and table are matched by position and must describe the same well at every position. Wells are processed in parallel.
 *
 * \param [in] stack  Stamps from stage 1.
 * \param [in] table  Coordinate table from stage 1.
 * \param [in] config Threshold settings.
 * \return     One result per stamp, in stack order.
 * \throws     ManifestError if stack and table disagree, ConfigError for an invalid config or unsupported depth.
 */
std::vector<ThresholdResult> applyThreshold(const std::vector<WellStamp>& stack, const CoordinateTable& table, const ThresholdConfig& config);

ThresholdSummary summarizeThreshold(const std::vector<ThresholdResult>& results);

} // namespace wellgrid::imaging::core
