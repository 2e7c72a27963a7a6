#include "imaging/core/thresholdProcessor.hpp"

#include "imaging/core/errors.hpp"

#include "statistics.hpp"

#include <opencv2/core.hpp>
#include <opencv2/core/utility.hpp>

#include <climits>
#include <cmath>
#include <sstream>

namespace wellgrid::imaging::core {

std::string toString(const ThresholdMode mode) {
	switch (mode) {
	case ThresholdMode::Binarize:
		return "binarize";
	case ThresholdMode::Mask:
		return "mask";
	case ThresholdMode::Passthrough:
		return "passthrough";
	}
	return "binarize";
}

std::string toString(const GatePolicy gate) {
	switch (gate) {
	case GatePolicy::Keep:
		return "keep";
	case GatePolicy::DiscardFailing:
		return "discard";
	}
	return "keep";
}

ThresholdMode thresholdModeFromString(const std::string& text) {
	if (text == "binarize")
		return ThresholdMode::Binarize;
	if (text == "mask")
		return ThresholdMode::Mask;
	if (text == "passthrough")
		return ThresholdMode::Passthrough;
	throw ConfigError("Unknown threshold mode '" + text + "'. Expected binarize, mask or passthrough.");
}

GatePolicy gatePolicyFromString(const std::string& text) {
	if (text == "keep")
		return GatePolicy::Keep;
	if (text == "discard")
		return GatePolicy::DiscardFailing;
	throw ConfigError("Unknown gate policy '" + text + "'. Expected keep or discard.");
}

double fullScale(const int depth) {
	switch (depth) {
	case CV_8U:
		return 255.0;
	case CV_16U:
		return 65535.0;
	default:
		throw ConfigError("Unsupported stamp depth " + std::to_string(depth) + ". Only 8- and 16-bit unsigned stamps can be thresholded.");
	}
}

void validateThreshold(const ThresholdConfig& config) {
	if (!std::isfinite(config.thresholdValue) || config.thresholdValue < 0.0 || config.thresholdValue > fullScale(CV_16U)) {
		std::ostringstream os;
		os << "Threshold " << config.thresholdValue << " is outside the valid intensity range [0, " << fullScale(CV_16U) << "].";
		throw ConfigError(os.str());
	}
	if (!std::isfinite(config.occupancyCutoff) || config.occupancyCutoff < 0.0 || config.occupancyCutoff > 1.0) {
		std::ostringstream os;
		os << "Occupancy cutoff " << config.occupancyCutoff << " must be a fraction in [0, 1].";
		throw ConfigError(os.str());
	}
}

void validateThreshold(const ThresholdConfig& config, const int depth) {
	validateThreshold(config);

	const double maxValue = fullScale(depth);
	if (config.thresholdValue > maxValue) {
		std::ostringstream os;
		os << "Threshold " << config.thresholdValue << " is outside the intensity range [0, " << maxValue << "] of the stack.";
		throw ConfigError(os.str());
	}
}

ThresholdResult thresholdStamp(const cv::Mat& stamp, const ThresholdConfig& config) {
	ThresholdResult result{};
	result.processed = true;

	// Work on a single channel view so every channel is compared against the same scalar.
	const int channels = stamp.channels();
	const cv::Mat flat = stamp.reshape(1);

	cv::Mat above; //!< 255 where the sample is strictly above the threshold, 0 otherwise
	cv::compare(flat, cv::Scalar::all(config.thresholdValue), above, cv::CMP_GT);

	const double samples = static_cast<double>(flat.total());
	result.fractionAbove = samples > 0.0 ? static_cast<double>(cv::countNonZero(above)) / samples : 0.0;
	result.meanIntensity = cv::mean(flat)[0];
	result.pass          = result.fractionAbove >= config.occupancyCutoff;
	result.kept          = config.gate == GatePolicy::Keep || result.pass;

	if (!result.kept) {
		return result;
	}

	cv::Mat out;
	switch (config.mode) {
	case ThresholdMode::Binarize:
		// The compare mask is 0/255. Scale it to the full range of the stamp depth.
		above.convertTo(out, stamp.depth(), fullScale(stamp.depth()) / 255.0);
		break;
	case ThresholdMode::Mask:
		out = cv::Mat::zeros(flat.size(), flat.type());
		flat.copyTo(out, above);
		break;
	case ThresholdMode::Passthrough:
		out = flat.clone();
		break;
	}

	result.image = out.reshape(channels);
	return result;
}

std::vector<ThresholdResult> applyThreshold(const std::vector<WellStamp>& stack, const CoordinateTable& table, const ThresholdConfig& config) {
	// 0. The stack and the table must be the same manifest.
	if (stack.size() != table.size()) {
		throw ManifestError("Stamp stack holds " + std::to_string(stack.size()) + " frames but the coordinate table holds " + std::to_string(table.size()) +
		                    " rows.");
	}

	validateThreshold(config);
	if (stack.empty()) {
		return {};
	}
	if (stack.size() > static_cast<std::size_t>(INT_MAX)) {
		throw ConfigError("Cannot threshold more than " + std::to_string(INT_MAX) + " stamps at once.");
	}

	const int type = stack.front().image.type();
	for (std::size_t k = 0u; k < stack.size(); ++k) {
		const WellStamp& stamp   = stack[k];
		const CoordinateRow& row = table[k];
		if (!(stamp.index == row.index)) {
			throw ManifestError("Frame " + std::to_string(k) + " and table row " + std::to_string(k) + " describe different wells.");
		}
		if (stamp.valid() != row.valid) {
			throw ManifestError("Frame " + std::to_string(k) + " and table row " + std::to_string(k) + " disagree on validity.");
		}
		if (stamp.image.empty() || stamp.image.type() != type) {
			throw ManifestError("Frame " + std::to_string(k) + " is empty or differs in type from the first frame.");
		}
	}
	validateThreshold(config, CV_MAT_DEPTH(type));

	// 1. Independent per-well map. Each worker owns its output slots.
	std::vector<ThresholdResult> results(stack.size());
	cv::parallel_for_(cv::Range(0, static_cast<int>(stack.size())), [&](const cv::Range& range) {
		for (int k = range.start; k < range.end; ++k) {
			const auto i         = static_cast<std::size_t>(k);
			const bool valid     = table[i].valid;
			ThresholdResult& out = results[i];

			if (!valid && config.skipInvalid) {
				out = ThresholdResult{};
			} else {
				out = thresholdStamp(stack[i].image, config);
			}
			out.index = table[i].index;
			out.valid = valid;
		}
	});

	return results;
}

ThresholdSummary summarizeThreshold(const std::vector<ThresholdResult>& results) {
	ThresholdSummary summary{};
	summary.total = results.size();

	std::vector<double> fractions;
	fractions.reserve(results.size());
	for (const auto& r: results) {
		if (!r.processed) {
			++summary.skipped;
			continue;
		}
		++summary.processed;
		summary.passed += r.pass ? 1u : 0u;
		summary.kept += r.kept ? 1u : 0u;
		fractions.push_back(r.fractionAbove);
	}

	summary.meanFraction   = mean(fractions);
	summary.medianFraction = median(fractions);
	return summary;
}

} // namespace wellgrid::imaging::core
