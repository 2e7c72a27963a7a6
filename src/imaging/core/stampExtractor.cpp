#include "imaging/core/stampExtractor.hpp"

#include "imaging/core/errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/core/utility.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace wellgrid::imaging::core {

//! Enable verbose per-well diagnostics via environment variable.
static bool stampDebugEnabled() {
	const char* env = std::getenv("WELLGRID_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

std::string toString(const StampStatus status) {
	switch (status) {
	case StampStatus::Ok:
		return "ok";
	case StampStatus::Clipped:
		return "clipped";
	case StampStatus::Outside:
		return "outside";
	}
	return "ok";
}

StampStatus stampStatusFromString(const std::string& text) {
	if (text == "ok")
		return StampStatus::Ok;
	if (text == "clipped")
		return StampStatus::Clipped;
	if (text == "outside")
		return StampStatus::Outside;
	throw ConfigError("Unknown stamp status '" + text + "'.");
}

cv::Rect stampRect(const cv::Point2d& center, const int stampWidth) {
	// Round the center to the nearest pixel. For even widths the center pixel is the one right/below the middle.
	const int cx = static_cast<int>(std::lround(center.x));
	const int cy = static_cast<int>(std::lround(center.y));
	return {cx - stampWidth / 2, cy - stampWidth / 2, stampWidth, stampWidth};
}

cv::Mat cropStamp(const cv::Mat& image, const cv::Point2d& center, const int stampWidth, const double fillValue, StampStatus& status) {
	cv::Mat stamp(stampWidth, stampWidth, image.type(), cv::Scalar::all(fillValue));

	// Crop rectangles use int pixel coordinates. A center too far away for them cannot overlap any image.
	static constexpr double MAX_CENTER_PX = INT_MAX / 2;
	const double reach                    = MAX_CENTER_PX - stampWidth;
	if (!std::isfinite(center.x) || !std::isfinite(center.y) || std::abs(center.x) > reach || std::abs(center.y) > reach) {
		status = StampStatus::Outside;
		return stamp;
	}

	const cv::Rect crop   = stampRect(center, stampWidth);
	const cv::Rect inside = crop & cv::Rect(0, 0, image.cols, image.rows); //!< Part of the crop covered by the image
	if (inside.empty()) {
		status = StampStatus::Outside;
		return stamp;
	}

	image(inside).copyTo(stamp(cv::Rect(inside.x - crop.x, inside.y - crop.y, inside.width, inside.height)));
	status = (inside == crop) ? StampStatus::Ok : StampStatus::Clipped;
	return stamp;
}

ExtractionSummary summarize(const std::vector<WellStamp>& stack) {
	ExtractionSummary summary{};
	summary.total = stack.size();
	for (const auto& stamp: stack) {
		switch (stamp.status) {
		case StampStatus::Ok:
			++summary.valid;
			break;
		case StampStatus::Clipped:
			++summary.clipped;
			break;
		case StampStatus::Outside:
			++summary.outside;
			break;
		}
	}
	return summary;
}

//! Overlay of the crop rectangles on the source image. Green: ok, orange: clipped. Outside crops are not drawn.
static cv::Mat drawStampOverlay(const cv::Mat& image, const std::vector<WellStamp>& stack, const int stampWidth) {
	cv::Mat vis = DebugVisualizer::toBgr8U(image);
	if (vis.data == image.data) {
		vis = vis.clone();
	}

	const int thickness = std::max(1, stampWidth / 16);
	for (const auto& stamp: stack) {
		if (stamp.status == StampStatus::Outside) {
			continue;
		}
		const cv::Scalar colour = stamp.valid() ? cv::Scalar(0, 200, 0) : cv::Scalar(0, 140, 255);
		cv::rectangle(vis, stampRect(stamp.center, stampWidth), colour, thickness);
		cv::circle(vis, cv::Point(static_cast<int>(std::lround(stamp.center.x)), static_cast<int>(std::lround(stamp.center.y))), thickness, colour,
		           cv::FILLED);
	}
	return vis;
}

ExtractionResult extractStamps(const cv::Mat& image, const WellGrid& grid, const std::string& sourceId, const StampConfig& config,
                               DebugVisualizer* debugger) {
	if (image.empty()) {
		throw ConfigError("Cannot extract stamps from an empty image.");
	}

	const int stampWidth                   = grid.tiling().stampWidth;
	const std::vector<WellCenter>& centers = grid.centers();
	if (centers.size() > static_cast<std::size_t>(INT_MAX)) {
		throw ConfigError("Cannot extract more than " + std::to_string(INT_MAX) + " stamps from one image.");
	}

	if (debugger) {
		debugger->beginStage("Extract Stamps");
		debugger->add("Source", image);
	}

	// 1. Crop every well. Each worker only writes its own slot of the stack.
	ExtractionResult result{};
	result.stack.resize(centers.size());

	cv::parallel_for_(cv::Range(0, static_cast<int>(centers.size())), [&](const cv::Range& range) {
		for (int k = range.start; k < range.end; ++k) {
			const WellCenter& center = centers[static_cast<std::size_t>(k)];
			WellStamp& stamp         = result.stack[static_cast<std::size_t>(k)];

			stamp.index  = center.index;
			stamp.center = center.position;
			stamp.image  = cropStamp(image, center.position, stampWidth, config.fillValue, stamp.status);
		}
	});

	// 2. Coordinate table in the same order.
	result.table.reserve(result.stack.size());
	for (const auto& stamp: result.stack) {
		result.table.push_back({stamp.index, stamp.center, stamp.valid(), stamp.status, sourceId});

		if (!stamp.valid() && stampDebugEnabled()) {
			std::cerr << "[Warning] Well sc=" << stamp.index.subarrayCol << " sr=" << stamp.index.subarrayRow << " wc=" << stamp.index.wellCol
			          << " wr=" << stamp.index.wellRow << " is " << toString(stamp.status) << " (center " << stamp.center.x << ", " << stamp.center.y
			          << ").\n";
		}
	}

	result.summary = summarize(result.stack);
	std::cout << "Extracted " << result.summary.total << " stamps from '" << sourceId << "': " << result.summary.valid << " valid, "
	          << result.summary.clipped << " clipped, " << result.summary.outside << " outside.\n";

	if (debugger) {
		debugger->add("Stamp Rectangles", drawStampOverlay(image, result.stack, stampWidth));
		debugger->add("Stamp Mosaic", buildStampMosaic(result.stack, grid.tiling()));
		debugger->endStage();
	}

	return result;
}

cv::Mat buildStampMosaic(const std::vector<WellStamp>& stack, const TilingSpec& tiling, const int gutter) {
	if (stack.empty()) {
		return {};
	}

	const int w          = tiling.stampWidth;
	const GridDims total = totalWellDims(tiling);
	const int width      = static_cast<int>(total.cols) * w + static_cast<int>(tiling.subarrayDims.cols - 1u) * gutter;
	const int height     = static_cast<int>(total.rows) * w + static_cast<int>(tiling.subarrayDims.rows - 1u) * gutter;
	const int type       = stack.front().image.type();

	cv::Mat mosaic = cv::Mat::zeros(height, width, type);
	for (const auto& stamp: stack) {
		if (!isInside(stamp.index, tiling) || stamp.image.type() != type || stamp.image.cols != w || stamp.image.rows != w) {
			continue;
		}

		const int col = static_cast<int>(stamp.index.subarrayCol * tiling.tileDims.cols + stamp.index.wellCol); //!< Global well column
		const int row = static_cast<int>(stamp.index.subarrayRow * tiling.tileDims.rows + stamp.index.wellRow); //!< Global well row
		const int x   = col * w + static_cast<int>(stamp.index.subarrayCol) * gutter;
		const int y   = row * w + static_cast<int>(stamp.index.subarrayRow) * gutter;
		stamp.image.copyTo(mosaic(cv::Rect(x, y, w, w)));
	}
	return mosaic;
}

} // namespace wellgrid::imaging::core
