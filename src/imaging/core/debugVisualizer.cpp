#include "imaging/core/debugVisualizer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <opencv2/imgproc.hpp>

namespace wellgrid::imaging::core {

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}

	m_stages.emplace_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_hasActiveStage) {
		std::cerr << "[Warning] Debug image '" << name << "' added without an active stage. Ignored.\n";
		return;
	}
	m_currentStage.images.push_back(DebugStep{std::move(name), img.clone()});
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

cv::Mat DebugVisualizer::buildMosaic() {
	static constexpr int TILE_SIZE = 480; //!< Square tile per step (px).
	static constexpr int HEADER_H  = 34;  //!< Stage header height (px).
	static constexpr int LABEL_H   = 26;  //!< Step label height inside each tile (px).
	static constexpr int PAD       = 4;

	static const cv::Scalar BACKGROUND(24, 24, 24);

	endStage();
	if (m_stages.empty()) {
		return {};
	}

	std::size_t rows = 0u;
	for (const auto& stage: m_stages) {
		rows = std::max(rows, stage.images.size());
	}
	if (rows == 0u) {
		return {};
	}

	const int cols = static_cast<int>(m_stages.size());
	cv::Mat mosaic(HEADER_H + static_cast<int>(rows) * TILE_SIZE, cols * TILE_SIZE, CV_8UC3, BACKGROUND);

	for (int c = 0; c < cols; ++c) {
		const DebugStage& stage = m_stages[static_cast<std::size_t>(c)];

		cv::Mat header = mosaic(cv::Rect(c * TILE_SIZE, 0, TILE_SIZE, HEADER_H));
		drawLabel(header, stage.name + " (" + std::to_string(stage.images.size()) + ")", HEADER_H);

		for (std::size_t r = 0u; r < stage.images.size(); ++r) {
			const DebugStep& step = stage.images[r];
			cv::Mat tile          = mosaic(cv::Rect(c * TILE_SIZE, HEADER_H + static_cast<int>(r) * TILE_SIZE, TILE_SIZE, TILE_SIZE));
			drawLabel(tile, step.name, LABEL_H);

			if (step.image.empty()) {
				continue;
			}

			// Fit the image into the area below the label, keep the aspect ratio.
			const cv::Mat vis  = toBgr8U(step.image);
			const int availW   = TILE_SIZE - 2 * PAD;
			const int availH   = TILE_SIZE - LABEL_H - 2 * PAD;
			const double scale = std::min(static_cast<double>(availW) / vis.cols, static_cast<double>(availH) / vis.rows);
			const cv::Size fitted(std::clamp(static_cast<int>(std::lround(vis.cols * scale)), 1, availW),
			                      std::clamp(static_cast<int>(std::lround(vis.rows * scale)), 1, availH));

			cv::Mat resized;
			cv::resize(vis, resized, fitted, 0.0, 0.0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_NEAREST);
			const cv::Point origin(PAD + (availW - fitted.width) / 2, LABEL_H + PAD + (availH - fitted.height) / 2);
			resized.copyTo(tile(cv::Rect(origin, fitted)));
		}
	}

	return mosaic;
}

cv::Mat DebugVisualizer::toBgr8U(const cv::Mat& in) {
	if (in.empty()) {
		return {};
	}

	// Stretch anything that is not 8-bit to the full 8-bit range.
	cv::Mat out;
	if (in.depth() == CV_8U) {
		out = in;
	} else {
		cv::normalize(in, out, 0.0, 255.0, cv::NORM_MINMAX, CV_8U);
	}

	if (out.channels() == 1) {
		cv::cvtColor(out, out, cv::COLOR_GRAY2BGR);
	} else if (out.channels() == 4) {
		cv::cvtColor(out, out, cv::COLOR_BGRA2BGR);
	}
	return out;
}

void DebugVisualizer::drawLabel(cv::Mat& tile, const std::string& text, const int barHeight) {
	cv::rectangle(tile, cv::Rect(0, 0, tile.cols, barHeight), cv::Scalar(0, 0, 0), cv::FILLED);
	cv::putText(tile, text, cv::Point(6, barHeight - 9), cv::FONT_HERSHEY_SIMPLEX, 0.55, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
}

} // namespace wellgrid::imaging::core
