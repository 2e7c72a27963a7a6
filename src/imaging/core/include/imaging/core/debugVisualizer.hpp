#pragma once

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace wellgrid::imaging::core {

//! One image produced by a pipeline step.
struct DebugStep {
	std::string name; //!< Step name shown in the label bar.
	cv::Mat image;    //!< Image produced by the step.
};

//! A pipeline stage with all images its steps added.
struct DebugStage {
	std::string name;
	std::vector<DebugStep> images{};
};

//! Can be passed to the grid and stamp functions to collect intermediate images. The collection is rendered into one mosaic.
class DebugVisualizer {
public:
	void beginStage(std::string name);              //!< New stage starts. Ends the active stage.
	void add(std::string name, const cv::Mat& img); //!< Add an image to the active stage. Ignored without an active stage.
	void endStage();

	cv::Mat buildMosaic(); //!< Mosaic with one column per stage and one row per step. Ends the active stage.

	std::size_t stageCount() const {
		return m_stages.size() + (m_hasActiveStage ? 1u : 0u);
	}
	void clear();

	//! Normalise any depth / channel count to 8-bit BGR for display.
	static cv::Mat toBgr8U(const cv::Mat& in);

private:
	static void drawLabel(cv::Mat& tile, const std::string& text, int barHeight);

private:
	DebugStage m_currentStage{};        //!< Currently active stage.
	bool m_hasActiveStage{false};       //!< A stage is active.
	std::vector<DebugStage> m_stages{}; //!< Finished stages.
};

} // namespace wellgrid::imaging::core
