#include "imaging/core/debugVisualizer.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <cstdint>

namespace wellgrid::imaging::core {
namespace gtest {

TEST(DebugVisualizer, MosaicHasOneColumnPerStage) {
	DebugVisualizer debugger;
	debugger.beginStage("Grid");
	debugger.add("Input", cv::Mat(100, 200, CV_16UC1, cv::Scalar(1000)));
	debugger.add("Overlay", cv::Mat(50, 50, CV_8UC3, cv::Scalar(0, 255, 0)));
	debugger.beginStage("Stamps"); // ends "Grid"
	debugger.add("Mosaic", cv::Mat(10, 10, CV_8UC1, cv::Scalar(7)));

	EXPECT_EQ(debugger.stageCount(), 2u);

	const cv::Mat mosaic = debugger.buildMosaic();
	ASSERT_FALSE(mosaic.empty());
	EXPECT_EQ(mosaic.type(), CV_8UC3);
	EXPECT_EQ(mosaic.cols % 2, 0);
	EXPECT_GT(mosaic.rows, mosaic.cols); // two rows of square tiles plus a header
	EXPECT_EQ(debugger.stageCount(), 2u);
}

TEST(DebugVisualizer, ImagesWithoutStageAreIgnored) {
	DebugVisualizer debugger;
	debugger.add("Lost", cv::Mat(10, 10, CV_8UC1, cv::Scalar(1)));
	EXPECT_EQ(debugger.stageCount(), 0u);
	EXPECT_TRUE(debugger.buildMosaic().empty());

	debugger.beginStage("Stage");
	debugger.add("Kept", cv::Mat(10, 10, CV_8UC1, cv::Scalar(1)));
	debugger.clear();
	EXPECT_EQ(debugger.stageCount(), 0u);
}

TEST(DebugVisualizer, SixteenBitImagesAreStretched) {
	cv::Mat in(2, 2, CV_16UC1, cv::Scalar(1000));
	in.at<std::uint16_t>(1, 1) = 3000;

	const cv::Mat out = DebugVisualizer::toBgr8U(in);
	ASSERT_EQ(out.type(), CV_8UC3);
	EXPECT_EQ(out.at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 0));
	EXPECT_EQ(out.at<cv::Vec3b>(1, 1), cv::Vec3b(255, 255, 255));
	EXPECT_TRUE(DebugVisualizer::toBgr8U(cv::Mat{}).empty());
}

} // namespace gtest
} // namespace wellgrid::imaging::core
