#include "imaging/core/errors.hpp"
#include "imaging/core/thresholdProcessor.hpp"

#include "statistics.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <cstdint>

namespace wellgrid::imaging::core {
namespace gtest {

//! 8x8 8-bit stamp, left half `left`, right half `right`.
static cv::Mat halfStamp(std::uint8_t left, std::uint8_t right) {
	cv::Mat stamp(8, 8, CV_8UC1, cv::Scalar(left));
	stamp(cv::Rect(4, 0, 4, 8)).setTo(cv::Scalar(right));
	return stamp;
}

static WellStamp makeStamp(const WellIndex& index, const cv::Mat& image, StampStatus status = StampStatus::Ok) {
	return WellStamp{index, {10.0, 10.0}, image, status};
}

static CoordinateRow rowFor(const WellStamp& stamp) {
	return CoordinateRow{stamp.index, stamp.center, stamp.valid(), stamp.status, "chip.tif"};
}

TEST(ThresholdProcessor, BrightStampIsFullyAbove) {
	const ThresholdResult r = thresholdStamp(cv::Mat(8, 8, CV_8UC1, cv::Scalar(200)), ThresholdConfig{});

	EXPECT_TRUE(r.processed);
	EXPECT_DOUBLE_EQ(r.fractionAbove, 1.0);
	EXPECT_TRUE(r.pass);
	EXPECT_TRUE(r.kept);
	EXPECT_DOUBLE_EQ(r.meanIntensity, 200.0);
	ASSERT_EQ(r.image.type(), CV_8UC1);
	EXPECT_EQ(cv::countNonZero(r.image != 255), 0);
}

TEST(ThresholdProcessor, DarkStampIsFullyBelow) {
	const ThresholdResult r = thresholdStamp(cv::Mat(8, 8, CV_8UC1, cv::Scalar(50)), ThresholdConfig{});

	EXPECT_DOUBLE_EQ(r.fractionAbove, 0.0);
	EXPECT_FALSE(r.pass);
	EXPECT_TRUE(r.kept); // Keep policy
	EXPECT_EQ(cv::countNonZero(r.image), 0);
}

TEST(ThresholdProcessor, ValueEqualToThresholdIsNotAbove) {
	const ThresholdResult r = thresholdStamp(cv::Mat(8, 8, CV_8UC1, cv::Scalar(128)), ThresholdConfig{});
	EXPECT_DOUBLE_EQ(r.fractionAbove, 0.0);
}

TEST(ThresholdProcessor, MaskKeepsValuesAboveThreshold) {
	ThresholdConfig config{};
	config.mode = ThresholdMode::Mask;

	const ThresholdResult r = thresholdStamp(halfStamp(50, 200), config);

	EXPECT_DOUBLE_EQ(r.fractionAbove, 0.5);
	EXPECT_TRUE(r.pass); // cutoff is inclusive
	EXPECT_EQ(r.image.at<std::uint8_t>(0, 0), 0);
	EXPECT_EQ(r.image.at<std::uint8_t>(0, 7), 200);
}

TEST(ThresholdProcessor, PassthroughCopiesTheStamp) {
	ThresholdConfig config{};
	config.mode = ThresholdMode::Passthrough;

	const cv::Mat stamp     = halfStamp(50, 200);
	const ThresholdResult r = thresholdStamp(stamp, config);

	ASSERT_EQ(r.image.type(), stamp.type());
	EXPECT_EQ(cv::norm(r.image, stamp, cv::NORM_INF), 0.0);
	EXPECT_NE(r.image.data, stamp.data);
}

TEST(ThresholdProcessor, SixteenBitBinarizeUsesFullScale) {
	ThresholdConfig config{};
	config.thresholdValue = 1000.0;

	cv::Mat stamp(4, 4, CV_16UC1, cv::Scalar(500));
	stamp.at<std::uint16_t>(0, 0) = 40000;

	const ThresholdResult r = thresholdStamp(stamp, config);
	ASSERT_EQ(r.image.type(), CV_16UC1);
	EXPECT_EQ(r.image.at<std::uint16_t>(0, 0), 65535);
	EXPECT_EQ(r.image.at<std::uint16_t>(1, 1), 0);
	EXPECT_DOUBLE_EQ(r.fractionAbove, 1.0 / 16.0);
}

TEST(ThresholdProcessor, ChannelsShareTheThreshold) {
	ThresholdConfig config{};
	config.mode = ThresholdMode::Mask;

	const cv::Mat stamp(2, 2, CV_8UC3, cv::Scalar(200, 50, 129));
	const ThresholdResult r = thresholdStamp(stamp, config);

	EXPECT_NEAR(r.fractionAbove, 2.0 / 3.0, 1e-12);
	ASSERT_EQ(r.image.type(), CV_8UC3);
	EXPECT_EQ(r.image.at<cv::Vec3b>(1, 1), cv::Vec3b(200, 0, 129));
}

TEST(ThresholdProcessor, DiscardDropsFailingWells) {
	ThresholdConfig config{};
	config.gate            = GatePolicy::DiscardFailing;
	config.occupancyCutoff = 0.6;

	const ThresholdResult failing = thresholdStamp(halfStamp(50, 200), config);
	EXPECT_FALSE(failing.pass);
	EXPECT_FALSE(failing.kept);
	EXPECT_TRUE(failing.image.empty());

	const ThresholdResult passing = thresholdStamp(halfStamp(200, 200), config);
	EXPECT_TRUE(passing.kept);
	EXPECT_FALSE(passing.image.empty());
}

TEST(ThresholdProcessor, InvalidWellsAreSkippedByDefault) {
	const std::vector<WellStamp> stack = {makeStamp({0, 0, 0, 0}, halfStamp(200, 200)),
	                                      makeStamp({0, 0, 1, 0}, halfStamp(0, 200), StampStatus::Clipped)};
	const CoordinateTable table        = {rowFor(stack[0]), rowFor(stack[1])};

	const auto skipped = applyThreshold(stack, table, ThresholdConfig{});
	ASSERT_EQ(skipped.size(), 2u);
	EXPECT_TRUE(skipped[0].processed);
	EXPECT_TRUE(skipped[0].valid);
	EXPECT_FALSE(skipped[1].processed);
	EXPECT_FALSE(skipped[1].valid);
	EXPECT_FALSE(skipped[1].kept);
	EXPECT_EQ(skipped[1].index, stack[1].index);

	ThresholdConfig all{};
	all.skipInvalid     = false;
	const auto included = applyThreshold(stack, table, all);
	EXPECT_TRUE(included[1].processed);
	EXPECT_DOUBLE_EQ(included[1].fractionAbove, 0.5);
}

TEST(ThresholdProcessor, ResultsKeepStackOrder) {
	std::vector<WellStamp> stack;
	CoordinateTable table;
	for (unsigned k = 0u; k < 32u; ++k) {
		stack.push_back(makeStamp({k % 2u, k / 16u, (k / 2u) % 4u, (k / 8u) % 2u}, cv::Mat(8, 8, CV_8UC1, cv::Scalar(k * 8u))));
		table.push_back(rowFor(stack.back()));
	}

	const auto results = applyThreshold(stack, table, ThresholdConfig{});
	ASSERT_EQ(results.size(), stack.size());
	for (std::size_t k = 0u; k < results.size(); ++k) {
		EXPECT_EQ(results[k].index, stack[k].index);
		EXPECT_DOUBLE_EQ(results[k].meanIntensity, static_cast<double>(k * 8u));
		EXPECT_EQ(results[k].pass, k * 8u > 128u);
	}
}

TEST(ThresholdProcessor, MismatchedManifestIsRejected) {
	const std::vector<WellStamp> stack = {makeStamp({0, 0, 0, 0}, halfStamp(200, 200)), makeStamp({0, 0, 1, 0}, halfStamp(200, 200))};
	CoordinateTable table              = {rowFor(stack[0]), rowFor(stack[1])};

	// Length
	EXPECT_THROW(applyThreshold(stack, CoordinateTable{table[0]}, ThresholdConfig{}), ManifestError);

	// Order
	CoordinateTable swapped = {table[1], table[0]};
	EXPECT_THROW(applyThreshold(stack, swapped, ThresholdConfig{}), ManifestError);

	// Validity
	table[1].valid  = false;
	table[1].status = StampStatus::Clipped;
	EXPECT_THROW(applyThreshold(stack, table, ThresholdConfig{}), ManifestError);
}

TEST(ThresholdProcessor, ThresholdMustFitTheStackDepth) {
	const std::vector<WellStamp> stack = {makeStamp({0, 0, 0, 0}, halfStamp(200, 200))};
	const CoordinateTable table        = {rowFor(stack[0])};

	ThresholdConfig tooHigh{};
	tooHigh.thresholdValue = 300.0;
	EXPECT_THROW(applyThreshold(stack, table, tooHigh), ConfigError);

	ThresholdConfig negative{};
	negative.thresholdValue = -1.0;
	EXPECT_THROW(validateThreshold(negative), ConfigError);

	ThresholdConfig badCutoff{};
	badCutoff.occupancyCutoff = 1.5;
	EXPECT_THROW(validateThreshold(badCutoff), ConfigError);

	const std::vector<WellStamp> floats = {makeStamp({0, 0, 0, 0}, cv::Mat(4, 4, CV_32FC1, cv::Scalar(0.5)))};
	EXPECT_THROW(applyThreshold(floats, table, ThresholdConfig{}), ConfigError);
}

TEST(ThresholdProcessor, SummaryCountsProcessedWells) {
	std::vector<ThresholdResult> results(4);
	results[0].processed     = true;
	results[0].fractionAbove = 1.0;
	results[0].pass          = true;
	results[0].kept          = true;
	results[1].processed     = true;
	results[1].fractionAbove = 0.0;
	results[1].kept          = true;
	results[2].processed     = true;
	results[2].fractionAbove = 0.5;
	results[2].pass          = true;
	results[2].kept          = true;

	const ThresholdSummary summary = summarizeThreshold(results);
	EXPECT_EQ(summary.total, 4u);
	EXPECT_EQ(summary.processed, 3u);
	EXPECT_EQ(summary.skipped, 1u);
	EXPECT_EQ(summary.passed, 2u);
	EXPECT_EQ(summary.kept, 3u);
	EXPECT_DOUBLE_EQ(summary.meanFraction, 0.5);
	EXPECT_DOUBLE_EQ(summary.medianFraction, 0.5);
}

TEST(ThresholdProcessor, ModeAndGateParse) {
	EXPECT_EQ(thresholdModeFromString("binarize"), ThresholdMode::Binarize);
	EXPECT_EQ(thresholdModeFromString("mask"), ThresholdMode::Mask);
	EXPECT_EQ(thresholdModeFromString("passthrough"), ThresholdMode::Passthrough);
	EXPECT_EQ(gatePolicyFromString("discard"), GatePolicy::DiscardFailing);
	EXPECT_EQ(toString(GatePolicy::Keep), "keep");
	EXPECT_THROW(thresholdModeFromString("otsu"), ConfigError);
	EXPECT_THROW(gatePolicyFromString("drop"), ConfigError);
}

TEST(Statistics, MeanAndMedian) {
	EXPECT_DOUBLE_EQ(mean({}), 0.0);
	EXPECT_DOUBLE_EQ(median({}), 0.0);
	EXPECT_DOUBLE_EQ(mean({1.0, 2.0, 6.0}), 3.0);
	EXPECT_DOUBLE_EQ(median({5.0, 1.0, 3.0}), 3.0);
	EXPECT_DOUBLE_EQ(median({4.0, 1.0, 3.0, 2.0}), 2.5);
}

} // namespace gtest
} // namespace wellgrid::imaging::core
