#include "imaging/core/errors.hpp"
#include "imaging/pipeline/stampStack.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace wellgrid::imaging::pipeline {
namespace gtest {

using core::StampStatus;
using core::WellStamp;

//! Scratch directory per test, removed afterwards.
class StampStackTest : public ::testing::Test {
protected:
	void SetUp() override {
		const std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
		m_dir                  = std::filesystem::temp_directory_path() / ("wellgrid_stack_" + name);
		std::filesystem::remove_all(m_dir);
		std::filesystem::create_directories(m_dir);
	}
	void TearDown() override {
		std::error_code ec;
		std::filesystem::remove_all(m_dir, ec);
	}

	std::filesystem::path m_dir;
};

static cv::Mat randomStamp(int type, int width, unsigned seed) {
	cv::Mat stamp(width, width, type);
	cv::RNG rng(seed);
	rng.fill(stamp, cv::RNG::UNIFORM, 0, CV_MAT_DEPTH(type) == CV_16U ? 65536 : 256);
	return stamp;
}

TEST_F(StampStackTest, PagesKeepPixelsAndWellAddress) {
	const std::vector<WellStamp> stack = {
	        WellStamp{{0, 0, 0, 0}, {12.125, 7.0}, randomStamp(CV_8UC1, 9, 1u), StampStatus::Ok},
	        WellStamp{{1, 0, 2, 0}, {101.0 / 3.0, 55.5}, randomStamp(CV_8UC1, 9, 2u), StampStatus::Clipped},
	        WellStamp{{1, 3, 2, 4}, {-4.0, 1e6 + 0.1}, randomStamp(CV_8UC1, 9, 3u), StampStatus::Outside},
	};
	const auto path = m_dir / "stack.tif";
	writeStampStack(path, stack, "chip 01.tif");

	const StoredStack stored = readStampStack(path);
	ASSERT_EQ(stored.stamps.size(), stack.size());
	ASSERT_EQ(stored.sources.size(), stack.size());
	for (std::size_t k = 0u; k < stack.size(); ++k) {
		const WellStamp& in  = stack[k];
		const WellStamp& out = stored.stamps[k];
		EXPECT_EQ(out.index, in.index);
		EXPECT_EQ(out.center.x, in.center.x); // exact, not near
		EXPECT_EQ(out.center.y, in.center.y);
		EXPECT_EQ(out.status, in.status);
		EXPECT_EQ(out.valid(), in.valid());
		ASSERT_EQ(out.image.type(), in.image.type());
		ASSERT_EQ(out.image.size(), in.image.size());
		EXPECT_EQ(cv::norm(out.image, in.image, cv::NORM_INF), 0.0);
		EXPECT_EQ(stored.sources[k], "chip 01.tif");
	}
}

TEST_F(StampStackTest, SixteenBitColourStampsSurvive) {
	const std::vector<WellStamp> stack = {WellStamp{{0, 0, 1, 1}, {3.0, 4.0}, randomStamp(CV_16UC3, 6, 7u), StampStatus::Ok}};
	const auto path                    = m_dir / "colour.tif";
	writeStampStack(path, stack, "rgb.png");

	const StoredStack stored = readStampStack(path);
	ASSERT_EQ(stored.stamps.size(), 1u);
	ASSERT_EQ(stored.stamps[0].image.type(), CV_16UC3);
	EXPECT_EQ(cv::norm(stored.stamps[0].image, stack[0].image, cv::NORM_INF), 0.0);
}

TEST_F(StampStackTest, UnsupportedStampTypeIsAConfigError) {
	const std::vector<WellStamp> stack = {WellStamp{{0, 0, 0, 0}, {0.0, 0.0}, cv::Mat(4, 4, CV_32FC1, cv::Scalar(0.5)), StampStatus::Ok}};
	EXPECT_THROW(writeStampStack(m_dir / "float.tif", stack, "f"), core::ConfigError);
}

TEST_F(StampStackTest, MissingOrForeignFilesAreRejected) {
	EXPECT_THROW(readStampStack(m_dir / "missing.tif"), core::IoError);

	const auto bogus = m_dir / "bogus.tif";
	std::ofstream(bogus) << "not a tiff";
	EXPECT_THROW(readStampStack(bogus), core::IoError);
}

TEST(StampDescription, RoundTripsExactly) {
	const WellStamp stamp{{3, 1, 4, 1}, {0.1 + 0.2, 1.0 / 7.0}, {}, StampStatus::Clipped};
	const std::string text = describeStamp(stamp);
	EXPECT_EQ(text.rfind("wellgrid sc=3 sr=1 wc=4 wr=1 ", 0), 0u);

	const WellStamp parsed = parseStampDescription(text);
	EXPECT_EQ(parsed.index, stamp.index);
	EXPECT_EQ(parsed.center.x, stamp.center.x);
	EXPECT_EQ(parsed.center.y, stamp.center.y);
	EXPECT_EQ(parsed.status, StampStatus::Clipped);
}

TEST(StampDescription, MalformedTextIsAManifestError) {
	EXPECT_THROW(parseStampDescription(""), core::ManifestError);
	EXPECT_THROW(parseStampDescription("ImageJ=1.54"), core::ManifestError);
	EXPECT_THROW(parseStampDescription("wellgrid sc=0 sr=0 wc=0 cx=1 cy=1 status=ok"), core::ManifestError);
	EXPECT_THROW(parseStampDescription("wellgrid sc=a sr=0 wc=0 wr=0 cx=1 cy=1 status=ok"), core::ManifestError);
	EXPECT_THROW(parseStampDescription("wellgrid sc=0 sr=0 wc=0 wr=0 cx=1 cy=1 status=broken"), core::ManifestError);
	EXPECT_THROW(parseStampDescription("wellgrid sc=0 sr=0 wc=0 wr=0 cx=1 cy=1 status"), core::ManifestError);

	// Same strictness as the coordinate table: no sign, no trailing text.
	EXPECT_THROW(parseStampDescription("wellgrid sc=-1 sr=0 wc=0 wr=0 cx=1 cy=1 status=ok"), core::ManifestError);
	EXPECT_THROW(parseStampDescription("wellgrid sc=3x sr=0 wc=0 wr=0 cx=1 cy=1 status=ok"), core::ManifestError);
	EXPECT_THROW(parseStampDescription("wellgrid sc=0 sr=0 wc=0 wr=4294967296 cx=1 cy=1 status=ok"), core::ManifestError);
	EXPECT_THROW(parseStampDescription("wellgrid sc=0 sr=0 wc=0 wr=0 cx=1.5px cy=1 status=ok"), core::ManifestError);
}

} // namespace gtest
} // namespace wellgrid::imaging::pipeline
