#include "imaging/pipeline/pipeline.hpp"

#include "imaging/core/debugVisualizer.hpp"
#include "imaging/core/errors.hpp"
#include "imaging/pipeline/csvTables.hpp"
#include "imaging/pipeline/stampStack.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string_view>
#include <system_error>

namespace wellgrid::imaging::pipeline {

using core::ConfigError;
using core::IoError;
using core::ManifestError;

namespace {

static constexpr std::string_view STACK_SUFFIX = "_stamps";

static void ensureDirectory(const std::filesystem::path& dir) {
	std::error_code ec;
	std::filesystem::create_directories(dir, ec);
	if (ec) {
		throw IoError("Cannot create output directory " + dir.string() + ": " + ec.message());
	}
}

//! imwrite reports some failures by return value and others by exception.
static void writeImage(const std::filesystem::path& path, const cv::Mat& image) {
	bool written = false;
	try {
		written = cv::imwrite(path.string(), image);
	} catch (const cv::Exception& e) {
		throw IoError("Failed to write image " + path.string() + ": " + e.what());
	}
	if (!written) {
		throw IoError("Failed to write image " + path.string());
	}
}

//! The stack pages and the table rows must name the same source image.
static void checkSources(const StoredStack& stored, const core::CoordinateTable& table) {
	const std::size_t n = std::min(stored.sources.size(), table.size());
	for (std::size_t k = 0u; k < n; ++k) {
		if (!stored.sources[k].empty() && stored.sources[k] != table[k].source) {
			throw ManifestError("Frame " + std::to_string(k) + " was cut from '" + stored.sources[k] + "' but table row " + std::to_string(k) +
			                    " names '" + table[k].source + "'.");
		}
	}
}

} // namespace

std::filesystem::path stackPathFor(const std::filesystem::path& outDir, const std::string& prefix) {
	return outDir / (prefix + std::string(STACK_SUFFIX) + ".tif");
}

std::filesystem::path coordinatePathFor(const std::filesystem::path& outDir, const std::string& prefix) {
	return outDir / (prefix + "_coordinates.csv");
}

std::string wellImageName(const std::string& prefix, const core::WellIndex& index) {
	return prefix + "_sc" + std::to_string(index.subarrayCol) + "_sr" + std::to_string(index.subarrayRow) + "_wc" + std::to_string(index.wellCol) +
	       "_wr" + std::to_string(index.wellRow) + ".png";
}

std::string defaultThresholdPrefix(const std::filesystem::path& stackPath) {
	std::string stem = stackPath.stem().string();
	if (stem.size() > STACK_SUFFIX.size() && std::string_view(stem).substr(stem.size() - STACK_SUFFIX.size()) == STACK_SUFFIX) {
		stem.erase(stem.size() - STACK_SUFFIX.size());
	}
	return stem;
}

ExtractionReport runExtraction(const ExtractionJob& job) {
	// 0. Everything that can be checked without the image.
	if (job.imagePath.empty()) {
		throw ConfigError("No input image given.");
	}
	if (!std::isfinite(job.stamp.fillValue)) {
		throw ConfigError("Fill value must be finite.");
	}
	const core::WellGrid grid = core::computeCenters(job.corners, job.tiling, job.fit);

	const std::string prefix = job.prefix.empty() ? job.imagePath.stem().string() : job.prefix;
	const std::string source = job.imagePath.filename().string();

	// 1. Read the source image.
	const cv::Mat image = cv::imread(job.imagePath.string(), cv::IMREAD_ANYDEPTH | cv::IMREAD_GRAYSCALE);
	if (image.empty()) {
		throw IoError("Cannot read image " + job.imagePath.string());
	}
	std::cout << "Read " << image.cols << "x" << image.rows << " image " << job.imagePath.string() << "\n";

	// 2. Crop.
	core::DebugVisualizer debugger;
	core::DebugVisualizer* debug = job.debugPath.empty() ? nullptr : &debugger;
	const core::ExtractionResult result = core::extractStamps(image, grid, source, job.stamp, debug);

	// 3. Persist.
	ensureDirectory(job.outDir);

	ExtractionReport report{};
	report.fit       = grid.fit();
	report.summary   = result.summary;
	report.stackPath = stackPathFor(job.outDir, prefix);
	report.tablePath = coordinatePathFor(job.outDir, prefix);

	writeStampStack(report.stackPath, result.stack, source);
	writeCoordinateTable(report.tablePath, result.table);

	if (job.writeSummary) {
		report.summaryPath = job.outDir / (prefix + "_summary.png");
		writeImage(report.summaryPath, core::buildStampMosaic(result.stack, job.tiling));
	}
	if (debug) {
		writeImage(job.debugPath, debug->buildMosaic());
	}

	std::cout << "Stage 1 done: " << report.summary.total << " wells, " << report.summary.valid << " valid, "
	          << report.summary.clipped + report.summary.outside << " out of bounds (" << report.summary.clipped << " clipped, "
	          << report.summary.outside << " outside).\n";
	return report;
}

ThresholdReport runThresholding(const ThresholdJob& job) {
	// 0. Config first, files later.
	core::validateThreshold(job.threshold);
	if (job.stackPath.empty() || job.tablePath.empty()) {
		throw ConfigError("Stage 2 needs both a stamp stack and a coordinate table.");
	}
	const std::string prefix = job.prefix.empty() ? defaultThresholdPrefix(job.stackPath) : job.prefix;

	// 1. Load the manifest pair and make sure it belongs together.
	const StoredStack stored          = readStampStack(job.stackPath);
	const core::CoordinateTable table = readCoordinateTable(job.tablePath);
	checkSources(stored, table);

	// 2. Threshold. Size, well order and validity are verified here.
	const std::vector<core::ThresholdResult> results = core::applyThreshold(stored.stamps, table, job.threshold);

	// 3. Persist.
	ensureDirectory(job.outDir);

	ThresholdReport report{};
	for (const auto& r: results) {
		if (!r.kept || r.image.empty()) {
			continue;
		}
		writeImage(job.outDir / wellImageName(prefix, r.index), r.image);
		++report.imagesWritten;
	}

	report.tablePath = job.outDir / (prefix + "_threshold.csv");
	writeThresholdTable(report.tablePath, results);

	report.summary = core::summarizeThreshold(results);
	std::cout << "Stage 2 done: " << report.summary.total << " wells, " << report.summary.processed << " processed, " << report.summary.skipped
	          << " skipped, " << report.summary.passed << " passed, " << report.summary.kept << " kept. Occupancy mean "
	          << report.summary.meanFraction << ", median " << report.summary.medianFraction << ".\n";
	return report;
}

} // namespace wellgrid::imaging::pipeline
