#pragma once

#include "imaging/core/gridModel.hpp"
#include "imaging/core/stampExtractor.hpp"
#include "imaging/core/thresholdProcessor.hpp"
#include "imaging/core/tiling.hpp"

#include <filesystem>
#include <string>

// The two stages of the well grid workflow.
// Stage 1 "extract": image + corners + tiling -> stamp stack (TIFF) + coordinate table (CSV).
// Stage 2 "threshold": stamp stack + coordinate table -> per-well images (PNG) + threshold table (CSV).
// The stages only share files, so stage 2 can run in a different process, later or elsewhere.
namespace wellgrid::imaging::pipeline {

//! Everything stage 1 needs.
struct ExtractionJob {
	std::filesystem::path imagePath;
	core::CornerSet corners;
	core::TilingSpec tiling;
	core::GridFitConfig fit;
	core::StampConfig stamp;
	std::filesystem::path outDir{"."};
	std::string prefix;              //!< Output file prefix. Image stem if empty.
	bool writeSummary{false};        //!< Write the stamp mosaic.
	std::filesystem::path debugPath; //!< Write the debug mosaic here if not empty.
};

//! Files and counts produced by stage 1.
struct ExtractionReport {
	core::GridFit fit;
	core::ExtractionSummary summary;
	std::filesystem::path stackPath;
	std::filesystem::path tablePath;
	std::filesystem::path summaryPath; //!< Empty if no summary was written.
};

//! Everything stage 2 needs.
struct ThresholdJob {
	std::filesystem::path stackPath;
	std::filesystem::path tablePath;
	core::ThresholdConfig threshold;
	std::filesystem::path outDir{"."};
	std::string prefix; //!< Output file prefix. Derived from the stack name if empty.
};

//! Files and counts produced by stage 2.
struct ThresholdReport {
	core::ThresholdSummary summary;
	std::filesystem::path tablePath;
	std::size_t imagesWritten{0u};
};

//! Paths of the stage 1 outputs for a prefix.
std::filesystem::path stackPathFor(const std::filesystem::path& outDir, const std::string& prefix);
std::filesystem::path coordinatePathFor(const std::filesystem::path& outDir, const std::string& prefix);

//! File name of the image of one well: "<prefix>_sc<n>_sr<n>_wc<n>_wr<n>.png".
std::string wellImageName(const std::string& prefix, const core::WellIndex& index);

//! Prefix stage 2 uses if none is given: the stack stem without a trailing "_stamps".
std::string defaultThresholdPrefix(const std::filesystem::path& stackPath);

/*! Stage 1. Parameters are validated and the grid is fitted before the image is read.
 * \throws ConfigError, FitError, IoError
 */
ExtractionReport runExtraction(const ExtractionJob& job);

/*! Stage 2. The threshold config is validated before any file is read.
 * \throws ConfigError, IoError, ManifestError if stack and table do not describe the same wells.
 */
ThresholdReport runThresholding(const ThresholdJob& job);

} // namespace wellgrid::imaging::pipeline
