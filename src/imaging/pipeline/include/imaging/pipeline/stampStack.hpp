#pragma once

#include "imaging/core/stampExtractor.hpp"

#include <filesystem>
#include <string>
#include <vector>

// Multi-page TIFF persistence of a stamp stack.
// One page per stamp, in stack order. Every page carries its own well address so a stack can be checked against its coordinate table
// without relying on page order alone:
//   ImageDescription: "wellgrid sc=<n> sr=<n> wc=<n> wr=<n> cx=<x> cy=<y> status=<ok|clipped|outside>"
//   DocumentName:     source image identifier
// Supported stamps: 8- or 16-bit unsigned, 1 or 3 channels.
namespace wellgrid::imaging::pipeline {

//! A stack read back from disk.
struct StoredStack {
	std::vector<core::WellStamp> stamps;
	std::vector<std::string> sources; //!< Source identifier per page.
};

//! Page description for one stamp.
std::string describeStamp(const core::WellStamp& stamp);

//! Parse a page description written by describeStamp(). index/center/status are filled, the image is left empty.
//! \throws ManifestError if the text is not a well stamp description.
core::WellStamp parseStampDescription(const std::string& text);

//! Write all stamps as one multi-page TIFF. Throws IoError on failure, ConfigError for unsupported stamp types.
void writeStampStack(const std::filesystem::path& path, const std::vector<core::WellStamp>& stack, const std::string& sourceId);

//! Read a multi-page TIFF written by writeStampStack(). Throws IoError / ManifestError.
StoredStack readStampStack(const std::filesystem::path& path);

} // namespace wellgrid::imaging::pipeline
