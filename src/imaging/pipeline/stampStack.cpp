#include "imaging/pipeline/stampStack.hpp"

#include "imaging/core/errors.hpp"
#include "imaging/pipeline/csvTables.hpp"

#include <opencv2/imgproc.hpp>

#include <tiffio.h>

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace wellgrid::imaging::pipeline {

using core::ConfigError;
using core::IoError;
using core::ManifestError;

namespace {

static constexpr const char* DESCRIPTION_TAG = "wellgrid"; //!< First token of every page description.

struct TiffCloser {
	void operator()(TIFF* tiff) const {
		if (tiff) {
			TIFFClose(tiff);
		}
	}
};
using TiffHandle = std::unique_ptr<TIFF, TiffCloser>;

//! Bits per sample of a stamp. Throws ConfigError for depths TIFF pages are not written with.
static std::uint16_t bitsPerSample(const cv::Mat& image) {
	switch (image.depth()) {
	case CV_8U:
		return 8u;
	case CV_16U:
		return 16u;
	default:
		throw ConfigError("Stamp stacks support 8- and 16-bit unsigned images only.");
	}
}

//! Payload size of the stack. Classic TIFF offsets are 32 bit.
static std::uint64_t payloadBytes(const std::vector<core::WellStamp>& stack) {
	std::uint64_t bytes = 0u;
	for (const auto& stamp: stack) {
		bytes += static_cast<std::uint64_t>(stamp.image.total()) * stamp.image.elemSize();
	}
	return bytes;
}

static void writePage(TIFF* tiff, const core::WellStamp& stamp, const std::string& sourceId, const std::size_t page, const std::size_t pages) {
	const cv::Mat& image = stamp.image;
	if (image.empty()) {
		throw ConfigError("Cannot write an empty stamp to the stack.");
	}
	if (image.channels() != 1 && image.channels() != 3) {
		throw ConfigError("Stamp stacks support 1- or 3-channel images only.");
	}

	// TIFF stores RGB, OpenCV holds BGR. Scanlines must come from continuous memory.
	cv::Mat pixels;
	if (image.channels() == 3) {
		cv::cvtColor(image, pixels, cv::COLOR_BGR2RGB);
	} else {
		pixels = image.isContinuous() ? image : image.clone();
	}

	const std::string description = describeStamp(stamp);

	TIFFSetField(tiff, TIFFTAG_SUBFILETYPE, FILETYPE_PAGE);
	TIFFSetField(tiff, TIFFTAG_IMAGEWIDTH, static_cast<std::uint32_t>(pixels.cols));
	TIFFSetField(tiff, TIFFTAG_IMAGELENGTH, static_cast<std::uint32_t>(pixels.rows));
	TIFFSetField(tiff, TIFFTAG_SAMPLESPERPIXEL, static_cast<std::uint16_t>(pixels.channels()));
	TIFFSetField(tiff, TIFFTAG_BITSPERSAMPLE, bitsPerSample(pixels));
	TIFFSetField(tiff, TIFFTAG_SAMPLEFORMAT, SAMPLEFORMAT_UINT);
	TIFFSetField(tiff, TIFFTAG_ORIENTATION, ORIENTATION_TOPLEFT);
	TIFFSetField(tiff, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
	TIFFSetField(tiff, TIFFTAG_PHOTOMETRIC, pixels.channels() == 3 ? PHOTOMETRIC_RGB : PHOTOMETRIC_MINISBLACK);
	TIFFSetField(tiff, TIFFTAG_COMPRESSION, COMPRESSION_NONE);
	TIFFSetField(tiff, TIFFTAG_ROWSPERSTRIP, TIFFDefaultStripSize(tiff, 0));
	TIFFSetField(tiff, TIFFTAG_IMAGEDESCRIPTION, description.c_str());
	TIFFSetField(tiff, TIFFTAG_DOCUMENTNAME, sourceId.c_str());
	if (pages <= std::numeric_limits<std::uint16_t>::max()) {
		TIFFSetField(tiff, TIFFTAG_PAGENUMBER, static_cast<std::uint16_t>(page), static_cast<std::uint16_t>(pages));
	}

	for (int row = 0; row < pixels.rows; ++row) {
		if (TIFFWriteScanline(tiff, pixels.ptr(row), static_cast<std::uint32_t>(row), 0) < 0) {
			throw IoError("Failed to write row " + std::to_string(row) + " of stack page " + std::to_string(page) + ".");
		}
	}
	if (!TIFFWriteDirectory(tiff)) {
		throw IoError("Failed to finish stack page " + std::to_string(page) + ".");
	}
}

static core::WellStamp readPage(TIFF* tiff, const std::size_t page, std::string& source) {
	std::uint32_t width    = 0u;
	std::uint32_t height   = 0u;
	std::uint16_t channels = 1u;
	std::uint16_t bits     = 8u;
	std::uint16_t format   = SAMPLEFORMAT_UINT;
	std::uint16_t planar   = PLANARCONFIG_CONTIG;

	TIFFGetField(tiff, TIFFTAG_IMAGEWIDTH, &width);
	TIFFGetField(tiff, TIFFTAG_IMAGELENGTH, &height);
	TIFFGetFieldDefaulted(tiff, TIFFTAG_SAMPLESPERPIXEL, &channels);
	TIFFGetFieldDefaulted(tiff, TIFFTAG_BITSPERSAMPLE, &bits);
	TIFFGetFieldDefaulted(tiff, TIFFTAG_SAMPLEFORMAT, &format);
	TIFFGetFieldDefaulted(tiff, TIFFTAG_PLANARCONFIG, &planar);

	const std::string where = "Stack page " + std::to_string(page);
	if (width == 0u || height == 0u) {
		throw IoError(where + " has no pixels.");
	}
	if ((bits != 8u && bits != 16u) || format != SAMPLEFORMAT_UINT || (channels != 1u && channels != 3u) || planar != PLANARCONFIG_CONTIG) {
		throw IoError(where + " is not an 8/16-bit unsigned, 1/3-channel, contiguous page.");
	}

	char* description = nullptr;
	if (!TIFFGetField(tiff, TIFFTAG_IMAGEDESCRIPTION, &description) || description == nullptr) {
		throw ManifestError(where + " carries no well description.");
	}
	char* document = nullptr;
	source         = (TIFFGetField(tiff, TIFFTAG_DOCUMENTNAME, &document) && document != nullptr) ? std::string(document) : std::string{};

	core::WellStamp stamp = parseStampDescription(description);

	cv::Mat pixels(static_cast<int>(height), static_cast<int>(width), CV_MAKETYPE(bits == 8u ? CV_8U : CV_16U, channels));
	for (int row = 0; row < pixels.rows; ++row) {
		if (TIFFReadScanline(tiff, pixels.ptr(row), static_cast<std::uint32_t>(row), 0) < 0) {
			throw IoError("Failed to read row " + std::to_string(row) + " of " + where + ".");
		}
	}

	if (channels == 3u) {
		cv::cvtColor(pixels, stamp.image, cv::COLOR_RGB2BGR);
	} else {
		stamp.image = pixels;
	}
	return stamp;
}

} // namespace

std::string describeStamp(const core::WellStamp& stamp) {
	std::ostringstream os;
	os << std::setprecision(std::numeric_limits<double>::max_digits10);
	os << DESCRIPTION_TAG << " sc=" << stamp.index.subarrayCol << " sr=" << stamp.index.subarrayRow << " wc=" << stamp.index.wellCol
	   << " wr=" << stamp.index.wellRow << " cx=" << stamp.center.x << " cy=" << stamp.center.y << " status=" << core::toString(stamp.status);
	return os.str();
}

core::WellStamp parseStampDescription(const std::string& text) {
	std::istringstream is(text);
	std::string token;
	if (!(is >> token) || token != DESCRIPTION_TAG) {
		throw ManifestError("Not a well stamp description: '" + text + "'.");
	}

	// Collect key=value pairs.
	std::map<std::string, std::string> fields;
	while (is >> token) {
		const auto eq = token.find('=');
		if (eq == std::string::npos) {
			throw ManifestError("Malformed field '" + token + "' in stamp description.");
		}
		fields[token.substr(0, eq)] = token.substr(eq + 1);
	}

	const auto field = [&](const std::string& key) -> const std::string& {
		const auto it = fields.find(key);
		if (it == fields.end()) {
			throw ManifestError("Stamp description lacks '" + key + "': '" + text + "'.");
		}
		return it->second;
	};

	core::WellStamp stamp{};
	try {
		stamp.index.subarrayCol = parseUnsignedField(field("sc"));
		stamp.index.subarrayRow = parseUnsignedField(field("sr"));
		stamp.index.wellCol     = parseUnsignedField(field("wc"));
		stamp.index.wellRow     = parseUnsignedField(field("wr"));
		stamp.center            = {parseDoubleField(field("cx")), parseDoubleField(field("cy"))};
		stamp.status            = core::stampStatusFromString(field("status"));
	} catch (const std::invalid_argument& e) {
		throw ManifestError(std::string("Malformed value in stamp description (") + e.what() + "): '" + text + "'.");
	} catch (const std::out_of_range&) {
		throw ManifestError("Value out of range in stamp description: '" + text + "'.");
	} catch (const core::ConfigError& e) {
		throw ManifestError(std::string(e.what()) + " In stamp description '" + text + "'.");
	}
	return stamp;
}

void writeStampStack(const std::filesystem::path& path, const std::vector<core::WellStamp>& stack, const std::string& sourceId) {
	// Switch to BigTIFF well before the 4 GiB offset limit of classic TIFF.
	static constexpr std::uint64_t CLASSIC_TIFF_LIMIT = 3ull << 30;
	const char* mode                                  = payloadBytes(stack) > CLASSIC_TIFF_LIMIT ? "w8" : "w";

	TiffHandle tiff{TIFFOpen(path.string().c_str(), mode)};
	if (!tiff) {
		throw IoError("Cannot open stamp stack for writing: " + path.string());
	}

	for (std::size_t k = 0u; k < stack.size(); ++k) {
		writePage(tiff.get(), stack[k], sourceId, k, stack.size());
	}

	std::cout << "Wrote " << stack.size() << " stamps to " << path.string() << "\n";
}

StoredStack readStampStack(const std::filesystem::path& path) {
	TiffHandle tiff{TIFFOpen(path.string().c_str(), "r")};
	if (!tiff) {
		throw IoError("Cannot open stamp stack: " + path.string());
	}

	StoredStack stored{};
	std::size_t page = 0u;
	do {
		std::string source;
		stored.stamps.push_back(readPage(tiff.get(), page, source));
		stored.sources.push_back(std::move(source));
		++page;
	} while (TIFFReadDirectory(tiff.get()));

	std::cout << "Read " << stored.stamps.size() << " stamps from " << path.string() << "\n";
	return stored;
}

} // namespace wellgrid::imaging::pipeline
