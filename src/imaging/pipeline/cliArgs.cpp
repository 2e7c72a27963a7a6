#include "imaging/pipeline/cliArgs.hpp"

#include "imaging/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace wellgrid::imaging::pipeline {

using core::ConfigError;

namespace {

static const std::vector<std::string> EXTRACT_KEYS    = {"image", "tl",   "tr",  "bl",     "br",    "subarrays",   "wells",
                                                         "spacing", "stamp", "fill", "out", "prefix", "debug", "max-residual"};
static const std::vector<std::string> EXTRACT_FLAGS   = {"summary"};
static const std::vector<std::string> THRESHOLD_KEYS  = {"stack", "table", "threshold", "mode", "cutoff", "gate", "out", "prefix"};
static const std::vector<std::string> THRESHOLD_FLAGS = {"include-invalid"};

static bool contains(const std::vector<std::string>& list, const std::string& key) {
	return std::find(list.begin(), list.end(), key) != list.end();
}

//! Key of "--key=value" or "--key".
static std::string keyOf(const std::string& arg) {
	if (arg.rfind("--", 0) != 0) {
		throw ConfigError("Unexpected argument '" + arg + "'. Options have the form --key=value.");
	}
	const auto eq = arg.find('=');
	return arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
}

//! Every argument must be a known option in its form (value or flag) and appear once. Anything else would be ignored silently.
static void checkOptions(const std::vector<std::string>& args, const std::vector<std::string>& keys, const std::vector<std::string>& flags) {
	std::vector<std::string> seen;
	for (const auto& arg: args) {
		const std::string key = keyOf(arg);
		const bool hasValue   = arg.find('=') != std::string::npos;

		if (contains(flags, key)) {
			if (hasValue) {
				throw ConfigError("Option --" + key + " is a flag and takes no value, got '" + arg + "'.");
			}
		} else if (contains(keys, key)) {
			if (!hasValue) {
				throw ConfigError("Option --" + key + " needs a value: --" + key + "=...");
			}
		} else {
			throw ConfigError("Unknown option '--" + key + "'.");
		}

		if (contains(seen, key)) {
			throw ConfigError("Option --" + key + " is given more than once.");
		}
		seen.push_back(key);
	}
}

static std::string required(const std::vector<std::string>& args, const std::string& key) {
	const auto value = argValue(args, key);
	if (!value || value->empty()) {
		throw ConfigError("Missing required option --" + key + "=...");
	}
	return *value;
}

//! Split "a,b" into exactly two parts.
static std::pair<std::string, std::string> splitPair(const std::string& text, const std::string& key, const char* expected) {
	const auto comma = text.find(',');
	if (comma == std::string::npos || text.find(',', comma + 1) != std::string::npos) {
		throw ConfigError("Option --" + key + "='" + text + "' is not of the form " + expected + ".");
	}
	return {text.substr(0, comma), text.substr(comma + 1)};
}

static unsigned parseCount(const std::string& text, const std::string& key) {
	const double value = parseNumber(text, key);
	if (value < 0.0 || value != std::floor(value) || value > std::numeric_limits<unsigned>::max()) {
		throw ConfigError("Option --" + key + " expects a non-negative integer, got '" + text + "'.");
	}
	return static_cast<unsigned>(value);
}

} // namespace

std::optional<std::string> argValue(const std::vector<std::string>& args, const std::string& key) {
	const std::string pref = "--" + key + "=";
	for (const auto& a: args) {
		if (a.rfind(pref, 0) == 0)
			return a.substr(pref.size());
	}
	return std::nullopt;
}

bool argHas(const std::vector<std::string>& args, const std::string& key) {
	const std::string flag = "--" + key;
	return std::find(args.begin(), args.end(), flag) != args.end();
}

double parseNumber(const std::string& text, const std::string& key) {
	std::size_t used = 0u;
	double value     = 0.0;
	try {
		value = std::stod(text, &used);
	} catch (const std::invalid_argument&) {
		throw ConfigError("Option --" + key + " expects a number, got '" + text + "'.");
	} catch (const std::out_of_range&) {
		throw ConfigError("Option --" + key + " is out of range: '" + text + "'.");
	}
	if (used != text.size() || !std::isfinite(value)) {
		throw ConfigError("Option --" + key + " expects a number, got '" + text + "'.");
	}
	return value;
}

cv::Point2d parsePoint(const std::string& text, const std::string& key) {
	const auto [x, y] = splitPair(text, key, "x,y");
	return {parseNumber(x, key), parseNumber(y, key)};
}

core::GridDims parseDims(const std::string& text, const std::string& key) {
	const auto [cols, rows] = splitPair(text, key, "cols,rows");
	return {parseCount(cols, key), parseCount(rows, key)};
}

core::AxisSpacing parseSpacing(const std::string& text, const std::string& key) {
	if (text.find(',') == std::string::npos) {
		const double v = parseNumber(text, key);
		return {v, v};
	}
	const auto [x, y] = splitPair(text, key, "v or x,y");
	return {parseNumber(x, key), parseNumber(y, key)};
}

ExtractionJob parseExtractionJob(const std::vector<std::string>& args) {
	checkOptions(args, EXTRACT_KEYS, EXTRACT_FLAGS);

	ExtractionJob job{};
	job.imagePath = required(args, "image");

	job.corners.topLeft     = parsePoint(required(args, "tl"), "tl");
	job.corners.topRight    = parsePoint(required(args, "tr"), "tr");
	job.corners.bottomLeft  = parsePoint(required(args, "bl"), "bl");
	job.corners.bottomRight = parsePoint(required(args, "br"), "br");

	job.tiling.subarrayDims     = parseDims(required(args, "subarrays"), "subarrays");
	job.tiling.tileDims         = parseDims(required(args, "wells"), "wells");
	job.tiling.intraTileSpacing = parseSpacing(required(args, "spacing"), "spacing");

	if (const auto v = argValue(args, "stamp")) {
		const unsigned width = parseCount(*v, "stamp");
		if (width > static_cast<unsigned>(std::numeric_limits<int>::max())) {
			throw ConfigError("Option --stamp is too large.");
		}
		job.tiling.stampWidth = static_cast<int>(width);
	}
	if (const auto v = argValue(args, "max-residual"))
		job.fit.maxCornerResidualPx = parseNumber(*v, "max-residual");
	if (const auto v = argValue(args, "fill"))
		job.stamp.fillValue = parseNumber(*v, "fill");
	if (const auto v = argValue(args, "out"))
		job.outDir = *v;
	if (const auto v = argValue(args, "prefix"))
		job.prefix = *v;
	if (const auto v = argValue(args, "debug"))
		job.debugPath = *v;
	job.writeSummary = argHas(args, "summary");

	// Reject bad layouts here already. Corners are checked against the layout by the grid fit.
	core::validateTiling(job.tiling);
	return job;
}

ThresholdJob parseThresholdJob(const std::vector<std::string>& args) {
	checkOptions(args, THRESHOLD_KEYS, THRESHOLD_FLAGS);

	ThresholdJob job{};
	job.stackPath = required(args, "stack");
	job.tablePath = required(args, "table");

	if (const auto v = argValue(args, "threshold"))
		job.threshold.thresholdValue = parseNumber(*v, "threshold");
	if (const auto v = argValue(args, "mode"))
		job.threshold.mode = core::thresholdModeFromString(*v);
	if (const auto v = argValue(args, "cutoff"))
		job.threshold.occupancyCutoff = parseNumber(*v, "cutoff");
	if (const auto v = argValue(args, "gate"))
		job.threshold.gate = core::gatePolicyFromString(*v);
	if (const auto v = argValue(args, "out"))
		job.outDir = *v;
	if (const auto v = argValue(args, "prefix"))
		job.prefix = *v;
	job.threshold.skipInvalid = !argHas(args, "include-invalid");

	core::validateThreshold(job.threshold);
	return job;
}

} // namespace wellgrid::imaging::pipeline
