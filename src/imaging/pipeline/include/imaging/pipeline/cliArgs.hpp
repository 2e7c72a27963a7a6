#pragma once

#include "imaging/pipeline/pipeline.hpp"

#include <optional>
#include <string>
#include <vector>

/*
  Command line options of the two stages.

  Conventions:
    - Key format: --key=value  (no spaces)
    - Flags:      --key        (boolean presence)
    - Options are passed without the program name and subcommand.
    - Keys are case-sensitive. Unknown keys are rejected so typos do not silently fall back to defaults.
    - Each key may appear once. Flags take no value and value keys need one.

  Value formats:
    - point:   x,y
    - dims:    cols,rows
    - spacing: v (both axes) or x,y

  Missing required keys and unparsable values throw ConfigError.
*/
namespace wellgrid::imaging::pipeline {

//! Value of "--key=value". Empty optional if the key is not given.
std::optional<std::string> argValue(const std::vector<std::string>& args, const std::string& key);

//! Presence of the flag "--key".
bool argHas(const std::vector<std::string>& args, const std::string& key);

double parseNumber(const std::string& text, const std::string& key);
cv::Point2d parsePoint(const std::string& text, const std::string& key);
core::GridDims parseDims(const std::string& text, const std::string& key);
core::AxisSpacing parseSpacing(const std::string& text, const std::string& key);

/*! Options of "extract":
 *    --image=<file> --tl=x,y --tr=x,y --bl=x,y --br=x,y --subarrays=cols,rows --wells=cols,rows --spacing=v|x,y
 *    [--stamp=32] [--max-residual=3] [--fill=0] [--out=.] [--prefix=<image stem>] [--summary] [--debug=<file>]
 */
ExtractionJob parseExtractionJob(const std::vector<std::string>& args);

/*! Options of "threshold":
 *    --stack=<file> --table=<file> [--threshold=128] [--mode=binarize|mask|passthrough] [--cutoff=0.5] [--gate=keep|discard]
 *    [--include-invalid] [--out=.] [--prefix=<stack stem>]
 */
ThresholdJob parseThresholdJob(const std::vector<std::string>& args);

} // namespace wellgrid::imaging::pipeline
