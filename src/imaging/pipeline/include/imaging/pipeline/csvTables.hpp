#pragma once

#include "imaging/core/stampExtractor.hpp"
#include "imaging/core/thresholdProcessor.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

// CSV tables written by the two stages. Comma separated, one header line, no quoting.
namespace wellgrid::imaging::pipeline {

static constexpr const char* COORDINATE_HEADER = "subarray_col,subarray_row,well_col,well_row,center_x,center_y,valid,status,source";
static constexpr const char* THRESHOLD_HEADER  = "subarray_col,subarray_row,well_col,well_row,valid,processed,fraction_above,pass,kept,mean_intensity";

//! Write the coordinate table. Centers keep full double precision. Throws IoError.
void writeCoordinateTable(std::ostream& os, const core::CoordinateTable& table);
void writeCoordinateTable(const std::filesystem::path& path, const core::CoordinateTable& table);

//! Read a coordinate table. Throws ManifestError for a wrong header or a malformed row (with line number), IoError if unreadable.
core::CoordinateTable readCoordinateTable(std::istream& is);
core::CoordinateTable readCoordinateTable(const std::filesystem::path& path);

//! Write the per-well threshold results. Throws IoError.
void writeThresholdTable(const std::filesystem::path& path, const std::vector<core::ThresholdResult>& results);

//! Strict unsigned field: digits only, no sign, no trailing text. Throws std::invalid_argument or std::out_of_range.
unsigned parseUnsignedField(const std::string& text);

//! Strict floating point field without trailing text. Throws std::invalid_argument or std::out_of_range.
double parseDoubleField(const std::string& text);

//! Split one CSV line at commas. Empty fields are kept.
std::vector<std::string> splitCsvLine(const std::string& line);

} // namespace wellgrid::imaging::pipeline
