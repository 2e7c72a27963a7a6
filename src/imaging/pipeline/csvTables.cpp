#include "imaging/pipeline/csvTables.hpp"

#include "imaging/core/errors.hpp"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace wellgrid::imaging::pipeline {

using core::IoError;
using core::ManifestError;

unsigned parseUnsignedField(const std::string& text) {
	// stoul skips whitespace and accepts a minus sign, which wraps.
	if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
		throw std::invalid_argument("not an unsigned integer: " + text);
	}
	std::size_t used = 0u;
	const auto value = std::stoul(text, &used);
	if (used != text.size() || value > std::numeric_limits<unsigned>::max()) {
		throw std::invalid_argument("not an unsigned integer: " + text);
	}
	return static_cast<unsigned>(value);
}

double parseDoubleField(const std::string& text) {
	std::size_t used   = 0u;
	const double value = std::stod(text, &used);
	if (used != text.size()) {
		throw std::invalid_argument("not a number: " + text);
	}
	return value;
}

namespace {

static constexpr std::size_t COORDINATE_COLUMNS = 9u;

static bool parseBool(const std::string& text) {
	if (text == "1" || text == "true")
		return true;
	if (text == "0" || text == "false")
		return false;
	throw std::invalid_argument("not a boolean: " + text);
}

static core::CoordinateRow parseCoordinateRow(const std::string& line) {
	auto fields = splitCsvLine(line);
	if (fields.size() < COORDINATE_COLUMNS) {
		throw std::invalid_argument("expected " + std::to_string(COORDINATE_COLUMNS) + " columns, found " + std::to_string(fields.size()));
	}
	// The source is the last column and may itself contain commas.
	for (std::size_t i = COORDINATE_COLUMNS; i < fields.size(); ++i) {
		fields[COORDINATE_COLUMNS - 1] += "," + fields[i];
	}

	core::CoordinateRow row{};
	row.index.subarrayCol = parseUnsignedField(fields[0]);
	row.index.subarrayRow = parseUnsignedField(fields[1]);
	row.index.wellCol     = parseUnsignedField(fields[2]);
	row.index.wellRow     = parseUnsignedField(fields[3]);
	row.center            = {parseDoubleField(fields[4]), parseDoubleField(fields[5])};
	row.valid             = parseBool(fields[6]);
	row.status            = core::stampStatusFromString(fields[7]);
	row.source            = fields[8];

	if (row.valid != (row.status == core::StampStatus::Ok)) {
		throw std::invalid_argument("validity does not match status '" + fields[7] + "'");
	}
	return row;
}

} // namespace

std::vector<std::string> splitCsvLine(const std::string& line) {
	std::vector<std::string> fields;
	std::string field;
	std::istringstream is(line);
	while (std::getline(is, field, ',')) {
		fields.push_back(field);
	}
	// getline drops a trailing empty field.
	if (!line.empty() && line.back() == ',') {
		fields.emplace_back();
	}
	return fields;
}

void writeCoordinateTable(std::ostream& os, const core::CoordinateTable& table) {
	os << std::setprecision(std::numeric_limits<double>::max_digits10);
	os << COORDINATE_HEADER << "\n";
	for (const auto& row: table) {
		os << row.index.subarrayCol << ',' << row.index.subarrayRow << ',' << row.index.wellCol << ',' << row.index.wellRow << ',' << row.center.x
		   << ',' << row.center.y << ',' << (row.valid ? 1 : 0) << ',' << core::toString(row.status) << ',' << row.source << "\n";
	}
}

void writeCoordinateTable(const std::filesystem::path& path, const core::CoordinateTable& table) {
	std::ofstream file(path);
	if (!file) {
		throw IoError("Cannot open coordinate table for writing: " + path.string());
	}
	writeCoordinateTable(file, table);
	file.flush();
	if (!file) {
		throw IoError("Failed to write coordinate table: " + path.string());
	}
	std::cout << "Wrote " << table.size() << " rows to " << path.string() << "\n";
}

core::CoordinateTable readCoordinateTable(std::istream& is) {
	std::string line;
	if (!std::getline(is, line)) {
		throw ManifestError("Coordinate table is empty.");
	}
	if (!line.empty() && line.back() == '\r') {
		line.pop_back();
	}
	if (line != COORDINATE_HEADER) {
		throw ManifestError("Unexpected coordinate table header '" + line + "'.");
	}

	core::CoordinateTable table;
	std::size_t lineNumber = 1u;
	while (std::getline(is, line)) {
		++lineNumber;
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		if (line.empty()) {
			continue;
		}

		try {
			table.push_back(parseCoordinateRow(line));
		} catch (const std::invalid_argument& e) {
			throw ManifestError("Coordinate table line " + std::to_string(lineNumber) + ": " + e.what());
		} catch (const std::out_of_range& e) {
			throw ManifestError("Coordinate table line " + std::to_string(lineNumber) + ": value out of range (" + e.what() + ")");
		} catch (const core::ConfigError& e) {
			throw ManifestError("Coordinate table line " + std::to_string(lineNumber) + ": " + e.what());
		}
	}
	return table;
}

core::CoordinateTable readCoordinateTable(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file) {
		throw IoError("Cannot open coordinate table: " + path.string());
	}
	auto table = readCoordinateTable(file);
	std::cout << "Read " << table.size() << " rows from " << path.string() << "\n";
	return table;
}

void writeThresholdTable(const std::filesystem::path& path, const std::vector<core::ThresholdResult>& results) {
	std::ofstream file(path);
	if (!file) {
		throw IoError("Cannot open threshold table for writing: " + path.string());
	}

	file << std::setprecision(std::numeric_limits<double>::max_digits10);
	file << THRESHOLD_HEADER << "\n";
	for (const auto& r: results) {
		file << r.index.subarrayCol << ',' << r.index.subarrayRow << ',' << r.index.wellCol << ',' << r.index.wellRow << ',' << (r.valid ? 1 : 0) << ','
		     << (r.processed ? 1 : 0) << ',' << r.fractionAbove << ',' << (r.pass ? 1 : 0) << ',' << (r.kept ? 1 : 0) << ',' << r.meanIntensity << "\n";
	}

	file.flush();
	if (!file) {
		throw IoError("Failed to write threshold table: " + path.string());
	}
	std::cout << "Wrote " << results.size() << " rows to " << path.string() << "\n";
}

} // namespace wellgrid::imaging::pipeline
