#include "imaging/core/tiling.hpp"

#include "imaging/core/errors.hpp"

#include <climits>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>

namespace wellgrid::imaging::core {

static bool isFinite(const cv::Point2d& p) {
	return std::isfinite(p.x) && std::isfinite(p.y);
}

//! Wells along one axis of the whole array. Computed wide so that large layouts do not wrap.
static std::uint64_t axisTotal(const unsigned subarrays, const unsigned wellsPerSubarray) {
	return static_cast<std::uint64_t>(subarrays) * static_cast<std::uint64_t>(wellsPerSubarray);
}

static std::string describe(const cv::Point2d& p) {
	std::ostringstream os;
	os << "(" << p.x << ", " << p.y << ")";
	return os.str();
}

std::size_t wellCount(const TilingSpec& tiling) {
	const GridDims total = totalWellDims(tiling);
	return static_cast<std::size_t>(total.cols) * static_cast<std::size_t>(total.rows);
}

GridDims totalWellDims(const TilingSpec& tiling) {
	// Exact for every tiling accepted by validateTiling().
	return {static_cast<unsigned>(axisTotal(tiling.subarrayDims.cols, tiling.tileDims.cols)),
	        static_cast<unsigned>(axisTotal(tiling.subarrayDims.rows, tiling.tileDims.rows))};
}

std::size_t flatIndex(const WellIndex& index, const TilingSpec& tiling) {
	const std::size_t subCols  = tiling.subarrayDims.cols;
	const std::size_t tileCols = tiling.tileDims.cols;
	const std::size_t tileRows = tiling.tileDims.rows;

	const std::size_t subarray = static_cast<std::size_t>(index.subarrayRow) * subCols + index.subarrayCol; //!< Position of the subarray
	const std::size_t well     = static_cast<std::size_t>(index.wellRow) * tileCols + index.wellCol;        //!< Position inside the subarray
	return subarray * tileCols * tileRows + well;
}

WellIndex wellIndexAt(const std::size_t position, const TilingSpec& tiling) {
	const std::size_t perSubarray = static_cast<std::size_t>(tiling.tileDims.cols) * tiling.tileDims.rows;
	const std::size_t subarray    = position / perSubarray;
	const std::size_t well        = position % perSubarray;

	WellIndex index{};
	index.subarrayRow = static_cast<unsigned>(subarray / tiling.subarrayDims.cols);
	index.subarrayCol = static_cast<unsigned>(subarray % tiling.subarrayDims.cols);
	index.wellRow     = static_cast<unsigned>(well / tiling.tileDims.cols);
	index.wellCol     = static_cast<unsigned>(well % tiling.tileDims.cols);
	return index;
}

std::vector<WellIndex> enumerateWells(const TilingSpec& tiling) {
	std::vector<WellIndex> indices;
	indices.reserve(wellCount(tiling));

	for (unsigned sr = 0u; sr < tiling.subarrayDims.rows; ++sr) {
		for (unsigned sc = 0u; sc < tiling.subarrayDims.cols; ++sc) {
			for (unsigned wr = 0u; wr < tiling.tileDims.rows; ++wr) {
				for (unsigned wc = 0u; wc < tiling.tileDims.cols; ++wc) {
					indices.push_back({sc, sr, wc, wr});
				}
			}
		}
	}
	return indices;
}

bool isInside(const WellIndex& index, const TilingSpec& tiling) {
	return index.subarrayCol < tiling.subarrayDims.cols && index.subarrayRow < tiling.subarrayDims.rows && index.wellCol < tiling.tileDims.cols &&
	       index.wellRow < tiling.tileDims.rows;
}

void validateTiling(const TilingSpec& tiling) {
	if (tiling.subarrayDims.cols == 0u || tiling.subarrayDims.rows == 0u) {
		throw ConfigError("Subarray dimensions must be positive.");
	}
	if (tiling.tileDims.cols == 0u || tiling.tileDims.rows == 0u) {
		throw ConfigError("Tile dimensions (wells per subarray) must be positive.");
	}
	if (!std::isfinite(tiling.intraTileSpacing.x) || !std::isfinite(tiling.intraTileSpacing.y) || tiling.intraTileSpacing.x < 0.0 ||
	    tiling.intraTileSpacing.y < 0.0) {
		throw ConfigError("Intra-tile spacing must be finite and non-negative.");
	}
	if (tiling.stampWidth <= 0) {
		throw ConfigError("Stamp width must be positive, got " + std::to_string(tiling.stampWidth) + ".");
	}

	// Well columns/rows are addressed with int pixel math downstream.
	const std::uint64_t cols = axisTotal(tiling.subarrayDims.cols, tiling.tileDims.cols);
	const std::uint64_t rows = axisTotal(tiling.subarrayDims.rows, tiling.tileDims.rows);
	if (cols > static_cast<std::uint64_t>(INT_MAX) || rows > static_cast<std::uint64_t>(INT_MAX)) {
		throw ConfigError("Array of " + std::to_string(cols) + " x " + std::to_string(rows) + " wells is too large. At most " + std::to_string(INT_MAX) +
		                  " wells per axis are supported.");
	}
	if (cols > std::numeric_limits<std::size_t>::max() / rows) {
		throw ConfigError("Array of " + std::to_string(cols) + " x " + std::to_string(rows) + " wells cannot be counted.");
	}
}

void validateCorners(const CornerSet& corners, const TilingSpec& tiling) {
	if (!isFinite(corners.topLeft) || !isFinite(corners.topRight) || !isFinite(corners.bottomLeft) || !isFinite(corners.bottomRight)) {
		throw ConfigError("Corner coordinates must be finite.");
	}

	static constexpr double MIN_SPAN_PX = 1e-6; //!< Below this an axis has no usable direction.

	const GridDims total    = totalWellDims(tiling);
	const cv::Point2d axisX = corners.topRight - corners.topLeft;
	const cv::Point2d axisY = corners.bottomLeft - corners.topLeft;
	const double spanX      = cv::norm(axisX);
	const double spanY      = cv::norm(axisY);

	if (total.cols > 1u && spanX < MIN_SPAN_PX) {
		throw ConfigError("Degenerate corners: top-left " + describe(corners.topLeft) + " and top-right " + describe(corners.topRight) +
		                  " coincide but the array is " + std::to_string(total.cols) + " wells wide.");
	}
	if (total.rows > 1u && spanY < MIN_SPAN_PX) {
		throw ConfigError("Degenerate corners: top-left " + describe(corners.topLeft) + " and bottom-left " + describe(corners.bottomLeft) +
		                  " coincide but the array is " + std::to_string(total.rows) + " wells high.");
	}

	// Both axes must span a proper parallelogram.
	if (total.cols > 1u && total.rows > 1u) {
		static constexpr double MIN_SIN_ANGLE = 1e-3; //!< ~0.06 degrees between the axes.
		const double cross                    = axisX.x * axisY.y - axisX.y * axisY.x;
		if (std::abs(cross) < MIN_SIN_ANGLE * spanX * spanY) {
			throw ConfigError("Degenerate corners: the top edge and the left edge of the array are collinear.");
		}
	}
}

} // namespace wellgrid::imaging::core
