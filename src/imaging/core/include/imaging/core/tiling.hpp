#pragma once

#include <opencv2/core/types.hpp>

#include <cstddef>
#include <vector>

// Data model shared by all stages.
// A chip image contains a rectilinear tiling of subarrays, each subarray holds a rectilinear block of wells.
// Wells are enumerated in one fixed order everywhere (centers, stamp stack, coordinate table):
//   subarray row -> subarray column -> well row -> well column
// i.e. row-major across subarrays, then row-major inside a subarray.
namespace wellgrid::imaging::core {

//! Column/row counts.
struct GridDims {
	unsigned cols{1u};
	unsigned rows{1u};

	bool operator==(const GridDims&) const = default;
};

//! Pixel distance between the facing edge wells of two neighbouring subarrays, per axis.
struct AxisSpacing {
	double x{0.0};
	double y{0.0};

	bool operator==(const AxisSpacing&) const = default;
};

//! Centers of the four extreme wells of the full tiled array (pixels, source image space).
struct CornerSet {
	cv::Point2d topLeft;
	cv::Point2d topRight;
	cv::Point2d bottomLeft;
	cv::Point2d bottomRight;
};

//! Immutable description of the chip layout and the stamp size.
struct TilingSpec {
	GridDims subarrayDims{};        //!< Subarrays across/down.
	GridDims tileDims{};            //!< Wells per subarray across/down.
	AxisSpacing intraTileSpacing{}; //!< Gap between adjacent subarrays (px).
	int stampWidth{32};             //!< Side length of the square crop around each well (px).
};

//! Address of one well. All members are zero-based.
struct WellIndex {
	unsigned subarrayCol{0u};
	unsigned subarrayRow{0u};
	unsigned wellCol{0u};
	unsigned wellRow{0u};

	bool operator==(const WellIndex&) const = default;
};

//! Predicted center of one well. Produced by the grid model only.
struct WellCenter {
	WellIndex index;
	cv::Point2d position;
};

//! Total number of wells described by the tiling.
std::size_t wellCount(const TilingSpec& tiling);

//! Wells per axis over the whole array (subarrays * wells per subarray).
GridDims totalWellDims(const TilingSpec& tiling);

//! Position of a well in the fixed enumeration order.
std::size_t flatIndex(const WellIndex& index, const TilingSpec& tiling);

//! Inverse of flatIndex().
WellIndex wellIndexAt(std::size_t position, const TilingSpec& tiling);

//! All well indices in enumeration order.
std::vector<WellIndex> enumerateWells(const TilingSpec& tiling);

//! True if every member is inside the bounds given by the tiling.
bool isInside(const WellIndex& index, const TilingSpec& tiling);

//! Throws ConfigError if dimensions, spacing or stamp width are not usable.
void validateTiling(const TilingSpec& tiling);

//! Throws ConfigError if the corners are non-finite or degenerate for this tiling (zero span, collinear axes).
void validateCorners(const CornerSet& corners, const TilingSpec& tiling);

} // namespace wellgrid::imaging::core
