#include "statistics.hpp"

#include <algorithm>
#include <cstddef>
#include <numeric>

namespace wellgrid::imaging::core {

double mean(const std::vector<double>& v) {
	if (v.empty()) {
		return 0.0;
	}
	return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double median(std::vector<double> values) {
	if (values.empty()) {
		return 0.0;
	}

	const std::size_t n   = values.size();
	const std::size_t mid = n / 2;

	std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
	double m = values[mid];

	// Even count: average with the largest element of the lower half.
	if (n % 2 == 0) {
		m = 0.5 * (m + *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid)));
	}
	return m;
}

} // namespace wellgrid::imaging::core
