#pragma once

#include <vector>

namespace wellgrid::imaging::core {

double mean(const std::vector<double>& v);
double median(std::vector<double> values); //!< 0.0 for an empty input.

} // namespace wellgrid::imaging::core
