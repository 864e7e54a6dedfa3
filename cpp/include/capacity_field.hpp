#pragma once

#include "types.hpp"
#include <functional>

namespace sugarscape {

// Maximum resource of the cell at (x, y). Called once per cell.
using CapacityField = std::function<int(int x, int y)>;

double gaussian(double dx, double dy, const TwoPeakGaussianParams& params);

// Sum of two gaussian bumps over toroidally wrapped coordinates,
// rounded to the nearest integer.
int two_peak_gaussian(int x, int y, const TwoPeakGaussianParams& params);

CapacityField make_two_peak_gaussian(const TwoPeakGaussianParams& params);

CapacityField make_uniform_capacity(int capacity);

}  // namespace sugarscape
