#include "capacity_field.hpp"
#include <cmath>

namespace sugarscape {

double gaussian(double dx, double dy, const TwoPeakGaussianParams& params) {
    double theta_x = params.theta_x * params.bound_x;
    double theta_y = params.theta_y * params.bound_y;
    double ex = dx / theta_x;
    double ey = dy / theta_y;
    return params.psi * std::exp(-(ex * ex) - (ey * ey));
}

int two_peak_gaussian(int x, int y, const TwoPeakGaussianParams& params) {
    int wx = ((x % params.bound_x) + params.bound_x) % params.bound_x;
    int wy = ((y % params.bound_y) + params.bound_y) % params.bound_y;

    double value =
        gaussian(wx - params.peak1_x * params.bound_x, wy - params.peak1_y * params.bound_y, params) +
        gaussian(wx - params.peak2_x * params.bound_x, wy - params.peak2_y * params.bound_y, params);
    return static_cast<int>(std::lround(value));
}

CapacityField make_two_peak_gaussian(const TwoPeakGaussianParams& params) {
    return [params](int x, int y) { return two_peak_gaussian(x, y, params); };
}

CapacityField make_uniform_capacity(int capacity) {
    return [capacity](int, int) { return capacity; };
}

}  // namespace sugarscape
