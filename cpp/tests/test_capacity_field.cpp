#include <doctest/doctest.h>

#include "capacity_field.hpp"
#include "types.hpp"

#include <algorithm>

using namespace sugarscape;

TEST_CASE("Capacity field: default peaks reach psi")
{
    TwoPeakGaussianParams params = default_capacity_params(50, 50);

    CHECK(two_peak_gaussian(12, 12, params) == 4);
    CHECK(two_peak_gaussian(37, 37, params) == 4);
    // Far from both peaks
    CHECK(two_peak_gaussian(0, 49, params) < 2);
}

TEST_CASE("Capacity field: coordinates wrap around the bounds")
{
    TwoPeakGaussianParams params = default_capacity_params(20, 30);

    CHECK(two_peak_gaussian(-1, 0, params) == two_peak_gaussian(19, 0, params));
    CHECK(two_peak_gaussian(20, 5, params) == two_peak_gaussian(0, 5, params));
    CHECK(two_peak_gaussian(3, 31, params) == two_peak_gaussian(3, 1, params));
}

TEST_CASE("Capacity field: values are bounded by two bumps")
{
    TwoPeakGaussianParams params = default_capacity_params(40, 40);
    params.psi = 3.0;
    params.peak1_x = params.peak2_x = 0.5;
    params.peak1_y = params.peak2_y = 0.5;

    int highest = 0;
    for (int y = 0; y < 40; y++) {
        for (int x = 0; x < 40; x++) {
            int c = two_peak_gaussian(x, y, params);
            CHECK(c >= 0);
            highest = std::max(highest, c);
        }
    }
    // Overlapping peaks add up
    CHECK(highest == 6);
}

TEST_CASE("Capacity field: adapters")
{
    CapacityField uniform = make_uniform_capacity(3);
    CHECK(uniform(0, 0) == 3);
    CHECK(uniform(17, 4) == 3);

    TwoPeakGaussianParams params = default_capacity_params(50, 50);
    CapacityField field = make_two_peak_gaussian(params);
    CHECK(field(12, 12) == two_peak_gaussian(12, 12, params));
}
