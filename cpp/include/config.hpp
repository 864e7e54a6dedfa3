#pragma once

#include "types.hpp"
#include "rng.hpp"
#include <stdexcept>
#include <string>

namespace sugarscape {

class InvalidConfiguration : public std::runtime_error {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::runtime_error("invalid configuration: " + what) {}
};

void validate_trait_ranges(const AgentTraitRanges& ranges);
void validate_capacity_params(const TwoPeakGaussianParams& params);
void validate_config(const SimulationConfig& config);

// Random peak placement, spreads and amplitude over the given bounds.
TwoPeakGaussianParams randomize_capacity_params(int bound_x, int bound_y, PCG64& rng);

}  // namespace sugarscape
