#include "config.hpp"

namespace sugarscape {

namespace {

template <typename T>
void check_range(T min_val, T max_val, const char* name) {
    if (min_val > max_val) {
        throw InvalidConfiguration(std::string(name) + " range is empty (min > max)");
    }
}

}  // namespace

void validate_trait_ranges(const AgentTraitRanges& ranges) {
    if (ranges.field_of_view_min < 1) {
        throw InvalidConfiguration("field of view must be at least 1");
    }
    if (ranges.metabolism_min <= 0.0) {
        throw InvalidConfiguration("metabolism must be positive");
    }
    if (ranges.lifespan_min <= 0.0) {
        throw InvalidConfiguration("lifespan must be positive");
    }
    if (ranges.endowment_min < 0.0) {
        throw InvalidConfiguration("endowment must not be negative");
    }
    check_range(ranges.field_of_view_min, ranges.field_of_view_max, "field of view");
    check_range(ranges.metabolism_min, ranges.metabolism_max, "metabolism");
    check_range(ranges.endowment_min, ranges.endowment_max, "endowment");
    check_range(ranges.lifespan_min, ranges.lifespan_max, "lifespan");
    check_range(ranges.fertility_begin_min, ranges.fertility_begin_max, "fertility begin");
    check_range(ranges.female_fertility_end_min, ranges.female_fertility_end_max, "female fertility end");
    check_range(ranges.male_fertility_end_min, ranges.male_fertility_end_max, "male fertility end");
}

void validate_capacity_params(const TwoPeakGaussianParams& params) {
    if (params.bound_x <= 0 || params.bound_y <= 0) {
        throw InvalidConfiguration("capacity field bounds must be positive");
    }
    if (params.theta_x <= 0.0 || params.theta_y <= 0.0) {
        throw InvalidConfiguration("capacity field spreads must be positive");
    }
}

void validate_config(const SimulationConfig& config) {
    if (config.width <= 0 || config.height <= 0) {
        throw InvalidConfiguration("landscape dimensions must be positive, got " +
                                   std::to_string(config.width) + "x" + std::to_string(config.height));
    }
    if (config.regrowth_rate < 0.0) {
        throw InvalidConfiguration("regrowth rate must not be negative");
    }
    if (config.initial_agents < 0) {
        throw InvalidConfiguration("initial agent count must not be negative");
    }
    if (config.max_ticks < 0) {
        throw InvalidConfiguration("tick budget must not be negative");
    }
    if (config.workers < 0) {
        throw InvalidConfiguration("worker count must not be negative");
    }
    validate_trait_ranges(config.agent_traits);
    validate_capacity_params(config.capacity);
}

TwoPeakGaussianParams randomize_capacity_params(int bound_x, int bound_y, PCG64& rng) {
    return TwoPeakGaussianParams{
        .bound_x = bound_x,
        .bound_y = bound_y,
        .psi = rng.uniform(1.0, 5.0),
        .peak1_x = rng.uniform(0.1, 0.9),
        .peak1_y = rng.uniform(0.1, 0.9),
        .peak2_x = rng.uniform(0.1, 0.9),
        .peak2_y = rng.uniform(0.1, 0.9),
        .theta_x = rng.uniform(0.1, 0.5),
        .theta_y = rng.uniform(0.1, 0.5)
    };
}

}  // namespace sugarscape
