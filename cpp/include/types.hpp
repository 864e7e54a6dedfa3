#pragma once

#include <cstdint>
#include <vector>

namespace sugarscape {

using AgentId = uint64_t;

enum class Sex : int8_t {
    MALE = 0,
    FEMALE = 1
};

struct Position {
    int x;
    int y;
};

inline bool operator==(const Position& a, const Position& b) {
    return a.x == b.x && a.y == b.y;
}

// Per-agent attributes fixed at birth.
struct AgentTraits {
    int field_of_view;
    double metabolism;
    double endowment;
    double lifespan;
    Sex sex;
    double fertility_begin;
    double fertility_end;
};

// Sampling ranges for the traits of newly created agents (inclusive).
struct AgentTraitRanges {
    int field_of_view_min;
    int field_of_view_max;
    double metabolism_min;
    double metabolism_max;
    double endowment_min;
    double endowment_max;
    double lifespan_min;
    double lifespan_max;
    double fertility_begin_min;
    double fertility_begin_max;
    double female_fertility_end_min;
    double female_fertility_end_max;
    double male_fertility_end_min;
    double male_fertility_end_max;
};

// Peak centers and spreads are fractions of the bounds.
struct TwoPeakGaussianParams {
    int bound_x;
    int bound_y;
    double psi;
    double peak1_x;
    double peak1_y;
    double peak2_x;
    double peak2_y;
    double theta_x;
    double theta_y;
};

struct SimulationConfig {
    int width;
    int height;
    double regrowth_rate;
    int initial_agents;
    int max_ticks;
    int workers;  // 0 = all hardware threads
    AgentTraitRanges agent_traits;
    TwoPeakGaussianParams capacity;
};

// Read-only view of one cell for renderers.
struct CellView {
    int resource_level;
    bool occupied;
};

inline AgentTraitRanges default_agent_trait_ranges() {
    return AgentTraitRanges{
        .field_of_view_min = 1,
        .field_of_view_max = 6,
        .metabolism_min = 1.0,
        .metabolism_max = 4.0,
        .endowment_min = 50.0,
        .endowment_max = 100.0,
        .lifespan_min = 60.0,
        .lifespan_max = 100.0,
        .fertility_begin_min = 12.0,
        .fertility_begin_max = 15.0,
        .female_fertility_end_min = 40.0,
        .female_fertility_end_max = 50.0,
        .male_fertility_end_min = 50.0,
        .male_fertility_end_max = 60.0
    };
}

inline TwoPeakGaussianParams default_capacity_params(int bound_x, int bound_y) {
    return TwoPeakGaussianParams{
        .bound_x = bound_x,
        .bound_y = bound_y,
        .psi = 4.0,
        .peak1_x = 0.25,
        .peak1_y = 0.25,
        .peak2_x = 0.75,
        .peak2_y = 0.75,
        .theta_x = 0.3,
        .theta_y = 0.3
    };
}

inline SimulationConfig default_simulation_config() {
    return SimulationConfig{
        .width = 50,
        .height = 50,
        .regrowth_rate = 1.0,
        .initial_agents = 250,
        .max_ticks = 500,
        .workers = 0,
        .agent_traits = default_agent_trait_ranges(),
        .capacity = default_capacity_params(50, 50)
    };
}

}  // namespace sugarscape
