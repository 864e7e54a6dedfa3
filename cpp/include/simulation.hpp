#pragma once

#include "types.hpp"
#include "rng.hpp"
#include "capacity_field.hpp"
#include "landscape.hpp"
#include "agent.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace sugarscape {

// Clears the cells claimed by offspring in results, then destroys them
void release_offspring(Landscape& landscape, std::vector<UpdateResult>& results);

// Called after every completed tick with its 1-based number in the run
using TickCallback = std::function<void(int tick, int population)>;

class Simulation {
public:
    // Landscape capacities from the two-peak field in config.capacity
    Simulation(const SimulationConfig& config, uint64_t seed);
    Simulation(const SimulationConfig& config, const CapacityField& capacity_field, uint64_t seed);

    // nullptr if the cell is taken, std::out_of_range outside the grid
    Agent* add_agent(Position position, const AgentTraits& traits);

    // Random placement into empty cells, clamped to the free space.
    // Returns the number actually placed.
    int spawn_random_agents(int n);

    // One generation. Returns the new population. If an update throws, moves
    // and deaths already applied are kept; do not step the simulation again.
    int step();

    // Steps until extinction or the budget is spent. Returns ticks run.
    int run(int max_ticks, const TickCallback& on_tick = nullptr);

    // Accessors
    int timestep() const { return landscape_.time(); }
    int workers() const { return workers_; }
    int population() const { return static_cast<int>(agents_.size()); }
    int initial_population() const { return initial_population_; }
    bool is_extinct() const { return agents_.empty(); }
    double survivor_ratio() const;
    const std::vector<int>& population_history() const { return population_history_; }
    const std::vector<std::unique_ptr<Agent>>& agents() const { return agents_; }
    const Landscape& landscape() const { return landscape_; }
    Landscape& landscape() { return landscape_; }

private:
    SimulationConfig config_;
    PCG64 rng_;
    Landscape landscape_;
    std::vector<std::unique_ptr<Agent>> agents_;
    std::vector<int> population_history_;
    int initial_population_;
    int workers_;

    void dispatch_updates(std::vector<UpdateResult>& results);
};

}  // namespace sugarscape
