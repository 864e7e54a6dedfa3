#include "simulation.hpp"
#include "config.hpp"
#include <omp.h>
#include <algorithm>
#include <exception>
#include <iterator>
#include <stdexcept>

namespace sugarscape {

namespace {

const SimulationConfig& validated(const SimulationConfig& config) {
    validate_config(config);
    return config;
}

}  // namespace

void release_offspring(Landscape& landscape, std::vector<UpdateResult>& results) {
    for (auto& result : results) {
        if (!result.offspring) continue;
        Cell& cell = landscape.cell_at(result.offspring->position());
        if (cell.occupant == result.offspring.get()) {
            cell.occupant = nullptr;
        }
        result.offspring.reset();
    }
}

Simulation::Simulation(const SimulationConfig& config, uint64_t seed)
    : Simulation(config, make_two_peak_gaussian(config.capacity), seed) {}

Simulation::Simulation(const SimulationConfig& config, const CapacityField& capacity_field, uint64_t seed)
    : config_(validated(config)),
      rng_(seed),
      landscape_(config.width, config.height, config.regrowth_rate, capacity_field),
      initial_population_(0),
      workers_(config.workers > 0 ? config.workers : omp_get_max_threads()) {}

Agent* Simulation::add_agent(Position position, const AgentTraits& traits) {
    const Cell& target = landscape_.at(position.x, position.y);
    if (!target.is_empty()) {
        return nullptr;
    }

    auto agent = std::make_unique<Agent>(landscape_.next_agent_id(), position, traits, landscape_.time());
    Agent* placed = agent.get();
    landscape_.cell_at(position).occupant = placed;
    agents_.push_back(std::move(agent));
    initial_population_++;
    return placed;
}

int Simulation::spawn_random_agents(int n) {
    std::vector<Position> free_cells;
    for (const auto& cell : landscape_.cells()) {
        if (cell.is_empty()) {
            free_cells.push_back(cell.position());
        }
    }
    rng_.shuffle(free_cells);

    int count = std::min(n, static_cast<int>(free_cells.size()));
    for (int i = 0; i < count; i++) {
        add_agent(free_cells[i], random_traits(config_.agent_traits, rng_));
    }
    return count;
}

void Simulation::dispatch_updates(std::vector<UpdateResult>& results) {
    const int n = static_cast<int>(agents_.size());

    // One generator per dispatched agent, drawn in shuffled order
    std::vector<PCG64> streams;
    streams.reserve(n);
    for (int i = 0; i < n; i++) {
        streams.push_back(rng_.spawn());
    }

    std::exception_ptr failure;

#pragma omp parallel for schedule(dynamic, 8) num_threads(workers_)
    for (int i = 0; i < n; i++) {
        try {
            results[i] = agents_[i]->update(landscape_, config_.agent_traits, streams[i]);
        } catch (...) {
#pragma omp critical(sugarscape_update_failure)
            {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
    }

    if (failure) {
        release_offspring(landscape_, results);
        std::rethrow_exception(failure);
    }
}

int Simulation::step() {
    rng_.shuffle(agents_);

    std::vector<UpdateResult> results(agents_.size());
    dispatch_updates(results);

    std::vector<std::unique_ptr<Agent>> survivors;
    std::vector<std::unique_ptr<Agent>> offspring;
    survivors.reserve(agents_.size());

    for (size_t i = 0; i < agents_.size(); i++) {
        if (results[i].alive) {
            survivors.push_back(std::move(agents_[i]));
        }
        if (results[i].offspring) {
            offspring.push_back(std::move(results[i].offspring));
        }
    }
    survivors.insert(survivors.end(),
                     std::make_move_iterator(offspring.begin()),
                     std::make_move_iterator(offspring.end()));

    for (auto& agent : survivors) {
        agent->reset_reproduction();
    }

    // Dead agents are released here, after every update has finished
    agents_ = std::move(survivors);

    landscape_.regrowth();
    landscape_.advance_time();

    population_history_.push_back(population());
    return population();
}

int Simulation::run(int max_ticks, const TickCallback& on_tick) {
    int ticks = 0;
    while (ticks < max_ticks && !is_extinct()) {
        int population = step();
        ticks++;
        if (on_tick) {
            on_tick(ticks, population);
        }
    }
    return ticks;
}

double Simulation::survivor_ratio() const {
    if (initial_population_ == 0) return 0.0;
    return static_cast<double>(population()) / initial_population_;
}

}  // namespace sugarscape
