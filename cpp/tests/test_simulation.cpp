#include <doctest/doctest.h>

#include "config.hpp"
#include "simulation.hpp"
#include "test_support.hpp"

#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace sugarscape;
using sugarscape_test::make_traits;

namespace sugarscape_sim_test {

SimulationConfig small_config(int width, int height, int workers) {
    SimulationConfig config = default_simulation_config();
    config.width = width;
    config.height = height;
    config.workers = workers;
    config.capacity = default_capacity_params(width, height);
    return config;
}

// Every invariant that must hold between ticks.
void check_invariants(const Simulation& sim) {
    const Landscape& landscape = sim.landscape();

    for (const Cell& cell : landscape.cells()) {
        CHECK(cell.resource_level >= 0);
        CHECK(cell.resource_level <= cell.capacity);
    }

    std::set<std::pair<int, int>> positions;
    for (const auto& agent : sim.agents()) {
        CHECK(agent->alive());
        CHECK(agent->wealth() >= 0.0);
        Position p = agent->position();
        REQUIRE(landscape.in_bounds(p.x, p.y));
        CHECK(landscape.cell_at(p).occupant == agent.get());
        positions.insert({p.x, p.y});
    }
    CHECK(positions.size() == sim.agents().size());
    CHECK(landscape.count_occupied() == sim.population());
}

}  // namespace sugarscape_sim_test

using sugarscape_sim_test::check_invariants;
using sugarscape_sim_test::small_config;

TEST_CASE("Simulation: invalid configuration is fatal at construction")
{
    SimulationConfig config = small_config(10, 10, 1);
    config.width = 0;
    CHECK_THROWS_AS(Simulation(config, 1), InvalidConfiguration);

    config = small_config(10, 10, 1);
    config.agent_traits.metabolism_min = 0.0;
    CHECK_THROWS_AS(Simulation(config, 1), InvalidConfiguration);

    config = small_config(10, 10, 1);
    config.agent_traits.lifespan_min = -1.0;
    CHECK_THROWS_AS(Simulation(config, 1), InvalidConfiguration);
}

TEST_CASE("Simulation: placement is clamped to the free cells")
{
    Simulation sim(small_config(3, 3, 1), make_uniform_capacity(4), 5);

    CHECK(sim.spawn_random_agents(20) == 9);
    CHECK(sim.population() == 9);
    CHECK(sim.initial_population() == 9);
    CHECK(sim.spawn_random_agents(1) == 0);
    check_invariants(sim);
}

TEST_CASE("Simulation: explicit placement refuses occupied cells")
{
    Simulation sim(small_config(4, 4, 1), make_uniform_capacity(4), 5);

    Agent* first = sim.add_agent({1, 2}, make_traits());
    REQUIRE(first != nullptr);
    CHECK(sim.landscape().cell_at(1, 2).occupant == first);
    CHECK(sim.add_agent({1, 2}, make_traits()) == nullptr);
    CHECK_THROWS_AS(sim.add_agent({4, 0}, make_traits()), std::out_of_range);
    CHECK(sim.population() == 1);
}

TEST_CASE("Simulation: a tick advances time and regrows the landscape")
{
    Simulation sim(small_config(5, 5, 1), make_uniform_capacity(6), 3);
    sim.add_agent({2, 2}, make_traits(Sex::MALE, 10.0, 1.0));

    CHECK(sim.step() == 1);
    CHECK(sim.timestep() == 1);
    CHECK(sim.landscape().time() == 1);
    // Drained to 0, then one unit of regrowth
    CHECK(sim.landscape().cell_at(2, 2).resource_level == 1);
    CHECK(sim.population_history() == std::vector<int>{1});
    CHECK(sim.agents().front()->can_reproduce());
}

TEST_CASE("Simulation: invariants hold every tick with several workers")
{
    Simulation sim(small_config(30, 30, 4), 1234);
    sim.spawn_random_agents(200);
    check_invariants(sim);

    for (int tick = 0; tick < 80 && !sim.is_extinct(); tick++) {
        int population = sim.step();
        CHECK(population == sim.population());
        check_invariants(sim);
    }
    CHECK(sim.population_history().size() == static_cast<size_t>(sim.timestep()));
}

TEST_CASE("Simulation: offspring join the active set")
{
    // Rich land, long lives and immediate fertility give births on the first tick
    SimulationConfig config = small_config(12, 12, 2);
    config.agent_traits.fertility_begin_min = 0.0;
    config.agent_traits.fertility_begin_max = 0.0;
    config.agent_traits.endowment_min = 1.0;
    config.agent_traits.endowment_max = 1.0;

    Simulation sim(config, make_uniform_capacity(10), 77);
    sim.spawn_random_agents(40);
    sim.step();

    CHECK(sim.population() > 40);
    check_invariants(sim);
    for (const auto& agent : sim.agents()) {
        CHECK(agent->can_reproduce());
    }
}

TEST_CASE("Simulation: a starving population dies out in one tick")
{
    SimulationConfig config = small_config(10, 10, 3);
    config.agent_traits.endowment_min = 0.1;
    config.agent_traits.endowment_max = 0.5;

    Simulation sim(config, make_uniform_capacity(0), 8);
    sim.spawn_random_agents(30);

    CHECK(sim.run(100) == 1);
    CHECK(sim.is_extinct());
    CHECK(sim.population_history() == std::vector<int>{0});
    CHECK(sim.survivor_ratio() == 0.0);
    CHECK(sim.landscape().count_occupied() == 0);
    // Nothing left to update
    CHECK(sim.run(100) == 0);
}

TEST_CASE("Simulation: run stops at the tick budget")
{
    Simulation sim(small_config(20, 20, 2), make_uniform_capacity(8), 15);
    sim.spawn_random_agents(20);

    CHECK(sim.run(5) == 5);
    CHECK(sim.timestep() == 5);
    CHECK(sim.population_history().size() == 5);
    CHECK(sim.survivor_ratio() == doctest::Approx(sim.population() / 20.0));
}

TEST_CASE("Simulation: released offspring leave their cells empty")
{
    Landscape landscape(5, 5, 1.0, make_uniform_capacity(4));
    auto parent = sugarscape_test::place(landscape, {2, 2}, make_traits());

    std::vector<UpdateResult> results(2);
    results[0].alive = true;
    results[0].offspring = sugarscape_test::place(landscape, {2, 3}, make_traits(Sex::MALE));
    results[1].alive = true;

    release_offspring(landscape, results);

    CHECK(landscape.cell_at(2, 3).is_empty());
    CHECK(results[0].offspring.get() == nullptr);
    CHECK(landscape.cell_at(2, 2).occupant == parent.get());
    CHECK(landscape.count_occupied() == 1);
}

TEST_CASE("Simulation: run reports every completed tick")
{
    Simulation sim(small_config(15, 15, 2), make_uniform_capacity(6), 21);
    sim.spawn_random_agents(30);

    std::vector<int> ticks;
    std::vector<int> populations;
    int run = sim.run(4, [&](int tick, int population) {
        ticks.push_back(tick);
        populations.push_back(population);
        CHECK(population == sim.population());
    });

    CHECK(run == 4);
    CHECK(ticks == std::vector<int>{1, 2, 3, 4});
    CHECK(populations == sim.population_history());
}

TEST_CASE("Simulation: run skips the callback once extinct")
{
    SimulationConfig config = small_config(6, 6, 1);
    config.agent_traits.endowment_min = 0.1;
    config.agent_traits.endowment_max = 0.5;

    Simulation sim(config, make_uniform_capacity(0), 4);
    sim.spawn_random_agents(5);

    int calls = 0;
    CHECK(sim.run(10, [&](int, int population) {
        calls++;
        CHECK(population == 0);
    }) == 1);
    CHECK(calls == 1);
}

TEST_CASE("Simulation: same seed with one worker reproduces the run")
{
    auto history = [](uint64_t seed) {
        Simulation sim(small_config(25, 25, 1), seed);
        sim.spawn_random_agents(150);
        sim.run(60);
        return sim.population_history();
    };

    CHECK(history(99) == history(99));
}
