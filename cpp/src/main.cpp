#include "types.hpp"
#include "config.hpp"
#include "simulation.hpp"
#include "output.hpp"
#include <iostream>
#include <string>
#include <chrono>
#include <cstring>
#include <exception>
#include <thread>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  -T, --time N          Number of ticks to simulate (default: 500)\n"
              << "  -X, --max_width N     Landscape and capacity field width (default: 50)\n"
              << "  -Y, --max_height N    Landscape and capacity field height (default: 50)\n"
              << "  -A, --agents N        Number of agents to place (default: 250)\n"
              << "  -R, --randomize       Randomize the capacity field parameters\n"
              << "  -S, --sleep_time SEC  Pause between displayed frames (default: 1.0)\n"
              << "  -V, --display         Draw the landscape after every tick\n"
              << "  --regrowth RATE       Resource regrowth per tick (default: 1.0)\n"
              << "  --threads N           Worker threads, 0 = all cores (default: 0)\n"
              << "  --seed N              Random seed (default: 42)\n"
              << "  --series FILE         Write the population series as CSV\n"
              << "  -q, --quiet           Suppress per-tick progress output\n"
              << "  -h, --help            Show this help message\n";
}

static bool is_flag(const char* arg, const char* long_name, const char* short_name) {
    return std::strcmp(arg, long_name) == 0 || (short_name && std::strcmp(arg, short_name) == 0);
}

int main(int argc, char* argv[]) {
    sugarscape::SimulationConfig config = sugarscape::default_simulation_config();
    uint64_t seed = 42;
    bool randomize = false;
    bool display = false;
    bool quiet = false;
    double sleep_time = 1.0;
    std::string series_file;

    // Parse command line arguments
    try {
        for (int i = 1; i < argc; i++) {
            if (is_flag(argv[i], "--help", "-h")) {
                print_usage(argv[0]);
                return 0;
            } else if (is_flag(argv[i], "--time", "-T") && i + 1 < argc) {
                config.max_ticks = std::stoi(argv[++i]);
            } else if (is_flag(argv[i], "--max_width", "-X") && i + 1 < argc) {
                config.width = std::stoi(argv[++i]);
            } else if (is_flag(argv[i], "--max_height", "-Y") && i + 1 < argc) {
                config.height = std::stoi(argv[++i]);
            } else if (is_flag(argv[i], "--agents", "-A") && i + 1 < argc) {
                config.initial_agents = std::stoi(argv[++i]);
            } else if (is_flag(argv[i], "--randomize", "-R")) {
                randomize = true;
            } else if (is_flag(argv[i], "--sleep_time", "-S") && i + 1 < argc) {
                sleep_time = std::stod(argv[++i]);
            } else if (is_flag(argv[i], "--display", "-V")) {
                display = true;
            } else if (is_flag(argv[i], "--regrowth", nullptr) && i + 1 < argc) {
                config.regrowth_rate = std::stod(argv[++i]);
            } else if (is_flag(argv[i], "--threads", nullptr) && i + 1 < argc) {
                config.workers = std::stoi(argv[++i]);
            } else if (is_flag(argv[i], "--seed", nullptr) && i + 1 < argc) {
                seed = std::stoull(argv[++i]);
            } else if (is_flag(argv[i], "--series", nullptr) && i + 1 < argc) {
                series_file = argv[++i];
            } else if (is_flag(argv[i], "--quiet", "-q")) {
                quiet = true;
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        // std::stoi and friends reject malformed numbers
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        // The capacity field shares the landscape bounds
        sugarscape::PCG64 param_rng(seed, 7);
        config.capacity = randomize
            ? sugarscape::randomize_capacity_params(config.width, config.height, param_rng)
            : sugarscape::default_capacity_params(config.width, config.height);

        sugarscape::Simulation sim(config, seed);
        int placed = sim.spawn_random_agents(config.initial_agents);

        sugarscape::LandscapeRenderer renderer(std::cout);
        if (!quiet) {
            std::cout << "Starting simulation:\n"
                      << "  Ticks: " << config.max_ticks << "\n"
                      << "  Agents placed: " << placed << " of " << config.initial_agents << "\n"
                      << "  Grid: " << config.width << "x" << config.height << "\n"
                      << "  Workers: " << sim.workers() << "\n"
                      << "  Seed: " << seed << "\n";
        }
        if (!quiet) {
            renderer.render(sim.landscape(), sim.population(), "Initial Map");
        }

        auto start_time = std::chrono::high_resolution_clock::now();

        int ticks = sim.run(config.max_ticks, [&](int tick, int population) {
            if (display) {
                renderer.render(sim.landscape(), population, tick, config.max_ticks);
                std::this_thread::sleep_for(std::chrono::duration<double>(sleep_time));
            }
            if (!quiet) {
                std::cout << "Current Population at (" << tick << " of " << config.max_ticks
                          << "): " << population << (display ? "\n" : "\r") << std::flush;
            }
            if (population <= 0) {
                std::cout << "\nAll agents have died.\n";
            }
        });

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        if (!quiet) {
            renderer.render(sim.landscape(), sim.population(), "Final Map");
        }

        if (!series_file.empty()) {
            sugarscape::PopulationSeriesWriter writer(series_file);
            writer.write(sim.population_history());
            writer.close();
        }

        std::cout << "\nSimulation complete!\n"
                  << "  Ticks run: " << ticks << "\n"
                  << "  Final population: " << sim.population() << "\n"
                  << "  Survivor ratio: " << sim.survivor_ratio() << "\n"
                  << "  Time: " << duration.count() << " ms\n";
        if (duration.count() > 0) {
            std::cout << "  Speed: " << (ticks * 1000.0 / duration.count()) << " ticks/sec\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
