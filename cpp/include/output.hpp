#pragma once

#include "landscape.hpp"
#include <fstream>
#include <ostream>
#include <string>
#include <vector>

namespace sugarscape {

// ANSI background per resource level; higher levels reuse the last entry
constexpr int COLOR_LEVELS = 10;

class LandscapeRenderer {
public:
    explicit LandscapeRenderer(std::ostream& out);

    // tick/total are omitted from the header when total is 0
    void render(const Landscape& landscape, int population, int tick = 0, int total = 0);
    void render(const Landscape& landscape, int population, const std::string& title);

private:
    std::ostream& out_;

    void print_key();
};

// CSV "tick,population", one row per completed tick
void write_population_series(std::ostream& out, const std::vector<int>& series);

class PopulationSeriesWriter {
public:
    explicit PopulationSeriesWriter(const std::string& filename);
    ~PopulationSeriesWriter();

    void write(const std::vector<int>& series);
    void close();

private:
    std::ofstream file_;
    std::string filename_;
    bool closed_;
};

}  // namespace sugarscape
