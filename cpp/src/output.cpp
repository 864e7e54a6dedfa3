#include "output.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace sugarscape {

namespace {

const char* const COLOR_MAP[COLOR_LEVELS] = {
    "\033[30;100m",
    "\033[30;106m",
    "\033[30;46m",
    "\033[30;104m",
    "\033[30;44m",
    "\033[30;45m",
    "\033[30;105m",
    "\033[30;101m",
    "\033[30;41m",
    "\033[30;40m",
};

const char* const RESET = "\033[0m";
const char* const AGENT = "\033[30;43m";
const char* const CLEAR_SCREEN = "\033[2J";
const char* const CURSOR_HOME = "\033[H";

}  // namespace

LandscapeRenderer::LandscapeRenderer(std::ostream& out) : out_(out) {}

void LandscapeRenderer::print_key() {
    out_ << "Key:\n";
    for (int i = 0; i < COLOR_LEVELS; i++) {
        out_ << i << " = " << COLOR_MAP[i] << "  " << RESET;
        out_ << (((i + 1) % 4 == 0) ? "\n" : "; ");
    }
    out_ << "Agent = " << AGENT << "  " << RESET << "\n";
}

void LandscapeRenderer::render(const Landscape& landscape, int population, int tick, int total) {
    std::string title = "Landscape Map";
    if (total > 0) {
        title += " " + std::to_string(tick) + "/" + std::to_string(total);
    }
    render(landscape, population, title);
}

void LandscapeRenderer::render(const Landscape& landscape, int population, const std::string& title) {
    std::string rule(static_cast<size_t>(landscape.width()) * 2, '=');

    out_ << CLEAR_SCREEN << CURSOR_HOME;
    out_ << rule << "\n";
    out_ << "\033[97;1m" << title << ":" << RESET << "\n";
    out_ << rule << "\n";
    print_key();
    out_ << rule << "\n";

    std::vector<CellView> view = landscape.snapshot();
    for (int y = 0; y < landscape.height(); y++) {
        for (int x = 0; x < landscape.width(); x++) {
            const CellView& cell = view[y * landscape.width() + x];
            if (cell.occupied) {
                out_ << AGENT << "  " << RESET;
            } else {
                int level = std::clamp(cell.resource_level, 0, COLOR_LEVELS - 1);
                out_ << COLOR_MAP[level] << "  " << RESET;
            }
        }
        out_ << "\n";
    }

    out_ << rule << "\n";
    out_ << "Agents: " << population << "\n";
    out_ << rule << "\n";
    out_.flush();
}

void write_population_series(std::ostream& out, const std::vector<int>& series) {
    out << "tick,population\n";
    for (size_t i = 0; i < series.size(); i++) {
        out << (i + 1) << "," << series[i] << "\n";
    }
}

PopulationSeriesWriter::PopulationSeriesWriter(const std::string& filename)
    : file_(filename), filename_(filename), closed_(false) {
    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open population series file: " + filename);
    }
}

PopulationSeriesWriter::~PopulationSeriesWriter() {
    if (!closed_ && file_.is_open()) {
        file_.close();
    }
}

void PopulationSeriesWriter::write(const std::vector<int>& series) {
    if (closed_) {
        throw std::logic_error("population series file already closed: " + filename_);
    }
    write_population_series(file_, series);
    if (!file_) {
        throw std::runtime_error("Failed to write population series file: " + filename_);
    }
}

void PopulationSeriesWriter::close() {
    if (!closed_ && file_.is_open()) {
        file_.close();
        closed_ = true;
        if (file_.fail()) {
            throw std::runtime_error("Failed to close population series file: " + filename_);
        }
    }
}

}  // namespace sugarscape
