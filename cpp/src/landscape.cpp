#include "landscape.hpp"
#include "config.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace sugarscape {

Landscape::Landscape(int width, int height, double regrowth_rate, const CapacityField& capacity_field)
    : width_(width),
      height_(height),
      regrowth_rate_(regrowth_rate),
      time_(0),
      next_agent_id_(1) {
    if (width <= 0 || height <= 0) {
        throw InvalidConfiguration("landscape dimensions must be positive, got " +
                                   std::to_string(width) + "x" + std::to_string(height));
    }
    if (regrowth_rate < 0.0) {
        throw InvalidConfiguration("regrowth rate must not be negative");
    }
    if (!capacity_field) {
        throw InvalidConfiguration("no capacity field given");
    }

    cells_.reserve(static_cast<size_t>(width) * height);
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            int capacity = capacity_field(x, y);
            if (capacity < 0) {
                throw InvalidConfiguration("capacity field returned " + std::to_string(capacity) +
                                           " at (" + std::to_string(x) + ", " + std::to_string(y) + ")");
            }
            cells_.emplace_back(x, y, capacity);
        }
    }
}

bool Landscape::in_bounds(int x, int y) const {
    return x >= 0 && x < width_ && y >= 0 && y < height_;
}

Cell& Landscape::cell_at(int x, int y) {
    return cells_[y * width_ + x];
}

const Cell& Landscape::cell_at(int x, int y) const {
    return cells_[y * width_ + x];
}

const Cell& Landscape::at(int x, int y) const {
    if (!in_bounds(x, y)) {
        throw std::out_of_range("cell (" + std::to_string(x) + ", " + std::to_string(y) +
                                ") outside " + std::to_string(width_) + "x" + std::to_string(height_));
    }
    return cell_at(x, y);
}

void Landscape::regrowth() {
    for (auto& cell : cells_) {
        cell.regrow(regrowth_rate_);
    }
}

void Landscape::advance_time() {
    time_++;
}

std::vector<Cell*> Landscape::von_neumann_neighborhood(Position center, int radius) {
    std::vector<int> indices;
    indices.reserve(static_cast<size_t>(2 * radius * (radius + 1) + 1));

    for (int dx = -radius; dx <= radius; dx++) {
        int span = radius - std::abs(dx);
        int nx = std::clamp(center.x + dx, 0, width_ - 1);
        for (int dy = -span; dy <= span; dy++) {
            int ny = std::clamp(center.y + dy, 0, height_ - 1);
            indices.push_back(ny * width_ + nx);
        }
    }

    // Clamping folds offsets beyond the border onto the same edge cell
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

    std::vector<Cell*> neighborhood;
    neighborhood.reserve(indices.size());
    for (int idx : indices) {
        neighborhood.push_back(&cells_[idx]);
    }
    return neighborhood;
}

std::vector<Cell*> Landscape::empty_neighbors(Position center, int radius) {
    std::vector<Cell*> neighborhood = von_neumann_neighborhood(center, radius);
    neighborhood.erase(
        std::remove_if(neighborhood.begin(), neighborhood.end(),
                       [](const Cell* c) { return !c->is_empty(); }),
        neighborhood.end()
    );
    return neighborhood;
}

AgentId Landscape::next_agent_id() {
    return next_agent_id_.fetch_add(1, std::memory_order_relaxed);
}

std::vector<CellView> Landscape::snapshot() const {
    std::vector<CellView> view;
    view.reserve(cells_.size());
    for (const auto& cell : cells_) {
        view.push_back(CellView{cell.resource_level, !cell.is_empty()});
    }
    return view;
}

int Landscape::count_occupied() const {
    return static_cast<int>(std::count_if(cells_.begin(), cells_.end(),
                                          [](const Cell& c) { return !c.is_empty(); }));
}

long long Landscape::total_resources() const {
    long long total = 0;
    for (const auto& cell : cells_) {
        total += cell.resource_level;
    }
    return total;
}

}  // namespace sugarscape
