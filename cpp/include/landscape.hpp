#pragma once

#include "types.hpp"
#include "cell.hpp"
#include "capacity_field.hpp"
#include <atomic>
#include <mutex>
#include <vector>

namespace sugarscape {

class Landscape {
public:
    Landscape(int width, int height, double regrowth_rate, const CapacityField& capacity_field);

    Landscape(const Landscape&) = delete;
    Landscape& operator=(const Landscape&) = delete;

    int width() const { return width_; }
    int height() const { return height_; }
    int time() const { return time_; }
    const std::vector<Cell>& cells() const { return cells_; }

    bool in_bounds(int x, int y) const;

    // Unchecked, callers guarantee in-bounds coordinates
    Cell& cell_at(int x, int y);
    const Cell& cell_at(int x, int y) const;
    Cell& cell_at(Position p) { return cell_at(p.x, p.y); }
    const Cell& cell_at(Position p) const { return cell_at(p.x, p.y); }

    // Throws std::out_of_range
    const Cell& at(int x, int y) const;

    void regrowth();
    void advance_time();

    // Manhattan ball around center, clamped to the border, deduplicated, row-major
    std::vector<Cell*> von_neumann_neighborhood(Position center, int radius);

    // Unoccupied subset of the neighborhood, row-major order
    std::vector<Cell*> empty_neighbors(Position center, int radius);

    // Guards occupancy, resource levels and offspring placement
    std::mutex& mutex() { return mutex_; }

    AgentId next_agent_id();

    // Reporting
    std::vector<CellView> snapshot() const;
    int count_occupied() const;
    long long total_resources() const;

private:
    int width_;
    int height_;
    double regrowth_rate_;
    int time_;
    std::vector<Cell> cells_;  // Row-major: cells_[y * width + x]
    std::mutex mutex_;
    std::atomic<AgentId> next_agent_id_;
};

}  // namespace sugarscape
