#pragma once

#include "types.hpp"

namespace sugarscape {

class Agent;

struct Cell {
    int x;
    int y;
    const int capacity;
    int resource_level;
    Agent* occupant;  // non-owning, nullptr when empty

    Cell(int x_, int y_, int capacity_);

    bool is_empty() const { return occupant == nullptr; }
    Position position() const { return Position{x, y}; }
    void regrow(double rate);
    int drain();
};

}  // namespace sugarscape
