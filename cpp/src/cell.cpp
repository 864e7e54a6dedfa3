#include "cell.hpp"
#include <algorithm>

namespace sugarscape {

Cell::Cell(int x_, int y_, int capacity_)
    : x(x_),
      y(y_),
      capacity(capacity_),
      resource_level(capacity_),
      occupant(nullptr) {}

void Cell::regrow(double rate) {
    resource_level = static_cast<int>(std::min(static_cast<double>(capacity), resource_level + rate));
}

int Cell::drain() {
    int taken = resource_level;
    resource_level = 0;
    return taken;
}

}  // namespace sugarscape
