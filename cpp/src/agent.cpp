#include "agent.hpp"
#include "config.hpp"
#include <algorithm>
#include <iterator>
#include <limits>
#include <mutex>

namespace sugarscape {

AgentTraits random_traits(const AgentTraitRanges& ranges, PCG64& rng) {
    AgentTraits traits;
    traits.field_of_view = rng.integers(ranges.field_of_view_min, ranges.field_of_view_max + 1);
    traits.metabolism = rng.uniform(ranges.metabolism_min, ranges.metabolism_max);
    traits.endowment = rng.uniform(ranges.endowment_min, ranges.endowment_max);
    traits.lifespan = rng.uniform(ranges.lifespan_min, ranges.lifespan_max);
    traits.sex = rng.coin() ? Sex::FEMALE : Sex::MALE;
    traits.fertility_begin = rng.uniform(ranges.fertility_begin_min, ranges.fertility_begin_max);
    if (traits.sex == Sex::FEMALE) {
        traits.fertility_end = rng.uniform(ranges.female_fertility_end_min, ranges.female_fertility_end_max);
    } else {
        traits.fertility_end = rng.uniform(ranges.male_fertility_end_min, ranges.male_fertility_end_max);
    }
    return traits;
}

Agent::Agent(AgentId id, Position position, const AgentTraits& traits, int birth_time)
    : id_(id),
      position_(position),
      traits_(traits),
      birth_time_(birth_time),
      wealth_(traits.endowment),
      alive_(true),
      can_reproduce_(true) {
    if (traits.metabolism <= 0.0) {
        throw InvalidConfiguration("metabolism must be positive");
    }
    if (traits.lifespan <= 0.0) {
        throw InvalidConfiguration("lifespan must be positive");
    }
    if (traits.field_of_view < 1) {
        throw InvalidConfiguration("field of view must be at least 1");
    }
    if (traits.endowment < 0.0) {
        throw InvalidConfiguration("endowment must not be negative");
    }
}

bool Agent::is_fertile(int time) const {
    int a = age(time);
    return traits_.fertility_begin <= a && a <= traits_.fertility_end &&
           wealth_ >= traits_.endowment;
}

void Agent::die(Cell& current) {
    if (current.occupant == this) {
        current.occupant = nullptr;
    }
    alive_ = false;
}

void Agent::relocate(Cell& from, Cell& to) {
    from.occupant = nullptr;
    to.occupant = this;
    position_ = to.position();
}

UpdateResult Agent::update(Landscape& landscape, const AgentTraitRanges& ranges, PCG64& rng) {
    UpdateResult result;

    if (age(landscape.time()) > traits_.lifespan) {
        std::lock_guard<std::mutex> lock(landscape.mutex());
        die(landscape.cell_at(position_));
        return result;
    }

    if (!move(landscape, rng)) {
        return result;
    }

    result.offspring = reproduce(landscape, ranges, rng);
    result.alive = alive_;
    return result;
}

bool Agent::move(Landscape& landscape, PCG64& rng) {
    std::lock_guard<std::mutex> lock(landscape.mutex());

    Cell& current = landscape.cell_at(position_);
    double harvested = current.drain();
    double earned = std::max(0.0, wealth_ + harvested - traits_.metabolism);
    if (earned <= 0.0) {
        wealth_ = 0.0;
        die(current);
        return false;
    }
    wealth_ = earned;

    std::vector<Cell*> candidates = landscape.empty_neighbors(position_, traits_.field_of_view);
    rng.shuffle(candidates);

    Cell* best = nullptr;
    for (Cell* cell : candidates) {
        if (best == nullptr || cell->resource_level > best->resource_level) {
            best = cell;
        }
    }

    if (best != nullptr) {
        relocate(current, *best);
    }
    return true;
}

std::unique_ptr<Agent> Agent::reproduce(Landscape& landscape, const AgentTraitRanges& ranges, PCG64& rng) {
    int time = landscape.time();
    if (!alive_ || !can_reproduce_ || !is_fertile(time)) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(landscape.mutex());

    std::vector<Agent*> candidates;
    for (Cell* cell : landscape.von_neumann_neighborhood(position_, traits_.field_of_view)) {
        Agent* other = cell->occupant;
        if (other != nullptr && other != this && other->sex() != sex() && other->is_fertile(time)) {
            candidates.push_back(other);
            if (static_cast<int>(candidates.size()) >= MAX_MATE_CANDIDATES) break;
        }
    }
    if (candidates.empty()) {
        return nullptr;
    }

    std::vector<Cell*> own_free = landscape.empty_neighbors(position_, traits_.field_of_view);

    Agent* partner = nullptr;
    std::vector<Cell*> birth_cells;
    double best_wealth = -std::numeric_limits<double>::infinity();
    for (Agent* candidate : candidates) {
        std::vector<Cell*> candidate_free =
            landscape.empty_neighbors(candidate->position(), candidate->field_of_view());

        // Both lists point into the row-major grid and are sorted by address
        std::vector<Cell*> shared;
        std::set_union(own_free.begin(), own_free.end(),
                       candidate_free.begin(), candidate_free.end(),
                       std::back_inserter(shared));

        if (!shared.empty() && candidate->wealth() > best_wealth) {
            best_wealth = candidate->wealth();
            partner = candidate;
            birth_cells = std::move(shared);
        }
    }
    if (partner == nullptr) {
        return nullptr;
    }

    Cell* birth_cell = birth_cells[rng.integers(0, static_cast<int>(birth_cells.size()))];

    AgentTraits child_traits = random_traits(ranges, rng);
    child_traits.endowment = (traits_.endowment + partner->endowment()) / 2.0;

    auto offspring = std::make_unique<Agent>(landscape.next_agent_id(), birth_cell->position(),
                                             child_traits, time);
    birth_cell->occupant = offspring.get();
    can_reproduce_ = false;
    return offspring;
}

}  // namespace sugarscape
