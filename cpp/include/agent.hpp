#pragma once

#include "types.hpp"
#include "rng.hpp"
#include "landscape.hpp"
#include <memory>

namespace sugarscape {

// Mates considered per reproduction attempt
constexpr int MAX_MATE_CANDIDATES = 4;

class Agent;

struct UpdateResult {
    bool alive = false;
    std::unique_ptr<Agent> offspring;
};

AgentTraits random_traits(const AgentTraitRanges& ranges, PCG64& rng);

// Owned by the simulation; its cell only points back at it.
// Grid access and writes to wealth happen under the landscape mutex.
class Agent {
public:
    // Throws InvalidConfiguration for non-positive metabolism or lifespan
    Agent(AgentId id, Position position, const AgentTraits& traits, int birth_time);

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    AgentId id() const { return id_; }
    Position position() const { return position_; }
    const AgentTraits& traits() const { return traits_; }
    Sex sex() const { return traits_.sex; }
    int field_of_view() const { return traits_.field_of_view; }
    double endowment() const { return traits_.endowment; }
    int birth_time() const { return birth_time_; }
    double wealth() const { return wealth_; }
    bool alive() const { return alive_; }
    bool can_reproduce() const { return can_reproduce_; }

    int age(int time) const { return time - birth_time_; }
    bool is_fertile(int time) const;

    // Age check, then move/forage, then reproduce.
    UpdateResult update(Landscape& landscape, const AgentTraitRanges& ranges, PCG64& rng);

    // Harvest, pay metabolism, step to the richest empty cell in view.
    // Returns false if the agent starved.
    bool move(Landscape& landscape, PCG64& rng);

    // Pair with the wealthiest fertile opposite-sex neighbor sharing a free cell
    std::unique_ptr<Agent> reproduce(Landscape& landscape, const AgentTraitRanges& ranges, PCG64& rng);

    void reset_reproduction() { can_reproduce_ = true; }

private:
    AgentId id_;
    Position position_;
    AgentTraits traits_;
    int birth_time_;
    double wealth_;
    bool alive_;
    bool can_reproduce_;

    void die(Cell& current);
    void relocate(Cell& from, Cell& to);
};

}  // namespace sugarscape
