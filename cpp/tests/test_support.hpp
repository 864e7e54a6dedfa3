#pragma once

#include "types.hpp"
#include "agent.hpp"
#include "landscape.hpp"
#include <memory>

namespace sugarscape_test {

using namespace sugarscape;

// Fertile from birth until age 100 unless told otherwise.
inline AgentTraits make_traits(Sex sex = Sex::FEMALE,
                               double endowment = 10.0,
                               double metabolism = 1.0,
                               int field_of_view = 1,
                               double lifespan = 100.0) {
    return AgentTraits{
        .field_of_view = field_of_view,
        .metabolism = metabolism,
        .endowment = endowment,
        .lifespan = lifespan,
        .sex = sex,
        .fertility_begin = 0.0,
        .fertility_end = 100.0
    };
}

// Creates an agent and occupies its cell, the way the simulation places one.
inline std::unique_ptr<Agent> place(Landscape& landscape, Position p, const AgentTraits& traits) {
    auto agent = std::make_unique<Agent>(landscape.next_agent_id(), p, traits, landscape.time());
    landscape.cell_at(p).occupant = agent.get();
    return agent;
}

}  // namespace sugarscape_test
