#include "behavior/definition.hpp"

#include <algorithm>

namespace behavior {

bool is_known_category(std::string_view category) noexcept {
    return std::find(std::begin(k_categories), std::end(k_categories), category) != std::end(k_categories);
}

bool definition::has_state(std::string_view state) const {
    return std::any_of(states.begin(), states.end(), [&](const state_decl& s) { return s.name == state; });
}

bool definition::has_event(std::string_view event) const {
    return std::any_of(events.begin(), events.end(), [&](const event_decl& e) { return e.key == event; });
}

std::vector<std::string> definition::state_names() const {
    std::vector<std::string> out;
    out.reserve(states.size());
    for (const state_decl& s : states) {
        out.push_back(s.name);
    }
    return out;
}

std::vector<std::string> definition::event_keys() const {
    std::vector<std::string> out;
    out.reserve(events.size());
    for (const event_decl& e : events) {
        out.push_back(e.key);
    }
    return out;
}

bool accepts_state(const transition& t, std::string_view state) {
    if (t.any_state) {
        return true;
    }
    return std::find(t.from.begin(), t.from.end(), state) != t.from.end();
}

behavior_metadata metadata_of(const definition& def) {
    behavior_metadata out;
    out.name = def.name;
    out.category = def.category;
    out.description = def.description;
    out.suggested_for = def.suggested_for;
    out.states = def.state_names();
    out.events = def.event_keys();
    out.transition_count = def.transitions.size();
    out.tick_count = def.ticks.size();
    out.has_data_entities = !def.data_entities.empty();
    return out;
}

}  // namespace behavior
