#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "orbital/expression.hpp"
#include "orbital/value.hpp"

namespace behavior {

inline constexpr std::string_view k_categories[] = {
    "ui-interaction", "data-management", "async", "feedback", "game-core", "game-entity", "game-ui"};

inline constexpr std::int64_t k_frame_interval_ms = 16;

[[nodiscard]] bool is_known_category(std::string_view category) noexcept;

struct state_decl {
    std::string name;
    bool is_initial = false;
    bool is_final = false;
    std::string description;
};

struct event_decl {
    std::string key;
    std::string name;
    std::string description;
    orbital::value payload_schema;
};

struct transition {
    // Empty with any_state set means "any current state".
    std::vector<std::string> from;
    bool any_state = false;
    std::optional<std::string> to;
    std::string event;
    std::optional<orbital::sexpr> guard;
    std::vector<orbital::sexpr> effects;
};

enum class interval_kind {
    frame,
    fixed_ms,
    // "@config.<name>", resolved against each instance's configuration.
    config_ref
};

struct tick_interval {
    interval_kind kind = interval_kind::frame;
    double ms = 0.0;
    std::string config_key;
};

struct tick_decl {
    std::string name;
    std::string description;
    double priority = 0.0;
    tick_interval interval;
    // Empty means every state.
    std::vector<std::string> applies_to;
    std::optional<orbital::sexpr> guard;
    std::vector<orbital::sexpr> effects;
};

struct entity_field {
    std::string name;
    std::string type;
    orbital::value default_value;
    bool required = false;
    std::string description;
};

struct data_entity {
    std::string name;
    std::string description;
    bool runtime = false;
    bool singleton = false;
    std::vector<entity_field> fields;
};

struct config_field {
    std::string name;
    std::string type;
    std::string description;
    orbital::value default_value;
    std::vector<orbital::value> allowed;
};

struct definition {
    std::string name;
    std::string category;
    std::string description;
    std::vector<std::string> suggested_for;

    std::vector<data_entity> data_entities;

    std::string initial;
    std::vector<state_decl> states;
    std::vector<event_decl> events;
    std::vector<transition> transitions;

    std::vector<tick_decl> ticks;

    std::vector<config_field> config_required;
    std::vector<config_field> config_optional;

    std::vector<orbital::sexpr> initial_effects;

    [[nodiscard]] bool has_state(std::string_view state) const;
    [[nodiscard]] bool has_event(std::string_view event) const;
    [[nodiscard]] std::vector<std::string> state_names() const;
    [[nodiscard]] std::vector<std::string> event_keys() const;
};

[[nodiscard]] bool accepts_state(const transition& t, std::string_view state);

struct behavior_metadata {
    std::string name;
    std::string category;
    std::string description;
    std::vector<std::string> suggested_for;
    std::vector<std::string> states;
    std::vector<std::string> events;
    std::size_t transition_count = 0;
    std::size_t tick_count = 0;
    bool has_data_entities = false;
};

[[nodiscard]] behavior_metadata metadata_of(const definition& def);

}  // namespace behavior
