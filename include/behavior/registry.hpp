#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "behavior/definition.hpp"

namespace behavior {

struct library_stats {
    std::size_t total_behaviors = 0;
    std::map<std::string, std::size_t> by_category;
    std::size_t total_states = 0;
    std::size_t total_events = 0;
    std::size_t total_transitions = 0;
    std::size_t total_ticks = 0;
};

// Named catalog of behavior definitions. Registration order is kept for listing.
class registry {
public:
    // Replaces an existing entry with the same name.
    void register_behavior(definition def);

    std::shared_ptr<const definition> find(std::string_view name) const;
    bool contains(std::string_view name) const;
    std::vector<std::string> names() const;
    std::size_t size() const noexcept;

    std::vector<std::shared_ptr<const definition>> all() const;
    std::vector<std::shared_ptr<const definition>> by_category(std::string_view category) const;
    // Case-insensitive substring match, either direction, against suggested_for.
    std::vector<std::shared_ptr<const definition>> for_use_case(std::string_view use_case) const;
    std::vector<std::shared_ptr<const definition>> for_event(std::string_view event) const;
    std::vector<std::shared_ptr<const definition>> with_state(std::string_view state) const;

    // nullopt when name refers to a registered behavior; otherwise a message, with
    // suggestions when close names exist.
    std::optional<std::string> validate_reference(std::string_view name) const;
    std::vector<std::string> similar_names(std::string_view name) const;

    library_stats stats() const;
    void clear();

private:
    std::vector<std::shared_ptr<const definition>> entries_;
};

std::size_t levenshtein_distance(std::string_view a, std::string_view b);

// JSON documents of the std/ catalog, in registration order.
const std::vector<std::string_view>& std_behavior_documents();
// Built once from std_behavior_documents().
const registry& std_registry();

}  // namespace behavior
