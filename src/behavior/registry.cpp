#include "behavior/registry.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "behavior/compiler.hpp"

namespace behavior {
namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string strip_std_prefix(std::string text) {
    if (text.rfind("std/", 0) == 0) {
        text.erase(0, 4);
    }
    return text;
}

template <typename Pred>
std::vector<std::shared_ptr<const definition>> select(const std::vector<std::shared_ptr<const definition>>& entries, Pred pred) {
    std::vector<std::shared_ptr<const definition>> out;
    for (const auto& def : entries) {
        if (pred(*def)) {
            out.push_back(def);
        }
    }
    return out;
}

}  // namespace

std::size_t levenshtein_distance(std::string_view a, std::string_view b) {
    std::vector<std::size_t> row(b.size() + 1);
    for (std::size_t j = 0; j <= b.size(); ++j) {
        row[j] = j;
    }
    for (std::size_t i = 1; i <= a.size(); ++i) {
        std::size_t diagonal = row[0];
        row[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            const std::size_t above = row[j];
            const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            row[j] = std::min({row[j] + 1, row[j - 1] + 1, diagonal + cost});
            diagonal = above;
        }
    }
    return row[b.size()];
}

void registry::register_behavior(definition def) {
    auto shared = std::make_shared<const definition>(std::move(def));
    for (auto& existing : entries_) {
        if (existing->name == shared->name) {
            existing = std::move(shared);
            return;
        }
    }
    entries_.push_back(std::move(shared));
}

std::shared_ptr<const definition> registry::find(std::string_view name) const {
    for (const auto& def : entries_) {
        if (def->name == name) {
            return def;
        }
    }
    return nullptr;
}

bool registry::contains(std::string_view name) const {
    return find(name) != nullptr;
}

std::vector<std::string> registry::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& def : entries_) {
        out.push_back(def->name);
    }
    return out;
}

std::size_t registry::size() const noexcept {
    return entries_.size();
}

std::vector<std::shared_ptr<const definition>> registry::all() const {
    return entries_;
}

std::vector<std::shared_ptr<const definition>> registry::by_category(std::string_view category) const {
    return select(entries_, [&](const definition& def) { return def.category == category; });
}

std::vector<std::shared_ptr<const definition>> registry::for_use_case(std::string_view use_case) const {
    const std::string needle = lowercase(use_case);
    return select(entries_, [&](const definition& def) {
        return std::any_of(def.suggested_for.begin(), def.suggested_for.end(), [&](const std::string& suggestion) {
            const std::string hay = lowercase(suggestion);
            return hay.find(needle) != std::string::npos || needle.find(hay) != std::string::npos;
        });
    });
}

std::vector<std::shared_ptr<const definition>> registry::for_event(std::string_view event) const {
    return select(entries_, [&](const definition& def) { return def.has_event(event); });
}

std::vector<std::shared_ptr<const definition>> registry::with_state(std::string_view state) const {
    return select(entries_, [&](const definition& def) { return def.has_state(state); });
}

std::vector<std::string> registry::similar_names(std::string_view name) const {
    const std::string wanted = strip_std_prefix(lowercase(name));
    std::vector<std::string> out;
    for (const auto& def : entries_) {
        const std::string candidate = strip_std_prefix(lowercase(def->name));
        const bool contains_either = candidate.find(wanted) != std::string::npos || wanted.find(candidate) != std::string::npos;
        if (contains_either || levenshtein_distance(candidate, wanted) <= 3) {
            out.push_back(def->name);
        }
    }
    return out;
}

std::optional<std::string> registry::validate_reference(std::string_view name) const {
    if (name.rfind("std/", 0) != 0) {
        return "Behavior name must start with 'std/': " + std::string(name);
    }
    if (contains(name)) {
        return std::nullopt;
    }
    const std::vector<std::string> similar = similar_names(name);
    if (similar.empty()) {
        return "Unknown behavior: " + std::string(name);
    }
    std::string joined;
    for (std::size_t i = 0; i < similar.size(); ++i) {
        joined += (i == 0 ? "" : ", ") + similar[i];
    }
    return "Unknown behavior '" + std::string(name) + "'. Did you mean: " + joined + "?";
}

library_stats registry::stats() const {
    library_stats out;
    out.total_behaviors = entries_.size();
    for (const auto& def : entries_) {
        ++out.by_category[def->category];
        out.total_states += def->states.size();
        out.total_events += def->events.size();
        out.total_transitions += def->transitions.size();
        out.total_ticks += def->ticks.size();
    }
    return out;
}

void registry::clear() {
    entries_.clear();
}

const registry& std_registry() {
    static const registry catalog = [] {
        registry r;
        for (std::string_view doc : std_behavior_documents()) {
            r.register_behavior(compile_definition_text(std::string(doc)));
        }
        return r;
    }();
    return catalog;
}

}  // namespace behavior
