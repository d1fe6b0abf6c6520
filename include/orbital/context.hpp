#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "orbital/expression.hpp"
#include "orbital/value.hpp"

namespace orbital {

// Entity data for the instance in scope. Effects write through mutate_entity handlers;
// readers take a snapshot, so a binding never observes a half-applied change set.
class entity_store {
public:
    entity_store();
    explicit entity_store(value initial);

    entity_store(const entity_store&) = delete;
    entity_store& operator=(const entity_store&) = delete;

    [[nodiscard]] value snapshot() const;
    void replace(value data);
    // Keys may be dotted paths ("a.b" writes into nested map a).
    void apply_changes(const map_entries& changes);
    [[nodiscard]] value get_path(std::string_view dotted) const;

private:
    mutable std::mutex mutex_;
    value data_;
};

struct effect_handlers {
    std::function<void(const map_entries& changes)> mutate_entity;
    std::function<void(const std::string& event, const value& payload)> emit;
    std::function<void(const std::string& route, const value& params)> navigate;
    std::function<std::future<void>(const std::string& action, const value& data)> persist;
    std::function<void(const std::string& message, const std::string& severity)> notify;
    std::function<void(const std::string& entity_type, const value& props)> spawn;
    std::function<void(const value& entity_id)> despawn;
    std::function<std::future<value>(const std::string& service, const std::string& method, const value& params)> call_service;
    std::function<void(const std::string& slot, const value& pattern, const value& props, const value& priority)> render_ui;
};

using singleton_map = std::map<std::string, value>;
using local_map = std::map<std::string, value>;

struct eval_context {
    std::shared_ptr<entity_store> entity;
    value payload;
    std::string state;
    std::int64_t now = 0;
    value user;
    std::shared_ptr<const singleton_map> singletons;
    std::shared_ptr<const local_map> locals;
    std::shared_ptr<const effect_handlers> handlers;
};

// A closure shares the defining context's data; nothing in it points back at a mutable context.
struct closure {
    std::vector<std::string> params;
    bool positional = false;
    sexpr body;
    eval_context captured;
};

[[nodiscard]] std::int64_t wall_clock_ms();

eval_context create_minimal_context(value entity = make_map(), value payload = make_map(), std::string state = {});
eval_context create_effect_context(const eval_context& base, const effect_handlers& overlay);
eval_context create_child_context(const eval_context& parent, const local_map& new_locals);

[[nodiscard]] value resolve_binding(const binding_ref& binding, const eval_context& ctx);
[[nodiscard]] value resolve_binding(std::string_view binding, const eval_context& ctx);

}  // namespace orbital
