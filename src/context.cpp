#include "orbital/context.hpp"

#include <chrono>
#include <utility>

namespace orbital {

entity_store::entity_store() : data_(make_map()) {}

entity_store::entity_store(value initial) : data_(is_map(initial) ? std::move(initial) : make_map()) {}

value entity_store::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

void entity_store::replace(value data) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_ = is_map(data) ? std::move(data) : make_map();
}

void entity_store::apply_changes(const map_entries& changes) {
    std::lock_guard<std::mutex> lock(mutex_);
    value next = data_;
    for (const auto& [key, item] : changes) {
        const std::vector<std::string> path = split_path(key);
        next = assoc_in(next, path, item);
    }
    data_ = std::move(next);
}

value entity_store::get_path(std::string_view dotted) const {
    const std::vector<std::string> path = split_path(dotted);
    return get_in(snapshot(), path);
}

std::int64_t wall_clock_ms() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

eval_context create_minimal_context(value entity, value payload, std::string state) {
    eval_context ctx;
    ctx.entity = std::make_shared<entity_store>(std::move(entity));
    ctx.payload = std::move(payload);
    ctx.state = std::move(state);
    ctx.now = wall_clock_ms();
    ctx.singletons = std::make_shared<const singleton_map>();
    ctx.locals = std::make_shared<const local_map>();
    return ctx;
}

eval_context create_effect_context(const eval_context& base, const effect_handlers& overlay) {
    effect_handlers merged = base.handlers ? *base.handlers : effect_handlers{};
    if (overlay.mutate_entity) {
        merged.mutate_entity = overlay.mutate_entity;
    }
    if (overlay.emit) {
        merged.emit = overlay.emit;
    }
    if (overlay.navigate) {
        merged.navigate = overlay.navigate;
    }
    if (overlay.persist) {
        merged.persist = overlay.persist;
    }
    if (overlay.notify) {
        merged.notify = overlay.notify;
    }
    if (overlay.spawn) {
        merged.spawn = overlay.spawn;
    }
    if (overlay.despawn) {
        merged.despawn = overlay.despawn;
    }
    if (overlay.call_service) {
        merged.call_service = overlay.call_service;
    }
    if (overlay.render_ui) {
        merged.render_ui = overlay.render_ui;
    }

    eval_context ctx = base;
    ctx.handlers = std::make_shared<const effect_handlers>(std::move(merged));
    return ctx;
}

eval_context create_child_context(const eval_context& parent, const local_map& new_locals) {
    local_map merged = parent.locals ? *parent.locals : local_map{};
    for (const auto& [name, item] : new_locals) {
        merged[name] = item;
    }
    eval_context ctx = parent;
    ctx.locals = std::make_shared<const local_map>(std::move(merged));
    return ctx;
}

value resolve_binding(const binding_ref& binding, const eval_context& ctx) {
    value current;

    const value* local = nullptr;
    if (ctx.locals) {
        const auto it = ctx.locals->find(binding.root);
        if (it != ctx.locals->end()) {
            local = &it->second;
        }
    }

    if (local) {
        current = *local;
    } else if (binding.root == "entity") {
        current = ctx.entity ? ctx.entity->snapshot() : make_undefined();
    } else if (binding.root == "payload") {
        current = ctx.payload;
    } else if (binding.root == "state") {
        return make_string(ctx.state);
    } else if (binding.root == "now") {
        return make_number(static_cast<double>(ctx.now));
    } else if (binding.root == "user") {
        current = ctx.user;
    } else if (ctx.singletons) {
        const auto it = ctx.singletons->find(binding.root);
        current = it == ctx.singletons->end() ? make_undefined() : it->second;
    }

    return get_in(current, binding.path);
}

value resolve_binding(std::string_view binding, const eval_context& ctx) {
    const std::optional<binding_ref> ref = parse_binding(binding);
    if (!ref) {
        return make_undefined();
    }
    return resolve_binding(*ref, ctx);
}

}  // namespace orbital
