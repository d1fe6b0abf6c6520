#include <algorithm>
#include <future>
#include <string>
#include <utility>

#include "module_support.hpp"
#include "orbital/async_runtime.hpp"
#include "orbital/operators.hpp"

namespace orbital {
namespace {

constexpr std::string_view k_entity_prefix = "@entity.";

void log_missing_handler(const evaluator& ev, const std::string& op) {
    ev.runtime().log(log_level::debug, "effect", op + ": no handler installed, skipped");
}

const effect_handlers& handlers_of(const eval_context& ctx) {
    static const effect_handlers none{};
    return ctx.handlers ? *ctx.handlers : none;
}

// "@entity.a.b" -> "a.b"; empty when the target is not an entity binding.
std::string entity_field_path(const sexpr& target) {
    if (!is_string(target)) {
        return {};
    }
    const std::string& text = string_value(target);
    if (text.size() <= k_entity_prefix.size() || text.compare(0, k_entity_prefix.size(), k_entity_prefix) != 0) {
        return {};
    }
    return text.substr(k_entity_prefix.size());
}

std::string describe_target(const sexpr& target) {
    return is_string(target) ? string_value(target) : std::string(type_name(type_of(target)));
}

value combine_for_set(const std::string& operation, const value& current, const value& operand) {
    if (operation == "increment") {
        return make_number(to_number(current) + to_number(operand));
    }
    if (operation == "decrement") {
        return make_number(to_number(current) - to_number(operand));
    }
    if (operation == "multiply") {
        return make_number(to_number(current) * to_number(operand));
    }
    if (operation == "append") {
        return is_array(current) ? array_with_appended(current, operand) : make_array({operand});
    }
    if (operation == "remove") {
        if (!is_array(current)) {
            return make_array();
        }
        array_items kept;
        for (const value& item : array_value(current)) {
            if (!deep_equal(item, operand)) {
                kept.push_back(item);
            }
        }
        return make_array(std::move(kept));
    }
    return operand;
}

void adjust_entity_number(effect_op op, std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
    const std::string name = op == effect_op::increment ? "increment" : "decrement";
    const sexpr& target = detail::require_arg(name, args, 0);
    const double amount = args.size() > 1 ? to_number(ev.evaluate(args[1], ctx)) : 1.0;

    const effect_handlers& handlers = handlers_of(ctx);
    if (!handlers.mutate_entity) {
        log_missing_handler(ev, name);
        return;
    }

    const std::string field = entity_field_path(target);
    if (field.empty()) {
        ev.runtime().log(log_level::warn, "effect", name + " only supports @entity bindings, got: " + describe_target(target));
        return;
    }

    const double current = to_number(resolve_binding(string_value(target), ctx));
    const double next = op == effect_op::increment ? current + amount : current - amount;
    handlers.mutate_entity(map_entries{{field, make_number(next)}});
}

}  // namespace

value apply_effect(effect_op op, std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
    const effect_handlers& handlers = handlers_of(ctx);

    switch (op) {
        case effect_op::set: {
            const sexpr& target = detail::require_arg("set", args, 0);
            const value operand = detail::eval_required("set", ev, ctx, args, 1);
            const std::string operation = args.size() > 2 ? to_display_string(ev.evaluate(args[2], ctx)) : std::string{};

            if (!handlers.mutate_entity) {
                log_missing_handler(ev, "set");
                return make_undefined();
            }

            const std::string field = entity_field_path(target);
            if (field.empty()) {
                ev.runtime().log(log_level::warn, "effect", "set only supports @entity bindings, got: " + describe_target(target));
                return make_undefined();
            }

            value next = operand;
            if (!operation.empty()) {
                next = combine_for_set(operation, resolve_binding(string_value(target), ctx), operand);
            }
            handlers.mutate_entity(map_entries{{field, std::move(next)}});
            return make_undefined();
        }
        case effect_op::set_dynamic: {
            const value path = detail::eval_required("set-dynamic", ev, ctx, args, 0);
            const value operand = detail::eval_required("set-dynamic", ev, ctx, args, 1);

            if (!handlers.mutate_entity) {
                log_missing_handler(ev, "set-dynamic");
                return make_undefined();
            }
            if (!is_string(path) || string_value(path).empty()) {
                ev.runtime().log(log_level::warn, "effect", "set-dynamic requires a path string, got: " + to_display_string(path));
                return make_undefined();
            }
            handlers.mutate_entity(map_entries{{string_value(path), operand}});
            return make_undefined();
        }
        case effect_op::increment:
        case effect_op::decrement:
            adjust_entity_number(op, args, ev, ctx);
            return make_undefined();
        case effect_op::emit: {
            const std::string event = to_display_string(detail::eval_required("emit", ev, ctx, args, 0));
            const value payload = detail::eval_optional(ev, ctx, args, 1);
            if (!handlers.emit) {
                log_missing_handler(ev, "emit");
                return make_undefined();
            }
            handlers.emit(event, payload);
            return make_undefined();
        }
        case effect_op::navigate: {
            const std::string route = to_display_string(detail::eval_required("navigate", ev, ctx, args, 0));
            const value params = detail::eval_optional(ev, ctx, args, 1);
            if (!handlers.navigate) {
                log_missing_handler(ev, "navigate");
                return make_undefined();
            }
            handlers.navigate(route, params);
            return make_undefined();
        }
        case effect_op::persist: {
            const std::string action = to_display_string(detail::eval_required("persist", ev, ctx, args, 0));
            if (action != "create" && action != "update" && action != "delete") {
                throw eval_error("persist: action must be create, update or delete, got '" + action + "'");
            }
            const value data = args.size() > 1 ? ev.evaluate(args[1], ctx) : ctx.payload;
            if (!handlers.persist) {
                log_missing_handler(ev, "persist");
                return make_undefined();
            }
            std::future<void> pending = handlers.persist(action, data);
            if (pending.valid()) {
                pending.get();
            }
            return make_undefined();
        }
        case effect_op::notify: {
            const value message = detail::eval_required("notify", ev, ctx, args, 0);
            std::string text = to_display_string(message);
            std::string severity = "info";
            if (is_map(message)) {
                const value inner_text = map_get(message, "message");
                const value inner_type = map_get(message, "type");
                text = is_nullish(inner_text) ? std::string{} : to_display_string(inner_text);
                if (!is_nullish(inner_type)) {
                    severity = to_display_string(inner_type);
                }
            }
            if (args.size() > 1) {
                const value explicit_severity = ev.evaluate(args[1], ctx);
                if (!is_nullish(explicit_severity)) {
                    severity = to_display_string(explicit_severity);
                }
            }
            if (!handlers.notify) {
                log_missing_handler(ev, "notify");
                return make_undefined();
            }
            handlers.notify(text, severity);
            return make_undefined();
        }
        case effect_op::spawn: {
            const std::string entity_type = to_display_string(detail::eval_required("spawn", ev, ctx, args, 0));
            const value props = detail::eval_optional(ev, ctx, args, 1);
            if (!handlers.spawn) {
                log_missing_handler(ev, "spawn");
                return make_undefined();
            }
            handlers.spawn(entity_type, props);
            return make_undefined();
        }
        case effect_op::despawn: {
            const value entity_id = detail::eval_optional(ev, ctx, args, 0);
            if (!handlers.despawn) {
                log_missing_handler(ev, "despawn");
                return make_undefined();
            }
            handlers.despawn(entity_id);
            return make_undefined();
        }
        case effect_op::call_service: {
            const std::string service = to_display_string(detail::eval_required("call-service", ev, ctx, args, 0));
            const std::string method = to_display_string(detail::eval_required("call-service", ev, ctx, args, 1));
            const value params = detail::eval_optional(ev, ctx, args, 2);
            if (!handlers.call_service) {
                log_missing_handler(ev, "call-service");
                return make_undefined();
            }
            std::future<value> pending = handlers.call_service(service, method, params);
            if (!pending.valid()) {
                return make_undefined();
            }
            return pending.get();
        }
        case effect_op::render_ui: {
            const std::string slot = to_display_string(detail::eval_required("render-ui", ev, ctx, args, 0));
            const value pattern = detail::eval_required("render-ui", ev, ctx, args, 1);
            const value props = detail::eval_optional(ev, ctx, args, 2);
            const value priority = detail::eval_optional(ev, ctx, args, 3);
            if (!handlers.render_ui) {
                log_missing_handler(ev, "render-ui");
                return make_undefined();
            }
            if (is_nullish(pattern)) {
                handlers.render_ui(slot, make_map({{"type", make_string("clear")}}), make_undefined(), priority);
                return make_undefined();
            }
            handlers.render_ui(slot, pattern, props, priority);
            return make_undefined();
        }
    }
    throw eval_error("unhandled effect operator");
}

}  // namespace orbital
