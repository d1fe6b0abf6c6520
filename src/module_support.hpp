#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "orbital/context.hpp"
#include "orbital/error.hpp"
#include "orbital/eval.hpp"
#include "orbital/value.hpp"

namespace orbital::detail {

inline const sexpr& require_arg(std::string_view op, std::span<const sexpr> args, std::size_t index) {
    if (index >= args.size()) {
        throw arity_error(std::string(op), index + 1);
    }
    return args[index];
}

inline value eval_required(std::string_view op,
                           const evaluator& ev,
                           const eval_context& ctx,
                           std::span<const sexpr> args,
                           std::size_t index) {
    return ev.evaluate(require_arg(op, args, index), ctx);
}

inline value eval_optional(const evaluator& ev, const eval_context& ctx, std::span<const sexpr> args, std::size_t index) {
    if (index >= args.size()) {
        return make_undefined();
    }
    return ev.evaluate(args[index], ctx);
}

inline array_items eval_all(const evaluator& ev, const eval_context& ctx, std::span<const sexpr> args) {
    array_items out;
    out.reserve(args.size());
    for (const sexpr& arg : args) {
        out.push_back(ev.evaluate(arg, ctx));
    }
    return out;
}

inline value arg_at(std::span<const value> args, std::size_t index) {
    return index < args.size() ? args[index] : make_undefined();
}

inline double number_at(std::span<const value> args, std::size_t index, double fallback = 0.0) {
    if (index >= args.size() || is_undefined(args[index])) {
        return fallback;
    }
    return to_number(args[index]);
}

// Nullish becomes the fallback; everything else its display string.
inline std::string string_at(std::span<const value> args, std::size_t index, std::string fallback = {}) {
    if (index >= args.size() || is_nullish(args[index])) {
        return fallback;
    }
    return to_display_string(args[index]);
}

inline void require_count(std::string_view op, std::span<const value> args, std::size_t count) {
    if (args.size() < count) {
        throw arity_error(std::string(op), args.size() + 1);
    }
}

inline const closure& require_closure(std::string_view op, const value& fn) {
    if (!is_closure(fn)) {
        throw type_error(std::string(op) + ": expected lambda, got " + std::string(type_name(type_of(fn))));
    }
    return *closure_value(fn);
}

inline closure_ptr closure_at(std::string_view op, std::span<const value> args, std::size_t index) {
    if (index >= args.size()) {
        throw arity_error(std::string(op), index + 1);
    }
    (void)require_closure(op, args[index]);
    return closure_value(args[index]);
}

inline value call_closure(const evaluator& ev, const closure& fn, std::initializer_list<value> args) {
    return ev.invoke(fn, std::span<const value>(args.begin(), args.size()));
}

// ISO 8601 date or date-time in milliseconds since the epoch; NaN when malformed.
double parse_iso_time(const std::string& text);

// Like registrar::register_function, but fn may call back into closures through ev.
using evaluated_fn = std::function<value(std::span<const value> args, const evaluator& ev)>;

inline void register_evaluated(registrar& r, const std::string& name, evaluated_fn fn) {
    r.register_builtin(name, [fn = std::move(fn)](std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
        const array_items evaluated = eval_all(ev, ctx, args);
        return fn(evaluated, ev);
    });
}

}  // namespace orbital::detail
