#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "orbital/context.hpp"
#include "orbital/expression.hpp"

namespace orbital {

class evaluator;

enum class arithmetic_op { add, subtract, multiply, divide, modulo, abs, min, max, floor, ceil, round, clamp };

enum class comparison_op { equal, not_equal, less, greater, less_equal, greater_equal, matches };

enum class logic_op { op_and, op_or, op_not, op_if };

enum class control_op { let_bind, sequence, when, lambda };

enum class collection_op { map, filter, find, count, sum, first, last, nth, concat, includes, empty };

enum class effect_op {
    set,
    set_dynamic,
    increment,
    decrement,
    emit,
    navigate,
    persist,
    notify,
    spawn,
    despawn,
    call_service,
    render_ui
};

using core_operator = std::variant<arithmetic_op, comparison_op, logic_op, control_op, collection_op, effect_op>;

[[nodiscard]] std::optional<core_operator> lookup_core_operator(std::string_view name);
[[nodiscard]] std::vector<std::string> core_operator_names();

value apply_arithmetic(arithmetic_op op, std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx);
value apply_comparison(comparison_op op, std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx);
value apply_logic(logic_op op, std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx);
value apply_control(control_op op, std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx);
value apply_collection(collection_op op, std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx);
value apply_effect(effect_op op, std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx);

// Three-way ordering of two comparables (see to_comparable): two strings compare
// lexicographically, anything else numerically. nullopt when a side is NaN.
[[nodiscard]] std::optional<int> compare_comparables(const value& lhs, const value& rhs);

// ECMAScript-flavoured regex search; false for an invalid pattern.
[[nodiscard]] bool regex_search_text(const std::string& subject, const std::string& pattern, bool ignore_case = false);

}  // namespace orbital
