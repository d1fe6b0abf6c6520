#include "orbital/eval.hpp"

#include <type_traits>
#include <utility>
#include <variant>

#include "orbital/error.hpp"
#include "orbital/operators.hpp"
#include "orbital/stdlib.hpp"

namespace orbital {

evaluator::evaluator(const runtime_config& config) : runtime_(config.runtime ? config.runtime : &default_async_runtime()) {
    registrar r(modules_);
    if (config.install_std_modules) {
        install_std_modules(r);
    }
    if (config.extension_register_hook) {
        config.extension_register_hook(&r, config.extension_register_user);
    }
}

evaluator::~evaluator() {
    runtime_->forget_owner(this);
}

value evaluator::evaluate(const sexpr& expr, const eval_context& ctx) const {
    if (!is_call(expr)) {
        if (is_binding(expr)) {
            return resolve_binding(string_value(expr), ctx);
        }
        return expr;
    }

    const array_items& items = array_value(expr);
    const std::string& op = string_value(items.front());
    const std::span<const sexpr> args(items.data() + 1, items.size() - 1);

    if (const std::optional<core_operator> core = lookup_core_operator(op)) {
        return std::visit(
            [&](auto family) -> value {
                using family_t = std::decay_t<decltype(family)>;
                if constexpr (std::is_same_v<family_t, arithmetic_op>) {
                    return apply_arithmetic(family, args, *this, ctx);
                } else if constexpr (std::is_same_v<family_t, comparison_op>) {
                    return apply_comparison(family, args, *this, ctx);
                } else if constexpr (std::is_same_v<family_t, logic_op>) {
                    return apply_logic(family, args, *this, ctx);
                } else if constexpr (std::is_same_v<family_t, control_op>) {
                    return apply_control(family, args, *this, ctx);
                } else if constexpr (std::is_same_v<family_t, collection_op>) {
                    return apply_collection(family, args, *this, ctx);
                } else {
                    return apply_effect(family, args, *this, ctx);
                }
            },
            *core);
    }

    if (const operator_fn* fn = modules_.find(op)) {
        return (*fn)(args, *this, ctx);
    }

    throw unknown_operator_error(op);
}

bool evaluator::evaluate_guard(const sexpr& guard, const eval_context& ctx) const {
    return is_truthy(evaluate(guard, ctx));
}

void evaluator::execute_effects(std::span<const sexpr> effects, const eval_context& ctx) const {
    for (const sexpr& effect : effects) {
        (void)evaluate(effect, ctx);
    }
}

value evaluator::invoke(const closure& fn, std::span<const value> args) const {
    local_map locals;
    if (!fn.positional) {
        if (!fn.params.empty()) {
            locals[fn.params.front()] = args.empty() ? make_undefined() : args.front();
        }
    } else {
        array_items bound;
        if (args.size() == 1) {
            bound = is_array(args.front()) ? array_value(args.front()) : array_items{args.front()};
        } else {
            bound.assign(args.begin(), args.end());
        }
        for (std::size_t i = 0; i < fn.params.size(); ++i) {
            locals[fn.params[i]] = i < bound.size() ? bound[i] : make_undefined();
        }
    }
    return evaluate(fn.body, create_child_context(fn.captured, locals));
}

value evaluator::invoke(const value& fn, std::span<const value> args) const {
    if (!is_closure(fn)) {
        throw type_error("invoke: expected closure, got " + std::string(type_name(type_of(fn))));
    }
    return invoke(*closure_value(fn), args);
}

const operator_registry& evaluator::modules() const noexcept {
    return modules_;
}

async_runtime& evaluator::runtime() const noexcept {
    return *runtime_;
}

evaluator& default_evaluator() {
    static evaluator ev;
    return ev;
}

value evaluate(const sexpr& expr, const eval_context& ctx) {
    return default_evaluator().evaluate(expr, ctx);
}

bool evaluate_guard(const sexpr& guard, const eval_context& ctx) {
    return default_evaluator().evaluate_guard(guard, ctx);
}

void execute_effects(std::span<const sexpr> effects, const eval_context& ctx) {
    default_evaluator().execute_effects(effects, ctx);
}

}  // namespace orbital
