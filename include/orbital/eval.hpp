#pragma once

#include <span>

#include "orbital/async_runtime.hpp"
#include "orbital/context.hpp"
#include "orbital/expression.hpp"
#include "orbital/extensions.hpp"

namespace orbital {

class evaluator {
public:
    explicit evaluator(const runtime_config& config = {});
    // Cancels this evaluator's pending debounce timers and waits for its async jobs.
    ~evaluator();

    evaluator(const evaluator&) = delete;
    evaluator& operator=(const evaluator&) = delete;

    value evaluate(const sexpr& expr, const eval_context& ctx) const;
    // Truthiness of the result. Errors propagate; policy belongs to the caller.
    bool evaluate_guard(const sexpr& guard, const eval_context& ctx) const;
    void execute_effects(std::span<const sexpr> effects, const eval_context& ctx) const;

    value invoke(const closure& fn, std::span<const value> args) const;
    // fn must hold a closure.
    value invoke(const value& fn, std::span<const value> args) const;

    const operator_registry& modules() const noexcept;
    async_runtime& runtime() const noexcept;

private:
    operator_registry modules_;
    async_runtime* runtime_;
};

evaluator& default_evaluator();

value evaluate(const sexpr& expr, const eval_context& ctx);
bool evaluate_guard(const sexpr& guard, const eval_context& ctx);
void execute_effects(std::span<const sexpr> effects, const eval_context& ctx);

}  // namespace orbital
