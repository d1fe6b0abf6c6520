#pragma once

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "orbital/context.hpp"
#include "orbital/expression.hpp"

namespace orbital {

class evaluator;
class async_runtime;

// Receives unevaluated arguments; operators decide what to evaluate and when.
using operator_fn = std::function<value(std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx)>;

class operator_registry {
public:
    void register_operator(std::string name, operator_fn fn);
    const operator_fn* find(std::string_view name) const;
    bool contains(std::string_view name) const;
    std::vector<std::string> names() const;
    std::size_t size() const noexcept;

private:
    std::unordered_map<std::string, operator_fn> operators_;
};

class registrar {
public:
    explicit registrar(operator_registry& modules);

    void register_builtin(const std::string& full_name, operator_fn fn);
    // Arguments are evaluated left to right before fn runs.
    void register_function(const std::string& full_name, std::function<value(std::span<const value> args)> fn);

private:
    void ensure_registerable_name(const std::string& full_name, const char* where) const;

    operator_registry* modules_;
};

using extension_register_hook_fn = void (*)(registrar* r, void* user);

struct runtime_config {
    extension_register_hook_fn extension_register_hook = nullptr;
    void* extension_register_user = nullptr;
    bool install_std_modules = true;
    // nullptr selects default_async_runtime().
    async_runtime* runtime = nullptr;
};

}  // namespace orbital
