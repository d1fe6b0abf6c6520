#include "orbital/extensions.hpp"

#include <algorithm>
#include <utility>

#include "orbital/error.hpp"
#include "orbital/eval.hpp"
#include "orbital/operators.hpp"

namespace orbital {

void operator_registry::register_operator(std::string name, operator_fn fn) {
    operators_[std::move(name)] = std::move(fn);
}

const operator_fn* operator_registry::find(std::string_view name) const {
    const auto it = operators_.find(std::string(name));
    if (it == operators_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool operator_registry::contains(std::string_view name) const {
    return find(name) != nullptr;
}

std::vector<std::string> operator_registry::names() const {
    std::vector<std::string> out;
    out.reserve(operators_.size());
    for (const auto& [name, fn] : operators_) {
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::size_t operator_registry::size() const noexcept {
    return operators_.size();
}

registrar::registrar(operator_registry& modules) : modules_(&modules) {}

void registrar::register_builtin(const std::string& full_name, operator_fn fn) {
    ensure_registerable_name(full_name, "registrar.register_builtin");
    if (!fn) {
        throw orbital_error("registrar.register_builtin: empty operator function for " + full_name);
    }
    modules_->register_operator(full_name, std::move(fn));
}

void registrar::register_function(const std::string& full_name, std::function<value(std::span<const value> args)> fn) {
    ensure_registerable_name(full_name, "registrar.register_function");
    if (!fn) {
        throw orbital_error("registrar.register_function: empty function for " + full_name);
    }
    modules_->register_operator(full_name,
                                [fn = std::move(fn)](std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
                                    std::vector<value> evaluated;
                                    evaluated.reserve(args.size());
                                    for (const sexpr& arg : args) {
                                        evaluated.push_back(ev.evaluate(arg, ctx));
                                    }
                                    return fn(evaluated);
                                });
}

void registrar::ensure_registerable_name(const std::string& full_name, const char* where) const {
    if (full_name.empty()) {
        throw orbital_error(std::string(where) + ": name must not be empty");
    }
    if (full_name.front() == '@') {
        throw orbital_error(std::string(where) + ": name must not look like a binding: " + full_name);
    }
    if (lookup_core_operator(full_name)) {
        throw orbital_error(std::string(where) + ": cannot shadow core operator: " + full_name);
    }
    if (modules_->contains(full_name)) {
        throw orbital_error(std::string(where) + ": operator already defined: " + full_name);
    }
}

}  // namespace orbital
