#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "orbital/value.hpp"

namespace orbital {

// Expression trees are plain JSON-shaped values.
using sexpr = value;

enum class binding_kind {
    core,
    entity
};

struct binding_ref {
    binding_kind kind = binding_kind::core;
    std::string root;
    std::vector<std::string> path;
    std::string original;
};

inline constexpr std::string_view k_core_binding_roots[] = {"entity", "payload", "state", "now", "config", "computed", "trait"};

[[nodiscard]] bool is_core_binding_root(std::string_view root) noexcept;

[[nodiscard]] bool is_call(const sexpr& expr);
[[nodiscard]] std::optional<std::string> operator_of(const sexpr& expr);
// Empty for non-calls. The span refers into expr and lives as long as it does.
[[nodiscard]] std::span<const sexpr> args_of(const sexpr& expr);

sexpr make_call(std::string op, std::initializer_list<sexpr> args = {});
sexpr make_call(std::string op, std::vector<sexpr> args);

// Pre-order. The visitor sees (node, parent or nullptr, index within parent).
using walk_visitor = std::function<void(const sexpr& node, const sexpr* parent, std::size_t index)>;
void walk(const sexpr& expr, const walk_visitor& visit);

[[nodiscard]] std::vector<std::string> collect_bindings(const sexpr& expr);

[[nodiscard]] bool is_binding(const sexpr& expr);
[[nodiscard]] std::optional<binding_ref> parse_binding(std::string_view text);
[[nodiscard]] bool is_valid_binding(std::string_view text);

[[nodiscard]] std::vector<std::string> split_path(std::string_view path);

}  // namespace orbital
