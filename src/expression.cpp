#include "orbital/expression.hpp"

#include <algorithm>
#include <utility>

namespace orbital {
namespace {

void walk_impl(const sexpr& node, const sexpr* parent, std::size_t index, const walk_visitor& visit) {
    visit(node, parent, index);
    if (!is_array(node)) {
        return;
    }
    const array_items& items = array_value(node);
    for (std::size_t i = 0; i < items.size(); ++i) {
        walk_impl(items[i], &node, i, visit);
    }
}

}  // namespace

bool is_core_binding_root(std::string_view root) noexcept {
    return std::find(std::begin(k_core_binding_roots), std::end(k_core_binding_roots), root) != std::end(k_core_binding_roots);
}

bool is_call(const sexpr& expr) {
    if (!is_array(expr)) {
        return false;
    }
    const array_items& items = array_value(expr);
    return !items.empty() && is_string(items.front());
}

std::optional<std::string> operator_of(const sexpr& expr) {
    if (!is_call(expr)) {
        return std::nullopt;
    }
    return string_value(array_value(expr).front());
}

std::span<const sexpr> args_of(const sexpr& expr) {
    if (!is_call(expr)) {
        return {};
    }
    const array_items& items = array_value(expr);
    return std::span<const sexpr>(items).subspan(1);
}

sexpr make_call(std::string op, std::initializer_list<sexpr> args) {
    return make_call(std::move(op), std::vector<sexpr>(args));
}

sexpr make_call(std::string op, std::vector<sexpr> args) {
    array_items items;
    items.reserve(args.size() + 1);
    items.push_back(make_string(std::move(op)));
    for (sexpr& arg : args) {
        items.push_back(std::move(arg));
    }
    return make_array(std::move(items));
}

void walk(const sexpr& expr, const walk_visitor& visit) {
    walk_impl(expr, nullptr, 0, visit);
}

std::vector<std::string> collect_bindings(const sexpr& expr) {
    std::vector<std::string> out;
    walk(expr, [&out](const sexpr& node, const sexpr*, std::size_t) {
        if (is_binding(node)) {
            out.push_back(string_value(node));
        }
    });
    return out;
}

bool is_binding(const sexpr& expr) {
    return is_string(expr) && !string_value(expr).empty() && string_value(expr).front() == '@';
}

std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const std::size_t dot = path.find('.', start);
        if (dot == std::string_view::npos) {
            parts.emplace_back(path.substr(start));
            break;
        }
        parts.emplace_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

std::optional<binding_ref> parse_binding(std::string_view text) {
    if (text.size() < 2 || text.front() != '@') {
        return std::nullopt;
    }

    std::vector<std::string> parts = split_path(text.substr(1));
    if (parts.front().empty()) {
        return std::nullopt;
    }

    binding_ref ref;
    ref.original = std::string(text);
    ref.root = std::move(parts.front());
    ref.path.assign(std::make_move_iterator(parts.begin() + 1), std::make_move_iterator(parts.end()));
    ref.kind = is_core_binding_root(ref.root) ? binding_kind::core : binding_kind::entity;
    return ref;
}

bool is_valid_binding(std::string_view text) {
    const std::optional<binding_ref> ref = parse_binding(text);
    if (!ref) {
        return false;
    }
    if (ref->kind == binding_kind::entity) {
        return !ref->path.empty();
    }
    if (ref->root == "state" || ref->root == "now") {
        return ref->path.empty();
    }
    return true;
}

}  // namespace orbital
