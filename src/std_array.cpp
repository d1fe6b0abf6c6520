#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <utility>

#include "module_support.hpp"
#include "orbital/operators.hpp"
#include "orbital/stdlib.hpp"

namespace orbital {
namespace {

using detail::arg_at;
using detail::number_at;
using detail::register_evaluated;

array_items items_at(std::span<const value> args, std::size_t index) {
    return to_array_view(arg_at(args, index));
}

std::size_t relative_index(double index, std::size_t len) {
    if (std::isnan(index)) {
        return 0;
    }
    const double size = static_cast<double>(len);
    const double resolved = index < 0.0 ? size + std::trunc(index) : std::trunc(index);
    return static_cast<std::size_t>(std::clamp(resolved, 0.0, size));
}

array_items slice_items(const array_items& items, double start, std::optional<double> end) {
    const std::size_t from = relative_index(start, items.size());
    const std::size_t to = end ? relative_index(*end, items.size()) : items.size();
    if (to <= from) {
        return {};
    }
    return array_items(items.begin() + static_cast<std::ptrdiff_t>(from), items.begin() + static_cast<std::ptrdiff_t>(to));
}

std::optional<std::size_t> index_of(const array_items& items, const value& needle) {
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (deep_equal(items[i], needle)) {
            return i;
        }
    }
    return std::nullopt;
}

// Numeric field of item (or item itself without a key); nullopt when not a number.
std::optional<double> numeric_field(const value& item, const std::string& key) {
    const value field = key.empty() ? item : map_get(item, key);
    if (!is_number(field)) {
        return std::nullopt;
    }
    return number_value(field);
}

int order_of(const value& lhs, const value& rhs) {
    return compare_comparables(to_comparable(lhs), to_comparable(rhs)).value_or(0);
}

std::size_t count_at(std::span<const value> args, std::size_t index) {
    const double n = number_at(args, index);
    if (!(n > 0.0)) {
        return 0;
    }
    return static_cast<std::size_t>(std::min(n, static_cast<double>(std::numeric_limits<std::uint32_t>::max())));
}

}  // namespace

void install_array_module(registrar& r) {
    r.register_function("array/len", [](std::span<const value> args) {
        const value v = arg_at(args, 0);
        if (is_string(v)) {
            return make_number(static_cast<double>(string_value(v).size()));
        }
        return make_number(is_array(v) ? static_cast<double>(array_value(v).size()) : 0.0);
    });

    r.register_function("array/empty?", [](std::span<const value> args) {
        const value v = arg_at(args, 0);
        return make_boolean(!is_array(v) || array_value(v).empty());
    });

    r.register_function("array/first", [](std::span<const value> args) {
        const array_items items = items_at(args, 0);
        return items.empty() ? make_undefined() : items.front();
    });

    r.register_function("array/last", [](std::span<const value> args) {
        const array_items items = items_at(args, 0);
        return items.empty() ? make_undefined() : items.back();
    });

    r.register_function("array/nth", [](std::span<const value> args) {
        const array_items items = items_at(args, 0);
        const double index = number_at(args, 1);
        if (!(index >= 0.0) || std::floor(index) != index || index >= static_cast<double>(items.size())) {
            return make_undefined();
        }
        return items[static_cast<std::size_t>(index)];
    });

    r.register_function("array/slice", [](std::span<const value> args) {
        std::optional<double> end;
        if (args.size() > 2 && !is_undefined(args[2])) {
            end = to_number(args[2]);
        }
        return make_array(slice_items(items_at(args, 0), number_at(args, 1), end));
    });

    r.register_function("array/concat", [](std::span<const value> args) {
        array_items out;
        for (const value& arg : args) {
            for (value& item : to_array_view(arg)) {
                out.push_back(std::move(item));
            }
        }
        return make_array(std::move(out));
    });

    r.register_function("array/append", [](std::span<const value> args) {
        array_items items = items_at(args, 0);
        items.push_back(arg_at(args, 1));
        return make_array(std::move(items));
    });

    r.register_function("array/prepend", [](std::span<const value> args) {
        array_items items = items_at(args, 0);
        items.insert(items.begin(), arg_at(args, 1));
        return make_array(std::move(items));
    });

    r.register_function("array/insert", [](std::span<const value> args) {
        array_items items = items_at(args, 0);
        const std::size_t at = relative_index(number_at(args, 1), items.size());
        items.insert(items.begin() + static_cast<std::ptrdiff_t>(at), arg_at(args, 2));
        return make_array(std::move(items));
    });

    r.register_function("array/remove", [](std::span<const value> args) {
        array_items items = items_at(args, 0);
        const std::size_t at = relative_index(number_at(args, 1), items.size());
        if (at < items.size()) {
            items.erase(items.begin() + static_cast<std::ptrdiff_t>(at));
        }
        return make_array(std::move(items));
    });

    // Removes the first deep-equal occurrence only.
    r.register_function("array/removeItem", [](std::span<const value> args) {
        array_items items = items_at(args, 0);
        if (const auto at = index_of(items, arg_at(args, 1))) {
            items.erase(items.begin() + static_cast<std::ptrdiff_t>(*at));
        }
        return make_array(std::move(items));
    });

    r.register_function("array/reverse", [](std::span<const value> args) {
        array_items items = items_at(args, 0);
        std::reverse(items.begin(), items.end());
        return make_array(std::move(items));
    });

    // Fisher-Yates over a copy.
    r.register_function("array/shuffle", [](std::span<const value> args) {
        thread_local std::mt19937_64 engine{std::random_device{}()};
        array_items items = items_at(args, 0);
        std::shuffle(items.begin(), items.end(), engine);
        return make_array(std::move(items));
    });

    r.register_function("array/sort", [](std::span<const value> args) {
        array_items items = items_at(args, 0);
        const std::string key = detail::string_at(args, 1);
        const bool descending = detail::string_at(args, 2, "asc") == "desc";
        std::stable_sort(items.begin(), items.end(), [&](const value& a, const value& b) {
            const int order = key.empty() ? order_of(a, b) : order_of(map_get(a, key), map_get(b, key));
            return descending ? order > 0 : order < 0;
        });
        return make_array(std::move(items));
    });

    r.register_function("array/unique", [](std::span<const value> args) {
        array_items out;
        for (const value& item : items_at(args, 0)) {
            if (!index_of(out, item)) {
                out.push_back(item);
            }
        }
        return make_array(std::move(out));
    });

    r.register_function("array/flatten", [](std::span<const value> args) {
        array_items out;
        for (const value& item : items_at(args, 0)) {
            if (is_array(item)) {
                const array_items& inner = array_value(item);
                out.insert(out.end(), inner.begin(), inner.end());
            } else {
                out.push_back(item);
            }
        }
        return make_array(std::move(out));
    });

    r.register_function("array/zip", [](std::span<const value> args) {
        const array_items lhs = items_at(args, 0);
        const array_items rhs = items_at(args, 1);
        array_items out;
        for (std::size_t i = 0; i < std::min(lhs.size(), rhs.size()); ++i) {
            out.push_back(make_array({lhs[i], rhs[i]}));
        }
        return make_array(std::move(out));
    });

    r.register_function("array/includes", [](std::span<const value> args) {
        return make_boolean(index_of(items_at(args, 0), arg_at(args, 1)).has_value());
    });

    r.register_function("array/indexOf", [](std::span<const value> args) {
        const auto at = index_of(items_at(args, 0), arg_at(args, 1));
        return make_number(at ? static_cast<double>(*at) : -1.0);
    });

    register_evaluated(r, "array/find", [](std::span<const value> args, const evaluator& ev) {
        const closure_ptr fn = detail::closure_at("array/find", args, 1);
        for (const value& item : items_at(args, 0)) {
            if (is_truthy(detail::call_closure(ev, *fn, {item}))) {
                return item;
            }
        }
        return make_undefined();
    });

    register_evaluated(r, "array/findIndex", [](std::span<const value> args, const evaluator& ev) {
        const closure_ptr fn = detail::closure_at("array/findIndex", args, 1);
        const array_items items = items_at(args, 0);
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (is_truthy(detail::call_closure(ev, *fn, {items[i]}))) {
                return make_number(static_cast<double>(i));
            }
        }
        return make_number(-1.0);
    });

    register_evaluated(r, "array/filter", [](std::span<const value> args, const evaluator& ev) {
        const closure_ptr fn = detail::closure_at("array/filter", args, 1);
        array_items out;
        for (const value& item : items_at(args, 0)) {
            if (is_truthy(detail::call_closure(ev, *fn, {item}))) {
                out.push_back(item);
            }
        }
        return make_array(std::move(out));
    });

    register_evaluated(r, "array/reject", [](std::span<const value> args, const evaluator& ev) {
        const closure_ptr fn = detail::closure_at("array/reject", args, 1);
        array_items out;
        for (const value& item : items_at(args, 0)) {
            if (!is_truthy(detail::call_closure(ev, *fn, {item}))) {
                out.push_back(item);
            }
        }
        return make_array(std::move(out));
    });

    register_evaluated(r, "array/map", [](std::span<const value> args, const evaluator& ev) {
        const closure_ptr fn = detail::closure_at("array/map", args, 1);
        array_items out;
        for (const value& item : items_at(args, 0)) {
            out.push_back(detail::call_closure(ev, *fn, {item}));
        }
        return make_array(std::move(out));
    });

    // (array/reduce items (fn [acc item] ...) init)
    register_evaluated(r, "array/reduce", [](std::span<const value> args, const evaluator& ev) {
        const closure_ptr fn = detail::closure_at("array/reduce", args, 1);
        value acc = arg_at(args, 2);
        for (const value& item : items_at(args, 0)) {
            acc = detail::call_closure(ev, *fn, {acc, item});
        }
        return acc;
    });

    register_evaluated(r, "array/every", [](std::span<const value> args, const evaluator& ev) {
        const closure_ptr fn = detail::closure_at("array/every", args, 1);
        for (const value& item : items_at(args, 0)) {
            if (!is_truthy(detail::call_closure(ev, *fn, {item}))) {
                return make_boolean(false);
            }
        }
        return make_boolean(true);
    });

    register_evaluated(r, "array/some", [](std::span<const value> args, const evaluator& ev) {
        const closure_ptr fn = detail::closure_at("array/some", args, 1);
        for (const value& item : items_at(args, 0)) {
            if (is_truthy(detail::call_closure(ev, *fn, {item}))) {
                return make_boolean(true);
            }
        }
        return make_boolean(false);
    });

    register_evaluated(r, "array/count", [](std::span<const value> args, const evaluator& ev) {
        const array_items items = items_at(args, 0);
        if (args.size() < 2) {
            return make_number(static_cast<double>(items.size()));
        }
        const closure_ptr fn = detail::closure_at("array/count", args, 1);
        const auto n = std::count_if(items.begin(), items.end(), [&](const value& item) {
            return is_truthy(detail::call_closure(ev, *fn, {item}));
        });
        return make_number(static_cast<double>(n));
    });

    // sum/avg/min/max read numbers only; an optional key selects a field of each item.
    r.register_function("array/sum", [](std::span<const value> args) {
        const std::string key = detail::string_at(args, 1);
        double total = 0.0;
        for (const value& item : items_at(args, 0)) {
            total += numeric_field(item, key).value_or(0.0);
        }
        return make_number(total);
    });

    r.register_function("array/avg", [](std::span<const value> args) {
        const array_items items = items_at(args, 0);
        if (items.empty()) {
            return make_number(0.0);
        }
        const std::string key = detail::string_at(args, 1);
        double total = 0.0;
        for (const value& item : items) {
            total += numeric_field(item, key).value_or(0.0);
        }
        return make_number(total / static_cast<double>(items.size()));
    });

    r.register_function("array/min", [](std::span<const value> args) {
        const array_items items = items_at(args, 0);
        if (items.empty()) {
            return make_number(0.0);
        }
        const std::string key = detail::string_at(args, 1);
        double out = std::numeric_limits<double>::infinity();
        for (const value& item : items) {
            out = std::min(out, numeric_field(item, key).value_or(std::numeric_limits<double>::infinity()));
        }
        return make_number(out);
    });

    r.register_function("array/max", [](std::span<const value> args) {
        const array_items items = items_at(args, 0);
        if (items.empty()) {
            return make_number(0.0);
        }
        const std::string key = detail::string_at(args, 1);
        double out = -std::numeric_limits<double>::infinity();
        for (const value& item : items) {
            out = std::max(out, numeric_field(item, key).value_or(-std::numeric_limits<double>::infinity()));
        }
        return make_number(out);
    });

    r.register_function("array/groupBy", [](std::span<const value> args) {
        const std::string key = detail::string_at(args, 1);
        std::map<std::string, array_items> groups;
        for (const value& item : items_at(args, 0)) {
            const value field = map_get(item, key);
            groups[is_nullish(field) ? std::string("undefined") : to_display_string(field)].push_back(item);
        }
        map_entries out;
        for (auto& [name, members] : groups) {
            out.emplace(name, make_array(std::move(members)));
        }
        return make_map(std::move(out));
    });

    register_evaluated(r, "array/partition", [](std::span<const value> args, const evaluator& ev) {
        const closure_ptr fn = detail::closure_at("array/partition", args, 1);
        array_items matches;
        array_items rest;
        for (const value& item : items_at(args, 0)) {
            (is_truthy(detail::call_closure(ev, *fn, {item})) ? matches : rest).push_back(item);
        }
        return make_array({make_array(std::move(matches)), make_array(std::move(rest))});
    });

    r.register_function("array/take", [](std::span<const value> args) {
        const array_items items = items_at(args, 0);
        const std::size_t n = std::min(count_at(args, 1), items.size());
        return make_array(array_items(items.begin(), items.begin() + static_cast<std::ptrdiff_t>(n)));
    });

    r.register_function("array/drop", [](std::span<const value> args) {
        const array_items items = items_at(args, 0);
        const std::size_t n = std::min(count_at(args, 1), items.size());
        return make_array(array_items(items.begin() + static_cast<std::ptrdiff_t>(n), items.end()));
    });

    r.register_function("array/takeLast", [](std::span<const value> args) {
        const array_items items = items_at(args, 0);
        const std::size_t n = std::min(count_at(args, 1), items.size());
        return make_array(array_items(items.end() - static_cast<std::ptrdiff_t>(n), items.end()));
    });

    r.register_function("array/dropLast", [](std::span<const value> args) {
        const array_items items = items_at(args, 0);
        const std::size_t n = std::min(count_at(args, 1), items.size());
        return make_array(array_items(items.begin(), items.end() - static_cast<std::ptrdiff_t>(n)));
    });
}

}  // namespace orbital
