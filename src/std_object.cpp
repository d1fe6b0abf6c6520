#include <functional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "module_support.hpp"
#include "orbital/stdlib.hpp"

namespace orbital {
namespace {

using detail::arg_at;
using detail::string_at;
using detail::register_evaluated;

const map_entries& entries_at(std::span<const value> args, std::size_t index) {
    static const map_entries empty;
    const value* v = index < args.size() ? &args[index] : nullptr;
    return v && is_map(*v) ? map_value(*v) : empty;
}

std::vector<std::string> path_at(std::span<const value> args, std::size_t index) {
    return split_path(string_at(args, index));
}

value deep_merge(const value& target, const value& source) {
    map_entries out = map_value(target);
    for (const auto& [key, incoming] : map_value(source)) {
        const auto existing = out.find(key);
        if (existing != out.end() && is_map(existing->second) && is_map(incoming)) {
            existing->second = deep_merge(existing->second, incoming);
        } else {
            out[key] = incoming;
        }
    }
    return make_map(std::move(out));
}

value join_path_segments(std::span<const value> args) {
    if (args.empty()) {
        throw arity_error("path", 1);
    }
    std::string out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out += '.';
        }
        out += string_at(args, i);
    }
    return make_string(out);
}

}  // namespace

void install_object_module(registrar& r) {
    r.register_function("object/keys", [](std::span<const value> args) {
        array_items out;
        for (const auto& [key, item] : entries_at(args, 0)) {
            out.push_back(make_string(key));
        }
        return make_array(std::move(out));
    });

    r.register_function("object/values", [](std::span<const value> args) {
        array_items out;
        for (const auto& [key, item] : entries_at(args, 0)) {
            out.push_back(item);
        }
        return make_array(std::move(out));
    });

    r.register_function("object/entries", [](std::span<const value> args) {
        array_items out;
        for (const auto& [key, item] : entries_at(args, 0)) {
            out.push_back(make_array({make_string(key), item}));
        }
        return make_array(std::move(out));
    });

    // Malformed pairs are skipped.
    r.register_function("object/fromEntries", [](std::span<const value> args) {
        map_entries out;
        for (const value& pair : to_array_view(arg_at(args, 0))) {
            if (!is_array(pair) || array_value(pair).empty()) {
                continue;
            }
            const array_items& kv = array_value(pair);
            out[to_display_string(kv[0])] = kv.size() > 1 ? kv[1] : make_undefined();
        }
        return make_map(std::move(out));
    });

    r.register_function("object/get", [](std::span<const value> args) {
        const value obj = arg_at(args, 0);
        const value fallback = arg_at(args, 2);
        const std::vector<std::string> path = path_at(args, 1);
        if (is_nullish(obj) || path.empty()) {
            return fallback;
        }
        const value found = get_in(obj, path);
        return is_undefined(found) ? fallback : found;
    });

    r.register_function("object/set", [](std::span<const value> args) {
        const value obj = is_map(arg_at(args, 0)) ? arg_at(args, 0) : make_map();
        const std::vector<std::string> path = path_at(args, 1);
        if (path.empty()) {
            return obj;
        }
        return assoc_in(obj, path, arg_at(args, 2));
    });

    r.register_function("object/has", [](std::span<const value> args) {
        const std::vector<std::string> path = path_at(args, 1);
        if (path.empty()) {
            return make_boolean(false);
        }
        value current = arg_at(args, 0);
        for (const std::string& part : path) {
            const value* next = map_find(current, part);
            if (!next) {
                return make_boolean(false);
            }
            current = *next;
        }
        return make_boolean(true);
    });

    // Shallow; later arguments win.
    r.register_function("object/merge", [](std::span<const value> args) {
        map_entries out;
        for (std::size_t i = 0; i < args.size(); ++i) {
            for (const auto& [key, item] : entries_at(args, i)) {
                out[key] = item;
            }
        }
        return make_map(std::move(out));
    });

    r.register_function("object/deepMerge", [](std::span<const value> args) {
        value out = make_map();
        for (const value& arg : args) {
            if (is_map(arg)) {
                out = deep_merge(out, arg);
            }
        }
        return out;
    });

    r.register_function("object/pick", [](std::span<const value> args) {
        const map_entries& source = entries_at(args, 0);
        map_entries out;
        for (const value& key : to_array_view(arg_at(args, 1))) {
            const auto it = source.find(to_display_string(key));
            if (it != source.end()) {
                out.insert(*it);
            }
        }
        return make_map(std::move(out));
    });

    r.register_function("object/omit", [](std::span<const value> args) {
        std::set<std::string> dropped;
        for (const value& key : to_array_view(arg_at(args, 1))) {
            dropped.insert(to_display_string(key));
        }
        map_entries out;
        for (const auto& [key, item] : entries_at(args, 0)) {
            if (dropped.count(key) == 0) {
                out.emplace(key, item);
            }
        }
        return make_map(std::move(out));
    });

    register_evaluated(r, "object/mapValues", [](std::span<const value> args, const evaluator& ev) {
        const closure_ptr fn = detail::closure_at("object/mapValues", args, 1);
        map_entries out;
        for (const auto& [key, item] : entries_at(args, 0)) {
            out.emplace(key, detail::call_closure(ev, *fn, {item}));
        }
        return make_map(std::move(out));
    });

    register_evaluated(r, "object/mapKeys", [](std::span<const value> args, const evaluator& ev) {
        const closure_ptr fn = detail::closure_at("object/mapKeys", args, 1);
        map_entries out;
        for (const auto& [key, item] : entries_at(args, 0)) {
            out[to_display_string(detail::call_closure(ev, *fn, {make_string(key)}))] = item;
        }
        return make_map(std::move(out));
    });

    // The lambda receives key and value.
    register_evaluated(r, "object/filter", [](std::span<const value> args, const evaluator& ev) {
        const closure_ptr fn = detail::closure_at("object/filter", args, 1);
        map_entries out;
        for (const auto& [key, item] : entries_at(args, 0)) {
            if (is_truthy(detail::call_closure(ev, *fn, {make_string(key), item}))) {
                out.emplace(key, item);
            }
        }
        return make_map(std::move(out));
    });

    r.register_function("object/empty?", [](std::span<const value> args) {
        return make_boolean(entries_at(args, 0).empty());
    });

    r.register_function("object/equals", [](std::span<const value> args) {
        return make_boolean(deep_equal(arg_at(args, 0), arg_at(args, 1)));
    });

    // Values are immutable, so a clone shares structure with its source.
    r.register_function("object/clone", [](std::span<const value> args) {
        return make_map(entries_at(args, 0));
    });
    r.register_function("object/deepClone", [](std::span<const value> args) {
        return make_map(entries_at(args, 0));
    });

    r.register_function("object/path", join_path_segments);
    r.register_function("path", join_path_segments);
}

}  // namespace orbital
