#include "orbital/value.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>
#include <utility>

#include "orbital/error.hpp"

namespace orbital {
namespace {

constexpr double k_nan = std::numeric_limits<double>::quiet_NaN();
constexpr double k_inf = std::numeric_limits<double>::infinity();

bool is_js_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string_view trim_js_space(std::string_view text) {
    std::size_t begin = 0;
    while (begin < text.size() && is_js_space(text[begin])) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin && is_js_space(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

[[noreturn]] void throw_type_mismatch(const value& v, std::string_view expected) {
    throw type_error("expected " + std::string(expected) + ", got " + std::string(type_name(type_of(v))));
}

std::string chars_to_string(double n, std::chars_format fmt) {
    std::array<char, 128> buffer{};
    const auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), n, fmt);
    if (result.ec != std::errc{}) {
        return "NaN";
    }
    return std::string(buffer.data(), result.ptr);
}

// "1e-07" -> "1e-7", "1e+21" stays.
std::string tidy_exponent(std::string text) {
    const std::size_t e = text.find('e');
    if (e == std::string::npos || e + 2 >= text.size()) {
        return text;
    }
    std::size_t digits = e + 2;
    while (digits + 1 < text.size() && text[digits] == '0') {
        text.erase(digits, 1);
    }
    return text;
}

}  // namespace

value make_undefined() {
    return value{};
}

value make_null() {
    return value(value::storage{null_tag{}});
}

value make_boolean(bool v) {
    return value(value::storage{v});
}

value make_number(double v) {
    return value(value::storage{v});
}

value make_string(std::string text) {
    return value(value::storage{std::move(text)});
}

value make_array(array_items items) {
    return value(value::storage{std::make_shared<const array_items>(std::move(items))});
}

value make_map(map_entries entries) {
    return value(value::storage{std::make_shared<const map_entries>(std::move(entries))});
}

value make_closure(closure_ptr fn) {
    if (!fn) {
        throw type_error("make_closure: null closure");
    }
    return value(value::storage{std::move(fn)});
}

value_type type_of(const value& v) noexcept {
    switch (v.data().index()) {
        case 0:
            return value_type::undefined;
        case 1:
            return value_type::null;
        case 2:
            return value_type::boolean;
        case 3:
            return value_type::number;
        case 4:
            return value_type::string;
        case 5:
            return value_type::array;
        case 6:
            return value_type::map;
        default:
            return value_type::closure;
    }
}

std::string_view type_name(value_type t) noexcept {
    switch (t) {
        case value_type::undefined:
            return "undefined";
        case value_type::null:
            return "null";
        case value_type::boolean:
            return "boolean";
        case value_type::number:
            return "number";
        case value_type::string:
            return "string";
        case value_type::array:
            return "array";
        case value_type::map:
            return "map";
        case value_type::closure:
            return "closure";
    }
    return "unknown";
}

bool is_undefined(const value& v) noexcept {
    return std::holds_alternative<undefined_tag>(v.data());
}

bool is_null(const value& v) noexcept {
    return std::holds_alternative<null_tag>(v.data());
}

bool is_nullish(const value& v) noexcept {
    return is_undefined(v) || is_null(v);
}

bool is_boolean(const value& v) noexcept {
    return std::holds_alternative<bool>(v.data());
}

bool is_number(const value& v) noexcept {
    return std::holds_alternative<double>(v.data());
}

bool is_string(const value& v) noexcept {
    return std::holds_alternative<std::string>(v.data());
}

bool is_array(const value& v) noexcept {
    return std::holds_alternative<array_ptr>(v.data());
}

bool is_map(const value& v) noexcept {
    return std::holds_alternative<map_ptr>(v.data());
}

bool is_closure(const value& v) noexcept {
    return std::holds_alternative<closure_ptr>(v.data());
}

bool boolean_value(const value& v) {
    if (const bool* b = std::get_if<bool>(&v.data())) {
        return *b;
    }
    throw_type_mismatch(v, "boolean");
}

double number_value(const value& v) {
    if (const double* n = std::get_if<double>(&v.data())) {
        return *n;
    }
    throw_type_mismatch(v, "number");
}

const std::string& string_value(const value& v) {
    if (const std::string* s = std::get_if<std::string>(&v.data())) {
        return *s;
    }
    throw_type_mismatch(v, "string");
}

const array_items& array_value(const value& v) {
    if (const array_ptr* a = std::get_if<array_ptr>(&v.data())) {
        return **a;
    }
    throw_type_mismatch(v, "array");
}

const map_entries& map_value(const value& v) {
    if (const map_ptr* m = std::get_if<map_ptr>(&v.data())) {
        return **m;
    }
    throw_type_mismatch(v, "map");
}

const closure_ptr& closure_value(const value& v) {
    if (const closure_ptr* c = std::get_if<closure_ptr>(&v.data())) {
        return *c;
    }
    throw_type_mismatch(v, "closure");
}

const value* map_find(const value& v, std::string_view key) {
    const map_ptr* m = std::get_if<map_ptr>(&v.data());
    if (!m) {
        return nullptr;
    }
    const auto it = (*m)->find(std::string(key));
    return it == (*m)->end() ? nullptr : &it->second;
}

value map_get(const value& v, std::string_view key) {
    const value* found = map_find(v, key);
    return found ? *found : make_undefined();
}

value map_with(const value& v, const std::string& key, value item) {
    map_entries entries;
    if (is_map(v)) {
        entries = map_value(v);
    }
    entries[key] = std::move(item);
    return make_map(std::move(entries));
}

value array_with_appended(const value& v, value item) {
    array_items items;
    if (is_array(v)) {
        items = array_value(v);
    }
    items.push_back(std::move(item));
    return make_array(std::move(items));
}

value get_in(const value& root, std::span<const std::string> path) {
    value current = root;
    for (const std::string& segment : path) {
        if (!is_map(current)) {
            return make_undefined();
        }
        current = map_get(current, segment);
    }
    return current;
}

value assoc_in(const value& root, std::span<const std::string> path, value item) {
    if (path.empty()) {
        return item;
    }
    const value child = map_get(root, path.front());
    return map_with(root, path.front(), assoc_in(child, path.subspan(1), std::move(item)));
}

bool is_truthy(const value& v) {
    switch (type_of(v)) {
        case value_type::undefined:
        case value_type::null:
            return false;
        case value_type::boolean:
            return boolean_value(v);
        case value_type::number: {
            const double n = number_value(v);
            return n != 0.0 && !std::isnan(n);
        }
        case value_type::string:
            return !string_value(v).empty();
        case value_type::array:
        case value_type::map:
        case value_type::closure:
            return true;
    }
    return false;
}

double to_number(const value& v) {
    switch (type_of(v)) {
        case value_type::number:
            return number_value(v);
        case value_type::string: {
            const double parsed = parse_number_prefix(string_value(v));
            return std::isnan(parsed) ? 0.0 : parsed;
        }
        case value_type::boolean:
            return boolean_value(v) ? 1.0 : 0.0;
        default:
            return 0.0;
    }
}

value to_comparable(const value& v) {
    switch (type_of(v)) {
        case value_type::number:
        case value_type::string:
            return v;
        case value_type::boolean:
            return make_number(boolean_value(v) ? 1.0 : 0.0);
        case value_type::undefined:
        case value_type::null:
            return make_number(0.0);
        default:
            return make_string(to_display_string(v));
    }
}

bool deep_equal(const value& lhs, const value& rhs) {
    const value_type lt = type_of(lhs);
    const value_type rt = type_of(rhs);
    if (lt != rt) {
        return false;
    }

    switch (lt) {
        case value_type::undefined:
        case value_type::null:
            return true;
        case value_type::boolean:
            return boolean_value(lhs) == boolean_value(rhs);
        case value_type::number:
            return number_value(lhs) == number_value(rhs);
        case value_type::string:
            return string_value(lhs) == string_value(rhs);
        case value_type::array: {
            const array_items& a = array_value(lhs);
            const array_items& b = array_value(rhs);
            if (a.size() != b.size()) {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!deep_equal(a[i], b[i])) {
                    return false;
                }
            }
            return true;
        }
        case value_type::map: {
            const map_entries& a = map_value(lhs);
            const map_entries& b = map_value(rhs);
            if (a.size() != b.size()) {
                return false;
            }
            for (const auto& [key, item] : a) {
                const auto it = b.find(key);
                if (it == b.end() || !deep_equal(item, it->second)) {
                    return false;
                }
            }
            return true;
        }
        case value_type::closure:
            return closure_value(lhs) == closure_value(rhs);
    }
    return false;
}

array_items to_array_view(const value& v) {
    if (is_array(v)) {
        return array_value(v);
    }
    if (is_nullish(v)) {
        return {};
    }
    return {v};
}

std::string to_display_string(const value& v) {
    switch (type_of(v)) {
        case value_type::undefined:
            return "undefined";
        case value_type::null:
            return "null";
        case value_type::boolean:
            return boolean_value(v) ? "true" : "false";
        case value_type::number:
            return format_number(number_value(v));
        case value_type::string:
            return string_value(v);
        case value_type::array: {
            std::string out;
            bool first = true;
            for (const value& item : array_value(v)) {
                if (!first) {
                    out.push_back(',');
                }
                first = false;
                if (!is_nullish(item)) {
                    out += to_display_string(item);
                }
            }
            return out;
        }
        case value_type::map:
            return "[object Object]";
        case value_type::closure:
            return "[function]";
    }
    return {};
}

std::string format_number(double n) {
    if (std::isnan(n)) {
        return "NaN";
    }
    if (std::isinf(n)) {
        return n < 0.0 ? "-Infinity" : "Infinity";
    }
    if (n == 0.0) {
        return "0";
    }
    const double magnitude = std::fabs(n);
    if (magnitude >= 1e-6 && magnitude < 1e21) {
        return chars_to_string(n, std::chars_format::fixed);
    }
    return tidy_exponent(chars_to_string(n, std::chars_format::scientific));
}

double parse_number_prefix(std::string_view text) {
    std::size_t pos = 0;
    while (pos < text.size() && is_js_space(text[pos])) {
        ++pos;
    }

    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    const std::string_view rest = text.substr(pos);
    if (rest.substr(0, 8) == "Infinity") {
        return negative ? -k_inf : k_inf;
    }
    if (rest.empty() || !(is_ascii_digit(rest.front()) || rest.front() == '.')) {
        return k_nan;
    }

    double parsed = 0.0;
    const auto result = std::from_chars(rest.data(), rest.data() + rest.size(), parsed, std::chars_format::general);
    if (result.ec == std::errc::invalid_argument) {
        return k_nan;
    }
    if (result.ec == std::errc::result_out_of_range) {
        // from_chars leaves the value untouched on overflow; match host behaviour.
        parsed = rest.find_first_of("eE") != std::string_view::npos && rest.find("e-") != std::string_view::npos ? 0.0 : k_inf;
    }
    return negative ? -parsed : parsed;
}

double parse_number_strict(std::string_view text) {
    const std::string_view trimmed = trim_js_space(text);
    if (trimmed.empty()) {
        return 0.0;
    }

    std::string_view body = trimmed;
    bool negative = false;
    if (body.front() == '+' || body.front() == '-') {
        negative = body.front() == '-';
        body.remove_prefix(1);
    }
    if (body == "Infinity") {
        return negative ? -k_inf : k_inf;
    }
    if (body.empty()) {
        return k_nan;
    }

    if (trimmed.size() > 2 && trimmed[0] == '0' && (trimmed[1] == 'x' || trimmed[1] == 'X')) {
        unsigned long long hex = 0;
        const auto result = std::from_chars(trimmed.data() + 2, trimmed.data() + trimmed.size(), hex, 16);
        if (result.ec != std::errc{} || result.ptr != trimmed.data() + trimmed.size()) {
            return k_nan;
        }
        return static_cast<double>(hex);
    }

    if (!(is_ascii_digit(body.front()) || body.front() == '.')) {
        return k_nan;
    }

    double parsed = 0.0;
    const auto result = std::from_chars(body.data(), body.data() + body.size(), parsed, std::chars_format::general);
    if (result.ec == std::errc::invalid_argument || result.ptr != body.data() + body.size()) {
        return k_nan;
    }
    if (result.ec == std::errc::result_out_of_range) {
        parsed = body.find("e-") != std::string_view::npos ? 0.0 : k_inf;
    }
    return negative ? -parsed : parsed;
}

}  // namespace orbital
