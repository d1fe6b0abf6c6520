#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace orbital {

class value;
struct closure;

using array_items = std::vector<value>;
using map_entries = std::map<std::string, value>;

using array_ptr = std::shared_ptr<const array_items>;
using map_ptr = std::shared_ptr<const map_entries>;
using closure_ptr = std::shared_ptr<const closure>;

enum class value_type {
    undefined,
    null,
    boolean,
    number,
    string,
    array,
    map,
    closure
};

struct undefined_tag {};
struct null_tag {};

// Immutable tagged value. Arrays and maps are shared; "modifying" one always builds a copy.
class value {
public:
    using storage = std::variant<undefined_tag, null_tag, bool, double, std::string, array_ptr, map_ptr, closure_ptr>;

    value() = default;
    explicit value(storage data) : data_(std::move(data)) {}

    [[nodiscard]] const storage& data() const noexcept { return data_; }

private:
    storage data_;
};

value make_undefined();
value make_null();
value make_boolean(bool v);
value make_number(double v);
value make_string(std::string text);
value make_array(array_items items = {});
value make_map(map_entries entries = {});
value make_closure(closure_ptr fn);

[[nodiscard]] value_type type_of(const value& v) noexcept;
[[nodiscard]] std::string_view type_name(value_type t) noexcept;

[[nodiscard]] bool is_undefined(const value& v) noexcept;
[[nodiscard]] bool is_null(const value& v) noexcept;
[[nodiscard]] bool is_nullish(const value& v) noexcept;
[[nodiscard]] bool is_boolean(const value& v) noexcept;
[[nodiscard]] bool is_number(const value& v) noexcept;
[[nodiscard]] bool is_string(const value& v) noexcept;
[[nodiscard]] bool is_array(const value& v) noexcept;
[[nodiscard]] bool is_map(const value& v) noexcept;
[[nodiscard]] bool is_closure(const value& v) noexcept;

// Accessors throw type_error on a mismatched value.
[[nodiscard]] bool boolean_value(const value& v);
[[nodiscard]] double number_value(const value& v);
[[nodiscard]] const std::string& string_value(const value& v);
[[nodiscard]] const array_items& array_value(const value& v);
[[nodiscard]] const map_entries& map_value(const value& v);
[[nodiscard]] const closure_ptr& closure_value(const value& v);

// Returns nullptr when v is not a map or the key is absent.
[[nodiscard]] const value* map_find(const value& v, std::string_view key);
[[nodiscard]] value map_get(const value& v, std::string_view key);
[[nodiscard]] value map_with(const value& v, const std::string& key, value item);
[[nodiscard]] value array_with_appended(const value& v, value item);

// Path helpers over nested maps. get_in yields undefined on any miss; assoc_in copies
// every map along the path and creates missing intermediates.
[[nodiscard]] value get_in(const value& root, std::span<const std::string> path);
[[nodiscard]] value assoc_in(const value& root, std::span<const std::string> path, value item);

[[nodiscard]] bool is_truthy(const value& v);
[[nodiscard]] double to_number(const value& v);
[[nodiscard]] value to_comparable(const value& v);
[[nodiscard]] bool deep_equal(const value& lhs, const value& rhs);
[[nodiscard]] array_items to_array_view(const value& v);
[[nodiscard]] std::string to_display_string(const value& v);
[[nodiscard]] std::string format_number(double n);

// Leading-prefix float parse: "12px" -> 12, "abc" -> NaN.
[[nodiscard]] double parse_number_prefix(std::string_view text);
// Whole-string numeric conversion: "" -> 0, " 7 " -> 7, "7px" -> NaN.
[[nodiscard]] double parse_number_strict(std::string_view text);

}  // namespace orbital
