#include <cmath>
#include <functional>
#include <map>
#include <regex>
#include <string>
#include <utility>

#include "module_support.hpp"
#include "orbital/operators.hpp"
#include "orbital/stdlib.hpp"

namespace orbital {
namespace {

using detail::arg_at;

// A rule sees the value under test and the rule's own arguments.
using rule_fn = std::function<bool(const value& subject, std::span<const value> rule_args)>;

bool matches_regex(const value& subject, const std::regex& pattern) {
    return is_string(subject) && std::regex_search(string_value(subject), pattern);
}

std::string digits_only(const std::string& text) {
    std::string out;
    for (char c : text) {
        if (c >= '0' && c <= '9') {
            out.push_back(c);
        }
    }
    return out;
}

// Length of a string or array; -1 for anything else.
double length_of(const value& subject) {
    if (is_string(subject)) {
        return static_cast<double>(string_value(subject).size());
    }
    if (is_array(subject)) {
        return static_cast<double>(array_value(subject).size());
    }
    return -1.0;
}

bool luhn_valid(const std::string& digits) {
    int sum = 0;
    bool doubled = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int digit = *it - '0';
        if (doubled) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        doubled = !doubled;
    }
    return sum % 10 == 0;
}

bool in_options(const value& subject, const value& options) {
    for (const value& option : to_array_view(options)) {
        if (deep_equal(option, subject)) {
            return true;
        }
    }
    return false;
}

const std::map<std::string, rule_fn>& rule_table() {
    static const std::map<std::string, rule_fn> rules = [] {
        std::map<std::string, rule_fn> out;
        out["required"] = [](const value& v, std::span<const value>) {
            return !is_nullish(v) && !(is_string(v) && string_value(v).empty());
        };
        out["string"] = [](const value& v, std::span<const value>) { return is_string(v); };
        out["number"] = [](const value& v, std::span<const value>) { return is_number(v) && !std::isnan(number_value(v)); };
        out["boolean"] = [](const value& v, std::span<const value>) { return is_boolean(v); };
        out["array"] = [](const value& v, std::span<const value>) { return is_array(v); };
        out["object"] = [](const value& v, std::span<const value>) { return is_map(v); };
        out["email"] = [](const value& v, std::span<const value>) {
            static const std::regex email(R"(^[^\s@]+@[^\s@]+\.[^\s@]+$)");
            return matches_regex(v, email);
        };
        out["url"] = [](const value& v, std::span<const value>) {
            static const std::regex url(R"(^[A-Za-z][A-Za-z0-9+.\-]*:[^\s]+$)");
            return matches_regex(v, url);
        };
        out["uuid"] = [](const value& v, std::span<const value>) {
            static const std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-[1-5][0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$",
                                         std::regex::ECMAScript | std::regex::icase);
            return matches_regex(v, uuid);
        };
        out["phone"] = [](const value& v, std::span<const value>) {
            static const std::regex phone(R"(^\+?[\d\s\-().]{10,}$)");
            return matches_regex(v, phone) && digits_only(string_value(v)).size() >= 10;
        };
        out["creditCard"] = [](const value& v, std::span<const value>) {
            if (!is_string(v)) {
                return false;
            }
            const std::string digits = digits_only(string_value(v));
            return digits.size() >= 13 && digits.size() <= 19 && luhn_valid(digits);
        };
        out["date"] = [](const value& v, std::span<const value>) {
            if (is_number(v)) {
                return std::isfinite(number_value(v));
            }
            return is_string(v) && !std::isnan(detail::parse_iso_time(string_value(v)));
        };
        out["minLength"] = [](const value& v, std::span<const value> a) {
            const double n = length_of(v);
            return n >= 0.0 && n >= detail::number_at(a, 0);
        };
        out["maxLength"] = [](const value& v, std::span<const value> a) {
            const double n = length_of(v);
            return n >= 0.0 && n <= detail::number_at(a, 0);
        };
        out["length"] = [](const value& v, std::span<const value> a) {
            const double n = length_of(v);
            return n >= 0.0 && n == detail::number_at(a, 0);
        };
        out["min"] = [](const value& v, std::span<const value> a) {
            return is_number(v) && number_value(v) >= detail::number_at(a, 0);
        };
        out["max"] = [](const value& v, std::span<const value> a) {
            return is_number(v) && number_value(v) <= detail::number_at(a, 0);
        };
        out["range"] = [](const value& v, std::span<const value> a) {
            return is_number(v) && number_value(v) >= detail::number_at(a, 0) && number_value(v) <= detail::number_at(a, 1);
        };
        out["pattern"] = [](const value& v, std::span<const value> a) {
            return is_string(v) && regex_search_text(string_value(v), detail::string_at(a, 0));
        };
        out["oneOf"] = [](const value& v, std::span<const value> a) { return in_options(v, arg_at(a, 0)); };
        out["noneOf"] = [](const value& v, std::span<const value> a) { return !in_options(v, arg_at(a, 0)); };
        out["equals"] = [](const value& v, std::span<const value> a) { return deep_equal(v, arg_at(a, 0)); };
        return out;
    }();
    return rules;
}

// rules: {"field": [["required"], ["minLength", 3]], ...}. Unknown rule names are skipped.
value check_fields(const value& subject, const value& rules) {
    const auto& table = rule_table();
    array_items errors;
    if (is_map(rules)) {
        for (const auto& [field, field_rules] : map_value(rules)) {
            const value field_value = map_get(subject, field);
            for (const value& rule : to_array_view(field_rules)) {
                const array_items parts = to_array_view(rule);
                if (parts.empty()) {
                    continue;
                }
                const std::string rule_name = to_display_string(parts.front());
                const auto it = table.find(rule_name);
                if (it == table.end()) {
                    continue;
                }
                const std::span<const value> rule_args(parts.data() + 1, parts.size() - 1);
                if (!it->second(field_value, rule_args)) {
                    errors.push_back(make_string(field + ": " + rule_name + " validation failed"));
                }
            }
        }
    }
    const bool valid = errors.empty();
    return make_map({{"valid", make_boolean(valid)}, {"errors", make_array(std::move(errors))}});
}

}  // namespace

void install_validate_module(registrar& r) {
    for (const auto& [name, rule] : rule_table()) {
        r.register_function("validate/" + name, [rule = rule](std::span<const value> args) {
            const std::span<const value> rule_args = args.empty() ? args : args.subspan(1);
            return make_boolean(rule(arg_at(args, 0), rule_args));
        });
    }

    r.register_function("validate/check", [](std::span<const value> args) {
        return check_fields(arg_at(args, 0), arg_at(args, 1));
    });
}

}  // namespace orbital
