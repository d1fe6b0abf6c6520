#include <charconv>
#include <cmath>
#include <string>
#include <string_view>

#include "module_support.hpp"
#include "orbital/stdlib.hpp"

namespace orbital {
namespace {

using detail::arg_at;
using detail::number_at;
using detail::string_at;

struct currency_style {
    std::string_view code;
    std::string_view symbol;
    int decimals;
};

constexpr currency_style k_currencies[] = {
    {"USD", "$", 2},
    {"EUR", "€", 2},
    {"GBP", "£", 2},
    {"JPY", "¥", 0},
    {"CNY", "CN¥", 2},
    {"INR", "₹", 2},
    {"CAD", "CA$", 2},
    {"AUD", "A$", 2},
};

std::string fixed_digits(double magnitude, int decimals) {
    char buffer[400];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), magnitude, std::chars_format::fixed, decimals);
    if (result.ec != std::errc{}) {
        return format_number(magnitude);
    }
    return std::string(buffer, result.ptr);
}

// en-US grouping: "1234567.891" -> "1,234,567.891". Fraction digits are rounded to
// max_fraction and trailing zeros trimmed down to min_fraction.
std::string group_number(double n, int min_fraction, int max_fraction) {
    if (std::isnan(n)) {
        return "NaN";
    }
    if (std::isinf(n)) {
        return n < 0.0 ? "-∞" : "∞";
    }
    std::string digits = fixed_digits(std::fabs(n), max_fraction);
    std::string fraction;
    const std::size_t dot = digits.find('.');
    if (dot != std::string::npos) {
        fraction = digits.substr(dot + 1);
        digits.resize(dot);
    }
    while (static_cast<int>(fraction.size()) > min_fraction && !fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }

    std::string grouped;
    const std::size_t lead = digits.size() % 3 == 0 ? 3 : digits.size() % 3;
    grouped.append(digits, 0, lead);
    for (std::size_t i = lead; i < digits.size(); i += 3) {
        grouped += ',';
        grouped.append(digits, i, 3);
    }

    const bool negative = n < 0.0 && (grouped.find_first_not_of("0,") != std::string::npos ||
                                      fraction.find_first_not_of('0') != std::string::npos);
    std::string out = negative ? "-" + grouped : grouped;
    if (!fraction.empty()) {
        out += '.' + fraction;
    }
    return out;
}

int clamp_decimals(double decimals) {
    if (!(decimals >= 0.0)) {
        return 0;
    }
    return decimals > 20.0 ? 20 : static_cast<int>(decimals);
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

std::string format_bytes(double bytes) {
    if (bytes == 0.0) {
        return "0 B";
    }
    static constexpr const char* k_units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    int index = static_cast<int>(std::floor(std::log(bytes) / std::log(1024.0)));
    if (index <= 0 || std::isnan(bytes)) {
        return format_number(bytes) + " B";
    }
    if (index > 5) {
        index = 5;
    }
    const double scaled = bytes / std::pow(1024.0, index);
    std::string text;
    if (scaled >= 10.0) {
        text = format_number(std::floor(scaled + 0.5));
    } else if (std::floor(scaled) == scaled) {
        text = format_number(scaled);
    } else {
        text = fixed_digits(scaled, 1);
    }
    return text + " " + k_units[index];
}

std::string ordinal_suffix(double n) {
    const double magnitude = std::fabs(n);
    const double last_digit = std::fmod(magnitude, 10.0);
    const double last_two = std::fmod(magnitude, 100.0);
    if (last_two >= 11.0 && last_two <= 13.0) {
        return "th";
    }
    if (last_digit == 1.0) {
        return "st";
    }
    if (last_digit == 2.0) {
        return "nd";
    }
    if (last_digit == 3.0) {
        return "rd";
    }
    return "th";
}

}  // namespace

void install_format_module(registrar& r) {
    // (format/number n {"decimals": 2})
    r.register_function("format/number", [](std::span<const value> args) {
        const value options = arg_at(args, 1);
        const value decimals = map_get(options, "decimals");
        if (is_nullish(decimals)) {
            return make_string(group_number(number_at(args, 0), 0, 3));
        }
        const int fixed = clamp_decimals(to_number(decimals));
        return make_string(group_number(number_at(args, 0), fixed, fixed));
    });

    r.register_function("format/currency", [](std::span<const value> args) {
        const double n = number_at(args, 0);
        const std::string code = string_at(args, 1, "USD");
        for (const currency_style& style : k_currencies) {
            if (style.code == code) {
                const std::string amount = group_number(std::fabs(n), style.decimals, style.decimals);
                return make_string((n < 0.0 ? "-" : "") + std::string(style.symbol) + amount);
            }
        }
        return make_string((n < 0.0 ? "-" : "") + code + " " + group_number(std::fabs(n), 2, 2));
    });

    r.register_function("format/percent", [](std::span<const value> args) {
        const int decimals = clamp_decimals(number_at(args, 1));
        return make_string(group_number(number_at(args, 0) * 100.0, decimals, decimals) + "%");
    });

    r.register_function("format/bytes", [](std::span<const value> args) { return make_string(format_bytes(number_at(args, 0))); });

    r.register_function("format/ordinal", [](std::span<const value> args) {
        const double n = number_at(args, 0);
        return make_string(format_number(n) + ordinal_suffix(n));
    });

    r.register_function("format/plural", [](std::span<const value> args) {
        const double n = number_at(args, 0);
        return make_string(format_number(n) + " " + (std::fabs(n) == 1.0 ? string_at(args, 1) : string_at(args, 2)));
    });

    // ["a", "b", "c"] -> "a, b, and c"; the second argument swaps "and" for "or".
    r.register_function("format/list", [](std::span<const value> args) {
        const array_items items = to_array_view(arg_at(args, 0));
        const std::string style = string_at(args, 1, "and");
        if (items.empty()) {
            return make_string({});
        }
        if (items.size() == 1) {
            return make_string(to_display_string(items.front()));
        }
        if (items.size() == 2) {
            return make_string(to_display_string(items[0]) + " " + style + " " + to_display_string(items[1]));
        }
        std::string out;
        for (std::size_t i = 0; i + 1 < items.size(); ++i) {
            out += to_display_string(items[i]) + ", ";
        }
        return make_string(out + style + " " + to_display_string(items.back()));
    });

    r.register_function("format/phone", [](std::span<const value> args) {
        const value input = arg_at(args, 0);
        const std::string digits = digits_only(string_at(args, 0));
        const bool us = string_at(args, 1, "US") == "US";
        if (us && digits.size() == 10) {
            return make_string("(" + digits.substr(0, 3) + ") " + digits.substr(3, 3) + "-" + digits.substr(6));
        }
        if (us && digits.size() == 11 && digits[0] == '1') {
            return make_string("+1 (" + digits.substr(1, 3) + ") " + digits.substr(4, 3) + "-" + digits.substr(7));
        }
        if (digits.size() >= 10) {
            return make_string(digits.substr(0, 3) + "-" + digits.substr(3, 3) + "-" + digits.substr(6));
        }
        return input;
    });

    // Masks all but the last four digits, grouped in fours.
    r.register_function("format/creditCard", [](std::span<const value> args) {
        const value input = arg_at(args, 0);
        const std::string digits = digits_only(string_at(args, 0));
        if (digits.size() < 4) {
            return input;
        }
        std::string out;
        for (std::size_t i = 0; i < digits.size(); ++i) {
            if (i > 0 && i % 4 == 0) {
                out += ' ';
            }
            out += i + 4 < digits.size() ? std::string("•") : std::string(1, digits[i]);
        }
        return make_string(out);
    });
}

}  // namespace orbital
