#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <regex>
#include <string>

#include "module_support.hpp"
#include "orbital/stdlib.hpp"

namespace orbital {
namespace {

using detail::arg_at;
using detail::number_at;
using detail::string_at;

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_space_char(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim_start(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size() && is_space_char(s[i])) {
        ++i;
    }
    return s.substr(i);
}

std::string trim_end(const std::string& s) {
    std::size_t n = s.size();
    while (n > 0 && is_space_char(s[n - 1])) {
        --n;
    }
    return s.substr(0, n);
}

// Relative index as used by slice: negatives count from the end, result clamped to [0, len].
std::size_t relative_index(double index, std::size_t len) {
    if (std::isnan(index)) {
        return 0;
    }
    const double size = static_cast<double>(len);
    double resolved = index < 0.0 ? size + std::trunc(index) : std::trunc(index);
    resolved = std::clamp(resolved, 0.0, size);
    return static_cast<std::size_t>(resolved);
}

std::string js_slice(const std::string& s, double start, std::optional<double> end) {
    const std::size_t from = relative_index(start, s.size());
    const std::size_t to = end ? relative_index(*end, s.size()) : s.size();
    if (to <= from) {
        return {};
    }
    return s.substr(from, to - from);
}

std::string pad_fill(const std::string& s, double target_length, const std::string& fill) {
    if (fill.empty() || std::isnan(target_length) || target_length <= static_cast<double>(s.size())) {
        return {};
    }
    const std::size_t needed = static_cast<std::size_t>(target_length) - s.size();
    std::string out;
    while (out.size() < needed) {
        out += fill;
    }
    out.resize(needed);
    return out;
}

std::string replace_all(const std::string& s, const std::string& find, const std::string& replacement) {
    if (find.empty()) {
        return s;
    }
    std::string out;
    std::size_t pos = 0;
    while (true) {
        const std::size_t hit = s.find(find, pos);
        if (hit == std::string::npos) {
            out.append(s, pos, std::string::npos);
            return out;
        }
        out.append(s, pos, hit - pos);
        out += replacement;
        pos = hit + find.size();
    }
}

std::string title_case(const std::string& s) {
    std::string out = s;
    std::size_t i = 0;
    while (i < out.size()) {
        if (!is_word_char(out[i])) {
            ++i;
            continue;
        }
        out[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[i])));
        ++i;
        while (i < out.size() && !is_space_char(out[i])) {
            out[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[i])));
            ++i;
        }
    }
    return out;
}

std::string camel_case(const std::string& s) {
    std::string marked;
    marked.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        const bool boundary = is_word_char(c) && (i == 0 || !is_word_char(s[i - 1]));
        const bool upper = std::isupper(static_cast<unsigned char>(c)) != 0;
        if (boundary || upper) {
            const auto u = static_cast<unsigned char>(c);
            marked.push_back(static_cast<char>(i == 0 ? std::tolower(u) : std::toupper(u)));
        } else {
            marked.push_back(c);
        }
    }
    std::string out;
    for (char c : marked) {
        if (!is_space_char(c) && c != '-' && c != '_') {
            out.push_back(c);
        }
    }
    return out;
}

std::string separated_case(const std::string& s, const std::string& separator, const char* separators_pattern) {
    static const std::regex lower_upper("([a-z])([A-Z])");
    std::string out = std::regex_replace(s, lower_upper, "$1" + separator + "$2");
    out = std::regex_replace(out, std::regex(separators_pattern), separator);
    return to_lower(out);
}

std::string fill_template(const std::string& text, const value& vars) {
    std::string out;
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '{') {
            std::size_t j = i + 1;
            while (j < text.size() && is_word_char(text[j])) {
                ++j;
            }
            if (j > i + 1 && j < text.size() && text[j] == '}') {
                const value item = map_get(vars, text.substr(i + 1, j - i - 1));
                if (!is_undefined(item)) {
                    out += to_display_string(item);
                }
                i = j + 1;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::optional<double> optional_number(std::span<const value> args, std::size_t index) {
    if (index >= args.size() || is_undefined(args[index])) {
        return std::nullopt;
    }
    return to_number(args[index]);
}

}  // namespace

void install_str_module(registrar& r) {
    r.register_function("str/len", [](std::span<const value> args) {
        const value s = arg_at(args, 0);
        if (is_string(s)) {
            return make_number(static_cast<double>(string_value(s).size()));
        }
        if (is_array(s)) {
            return make_number(static_cast<double>(array_value(s).size()));
        }
        return make_number(0.0);
    });

    r.register_function("str/upper", [](std::span<const value> args) { return make_string(to_upper(string_at(args, 0))); });
    r.register_function("str/lower", [](std::span<const value> args) { return make_string(to_lower(string_at(args, 0))); });
    r.register_function("str/trim", [](std::span<const value> args) {
        return make_string(trim_end(trim_start(string_at(args, 0))));
    });
    r.register_function("str/trimStart", [](std::span<const value> args) { return make_string(trim_start(string_at(args, 0))); });
    r.register_function("str/trimEnd", [](std::span<const value> args) { return make_string(trim_end(string_at(args, 0))); });

    r.register_function("str/split", [](std::span<const value> args) {
        const value s = arg_at(args, 0);
        if (is_nullish(s)) {
            return make_array();
        }
        const std::string text = to_display_string(s);
        const std::string delim = string_at(args, 1);
        array_items parts;
        if (delim.empty()) {
            for (char c : text) {
                parts.push_back(make_string(std::string(1, c)));
            }
            return make_array(std::move(parts));
        }
        std::size_t pos = 0;
        while (true) {
            const std::size_t hit = text.find(delim, pos);
            if (hit == std::string::npos) {
                parts.push_back(make_string(text.substr(pos)));
                break;
            }
            parts.push_back(make_string(text.substr(pos, hit - pos)));
            pos = hit + delim.size();
        }
        return make_array(std::move(parts));
    });

    r.register_function("str/join", [](std::span<const value> args) {
        const value items = arg_at(args, 0);
        if (!is_array(items)) {
            return make_string(is_nullish(items) ? std::string{} : to_display_string(items));
        }
        const std::string delim = string_at(args, 1, ",");
        std::string out;
        bool first = true;
        for (const value& item : array_value(items)) {
            if (!first) {
                out += delim;
            }
            first = false;
            if (!is_nullish(item)) {
                out += to_display_string(item);
            }
        }
        return make_string(out);
    });

    r.register_function("str/slice", [](std::span<const value> args) {
        return make_string(js_slice(string_at(args, 0), number_at(args, 1), optional_number(args, 2)));
    });

    r.register_function("str/replace", [](std::span<const value> args) {
        const std::string s = string_at(args, 0);
        const std::string find = string_at(args, 1);
        const std::string replacement = string_at(args, 2);
        const std::size_t hit = s.find(find);
        if (hit == std::string::npos) {
            return make_string(s);
        }
        return make_string(s.substr(0, hit) + replacement + s.substr(hit + find.size()));
    });

    r.register_function("str/replaceAll", [](std::span<const value> args) {
        return make_string(replace_all(string_at(args, 0), string_at(args, 1), string_at(args, 2)));
    });

    r.register_function("str/includes", [](std::span<const value> args) {
        if (is_nullish(arg_at(args, 0))) {
            return make_boolean(false);
        }
        return make_boolean(string_at(args, 0).find(string_at(args, 1, "undefined")) != std::string::npos);
    });

    r.register_function("str/startsWith", [](std::span<const value> args) {
        if (is_nullish(arg_at(args, 0))) {
            return make_boolean(false);
        }
        const std::string s = string_at(args, 0);
        const std::string prefix = string_at(args, 1, "undefined");
        return make_boolean(s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0);
    });

    r.register_function("str/endsWith", [](std::span<const value> args) {
        if (is_nullish(arg_at(args, 0))) {
            return make_boolean(false);
        }
        const std::string s = string_at(args, 0);
        const std::string suffix = string_at(args, 1, "undefined");
        return make_boolean(s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0);
    });

    r.register_function("str/padStart", [](std::span<const value> args) {
        const std::string s = string_at(args, 0);
        return make_string(pad_fill(s, number_at(args, 1), string_at(args, 2, " ")) + s);
    });

    r.register_function("str/padEnd", [](std::span<const value> args) {
        const std::string s = string_at(args, 0);
        return make_string(s + pad_fill(s, number_at(args, 1), string_at(args, 2, " ")));
    });

    r.register_function("str/repeat", [](std::span<const value> args) {
        const double count = number_at(args, 1);
        if (count < 0.0 || std::isinf(count)) {
            throw eval_error("str/repeat: invalid count " + format_number(count));
        }
        const std::string s = string_at(args, 0);
        std::string out;
        for (std::size_t i = 0; i < static_cast<std::size_t>(count); ++i) {
            out += s;
        }
        return make_string(out);
    });

    r.register_function("str/reverse", [](std::span<const value> args) {
        std::string s = string_at(args, 0);
        std::reverse(s.begin(), s.end());
        return make_string(s);
    });

    r.register_function("str/capitalize", [](std::span<const value> args) {
        std::string s = string_at(args, 0);
        if (!s.empty()) {
            s.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(s.front())));
        }
        return make_string(s);
    });

    r.register_function("str/titleCase", [](std::span<const value> args) { return make_string(title_case(string_at(args, 0))); });
    r.register_function("str/camelCase", [](std::span<const value> args) { return make_string(camel_case(string_at(args, 0))); });
    r.register_function("str/kebabCase", [](std::span<const value> args) {
        return make_string(separated_case(string_at(args, 0), "-", "[\\s_]+"));
    });
    r.register_function("str/snakeCase", [](std::span<const value> args) {
        return make_string(separated_case(string_at(args, 0), "_", "[\\s-]+"));
    });

    r.register_function("str/default", [](std::span<const value> args) {
        const value s = arg_at(args, 0);
        if (is_nullish(s) || (is_string(s) && string_value(s).empty())) {
            return arg_at(args, 1);
        }
        return s;
    });

    r.register_function("str/template", [](std::span<const value> args) {
        return make_string(fill_template(string_at(args, 0), arg_at(args, 1)));
    });

    r.register_function("str/truncate", [](std::span<const value> args) {
        const std::string s = string_at(args, 0);
        const double length = number_at(args, 1);
        const std::string suffix = string_at(args, 2, "...");
        if (static_cast<double>(s.size()) <= length) {
            return make_string(s);
        }
        return make_string(js_slice(s, 0.0, length - static_cast<double>(suffix.size())) + suffix);
    });
}

}  // namespace orbital
