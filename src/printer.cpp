#include "orbital/printer.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace orbital {
namespace {

std::string escape_string(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        switch (c) {
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buffer;
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    return out;
}

void print_impl(std::ostringstream& out, const value& v, bool strict) {
    switch (type_of(v)) {
        case value_type::undefined:
            out << (strict ? "null" : "undefined");
            return;
        case value_type::null:
            out << "null";
            return;
        case value_type::boolean:
            out << (boolean_value(v) ? "true" : "false");
            return;
        case value_type::number: {
            const double n = number_value(v);
            if (strict && !std::isfinite(n)) {
                out << "null";
                return;
            }
            out << format_number(n);
            return;
        }
        case value_type::string:
            out << '"' << escape_string(string_value(v)) << '"';
            return;
        case value_type::array: {
            out << '[';
            bool first = true;
            for (const value& item : array_value(v)) {
                if (!first) {
                    out << ',';
                }
                first = false;
                print_impl(out, item, strict);
            }
            out << ']';
            return;
        }
        case value_type::map: {
            out << '{';
            bool first = true;
            for (const auto& [key, item] : map_value(v)) {
                if (strict && is_undefined(item)) {
                    continue;
                }
                if (!first) {
                    out << ',';
                }
                first = false;
                out << '"' << escape_string(key) << "\":";
                print_impl(out, item, strict);
            }
            out << '}';
            return;
        }
        case value_type::closure:
            out << (strict ? "null" : "#<closure>");
            return;
    }
}

}  // namespace

std::string print_value(const value& v) {
    std::ostringstream out;
    print_impl(out, v, false);
    return out.str();
}

std::string write_json(const value& v) {
    std::ostringstream out;
    print_impl(out, v, true);
    return out.str();
}

}  // namespace orbital
