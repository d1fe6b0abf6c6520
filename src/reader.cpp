#include "orbital/reader.hpp"

#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

#include "orbital/error.hpp"

namespace orbital {
namespace {

class parser {
public:
    explicit parser(std::string_view source) : source_(source) {}

    std::vector<value> read_all_values() {
        std::vector<value> values;
        while (true) {
            skip_ws_and_comments();
            if (eof()) {
                break;
            }
            values.push_back(read_value());
        }
        return values;
    }

    value read_single() {
        skip_ws_and_comments();
        if (eof()) {
            throw parse_error_here("unexpected end of input", true);
        }
        value out = read_value();
        skip_ws_and_comments();
        if (!eof()) {
            throw parse_error_here("trailing characters after value", false);
        }
        return out;
    }

private:
    [[nodiscard]] parse_error parse_error_at(const std::string& message, bool incomplete, std::size_t position) const {
        std::size_t line = 1;
        std::size_t column = 1;
        const std::size_t end = position < source_.size() ? position : source_.size();
        for (std::size_t i = 0; i < end; ++i) {
            if (source_[i] == '\n') {
                ++line;
                column = 1;
                continue;
            }
            ++column;
        }
        return parse_error("line " + std::to_string(line) + ", column " + std::to_string(column) + ": " + message, incomplete);
    }

    [[nodiscard]] parse_error parse_error_here(const std::string& message, bool incomplete) const {
        return parse_error_at(message, incomplete, pos_);
    }

    [[nodiscard]] bool eof() const {
        return pos_ >= source_.size();
    }

    [[nodiscard]] char peek() const {
        return source_[pos_];
    }

    [[nodiscard]] char get() {
        return source_[pos_++];
    }

    void skip_ws_and_comments() {
        while (!eof()) {
            const char c = peek();
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
                continue;
            }
            if (c == ';') {
                while (!eof() && peek() != '\n') {
                    ++pos_;
                }
                continue;
            }
            break;
        }
    }

    [[nodiscard]] value read_value() {
        skip_ws_and_comments();
        if (eof()) {
            throw parse_error_here("unexpected end of input", true);
        }

        const char c = peek();
        if (c == '[') {
            ++pos_;
            return read_array();
        }
        if (c == '{') {
            ++pos_;
            return read_object();
        }
        if (c == '"') {
            ++pos_;
            return make_string(read_string());
        }
        if (c == ']' || c == '}') {
            throw parse_error_here(std::string("unexpected '") + c + "'", false);
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return read_number();
        }
        return read_keyword();
    }

    [[nodiscard]] value read_array() {
        array_items items;
        skip_ws_and_comments();
        if (!eof() && peek() == ']') {
            ++pos_;
            return make_array(std::move(items));
        }

        while (true) {
            items.push_back(read_value());
            skip_ws_and_comments();
            if (eof()) {
                throw parse_error_here("unterminated array", true);
            }
            const char c = get();
            if (c == ']') {
                return make_array(std::move(items));
            }
            if (c != ',') {
                throw parse_error_at("expected ',' or ']' in array", false, pos_ - 1);
            }
        }
    }

    [[nodiscard]] value read_object() {
        map_entries entries;
        skip_ws_and_comments();
        if (!eof() && peek() == '}') {
            ++pos_;
            return make_map(std::move(entries));
        }

        while (true) {
            skip_ws_and_comments();
            if (eof()) {
                throw parse_error_here("unterminated object", true);
            }
            if (get() != '"') {
                throw parse_error_at("expected string key in object", false, pos_ - 1);
            }
            std::string key = read_string();

            skip_ws_and_comments();
            if (eof()) {
                throw parse_error_here("unterminated object", true);
            }
            if (get() != ':') {
                throw parse_error_at("expected ':' after object key", false, pos_ - 1);
            }

            entries[std::move(key)] = read_value();

            skip_ws_and_comments();
            if (eof()) {
                throw parse_error_here("unterminated object", true);
            }
            const char c = get();
            if (c == '}') {
                return make_map(std::move(entries));
            }
            if (c != ',') {
                throw parse_error_at("expected ',' or '}' in object", false, pos_ - 1);
            }
        }
    }

    void append_utf8(std::string& out, std::uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    [[nodiscard]] std::uint32_t read_hex4() {
        if (pos_ + 4 > source_.size()) {
            throw parse_error_here("truncated \\u escape", true);
        }
        std::uint32_t cp = 0;
        const char* begin = source_.data() + pos_;
        const auto result = std::from_chars(begin, begin + 4, cp, 16);
        if (result.ec != std::errc{} || result.ptr != begin + 4) {
            throw parse_error_here("invalid \\u escape", false);
        }
        pos_ += 4;
        return cp;
    }

    [[nodiscard]] std::string read_string() {
        std::string out;
        while (true) {
            if (eof()) {
                throw parse_error_here("unterminated string", true);
            }

            const char c = get();
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }

            if (eof()) {
                throw parse_error_here("unterminated string escape", true);
            }
            const char escaped = get();
            switch (escaped) {
                case 'n':
                    out.push_back('\n');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case '/':
                    out.push_back('/');
                    break;
                case '"':
                    out.push_back('"');
                    break;
                case '\\':
                    out.push_back('\\');
                    break;
                case 'u': {
                    std::uint32_t cp = read_hex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF && pos_ + 1 < source_.size() && source_[pos_] == '\\' &&
                        source_[pos_ + 1] == 'u') {
                        pos_ += 2;
                        const std::uint32_t low = read_hex4();
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            append_utf8(out, cp);
                            cp = low;
                        }
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    throw parse_error_here("unknown string escape", false);
            }
        }
    }

    [[nodiscard]] value read_number() {
        const std::size_t start = pos_;
        if (peek() == '-') {
            ++pos_;
        }
        while (!eof()) {
            const char c = peek();
            if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
                ++pos_;
                continue;
            }
            break;
        }

        const std::string_view token = source_.substr(start, pos_ - start);
        double parsed = 0.0;
        const auto result = std::from_chars(token.data(), token.data() + token.size(), parsed);
        if (result.ec == std::errc::invalid_argument || result.ptr != token.data() + token.size()) {
            if (pos_ >= source_.size() && token == "-") {
                throw parse_error_at("incomplete number", true, start);
            }
            throw parse_error_at("invalid number: " + std::string(token), false, start);
        }
        if (result.ec == std::errc::result_out_of_range) {
            throw parse_error_at("number out of range: " + std::string(token), false, start);
        }
        return make_number(parsed);
    }

    [[nodiscard]] value read_keyword() {
        const std::size_t start = pos_;
        while (!eof() && std::isalpha(static_cast<unsigned char>(peek()))) {
            ++pos_;
        }
        const std::string_view word = source_.substr(start, pos_ - start);
        if (word == "true") {
            return make_boolean(true);
        }
        if (word == "false") {
            return make_boolean(false);
        }
        if (word == "null") {
            return make_null();
        }
        if (word.empty()) {
            throw parse_error_at(std::string("unexpected character '") + source_[start] + "'", false, start);
        }
        throw parse_error_at("unknown literal: " + std::string(word), false, start);
    }

    std::string_view source_;
    std::size_t pos_ = 0;
};

}  // namespace

value read_json(std::string_view source) {
    parser p(source);
    return p.read_single();
}

std::vector<value> read_all_json(std::string_view source) {
    parser p(source);
    return p.read_all_values();
}

}  // namespace orbital
