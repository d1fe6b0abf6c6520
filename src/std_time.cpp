#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

#include "module_support.hpp"
#include "orbital/stdlib.hpp"

namespace orbital {
namespace {

using namespace std::chrono;

using detail::arg_at;
using detail::number_at;
using detail::string_at;

constexpr double k_ms_per_second = 1000.0;
constexpr double k_ms_per_minute = 60.0 * k_ms_per_second;
constexpr double k_ms_per_hour = 60.0 * k_ms_per_minute;
constexpr double k_ms_per_day = 24.0 * k_ms_per_hour;
constexpr double k_ms_per_week = 7.0 * k_ms_per_day;

constexpr std::array<const char*, 7> k_weekday_short = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
constexpr std::array<const char*, 7> k_weekday_long = {"Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};
constexpr std::array<const char*, 12> k_month_short = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                       "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
constexpr std::array<const char*, 12> k_month_long = {"January", "February", "March", "April", "May", "June",
                                                      "July", "August", "September", "October", "November", "December"};

// Broken-down UTC time. month is 1-12, weekday 0 (Sunday) to 6.
struct utc_fields {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millisecond = 0;
    int weekday = 4;
};

double nan_value() {
    return std::numeric_limits<double>::quiet_NaN();
}

utc_fields to_fields(double timestamp) {
    const sys_time<milliseconds> tp{milliseconds{static_cast<std::int64_t>(std::floor(timestamp))}};
    const sys_days day_point = std::chrono::floor<days>(tp);
    const year_month_day ymd{day_point};
    const hh_mm_ss<milliseconds> hms{tp - day_point};

    utc_fields out;
    out.year = static_cast<int>(ymd.year());
    out.month = static_cast<int>(static_cast<unsigned>(ymd.month()));
    out.day = static_cast<int>(static_cast<unsigned>(ymd.day()));
    out.hour = static_cast<int>(hms.hours().count());
    out.minute = static_cast<int>(hms.minutes().count());
    out.second = static_cast<int>(hms.seconds().count());
    out.millisecond = static_cast<int>(hms.subseconds().count());
    out.weekday = static_cast<int>(weekday{day_point}.c_encoding());
    return out;
}

// Out-of-range fields carry over (month 13 is January of the next year, day 0 the last
// day of the previous month), so callers can add to any field directly.
double from_fields(const utc_fields& f) {
    const year_month ym = year{f.year} / January + months{f.month - 1};
    const sys_days day_point = sys_days{ym / 1} + days{f.day - 1};
    const milliseconds total = day_point.time_since_epoch() + hours{f.hour} + minutes{f.minute} + seconds{f.second} +
                               milliseconds{f.millisecond};
    return static_cast<double>(total.count());
}

int days_in_month(int y, int m) {
    const year_month_day_last end{year{y} / month{static_cast<unsigned>(m)} / std::chrono::last};
    return static_cast<int>(static_cast<unsigned>(end.day()));
}

std::int64_t now_of(const eval_context& ctx) {
    return ctx.now != 0 ? ctx.now : wall_clock_ms();
}

std::string two_digits(int n) {
    return n < 10 ? "0" + std::to_string(n) : std::to_string(n);
}

// Longest token wins at each position, so "MMMM" is never read as "MM" twice.
std::string format_time(double timestamp, const std::string& pattern) {
    if (!std::isfinite(timestamp)) {
        return "Invalid Date";
    }
    const utc_fields f = to_fields(timestamp);
    const std::string year_text = std::to_string(f.year);
    const std::pair<std::string_view, std::string> tokens[] = {
        {"YYYY", year_text},
        {"YY", year_text.size() >= 2 ? year_text.substr(year_text.size() - 2) : year_text},
        {"MMMM", k_month_long[static_cast<std::size_t>(f.month - 1)]},
        {"MMM", k_month_short[static_cast<std::size_t>(f.month - 1)]},
        {"MM", two_digits(f.month)},
        {"M", std::to_string(f.month)},
        {"dddd", k_weekday_long[static_cast<std::size_t>(f.weekday)]},
        {"ddd", k_weekday_short[static_cast<std::size_t>(f.weekday)]},
        {"DD", two_digits(f.day)},
        {"D", std::to_string(f.day)},
        {"HH", two_digits(f.hour)},
        {"H", std::to_string(f.hour)},
        {"mm", two_digits(f.minute)},
        {"m", std::to_string(f.minute)},
        {"ss", two_digits(f.second)},
        {"s", std::to_string(f.second)},
    };

    std::string out;
    std::size_t i = 0;
    while (i < pattern.size()) {
        bool matched = false;
        for (const auto& [token, replacement] : tokens) {
            if (pattern.compare(i, token.size(), token) == 0) {
                out += replacement;
                i += token.size();
                matched = true;
                break;
            }
        }
        if (!matched) {
            out.push_back(pattern[i]);
            ++i;
        }
    }
    return out;
}


double add_time(double timestamp, double amount, const std::string& unit) {
    if (!std::isfinite(timestamp) || !std::isfinite(amount)) {
        return nan_value();
    }
    utc_fields f = to_fields(timestamp);
    const int whole = static_cast<int>(std::trunc(amount));
    if (unit == "year") {
        f.year += whole;
    } else if (unit == "month") {
        f.month += whole;
    } else if (unit == "week") {
        f.day += whole * 7;
    } else if (unit == "day") {
        f.day += whole;
    } else if (unit == "hour") {
        return timestamp + whole * k_ms_per_hour;
    } else if (unit == "minute") {
        return timestamp + whole * k_ms_per_minute;
    } else if (unit == "second") {
        return timestamp + whole * k_ms_per_second;
    } else if (unit == "ms") {
        return timestamp + whole;
    } else {
        return timestamp;
    }
    return from_fields(f);
}

double diff_time(double lhs, double rhs, const std::string& unit) {
    const double delta = lhs - rhs;
    if (unit == "year") {
        return std::floor(delta / (k_ms_per_day * 365.25));
    }
    if (unit == "month") {
        return std::floor(delta / (k_ms_per_day * 30.44));
    }
    if (unit == "week") {
        return std::floor(delta / k_ms_per_week);
    }
    if (unit == "day") {
        return std::floor(delta / k_ms_per_day);
    }
    if (unit == "hour") {
        return std::floor(delta / k_ms_per_hour);
    }
    if (unit == "minute") {
        return std::floor(delta / k_ms_per_minute);
    }
    if (unit == "second") {
        return std::floor(delta / k_ms_per_second);
    }
    return delta;
}

double start_of(double timestamp, const std::string& unit) {
    if (!std::isfinite(timestamp)) {
        return nan_value();
    }
    utc_fields f = to_fields(timestamp);
    if (unit == "year") {
        f.month = 1;
        f.day = 1;
    } else if (unit == "month") {
        f.day = 1;
    } else if (unit == "week") {
        f.day -= f.weekday;
    } else if (unit != "day") {
        if (unit == "hour") {
            f.minute = 0;
        }
        if (unit == "hour" || unit == "minute") {
            f.second = 0;
            f.millisecond = 0;
            return from_fields(f);
        }
        return timestamp;
    }
    f.hour = 0;
    f.minute = 0;
    f.second = 0;
    f.millisecond = 0;
    return from_fields(f);
}

double end_of(double timestamp, const std::string& unit) {
    if (!std::isfinite(timestamp)) {
        return nan_value();
    }
    utc_fields f = to_fields(timestamp);
    if (unit == "year") {
        f.month = 12;
        f.day = 31;
    } else if (unit == "month") {
        f.day = days_in_month(f.year, f.month);
    } else if (unit == "week") {
        f.day += 6 - f.weekday;
    } else if (unit != "day") {
        if (unit == "hour") {
            f.minute = 59;
        }
        if (unit == "hour" || unit == "minute") {
            f.second = 59;
            f.millisecond = 999;
            return from_fields(f);
        }
        return timestamp;
    }
    f.hour = 23;
    f.minute = 59;
    f.second = 59;
    f.millisecond = 999;
    return from_fields(f);
}

bool is_same(double lhs, double rhs, const std::string& unit) {
    if (unit == "minute") {
        return std::floor(lhs / k_ms_per_minute) == std::floor(rhs / k_ms_per_minute);
    }
    if (unit == "second") {
        return std::floor(lhs / k_ms_per_second) == std::floor(rhs / k_ms_per_second);
    }
    if (unit != "year" && unit != "month" && unit != "day" && unit != "hour") {
        return lhs == rhs;
    }
    if (!std::isfinite(lhs) || !std::isfinite(rhs)) {
        return false;
    }
    const utc_fields a = to_fields(lhs);
    const utc_fields b = to_fields(rhs);
    bool same = a.year == b.year;
    if (unit != "year") {
        same = same && a.month == b.month;
    }
    if (unit == "day" || unit == "hour") {
        same = same && a.day == b.day;
    }
    if (unit == "hour") {
        same = same && a.hour == b.hour;
    }
    return same;
}

std::string relative_time(double timestamp, std::int64_t now) {
    const double delta = timestamp - static_cast<double>(now);
    const double magnitude = std::fabs(delta);
    if (magnitude < k_ms_per_minute) {
        return "just now";
    }

    struct step {
        double below;
        double unit_ms;
        const char* name;
    };
    static constexpr step k_steps[] = {
        {k_ms_per_hour, k_ms_per_minute, "minute"},
        {k_ms_per_day, k_ms_per_hour, "hour"},
        {k_ms_per_week, k_ms_per_day, "day"},
        {k_ms_per_day * 30.0, k_ms_per_week, "week"},
        {k_ms_per_day * 365.0, k_ms_per_day * 30.0, "month"},
        {std::numeric_limits<double>::infinity(), k_ms_per_day * 365.0, "year"},
    };
    for (const step& s : k_steps) {
        if (magnitude < s.below) {
            const double count = std::floor(magnitude / s.unit_ms + 0.5);
            const std::string label = format_number(count) + " " + s.name + (count == 1.0 ? "" : "s");
            return delta < 0.0 ? label + " ago" : "in " + label;
        }
    }
    return "just now";
}

// At most two significant parts for anything above a minute: "1d 2h", "3m 5s".
std::string duration_text(double ms) {
    ms = std::fabs(ms);
    std::string out;
    int parts = 0;
    const auto push = [&](double count, const char* suffix) {
        if (!out.empty()) {
            out += ' ';
        }
        out += format_number(count) + suffix;
        ++parts;
    };
    if (ms >= k_ms_per_day) {
        push(std::floor(ms / k_ms_per_day), "d");
        ms = std::fmod(ms, k_ms_per_day);
    }
    if (ms >= k_ms_per_hour) {
        push(std::floor(ms / k_ms_per_hour), "h");
        ms = std::fmod(ms, k_ms_per_hour);
    }
    if (ms >= k_ms_per_minute) {
        push(std::floor(ms / k_ms_per_minute), "m");
        ms = std::fmod(ms, k_ms_per_minute);
    }
    if (ms >= k_ms_per_second && parts < 2) {
        push(std::floor(ms / k_ms_per_second), "s");
    }
    return out.empty() ? "0s" : out;
}

using contextual_fn = std::function<value(std::span<const value> args, const eval_context& ctx)>;

// For functions that read the evaluation clock.
void register_contextual(registrar& r, const std::string& name, contextual_fn fn) {
    r.register_builtin(name, [fn = std::move(fn)](std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
        const array_items evaluated = detail::eval_all(ev, ctx, args);
        return fn(evaluated, ctx);
    });
}

template <typename Extract>
void register_field(registrar& r, const std::string& name, Extract extract) {
    r.register_function(name, [extract](std::span<const value> args) {
        const double timestamp = number_at(args, 0, nan_value());
        if (!std::isfinite(timestamp)) {
            return make_number(nan_value());
        }
        return make_number(static_cast<double>(extract(to_fields(timestamp))));
    });
}

}  // namespace

namespace detail {

// ISO 8601 date or date-time; a missing zone means UTC.
double parse_iso_time(const std::string& text) {
    static const std::regex iso(
        R"(^\s*(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,3})\d*)?)?)?\s*(Z|[+-]\d{2}:?\d{2})?\s*$)");
    std::smatch m;
    if (!std::regex_match(text, m, iso)) {
        return nan_value();
    }
    const auto field = [&](std::size_t index) { return m[index].matched ? std::stoi(m[index].str()) : 0; };

    utc_fields f;
    f.year = field(1);
    f.month = field(2);
    f.day = field(3);
    f.hour = field(4);
    f.minute = field(5);
    f.second = field(6);
    if (m[7].matched) {
        std::string fraction = m[7].str();
        fraction.resize(3, '0');
        f.millisecond = std::stoi(fraction);
    }
    if (f.month < 1 || f.month > 12 || f.day < 1 || f.day > days_in_month(f.year, f.month) || f.hour > 24 ||
        f.minute > 59 || f.second > 59) {
        return nan_value();
    }

    double out = from_fields(f);
    if (m[8].matched && m[8].str() != "Z") {
        const std::string zone = m[8].str();
        const int sign = zone[0] == '-' ? -1 : 1;
        const int zone_hours = std::stoi(zone.substr(1, 2));
        const int zone_minutes = std::stoi(zone.substr(zone.size() - 2));
        out -= sign * (zone_hours * k_ms_per_hour + zone_minutes * k_ms_per_minute);
    }
    return out;
}

}  // namespace detail

void install_time_module(registrar& r) {
    register_contextual(r, "time/now", [](std::span<const value>, const eval_context& ctx) {
        return make_number(static_cast<double>(now_of(ctx)));
    });

    register_contextual(r, "time/today", [](std::span<const value>, const eval_context& ctx) {
        return make_number(start_of(static_cast<double>(now_of(ctx)), "day"));
    });

    r.register_function("time/parse", [](std::span<const value> args) {
        const value input = arg_at(args, 0);
        if (is_number(input)) {
            return input;
        }
        return make_number(detail::parse_iso_time(string_at(args, 0)));
    });

    r.register_function("time/format", [](std::span<const value> args) {
        return make_string(format_time(number_at(args, 0, nan_value()), string_at(args, 1, "YYYY-MM-DD")));
    });

    register_field(r, "time/year", [](const utc_fields& f) { return f.year; });
    register_field(r, "time/month", [](const utc_fields& f) { return f.month; });
    register_field(r, "time/day", [](const utc_fields& f) { return f.day; });
    register_field(r, "time/weekday", [](const utc_fields& f) { return f.weekday; });
    register_field(r, "time/hour", [](const utc_fields& f) { return f.hour; });
    register_field(r, "time/minute", [](const utc_fields& f) { return f.minute; });
    register_field(r, "time/second", [](const utc_fields& f) { return f.second; });

    r.register_function("time/add", [](std::span<const value> args) {
        return make_number(add_time(number_at(args, 0, nan_value()), number_at(args, 1), string_at(args, 2)));
    });
    r.register_function("time/subtract", [](std::span<const value> args) {
        return make_number(add_time(number_at(args, 0, nan_value()), -number_at(args, 1), string_at(args, 2)));
    });
    r.register_function("time/diff", [](std::span<const value> args) {
        return make_number(diff_time(number_at(args, 0, nan_value()), number_at(args, 1, nan_value()), string_at(args, 2, "ms")));
    });

    r.register_function("time/startOf", [](std::span<const value> args) {
        return make_number(start_of(number_at(args, 0, nan_value()), string_at(args, 1)));
    });
    r.register_function("time/endOf", [](std::span<const value> args) {
        return make_number(end_of(number_at(args, 0, nan_value()), string_at(args, 1)));
    });

    r.register_function("time/isBefore", [](std::span<const value> args) {
        return make_boolean(number_at(args, 0, nan_value()) < number_at(args, 1, nan_value()));
    });
    r.register_function("time/isAfter", [](std::span<const value> args) {
        return make_boolean(number_at(args, 0, nan_value()) > number_at(args, 1, nan_value()));
    });
    r.register_function("time/isBetween", [](std::span<const value> args) {
        const double t = number_at(args, 0, nan_value());
        return make_boolean(t >= number_at(args, 1, nan_value()) && t <= number_at(args, 2, nan_value()));
    });
    r.register_function("time/isSame", [](std::span<const value> args) {
        return make_boolean(is_same(number_at(args, 0, nan_value()), number_at(args, 1, nan_value()), string_at(args, 2)));
    });

    register_contextual(r, "time/isPast", [](std::span<const value> args, const eval_context& ctx) {
        return make_boolean(number_at(args, 0, nan_value()) < static_cast<double>(now_of(ctx)));
    });
    register_contextual(r, "time/isFuture", [](std::span<const value> args, const eval_context& ctx) {
        return make_boolean(number_at(args, 0, nan_value()) > static_cast<double>(now_of(ctx)));
    });
    register_contextual(r, "time/isToday", [](std::span<const value> args, const eval_context& ctx) {
        return make_boolean(is_same(number_at(args, 0, nan_value()), static_cast<double>(now_of(ctx)), "day"));
    });
    register_contextual(r, "time/relative", [](std::span<const value> args, const eval_context& ctx) {
        return make_string(relative_time(number_at(args, 0, nan_value()), now_of(ctx)));
    });

    r.register_function("time/duration", [](std::span<const value> args) {
        return make_string(duration_text(number_at(args, 0)));
    });
}

}  // namespace orbital
