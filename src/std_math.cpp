#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>

#include "module_support.hpp"
#include "orbital/stdlib.hpp"

namespace orbital {
namespace {

using detail::arg_at;
using detail::number_at;

std::atomic<std::uint64_t>& rng_state() {
    static std::atomic<std::uint64_t> state{
        static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count())};
    return state;
}

std::uint64_t splitmix64_next() {
    std::uint64_t z = rng_state().fetch_add(0x9e3779b97f4a7c15ull) + 0x9e3779b97f4a7c15ull;
    z = (z ^ (z >> 30u)) * 0xbf58476d1ce4e5b9ull;
    z = (z ^ (z >> 27u)) * 0x94d049bb133111ebull;
    return z ^ (z >> 31u);
}

double next_unit() {
    // Top 53 bits give a uniform double in [0, 1).
    constexpr double k_scale = 1.0 / 9007199254740992.0;
    return static_cast<double>(splitmix64_next() >> 11u) * k_scale;
}

double round_half_up(double n) {
    return std::floor(n + 0.5);
}

double js_min(double a, double b) {
    return std::isnan(a) || std::isnan(b) ? std::numeric_limits<double>::quiet_NaN() : (b < a ? b : a);
}

double js_max(double a, double b) {
    return std::isnan(a) || std::isnan(b) ? std::numeric_limits<double>::quiet_NaN() : (b > a ? b : a);
}

}  // namespace

void install_math_module(registrar& r) {
    r.register_function("math/abs", [](std::span<const value> args) { return make_number(std::fabs(number_at(args, 0))); });

    r.register_function("math/min", [](std::span<const value> args) {
        double out = std::numeric_limits<double>::infinity();
        for (const value& v : args) {
            out = js_min(out, to_number(v));
        }
        return make_number(out);
    });

    r.register_function("math/max", [](std::span<const value> args) {
        double out = -std::numeric_limits<double>::infinity();
        for (const value& v : args) {
            out = js_max(out, to_number(v));
        }
        return make_number(out);
    });

    r.register_function("math/clamp", [](std::span<const value> args) {
        detail::require_count("math/clamp", args, 3);
        return make_number(js_min(js_max(number_at(args, 0), number_at(args, 1)), number_at(args, 2)));
    });

    r.register_function("math/floor", [](std::span<const value> args) { return make_number(std::floor(number_at(args, 0))); });
    r.register_function("math/ceil", [](std::span<const value> args) { return make_number(std::ceil(number_at(args, 0))); });

    r.register_function("math/round", [](std::span<const value> args) {
        const double n = number_at(args, 0);
        const double decimals = number_at(args, 1);
        if (decimals == 0.0) {
            return make_number(round_half_up(n));
        }
        const double factor = std::pow(10.0, decimals);
        return make_number(round_half_up(n * factor) / factor);
    });

    r.register_function("math/pow", [](std::span<const value> args) {
        return make_number(std::pow(number_at(args, 0), number_at(args, 1)));
    });
    r.register_function("math/sqrt", [](std::span<const value> args) { return make_number(std::sqrt(number_at(args, 0))); });
    r.register_function("math/mod", [](std::span<const value> args) {
        return make_number(std::fmod(number_at(args, 0), number_at(args, 1)));
    });

    r.register_function("math/sign", [](std::span<const value> args) {
        const double n = number_at(args, 0);
        if (std::isnan(n) || n == 0.0) {
            return make_number(n);
        }
        return make_number(n > 0.0 ? 1.0 : -1.0);
    });

    r.register_function("math/lerp", [](std::span<const value> args) {
        const double a = number_at(args, 0);
        const double b = number_at(args, 1);
        const double t = number_at(args, 2);
        return make_number(a + (b - a) * t);
    });

    r.register_function("math/map", [](std::span<const value> args) {
        detail::require_count("math/map", args, 5);
        const double n = number_at(args, 0);
        const double in_min = number_at(args, 1);
        const double in_max = number_at(args, 2);
        const double out_min = number_at(args, 3);
        const double out_max = number_at(args, 4);
        return make_number((n - in_min) / (in_max - in_min) * (out_max - out_min) + out_min);
    });

    r.register_function("math/random", [](std::span<const value>) { return make_number(next_unit()); });

    // Inclusive on both ends.
    r.register_function("math/randomInt", [](std::span<const value> args) {
        const double lo = number_at(args, 0);
        const double hi = number_at(args, 1);
        return make_number(std::floor(next_unit() * (hi - lo + 1.0)) + lo);
    });

    r.register_function("math/seed", [](std::span<const value> args) {
        rng_state().store(static_cast<std::uint64_t>(static_cast<std::int64_t>(number_at(args, 0))));
        return make_undefined();
    });

    r.register_function("math/default", [](std::span<const value> args) {
        const value n = arg_at(args, 0);
        if (is_nullish(n) || (is_number(n) && std::isnan(number_value(n)))) {
            return arg_at(args, 1);
        }
        return n;
    });
}

}  // namespace orbital
