#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

#include "module_support.hpp"
#include "orbital/operators.hpp"

namespace orbital {
namespace {

struct core_entry {
    std::string_view name;
    core_operator op;
};

const core_entry k_core_table[] = {
    {"+", arithmetic_op::add},
    {"-", arithmetic_op::subtract},
    {"*", arithmetic_op::multiply},
    {"/", arithmetic_op::divide},
    {"%", arithmetic_op::modulo},
    {"abs", arithmetic_op::abs},
    {"min", arithmetic_op::min},
    {"max", arithmetic_op::max},
    {"floor", arithmetic_op::floor},
    {"ceil", arithmetic_op::ceil},
    {"round", arithmetic_op::round},
    {"clamp", arithmetic_op::clamp},

    {"=", comparison_op::equal},
    {"!=", comparison_op::not_equal},
    {"<", comparison_op::less},
    {">", comparison_op::greater},
    {"<=", comparison_op::less_equal},
    {">=", comparison_op::greater_equal},
    {"matches", comparison_op::matches},

    {"and", logic_op::op_and},
    {"or", logic_op::op_or},
    {"not", logic_op::op_not},
    {"if", logic_op::op_if},

    {"let", control_op::let_bind},
    {"do", control_op::sequence},
    {"when", control_op::when},
    {"fn", control_op::lambda},

    {"map", collection_op::map},
    {"filter", collection_op::filter},
    {"find", collection_op::find},
    {"count", collection_op::count},
    {"sum", collection_op::sum},
    {"first", collection_op::first},
    {"last", collection_op::last},
    {"nth", collection_op::nth},
    {"concat", collection_op::concat},
    {"includes", collection_op::includes},
    {"empty", collection_op::empty},

    {"set", effect_op::set},
    {"set-dynamic", effect_op::set_dynamic},
    {"increment", effect_op::increment},
    {"decrement", effect_op::decrement},
    {"emit", effect_op::emit},
    {"navigate", effect_op::navigate},
    {"persist", effect_op::persist},
    {"notify", effect_op::notify},
    {"spawn", effect_op::spawn},
    {"despawn", effect_op::despawn},
    {"call-service", effect_op::call_service},
    {"render-ui", effect_op::render_ui},
};

template <typename Family>
std::string name_of(Family op) {
    for (const core_entry& entry : k_core_table) {
        const Family* candidate = std::get_if<Family>(&entry.op);
        if (candidate && *candidate == op) {
            return std::string(entry.name);
        }
    }
    return "?";
}

double js_min(double a, double b) {
    if (std::isnan(a) || std::isnan(b)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return b < a ? b : a;
}

double js_max(double a, double b) {
    if (std::isnan(a) || std::isnan(b)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return b > a ? b : a;
}

std::string strip_binding_prefix(const std::string& name) {
    if (!name.empty() && name.front() == '@') {
        return name.substr(1);
    }
    return name;
}

}  // namespace

std::optional<core_operator> lookup_core_operator(std::string_view name) {
    for (const core_entry& entry : k_core_table) {
        if (entry.name == name) {
            return entry.op;
        }
    }
    return std::nullopt;
}

std::vector<std::string> core_operator_names() {
    std::vector<std::string> out;
    for (const core_entry& entry : k_core_table) {
        out.emplace_back(entry.name);
    }
    return out;
}

std::optional<int> compare_comparables(const value& lhs, const value& rhs) {
    if (is_string(lhs) && is_string(rhs)) {
        const int c = string_value(lhs).compare(string_value(rhs));
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }

    const auto numeric = [](const value& v) {
        if (is_string(v)) {
            return parse_number_strict(string_value(v));
        }
        return to_number(v);
    };
    const double a = numeric(lhs);
    const double b = numeric(rhs);
    if (std::isnan(a) || std::isnan(b)) {
        return std::nullopt;
    }
    return a < b ? -1 : (a > b ? 1 : 0);
}

bool regex_search_text(const std::string& subject, const std::string& pattern, bool ignore_case) {
    try {
        auto flags = std::regex::ECMAScript;
        if (ignore_case) {
            flags |= std::regex::icase;
        }
        const std::regex re(pattern, flags);
        return std::regex_search(subject, re);
    } catch (const std::regex_error&) {
        return false;
    }
}

value apply_arithmetic(arithmetic_op op, std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
    const std::string name = name_of(op);
    const auto required = [&](std::size_t i) { return to_number(detail::eval_required(name, ev, ctx, args, i)); };
    const auto lenient = [&](std::size_t i) { return to_number(detail::eval_optional(ev, ctx, args, i)); };

    switch (op) {
        case arithmetic_op::add: {
            double sum = 0.0;
            for (std::size_t i = 0; i < args.size(); ++i) {
                sum += lenient(i);
            }
            return make_number(sum);
        }
        case arithmetic_op::subtract: {
            const double first = required(0);
            if (args.size() == 1) {
                return make_number(-first);
            }
            return make_number(first - lenient(1));
        }
        case arithmetic_op::multiply: {
            double product = 1.0;
            for (std::size_t i = 0; i < args.size(); ++i) {
                product *= lenient(i);
            }
            return make_number(product);
        }
        case arithmetic_op::divide: {
            const double dividend = required(0);
            const double divisor = required(1);
            if (divisor == 0.0) {
                return make_number(dividend >= 0.0 ? std::numeric_limits<double>::infinity()
                                                   : -std::numeric_limits<double>::infinity());
            }
            return make_number(dividend / divisor);
        }
        case arithmetic_op::modulo: {
            const double dividend = required(0);
            const double divisor = required(1);
            return make_number(std::fmod(dividend, divisor));
        }
        case arithmetic_op::abs:
            return make_number(std::fabs(required(0)));
        case arithmetic_op::min: {
            double out = std::numeric_limits<double>::infinity();
            for (std::size_t i = 0; i < args.size(); ++i) {
                out = js_min(out, lenient(i));
            }
            return make_number(out);
        }
        case arithmetic_op::max: {
            double out = -std::numeric_limits<double>::infinity();
            for (std::size_t i = 0; i < args.size(); ++i) {
                out = js_max(out, lenient(i));
            }
            return make_number(out);
        }
        case arithmetic_op::floor:
            return make_number(std::floor(required(0)));
        case arithmetic_op::ceil:
            return make_number(std::ceil(required(0)));
        case arithmetic_op::round:
            return make_number(std::floor(required(0) + 0.5));
        case arithmetic_op::clamp: {
            const double v = required(0);
            const double lo = required(1);
            const double hi = required(2);
            return make_number(js_max(lo, js_min(hi, v)));
        }
    }
    throw eval_error("unhandled arithmetic operator");
}

value apply_comparison(comparison_op op, std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
    const std::string name = name_of(op);
    const value lhs = detail::eval_required(name, ev, ctx, args, 0);
    const value rhs = detail::eval_required(name, ev, ctx, args, 1);

    switch (op) {
        case comparison_op::equal:
            return make_boolean(deep_equal(lhs, rhs));
        case comparison_op::not_equal:
            return make_boolean(!deep_equal(lhs, rhs));
        case comparison_op::matches:
            if (!is_string(lhs) || !is_string(rhs)) {
                return make_boolean(false);
            }
            return make_boolean(regex_search_text(string_value(lhs), string_value(rhs)));
        default:
            break;
    }

    const std::optional<int> order = compare_comparables(to_comparable(lhs), to_comparable(rhs));
    if (!order) {
        return make_boolean(false);
    }
    switch (op) {
        case comparison_op::less:
            return make_boolean(*order < 0);
        case comparison_op::greater:
            return make_boolean(*order > 0);
        case comparison_op::less_equal:
            return make_boolean(*order <= 0);
        case comparison_op::greater_equal:
            return make_boolean(*order >= 0);
        default:
            break;
    }
    throw eval_error("unhandled comparison operator");
}

value apply_logic(logic_op op, std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
    switch (op) {
        case logic_op::op_and:
            for (const sexpr& arg : args) {
                if (!is_truthy(ev.evaluate(arg, ctx))) {
                    return make_boolean(false);
                }
            }
            return make_boolean(true);
        case logic_op::op_or:
            for (const sexpr& arg : args) {
                if (is_truthy(ev.evaluate(arg, ctx))) {
                    return make_boolean(true);
                }
            }
            return make_boolean(false);
        case logic_op::op_not:
            return make_boolean(!is_truthy(detail::eval_required("not", ev, ctx, args, 0)));
        case logic_op::op_if:
            if (is_truthy(detail::eval_required("if", ev, ctx, args, 0))) {
                return detail::eval_required("if", ev, ctx, args, 1);
            }
            return detail::eval_optional(ev, ctx, args, 2);
    }
    throw eval_error("unhandled logic operator");
}

value apply_control(control_op op, std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
    switch (op) {
        case control_op::let_bind: {
            const sexpr& bindings = detail::require_arg("let", args, 0);
            (void)detail::require_arg("let", args, 1);
            if (!is_array(bindings)) {
                throw type_error("let: bindings must be an array of [name, expr] pairs");
            }

            local_map locals;
            for (const sexpr& binding : array_value(bindings)) {
                if (!is_array(binding) || array_value(binding).empty() || !is_string(array_value(binding).front())) {
                    throw type_error("let: each binding must be [name, expr]");
                }
                const array_items& pair = array_value(binding);
                const value bound = pair.size() > 1 ? ev.evaluate(pair[1], ctx) : make_undefined();
                locals[strip_binding_prefix(string_value(pair.front()))] = bound;
            }

            const eval_context child = create_child_context(ctx, locals);
            value result;
            for (std::size_t i = 1; i < args.size(); ++i) {
                result = ev.evaluate(args[i], child);
            }
            return result;
        }
        case control_op::sequence: {
            value result;
            for (const sexpr& arg : args) {
                result = ev.evaluate(arg, ctx);
            }
            return result;
        }
        case control_op::when:
            if (is_truthy(detail::eval_required("when", ev, ctx, args, 0))) {
                (void)detail::require_arg("when", args, 1);
                for (std::size_t i = 1; i < args.size(); ++i) {
                    (void)ev.evaluate(args[i], ctx);
                }
            }
            return make_undefined();
        case control_op::lambda: {
            const sexpr& params = detail::require_arg("fn", args, 0);
            const sexpr& body = detail::require_arg("fn", args, 1);

            auto fn = std::make_shared<closure>();
            if (is_string(params)) {
                fn->params.push_back(strip_binding_prefix(string_value(params)));
            } else if (is_array(params)) {
                fn->positional = true;
                for (const value& param : array_value(params)) {
                    if (!is_string(param)) {
                        throw type_error("fn: parameter names must be strings");
                    }
                    fn->params.push_back(strip_binding_prefix(string_value(param)));
                }
            } else {
                throw type_error("fn: parameters must be a name or an array of names");
            }
            fn->body = body;
            fn->captured = ctx;
            return make_closure(std::move(fn));
        }
    }
    throw eval_error("unhandled control operator");
}

value apply_collection(collection_op op, std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
    const std::string name = name_of(op);

    if (op == collection_op::concat) {
        array_items out;
        for (const sexpr& arg : args) {
            for (value& item : to_array_view(ev.evaluate(arg, ctx))) {
                out.push_back(std::move(item));
            }
        }
        return make_array(std::move(out));
    }

    const array_items items = to_array_view(detail::eval_required(name, ev, ctx, args, 0));
    const auto lambda_at = [&](std::size_t i) -> closure_ptr {
        const value fn = detail::eval_required(name, ev, ctx, args, i);
        (void)detail::require_closure(name, fn);
        return closure_value(fn);
    };

    switch (op) {
        case collection_op::map: {
            const closure_ptr fn = lambda_at(1);
            array_items out;
            out.reserve(items.size());
            for (const value& item : items) {
                out.push_back(detail::call_closure(ev, *fn, {item}));
            }
            return make_array(std::move(out));
        }
        case collection_op::filter: {
            const closure_ptr fn = lambda_at(1);
            array_items out;
            for (const value& item : items) {
                if (is_truthy(detail::call_closure(ev, *fn, {item}))) {
                    out.push_back(item);
                }
            }
            return make_array(std::move(out));
        }
        case collection_op::find: {
            const closure_ptr fn = lambda_at(1);
            for (const value& item : items) {
                if (is_truthy(detail::call_closure(ev, *fn, {item}))) {
                    return item;
                }
            }
            return make_undefined();
        }
        case collection_op::count: {
            if (args.size() < 2) {
                return make_number(static_cast<double>(items.size()));
            }
            const closure_ptr fn = lambda_at(1);
            std::size_t n = 0;
            for (const value& item : items) {
                if (is_truthy(detail::call_closure(ev, *fn, {item}))) {
                    ++n;
                }
            }
            return make_number(static_cast<double>(n));
        }
        case collection_op::sum: {
            double total = 0.0;
            if (args.size() < 2) {
                for (const value& item : items) {
                    total += to_number(item);
                }
                return make_number(total);
            }
            const closure_ptr fn = lambda_at(1);
            for (const value& item : items) {
                total += to_number(detail::call_closure(ev, *fn, {item}));
            }
            return make_number(total);
        }
        case collection_op::first:
            return items.empty() ? make_undefined() : items.front();
        case collection_op::last:
            return items.empty() ? make_undefined() : items.back();
        case collection_op::nth: {
            const double index = to_number(detail::eval_required(name, ev, ctx, args, 1));
            if (!(index >= 0.0) || std::floor(index) != index || index >= static_cast<double>(items.size())) {
                return make_undefined();
            }
            return items[static_cast<std::size_t>(index)];
        }
        case collection_op::includes: {
            const value needle = detail::eval_required(name, ev, ctx, args, 1);
            return make_boolean(std::any_of(items.begin(), items.end(), [&](const value& item) { return deep_equal(item, needle); }));
        }
        case collection_op::empty:
            return make_boolean(items.empty());
        case collection_op::concat:
            break;
    }
    throw eval_error("unhandled collection operator");
}

}  // namespace orbital
