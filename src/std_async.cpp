#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "module_support.hpp"
#include "orbital/async_runtime.hpp"
#include "orbital/stdlib.hpp"

namespace orbital {
namespace {

std::chrono::milliseconds to_millis(double ms) {
    if (!(ms > 0.0)) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::milliseconds{static_cast<std::int64_t>(std::ceil(ms))};
}

void sleep_ms(double ms) {
    const std::chrono::milliseconds duration = to_millis(ms);
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

job_id submit_effect(const evaluator& ev, const eval_context& ctx, const sexpr& effect, const std::string& task_name) {
    job_request req;
    req.task_name = task_name;
    req.fn = [&ev, ctx, effect]() { return ev.evaluate(effect, ctx); };
    req.owner = &ev;
    return ev.runtime().scheduler_ref().submit(std::move(req));
}

void release_all(thread_pool_scheduler& scheduler, const std::vector<job_id>& ids) {
    for (job_id id : ids) {
        scheduler.release(id);
    }
}

void emit_event(const evaluator& ev, const std::shared_ptr<const effect_handlers>& handlers, const std::string& event) {
    if (!handlers || !handlers->emit) {
        ev.runtime().log(log_level::debug, "async", "emit " + event + ": no handler installed, skipped");
        return;
    }
    handlers->emit(event, make_undefined());
}

double backoff_delay(const std::string& backoff, double base_delay, int attempt) {
    if (backoff == "fixed") {
        return base_delay;
    }
    if (backoff == "linear") {
        return base_delay * (attempt + 1);
    }
    return base_delay * std::pow(2.0, attempt);
}

value option_or(const value& options, std::string_view key, value fallback) {
    const value found = map_get(options, key);
    return is_nullish(found) ? fallback : found;
}

}  // namespace

void install_async_module(registrar& r) {
    // (async/delay ms) or (async/delay ms effect): the effect runs after the wait.
    r.register_builtin("async/delay", [](std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
        sleep_ms(to_number(detail::eval_required("async/delay", ev, ctx, args, 0)));
        if (args.size() > 1) {
            return ev.evaluate(args[1], ctx);
        }
        return make_undefined();
    });

    r.register_builtin("async/timeout", [](std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
        const sexpr& effect = detail::require_arg("async/timeout", args, 0);
        const double ms = to_number(detail::eval_required("async/timeout", ev, ctx, args, 1));

        thread_pool_scheduler& scheduler = ev.runtime().scheduler_ref();
        const job_id id = submit_effect(ev, ctx, effect, "async/timeout");
        const auto deadline = std::chrono::steady_clock::now() + to_millis(ms);
        if (!scheduler.wait(id, deadline)) {
            scheduler.release(id);
            throw timeout_error("Timeout exceeded");
        }
        return scheduler.take_result(id);
    });

    r.register_builtin("async/debounce", [](std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
        const std::string event = to_display_string(detail::eval_required("async/debounce", ev, ctx, args, 0));
        const double ms = to_number(detail::eval_required("async/debounce", ev, ctx, args, 1));
        std::shared_ptr<const effect_handlers> handlers = ctx.handlers;
        ev.runtime().debounce(
            event, to_millis(ms), [&ev, handlers = std::move(handlers), event]() { emit_event(ev, handlers, event); }, &ev);
        return make_undefined();
    });

    r.register_builtin("async/throttle", [](std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
        const std::string event = to_display_string(detail::eval_required("async/throttle", ev, ctx, args, 0));
        const double ms = to_number(detail::eval_required("async/throttle", ev, ctx, args, 1));
        if (ev.runtime().throttle(event, static_cast<std::int64_t>(std::ceil(ms)))) {
            emit_event(ev, ctx.handlers, event);
        }
        return make_undefined();
    });

    // (async/retry effect {"attempts": 3, "backoff": "exponential", "baseDelay": 1000})
    r.register_builtin("async/retry", [](std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
        const sexpr& effect = detail::require_arg("async/retry", args, 0);
        const value options = detail::eval_optional(ev, ctx, args, 1);
        const int attempts = static_cast<int>(to_number(option_or(options, "attempts", make_number(3.0))));
        const std::string backoff = to_display_string(option_or(options, "backoff", make_string("exponential")));
        const double base_delay = to_number(option_or(options, "baseDelay", make_number(1000.0)));

        std::exception_ptr last_error;
        for (int attempt = 0; attempt < attempts; ++attempt) {
            try {
                return ev.evaluate(effect, ctx);
            } catch (const std::exception& e) {
                last_error = std::current_exception();
                ev.runtime().log(log_level::debug, "async",
                                 "async/retry: attempt " + std::to_string(attempt + 1) + " failed: " + e.what());
            }
            if (attempt + 1 < attempts) {
                sleep_ms(backoff_delay(backoff, base_delay, attempt));
            }
        }
        if (last_error) {
            std::rethrow_exception(last_error);
        }
        return make_undefined();
    });

    // First job to settle wins, whether it produced a value or threw.
    r.register_builtin("async/race", [](std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
        if (args.empty()) {
            return make_undefined();
        }
        thread_pool_scheduler& scheduler = ev.runtime().scheduler_ref();
        std::vector<job_id> ids;
        ids.reserve(args.size());
        for (const sexpr& effect : args) {
            ids.push_back(submit_effect(ev, ctx, effect, "async/race"));
        }
        const job_id winner = *scheduler.wait_any(ids);
        std::vector<job_id> losers;
        for (job_id id : ids) {
            if (id != winner) {
                losers.push_back(id);
            }
        }
        release_all(scheduler, losers);
        return scheduler.take_result(winner);
    });

    r.register_builtin("async/all", [](std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
        thread_pool_scheduler& scheduler = ev.runtime().scheduler_ref();
        std::vector<job_id> ids;
        ids.reserve(args.size());
        for (const sexpr& effect : args) {
            ids.push_back(submit_effect(ev, ctx, effect, "async/all"));
        }

        array_items results(ids.size());
        std::vector<job_id> pending = ids;
        while (!pending.empty()) {
            const job_id settled = *scheduler.wait_any(pending);
            std::erase(pending, settled);
            const auto position = static_cast<std::size_t>(std::find(ids.begin(), ids.end(), settled) - ids.begin());
            try {
                results[position] = scheduler.take_result(settled);
            } catch (...) {
                release_all(scheduler, pending);
                throw;
            }
        }
        return make_array(std::move(results));
    });

    r.register_builtin("async/sequence", [](std::span<const sexpr> args, const evaluator& ev, const eval_context& ctx) {
        array_items results;
        results.reserve(args.size());
        for (const sexpr& effect : args) {
            results.push_back(ev.evaluate(effect, ctx));
        }
        return make_array(std::move(results));
    });
}

}  // namespace orbital
