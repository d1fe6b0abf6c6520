#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "behavior/compiler.hpp"
#include "behavior/error.hpp"
#include "behavior/registry.hpp"
#include "behavior/runtime.hpp"
#include "behavior/runtime_host.hpp"
#include "orbital/async_runtime.hpp"
#include "orbital/context.hpp"
#include "orbital/error.hpp"
#include "orbital/eval.hpp"
#include "orbital/expression.hpp"
#include "orbital/printer.hpp"
#include "orbital/reader.hpp"

namespace {

void check(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

void check_close(double actual, double expected, double epsilon, const std::string& message) {
    if (std::fabs(actual - expected) > epsilon) {
        throw std::runtime_error(message + " (expected " + std::to_string(expected) + ", got " + std::to_string(actual) + ")");
    }
}

template <typename Exception, typename Fn>
void check_throws(Fn&& fn, const std::string& message) {
    try {
        fn();
    } catch (const Exception&) {
        return;
    }
    throw std::runtime_error(message);
}

orbital::value json(const std::string& text) {
    return orbital::read_json(text);
}

orbital::value eval_text(const std::string& source, const orbital::eval_context& ctx) {
    return orbital::default_evaluator().evaluate(orbital::read_json(source), ctx);
}

orbital::value eval_text(const std::string& source) {
    return eval_text(source, orbital::create_minimal_context());
}

double number_at(const orbital::value& map, const std::string& key) {
    return orbital::number_value(orbital::map_get(map, key));
}

class manual_clock final : public orbital::clock_interface {
public:
    explicit manual_clock(std::int64_t start) : now_(start) {}

    std::int64_t now_ms() const override {
        return now_.load();
    }

    void set(std::int64_t now) {
        now_.store(now);
    }

private:
    std::atomic<std::int64_t> now_;
};

struct recorded_emit {
    std::string event;
    orbital::value payload;
};

// Records effects that leave the evaluator.
struct effect_recorder {
    std::mutex mutex;
    std::vector<orbital::map_entries> changes;
    std::vector<recorded_emit> emits;
    std::vector<std::pair<std::string, std::string>> notices;
    std::vector<std::string> persisted;
    std::vector<std::pair<std::string, orbital::value>> renders;

    orbital::effect_handlers handlers() {
        orbital::effect_handlers h;
        h.mutate_entity = [this](const orbital::map_entries& c) {
            std::lock_guard<std::mutex> lock(mutex);
            changes.push_back(c);
        };
        h.emit = [this](const std::string& event, const orbital::value& payload) {
            std::lock_guard<std::mutex> lock(mutex);
            emits.push_back({event, payload});
        };
        h.notify = [this](const std::string& message, const std::string& severity) {
            std::lock_guard<std::mutex> lock(mutex);
            notices.emplace_back(message, severity);
        };
        h.persist = [this](const std::string& action, const orbital::value&) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                persisted.push_back(action);
            }
            std::promise<void> done;
            done.set_value();
            return done.get_future();
        };
        h.render_ui = [this](const std::string& slot, const orbital::value& pattern, const orbital::value&, const orbital::value&) {
            std::lock_guard<std::mutex> lock(mutex);
            renders.emplace_back(slot, pattern);
        };
        return h;
    }
};

struct emit_log {
    std::mutex mutex;
    std::vector<std::string> events;

    behavior::emit_listener_fn listener() {
        return [this](std::int64_t, const std::string& event, const orbital::value&) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(event);
        };
    }

    std::size_t count(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (const std::string& e : events) {
            n += e == event ? 1 : 0;
        }
        return n;
    }
};

std::int64_t create_std_instance(behavior::runtime_host& host,
                                 const std::string& name,
                                 const orbital::value& config = orbital::make_map(),
                                 const orbital::value& seed = orbital::make_map()) {
    std::shared_ptr<const behavior::definition> def = behavior::std_registry().find(name);
    check(def != nullptr, "catalog entry missing: " + name);
    const std::int64_t def_handle = host.store_definition(*def);
    return host.create_instance(def_handle, config, seed);
}

bool wait_for_state(behavior::runtime_host& host, std::int64_t handle, const std::string& state) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (host.current_state(handle) == state) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

void test_reader_and_printer() {
    const orbital::value doc = json("{\"b\": [1, 2.5, \"x\"], \"a\": null} ; trailing comment");
    check(orbital::write_json(doc) == "{\"a\":null,\"b\":[1,2.5,\"x\"]}", "write_json should sort keys and keep numbers short");

    const std::vector<orbital::value> all = orbital::read_all_json("1 \"two\" [3]\n; done\n");
    check(all.size() == 3, "read_all_json should read three values");
    check(orbital::print_value(all[1]) == "\"two\"", "print_value should quote strings");

    check(orbital::print_value(orbital::make_undefined()) == "undefined", "print_value keeps undefined");
    check(orbital::write_json(orbital::make_undefined()) == "null", "write_json maps undefined to null");
    check(orbital::write_json(orbital::make_map({{"gone", orbital::make_undefined()}, {"kept", orbital::make_number(1)}})) ==
              "{\"kept\":1}",
          "write_json drops undefined members");

    try {
        (void)json("[1, 2");
        throw std::runtime_error("expected parse_error for unterminated array");
    } catch (const orbital::parse_error& e) {
        check(e.incomplete(), "unterminated array should be reported as incomplete");
    }
    try {
        (void)json("[1 2] x");
        throw std::runtime_error("expected parse_error for trailing text");
    } catch (const orbital::parse_error& e) {
        check(!e.incomplete(), "malformed input is not incomplete");
    }
}

void test_arithmetic_coercion() {
    check_close(orbital::number_value(eval_text("[\"+\", \"12px\", 1, true]")), 14.0, 1e-9, "+ coerces numeric prefixes and booleans");
    check_close(orbital::number_value(eval_text("[\"+\", \"abc\", 1]")), 1.0, 1e-9, "+ treats non-numeric strings as 0");
    check_close(orbital::number_value(eval_text("[\"-\", 5]")), -5.0, 1e-9, "unary minus");
    check_close(orbital::number_value(eval_text("[\"%\", 7, 3]")), 1.0, 1e-9, "modulo");

    const double positive = orbital::number_value(eval_text("[\"/\", 1, 0]"));
    const double negative = orbital::number_value(eval_text("[\"/\", -1, 0]"));
    check(std::isinf(positive) && positive > 0.0, "1/0 should be +Infinity");
    check(std::isinf(negative) && negative < 0.0, "-1/0 should be -Infinity");

    check(orbital::boolean_value(eval_text("[\"<\", \"2\", 10]")), "numeric string compares numerically against a number");
    check(orbital::boolean_value(eval_text("[\"<\", \"b\", \"a\"]")) == false, "strings compare lexicographically");
}

void test_logic_short_circuit() {
    effect_recorder rec;
    const orbital::eval_context ctx = orbital::create_effect_context(orbital::create_minimal_context(), rec.handlers());

    check(!orbital::boolean_value(eval_text("[\"and\", false, [\"emit\", \"NEVER\"]]", ctx)), "and should be false");
    check(orbital::boolean_value(eval_text("[\"or\", 1, [\"emit\", \"NEVER\"]]", ctx)), "or should be true");
    check_close(orbital::number_value(eval_text("[\"if\", false, [\"emit\", \"NEVER\"], 2]", ctx)), 2.0, 1e-9, "if else branch");
    check(orbital::is_undefined(eval_text("[\"if\", false, 1]", ctx)), "if without else yields undefined");
    check(rec.emits.empty(), "short-circuited branches must not run");

    (void)eval_text("[\"when\", true, [\"emit\", \"A\"], [\"emit\", \"B\"]]", ctx);
    check(rec.emits.size() == 2 && rec.emits[1].event == "B", "when runs every body form");
}

void test_binding_resolution() {
    const orbital::eval_context ctx = orbital::create_minimal_context(json("{\"user\": {\"name\": \"Ada\"}, \"count\": 3}"),
                                                                      json("{\"n\": null, \"id\": \"p1\", \"list\": [4, 5]}"),
                                                                      "Idle");
    check(orbital::string_value(eval_text("\"@entity.user.name\"", ctx)) == "Ada", "nested entity path");
    check(orbital::is_undefined(eval_text("\"@entity.missing.deep\"", ctx)), "missing path yields undefined");
    check(orbital::is_undefined(eval_text("\"@payload.n.x\"", ctx)), "path through null yields undefined");
    check(orbital::string_value(eval_text("\"@state\"", ctx)) == "Idle", "@state");
    check(orbital::is_undefined(eval_text("\"@payload.list.0\"", ctx)), "paths do not index into arrays");
    check(orbital::is_undefined(eval_text("\"@nothing.here\"", ctx)), "unknown root yields undefined");

    const std::vector<std::string> found = orbital::collect_bindings(json("[\"+\", \"@entity.a\", [\"*\", \"@payload.b\", 2], \"plain\"]"));
    check(found.size() == 2 && found[0] == "@entity.a" && found[1] == "@payload.b", "collect_bindings in pre-order");

    const orbital::sexpr built = orbital::make_call("+", {orbital::make_string("@entity.a"), orbital::make_call("abs", {orbital::make_number(-2.0)})});
    check(orbital::write_json(built) == "[\"+\",\"@entity.a\",[\"abs\",-2]]", "make_call builds a call");
    std::vector<std::size_t> indices;
    orbital::walk(built, [&indices](const orbital::sexpr&, const orbital::sexpr* parent, std::size_t index) {
        if (parent != nullptr) {
            indices.push_back(index);
        }
    });
    check(indices.size() == 5, "walk visits every node below the root");

    check(orbital::is_valid_binding("@entity.count"), "@entity.count is valid");
    check(!orbital::is_valid_binding("@now.x"), "@now takes no path");
}

void test_let_and_lambdas() {
    const orbital::eval_context ctx = orbital::create_minimal_context(orbital::make_map(), json("{\"items\": [1, 2, 3, 4]}"));

    check_close(orbital::number_value(eval_text("[\"let\", [[\"x\", 2], [\"@y\", 5]], [\"*\", \"@x\", \"@y\"]]", ctx)), 10.0, 1e-9,
                "let binds names with or without @");
    check(orbital::is_undefined(eval_text("[\"do\", [\"let\", [[\"x\", 2]], \"@x\"], \"@x\"]", ctx)), "let bindings are not visible outside");
    check(orbital::is_undefined(eval_text("[\"let\", [[\"x\", 1], [\"y\", \"@x\"]], \"@y\"]", ctx)),
          "let bindings do not see their siblings");

    const orbital::value big = eval_text("[\"array/filter\", \"@payload.items\", [\"fn\", \"n\", [\">\", \"@n\", 2]]]", ctx);
    check(orbital::write_json(big) == "[3,4]", "array/filter with a lambda");

    const orbital::value doubled = eval_text("[\"map\", \"@payload.items\", [\"fn\", \"n\", [\"*\", \"@n\", 2]]]", ctx);
    check(orbital::write_json(doubled) == "[2,4,6,8]", "core map with a lambda");

    const orbital::value closure = eval_text("[\"fn\", [\"a\", \"b\"], [\"+\", \"@a\", \"@b\"]]", ctx);
    const std::vector<orbital::value> args{orbital::make_number(3), orbital::make_number(4)};
    check_close(orbital::number_value(orbital::default_evaluator().invoke(closure, args)), 7.0, 1e-9, "positional lambda via invoke");
}

void test_std_modules() {
    const orbital::eval_context ctx = orbital::create_minimal_context(
        orbital::make_map(), json("{\"dupes\": [1, 1, 2], \"user\": {\"name\": \"Ada\", \"role\": \"admin\", \"age\": 36}}"));

    check(orbital::string_value(eval_text("[\"str/upper\", \"abc\"]")) == "ABC", "str/upper");
    check(orbital::string_value(eval_text("[\"str/truncate\", \"Hello world\", 8]")) == "Hello...", "str/truncate");
    check(orbital::string_value(eval_text("[\"str/padStart\", \"7\", 3, \"0\"]")) == "007", "str/padStart");
    check(orbital::string_value(eval_text("[\"str/template\", \"Hi {name}!\", \"@payload.user\"]", ctx)) == "Hi Ada!", "str/template");

    check_close(orbital::number_value(eval_text("[\"math/clamp\", 15, 0, 10]")), 10.0, 1e-9, "math/clamp");
    check_close(orbital::number_value(eval_text("[\"math/default\", null, 4]")), 4.0, 1e-9, "math/default");

    check(orbital::string_value(eval_text("[\"format/ordinal\", 22]")) == "22nd", "format/ordinal");
    check(orbital::string_value(eval_text("[\"format/ordinal\", 12]")) == "12th", "format/ordinal teens");
    check(orbital::string_value(eval_text("[\"format/plural\", 1, \"item\", \"items\"]")) == "1 item", "format/plural");

    check(orbital::write_json(eval_text("[\"array/unique\", \"@payload.dupes\"]", ctx)) == "[1,2]", "array/unique");
    check(orbital::write_json(eval_text("[\"array/takeLast\", \"@payload.dupes\", 0]", ctx)) == "[]", "array/takeLast 0");
    const orbital::value shuffled = eval_text("[\"array/shuffle\", [5, 3, 1, 4, 2, 3]]");
    check(orbital::is_array(shuffled) && orbital::array_value(shuffled).size() == 6, "array/shuffle keeps the length");
    std::vector<double> shuffled_numbers;
    for (const orbital::value& item : orbital::array_value(shuffled)) {
        shuffled_numbers.push_back(orbital::number_value(item));
    }
    std::sort(shuffled_numbers.begin(), shuffled_numbers.end());
    check(shuffled_numbers == std::vector<double>{1, 2, 3, 3, 4, 5}, "array/shuffle keeps every element");
    check(orbital::write_json(eval_text("[\"object/pick\", \"@payload.user\", [\"array/append\", [], \"name\"]]", ctx)) ==
              "{\"name\":\"Ada\"}",
          "object/pick");
    check(orbital::write_json(eval_text("[\"object/set\", {}, \"a.b\", 1]")) == "{\"a\":{\"b\":1}}", "object/set creates intermediates");

    check(orbital::boolean_value(eval_text("[\"validate/email\", \"a@b.co\"]")), "validate/email accepts an address");
    check(!orbital::boolean_value(eval_text("[\"validate/email\", \"nope\"]")), "validate/email rejects junk");

    check(orbital::write_json(eval_text("{\"literal\": \"@payload.user\"}", ctx)) == "{\"literal\":\"@payload.user\"}",
          "map literals are not evaluated");
}

void test_operator_errors() {
    try {
        (void)eval_text("[\"nope/op\", 1]");
        throw std::runtime_error("expected unknown_operator_error");
    } catch (const orbital::unknown_operator_error& e) {
        check(e.op() == "nope/op", "unknown operator name is reported");
    }
    try {
        (void)eval_text("[\"/\", 1]");
        throw std::runtime_error("expected arity_error");
    } catch (const orbital::arity_error& e) {
        check(e.op() == "/" && e.position() == 2, "arity error names operator and argument");
    }
    check_throws<orbital::eval_error>([] { (void)eval_text("[\"persist\", \"bogus\"]"); }, "persist should reject unknown actions");
}

void test_effect_operators() {
    effect_recorder rec;
    orbital::eval_context ctx = orbital::create_effect_context(
        orbital::create_minimal_context(json("{\"count\": 5}"), json("{\"msg\": {\"message\": \"Saved\", \"type\": \"success\"}}")),
        rec.handlers());

    (void)eval_text("[\"set\", \"@entity.count\", 2, \"increment\"]", ctx);
    check(rec.changes.size() == 1, "set should mutate once");
    check_close(orbital::number_value(rec.changes[0].at("count")), 7.0, 1e-9, "set increment uses the current value");

    (void)eval_text("[\"set\", \"@payload.count\", 1]", ctx);
    check(rec.changes.size() == 1, "set on a non-entity target is ignored");

    (void)eval_text("[\"notify\", \"@payload.msg\"]", ctx);
    check(rec.notices.size() == 1 && rec.notices[0].first == "Saved" && rec.notices[0].second == "success",
          "notify unpacks a message map");
    (void)eval_text("[\"notify\", \"plain\", \"warning\"]", ctx);
    check(rec.notices[1].second == "warning", "notify explicit severity");

    (void)eval_text("[\"persist\", \"update\", {\"id\": 1}]", ctx);
    check(rec.persisted.size() == 1 && rec.persisted[0] == "update", "persist update");

    (void)eval_text("[\"render-ui\", \"modal\", null]", ctx);
    check(rec.renders.size() == 1 && orbital::string_value(orbital::map_get(rec.renders[0].second, "type")) == "clear",
          "render-ui with null pattern clears the slot");

    (void)eval_text("[\"emit\", \"SAVED\", {\"ok\": true}]", ctx);
    check(rec.emits.size() == 1 && rec.emits[0].event == "SAVED" && orbital::boolean_value(orbital::map_get(rec.emits[0].payload, "ok")),
          "emit passes event and payload");

    // Without handlers effects are skipped rather than failing.
    (void)eval_text("[\"emit\", \"NOBODY\"]");
}

void test_async_debounce_single_emit() {
    std::atomic<int> fired{0};
    orbital::effect_handlers handlers;
    handlers.emit = [&fired](const std::string& event, const orbital::value&) {
        if (event == "SEARCH_SETTLED") {
            ++fired;
        }
    };
    const orbital::eval_context ctx = orbital::create_effect_context(orbital::create_minimal_context(), handlers);

    for (int i = 0; i < 3; ++i) {
        (void)eval_text("[\"async/debounce\", \"SEARCH_SETTLED\", 50]", ctx);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    check(fired.load() == 0, "debounce should not fire before the delay");
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    check(fired.load() == 1, "three debounced calls should emit exactly once");

    std::atomic<int> throttled{0};
    orbital::effect_handlers throttle_handlers;
    throttle_handlers.emit = [&throttled](const std::string& event, const orbital::value&) {
        if (event == "SCROLL_SAMPLED") {
            ++throttled;
        }
    };
    const orbital::eval_context throttle_ctx = orbital::create_effect_context(orbital::create_minimal_context(), throttle_handlers);
    for (int i = 0; i < 3; ++i) {
        (void)eval_text("[\"async/throttle\", \"SCROLL_SAMPLED\", 60000]", throttle_ctx);
    }
    check(throttled.load() == 1, "throttle should drop calls inside the window");
}

void test_async_retry_attempts() {
    std::atomic<int> calls{0};
    orbital::effect_handlers handlers;
    handlers.call_service = [&calls](const std::string&, const std::string&, const orbital::value&) {
        if (++calls < 3) {
            throw std::runtime_error("transient");
        }
        std::promise<orbital::value> done;
        done.set_value(orbital::make_string("ok"));
        return done.get_future();
    };
    const orbital::eval_context ctx = orbital::create_effect_context(orbital::create_minimal_context(), handlers);

    const auto started = std::chrono::steady_clock::now();
    const orbital::value out = eval_text(
        "[\"async/retry\", [\"call-service\", \"api\", \"get\"], {\"attempts\": 3, \"backoff\": \"fixed\", \"baseDelay\": 10}]", ctx);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    check(orbital::string_value(out) == "ok", "retry should return the successful result");
    check(calls.load() == 3, "retry should make three attempts");
    check(elapsed >= std::chrono::milliseconds(20), "two fixed 10ms waits between attempts");

    calls = -100;
    const auto failing_started = std::chrono::steady_clock::now();
    std::string last_error;
    try {
        (void)eval_text(
            "[\"async/retry\", [\"call-service\", \"api\", \"get\"], {\"attempts\": 3, \"backoff\": \"fixed\", \"baseDelay\": 10}]", ctx);
    } catch (const std::runtime_error& e) {
        last_error = e.what();
    }
    const auto failing_elapsed = std::chrono::steady_clock::now() - failing_started;
    check(last_error == "transient", "retry should rethrow the last failure");
    check(calls.load() == -97, "an always failing effect is attempted exactly three times");
    check(failing_elapsed >= std::chrono::milliseconds(20), "failed attempts wait between each other");
}

void test_async_race_all_timeout() {
    check(orbital::write_json(eval_text("[\"async/all\", [\"+\", 1, 1], [\"*\", 2, 3]]")) == "[2,6]", "async/all keeps argument order");
    check(orbital::write_json(eval_text("[\"async/sequence\", [\"+\", 1, 1], 5]")) == "[2,5]", "async/sequence");
    check_close(orbital::number_value(eval_text("[\"async/race\", 7, [\"async/delay\", 300, 1]]")), 7.0, 1e-9,
                "async/race returns the first settled result");
    check_throws<orbital::timeout_error>([] { (void)eval_text("[\"async/timeout\", [\"async/delay\", 300, 1], 20]"); },
                                         "async/timeout should throw when the effect is slow");
    check_close(orbital::number_value(eval_text("[\"async/timeout\", [\"+\", 1, 2], 1000]")), 3.0, 1e-9,
                "async/timeout returns a fast result");

    const orbital::scheduler_profile_stats stats = orbital::default_async_runtime().scheduler_ref().stats_snapshot();
    check(stats.submitted >= 4 && stats.completed + stats.failed <= stats.submitted, "combinators run on the shared scheduler");
}

void test_async_busy_worker_pool() {
    orbital::async_runtime runtime(1);
    orbital::runtime_config config;
    config.runtime = &runtime;
    const orbital::evaluator ev(config);
    const orbital::eval_context ctx = orbital::create_minimal_context();

    check_throws<orbital::timeout_error>([&] { (void)ev.evaluate(json("[\"async/timeout\", [\"async/delay\", 400], 10]"), ctx); },
                                         "slow effect should time out");

    auto started = std::chrono::steady_clock::now();
    check_close(orbital::number_value(ev.evaluate(json("[\"async/timeout\", [\"+\", 1, 2], 500]"), ctx)), 3.0, 1e-9,
                "fast effect succeeds while an abandoned job holds the only worker");
    check(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(300), "fast effect should not wait for the abandoned job");

    started = std::chrono::steady_clock::now();
    const orbital::value winner = ev.evaluate(json("[\"async/race\", [\"async/delay\", 20, 0], [\"async/delay\", 600, 99]]"), ctx);
    check_close(orbital::number_value(winner), 0.0, 1e-9, "race returns the quick effect");
    check(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(400), "race returns without waiting for the slow effect");

    started = std::chrono::steady_clock::now();
    check_throws<orbital::unknown_operator_error>(
        [&] { (void)ev.evaluate(json("[\"async/all\", [\"async/delay\", 600, 1], [\"nope/op\"]]"), ctx); },
        "async/all should rethrow the failing effect");
    check(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(400), "async/all fails without waiting for siblings");

    check(runtime.scheduler_ref().stats_snapshot().extra_workers > 0, "busy pool should start extra workers");
}

void test_evaluator_teardown_cancels_timers() {
    std::atomic<int> fired{0};
    orbital::effect_handlers handlers;
    handlers.emit = [&fired](const std::string& event, const orbital::value&) {
        if (event == "TEARDOWN_EVENT") {
            ++fired;
        }
    };
    const orbital::eval_context ctx = orbital::create_effect_context(orbital::create_minimal_context(), handlers);

    {
        const orbital::evaluator ev;
        (void)ev.evaluate(json("[\"async/debounce\", \"TEARDOWN_EVENT\", 30]"), ctx);
        check_throws<orbital::timeout_error>([&] { (void)ev.evaluate(json("[\"async/timeout\", [\"async/delay\", 60], 5]"), ctx); },
                                             "abandoned job outlives the timeout");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    check(fired.load() == 0, "debounce timers die with their evaluator");
}

void test_catalog_validates() {
    const behavior::registry& reg = behavior::std_registry();
    check(reg.size() == behavior::std_behavior_documents().size(), "every catalog document should register");
    check(reg.size() == 19, "catalog should hold 19 behaviors");

    for (const auto& def : reg.all()) {
        const std::vector<std::string> problems = behavior::validate_definition(*def);
        std::string joined;
        for (const std::string& p : problems) {
            joined += p + "; ";
        }
        check(problems.empty(), def->name + " has problems: " + joined);
        check(!def->suggested_for.empty(), def->name + " should suggest use cases");
    }

    const behavior::library_stats stats = reg.stats();
    check(stats.total_behaviors == 19, "stats total");
    check(stats.by_category.at("game-entity") == 2, "two game-entity behaviors");
    check(stats.total_ticks > 0, "catalog declares ticks");
}

void test_registry_queries() {
    const behavior::registry& reg = behavior::std_registry();
    check(!reg.validate_reference("std/Pagination").has_value(), "known name validates");

    const std::optional<std::string> no_prefix = reg.validate_reference("Pagination");
    check(no_prefix && *no_prefix == "Behavior name must start with 'std/': Pagination", "prefix message");

    const std::optional<std::string> typo = reg.validate_reference("std/Paginaton");
    check(typo && typo->find("Did you mean: std/Pagination") != std::string::npos, "typo should suggest std/Pagination");

    const std::optional<std::string> unknown = reg.validate_reference("std/Xyzzyqwerty");
    check(unknown && *unknown == "Unknown behavior: std/Xyzzyqwerty", "unknown name without suggestions");

    check(reg.for_event("DAMAGE").size() == 1 && reg.for_event("DAMAGE").front()->name == "std/Health", "for_event");
    bool pagination_found = false;
    for (const auto& def : reg.for_use_case("pagination")) {
        pagination_found = pagination_found || def->name == "std/Pagination";
    }
    check(pagination_found, "for_use_case is case-insensitive substring");
    check(!reg.with_state("Polling").empty(), "with_state");
    check(behavior::levenshtein_distance("kitten", "sitting") == 3, "levenshtein");

    const behavior::behavior_metadata meta = behavior::metadata_of(*reg.find("std/Wizard"));
    check(meta.states.size() == 4 && meta.has_data_entities, "metadata_of");
}

void test_compile_errors() {
    check_throws<behavior::behavior_compile_error>(
        [] { (void)behavior::compile_definition_text("{\"name\": \"std/Empty\", \"stateMachine\": {\"states\": []}}"); },
        "no states should fail to compile");
    check_throws<behavior::behavior_compile_error>(
        [] { (void)behavior::compile_definition_text("{\"name\": \"std/Bad\", \"stateMachine\": {\"states\": [\"A\"], \"initial\": \"B\"}}"); },
        "undeclared initial state should fail to compile");
    check_throws<behavior::behavior_compile_error>(
        [] {
            (void)behavior::compile_definition_text(
                "{\"name\": \"std/Bad\", \"stateMachine\": {\"states\": [\"A\"], \"events\": [\"GO\"], "
                "\"transitions\": [{\"event\": \"GO\", \"effects\": [42]}]}}");
        },
        "non-call effects should fail to compile");

    const behavior::definition def = behavior::compile_definition_text(
        "{\"name\": \"Loose\", \"category\": \"misc\", \"stateMachine\": {\"states\": [\"A\"], \"events\": [\"GO\"], "
        "\"transitions\": [{\"from\": \"Z\", \"to\": \"Y\", \"event\": \"STOP\"}]}}");
    const std::vector<std::string> problems = behavior::validate_definition(def);
    const auto has = [&](const std::string& text) {
        for (const std::string& p : problems) {
            if (p == text) {
                return true;
            }
        }
        return false;
    };
    check(has("Behavior name should start with 'std/' (got: Loose)"), "name prefix problem");
    check(has("Invalid category: misc"), "category problem");
    check(has("Transition uses undeclared event: STOP"), "undeclared event problem");
    check(has("Transition from undeclared state: Z"), "undeclared from problem");
    check(has("Transition to undeclared state: Y"), "undeclared to problem");
}

void test_pagination_guards() {
    behavior::runtime_host host;
    const std::int64_t h = create_std_instance(host, "std/Pagination", orbital::make_map(), json("{\"totalItems\": 45, \"pageSize\": 20}"));

    check(host.dispatch(h, "NEXT_PAGE").transitioned, "first NEXT_PAGE");
    check(host.dispatch(h, "NEXT_PAGE").transitioned, "second NEXT_PAGE");
    check_close(number_at(host.entity_snapshot(h), "page"), 3.0, 1e-9, "page after two NEXT_PAGE");

    const behavior::dispatch_result last = host.dispatch(h, "NEXT_PAGE");
    check(!last.transitioned && last.guard_rejected, "NEXT_PAGE past the last page is guard-rejected");
    check_close(number_at(host.entity_snapshot(h), "page"), 3.0, 1e-9, "page stays on the last page");

    check(host.dispatch(h, "GO_TO_PAGE", json("{\"page\": 5}")).guard_rejected, "GO_TO_PAGE out of range");
    check(host.dispatch(h, "GO_TO_PAGE", json("{\"page\": 1}")).transitioned, "GO_TO_PAGE in range");
    check_close(number_at(host.entity_snapshot(h), "page"), 1.0, 1e-9, "GO_TO_PAGE sets the page");

    const behavior::dispatch_result unmatched = host.dispatch(h, "NOT_AN_EVENT");
    check(!unmatched.transitioned && !unmatched.guard_rejected, "unknown events are ignored");

    const std::string stats = host.dump_instance_stats(h);
    check(stats.find("guard_rejections=2") != std::string::npos, "stats count guard rejections");
    check(stats.find("unmatched_events=1") != std::string::npos, "stats count unmatched events");
}

void test_selection_modes() {
    behavior::runtime_host host;
    effect_recorder rec;
    host.set_effect_handlers(rec.handlers());

    const std::int64_t single = create_std_instance(host, "std/Selection");
    (void)host.dispatch(single, "SELECT", json("{\"id\": \"a\"}"));
    (void)host.dispatch(single, "SELECT", json("{\"id\": \"b\"}"));
    check(orbital::write_json(orbital::map_get(host.entity_snapshot(single), "selected")) == "[\"b\"]", "single mode keeps one item");
    check(orbital::string_value(orbital::map_get(host.entity_snapshot(single), "lastSelected")) == "b", "lastSelected");

    const std::int64_t multi = create_std_instance(host, "std/Selection", json("{\"mode\": \"multi\", \"maxSelection\": 2}"));
    for (const char* id : {"a", "b", "c"}) {
        (void)host.dispatch(multi, "SELECT", orbital::make_map({{"id", orbital::make_string(id)}}));
    }
    check(orbital::write_json(orbital::map_get(host.entity_snapshot(multi), "selected")) == "[\"a\",\"b\"]", "multi mode honours the limit");
    check(rec.notices.size() == 1 && rec.notices[0].second == "warning", "limit reached is notified");

    (void)host.dispatch(multi, "TOGGLE", json("{\"id\": \"a\"}"));
    check(orbital::write_json(orbital::map_get(host.entity_snapshot(multi), "selected")) == "[\"b\"]", "TOGGLE removes a selected id");

    check_throws<behavior::behavior_error>([&] { (void)create_std_instance(host, "std/Selection", json("{\"mode\": \"triple\"}")); },
                                           "enum violation should be rejected");
}

void test_required_config() {
    behavior::runtime_host host;
    check_throws<behavior::behavior_error>([&] { (void)create_std_instance(host, "std/Health"); },
                                           "missing required config should throw");
    check_throws<behavior::behavior_error>([&] { (void)create_std_instance(host, "std/Health", json("{\"maxHealth\": null}")); },
                                           "null required config should throw");
    check_throws<std::invalid_argument>([&] { (void)host.create_instance(999); }, "unknown definition handle");
}

void test_emit_queue_and_ticks_health() {
    manual_clock clock(1000);
    behavior::runtime_host host;
    host.set_clock_interface(&clock);
    emit_log log;
    host.set_emit_listener(log.listener());

    const std::int64_t h = create_std_instance(host, "std/Health", json("{\"maxHealth\": 100}"));
    const behavior::dispatch_result hit = host.dispatch(h, "DAMAGE", json("{\"amount\": 30}"));
    check(hit.transitioned && hit.to_state == "Damaged", "DAMAGE moves to Damaged");
    check(orbital::boolean_value(orbital::map_get(host.entity_snapshot(h), "isInvulnerable")), "damage grants invulnerability");

    clock.set(1400);
    (void)host.run_due_ticks(1400);
    check(host.current_state(h) == "Damaged", "still invulnerable before the window ends");

    clock.set(1600);
    check(host.run_due_ticks(1600) == 1, "invulnerability timer should run");
    check(host.current_state(h) == "Alive", "emitted INVULNERABILITY_END is processed in the same pass");

    (void)host.dispatch(h, "DAMAGE", json("{\"amount\": 150}"));
    check(host.current_state(h) == "Dead", "lethal damage emits DIE which is drained before dispatch returns");
    check_close(number_at(host.entity_snapshot(h), "currentHealth"), 0.0, 1e-9, "health floors at zero");
    check(log.count("DIE") == 1, "listener sees the declared DIE event");
    check(log.count("ENTITY_DIED") == 1, "listener sees the configured death event");

    host.set_clock_interface(nullptr);
}

void test_game_loop_frame_ticks() {
    manual_clock clock(1000);
    behavior::runtime_host host;
    host.set_clock_interface(&clock);
    emit_log log;
    host.set_emit_listener(log.listener());

    const std::int64_t h = create_std_instance(host, "std/GameLoop");
    (void)host.dispatch(h, "START");

    check(host.run_due_ticks(1010) == 0, "frame tick not due before 16ms");
    check(host.run_due_ticks(1016) == 1, "frame tick due at 16ms");
    check(host.run_due_ticks(1032) == 1, "frame tick due again");
    const orbital::value entity = host.entity_snapshot(h);
    check_close(number_at(entity, "frameCount"), 2.0, 1e-9, "two frames counted");
    check_close(number_at(entity, "elapsedTime"), 32.0, 1e-9, "elapsed time accumulates delta");
    check(log.count("GAME_TICK") == 2, "each frame emits GAME_TICK");

    (void)host.dispatch(h, "PAUSE");
    check(host.run_due_ticks(1048) == 0, "paused loop does not tick");
    check_close(number_at(host.entity_snapshot(h), "frameCount"), 2.0, 1e-9, "frame count frozen while paused");

    host.set_clock_interface(nullptr);
}

void test_poll_config_interval() {
    manual_clock clock(0);
    behavior::runtime_host host;
    host.set_clock_interface(&clock);
    emit_log log;
    host.set_emit_listener(log.listener());

    const std::int64_t h = create_std_instance(host, "std/Poll", json("{\"intervalMs\": 100}"));
    (void)host.dispatch(h, "START");

    check(host.run_due_ticks(50) == 0, "poll interval not elapsed");
    clock.set(100);
    check(host.run_due_ticks(100) == 1, "poll interval elapsed");
    check(log.count("POLL_REQUESTED") == 1, "POLL_TICK handling requests a poll");
    check_close(number_at(host.entity_snapshot(h), "lastPollAt"), 100.0, 1e-9, "lastPollAt uses the host clock");

    (void)host.dispatch(h, "STOP");
    clock.set(300);
    check(host.run_due_ticks(300) == 0, "stopped poll does not tick");

    host.set_clock_interface(nullptr);
}

void test_notification_auto_dismiss() {
    manual_clock clock(1000);
    behavior::runtime_host host;
    host.set_clock_interface(&clock);

    const std::int64_t h = create_std_instance(host, "std/Notification", json("{\"autoDismissMs\": 500}"));
    (void)host.dispatch(h, "SHOW", json("{\"type\": \"info\", \"message\": \"hi\", \"extra\": 1}"));
    check(host.current_state(h) == "Visible", "SHOW makes the toast visible");

    const orbital::value shown = orbital::map_get(host.entity_snapshot(h), "notifications");
    check(orbital::array_value(shown).size() == 1, "one notification queued");
    const orbital::value first = orbital::array_value(shown).front();
    check_close(number_at(first, "id"), 1.0, 1e-9, "ids start at 1");
    check_close(number_at(first, "expiresAt"), 1500.0, 1e-9, "expiry is now + autoDismissMs");
    check(orbital::is_undefined(orbital::map_get(first, "extra")), "only type, message and title are kept");

    clock.set(1400);
    check(host.run_due_ticks(1400) == 0, "nothing expired yet");
    clock.set(1500);
    check(host.run_due_ticks(1500) == 1, "expired notifications are dismissed");
    check(host.current_state(h) == "Hidden", "empty list hides the toast");

    host.set_clock_interface(nullptr);
}

void test_tabs_initial_effects() {
    behavior::runtime_host host;
    const std::int64_t h = create_std_instance(host, "std/Tabs", json("{\"tabs\": [{\"id\": \"a\"}, {\"id\": \"b\"}]}"));
    check(orbital::string_value(orbital::map_get(host.entity_snapshot(h), "activeTab")) == "a", "initial INIT selects the first tab");

    check(host.dispatch(h, "SELECT_TAB", json("{\"tabId\": \"b\"}")).transitioned, "known tab selects");
    check(host.dispatch(h, "SELECT_TAB", json("{\"tabId\": \"zzz\"}")).guard_rejected, "unknown tab is rejected");
    check(orbital::string_value(orbital::map_get(host.entity_snapshot(h), "activeTab")) == "b", "active tab unchanged by rejection");
}

void test_search_debounced_completion() {
    behavior::runtime_host host;
    const std::int64_t h = create_std_instance(host, "std/Search", json("{\"debounceMs\": 30}"));

    (void)host.dispatch(h, "SEARCH", json("{\"term\": \"abc\"}"));
    check(host.current_state(h) == "Searching", "SEARCH starts searching");
    check(orbital::boolean_value(orbital::map_get(host.entity_snapshot(h), "isSearching")), "isSearching set");

    check(wait_for_state(host, h, "Idle"), "debounced SEARCH_COMPLETE should dispatch back to Idle");
    check(!orbital::boolean_value(orbital::map_get(host.entity_snapshot(h), "isSearching")), "isSearching cleared");
}

constexpr const char* k_faulty_guard_doc = R"json({
  "name": "std/FaultyGuard",
  "category": "ui-interaction",
  "stateMachine": {
    "states": ["A", "B"],
    "events": ["GO", "FAIL"],
    "transitions": [
      {"from": "A", "to": "B", "event": "GO", "guard": ["nope/op"]},
      {"from": "A", "event": "GO", "effects": [["set", "@entity.fallback", true]]},
      {"from": "A", "to": "B", "event": "FAIL", "effects": [["set", "@entity.written", 1], ["persist", "bogus"]]}
    ]
  }
})json";

void test_guard_error_policy() {
    behavior::runtime_host lenient;
    const std::int64_t def = lenient.store_definition(behavior::compile_definition_text(k_faulty_guard_doc));
    const std::int64_t h = lenient.create_instance(def);

    const behavior::dispatch_result r = lenient.dispatch(h, "GO");
    check(r.transitioned && r.transition_index == 1u, "failing guard falls through to the next candidate");
    check(lenient.current_state(h) == "A", "fallback transition keeps the state");
    check(orbital::boolean_value(orbital::map_get(lenient.entity_snapshot(h), "fallback")), "fallback effects ran");
    check(lenient.find_instance(h)->stats.guard_errors == 1, "guard error counted");

    behavior::host_config strict_config;
    strict_config.guard_policy = behavior::guard_error_policy::propagate;
    behavior::runtime_host strict(strict_config);
    const std::int64_t strict_def = strict.store_definition(behavior::compile_definition_text(k_faulty_guard_doc));
    const std::int64_t s = strict.create_instance(strict_def);
    check_throws<orbital::unknown_operator_error>([&] { (void)strict.dispatch(s, "GO"); }, "propagate policy rethrows");
    check(strict.current_state(s) == "A", "state unchanged after a propagated guard error");
}

void test_effect_failure_keeps_state() {
    behavior::runtime_host host;
    const std::int64_t def = host.store_definition(behavior::compile_definition_text(k_faulty_guard_doc));
    const std::int64_t h = host.create_instance(def);

    check_throws<orbital::eval_error>([&] { (void)host.dispatch(h, "FAIL"); }, "failing effect propagates");
    check(host.current_state(h) == "A", "state does not change when an effect fails");
    check_close(number_at(host.entity_snapshot(h), "written"), 1.0, 1e-9, "earlier writes are kept");

    bool logged = false;
    for (const orbital::log_record& rec : host.logs().snapshot()) {
        logged = logged || (rec.level == orbital::log_level::error && rec.category == "behavior");
    }
    check(logged, "effect failure is logged");
    check(host.dump_logs().find("created in state A") != std::string::npos, "creation is logged");
}

void test_host_lifecycle_and_ticker() {
    behavior::runtime_host host;
    const std::int64_t h = create_std_instance(host, "std/Modal");
    check(host.find_instance(h) != nullptr, "instance registered");
    check(host.dump_instance_entity(h).find("content=null") != std::string::npos, "entity dump lists defaults");

    host.destroy_instance(h);
    check(host.find_instance(h) == nullptr, "instance removed");
    check_throws<std::invalid_argument>([&] { host.destroy_instance(h); }, "double destroy");
    check_throws<std::invalid_argument>([&] { (void)host.dispatch(h, "OPEN"); }, "dispatch to a destroyed instance");

    check_throws<std::invalid_argument>([&] { host.start_ticker(std::chrono::milliseconds(0)); }, "ticker period must be positive");
    const std::int64_t loop = create_std_instance(host, "std/GameLoop");
    (void)host.dispatch(loop, "START");
    host.start_ticker(std::chrono::milliseconds(5));
    check(host.ticker_running(), "ticker running");
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (number_at(host.entity_snapshot(loop), "frameCount") < 1.0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    host.stop_ticker();
    check(!host.ticker_running(), "ticker stopped");
    check(number_at(host.entity_snapshot(loop), "frameCount") >= 1.0, "ticker drives frame ticks");

    host.clear_all();
    check(host.find_instance(loop) == nullptr, "clear_all drops instances");
}

void test_direct_instance_dispatch() {
    const std::shared_ptr<const behavior::definition> def = behavior::std_registry().find("std/Sort");
    std::shared_ptr<behavior::instance> inst = behavior::make_instance(*def);
    behavior::services svc;
    svc.now_ms = [] { return std::int64_t{0}; };

    (void)behavior::dispatch(*inst, "SORT", json("{\"field\": \"name\"}"), svc);
    (void)behavior::dispatch(*inst, "SORT", json("{\"field\": \"name\"}"), svc);
    check(orbital::string_value(inst->entity->get_path("sortDirection")) == "desc", "sorting the same field twice flips direction");

    behavior::instance unowned(def.get());
    check_throws<behavior::behavior_error>([&] { (void)behavior::dispatch(unowned, "SORT", orbital::make_map(), svc); },
                                           "instances must be shared-owned to dispatch");
}

}  // namespace

int main() {
    const std::vector<std::pair<std::string, std::function<void()>>> tests = {
        {"reader and printer", test_reader_and_printer},
        {"arithmetic coercion", test_arithmetic_coercion},
        {"logic short-circuit", test_logic_short_circuit},
        {"binding resolution", test_binding_resolution},
        {"let and lambdas", test_let_and_lambdas},
        {"std modules", test_std_modules},
        {"operator errors", test_operator_errors},
        {"effect operators", test_effect_operators},
        {"async debounce single emit", test_async_debounce_single_emit},
        {"async retry attempts", test_async_retry_attempts},
        {"async race/all/timeout", test_async_race_all_timeout},
        {"async busy worker pool", test_async_busy_worker_pool},
        {"evaluator teardown cancels timers", test_evaluator_teardown_cancels_timers},
        {"catalog validates", test_catalog_validates},
        {"registry queries", test_registry_queries},
        {"compile errors", test_compile_errors},
        {"pagination guards", test_pagination_guards},
        {"selection modes", test_selection_modes},
        {"required config", test_required_config},
        {"health emit queue and ticks", test_emit_queue_and_ticks_health},
        {"game loop frame ticks", test_game_loop_frame_ticks},
        {"poll config interval", test_poll_config_interval},
        {"notification auto-dismiss", test_notification_auto_dismiss},
        {"tabs initial effects", test_tabs_initial_effects},
        {"search debounced completion", test_search_debounced_completion},
        {"guard error policy", test_guard_error_policy},
        {"effect failure keeps state", test_effect_failure_keeps_state},
        {"host lifecycle and ticker", test_host_lifecycle_and_ticker},
        {"direct instance dispatch", test_direct_instance_dispatch},
    };

    std::size_t passed = 0;
    for (const auto& [name, test_fn] : tests) {
        try {
            test_fn();
            ++passed;
            std::cout << "[PASS] " << name << '\n';
        } catch (const std::exception& e) {
            std::cerr << "[FAIL] " << name << ": " << e.what() << '\n';
            return 1;
        }
    }

    std::cout << "All tests passed (" << passed << "/" << tests.size() << ").\n";
    return 0;
}
