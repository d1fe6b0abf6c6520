#include "behavior/runtime.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <numeric>
#include <optional>
#include <utility>

#include "behavior/compiler.hpp"
#include "behavior/error.hpp"

namespace behavior {
namespace {

std::string instance_label(const instance& inst) {
    return (inst.def ? inst.def->name : std::string("?")) + "#" + std::to_string(inst.instance_handle);
}

void log_event(const services& svc, const instance& inst, orbital::log_level level, std::string category, std::string message) {
    if (!svc.logger) {
        return;
    }
    orbital::write_log(*svc.logger, level, std::move(category), instance_label(inst), std::move(message));
}

std::int64_t current_time(const services& svc) {
    return svc.now_ms ? svc.now_ms() : orbital::wall_clock_ms();
}

const orbital::evaluator& evaluator_of(const services& svc) {
    return svc.ev ? *svc.ev : orbital::default_evaluator();
}

// Holds the instance's transaction for one dispatch, tick pass or initial-effects run.
class transaction_scope {
public:
    explicit transaction_scope(instance& inst) : inst_(inst), lock_(inst.transaction) {
        std::lock_guard<std::mutex> queue_lock(inst_.queue_mutex);
        inst_.in_transaction = true;
    }

    ~transaction_scope() {
        std::lock_guard<std::mutex> queue_lock(inst_.queue_mutex);
        inst_.in_transaction = false;
        inst_.pending.clear();
    }

    transaction_scope(const transaction_scope&) = delete;
    transaction_scope& operator=(const transaction_scope&) = delete;

    // An empty queue closes the transaction to further queueing in the same step,
    // so an emitter racing the close dispatches on its own instead.
    std::optional<pending_event> next() {
        std::lock_guard<std::mutex> queue_lock(inst_.queue_mutex);
        if (inst_.pending.empty()) {
            inst_.in_transaction = false;
            return std::nullopt;
        }
        pending_event front = std::move(inst_.pending.front());
        inst_.pending.pop_front();
        return front;
    }

private:
    instance& inst_;
    std::unique_lock<std::mutex> lock_;
};

void route_emitted(instance& inst, const std::string& event, const orbital::value& payload, const services& svc);

std::shared_ptr<const orbital::effect_handlers> instance_handlers(instance& inst, const services& svc) {
    orbital::effect_handlers handlers = svc.handlers ? *svc.handlers : orbital::effect_handlers{};

    std::function<void(const orbital::map_entries&)> observer = handlers.mutate_entity;
    std::shared_ptr<orbital::entity_store> store = inst.entity;
    handlers.mutate_entity = [store, observer = std::move(observer)](const orbital::map_entries& changes) {
        store->apply_changes(changes);
        if (observer) {
            observer(changes);
        }
    };

    std::weak_ptr<instance> weak = inst.weak_from_this();
    handlers.emit = [weak, svc](const std::string& event, const orbital::value& payload) {
        if (std::shared_ptr<instance> live = weak.lock()) {
            route_emitted(*live, event, payload, svc);
        }
    };

    return std::make_shared<const orbital::effect_handlers>(std::move(handlers));
}

bool guard_passes(instance& inst, const orbital::sexpr& guard, const orbital::eval_context& ctx, const services& svc, const std::string& where) {
    try {
        return evaluator_of(svc).evaluate_guard(guard, ctx);
    } catch (const std::exception& e) {
        ++inst.stats.guard_errors;
        if (svc.guard_policy == guard_error_policy::propagate) {
            throw;
        }
        log_event(svc, inst, orbital::log_level::warn, "behavior", where + ": guard failed, treated as false: " + e.what());
        return false;
    }
}

std::size_t run_effects(instance& inst,
                        const std::vector<orbital::sexpr>& effects,
                        const orbital::eval_context& ctx,
                        const services& svc,
                        const std::string& where) {
    const orbital::evaluator& ev = evaluator_of(svc);
    std::size_t ran = 0;
    for (const orbital::sexpr& effect : effects) {
        try {
            (void)ev.evaluate(effect, ctx);
        } catch (const std::exception& e) {
            log_event(svc, inst, orbital::log_level::error, "behavior", where + ": effect " + std::to_string(ran + 1) + " failed: " + e.what());
            throw;
        }
        ++ran;
    }
    return ran;
}

dispatch_result process_event(instance& inst, const std::string& event, const orbital::value& payload, const services& svc) {
    const auto started = std::chrono::steady_clock::now();
    const definition& def = *inst.def;

    dispatch_result result;
    result.from_state = inst.state;
    result.to_state = inst.state;
    ++inst.stats.events;

    orbital::eval_context ctx = make_eval_context(inst, payload, current_time(svc));
    for (std::size_t i = 0; i < def.transitions.size(); ++i) {
        const transition& t = def.transitions[i];
        if (t.event != event || !accepts_state(t, inst.state)) {
            continue;
        }
        const std::string where = event + " transition " + std::to_string(i);
        if (t.guard && !guard_passes(inst, *t.guard, ctx, svc, where)) {
            result.guard_rejected = true;
            ++inst.stats.guard_rejections;
            continue;
        }

        orbital::eval_context effect_ctx = ctx;
        effect_ctx.handlers = instance_handlers(inst, svc);
        result.effects_run = run_effects(inst, t.effects, effect_ctx, svc, where);

        if (t.to) {
            inst.state = *t.to;
        }
        result.transitioned = true;
        result.transition_index = i;
        result.to_state = inst.state;
        ++inst.stats.transitions;
        log_event(svc, inst, orbital::log_level::debug, "behavior", event + ": " + result.from_state + " -> " + result.to_state);
        break;
    }

    if (!result.transitioned && !result.guard_rejected) {
        ++inst.stats.unmatched_events;
        log_event(svc, inst, orbital::log_level::debug, "behavior", event + ": no transition from " + inst.state);
    }

    inst.stats.dispatch_time.observe(std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - started));
    return result;
}

void drain_pending(instance& inst, transaction_scope& scope, const services& svc) {
    std::size_t drained = 0;
    while (std::optional<pending_event> next = scope.next()) {
        if (drained >= svc.max_queued_events) {
            log_event(svc, inst, orbital::log_level::warn, "behavior", "queued event " + next->event + " dropped: limit reached");
            continue;
        }
        ++drained;
        (void)process_event(inst, next->event, next->payload, svc);
    }
}

void route_emitted(instance& inst, const std::string& event, const orbital::value& payload, const services& svc) {
    if (svc.emit_listener) {
        svc.emit_listener(inst.instance_handle, event, payload);
    }
    if (!inst.def || !inst.def->has_event(event)) {
        return;
    }

    {
        std::lock_guard<std::mutex> queue_lock(inst.queue_mutex);
        if (inst.in_transaction) {
            if (inst.pending.size() >= svc.max_queued_events) {
                log_event(svc, inst, orbital::log_level::warn, "behavior", "queued event " + event + " dropped: queue full");
                return;
            }
            inst.pending.push_back(pending_event{event, payload});
            return;
        }
    }

    // Emitted outside any transaction, e.g. by a debounce timer.
    (void)dispatch(inst, event, payload, svc);
}

std::optional<std::int64_t> tick_interval_ms(instance& inst, const tick_decl& tick, const services& svc) {
    switch (tick.interval.kind) {
        case interval_kind::frame:
            return svc.frame_interval_ms;
        case interval_kind::fixed_ms:
            return static_cast<std::int64_t>(tick.interval.ms);
        case interval_kind::config_ref: {
            const double ms = orbital::to_number(orbital::map_get(inst.config, tick.interval.config_key));
            if (!(ms > 0.0)) {
                log_event(svc, inst, orbital::log_level::debug, "tick",
                          tick.name + ": interval @config." + tick.interval.config_key + " is not positive, skipped");
                return std::nullopt;
            }
            return static_cast<std::int64_t>(ms);
        }
    }
    return std::nullopt;
}

void require_dispatchable(const instance& inst, const char* where) {
    if (!inst.def) {
        throw behavior_error(std::string(where) + ": instance has no definition");
    }
    if (inst.weak_from_this().expired()) {
        throw behavior_error(std::string(where) + ": instance must be owned by a std::shared_ptr");
    }
}

}  // namespace

std::shared_ptr<instance> make_instance(const definition& def,
                                        const orbital::value& config_overrides,
                                        const orbital::value& entity_seed,
                                        std::int64_t created_at_ms) {
    auto inst = std::make_shared<instance>(&def);
    inst->config = resolve_config(def, config_overrides);

    orbital::map_entries data = orbital::map_value(default_entity_data(def));
    if (orbital::is_map(entity_seed)) {
        for (const auto& [key, item] : orbital::map_value(entity_seed)) {
            data[key] = item;
        }
    }
    inst->entity = std::make_shared<orbital::entity_store>(orbital::make_map(std::move(data)));
    inst->state = def.initial;

    orbital::singleton_map singletons;
    singletons["config"] = inst->config;
    inst->singletons = std::make_shared<const orbital::singleton_map>(std::move(singletons));

    inst->tick_last_run_ms.assign(def.ticks.size(), created_at_ms);
    return inst;
}

orbital::eval_context make_eval_context(const instance& inst, const orbital::value& payload, std::int64_t now_ms) {
    orbital::eval_context ctx;
    ctx.entity = inst.entity;
    ctx.payload = payload;
    ctx.state = inst.state;
    ctx.now = now_ms;
    ctx.user = inst.user;
    ctx.singletons = inst.singletons ? inst.singletons : std::make_shared<const orbital::singleton_map>();
    ctx.locals = std::make_shared<const orbital::local_map>();
    return ctx;
}

dispatch_result dispatch(instance& inst, const std::string& event, const orbital::value& payload, const services& svc) {
    require_dispatchable(inst, "dispatch");
    transaction_scope scope(inst);
    dispatch_result first = process_event(inst, event, payload, svc);
    drain_pending(inst, scope, svc);
    return first;
}

std::size_t run_due_ticks(instance& inst, std::int64_t now_ms, const services& svc) {
    require_dispatchable(inst, "run_due_ticks");
    const definition& def = *inst.def;
    if (def.ticks.empty()) {
        return 0;
    }

    transaction_scope scope(inst);
    const auto started = std::chrono::steady_clock::now();
    if (inst.tick_last_run_ms.size() != def.ticks.size()) {
        inst.tick_last_run_ms.assign(def.ticks.size(), now_ms);
    }

    // Higher priority first; declaration order breaks ties.
    std::vector<std::size_t> order(def.ticks.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return def.ticks[a].priority > def.ticks[b].priority;
    });

    std::size_t ran = 0;
    for (std::size_t index : order) {
        const tick_decl& tick = def.ticks[index];
        const std::optional<std::int64_t> interval = tick_interval_ms(inst, tick, svc);
        if (!interval || now_ms - inst.tick_last_run_ms[index] < *interval) {
            continue;
        }
        if (!tick.applies_to.empty() &&
            std::find(tick.applies_to.begin(), tick.applies_to.end(), inst.state) == tick.applies_to.end()) {
            ++inst.stats.ticks_skipped;
            continue;
        }

        orbital::eval_context ctx = make_eval_context(inst, orbital::make_map(), now_ms);
        if (tick.guard && !guard_passes(inst, *tick.guard, ctx, svc, "tick " + tick.name)) {
            ++inst.stats.ticks_skipped;
            continue;
        }

        ctx.handlers = instance_handlers(inst, svc);
        (void)run_effects(inst, tick.effects, ctx, svc, "tick " + tick.name);
        inst.tick_last_run_ms[index] = now_ms;
        ++inst.stats.ticks_run;
        ++ran;
    }

    inst.stats.tick_time.observe(std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - started));
    drain_pending(inst, scope, svc);
    return ran;
}

void run_initial_effects(instance& inst, const services& svc) {
    require_dispatchable(inst, "run_initial_effects");
    if (inst.def->initial_effects.empty()) {
        return;
    }
    transaction_scope scope(inst);
    orbital::eval_context ctx = make_eval_context(inst, orbital::make_map(), current_time(svc));
    ctx.handlers = instance_handlers(inst, svc);
    (void)run_effects(inst, inst.def->initial_effects, ctx, svc, "initial effects");
    drain_pending(inst, scope, svc);
}

}  // namespace behavior
