#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "behavior/instance.hpp"
#include "orbital/eval.hpp"
#include "orbital/logging.hpp"

namespace behavior {

enum class guard_error_policy {
    // A throwing guard counts as false: logged, the transition is skipped and the
    // remaining candidates are still considered.
    treat_as_false,
    propagate
};

struct dispatch_result {
    bool transitioned = false;
    std::string from_state;
    std::string to_state;
    std::optional<std::size_t> transition_index;
    // At least one candidate matched event and state but its guard said no.
    bool guard_rejected = false;
    std::size_t effects_run = 0;
};

using emit_listener_fn = std::function<void(std::int64_t instance_handle, const std::string& event, const orbital::value& payload)>;
using epoch_clock_fn = std::function<std::int64_t()>;

struct services {
    const orbital::evaluator* ev = nullptr;
    // Host handlers. mutate_entity, when set, observes changes after the instance applied them.
    std::shared_ptr<const orbital::effect_handlers> handlers;
    emit_listener_fn emit_listener;
    orbital::log_sink* logger = nullptr;
    // Epoch milliseconds; empty selects the wall clock.
    epoch_clock_fn now_ms;
    guard_error_policy guard_policy = guard_error_policy::treat_as_false;
    // Upper bound on emitted events drained by one transaction.
    std::size_t max_queued_events = 64;
    std::int64_t frame_interval_ms = k_frame_interval_ms;
};

// Resolves configuration, seeds entity data from field defaults and then entity_seed,
// and starts in the initial state. Tick intervals count from created_at_ms.
std::shared_ptr<instance> make_instance(const definition& def,
                                        const orbital::value& config_overrides = orbital::make_map(),
                                        const orbital::value& entity_seed = orbital::make_map(),
                                        std::int64_t created_at_ms = 0);

// Runs one event to completion, then every declared event its effects emitted.
// The result describes the first event only.
dispatch_result dispatch(instance& inst, const std::string& event, const orbital::value& payload, const services& svc);

// Returns how many ticks ran their effects.
std::size_t run_due_ticks(instance& inst, std::int64_t now_ms, const services& svc);

void run_initial_effects(instance& inst, const services& svc);

orbital::eval_context make_eval_context(const instance& inst, const orbital::value& payload, std::int64_t now_ms);

}  // namespace behavior
