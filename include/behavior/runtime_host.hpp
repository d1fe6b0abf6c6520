#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "behavior/compiler.hpp"
#include "behavior/runtime.hpp"
#include "orbital/async_runtime.hpp"
#include "orbital/eval.hpp"

namespace behavior {

struct host_config {
    guard_error_policy guard_policy = guard_error_policy::treat_as_false;
    std::size_t log_capacity = 4096;
    std::size_t max_queued_events = 64;
    std::int64_t frame_interval_ms = k_frame_interval_ms;
    // nullptr selects orbital::default_evaluator().
    const orbital::evaluator* ev = nullptr;
};

// Owns definitions and instances by handle and wires them to effect handlers,
// an emit listener, a clock and a log sink.
class runtime_host {
public:
    explicit runtime_host(host_config config = {});
    ~runtime_host();

    runtime_host(const runtime_host&) = delete;
    runtime_host& operator=(const runtime_host&) = delete;

    std::int64_t store_definition(definition def);
    std::int64_t create_instance(std::int64_t definition_handle,
                                 const orbital::value& config_overrides = orbital::make_map(),
                                 const orbital::value& entity_seed = orbital::make_map());
    void destroy_instance(std::int64_t handle);

    const definition* find_definition(std::int64_t handle) const;
    instance* find_instance(std::int64_t handle);
    const instance* find_instance(std::int64_t handle) const;

    dispatch_result dispatch(std::int64_t handle, const std::string& event, const orbital::value& payload = orbital::make_map());
    std::size_t run_due_ticks();
    std::size_t run_due_ticks(std::int64_t now_ms);

    // Drives run_due_ticks from a background thread.
    void start_ticker(std::chrono::milliseconds period);
    void stop_ticker();
    [[nodiscard]] bool ticker_running() const noexcept;

    void set_effect_handlers(orbital::effect_handlers handlers);
    void set_emit_listener(emit_listener_fn listener);
    // nullptr restores the wall clock.
    void set_clock_interface(orbital::clock_interface* clock) noexcept;
    [[nodiscard]] std::int64_t now_ms() const;

    [[nodiscard]] orbital::value entity_snapshot(std::int64_t handle) const;
    [[nodiscard]] std::string current_state(std::int64_t handle) const;

    orbital::memory_log_sink& logs() noexcept;
    const orbital::memory_log_sink& logs() const noexcept;
    const host_config& config() const noexcept;

    void clear_logs();
    void clear_all();

    std::string dump_instance_stats(std::int64_t handle) const;
    std::string dump_instance_entity(std::int64_t handle) const;
    std::string dump_logs() const;

private:
    services make_services();
    std::shared_ptr<instance> find_shared(std::int64_t handle) const;
    void ticker_loop(std::chrono::milliseconds period);

    host_config config_;
    const orbital::evaluator* ev_;

    mutable std::mutex mutex_;
    std::int64_t next_definition_handle_ = 1;
    std::int64_t next_instance_handle_ = 1;
    std::unordered_map<std::int64_t, std::shared_ptr<const definition>> definitions_;
    std::unordered_map<std::int64_t, std::shared_ptr<instance>> instances_;
    // Keeps each instance's definition alive as long as the instance.
    std::unordered_map<std::int64_t, std::shared_ptr<const definition>> instance_definitions_;

    std::shared_ptr<const orbital::effect_handlers> handlers_;
    emit_listener_fn emit_listener_;
    std::atomic<orbital::clock_interface*> clock_{nullptr};
    orbital::memory_log_sink logs_;

    std::mutex ticker_mutex_;
    std::condition_variable ticker_cv_;
    bool ticker_stopping_ = false;
    std::atomic<bool> ticker_running_{false};
    std::thread ticker_thread_;
};

runtime_host& default_runtime_host();

}  // namespace behavior
