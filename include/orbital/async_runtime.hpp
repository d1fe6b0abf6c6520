#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "orbital/logging.hpp"
#include "orbital/scheduler.hpp"

namespace orbital {

class clock_interface {
public:
    virtual ~clock_interface() = default;
    virtual std::int64_t now_ms() const = 0;
};

// Process-wide state behind the async/ operators: the worker pool, the debounce
// timers and throttle timestamps (keyed by event name), and the log sink.
class async_runtime {
public:
    explicit async_runtime(std::size_t worker_count = 0, std::size_t log_capacity = 1024);
    ~async_runtime();

    async_runtime(const async_runtime&) = delete;
    async_runtime& operator=(const async_runtime&) = delete;

    thread_pool_scheduler& scheduler_ref() noexcept;

    memory_log_sink& logs() noexcept;
    const memory_log_sink& logs() const noexcept;
    void log(log_level level, std::string category, std::string message, std::string instance = {});

    // nullptr restores the steady clock.
    void set_clock_interface(clock_interface* clock) noexcept;
    std::int64_t now_ms() const;

    // Cancels any pending timer for key and arms a new one. fire runs on the timer thread.
    void debounce(const std::string& key, std::chrono::milliseconds delay, std::function<void()> fire, const void* owner = nullptr);
    // True when the call may fire; the timestamp is recorded in that case.
    bool throttle(const std::string& key, std::int64_t window_ms);

    // Drops the owner's pending debounce timers and blocks until none of its timers
    // or scheduler jobs are still running.
    void forget_owner(const void* owner);

    std::size_t pending_debounce_count() const;
    void clear_debounce_timers();
    void clear_throttle_timestamps();
    void reset();

private:
    struct debounce_timer {
        std::chrono::steady_clock::time_point due{};
        std::function<void()> fire;
        const void* owner = nullptr;
    };

    void timer_loop();

    thread_pool_scheduler scheduler_;
    memory_log_sink logs_;
    clock_interface* clock_ = nullptr;

    mutable std::mutex timers_mutex_;
    std::condition_variable timers_cv_;
    bool stopping_ = false;
    std::map<std::string, debounce_timer> debounce_timers_;
    std::map<std::string, std::int64_t> throttle_last_fired_;
    std::multiset<const void*> firing_owners_;
    std::thread timer_thread_;
};

async_runtime& default_async_runtime();

}  // namespace orbital
