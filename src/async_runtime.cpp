#include "orbital/async_runtime.hpp"

#include <exception>
#include <utility>
#include <vector>

namespace orbital {

async_runtime::async_runtime(std::size_t worker_count, std::size_t log_capacity)
    : scheduler_(worker_count), logs_(log_capacity), timer_thread_([this] { timer_loop(); }) {}

async_runtime::~async_runtime() {
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        stopping_ = true;
        debounce_timers_.clear();
    }
    timers_cv_.notify_all();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

thread_pool_scheduler& async_runtime::scheduler_ref() noexcept {
    return scheduler_;
}

memory_log_sink& async_runtime::logs() noexcept {
    return logs_;
}

const memory_log_sink& async_runtime::logs() const noexcept {
    return logs_;
}

void async_runtime::log(log_level level, std::string category, std::string message, std::string instance) {
    write_log(logs_, level, std::move(category), std::move(instance), std::move(message));
}

void async_runtime::set_clock_interface(clock_interface* clock) noexcept {
    clock_ = clock;
}

std::int64_t async_runtime::now_ms() const {
    if (clock_) {
        return clock_->now_ms();
    }
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

void async_runtime::debounce(const std::string& key, std::chrono::milliseconds delay, std::function<void()> fire, const void* owner) {
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        debounce_timer& timer = debounce_timers_[key];
        timer.due = std::chrono::steady_clock::now() + delay;
        timer.fire = std::move(fire);
        timer.owner = owner;
    }
    timers_cv_.notify_all();
}

bool async_runtime::throttle(const std::string& key, std::int64_t window_ms) {
    const std::int64_t now = now_ms();
    std::lock_guard<std::mutex> lock(timers_mutex_);
    const auto it = throttle_last_fired_.find(key);
    if (it != throttle_last_fired_.end() && now - it->second < window_ms) {
        return false;
    }
    throttle_last_fired_[key] = now;
    return true;
}

void async_runtime::forget_owner(const void* owner) {
    {
        std::unique_lock<std::mutex> lock(timers_mutex_);
        std::erase_if(debounce_timers_, [owner](const auto& entry) { return entry.second.owner == owner; });
        timers_cv_.wait(lock, [this, owner] { return firing_owners_.count(owner) == 0; });
    }
    timers_cv_.notify_all();
    scheduler_.wait_for_owner(owner);
}

std::size_t async_runtime::pending_debounce_count() const {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    return debounce_timers_.size();
}

void async_runtime::clear_debounce_timers() {
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        debounce_timers_.clear();
    }
    timers_cv_.notify_all();
}

void async_runtime::clear_throttle_timestamps() {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    throttle_last_fired_.clear();
}

void async_runtime::reset() {
    clear_debounce_timers();
    clear_throttle_timestamps();
    logs_.clear();
}

void async_runtime::timer_loop() {
    std::unique_lock<std::mutex> lock(timers_mutex_);
    while (!stopping_) {
        if (debounce_timers_.empty()) {
            timers_cv_.wait(lock);
            continue;
        }

        auto next_due = std::chrono::steady_clock::time_point::max();
        for (const auto& [key, timer] : debounce_timers_) {
            if (timer.due < next_due) {
                next_due = timer.due;
            }
        }

        if (std::chrono::steady_clock::now() < next_due) {
            timers_cv_.wait_until(lock, next_due);
            continue;
        }

        const auto now = std::chrono::steady_clock::now();
        std::vector<std::pair<std::string, debounce_timer>> expired;
        for (auto it = debounce_timers_.begin(); it != debounce_timers_.end();) {
            if (it->second.due <= now) {
                firing_owners_.insert(it->second.owner);
                expired.emplace_back(it->first, std::move(it->second));
                it = debounce_timers_.erase(it);
            } else {
                ++it;
            }
        }

        lock.unlock();
        for (auto& [key, timer] : expired) {
            try {
                if (timer.fire) {
                    timer.fire();
                }
            } catch (const std::exception& e) {
                log(log_level::error, "async", "debounce '" + key + "' handler failed: " + e.what());
            }
        }
        lock.lock();
        for (const auto& [key, timer] : expired) {
            firing_owners_.erase(firing_owners_.find(timer.owner));
        }
        timers_cv_.notify_all();
    }
}

async_runtime& default_async_runtime() {
    static async_runtime runtime;
    return runtime;
}

}  // namespace orbital
