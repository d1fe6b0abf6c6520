#pragma once

#include <chrono>
#include <cstdint>

namespace orbital {

struct duration_stats {
    std::uint64_t count = 0;
    std::chrono::nanoseconds last{0};
    std::chrono::nanoseconds max{0};
    std::chrono::nanoseconds total{0};
    std::uint64_t over_budget_count = 0;

    void observe(std::chrono::nanoseconds sample, std::chrono::nanoseconds budget = std::chrono::nanoseconds{0});
};

struct scheduler_profile_stats {
    std::uint64_t submitted = 0;
    std::uint64_t started = 0;
    std::uint64_t completed = 0;
    std::uint64_t failed = 0;
    std::uint64_t extra_workers = 0;

    duration_stats queue_delay;
    duration_stats run_time;
};

// Per behavior instance.
struct dispatch_profile_stats {
    std::uint64_t events = 0;
    std::uint64_t transitions = 0;
    std::uint64_t guard_rejections = 0;
    std::uint64_t guard_errors = 0;
    std::uint64_t unmatched_events = 0;
    std::uint64_t ticks_run = 0;
    std::uint64_t ticks_skipped = 0;

    duration_stats dispatch_time;
    duration_stats tick_time;
};

}  // namespace orbital
