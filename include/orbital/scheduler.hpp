#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <span>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "orbital/profile.hpp"
#include "orbital/value.hpp"

namespace orbital {

using job_id = std::uint64_t;

enum class job_status {
    queued,
    running,
    done,
    failed,
    unknown
};

struct job_timing {
    std::chrono::steady_clock::time_point submitted_at{};
    std::chrono::steady_clock::time_point started_at{};
    std::chrono::steady_clock::time_point finished_at{};
};

struct job_info {
    job_status status = job_status::unknown;
    job_timing timing{};
    std::string task_name;
    std::string error_text;
};

struct job_request {
    std::string task_name;
    std::function<value()> fn;
    // Whatever fn refers to; wait_for_owner blocks until its jobs have finished.
    const void* owner = nullptr;
};

// Worker pool for concurrently evaluated effects. A job either produces a value or
// captures the exception it threw; take_result hands back one or rethrows the other.
class thread_pool_scheduler final {
public:
    using time_point = std::chrono::steady_clock::time_point;

    explicit thread_pool_scheduler(std::size_t worker_count = 0);
    ~thread_pool_scheduler();

    thread_pool_scheduler(const thread_pool_scheduler&) = delete;
    thread_pool_scheduler& operator=(const thread_pool_scheduler&) = delete;

    // Starts another worker when every worker is busy, so a new job never queues
    // behind abandoned ones.
    job_id submit(job_request req);
    job_info get_info(job_id id) const;

    // False when the deadline passed before the job settled.
    bool wait(job_id id, std::optional<time_point> deadline = std::nullopt);
    // Returns whichever of ids settled first, or nullopt on deadline.
    std::optional<job_id> wait_any(std::span<const job_id> ids, std::optional<time_point> deadline = std::nullopt);

    // The job must have settled. Forgets the job.
    value take_result(job_id id);
    // Forget a job; one still in flight is dropped once it finishes.
    void release(job_id id);

    void wait_for_owner(const void* owner);

    scheduler_profile_stats stats_snapshot() const;
    // Workers started so far.
    std::size_t worker_count() const;

private:
    struct job_state {
        job_id id = 0;
        job_status status = job_status::queued;
        job_timing timing{};
        std::string task_name;
        std::string error_text;
        job_request request;
        std::optional<value> result;
        std::exception_ptr error;
        std::uint64_t finish_seq = 0;
        bool released = false;
    };

    // Caller holds mutex_.
    void start_worker_locked();
    void worker_loop();
    void run_job(const std::shared_ptr<job_state>& state);
    // Caller holds mutex_. Pops the next runnable job, if any, and marks it running.
    std::shared_ptr<job_state> pop_runnable_locked();
    bool settled_locked(job_id id) const;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;
    bool stopping_ = false;
    job_id next_job_id_ = 1;
    std::uint64_t next_finish_seq_ = 1;
    std::size_t idle_workers_ = 0;

    std::queue<job_id> queue_;
    std::unordered_map<job_id, std::shared_ptr<job_state>> jobs_;
    scheduler_profile_stats stats_{};
    std::vector<std::thread> workers_;
};

const char* job_status_name(job_status st) noexcept;

}  // namespace orbital
