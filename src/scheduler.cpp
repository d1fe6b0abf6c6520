#include "orbital/scheduler.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

namespace orbital {
namespace {

std::size_t effective_worker_count(std::size_t requested) {
    if (requested > 0) {
        return requested;
    }
    const auto hc = std::thread::hardware_concurrency();
    if (hc == 0) {
        return 2;
    }
    return hc > 4 ? 4 : hc;
}

}  // namespace

thread_pool_scheduler::thread_pool_scheduler(std::size_t worker_count) {
    const std::size_t count = effective_worker_count(worker_count);
    std::lock_guard<std::mutex> lock(mutex_);
    workers_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        start_worker_locked();
    }
}

thread_pool_scheduler::~thread_pool_scheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_cv_.notify_all();
    // Jobs still draining may submit more work, which can start more workers.
    while (true) {
        std::vector<std::thread> joining;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            joining.swap(workers_);
        }
        if (joining.empty()) {
            break;
        }
        for (std::thread& worker : joining) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }
}

job_id thread_pool_scheduler::submit(job_request req) {
    if (!req.fn) {
        throw std::invalid_argument("scheduler submit: empty job function");
    }

    auto state = std::make_shared<job_state>();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state->id = next_job_id_++;
        state->status = job_status::queued;
        state->timing.submitted_at = std::chrono::steady_clock::now();
        state->task_name = req.task_name;
        state->request = std::move(req);

        jobs_[state->id] = state;
        queue_.push(state->id);
        ++stats_.submitted;
        if (queue_.size() > idle_workers_) {
            start_worker_locked();
            ++stats_.extra_workers;
        }
    }

    work_cv_.notify_one();
    return state->id;
}

job_info thread_pool_scheduler::get_info(job_id id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return job_info{};
    }

    job_info info;
    info.status = it->second->status;
    info.timing = it->second->timing;
    info.task_name = it->second->task_name;
    info.error_text = it->second->error_text;
    return info;
}

bool thread_pool_scheduler::settled_locked(job_id id) const {
    const auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return true;
    }
    return it->second->status == job_status::done || it->second->status == job_status::failed;
}

std::shared_ptr<thread_pool_scheduler::job_state> thread_pool_scheduler::pop_runnable_locked() {
    while (!queue_.empty()) {
        const job_id id = queue_.front();
        queue_.pop();

        const auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            continue;
        }

        std::shared_ptr<job_state> state = it->second;
        const auto start = std::chrono::steady_clock::now();
        state->status = job_status::running;
        state->timing.started_at = start;
        ++stats_.started;
        stats_.queue_delay.observe(std::chrono::duration_cast<std::chrono::nanoseconds>(start - state->timing.submitted_at));
        return state;
    }
    return nullptr;
}

void thread_pool_scheduler::run_job(const std::shared_ptr<job_state>& state) {
    std::optional<value> result;
    std::exception_ptr error;
    std::string error_text;

    try {
        result = state->request.fn();
    } catch (const std::exception& e) {
        error = std::current_exception();
        error_text = e.what();
    } catch (...) {
        error = std::current_exception();
        error_text = "unknown exception";
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto finish = std::chrono::steady_clock::now();
        state->timing.finished_at = finish;
        stats_.run_time.observe(std::chrono::duration_cast<std::chrono::nanoseconds>(finish - state->timing.started_at));
        state->finish_seq = next_finish_seq_++;
        state->request.fn = nullptr;

        if (error) {
            state->status = job_status::failed;
            state->error = error;
            state->error_text = std::move(error_text);
            ++stats_.failed;
        } else {
            state->status = job_status::done;
            state->result = std::move(result);
            ++stats_.completed;
        }

        if (state->released) {
            jobs_.erase(state->id);
        }
    }

    done_cv_.notify_all();
}

void thread_pool_scheduler::start_worker_locked() {
    ++idle_workers_;
    workers_.emplace_back([this] { worker_loop(); });
}

void thread_pool_scheduler::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (stopping_ && queue_.empty()) {
            --idle_workers_;
            return;
        }

        std::shared_ptr<job_state> state = pop_runnable_locked();
        if (!state) {
            continue;
        }

        --idle_workers_;
        lock.unlock();
        run_job(state);
        lock.lock();
        ++idle_workers_;
    }
}

bool thread_pool_scheduler::wait(job_id id, std::optional<time_point> deadline) {
    const job_id ids[] = {id};
    return wait_any(ids, deadline).has_value();
}

std::optional<job_id> thread_pool_scheduler::wait_any(std::span<const job_id> ids, std::optional<time_point> deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        std::optional<job_id> winner;
        std::uint64_t best_seq = std::numeric_limits<std::uint64_t>::max();
        for (const job_id id : ids) {
            if (!settled_locked(id)) {
                continue;
            }
            const auto it = jobs_.find(id);
            const std::uint64_t seq = it == jobs_.end() ? std::numeric_limits<std::uint64_t>::max() : it->second->finish_seq;
            if (!winner || seq < best_seq) {
                winner = id;
                best_seq = seq;
            }
        }
        if (winner) {
            return winner;
        }

        if (deadline) {
            if (done_cv_.wait_until(lock, *deadline) == std::cv_status::timeout) {
                bool any_settled = false;
                for (const job_id id : ids) {
                    any_settled = any_settled || settled_locked(id);
                }
                if (!any_settled) {
                    return std::nullopt;
                }
            }
        } else {
            done_cv_.wait(lock);
        }
    }
}

value thread_pool_scheduler::take_result(job_id id) {
    std::optional<value> result;
    std::exception_ptr error;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            throw std::invalid_argument("take_result: unknown job " + std::to_string(id));
        }
        job_state& state = *(it->second);
        if (state.status != job_status::done && state.status != job_status::failed) {
            throw std::logic_error("take_result: job " + std::to_string(id) + " has not settled");
        }
        result = std::move(state.result);
        error = state.error;
        jobs_.erase(it);
    }

    if (error) {
        std::rethrow_exception(error);
    }
    return result ? *result : make_undefined();
}

void thread_pool_scheduler::release(job_id id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return;
    }
    if (it->second->status == job_status::done || it->second->status == job_status::failed) {
        jobs_.erase(it);
        return;
    }
    it->second->released = true;
}

void thread_pool_scheduler::wait_for_owner(const void* owner) {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this, owner] {
        for (const auto& [id, state] : jobs_) {
            const bool in_flight = state->status == job_status::queued || state->status == job_status::running;
            if (in_flight && state->request.owner == owner) {
                return false;
            }
        }
        return true;
    });
}

scheduler_profile_stats thread_pool_scheduler::stats_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::size_t thread_pool_scheduler::worker_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

const char* job_status_name(job_status st) noexcept {
    switch (st) {
        case job_status::queued:
            return "queued";
        case job_status::running:
            return "running";
        case job_status::done:
            return "done";
        case job_status::failed:
            return "failed";
        case job_status::unknown:
            return "unknown";
    }
    return "unknown";
}

}  // namespace orbital
