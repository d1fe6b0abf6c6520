#include "behavior/runtime_host.hpp"

#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

#include "orbital/context.hpp"

namespace behavior {

runtime_host::runtime_host(host_config config)
    : config_(config), ev_(config.ev ? config.ev : &orbital::default_evaluator()), logs_(config.log_capacity) {}

runtime_host::~runtime_host() {
    stop_ticker();
}

std::int64_t runtime_host::store_definition(definition def) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::int64_t handle = next_definition_handle_++;
    definitions_[handle] = std::make_shared<const definition>(std::move(def));
    return handle;
}

std::int64_t runtime_host::create_instance(std::int64_t definition_handle,
                                           const orbital::value& config_overrides,
                                           const orbital::value& entity_seed) {
    std::shared_ptr<const definition> def;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = definitions_.find(definition_handle);
        if (it == definitions_.end()) {
            throw std::invalid_argument("create_instance: unknown definition handle");
        }
        def = it->second;
    }

    std::shared_ptr<instance> inst = make_instance(*def, config_overrides, entity_seed, now_ms());
    std::int64_t handle = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handle = next_instance_handle_++;
        inst->instance_handle = handle;
        instances_[handle] = inst;
        instance_definitions_[handle] = def;
    }

    orbital::write_log(logs_, orbital::log_level::info, "behavior", def->name + "#" + std::to_string(handle),
                       "created in state " + inst->state);
    run_initial_effects(*inst, make_services());
    return handle;
}

void runtime_host::destroy_instance(std::int64_t handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (instances_.erase(handle) == 0) {
        throw std::invalid_argument("destroy_instance: unknown instance handle");
    }
    instance_definitions_.erase(handle);
}

const definition* runtime_host::find_definition(std::int64_t handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = definitions_.find(handle);
    return it == definitions_.end() ? nullptr : it->second.get();
}

instance* runtime_host::find_instance(std::int64_t handle) {
    return find_shared(handle).get();
}

const instance* runtime_host::find_instance(std::int64_t handle) const {
    return find_shared(handle).get();
}

std::shared_ptr<instance> runtime_host::find_shared(std::int64_t handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = instances_.find(handle);
    return it == instances_.end() ? nullptr : it->second;
}

dispatch_result runtime_host::dispatch(std::int64_t handle, const std::string& event, const orbital::value& payload) {
    std::shared_ptr<instance> inst = find_shared(handle);
    if (!inst) {
        throw std::invalid_argument("dispatch: unknown instance handle");
    }
    return behavior::dispatch(*inst, event, payload, make_services());
}

std::size_t runtime_host::run_due_ticks() {
    return run_due_ticks(now_ms());
}

std::size_t runtime_host::run_due_ticks(std::int64_t now) {
    std::vector<std::shared_ptr<instance>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live.reserve(instances_.size());
        for (const auto& [handle, inst] : instances_) {
            live.push_back(inst);
        }
    }

    const services svc = make_services();
    std::size_t ran = 0;
    for (const std::shared_ptr<instance>& inst : live) {
        ran += behavior::run_due_ticks(*inst, now, svc);
    }
    return ran;
}

void runtime_host::start_ticker(std::chrono::milliseconds period) {
    if (period.count() <= 0) {
        throw std::invalid_argument("start_ticker: period must be positive");
    }
    stop_ticker();
    {
        std::lock_guard<std::mutex> lock(ticker_mutex_);
        ticker_stopping_ = false;
    }
    ticker_running_ = true;
    ticker_thread_ = std::thread([this, period] { ticker_loop(period); });
}

void runtime_host::stop_ticker() {
    {
        std::lock_guard<std::mutex> lock(ticker_mutex_);
        ticker_stopping_ = true;
    }
    ticker_cv_.notify_all();
    if (ticker_thread_.joinable()) {
        ticker_thread_.join();
    }
    ticker_running_ = false;
}

bool runtime_host::ticker_running() const noexcept {
    return ticker_running_;
}

void runtime_host::ticker_loop(std::chrono::milliseconds period) {
    std::unique_lock<std::mutex> lock(ticker_mutex_);
    while (!ticker_stopping_) {
        if (ticker_cv_.wait_for(lock, period, [this] { return ticker_stopping_; })) {
            break;
        }
        lock.unlock();
        try {
            (void)run_due_ticks();
        } catch (const std::exception& e) {
            orbital::write_log(logs_, orbital::log_level::error, "tick", {}, std::string("ticker pass failed: ") + e.what());
        }
        lock.lock();
    }
}

void runtime_host::set_effect_handlers(orbital::effect_handlers handlers) {
    auto shared = std::make_shared<const orbital::effect_handlers>(std::move(handlers));
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_ = std::move(shared);
}

void runtime_host::set_emit_listener(emit_listener_fn listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    emit_listener_ = std::move(listener);
}

void runtime_host::set_clock_interface(orbital::clock_interface* clock) noexcept {
    clock_ = clock;
}

std::int64_t runtime_host::now_ms() const {
    const orbital::clock_interface* clock = clock_.load();
    return clock ? clock->now_ms() : orbital::wall_clock_ms();
}

orbital::value runtime_host::entity_snapshot(std::int64_t handle) const {
    std::shared_ptr<instance> inst = find_shared(handle);
    if (!inst) {
        throw std::invalid_argument("entity_snapshot: unknown instance handle");
    }
    return inst->entity->snapshot();
}

std::string runtime_host::current_state(std::int64_t handle) const {
    std::shared_ptr<instance> inst = find_shared(handle);
    if (!inst) {
        throw std::invalid_argument("current_state: unknown instance handle");
    }
    std::lock_guard<std::mutex> lock(inst->transaction);
    return inst->state;
}

orbital::memory_log_sink& runtime_host::logs() noexcept {
    return logs_;
}

const orbital::memory_log_sink& runtime_host::logs() const noexcept {
    return logs_;
}

const host_config& runtime_host::config() const noexcept {
    return config_;
}

void runtime_host::clear_logs() {
    logs_.clear();
}

void runtime_host::clear_all() {
    stop_ticker();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instances_.clear();
        instance_definitions_.clear();
        definitions_.clear();
        handlers_.reset();
        emit_listener_ = nullptr;
    }
    logs_.clear();
}

std::string runtime_host::dump_instance_stats(std::int64_t handle) const {
    std::shared_ptr<instance> inst = find_shared(handle);
    if (!inst) {
        throw std::invalid_argument("dump_instance_stats: unknown instance handle");
    }
    std::lock_guard<std::mutex> lock(inst->transaction);
    return dump_stats(*inst);
}

std::string runtime_host::dump_instance_entity(std::int64_t handle) const {
    std::shared_ptr<instance> inst = find_shared(handle);
    if (!inst) {
        throw std::invalid_argument("dump_instance_entity: unknown instance handle");
    }
    return dump_entity(*inst);
}

std::string runtime_host::dump_logs() const {
    return orbital::format_log_records(logs_.snapshot());
}

services runtime_host::make_services() {
    services svc;
    svc.ev = ev_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        svc.handlers = handlers_;
        svc.emit_listener = emit_listener_;
    }
    svc.logger = &logs_;
    svc.now_ms = [this] { return now_ms(); };
    svc.guard_policy = config_.guard_policy;
    svc.max_queued_events = config_.max_queued_events;
    svc.frame_interval_ms = config_.frame_interval_ms;
    return svc;
}

runtime_host& default_runtime_host() {
    static runtime_host host;
    return host;
}

}  // namespace behavior
