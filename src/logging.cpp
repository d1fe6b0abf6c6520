#include "orbital/logging.hpp"

#include <sstream>
#include <utility>

namespace orbital {

memory_log_sink::memory_log_sink(std::size_t capacity_records) : capacity_(capacity_records) {
    records_.reserve(capacity_);
}

void memory_log_sink::write(const log_record& rec) {
    std::lock_guard<std::mutex> lock(mutex_);

    log_record copy = rec;
    copy.sequence = ++sequence_;

    if (capacity_ == 0) {
        return;
    }

    if (records_.size() == capacity_) {
        records_.erase(records_.begin());
    }
    records_.push_back(std::move(copy));
}

std::vector<log_record> memory_log_sink::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::size_t memory_log_sink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::size_t memory_log_sink::capacity() const {
    return capacity_;
}

void memory_log_sink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

const char* log_level_name(log_level level) noexcept {
    switch (level) {
        case log_level::debug:
            return "debug";
        case log_level::info:
            return "info";
        case log_level::warn:
            return "warn";
        case log_level::error:
            return "error";
    }
    return "unknown";
}

void write_log(log_sink& sink, log_level level, std::string category, std::string instance, std::string message) {
    log_record rec;
    rec.ts = std::chrono::steady_clock::now();
    rec.level = level;
    rec.category = std::move(category);
    rec.instance = std::move(instance);
    rec.message = std::move(message);
    sink.write(rec);
}

std::string format_log_records(const std::vector<log_record>& records) {
    std::ostringstream out;
    for (const log_record& rec : records) {
        out << rec.sequence << " level=" << log_level_name(rec.level) << " ts_ns="
            << std::chrono::duration_cast<std::chrono::nanoseconds>(rec.ts.time_since_epoch()).count()
            << " category=" << rec.category;
        if (!rec.instance.empty()) {
            out << " instance=" << rec.instance;
        }
        out << " msg=" << rec.message << '\n';
    }
    return out.str();
}

}  // namespace orbital
