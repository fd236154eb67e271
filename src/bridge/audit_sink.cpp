/**
 * @file audit_sink.cpp
 * @brief Audit entry serialization and the bundled sinks
 *
 * @date 2025
 */

#include "sealbox/bridge/audit_sink.hpp"
#include "sealbox/core/execution_types.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sealbox {
namespace bridge {

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_value = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm tm_utc{};
    gmtime_r(&time_t_value, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

nlohmann::json AuditEntry::ToJson() const {
    nlohmann::json j;
    j["timestamp"] = FormatTimestamp(timestamp);
    j["user_id"] = user_id;
    j["function_id"] = function_id;
    j["execution_id"] = execution_id;
    j["action"] = action;
    j["subject"] = subject;
    j["success"] = success;
    if (!detail.empty()) {
        j["detail"] = detail;
    }
    return j;
}

// ============================================================================
// LoggingAuditSink
// ============================================================================

void LoggingAuditSink::Append(const AuditEntry& entry) {
    spdlog::info("[audit] {} {} user={} function={} execution={} success={}{}",
        entry.action, entry.subject, entry.user_id, entry.function_id,
        entry.execution_id, entry.success,
        entry.detail.empty() ? "" : " (" + entry.detail + ")");
}

// ============================================================================
// JsonLinesAuditSink
// ============================================================================

JsonLinesAuditSink::JsonLinesAuditSink(const std::filesystem::path& path)
    : path_(path) {
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw SealboxError("Failed to create audit log directory: " + ec.message());
        }
    }

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        throw SealboxError("Failed to open audit log: " + path_.string());
    }
    spdlog::debug("Audit log: {}", path_.string());
}

void JsonLinesAuditSink::Append(const AuditEntry& entry) {
    std::string line = entry.ToJson().dump();

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        throw SealboxError("Failed to write audit log: " + path_.string());
    }
}

// ============================================================================
// AsyncAuditSink
// ============================================================================

AsyncAuditSink::AsyncAuditSink(std::shared_ptr<AuditSink> downstream, std::size_t capacity)
    : downstream_(std::move(downstream))
    , capacity_(capacity == 0 ? 1 : capacity) {
    if (!downstream_) {
        throw SealboxError("AsyncAuditSink requires a downstream sink");
    }
    worker_ = std::thread(&AsyncAuditSink::WorkerLoop, this);
}

AsyncAuditSink::~AsyncAuditSink() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    not_empty_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AsyncAuditSink::Append(const AuditEntry& entry) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_) {
            dropped_.fetch_add(1, std::memory_order_acq_rel);
            spdlog::warn("Audit queue full ({} entries), dropping {} for {}",
                capacity_, entry.action, entry.execution_id);
            return;
        }
        queue_.push_back(entry);
    }
    not_empty_.notify_one();
}

void AsyncAuditSink::Flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_.wait(lock, [this] { return queue_.empty() && !in_flight_; });
}

void AsyncAuditSink::WorkerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        not_empty_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // stopping_ and nothing left to drain
            break;
        }

        AuditEntry entry = std::move(queue_.front());
        queue_.pop_front();
        in_flight_ = true;
        lock.unlock();

        try {
            downstream_->Append(entry);
        } catch (const std::exception& e) {
            spdlog::error("Audit sink failed for {} {}: {}", entry.action, entry.execution_id, e.what());
        }

        lock.lock();
        in_flight_ = false;
        if (queue_.empty()) {
            drained_.notify_all();
        }
    }
    drained_.notify_all();
}

} // namespace bridge
} // namespace sealbox
