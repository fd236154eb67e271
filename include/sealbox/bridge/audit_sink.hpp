/**
 * @file audit_sink.hpp
 * @brief Audit records for secret access and policy violations
 *
 * The engine only emits entries; where they end up is the sink's business.
 * Sinks are shared by concurrent executions and must be thread-safe.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sealbox {
namespace bridge {

/**
 * @struct AuditEntry
 * @brief One audited action
 *
 * Never carries secret values.
 */
struct AuditEntry {
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    std::int64_t user_id{0};
    std::string function_id;
    std::string execution_id;
    std::string action;         ///< "secret.read" or "policy.violation"
    std::string subject;        ///< Secret name or violated rule
    bool success{false};
    std::string detail;         ///< Optional reason

    nlohmann::json ToJson() const;
};

/// ISO-8601 UTC with milliseconds, e.g. "2025-01-31T12:00:00.123Z"
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

/**
 * @class AuditSink
 * @brief Destination for audit entries
 */
class AuditSink {
public:
    virtual ~AuditSink() = default;

    /**
     * @brief Record an entry
     *
     * Implementations may throw SealboxError; callers log and carry on.
     */
    virtual void Append(const AuditEntry& entry) = 0;
};

/**
 * @class LoggingAuditSink
 * @brief Writes entries through spdlog at info level
 */
class LoggingAuditSink : public AuditSink {
public:
    void Append(const AuditEntry& entry) override;
};

/**
 * @class JsonLinesAuditSink
 * @brief Append-only file, one JSON object per line
 */
class JsonLinesAuditSink : public AuditSink {
public:
    /**
     * @throws SealboxError if the file cannot be opened for appending
     */
    explicit JsonLinesAuditSink(const std::filesystem::path& path);

    void Append(const AuditEntry& entry) override;

private:
    std::mutex mutex_;
    std::filesystem::path path_;
    std::ofstream out_;
};

/**
 * @class AsyncAuditSink
 * @brief Decouples runs from a slow downstream sink
 *
 * Append() only enqueues. A worker thread forwards entries in order. When
 * the queue is full the entry is dropped with a warning rather than blocking
 * the execution. The destructor drains what is queued.
 */
class AsyncAuditSink : public AuditSink {
public:
    AsyncAuditSink(std::shared_ptr<AuditSink> downstream, std::size_t capacity = 4096);
    ~AsyncAuditSink() override;

    AsyncAuditSink(const AsyncAuditSink&) = delete;
    AsyncAuditSink& operator=(const AsyncAuditSink&) = delete;

    void Append(const AuditEntry& entry) override;

    /// Block until everything enqueued so far was handed downstream
    void Flush();

    std::uint64_t Dropped() const { return dropped_.load(std::memory_order_acquire); }

private:
    void WorkerLoop();

    std::shared_ptr<AuditSink> downstream_;
    const std::size_t capacity_;

    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable drained_;
    std::deque<AuditEntry> queue_;
    bool in_flight_{false};
    bool stopping_{false};

    std::atomic<std::uint64_t> dropped_{0};
    std::thread worker_;
};

} // namespace bridge
} // namespace sealbox
