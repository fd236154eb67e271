/**
 * @file sandbox_policy.hpp
 * @brief Capability allow-list and per-run policy state
 *
 * PolicyConfig is immutable deployment configuration shared by every run.
 * SandboxPolicy is built fresh for each run from that configuration; its only
 * mutable state is the step counter, the first recorded violation and the
 * console accounting.
 *
 * @date 2025
 */

#pragma once

#include "sealbox/core/resource_limiter.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sealbox {
namespace policy {

/**
 * @struct NetworkRules
 * @brief Outbound network rules enforced on every fetch()
 */
struct NetworkRules {
    bool enabled{true};                               ///< fetch() exposed at all
    std::vector<std::string> allowed_hosts;           ///< Exact or sub-domain match
    std::vector<std::string> allowed_methods{"GET", "POST", "PUT", "PATCH", "DELETE", "HEAD"};
    std::vector<std::string> credential_domains;      ///< May receive sensitive headers
    std::vector<std::string> sensitive_headers{
        "authorization", "cookie", "proxy-authorization", "x-api-key"
    };
    std::size_t max_request_body_bytes{1024 * 1024};  ///< 1 MB
    std::size_t max_response_bytes{5 * 1024 * 1024};  ///< 5 MB
    std::uint32_t rate_limit_requests{30};            ///< Per host per window
    std::int64_t rate_limit_window_ms{60000};
    std::uint32_t max_requests_per_execution{20};
    std::int64_t request_timeout_ms{10000};           ///< Capped by remaining budget
};

/**
 * @struct ValueLimits
 * @brief Shape limits applied to parameters and return values
 */
struct ValueLimits {
    std::size_t max_bytes{1024 * 1024};               ///< Serialized JSON size
    std::size_t max_depth{32};                        ///< Nesting depth
    std::size_t max_entries{1000};                    ///< Per array / object
    std::vector<std::string> forbidden_keys{"__proto__", "constructor", "prototype"};
    std::vector<std::string> forbidden_patterns{
        R"(function\s*\*?\s*[A-Za-z0-9_$]*\s*\()",
        R"(require\s*\()",
        R"(import\s*\()",
        R"(process\s*\.\s*(binding|mainModule|env))",
        R"(constructor\s*\.\s*constructor)",
        R"(__proto__)"
    };
};

/**
 * @struct PolicyConfig
 * @brief Static policy configuration for all runs
 */
struct PolicyConfig {
    /// Globals that survive sandbox setup
    std::vector<std::string> allowed_globals{
        "Object", "Array", "String", "Number", "Boolean", "Symbol", "BigInt",
        "Date", "RegExp", "Math", "JSON", "Map", "Set", "WeakMap", "WeakSet",
        "Promise", "Proxy", "Reflect",
        "ArrayBuffer", "DataView", "Int8Array", "Uint8Array", "Uint8ClampedArray",
        "Int16Array", "Uint16Array", "Int32Array", "Uint32Array",
        "Float32Array", "Float64Array", "BigInt64Array", "BigUint64Array",
        "Error", "TypeError", "RangeError", "SyntaxError", "ReferenceError",
        "EvalError", "URIError", "AggregateError", "InternalError",
        "parseInt", "parseFloat", "isNaN", "isFinite",
        "encodeURIComponent", "decodeURIComponent", "encodeURI", "decodeURI",
        "NaN", "Infinity", "undefined", "globalThis",
        "console", "fetch", "getSecret", "secrets", "crypto",
        "executionContext", "params"
    };

    NetworkRules network;
    ValueLimits values;

    std::uint64_t max_steps{2000000};                 ///< Interpreter checkpoints per run
    std::size_t max_stack_bytes{1024 * 1024};         ///< Interpreter native stack
    std::size_t max_log_entries{100};
    std::size_t max_log_bytes{64 * 1024};
};

/**
 * @struct PolicyViolation
 * @brief A disallowed capability use
 */
struct PolicyViolation {
    std::string rule;       ///< e.g. "network.host", "dynamic-code"
    std::string detail;     ///< Human readable description (never contains secrets)
};

/**
 * @class SandboxPolicy
 * @brief Per-run view of the policy configuration
 *
 * Built once per execution; discarded with the execution context.
 *
 * **Thread Safety**: Step() and the violation record are touched by the
 * interpreter thread; Steps() may be read from any thread.
 */
class SandboxPolicy {
public:
    explicit SandboxPolicy(std::shared_ptr<const PolicyConfig> config);

    SandboxPolicy(const SandboxPolicy&) = delete;
    SandboxPolicy& operator=(const SandboxPolicy&) = delete;

    const PolicyConfig& Config() const { return *config_; }

    bool IsGlobalAllowed(const std::string& name) const;

    /**
     * @brief Advance the step guard by one checkpoint
     * @return ResourceViolation{kind "steps"} once the ceiling is crossed
     */
    std::optional<core::ResourceViolation> Step();

    std::uint64_t Steps() const { return steps_.load(std::memory_order_acquire); }

    /**
     * @brief Record a violation; only the first one is kept
     * @return true if this was the first violation of the run
     */
    bool RecordViolation(PolicyViolation violation);

    std::optional<PolicyViolation> FirstViolation() const;

    /**
     * @brief Account one console line against the log limits
     * @return Possibly truncated line to keep, or nullopt when the budget is spent
     */
    std::optional<std::string> AdmitLog(const std::string& line);

    bool LogsTruncated() const { return logs_truncated_; }

private:
    std::shared_ptr<const PolicyConfig> config_;

    std::atomic<std::uint64_t> steps_{0};

    mutable std::mutex violation_mutex_;
    std::optional<PolicyViolation> violation_;

    std::size_t log_entries_{0};
    std::size_t log_bytes_{0};
    bool logs_truncated_{false};
};

} // namespace policy
} // namespace sealbox
