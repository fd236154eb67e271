/**
 * @file network_guard.hpp
 * @brief Policy checks for the sandboxed fetch()
 *
 * Every outbound request is checked here before it reaches the transport:
 * - Encrypted transport only (https)
 * - Host allow-list (exact or sub-domain match); IP literals and localhost refused
 * - HTTP method allow-list and request body ceiling
 * - Sensitive headers only towards credential-trusted domains
 * - Per-execution request cap and per-destination rate limit
 *
 * @date 2025
 */

#pragma once

#include "sealbox/bridge/http_transport.hpp"
#include "sealbox/policy/sandbox_policy.hpp"

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace sealbox {
namespace policy {

/**
 * @struct ParsedUrl
 * @brief Minimal URL split used for policy decisions
 */
struct ParsedUrl {
    std::string scheme;     ///< Lowercased
    std::string host;       ///< Lowercased, brackets kept for IPv6
    std::string port;       ///< Empty when absent
    std::string path;       ///< Remainder after the authority
    bool has_userinfo{false};

    static std::optional<ParsedUrl> Parse(const std::string& url);
};

/**
 * @class HostRateLimiter
 * @brief Sliding-window request counter per destination host
 *
 * Shared by all executions of one engine. Thread-safe.
 */
class HostRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Count a request towards host if the window has room
     * @return false when max_requests were already made within window
     */
    bool Admit(const std::string& host, std::uint32_t max_requests,
               std::chrono::milliseconds window, Clock::time_point now = Clock::now());

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::deque<Clock::time_point>> history_;
};

/**
 * @class NetworkGuard
 * @brief Per-run network policy enforcement
 */
class NetworkGuard {
public:
    NetworkGuard(const NetworkRules& rules, std::shared_ptr<HostRateLimiter> rate_limiter);

    /**
     * @brief Check a request against the rules
     * @return Violation describing the first broken rule, or nullopt if the
     *         request may be sent (it is then counted against the quotas)
     */
    std::optional<PolicyViolation> Check(const bridge::HttpRequest& request);

    std::uint32_t RequestCount() const { return request_count_; }

private:
    bool IsHostAllowed(const std::string& host) const;
    bool IsCredentialDomain(const std::string& host) const;
    bool IsSensitiveHeader(const std::string& name) const;

    const NetworkRules& rules_;
    std::shared_ptr<HostRateLimiter> rate_limiter_;
    std::uint32_t request_count_{0};
};

} // namespace policy
} // namespace sealbox
