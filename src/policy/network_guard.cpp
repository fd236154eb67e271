/**
 * @file network_guard.cpp
 * @brief Implementation of the outbound request checks
 *
 * @date 2025
 */

#include "sealbox/policy/network_guard.hpp"
#include "sealbox/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace sealbox {
namespace policy {

using utils::StringUtils;

// ============================================================================
// URL PARSING
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::Parse(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = StringUtils::ToLower(url.substr(0, scheme_end));

    std::size_t authority_start = scheme_end + 3;
    std::size_t authority_end = url.find_first_of("/?#", authority_start);
    std::string authority = url.substr(authority_start,
        authority_end == std::string::npos ? std::string::npos : authority_end - authority_start);
    parsed.path = authority_end == std::string::npos ? "/" : url.substr(authority_end);

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        parsed.has_userinfo = true;
        authority = authority.substr(at + 1);
    }

    if (authority.empty()) {
        return std::nullopt;
    }

    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        parsed.host = authority.substr(0, close + 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return std::nullopt;
            }
            parsed.port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.find(':');
        parsed.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            parsed.port = authority.substr(colon + 1);
        }
    }

    if (!parsed.port.empty() &&
        !std::all_of(parsed.port.begin(), parsed.port.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    parsed.host = StringUtils::ToLower(parsed.host);
    while (!parsed.host.empty() && parsed.host.back() == '.') {
        parsed.host.pop_back();
    }
    if (parsed.host.empty()) {
        return std::nullopt;
    }

    return parsed;
}

// ============================================================================
// RATE LIMITING
// ============================================================================

bool HostRateLimiter::Admit(const std::string& host, std::uint32_t max_requests,
                            std::chrono::milliseconds window, Clock::time_point now) {
    if (max_requests == 0) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& timestamps = history_[host];

    while (!timestamps.empty() && now - timestamps.front() >= window) {
        timestamps.pop_front();
    }

    if (timestamps.size() >= max_requests) {
        return false;
    }

    timestamps.push_back(now);
    return true;
}

// ============================================================================
// REQUEST CHECKS
// ============================================================================

NetworkGuard::NetworkGuard(const NetworkRules& rules, std::shared_ptr<HostRateLimiter> rate_limiter)
    : rules_(rules)
    , rate_limiter_(std::move(rate_limiter)) {
}

bool NetworkGuard::IsHostAllowed(const std::string& host) const {
    return std::any_of(rules_.allowed_hosts.begin(), rules_.allowed_hosts.end(),
        [&host](const std::string& domain) { return StringUtils::HostMatchesDomain(host, domain); });
}

bool NetworkGuard::IsCredentialDomain(const std::string& host) const {
    return std::any_of(rules_.credential_domains.begin(), rules_.credential_domains.end(),
        [&host](const std::string& domain) { return StringUtils::HostMatchesDomain(host, domain); });
}

bool NetworkGuard::IsSensitiveHeader(const std::string& name) const {
    std::string lower = StringUtils::ToLower(StringUtils::Trim(name));
    return std::any_of(rules_.sensitive_headers.begin(), rules_.sensitive_headers.end(),
        [&lower](const std::string& header) { return StringUtils::ToLower(header) == lower; });
}

std::optional<PolicyViolation> NetworkGuard::Check(const bridge::HttpRequest& request) {
    if (!rules_.enabled) {
        return PolicyViolation{"network.disabled", "network access is disabled"};
    }

    auto url = ParsedUrl::Parse(request.url);
    if (!url) {
        return PolicyViolation{"network.url", "malformed URL"};
    }
    if (url->scheme != "https") {
        return PolicyViolation{"network.scheme", "only https URLs are allowed, got " + url->scheme};
    }
    if (url->has_userinfo) {
        return PolicyViolation{"network.url", "credentials in URL are not allowed"};
    }

    const std::string& host = url->host;
    if (host == "localhost" || StringUtils::EndsWith(host, ".localhost") ||
        StringUtils::IsIPAddress(host)) {
        return PolicyViolation{"network.host", "destination " + host + " is not allowed"};
    }
    if (!IsHostAllowed(host)) {
        return PolicyViolation{"network.host", "domain not in allowlist: " + host};
    }

    std::string method = request.method;
    std::transform(method.begin(), method.end(), method.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (std::find(rules_.allowed_methods.begin(), rules_.allowed_methods.end(), method)
            == rules_.allowed_methods.end()) {
        return PolicyViolation{"network.method", "HTTP method " + method + " is not allowed"};
    }

    if (request.body.size() > rules_.max_request_body_bytes) {
        return PolicyViolation{"network.request-size",
            "request body of " + std::to_string(request.body.size()) + " bytes exceeds " +
            std::to_string(rules_.max_request_body_bytes)};
    }

    bool trusted = IsCredentialDomain(host);
    for (const auto& [name, value] : request.headers) {
        if (name.find_first_of("\r\n:") != std::string::npos ||
            value.find_first_of("\r\n") != std::string::npos) {
            return PolicyViolation{"network.header", "malformed header " + name};
        }
        if (!trusted && IsSensitiveHeader(name)) {
            return PolicyViolation{"network.header",
                "header " + name + " may not be sent to " + host};
        }
    }

    if (rules_.max_requests_per_execution > 0 &&
        request_count_ >= rules_.max_requests_per_execution) {
        return PolicyViolation{"network.quota",
            "more than " + std::to_string(rules_.max_requests_per_execution) +
            " requests in one execution"};
    }

    if (rate_limiter_ &&
        !rate_limiter_->Admit(host, rules_.rate_limit_requests,
                              std::chrono::milliseconds(rules_.rate_limit_window_ms))) {
        return PolicyViolation{"network.rate-limit", "rate limit exceeded for " + host};
    }

    ++request_count_;
    return std::nullopt;
}

} // namespace policy
} // namespace sealbox
