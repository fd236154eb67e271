/**
 * @file http_transport.hpp
 * @brief Outbound HTTP transport used by the sandboxed fetch()
 *
 * The transport only moves bytes. Every policy decision (scheme, host,
 * method, headers, rate) is made by policy::NetworkGuard before a request
 * reaches it.
 *
 * @date 2025
 */

#pragma once

#include "sealbox/core/execution_types.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sealbox {
namespace bridge {

/**
 * @struct HttpRequest
 * @brief Outbound request as built from the script's fetch() arguments
 */
struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

/**
 * @struct HttpResponse
 * @brief Response returned to the script
 */
struct HttpResponse {
    int status_code{0};
    std::string status_text;
    std::string url;
    std::map<std::string, std::string> headers;   ///< Lowercased names
    std::string body;
    std::chrono::milliseconds duration{0};
};

/**
 * @struct TransportOptions
 * @brief Per-call transport limits
 */
struct TransportOptions {
    std::int64_t timeout_ms{10000};
    std::size_t max_response_bytes{5 * 1024 * 1024};
};

/**
 * @class TransportError
 * @brief Transport level failure (DNS, TLS, timeout, oversized body)
 */
class TransportError : public SealboxError {
public:
    enum class Kind {
        FAILED,
        TIMEOUT,
        RESPONSE_TOO_LARGE
    };

    TransportError(Kind kind, const std::string& message)
        : SealboxError(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

/**
 * @class HttpTransport
 * @brief Abstract transport; implementations must be thread-safe
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform one request
     * @throws TransportError on any transport failure
     */
    virtual HttpResponse Send(const HttpRequest& request, const TransportOptions& options) = 0;
};

/**
 * @class CurlHttpTransport
 * @brief libcurl transport: HTTPS only, no redirects, peer verification on
 *
 * A fresh easy handle is used per call, so one instance can be shared by
 * concurrent executions.
 */
class CurlHttpTransport : public HttpTransport {
public:
    CurlHttpTransport();
    ~CurlHttpTransport() override;

    HttpResponse Send(const HttpRequest& request, const TransportOptions& options) override;
};

} // namespace bridge
} // namespace sealbox
