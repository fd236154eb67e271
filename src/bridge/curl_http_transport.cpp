/**
 * @file curl_http_transport.cpp
 * @brief libcurl implementation of HttpTransport
 *
 * @date 2025
 */

#include "sealbox/bridge/http_transport.hpp"
#include "sealbox/utils/string_utils.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace sealbox {
namespace bridge {

namespace {

struct ResponseSink {
    std::string body;
    std::size_t limit{0};
    bool overflowed{false};
};

struct HeaderSink {
    std::map<std::string, std::string> headers;
    std::string status_text;
};

// Returning less than the chunk size aborts the transfer with CURLE_WRITE_ERROR
size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    auto* sink = static_cast<ResponseSink*>(userp);

    if (sink->body.size() + total_size > sink->limit) {
        sink->overflowed = true;
        return 0;
    }

    sink->body.append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header(buffer, total_size);
    auto* sink = static_cast<HeaderSink*>(userdata);

    // Status line: "HTTP/1.1 200 OK"; a new one starts each response
    if (utils::StringUtils::StartsWith(header, "HTTP/")) {
        sink->headers.clear();
        sink->status_text.clear();
        auto first_space = header.find(' ');
        if (first_space != std::string::npos) {
            auto second_space = header.find(' ', first_space + 1);
            if (second_space != std::string::npos) {
                sink->status_text = utils::StringUtils::Trim(header.substr(second_space + 1));
            }
        }
        return total_size;
    }

    size_t colon_pos = header.find(':');
    if (colon_pos != std::string::npos) {
        std::string name = utils::StringUtils::ToLower(utils::StringUtils::Trim(header.substr(0, colon_pos)));
        std::string value = utils::StringUtils::Trim(header.substr(colon_pos + 1));

        auto existing = sink->headers.find(name);
        if (existing != sink->headers.end()) {
            existing->second += ", " + value;
        } else {
            sink->headers.emplace(name, value);
        }
    }

    return total_size;
}

std::once_flag g_curl_init_flag;

} // anonymous namespace

CurlHttpTransport::CurlHttpTransport() {
    std::call_once(g_curl_init_flag, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

CurlHttpTransport::~CurlHttpTransport() = default;

HttpResponse CurlHttpTransport::Send(const HttpRequest& request, const TransportOptions& options) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransportError(TransportError::Kind::FAILED, "Failed to initialize CURL");
    }

    auto start = std::chrono::steady_clock::now();

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "https");
#else
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTPS));
#endif
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE,
                     static_cast<curl_off_t>(options.max_response_bytes));

    if (request.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    if (!request.body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    }

    struct curl_slist* curl_headers = nullptr;
    for (const auto& [key, value] : request.headers) {
        std::string header_line = key + ": " + value;
        curl_headers = curl_slist_append(curl_headers, header_line.c_str());
    }
    if (curl_headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);
    }

    ResponseSink body_sink;
    body_sink.limit = options.max_response_bytes;
    HeaderSink header_sink;

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body_sink);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &header_sink);

    spdlog::debug("HTTP {} {}", request.method, request.url);

    CURLcode res = curl_easy_perform(curl);

    long status_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);

    if (curl_headers) {
        curl_slist_free_all(curl_headers);
    }
    curl_easy_cleanup(curl);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (res != CURLE_OK) {
        if (body_sink.overflowed || res == CURLE_FILESIZE_EXCEEDED) {
            throw TransportError(TransportError::Kind::RESPONSE_TOO_LARGE,
                "Response exceeds " + std::to_string(options.max_response_bytes) + " bytes");
        }
        if (res == CURLE_OPERATION_TIMEDOUT) {
            throw TransportError(TransportError::Kind::TIMEOUT,
                "Request timed out after " + std::to_string(options.timeout_ms) + " ms");
        }
        std::string error_msg = "CURL error: ";
        error_msg += curl_easy_strerror(res);
        throw TransportError(TransportError::Kind::FAILED, error_msg);
    }

    spdlog::debug("HTTP {} {} -> {} ({}ms, {} bytes)",
        request.method, request.url, status_code, duration.count(), body_sink.body.size());

    HttpResponse response;
    response.status_code = static_cast<int>(status_code);
    response.status_text = header_sink.status_text;
    response.url = request.url;
    response.headers = std::move(header_sink.headers);
    response.body = std::move(body_sink.body);
    response.duration = duration;
    return response;
}

} // namespace bridge
} // namespace sealbox
