/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "sealbox/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace sealbox {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

std::string StringUtils::Truncate(const std::string& str, std::size_t max_bytes) {
    if (str.size() <= max_bytes) {
        return str;
    }

    std::size_t cut = max_bytes;
    // Back off continuation bytes (10xxxxxx)
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return str.substr(0, cut) + "...";
}

// ============================================================================
// PATTERN MATCHING UTILITIES
// ============================================================================

bool StringUtils::IsIPAddress(const std::string& str) {
    static const std::regex ipv4_pattern(
        R"(^(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)$)"
    );

    // Any bracketed or colon-bearing host is treated as IPv6
    if (!str.empty() && (str.front() == '[' || Contains(str, ":"))) {
        return true;
    }

    // Integer and hex forms (http://2130706433/, 0x7f.1) resolve as IPv4 too
    static const std::regex numeric_host(R"(^(?:0x[0-9a-fA-F]+|[0-9]+)(?:\.(?:0x[0-9a-fA-F]+|[0-9]+))*$)");

    return std::regex_match(str, ipv4_pattern) || std::regex_match(str, numeric_host);
}

bool StringUtils::IsIdentifier(const std::string& str) {
    static const std::regex identifier_pattern(R"(^[A-Za-z_$][A-Za-z0-9_$]*$)");
    return std::regex_match(str, identifier_pattern);
}

bool StringUtils::HostMatchesDomain(const std::string& host, const std::string& domain) {
    if (host.empty() || domain.empty()) {
        return false;
    }

    std::string h = ToLower(host);
    std::string d = ToLower(domain);
    if (h == d) {
        return true;
    }
    return EndsWith(h, "." + d);
}

} // namespace utils
} // namespace sealbox
