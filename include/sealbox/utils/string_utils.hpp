/**
 * @file string_utils.hpp
 * @brief String helpers shared by the policy layer and the CLI
 *
 * Host and identifier checks used when validating requests and outbound
 * network calls, plus the usual trim/split/case helpers.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace sealbox {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * if (StringUtils::IsIPAddress(host)) {
 *     // reject IP literal destinations
 * }
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic String Manipulation
     ***************************************************************************/

    /// Remove leading and trailing whitespace
    static std::string Trim(const std::string& str);

    /// ASCII lowercase copy
    static std::string ToLower(const std::string& str);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Keep at most max_bytes of the string, appending "..." when cut
     *
     * Never splits a UTF-8 multi-byte sequence.
     */
    static std::string Truncate(const std::string& str, std::size_t max_bytes);

    /***************************************************************************
     * Pattern Detection
     ***************************************************************************/

    /// IPv4 dotted quad or IPv6 literal (with or without brackets)
    static bool IsIPAddress(const std::string& str);

    /// JavaScript identifier (ASCII subset: [A-Za-z_$][A-Za-z0-9_$]*)
    static bool IsIdentifier(const std::string& str);

    /**
     * @brief True if host equals domain or is a sub-domain of it
     *
     * Comparison is case-insensitive. "api.example.com" matches
     * "example.com"; "badexample.com" does not.
     */
    static bool HostMatchesDomain(const std::string& host, const std::string& domain);
};

} // namespace utils
} // namespace sealbox
