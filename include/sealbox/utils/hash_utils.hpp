/**
 * @file hash_utils.hpp
 * @brief Hashing, randomness and identifier generation over OpenSSL
 *
 * Backs the script-visible `crypto` helpers and the generation of execution
 * identifiers. All functions are thread-safe.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sealbox {
namespace utils {

/**
 * @class HashUtils
 * @brief Static OpenSSL wrappers
 *
 * **Usage Example**:
 * @code
 * std::string digest = HashUtils::Sha256Hex("hello");
 * std::string id = HashUtils::GenerateExecutionId();   // "exec_" + 32 hex chars
 * @endcode
 */
class HashUtils {
public:
    /// Lowercase hex SHA-256 of the input bytes
    static std::string Sha256Hex(const std::string& data);

    /**
     * @brief Cryptographically secure random bytes
     * @throws SealboxError if the OpenSSL generator fails
     */
    static std::vector<std::uint8_t> RandomBytes(std::size_t count);

    /// Standard base64 (with padding)
    static std::string ToBase64(const std::vector<std::uint8_t>& data);

    static std::string ToHex(const std::uint8_t* data, std::size_t length);

    /// 128 random bits, hex encoded, "exec_" prefixed
    static std::string GenerateExecutionId();
};

} // namespace utils
} // namespace sealbox
