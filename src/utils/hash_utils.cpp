/**
 * @file hash_utils.cpp
 * @brief OpenSSL backed hashing and random number helpers
 *
 * **Error Handling**:
 * - OpenSSL errors: Logs and throws SealboxError
 *
 * @date 2025
 */

#include "sealbox/utils/hash_utils.hpp"
#include "sealbox/core/execution_types.hpp"

#include <spdlog/spdlog.h>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace sealbox {
namespace utils {

namespace {

std::string LastOpenSSLError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

} // anonymous namespace

std::string HashUtils::ToHex(const std::uint8_t* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string HashUtils::Sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        std::string error = LastOpenSSLError();
        spdlog::error("SHA-256 computation failed: {}", error);
        throw SealboxError("SHA-256 computation failed: " + error);
    }

    return ToHex(digest, digest_len);
}

std::vector<std::uint8_t> HashUtils::RandomBytes(std::size_t count) {
    std::vector<std::uint8_t> buffer(count);
    if (count == 0) {
        return buffer;
    }

    if (RAND_bytes(buffer.data(), static_cast<int>(count)) != 1) {
        std::string error = LastOpenSSLError();
        spdlog::error("Random byte generation failed: {}", error);
        throw SealboxError("Random byte generation failed: " + error);
    }
    return buffer;
}

std::string HashUtils::ToBase64(const std::vector<std::uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    // 4 output chars per 3 input bytes, plus the terminating NUL
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::string HashUtils::GenerateExecutionId() {
    auto bytes = RandomBytes(16);
    return "exec_" + ToHex(bytes.data(), bytes.size());
}

} // namespace utils
} // namespace sealbox
