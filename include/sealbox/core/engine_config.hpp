/**
 * @file engine_config.hpp
 * @brief Engine configuration and its JSON loader
 *
 * Every field has an in-code default, so an empty JSON object is a valid
 * configuration. Unknown keys are ignored. A key present with the wrong
 * type is an error.
 *
 * **Example**:
 * @code
 * {
 *   "limits":  { "max_memory_bytes": 268435456, "max_time_ms": 60000 },
 *   "policy":  { "max_steps": 500000, "network": { "allowed_hosts": ["api.example.com"] } },
 *   "audit":   { "sink": "jsonl", "path": "./audit/secrets.jsonl" },
 *   "verbose_logging": false
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "sealbox/core/execution_types.hpp"
#include "sealbox/policy/sandbox_policy.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace sealbox {
namespace core {

/**
 * @class ConfigError
 * @brief Configuration file missing, unreadable or malformed
 */
class ConfigError : public SealboxError {
public:
    explicit ConfigError(const std::string& msg) : SealboxError(msg) {}
};

/**
 * @struct PlatformLimits
 * @brief Hard maxima enforced on every request plus the CLI defaults
 */
struct PlatformLimits {
    std::size_t max_source_bytes{100000};                   ///< Script source size
    std::size_t max_memory_bytes{512 * 1024 * 1024};        ///< Upper bound for a request's ceiling
    std::int64_t max_time_ms{300000};                       ///< Upper bound for a request's ceiling
    std::size_t default_memory_bytes{128 * 1024 * 1024};    ///< Used when a caller passes none
    std::int64_t default_time_ms{30000};                    ///< Used when a caller passes none
};

/**
 * @enum AuditSinkType
 * @brief Where audit entries end up
 */
enum class AuditSinkType {
    LOG,        ///< spdlog at info level
    JSONL       ///< Append-only JSON lines file
};

/**
 * @struct AuditConfig
 * @brief Audit sink selection
 */
struct AuditConfig {
    AuditSinkType sink{AuditSinkType::LOG};
    std::filesystem::path path{"./audit/audit.jsonl"};    ///< JSONL sink only
    bool async{true};                                     ///< Wrap the sink in AsyncAuditSink
    std::size_t queue_capacity{4096};
};

/**
 * @struct EngineConfig
 * @brief Everything the engine needs besides its collaborators
 */
struct EngineConfig {
    PlatformLimits limits;
    policy::PolicyConfig policy;
    AuditConfig audit;
    std::size_t interpreter_overhead_bytes{1024 * 1024};   ///< Added to the interpreter's own limit
    bool verbose_logging{false};
};

/**
 * @class ConfigLoader
 * @brief Builds an EngineConfig from JSON
 */
class ConfigLoader {
public:
    /**
     * @brief Load and parse a configuration file
     * @throws ConfigError if the file is missing, unreadable, or invalid
     */
    static EngineConfig LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Overlay a JSON document on the defaults
     * @throws ConfigError on wrong types or invalid values
     */
    static EngineConfig FromJson(const nlohmann::json& document);

    /// Serialized form of a configuration (inverse of FromJson)
    static nlohmann::json ToJson(const EngineConfig& config);

    /**
     * @brief Convert a CLI memory ceiling in MB to bytes
     * @throws ConfigError if the result would exceed limits.max_memory_bytes
     */
    static std::size_t MemoryCeilingBytes(std::size_t megabytes, const PlatformLimits& limits);
};

} // namespace core
} // namespace sealbox
