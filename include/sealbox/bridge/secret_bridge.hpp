/**
 * @file secret_bridge.hpp
 * @brief Mediated secret lookup for running scripts
 *
 * Scripts never name the tenant they act for. The bridge attaches the
 * identity of the execution (user, function, execution ID) to every lookup,
 * delegates to the SecretStore and emits exactly one audit entry per call.
 * Nothing is cached between calls or between executions.
 *
 * @date 2025
 */

#pragma once

#include "sealbox/bridge/audit_sink.hpp"
#include "sealbox/core/execution_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace sealbox {
namespace bridge {

/**
 * @struct SecretAccessContext
 * @brief Identity a lookup is performed on behalf of
 */
struct SecretAccessContext {
    std::int64_t user_id{0};
    std::string function_id;
    std::string execution_id;
};

/**
 * @struct SecretAccessRequest
 * @brief One lookup; created per call and never cached
 */
struct SecretAccessRequest {
    SecretAccessContext identity;
    std::string secret_name;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @class SecretStoreError
 * @brief Lookup refused or failed
 */
class SecretStoreError : public SealboxError {
public:
    enum class Code {
        NOT_FOUND,
        UNAUTHORIZED,
        UNAVAILABLE
    };

    SecretStoreError(Code code, const std::string& message)
        : SealboxError(message), code_(code) {}

    Code code() const { return code_; }

private:
    Code code_;
};

std::string ToString(SecretStoreError::Code code);

/**
 * @class SecretStore
 * @brief Narrow "fetch secret for (identity, name)" capability
 *
 * Implementations must be thread-safe; concurrent executions share one store.
 */
class SecretStore {
public:
    virtual ~SecretStore() = default;

    /**
     * @brief Look up a secret for the given identity
     * @throws SecretStoreError when the secret is missing, not accessible to
     *         the identity, or the store is unavailable
     */
    virtual std::string GetSecret(const SecretAccessContext& identity, const std::string& name) = 0;
};

/**
 * @class InMemorySecretStore
 * @brief Secret store held in memory, scoped per user
 *
 * JSON form accepted by LoadFromJson():
 * @code
 * {
 *   "1": { "api_key": "value", "db_password": { "value": "...", "functions": ["fn-a"] } },
 *   "2": { "api_key": "other" }
 * }
 * @endcode
 * A secret with a "functions" list is only released to those functions.
 */
class InMemorySecretStore : public SecretStore {
public:
    void Put(std::int64_t user_id, const std::string& name, const std::string& value,
             std::set<std::string> allowed_functions = {});

    /// @throws SealboxError on malformed input
    void LoadFromJson(const nlohmann::json& document);

    /// @throws SealboxError if the file cannot be read or parsed
    void LoadFromFile(const std::filesystem::path& path);

    std::string GetSecret(const SecretAccessContext& identity, const std::string& name) override;

    std::size_t Size() const;

private:
    struct StoredSecret {
        std::string value;
        std::set<std::string> allowed_functions;
    };

    mutable std::mutex mutex_;
    std::map<std::int64_t, std::map<std::string, StoredSecret>> secrets_;
};

/**
 * @struct SecretLookup
 * @brief Result of a mediated lookup
 */
struct SecretLookup {
    bool granted{false};
    std::string value;          ///< Only set when granted
    std::string reason;         ///< Denial reason (safe to show to the script)
};

/**
 * @class SecretAccessBridge
 * @brief Per-execution secret mediator
 */
class SecretAccessBridge {
public:
    static constexpr std::size_t kMaxSecretNameLength = 256;

    SecretAccessBridge(std::shared_ptr<SecretStore> store,
                       std::shared_ptr<AuditSink> audit,
                       SecretAccessContext identity);

    /**
     * @brief Look up one secret
     *
     * Never throws. Emits exactly one "secret.read" audit entry.
     */
    SecretLookup Get(const std::string& name);

    const SecretAccessContext& Identity() const { return identity_; }

    std::size_t Calls() const { return calls_; }

private:
    void Audit(const SecretAccessRequest& request, bool success, const std::string& detail);

    std::shared_ptr<SecretStore> store_;
    std::shared_ptr<AuditSink> audit_;
    SecretAccessContext identity_;
    std::size_t calls_{0};
};

} // namespace bridge
} // namespace sealbox
