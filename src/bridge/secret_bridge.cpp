/**
 * @file secret_bridge.cpp
 * @brief Secret mediation and the in-memory store
 *
 * @date 2025
 */

#include "sealbox/bridge/secret_bridge.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace sealbox {
namespace bridge {

std::string ToString(SecretStoreError::Code code) {
    switch (code) {
        case SecretStoreError::Code::NOT_FOUND:    return "not_found";
        case SecretStoreError::Code::UNAUTHORIZED: return "unauthorized";
        case SecretStoreError::Code::UNAVAILABLE:  return "unavailable";
    }
    return "unknown";
}

// ============================================================================
// InMemorySecretStore
// ============================================================================

void InMemorySecretStore::Put(std::int64_t user_id, const std::string& name,
                              const std::string& value, std::set<std::string> allowed_functions) {
    std::lock_guard<std::mutex> lock(mutex_);
    secrets_[user_id][name] = StoredSecret{value, std::move(allowed_functions)};
}

void InMemorySecretStore::LoadFromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw SealboxError("Secret document must be an object keyed by user id");
    }

    for (auto user_it = document.begin(); user_it != document.end(); ++user_it) {
        std::int64_t user_id = 0;
        try {
            std::size_t consumed = 0;
            user_id = std::stoll(user_it.key(), &consumed);
            if (consumed != user_it.key().size()) {
                throw std::invalid_argument(user_it.key());
            }
        } catch (const std::logic_error&) {
            throw SealboxError("Invalid user id in secret document: " + user_it.key());
        }

        if (!user_it.value().is_object()) {
            throw SealboxError("Secrets for user " + user_it.key() + " must be an object");
        }

        for (auto it = user_it.value().begin(); it != user_it.value().end(); ++it) {
            const auto& entry = it.value();
            if (entry.is_string()) {
                Put(user_id, it.key(), entry.get<std::string>());
            } else if (entry.is_object() && entry.contains("value") && entry["value"].is_string()) {
                std::set<std::string> functions;
                if (entry.contains("functions")) {
                    if (!entry["functions"].is_array()) {
                        throw SealboxError("'functions' of secret " + it.key() + " must be an array");
                    }
                    for (const auto& fn : entry["functions"]) {
                        if (!fn.is_string()) {
                            throw SealboxError("'functions' of secret " + it.key() + " must hold strings");
                        }
                        functions.insert(fn.get<std::string>());
                    }
                }
                Put(user_id, it.key(), entry["value"].get<std::string>(), std::move(functions));
            } else {
                throw SealboxError("Secret " + it.key() + " must be a string or {\"value\": ...}");
            }
        }
    }
}

void InMemorySecretStore::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SealboxError("Failed to open secrets file: " + path.string());
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw SealboxError("Failed to parse secrets file " + path.string() + ": " + e.what());
    }

    LoadFromJson(document);
    spdlog::info("Loaded {} secrets from {}", Size(), path.string());
}

std::string InMemorySecretStore::GetSecret(const SecretAccessContext& identity,
                                           const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto user_it = secrets_.find(identity.user_id);
    if (user_it == secrets_.end()) {
        throw SecretStoreError(SecretStoreError::Code::NOT_FOUND, "secret not found: " + name);
    }

    auto it = user_it->second.find(name);
    if (it == user_it->second.end()) {
        throw SecretStoreError(SecretStoreError::Code::NOT_FOUND, "secret not found: " + name);
    }

    const auto& allowed = it->second.allowed_functions;
    if (!allowed.empty() && allowed.count(identity.function_id) == 0) {
        throw SecretStoreError(SecretStoreError::Code::UNAUTHORIZED,
            "secret " + name + " is not available to function " + identity.function_id);
    }

    return it->second.value;
}

std::size_t InMemorySecretStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& [user, entries] : secrets_) {
        total += entries.size();
    }
    return total;
}

// ============================================================================
// SecretAccessBridge
// ============================================================================

SecretAccessBridge::SecretAccessBridge(std::shared_ptr<SecretStore> store,
                                       std::shared_ptr<AuditSink> audit,
                                       SecretAccessContext identity)
    : store_(std::move(store))
    , audit_(std::move(audit))
    , identity_(std::move(identity)) {
}

SecretLookup SecretAccessBridge::Get(const std::string& name) {
    ++calls_;

    SecretAccessRequest request;
    request.identity = identity_;
    request.secret_name = name;

    SecretLookup lookup;

    if (name.empty() || name.size() > kMaxSecretNameLength) {
        lookup.reason = "invalid secret name";
    } else if (!store_) {
        lookup.reason = "secret store unavailable";
    } else {
        try {
            lookup.value = store_->GetSecret(identity_, name);
            lookup.granted = true;
        } catch (const SecretStoreError& e) {
            lookup.reason = e.what();
            spdlog::warn("Secret '{}' denied for user {} ({}): {}",
                name, identity_.user_id, ToString(e.code()), e.what());
        } catch (const std::exception& e) {
            lookup.reason = "secret store unavailable";
            spdlog::error("Secret store failed for '{}' (user {}): {}", name, identity_.user_id, e.what());
        }
    }

    Audit(request, lookup.granted, lookup.reason);
    return lookup;
}

void SecretAccessBridge::Audit(const SecretAccessRequest& request, bool success,
                               const std::string& detail) {
    if (!audit_) {
        return;
    }

    AuditEntry entry;
    entry.timestamp = request.timestamp;
    entry.user_id = request.identity.user_id;
    entry.function_id = request.identity.function_id;
    entry.execution_id = request.identity.execution_id;
    entry.action = "secret.read";
    entry.subject = request.secret_name.size() > kMaxSecretNameLength
        ? request.secret_name.substr(0, kMaxSecretNameLength)
        : request.secret_name;
    entry.success = success;
    entry.detail = detail;

    try {
        audit_->Append(entry);
    } catch (const std::exception& e) {
        spdlog::error("Failed to record audit entry for {}: {}", identity_.execution_id, e.what());
    }
}

} // namespace bridge
} // namespace sealbox
