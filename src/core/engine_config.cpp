/**
 * @file engine_config.cpp
 * @brief JSON configuration loading
 *
 * @date 2025
 */

#include "sealbox/core/engine_config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <type_traits>

namespace sealbox {
namespace core {

namespace {

using nlohmann::json;

std::string Where(const std::string& path, const char* key) {
    return path.empty() ? std::string(key) : path + "." + key;
}

const json* Find(const json& object, const char* key) {
    auto it = object.find(key);
    return it == object.end() ? nullptr : &*it;
}

void Read(const json& object, const char* key, const std::string& path, bool& out) {
    if (const json* value = Find(object, key)) {
        if (!value->is_boolean()) {
            throw ConfigError(Where(path, key) + " must be a boolean");
        }
        out = value->get<bool>();
    }
}

template <typename T>
typename std::enable_if<std::is_unsigned<T>::value && !std::is_same<T, bool>::value>::type
Read(const json& object, const char* key, const std::string& path, T& out) {
    if (const json* value = Find(object, key)) {
        if (!value->is_number_unsigned()) {
            throw ConfigError(Where(path, key) + " must be a non-negative integer");
        }
        auto wide = value->get<std::uint64_t>();
        if (wide > std::numeric_limits<T>::max()) {
            throw ConfigError(Where(path, key) + " is out of range");
        }
        out = static_cast<T>(wide);
    }
}

void Read(const json& object, const char* key, const std::string& path, std::int64_t& out) {
    if (const json* value = Find(object, key)) {
        if (!value->is_number_integer()) {
            throw ConfigError(Where(path, key) + " must be an integer");
        }
        out = value->get<std::int64_t>();
    }
}

void Read(const json& object, const char* key, const std::string& path, std::string& out) {
    if (const json* value = Find(object, key)) {
        if (!value->is_string()) {
            throw ConfigError(Where(path, key) + " must be a string");
        }
        out = value->get<std::string>();
    }
}

void Read(const json& object, const char* key, const std::string& path,
          std::vector<std::string>& out) {
    if (const json* value = Find(object, key)) {
        if (!value->is_array()) {
            throw ConfigError(Where(path, key) + " must be an array of strings");
        }
        std::vector<std::string> items;
        for (const auto& item : *value) {
            if (!item.is_string()) {
                throw ConfigError(Where(path, key) + " must be an array of strings");
            }
            items.push_back(item.get<std::string>());
        }
        out = std::move(items);
    }
}

const json* Section(const json& object, const char* key, const std::string& path) {
    const json* section = Find(object, key);
    if (section && !section->is_object()) {
        throw ConfigError(Where(path, key) + " must be an object");
    }
    return section;
}

void ReadNetwork(const json& j, policy::NetworkRules& rules) {
    const std::string path = "policy.network";
    Read(j, "enabled", path, rules.enabled);
    Read(j, "allowed_hosts", path, rules.allowed_hosts);
    Read(j, "allowed_methods", path, rules.allowed_methods);
    Read(j, "credential_domains", path, rules.credential_domains);
    Read(j, "sensitive_headers", path, rules.sensitive_headers);
    Read(j, "max_request_body_bytes", path, rules.max_request_body_bytes);
    Read(j, "max_response_bytes", path, rules.max_response_bytes);
    Read(j, "rate_limit_requests", path, rules.rate_limit_requests);
    Read(j, "rate_limit_window_ms", path, rules.rate_limit_window_ms);
    Read(j, "max_requests_per_execution", path, rules.max_requests_per_execution);
    Read(j, "request_timeout_ms", path, rules.request_timeout_ms);

    if (rules.rate_limit_window_ms <= 0 || rules.request_timeout_ms <= 0) {
        throw ConfigError(path + " windows and timeouts must be positive");
    }
}

void ReadValues(const json& j, policy::ValueLimits& limits) {
    const std::string path = "policy.values";
    Read(j, "max_bytes", path, limits.max_bytes);
    Read(j, "max_depth", path, limits.max_depth);
    Read(j, "max_entries", path, limits.max_entries);
    Read(j, "forbidden_keys", path, limits.forbidden_keys);
    Read(j, "forbidden_patterns", path, limits.forbidden_patterns);
}

void ReadPolicy(const json& j, policy::PolicyConfig& config) {
    const std::string path = "policy";
    Read(j, "allowed_globals", path, config.allowed_globals);
    Read(j, "max_steps", path, config.max_steps);
    Read(j, "max_stack_bytes", path, config.max_stack_bytes);
    Read(j, "max_log_entries", path, config.max_log_entries);
    Read(j, "max_log_bytes", path, config.max_log_bytes);

    if (const json* network = Section(j, "network", path)) {
        ReadNetwork(*network, config.network);
    }
    if (const json* values = Section(j, "values", path)) {
        ReadValues(*values, config.values);
    }
}

void ReadLimits(const json& j, PlatformLimits& limits) {
    const std::string path = "limits";
    Read(j, "max_source_bytes", path, limits.max_source_bytes);
    Read(j, "max_memory_bytes", path, limits.max_memory_bytes);
    Read(j, "max_time_ms", path, limits.max_time_ms);
    Read(j, "default_memory_bytes", path, limits.default_memory_bytes);
    Read(j, "default_time_ms", path, limits.default_time_ms);

    if (limits.max_memory_bytes == 0 || limits.max_time_ms <= 0) {
        throw ConfigError("limits maxima must be positive");
    }
    if (limits.default_memory_bytes == 0 || limits.default_memory_bytes > limits.max_memory_bytes) {
        throw ConfigError("limits.default_memory_bytes must be within (0, max_memory_bytes]");
    }
    if (limits.default_time_ms <= 0 || limits.default_time_ms > limits.max_time_ms) {
        throw ConfigError("limits.default_time_ms must be within (0, max_time_ms]");
    }
}

void ReadAudit(const json& j, AuditConfig& audit) {
    const std::string path = "audit";
    std::string sink = audit.sink == AuditSinkType::JSONL ? "jsonl" : "log";
    Read(j, "sink", path, sink);
    if (sink == "log") {
        audit.sink = AuditSinkType::LOG;
    } else if (sink == "jsonl") {
        audit.sink = AuditSinkType::JSONL;
    } else {
        throw ConfigError("audit.sink must be \"log\" or \"jsonl\", got \"" + sink + "\"");
    }

    std::string file = audit.path.string();
    Read(j, "path", path, file);
    audit.path = file;
    Read(j, "async", path, audit.async);
    Read(j, "queue_capacity", path, audit.queue_capacity);
    if (audit.queue_capacity == 0) {
        throw ConfigError("audit.queue_capacity must be positive");
    }
}

} // anonymous namespace

EngineConfig ConfigLoader::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }

    json document;
    try {
        in >> document;
    } catch (const json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path.string() + ": " + e.what());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return FromJson(document);
}

EngineConfig ConfigLoader::FromJson(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("Configuration root must be an object");
    }

    EngineConfig config;
    if (const json* limits = Section(document, "limits", "")) {
        ReadLimits(*limits, config.limits);
    }
    if (const json* policy = Section(document, "policy", "")) {
        ReadPolicy(*policy, config.policy);
    }
    if (const json* audit = Section(document, "audit", "")) {
        ReadAudit(*audit, config.audit);
    }
    Read(document, "interpreter_overhead_bytes", "", config.interpreter_overhead_bytes);
    Read(document, "verbose_logging", "", config.verbose_logging);
    return config;
}

json ConfigLoader::ToJson(const EngineConfig& config) {
    const auto& policy = config.policy;
    const auto& network = policy.network;
    const auto& values = policy.values;

    return json{
        {"limits", {
            {"max_source_bytes", config.limits.max_source_bytes},
            {"max_memory_bytes", config.limits.max_memory_bytes},
            {"max_time_ms", config.limits.max_time_ms},
            {"default_memory_bytes", config.limits.default_memory_bytes},
            {"default_time_ms", config.limits.default_time_ms}
        }},
        {"policy", {
            {"allowed_globals", policy.allowed_globals},
            {"max_steps", policy.max_steps},
            {"max_stack_bytes", policy.max_stack_bytes},
            {"max_log_entries", policy.max_log_entries},
            {"max_log_bytes", policy.max_log_bytes},
            {"network", {
                {"enabled", network.enabled},
                {"allowed_hosts", network.allowed_hosts},
                {"allowed_methods", network.allowed_methods},
                {"credential_domains", network.credential_domains},
                {"sensitive_headers", network.sensitive_headers},
                {"max_request_body_bytes", network.max_request_body_bytes},
                {"max_response_bytes", network.max_response_bytes},
                {"rate_limit_requests", network.rate_limit_requests},
                {"rate_limit_window_ms", network.rate_limit_window_ms},
                {"max_requests_per_execution", network.max_requests_per_execution},
                {"request_timeout_ms", network.request_timeout_ms}
            }},
            {"values", {
                {"max_bytes", values.max_bytes},
                {"max_depth", values.max_depth},
                {"max_entries", values.max_entries},
                {"forbidden_keys", values.forbidden_keys},
                {"forbidden_patterns", values.forbidden_patterns}
            }}
        }},
        {"audit", {
            {"sink", config.audit.sink == AuditSinkType::JSONL ? "jsonl" : "log"},
            {"path", config.audit.path.string()},
            {"async", config.audit.async},
            {"queue_capacity", config.audit.queue_capacity}
        }},
        {"interpreter_overhead_bytes", config.interpreter_overhead_bytes},
        {"verbose_logging", config.verbose_logging}
    };
}

std::size_t ConfigLoader::MemoryCeilingBytes(std::size_t megabytes, const PlatformLimits& limits) {
    constexpr std::size_t kMegabyte = 1024 * 1024;
    if (megabytes > limits.max_memory_bytes / kMegabyte) {
        throw ConfigError("memory ceiling of " + std::to_string(megabytes) +
                          " MB exceeds the limit of " +
                          std::to_string(limits.max_memory_bytes / kMegabyte) + " MB");
    }
    return megabytes * kMegabyte;
}

} // namespace core
} // namespace sealbox
