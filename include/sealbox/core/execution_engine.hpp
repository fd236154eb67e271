/**
 * @file execution_engine.hpp
 * @brief Public entry point: run one script request in a fresh sandbox
 *
 * The engine validates a request, builds a single-use ExecutionContext for
 * it, runs it and converts whatever happened into one ExecutionResult.
 * Execute() never throws.
 *
 * Concurrent calls share only the immutable policy, the per-host rate
 * limiter, the secret store, the audit sink and the HTTP transport. No
 * interpreter is ever reused.
 *
 * **Usage Example**:
 * @code
 * auto engine = EngineBuilder()
 *     .WithSecretStore(store)
 *     .WithAllowedHosts({"api.example.com"})
 *     .Build();
 *
 * ExecutionRequest request;
 * request.function_id = "price-feed";
 * request.user_id = 42;
 * request.source_code = "function main(params) { return params.x * 2; }";
 * request.parameters = {{"x", 21}};
 * request.memory_ceiling_bytes = 16 * 1024 * 1024;
 * request.time_ceiling_ms = 2000;
 *
 * auto result = engine->Execute(request);
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "sealbox/bridge/audit_sink.hpp"
#include "sealbox/bridge/http_transport.hpp"
#include "sealbox/bridge/secret_bridge.hpp"
#include "sealbox/core/engine_config.hpp"
#include "sealbox/core/execution_types.hpp"

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sealbox {
namespace core {

/**
 * @struct EngineCollaborators
 * @brief External services the engine talks to
 *
 * All of them must be thread-safe. The transport may be null when the
 * network is disabled; fetch() then fails inside the script.
 */
struct EngineCollaborators {
    std::shared_ptr<bridge::SecretStore> secret_store;
    std::shared_ptr<bridge::AuditSink> audit_sink;
    std::shared_ptr<bridge::HttpTransport> transport;
};

/**
 * @class ExecutionEngine
 * @brief Stateless-per-request script executor
 */
class ExecutionEngine {
public:
    /**
     * @throws SealboxError if a collaborator is missing or the policy holds
     *         an invalid pattern
     */
    ExecutionEngine(EngineConfig config, EngineCollaborators collaborators);
    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    /**
     * @brief Run one request to completion
     *
     * Invalid requests and parameters are rejected before any interpreter
     * is created; those results carry no execution ID.
     */
    ExecutionResult Execute(const ExecutionRequest& request);

    /// Execute() on a separate thread
    std::future<ExecutionResult> ExecuteAsync(ExecutionRequest request);

    /**
     * @brief Abort a running execution at its next checkpoint
     * @return false if the ID is unknown or the run already ended
     */
    bool Cancel(const std::string& execution_id);

    /// Human readable reason when the request is not acceptable
    std::optional<std::string> ValidateRequest(const ExecutionRequest& request) const;

    std::vector<std::string> ActiveExecutionIds() const;
    std::size_t ActiveContexts() const;
    std::uint64_t TotalExecutions() const;

    const EngineConfig& Config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @class EngineBuilder
 * @brief Fluent assembly of configuration and collaborators
 *
 * Build() fills in what was not given: an empty InMemorySecretStore, the
 * audit sink selected by the configuration, and a CurlHttpTransport when
 * the network is enabled.
 */
class EngineBuilder {
public:
    EngineBuilder& WithConfig(EngineConfig config) {
        config_ = std::move(config);
        return *this;
    }

    EngineBuilder& WithPolicy(policy::PolicyConfig policy) {
        config_.policy = std::move(policy);
        return *this;
    }

    EngineBuilder& WithLimits(PlatformLimits limits) {
        config_.limits = limits;
        return *this;
    }

    EngineBuilder& WithAllowedHosts(std::vector<std::string> hosts) {
        config_.policy.network.allowed_hosts = std::move(hosts);
        return *this;
    }

    EngineBuilder& WithMaxSteps(std::uint64_t steps) {
        config_.policy.max_steps = steps;
        return *this;
    }

    EngineBuilder& EnableNetwork(bool enable = true) {
        config_.policy.network.enabled = enable;
        return *this;
    }

    EngineBuilder& WithSecretStore(std::shared_ptr<bridge::SecretStore> store) {
        collaborators_.secret_store = std::move(store);
        return *this;
    }

    EngineBuilder& WithAuditSink(std::shared_ptr<bridge::AuditSink> sink) {
        collaborators_.audit_sink = std::move(sink);
        return *this;
    }

    EngineBuilder& WithTransport(std::shared_ptr<bridge::HttpTransport> transport) {
        collaborators_.transport = std::move(transport);
        return *this;
    }

    EngineBuilder& Verbose(bool enable = true) {
        config_.verbose_logging = enable;
        return *this;
    }

    /// @throws SealboxError if a collaborator cannot be created
    std::unique_ptr<ExecutionEngine> Build();

private:
    EngineConfig config_;
    EngineCollaborators collaborators_;
};

/// Audit sink described by the configuration (wrapped in AsyncAuditSink when async)
std::shared_ptr<bridge::AuditSink> MakeAuditSink(const AuditConfig& config);

} // namespace core
} // namespace sealbox
