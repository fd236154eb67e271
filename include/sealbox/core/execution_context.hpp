/**
 * @file execution_context.hpp
 * @brief One isolated run: a private interpreter plus its limiter and policy
 *
 * An ExecutionContext is created for exactly one request and destroyed when
 * the request finishes. It owns a fresh interpreter (runtime + context), a
 * fresh ResourceLimiter, a fresh SandboxPolicy and its own watchdog. Nothing
 * it owns is ever handed to another request.
 *
 * **Lifecycle**:
 * @code
 * CREATED -> INITIALIZING -> RUNNING -> COMPLETED | FAILED | ABORTED -> DESTROYED
 * @endcode
 * INITIALIZING and RUNNING may also fail straight into FAILED or ABORTED.
 * DESTROYED is entered from the destructor, whatever the terminal state.
 *
 * **Thread Safety**: Run() and the host services are interpreter-thread only.
 * Cancel(), State() and ExecutionId() may be called from any thread.
 *
 * @date 2025
 */

#pragma once

#include "sealbox/bridge/audit_sink.hpp"
#include "sealbox/bridge/http_transport.hpp"
#include "sealbox/bridge/secret_bridge.hpp"
#include "sealbox/core/execution_types.hpp"
#include "sealbox/core/interrupt_controller.hpp"
#include "sealbox/core/resource_limiter.hpp"
#include "sealbox/policy/network_guard.hpp"
#include "sealbox/policy/sandbox_policy.hpp"
#include "sealbox/policy/value_validator.hpp"

#include <quickjs.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sealbox {
namespace core {

/**
 * @enum ContextState
 * @brief Lifecycle state of an execution context
 */
enum class ContextState {
    CREATED,
    INITIALIZING,
    RUNNING,
    COMPLETED,
    FAILED,
    ABORTED,
    DESTROYED
};

std::string ToString(ContextState state);

/**
 * @struct ContextServices
 * @brief Shared collaborators handed to every context by the engine
 *
 * Everything here is either immutable or thread-safe.
 */
struct ContextServices {
    std::shared_ptr<const policy::PolicyConfig> policy;
    std::shared_ptr<const policy::ValueValidator> validator;
    std::shared_ptr<policy::HostRateLimiter> rate_limiter;
    std::shared_ptr<bridge::SecretStore> secret_store;
    std::shared_ptr<bridge::AuditSink> audit_sink;
    std::shared_ptr<bridge::HttpTransport> transport;
    std::size_t interpreter_overhead_bytes{1024 * 1024};
};

/**
 * @class ExecutionContext
 * @brief Single-use isolated run
 */
class ExecutionContext {
public:
    /**
     * @param request Already validated request
     * @param execution_id Unique identifier of this run
     * @throws SealboxError if a required service is missing
     */
    ExecutionContext(const ExecutionRequest& request, std::string execution_id,
                     ContextServices services);
    ~ExecutionContext();

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    /**
     * @brief Run the request to completion
     *
     * Never throws for script-side failures; those come back as results.
     * @throws SealboxError if called more than once
     */
    ExecutionResult Run();

    /// Abort the run at its next checkpoint
    bool Cancel() { return interrupts_.Cancel(); }

    ContextState State() const { return state_.load(std::memory_order_acquire); }
    const std::string& ExecutionId() const { return execution_id_; }
    const ExecutionRequest& Request() const { return request_; }

    /***************************************************************************
     * Host services used by the capability bindings
     ***************************************************************************/

    /**
     * @brief Charge bytes to the memory budget
     * @return Violation when refused; the run is then marked for abort
     */
    std::optional<ResourceViolation> ReserveMemory(std::size_t bytes);

    void ReleaseMemory(std::size_t bytes);

    /// Record a violation, audit it and mark the run for abort
    void RaiseViolation(policy::PolicyViolation violation);

    /// Capture one console line, subject to the log budget
    void AppendLog(const std::string& level, const std::string& text);

    /// Mediated secret lookup with identity attached
    bridge::SecretLookup LookupSecret(const std::string& name);

    /// Policy check for an outbound request
    std::optional<policy::PolicyViolation> AuthorizeRequest(const bridge::HttpRequest& request);

    /**
     * @brief Send an authorized request with the timeout capped by the time left
     * @throws bridge::TransportError
     */
    bridge::HttpResponse SendRequest(const bridge::HttpRequest& request);

    /// Record a host-side failure surfaced to the script as an InternalError
    void RecordInternalError(const std::string& message);

    const policy::SandboxPolicy& Policy() const { return policy_; }
    const ResourceLimiter& Limiter() const { return limiter_; }

private:
    struct Interpreter;

    /// Result of the interpreter phase, before classification
    struct RunOutcome {
        bool completed{false};
        nlohmann::json value;
        ErrorKind kind{ErrorKind::NONE};
        std::string message;
        std::string exception_name;
        std::string stack;
    };

    static int OnInterrupt(JSRuntime* runtime, void* opaque);
    static JSValue OnSettled(JSContext* ctx, JSValueConst this_val, int argc,
                             JSValueConst* argv, int magic, JSValue* data);
    bool Checkpoint();

    void TransitionTo(ContextState next);
    RunOutcome Evaluate();
    RunOutcome TakeException();
    RunOutcome ExceptionOutcome(JSValueConst exception);
    RunOutcome AwaitSettlement(JSValue thenable, JSValue then);
    RunOutcome Failure(ErrorKind kind, const std::string& message);
    ExecutionResult Classify(RunOutcome outcome);

    const ExecutionRequest request_;
    const std::string execution_id_;
    ContextServices services_;

    std::atomic<ContextState> state_{ContextState::CREATED};

    ResourceLimiter limiter_;
    policy::SandboxPolicy policy_;
    policy::NetworkGuard network_;
    bridge::SecretAccessBridge secrets_;
    InterruptController interrupts_;

    std::unique_ptr<Interpreter> interpreter_;

    std::atomic<bool> abort_requested_{false};
    std::optional<ResourceViolation> memory_violation_;
    std::optional<ResourceViolation> step_violation_;
    std::optional<std::string> internal_error_;
    std::size_t secret_denials_{0};
    std::vector<std::string> logs_;
    std::chrono::steady_clock::time_point started_;
};

} // namespace core
} // namespace sealbox
