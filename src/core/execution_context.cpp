/**
 * @file execution_context.cpp
 * @brief Single-run interpreter lifecycle and outcome classification
 *
 * @date 2025
 */

#include "sealbox/core/execution_context.hpp"
#include "sealbox/core/capability_builder.hpp"
#include "sealbox/core/js_value_codec.hpp"
#include "sealbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sealbox {
namespace core {

using utils::StringUtils;

namespace {

enum SettleState {
    PENDING = 0,
    FULFILLED = 1,
    REJECTED = 2
};

ContextServices RequireServices(ContextServices services) {
    if (!services.policy || !services.validator || !services.rate_limiter) {
        throw SealboxError("execution context requires a policy, a validator and a rate limiter");
    }
    if (!services.secret_store || !services.audit_sink) {
        throw SealboxError("execution context requires a secret store and an audit sink");
    }
    return services;
}

} // anonymous namespace

std::string ToString(ContextState state) {
    switch (state) {
        case ContextState::CREATED:      return "created";
        case ContextState::INITIALIZING: return "initializing";
        case ContextState::RUNNING:      return "running";
        case ContextState::COMPLETED:    return "completed";
        case ContextState::FAILED:       return "failed";
        case ContextState::ABORTED:      return "aborted";
        case ContextState::DESTROYED:    return "destroyed";
        default:                         return "unknown";
    }
}

// ============================================================================
// Interpreter
// ============================================================================

struct ExecutionContext::Interpreter {
    JSRuntime* runtime{nullptr};
    JSContext* context{nullptr};
    JSValue settled{JS_UNDEFINED};
    int settle_state{PENDING};

    ~Interpreter() {
        if (context) {
            JS_FreeValue(context, settled);
            JS_FreeContext(context);
        }
        if (runtime) {
            JS_FreeRuntime(runtime);
        }
    }
};

// ============================================================================
// Lifecycle
// ============================================================================

ExecutionContext::ExecutionContext(const ExecutionRequest& request, std::string execution_id,
                                   ContextServices services)
    : request_(request)
    , execution_id_(std::move(execution_id))
    , services_(RequireServices(std::move(services)))
    , limiter_(request.memory_ceiling_bytes)
    , policy_(services_.policy)
    , network_(services_.policy->network, services_.rate_limiter)
    , secrets_(services_.secret_store, services_.audit_sink,
               bridge::SecretAccessContext{request.user_id, request.function_id, execution_id_}) {
    spdlog::debug("Execution {} created for function {}", execution_id_, request_.function_id);
}

ExecutionContext::~ExecutionContext() {
    interrupts_.Disarm();
    interpreter_.reset();
    TransitionTo(ContextState::DESTROYED);
}

void ExecutionContext::TransitionTo(ContextState next) {
    ContextState previous = state_.exchange(next, std::memory_order_acq_rel);
    spdlog::debug("Execution {}: {} -> {}", execution_id_, ToString(previous), ToString(next));
}

ExecutionResult ExecutionContext::Run() {
    ContextState expected = ContextState::CREATED;
    if (!state_.compare_exchange_strong(expected, ContextState::INITIALIZING,
                                        std::memory_order_acq_rel)) {
        throw SealboxError("Execution context " + execution_id_ + " cannot be run twice");
    }
    spdlog::debug("Execution {}: created -> initializing", execution_id_);

    started_ = std::chrono::steady_clock::now();
    interrupts_.Arm(std::chrono::milliseconds(request_.time_ceiling_ms));

    RunOutcome outcome;
    try {
        outcome = Evaluate();
    } catch (const std::exception& e) {
        spdlog::error("Execution {} failed in host code: {}", execution_id_, e.what());
        RecordInternalError(e.what());
        outcome = Failure(ErrorKind::INTERNAL, e.what());
    }

    interrupts_.Disarm();

    ExecutionResult result = Classify(std::move(outcome));
    interpreter_.reset();
    return result;
}

// ============================================================================
// Interpreter phase
// ============================================================================

ExecutionContext::RunOutcome ExecutionContext::Evaluate() {
    auto params_check = services_.validator->Validate(request_.parameters, "params");
    if (!params_check.valid) {
        spdlog::warn("Execution {}: rejected parameters: {}", execution_id_, params_check.error);
        return Failure(ErrorKind::VALIDATION_ERROR, params_check.error);
    }

    interpreter_ = std::make_unique<Interpreter>();

    JSRuntime* runtime = JS_NewRuntime();
    if (!runtime) {
        throw SealboxError("Failed to create interpreter runtime");
    }
    interpreter_->runtime = runtime;

    JS_SetMemoryLimit(runtime, request_.memory_ceiling_bytes + services_.interpreter_overhead_bytes);
    JS_SetMaxStackSize(runtime, policy_.Config().max_stack_bytes);
    JS_SetInterruptHandler(runtime, &ExecutionContext::OnInterrupt, this);

    JSContext* ctx = JS_NewContext(runtime);
    if (!ctx) {
        throw SealboxError("Failed to create interpreter context");
    }
    interpreter_->context = ctx;
    JS_SetContextOpaque(ctx, this);

    JSValue params = JsonToJs(ctx, request_.parameters);
    if (JS_IsException(params)) {
        return TakeException();
    }

    CapabilityBuilder capabilities(*this);
    try {
        capabilities.Install(ctx, params);
    } catch (const CapabilityError& e) {
        JS_FreeValue(ctx, params);
        spdlog::error("Execution {}: {}", execution_id_, e.what());
        return Failure(ErrorKind::INTERNAL, e.what());
    }

    const std::string& entry = request_.entry_point;
    std::string frame = "(function () {\n" + request_.source_code +
                        "\n;return typeof " + entry + " === 'function' ? " + entry +
                        " : undefined;\n})";

    JSValue factory = JS_Eval(ctx, frame.c_str(), frame.size(), request_.function_id.c_str(),
                              JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(factory)) {
        JS_FreeValue(ctx, params);
        return TakeException();
    }
    if (!JS_IsFunction(ctx, factory)) {
        JS_FreeValue(ctx, factory);
        JS_FreeValue(ctx, params);
        return Failure(ErrorKind::ENTRY_POINT_MISSING,
                       "source does not evaluate to a loadable function body");
    }

    JSValue callee = JS_Call(ctx, factory, JS_UNDEFINED, 0, nullptr);
    JS_FreeValue(ctx, factory);
    if (JS_IsException(callee)) {
        JS_FreeValue(ctx, params);
        return TakeException();
    }
    if (!JS_IsFunction(ctx, callee)) {
        JS_FreeValue(ctx, callee);
        JS_FreeValue(ctx, params);
        return Failure(ErrorKind::ENTRY_POINT_MISSING,
                       "entry point '" + entry + "' is not defined or not a function");
    }

    TransitionTo(ContextState::RUNNING);

    JSValue returned = JS_Call(ctx, callee, JS_UNDEFINED, 1, &params);
    JS_FreeValue(ctx, callee);
    JS_FreeValue(ctx, params);
    if (JS_IsException(returned)) {
        return TakeException();
    }

    if (JS_IsObject(returned)) {
        JSValue then = JS_GetPropertyStr(ctx, returned, "then");
        if (JS_IsException(then)) {
            JS_FreeValue(ctx, returned);
            return TakeException();
        }
        if (JS_IsFunction(ctx, then)) {
            RunOutcome settlement = AwaitSettlement(returned, then);
            if (!settlement.completed) {
                return settlement;
            }
            returned = interpreter_->settled;
            interpreter_->settled = JS_UNDEFINED;
        } else {
            JS_FreeValue(ctx, then);
        }
    }

    const auto& values = policy_.Config().values;
    RunOutcome outcome;
    try {
        outcome.value = JsToJson(ctx, returned, CodecLimits{values.max_depth, values.max_entries});
    } catch (const ValueConversionError& e) {
        JS_FreeValue(ctx, returned);
        return Failure(ErrorKind::VALIDATION_ERROR, std::string("invalid result: ") + e.what());
    }
    JS_FreeValue(ctx, returned);

    auto validation = services_.validator->Validate(outcome.value, "result");
    if (!validation.valid) {
        return Failure(ErrorKind::VALIDATION_ERROR, validation.error);
    }

    outcome.completed = true;
    return outcome;
}

ExecutionContext::RunOutcome ExecutionContext::AwaitSettlement(JSValue thenable, JSValue then) {
    JSContext* ctx = interpreter_->context;

    JSValue callbacks[2] = {
        JS_NewCFunctionData(ctx, &ExecutionContext::OnSettled, 1, FULFILLED, 0, nullptr),
        JS_NewCFunctionData(ctx, &ExecutionContext::OnSettled, 1, REJECTED, 0, nullptr)
    };
    JSValue chained = JS_Call(ctx, then, thenable, 2, callbacks);
    JS_FreeValue(ctx, callbacks[0]);
    JS_FreeValue(ctx, callbacks[1]);
    JS_FreeValue(ctx, then);
    JS_FreeValue(ctx, thenable);
    if (JS_IsException(chained)) {
        return TakeException();
    }
    JS_FreeValue(ctx, chained);

    while (interpreter_->settle_state == PENDING &&
           !abort_requested_.load(std::memory_order_acquire) &&
           !interrupts_.ShouldInterrupt()) {
        JSContext* job_ctx = nullptr;
        int rc = JS_ExecutePendingJob(interpreter_->runtime, &job_ctx);
        if (rc == 0) {
            break;
        }
        if (rc < 0) {
            return TakeException();
        }
    }

    if (interpreter_->settle_state == FULFILLED) {
        RunOutcome fulfilled;
        fulfilled.completed = true;
        return fulfilled;
    }
    if (interpreter_->settle_state == REJECTED) {
        RunOutcome rejected = ExceptionOutcome(interpreter_->settled);
        JS_FreeValue(ctx, interpreter_->settled);
        interpreter_->settled = JS_UNDEFINED;
        return rejected;
    }
    if (abort_requested_.load(std::memory_order_acquire) || interrupts_.ShouldInterrupt()) {
        return Failure(ErrorKind::SCRIPT_ERROR, "execution interrupted while awaiting a promise");
    }
    return Failure(ErrorKind::SCRIPT_ERROR, "promise returned by entry point never settled");
}

JSValue ExecutionContext::OnSettled(JSContext* ctx, JSValueConst, int argc,
                                    JSValueConst* argv, int magic, JSValue*) {
    auto* self = static_cast<ExecutionContext*>(JS_GetContextOpaque(ctx));
    Interpreter& interpreter = *self->interpreter_;
    if (interpreter.settle_state == PENDING) {
        interpreter.settled = JS_DupValue(ctx, argc > 0 ? argv[0] : JS_UNDEFINED);
        interpreter.settle_state = magic;
    }
    return JS_UNDEFINED;
}

ExecutionContext::RunOutcome ExecutionContext::TakeException() {
    JSContext* ctx = interpreter_->context;
    JSValue exception = JS_GetException(ctx);
    RunOutcome outcome = ExceptionOutcome(exception);
    JS_FreeValue(ctx, exception);
    return outcome;
}

ExecutionContext::RunOutcome ExecutionContext::ExceptionOutcome(JSValueConst exception) {
    JSContext* ctx = interpreter_->context;
    RunOutcome outcome;
    outcome.kind = ErrorKind::SCRIPT_ERROR;
    outcome.exception_name = GetStringProperty(ctx, exception, "name");
    outcome.message = DescribeException(ctx, exception);
    outcome.stack = GetStringProperty(ctx, exception, "stack");
    if (outcome.message.empty()) {
        outcome.message = "uncaught exception";
    }
    return outcome;
}

ExecutionContext::RunOutcome ExecutionContext::Failure(ErrorKind kind, const std::string& message) {
    RunOutcome outcome;
    outcome.kind = kind;
    outcome.message = message;
    return outcome;
}

// ============================================================================
// Checkpoints
// ============================================================================

int ExecutionContext::OnInterrupt(JSRuntime*, void* opaque) {
    return static_cast<ExecutionContext*>(opaque)->Checkpoint() ? 1 : 0;
}

bool ExecutionContext::Checkpoint() {
    if (abort_requested_.load(std::memory_order_acquire)) {
        return true;
    }
    if (auto violation = policy_.Step()) {
        if (!step_violation_) {
            step_violation_ = violation;
            spdlog::warn("Execution {}: {}", execution_id_, violation->Describe());
        }
        abort_requested_.store(true, std::memory_order_release);
        return true;
    }
    return interrupts_.ShouldInterrupt();
}

// ============================================================================
// Classification
// ============================================================================

ExecutionResult ExecutionContext::Classify(RunOutcome outcome) {
    ExecutionResult result;
    result.execution_id = execution_id_;
    result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_).count();

    ErrorKind kind = outcome.kind;
    std::string message = outcome.message;
    auto violation = policy_.FirstViolation();
    InterruptReason interrupt = interrupts_.Reason();

    if (memory_violation_) {
        kind = ErrorKind::RESOURCE_EXCEEDED;
        message = memory_violation_->Describe();
    } else if (violation) {
        kind = ErrorKind::SANDBOX_VIOLATION;
        message = "sandbox violation (" + violation->rule + "): " + violation->detail;
    } else if (step_violation_) {
        kind = ErrorKind::RESOURCE_EXCEEDED;
        message = step_violation_->Describe();
    } else if (!outcome.completed && interrupt == InterruptReason::DEADLINE) {
        kind = ErrorKind::TIMEOUT;
        message = "execution timed out after " + std::to_string(request_.time_ceiling_ms) + " ms";
    } else if (!outcome.completed && interrupt == InterruptReason::CANCELLED) {
        kind = ErrorKind::TIMEOUT;
        message = "execution cancelled";
    } else if (!outcome.completed && StringUtils::Contains(outcome.message, "out of memory")) {
        kind = ErrorKind::RESOURCE_EXCEEDED;
        message = ResourceViolation{"memory", request_.memory_ceiling_bytes + 1,
                                    request_.memory_ceiling_bytes}.Describe();
    } else if (!outcome.completed && (StringUtils::Contains(outcome.message, "stack overflow") ||
                                      StringUtils::Contains(outcome.message, "Maximum call stack size exceeded"))) {
        kind = ErrorKind::RESOURCE_EXCEEDED;
        message = "stack limit exceeded: ceiling " +
                  std::to_string(policy_.Config().max_stack_bytes) + " bytes";
    } else if (!outcome.completed && outcome.exception_name == "SecretAccessDenied" &&
               secret_denials_ > 0) {
        kind = ErrorKind::SECRET_ACCESS_DENIED;
    } else if (!outcome.completed && internal_error_) {
        kind = ErrorKind::INTERNAL;
        message = *internal_error_;
    }

    result.error_kind = kind;
    result.status = StatusFor(result.error_kind);
    result.message = message;
    if (result.IsSuccess()) {
        result.value = std::move(outcome.value);
    }
    result.logs = std::move(logs_);

    auto& diagnostics = result.diagnostics;
    diagnostics["steps"] = policy_.Steps();
    diagnostics["memory_peak_bytes"] = limiter_.PeakUsage();
    diagnostics["memory_ceiling_bytes"] = limiter_.Ceiling();
    diagnostics["time_ceiling_ms"] = request_.time_ceiling_ms;
    diagnostics["logs_truncated"] = policy_.LogsTruncated();
    diagnostics["network_requests"] = network_.RequestCount();
    diagnostics["secret_lookups"] = secrets_.Calls();
    if (interpreter_ && interpreter_->runtime) {
        JSMemoryUsage usage;
        JS_ComputeMemoryUsage(interpreter_->runtime, &usage);
        diagnostics["interpreter_memory_bytes"] = usage.malloc_size;
    }
    if (violation) {
        diagnostics["violation_rule"] = violation->rule;
    }
    if (result.status == ExecutionStatus::SCRIPT_ERROR && !outcome.stack.empty()) {
        diagnostics["stack"] = outcome.stack;
    }

    if (result.IsSuccess()) {
        TransitionTo(ContextState::COMPLETED);
    } else if (abort_requested_.load(std::memory_order_acquire) ||
               interrupt != InterruptReason::NONE ||
               result.status == ExecutionStatus::TIMEOUT ||
               result.status == ExecutionStatus::RESOURCE_EXCEEDED) {
        TransitionTo(ContextState::ABORTED);
    } else {
        TransitionTo(ContextState::FAILED);
    }
    return result;
}

// ============================================================================
// Host services
// ============================================================================

std::optional<ResourceViolation> ExecutionContext::ReserveMemory(std::size_t bytes) {
    auto violation = limiter_.Reserve(bytes);
    if (violation) {
        if (!memory_violation_) {
            memory_violation_ = violation;
            spdlog::warn("Execution {}: {}", execution_id_, violation->Describe());
        }
        abort_requested_.store(true, std::memory_order_release);
    }
    return violation;
}

void ExecutionContext::ReleaseMemory(std::size_t bytes) {
    limiter_.Release(bytes);
}

void ExecutionContext::RaiseViolation(policy::PolicyViolation violation) {
    bridge::AuditEntry entry;
    entry.user_id = request_.user_id;
    entry.function_id = request_.function_id;
    entry.execution_id = execution_id_;
    entry.action = "policy.violation";
    entry.subject = violation.rule;
    entry.success = false;
    entry.detail = violation.detail;

    policy_.RecordViolation(std::move(violation));
    abort_requested_.store(true, std::memory_order_release);
    services_.audit_sink->Append(entry);
}

void ExecutionContext::AppendLog(const std::string& level, const std::string& text) {
    if (auto line = policy_.AdmitLog("[" + level + "] " + text)) {
        logs_.push_back(std::move(*line));
    }
}

bridge::SecretLookup ExecutionContext::LookupSecret(const std::string& name) {
    bridge::SecretLookup lookup = secrets_.Get(name);
    if (!lookup.granted) {
        ++secret_denials_;
    }
    return lookup;
}

std::optional<policy::PolicyViolation> ExecutionContext::AuthorizeRequest(
    const bridge::HttpRequest& request) {
    return network_.Check(request);
}

bridge::HttpResponse ExecutionContext::SendRequest(const bridge::HttpRequest& request) {
    if (!services_.transport) {
        throw bridge::TransportError(bridge::TransportError::Kind::FAILED,
                                     "no HTTP transport configured");
    }

    const auto& rules = policy_.Config().network;
    std::int64_t remaining = interrupts_.Remaining().count();
    if (remaining <= 0) {
        throw bridge::TransportError(bridge::TransportError::Kind::TIMEOUT,
                                     "no time left for the request");
    }

    bridge::TransportOptions options;
    options.timeout_ms = std::min(rules.request_timeout_ms, remaining);
    options.max_response_bytes = rules.max_response_bytes;

    spdlog::debug("Execution {}: {} {}", execution_id_, request.method, request.url);
    return services_.transport->Send(request, options);
}

void ExecutionContext::RecordInternalError(const std::string& message) {
    if (!internal_error_) {
        internal_error_ = message;
    }
}

} // namespace core
} // namespace sealbox
