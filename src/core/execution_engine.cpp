/**
 * @file execution_engine.cpp
 * @brief Request validation, context orchestration and result collection
 *
 * @date 2025
 */

#include "sealbox/core/execution_engine.hpp"
#include "sealbox/core/execution_context.hpp"
#include "sealbox/utils/hash_utils.hpp"
#include "sealbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>

namespace sealbox {
namespace core {

namespace {

// Reserved words cannot name the entry point even though they look like identifiers
const std::set<std::string> kReservedWords = {
    "await", "break", "case", "catch", "class", "const", "continue", "debugger",
    "default", "delete", "do", "else", "enum", "export", "extends", "false",
    "finally", "for", "function", "if", "implements", "import", "in", "instanceof",
    "interface", "let", "new", "null", "package", "private", "protected", "public",
    "return", "static", "super", "switch", "this", "throw", "true", "try",
    "typeof", "var", "void", "while", "with", "yield"
};

ExecutionResult Rejected(ErrorKind kind, const std::string& message) {
    ExecutionResult result;
    result.error_kind = kind;
    result.status = StatusFor(kind);
    result.message = message;
    return result;
}

} // anonymous namespace

// ============================================================================
// PRIVATE IMPLEMENTATION (PIMPL PATTERN)
// ============================================================================

class ExecutionEngine::Impl {
public:
    EngineConfig config;
    EngineCollaborators collaborators;
    ContextServices services;

    mutable std::mutex registry_mutex;
    std::map<std::string, ExecutionContext*> registry;
    std::atomic<std::uint64_t> total_executions{0};

    // Runs started through ExecuteAsync that have not returned yet
    std::mutex in_flight_mutex;
    std::condition_variable in_flight_done;
    std::size_t in_flight{0};

    void CancelAll() {
        std::lock_guard<std::mutex> lock(registry_mutex);
        for (auto& [id, context] : registry) {
            context->Cancel();
        }
    }

    // Keeps a context visible to Cancel() for the duration of its run
    class Registration {
    public:
        Registration(Impl& impl, const std::string& id, ExecutionContext* context)
            : impl_(impl), id_(id) {
            std::lock_guard<std::mutex> lock(impl_.registry_mutex);
            impl_.registry.emplace(id_, context);
        }
        ~Registration() {
            std::lock_guard<std::mutex> lock(impl_.registry_mutex);
            impl_.registry.erase(id_);
        }

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

    private:
        Impl& impl_;
        std::string id_;
    };
};

ExecutionEngine::ExecutionEngine(EngineConfig config, EngineCollaborators collaborators)
    : impl_(std::make_unique<Impl>()) {

    if (config.verbose_logging) {
        spdlog::set_level(spdlog::level::debug);
    }
    if (!collaborators.secret_store || !collaborators.audit_sink) {
        throw SealboxError("ExecutionEngine requires a secret store and an audit sink");
    }

    impl_->config = std::move(config);
    impl_->collaborators = std::move(collaborators);

    auto& services = impl_->services;
    services.policy = std::make_shared<const policy::PolicyConfig>(impl_->config.policy);
    services.validator = std::make_shared<const policy::ValueValidator>(impl_->config.policy.values);
    services.rate_limiter = std::make_shared<policy::HostRateLimiter>();
    services.secret_store = impl_->collaborators.secret_store;
    services.audit_sink = impl_->collaborators.audit_sink;
    services.transport = impl_->collaborators.transport;
    services.interpreter_overhead_bytes = impl_->config.interpreter_overhead_bytes;

    spdlog::debug("Execution engine ready (max memory {} bytes, max time {} ms, network {})",
                  impl_->config.limits.max_memory_bytes, impl_->config.limits.max_time_ms,
                  impl_->config.policy.network.enabled ? "enabled" : "disabled");
}

ExecutionEngine::~ExecutionEngine() {
    std::unique_lock<std::mutex> lock(impl_->in_flight_mutex);
    if (impl_->in_flight == 0) {
        return;
    }

    spdlog::warn("Execution engine destroyed with {} active executions, cancelling",
                 impl_->in_flight);
    // A run may register its context after a cancel pass, so keep sweeping
    while (impl_->in_flight > 0) {
        lock.unlock();
        impl_->CancelAll();
        lock.lock();
        impl_->in_flight_done.wait_for(lock, std::chrono::milliseconds(10),
                                       [this] { return impl_->in_flight == 0; });
    }
}

std::optional<std::string> ExecutionEngine::ValidateRequest(const ExecutionRequest& request) const {
    const auto& limits = impl_->config.limits;

    if (request.function_id.empty()) {
        return std::string("function ID is required");
    }
    if (request.user_id <= 0) {
        return std::string("user ID must be positive");
    }
    if (request.source_code.empty()) {
        return std::string("source code is required");
    }
    if (request.source_code.size() > limits.max_source_bytes) {
        return "source code is " + std::to_string(request.source_code.size()) +
               " bytes, limit is " + std::to_string(limits.max_source_bytes);
    }
    if (!utils::StringUtils::IsIdentifier(request.entry_point) ||
        kReservedWords.count(request.entry_point) > 0) {
        return "entry point '" + request.entry_point + "' is not a valid identifier";
    }
    if (request.memory_ceiling_bytes == 0 || request.memory_ceiling_bytes > limits.max_memory_bytes) {
        return "memory ceiling must be within (0, " + std::to_string(limits.max_memory_bytes) +
               "] bytes";
    }
    if (request.time_ceiling_ms <= 0 || request.time_ceiling_ms > limits.max_time_ms) {
        return "time ceiling must be within (0, " + std::to_string(limits.max_time_ms) + "] ms";
    }
    return std::nullopt;
}

ExecutionResult ExecutionEngine::Execute(const ExecutionRequest& request) {
    impl_->total_executions.fetch_add(1, std::memory_order_relaxed);

    if (auto problem = ValidateRequest(request)) {
        spdlog::warn("Rejected request for function {}: {}", request.function_id, *problem);
        return Rejected(ErrorKind::INVALID_REQUEST, "invalid request: " + *problem);
    }

    ExecutionResult result;
    std::string execution_id;
    try {
        execution_id = utils::HashUtils::GenerateExecutionId();
        auto context = std::make_unique<ExecutionContext>(request, execution_id, impl_->services);
        Impl::Registration registration(*impl_, execution_id, context.get());
        result = context->Run();
    } catch (const std::exception& e) {
        spdlog::error("Execution {} of function {} failed: {}", execution_id,
                      request.function_id, e.what());
        result = Rejected(ErrorKind::INTERNAL, std::string("internal error: ") + e.what());
        result.execution_id = execution_id;
    }

    spdlog::info("Execution {} of function {} (user {}) finished: {} in {} ms",
                 result.execution_id, request.function_id, request.user_id,
                 ToString(result.status), result.elapsed_ms);
    return result;
}

std::future<ExecutionResult> ExecutionEngine::ExecuteAsync(ExecutionRequest request) {
    {
        std::lock_guard<std::mutex> lock(impl_->in_flight_mutex);
        ++impl_->in_flight;
    }

    Impl* impl = impl_.get();
    return std::async(std::launch::async, [this, impl, request = std::move(request)]() {
        ExecutionResult result;
        try {
            result = Execute(request);
        } catch (const std::exception& e) {
            spdlog::error("Asynchronous execution of function {} failed: {}",
                          request.function_id, e.what());
            result = Rejected(ErrorKind::INTERNAL, std::string("internal error: ") + e.what());
        }

        // The engine may be destroyed as soon as the count drops
        std::lock_guard<std::mutex> lock(impl->in_flight_mutex);
        --impl->in_flight;
        impl->in_flight_done.notify_all();
        return result;
    });
}

bool ExecutionEngine::Cancel(const std::string& execution_id) {
    std::lock_guard<std::mutex> lock(impl_->registry_mutex);
    auto it = impl_->registry.find(execution_id);
    if (it == impl_->registry.end()) {
        return false;
    }
    spdlog::info("Cancelling execution {}", execution_id);
    return it->second->Cancel();
}

std::vector<std::string> ExecutionEngine::ActiveExecutionIds() const {
    std::lock_guard<std::mutex> lock(impl_->registry_mutex);
    std::vector<std::string> ids;
    ids.reserve(impl_->registry.size());
    for (const auto& [id, context] : impl_->registry) {
        ids.push_back(id);
    }
    return ids;
}

std::size_t ExecutionEngine::ActiveContexts() const {
    std::lock_guard<std::mutex> lock(impl_->registry_mutex);
    return impl_->registry.size();
}

std::uint64_t ExecutionEngine::TotalExecutions() const {
    return impl_->total_executions.load(std::memory_order_relaxed);
}

const EngineConfig& ExecutionEngine::Config() const {
    return impl_->config;
}

// ============================================================================
// EngineBuilder
// ============================================================================

std::shared_ptr<bridge::AuditSink> MakeAuditSink(const AuditConfig& config) {
    std::shared_ptr<bridge::AuditSink> sink;
    if (config.sink == AuditSinkType::JSONL) {
        sink = std::make_shared<bridge::JsonLinesAuditSink>(config.path);
    } else {
        sink = std::make_shared<bridge::LoggingAuditSink>();
    }

    if (config.async) {
        return std::make_shared<bridge::AsyncAuditSink>(sink, config.queue_capacity);
    }
    return sink;
}

std::unique_ptr<ExecutionEngine> EngineBuilder::Build() {
    if (!collaborators_.secret_store) {
        collaborators_.secret_store = std::make_shared<bridge::InMemorySecretStore>();
    }
    if (!collaborators_.audit_sink) {
        collaborators_.audit_sink = MakeAuditSink(config_.audit);
    }
    if (!collaborators_.transport && config_.policy.network.enabled) {
        collaborators_.transport = std::make_shared<bridge::CurlHttpTransport>();
    }
    return std::make_unique<ExecutionEngine>(config_, collaborators_);
}

} // namespace core
} // namespace sealbox
