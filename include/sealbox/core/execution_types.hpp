/**
 * @file execution_types.hpp
 * @brief Request, result and error taxonomy of the sandboxed execution engine
 *
 * These are the only types that cross the engine boundary. A request is
 * immutable once submitted; a result is created exactly once per invocation
 * and is never retained by the engine.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace sealbox {

/**
 * @class SealboxError
 * @brief Root of the host-side exception hierarchy
 *
 * Never escapes ExecutionEngine::Execute(); the engine converts every
 * exception into a typed ExecutionResult.
 */
class SealboxError : public std::runtime_error {
public:
    explicit SealboxError(const std::string& msg) : std::runtime_error(msg) {}
};

namespace core {

/**
 * @enum ExecutionStatus
 * @brief Coarse outcome reported to the caller
 */
enum class ExecutionStatus {
    SUCCESS,               ///< Entry point returned an accepted value
    SCRIPT_ERROR,          ///< Uncaught script error (or missing entry point)
    TIMEOUT,               ///< Time ceiling elapsed
    RESOURCE_EXCEEDED,     ///< Memory or step ceiling breached
    SANDBOX_VIOLATION,     ///< Disallowed capability/network access
    VALIDATION_ERROR,      ///< Input/output shape limits, or invalid request
    SECRET_ACCESS_DENIED   ///< Secret store rejected an uncaught lookup
};

/**
 * @enum ErrorKind
 * @brief Fine-grained failure taxonomy behind a status
 */
enum class ErrorKind {
    NONE,
    INVALID_REQUEST,
    ENTRY_POINT_MISSING,
    SCRIPT_ERROR,
    TIMEOUT,
    RESOURCE_EXCEEDED,
    SANDBOX_VIOLATION,
    SECRET_ACCESS_DENIED,
    VALIDATION_ERROR,
    INTERNAL
};

/**
 * @struct ExecutionRequest
 * @brief One invocation of one tenant function
 */
struct ExecutionRequest {
    std::string function_id;                        ///< Function being invoked
    std::int64_t user_id{0};                        ///< Owning tenant
    std::string source_code;                        ///< Script source
    std::string entry_point{"main"};                ///< Callable invoked after load
    nlohmann::json parameters = nlohmann::json::object();  ///< Structured input
    std::size_t memory_ceiling_bytes{0};            ///< Per-run memory budget
    std::int64_t time_ceiling_ms{0};                ///< Per-run wall-clock budget
};

/**
 * @struct ExecutionResult
 * @brief Outcome of one run
 *
 * `value` is only meaningful when status == SUCCESS. `diagnostics` always
 * is a JSON object (possibly empty).
 */
struct ExecutionResult {
    ExecutionStatus status{ExecutionStatus::SUCCESS};
    ErrorKind error_kind{ErrorKind::NONE};
    std::string execution_id;                   ///< Empty for rejected requests
    nlohmann::json value;                       ///< Returned value (success only)
    std::string message;                        ///< Error description
    std::int64_t elapsed_ms{0};                 ///< Wall time of the run
    std::vector<std::string> logs;              ///< Captured console output
    nlohmann::json diagnostics = nlohmann::json::object();

    bool IsSuccess() const { return status == ExecutionStatus::SUCCESS; }

    /// Wire representation used by the CLI and the surrounding service
    nlohmann::json ToJson() const;
};

/// Wire name of a status ("success", "scriptError", ...)
std::string ToString(ExecutionStatus status);

/// Wire name of an error kind ("invalidRequest", "entryPointMissing", ...)
std::string ToString(ErrorKind kind);

/// Status reported for a given error kind
ExecutionStatus StatusFor(ErrorKind kind);

} // namespace core
} // namespace sealbox
