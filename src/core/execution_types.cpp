/**
 * @file execution_types.cpp
 * @brief Wire names and JSON form of execution results
 *
 * @date 2025
 */

#include "sealbox/core/execution_types.hpp"

namespace sealbox {
namespace core {

std::string ToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::SUCCESS:              return "success";
        case ExecutionStatus::SCRIPT_ERROR:         return "scriptError";
        case ExecutionStatus::TIMEOUT:              return "timeout";
        case ExecutionStatus::RESOURCE_EXCEEDED:    return "resourceExceeded";
        case ExecutionStatus::SANDBOX_VIOLATION:    return "sandboxViolation";
        case ExecutionStatus::VALIDATION_ERROR:     return "validationError";
        case ExecutionStatus::SECRET_ACCESS_DENIED: return "secretAccessDenied";
    }
    return "unknown";
}

std::string ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                 return "none";
        case ErrorKind::INVALID_REQUEST:      return "invalidRequest";
        case ErrorKind::ENTRY_POINT_MISSING:  return "entryPointMissing";
        case ErrorKind::SCRIPT_ERROR:         return "scriptError";
        case ErrorKind::TIMEOUT:              return "timeout";
        case ErrorKind::RESOURCE_EXCEEDED:    return "resourceExceeded";
        case ErrorKind::SANDBOX_VIOLATION:    return "sandboxViolation";
        case ErrorKind::SECRET_ACCESS_DENIED: return "secretAccessDenied";
        case ErrorKind::VALIDATION_ERROR:     return "validationError";
        case ErrorKind::INTERNAL:             return "internal";
    }
    return "unknown";
}

ExecutionStatus StatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:
            return ExecutionStatus::SUCCESS;
        case ErrorKind::INVALID_REQUEST:
        case ErrorKind::VALIDATION_ERROR:
            return ExecutionStatus::VALIDATION_ERROR;
        case ErrorKind::TIMEOUT:
            return ExecutionStatus::TIMEOUT;
        case ErrorKind::RESOURCE_EXCEEDED:
            return ExecutionStatus::RESOURCE_EXCEEDED;
        case ErrorKind::SANDBOX_VIOLATION:
            return ExecutionStatus::SANDBOX_VIOLATION;
        case ErrorKind::SECRET_ACCESS_DENIED:
            return ExecutionStatus::SECRET_ACCESS_DENIED;
        case ErrorKind::ENTRY_POINT_MISSING:
        case ErrorKind::SCRIPT_ERROR:
        case ErrorKind::INTERNAL:
            return ExecutionStatus::SCRIPT_ERROR;
    }
    return ExecutionStatus::SCRIPT_ERROR;
}

nlohmann::json ExecutionResult::ToJson() const {
    nlohmann::json j;
    j["status"] = ToString(status);
    if (error_kind != ErrorKind::NONE) {
        j["errorKind"] = ToString(error_kind);
    }
    if (!execution_id.empty()) {
        j["executionId"] = execution_id;
    }
    if (status == ExecutionStatus::SUCCESS) {
        j["value"] = value;
    }
    j["message"] = message;
    j["elapsedMillis"] = elapsed_ms;
    j["logs"] = logs;
    if (!diagnostics.empty()) {
        j["diagnostics"] = diagnostics;
    }
    return j;
}

} // namespace core
} // namespace sealbox
