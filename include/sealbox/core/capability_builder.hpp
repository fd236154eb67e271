/**
 * @file capability_builder.hpp
 * @brief Builds the binding set of a run and locks the global object down
 *
 * Install() runs once per context, before any user code, and in one step:
 * - instruments allocation sites (Array, ArrayBuffer, typed arrays,
 *   String.prototype.repeat, Array.prototype.push/concat/fill)
 * - replaces every reachable Function-style constructor with a stub that
 *   raises a "dynamic-code" violation
 * - defines the capability globals (console, fetch, getSecret, secrets,
 *   crypto, executionContext, params) allowed by the policy
 * - freezes built-in constructors, prototypes and the capability objects
 * - deletes every global outside the allow-list
 *
 * No binding is added after Install() returns.
 *
 * @date 2025
 */

#pragma once

#include "sealbox/core/execution_types.hpp"

#include <quickjs.h>

#include <string>
#include <vector>

namespace sealbox {
namespace core {

class ExecutionContext;

/**
 * @class CapabilityError
 * @brief The sandbox could not be set up
 */
class CapabilityError : public SealboxError {
public:
    explicit CapabilityError(const std::string& msg) : SealboxError(msg) {}
};

/**
 * @class CapabilityBuilder
 * @brief One-shot installer of the sandbox bindings
 */
class CapabilityBuilder {
public:
    /// Bytes accumulated in the interpreter before a reservation is forwarded
    static constexpr std::size_t kChargeGranularity = 16 * 1024;

    explicit CapabilityBuilder(ExecutionContext& owner);

    /**
     * @brief Install bindings and apply the lockdown
     * @param ctx Interpreter context whose opaque pointer is the owner
     * @param params Parameters value exposed as the `params` global
     * @throws CapabilityError if setup fails; a pending interpreter exception
     *         is consumed and described in the message
     */
    void Install(JSContext* ctx, JSValueConst params);

    /// Globals that could not be removed (non-configurable)
    const std::vector<std::string>& Leftovers() const { return leftovers_; }

private:
    ExecutionContext& owner_;
    std::vector<std::string> leftovers_;
};

} // namespace core
} // namespace sealbox
