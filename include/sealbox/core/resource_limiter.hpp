/**
 * @file resource_limiter.hpp
 * @brief Per-execution memory ledger
 *
 * Every tracked allocation site inside the sandbox (instrumented
 * constructors, array growth helpers) reserves its estimated size here
 * before the allocation happens. A reservation that would cross the ceiling
 * is refused and must surface in the script as a thrown error.
 *
 * **Thread Safety**: writes come from the interpreter thread only; reads are
 * safe from any thread (the watchdog reads usage for diagnostics).
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace sealbox {
namespace core {

/**
 * @struct ResourceViolation
 * @brief A refused reservation or a breached step ceiling
 */
struct ResourceViolation {
    std::string kind;             ///< "memory" or "steps"
    std::uint64_t requested{0};   ///< Usage the operation would have reached
    std::uint64_t ceiling{0};     ///< Configured ceiling

    /// Human readable form, e.g. "memory limit exceeded: requested 104857600 bytes, ceiling 5242880 bytes"
    std::string Describe() const;
};

/**
 * @class ResourceLimiter
 * @brief Tracks memory attributed to one execution against a ceiling
 *
 * **Usage Example**:
 * @code
 * ResourceLimiter limiter(5 * 1024 * 1024);
 * if (auto violation = limiter.Reserve(100 * 1024 * 1024)) {
 *     // throw into the script, record violation->Describe()
 * }
 * @endcode
 */
class ResourceLimiter {
public:
    explicit ResourceLimiter(std::size_t ceiling_bytes);

    ResourceLimiter(const ResourceLimiter&) = delete;
    ResourceLimiter& operator=(const ResourceLimiter&) = delete;

    /**
     * @brief Reserve bytes against the ceiling
     * @return Violation if CurrentUsage() + bytes would exceed the ceiling;
     *         usage is left unchanged in that case
     */
    std::optional<ResourceViolation> Reserve(std::size_t bytes);

    /**
     * @brief Return bytes to the budget (best effort)
     *
     * Releasing more than is reserved clamps usage at zero.
     */
    void Release(std::size_t bytes);

    std::size_t CurrentUsage() const { return used_.load(std::memory_order_acquire); }
    std::size_t PeakUsage() const { return peak_.load(std::memory_order_acquire); }
    std::size_t Ceiling() const { return ceiling_; }

    /// Number of reservations refused so far
    std::uint64_t RejectedReservations() const {
        return rejected_.load(std::memory_order_acquire);
    }

private:
    const std::size_t ceiling_;
    std::atomic<std::size_t> used_{0};
    std::atomic<std::size_t> peak_{0};
    std::atomic<std::uint64_t> rejected_{0};
};

} // namespace core
} // namespace sealbox
