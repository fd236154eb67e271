/**
 * @file resource_limiter.cpp
 * @brief Implementation of the per-execution memory ledger
 *
 * @date 2025
 */

#include "sealbox/core/resource_limiter.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace sealbox {
namespace core {

std::string ResourceViolation::Describe() const {
    std::ostringstream oss;
    if (kind == "steps") {
        oss << "step limit exceeded: " << requested << " checkpoints, ceiling "
            << ceiling << " checkpoints";
    } else {
        oss << kind << " limit exceeded: requested " << requested
            << " bytes, ceiling " << ceiling << " bytes";
    }
    return oss.str();
}

ResourceLimiter::ResourceLimiter(std::size_t ceiling_bytes)
    : ceiling_(ceiling_bytes) {
}

std::optional<ResourceViolation> ResourceLimiter::Reserve(std::size_t bytes) {
    std::size_t current = used_.load(std::memory_order_acquire);
    for (;;) {
        if (bytes > ceiling_ || current > ceiling_ - bytes) {
            rejected_.fetch_add(1, std::memory_order_acq_rel);

            ResourceViolation violation;
            violation.kind = "memory";
            // Saturate instead of wrapping for absurd requests
            violation.requested = bytes > SIZE_MAX - current
                ? static_cast<std::uint64_t>(SIZE_MAX)
                : static_cast<std::uint64_t>(current + bytes);
            violation.ceiling = ceiling_;

            spdlog::debug("Reservation of {} bytes refused ({} of {} in use)",
                bytes, current, ceiling_);
            return violation;
        }

        if (used_.compare_exchange_weak(current, current + bytes,
                                        std::memory_order_acq_rel)) {
            break;
        }
    }

    std::size_t now = current + bytes;
    std::size_t peak = peak_.load(std::memory_order_acquire);
    while (now > peak &&
           !peak_.compare_exchange_weak(peak, now, std::memory_order_acq_rel)) {
    }

    return std::nullopt;
}

void ResourceLimiter::Release(std::size_t bytes) {
    std::size_t current = used_.load(std::memory_order_acquire);
    std::size_t next;
    do {
        next = bytes >= current ? 0 : current - bytes;
    } while (!used_.compare_exchange_weak(current, next, std::memory_order_acq_rel));
}

} // namespace core
} // namespace sealbox
