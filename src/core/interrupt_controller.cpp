/**
 * @file interrupt_controller.cpp
 * @brief Watchdog thread implementation
 *
 * The watchdog sleeps on a condition variable until either the deadline
 * passes or Disarm() wakes it. Only the abort flag is written from the
 * watchdog thread.
 *
 * @date 2025
 */

#include "sealbox/core/interrupt_controller.hpp"
#include "sealbox/core/execution_types.hpp"

#include <spdlog/spdlog.h>

namespace sealbox {
namespace core {

InterruptController::~InterruptController() {
    Disarm();
}

void InterruptController::Arm(Clock::time_point deadline) {
    bool expected = false;
    if (!used_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        throw SealboxError("Interrupt controller can only be armed once");
    }

    deadline_ticks_.store(deadline.time_since_epoch().count(), std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    armed_.store(true, std::memory_order_release);

    watchdog_ = std::thread(&InterruptController::WatchdogLoop, this);
}

void InterruptController::Arm(std::chrono::milliseconds budget) {
    Arm(Clock::now() + budget);
}

void InterruptController::Disarm() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        armed_.store(false, std::memory_order_release);
    }
    cv_.notify_all();

    if (watchdog_.joinable()) {
        watchdog_.join();
    }
}

bool InterruptController::Fire(InterruptReason reason) {
    if (reason == InterruptReason::NONE || !armed_.load(std::memory_order_acquire)) {
        return false;
    }

    int expected = static_cast<int>(InterruptReason::NONE);
    return reason_.compare_exchange_strong(expected, static_cast<int>(reason),
                                           std::memory_order_acq_rel);
}

std::chrono::milliseconds InterruptController::Remaining() const {
    if (!armed_.load(std::memory_order_acquire)) {
        return std::chrono::milliseconds(0);
    }
    Clock::time_point deadline{Clock::duration(deadline_ticks_.load(std::memory_order_acquire))};
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

void InterruptController::WatchdogLoop() {
    Clock::time_point deadline{Clock::duration(deadline_ticks_.load(std::memory_order_acquire))};

    std::unique_lock<std::mutex> lock(mutex_);
    bool stopped = cv_.wait_until(lock, deadline, [this] { return stop_requested_; });
    if (stopped) {
        return;
    }
    lock.unlock();

    if (Fire(InterruptReason::DEADLINE)) {
        spdlog::warn("Watchdog deadline reached, aborting execution");
    }
}

} // namespace core
} // namespace sealbox
