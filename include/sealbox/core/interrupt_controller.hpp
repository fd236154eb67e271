/**
 * @file interrupt_controller.hpp
 * @brief Watchdog that aborts a running script after its deadline
 *
 * The controller owns one watchdog thread while armed. When the deadline
 * passes (or the caller cancels) it raises an abort flag. The interpreter
 * reads that flag at its periodic checkpoints and unwinds; the watchdog never
 * touches interpreter memory. The flag is the only state shared between the
 * two threads.
 *
 * **Idempotency**: firing twice, or firing after Disarm(), has no further
 * effect. The first reason recorded wins.
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace sealbox {
namespace core {

/**
 * @enum InterruptReason
 * @brief Why the abort flag was raised
 */
enum class InterruptReason : int {
    NONE = 0,     ///< Not fired
    DEADLINE,     ///< Time ceiling elapsed
    CANCELLED     ///< Caller cancelled the invocation
};

/**
 * @class InterruptController
 * @brief Deadline watchdog for a single execution
 *
 * **Usage Example**:
 * @code
 * InterruptController watchdog;
 * watchdog.Arm(std::chrono::milliseconds(1000));
 * // ... interpreter polls watchdog.ShouldInterrupt() at checkpoints ...
 * watchdog.Disarm();
 * if (watchdog.Reason() == InterruptReason::DEADLINE) { ... }
 * @endcode
 */
class InterruptController {
public:
    using Clock = std::chrono::steady_clock;

    InterruptController() = default;
    ~InterruptController();

    InterruptController(const InterruptController&) = delete;
    InterruptController& operator=(const InterruptController&) = delete;

    /**
     * @brief Start the watchdog
     * @param deadline Absolute point after which the run is aborted
     * @throws SealboxError if already armed or already used
     */
    void Arm(Clock::time_point deadline);

    /// Convenience overload: deadline = now + budget
    void Arm(std::chrono::milliseconds budget);

    /**
     * @brief Stop the watchdog and join its thread
     *
     * Safe to call more than once. After Disarm() the flag can no longer be
     * raised, but an already raised reason is kept for classification.
     */
    void Disarm();

    /**
     * @brief Raise the abort flag
     * @return true if this call raised it, false if it was already raised
     *         or the controller is disarmed
     */
    bool Fire(InterruptReason reason);

    /// Caller-initiated cancellation, routed through the same flag
    bool Cancel() { return Fire(InterruptReason::CANCELLED); }

    /// Checkpoint read; lock free
    bool ShouldInterrupt() const {
        return reason_.load(std::memory_order_acquire) != static_cast<int>(InterruptReason::NONE);
    }

    InterruptReason Reason() const {
        return static_cast<InterruptReason>(reason_.load(std::memory_order_acquire));
    }

    bool IsArmed() const { return armed_.load(std::memory_order_acquire); }

    /// Time left before the deadline (zero when unarmed or elapsed)
    std::chrono::milliseconds Remaining() const;

private:
    void WatchdogLoop();

    std::atomic<int> reason_{static_cast<int>(InterruptReason::NONE)};
    std::atomic<bool> armed_{false};
    std::atomic<bool> used_{false};
    std::atomic<Clock::rep> deadline_ticks_{0};

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    std::thread watchdog_;
};

} // namespace core
} // namespace sealbox
