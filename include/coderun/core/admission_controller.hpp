/**
 * @file admission_controller.hpp
 * @brief Bounded, first-come-first-served admission of concurrent sandboxes
 *
 * At most `capacity` slots are held at any time. Callers that find no free
 * slot queue up and are admitted strictly in arrival order; a caller that
 * waits longer than the queue timeout leaves the queue and gets
 * AdmissionTimeoutError. Slots are RAII tokens: destroying (or moving out of)
 * a Slot returns the capacity, so every exit path of an execution releases
 * it.
 *
 * The in-use counter and the waiter queue are guarded by one mutex; nothing
 * else in the controller is mutable. Waiting uses a condition variable, so a
 * blocked caller does not hold the mutex.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace coderun {
namespace core {

/**
 * @class AdmissionController
 * @brief Counting semaphore with FIFO waiters and a queue-wait timeout
 *
 * **Thread Safety**: All methods are thread-safe. The controller must
 * outlive every Slot it hands out.
 */
class AdmissionController {
public:
    /**
     * @class Slot
     * @brief Move-only token for one unit of capacity
     */
    class Slot {
    public:
        Slot() = default;
        ~Slot();

        Slot(Slot&& other) noexcept;
        Slot& operator=(Slot&& other) noexcept;

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        /**
         * @brief True while this token still holds capacity
         */
        bool IsHeld() const { return controller_ != nullptr; }

        /**
         * @brief Return the capacity early; later calls are no-ops
         */
        void Release();

    private:
        friend class AdmissionController;
        explicit Slot(AdmissionController* controller) : controller_(controller) {}

        AdmissionController* controller_{nullptr};
    };

    /**
     * @brief Construct controller
     * @param capacity Maximum concurrently held slots (must be > 0)
     * @param queue_wait_timeout Default wait used by Acquire()
     * @throws std::invalid_argument if capacity is 0
     */
    AdmissionController(std::size_t capacity, std::chrono::milliseconds queue_wait_timeout);

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    /**
     * @brief Wait for a slot using the configured queue timeout
     * @throws AdmissionTimeoutError if none becomes free in time
     */
    Slot Acquire();

    /**
     * @brief Wait for a slot with an explicit timeout
     * @throws AdmissionTimeoutError if none becomes free in time
     */
    Slot Acquire(std::chrono::milliseconds wait_timeout);

    /**
     * @brief Take a slot only if one is free and nobody is queued
     */
    std::optional<Slot> TryAcquire();

    std::size_t Capacity() const { return capacity_; }
    std::chrono::milliseconds QueueWaitTimeout() const { return queue_wait_timeout_; }

    /// Slots currently held
    std::size_t InUse() const;

    /// Callers currently queued
    std::size_t Waiting() const;

private:
    void ReleaseSlot();

    const std::size_t capacity_;
    const std::chrono::milliseconds queue_wait_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
    std::size_t in_use_{0};
    std::uint64_t next_ticket_{0};
    std::deque<std::uint64_t> waiters_;
};

} // namespace core
} // namespace coderun
