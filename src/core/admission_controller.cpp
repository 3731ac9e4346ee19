/**
 * @file admission_controller.cpp
 * @brief FIFO counting semaphore with queue-wait timeout
 *
 * **Fairness**:
 * Every caller that cannot be admitted immediately takes a ticket and
 * appends it to `waiters_`. Only the ticket at the front of the queue may
 * take a freed slot, so admission order equals arrival order. A newcomer is
 * admitted without queueing only when the queue is empty.
 *
 * **Timeout**:
 * A waiter whose deadline passes removes its own ticket and wakes the others,
 * since the ticket behind it may now be at the front.
 *
 * @date 2025
 */

#include "coderun/core/admission_controller.hpp"
#include "coderun/core/execution_errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace coderun {
namespace core {

// ============================================================================
// SLOT
// ============================================================================

AdmissionController::Slot::~Slot() {
    Release();
}

AdmissionController::Slot::Slot(Slot&& other) noexcept
    : controller_(other.controller_) {
    other.controller_ = nullptr;
}

AdmissionController::Slot& AdmissionController::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        Release();
        controller_ = other.controller_;
        other.controller_ = nullptr;
    }
    return *this;
}

void AdmissionController::Slot::Release() {
    if (controller_ != nullptr) {
        auto* controller = controller_;
        controller_ = nullptr;
        controller->ReleaseSlot();
    }
}

// ============================================================================
// CONTROLLER
// ============================================================================

AdmissionController::AdmissionController(std::size_t capacity,
                                         std::chrono::milliseconds queue_wait_timeout)
    : capacity_(capacity)
    , queue_wait_timeout_(queue_wait_timeout) {
    if (capacity_ == 0) {
        throw std::invalid_argument("Admission capacity must be greater than zero");
    }
    spdlog::debug("Admission controller: capacity {}, queue wait {} ms",
                  capacity_, queue_wait_timeout_.count());
}

AdmissionController::Slot AdmissionController::Acquire() {
    return Acquire(queue_wait_timeout_);
}

AdmissionController::Slot AdmissionController::Acquire(std::chrono::milliseconds wait_timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (waiters_.empty() && in_use_ < capacity_) {
        ++in_use_;
        return Slot(this);
    }

    const auto ticket = next_ticket_++;
    waiters_.push_back(ticket);
    const auto deadline = std::chrono::steady_clock::now() + wait_timeout;

    const bool admitted = slot_freed_.wait_until(lock, deadline, [this, ticket]() {
        return waiters_.front() == ticket && in_use_ < capacity_;
    });

    if (!admitted) {
        waiters_.erase(std::find(waiters_.begin(), waiters_.end(), ticket));
        const auto still_waiting = waiters_.size();
        lock.unlock();
        slot_freed_.notify_all();
        spdlog::warn("Admission timed out after {} ms ({} still queued)",
                     wait_timeout.count(), still_waiting);
        throw AdmissionTimeoutError(wait_timeout);
    }

    waiters_.pop_front();
    ++in_use_;
    const bool more_capacity = in_use_ < capacity_ && !waiters_.empty();
    lock.unlock();

    // Several slots may have been freed while this waiter was at the front.
    if (more_capacity) {
        slot_freed_.notify_all();
    }
    return Slot(this);
}

std::optional<AdmissionController::Slot> AdmissionController::TryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (waiters_.empty() && in_use_ < capacity_) {
        ++in_use_;
        return Slot(this);
    }
    return std::nullopt;
}

std::size_t AdmissionController::InUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

std::size_t AdmissionController::Waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

void AdmissionController::ReleaseSlot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_use_;
    }
    slot_freed_.notify_all();
}

} // namespace core
} // namespace coderun
