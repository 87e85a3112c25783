#include "scriptbox/execution_slots.h"
#include <spdlog/spdlog.h>

namespace scriptbox {

ExecutionSlots::Permit::Permit(Permit&& other) noexcept
    : slots_(other.slots_)
    , wait_time_(other.wait_time_)
{
    other.slots_ = nullptr;
}

ExecutionSlots::Permit& ExecutionSlots::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        Release();
        slots_ = other.slots_;
        wait_time_ = other.wait_time_;
        other.slots_ = nullptr;
    }
    return *this;
}

void ExecutionSlots::Permit::Release() {
    if (slots_) {
        slots_->ReturnSlot();
        slots_ = nullptr;
    }
}

ExecutionSlots::ExecutionSlots(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
{
}

ExecutionSlots::Permit ExecutionSlots::Acquire() {
    auto start = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lock(mutex_);
    if (in_use_ >= capacity_) {
        spdlog::debug("ExecutionSlots: all {} slots busy, waiting", capacity_);
    }
    cv_.wait(lock, [this] { return in_use_ < capacity_; });
    ++in_use_;

    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return Permit(this, waited);
}

ExecutionSlots::Permit ExecutionSlots::TryAcquireFor(std::chrono::milliseconds wait) {
    auto start = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, wait, [this] { return in_use_ < capacity_; })) {
        return Permit();
    }
    ++in_use_;

    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return Permit(this, waited);
}

size_t ExecutionSlots::GetInUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

size_t ExecutionSlots::GetAvailable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_ - in_use_;
}

void ExecutionSlots::ReturnSlot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_one();
}

} // namespace scriptbox
