// execution_slots.h - Counting permit bounding concurrent script runs
#pragma once

#include "api_export.h"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace scriptbox {

class SCRIPTBOX_API ExecutionSlots {
public:
    // Held for the duration of one run; returns the slot on destruction
    class SCRIPTBOX_API Permit {
    public:
        Permit() = default;
        ~Permit() { Release(); }

        Permit(Permit&& other) noexcept;
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        bool IsHeld() const { return slots_ != nullptr; }
        std::chrono::milliseconds GetWaitTime() const { return wait_time_; }

        void Release();

    private:
        friend class ExecutionSlots;
        Permit(ExecutionSlots* slots, std::chrono::milliseconds wait_time)
            : slots_(slots), wait_time_(wait_time) {}

        ExecutionSlots* slots_ = nullptr;
        std::chrono::milliseconds wait_time_{0};
    };

    // A capacity of 0 is raised to 1
    explicit ExecutionSlots(size_t capacity = kDefaultCapacity);

    ExecutionSlots(const ExecutionSlots&) = delete;
    ExecutionSlots& operator=(const ExecutionSlots&) = delete;

    // Blocks until a slot is free
    Permit Acquire();

    // Empty permit when no slot frees up in time
    Permit TryAcquireFor(std::chrono::milliseconds wait);

    size_t GetCapacity() const { return capacity_; }
    size_t GetInUse() const;
    size_t GetAvailable() const;

    static constexpr size_t kDefaultCapacity = 4;

private:
    void ReturnSlot();

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t in_use_ = 0;
};

} // namespace scriptbox
