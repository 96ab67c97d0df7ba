// ==============================================================================
// Layer 1: DSP Primitive - SPSC Queue
// ==============================================================================
// Wait-free single-producer single-consumer ring of trivially copyable
// records. Fixed capacity, no allocation. push() fails when the ring is full
// and the record is dropped by the caller.
// ==============================================================================

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <type_traits>

namespace Actuate {
namespace DSP {

template <typename T, size_t Capacity>
class SpscQueue {
    static_assert(std::is_trivially_copyable_v<T>, "SpscQueue stores trivially copyable records");
    static_assert(Capacity >= 2, "SpscQueue needs at least two slots");

public:
    SpscQueue() noexcept = default;

    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    /// @brief Producer side. Returns false when full.
    bool push(const T& item) noexcept {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t nextTail = (tail + 1) % Capacity;
        if (nextTail == head_.load(std::memory_order_acquire)) {
            return false;
        }
        slots_[tail] = item;
        tail_.store(nextTail, std::memory_order_release);
        return true;
    }

    /// @brief Consumer side. Returns false when empty.
    bool pop(T& item) noexcept {
        const size_t head = head_.load(std::memory_order_relaxed);
        if (head == tail_.load(std::memory_order_acquire)) {
            return false;
        }
        item = slots_[head];
        head_.store((head + 1) % Capacity, std::memory_order_release);
        return true;
    }

    /// @brief Consumer side. Discards everything currently queued.
    void clear() noexcept {
        head_.store(tail_.load(std::memory_order_acquire), std::memory_order_release);
    }

    [[nodiscard]] bool empty() const noexcept {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    /// @brief Usable capacity (one slot stays free to tell full from empty).
    [[nodiscard]] static constexpr size_t capacity() noexcept { return Capacity - 1; }

private:
    std::array<T, Capacity> slots_{};
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
};

} // namespace DSP
} // namespace Actuate
