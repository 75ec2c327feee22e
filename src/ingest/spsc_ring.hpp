#pragma once

#include <atomic>
#include <cstddef>
#include <type_traits>
#include <utility>

namespace ingest {

// Single-producer/single-consumer ring with cache-line separated indices.
// Producer: relaxed load of head, acquire load of tail, release store of head.
// Consumer mirrors it. Elements are moved in and out so heap-owning values
// (decoded push requests) pass through without copies; a popped slot is left
// in its moved-from state until overwritten. Capacity must be a power of two
// and one slot stays empty.
template <typename T, std::size_t CapacityPowerOf2>
class alignas(64) SpscRing {
    static_assert((CapacityPowerOf2 & (CapacityPowerOf2 - 1)) == 0, "Capacity must be power of two");
    static_assert(std::is_default_constructible_v<T>, "Ring slots are default constructed");

public:
    using value_type = T;

    SpscRing() : head_(0), tail_(0) {}

    SpscRing(const SpscRing&) = delete;
    SpscRing& operator=(const SpscRing&) = delete;

    bool try_push(T&& v) noexcept(std::is_nothrow_move_assignable_v<T>) {
        const auto head = head_.load(std::memory_order_relaxed);
        const auto next_head = increment(head);
        if (next_head == tail_.load(std::memory_order_acquire)) {
            return false; // full
        }
        buffer_[head] = std::move(v);
        head_.store(next_head, std::memory_order_release);
        return true;
    }

    bool try_push(const T& v) {
        T copy(v);
        return try_push(std::move(copy));
    }

    bool try_pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>) {
        const auto tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) {
            return false; // empty
        }
        out = std::move(buffer_[tail]);
        tail_.store(increment(tail), std::memory_order_release);
        return true;
    }

    std::size_t size_approx() const noexcept {
        const auto head = head_.load(std::memory_order_acquire);
        const auto tail = tail_.load(std::memory_order_acquire);
        return head >= tail ? head - tail : CapacityPowerOf2 - (tail - head);
    }

    bool empty_approx() const noexcept { return size_approx() == 0; }

    static constexpr std::size_t capacity() noexcept { return CapacityPowerOf2; }

private:
    static constexpr std::size_t increment(std::size_t idx) noexcept {
        return (idx + 1) & (CapacityPowerOf2 - 1);
    }

    alignas(64) std::atomic<std::size_t> head_;
    alignas(64) std::atomic<std::size_t> tail_;
    T buffer_[CapacityPowerOf2];
};

} // namespace ingest
