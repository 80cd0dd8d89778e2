#pragma once
#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>

namespace WP {

/**
 * WorkStealingDeque<T>: fixed-capacity Chase-Lev deque of pointers.
 *
 * The owning worker pushes and pops at the bottom (LIFO); any other thread may
 * steal from the top (FIFO). Memory ordering follows Lê, Pop, Cohen and
 * Zappa Nardelli, "Correct and Efficient Work-Stealing for Weak Memory
 * Models" (PPoPP 2013), minus the buffer growth: push() reports a full deque
 * and the caller spills elsewhere.
 *
 * Capacity is rounded up to a power of two so indices wrap with a mask.
 */
template <typename T>
class WorkStealingDeque {
    static_assert(std::is_pointer_v<T>, "WorkStealingDeque stores pointers");

public:
    explicit WorkStealingDeque(std::size_t capacity)
        : capacity_(std::bit_ceil(capacity < 2 ? std::size_t{2} : capacity)),
          mask_(static_cast<std::int64_t>(capacity_ - 1)),
          buffer_(std::make_unique<std::atomic<T>[]>(capacity_)) {}

    WorkStealingDeque(WorkStealingDeque const&)            = delete;
    WorkStealingDeque& operator=(WorkStealingDeque const&) = delete;

    // Owner only. Returns false when the deque is full.
    auto push(T item) -> bool {
        auto const b = this->bottom_.load(std::memory_order_relaxed);
        auto const t = this->top_.load(std::memory_order_acquire);
        if (b - t >= static_cast<std::int64_t>(this->capacity_))
            return false;
        this->buffer_[b & this->mask_].store(item, std::memory_order_relaxed);
        std::atomic_thread_fence(std::memory_order_release);
        this->bottom_.store(b + 1, std::memory_order_relaxed);
        return true;
    }

    // Owner only. Returns nullptr when empty or when a thief took the last item.
    auto pop() -> T {
        auto const b = this->bottom_.load(std::memory_order_relaxed) - 1;
        this->bottom_.store(b, std::memory_order_relaxed);
        std::atomic_thread_fence(std::memory_order_seq_cst);
        auto t = this->top_.load(std::memory_order_relaxed);

        if (t > b) {
            this->bottom_.store(b + 1, std::memory_order_relaxed);
            return nullptr;
        }
        T item = this->buffer_[b & this->mask_].load(std::memory_order_relaxed);
        if (t == b) {
            // Last item: race the thieves for it.
            if (!this->top_.compare_exchange_strong(t, t + 1, std::memory_order_seq_cst, std::memory_order_relaxed))
                item = nullptr;
            this->bottom_.store(b + 1, std::memory_order_relaxed);
        }
        return item;
    }

    // Any thread. Returns nullptr when empty or when another thread won the race.
    auto steal() -> T {
        auto t = this->top_.load(std::memory_order_acquire);
        std::atomic_thread_fence(std::memory_order_seq_cst);
        auto const b = this->bottom_.load(std::memory_order_acquire);
        if (t >= b)
            return nullptr;
        T item = this->buffer_[t & this->mask_].load(std::memory_order_relaxed);
        if (!this->top_.compare_exchange_strong(t, t + 1, std::memory_order_seq_cst, std::memory_order_relaxed))
            return nullptr;
        return item;
    }

    // Approximate when other threads are active.
    [[nodiscard]] auto size() const -> std::size_t {
        auto const b = this->bottom_.load(std::memory_order_relaxed);
        auto const t = this->top_.load(std::memory_order_relaxed);
        return b > t ? static_cast<std::size_t>(b - t) : 0;
    }

    [[nodiscard]] auto empty() const -> bool { return this->size() == 0; }
    [[nodiscard]] auto capacity() const -> std::size_t { return this->capacity_; }

private:
    std::size_t                       capacity_;
    std::int64_t                      mask_;
    std::unique_ptr<std::atomic<T>[]> buffer_;
    alignas(64) std::atomic<std::int64_t> top_{0};
    alignas(64) std::atomic<std::int64_t> bottom_{0};
};

} // namespace WP
