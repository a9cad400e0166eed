#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <new>
#include <optional>
#include <stdexcept>
#include <utility>

namespace polarbear::util {

/**
 * @brief Bounded lock-free queue with one producer thread and one consumer thread.
 *
 * Head and tail are free-running counters; a slot index is the counter masked by the
 * capacity, so the capacity must be a power of two. A push into a full queue fails and
 * is counted in `rejected()`.
 */
template <typename T>
class SPSCQueue {
public:
    explicit SPSCQueue(size_t capacity) : m_capacity(capacity), m_mask(capacity - 1) {
        if (capacity == 0 || (capacity & (capacity - 1)) != 0) {
            throw std::invalid_argument("SPSCQueue capacity must be power of 2");
        }
        m_slots = static_cast<T*>(std::aligned_alloc(alignof(T), sizeof(T) * capacity));
        if (m_slots == nullptr) {
            throw std::bad_alloc();
        }
    }

    ~SPSCQueue() {
        while (try_pop()) {
        }
        std::free(m_slots);
    }

    SPSCQueue(const SPSCQueue&) = delete;
    SPSCQueue& operator=(const SPSCQueue&) = delete;
    SPSCQueue(SPSCQueue&&) = delete;
    SPSCQueue& operator=(SPSCQueue&&) = delete;

    /// Producer side.
    template <typename U>
    auto try_push(U&& item) -> bool {
        const uint64_t head = m_head.load(std::memory_order_relaxed);
        if (head - m_tail.load(std::memory_order_acquire) >= m_capacity) {
            m_rejected.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        new (&m_slots[head & m_mask]) T(std::forward<U>(item));
        m_head.store(head + 1, std::memory_order_release);
        return true;
    }

    /// Consumer side.
    auto try_pop() -> std::optional<T> {
        const uint64_t tail = m_tail.load(std::memory_order_relaxed);
        if (tail == m_head.load(std::memory_order_acquire)) {
            return std::nullopt;
        }
        T& slot = m_slots[tail & m_mask];
        std::optional<T> item(std::move(slot));
        slot.~T();
        m_tail.store(tail + 1, std::memory_order_release);
        return item;
    }

    /// Pops at most @p max items into @p fn. Returns how many were consumed.
    template <typename Fn>
    auto drain(size_t max, Fn&& fn) -> size_t {
        size_t consumed = 0;
        while (consumed < max) {
            auto item = try_pop();
            if (!item) {
                break;
            }
            fn(std::move(*item));
            ++consumed;
        }
        return consumed;
    }

    [[nodiscard]] auto size() const -> size_t {
        return static_cast<size_t>(m_head.load(std::memory_order_acquire) -
                                   m_tail.load(std::memory_order_acquire));
    }

    [[nodiscard]] auto empty() const -> bool { return size() == 0; }
    [[nodiscard]] auto capacity() const -> size_t { return m_capacity; }

    /// Number of pushes refused because the queue was full.
    [[nodiscard]] auto rejected() const -> uint64_t {
        return m_rejected.load(std::memory_order_relaxed);
    }

private:
    alignas(64) std::atomic<uint64_t> m_head{0};
    alignas(64) std::atomic<uint64_t> m_tail{0};
    std::atomic<uint64_t> m_rejected{0};

    const size_t m_capacity;
    const size_t m_mask;
    T* m_slots = nullptr;
};

} // namespace polarbear::util
