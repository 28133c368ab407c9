#pragma once

#include <atomic>
#include <cstddef>
#include <cstring>
#include <type_traits>

namespace aqwave {

// Bounded single-producer single-consumer lock-free ring.
// Producer: acquisition thread. Consumer: CSV writer or relay thread.
// Capacity is a power of 2 so wrapping is a mask. One slot stays empty to
// tell full from empty, so at most Capacity - 1 items are queued.
template <typename T, size_t Capacity = 1024>
class SPSCRing {
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");
    static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");

public:
    SPSCRing() : write_idx_(0), read_idx_(0) {}

    // Non-blocking. Returns false if full (caller counts the drop).
    bool try_push(const T& item) {
        const size_t w = write_idx_.load(std::memory_order_relaxed);
        const size_t next_w = (w + 1) & MASK;
        if (next_w == read_idx_.load(std::memory_order_acquire)) {
            return false;
        }
        std::memcpy(&buffer_[w], &item, sizeof(T));
        write_idx_.store(next_w, std::memory_order_release);
        return true;
    }

    // Non-blocking. Returns false if empty.
    bool try_pop(T& item) {
        const size_t r = read_idx_.load(std::memory_order_relaxed);
        if (r == write_idx_.load(std::memory_order_acquire)) {
            return false;
        }
        std::memcpy(&item, &buffer_[r], sizeof(T));
        read_idx_.store((r + 1) & MASK, std::memory_order_release);
        return true;
    }

    size_t capacity() const { return Capacity; }

    size_t size_approx() const {
        const size_t w = write_idx_.load(std::memory_order_relaxed);
        const size_t r = read_idx_.load(std::memory_order_relaxed);
        return (w - r) & MASK;
    }

private:
    static constexpr size_t MASK = Capacity - 1;

    // Separate cache lines for the two indices
    alignas(64) std::atomic<size_t> write_idx_;
    alignas(64) std::atomic<size_t> read_idx_;

    alignas(64) T buffer_[Capacity];
};

} // namespace aqwave
