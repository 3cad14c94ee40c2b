// core/channel.hpp
// Lock-free single-producer single-consumer channel of typed events
//
// Each producer owns one channel; the consumer multiplexes all channels through
// their eventfds with an event policy (see engine/event_merger.hpp).
//
// Properties:
//   - Compile-time capacity (power of 2), one slot reserved to tell full/empty
//   - Cache-line separated head/tail indices
//   - eventfd signalled on every push and on close(), so the consumer can sleep
//   - try_push() never blocks: a full channel rejects the event
#pragma once

#include <atomic>
#include <array>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <unistd.h>

#if defined(__linux__)
#include <sys/eventfd.h>
#else
#error "SpscChannel requires Linux eventfd"
#endif

// Platform-specific cache line size
#ifndef CACHE_LINE_SIZE
#if defined(__aarch64__) && defined(__APPLE__)
#define CACHE_LINE_SIZE 128
#else
#define CACHE_LINE_SIZE 64
#endif
#endif

namespace coverage {

// Compile-time check: Capacity must be power of 2
template<size_t N>
struct IsPowerOfTwo {
    static constexpr bool value = (N != 0) && ((N & (N - 1)) == 0);
};

template<typename T, size_t Capacity>
class SpscChannel {
    static_assert(IsPowerOfTwo<Capacity>::value, "Capacity must be a power of 2");
    static constexpr size_t MASK = Capacity - 1;

public:
    SpscChannel() : head_(0), tail_(0), closed_(false), dropped_(0), event_fd_(-1) {}

    ~SpscChannel() {
        if (event_fd_ >= 0) {
            ::close(event_fd_);
            event_fd_ = -1;
        }
    }

    // Prevent copying and moving (consumer holds raw pointers / fds)
    SpscChannel(const SpscChannel&) = delete;
    SpscChannel& operator=(const SpscChannel&) = delete;

    /**
     * Create the readiness eventfd
     *
     * @throws std::runtime_error if eventfd() fails
     */
    void init() {
        event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (event_fd_ < 0) {
            throw std::runtime_error("eventfd() failed");
        }
    }

    /**
     * Producer side: enqueue an event
     *
     * @return false if the channel is full or closed (event not enqueued)
     */
    bool try_push(T value) {
        if (closed_.load(std::memory_order_acquire)) {
            return false;
        }

        size_t tail = tail_.load(std::memory_order_relaxed);
        size_t next = (tail + 1) & MASK;
        if (next == head_.load(std::memory_order_acquire)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        slots_[tail] = std::move(value);
        tail_.store(next, std::memory_order_release);
        notify();
        return true;
    }

    /**
     * Consumer side: dequeue the oldest event
     */
    std::optional<T> try_pop() {
        size_t head = head_.load(std::memory_order_relaxed);
        if (head == tail_.load(std::memory_order_acquire)) {
            return std::nullopt;
        }

        std::optional<T> out(std::move(slots_[head]));
        head_.store((head + 1) & MASK, std::memory_order_release);
        return out;
    }

    /**
     * Consumer side: clear the readiness counter before draining
     */
    void consume_notification() {
        if (event_fd_ < 0) return;
        uint64_t counter;
        while (::read(event_fd_, &counter, sizeof(counter)) > 0) {
        }
    }

    /**
     * Producer side: mark end of stream and wake the consumer
     */
    void close() {
        closed_.store(true, std::memory_order_release);
        notify();
    }

    bool is_closed() const {
        return closed_.load(std::memory_order_acquire);
    }

    // Closed and fully drained
    bool is_finished() const {
        return is_closed() && empty();
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    size_t size() const {
        return (tail_.load(std::memory_order_acquire) - head_.load(std::memory_order_acquire)) & MASK;
    }

    static constexpr size_t capacity() {
        return Capacity - 1;
    }

    uint64_t dropped() const {
        return dropped_.load(std::memory_order_relaxed);
    }

    int get_fd() const {
        return event_fd_;
    }

private:
    void notify() {
        uint64_t one = 1;
        if (event_fd_ >= 0) {
            ssize_t n = ::write(event_fd_, &one, sizeof(one));
            (void)n;  // EAGAIN only when the counter saturates; consumer is awake anyway
        }
    }

    alignas(CACHE_LINE_SIZE) std::atomic<size_t> head_;  // consumer index
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> tail_;  // producer index
    alignas(CACHE_LINE_SIZE) std::atomic<bool> closed_;
    std::atomic<uint64_t> dropped_;
    int event_fd_;
    std::array<T, Capacity> slots_;
};

} // namespace coverage
