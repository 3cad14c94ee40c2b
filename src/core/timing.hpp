// core/timing.hpp
// Time sources for measurement timestamps and round-trip durations
//
// Two clocks are provided, both conforming to ClockConcept:
//   - RealClock:    wall clock (CLOCK_REALTIME) plus CLOCK_MONOTONIC, sleeps for real
//   - VirtualClock: test-controlled clock, sleep_until() advances instantly
//
// All measurement timestamps are Timestamp values from now(): signed
// microseconds since the Unix epoch. Round-trip durations and reply timeouts
// are measured on monotonic_us(), which never goes backwards when the wall
// clock is stepped.
#pragma once

#include <cstdint>
#include <ctime>
#include <cerrno>
#include <atomic>

namespace coverage {

// Microseconds since the Unix epoch
using Timestamp = int64_t;

// Microseconds
using Duration = int64_t;

constexpr Duration US_PER_MS = 1000;
constexpr Duration US_PER_SEC = 1000000;

inline constexpr Duration ms_to_us(int64_t ms) { return ms * US_PER_MS; }
inline constexpr Duration sec_to_us(int64_t sec) { return sec * US_PER_SEC; }
inline constexpr double us_to_sec(Duration us) { return static_cast<double>(us) / US_PER_SEC; }

// Get current monotonic timestamp in nanoseconds
static inline uint64_t get_monotonic_timestamp_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (uint64_t)ts.tv_sec * 1000000000ULL + ts.tv_nsec;
}

// Get current wall-clock time in microseconds since epoch
static inline Timestamp get_realtime_timestamp_us() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return (Timestamp)ts.tv_sec * US_PER_SEC + ts.tv_nsec / 1000;
}

/**
 * RealClock - wall clock used in production
 */
struct RealClock {
    Timestamp now() const {
        return get_realtime_timestamp_us();
    }

    Duration monotonic_us() const {
        return static_cast<Duration>(get_monotonic_timestamp_ns() / 1000);
    }

    /**
     * Sleep until the given wall-clock instant (returns immediately if past)
     */
    void sleep_until(Timestamp t) const {
        Duration remaining = t - now();
        if (remaining <= 0) {
            return;
        }
        struct timespec req;
        req.tv_sec = remaining / US_PER_SEC;
        req.tv_nsec = (remaining % US_PER_SEC) * 1000;
        while (nanosleep(&req, &req) < 0 && errno == EINTR) {
        }
    }

    static constexpr const char* name() {
        return "realtime";
    }
};

/**
 * VirtualClock - steppable clock for deterministic tests
 *
 * Safe to read from several threads; set()/advance() are expected from the
 * single thread driving the test.
 *
 * The monotonic counter follows every forward step of the wall clock and
 * stays put when set() moves the wall clock backwards.
 */
struct VirtualClock {
    explicit VirtualClock(Timestamp start = 0) : now_(start), mono_(0) {}

    Timestamp now() const {
        return now_.load(std::memory_order_acquire);
    }

    Duration monotonic_us() const {
        return mono_.load(std::memory_order_acquire);
    }

    void set(Timestamp t) {
        Timestamp prev = now_.exchange(t, std::memory_order_acq_rel);
        if (t > prev) {
            mono_.fetch_add(t - prev, std::memory_order_acq_rel);
        }
    }

    void advance(Duration us) {
        now_.fetch_add(us, std::memory_order_acq_rel);
        if (us > 0) {
            mono_.fetch_add(us, std::memory_order_acq_rel);
        }
    }

    void sleep_until(Timestamp t) {
        if (t > now()) {
            set(t);
        }
    }

    static constexpr const char* name() {
        return "virtual";
    }

private:
    std::atomic<Timestamp> now_;
    std::atomic<Duration> mono_;
};

} // namespace coverage

#if __cplusplus >= 202002L
#include <concepts>

namespace coverage {

/**
 * ClockConcept - required interface for injectable clocks
 */
template<typename T>
concept ClockConcept = requires(T clock, Timestamp t) {
    { clock.now() } -> std::convertible_to<Timestamp>;
    { clock.monotonic_us() } -> std::convertible_to<Duration>;
    { clock.sleep_until(t) } -> std::same_as<void>;
};

static_assert(ClockConcept<RealClock>);
static_assert(ClockConcept<VirtualClock>);

} // namespace coverage

#endif // C++20
