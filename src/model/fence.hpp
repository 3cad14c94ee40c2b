// model/fence.hpp
// Fence - contiguous time/space cell grouping pings and technology samples
#pragma once

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "types.hpp"

namespace coverage {

/**
 * Generate a random RFC 4122 version 4 UUID string
 */
inline std::string generate_uuid() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    uint64_t hi = gen();
    uint64_t lo = gen();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // variant 10

    char buf[37];
    snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
             (unsigned)(hi >> 32), (unsigned)((hi >> 16) & 0xFFFF), (unsigned)(hi & 0xFFFF),
             (unsigned)(lo >> 48), (unsigned long long)(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

struct Fence {
    std::string id;
    LocationSample starting_location;
    Timestamp date_entered;
    std::optional<Timestamp> date_exited;
    std::vector<LocationSample> locations;
    std::vector<PingOutcome> pings;
    std::vector<RadioTechnologySample> technologies;
    double radius_m;
    std::optional<std::string> session_uuid;

    Fence() : date_entered(0), radius_m(20.0) {}

    Fence(const LocationSample& start, std::optional<RadioTechnologySample> technology,
          double radius, std::optional<std::string> session)
        : id(generate_uuid())
        , starting_location(start)
        , date_entered(start.timestamp)
        , radius_m(radius)
        , session_uuid(std::move(session))
    {
        locations.push_back(start);
        if (technology) {
            technologies.push_back(*technology);
        }
    }

    bool is_open() const {
        return !date_exited.has_value();
    }

    // Closed interval start, half-open end: [date_entered, date_exited)
    bool contains(Timestamp t) const {
        return date_entered <= t && (!date_exited || t < *date_exited);
    }

    /**
     * Mean of successful ping durations in ms, rounded to nearest
     */
    std::optional<int64_t> average_ping_ms() const {
        int64_t total_us = 0;
        int64_t count = 0;
        for (const auto& p : pings) {
            if (p.is_success()) {
                total_us += p.duration;
                ++count;
            }
        }
        if (count == 0) return std::nullopt;
        double mean_ms = static_cast<double>(total_us) / count / 1000.0;
        return static_cast<int64_t>(std::llround(mean_ms));
    }

    // Last-write-wins
    std::optional<RadioTechnologySample> significant_technology() const {
        if (technologies.empty()) return std::nullopt;
        return technologies.back();
    }
};

} // namespace coverage
