// control/coverage_api.hpp
// Request/response bodies of the coverage control-server endpoints
//
//   POST /coverageRequest  {time, measurement_type, loop_uuid?}
//     -> {test_uuid, ping_token, ping_host, ping_port, ip_version,
//         max_coverage_session_seconds, max_coverage_measurement_seconds}
//
//   POST /coverageResult   {test_uuid, client_uuid?, fences: [...]}
//     fence: {timestamp_microseconds, offset_ms, radius_m, duration_ms?,
//             technology?, technology_id?, avg_ping_ms?,
//             location: {latitude, longitude, accuracy?}}
#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/json.hpp"
#include "../core/timing.hpp"
#include "../model/fence.hpp"
#include "../model/types.hpp"

namespace coverage {
namespace control {

struct CoverageResponse {
    SessionCredentials credentials;
    std::optional<int64_t> max_coverage_session_seconds;
    std::optional<int64_t> max_coverage_measurement_seconds;
};

/**
 * Body of POST /coverageRequest
 *
 * @param now Request time; submitted in milliseconds since epoch
 */
inline std::string encode_coverage_request(Timestamp now, const std::optional<std::string>& loop_uuid,
                                           const std::optional<std::string>& client_uuid = std::nullopt) {
    json::JsonWriter w;
    w.begin_object();
    w.field("time", static_cast<int64_t>(now / US_PER_MS));
    w.field("measurement_type", "dedicated");
    w.optional_field("loop_uuid", loop_uuid);
    w.optional_field("client_uuid", client_uuid);
    w.end_object();
    return w.str();
}

/**
 * Parse the body of a /coverageRequest response
 *
 * @throws std::runtime_error if a required field is missing
 */
inline CoverageResponse decode_coverage_response(const std::string& body,
                                                 const std::optional<std::string>& loop_uuid) {
    CoverageResponse r;

    auto test_uuid = json::find_string(body, "test_uuid");
    auto token = json::find_string(body, "ping_token");
    auto host = json::find_string(body, "ping_host");
    auto port = json::find_int(body, "ping_port");
    if (!test_uuid || test_uuid->empty() || !token || !host || !port) {
        throw std::runtime_error("coverageRequest response missing required fields");
    }
    if (*port <= 0 || *port > 65535) {
        throw std::runtime_error("coverageRequest response has invalid ping_port");
    }

    r.credentials.test_uuid = *test_uuid;
    r.credentials.loop_uuid = loop_uuid;
    r.credentials.ping_token = *token;
    r.credentials.ping_host = *host;
    r.credentials.ping_port = static_cast<uint16_t>(*port);

    auto ip = json::find_int(body, "ip_version");
    r.credentials.ip_version = !ip ? IpVersion::Any
                             : *ip == 4 ? IpVersion::V4
                             : *ip == 6 ? IpVersion::V6
                             : IpVersion::Any;

    r.max_coverage_session_seconds = json::find_int(body, "max_coverage_session_seconds");
    r.max_coverage_measurement_seconds = json::find_int(body, "max_coverage_measurement_seconds");
    return r;
}

/**
 * Signed offset of a fence from its session's anchor instant
 */
inline int64_t offset_ms(Timestamp fence_timestamp, Timestamp anchor) {
    return static_cast<int64_t>(std::llround(static_cast<double>(fence_timestamp - anchor) / US_PER_MS));
}

inline void write_fence(json::JsonWriter& w, const Fence& fence, Timestamp anchor) {
    w.begin_object();
    w.field("timestamp_microseconds", static_cast<int64_t>(fence.date_entered));
    w.field("offset_ms", offset_ms(fence.date_entered, anchor));
    w.field("radius_m", static_cast<int64_t>(std::llround(fence.radius_m)));
    if (fence.date_exited) {
        w.field("duration_ms", offset_ms(*fence.date_exited, fence.date_entered));
    }

    auto tech = fence.significant_technology();
    if (tech && tech->code()) {
        w.field("technology", tech->code());
        w.optional_field("technology_id", tech->technology_id());
    }
    w.optional_field("avg_ping_ms", fence.average_ping_ms());

    w.key("location").begin_object();
    w.field("latitude", fence.starting_location.coordinate.latitude);
    w.field("longitude", fence.starting_location.coordinate.longitude);
    if (fence.starting_location.horizontal_accuracy >= 0) {
        w.field("accuracy", fence.starting_location.horizontal_accuracy);
    }
    w.end_object();

    w.end_object();
}

/**
 * Body of POST /coverageResult
 */
inline std::string encode_coverage_result(const std::string& test_uuid, const std::vector<Fence>& fences,
                                          Timestamp anchor,
                                          const std::optional<std::string>& client_uuid = std::nullopt) {
    json::JsonWriter w;
    w.begin_object();
    w.field("test_uuid", test_uuid);
    w.optional_field("client_uuid", client_uuid);
    w.key("fences").begin_array();
    for (const auto& f : fences) {
        write_fence(w, f, anchor);
    }
    w.end_array();
    w.end_object();
    return w.str();
}

} // namespace control
} // namespace coverage
