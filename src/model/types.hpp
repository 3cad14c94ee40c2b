// model/types.hpp
// Measurement data model: samples, ping outcomes, session credentials and the
// merged event variant consumed by the fence engine.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "../core/timing.hpp"
#include "../core/geo.hpp"
#include "../transport/transport_policy.hpp"

namespace coverage {

// ============================================================================
// Location
// ============================================================================

struct LocationSample {
    Coordinate coordinate;
    double horizontal_accuracy;  // meters, negative = unknown
    Timestamp timestamp;

    LocationSample() : horizontal_accuracy(-1.0), timestamp(0) {}
    LocationSample(Coordinate c, double accuracy, Timestamp t)
        : coordinate(c), horizontal_accuracy(accuracy), timestamp(t) {}
};

// ============================================================================
// Network type
// ============================================================================

enum class NetworkType : uint8_t {
    Cellular = 0,
    WiFi = 1,
};

struct NetworkTypeSample {
    NetworkType type;
    Timestamp timestamp;

    NetworkTypeSample() : type(NetworkType::Cellular), timestamp(0) {}
    NetworkTypeSample(NetworkType ty, Timestamp t) : type(ty), timestamp(t) {}
};

// ============================================================================
// Radio access technology
// ============================================================================

enum class RadioTechnology : uint8_t {
    Unknown = 0,
    GPRS,
    Edge,
    WCDMA,
    CDMA1x,
    EVDORev0,
    EVDORevA,
    HSDPA,
    HSUPA,
    EVDORevB,
    LTE,
    eHRPD,
    NRNSA,
    NR,
};

struct RadioTechnologyInfo {
    RadioTechnology technology;
    const char* code;       // submitted as "technology"
    int technology_id;      // submitted as "technology_id"
    const char* display;    // generation label
    const char* name;       // platform identifier suffix (CTRadioAccessTechnology*)
};

inline constexpr RadioTechnologyInfo RADIO_TECHNOLOGIES[] = {
    {RadioTechnology::GPRS,     "2G/GSM",    1,  "2G",     "GPRS"},
    {RadioTechnology::Edge,     "2G/EDGE",   2,  "2G",     "Edge"},
    {RadioTechnology::WCDMA,    "3G/UMTS",   3,  "3G",     "WCDMA"},
    {RadioTechnology::CDMA1x,   "2G/CDMA",   4,  "2G",     "CDMA1x"},
    {RadioTechnology::EVDORev0, "2G/EVDO_0", 5,  "2G",     "CDMAEVDORev0"},
    {RadioTechnology::EVDORevA, "2G/EVDO_A", 6,  "2G",     "CDMAEVDORevA"},
    {RadioTechnology::HSDPA,    "3G/HSDPA",  8,  "3G",     "HSDPA"},
    {RadioTechnology::HSUPA,    "3G/HSUPA",  9,  "3G",     "HSUPA"},
    {RadioTechnology::EVDORevB, "2G/EVDO_B", 12, "2G",     "CDMAEVDORevB"},
    {RadioTechnology::LTE,      "4G/LTE",    13, "4G",     "LTE"},
    {RadioTechnology::eHRPD,    "2G/HRPD",   14, "2G",     "eHRPD"},
    {RadioTechnology::NR,       "5G/NR",     20, "5G SA",  "NR"},
    {RadioTechnology::NRNSA,    "5G/NRNSA",  41, "5G NSA", "NRNSA"},
};

inline const RadioTechnologyInfo* radio_technology_info(RadioTechnology t) {
    for (const auto& info : RADIO_TECHNOLOGIES) {
        if (info.technology == t) return &info;
    }
    return nullptr;
}

/**
 * Parse a platform radio identifier ("LTE", "CTRadioAccessTechnologyLTE")
 * or a submitted code ("4G/LTE")
 */
inline RadioTechnology parse_radio_technology(const std::string& text) {
    static const std::string PREFIX = "CTRadioAccessTechnology";
    std::string s = text.compare(0, PREFIX.size(), PREFIX) == 0 ? text.substr(PREFIX.size()) : text;
    for (const auto& info : RADIO_TECHNOLOGIES) {
        if (s == info.name || s == info.code) return info.technology;
    }
    return RadioTechnology::Unknown;
}

struct RadioTechnologySample {
    RadioTechnology technology;
    Timestamp timestamp;

    RadioTechnologySample() : technology(RadioTechnology::Unknown), timestamp(0) {}
    RadioTechnologySample(RadioTechnology tech, Timestamp t) : technology(tech), timestamp(t) {}

    const char* code() const {
        const auto* info = radio_technology_info(technology);
        return info ? info->code : nullptr;
    }

    std::optional<int> technology_id() const {
        const auto* info = radio_technology_info(technology);
        if (!info) return std::nullopt;
        return info->technology_id;
    }
};

// ============================================================================
// Pings
// ============================================================================

enum class PingError : uint8_t {
    None = 0,
    TimedOut,               // no reply within the timeout, session stays valid
    NetworkIssue,           // transport failure, session stays valid
    NeedsReinitialization,  // RE01 from the server
    InitiationInProgress,   // pacer tick while a session request is underway
    InitiationFailed,       // control-plane session request failed
};

inline const char* ping_error_name(PingError e) {
    switch (e) {
        case PingError::None: return "none";
        case PingError::TimedOut: return "timedOut";
        case PingError::NetworkIssue: return "networkIssue";
        case PingError::NeedsReinitialization: return "needsReinitialization";
        case PingError::InitiationInProgress: return "initiationInProgress";
        case PingError::InitiationFailed: return "initiationFailed";
    }
    return "unknown";
}

/**
 * PingOutcome - one ping attempt, timestamped at the pacer tick that issued it
 */
struct PingOutcome {
    Timestamp timestamp;
    Duration duration;   // round trip in microseconds, valid when error == None
    PingError error;

    PingOutcome() : timestamp(0), duration(0), error(PingError::None) {}

    static PingOutcome success(Timestamp t, Duration d) {
        PingOutcome o;
        o.timestamp = t;
        o.duration = d;
        return o;
    }

    static PingOutcome failure(Timestamp t, PingError e) {
        PingOutcome o;
        o.timestamp = t;
        o.error = e;
        return o;
    }

    bool is_success() const { return error == PingError::None; }
};

// ============================================================================
// Control-plane session
// ============================================================================

/**
 * SessionCredentials - token issued by POST /coverageRequest
 */
struct SessionCredentials {
    std::string test_uuid;
    std::optional<std::string> loop_uuid;
    std::string ping_token;   // Base64
    std::string ping_host;
    uint16_t ping_port = 0;
    IpVersion ip_version = IpVersion::Any;
};

struct SessionInitialized {
    Timestamp timestamp;
    std::string test_uuid;

    SessionInitialized() : timestamp(0) {}
    SessionInitialized(Timestamp t, std::string uuid) : timestamp(t), test_uuid(std::move(uuid)) {}
};

// ============================================================================
// Merged event stream
// ============================================================================

using CoverageEvent = std::variant<LocationSample, PingOutcome, NetworkTypeSample, SessionInitialized>;

} // namespace coverage
