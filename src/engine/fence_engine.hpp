// engine/fence_engine.hpp
// Fence engine - segments the merged event stream into fences
//
// Single writer: every handler runs on the consumer thread, so the fence list
// needs no locking. Persistence calls are best-effort; failures are logged and
// never reach the caller.
//
// Location: a sample with accuracy worse than the threshold (or unknown) opens
// an inaccurate-location window and is otherwise ignored. An accurate sample
// closes the window, then either opens the first fence, extends the open one
// (distance < radius) or closes it and opens a new one (distance >= radius).
//
// Ping: dropped while on Wi-Fi or when its timestamp lies in an
// inaccurate-location window [begin, end); otherwise attributed to the newest
// fence F with F.date_entered <= t and (F open or t < F.date_exited).
//
// Session: fences without a session adopt the first token; on
// reinitialization the open fence moves to the new token while closed fences
// keep theirs. Fences closed before any token was known are persisted once a
// token arrives.

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../core/geo.hpp"
#include "../core/timing.hpp"
#include "../model/fence.hpp"
#include "../model/types.hpp"

// Debug printing - enable with -DDEBUG
#ifdef DEBUG
#define DEBUG_PRINT(...) do { printf(__VA_ARGS__); fflush(stdout); } while(0)
#else
#define DEBUG_PRINT(...) ((void)0)
#endif

namespace coverage {
namespace engine {

/**
 * Fence engine configuration
 */
struct FenceConfig {
    double radius_m;
    double accuracy_threshold_m;             // worse accuracy is ignored
    Duration insufficient_accuracy_auto_stop; // 0 disables
    Duration inaccuracy_warning_delay;
    Duration ping_refresh_interval;          // latest-ping averaging window

    FenceConfig()
        : radius_m(20.0)
        , accuracy_threshold_m(10.0)
        , insufficient_accuracy_auto_stop(sec_to_us(30 * 60))
        , inaccuracy_warning_delay(sec_to_us(3))
        , ping_refresh_interval(sec_to_us(3))
    {}

    /**
     * Defaults overridden by COV_FENCE_RADIUS_M, COV_ACCURACY_M
     */
    static FenceConfig from_env() {
        FenceConfig c;
        if (const char* v = getenv("COV_FENCE_RADIUS_M")) {
            double r = atof(v);
            if (r > 0) c.radius_m = r;
        }
        if (const char* v = getenv("COV_ACCURACY_M")) {
            double a = atof(v);
            if (a > 0) c.accuracy_threshold_m = a;
        }
        return c;
    }
};

struct InaccurateLocationWindow {
    Timestamp begin;
    std::optional<Timestamp> end;

    bool contains(Timestamp t) const {
        return begin <= t && (!end || t < *end);
    }
};

struct FenceEngineStats {
    uint64_t locations = 0;
    uint64_t inaccurate_locations = 0;
    uint64_t pings_attributed = 0;
    uint64_t pings_dropped_wifi = 0;
    uint64_t pings_dropped_inaccurate = 0;
    uint64_t pings_unattributed = 0;
    uint64_t persist_failures = 0;
};

/**
 * FenceEngine
 *
 * @tparam Persistence save(const Fence&), assign_test_uuid(uuid, anchor)
 */
template<typename Persistence>
class FenceEngine {
public:
    using TechnologyLookup = std::function<std::optional<RadioTechnologySample>(Timestamp)>;

    FenceEngine(Persistence& persistence, TechnologyLookup technology,
                FenceConfig config = FenceConfig())
        : persistence_(persistence)
        , technology_(std::move(technology))
        , config_(config)
        , started_at_(0)
        , on_wifi_(false)
        , had_accurate_location_(false)
    {}

    FenceEngine(const FenceEngine&) = delete;
    FenceEngine& operator=(const FenceEngine&) = delete;

    /**
     * Reset all state for a new measurement run
     */
    void start(Timestamp t) {
        fences_.clear();
        windows_.clear();
        unsaved_.clear();
        recent_pings_.clear();
        first_ping_.reset();
        last_location_.reset();
        session_uuid_.reset();
        anchor_.reset();
        stats_ = FenceEngineStats();
        started_at_ = t;
        on_wifi_ = false;
        had_accurate_location_ = false;
    }

    void handle(const CoverageEvent& ev) {
        std::visit([this](const auto& e) { on_event(e); }, ev);
    }

    void on_location(const LocationSample& s) {
        ++stats_.locations;
        last_location_ = s;

        if (!is_precise(s)) {
            ++stats_.inaccurate_locations;
            if (windows_.empty() || windows_.back().end) {
                windows_.push_back({s.timestamp, std::nullopt});
                DEBUG_PRINT("[Fence] Inaccurate window opened at %ld (accuracy %.1fm)\n",
                            (long)s.timestamp, s.horizontal_accuracy);
            }
            return;
        }

        if (!windows_.empty() && !windows_.back().end) {
            windows_.back().end = s.timestamp;
        }
        had_accurate_location_ = true;

        // Wi-Fi: accuracy state only, fences untouched
        if (on_wifi_) return;

        std::optional<RadioTechnologySample> tech;
        if (technology_) tech = technology_(s.timestamp);

        if (fences_.empty() || !fences_.back().is_open()) {
            open_fence(s, tech);
            return;
        }

        Fence& current = fences_.back();
        if (distance_m(current.starting_location.coordinate, s.coordinate) >= config_.radius_m) {
            if (s.timestamp <= current.date_entered) {
                DEBUG_PRINT("[Fence] Stale location at %ld ignored\n", (long)s.timestamp);
                return;
            }
            current.date_exited = s.timestamp;
            persist(fences_.size() - 1);
            open_fence(s, tech);
        } else {
            current.locations.push_back(s);
            if (tech) current.technologies.push_back(*tech);
        }
    }

    void on_ping(const PingOutcome& p) {
        if (on_wifi_) {
            ++stats_.pings_dropped_wifi;
            return;
        }
        if (!first_ping_) first_ping_ = p.timestamp;
        if (in_inaccurate_window(p.timestamp)) {
            ++stats_.pings_dropped_inaccurate;
            return;
        }

        record_latest(p);

        for (auto it = fences_.rbegin(); it != fences_.rend(); ++it) {
            if (it->contains(p.timestamp)) {
                it->pings.push_back(p);
                ++stats_.pings_attributed;
                return;
            }
        }
        ++stats_.pings_unattributed;
    }

    void on_network_type(const NetworkTypeSample& s) {
        bool wifi = s.type == NetworkType::WiFi;
        if (wifi == on_wifi_) return;
        on_wifi_ = wifi;
        printf("[Fence] Network changed to %s\n", wifi ? "Wi-Fi, pings ignored" : "cellular");
    }

    void on_session_initialized(const SessionInitialized& s) {
        bool reinit = session_uuid_.has_value() && *session_uuid_ != s.test_uuid;
        session_uuid_ = s.test_uuid;
        anchor_ = s.timestamp;

        try {
            persistence_.assign_test_uuid(s.test_uuid, s.timestamp);
        } catch (const std::exception& e) {
            ++stats_.persist_failures;
            printf("[Fence] Assigning session %s failed: %s\n", s.test_uuid.c_str(), e.what());
        }

        for (auto& f : fences_) {
            if (!f.session_uuid) f.session_uuid = s.test_uuid;
        }
        if (reinit && !fences_.empty() && fences_.back().is_open()) {
            fences_.back().session_uuid = s.test_uuid;
        }

        printf("[Fence] Session %s %s (%zu fences)\n", s.test_uuid.c_str(),
               reinit ? "replaces previous" : "assigned", fences_.size());

        std::vector<size_t> pending;
        pending.swap(unsaved_);
        for (size_t idx : pending) {
            persist(idx);
        }
    }

    /**
     * Close the open fence at the stop instant and persist it
     *
     * @return All fences of the run
     */
    const std::vector<Fence>& stop(Timestamp now) {
        if (!fences_.empty() && fences_.back().is_open()) {
            Fence& last = fences_.back();
            last.date_exited = std::max(now, last.date_entered);
            persist(fences_.size() - 1);
        }
        if (!windows_.empty() && !windows_.back().end) {
            windows_.back().end = now;
        }
        printf("[Fence] Stopped: %zu fences, %lu pings attributed, %lu dropped (wifi %lu, inaccurate %lu)\n",
               fences_.size(), (unsigned long)stats_.pings_attributed,
               (unsigned long)(stats_.pings_dropped_wifi + stats_.pings_dropped_inaccurate),
               (unsigned long)stats_.pings_dropped_wifi, (unsigned long)stats_.pings_dropped_inaccurate);
        return fences_;
    }

    bool in_inaccurate_window(Timestamp t) const {
        for (const auto& w : windows_) {
            if (w.contains(t)) return true;
        }
        return false;
    }

    bool is_precise(const LocationSample& s) const {
        return s.horizontal_accuracy >= 0 && s.horizontal_accuracy <= config_.accuracy_threshold_m;
    }

    /**
     * Inaccuracy warning: accuracy insufficient continuously for the warning delay
     */
    bool location_warning(Timestamp now) const {
        if (windows_.empty() || windows_.back().end) return false;
        Timestamp since = std::max(windows_.back().begin, started_at_);
        return now - since >= config_.inaccuracy_warning_delay;
    }

    /**
     * No accurate location since the run started, for the auto-stop interval
     */
    bool insufficient_accuracy_expired(Timestamp now) const {
        if (config_.insufficient_accuracy_auto_stop <= 0 || had_accurate_location_) return false;
        return now - started_at_ >= config_.insufficient_accuracy_auto_stop;
    }

    /**
     * Mean successful ping over the last completed refresh interval, in ms
     *
     * Intervals are aligned to the first ping received off Wi-Fi, even one
     * that fell into an inaccurate-location window.
     */
    std::optional<int64_t> latest_ping_ms() const {
        if (!first_ping_ || recent_pings_.empty()) return std::nullopt;
        const Duration interval = config_.ping_refresh_interval;
        if (interval <= 0) return std::nullopt;

        Timestamp last = recent_pings_.front().timestamp;
        for (const auto& p : recent_pings_) last = std::max(last, p.timestamp);

        Duration span = last - *first_ping_;
        if (span <= interval) return std::nullopt;
        int64_t steps = (span - 1) / interval;
        Timestamp end = *first_ping_ + steps * interval;
        Timestamp begin = end - interval;

        int64_t total = 0;
        int64_t count = 0;
        for (const auto& p : recent_pings_) {
            if (p.is_success() && p.timestamp >= begin && p.timestamp < end) {
                total += p.duration;
                ++count;
            }
        }
        if (count == 0) return std::nullopt;
        return static_cast<int64_t>(std::llround(static_cast<double>(total) / count / US_PER_MS));
    }

    const std::vector<Fence>& fences() const { return fences_; }
    const std::vector<InaccurateLocationWindow>& inaccurate_windows() const { return windows_; }
    const std::optional<std::string>& session_uuid() const { return session_uuid_; }
    const std::optional<Timestamp>& anchor() const { return anchor_; }
    const std::optional<LocationSample>& last_location() const { return last_location_; }
    bool on_wifi() const { return on_wifi_; }
    const FenceEngineStats& stats() const { return stats_; }
    const FenceConfig& config() const { return config_; }

private:
    void on_event(const LocationSample& s) { on_location(s); }
    void on_event(const PingOutcome& p) { on_ping(p); }
    void on_event(const NetworkTypeSample& s) { on_network_type(s); }
    void on_event(const SessionInitialized& s) { on_session_initialized(s); }

    void open_fence(const LocationSample& s, const std::optional<RadioTechnologySample>& tech) {
        fences_.emplace_back(s, tech, config_.radius_m, session_uuid_);
        DEBUG_PRINT("[Fence] Fence %zu opened at %.6f,%.6f\n", fences_.size() - 1,
                    s.coordinate.latitude, s.coordinate.longitude);
    }

    // Closed fences without a session wait for the first token
    void persist(size_t idx) {
        const Fence& f = fences_[idx];
        if (!f.session_uuid) {
            unsaved_.push_back(idx);
            return;
        }
        try {
            persistence_.save(f);
        } catch (const std::exception& e) {
            ++stats_.persist_failures;
            printf("[Fence] Persisting fence %s failed: %s\n", f.id.c_str(), e.what());
        }
    }

    void record_latest(const PingOutcome& p) {
        recent_pings_.push_back(p);

        // Keep two refresh intervals behind the newest ping
        Timestamp horizon = p.timestamp - 2 * config_.ping_refresh_interval;
        while (!recent_pings_.empty() && recent_pings_.front().timestamp < horizon) {
            recent_pings_.pop_front();
        }
    }

    Persistence& persistence_;
    TechnologyLookup technology_;
    FenceConfig config_;

    std::vector<Fence> fences_;
    std::vector<InaccurateLocationWindow> windows_;
    std::vector<size_t> unsaved_;
    std::deque<PingOutcome> recent_pings_;
    std::optional<Timestamp> first_ping_;
    std::optional<LocationSample> last_location_;
    std::optional<std::string> session_uuid_;
    std::optional<Timestamp> anchor_;
    Timestamp started_at_;
    bool on_wifi_;
    bool had_accurate_location_;
    FenceEngineStats stats_;
};

} // namespace engine
} // namespace coverage

// ============================================================================
// C++20 Concepts
// ============================================================================

#if __cplusplus >= 202002L
#include <concepts>

namespace coverage {

/**
 * FencePersistenceConcept - sink for closed fences and token assignment
 */
template<typename T>
concept FencePersistenceConcept = requires(T p, const Fence& f, const std::string& uuid, Timestamp t) {
    { p.save(f) } -> std::same_as<void>;
    { p.assign_test_uuid(uuid, t) } -> std::same_as<void>;
};

} // namespace coverage
#endif
