// session/session_controller.hpp
// Coverage session controller - control-plane token lifecycle
//
// Each successful /coverageRequest opens a sub-session. Sub-sessions are
// chained: the request for a new token carries loop_uuid = the test_uuid of
// the sub-session it replaces. Two timers are evaluated against the injected
// clock:
//   - sub-session timer (max_coverage_measurement_seconds), measured from the
//     anchor instant of the current token; expiry triggers reinitialization
//   - total timer (max_coverage_session_seconds), measured from the start of
//     the measurement run; expiry stops the run
//
// start_new_session() is called from the pacer's initiation thread while the
// accessors are read from the measurement thread, so all state sits behind a
// mutex. The network request itself runs unlocked.

#pragma once

#include <cstdio>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "../core/timing.hpp"
#include "../model/types.hpp"

namespace coverage {
namespace session {

/**
 * Api must provide:
 *   CoverageResponse request_coverage(const std::optional<std::string>& loop_uuid, Timestamp now);
 * returning credentials plus optional session / measurement maxima in seconds,
 * and throwing on failure (see control::ControlServerClient).
 */
template<typename Api, typename Clock = RealClock>
class CoverageSessionController {
public:
    using SessionSink = std::function<void(const SessionInitialized&)>;
    using ResendSweep = std::function<void()>;

    CoverageSessionController(Clock& clock, Api& api, SessionSink sink = nullptr,
                              ResendSweep resend = nullptr)
        : clock_(clock)
        , api_(api)
        , sink_(std::move(sink))
        , resend_(std::move(resend))
        , anchor_(0)
        , measurement_start_(0)
        , ip_version_(IpVersion::Any)
        , session_count_(0)
    {}

    CoverageSessionController(const CoverageSessionController&) = delete;
    CoverageSessionController& operator=(const CoverageSessionController&) = delete;

    /**
     * Request a fresh token, chained to the previous sub-session if there was one
     *
     * Persisted sessions are resent first on a best-effort basis.
     *
     * @return Credentials for the ping session, nullopt if the request failed
     */
    std::optional<SessionCredentials> start_new_session() {
        if (resend_) {
            try {
                resend_();
            } catch (const std::exception& e) {
                printf("[Session] Resend before new session failed: %s\n", e.what());
            }
        }

        std::optional<std::string> loop_uuid;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            loop_uuid = test_uuid_;
        }

        printf("[Session] Requesting session (loop_uuid=%s)\n", loop_uuid ? loop_uuid->c_str() : "none");

        try {
            auto response = api_.request_coverage(loop_uuid, clock_.now());
            Timestamp anchor = clock_.now();
            SessionCredentials credentials = response.credentials;
            credentials.loop_uuid = loop_uuid;

            size_t count;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                test_uuid_ = credentials.test_uuid;
                anchor_ = anchor;
                if (response.max_coverage_session_seconds) {
                    max_session_ = sec_to_us(*response.max_coverage_session_seconds);
                }
                if (response.max_coverage_measurement_seconds) {
                    max_sub_session_ = sec_to_us(*response.max_coverage_measurement_seconds);
                }
                ip_version_ = credentials.ip_version;
                count = ++session_count_;
            }

            printf("[Session] Initialized test_uuid=%s ip=%s sessions=%zu\n",
                   credentials.test_uuid.c_str(), ip_version_name(credentials.ip_version), count);

            if (sink_) {
                sink_(SessionInitialized(anchor, credentials.test_uuid));
            }
            return credentials;
        } catch (const std::exception& e) {
            printf("[Session] Session request failed: %s\n", e.what());
            return std::nullopt;
        }
    }

    /**
     * Forget the previous run's token and maxima
     */
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        test_uuid_.reset();
        anchor_ = 0;
        max_session_.reset();
        max_sub_session_.reset();
        ip_version_ = IpVersion::Any;
        session_count_ = 0;
    }

    /**
     * Start of the user-visible run, origin of the total timer
     */
    void mark_measurement_started(Timestamp t) {
        std::lock_guard<std::mutex> lock(mutex_);
        measurement_start_ = t;
    }

    // Current sub-session outlived max_coverage_measurement_seconds
    bool sub_session_expired(Timestamp now) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!test_uuid_ || !max_sub_session_) return false;
        return now - anchor_ >= *max_sub_session_;
    }

    // Run outlived max_coverage_session_seconds
    bool total_expired(Timestamp now) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!max_session_) return false;
        return now - measurement_start_ >= *max_session_;
    }

    bool is_initialized() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return test_uuid_.has_value();
    }

    std::optional<std::string> current_test_uuid() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return test_uuid_;
    }

    Timestamp anchor() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return anchor_;
    }

    IpVersion ip_version() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ip_version_;
    }

    size_t session_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_count_;
    }

    std::optional<Duration> max_session_duration() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_session_;
    }

    std::optional<Duration> max_sub_session_duration() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_sub_session_;
    }

private:
    Clock& clock_;
    Api& api_;
    SessionSink sink_;
    ResendSweep resend_;

    mutable std::mutex mutex_;
    std::optional<std::string> test_uuid_;
    Timestamp anchor_;
    Timestamp measurement_start_;
    std::optional<Duration> max_session_;
    std::optional<Duration> max_sub_session_;
    IpVersion ip_version_;
    size_t session_count_;
};

} // namespace session
} // namespace coverage
