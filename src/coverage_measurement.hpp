// coverage_measurement.hpp
// CoverageMeasurement - one user-visible coverage measurement run
//
// Threads:
//   - pacer thread:   PingPacer::run(), pushes PingOutcome events; session
//                     initiation runs on std::async workers
//   - caller threads: push_location() / push_network_type() from the
//                     location and network monitors (one thread each)
//   - consumer:       run() / process() on the thread that owns the run,
//                     the only writer of fence state
//
// The sub-session record is written when the first token is handled, so a run
// that never obtains one leaves nothing in the store.
//
// Stop conditions: user request, total duration (max_coverage_session_seconds)
// and no accurate location within the auto-stop interval. On stop the open
// fence is closed at the stop instant; with a token the fences are submitted
// (failures leave them persisted for the resend sweep), without one the whole
// run is discarded.

#pragma once

#include <atomic>
#include <cstdio>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "core/timing.hpp"
#include "engine/event_merger.hpp"
#include "engine/fence_engine.hpp"
#include "model/fence.hpp"
#include "model/types.hpp"
#include "persistence/fence_store.hpp"
#include "persistence/resender.hpp"
#include "persistence/results_service.hpp"
#include "ping/ping_pacer.hpp"
#include "ping/udp_ping_session.hpp"
#include "session/keep_measuring_token.hpp"
#include "session/session_controller.hpp"

namespace coverage {

enum class StopReason : uint8_t {
    User = 0,
    MaxSessionDuration,
    InsufficientAccuracy,
};

inline const char* stop_reason_name(StopReason r) {
    switch (r) {
        case StopReason::User: return "user";
        case StopReason::MaxSessionDuration: return "maxSessionDuration";
        case StopReason::InsufficientAccuracy: return "insufficientAccuracy";
    }
    return "unknown";
}

/**
 * Measurement configuration
 */
struct MeasurementConfig {
    ping::PingConfig ping;
    engine::FenceConfig fence;
    Duration max_resend_age;
    int consumer_wait_ms;     // merger wait per consumer step

    MeasurementConfig()
        : max_resend_age(sec_to_us(7 * 24 * 3600))
        , consumer_wait_ms(100)
    {}

    static MeasurementConfig from_env() {
        MeasurementConfig c;
        c.ping = ping::PingConfig::from_env();
        c.fence = engine::FenceConfig::from_env();
        return c;
    }
};

struct MeasurementResult {
    StopReason reason = StopReason::User;
    std::vector<Fence> fences;
    std::optional<std::string> test_uuid;
    bool submitted = false;
    bool discarded = false;
};

/**
 * CoverageMeasurement
 *
 * @tparam Api       request_coverage() and submit_coverage_result() (control::ControlServerClient)
 * @tparam Transport Datagram transport of the ping session
 * @tparam Store     persistence::FenceStore or compatible
 * @tparam Clock     RealClock or VirtualClock
 */
template<typename Api, typename Transport, typename Store = persistence::FenceStore, typename Clock = RealClock>
class CoverageMeasurement {
public:
    using PingSession = ping::UdpPingSession<Transport, Clock>;
    using Pacer = ping::PingPacer<PingSession, Clock>;
    using Controller = session::CoverageSessionController<Api, Clock>;
    using Resender = persistence::PersistedFencesResender<Store, Api>;
    using ResultsService = persistence::PersistenceManagingResultsService<Store, Api, Controller, Clock>;
    using Engine = engine::FenceEngine<Store>;
    using SessionMaker = std::function<std::unique_ptr<PingSession>()>;

    CoverageMeasurement(Clock& clock, Api& api, Store& store,
                        typename Engine::TechnologyLookup technology,
                        MeasurementConfig config = MeasurementConfig(),
                        SessionMaker make_session = nullptr,
                        session::KeepMeasuringToken& token = session::KeepMeasuringToken::shared())
        : clock_(clock)
        , api_(api)
        , store_(store)
        , config_(config)
        , token_(token)
        , make_session_(std::move(make_session))
        , engine_(store, std::move(technology), config.fence)
        , resender_(store, api, config.max_resend_age)
        , controller_(clock, api,
                      [this](const SessionInitialized& s) { merger_.push_session(s); },
                      [this]() { resender_.resend_persistent_sessions(false, clock_.now()); })
        , results_(clock, store, api, controller_, resender_)
        , started_(false)
        , session_recorded_(false)
        , started_at_(0)
        , stop_pacer_(false)
    {
        merger_.init();
        if (!make_session_) {
            make_session_ = [this]() { return std::make_unique<PingSession>(clock_, config_.ping); };
        }
    }

    ~CoverageMeasurement() {
        if (started_) {
            stop(StopReason::User);
        }
    }

    CoverageMeasurement(const CoverageMeasurement&) = delete;
    CoverageMeasurement& operator=(const CoverageMeasurement&) = delete;

    /**
     * Begin the run: hold the keep-measuring token and start pinging
     */
    void start() {
        if (started_) return;

        Timestamp now = clock_.now();
        token_.acquire();
        started_ = true;
        started_at_ = now;
        session_recorded_ = false;
        stop_reasons_.clear();

        engine_.start(now);
        controller_.reset();
        controller_.mark_measurement_started(now);

        pacer_ = std::make_unique<Pacer>(
            clock_,
            [this]() {
                return std::async(std::launch::async, [this]() { return controller_.start_new_session(); });
            },
            [this](const SessionCredentials& credentials) {
                auto s = make_session_();
                s->start(credentials);
                return s;
            },
            [this](const PingOutcome& outcome) { merger_.push_ping(outcome); },
            config_.ping);
        pacer_->set_expiry_check([this](Timestamp t) { return controller_.sub_session_expired(t); });

        stop_pacer_.store(false, std::memory_order_release);
        pacer_thread_ = std::thread([this]() { pacer_->run(stop_pacer_); });

        printf("[Measurement] Started (ping every %d ms, radius %.0fm, accuracy %.0fm)\n",
               config_.ping.interval_ms, config_.fence.radius_m, config_.fence.accuracy_threshold_m);
    }

    // Producer entry points (one thread per producer)
    bool push_location(const LocationSample& s) { return merger_.push_location(s); }
    bool push_network_type(const NetworkTypeSample& s) { return merger_.push_network_type(s); }

    /**
     * One consumer step: handle at most one event, then evaluate stop conditions
     *
     * @return Stop reason if the run must end now
     */
    std::optional<StopReason> process(int wait_ms) {
        if (auto ev = merger_.next(wait_ms)) {
            dispatch(*ev);
        }

        Timestamp now = clock_.now();
        if (controller_.total_expired(now)) {
            return StopReason::MaxSessionDuration;
        }
        if (engine_.insufficient_accuracy_expired(now)) {
            return StopReason::InsufficientAccuracy;
        }
        return std::nullopt;
    }

    /**
     * Consumer loop until a stop condition or a user stop
     */
    MeasurementResult run(const std::atomic<bool>& user_stop) {
        while (!user_stop.load(std::memory_order_acquire)) {
            if (auto reason = process(config_.consumer_wait_ms)) {
                return stop(*reason);
            }
        }
        return stop(StopReason::User);
    }

    /**
     * End the run and hand the fences to the results service
     */
    MeasurementResult stop(StopReason reason) {
        MeasurementResult result;
        result.reason = reason;
        if (!started_) {
            return result;
        }

        stop_pacer_.store(true, std::memory_order_release);
        if (pacer_thread_.joinable()) {
            pacer_thread_.join();
        }
        pacer_.reset();

        // Everything produced before the stop still counts
        while (auto ev = merger_.next(0)) {
            dispatch(*ev);
        }

        Timestamp now = clock_.now();
        result.fences = engine_.stop(now);
        result.test_uuid = controller_.current_test_uuid();
        stop_reasons_.push_back(reason);

        if (!controller_.is_initialized()) {
            result.discarded = true;
            try {
                store_.discard_unassigned_session();
            } catch (const std::exception& e) {
                printf("[Measurement] Discarding session failed: %s\n", e.what());
            }
            printf("[Measurement] Stopped (%s) without a session, %zu fences discarded\n",
                   stop_reason_name(reason), result.fences.size());
        } else {
            try {
                store_.session_finalized(now);
            } catch (const std::exception& e) {
                printf("[Measurement] Finalizing session failed: %s\n", e.what());
            }
            if (!result.fences.empty()) {
                try {
                    results_.send(result.fences);
                    result.submitted = true;
                } catch (const std::exception& e) {
                    printf("[Measurement] Submitting results failed: %s\n", e.what());
                }
            }
            printf("[Measurement] Stopped (%s): %zu fences, %s\n", stop_reason_name(reason),
                   result.fences.size(), result.submitted ? "submitted" : "kept for resend");
        }

        started_ = false;
        token_.release();
        return result;
    }

    bool is_started() const { return started_; }
    const std::vector<StopReason>& stop_reasons() const { return stop_reasons_; }
    const Engine& fence_engine() const { return engine_; }
    Controller& controller() { return controller_; }
    Resender& resender() { return resender_; }

private:
    // First token of the run opens its sub-session record
    void dispatch(const CoverageEvent& ev) {
        if (!session_recorded_ && std::holds_alternative<SessionInitialized>(ev)) {
            session_recorded_ = true;
            try {
                store_.session_started(started_at_);
            } catch (const std::exception& e) {
                printf("[Measurement] Recording session start failed: %s\n", e.what());
            }
        }
        engine_.handle(ev);
    }

    Clock& clock_;
    Api& api_;
    Store& store_;
    MeasurementConfig config_;
    session::KeepMeasuringToken& token_;
    SessionMaker make_session_;

    engine::EventMerger<> merger_;
    Engine engine_;
    Resender resender_;
    Controller controller_;
    ResultsService results_;

    std::unique_ptr<Pacer> pacer_;
    std::thread pacer_thread_;
    bool started_;
    bool session_recorded_;
    Timestamp started_at_;
    std::atomic<bool> stop_pacer_;
    std::vector<StopReason> stop_reasons_;
};

} // namespace coverage
