// ping/ping_pacer.hpp
// Ping Pacer - fixed-cadence ping attempts over a reinitializable session
//
// State machine:
//
//   NeedsInitiation --tick--> InProgress --credentials--> Ready(session)
//          ^                      |                           |
//          +------ failure -------+                           |
//          +---------------- RE01 / reinitialize() -----------+
//
// Each tick yields exactly one PingOutcome, timestamped with the tick instant:
//   - NeedsInitiation: starts the asynchronous session request; once it
//     resolves the tick's ping is sent on the new session (or the tick is
//     reported as InitiationFailed)
//   - InProgress:      synthetic InitiationInProgress error, cadence unaffected
//   - Ready:           one ping on the active session
// Outcomes are emitted when the attempt completes, so pipelined pings may be
// emitted out of tick order.
//
// The optional expiry check (sub-session timer) is evaluated before each tick
// in Ready; when it fires the session is retired and the same tick starts a
// new initiation.
//
// A discarded session is retired rather than destroyed: requests it still has
// in flight keep their chance to be answered and are reported when they
// complete or time out.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "../core/timing.hpp"
#include "../model/types.hpp"
#include "udp_ping_session.hpp"

namespace coverage {
namespace ping {

enum class PacerState : uint8_t {
    NeedsInitiation = 0,
    InProgress,
    Ready,
};

inline const char* pacer_state_name(PacerState s) {
    switch (s) {
        case PacerState::NeedsInitiation: return "NeedsInitiation";
        case PacerState::InProgress: return "InProgress";
        case PacerState::Ready: return "Ready";
    }
    return "unknown";
}

template<typename Session, typename Clock = RealClock>
class PingPacer {
public:
    using Initiator = std::function<std::future<std::optional<SessionCredentials>>()>;
    using SessionFactory = std::function<std::unique_ptr<Session>(const SessionCredentials&)>;
    using OutcomeSink = std::function<void(const PingOutcome&)>;
    using ExpiryCheck = std::function<bool(Timestamp)>;

    PingPacer(Clock& clock, Initiator initiator, SessionFactory factory, OutcomeSink sink,
              PingConfig config = PingConfig())
        : clock_(clock)
        , initiator_(std::move(initiator))
        , factory_(std::move(factory))
        , sink_(std::move(sink))
        , config_(config)
        , state_(PacerState::NeedsInitiation)
        , initiation_tick_(0)
    {}

    ~PingPacer() {
        shutdown();
    }

    PingPacer(const PingPacer&) = delete;
    PingPacer& operator=(const PingPacer&) = delete;

    /**
     * One cadence step at the current clock instant
     */
    void tick() {
        Timestamp now = clock_.now();

        if (state_ == PacerState::Ready && expiry_ && expiry_(now)) {
            printf("[Pacer] Sub-session expired\n");
            retire_active();
        }

        switch (state_) {
            case PacerState::NeedsInitiation:
                state_ = PacerState::InProgress;
                initiation_tick_ = now;
                pending_init_ = initiator_();
                check_initiation();
                break;

            case PacerState::InProgress:
                emit(PingOutcome::failure(now, PingError::InitiationInProgress));
                break;

            case PacerState::Ready:
                send_on(*active_, now);
                if (!active_->session->is_valid()) {
                    retire_active();
                }
                break;
        }
    }

    /**
     * Drive initiation, replies and timeouts
     *
     * @param wait_ms Maximum time to wait for replies on the active session
     */
    void pump(int wait_ms = 0) {
        check_initiation();

        if (active_) {
            active_->session->poll(wait_ms);
            active_->session->expire();
            bool reinit = collect(*active_);
            if (reinit || !active_->session->is_valid()) {
                retire_active();
            }
        } else if (wait_ms > 0) {
            clock_.sleep_until(clock_.now() + ms_to_us(wait_ms));
        }

        for (auto it = retiring_.begin(); it != retiring_.end();) {
            (*it)->session->poll(0);
            (*it)->session->expire();
            collect(**it);
            if ((*it)->session->pending_count() == 0) {
                it = retiring_.erase(it);
            } else {
                ++it;
            }
        }
    }

    /**
     * Real-time loop: immediate first tick, then one tick per interval
     *
     * @param stop Cancellation flag checked between steps
     */
    void run(const std::atomic<bool>& stop) {
        const Duration interval = ms_to_us(config_.interval_ms);
        Timestamp next_tick = clock_.now();

        while (!stop.load(std::memory_order_acquire)) {
            Timestamp now = clock_.now();
            if (now >= next_tick) {
                tick();
                next_tick += interval;
                if (next_tick <= now) {
                    next_tick = now + interval;  // fell behind, skip missed ticks
                }
            }

            Duration remaining = next_tick - clock_.now();
            int wait_ms = static_cast<int>(remaining / US_PER_MS);
            if (wait_ms < 0) wait_ms = 0;
            if (wait_ms > 10) wait_ms = 10;
            pump(wait_ms);
        }

        shutdown();
    }

    /**
     * Drop the active session; the next tick requests a new one
     */
    void reinitialize() {
        printf("[Pacer] Reinitialization requested\n");
        retire_active();
        if (state_ == PacerState::Ready) {
            state_ = PacerState::NeedsInitiation;
        }
    }

    /**
     * Sub-session timer, evaluated before each tick while Ready
     */
    void set_expiry_check(ExpiryCheck check) {
        expiry_ = std::move(check);
    }

    /**
     * Stop all sessions, resolving their in-flight requests with errors
     *
     * An initiation still underway is awaited so that its side effects have
     * happened before shutdown returns; its credentials are discarded.
     */
    void shutdown() {
        if (state_ == PacerState::InProgress && pending_init_.valid()) {
            try {
                auto credentials = pending_init_.get();
                if (credentials) {
                    printf("[Pacer] Session %s obtained during shutdown, discarded\n",
                           credentials->test_uuid.c_str());
                }
            } catch (const std::exception& e) {
                printf("[Pacer] Session initiation failed during shutdown: %s\n", e.what());
            }
            state_ = PacerState::NeedsInitiation;
        }
        if (active_) {
            active_->session->stop();
            collect(*active_);
            active_.reset();
        }
        for (auto& r : retiring_) {
            r->session->stop();
            collect(*r);
        }
        retiring_.clear();
    }

    PacerState state() const { return state_; }

    Session* session() { return active_ ? active_->session.get() : nullptr; }

    size_t retiring_count() const { return retiring_.size(); }

private:
    struct Slot {
        std::unique_ptr<Session> session;
        std::map<uint32_t, Timestamp> ticks;  // seq -> tick instant
    };

    void check_initiation() {
        if (state_ != PacerState::InProgress || !pending_init_.valid()) {
            return;
        }
        if (pending_init_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return;
        }

        std::optional<SessionCredentials> credentials;
        try {
            credentials = pending_init_.get();
        } catch (const std::exception& e) {
            printf("[Pacer] Session initiation failed: %s\n", e.what());
        }

        if (!credentials) {
            state_ = PacerState::NeedsInitiation;
            emit(PingOutcome::failure(initiation_tick_, PingError::InitiationFailed));
            return;
        }

        try {
            auto slot = std::make_unique<Slot>();
            slot->session = factory_(*credentials);
            active_ = std::move(slot);
        } catch (const std::exception& e) {
            printf("[Pacer] Ping session start failed: %s\n", e.what());
            state_ = PacerState::NeedsInitiation;
            emit(PingOutcome::failure(initiation_tick_, PingError::InitiationFailed));
            return;
        }

        state_ = PacerState::Ready;
        send_on(*active_, initiation_tick_);
    }

    void send_on(Slot& slot, Timestamp tick) {
        uint32_t seq = slot.session->send_ping();
        slot.ticks[seq] = tick;
        collect(slot);
    }

    // Emit finished attempts; true if the server invalidated the session
    bool collect(Slot& slot) {
        bool reinit = false;
        for (const auto& c : slot.session->drain_completions()) {
            Timestamp tick = c.sent_at;
            auto it = slot.ticks.find(c.seq);
            if (it != slot.ticks.end()) {
                tick = it->second;
                slot.ticks.erase(it);
            }
            if (c.error == PingError::None) {
                emit(PingOutcome::success(tick, c.duration));
            } else {
                if (c.error == PingError::NeedsReinitialization) reinit = true;
                emit(PingOutcome::failure(tick, c.error));
            }
        }
        return reinit;
    }

    void retire_active() {
        if (!active_) return;
        printf("[Pacer] Retiring ping session %s (%zu in flight)\n",
               active_->session->test_uuid().c_str(), active_->session->pending_count());
        if (active_->session->pending_count() > 0) {
            retiring_.push_back(std::move(active_));
        }
        active_.reset();
        if (state_ == PacerState::Ready) {
            state_ = PacerState::NeedsInitiation;
        }
    }

    void emit(const PingOutcome& outcome) {
        if (sink_) sink_(outcome);
    }

    Clock& clock_;
    Initiator initiator_;
    SessionFactory factory_;
    OutcomeSink sink_;
    ExpiryCheck expiry_;
    PingConfig config_;
    PacerState state_;
    Timestamp initiation_tick_;
    std::future<std::optional<SessionCredentials>> pending_init_;
    std::unique_ptr<Slot> active_;
    std::vector<std::unique_ptr<Slot>> retiring_;
};

} // namespace ping
} // namespace coverage
