// test/unittest/test_ping_pacer.cpp
// Unit tests for the ping pacer state machine on a virtual clock

#include "ping/ping_pacer.hpp"
#include "transport/loopback_transport.hpp"
#include "test_harness.hpp"
#include <cstring>
#include <thread>

using namespace coverage;
using namespace coverage::ping;
using transport::Datagram;
using transport::LoopbackState;
using transport::LoopbackTransport;

using Session = UdpPingSession<LoopbackTransport, VirtualClock>;
using Pacer = PingPacer<Session, VirtualClock>;

static SessionCredentials credentials(const std::string& uuid) {
    SessionCredentials c;
    c.test_uuid = uuid;
    c.ping_token = "AAEC";
    c.ping_host = "127.0.0.1";
    c.ping_port = 444;
    return c;
}

static Datagram reply(const uint8_t* tag, uint32_t seq) {
    Datagram d(HEADER_SIZE);
    memcpy(d.data(), tag, 4);
    store_be32(d.data() + 4, seq);
    return d;
}

static std::future<std::optional<SessionCredentials>> ready(std::optional<SessionCredentials> c) {
    std::promise<std::optional<SessionCredentials>> p;
    p.set_value(std::move(c));
    return p.get_future();
}

// Helper: pacer wired to loopback sessions, collecting outcomes
struct Fixture {
    VirtualClock clock{ms_to_us(1000)};
    std::vector<std::shared_ptr<LoopbackState>> states;
    std::vector<PingOutcome> outcomes;
    int initiations = 0;
    bool answer = true;
    std::function<std::future<std::optional<SessionCredentials>>()> initiator;
    std::unique_ptr<Pacer> pacer;

    Fixture() {
        initiator = [this]() {
            return ready(credentials("uuid-" + std::to_string(initiations)));
        };
        pacer = std::make_unique<Pacer>(
            clock,
            [this]() {
                ++initiations;
                return initiator();
            },
            [this](const SessionCredentials& c) {
                LoopbackTransport t;
                auto state = t.state();
                if (answer) {
                    state->responder = [](const Datagram& req) -> std::optional<Datagram> {
                        return reply(TAG_REPLY, load_be32(req.data() + 4));
                    };
                }
                states.push_back(state);
                auto s = std::make_unique<Session>(clock, std::move(t));
                s->start(c);
                return s;
            },
            [this](const PingOutcome& o) { outcomes.push_back(o); });
    }
};

TEST(first_tick_initiates_and_pings) {
    Fixture f;
    ASSERT_TRUE(f.pacer->state() == PacerState::NeedsInitiation);

    f.pacer->tick();
    ASSERT_TRUE(f.pacer->state() == PacerState::Ready);
    ASSERT_EQ(f.initiations, 1);
    ASSERT_EQ(f.states.size(), 1u);
    ASSERT_EQ(f.states[0]->sent_count(), 1u);

    f.clock.advance(ms_to_us(15));
    f.pacer->pump(0);
    ASSERT_EQ(f.outcomes.size(), 1u);
    ASSERT_TRUE(f.outcomes[0].is_success());
    ASSERT_EQ(f.outcomes[0].timestamp, ms_to_us(1000));
    ASSERT_EQ(f.outcomes[0].duration, ms_to_us(15));
}

TEST(each_tick_one_outcome) {
    Fixture f;
    for (int i = 0; i < 10; ++i) {
        f.pacer->tick();
        f.clock.advance(ms_to_us(100));
        f.pacer->pump(0);
    }
    ASSERT_EQ(f.outcomes.size(), 10u);
    for (size_t i = 0; i < f.outcomes.size(); ++i) {
        ASSERT_TRUE(f.outcomes[i].is_success());
        ASSERT_EQ(f.outcomes[i].timestamp, ms_to_us(1000) + static_cast<Timestamp>(i) * ms_to_us(100));
    }
    ASSERT_EQ(f.initiations, 1);
}

TEST(in_progress_ticks_emit_marker) {
    Fixture f;
    std::promise<std::optional<SessionCredentials>> pending;
    f.initiator = [&pending]() { return pending.get_future(); };

    f.pacer->tick();
    ASSERT_TRUE(f.pacer->state() == PacerState::InProgress);
    ASSERT_EQ(f.outcomes.size(), 0u);

    f.clock.advance(ms_to_us(100));
    f.pacer->tick();
    f.clock.advance(ms_to_us(100));
    f.pacer->tick();
    ASSERT_EQ(f.outcomes.size(), 2u);
    for (const auto& o : f.outcomes) {
        ASSERT_TRUE(o.error == PingError::InitiationInProgress);
    }
    ASSERT_EQ(f.outcomes[0].timestamp, ms_to_us(1100));
    ASSERT_EQ(f.initiations, 1);

    // Resolution sends the ping for the tick that started the initiation
    pending.set_value(credentials("late"));
    f.pacer->pump(0);
    ASSERT_TRUE(f.pacer->state() == PacerState::Ready);
    ASSERT_EQ(f.outcomes.size(), 3u);
    ASSERT_TRUE(f.outcomes[2].is_success());
    ASSERT_EQ(f.outcomes[2].timestamp, ms_to_us(1000));
}

TEST(initiation_failure_emits_and_retries) {
    Fixture f;
    f.initiator = []() { return ready(std::nullopt); };

    f.pacer->tick();
    ASSERT_TRUE(f.pacer->state() == PacerState::NeedsInitiation);
    ASSERT_EQ(f.outcomes.size(), 1u);
    ASSERT_TRUE(f.outcomes[0].error == PingError::InitiationFailed);

    f.initiator = []() { return ready(credentials("second")); };
    f.clock.advance(ms_to_us(100));
    f.pacer->tick();
    ASSERT_TRUE(f.pacer->state() == PacerState::Ready);
    ASSERT_EQ(f.initiations, 2);
}

TEST(initiation_exception_is_failure) {
    Fixture f;
    f.initiator = []() {
        std::promise<std::optional<SessionCredentials>> p;
        p.set_exception(std::make_exception_ptr(std::runtime_error("control server down")));
        return p.get_future();
    };

    f.pacer->tick();
    ASSERT_EQ(f.outcomes.size(), 1u);
    ASSERT_TRUE(f.outcomes[0].error == PingError::InitiationFailed);
    ASSERT_TRUE(f.pacer->state() == PacerState::NeedsInitiation);
}

TEST(session_start_failure_is_initiation_failure) {
    Fixture f;
    f.initiator = []() {
        SessionCredentials c = credentials("bad");
        c.ping_token = "%%%";
        return ready(c);
    };

    f.pacer->tick();
    ASSERT_EQ(f.outcomes.size(), 1u);
    ASSERT_TRUE(f.outcomes[0].error == PingError::InitiationFailed);
    ASSERT_TRUE(f.pacer->session() == nullptr);
}

TEST(error_reply_reinitializes_on_next_tick) {
    Fixture f;
    f.answer = false;

    f.pacer->tick();
    auto state = f.states[0];
    uint32_t seq = load_be32(state->sent_at(0).data() + 4);

    state->inject(reply(TAG_ERROR, seq));
    f.pacer->pump(0);
    ASSERT_EQ(f.outcomes.size(), 1u);
    ASSERT_TRUE(f.outcomes[0].error == PingError::NeedsReinitialization);
    ASSERT_TRUE(f.pacer->state() == PacerState::NeedsInitiation);
    ASSERT_TRUE(f.pacer->session() == nullptr);

    f.clock.advance(ms_to_us(100));
    f.pacer->tick();
    ASSERT_EQ(f.initiations, 2);
    ASSERT_EQ(f.states.size(), 2u);
    ASSERT_TRUE(f.pacer->state() == PacerState::Ready);
}

TEST(timeouts_reported_at_tick_time) {
    Fixture f;
    f.answer = false;

    f.pacer->tick();
    f.clock.advance(ms_to_us(1000));
    f.pacer->pump(0);

    ASSERT_EQ(f.outcomes.size(), 1u);
    ASSERT_TRUE(f.outcomes[0].error == PingError::TimedOut);
    ASSERT_EQ(f.outcomes[0].timestamp, ms_to_us(1000));
    ASSERT_TRUE(f.pacer->state() == PacerState::Ready);
}

TEST(expiry_check_retires_session) {
    Fixture f;
    Timestamp expire_at = ms_to_us(1250);
    f.pacer->set_expiry_check([&expire_at](Timestamp now) { return now >= expire_at; });

    f.pacer->tick();
    f.pacer->pump(0);
    f.clock.advance(ms_to_us(100));
    f.pacer->tick();
    f.pacer->pump(0);
    ASSERT_EQ(f.initiations, 1);

    f.clock.advance(ms_to_us(200));
    f.pacer->tick();
    ASSERT_EQ(f.initiations, 2);
    ASSERT_EQ(f.states.size(), 2u);
    ASSERT_EQ(f.pacer->session()->test_uuid(), "uuid-2");
    ASSERT_EQ(f.states[1]->sent_count(), 1u);
}

TEST(retired_session_reports_late_replies) {
    Fixture f;
    f.answer = false;

    f.pacer->tick();
    auto old_state = f.states[0];
    uint32_t seq = load_be32(old_state->sent_at(0).data() + 4);

    f.pacer->reinitialize();
    ASSERT_TRUE(f.pacer->state() == PacerState::NeedsInitiation);
    ASSERT_EQ(f.pacer->retiring_count(), 1u);

    f.clock.advance(ms_to_us(40));
    old_state->inject(reply(TAG_REPLY, seq));
    f.pacer->pump(0);

    ASSERT_EQ(f.outcomes.size(), 1u);
    ASSERT_TRUE(f.outcomes[0].is_success());
    ASSERT_EQ(f.outcomes[0].duration, ms_to_us(40));
    ASSERT_EQ(f.pacer->retiring_count(), 0u);
}

TEST(shutdown_fails_in_flight) {
    Fixture f;
    f.answer = false;

    f.pacer->tick();
    f.pacer->shutdown();
    ASSERT_EQ(f.outcomes.size(), 1u);
    ASSERT_TRUE(f.outcomes[0].error == PingError::NetworkIssue);
    ASSERT_TRUE(f.pacer->session() == nullptr);
    ASSERT_FALSE(f.states[0]->open);
}

TEST(shutdown_awaits_pending_initiation) {
    Fixture f;
    std::promise<std::optional<SessionCredentials>> pending;
    f.initiator = [&pending]() { return pending.get_future(); };

    f.pacer->tick();
    ASSERT_TRUE(f.pacer->state() == PacerState::InProgress);

    std::thread resolver([&pending]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        pending.set_value(credentials("discarded"));
    });
    f.pacer->shutdown();
    resolver.join();

    ASSERT_TRUE(f.pacer->state() == PacerState::NeedsInitiation);
    ASSERT_EQ(f.states.size(), 0u);
}

int main() {
    return run_all_tests("PingPacer");
}
