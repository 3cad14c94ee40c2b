// engine/event_merger.hpp
// Event merger - fan-in of the producer streams into one consumer stream
//
// Every producer (location source, ping pacer, network-type monitor, session
// controller) owns one SpscChannel. The single consumer waits on all channel
// eventfds through the event policy and drains them round-robin, so each
// producer's order is preserved while cross-producer interleaving is not
// specified.
//
// Usage:
//   EventMerger<> merger;
//   merger.init();
//   // producer threads
//   merger.push_location(sample);
//   merger.push_ping(outcome);
//   // consumer thread
//   while (auto ev = merger.next(100)) { engine.handle(*ev); }

#pragma once

#include <array>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>

#include "../core/channel.hpp"
#include "../model/types.hpp"
#include "../policy/event.hpp"

namespace coverage {
namespace engine {

enum class Producer : uint8_t {
    Location = 0,
    Ping,
    NetworkType,
    Session,
};

inline const char* producer_name(Producer p) {
    switch (p) {
        case Producer::Location: return "location";
        case Producer::Ping: return "ping";
        case Producer::NetworkType: return "network";
        case Producer::Session: return "session";
    }
    return "unknown";
}

template<typename EventPolicy = DefaultEventPolicy, size_t Capacity = 4096>
class EventMerger {
public:
    static constexpr size_t PRODUCER_COUNT = 4;
    using Channel = SpscChannel<CoverageEvent, Capacity>;

    EventMerger() : next_index_(0), initialized_(false) {}

    EventMerger(const EventMerger&) = delete;
    EventMerger& operator=(const EventMerger&) = delete;

    /**
     * Create the channels and register their eventfds
     *
     * @throws std::runtime_error if eventfd or the event policy fails
     */
    void init() {
        event_.init();
        for (auto& ch : channels_) {
            ch = std::make_unique<Channel>();
            ch->init();
            event_.add_read(ch->get_fd());
        }
        initialized_ = true;
    }

    bool push_location(const LocationSample& s) { return push(Producer::Location, s); }
    bool push_ping(const PingOutcome& p) { return push(Producer::Ping, p); }
    bool push_network_type(const NetworkTypeSample& s) { return push(Producer::NetworkType, s); }
    bool push_session(const SessionInitialized& s) { return push(Producer::Session, s); }

    /**
     * Enqueue an event on the producer's channel
     *
     * @return false if the channel is full (event dropped) or closed
     */
    bool push(Producer producer, CoverageEvent ev) {
        Channel& ch = channel(producer);
        if (ch.try_push(std::move(ev))) {
            return true;
        }
        if (!ch.is_closed()) {
            uint64_t dropped = ch.dropped();
            // Log the first drop and then every 1000th
            if (dropped == 1 || dropped % 1000 == 0) {
                fprintf(stderr, "[Merger] %s channel full, %lu event(s) dropped\n",
                        producer_name(producer), (unsigned long)dropped);
            }
        }
        return false;
    }

    /**
     * Close one producer's stream; buffered events are still delivered
     */
    void close(Producer producer) {
        channel(producer).close();
    }

    void close_all() {
        for (auto& ch : channels_) {
            if (ch) ch->close();
        }
    }

    /**
     * Next merged event
     *
     * @param timeout_ms Maximum wait (-1 = until an event or all streams end)
     * @return The event, or nullopt on timeout or once every channel is
     *         closed and drained
     */
    std::optional<CoverageEvent> next(int timeout_ms) {
        for (;;) {
            for (auto& ch : channels_) {
                ch->consume_notification();
            }

            if (auto ev = pop_any()) {
                return ev;
            }
            if (finished()) {
                return std::nullopt;
            }

            event_.set_wait_timeout(timeout_ms);
            int n = event_.wait_with_timeout();
            if (n == 0) {
                // A push may race the timeout; one last look
                return pop_any();
            }
            // n < 0 (EINTR) falls through to another drain
        }
    }

    // All channels closed and empty
    bool finished() const {
        for (const auto& ch : channels_) {
            if (!ch->is_finished()) return false;
        }
        return true;
    }

    uint64_t dropped(Producer producer) const {
        return channels_[static_cast<size_t>(producer)]->dropped();
    }

    bool is_initialized() const { return initialized_; }

private:
    Channel& channel(Producer producer) {
        return *channels_[static_cast<size_t>(producer)];
    }

    std::optional<CoverageEvent> pop_any() {
        for (size_t i = 0; i < PRODUCER_COUNT; ++i) {
            size_t idx = (next_index_ + i) % PRODUCER_COUNT;
            if (auto ev = channels_[idx]->try_pop()) {
                next_index_ = (idx + 1) % PRODUCER_COUNT;
                return ev;
            }
        }
        return std::nullopt;
    }

    EventPolicy event_;
    std::array<std::unique_ptr<Channel>, PRODUCER_COUNT> channels_;
    size_t next_index_;
    bool initialized_;
};

} // namespace engine
} // namespace coverage
