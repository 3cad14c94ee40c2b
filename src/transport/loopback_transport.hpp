// src/transport/loopback_transport.hpp
// Loopback Transport - scripted in-memory datagram transport for testing
//
// Satisfies DatagramTransportConcept without touching the network:
//   - every send() is recorded and may be answered by a responder callback
//   - tests can inject datagrams, fail sends, or fail open()
//   - wait_readable() never sleeps: 1 if a datagram is queued, otherwise 0
//
// Usage:
//   LoopbackTransport t;
//   t.state()->responder = [](const Datagram& req) { return make_reply(req); };
//   UdpPingSession<LoopbackTransport, VirtualClock> session(clock, std::move(t), config);
//
#pragma once

#include <cerrno>
#include <cstdio>
#include <cstdint>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/types.h>

#include "transport_policy.hpp"

// Debug printing - enable with -DDEBUG
#ifdef DEBUG
#define DEBUG_PRINT(...) do { printf(__VA_ARGS__); fflush(stdout); } while(0)
#else
#define DEBUG_PRINT(...) ((void)0)
#endif

namespace coverage {
namespace transport {

using Datagram = std::vector<uint8_t>;

/**
 * Shared state of a loopback transport
 *
 * Held through shared_ptr so a test keeps a handle after moving the transport
 * into the component under test.
 */
struct LoopbackState {
    std::mutex mutex;
    std::vector<Datagram> sent;
    std::deque<Datagram> inbox;
    std::function<std::optional<Datagram>(const Datagram&)> responder;
    std::string host;
    uint16_t port = 0;
    IpVersion version = IpVersion::Any;
    bool open = false;
    bool fail_open = false;
    bool fail_sends = false;
    int open_count = 0;

    void inject(Datagram d) {
        std::lock_guard<std::mutex> lock(mutex);
        inbox.push_back(std::move(d));
    }

    size_t sent_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return sent.size();
    }

    Datagram sent_at(size_t i) {
        std::lock_guard<std::mutex> lock(mutex);
        return sent.at(i);
    }
};

struct LoopbackTransport {
    LoopbackTransport() : state_(std::make_shared<LoopbackState>()) {}

    explicit LoopbackTransport(std::shared_ptr<LoopbackState> state)
        : state_(std::move(state)) {}

    /**
     * @throws std::runtime_error if the script asks open() to fail
     */
    void open(const char* host, uint16_t port, IpVersion version = IpVersion::Any) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->fail_open) {
            throw std::runtime_error("loopback open failure");
        }
        state_->host = host;
        state_->port = port;
        state_->version = version;
        state_->open = true;
        state_->open_count++;
        DEBUG_PRINT("[Loopback] open %s:%u\n", host, port);
    }

    void close() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->open = false;
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->open;
    }

    ssize_t send(const void* data, size_t len) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->open || state_->fail_sends) {
            errno = ECONNREFUSED;
            return -1;
        }
        const uint8_t* p = static_cast<const uint8_t*>(data);
        Datagram d(p, p + len);
        state_->sent.push_back(d);
        if (state_->responder) {
            auto reply = state_->responder(d);
            if (reply) {
                state_->inbox.push_back(std::move(*reply));
            }
        }
        return static_cast<ssize_t>(len);
    }

    ssize_t recv(void* buffer, size_t len) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->inbox.empty()) {
            errno = EAGAIN;
            return -1;
        }
        Datagram d = std::move(state_->inbox.front());
        state_->inbox.pop_front();
        size_t n = d.size() < len ? d.size() : len;
        memcpy(buffer, d.data(), n);
        return static_cast<ssize_t>(n);
    }

    int wait_readable(int) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->open) return -1;
        return state_->inbox.empty() ? 0 : 1;
    }

    void interrupt() {}

    const std::shared_ptr<LoopbackState>& state() const {
        return state_;
    }

private:
    std::shared_ptr<LoopbackState> state_;
};

} // namespace transport
} // namespace coverage

#if __cplusplus >= 202002L
static_assert(coverage::DatagramTransportConcept<coverage::transport::LoopbackTransport>);
#endif
