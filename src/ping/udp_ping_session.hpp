// ping/udp_ping_session.hpp
// UDP ping protocol: framed request/reply echo with a per-session token
//
// Wire format (all multi-byte integers big-endian):
//   Request:  "RP01" | seq (u32) | token bytes (Base64-decoded ping_token)
//   Success:  "RR01" | seq (u32)
//   Error:    "RE01" | seq (u32)   server no longer accepts the token
//
// Requests are pipelined: any number may be outstanding and each reply is
// matched to its request by sequence number only, never by order.
//
// Failure classification:
//   RR01 matching seq        -> success, duration = reply receipt - send
//                               (monotonic clock; sent_at stays wall time)
//   RE01 matching seq        -> NeedsReinitialization for that request
//   RE01 unknown seq (or 0)  -> NeedsReinitialization for every pending request
//   no reply within timeout  -> TimedOut (session stays valid)
//   send() failure           -> NetworkIssue (session stays valid)
//
// Template parameters:
//   - Transport: DatagramTransportConcept (UdpSocket<>, LoopbackTransport)
//   - Clock:     ClockConcept (RealClock, VirtualClock)

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/encoding.hpp"
#include "../core/timing.hpp"
#include "../model/types.hpp"

// Debug printing - enable with -DDEBUG
#ifdef DEBUG
#define DEBUG_PRINT(...) do { printf(__VA_ARGS__); fflush(stdout); } while(0)
#else
#define DEBUG_PRINT(...) ((void)0)
#endif

namespace coverage {
namespace ping {

inline constexpr uint8_t TAG_REQUEST[4] = {'R', 'P', '0', '1'};
inline constexpr uint8_t TAG_REPLY[4]   = {'R', 'R', '0', '1'};
inline constexpr uint8_t TAG_ERROR[4]   = {'R', 'E', '0', '1'};
inline constexpr size_t HEADER_SIZE = 8;
inline constexpr size_t MAX_DATAGRAM = 1500;

/**
 * Ping configuration
 */
struct PingConfig {
    int interval_ms;        // Pacer cadence (default: 100)
    int timeout_ms;         // Reply timeout (default: 1000)
    size_t max_in_flight;   // Pending requests before the oldest is expired (default: 64)

    PingConfig()
        : interval_ms(100)
        , timeout_ms(1000)
        , max_in_flight(64)
    {}

    /**
     * Defaults overridden by COV_PING_INTERVAL_MS / COV_PING_TIMEOUT_MS
     */
    static PingConfig from_env() {
        PingConfig c;
        if (const char* v = getenv("COV_PING_INTERVAL_MS")) {
            int ms = atoi(v);
            if (ms > 0) c.interval_ms = ms;
        }
        if (const char* v = getenv("COV_PING_TIMEOUT_MS")) {
            int ms = atoi(v);
            if (ms > 0) c.timeout_ms = ms;
        }
        return c;
    }
};

/**
 * Encode a ping request datagram
 */
inline std::vector<uint8_t> encode_request(uint32_t seq, const std::vector<uint8_t>& token) {
    std::vector<uint8_t> out(HEADER_SIZE + token.size());
    memcpy(out.data(), TAG_REQUEST, 4);
    store_be32(out.data() + 4, seq);
    if (!token.empty()) {
        memcpy(out.data() + HEADER_SIZE, token.data(), token.size());
    }
    return out;
}

enum class ReplyKind : uint8_t {
    Invalid = 0,
    Success,
    Error,
};

struct Reply {
    ReplyKind kind;
    uint32_t seq;
};

/**
 * Decode a reply datagram (trailing bytes after the header are ignored)
 */
inline Reply decode_reply(const uint8_t* data, size_t len) {
    if (len < HEADER_SIZE) {
        return {ReplyKind::Invalid, 0};
    }
    uint32_t seq = load_be32(data + 4);
    if (memcmp(data, TAG_REPLY, 4) == 0) {
        return {ReplyKind::Success, seq};
    }
    if (memcmp(data, TAG_ERROR, 4) == 0) {
        return {ReplyKind::Error, seq};
    }
    return {ReplyKind::Invalid, seq};
}

/**
 * Outstanding request: wall-clock stamp for reporting, monotonic stamp for
 * duration and timeout
 */
struct PendingRequest {
    Timestamp sent_at;
    Duration sent_mono;
};

/**
 * Finished ping request
 */
struct PingCompletion {
    uint32_t seq;
    Timestamp sent_at;
    Duration duration;  // valid when error == PingError::None
    PingError error;
};

template<typename Transport, typename Clock = RealClock>
class UdpPingSession {
public:
    explicit UdpPingSession(Clock& clock, PingConfig config = PingConfig())
        : clock_(clock)
        , config_(config)
        , next_seq_(1)
        , valid_(false)
    {}

    // Movable transports only (scripted transports in tests)
    UdpPingSession(Clock& clock, Transport transport, PingConfig config = PingConfig())
        : clock_(clock)
        , transport_(std::move(transport))
        , config_(config)
        , next_seq_(1)
        , valid_(false)
    {}

    ~UdpPingSession() {
        transport_.close();
    }

    UdpPingSession(const UdpPingSession&) = delete;
    UdpPingSession& operator=(const UdpPingSession&) = delete;

    /**
     * Open the transport for the issued credentials
     *
     * @throws std::runtime_error if the token is not Base64 or the transport fails to open
     */
    void start(const SessionCredentials& credentials) {
        auto token = base64_decode(credentials.ping_token);
        if (!token) {
            throw std::runtime_error("ping token is not valid Base64");
        }
        token_ = std::move(*token);

        transport_.open(credentials.ping_host.c_str(), credentials.ping_port, credentials.ip_version);

        std::random_device rd;
        next_seq_ = static_cast<uint32_t>(rd());
        if (next_seq_ == 0) next_seq_ = 1;

        pending_.clear();
        completions_.clear();
        valid_ = true;
        test_uuid_ = credentials.test_uuid;
        printf("[UDP Ping] Session %s started, %s:%u\n", test_uuid_.c_str(),
               credentials.ping_host.c_str(), credentials.ping_port);
    }

    /**
     * Send one ping request stamped with the current clock
     *
     * A transport failure completes the request immediately with NetworkIssue.
     *
     * @return Sequence number of the request
     */
    uint32_t send_ping() {
        Timestamp now = clock_.now();
        Duration mono = clock_.monotonic_us();
        uint32_t seq = allocate_seq();

        if (pending_.size() >= config_.max_in_flight) {
            auto oldest = pending_.begin();
            for (auto it = pending_.begin(); it != pending_.end(); ++it) {
                if (it->second.sent_mono < oldest->second.sent_mono) oldest = it;
            }
            complete(oldest->first, oldest->second.sent_at, 0, PingError::TimedOut);
            pending_.erase(oldest);
        }

        auto datagram = encode_request(seq, token_);
        ssize_t n = transport_.send(datagram.data(), datagram.size());
        if (n < 0 || static_cast<size_t>(n) != datagram.size()) {
            DEBUG_PRINT("[UDP Ping] send seq=%u failed: %s\n", seq, strerror(errno));
            complete(seq, now, 0, PingError::NetworkIssue);
            return seq;
        }

        pending_[seq] = PendingRequest{now, mono};
        DEBUG_PRINT("[UDP Ping] sent seq=%u\n", seq);
        return seq;
    }

    /**
     * Wait up to timeout_ms for replies and process every queued datagram
     *
     * @return Number of datagrams processed
     */
    size_t poll(int timeout_ms) {
        if (!transport_.is_open()) {
            return 0;
        }
        if (transport_.wait_readable(timeout_ms) <= 0) {
            return 0;
        }

        size_t processed = 0;
        int errors = 0;
        uint8_t buf[MAX_DATAGRAM];
        for (;;) {
            ssize_t n = transport_.recv(buf, sizeof(buf));
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || ++errors > 8) {
                    break;
                }
                // ICMP port unreachable surfaces here on connected UDP; keep draining
                DEBUG_PRINT("[UDP Ping] recv failed: %s\n", strerror(errno));
                continue;
            }
            process_datagram(buf, static_cast<size_t>(n));
            ++processed;
        }
        return processed;
    }

    /**
     * Match one reply datagram against pending requests
     */
    void process_datagram(const uint8_t* data, size_t len) {
        Duration mono = clock_.monotonic_us();
        Reply reply = decode_reply(data, len);

        switch (reply.kind) {
            case ReplyKind::Success: {
                auto it = pending_.find(reply.seq);
                if (it == pending_.end()) {
                    DEBUG_PRINT("[UDP Ping] unmatched RR01 seq=%u ignored\n", reply.seq);
                    return;
                }
                complete(it->first, it->second.sent_at, mono - it->second.sent_mono,
                         PingError::None);
                pending_.erase(it);
                return;
            }
            case ReplyKind::Error: {
                valid_ = false;
                auto it = pending_.find(reply.seq);
                if (it != pending_.end()) {
                    complete(it->first, it->second.sent_at, 0, PingError::NeedsReinitialization);
                    pending_.erase(it);
                } else {
                    fail_all_pending(PingError::NeedsReinitialization);
                }
                printf("[UDP Ping] Session %s rejected by server (RE01 seq=%u)\n",
                       test_uuid_.c_str(), reply.seq);
                return;
            }
            case ReplyKind::Invalid:
                DEBUG_PRINT("[UDP Ping] malformed datagram (%zu bytes) ignored\n", len);
                return;
        }
    }

    /**
     * Fail every request older than the timeout with TimedOut
     */
    void expire() {
        Duration mono = clock_.monotonic_us();
        Duration timeout = ms_to_us(config_.timeout_ms);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (mono - it->second.sent_mono >= timeout) {
                complete(it->first, it->second.sent_at, 0, PingError::TimedOut);
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }

    /**
     * Fail every pending request (session discarded or stopped)
     */
    void fail_all_pending(PingError error) {
        for (const auto& [seq, request] : pending_) {
            complete(seq, request.sent_at, 0, error);
        }
        pending_.clear();
    }

    std::vector<PingCompletion> drain_completions() {
        std::vector<PingCompletion> out;
        out.swap(completions_);
        return out;
    }

    void stop() {
        transport_.interrupt();
        transport_.close();
        fail_all_pending(PingError::NetworkIssue);
        valid_ = false;
    }

    bool is_valid() const { return valid_; }
    size_t pending_count() const { return pending_.size(); }
    const std::string& test_uuid() const { return test_uuid_; }
    Transport& transport() { return transport_; }

private:
    uint32_t allocate_seq() {
        uint32_t seq = next_seq_++;
        if (next_seq_ == 0) next_seq_ = 1;  // zero is reserved for session-wide RE01
        return seq;
    }

    void complete(uint32_t seq, Timestamp sent_at, Duration duration, PingError error) {
        completions_.push_back({seq, sent_at, duration, error});
    }

    Clock& clock_;
    Transport transport_;
    PingConfig config_;
    std::vector<uint8_t> token_;
    std::string test_uuid_;
    std::map<uint32_t, PendingRequest> pending_;
    std::vector<PingCompletion> completions_;
    uint32_t next_seq_;
    bool valid_;
};

} // namespace ping
} // namespace coverage
