// test/unittest/test_udp_socket.cpp
// UdpSocket and UdpPingSession against a real UDP responder on 127.0.0.1

#include "ping/udp_ping_session.hpp"
#include "transport/udp_socket.hpp"
#include "test_harness.hpp"
#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace coverage;
using namespace coverage::ping;

// Helper: blocking UDP responder bound to an ephemeral loopback port
struct Responder {
    int fd;
    uint16_t port;
    std::vector<uint8_t> token;
    std::atomic<bool> running;
    std::atomic<int> requests;
    bool reject;
    std::thread thread;

    explicit Responder(std::vector<uint8_t> t, bool reject_all = false)
        : fd(-1), port(0), token(std::move(t)), running(true), requests(0), reject(reject_all) {
        fd = socket(AF_INET, SOCK_DGRAM, 0);
        if (fd < 0) throw std::runtime_error("socket() failed");

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(fd);
            throw std::runtime_error("bind() failed");
        }
        socklen_t len = sizeof(addr);
        getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len);
        port = ntohs(addr.sin_port);

        struct timeval tv = {0, 50000};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        thread = std::thread([this]() { serve(); });
    }

    ~Responder() {
        running.store(false);
        if (thread.joinable()) thread.join();
        close(fd);
    }

    void serve() {
        uint8_t buf[MAX_DATAGRAM];
        while (running.load()) {
            struct sockaddr_storage peer;
            socklen_t peer_len = sizeof(peer);
            ssize_t n = recvfrom(fd, buf, sizeof(buf), 0, reinterpret_cast<struct sockaddr*>(&peer), &peer_len);
            if (n < static_cast<ssize_t>(HEADER_SIZE) || memcmp(buf, TAG_REQUEST, 4) != 0) continue;
            requests.fetch_add(1);

            bool ok = !reject && static_cast<size_t>(n) - HEADER_SIZE == token.size() &&
                      memcmp(buf + HEADER_SIZE, token.data(), token.size()) == 0;
            uint8_t out[HEADER_SIZE];
            memcpy(out, ok ? TAG_REPLY : TAG_ERROR, 4);
            memcpy(out + 4, buf + 4, 4);
            sendto(fd, out, sizeof(out), 0, reinterpret_cast<struct sockaddr*>(&peer), peer_len);
        }
    }
};

static const std::vector<uint8_t> TOKEN = {'s', 'e', 'c', 'r', 'e', 't'};

static SessionCredentials credentials(uint16_t port, const std::vector<uint8_t>& token) {
    SessionCredentials c;
    c.test_uuid = "udp-test";
    c.ping_token = base64_encode(token.data(), token.size());
    c.ping_host = "127.0.0.1";
    c.ping_port = port;
    c.ip_version = IpVersion::V4;
    return c;
}

TEST(open_send_receive) {
    Responder server(TOKEN);
    transport::UdpSocket<> sock;
    sock.open("127.0.0.1", server.port, IpVersion::V4);
    ASSERT_TRUE(sock.is_open());

    auto req = encode_request(5, TOKEN);
    ASSERT_EQ(sock.send(req.data(), req.size()), static_cast<ssize_t>(req.size()));

    ASSERT_EQ(sock.wait_readable(2000), 1);
    uint8_t buf[64];
    ssize_t n = sock.recv(buf, sizeof(buf));
    ASSERT_EQ(n, static_cast<ssize_t>(HEADER_SIZE));
    Reply r = decode_reply(buf, static_cast<size_t>(n));
    ASSERT_TRUE(r.kind == ReplyKind::Success);
    ASSERT_EQ(r.seq, 5u);

    // Nothing further queued
    ASSERT_EQ(sock.recv(buf, sizeof(buf)), -1);
}

TEST(wait_times_out) {
    Responder server(TOKEN);
    transport::UdpSocket<> sock;
    sock.open("127.0.0.1", server.port, IpVersion::V4);

    auto start = std::chrono::steady_clock::now();
    ASSERT_EQ(sock.wait_readable(50), 0);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    ASSERT_GT(ms, 40);
}

TEST(interrupt_resolves_wait) {
    Responder server(TOKEN);
    transport::UdpSocket<> sock;
    sock.open("127.0.0.1", server.port, IpVersion::V4);

    std::thread waker([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        sock.interrupt();
    });

    auto start = std::chrono::steady_clock::now();
    int r = sock.wait_readable(5000);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    waker.join();

    ASSERT_EQ(r, -1);
    ASSERT_LT(ms, 2000);

    // Interrupt is consumed: the next wait behaves normally
    ASSERT_EQ(sock.wait_readable(10), 0);
}

TEST(closed_socket) {
    transport::UdpSocket<> sock;
    ASSERT_FALSE(sock.is_open());
    ASSERT_EQ(sock.wait_readable(0), -1);
    uint8_t b = 0;
    ASSERT_EQ(sock.send(&b, 1), -1);
}

TEST(open_unresolvable_host_throws) {
    transport::UdpSocket<> sock;
    ASSERT_THROWS(sock.open("no-such-host.invalid", 444, IpVersion::Any), std::runtime_error);
    ASSERT_FALSE(sock.is_open());
}

TEST(ping_session_round_trip) {
    Responder server(TOKEN);
    RealClock clock;
    UdpPingSession<transport::UdpSocket<>, RealClock> session(clock);
    session.start(credentials(server.port, TOKEN));

    for (int i = 0; i < 5; ++i) {
        session.send_ping();
    }

    std::vector<PingCompletion> done;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (done.size() < 5 && std::chrono::steady_clock::now() < deadline) {
        session.poll(100);
        for (const auto& c : session.drain_completions()) done.push_back(c);
    }

    ASSERT_EQ(done.size(), 5u);
    for (const auto& c : done) {
        ASSERT_TRUE(c.error == PingError::None);
        ASSERT_TRUE(c.duration >= 0);
        ASSERT_LT(c.duration, sec_to_us(3));
    }
    ASSERT_TRUE(session.is_valid());
    ASSERT_EQ(server.requests.load(), 5);
}

TEST(ping_session_wrong_token_needs_reinit) {
    Responder server(TOKEN);
    RealClock clock;
    UdpPingSession<transport::UdpSocket<>, RealClock> session(clock);
    session.start(credentials(server.port, {'w', 'r', 'o', 'n', 'g'}));

    session.send_ping();

    std::vector<PingCompletion> done;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (done.empty() && std::chrono::steady_clock::now() < deadline) {
        session.poll(100);
        done = session.drain_completions();
    }

    ASSERT_EQ(done.size(), 1u);
    ASSERT_TRUE(done[0].error == PingError::NeedsReinitialization);
    ASSERT_FALSE(session.is_valid());
}

int main() {
    return run_all_tests("UdpSocket");
}
