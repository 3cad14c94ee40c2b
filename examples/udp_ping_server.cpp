// examples/udp_ping_server.cpp
// Reference UDP ping server for local measurements
//
// This example shows:
// - Binding a dual-stack datagram socket
// - Waiting for requests with the event policy
// - Answering RP01 requests with RR01 (known token) or RE01 (unknown token)
// - Clean shutdown
//
// Usage:
//   udp_ping_server <port> <base64-token> [reject-after]
//
//   reject-after  answer RE01 once this many requests were served, forcing
//                 clients to request a new token

#include "core/encoding.hpp"
#include "ping/udp_ping_session.hpp"
#include "policy/event.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace coverage;

static std::atomic<bool> g_running{true};

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_running.store(false);
    }
}

// Helper: non-blocking dual-stack datagram socket bound to port
int create_udp_socket(uint16_t port) {
    int fd = socket(AF_INET6, SOCK_DGRAM | SOCK_NONBLOCK, 0);
    if (fd < 0) {
        perror("socket");
        return -1;
    }

    int off = 0;
    setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &off, sizeof(off));
    int on = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

    struct sockaddr_in6 addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin6_family = AF_INET6;
    addr.sin6_addr = in6addr_any;
    addr.sin6_port = htons(port);

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        perror("bind");
        close(fd);
        return -1;
    }
    return fd;
}

// Build the reply for one request datagram, empty if it must be ignored
std::vector<uint8_t> make_reply(const uint8_t* data, size_t len, const std::vector<uint8_t>& token,
                                bool reject) {
    if (len < ping::HEADER_SIZE || memcmp(data, ping::TAG_REQUEST, 4) != 0) {
        return {};
    }
    uint32_t seq = load_be32(data + 4);

    bool token_ok = len - ping::HEADER_SIZE == token.size() &&
                    memcmp(data + ping::HEADER_SIZE, token.data(), token.size()) == 0;

    std::vector<uint8_t> reply(ping::HEADER_SIZE);
    memcpy(reply.data(), (token_ok && !reject) ? ping::TAG_REPLY : ping::TAG_ERROR, 4);
    store_be32(reply.data() + 4, seq);
    return reply;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        fprintf(stderr, "Usage: %s <port> <base64-token> [reject-after]\n", argv[0]);
        return 1;
    }

    uint16_t port = static_cast<uint16_t>(atoi(argv[1]));
    auto token = base64_decode(argv[2]);
    if (!token) {
        fprintf(stderr, "Token is not valid Base64\n");
        return 1;
    }
    long reject_after = argc > 3 ? atol(argv[3]) : -1;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    int fd = create_udp_socket(port);
    if (fd < 0) {
        return 1;
    }

    DefaultEventPolicy event;
    try {
        event.init();
        event.add_read(fd);
    } catch (const std::exception& e) {
        fprintf(stderr, "Event policy setup failed: %s\n", e.what());
        close(fd);
        return 1;
    }
    event.set_wait_timeout(200);

    printf("UDP ping server on port %u (%s), %zu-byte token\n", port, event.name(), token->size());

    long served = 0;
    long rejected = 0;
    uint8_t buf[ping::MAX_DATAGRAM];

    while (g_running.load()) {
        int n = event.wait_with_timeout();
        if (n <= 0) {
            continue;
        }

        // Edge-triggered: drain until EAGAIN
        for (;;) {
            struct sockaddr_storage peer;
            socklen_t peer_len = sizeof(peer);
            ssize_t len = recvfrom(fd, buf, sizeof(buf), 0, reinterpret_cast<struct sockaddr*>(&peer), &peer_len);
            if (len < 0) {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    perror("recvfrom");
                }
                break;
            }

            bool reject = reject_after >= 0 && served >= reject_after;
            auto reply = make_reply(buf, static_cast<size_t>(len), *token, reject);
            if (reply.empty()) {
                continue;
            }
            if (memcmp(reply.data(), ping::TAG_REPLY, 4) == 0) {
                ++served;
            } else {
                ++rejected;
            }

            if (sendto(fd, reply.data(), reply.size(), 0, reinterpret_cast<struct sockaddr*>(&peer), peer_len) < 0) {
                perror("sendto");
            }
        }
    }

    printf("\nShutting down: %ld replies, %ld rejections\n", served, rejected);
    close(fd);
    return 0;
}
