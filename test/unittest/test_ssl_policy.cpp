// test/unittest/test_ssl_policy.cpp
// Unit tests for the control-server SSL policies
//
//   OpenSSLPolicy: context setup, verification flag, failed handshake, move
//   NoSSLPolicy:   plaintext pass-through over a socketpair

#include "../../src/policy/ssl.hpp"
#include <iostream>
#include <csignal>
#include <cstring>
#include <vector>
#include <sys/socket.h>
#include <unistd.h>

using namespace coverage::ssl;

int tests_passed = 0;
int tests_failed = 0;

#define TEST(name) \
    std::cout << "Testing " << name << "... "; \
    try {

#define END_TEST \
        std::cout << "✅ PASS" << std::endl; \
        tests_passed++; \
    } catch (const std::exception& e) { \
        std::cout << "❌ FAIL: " << e.what() << std::endl; \
        tests_failed++; \
    }

#define ASSERT(condition, msg) \
    if (!(condition)) throw std::runtime_error(msg);

// Helper: connected AF_UNIX stream pair, closed on scope exit
struct SocketPair {
    int fds[2];

    SocketPair() {
        if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
            throw std::runtime_error("socketpair() failed");
        }
    }

    ~SocketPair() {
        if (fds[0] >= 0) ::close(fds[0]);
        if (fds[1] >= 0) ::close(fds[1]);
    }
};

// ============================================================================
// NoSSLPolicy Tests
// ============================================================================

void test_nossl_name() {
    TEST("NoSSLPolicy::name()")
        ASSERT(strcmp(NoSSLPolicy::name(), "plaintext") == 0, "Name should be plaintext");
    END_TEST
}

void test_nossl_before_handshake() {
    TEST("NoSSLPolicy I/O before handshake")
        NoSSLPolicy policy;
        policy.init();
        uint8_t buf[8];
        ASSERT(policy.get_fd() == -1, "No fd before handshake");
        ASSERT(policy.read(buf, sizeof(buf)) == -1, "Read should fail");
        ASSERT(policy.write(buf, sizeof(buf)) == -1, "Write should fail");
    END_TEST
}

void test_nossl_pass_through() {
    TEST("NoSSLPolicy read/write pass-through")
        SocketPair sp;
        NoSSLPolicy policy;
        policy.init();
        policy.set_hostname("control.example.net");
        policy.handshake(sp.fds[0]);
        ASSERT(policy.get_fd() == sp.fds[0], "fd should be the handshake fd");

        const char request[] = "POST /coverageRequest HTTP/1.1\r\n\r\n";
        ssize_t n = policy.write(request, sizeof(request) - 1);
        ASSERT(n == static_cast<ssize_t>(sizeof(request) - 1), "Write should send everything");

        char peer_buf[64] = {};
        ssize_t got = ::recv(sp.fds[1], peer_buf, sizeof(peer_buf), 0);
        ASSERT(got == n, "Peer should receive the bytes");
        ASSERT(memcmp(peer_buf, request, static_cast<size_t>(got)) == 0, "Bytes should match");

        const char reply[] = "HTTP/1.1 200 OK\r\n";
        ::send(sp.fds[1], reply, sizeof(reply) - 1, 0);
        char buf[64] = {};
        ssize_t r = policy.read(buf, sizeof(buf));
        ASSERT(r == static_cast<ssize_t>(sizeof(reply) - 1), "Read should return the reply");
        ASSERT(memcmp(buf, reply, static_cast<size_t>(r)) == 0, "Reply should match");
    END_TEST
}

void test_nossl_peer_close() {
    TEST("NoSSLPolicy read after peer close")
        SocketPair sp;
        NoSSLPolicy policy;
        policy.handshake(sp.fds[0]);
        ::close(sp.fds[1]);
        sp.fds[1] = -1;

        char buf[8];
        ASSERT(policy.read(buf, sizeof(buf)) == 0, "Read should report EOF");
    END_TEST
}

void test_nossl_shutdown() {
    TEST("NoSSLPolicy::shutdown()")
        SocketPair sp;
        NoSSLPolicy policy;
        policy.handshake(sp.fds[0]);
        policy.shutdown();
        ASSERT(policy.get_fd() == -1, "fd should be released");
        char c = 'x';
        ASSERT(policy.write(&c, 1) == -1, "Write after shutdown should fail");
    END_TEST
}

// ============================================================================
// OpenSSLPolicy Tests
// ============================================================================

void test_openssl_name() {
    TEST("OpenSSLPolicy::name()")
        ASSERT(strcmp(OpenSSLPolicy::name(), "OpenSSL") == 0, "Name should be OpenSSL");
    END_TEST
}

void test_openssl_init() {
    TEST("OpenSSLPolicy::init()")
        OpenSSLPolicy policy;
        policy.init();
        ASSERT(policy.ctx_ != nullptr, "SSL_CTX should be created");
        ASSERT(policy.ssl_ == nullptr, "No SSL object before handshake");
        ASSERT(SSL_CTX_get_verify_mode(policy.ctx_) == SSL_VERIFY_PEER, "Peer verification on by default");
        ASSERT(SSL_CTX_get_min_proto_version(policy.ctx_) == TLS1_2_VERSION, "TLS 1.2 minimum");
    END_TEST
}

void test_openssl_verify_disabled() {
    TEST("OpenSSLPolicy::set_verify_peer(false)")
        OpenSSLPolicy policy;
        policy.set_verify_peer(false);
        policy.init();
        ASSERT(SSL_CTX_get_verify_mode(policy.ctx_) == SSL_VERIFY_NONE, "Verification should be off");
    END_TEST
}

void test_openssl_before_handshake() {
    TEST("OpenSSLPolicy I/O before handshake")
        OpenSSLPolicy policy;
        policy.init();
        uint8_t buf[8];
        ASSERT(policy.read(buf, sizeof(buf)) == -1, "Read should fail");
        ASSERT(policy.write(buf, sizeof(buf)) == -1, "Write should fail");
        ASSERT(policy.get_fd() == -1, "No fd before handshake");
    END_TEST
}

void test_openssl_handshake_rejects_plaintext_peer() {
    TEST("OpenSSLPolicy::handshake() against a plaintext peer")
        SocketPair sp;
        const char garbage[] = "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\n\r\n";
        ::send(sp.fds[1], garbage, sizeof(garbage) - 1, 0);

        OpenSSLPolicy policy;
        policy.set_verify_peer(false);
        policy.init();
        policy.set_hostname("control.example.net");

        bool threw = false;
        try {
            policy.handshake(sp.fds[0]);
        } catch (const std::runtime_error& e) {
            threw = strstr(e.what(), "SSL_connect") != nullptr;
        }
        ASSERT(threw, "Handshake should throw SSL_connect failure");
    END_TEST
}

void test_openssl_move() {
    TEST("OpenSSLPolicy move constructor")
        OpenSSLPolicy a;
        a.init();
        SSL_CTX* ctx = a.ctx_;
        OpenSSLPolicy b(std::move(a));
        ASSERT(b.ctx_ == ctx, "Context should move");
        ASSERT(a.ctx_ == nullptr, "Source should be empty");
    END_TEST
}

void test_openssl_shutdown_idempotent() {
    TEST("OpenSSLPolicy::shutdown() twice")
        OpenSSLPolicy policy;
        policy.init();
        policy.shutdown();
        policy.shutdown();
        ASSERT(policy.ctx_ == nullptr, "Context should be freed");
    END_TEST
}

int main() {
    // A failed handshake may write to a socket the peer no longer reads
    signal(SIGPIPE, SIG_IGN);

    std::cout << "========================================" << std::endl;
    std::cout << "SSL Policy Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    std::cout << "\n--- NoSSLPolicy Tests ---" << std::endl;
    test_nossl_name();
    test_nossl_before_handshake();
    test_nossl_pass_through();
    test_nossl_peer_close();
    test_nossl_shutdown();

    std::cout << "\n--- OpenSSLPolicy Tests ---" << std::endl;
    test_openssl_name();
    test_openssl_init();
    test_openssl_verify_disabled();
    test_openssl_before_handshake();
    test_openssl_handshake_rejects_plaintext_peer();
    test_openssl_move();
    test_openssl_shutdown_idempotent();

    std::cout << "\n========================================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, " << tests_failed << " failed" << std::endl;
    std::cout << "========================================" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
