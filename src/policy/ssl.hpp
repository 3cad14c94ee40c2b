// policy/ssl.hpp
// SSL/TLS Policy for the control-server connection
//
//   - OpenSSLPolicy: OpenSSL / LibreSSL (same API), TLS 1.2+ client
//   - NoSSLPolicy:   plaintext pass-through (local control servers, tests)
//
// All policies conform to the SSLPolicyConcept interface:
//   - void init()
//   - void set_hostname(const char* host)
//   - void handshake(int fd)
//   - ssize_t read(void* buf, size_t len)
//   - ssize_t write(const void* buf, size_t len)
//   - int get_fd() const
//   - void shutdown()
//
// Namespace: coverage::ssl

#pragma once

#include <stdexcept>
#include <cstdio>
#include <cstring>
#include <string>
#include <sys/types.h>
#include <sys/socket.h>

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

namespace coverage {
namespace ssl {

// ============================================================================
// OpenSSL Policy
// ============================================================================

/**
 * OpenSSLPolicy - OpenSSL client implementation
 *
 * Peer verification uses the system trust store and is on by default; it can
 * be disabled for self-signed test deployments (COV_CONTROL_INSECURE=1).
 *
 * Thread safety: Not thread-safe (one connection per instance)
 */
struct OpenSSLPolicy {
    OpenSSLPolicy() : ctx_(nullptr), ssl_(nullptr), verify_peer_(true) {}

    ~OpenSSLPolicy() {
        shutdown();
    }

    // Prevent copying
    OpenSSLPolicy(const OpenSSLPolicy&) = delete;
    OpenSSLPolicy& operator=(const OpenSSLPolicy&) = delete;

    // Allow moving
    OpenSSLPolicy(OpenSSLPolicy&& other) noexcept
        : ctx_(other.ctx_)
        , ssl_(other.ssl_)
        , hostname_(std::move(other.hostname_))
        , verify_peer_(other.verify_peer_)
    {
        other.ctx_ = nullptr;
        other.ssl_ = nullptr;
    }

    OpenSSLPolicy& operator=(OpenSSLPolicy&& other) noexcept {
        if (this != &other) {
            shutdown();
            ctx_ = other.ctx_;
            ssl_ = other.ssl_;
            hostname_ = std::move(other.hostname_);
            verify_peer_ = other.verify_peer_;
            other.ctx_ = nullptr;
            other.ssl_ = nullptr;
        }
        return *this;
    }

    /**
     * Initialize SSL context
     *
     * @throws std::runtime_error if initialization fails
     */
    void init() {
        const SSL_METHOD* method = TLS_client_method();
        ctx_ = SSL_CTX_new(method);

        if (!ctx_) {
            throw std::runtime_error("SSL_CTX_new() failed");
        }

        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        if (verify_peer_) {
            if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
                printf("[WARN] SSL_CTX_set_default_verify_paths() failed, peer verification may fail\n");
            }
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        } else {
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
        }
    }

    void set_verify_peer(bool verify) {
        verify_peer_ = verify;
    }

    /**
     * Hostname used for SNI and certificate name checks
     */
    void set_hostname(const char* host) {
        hostname_ = host ? host : "";
    }

    /**
     * Perform TLS handshake (blocking)
     *
     * @param fd Connected socket file descriptor
     * @throws std::runtime_error if handshake fails
     */
    void handshake(int fd) {
        ssl_ = SSL_new(ctx_);
        if (!ssl_) {
            throw std::runtime_error("SSL_new() failed");
        }

        if (SSL_set_fd(ssl_, fd) != 1) {
            throw std::runtime_error("SSL_set_fd() failed");
        }

        if (!hostname_.empty()) {
            SSL_set_tlsext_host_name(ssl_, hostname_.c_str());
            if (verify_peer_) {
                SSL_set_hostflags(ssl_, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
                if (SSL_set1_host(ssl_, hostname_.c_str()) != 1) {
                    throw std::runtime_error("SSL_set1_host() failed");
                }
            }
        }

        int ret = SSL_connect(ssl_);
        if (ret != 1) {
            unsigned long err = ERR_get_error();
            char err_buf[256];
            ERR_error_string_n(err, err_buf, sizeof(err_buf));
            throw std::runtime_error(std::string("SSL_connect() failed: ") + err_buf);
        }
    }

    /**
     * Read decrypted data
     *
     * @return Number of bytes read, 0 on connection close, -1 on error
     */
    ssize_t read(void* buf, size_t len) {
        if (!ssl_) return -1;

        int n = SSL_read(ssl_, buf, static_cast<int>(len));
        if (n > 0) {
            return n;
        }
        int err = SSL_get_error(ssl_, n);
        if (err == SSL_ERROR_ZERO_RETURN) {
            return 0;  // Clean close_notify
        }
        return -1;
    }

    /**
     * Write data to be encrypted
     *
     * @return Number of bytes written, -1 on error
     */
    ssize_t write(const void* buf, size_t len) {
        if (!ssl_) return -1;

        int n = SSL_write(ssl_, buf, static_cast<int>(len));
        if (n > 0) {
            return n;
        }
        return -1;
    }

    int get_fd() const {
        if (!ssl_) return -1;
        return SSL_get_fd(ssl_);
    }

    /**
     * Shutdown SSL connection and free resources
     */
    void shutdown() {
        if (ssl_) {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }

        if (ctx_) {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    static constexpr const char* name() {
        return "OpenSSL";
    }

    SSL_CTX* ctx_;
    SSL* ssl_;
    std::string hostname_;
    bool verify_peer_;
};

// ============================================================================
// No-SSL Policy (plaintext)
// ============================================================================

/**
 * NoSSLPolicy - plaintext pass-through over the socket fd
 */
struct NoSSLPolicy {
    NoSSLPolicy() : fd_(-1) {}

    void init() {}
    void set_hostname(const char*) {}
    void set_verify_peer(bool) {}

    void handshake(int fd) {
        fd_ = fd;
    }

    ssize_t read(void* buf, size_t len) {
        if (fd_ < 0) return -1;
        return ::recv(fd_, buf, len, 0);
    }

    ssize_t write(const void* buf, size_t len) {
        if (fd_ < 0) return -1;
        return ::send(fd_, buf, len, MSG_NOSIGNAL);
    }

    int get_fd() const {
        return fd_;
    }

    void shutdown() {
        fd_ = -1;
    }

    static constexpr const char* name() {
        return "plaintext";
    }

    int fd_;
};

} // namespace ssl
} // namespace coverage

// ============================================================================
// SSL Policy Concepts (C++20)
// ============================================================================

#if __cplusplus >= 202002L
#include <concepts>

namespace coverage {

template<typename T>
concept SSLPolicyConcept = requires(T ssl, int fd, void* buf, const char* host, size_t len) {
    { ssl.init() } -> std::same_as<void>;
    { ssl.set_hostname(host) } -> std::same_as<void>;
    { ssl.handshake(fd) } -> std::same_as<void>;
    { ssl.read(buf, len) } -> std::convertible_to<ssize_t>;
    { ssl.write(buf, len) } -> std::convertible_to<ssize_t>;
    { ssl.get_fd() } -> std::convertible_to<int>;
    { ssl.shutdown() } -> std::same_as<void>;
};

static_assert(SSLPolicyConcept<ssl::OpenSSLPolicy>);
static_assert(SSLPolicyConcept<ssl::NoSSLPolicy>);

} // namespace coverage

#endif // C++20
