// src/transport/transport_policy.hpp
// Transport Policy Requirements (Compile-time polymorphism)
//
// Two transport shapes are used:
//
// Datagram transport (UDP ping protocol), duck-typed and checked by
// DatagramTransportConcept:
//   struct SomeDatagramTransport {
//       void open(const char* host, uint16_t port, IpVersion version);
//       void close();
//       bool is_open() const;
//       ssize_t send(const void* data, size_t len);   // -1 on failure
//       ssize_t recv(void* buffer, size_t len);       // -1 + EAGAIN when empty
//       int wait_readable(int timeout_ms);            // 1 ready, 0 timeout, -1 error/closed
//   };
//
// Stream transport (control-server HTTP), composed by TransportPolicy from a
// stream socket and an SSL policy.

#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <sys/types.h>

namespace coverage {

/**
 * IP version requested by the control server for the ping host
 */
enum class IpVersion : uint8_t {
    Any = 0,
    V4 = 4,
    V6 = 6,
};

inline const char* ip_version_name(IpVersion v) {
    switch (v) {
        case IpVersion::V4: return "IPv4";
        case IpVersion::V6: return "IPv6";
        default: return "any";
    }
}

namespace transport {

/**
 * TransportPolicy - stream socket + SSL policy
 *
 * Template Parameters:
 *   SocketType - Stream socket (TcpSocket)
 *   SSLPolicy  - SSL policy (OpenSSLPolicy, NoSSLPolicy)
 *
 * Usage:
 *   TransportPolicy<TcpSocket, OpenSSLPolicy> transport;
 *   transport.init();
 *   transport.connect("control.example.net", 443);
 *   transport.ssl_handshake();
 *   transport.ssl_send(data, len);
 *   transport.ssl_recv(buffer, len);
 */
template<typename SocketType, typename SSLPolicy>
struct TransportPolicy {
    SocketType socket;
    SSLPolicy ssl;
    bool ssl_initialized;

    TransportPolicy() : ssl_initialized(false) {}

    ~TransportPolicy() {
        close();
    }

    TransportPolicy(const TransportPolicy&) = delete;
    TransportPolicy& operator=(const TransportPolicy&) = delete;

    template<typename... Args>
    void init(Args&&... args) {
        socket.init(std::forward<Args>(args)...);
        ssl.init();
    }

    void connect(const char* host, uint16_t port) {
        socket.connect(host, port);
        ssl.set_hostname(host);
    }

    void close() {
        if (ssl_initialized) {
            ssl.shutdown();
        }
        socket.close();
        ssl_initialized = false;
    }

    bool is_connected() const {
        return socket.is_connected();
    }

    /**
     * @throws std::runtime_error if the handshake fails
     */
    void ssl_handshake() {
        ssl.handshake(socket.get_fd());
        ssl_initialized = true;
    }

    ssize_t ssl_send(const void* data, size_t len) {
        if (!ssl_initialized) {
            return -1;
        }
        return ssl.write(data, len);
    }

    ssize_t ssl_recv(void* buffer, size_t len) {
        if (!ssl_initialized) {
            return -1;
        }
        return ssl.read(buffer, len);
    }

    int get_fd() const {
        return socket.get_fd();
    }
};

} // namespace transport
} // namespace coverage

#if __cplusplus >= 202002L
#include <concepts>

namespace coverage {

template<typename T>
concept DatagramTransportConcept = requires(T t, const char* host, uint16_t port, IpVersion v,
                                            const void* cdata, void* buf, size_t len, int timeout) {
    { t.open(host, port, v) } -> std::same_as<void>;
    { t.close() } -> std::same_as<void>;
    { t.is_open() } -> std::convertible_to<bool>;
    { t.send(cdata, len) } -> std::convertible_to<ssize_t>;
    { t.recv(buf, len) } -> std::convertible_to<ssize_t>;
    { t.wait_readable(timeout) } -> std::convertible_to<int>;
};

} // namespace coverage

#endif // C++20
