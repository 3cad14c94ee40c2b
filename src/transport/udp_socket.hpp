// src/transport/udp_socket.hpp
// Connected UDP socket for the ping protocol
//
// Policy-based design: No inheritance, no virtual functions.
// The EventPolicy (epoll/select) drives wait_readable(); an extra eventfd lets
// another thread interrupt a pending wait so a stalled receive is always
// resolved instead of leaked.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdio>
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <netdb.h>
#include <errno.h>
#include <cstring>
#include <string>
#include <stdexcept>

#include "transport_policy.hpp"
#include "../policy/event.hpp"

namespace coverage {
namespace transport {

/**
 * UdpSocket - connected, non-blocking datagram socket
 *
 * At most one receive-await may be outstanding: a second concurrent
 * wait_readable() call fails immediately with -1.
 */
template<typename EventPolicy = DefaultEventPolicy>
struct UdpSocket {
    UdpSocket()
        : fd_(-1)
        , wake_fd_(-1)
        , waiting_(false)
        , interrupted_(false)
    {}

    ~UdpSocket() {
        close();
    }

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    /**
     * Resolve host and connect the datagram socket
     *
     * @param version IpVersion::V4 / V6 restricts resolution, Any takes the first result
     * @throws std::runtime_error on resolution or socket failure
     */
    void open(const char* host, uint16_t port, IpVersion version = IpVersion::Any) {
        close();

        struct addrinfo hints = {};
        struct addrinfo* result = nullptr;
        hints.ai_family = version == IpVersion::V4 ? AF_INET
                        : version == IpVersion::V6 ? AF_INET6
                        : AF_UNSPEC;
        hints.ai_socktype = SOCK_DGRAM;

        char port_str[8];
        snprintf(port_str, sizeof(port_str), "%u", port);

        int ret = getaddrinfo(host, port_str, &hints, &result);
        if (ret != 0) {
            throw std::runtime_error(std::string("getaddrinfo() failed: ") + gai_strerror(ret));
        }

        if (!result || !result->ai_addr) {
            if (result) freeaddrinfo(result);
            throw std::runtime_error("getaddrinfo() returned invalid result");
        }

        fd_ = ::socket(result->ai_family, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (fd_ < 0) {
            freeaddrinfo(result);
            throw std::runtime_error(std::string("socket() failed: ") + strerror(errno));
        }

        // Connected UDP: kernel filters foreign datagrams and reports ICMP errors
        ret = ::connect(fd_, result->ai_addr, result->ai_addrlen);
        int family = result->ai_family;
        freeaddrinfo(result);
        if (ret < 0) {
            int err = errno;
            close();
            throw std::runtime_error(std::string("connect() failed: ") + strerror(err));
        }

        wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wake_fd_ < 0) {
            close();
            throw std::runtime_error("eventfd() failed");
        }

        event_.init();
        event_.add_read(fd_);
        event_.add_read(wake_fd_);
        interrupted_.store(false, std::memory_order_release);

        printf("[UDP Socket] Connected to %s:%u (%s, %s)\n", host, port,
               family == AF_INET6 ? "IPv6" : "IPv4", EventPolicy::name());
    }

    void close() {
        if (fd_ >= 0) {
            event_.remove(fd_);
            ::close(fd_);
            fd_ = -1;
        }
        if (wake_fd_ >= 0) {
            event_.remove(wake_fd_);
            ::close(wake_fd_);
            wake_fd_ = -1;
        }
    }

    bool is_open() const {
        return fd_ >= 0;
    }

    ssize_t send(const void* data, size_t len) {
        if (fd_ < 0) {
            errno = ENOTCONN;
            return -1;
        }
        return ::send(fd_, data, len, MSG_NOSIGNAL);
    }

    /**
     * Non-blocking receive of one datagram
     *
     * @return Datagram length, -1 with errno EAGAIN when nothing is queued
     */
    ssize_t recv(void* buffer, size_t len) {
        if (fd_ < 0) {
            errno = ENOTCONN;
            return -1;
        }
        return ::recv(fd_, buffer, len, MSG_DONTWAIT);
    }

    /**
     * Wait until a datagram may be read
     *
     * @param timeout_ms Timeout in milliseconds (-1 = infinite)
     * @return 1 readable, 0 timeout, -1 error / interrupted / concurrent wait
     */
    int wait_readable(int timeout_ms) {
        if (fd_ < 0) {
            return -1;
        }
        bool expected = false;
        if (!waiting_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return -1;
        }

        event_.set_wait_timeout(timeout_ms);
        int n = event_.wait_with_timeout();

        int result = 0;
        if (n < 0) {
            result = (errno == EINTR) ? 0 : -1;
        } else if (n > 0) {
            if (event_.is_ready(wake_fd_)) {
                uint64_t counter;
                while (::read(wake_fd_, &counter, sizeof(counter)) > 0) {
                }
            }
            if (interrupted_.exchange(false, std::memory_order_acq_rel)) {
                result = -1;
            } else {
                result = event_.is_ready(fd_) ? 1 : 0;
            }
        }

        waiting_.store(false, std::memory_order_release);
        return result;
    }

    /**
     * Resolve a pending wait_readable() with -1 (callable from any thread)
     */
    void interrupt() {
        if (wake_fd_ < 0) return;
        interrupted_.store(true, std::memory_order_release);
        uint64_t one = 1;
        ssize_t n = ::write(wake_fd_, &one, sizeof(one));
        (void)n;
    }

    int get_fd() const {
        return fd_;
    }

private:
    int fd_;
    int wake_fd_;
    EventPolicy event_;
    std::atomic<bool> waiting_;
    std::atomic<bool> interrupted_;
};

} // namespace transport
} // namespace coverage

#if __cplusplus >= 202002L
static_assert(coverage::DatagramTransportConcept<coverage::transport::UdpSocket<>>);
#endif
