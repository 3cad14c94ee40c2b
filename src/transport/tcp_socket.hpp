// src/transport/tcp_socket.hpp
// TCP stream socket for control-server requests
//
// Policy-based design: no inheritance, no virtual functions.

#pragma once

#include <cstddef>
#include <cstdio>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <netdb.h>
#include <errno.h>
#include <poll.h>
#include <cstring>
#include <string>
#include <stdexcept>

namespace coverage {
namespace transport {

struct TcpSocketConfig {
    bool tcp_nodelay;        // Disable Nagle's algorithm (default: true)
    int connect_timeout_ms;  // Non-blocking connect timeout (default: 5000)
    int io_timeout_ms;       // SO_RCVTIMEO/SO_SNDTIMEO after connect (default: 10000)

    TcpSocketConfig()
        : tcp_nodelay(true)
        , connect_timeout_ms(5000)
        , io_timeout_ms(10000)
    {}
};

/**
 * TcpSocket - blocking stream socket with bounded connect and I/O timeouts
 *
 * Socket Interface (duck typing):
 *   void init(const TcpSocketConfig& config)
 *   void connect(const char* host, uint16_t port)
 *   void close()
 *   bool is_connected() const
 *   ssize_t send(const void* data, size_t len)
 *   ssize_t recv(void* buffer, size_t len)
 *   int get_fd() const
 */
struct TcpSocket {
    int fd_;
    bool connected_;
    TcpSocketConfig config_;

    TcpSocket()
        : fd_(-1)
        , connected_(false)
    {}

    ~TcpSocket() {
        close();
    }

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    void init(const TcpSocketConfig& config = TcpSocketConfig()) {
        config_ = config;
    }

    /**
     * Resolve and connect, trying every resolved address in order
     *
     * @throws std::runtime_error on resolution failure or when no address connects
     */
    void connect(const char* host, uint16_t port) {
        struct addrinfo hints = {};
        struct addrinfo* result = nullptr;
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        char port_str[8];
        snprintf(port_str, sizeof(port_str), "%u", port);

        int ret = getaddrinfo(host, port_str, &hints, &result);
        if (ret != 0) {
            throw std::runtime_error(std::string("getaddrinfo() failed: ") + gai_strerror(ret));
        }

        std::string last_error = "no address";
        for (struct addrinfo* ai = result; ai; ai = ai->ai_next) {
            try {
                connect_one(ai);
                freeaddrinfo(result);
                connected_ = true;
                return;
            } catch (const std::runtime_error& e) {
                last_error = e.what();
            }
        }

        freeaddrinfo(result);
        throw std::runtime_error(std::string("connect to ") + host + " failed: " + last_error);
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        connected_ = false;
    }

    bool is_connected() const {
        return connected_ && fd_ >= 0;
    }

    ssize_t send(const void* data, size_t len) {
        if (fd_ < 0) {
            return -1;
        }
        return ::send(fd_, data, len, MSG_NOSIGNAL);
    }

    ssize_t recv(void* buffer, size_t len) {
        if (fd_ < 0) {
            return -1;
        }
        return ::recv(fd_, buffer, len, 0);
    }

    int get_fd() const {
        return fd_;
    }

private:
    void connect_one(struct addrinfo* ai) {
        close();
        fd_ = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd_ < 0) {
            throw std::runtime_error(std::string("socket() failed: ") + strerror(errno));
        }

        if (config_.tcp_nodelay) {
            int flag = 1;
            if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0) {
                printf("[WARN] Failed to set TCP_NODELAY: %s\n", strerror(errno));
            }
        }

        // Non-blocking connect for timeout support
        int flags = fcntl(fd_, F_GETFL, 0);
        if (flags < 0 || fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
            close();
            throw std::runtime_error("Failed to set non-blocking mode");
        }

        int ret = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            int err = errno;
            close();
            throw std::runtime_error(std::string("connect() failed: ") + strerror(err));
        }

        if (ret < 0) {  // EINPROGRESS
            struct pollfd pfd = {};
            pfd.fd = fd_;
            pfd.events = POLLOUT;

            ret = ::poll(&pfd, 1, config_.connect_timeout_ms);
            if (ret <= 0) {
                close();
                if (ret == 0) {
                    throw std::runtime_error("connect() timeout");
                }
                throw std::runtime_error(std::string("poll() failed: ") + strerror(errno));
            }

            int sock_error = 0;
            socklen_t len = sizeof(sock_error);
            if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &sock_error, &len) < 0 || sock_error != 0) {
                close();
                throw std::runtime_error(std::string("connect() failed: ") + strerror(sock_error));
            }
        }

        // Restore blocking mode, bound by I/O timeouts
        if (fcntl(fd_, F_SETFL, flags) < 0) {
            close();
            throw std::runtime_error("Failed to restore blocking mode");
        }

        struct timeval tv;
        tv.tv_sec = config_.io_timeout_ms / 1000;
        tv.tv_usec = (config_.io_timeout_ms % 1000) * 1000;
        if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
            ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
            printf("[WARN] Failed to set socket I/O timeout: %s\n", strerror(errno));
        }
    }
};

} // namespace transport
} // namespace coverage
