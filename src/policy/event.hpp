// policy/event.hpp
// Event Loop Policy - read readiness for datagram sockets and eventfds
//
// Every descriptor the engine waits on is read-only interest: the connected
// UDP ping socket, its wakeup eventfd, and the event merger's channel
// eventfds. Policies therefore register read interest only and report the
// full ready set of the last wait, so a caller watching a socket and a
// wakeup fd can tell which one fired.
//
//   - Linux: EpollPolicy (default, edge-triggered)
//   - POSIX: SelectPolicy (fallback, -DUSE_SELECT)
//
// EventPolicyConcept interface:
//   - void init()
//   - void add_read(int fd)
//   - void remove(int fd)
//   - int wait()                        // Block until something is ready
//   - void set_wait_timeout(int ms)     // Timeout for wait_with_timeout()
//   - int wait_with_timeout()           // 0 = timeout, -1 = error
//   - int get_ready_fd() const          // First ready fd of the last wait
//   - bool is_ready(int fd) const       // fd in the ready set of the last wait
//
// Namespace: coverage::event_policies

#pragma once

#include <stdexcept>
#include <cstdint>
#include <sys/select.h>
#include <sys/time.h>
#include <unistd.h>

#if defined(__linux__)
    #define EVENT_POLICY_LINUX 1
    #include <sys/epoll.h>
#endif

namespace coverage {
namespace event_policies {

// Ready set of one wait, in the order the kernel reported it
struct ReadySet {
    static constexpr int CAPACITY = 8;

    int fds[CAPACITY];
    uint32_t errors;    // bit i set: fds[i] reported an error or hang-up
    int count;

    ReadySet() : errors(0), count(0) {}

    void clear() {
        count = 0;
        errors = 0;
    }

    void add(int fd, bool error) {
        if (count >= CAPACITY) return;
        if (error) errors |= 1u << count;
        fds[count++] = fd;
    }

    bool contains(int fd) const {
        for (int i = 0; i < count; ++i) {
            if (fds[i] == fd) return true;
        }
        return false;
    }

    int first() const { return count > 0 ? fds[0] : -1; }
    bool first_has_error() const { return count > 0 && (errors & 1u); }
};

#ifdef EVENT_POLICY_LINUX

/**
 * EpollPolicy - edge-triggered epoll
 *
 * Callers drain a ready descriptor until EAGAIN (UdpSocket recv loop,
 * SpscChannel::consume_notification) before waiting again.
 *
 * Thread safety: one waiting thread per instance
 */
struct EpollPolicy {
    EpollPolicy() : epfd_(-1), timeout_ms_(-1) {}

    ~EpollPolicy() {
        close_epoll();
    }

    EpollPolicy(const EpollPolicy&) = delete;
    EpollPolicy& operator=(const EpollPolicy&) = delete;

    EpollPolicy(EpollPolicy&& other) noexcept
        : epfd_(other.epfd_)
        , timeout_ms_(other.timeout_ms_)
        , ready_(other.ready_)
    {
        other.epfd_ = -1;
        other.ready_.clear();
    }

    EpollPolicy& operator=(EpollPolicy&& other) noexcept {
        if (this != &other) {
            close_epoll();
            epfd_ = other.epfd_;
            timeout_ms_ = other.timeout_ms_;
            ready_ = other.ready_;
            other.epfd_ = -1;
            other.ready_.clear();
        }
        return *this;
    }

    /**
     * @throws std::runtime_error if epoll_create1() fails
     */
    void init() {
        close_epoll();
        epfd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epfd_ < 0) {
            throw std::runtime_error("epoll_create1() failed");
        }
    }

    /**
     * Watch fd for input (EPOLLIN | EPOLLET)
     *
     * @throws std::runtime_error if epoll_ctl() fails
     */
    void add_read(int fd) {
        struct epoll_event ev = {};
        ev.events = EPOLLIN | EPOLLET;
        ev.data.fd = fd;
        if (epoll_ctl(epfd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            throw std::runtime_error("epoll_ctl(ADD, EPOLLIN) failed");
        }
    }

    // Closing a descriptor also drops it from epoll; remove() precedes close()
    void remove(int fd) {
        if (epfd_ >= 0) {
            epoll_ctl(epfd_, EPOLL_CTL_DEL, fd, nullptr);
        }
    }

    int wait() {
        return collect(-1);
    }

    void set_wait_timeout(int timeout_ms) {
        timeout_ms_ = timeout_ms;
    }

    int wait_with_timeout() {
        return collect(timeout_ms_);
    }

    int get_ready_fd() const { return ready_.first(); }
    bool is_ready(int fd) const { return ready_.contains(fd); }
    bool is_readable() const { return ready_.count > 0; }
    bool has_error() const { return ready_.first_has_error(); }

    static constexpr const char* name() {
        return "epoll";
    }

private:
    int collect(int timeout_ms) {
        struct epoll_event events[ReadySet::CAPACITY];
        int n = epoll_wait(epfd_, events, ReadySet::CAPACITY, timeout_ms);

        ready_.clear();
        for (int i = 0; i < n; ++i) {
            ready_.add(events[i].data.fd, events[i].events & (EPOLLERR | EPOLLHUP));
        }
        return n < 0 ? -1 : n;
    }

    void close_epoll() {
        if (epfd_ >= 0) {
            ::close(epfd_);
            epfd_ = -1;
        }
        ready_.clear();
    }

    int epfd_;
    int timeout_ms_;
    ReadySet ready_;
};

#endif // EVENT_POLICY_LINUX

/**
 * SelectPolicy - level-triggered select() fallback
 *
 * Descriptors must be below FD_SETSIZE. select() carries no error state, so
 * has_error() is always false.
 */
struct SelectPolicy {
    SelectPolicy() : max_fd_(-1), timeout_ms_(-1) {
        FD_ZERO(&watched_);
    }

    SelectPolicy(const SelectPolicy&) = delete;
    SelectPolicy& operator=(const SelectPolicy&) = delete;

    SelectPolicy(SelectPolicy&& other) noexcept
        : watched_(other.watched_)
        , max_fd_(other.max_fd_)
        , timeout_ms_(other.timeout_ms_)
        , ready_(other.ready_)
    {
        other.init();
    }

    SelectPolicy& operator=(SelectPolicy&& other) noexcept {
        if (this != &other) {
            watched_ = other.watched_;
            max_fd_ = other.max_fd_;
            timeout_ms_ = other.timeout_ms_;
            ready_ = other.ready_;
            other.init();
        }
        return *this;
    }

    void init() {
        FD_ZERO(&watched_);
        max_fd_ = -1;
        ready_.clear();
    }

    /**
     * @throws std::runtime_error if fd is outside [0, FD_SETSIZE)
     */
    void add_read(int fd) {
        if (fd < 0 || fd >= FD_SETSIZE) {
            throw std::runtime_error("fd >= FD_SETSIZE in select()");
        }
        FD_SET(fd, &watched_);
        if (fd > max_fd_) max_fd_ = fd;
    }

    void remove(int fd) {
        if (fd < 0 || fd >= FD_SETSIZE) return;
        FD_CLR(fd, &watched_);
        while (max_fd_ >= 0 && !FD_ISSET(max_fd_, &watched_)) {
            --max_fd_;
        }
    }

    int wait() {
        return collect(-1);
    }

    void set_wait_timeout(int timeout_ms) {
        timeout_ms_ = timeout_ms;
    }

    int wait_with_timeout() {
        return collect(timeout_ms_);
    }

    int get_ready_fd() const { return ready_.first(); }
    bool is_ready(int fd) const { return ready_.contains(fd); }
    bool is_readable() const { return ready_.count > 0; }
    bool has_error() const { return false; }

    static constexpr const char* name() {
        return "select";
    }

private:
    int collect(int timeout_ms) {
        fd_set readable = watched_;
        struct timeval tv;
        struct timeval* tvp = nullptr;
        if (timeout_ms >= 0) {
            tv.tv_sec = timeout_ms / 1000;
            tv.tv_usec = (timeout_ms % 1000) * 1000;
            tvp = &tv;
        }

        int n = ::select(max_fd_ + 1, &readable, nullptr, nullptr, tvp);

        ready_.clear();
        for (int fd = 0; n > 0 && fd <= max_fd_; ++fd) {
            if (FD_ISSET(fd, &readable)) {
                ready_.add(fd, false);
            }
        }
        return n < 0 ? -1 : n;
    }

    fd_set watched_;
    int max_fd_;
    int timeout_ms_;
    ReadySet ready_;
};

} // namespace event_policies

#if defined(EVENT_POLICY_LINUX) && !defined(USE_SELECT)
using DefaultEventPolicy = event_policies::EpollPolicy;
#else
using DefaultEventPolicy = event_policies::SelectPolicy;
#endif

} // namespace coverage

// ============================================================================
// Event Policy Concepts (C++20)
// ============================================================================

#if __cplusplus >= 202002L
#include <concepts>

namespace coverage {

template<typename T>
concept EventPolicyConcept = requires(T event, const T& cevent, int fd, int timeout) {
    { event.init() } -> std::same_as<void>;
    { event.add_read(fd) } -> std::same_as<void>;
    { event.remove(fd) } -> std::same_as<void>;
    { event.wait() } -> std::convertible_to<int>;
    { event.set_wait_timeout(timeout) } -> std::same_as<void>;
    { event.wait_with_timeout() } -> std::convertible_to<int>;
    { cevent.get_ready_fd() } -> std::convertible_to<int>;
    { cevent.is_ready(fd) } -> std::convertible_to<bool>;
};

#ifdef EVENT_POLICY_LINUX
static_assert(EventPolicyConcept<event_policies::EpollPolicy>);
#endif

static_assert(EventPolicyConcept<event_policies::SelectPolicy>);

} // namespace coverage

#endif // C++20
