// session/keep_measuring_token.hpp
// Reference-counted "keep measuring" resource shared by concurrent runs
//
// The resource is held while at least one measurement run holds the token.
// The first acquire() invokes the hold hook, the release() that brings the
// count back to zero invokes the drop hook. Unbalanced releases are ignored.
#pragma once

#include <atomic>
#include <cstdio>
#include <functional>
#include <mutex>

namespace coverage {
namespace session {

class KeepMeasuringToken {
public:
    using Hook = std::function<void()>;

    KeepMeasuringToken() : count_(0) {}

    KeepMeasuringToken(const KeepMeasuringToken&) = delete;
    KeepMeasuringToken& operator=(const KeepMeasuringToken&) = delete;

    /**
     * Process-wide token
     */
    static KeepMeasuringToken& shared() {
        static KeepMeasuringToken token;
        return token;
    }

    /**
     * Hooks run when the resource is taken / given back (default: log only)
     */
    void set_hooks(Hook on_hold, Hook on_drop) {
        std::lock_guard<std::mutex> lock(hook_mutex_);
        on_hold_ = std::move(on_hold);
        on_drop_ = std::move(on_drop);
    }

    void acquire() {
        if (count_.fetch_add(1, std::memory_order_acq_rel) == 0) {
            std::lock_guard<std::mutex> lock(hook_mutex_);
            printf("[Measurement] Keep-measuring resource held\n");
            if (on_hold_) on_hold_();
        }
    }

    void release() {
        int current = count_.load(std::memory_order_acquire);
        do {
            if (current <= 0) return;
        } while (!count_.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel));

        if (current == 1) {
            std::lock_guard<std::mutex> lock(hook_mutex_);
            printf("[Measurement] Keep-measuring resource released\n");
            if (on_drop_) on_drop_();
        }
    }

    int count() const { return count_.load(std::memory_order_acquire); }

    bool is_held() const { return count() > 0; }

private:
    std::atomic<int> count_;
    std::mutex hook_mutex_;
    Hook on_hold_;
    Hook on_drop_;
};

/**
 * Guard - holds the token for its lifetime
 */
class KeepMeasuringGuard {
public:
    explicit KeepMeasuringGuard(KeepMeasuringToken& token) : token_(&token) {
        token_->acquire();
    }

    ~KeepMeasuringGuard() {
        if (token_) token_->release();
    }

    KeepMeasuringGuard(KeepMeasuringGuard&& other) noexcept : token_(other.token_) {
        other.token_ = nullptr;
    }

    KeepMeasuringGuard(const KeepMeasuringGuard&) = delete;
    KeepMeasuringGuard& operator=(const KeepMeasuringGuard&) = delete;
    KeepMeasuringGuard& operator=(KeepMeasuringGuard&&) = delete;

private:
    KeepMeasuringToken* token_;
};

} // namespace session
} // namespace coverage
