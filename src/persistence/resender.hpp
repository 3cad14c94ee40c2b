// persistence/resender.hpp
// Resend sweep over persisted, not yet acknowledged sub-sessions
//
// Each sweep:
//   1. purges sessions older than the max resend age and those that can never
//      be sent (best-effort)
//   2. submits every eligible session once, most recent first (earliest fence
//      timestamp, descending)
//   3. deletes a session only after its submission succeeded
// A failing session is logged and kept for the next sweep; the remaining
// sessions are still attempted.

#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "../core/timing.hpp"
#include "fence_store.hpp"

namespace coverage {
namespace persistence {

struct ResendReport {
    int purged = 0;
    int attempted = 0;
    int succeeded = 0;
    int failed = 0;
};

/**
 * PersistedFencesResender
 *
 * @tparam Store  FenceStore or compatible: cleanup(), sessions_to_submit(), delete_session()
 * @tparam Sender submit_coverage_result(test_uuid, fences, anchor), throws on failure
 */
template<typename Store, typename Sender>
class PersistedFencesResender {
public:
    PersistedFencesResender(Store& store, Sender& sender, Duration max_resend_age)
        : store_(store)
        , sender_(sender)
        , max_resend_age_(max_resend_age)
    {}

    /**
     * Run one sweep
     *
     * @param is_launched true on the first sweep after process start: sessions
     *                    left unfinished by a previous process become eligible
     * @param now Reference instant for the age cutoff
     * @throws PersistenceError if the eligible sessions cannot be read
     */
    ResendReport resend_persistent_sessions(bool is_launched, Timestamp now) {
        ResendReport report;

        try {
            report.purged = store_.cleanup(max_resend_age_, now, is_launched);
        } catch (const std::exception& e) {
            printf("[Resender] Cleanup failed: %s\n", e.what());
        }

        std::vector<StoredSession> sessions = store_.sessions_to_submit(is_launched);
        if (sessions.empty()) {
            return report;
        }
        printf("[Resender] %zu session(s) to resend (%s)\n", sessions.size(),
               is_launched ? "launch" : "sweep");

        for (const auto& s : sessions) {
            if (!s.test_uuid || !s.anchor_at) {
                continue;
            }
            ++report.attempted;
            try {
                sender_.submit_coverage_result(*s.test_uuid, s.fences, *s.anchor_at);
                store_.delete_session(*s.test_uuid);
                ++report.succeeded;
                printf("[Resender] Resent %s (%zu fences)\n", s.test_uuid->c_str(), s.fences.size());
            } catch (const std::exception& e) {
                ++report.failed;
                printf("[Resender] Resend of %s failed, kept for retry: %s\n", s.test_uuid->c_str(), e.what());
            }
        }
        return report;
    }

    Duration max_resend_age() const { return max_resend_age_; }

private:
    Store& store_;
    Sender& sender_;
    Duration max_resend_age_;
};

} // namespace persistence
} // namespace coverage
