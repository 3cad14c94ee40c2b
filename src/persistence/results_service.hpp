// persistence/results_service.hpp
// Results service - submits the active sub-session and keeps storage in step
//
// send(fences):
//   - no active token: ServiceError(MissingTestUUID)
//   - no fence belongs to the active token: resend sweep only
//   - otherwise the active token's fences are submitted with offsets relative
//     to its anchor; on success the stored session is deleted, on failure it
//     stays for the resend sweep and the error propagates
//   - every successful submission is followed by a resend sweep

#pragma once

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "../core/errors.hpp"
#include "../core/timing.hpp"
#include "../model/fence.hpp"
#include "resender.hpp"

#ifdef DEBUG
#define DEBUG_PRINT(...) do { printf(__VA_ARGS__); fflush(stdout); } while(0)
#else
#define DEBUG_PRINT(...) ((void)0)
#endif

namespace coverage {
namespace persistence {

/**
 * PersistenceManagingResultsService
 *
 * @tparam Store   FenceStore or compatible
 * @tparam Sender  submit_coverage_result(test_uuid, fences, anchor)
 * @tparam Session current_test_uuid(), anchor() (see session::CoverageSessionController)
 * @tparam Clock   RealClock or VirtualClock
 */
template<typename Store, typename Sender, typename Session, typename Clock = RealClock>
class PersistenceManagingResultsService {
public:
    using Resender = PersistedFencesResender<Store, Sender>;

    PersistenceManagingResultsService(Clock& clock, Store& store, Sender& sender, Session& session,
                                      Resender& resender)
        : clock_(clock)
        , store_(store)
        , sender_(sender)
        , session_(session)
        , resender_(resender)
    {}

    /**
     * Submit the fences of the active sub-session
     *
     * @throws ServiceError if no token is active
     * @throws SubmissionError (or another std::runtime_error) if the submission failed
     */
    void send(const std::vector<Fence>& fences) {
        std::optional<std::string> test_uuid = session_.current_test_uuid();
        if (!test_uuid) {
            printf("[Results] Cannot send %zu fences: missing test UUID\n", fences.size());
            throw ServiceError(ServiceError::Kind::MissingTestUUID);
        }

        std::vector<Fence> matching;
        for (const auto& f : fences) {
            if (f.session_uuid && *f.session_uuid == *test_uuid) {
                matching.push_back(f);
            }
        }

        if (matching.empty()) {
            printf("[Results] No fences for %s, resending stored sessions only\n", test_uuid->c_str());
            sweep();
            return;
        }

        printf("[Results] Sending %zu of %zu fences for %s\n", matching.size(), fences.size(), test_uuid->c_str());
        try {
            sender_.submit_coverage_result(*test_uuid, matching, session_.anchor());
        } catch (const std::exception& e) {
            printf("[Results] Submission for %s failed, kept for resend: %s\n", test_uuid->c_str(), e.what());
            throw;
        }

        if (!store_.delete_session(*test_uuid)) {
            DEBUG_PRINT("[Results] Session %s was not stored\n", test_uuid->c_str());
        }

        sweep();
    }

private:
    void sweep() {
        try {
            resender_.resend_persistent_sessions(false, clock_.now());
        } catch (const std::exception& e) {
            printf("[Results] Resend sweep failed: %s\n", e.what());
        }
    }

    Clock& clock_;
    Store& store_;
    Sender& sender_;
    Session& session_;
    Resender& resender_;
};

} // namespace persistence
} // namespace coverage
