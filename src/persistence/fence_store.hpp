// persistence/fence_store.hpp
// SQLite-backed storage of coverage sub-sessions and their closed fences
//
// Schema:
//   coverage_session  one row per sub-session; test_uuid is NULL until the
//                     control server issued a token, finalized_at is NULL
//                     while the sub-session is running
//   coverage_fence    closed fences, ON DELETE CASCADE from their session
//
// A session's rows are removed only by delete_session() after a confirmed
// submission, or by cleanup() once they are too old or can never be sent.
//
// All operations are serialized by an internal mutex; the store may be shared
// between the measurement thread and the pacer's initiation thread.

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>

#include "../core/errors.hpp"
#include "../core/timing.hpp"
#include "../model/fence.hpp"

// Debug printing - enable with -DDEBUG
#ifdef DEBUG
#define DEBUG_PRINT(...) do { printf(__VA_ARGS__); fflush(stdout); } while(0)
#else
#define DEBUG_PRINT(...) ((void)0)
#endif

namespace coverage {
namespace persistence {

/**
 * Persistence configuration
 */
struct PersistenceConfig {
    std::string db_path;
    Duration max_resend_age;   // older sessions are purged, sent or not

    PersistenceConfig()
        : db_path("coverage.db")
        , max_resend_age(sec_to_us(7 * 24 * 3600))
    {}

    /**
     * Defaults overridden by COV_DB_PATH
     */
    static PersistenceConfig from_env() {
        PersistenceConfig c;
        if (const char* v = getenv("COV_DB_PATH")) c.db_path = v;
        return c;
    }
};

/**
 * StoredSession - one persisted sub-session with its fences
 */
struct StoredSession {
    int64_t id = 0;
    std::optional<std::string> test_uuid;
    std::optional<std::string> loop_uuid;
    Timestamp started_at = 0;
    std::optional<Timestamp> anchor_at;
    std::optional<Timestamp> finalized_at;
    std::vector<Fence> fences;   // ordered by date_entered

    // Sort key of the resend sweep
    std::optional<Timestamp> earliest_fence() const {
        if (fences.empty()) return std::nullopt;
        return fences.front().date_entered;
    }
};

// ============================================================================
// SQLite RAII helpers
// ============================================================================

/**
 * Statement - prepared statement, finalized on destruction
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db), stmt_(nullptr) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite3_prepare_v2() failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, int64_t v) {
        check(sqlite3_bind_int64(stmt_, idx, v));
        return *this;
    }

    Statement& bind(int idx, double v) {
        check(sqlite3_bind_double(stmt_, idx, v));
        return *this;
    }

    Statement& bind(int idx, const std::string& v) {
        check(sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind_null(int idx) {
        check(sqlite3_bind_null(stmt_, idx));
        return *this;
    }

    template<typename T>
    Statement& bind(int idx, const std::optional<T>& v) {
        return v ? bind(idx, *v) : bind_null(idx);
    }

    /**
     * @return true while a row is available
     * @throws PersistenceError on any other result
     */
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw PersistenceError(std::string("sqlite3_step() failed: ") + sqlite3_errmsg(db_));
    }

    void run() {
        while (step()) {
        }
    }

    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }

    std::string text(int col) const {
        const unsigned char* s = sqlite3_column_text(stmt_, col);
        return s ? std::string(reinterpret_cast<const char*>(s)) : std::string();
    }

    std::optional<int64_t> optional_int64(int col) const {
        if (is_null(col)) return std::nullopt;
        return int64(col);
    }

    std::optional<std::string> optional_text(int col) const {
        if (is_null(col)) return std::nullopt;
        return text(col);
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw PersistenceError(std::string("sqlite3_bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

/**
 * Transaction - BEGIN IMMEDIATE, rolled back unless committed
 */
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db), done_(false) {
        exec("BEGIN IMMEDIATE");
    }

    ~Transaction() {
        if (!done_) {
            char* err = nullptr;
            if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
                fprintf(stderr, "[FenceStore] ROLLBACK failed: %s\n", err ? err : "unknown");
                sqlite3_free(err);
            }
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec("COMMIT");
        done_ = true;
    }

private:
    void exec(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = std::string(sql) + " failed: " + (err ? err : "unknown");
            sqlite3_free(err);
            throw PersistenceError(msg);
        }
    }

    sqlite3* db_;
    bool done_;
};

// ============================================================================
// FenceStore
// ============================================================================

class FenceStore {
public:
    /**
     * Open (or create) the database and its schema
     *
     * @param path File path, ":memory:" for a private in-memory database
     * @throws std::runtime_error if the database cannot be opened
     */
    explicit FenceStore(const std::string& path) : db_(nullptr, &sqlite3_close) {
        sqlite3* raw = nullptr;
        int rc = sqlite3_open_v2(path.c_str(), &raw,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
        db_.reset(raw);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("sqlite3_open_v2(" + path + ") failed: " +
                                     (raw ? sqlite3_errmsg(raw) : "out of memory"));
        }
        sqlite3_busy_timeout(raw, 2000);
        exec("PRAGMA foreign_keys = ON");
        exec(SCHEMA);
        printf("[FenceStore] Opened %s\n", path.c_str());
    }

    explicit FenceStore(const PersistenceConfig& config) : FenceStore(config.db_path) {}

    FenceStore(const FenceStore&) = delete;
    FenceStore& operator=(const FenceStore&) = delete;

    /**
     * Record the start of a measurement run as a new sub-session without a token
     */
    void session_started(Timestamp at) {
        std::lock_guard<std::mutex> lock(mutex_);
        Statement(db(), "INSERT INTO coverage_session (started_at) VALUES (?)").bind(1, at).run();
        DEBUG_PRINT("[FenceStore] Session started at %ld\n", (long)at);
    }

    /**
     * Attach a control-server token to the running sub-session
     *
     * The running sub-session adopts the token if it has none yet. If it
     * already carries another token it is finalized at the anchor instant and
     * a new sub-session chained to it is opened.
     */
    void assign_test_uuid(const std::string& test_uuid, Timestamp anchor) {
        std::lock_guard<std::mutex> lock(mutex_);
        Transaction tx(db());

        if (auto existing = find_id_locked(test_uuid)) {
            Statement(db(), "UPDATE coverage_session SET anchor_at = COALESCE(anchor_at, ?) WHERE id = ?")
                .bind(1, anchor).bind(2, *existing).run();
            tx.commit();
            return;
        }

        Statement q(db(), "SELECT id, test_uuid FROM coverage_session WHERE finalized_at IS NULL "
                          "ORDER BY started_at DESC, id DESC LIMIT 1");
        if (q.step()) {
            int64_t id = q.int64(0);
            auto current = q.optional_text(1);
            if (!current) {
                Statement(db(), "UPDATE coverage_session SET test_uuid = ?, anchor_at = ? WHERE id = ?")
                    .bind(1, test_uuid).bind(2, anchor).bind(3, id).run();
                printf("[FenceStore] Session %s assigned\n", test_uuid.c_str());
            } else {
                Statement(db(), "UPDATE coverage_session SET finalized_at = ? WHERE id = ?")
                    .bind(1, anchor).bind(2, id).run();
                insert_session_locked(test_uuid, current, anchor);
                printf("[FenceStore] Session %s finalized, continued as %s\n",
                       current->c_str(), test_uuid.c_str());
            }
        } else {
            insert_session_locked(test_uuid, std::nullopt, anchor);
            printf("[FenceStore] Session %s created\n", test_uuid.c_str());
        }
        tx.commit();
    }

    /**
     * Store a closed fence under its session
     *
     * A fence without a session goes to the running sub-session that has no
     * token yet (created if necessary).
     *
     * @throws PersistenceError if the fence names an unknown session
     */
    void save(const Fence& fence) {
        std::lock_guard<std::mutex> lock(mutex_);
        Transaction tx(db());

        int64_t session_id;
        if (fence.session_uuid) {
            auto id = find_id_locked(*fence.session_uuid);
            if (!id) {
                throw PersistenceError("no stored session " + *fence.session_uuid);
            }
            session_id = *id;
        } else {
            Statement q(db(), "SELECT id FROM coverage_session WHERE finalized_at IS NULL AND test_uuid IS NULL "
                              "ORDER BY started_at DESC, id DESC LIMIT 1");
            if (q.step()) {
                session_id = q.int64(0);
            } else {
                Statement(db(), "INSERT INTO coverage_session (started_at) VALUES (?)")
                    .bind(1, fence.date_entered).run();
                session_id = sqlite3_last_insert_rowid(db());
            }
        }

        std::optional<double> accuracy;
        if (fence.starting_location.horizontal_accuracy >= 0) {
            accuracy = fence.starting_location.horizontal_accuracy;
        }
        std::optional<std::string> technology;
        auto tech = fence.significant_technology();
        if (tech && tech->code()) technology = std::string(tech->code());

        Statement(db(),
                  "INSERT OR REPLACE INTO coverage_fence "
                  "(session_id, fence_id, timestamp, exit_timestamp, latitude, longitude, accuracy, "
                  " avg_ping_ms, technology, radius_m) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)")
            .bind(1, session_id)
            .bind(2, fence.id)
            .bind(3, fence.date_entered)
            .bind(4, fence.date_exited)
            .bind(5, fence.starting_location.coordinate.latitude)
            .bind(6, fence.starting_location.coordinate.longitude)
            .bind(7, accuracy)
            .bind(8, fence.average_ping_ms())
            .bind(9, technology)
            .bind(10, fence.radius_m)
            .run();
        tx.commit();
        DEBUG_PRINT("[FenceStore] Saved fence %s\n", fence.id.c_str());
    }

    /**
     * Mark the running sub-session finished
     */
    void session_finalized(Timestamp at) {
        std::lock_guard<std::mutex> lock(mutex_);
        Statement(db(),
                  "UPDATE coverage_session SET finalized_at = ?, "
                  "started_at = CASE WHEN started_at = 0 THEN ? ELSE started_at END "
                  "WHERE id = (SELECT id FROM coverage_session WHERE finalized_at IS NULL "
                  "            ORDER BY started_at DESC, id DESC LIMIT 1)")
            .bind(1, at).bind(2, at).run();
        if (sqlite3_changes(db()) == 0) {
            printf("[FenceStore] No running session to finalize\n");
        }
    }

    /**
     * Drop the running sub-session if it never received a token
     *
     * @return Number of sessions removed
     */
    int discard_unassigned_session() {
        std::lock_guard<std::mutex> lock(mutex_);
        Statement(db(), "DELETE FROM coverage_session WHERE finalized_at IS NULL AND test_uuid IS NULL").run();
        return sqlite3_changes(db());
    }

    /**
     * Remove a session and its fences
     *
     * @return true if the session existed
     */
    bool delete_session(const std::string& test_uuid) {
        std::lock_guard<std::mutex> lock(mutex_);
        Statement(db(), "DELETE FROM coverage_session WHERE test_uuid = ?").bind(1, test_uuid).run();
        return sqlite3_changes(db()) > 0;
    }

    /**
     * Purge sessions that must not or cannot be sent
     *
     *   - older than max_age (reference: finalized_at, else started_at)
     *   - finalized without a token or without fences
     *   - after a launch, any session without a token or without fences
     *
     * @return Number of sessions removed
     */
    int cleanup(Duration max_age, Timestamp now, bool is_launched) {
        std::lock_guard<std::mutex> lock(mutex_);
        Transaction tx(db());
        int removed = 0;

        Timestamp cutoff = now - max_age;
        Statement(db(), "DELETE FROM coverage_session WHERE COALESCE(finalized_at, started_at) < ?")
            .bind(1, cutoff).run();
        removed += sqlite3_changes(db());

        const char* orphans = is_launched
            ? "DELETE FROM coverage_session WHERE test_uuid IS NULL "
              "OR NOT EXISTS (SELECT 1 FROM coverage_fence f WHERE f.session_id = coverage_session.id)"
            : "DELETE FROM coverage_session WHERE finalized_at IS NOT NULL AND (test_uuid IS NULL "
              "OR NOT EXISTS (SELECT 1 FROM coverage_fence f WHERE f.session_id = coverage_session.id))";
        Statement(db(), orphans).run();
        removed += sqlite3_changes(db());

        tx.commit();
        if (removed > 0) {
            printf("[FenceStore] Cleanup removed %d session(s)\n", removed);
        }
        return removed;
    }

    /**
     * Sessions eligible for resending, most recent first
     *
     * Eligible: token and anchor known, at least one fence, and finalized
     * (after a launch also unfinished ones, which no running measurement owns).
     * Ordered by earliest fence timestamp, descending.
     */
    std::vector<StoredSession> sessions_to_submit(bool is_launched) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<StoredSession> sessions;

        std::string sql =
            "SELECT id, test_uuid, loop_uuid, started_at, anchor_at, finalized_at FROM ("
            "  SELECT s.*, (SELECT MIN(f.timestamp) FROM coverage_fence f WHERE f.session_id = s.id) AS first_fence"
            "  FROM coverage_session s"
            ") WHERE test_uuid IS NOT NULL AND anchor_at IS NOT NULL AND first_fence IS NOT NULL";
        if (!is_launched) {
            sql += " AND finalized_at IS NOT NULL";
        }
        sql += " ORDER BY first_fence DESC, id DESC";

        Statement q(db(), sql.c_str());
        while (q.step()) {
            StoredSession s;
            s.id = q.int64(0);
            s.test_uuid = q.optional_text(1);
            s.loop_uuid = q.optional_text(2);
            s.started_at = q.int64(3);
            s.anchor_at = q.optional_int64(4);
            s.finalized_at = q.optional_int64(5);
            sessions.push_back(std::move(s));
        }
        for (auto& s : sessions) {
            s.fences = load_fences_locked(s.id, s.test_uuid);
        }
        return sessions;
    }

    /**
     * Stored fences of one session, ordered by entry time
     */
    std::vector<Fence> fences_for(const std::string& test_uuid) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto id = find_id_locked(test_uuid);
        if (!id) return {};
        return load_fences_locked(*id, test_uuid);
    }

    std::optional<StoredSession> find_session(const std::string& test_uuid) {
        std::lock_guard<std::mutex> lock(mutex_);
        Statement q(db(), "SELECT id, test_uuid, loop_uuid, started_at, anchor_at, finalized_at "
                          "FROM coverage_session WHERE test_uuid = ?");
        q.bind(1, test_uuid);
        if (!q.step()) return std::nullopt;
        StoredSession s;
        s.id = q.int64(0);
        s.test_uuid = q.optional_text(1);
        s.loop_uuid = q.optional_text(2);
        s.started_at = q.int64(3);
        s.anchor_at = q.optional_int64(4);
        s.finalized_at = q.optional_int64(5);
        s.fences = load_fences_locked(s.id, s.test_uuid);
        return s;
    }

    int64_t session_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_locked("SELECT COUNT(*) FROM coverage_session");
    }

    int64_t fence_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_locked("SELECT COUNT(*) FROM coverage_fence");
    }

private:
    static constexpr const char* SCHEMA =
        "CREATE TABLE IF NOT EXISTS coverage_session ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  test_uuid TEXT UNIQUE,"
        "  loop_uuid TEXT,"
        "  started_at INTEGER NOT NULL,"
        "  anchor_at INTEGER,"
        "  finalized_at INTEGER"
        ");"
        "CREATE TABLE IF NOT EXISTS coverage_fence ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  session_id INTEGER NOT NULL REFERENCES coverage_session(id) ON DELETE CASCADE,"
        "  fence_id TEXT NOT NULL,"
        "  timestamp INTEGER NOT NULL,"
        "  exit_timestamp INTEGER,"
        "  latitude REAL NOT NULL,"
        "  longitude REAL NOT NULL,"
        "  accuracy REAL,"
        "  avg_ping_ms INTEGER,"
        "  technology TEXT,"
        "  radius_m REAL NOT NULL,"
        "  UNIQUE (session_id, fence_id)"
        ");"
        "CREATE INDEX IF NOT EXISTS coverage_fence_session ON coverage_fence(session_id);";

    sqlite3* db() { return db_.get(); }

    void exec(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(db(), sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = std::string("sqlite3_exec() failed: ") + (err ? err : "unknown");
            sqlite3_free(err);
            throw std::runtime_error(msg);
        }
    }

    std::optional<int64_t> find_id_locked(const std::string& test_uuid) {
        Statement q(db(), "SELECT id FROM coverage_session WHERE test_uuid = ?");
        q.bind(1, test_uuid);
        if (!q.step()) return std::nullopt;
        return q.int64(0);
    }

    void insert_session_locked(const std::string& test_uuid, const std::optional<std::string>& loop_uuid,
                               Timestamp anchor) {
        Statement(db(), "INSERT INTO coverage_session (test_uuid, loop_uuid, started_at, anchor_at) "
                        "VALUES (?, ?, ?, ?)")
            .bind(1, test_uuid).bind(2, loop_uuid).bind(3, anchor).bind(4, anchor).run();
    }

    std::vector<Fence> load_fences_locked(int64_t session_id, const std::optional<std::string>& test_uuid) {
        std::vector<Fence> fences;
        Statement q(db(), "SELECT fence_id, timestamp, exit_timestamp, latitude, longitude, accuracy, "
                          "avg_ping_ms, technology, radius_m FROM coverage_fence "
                          "WHERE session_id = ? ORDER BY timestamp ASC, id ASC");
        q.bind(1, session_id);
        while (q.step()) {
            Fence f;
            f.id = q.text(0);
            f.date_entered = q.int64(1);
            f.date_exited = q.optional_int64(2);
            f.starting_location = LocationSample(Coordinate(q.real(3), q.real(4)),
                                                 q.is_null(5) ? -1.0 : q.real(5), f.date_entered);
            f.locations.push_back(f.starting_location);

            // Only the aggregate survives storage
            if (auto avg = q.optional_int64(6)) {
                f.pings.push_back(PingOutcome::success(f.date_entered, ms_to_us(*avg)));
            }
            if (auto code = q.optional_text(7)) {
                RadioTechnology tech = parse_radio_technology(*code);
                if (tech != RadioTechnology::Unknown) {
                    f.technologies.emplace_back(tech, f.date_entered);
                }
            }
            f.radius_m = q.real(8);
            f.session_uuid = test_uuid;
            fences.push_back(std::move(f));
        }
        return fences;
    }

    int64_t count_locked(const char* sql) {
        Statement q(db(), sql);
        return q.step() ? q.int64(0) : 0;
    }

    std::unique_ptr<sqlite3, decltype(&sqlite3_close)> db_;
    std::mutex mutex_;
};

} // namespace persistence
} // namespace coverage
