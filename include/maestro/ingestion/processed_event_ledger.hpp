#pragma once

#include "../types.hpp"

#include <ctime>
#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <unordered_set>
#include <vector>

namespace maestro {
namespace ingestion {

/**
 * @brief Record of event ids that have already been handled.
 *
 * add() is the atomic check-and-insert used for deduplication. Entries
 * become durable on flush(); until then they are only held in memory.
 */
class IEventLedger {
public:
    virtual ~IEventLedger() = default;

    /// Load durable entries into memory. Returns the number of known ids.
    virtual Expected<size_t> load() = 0;

    virtual bool contains(const std::string& event_id) const = 0;

    /// Insert `event_id`; false if it was already present.
    virtual bool add(const std::string& event_id, Timestamp processed_at) = 0;

    /// Persist entries added since the last successful flush.
    virtual Expected<size_t> flush() = 0;

    virtual size_t pending_count() const = 0;
};

/// Number of ledger entries recorded on one UTC day.
struct LedgerSegment {
    std::string name;   ///< YYYY-MM-DD
    size_t count = 0;
};

/**
 * @brief SQLite-backed processed-event ledger, segmented by UTC day.
 *
 * The full id set is held in memory for constant-time dedup checks.
 * Segments exist for administration (inspection, explicit pruning); they
 * do not expire on their own.
 *
 * @threadsafety All methods are thread-safe
 */
class ProcessedEventLedger : public IEventLedger {
public:
    ~ProcessedEventLedger() override {
        if (stmt_insert_ != nullptr) {
            sqlite3_finalize(stmt_insert_);
            stmt_insert_ = nullptr;
        }
        if (db_ != nullptr) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    ProcessedEventLedger(const ProcessedEventLedger&) = delete;
    ProcessedEventLedger& operator=(const ProcessedEventLedger&) = delete;

    static Expected<std::shared_ptr<ProcessedEventLedger>> open(const std::string& path) {
        if (path.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidDataPath, "Ledger path cannot be empty"});
        }

        sqlite3* db = nullptr;
        if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
            std::string message = "Failed to open processed-event ledger";
            if (db != nullptr && sqlite3_errmsg(db) != nullptr) {
                message += std::string(": ") + sqlite3_errmsg(db);
            }
            if (db != nullptr) {
                sqlite3_close(db);
            }
            return tl::unexpected(Error{ErrorCode::PersistenceFailed, std::move(message), path});
        }

        auto instance = std::shared_ptr<ProcessedEventLedger>(new ProcessedEventLedger(db, path));
        auto init_result = instance->initialize_schema();
        if (!init_result) {
            return tl::unexpected(init_result.error());
        }
        return instance;
    }

    Expected<size_t> load() override {
        std::lock_guard<std::mutex> lock(mutex_);

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, "SELECT event_id FROM processed_events", -1, &stmt, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error(ErrorCode::PersistenceFailed, "Failed to prepare ledger load"));
        }

        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            const auto* id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (id != nullptr) {
                known_.insert(id);
            }
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return tl::unexpected(make_sql_error(ErrorCode::PersistenceFailed, "Failed to load ledger"));
        }
        return known_.size();
    }

    bool contains(const std::string& event_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return known_.count(event_id) > 0;
    }

    bool add(const std::string& event_id, Timestamp processed_at) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!known_.insert(event_id).second) {
            return false;
        }
        pending_.push_back(Pending{event_id, processed_at});
        return true;
    }

    /**
     * @brief Write pending entries in one transaction.
     *
     * On failure the transaction is rolled back and the entries stay
     * pending for the next attempt.
     */
    Expected<size_t> flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.empty()) {
            return size_t{0};
        }

        if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error(ErrorCode::LedgerFlushFailed, "Failed to begin ledger flush"));
        }

        for (const auto& entry : pending_) {
            const std::string segment = segment_for(entry.processed_at);
            sqlite3_bind_text(stmt_insert_, 1, entry.event_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt_insert_, 2, segment.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt_insert_, 3, static_cast<sqlite3_int64>(entry.processed_at));
            const int rc = sqlite3_step(stmt_insert_);
            sqlite3_reset(stmt_insert_);
            sqlite3_clear_bindings(stmt_insert_);
            if (rc != SQLITE_DONE) {
                auto error = make_sql_error(ErrorCode::LedgerFlushFailed, "Failed to write ledger entry");
                sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
                return tl::unexpected(std::move(error));
            }
        }

        if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
            auto error = make_sql_error(ErrorCode::LedgerFlushFailed, "Failed to commit ledger flush");
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            return tl::unexpected(std::move(error));
        }

        const size_t written = pending_.size();
        pending_.clear();
        return written;
    }

    size_t pending_count() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return known_.size();
    }

    /// Durable entries per UTC day, oldest first.
    Expected<std::vector<LedgerSegment>> segments() const {
        std::lock_guard<std::mutex> lock(mutex_);

        sqlite3_stmt* stmt = nullptr;
        constexpr const char* sql =
            "SELECT segment, COUNT(*) FROM processed_events GROUP BY segment ORDER BY segment";
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error(ErrorCode::PersistenceFailed, "Failed to prepare segment query"));
        }

        std::vector<LedgerSegment> result;
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            LedgerSegment segment;
            const auto* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            segment.name = name != nullptr ? name : "";
            segment.count = static_cast<size_t>(sqlite3_column_int64(stmt, 1));
            result.push_back(std::move(segment));
        }
        sqlite3_finalize(stmt);
        return result;
    }

    /**
     * @brief Administrative removal of one day's entries.
     *
     * Ids from the dropped segment are forgotten and would be processed
     * again if redelivered.
     */
    Expected<size_t> drop_segment(const std::string& segment) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::string> ids;
        sqlite3_stmt* select = nullptr;
        if (sqlite3_prepare_v2(db_, "SELECT event_id FROM processed_events WHERE segment = ?1", -1,
                               &select, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error(ErrorCode::PersistenceFailed, "Failed to prepare segment select"));
        }
        sqlite3_bind_text(select, 1, segment.c_str(), -1, SQLITE_TRANSIENT);
        while (sqlite3_step(select) == SQLITE_ROW) {
            const auto* id = reinterpret_cast<const char*>(sqlite3_column_text(select, 0));
            if (id != nullptr) {
                ids.emplace_back(id);
            }
        }
        sqlite3_finalize(select);

        sqlite3_stmt* remove = nullptr;
        if (sqlite3_prepare_v2(db_, "DELETE FROM processed_events WHERE segment = ?1", -1,
                               &remove, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error(ErrorCode::PersistenceFailed, "Failed to prepare segment delete"));
        }
        sqlite3_bind_text(remove, 1, segment.c_str(), -1, SQLITE_TRANSIENT);
        const int rc = sqlite3_step(remove);
        sqlite3_finalize(remove);
        if (rc != SQLITE_DONE) {
            return tl::unexpected(make_sql_error(ErrorCode::PersistenceFailed, "Failed to drop ledger segment"));
        }

        for (const auto& id : ids) {
            known_.erase(id);
        }
        return ids.size();
    }

    /// Administrative wipe of every entry, durable and pending.
    Expected<void> clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        char* err_msg = nullptr;
        if (sqlite3_exec(db_, "DELETE FROM processed_events", nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string message = err_msg != nullptr ? err_msg : "Unknown SQLite error";
            sqlite3_free(err_msg);
            return tl::unexpected(Error{ErrorCode::PersistenceFailed, std::move(message), db_path_});
        }
        known_.clear();
        pending_.clear();
        return {};
    }

    /// UTC day a timestamp falls in.
    static std::string segment_for(Timestamp timestamp) {
        const std::time_t seconds = static_cast<std::time_t>(timestamp);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        char buffer[16];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &utc);
        return buffer;
    }

private:
    struct Pending {
        std::string event_id;
        Timestamp processed_at;
    };

    ProcessedEventLedger(sqlite3* db, std::string db_path)
        : db_(db)
        , db_path_(std::move(db_path))
    {}

    Expected<void> initialize_schema() {
        char* err_msg = nullptr;
        constexpr const char* schema_sql =
            "CREATE TABLE IF NOT EXISTS processed_events("
            "event_id TEXT PRIMARY KEY,"
            "segment TEXT NOT NULL,"
            "processed_at INTEGER NOT NULL"
            ");"
            "CREATE INDEX IF NOT EXISTS processed_events_segment ON processed_events(segment)";
        if (sqlite3_exec(db_, schema_sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string message = err_msg != nullptr ? err_msg : "Unknown SQLite error";
            sqlite3_free(err_msg);
            return tl::unexpected(Error{ErrorCode::PersistenceFailed, std::move(message), db_path_});
        }

        constexpr const char* insert_sql =
            "INSERT OR IGNORE INTO processed_events(event_id, segment, processed_at) VALUES (?1, ?2, ?3)";
        if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt_insert_, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error(ErrorCode::PersistenceFailed, "Failed to prepare ledger insert"));
        }
        return {};
    }

    Error make_sql_error(ErrorCode code, const std::string& prefix) const {
        return Error{code, prefix + ": " + sqlite3_errmsg(db_), db_path_};
    }

    sqlite3* db_ = nullptr;
    std::string db_path_;
    mutable std::mutex mutex_;
    sqlite3_stmt* stmt_insert_ = nullptr;
    std::unordered_set<std::string> known_;
    std::vector<Pending> pending_;
};

} // namespace ingestion
} // namespace maestro
