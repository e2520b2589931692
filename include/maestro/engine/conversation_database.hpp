#pragma once

#include "../conversation.hpp"
#include "../types.hpp"

#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace maestro {
namespace engine {

/**
 * @brief Durable storage for conversation records.
 */
class IConversationRepository {
public:
    virtual ~IConversationRepository() = default;

    /// Insert or replace the record for `conversation.id`.
    virtual Expected<void> save(const Conversation& conversation) = 0;

    /// Every stored conversation, oldest first.
    virtual Expected<std::vector<Conversation>> load_all() = 0;
};

/**
 * @brief SQLite repository storing one JSON record per conversation.
 *
 * Title, phase and update time are kept in their own columns as a
 * lightweight index; the full record lives in `payload`.
 */
class ConversationDatabase : public IConversationRepository {
public:
    ~ConversationDatabase() override {
        if (stmt_upsert_ != nullptr) {
            sqlite3_finalize(stmt_upsert_);
            stmt_upsert_ = nullptr;
        }
        if (stmt_select_all_ != nullptr) {
            sqlite3_finalize(stmt_select_all_);
            stmt_select_all_ = nullptr;
        }
        if (db_ != nullptr) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    ConversationDatabase(const ConversationDatabase&) = delete;
    ConversationDatabase& operator=(const ConversationDatabase&) = delete;

    static Expected<std::shared_ptr<ConversationDatabase>> open(const std::string& path) {
        if (path.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidDataPath, "Conversation database path cannot be empty"});
        }

        sqlite3* db = nullptr;
        if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
            std::string message = "Failed to open conversation database";
            if (db != nullptr && sqlite3_errmsg(db) != nullptr) {
                message += std::string(": ") + sqlite3_errmsg(db);
            }
            if (db != nullptr) {
                sqlite3_close(db);
            }
            return tl::unexpected(Error{ErrorCode::StoreReadFailed, std::move(message), path});
        }

        auto instance = std::shared_ptr<ConversationDatabase>(new ConversationDatabase(db, path));
        auto init_result = instance->initialize_schema();
        if (!init_result) {
            return tl::unexpected(init_result.error());
        }
        return instance;
    }

    Expected<void> save(const Conversation& conversation) override {
        std::string payload;
        try {
            payload = nlohmann::json(conversation).dump();
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::StoreWriteFailed, "Failed to serialize conversation", e.what()});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        sqlite3_bind_text(stmt_upsert_, 1, conversation.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_upsert_, 2, conversation.title.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_upsert_, 3, conversation.phase.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_upsert_, 4, static_cast<sqlite3_int64>(conversation.created_at));
        sqlite3_bind_int64(stmt_upsert_, 5, static_cast<sqlite3_int64>(now_seconds()));
        sqlite3_bind_text(stmt_upsert_, 6, payload.c_str(), -1, SQLITE_TRANSIENT);

        const int rc = sqlite3_step(stmt_upsert_);
        sqlite3_reset(stmt_upsert_);
        sqlite3_clear_bindings(stmt_upsert_);
        if (rc != SQLITE_DONE) {
            return tl::unexpected(make_sql_error(ErrorCode::StoreWriteFailed, "Failed to save conversation"));
        }
        return {};
    }

    Expected<std::vector<Conversation>> load_all() override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<Conversation> conversations;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt_select_all_)) == SQLITE_ROW) {
            const auto* id = reinterpret_cast<const char*>(sqlite3_column_text(stmt_select_all_, 0));
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_select_all_, 1));
            if (text == nullptr) {
                continue;
            }
            try {
                conversations.push_back(nlohmann::json::parse(text).get<Conversation>());
            } catch (const nlohmann::json::exception& e) {
                sqlite3_reset(stmt_select_all_);
                return tl::unexpected(Error{
                    ErrorCode::CorruptRecord,
                    std::string("Corrupt conversation record: ") + e.what(),
                    id != nullptr ? std::string(id) : db_path_
                });
            }
        }
        sqlite3_reset(stmt_select_all_);
        if (rc != SQLITE_DONE) {
            return tl::unexpected(make_sql_error(ErrorCode::StoreReadFailed, "Failed to read conversations"));
        }
        return conversations;
    }

private:
    ConversationDatabase(sqlite3* db, std::string db_path)
        : db_(db)
        , db_path_(std::move(db_path))
    {}

    Expected<void> initialize_schema() {
        char* err_msg = nullptr;
        constexpr const char* schema_sql =
            "CREATE TABLE IF NOT EXISTS conversations("
            "id TEXT PRIMARY KEY,"
            "title TEXT NOT NULL,"
            "phase TEXT NOT NULL,"
            "created_at INTEGER NOT NULL,"
            "updated_at INTEGER NOT NULL,"
            "payload TEXT NOT NULL"
            ")";
        if (sqlite3_exec(db_, schema_sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string message = err_msg != nullptr ? err_msg : "Unknown SQLite error";
            sqlite3_free(err_msg);
            return tl::unexpected(Error{ErrorCode::StoreWriteFailed, std::move(message), db_path_});
        }

        constexpr const char* upsert_sql =
            "INSERT INTO conversations(id, title, phase, created_at, updated_at, payload) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6) "
            "ON CONFLICT(id) DO UPDATE SET title = excluded.title, phase = excluded.phase, "
            "updated_at = excluded.updated_at, payload = excluded.payload";
        if (sqlite3_prepare_v2(db_, upsert_sql, -1, &stmt_upsert_, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error(ErrorCode::StoreWriteFailed, "Failed to prepare upsert statement"));
        }

        constexpr const char* select_sql =
            "SELECT id, payload FROM conversations ORDER BY created_at, id";
        if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt_select_all_, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error(ErrorCode::StoreReadFailed, "Failed to prepare select statement"));
        }
        return {};
    }

    Error make_sql_error(ErrorCode code, const std::string& prefix) const {
        return Error{code, prefix + ": " + sqlite3_errmsg(db_), db_path_};
    }

    sqlite3* db_ = nullptr;
    std::string db_path_;
    mutable std::mutex mutex_;
    sqlite3_stmt* stmt_upsert_ = nullptr;
    sqlite3_stmt* stmt_select_all_ = nullptr;
};

/**
 * @brief Non-durable repository. Used when no data directory is wanted.
 */
class InMemoryConversationRepository : public IConversationRepository {
public:
    Expected<void> save(const Conversation& conversation) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& stored : records_) {
            if (stored.id == conversation.id) {
                stored = conversation;
                return {};
            }
        }
        records_.push_back(conversation);
        return {};
    }

    Expected<std::vector<Conversation>> load_all() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

private:
    std::mutex mutex_;
    std::vector<Conversation> records_;
};

} // namespace engine
} // namespace maestro
