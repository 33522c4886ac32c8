#pragma once

#include <sqlite3.h>
#include <string>

#include <tasktrack/common/clock.hpp>
#include <tasktrack/common/error.hpp>
#include <tasktrack/common/log.hpp>

namespace tasktrack::storage {

    namespace detail {

        inline dp::Error sqliteError(sqlite3 *db, const std::string &context) {
            std::string msg = context;
            if (db) {
                msg += ": ";
                msg += sqlite3_errmsg(db);
            }
            return storage_failed(dp::String(msg.c_str()));
        }

    } // namespace detail

    // ===========================================
    // SqliteStore implementation
    // ===========================================

    inline SqliteStore::SqliteStore() : db_(nullptr), is_open_(false) {}

    inline SqliteStore::~SqliteStore() { close(); }

    inline SqliteStore::SqliteStore(SqliteStore &&other) noexcept
        : db_(other.db_), db_path_(std::move(other.db_path_)), is_open_(other.is_open_) {
        other.db_ = nullptr;
        other.is_open_ = false;
    }

    inline SqliteStore &SqliteStore::operator=(SqliteStore &&other) noexcept {
        if (this != &other) {
            close();
            db_ = other.db_;
            db_path_ = std::move(other.db_path_);
            is_open_ = other.is_open_;
            other.db_ = nullptr;
            other.is_open_ = false;
        }
        return *this;
    }

    inline dp::Result<void, dp::Error> SqliteStore::open(const std::string &path, const OpenOptions &opts) {
        close();

        int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK) {
            auto err = detail::sqliteError(db_, "Failed to open database " + path);
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            log::error("storage", errorMessage(err));
            return dp::Result<void, dp::Error>::err(err);
        }

        db_path_ = path;
        is_open_ = true;

        auto pragmas = applyPragmas(opts);
        if (!pragmas.is_ok()) {
            log::error("storage", errorMessage(pragmas.error()));
            close();
            return pragmas;
        }

        log::debug("storage", log::concat("opened ", path));
        return dp::Result<void, dp::Error>::ok();
    }

    inline void SqliteStore::close() {
        if (db_) {
            // sqlite3_close_v2 defers the release if a statement is still live
            sqlite3_close_v2(db_);
            db_ = nullptr;
            is_open_ = false;
            log::debug("storage", log::concat("closed ", db_path_));
        }
    }

    inline bool SqliteStore::isOpen() const { return is_open_; }

    inline dp::Result<void, dp::Error> SqliteStore::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return dp::Result<void, dp::Error>::err(store_not_open());

        if (opts.enable_wal) {
            // In-memory databases answer "memory" here, which is fine
            if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr) != SQLITE_OK) {
                log::warn("storage", log::concat("WAL unavailable: ", sqlite3_errmsg(db_)));
            }
        }

        if (opts.enable_foreign_keys) {
            if (sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr) != SQLITE_OK) {
                return dp::Result<void, dp::Error>::err(detail::sqliteError(db_, "Failed to enable foreign keys"));
            }
        }

        if (sqlite3_busy_timeout(db_, opts.busy_timeout_ms) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(detail::sqliteError(db_, "Failed to set busy timeout"));
        }

        std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";";
        sqlite3_exec(db_, cache_size.c_str(), nullptr, nullptr, nullptr);

        std::string sync_mode;
        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        if (sqlite3_exec(db_, sync_mode.c_str(), nullptr, nullptr, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(detail::sqliteError(db_, "Failed to set synchronous mode"));
        }

        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Schema versioning
    // ===========================================

    inline dp::Result<void, dp::Error> SqliteStore::applySchema(const ISchemaExtension &schema) {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(store_not_open());

        auto tx = beginTransaction(TxGuard::Mode::Immediate);
        if (!tx->isActive())
            return dp::Result<void, dp::Error>::err(detail::sqliteError(db_, "Failed to begin schema transaction"));

        auto created = executeSql(SCHEMA_MIGRATIONS_TABLE);
        if (!created.is_ok())
            return created;

        const int32_t current_version = schemaVersion();
        const int32_t target_version = schema.getSchemaVersion();

        if (current_version >= target_version)
            return dp::Result<void, dp::Error>::ok();

        if (current_version == 0) {
            // Fresh database: the create statements describe the latest layout
            for (const auto &sql : schema.getCreateTableStatements()) {
                auto r = executeSql(sql);
                if (!r.is_ok())
                    return r;
            }
            for (const auto &sql : schema.getCreateIndexStatements()) {
                auto r = executeSql(sql);
                if (!r.is_ok())
                    return r;
            }
        } else {
            for (const auto &[version, statements] : schema.getMigrations()) {
                if (version <= current_version || version > target_version)
                    continue;
                for (const auto &sql : statements) {
                    auto r = executeSql(sql);
                    if (!r.is_ok())
                        return r;
                }
                log::info("storage", log::concat("applied migration to schema version ", version));
            }
        }

        auto recorded = setSchemaVersion(target_version);
        if (!recorded.is_ok())
            return recorded;

        auto committed = tx->commit();
        if (!committed.is_ok())
            return committed;

        log::info("storage", log::concat("schema at version ", target_version, " (was ", current_version, ")"));
        return dp::Result<void, dp::Error>::ok();
    }

    inline bool SqliteStore::tableExists(const std::string &table_name) {
        if (!db_)
            return false;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_text(stmt, 1, table_name.c_str(), -1, SQLITE_TRANSIENT);

        bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
        sqlite3_finalize(stmt);

        return exists;
    }

    inline int32_t SqliteStore::schemaVersion() {
        if (!tableExists("schema_migrations"))
            return 0;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT MAX(version) FROM schema_migrations";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        int32_t version = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = sqlite3_column_int(stmt, 0);
        }

        sqlite3_finalize(stmt);
        return version;
    }

    inline dp::Result<void, dp::Error> SqliteStore::setSchemaVersion(int32_t version) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(detail::sqliteError(db_, "Failed to record schema version"));
        }

        sqlite3_bind_int(stmt, 1, version);
        sqlite3_bind_int64(stmt, 2, currentTimestamp());

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(detail::sqliteError(db_, "Failed to record schema version"));
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Transaction Guard
    // ===========================================

    inline SqliteStore::TxGuard::TxGuard(SqliteStore &store, Mode mode)
        : store_(store), active_(false), committed_(false) {
        if (store_.db_) {
            const char *begin = (mode == Mode::Immediate) ? "BEGIN IMMEDIATE TRANSACTION" : "BEGIN TRANSACTION";
            active_ = (sqlite3_exec(store_.db_, begin, nullptr, nullptr, nullptr) == SQLITE_OK);
            if (!active_)
                log::warn("storage", log::concat("BEGIN failed: ", sqlite3_errmsg(store_.db_)));
        }
    }

    inline SqliteStore::TxGuard::~TxGuard() {
        if (active_ && !committed_) {
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
            log::debug("storage", "transaction rolled back");
        }
    }

    inline dp::Result<void, dp::Error> SqliteStore::TxGuard::commit() {
        if (!active_ || committed_)
            return dp::Result<void, dp::Error>::err(storage_failed("No active transaction to commit"));

        if (sqlite3_exec(store_.db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
            auto err = detail::sqliteError(store_.db_, "Commit failed");
            log::error("storage", errorMessage(err));
            // Leave active_ set so the destructor rolls back
            return dp::Result<void, dp::Error>::err(err);
        }

        committed_ = true;
        active_ = false;
        return dp::Result<void, dp::Error>::ok();
    }

    inline void SqliteStore::TxGuard::rollback() {
        if (active_ && !committed_) {
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
            committed_ = true;
            active_ = false;
        }
    }

    inline std::unique_ptr<SqliteStore::TxGuard> SqliteStore::beginTransaction(TxGuard::Mode mode) {
        return std::make_unique<TxGuard>(*this, mode);
    }

    // ===========================================
    // Statement execution
    // ===========================================

    inline dp::Result<sqlite3_stmt *, dp::Error> SqliteStore::prepare(const std::string &sql,
                                                                       const std::vector<std::string> &params) {
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<sqlite3_stmt *, dp::Error>::err(detail::sqliteError(db_, "Failed to prepare statement"));
        }

        for (size_t i = 0; i < params.size(); ++i) {
            if (sqlite3_bind_text(stmt, static_cast<int>(i + 1), params[i].c_str(), -1, SQLITE_TRANSIENT) !=
                SQLITE_OK) {
                auto err = detail::sqliteError(db_, "Failed to bind parameter " + std::to_string(i + 1));
                sqlite3_finalize(stmt);
                return dp::Result<sqlite3_stmt *, dp::Error>::err(err);
            }
        }

        return dp::Result<sqlite3_stmt *, dp::Error>::ok(stmt);
    }

    inline dp::Result<void, dp::Error> SqliteStore::executeSql(const std::string &sql) {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(store_not_open());

        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);

        if (rc != SQLITE_OK) {
            std::string msg = "SQL execution failed";
            if (errmsg) {
                msg += ": ";
                msg += errmsg;
                sqlite3_free(errmsg);
            }
            return dp::Result<void, dp::Error>::err(storage_failed(dp::String(msg.c_str())));
        }

        return dp::Result<void, dp::Error>::ok();
    }

    inline dp::Result<int64_t, dp::Error> SqliteStore::executeUpdate(const std::string &sql,
                                                                     const std::vector<std::string> &params) {
        if (!db_ || !is_open_)
            return dp::Result<int64_t, dp::Error>::err(store_not_open());

        auto prepared = prepare(sql, params);
        if (!prepared.is_ok())
            return dp::Result<int64_t, dp::Error>::err(prepared.error());
        sqlite3_stmt *stmt = prepared.value();

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE)
            return dp::Result<int64_t, dp::Error>::err(detail::sqliteError(db_, "Statement failed"));

        return dp::Result<int64_t, dp::Error>::ok(static_cast<int64_t>(sqlite3_changes(db_)));
    }

    inline dp::Result<void, dp::Error> SqliteStore::executeQuery(const std::string &sql,
                                                                 const std::vector<std::string> &params,
                                                                 const std::function<void(const Row &row)> &callback) {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(store_not_open());

        auto prepared = prepare(sql, params);
        if (!prepared.is_ok())
            return dp::Result<void, dp::Error>::err(prepared.error());
        sqlite3_stmt *stmt = prepared.value();

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            Row row;
            int col_count = sqlite3_column_count(stmt);
            row.reserve(static_cast<size_t>(col_count));
            for (int i = 0; i < col_count; ++i) {
                const unsigned char *text = sqlite3_column_text(stmt, i);
                row.emplace_back(text ? reinterpret_cast<const char *>(text) : "");
            }
            if (callback)
                callback(row);
        }

        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(detail::sqliteError(db_, "Query failed"));

        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Diagnostics
    // ===========================================

    inline bool SqliteStore::quickCheck() {
        if (!db_ || !is_open_)
            return false;

        sqlite3_stmt *stmt;
        const char *sql = "PRAGMA quick_check";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        bool ok = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const unsigned char *text = sqlite3_column_text(stmt, 0);
            ok = text && std::string(reinterpret_cast<const char *>(text)) == "ok";
        }

        sqlite3_finalize(stmt);
        return ok;
    }

    inline std::string SqliteStore::lastErrorMessage() const {
        if (!db_)
            return "database not open";
        return sqlite3_errmsg(db_);
    }

} // namespace tasktrack::storage
