#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace tasktrack::storage {

    // ===========================================
    // Core Types
    // ===========================================

    /// SQLite database configuration
    struct OpenOptions {
        bool enable_wal = true;
        bool enable_foreign_keys = true; // cascades depend on this
        int32_t busy_timeout_ms = 5000;
        int32_t cache_size_kb = 20000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;

        OpenOptions() = default;
    };

    /// One result row. NULL columns read back as empty strings.
    using Row = std::vector<std::string>;

    // ===========================================
    // Schema definition interface
    // ===========================================

    /// A versioned schema applied through SqliteStore::applySchema
    class ISchemaExtension {
      public:
        virtual ~ISchemaExtension() = default;

        /// Version recorded in schema_migrations once the schema is installed
        virtual int32_t getSchemaVersion() const = 0;

        /// CREATE TABLE statements, "IF NOT EXISTS" for idempotency
        virtual std::vector<std::string> getCreateTableStatements() const = 0;

        /// CREATE INDEX statements
        virtual std::vector<std::string> getCreateIndexStatements() const = 0;

        /// Upgrade steps keyed by the version they bring the database to
        virtual std::vector<std::pair<int32_t, std::vector<std::string>>> getMigrations() const { return {}; }
    };

    // ===========================================
    // SqliteStore - connection and transaction owner
    // ===========================================

    class SqliteStore {
      public:
        SqliteStore();
        ~SqliteStore();

        // Non-copyable, movable
        SqliteStore(const SqliteStore &) = delete;
        SqliteStore &operator=(const SqliteStore &) = delete;
        SqliteStore(SqliteStore &&) noexcept;
        SqliteStore &operator=(SqliteStore &&) noexcept;

        /// Open or create database at given path
        /// @param path Database file path (e.g. "data/projects.db") or ":memory:"
        /// @param opts Configuration options
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Close database connection
        void close();

        /// Check if database is open
        bool isOpen() const;

        const std::string &path() const { return db_path_; }

        /// Install or upgrade a schema. Idempotent: a schema whose version is already
        /// recorded is left untouched.
        dp::Result<void, dp::Error> applySchema(const ISchemaExtension &schema);

        /// Highest version recorded in schema_migrations, 0 for a fresh database
        int32_t schemaVersion();

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        class TxGuard {
          public:
            /// Deferred takes locks lazily (reads); Immediate takes the write lock up front
            enum class Mode { Deferred, Immediate };

            explicit TxGuard(SqliteStore &store, Mode mode = Mode::Deferred);
            ~TxGuard();

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            /// True while BEGIN succeeded and neither commit nor rollback has run
            bool isActive() const { return active_; }

            dp::Result<void, dp::Error> commit();
            void rollback();

          private:
            SqliteStore &store_;
            bool active_;
            bool committed_;
        };

        std::unique_ptr<TxGuard> beginTransaction(TxGuard::Mode mode = TxGuard::Mode::Deferred);

        // ===========================================
        // Statement execution
        // ===========================================

        /// Execute one or more SQL statements without parameters
        dp::Result<void, dp::Error> executeSql(const std::string &sql);

        /// Execute prepared statement with text parameters
        /// @return Number of affected rows
        dp::Result<int64_t, dp::Error> executeUpdate(const std::string &sql, const std::vector<std::string> &params);

        /// Run a query, invoking callback once per result row
        dp::Result<void, dp::Error> executeQuery(const std::string &sql, const std::vector<std::string> &params,
                                                 const std::function<void(const Row &row)> &callback);

        // ===========================================
        // Diagnostics
        // ===========================================

        /// Run SQLite integrity check
        /// @return true if database is healthy, false on corruption
        bool quickCheck();

        /// Most recent SQLite error text for this connection
        std::string lastErrorMessage() const;

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;

        dp::Result<void, dp::Error> applyPragmas(const OpenOptions &opts);
        dp::Result<sqlite3_stmt *, dp::Error> prepare(const std::string &sql, const std::vector<std::string> &params);
        bool tableExists(const std::string &table_name);
        dp::Result<void, dp::Error> setSchemaVersion(int32_t version);

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";
    };

} // namespace tasktrack::storage

#include "sqlite_store_impl.hpp"
