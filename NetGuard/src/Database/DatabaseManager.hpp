#pragma once
/**
 * ============================================================================
 * NetGuard DatabaseManager - HEADER
 * ============================================================================
 *
 * @file DatabaseManager.hpp
 * @brief SQLite access layer with connection pooling, built on SQLiteCpp.
 *
 * One DatabaseManager instance owns one database file. Stores (AuditLogDB,
 * BlockedSiteStore) hold a reference to it; the engine owns the instance so
 * every test gets a fresh store.
 *
 * Key Components:
 * ---------------
 * 1. DatabaseConfig  - path, pool sizes, pragmas
 * 2. DatabaseError   - SQLite code, extended code, message, query, context
 * 3. QueryResult     - iterator-style rows; returns its connection on destruction
 * 4. ConnectionPool  - pre-opened connections with timed acquisition
 * 5. Transaction     - RAII BEGIN/COMMIT, rolls back unless committed
 *
 * Errors never cross the public API as exceptions: every call takes an
 * optional DatabaseError* and reports failure through its return value.
 *
 * Usage Example:
 * --------------
 * @code
 *   DatabaseConfig config;
 *   config.databasePath = "/var/lib/netguard/netguard.db";
 *
 *   DatabaseManager db;
 *   DatabaseError err;
 *   if (!db.Initialize(config, &err)) { ... }
 *
 *   auto rows = db.QueryWithParams("SELECT domain FROM blocked_sites WHERE active = ?", &err, 1);
 *   while (rows.Next()) {
 *       std::string domain = rows.GetString(0);
 *   }
 *
 *   auto txn = db.BeginTransaction(Transaction::Type::Immediate, &err);
 *   if (txn && txn->IsActive()) {
 *       txn->ExecuteWithParams("UPDATE ...", &err, ...);
 *       txn->Commit(&err);
 *   }
 * @endcode
 *
 * ============================================================================
 */

#include <SQLiteCpp/SQLiteCpp.h>
#include <sqlite3.h>

#include "../Utils/Logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace NetGuard {
    namespace Database {

        class DatabaseManager;

        // ============================================================================
        // ERROR HANDLING
        // ============================================================================

        /**
         * @brief Structured error information for database operations.
         */
        struct DatabaseError {
            int sqliteCode = SQLITE_OK;     ///< Primary SQLite result code
            int extendedCode = 0;           ///< Extended error code for details
            std::string message;            ///< Human-readable error message
            std::string query;              ///< SQL query that caused the error
            std::string context;            ///< Operation context (function name)

            bool HasError() const noexcept { return sqliteCode != SQLITE_OK; }

            void Clear() noexcept {
                sqliteCode = SQLITE_OK;
                extendedCode = 0;
                message.clear();
                query.clear();
                context.clear();
            }
        };

        // ============================================================================
        // CONFIGURATION
        // ============================================================================

        struct DatabaseConfig {
            std::string databasePath = "netguard.db";  ///< Full path to database file
            bool enableWAL = true;                     ///< Enable Write-Ahead Logging
            bool enableForeignKeys = true;
            int busyTimeoutMs = 5000;                  ///< Wait time for locked database
            size_t cacheSizeKB = 8192;

            size_t maxConnections = 8;                 ///< Maximum pool size
            size_t minConnections = 2;                 ///< Pre-opened connections
            std::chrono::milliseconds connectionTimeout = std::chrono::seconds(10);

            std::string synchronousMode = "NORMAL";    ///< OFF/NORMAL/FULL/EXTRA
        };

        // ============================================================================
        // QUERY RESULT
        // ============================================================================

        /**
         * @brief Iterator-style result set for SELECT queries.
         *
         * @note Move-only. Not thread-safe.
         */
        class QueryResult {
        public:
            QueryResult() = default;

            QueryResult(std::unique_ptr<SQLite::Statement>&& stmt,
                        std::shared_ptr<SQLite::Database> conn,
                        DatabaseManager* manager) noexcept
                : m_statement(std::move(stmt)), m_connection(std::move(conn)), m_manager(manager) {}

            ~QueryResult();

            QueryResult(QueryResult&& other) noexcept;
            QueryResult& operator=(QueryResult&& other) noexcept;
            QueryResult(const QueryResult&) = delete;
            QueryResult& operator=(const QueryResult&) = delete;

            /**
             * @brief Advances to the next row.
             * @return false at end of results or on error (error is logged)
             */
            bool Next(DatabaseError* err = nullptr);

            [[nodiscard]] bool IsValid() const noexcept { return m_statement != nullptr; }

            int GetInt(int columnIndex) const;
            int64_t GetInt64(int columnIndex) const;
            double GetDouble(int columnIndex) const;
            std::string GetString(int columnIndex) const;

            bool IsNull(int columnIndex) const;

        private:
            void release() noexcept;

            // statement must be destroyed before its connection returns to the pool
            std::unique_ptr<SQLite::Statement> m_statement;
            std::shared_ptr<SQLite::Database> m_connection;
            DatabaseManager* m_manager = nullptr;
        };

        // ============================================================================
        // CONNECTION POOL
        // ============================================================================

        class ConnectionPool {
        public:
            explicit ConnectionPool(const DatabaseConfig& config) noexcept;
            ~ConnectionPool();

            ConnectionPool(const ConnectionPool&) = delete;
            ConnectionPool& operator=(const ConnectionPool&) = delete;

            bool Initialize(DatabaseError* err = nullptr);
            void Shutdown();

            /**
             * @brief Borrows a connection, opening a new one while under maxConnections.
             * @return nullptr on timeout or shutdown (err set to SQLITE_BUSY / SQLITE_MISUSE)
             */
            std::shared_ptr<SQLite::Database> Acquire(std::chrono::milliseconds timeout, DatabaseError* err = nullptr);
            void Release(std::shared_ptr<SQLite::Database> conn);

        private:
            struct PooledConnection {
                std::shared_ptr<SQLite::Database> connection;
                bool inUse = false;
            };

            bool createConnection(DatabaseError* err);
            bool configureConnection(SQLite::Database& db, DatabaseError* err);

            DatabaseConfig m_config;
            mutable std::mutex m_mutex;
            std::condition_variable m_cv;
            std::vector<PooledConnection> m_connections;
            std::atomic<bool> m_shutdown{ false };
        };

        // ============================================================================
        // TRANSACTION (RAII)
        // ============================================================================

        /**
         * @brief Holds one pooled connection for its lifetime.
         *
         * Rolls back in the destructor unless Commit() succeeded. All statements
         * of the unit of work must go through the Transaction's own Execute*,
         * Query* helpers so they run on the held connection.
         */
        class Transaction {
        public:
            enum class Type {
                Deferred,   ///< Lock acquired on first read/write
                Immediate,  ///< RESERVED lock acquired immediately
                Exclusive   ///< EXCLUSIVE lock acquired immediately
            };

            Transaction(std::shared_ptr<SQLite::Database> conn,
                        DatabaseManager* manager,
                        Type type = Type::Deferred,
                        DatabaseError* err = nullptr);
            ~Transaction();

            Transaction(const Transaction&) = delete;
            Transaction& operator=(const Transaction&) = delete;

            bool Commit(DatabaseError* err = nullptr);
            bool Rollback(DatabaseError* err = nullptr);
            bool IsActive() const noexcept { return m_active; }

            bool Execute(std::string_view sql, DatabaseError* err = nullptr);

            /// @return rows changed, or -1 on failure
            template<typename... Args>
            int ExecuteWithParams(std::string_view sql, DatabaseError* err, Args&&... args);

            /// @return rowid of the inserted row, or 0 on failure
            template<typename... Args>
            int64_t InsertWithParams(std::string_view sql, DatabaseError* err, Args&&... args);

            /**
             * @brief Runs a SELECT on the held connection.
             *
             * The result must be consumed before Commit/Rollback.
             */
            template<typename... Args>
            QueryResult QueryWithParams(std::string_view sql, DatabaseError* err, Args&&... args);

        private:
            std::shared_ptr<SQLite::Database> m_connection;
            DatabaseManager* m_manager = nullptr;
            bool m_active = false;
        };

        // ============================================================================
        // DATABASE MANAGER
        // ============================================================================

        class DatabaseManager {
        public:
            DatabaseManager() = default;
            ~DatabaseManager();

            DatabaseManager(const DatabaseManager&) = delete;
            DatabaseManager& operator=(const DatabaseManager&) = delete;

            // === Initialization ===
            bool Initialize(const DatabaseConfig& config, DatabaseError* err = nullptr);
            void Shutdown();
            bool IsInitialized() const noexcept { return m_initialized.load(); }

            // === Schema Management ===
            int GetSchemaVersion(DatabaseError* err = nullptr);
            bool SetSchemaVersion(int version, DatabaseError* err = nullptr);

            // === Query Execution ===
            bool Execute(std::string_view sql, DatabaseError* err = nullptr);
            bool ExecuteMany(const std::vector<std::string>& statements, DatabaseError* err = nullptr);

            /// @return rows changed, or -1 on failure
            template<typename... Args>
            int ExecuteWithParams(std::string_view sql, DatabaseError* err, Args&&... args);

            /// @return rowid of the inserted row (from the same connection), or 0 on failure
            template<typename... Args>
            int64_t InsertWithParams(std::string_view sql, DatabaseError* err, Args&&... args);

            template<typename... Args>
            QueryResult QueryWithParams(std::string_view sql, DatabaseError* err, Args&&... args);

            /// Single integer from the first column of the first row; fallback when no row
            template<typename... Args>
            int64_t QueryScalar(std::string_view sql, int64_t fallback, DatabaseError* err, Args&&... args);

            // === Transactions ===
            std::unique_ptr<Transaction> BeginTransaction(
                Transaction::Type type = Transaction::Type::Deferred,
                DatabaseError* err = nullptr);

            // === Connection Access (Advanced) ===
            std::shared_ptr<SQLite::Database> AcquireConnection(DatabaseError* err = nullptr);
            void ReleaseConnection(std::shared_ptr<SQLite::Database> conn);

            const DatabaseConfig& GetConfig() const noexcept { return m_config; }

            // === Parameter Binding Helpers ===
            template<typename T>
            static void bindParameter(SQLite::Statement& stmt, int index, T&& value);

            template<typename T, typename... Args>
            static void bindParameters(SQLite::Statement& stmt, int index, T&& first, Args&&... rest);

            static void bindParameters(SQLite::Statement&, int) {}

            // === Error Handling ===
            static void setError(DatabaseError* err, int code, std::string_view msg, std::string_view ctx = {});
            static void setError(DatabaseError* err, const SQLite::Exception& ex, std::string_view sql, std::string_view ctx);

        private:
            // RAII guard ensures connection release on every path
            struct ConnectionGuard {
                DatabaseManager* mgr;
                std::shared_ptr<SQLite::Database> conn;
                bool released = false;
                ~ConnectionGuard() {
                    if (!released && conn && mgr) mgr->ReleaseConnection(std::move(conn));
                }
            };

            std::atomic<bool> m_initialized{ false };
            DatabaseConfig m_config;
            std::unique_ptr<ConnectionPool> m_connectionPool;
            mutable std::shared_mutex m_configMutex;
        };

        // ============================================================================
        // TEMPLATE IMPLEMENTATIONS
        // ============================================================================

        template<typename T>
        void DatabaseManager::bindParameter(SQLite::Statement& stmt, int index, T&& value) {
            using DecayT = std::decay_t<T>;

            if constexpr (std::is_same_v<DecayT, bool>) {
                stmt.bind(index, static_cast<int>(value));
            }
            else if constexpr (std::is_integral_v<DecayT>) {
                stmt.bind(index, static_cast<int64_t>(value));
            }
            else if constexpr (std::is_floating_point_v<DecayT>) {
                stmt.bind(index, static_cast<double>(value));
            }
            else if constexpr (std::is_same_v<DecayT, const char*> || std::is_same_v<DecayT, char*>) {
                if (value) stmt.bind(index, std::string(value));
                else stmt.bind(index);
            }
            else if constexpr (std::is_same_v<DecayT, std::string>) {
                stmt.bind(index, value);
            }
            else if constexpr (std::is_same_v<DecayT, std::string_view>) {
                stmt.bind(index, std::string(value));
            }
            else if constexpr (std::is_same_v<DecayT, std::vector<uint8_t>>) {
                if (value.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
                    throw SQLite::Exception("blob too large to bind", SQLITE_TOOBIG);
                }
                stmt.bind(index, value.data(), static_cast<int>(value.size()));
            }
            else if constexpr (std::is_same_v<DecayT, std::nullptr_t>) {
                stmt.bind(index);  // NULL
            }
            else if constexpr (std::is_same_v<DecayT, std::optional<int64_t>>) {
                if (value) stmt.bind(index, *value);
                else stmt.bind(index);
            }
            else {
                static_assert(sizeof(T) == 0, "Unsupported parameter type");
            }
        }

        template<typename T, typename... Args>
        void DatabaseManager::bindParameters(SQLite::Statement& stmt, int index, T&& first, Args&&... rest) {
            bindParameter(stmt, index, std::forward<T>(first));
            bindParameters(stmt, index + 1, std::forward<Args>(rest)...);
        }

        template<typename... Args>
        int DatabaseManager::ExecuteWithParams(std::string_view sql, DatabaseError* err, Args&&... args) {
            auto conn = AcquireConnection(err);
            if (!conn) return -1;
            ConnectionGuard guard{ this, conn };

            try {
                SQLite::Statement stmt(*conn, std::string(sql));
                bindParameters(stmt, 1, std::forward<Args>(args)...);
                return stmt.exec();
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, sql, "ExecuteWithParams");
                return -1;
            }
        }

        template<typename... Args>
        int64_t DatabaseManager::InsertWithParams(std::string_view sql, DatabaseError* err, Args&&... args) {
            auto conn = AcquireConnection(err);
            if (!conn) return 0;
            ConnectionGuard guard{ this, conn };

            try {
                SQLite::Statement stmt(*conn, std::string(sql));
                bindParameters(stmt, 1, std::forward<Args>(args)...);
                stmt.exec();
                return conn->getLastInsertRowid();
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, sql, "InsertWithParams");
                return 0;
            }
        }

        template<typename... Args>
        QueryResult DatabaseManager::QueryWithParams(std::string_view sql, DatabaseError* err, Args&&... args) {
            auto conn = AcquireConnection(err);
            if (!conn) return QueryResult{};
            ConnectionGuard guard{ this, conn };

            try {
                auto stmt = std::make_unique<SQLite::Statement>(*conn, std::string(sql));
                bindParameters(*stmt, 1, std::forward<Args>(args)...);
                // QueryResult takes over the release
                guard.released = true;
                return QueryResult{ std::move(stmt), conn, this };
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, sql, "QueryWithParams");
                return QueryResult{};
            }
        }

        template<typename... Args>
        int64_t DatabaseManager::QueryScalar(std::string_view sql, int64_t fallback, DatabaseError* err, Args&&... args) {
            auto result = QueryWithParams(sql, err, std::forward<Args>(args)...);
            if (!result.IsValid() || !result.Next(err) || result.IsNull(0)) return fallback;
            return result.GetInt64(0);
        }

        template<typename... Args>
        int Transaction::ExecuteWithParams(std::string_view sql, DatabaseError* err, Args&&... args) {
            if (!m_active || !m_connection) {
                DatabaseManager::setError(err, SQLITE_MISUSE, "Transaction not active", "Transaction::ExecuteWithParams");
                return -1;
            }
            try {
                SQLite::Statement stmt(*m_connection, std::string(sql));
                DatabaseManager::bindParameters(stmt, 1, std::forward<Args>(args)...);
                return stmt.exec();
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, sql, "Transaction::ExecuteWithParams");
                return -1;
            }
        }

        template<typename... Args>
        int64_t Transaction::InsertWithParams(std::string_view sql, DatabaseError* err, Args&&... args) {
            if (ExecuteWithParams(sql, err, std::forward<Args>(args)...) < 0) return 0;
            return m_connection->getLastInsertRowid();
        }

        template<typename... Args>
        QueryResult Transaction::QueryWithParams(std::string_view sql, DatabaseError* err, Args&&... args) {
            if (!m_active || !m_connection) {
                DatabaseManager::setError(err, SQLITE_MISUSE, "Transaction not active", "Transaction::QueryWithParams");
                return QueryResult{};
            }
            try {
                auto stmt = std::make_unique<SQLite::Statement>(*m_connection, std::string(sql));
                DatabaseManager::bindParameters(*stmt, 1, std::forward<Args>(args)...);
                // no manager: the connection stays with the transaction
                return QueryResult{ std::move(stmt), m_connection, nullptr };
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, sql, "Transaction::QueryWithParams");
                return QueryResult{};
            }
        }

    } // namespace Database
} // namespace NetGuard
