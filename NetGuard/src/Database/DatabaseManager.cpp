#include "DatabaseManager.hpp"

#include <algorithm>
#include <filesystem>

namespace NetGuard {
    namespace Database {

        // ============================================================================
        // QueryResult
        // ============================================================================

        QueryResult::~QueryResult() {
            release();
        }

        QueryResult::QueryResult(QueryResult&& other) noexcept
            : m_statement(std::move(other.m_statement))
            , m_connection(std::move(other.m_connection))
            , m_manager(other.m_manager) {
            other.m_manager = nullptr;
        }

        QueryResult& QueryResult::operator=(QueryResult&& other) noexcept {
            if (this != &other) {
                release();
                m_statement = std::move(other.m_statement);
                m_connection = std::move(other.m_connection);
                m_manager = other.m_manager;
                other.m_manager = nullptr;
            }
            return *this;
        }

        void QueryResult::release() noexcept {
            m_statement.reset();
            if (m_connection && m_manager) {
                m_manager->ReleaseConnection(std::move(m_connection));
            }
            m_connection.reset();
            m_manager = nullptr;
        }

        bool QueryResult::Next(DatabaseError* err) {
            if (!m_statement) return false;
            try {
                return m_statement->executeStep();
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, m_statement->getQuery(), "QueryResult::Next");
                NG_LOG_ERROR("Database", "Row fetch failed: %s", ex.what());
                return false;
            }
        }

        int QueryResult::GetInt(int columnIndex) const {
            return m_statement->getColumn(columnIndex).getInt();
        }

        int64_t QueryResult::GetInt64(int columnIndex) const {
            return m_statement->getColumn(columnIndex).getInt64();
        }

        double QueryResult::GetDouble(int columnIndex) const {
            return m_statement->getColumn(columnIndex).getDouble();
        }

        std::string QueryResult::GetString(int columnIndex) const {
            auto col = m_statement->getColumn(columnIndex);
            if (col.isNull()) return {};
            return col.getString();
        }

        bool QueryResult::IsNull(int columnIndex) const {
            return m_statement->getColumn(columnIndex).isNull();
        }

        // ============================================================================
        // ConnectionPool
        // ============================================================================

        ConnectionPool::ConnectionPool(const DatabaseConfig& config) noexcept
            : m_config(config) {
        }

        ConnectionPool::~ConnectionPool() {
            Shutdown();
        }

        bool ConnectionPool::Initialize(DatabaseError* err) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_shutdown.store(false, std::memory_order_release);
            const size_t warm = std::max<size_t>(1, std::min(m_config.minConnections, m_config.maxConnections));
            for (size_t i = 0; i < warm; ++i) {
                if (!createConnection(err)) return false;
            }
            return true;
        }

        void ConnectionPool::Shutdown() {
            m_shutdown.store(true, std::memory_order_release);
            m_cv.notify_all();
            std::lock_guard<std::mutex> lock(m_mutex);
            m_connections.clear();
        }

        bool ConnectionPool::createConnection(DatabaseError* err) {
            try {
                auto db = std::make_shared<SQLite::Database>(
                    m_config.databasePath,
                    SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE | SQLite::OPEN_FULLMUTEX,
                    m_config.busyTimeoutMs);
                if (!configureConnection(*db, err)) return false;
                m_connections.push_back(PooledConnection{ std::move(db), false });
                return true;
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, {}, "ConnectionPool::createConnection");
                NG_LOG_ERROR("Database", "Cannot open %s: %s", m_config.databasePath.c_str(), ex.what());
                return false;
            }
        }

        bool ConnectionPool::configureConnection(SQLite::Database& db, DatabaseError* err) {
            try {
                if (m_config.enableWAL) {
                    db.exec("PRAGMA journal_mode = WAL");
                }
                db.exec("PRAGMA synchronous = " + m_config.synchronousMode);
                db.exec(std::string("PRAGMA foreign_keys = ") + (m_config.enableForeignKeys ? "ON" : "OFF"));
                db.exec("PRAGMA cache_size = -" + std::to_string(m_config.cacheSizeKB));
                db.exec("PRAGMA temp_store = MEMORY");
                return true;
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, {}, "ConnectionPool::configureConnection");
                return false;
            }
        }

        std::shared_ptr<SQLite::Database> ConnectionPool::Acquire(std::chrono::milliseconds timeout, DatabaseError* err) {
            std::unique_lock<std::mutex> lock(m_mutex);
            const auto deadline = std::chrono::steady_clock::now() + timeout;

            while (true) {
                if (m_shutdown.load(std::memory_order_acquire)) {
                    DatabaseManager::setError(err, SQLITE_MISUSE, "Connection pool is shut down", "ConnectionPool::Acquire");
                    return nullptr;
                }

                for (auto& pc : m_connections) {
                    if (!pc.inUse) {
                        pc.inUse = true;
                        return pc.connection;
                    }
                }

                if (m_connections.size() < m_config.maxConnections) {
                    if (!createConnection(err)) return nullptr;
                    m_connections.back().inUse = true;
                    return m_connections.back().connection;
                }

                if (m_cv.wait_until(lock, deadline) == std::cv_status::timeout) {
                    DatabaseManager::setError(err, SQLITE_BUSY, "Timed out waiting for a database connection",
                        "ConnectionPool::Acquire");
                    return nullptr;
                }
            }
        }

        void ConnectionPool::Release(std::shared_ptr<SQLite::Database> conn) {
            if (!conn) return;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                for (auto& pc : m_connections) {
                    if (pc.connection == conn) {
                        pc.inUse = false;
                        break;
                    }
                }
            }
            m_cv.notify_one();
        }

        // ============================================================================
        // Transaction
        // ============================================================================

        Transaction::Transaction(std::shared_ptr<SQLite::Database> conn,
            DatabaseManager* manager, Type type, DatabaseError* err)
            : m_connection(std::move(conn)), m_manager(manager) {
            if (!m_connection) {
                DatabaseManager::setError(err, SQLITE_MISUSE, "No connection", "Transaction");
                return;
            }

            const char* begin = "BEGIN DEFERRED";
            if (type == Type::Immediate) begin = "BEGIN IMMEDIATE";
            else if (type == Type::Exclusive) begin = "BEGIN EXCLUSIVE";

            try {
                m_connection->exec(begin);
                m_active = true;
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, begin, "Transaction::Begin");
            }
        }

        Transaction::~Transaction() {
            if (m_active) {
                DatabaseError err;
                if (!Rollback(&err)) {
                    NG_LOG_ERROR("Database", "Rollback on scope exit failed: %s", err.message.c_str());
                }
            }
            if (m_manager && m_connection) {
                m_manager->ReleaseConnection(std::move(m_connection));
            }
        }

        bool Transaction::Commit(DatabaseError* err) {
            if (!m_active) {
                DatabaseManager::setError(err, SQLITE_MISUSE, "Transaction not active", "Transaction::Commit");
                return false;
            }
            try {
                m_connection->exec("COMMIT");
                m_active = false;
                return true;
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, "COMMIT", "Transaction::Commit");
                return false;
            }
        }

        bool Transaction::Rollback(DatabaseError* err) {
            if (!m_active) return true;
            m_active = false;
            try {
                m_connection->exec("ROLLBACK");
                return true;
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, "ROLLBACK", "Transaction::Rollback");
                return false;
            }
        }

        bool Transaction::Execute(std::string_view sql, DatabaseError* err) {
            if (!m_active) {
                DatabaseManager::setError(err, SQLITE_MISUSE, "Transaction not active", "Transaction::Execute");
                return false;
            }
            try {
                m_connection->exec(std::string(sql));
                return true;
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, sql, "Transaction::Execute");
                return false;
            }
        }

        // ============================================================================
        // DatabaseManager
        // ============================================================================

        DatabaseManager::~DatabaseManager() {
            Shutdown();
        }

        bool DatabaseManager::Initialize(const DatabaseConfig& config, DatabaseError* err) {
            if (m_initialized.load(std::memory_order_acquire)) {
                return true;
            }

            std::unique_lock<std::shared_mutex> lock(m_configMutex);
            m_config = config;

            const std::filesystem::path p(m_config.databasePath);
            if (p.has_parent_path()) {
                std::error_code ec;
                std::filesystem::create_directories(p.parent_path(), ec);
                if (ec) {
                    setError(err, SQLITE_CANTOPEN, "Cannot create database directory: " + ec.message(), "Initialize");
                    return false;
                }
            }

            m_connectionPool = std::make_unique<ConnectionPool>(m_config);
            if (!m_connectionPool->Initialize(err)) {
                m_connectionPool.reset();
                return false;
            }

            m_initialized.store(true, std::memory_order_release);
            NG_LOG_INFO("Database", "Opened %s", m_config.databasePath.c_str());
            return true;
        }

        void DatabaseManager::Shutdown() {
            bool expected = true;
            if (!m_initialized.compare_exchange_strong(expected, false)) return;
            std::unique_lock<std::shared_mutex> lock(m_configMutex);
            if (m_connectionPool) {
                m_connectionPool->Shutdown();
                m_connectionPool.reset();
            }
        }

        std::shared_ptr<SQLite::Database> DatabaseManager::AcquireConnection(DatabaseError* err) {
            std::shared_lock<std::shared_mutex> lock(m_configMutex);
            if (!m_initialized.load(std::memory_order_acquire) || !m_connectionPool) {
                setError(err, SQLITE_MISUSE, "Database not initialized", "AcquireConnection");
                return nullptr;
            }
            return m_connectionPool->Acquire(m_config.connectionTimeout, err);
        }

        void DatabaseManager::ReleaseConnection(std::shared_ptr<SQLite::Database> conn) {
            std::shared_lock<std::shared_mutex> lock(m_configMutex);
            if (m_connectionPool) m_connectionPool->Release(std::move(conn));
        }

        bool DatabaseManager::Execute(std::string_view sql, DatabaseError* err) {
            auto conn = AcquireConnection(err);
            if (!conn) return false;
            ConnectionGuard guard{ this, conn };
            try {
                conn->exec(std::string(sql));
                return true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, sql, "Execute");
                return false;
            }
        }

        bool DatabaseManager::ExecuteMany(const std::vector<std::string>& statements, DatabaseError* err) {
            auto txn = BeginTransaction(Transaction::Type::Immediate, err);
            if (!txn || !txn->IsActive()) return false;
            for (const auto& sql : statements) {
                if (!txn->Execute(sql, err)) return false;
            }
            return txn->Commit(err);
        }

        std::unique_ptr<Transaction> DatabaseManager::BeginTransaction(Transaction::Type type, DatabaseError* err) {
            auto conn = AcquireConnection(err);
            if (!conn) return nullptr;
            auto txn = std::make_unique<Transaction>(conn, this, type, err);
            if (!txn->IsActive()) return nullptr;
            return txn;
        }

        int DatabaseManager::GetSchemaVersion(DatabaseError* err) {
            return static_cast<int>(QueryScalar("PRAGMA user_version", 0, err));
        }

        bool DatabaseManager::SetSchemaVersion(int version, DatabaseError* err) {
            // PRAGMA does not accept bound parameters
            return Execute("PRAGMA user_version = " + std::to_string(version), err);
        }

        void DatabaseManager::setError(DatabaseError* err, int code, std::string_view msg, std::string_view ctx) {
            if (!err) return;
            err->sqliteCode = code;
            err->extendedCode = code;
            err->message = std::string(msg);
            err->query.clear();
            err->context = std::string(ctx);
        }

        void DatabaseManager::setError(DatabaseError* err, const SQLite::Exception& ex, std::string_view sql, std::string_view ctx) {
            if (!err) return;
            err->sqliteCode = ex.getErrorCode() == SQLITE_OK ? SQLITE_ERROR : ex.getErrorCode();
            err->extendedCode = ex.getExtendedErrorCode();
            err->message = ex.what();
            err->query = std::string(sql);
            err->context = std::string(ctx);
        }

    } // namespace Database
} // namespace NetGuard
