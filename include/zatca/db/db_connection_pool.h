/**
 * @file db_connection_pool.h
 * @brief PostgreSQL connection pool for chain state
 *
 * Thread-safe pool with configurable min/max size, acquire timeout and
 * health checking on acquire and release.
 */

#pragma once

#include <libpq-fe.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>

namespace zatca::db {

/// @brief Connection settings resolved from ConfigManager (DB_* keys)
struct DbPoolConfig {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "einvoice";
    std::string user = "einvoice";
    std::string password;
    size_t minSize = 2;
    size_t maxSize = 10;
    int acquireTimeoutSec = 5;

    /// @brief libpq keyword/value connection string
    std::string connectionString() const;

    static DbPoolConfig fromConfigManager();
};

class DbConnectionPool;

/**
 * @brief RAII handle returning its connection to the pool when destroyed
 */
class DbConnection {
public:
    DbConnection(PGconn* conn, DbConnectionPool* pool) : conn_(conn), pool_(pool) {}
    ~DbConnection();

    DbConnection(const DbConnection&) = delete;
    DbConnection& operator=(const DbConnection&) = delete;

    DbConnection(DbConnection&& other) noexcept : conn_(other.conn_), pool_(other.pool_) {
        other.conn_ = nullptr;
    }

    DbConnection& operator=(DbConnection&& other) noexcept;

    PGconn* get() const { return conn_; }
    bool isValid() const { return conn_ != nullptr; }

    void release();

private:
    PGconn* conn_;
    DbConnectionPool* pool_;  // Non-owning
};

class DbConnectionPool {
public:
    /**
     * @throws std::invalid_argument if minSize exceeds maxSize
     */
    explicit DbConnectionPool(const DbPoolConfig& config);
    ~DbConnectionPool();

    DbConnectionPool(const DbConnectionPool&) = delete;
    DbConnectionPool& operator=(const DbConnectionPool&) = delete;

    /**
     * @brief Open the minimum number of connections
     * @return false if any of them cannot be opened (details logged)
     */
    bool initialize();

    /**
     * @brief Take a healthy connection, opening one if under maxSize
     * @throws DatabaseException on shutdown, connection failure or timeout
     */
    DbConnection acquire();

    struct Stats {
        size_t availableConnections;
        size_t totalConnections;
        size_t maxConnections;
    };

    Stats getStats() const;

    void shutdown();

private:
    friend class DbConnection;

    PGconn* createConnection();
    bool isConnectionHealthy(PGconn* conn);
    void releaseConnection(PGconn* conn);

    std::string connString_;
    size_t minSize_;
    size_t maxSize_;
    std::chrono::seconds acquireTimeout_;

    std::queue<PGconn*> availableConnections_;
    std::atomic<size_t> totalConnections_{0};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace zatca::db
