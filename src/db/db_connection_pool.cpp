/**
 * @file db_connection_pool.cpp
 * @brief PostgreSQL connection pool
 */

#include "zatca/db/db_connection_pool.h"
#include "zatca/common/config_manager.h"
#include "zatca/common/exceptions.h"

#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace zatca::db {

using common::ConfigManager;
using common::DatabaseException;

// --- DbPoolConfig ---

std::string DbPoolConfig::connectionString() const {
    std::ostringstream oss;
    oss << "host=" << host
        << " port=" << port
        << " dbname=" << database
        << " user=" << user
        << " password=" << password;
    return oss.str();
}

DbPoolConfig DbPoolConfig::fromConfigManager() {
    auto& cfg = ConfigManager::getInstance();

    DbPoolConfig config;
    config.host = cfg.getString(ConfigManager::DB_HOST, config.host);
    config.port = cfg.getInt(ConfigManager::DB_PORT, config.port);
    config.database = cfg.getString(ConfigManager::DB_NAME, config.database);
    config.user = cfg.getString(ConfigManager::DB_USER, config.user);
    config.password = cfg.getString(ConfigManager::DB_PASSWORD);
    config.minSize = static_cast<size_t>(cfg.getInt(ConfigManager::DB_POOL_MIN, static_cast<int>(config.minSize)));
    config.maxSize = static_cast<size_t>(cfg.getInt(ConfigManager::DB_POOL_MAX, static_cast<int>(config.maxSize)));
    return config;
}

// --- DbConnection ---

DbConnection::~DbConnection() {
    release();
}

DbConnection& DbConnection::operator=(DbConnection&& other) noexcept {
    if (this != &other) {
        release();
        conn_ = other.conn_;
        pool_ = other.pool_;
        other.conn_ = nullptr;
    }
    return *this;
}

void DbConnection::release() {
    if (!conn_) return;
    if (pool_) {
        pool_->releaseConnection(conn_);
    } else {
        PQfinish(conn_);
    }
    conn_ = nullptr;
}

// --- DbConnectionPool ---

DbConnectionPool::DbConnectionPool(const DbPoolConfig& config)
    : connString_(config.connectionString())
    , minSize_(config.minSize)
    , maxSize_(config.maxSize)
    , acquireTimeout_(config.acquireTimeoutSec)
{
    if (minSize_ > maxSize_) {
        throw std::invalid_argument("minSize cannot exceed maxSize");
    }

    spdlog::info("[DbConnectionPool] Created: host={}, db={}, minSize={}, maxSize={}, timeout={}s",
                 config.host, config.database, minSize_, maxSize_, config.acquireTimeoutSec);
}

DbConnectionPool::~DbConnectionPool() {
    shutdown();
}

bool DbConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (size_t i = 0; i < minSize_; i++) {
        PGconn* conn = createConnection();
        if (!conn) {
            spdlog::error("[DbConnectionPool] Failed to create minimum connection {}/{}", i + 1, minSize_);
            return false;
        }
        availableConnections_.push(conn);
        totalConnections_++;
    }

    spdlog::info("[DbConnectionPool] Initialized with {} connections", totalConnections_.load());
    return true;
}

DbConnection DbConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + acquireTimeout_;

    while (true) {
        if (shutdown_) {
            throw DatabaseException("connection pool is shut down");
        }

        if (!availableConnections_.empty()) {
            PGconn* conn = availableConnections_.front();
            availableConnections_.pop();

            if (isConnectionHealthy(conn)) {
                return DbConnection(conn, this);
            }
            spdlog::warn("[DbConnectionPool] Pooled connection unhealthy, discarding");
            PQfinish(conn);
            totalConnections_--;
            continue;
        }

        if (totalConnections_ < maxSize_) {
            totalConnections_++;
            lock.unlock();
            PGconn* conn = createConnection();
            lock.lock();

            if (!conn) {
                totalConnections_--;
                throw DatabaseException("failed to open PostgreSQL connection");
            }
            spdlog::debug("[DbConnectionPool] Opened connection (total: {})", totalConnections_.load());
            return DbConnection(conn, this);
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            throw DatabaseException("timeout acquiring connection after " +
                                    std::to_string(acquireTimeout_.count()) + "s");
        }
    }
}

DbConnectionPool::Stats DbConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{availableConnections_.size(), totalConnections_.load(), maxSize_};
}

void DbConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) return;
    shutdown_ = true;

    while (!availableConnections_.empty()) {
        PQfinish(availableConnections_.front());
        availableConnections_.pop();
    }
    totalConnections_ = 0;
    cv_.notify_all();

    spdlog::info("[DbConnectionPool] Shutdown complete");
}

PGconn* DbConnectionPool::createConnection() {
    PGconn* conn = PQconnectdb(connString_.c_str());
    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::error("[DbConnectionPool] Connection failed: {}", PQerrorMessage(conn));
        PQfinish(conn);
        return nullptr;
    }
    return conn;
}

bool DbConnectionPool::isConnectionHealthy(PGconn* conn) {
    if (!conn || PQstatus(conn) != CONNECTION_OK) return false;

    PGresult* res = PQexec(conn, "SELECT 1");
    bool ok = res && PQresultStatus(res) == PGRES_TUPLES_OK;
    if (res) PQclear(res);
    return ok;
}

void DbConnectionPool::releaseConnection(PGconn* conn) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        PQfinish(conn);
        return;
    }

    // An aborted transaction must not leak into the next borrower
    if (PQtransactionStatus(conn) != PQTRANS_IDLE) {
        PGresult* res = PQexec(conn, "ROLLBACK");
        if (res) PQclear(res);
    }

    if (isConnectionHealthy(conn)) {
        availableConnections_.push(conn);
    } else {
        spdlog::warn("[DbConnectionPool] Released connection unhealthy, closing");
        PQfinish(conn);
        totalConnections_--;
    }
    cv_.notify_one();
}

} // namespace zatca::db
