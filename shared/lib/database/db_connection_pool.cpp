/**
 * @file db_connection_pool.cpp
 * @brief Implementation of PostgreSQL Connection Pool
 */

#include "db_connection_pool.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace common {

// =============================================================================
// DbConnection Implementation
// =============================================================================

DbConnection::~DbConnection() {
    if (!released_ && conn_) {
        release();
    }
}

void DbConnection::release() {
    if (released_ || !conn_) {
        return;
    }

    if (pool_) {
        pool_->releaseConnection(conn_);
    }

    conn_ = nullptr;
    released_ = true;
}

// =============================================================================
// DbConnectionPool Implementation
// =============================================================================

DbConnectionPool::DbConnectionPool(
    const std::string& connString,
    size_t minSize,
    size_t maxSize,
    int acquireTimeoutSec)
    : connString_(connString)
    , minSize_(minSize)
    , maxSize_(maxSize)
    , acquireTimeout_(acquireTimeoutSec)
    , totalConnections_(0)
    , shutdown_(false)
{
    if (minSize > maxSize) {
        throw std::invalid_argument("minSize cannot exceed maxSize");
    }

    spdlog::info("DbConnectionPool created: minSize={}, maxSize={}, timeout={}s",
                 minSize_, maxSize_, acquireTimeoutSec);
}

DbConnectionPool::~DbConnectionPool() {
    shutdown();
}

bool DbConnectionPool::initialize() {
    spdlog::info("Initializing DbConnectionPool with {} minimum connections", minSize_);

    std::lock_guard<std::mutex> lock(mutex_);

    for (size_t i = 0; i < minSize_; i++) {
        PGconn* conn = createConnection();
        if (!conn) {
            spdlog::error("Failed to create minimum connection {}/{}", i + 1, minSize_);
            return false;
        }

        availableConnections_.push(conn);
        totalConnections_++;
    }

    spdlog::info("DbConnectionPool initialized with {} connections", totalConnections_.load());
    return true;
}

DbConnection DbConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    auto deadline = std::chrono::steady_clock::now() + acquireTimeout_;

    while (true) {
        if (shutdown_) {
            throw StorageException(ErrorCode::DB_CONNECTION_FAILED,
                                   "Connection pool is shutdown", "");
        }

        if (!availableConnections_.empty()) {
            PGconn* conn = availableConnections_.front();
            availableConnections_.pop();

            if (isConnectionHealthy(conn)) {
                spdlog::debug("Acquired connection from pool (available: {})", availableConnections_.size());
                return DbConnection(conn, this);
            } else {
                spdlog::warn("Connection from pool is unhealthy, closing and retrying");
                PQfinish(conn);
                totalConnections_--;
                continue;
            }
        }

        // No available connections - try to create new one if under max
        if (totalConnections_ < maxSize_) {
            totalConnections_++;
            lock.unlock();
            PGconn* conn = createConnection();
            lock.lock();

            if (conn) {
                spdlog::info("Created new connection (total: {})", totalConnections_.load());
                return DbConnection(conn, this);
            }
            totalConnections_--;
            throw StorageException(ErrorCode::DB_CONNECTION_FAILED,
                                   "Failed to create database connection", "");
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            spdlog::warn("Timeout waiting for database connection (timeout: {}s)", acquireTimeout_.count());
            throw StorageException(ErrorCode::DB_POOL_EXHAUSTED,
                                   "Timeout acquiring database connection",
                                   "timeout=" + std::to_string(acquireTimeout_.count()) + "s");
        }
    }
}

DbConnectionPool::Stats DbConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    return Stats{
        availableConnections_.size(),
        totalConnections_.load(),
        maxSize_
    };
}

void DbConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return;
    }

    spdlog::info("Shutting down DbConnectionPool");
    shutdown_ = true;

    while (!availableConnections_.empty()) {
        PGconn* conn = availableConnections_.front();
        availableConnections_.pop();
        PQfinish(conn);
    }

    totalConnections_ = 0;
    cv_.notify_all();

    spdlog::info("DbConnectionPool shutdown complete");
}

std::string DbConnectionPool::buildConnString(
    const std::string& host, int port, const std::string& dbName,
    const std::string& user, const std::string& password)
{
    auto quote = [](const std::string& v) {
        std::string out = "'";
        for (char c : v) {
            if (c == '\'' || c == '\\') out += '\\';
            out += c;
        }
        return out + "'";
    };

    return "host=" + quote(host) +
           " port=" + std::to_string(port) +
           " dbname=" + quote(dbName) +
           " user=" + quote(user) +
           " password=" + quote(password);
}

PGconn* DbConnectionPool::createConnection() {
    spdlog::debug("Creating new PostgreSQL connection");

    PGconn* conn = PQconnectdb(connString_.c_str());

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn);
        spdlog::error("Failed to create PostgreSQL connection: {}", error);
        PQfinish(conn);
        return nullptr;
    }

    // Timestamps are read back as text; keep them in UTC
    PGresult* res = PQexec(conn, "SET TIME ZONE 'UTC'");
    if (!res || PQresultStatus(res) != PGRES_COMMAND_OK) {
        spdlog::error("Failed to set session time zone: {}", PQerrorMessage(conn));
        if (res) {
            PQclear(res);
        }
        PQfinish(conn);
        return nullptr;
    }
    PQclear(res);

    spdlog::debug("PostgreSQL connection created successfully");
    return conn;
}

bool DbConnectionPool::isConnectionHealthy(PGconn* conn) {
    if (!conn) {
        return false;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::debug("Connection status is not OK");
        return false;
    }

    PGresult* res = PQexec(conn, "SELECT 1");
    if (!res || PQresultStatus(res) != PGRES_TUPLES_OK) {
        if (res) {
            PQclear(res);
        }
        spdlog::debug("Connection health check query failed");
        return false;
    }

    PQclear(res);
    return true;
}

void DbConnectionPool::releaseConnection(PGconn* conn) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        PQfinish(conn);
        return;
    }

    // A connection left inside a transaction must not be handed to the next caller
    if (PQtransactionStatus(conn) != PQTRANS_IDLE) {
        spdlog::warn("Released connection still in a transaction, rolling back");
        PGresult* res = PQexec(conn, "ROLLBACK");
        if (res) {
            PQclear(res);
        }
    }

    if (isConnectionHealthy(conn)) {
        availableConnections_.push(conn);
        spdlog::debug("Connection returned to pool (available: {})", availableConnections_.size());
    } else {
        spdlog::warn("Released connection is unhealthy, closing");
        PQfinish(conn);
        totalConnections_--;
    }

    cv_.notify_one();
}

} // namespace common
