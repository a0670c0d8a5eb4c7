// src/data/connection_pool.cpp

#include "finpipe/data/connection_pool.hpp"

namespace finpipe {

ConnectionPool::ConnectionPool(std::string connection_string, size_t pool_size)
    : connection_string_(std::move(connection_string)), pool_size_(pool_size) {}

ConnectionPool::~ConnectionPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& connection : available_) {
        if (connection && connection->is_open()) {
            connection->close();
        }
    }
    available_.clear();
}

std::shared_ptr<pqxx::connection> ConnectionPool::open_connection() const {
    try {
        auto connection = std::make_shared<pqxx::connection>(connection_string_);
        if (connection->is_open()) {
            return connection;
        }
        ERROR("PostgreSQL connection opened in a closed state");
    } catch (const std::exception& e) {
        ERROR("Failed to open PostgreSQL connection: " << e.what());
    }
    return nullptr;
}

Result<void> ConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (total_ > 0) {
        return Result<void>();
    }

    for (size_t i = 0; i < pool_size_; ++i) {
        auto connection = open_connection();
        if (connection) {
            available_.push_back(std::move(connection));
            ++total_;
        }
    }

    if (total_ == 0) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Could not open any PostgreSQL connection", "ConnectionPool");
    }
    if (total_ < pool_size_) {
        WARN("Connection pool opened " << total_ << " of " << pool_size_ << " connections");
    }
    INFO("Connection pool initialized with " << total_ << " connections");
    return Result<void>();
}

ConnectionPool::ConnectionGuard ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!cv_.wait_for(lock, timeout, [this] { return !available_.empty(); })) {
        ERROR("No database connection available after " << timeout.count() << "ms");
        return ConnectionGuard(nullptr, this);
    }

    auto connection = std::move(available_.front());
    available_.pop_front();
    lock.unlock();

    if (!connection->is_open()) {
        INFO("Reconnecting stale database connection");
        connection = open_connection();
        if (!connection) {
            std::lock_guard<std::mutex> relock(mutex_);
            --total_;
            return ConnectionGuard(nullptr, this);
        }
    }
    return ConnectionGuard(std::move(connection), this);
}

void ConnectionPool::return_connection(std::shared_ptr<pqxx::connection> connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connection->is_open()) {
        // Dropped here; the slot is refilled lazily on the next acquire of a stale connection
        connection = open_connection();
        if (!connection) {
            --total_;
            return;
        }
    }
    available_.push_back(std::move(connection));
    cv_.notify_one();
}

}  // namespace finpipe
