// include/finpipe/data/connection_pool.hpp

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <thread>
#include "finpipe/core/error.hpp"
#include "finpipe/core/logger.hpp"

namespace finpipe {
namespace utils {

/**
 * @brief Re-run an operation while it fails with a transient database error
 * Backoff doubles from 100ms; non-transient errors are returned immediately.
 */
template <typename Func>
auto retry_with_backoff(Func func, int max_retries = 3) -> decltype(func()) {
    std::chrono::milliseconds delay(100);

    for (int attempt = 1;; ++attempt) {
        auto result = func();
        if (!result.is_error() || attempt >= max_retries) {
            return result;
        }
        ErrorCode code = result.error()->code();
        if (code != ErrorCode::DATABASE_ERROR && code != ErrorCode::CONNECTION_ERROR) {
            return result;
        }
        WARN("Database operation failed, retrying (attempt " << attempt << " of " << max_retries
                                                             << "): " << result.error()->what());
        std::this_thread::sleep_for(delay);
        delay *= 2;
    }
}

}  // namespace utils

/**
 * @brief Fixed-size pool of PostgreSQL connections owned by one store
 */
class ConnectionPool {
public:
    ConnectionPool(std::string connection_string, size_t pool_size);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Open the initial connections
     * @return CONNECTION_ERROR if not a single connection could be opened
     */
    Result<void> initialize();

    /**
     * @brief Returns its connection to the pool on destruction
     */
    class ConnectionGuard {
    public:
        ConnectionGuard(std::shared_ptr<pqxx::connection> connection, ConnectionPool* pool)
            : connection_(std::move(connection)), pool_(pool) {}

        ~ConnectionGuard() {
            if (connection_ && pool_) {
                pool_->return_connection(std::move(connection_));
            }
        }

        ConnectionGuard(const ConnectionGuard&) = delete;
        ConnectionGuard& operator=(const ConnectionGuard&) = delete;

        ConnectionGuard(ConnectionGuard&& other) noexcept
            : connection_(std::move(other.connection_)), pool_(other.pool_) {
            other.pool_ = nullptr;
        }

        ConnectionGuard& operator=(ConnectionGuard&& other) noexcept {
            if (this != &other) {
                if (connection_ && pool_) {
                    pool_->return_connection(std::move(connection_));
                }
                connection_ = std::move(other.connection_);
                pool_ = other.pool_;
                other.pool_ = nullptr;
            }
            return *this;
        }

        pqxx::connection* get() const {
            return connection_.get();
        }

        explicit operator bool() const {
            return connection_ != nullptr;
        }

    private:
        std::shared_ptr<pqxx::connection> connection_;
        ConnectionPool* pool_;
    };

    /**
     * @brief Wait for a free connection
     * @return An empty guard when none became available within the timeout
     */
    ConnectionGuard acquire(std::chrono::milliseconds timeout = std::chrono::seconds(5));

    size_t available() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_.size();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_;
    }

private:
    void return_connection(std::shared_ptr<pqxx::connection> connection);
    std::shared_ptr<pqxx::connection> open_connection() const;

    std::string connection_string_;
    size_t pool_size_;
    size_t total_{0};
    std::deque<std::shared_ptr<pqxx::connection>> available_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace finpipe
