#ifndef CHATLIVE_REDIS_MGR_HPP
#define CHATLIVE_REDIS_MGR_HPP

/******************************************************************************
 *
 * @file       redis_mgr.hpp
 * @brief      Pooled sw::redis::Redis connections shared by the live stores
 *
 * @details    Stores receive a RedisManager& explicitly; there is no global
 *             instance. Each pooled sw::redis::Redis holds one connection.
 *
 *****************************************************************************/

#include <sw/redis++/redis++.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include "../utils/connection_pool.hpp"
#include "../utils/log_manager.hpp"

namespace chatlive::db {

/**
 * Redis connection settings, "redis.*" in the configuration file
 */
struct RedisConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password = "";
    int db = 0;
    int pool_size = 10;
    int connect_timeout = 1000;  // ms
    int socket_timeout = 1000;   // ms
    int acquire_timeout = 3000;  // ms to wait for a free pooled connection

    // REDIS_HOST, REDIS_PORT and REDIS_PASSWORD override the file
    static RedisConfig from_file(const std::string& config_path);

    sw::redis::ConnectionOptions to_connection_options() const;
    sw::redis::ConnectionPoolOptions to_pool_options() const;
};

class RedisManager {
public:
    using RedisPtr = std::shared_ptr<sw::redis::Redis>;
    using RedisConnectionPool = chatlive::utils::ConnectionPool<sw::redis::Redis>;

    // No pooled connection became free within acquire_timeout
    class PoolExhausted : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    RedisManager() = default;
    ~RedisManager();

    RedisManager(const RedisManager&) = delete;
    RedisManager& operator=(const RedisManager&) = delete;

    bool initialize(const std::string& config_path);

    /**
     * Create the pool and verify it with a PING
     * @return false if Redis could not be reached
     */
    bool initialize(const RedisConfig& config);

    /**
     * A pooled connection, returned to the pool on destruction
     */
    class RedisConnection {
    public:
        RedisConnection(RedisConnectionPool& pool, std::chrono::milliseconds timeout);
        ~RedisConnection();

        RedisConnection(const RedisConnection&) = delete;
        RedisConnection& operator=(const RedisConnection&) = delete;
        RedisConnection(RedisConnection&& other) noexcept;
        RedisConnection& operator=(RedisConnection&&) = delete;

        sw::redis::Redis* operator->() { return redis_.get(); }
        sw::redis::Redis& operator*() { return *redis_; }

        bool is_valid() const { return redis_ != nullptr; }

    private:
        RedisConnectionPool* pool_;
        RedisPtr redis_;
    };

    /**
     * @throws std::runtime_error if the manager is not initialized
     * @throws PoolExhausted if no connection is free within acquire_timeout
     */
    RedisConnection get_connection();

    /**
     * Run func(sw::redis::Redis&) on a pooled connection.
     * sw::redis::Error from the command propagates to the caller.
     */
    template <typename Func>
    auto execute(Func&& func) -> decltype(func(std::declval<sw::redis::Redis&>())) {
        auto conn = get_connection();
        if (!conn.is_valid()) {
            throw PoolExhausted("Failed to get Redis connection");
        }
        return func(*conn);
    }

    /**
     * execute() that logs failures and returns default_value instead of throwing
     */
    template <typename Func, typename DefaultType>
    auto safe_execute(Func&& func, DefaultType&& default_value)
            -> decltype(func(std::declval<sw::redis::Redis&>())) {
        try {
            return execute(std::forward<Func>(func));
        } catch (const std::exception& e) {
            chatlive::utils::LogManager::GetLogger("redis_manager")
                    ->error("Redis operation failed: {}", e.what());
            return std::forward<DefaultType>(default_value);
        }
    }

    /**
     * execute() for read-only operations. Transient failures (IoError and
     * its TimeoutError, ClosedError, PoolExhausted) are retried with
     * exponential backoff; the last one propagates after max_attempts.
     */
    template <typename Func>
    auto execute_with_retry(Func&& func, int max_attempts = 3,
                            std::chrono::milliseconds backoff = std::chrono::milliseconds(50))
            -> decltype(func(std::declval<sw::redis::Redis&>())) {
        for (int attempt = 1;; ++attempt) {
            try {
                return execute(func);
            } catch (const sw::redis::IoError& e) {
                if (attempt >= max_attempts) throw;
                log_retry(attempt, e.what());
            } catch (const sw::redis::ClosedError& e) {
                if (attempt >= max_attempts) throw;
                log_retry(attempt, e.what());
            } catch (const PoolExhausted& e) {
                if (attempt >= max_attempts) throw;
                log_retry(attempt, e.what());
            }
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }

    struct PoolStats {
        size_t total_connections;
        size_t available_connections;
        size_t active_connections;
    };
    PoolStats get_pool_stats() const;

    bool is_healthy();

    void shutdown();

    const RedisConfig& config() const { return config_; }

private:
    static void log_retry(int attempt, const char* what);

    RedisPtr create_redis_connection() const;

    RedisConfig config_;
    RedisConnectionPool pool_;
    mutable std::mutex mutex_;
    bool initialized_ = false;
};

}  // namespace chatlive::db

#endif  // CHATLIVE_REDIS_MGR_HPP
