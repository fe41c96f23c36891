#include "redis_mgr.hpp"
#include <algorithm>
#include "../utils/config_mgr.hpp"

namespace chatlive::db {

using chatlive::utils::ConfigManager;
using chatlive::utils::LogManager;

// ===== RedisConfig =====
RedisConfig RedisConfig::from_file(const std::string& config_path) {
    RedisConfig config;
    try {
        ConfigManager cfg_mgr(config_path);

        config.host = cfg_mgr.getWithEnv<std::string>("redis.host", "REDIS_HOST", config.host);
        config.port = cfg_mgr.getWithEnv<int>("redis.port", "REDIS_PORT", config.port);
        config.password =
                cfg_mgr.getWithEnv<std::string>("redis.password", "REDIS_PASSWORD", config.password);
        config.db = cfg_mgr.get<int>("redis.db", config.db);
        config.pool_size = cfg_mgr.get<int>("redis.pool_size", config.pool_size);
        config.connect_timeout = cfg_mgr.get<int>("redis.connect_timeout", config.connect_timeout);
        config.socket_timeout = cfg_mgr.get<int>("redis.socket_timeout", config.socket_timeout);
        config.acquire_timeout = cfg_mgr.get<int>("redis.acquire_timeout", config.acquire_timeout);
    } catch (const std::exception& e) {
        LogManager::GetLogger("redis_manager")->error("Failed to load Redis config: {}", e.what());
        throw;
    }
    return config;
}

sw::redis::ConnectionOptions RedisConfig::to_connection_options() const {
    sw::redis::ConnectionOptions opts;
    opts.host = host;
    opts.port = port;
    opts.password = password;
    opts.db = db;
    opts.connect_timeout = std::chrono::milliseconds(connect_timeout);
    opts.socket_timeout = std::chrono::milliseconds(socket_timeout);
    return opts;
}

sw::redis::ConnectionPoolOptions RedisConfig::to_pool_options() const {
    // One connection per sw::redis::Redis; pooling happens in RedisManager
    sw::redis::ConnectionPoolOptions opts;
    opts.size = 1;
    opts.wait_timeout = std::chrono::milliseconds(acquire_timeout);
    return opts;
}

// ===== RedisManager::RedisConnection =====
RedisManager::RedisConnection::RedisConnection(RedisConnectionPool& pool,
                                               std::chrono::milliseconds timeout)
        : pool_(&pool), redis_(pool.GetConnection(timeout)) {}

RedisManager::RedisConnection::RedisConnection(RedisConnection&& other) noexcept
        : pool_(other.pool_), redis_(std::move(other.redis_)) {
    other.redis_.reset();
}

RedisManager::RedisConnection::~RedisConnection() {
    if (redis_) {
        pool_->ReleaseConnection(redis_);
    }
}

// ===== RedisManager =====
RedisManager::~RedisManager() {
    shutdown();
}

bool RedisManager::initialize(const std::string& config_path) {
    try {
        return initialize(RedisConfig::from_file(config_path));
    } catch (const std::exception& e) {
        LogManager::GetLogger("redis_manager")
                ->error("Failed to initialize Redis manager with config file {}: {}", config_path,
                        e.what());
        return false;
    }
}

bool RedisManager::initialize(const RedisConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto logger = LogManager::GetLogger("redis_manager");

    if (initialized_) {
        logger->warn("Redis manager already initialized");
        return true;
    }

    try {
        config_ = config;
        pool_.Init(static_cast<size_t>(std::max(1, config.pool_size)),
                   [this]() { return create_redis_connection(); });

        RedisConnection test_conn(pool_, std::chrono::milliseconds(config_.acquire_timeout));
        if (!test_conn.is_valid()) {
            throw std::runtime_error("Failed to create test connection");
        }
        test_conn->ping();

        initialized_ = true;
        logger->info("Redis manager initialized. Pool size: {}, Host: {}:{}, db: {}",
                     config.pool_size, config.host, config.port, config.db);
        return true;
    } catch (const std::exception& e) {
        logger->error("Failed to initialize Redis manager: {}", e.what());
        pool_.Close();
        return false;
    }
}

RedisManager::RedisConnection RedisManager::get_connection() {
    std::chrono::milliseconds timeout;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) {
            throw std::runtime_error("Redis manager not initialized");
        }
        timeout = std::chrono::milliseconds(config_.acquire_timeout);
    }
    // Waiting for a free connection must not hold mutex_
    return RedisConnection(pool_, timeout);
}

RedisManager::PoolStats RedisManager::get_pool_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return {0, 0, 0};
    }
    return {pool_.GetPoolSize(), pool_.GetAvailableCount(), pool_.GetInUsedCount()};
}

bool RedisManager::is_healthy() {
    try {
        auto conn = get_connection();
        if (!conn.is_valid()) {
            return false;
        }
        conn->ping();
        return true;
    } catch (const std::exception& e) {
        LogManager::GetLogger("redis_manager")->warn("Health check failed: {}", e.what());
        return false;
    }
}

void RedisManager::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return;
    }
    pool_.Close();
    initialized_ = false;
    LogManager::GetLogger("redis_manager")->info("Redis manager shutdown");
}

void RedisManager::log_retry(int attempt, const char* what) {
    LogManager::GetLogger("redis_manager")
            ->warn("Transient Redis failure (attempt {}), retrying: {}", attempt, what);
}

RedisManager::RedisPtr RedisManager::create_redis_connection() const {
    auto logger = LogManager::GetLogger("redis_manager");
    logger->debug("Creating Redis connection to {}:{}", config_.host, config_.port);
    return std::make_shared<sw::redis::Redis>(config_.to_connection_options(),
                                              config_.to_pool_options());
}

}  // namespace chatlive::db
