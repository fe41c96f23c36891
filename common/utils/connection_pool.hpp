#ifndef CHATLIVE_CONNECTION_POOL_HPP
#define CHATLIVE_CONNECTION_POOL_HPP

/******************************************************************************
 *
 * @file       connection_pool.hpp
 * @brief      Generic fixed-size connection pool
 *
 * @details    Connections are created up front by a factory. Callers block
 *             until a connection is free, or until the acquire timeout passes.
 *
 *****************************************************************************/

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include "log_manager.hpp"

namespace chatlive {
namespace utils {

template <typename T>
class ConnectionPool {
public:
    using ConnectionPtr = std::shared_ptr<T>;
    using ConnectionFactory = std::function<ConnectionPtr()>;

    ConnectionPool() = default;
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool<T>&) = delete;
    ConnectionPool& operator=(const ConnectionPool<T>&) = delete;

    /**
     * @brief      Fill the pool with poolSize connections
     *
     * @param[in]  poolSize  number of connections to create
     * @param[in]  factory   creates one connection; exceptions propagate
     */
    void Init(size_t poolSize, ConnectionFactory factory);

    /**
     * @brief      Take a connection out of the pool
     *
     * @param[in]  timeout  how long to wait for a free connection
     * @return     the connection, or nullptr if the pool is closed or the wait timed out
     */
    ConnectionPtr GetConnection(std::chrono::milliseconds timeout);

    void ReleaseConnection(const ConnectionPtr& conn);

    void Close();

    size_t GetPoolSize() const { return m_poolSize; }

    size_t GetAvailableCount() const;

    size_t GetInUsedCount() const;

    bool IsClosed() const { return m_isClosed.load(); }

private:
    static std::shared_ptr<spdlog::logger> Logger() {
        return LogManager::GetLogger("connection_pool");
    }

    size_t m_poolSize = 0;
    std::queue<ConnectionPtr> m_connections;
    mutable std::mutex m_mutex;
    std::condition_variable m_condVar;
    std::atomic<bool> m_isClosed{true};
};

template <typename T>
ConnectionPool<T>::~ConnectionPool() {
    Close();
}

template <typename T>
void ConnectionPool<T>::Init(size_t poolSize, ConnectionFactory factory) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_isClosed) {
        Logger()->warn("Connection pool already initialized.");
        return;
    }

    std::queue<ConnectionPtr> created;
    for (size_t i = 0; i < poolSize; ++i) {
        auto conn = factory();
        if (conn) {
            created.push(std::move(conn));
        }
    }

    m_connections.swap(created);
    m_poolSize = m_connections.size();
    m_isClosed = false;

    Logger()->info("Connection pool initialized with size: {}", m_poolSize);
}

template <typename T>
typename ConnectionPool<T>::ConnectionPtr ConnectionPool<T>::GetConnection(
        std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);

    bool ready = m_condVar.wait_for(lock, timeout,
                                    [this]() { return m_isClosed || !m_connections.empty(); });
    if (m_isClosed) {
        Logger()->error("Connection pool is closed, cannot get connection.");
        return nullptr;
    }
    if (!ready) {
        Logger()->error("Timed out after {}ms waiting for a pooled connection.", timeout.count());
        return nullptr;
    }

    auto conn = m_connections.front();
    m_connections.pop();
    Logger()->trace("Connection acquired from pool, remaining connections: {}",
                    m_connections.size());
    return conn;
}

template <typename T>
void ConnectionPool<T>::ReleaseConnection(const ConnectionPtr& conn) {
    if (!conn) {
        Logger()->error("Attempted to release a null connection.");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_isClosed) {
            return;
        }
        if (m_connections.size() >= m_poolSize) {
            Logger()->warn("Connection pool is full, discarding connection.");
            return;
        }
        m_connections.push(conn);
    }
    m_condVar.notify_one();
}

template <typename T>
void ConnectionPool<T>::Close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_isClosed) {
            return;
        }
        m_isClosed = true;
        while (!m_connections.empty()) {
            m_connections.pop();
        }
        m_poolSize = 0;
    }
    m_condVar.notify_all();
    Logger()->info("Connection pool closed, all connections released.");
}

template <typename T>
size_t ConnectionPool<T>::GetAvailableCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connections.size();
}

template <typename T>
size_t ConnectionPool<T>::GetInUsedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_poolSize - m_connections.size();
}

}  // namespace utils
}  // namespace chatlive

#endif  // CHATLIVE_CONNECTION_POOL_HPP
