#ifndef CHATLIVE_MESSAGE_LISTENER_HPP
#define CHATLIVE_MESSAGE_LISTENER_HPP

/******************************************************************************
 *
 * @file       message_listener.hpp
 * @brief      Long-poll read: wait for the next payload on a room's broadcast
 *             channel or on the user's private channel
 *
 * @details    Each wait() opens a dedicated subscriber connection built from
 *             the manager's settings, so no pooled connection is held while
 *             blocked. The subscriber socket times out every poll interval to
 *             check the deadline and cancel().
 *
 *****************************************************************************/

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "common/database/redis_mgr.hpp"

namespace chatlive::live {

class MessageListener {
public:
    MessageListener(db::RedisManager& redis, int64_t chat_id, int64_t user_id,
                    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    /**
     * @brief Block until the first message, the timeout or cancel()
     * @return the raw JSON payload, or std::nullopt on timeout or cancel
     * @throws sw::redis::Error if the subscriber connection fails
     */
    std::optional<std::string> wait(std::chrono::milliseconds timeout);

    // Thread-safe. A cancelled listener returns std::nullopt from every wait()
    void cancel() { cancelled_.store(true); }

    bool is_cancelled() const { return cancelled_.load(); }

private:
    db::RedisManager& redis_;
    int64_t chat_id_;
    int64_t user_id_;
    std::chrono::milliseconds poll_interval_;
    std::atomic<bool> cancelled_{false};
};

}  // namespace chatlive::live

#endif  // CHATLIVE_MESSAGE_LISTENER_HPP
