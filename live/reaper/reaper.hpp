#ifndef CHATLIVE_REAPER_HPP
#define CHATLIVE_REAPER_HPP

/******************************************************************************
 *
 * @file       reaper.hpp
 * @brief      Removes handles whose liveness record expired and announces the
 *             users that timed out
 *
 *****************************************************************************/

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

#include "common/database/redis_mgr.hpp"
#include "live/delivery/chat_publisher.hpp"
#include "live/directory/user_directory.hpp"
#include "live/presence/user_list_store.hpp"

namespace chatlive::live {

class Reaper {
public:
    Reaper(db::RedisManager& redis, ChatPublisher& publisher, UserDirectory& directory,
           std::chrono::milliseconds interval = std::chrono::seconds(10),
           PresenceOptions options = {});
    ~Reaper();

    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    /**
     * @brief One sweep over every active room
     * @return number of handles removed
     *
     * @details A failure in one room is logged and the sweep moves on to the
     *          next room.
     */
    size_t run_once();

    // Runs run_once() every interval on a background thread.
    // start() and stop() may be called from any thread.
    void start();
    void stop();

    bool is_running() const { return running_.load(); }

private:
    size_t reap_room(int64_t room_id);
    void loop();

    db::RedisManager& redis_;
    ChatPublisher& publisher_;
    UserDirectory& directory_;
    std::chrono::milliseconds interval_;
    PresenceOptions options_;

    std::atomic<bool> running_{false};
    std::mutex lifecycle_mutex_;  // serializes start() and stop()
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
};

}  // namespace chatlive::live

#endif  // CHATLIVE_REAPER_HPP
