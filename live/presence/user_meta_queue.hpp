#ifndef CHATLIVE_USER_META_QUEUE_HPP
#define CHATLIVE_USER_META_QUEUE_HPP

/******************************************************************************
 *
 * @file       user_meta_queue.hpp
 * @brief      Consumer side of queue:usermeta, the last-online updates
 *             written by UserListStore::join
 *
 *****************************************************************************/

#include <cstdint>
#include <string>
#include <vector>

#include "common/database/redis_mgr.hpp"

namespace chatlive::live {

struct UserMetaEntry {
    int64_t user_id = 0;
    int64_t chat_id = 0;
    std::string last_online;  // unix seconds with fraction
};

class UserMetaQueue {
public:
    explicit UserMetaQueue(db::RedisManager& redis) : redis_(redis) {}

    /**
     * @brief Take every queued entry and clear the queue in one atomic step
     *
     * @details Entries that cannot be parsed are logged and dropped.
     */
    std::vector<UserMetaEntry> drain();

private:
    db::RedisManager& redis_;
};

}  // namespace chatlive::live

#endif  // CHATLIVE_USER_META_QUEUE_HPP
