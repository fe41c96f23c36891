#ifndef CHATLIVE_CHAT_PUBLISHER_HPP
#define CHATLIVE_CHAT_PUBLISHER_HPP

/******************************************************************************
 *
 * @file       chat_publisher.hpp
 * @brief      Publishes chat events to the per-room and per-user channels
 *
 * @details    channel:{room_id} reaches everyone attached to the room;
 *             channel:{room_id}:{user_id} reaches a single user (kicks, bans,
 *             private notices).
 *
 *****************************************************************************/

#include <cstdint>
#include <set>
#include <string>

#include "common/database/redis_mgr.hpp"
#include "live/delivery/chat_event.hpp"
#include "live/directory/user_directory.hpp"

namespace chatlive::live {

class ChatPublisher {
public:
    ChatPublisher(db::RedisManager& redis, UserDirectory& directory)
            : redis_(redis), directory_(directory) {}

    /**
     * @brief Publish to the room's broadcast channel
     * @return number of subscribers that received the payload
     *
     * @details The current user list is attached for userlist events.
     */
    long long send(const ChatEvent& event);

    long long send_private(const ChatEvent& event, int64_t user_id);

    // Publishes {"typing": [user numbers]}
    long long send_typing(int64_t chat_id, const std::set<int>& typing_numbers);

private:
    long long publish(const std::string& channel, const std::string& payload);

    db::RedisManager& redis_;
    UserDirectory& directory_;
};

}  // namespace chatlive::live

#endif  // CHATLIVE_CHAT_PUBLISHER_HPP
