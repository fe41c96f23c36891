#ifndef CHATLIVE_CHAT_EVENT_HPP
#define CHATLIVE_CHAT_EVENT_HPP

/******************************************************************************
 *
 * @file       chat_event.hpp
 * @brief      Chat events and the JSON payloads published for them
 *
 * @details    Payload shape: {"messages": [event], "users": [...]}, where
 *             "users" is present only for events that change the user list.
 *
 *****************************************************************************/

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "live/directory/user_directory.hpp"

namespace chatlive::live {

struct ChatEvent {
    int64_t chat_id = 0;
    std::optional<int64_t> user_id;  // absent for system events
    std::string type;
    std::string text;
    std::string color = "000000";
    std::string acronym;
    uint64_t posted_ms = 0;

    nlohmann::json to_json() const;
};

ChatEvent make_join_event(int64_t chat_id, const ChatUser& user);
ChatEvent make_disconnect_event(int64_t chat_id, const ChatUser& user);
ChatEvent make_timeout_event(int64_t chat_id, const ChatUser& user);

// join, disconnect, timeout, user_info, user_group and user_action
bool is_userlist_event(const std::string& type);

nlohmann::json build_event_payload(const ChatEvent& event,
                                   const std::optional<nlohmann::json>& users = std::nullopt);

}  // namespace chatlive::live

#endif  // CHATLIVE_CHAT_EVENT_HPP
