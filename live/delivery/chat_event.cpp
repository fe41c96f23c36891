#include "chat_event.hpp"

#include <array>
#include <algorithm>

#include "common/utils/time_utils.hpp"

namespace chatlive::live {

namespace {

ChatEvent make_presence_event(int64_t chat_id, const ChatUser& user, const std::string& type,
                              const std::string& suffix) {
    ChatEvent event;
    event.chat_id = chat_id;
    event.user_id = user.user_id;
    event.type = type;
    event.text = user.name + " [" + user.acronym + "]" + suffix;
    event.color = user.color;
    event.acronym = user.acronym;
    event.posted_ms = utils::TimeUtils::now_ms();
    return event;
}

}  // namespace

nlohmann::json ChatEvent::to_json() const {
    nlohmann::json j;
    j["chat_id"] = chat_id;
    j["user_id"] = user_id ? nlohmann::json(*user_id) : nlohmann::json(nullptr);
    j["type"] = type;
    j["text"] = text;
    j["color"] = color;
    j["acronym"] = acronym;
    j["posted"] = posted_ms;
    return j;
}

ChatEvent make_join_event(int64_t chat_id, const ChatUser& user) {
    return make_presence_event(chat_id, user, "join", " joined chat.");
}

ChatEvent make_disconnect_event(int64_t chat_id, const ChatUser& user) {
    return make_presence_event(chat_id, user, "disconnect", " disconnected.");
}

ChatEvent make_timeout_event(int64_t chat_id, const ChatUser& user) {
    return make_presence_event(chat_id, user, "timeout", "'s connection timed out.");
}

bool is_userlist_event(const std::string& type) {
    static const std::array<const char*, 6> kUserlistTypes = {
            "join", "disconnect", "timeout", "user_info", "user_group", "user_action"};
    return std::any_of(kUserlistTypes.begin(), kUserlistTypes.end(),
                       [&type](const char* t) { return type == t; });
}

nlohmann::json build_event_payload(const ChatEvent& event,
                                   const std::optional<nlohmann::json>& users) {
    nlohmann::json payload;
    payload["messages"] = nlohmann::json::array({event.to_json()});
    if (users) {
        payload["users"] = *users;
    }
    return payload;
}

}  // namespace chatlive::live
