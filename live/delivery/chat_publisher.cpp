#include "chat_publisher.hpp"

#include "common/utils/log_manager.hpp"
#include "live/live_keys.hpp"
#include "live/presence/user_list_store.hpp"

namespace chatlive::live {

using chatlive::utils::LogManager;

long long ChatPublisher::send(const ChatEvent& event) {
    std::optional<nlohmann::json> users;
    if (is_userlist_event(event.type)) {
        auto online_ids = UserListStore(redis_, event.chat_id).online_user_ids();
        // Don't bother the directory when nobody is online
        users = online_ids.empty() ? nlohmann::json::array()
                                   : directory_.user_list(event.chat_id, online_ids);
    }
    return publish(keys::broadcast_channel(event.chat_id),
                   build_event_payload(event, users).dump());
}

long long ChatPublisher::send_private(const ChatEvent& event, int64_t user_id) {
    return publish(keys::private_channel(event.chat_id, user_id),
                   build_event_payload(event).dump());
}

long long ChatPublisher::send_typing(int64_t chat_id, const std::set<int>& typing_numbers) {
    nlohmann::json payload;
    payload["typing"] = typing_numbers;
    return publish(keys::broadcast_channel(chat_id), payload.dump());
}

long long ChatPublisher::publish(const std::string& channel, const std::string& payload) {
    auto receivers = redis_.execute(
            [&](sw::redis::Redis& redis) { return redis.publish(channel, payload); });
    LogManager::GetLogger("chat_publisher")
            ->debug("Published {} bytes to {} ({} receivers)", payload.size(), channel, receivers);
    return receivers;
}

}  // namespace chatlive::live
