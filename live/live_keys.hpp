#ifndef CHATLIVE_LIVE_KEYS_HPP
#define CHATLIVE_LIVE_KEYS_HPP

/******************************************************************************
 *
 * @file       live_keys.hpp
 * @brief      Redis key and pub/sub channel names shared by the live modules
 *
 * @note       Key layout:
 *             - token:forward:{token}             hash user_id/chat_id/session_id
 *             - token:reverse:{user_id}:{chat_id} string token
 *             - room:{room_id}:online             hash handle -> user_id
 *             - room:{room_id}:online:{handle}    string session_id, with TTL
 *             - room:{room_id}:typing             set of user numbers
 *             - queue:usermeta                    hash chatuser:{user_id} -> JSON
 *
 *****************************************************************************/

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace chatlive::live::keys {

inline const std::string kTokenForwardPrefix = "token:forward:";
inline const std::string kTokenReversePrefix = "token:reverse:";
inline const std::string kRoomPrefix = "room:";
inline const std::string kOnlineSuffix = ":online";
inline const std::string kUserMetaQueue = "queue:usermeta";
inline const std::string kUserMetaFieldPrefix = "chatuser:";
inline const std::string kChannelPrefix = "channel:";

inline std::string token_forward(const std::string& token) {
    return kTokenForwardPrefix + token;
}

inline std::string token_reverse(int64_t user_id, int64_t chat_id) {
    return kTokenReversePrefix + std::to_string(user_id) + ":" + std::to_string(chat_id);
}

// SCAN pattern matching every reverse record of one user
inline std::string token_reverse_pattern(int64_t user_id) {
    return kTokenReversePrefix + std::to_string(user_id) + ":*";
}

inline std::string room_online(int64_t room_id) {
    return kRoomPrefix + std::to_string(room_id) + kOnlineSuffix;
}

inline std::string room_liveness(int64_t room_id, const std::string& handle) {
    return room_online(room_id) + ":" + handle;
}

inline std::string room_typing(int64_t room_id) {
    return kRoomPrefix + std::to_string(room_id) + ":typing";
}

// user_id -> room-scoped user number of every online user
inline std::string room_numbers(int64_t room_id) {
    return kRoomPrefix + std::to_string(room_id) + ":numbers";
}

inline std::string room_online_pattern() {
    return kRoomPrefix + "*" + kOnlineSuffix;
}

inline std::string usermeta_field(int64_t user_id) {
    return kUserMetaFieldPrefix + std::to_string(user_id);
}

inline std::string broadcast_channel(int64_t room_id) {
    return kChannelPrefix + std::to_string(room_id);
}

inline std::string private_channel(int64_t room_id, int64_t user_id) {
    return broadcast_channel(room_id) + ":" + std::to_string(user_id);
}

/**
 * @brief Room id of a "room:{id}:online" key
 * @return std::nullopt when the key does not have that shape or the id is not
 *         an integer
 */
inline std::optional<int64_t> parse_online_key(const std::string& key) {
    if (key.size() <= kRoomPrefix.size() + kOnlineSuffix.size() ||
        key.compare(0, kRoomPrefix.size(), kRoomPrefix) != 0 ||
        key.compare(key.size() - kOnlineSuffix.size(), kOnlineSuffix.size(), kOnlineSuffix) != 0) {
        return std::nullopt;
    }
    std::string id = key.substr(kRoomPrefix.size(),
                                key.size() - kRoomPrefix.size() - kOnlineSuffix.size());
    try {
        size_t pos = 0;
        int64_t room_id = std::stoll(id, &pos);
        if (pos != id.size()) {
            return std::nullopt;
        }
        return room_id;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace chatlive::live::keys

#endif  // CHATLIVE_LIVE_KEYS_HPP
