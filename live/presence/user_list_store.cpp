#include "user_list_store.hpp"

#include <iterator>
#include <nlohmann/json.hpp>

#include "common/utils/log_manager.hpp"
#include "common/utils/time_utils.hpp"
#include "live/live_keys.hpp"
#include "live/lua_scripts.hpp"

namespace chatlive::live {

using chatlive::utils::LogManager;

namespace {

std::set<int64_t> parse_user_ids(const std::vector<std::string>& values) {
    std::set<int64_t> user_ids;
    for (const auto& value : values) {
        try {
            user_ids.insert(std::stoll(value));
        } catch (const std::exception&) {
            LogManager::GetLogger("user_list")->warn("Ignoring non-numeric user id '{}'", value);
        }
    }
    return user_ids;
}

}  // namespace

UserListStore::UserListStore(db::RedisManager& redis, int64_t room_id, PresenceOptions options)
        : redis_(redis),
          room_id_(room_id),
          options_(options),
          online_key_(keys::room_online(room_id)),
          typing_key_(keys::room_typing(room_id)),
          numbers_key_(keys::room_numbers(room_id)) {}

bool UserListStore::join(const std::string& handle, const std::string& session_id,
                         int64_t user_id, int user_number) {
    nlohmann::json meta;
    meta["last_online"] = utils::TimeUtils::unix_seconds_string();
    meta["chat_id"] = room_id_;

    auto liveness_key = keys::room_liveness(room_id_, handle);
    auto changed = redis_.execute([&](sw::redis::Redis& redis) {
        return redis.eval<long long>(
                scripts::kJoin, {online_key_, liveness_key, keys::kUserMetaQueue, numbers_key_},
                {handle, std::to_string(user_id), session_id,
                 std::to_string(options_.liveness_ttl.count()), keys::usermeta_field(user_id),
                 meta.dump(), std::to_string(user_number)});
    });

    LogManager::GetLogger("user_list")
            ->debug("Handle {} of user {} joined room {} (changed: {})", handle, user_id, room_id_,
                    changed == 1);
    return changed == 1;
}

void UserListStore::ping(const std::string& handle) {
    auto liveness_key = keys::room_liveness(room_id_, handle);
    auto alive = redis_.execute([&](sw::redis::Redis& redis) {
        return redis.eval<long long>(scripts::kPing, {online_key_, liveness_key},
                                     {handle, std::to_string(options_.liveness_ttl.count())});
    });
    if (alive != 1) {
        LogManager::GetLogger("user_list")
                ->info("Ping from expired handle {} in room {}", handle, room_id_);
        throw PingTimeoutException("Handle " + handle + " timed out in room " +
                                   std::to_string(room_id_));
    }
}

bool UserListStore::leave_handle(const std::string& handle, int user_number) {
    auto liveness_key = keys::room_liveness(room_id_, handle);
    auto changed = redis_.execute([&](sw::redis::Redis& redis) {
        return redis.eval<long long>(scripts::kLeaveHandle,
                                     {online_key_, liveness_key, typing_key_, numbers_key_},
                                     {handle, std::to_string(user_number)});
    });
    return changed == 1;
}

bool UserListStore::leave_user(int64_t user_id, int user_number) {
    auto removed = redis_.execute([&](sw::redis::Redis& redis) {
        return redis.eval<long long>(scripts::kLeaveUser, {online_key_, typing_key_, numbers_key_},
                                     {std::to_string(user_id), std::to_string(user_number)});
    });
    if (removed > 0) {
        LogManager::GetLogger("user_list")
                ->debug("Removed {} handles of user {} from room {}", removed, user_id, room_id_);
    }
    return removed > 0;
}

std::set<int64_t> UserListStore::online_user_ids() {
    auto values = redis_.execute_with_retry([&](sw::redis::Redis& redis) {
        std::vector<std::string> result;
        redis.hvals(online_key_, std::back_inserter(result));
        return result;
    });
    return parse_user_ids(values);
}

std::map<int64_t, std::set<int64_t>> UserListStore::multi_online_user_ids(
        db::RedisManager& redis, const std::vector<int64_t>& room_ids) {
    std::map<int64_t, std::set<int64_t>> result;
    if (room_ids.empty()) {
        return result;
    }

    auto per_room = redis.execute_with_retry([&](sw::redis::Redis& conn) {
        auto pipe = conn.pipeline();
        for (auto room_id : room_ids) {
            pipe.hvals(keys::room_online(room_id));
        }
        auto replies = pipe.exec();

        std::vector<std::vector<std::string>> values(room_ids.size());
        for (size_t i = 0; i < room_ids.size(); ++i) {
            replies.get(i, std::back_inserter(values[i]));
        }
        return values;
    });

    for (size_t i = 0; i < room_ids.size(); ++i) {
        auto& ids = result[room_ids[i]];
        auto parsed = parse_user_ids(per_room[i]);
        ids.insert(parsed.begin(), parsed.end());
    }
    return result;
}

bool UserListStore::start_typing(int user_number) {
    return redis_.execute([&](sw::redis::Redis& redis) {
        return redis.sadd(typing_key_, std::to_string(user_number));
    }) > 0;
}

bool UserListStore::stop_typing(int user_number) {
    return redis_.execute([&](sw::redis::Redis& redis) {
        return redis.srem(typing_key_, std::to_string(user_number));
    }) > 0;
}

std::set<int> UserListStore::typing_user_numbers() {
    auto members = redis_.execute_with_retry([&](sw::redis::Redis& redis) {
        std::vector<std::string> result;
        redis.smembers(typing_key_, std::back_inserter(result));
        return result;
    });

    std::set<int> numbers;
    for (const auto& member : members) {
        try {
            numbers.insert(std::stoi(member));
        } catch (const std::exception&) {
            LogManager::GetLogger("user_list")
                    ->warn("Ignoring non-numeric typing entry '{}' in room {}", member, room_id_);
        }
    }
    return numbers;
}

std::vector<HandleEntry> UserListStore::inconsistent_entries() {
    auto flat = redis_.execute_with_retry([&](sw::redis::Redis& redis) {
        std::vector<std::string> result;
        redis.eval(scripts::kInconsistentEntries, {online_key_}, {}, std::back_inserter(result));
        return result;
    });

    std::vector<HandleEntry> entries;
    for (size_t i = 0; i + 1 < flat.size(); i += 2) {
        try {
            entries.push_back(HandleEntry{flat[i], std::stoll(flat[i + 1])});
        } catch (const std::exception&) {
            LogManager::GetLogger("user_list")
                    ->warn("Handle {} in room {} maps to non-numeric user '{}'", flat[i], room_id_,
                           flat[i + 1]);
        }
    }
    return entries;
}

bool UserListStore::session_has_open_handle(const std::string& session_id, int64_t user_id) {
    return redis_.execute_with_retry([&](sw::redis::Redis& redis) {
        return redis.eval<long long>(scripts::kSessionHasOpenHandle, {online_key_},
                                     {session_id, std::to_string(user_id)});
    }) == 1;
}

void UserListStore::scan_active_rooms(db::RedisManager& redis,
                                      const std::function<void(int64_t)>& visitor) {
    auto pattern = keys::room_online_pattern();
    std::set<int64_t> seen;
    long long cursor = 0;
    do {
        std::vector<std::string> batch;
        cursor = redis.execute_with_retry([&](sw::redis::Redis& conn) {
            batch.clear();
            return conn.scan(cursor, pattern, 100, std::back_inserter(batch));
        });

        for (const auto& key : batch) {
            auto room_id = keys::parse_online_key(key);
            if (room_id && seen.insert(*room_id).second) {
                visitor(*room_id);
            }
        }
    } while (cursor != 0);
}

std::vector<int64_t> UserListStore::scan_active_rooms(db::RedisManager& redis) {
    std::vector<int64_t> rooms;
    scan_active_rooms(redis, [&rooms](int64_t room_id) { rooms.push_back(room_id); });
    return rooms;
}

}  // namespace chatlive::live
