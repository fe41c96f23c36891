#ifndef CHATLIVE_USER_DIRECTORY_HPP
#define CHATLIVE_USER_DIRECTORY_HPP

/******************************************************************************
 *
 * @file       user_directory.hpp
 * @brief      Lookup of room-scoped user profiles owned by the relational
 *             store
 *
 * @details    The live core never queries the relational store itself. The
 *             host application implements UserDirectory; InMemoryUserDirectory
 *             serves the reaper daemon and tests.
 *
 *****************************************************************************/

#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace chatlive::live {

// A user as seen inside one chat
struct ChatUser {
    int64_t user_id = 0;
    int number = 0;  // room-scoped, used by typing indicators
    std::string name;
    std::string acronym;
    std::string color = "000000";

    nlohmann::json to_json() const {
        return {{"user_id", user_id},
                {"number", number},
                {"name", name},
                {"acronym", acronym},
                {"color", color}};
    }
};

class UserDirectory {
public:
    virtual ~UserDirectory() = default;

    virtual std::optional<ChatUser> find_user(int64_t chat_id, int64_t user_id) = 0;

    /**
     * @brief User list attached to presence events
     * @return JSON array with one object per known online user
     */
    virtual nlohmann::json user_list(int64_t chat_id, const std::set<int64_t>& online_user_ids) = 0;
};

class InMemoryUserDirectory : public UserDirectory {
public:
    void add_user(int64_t chat_id, ChatUser user) {
        std::lock_guard<std::mutex> lock(mutex_);
        users_[{chat_id, user.user_id}] = std::move(user);
    }

    /**
     * @brief Load {"chat_id": N, "user_id": N, "number": N, "name": ...}
     *        objects from a JSON array
     * @return number of users loaded
     * @throws nlohmann::json::exception on a malformed entry
     */
    size_t load(const nlohmann::json& users) {
        size_t loaded = 0;
        for (const auto& item : users) {
            ChatUser user;
            user.user_id = item.at("user_id").get<int64_t>();
            user.number = item.at("number").get<int>();
            user.name = item.at("name").get<std::string>();
            user.acronym = item.value("acronym", "");
            user.color = item.value("color", "000000");
            add_user(item.at("chat_id").get<int64_t>(), std::move(user));
            ++loaded;
        }
        return loaded;
    }

    std::optional<ChatUser> find_user(int64_t chat_id, int64_t user_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = users_.find({chat_id, user_id});
        if (it == users_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    nlohmann::json user_list(int64_t chat_id, const std::set<int64_t>& online_user_ids) override {
        auto list = nlohmann::json::array();
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto user_id : online_user_ids) {
            auto it = users_.find({chat_id, user_id});
            if (it != users_.end()) {
                list.push_back(it->second.to_json());
            }
        }
        return list;
    }

private:
    std::mutex mutex_;
    std::map<std::pair<int64_t, int64_t>, ChatUser> users_;
};

}  // namespace chatlive::live

#endif  // CHATLIVE_USER_DIRECTORY_HPP
