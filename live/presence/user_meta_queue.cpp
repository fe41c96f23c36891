#include "user_meta_queue.hpp"

#include <iterator>
#include <nlohmann/json.hpp>

#include "common/utils/log_manager.hpp"
#include "live/live_keys.hpp"
#include "live/lua_scripts.hpp"

namespace chatlive::live {

using chatlive::utils::LogManager;

std::vector<UserMetaEntry> UserMetaQueue::drain() {
    std::vector<std::string> flat;
    redis_.execute([&](sw::redis::Redis& redis) {
        redis.eval(scripts::kDrainQueue, {keys::kUserMetaQueue}, {}, std::back_inserter(flat));
    });

    std::vector<UserMetaEntry> entries;
    for (size_t i = 0; i + 1 < flat.size(); i += 2) {
        const auto& field = flat[i];
        try {
            const auto& prefix = keys::kUserMetaFieldPrefix;
            if (field.compare(0, prefix.size(), prefix) != 0) {
                throw std::invalid_argument("unexpected field name");
            }
            auto meta = nlohmann::json::parse(flat[i + 1]);

            UserMetaEntry entry;
            entry.user_id = std::stoll(field.substr(prefix.size()));
            entry.chat_id = meta.at("chat_id").get<int64_t>();
            entry.last_online = meta.at("last_online").get<std::string>();
            entries.push_back(std::move(entry));
        } catch (const std::exception& e) {
            LogManager::GetLogger("user_list")
                    ->warn("Dropping malformed usermeta entry {}: {}", field, e.what());
        }
    }
    return entries;
}

}  // namespace chatlive::live
