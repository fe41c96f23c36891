#ifndef CHATLIVE_USER_LIST_STORE_HPP
#define CHATLIVE_USER_LIST_STORE_HPP

/******************************************************************************
 *
 * @file       user_list_store.hpp
 * @brief      Per-room online state: handles, liveness records and typing
 *
 * @details    Every compound transition (join, ping, leave_handle,
 *             leave_user, reconcile and the session check) is a single Lua
 *             script, so concurrent transports on any number of processes
 *             never observe partial state and no in-process lock is needed.
 *             Reporting reads may return slightly stale snapshots.
 *
 * @note       Redis keys for room {id}:
 *             - room:{id}:online           hash handle -> user_id
 *             - room:{id}:online:{handle}  string session_id, TTL liveness_ttl
 *             - room:{id}:typing           set of user numbers
 *             - room:{id}:numbers          hash user_id -> user number
 *
 *****************************************************************************/

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "common/database/redis_mgr.hpp"
#include "live/live_errors.hpp"

namespace chatlive::live {

// Typing is keyed by user number; this one never appears in a typing set
inline constexpr int kUnknownUserNumber = -1;

struct PresenceOptions {
    std::chrono::milliseconds liveness_ttl{30000};
};

// A handle still in the online map whose liveness record has expired
struct HandleEntry {
    std::string handle;
    int64_t user_id = 0;

    bool operator==(const HandleEntry& other) const {
        return handle == other.handle && user_id == other.user_id;
    }
};

class UserListStore {
public:
    UserListStore(db::RedisManager& redis, int64_t room_id, PresenceOptions options = {});

    /**
     * @brief Register a transport handle for a user
     * @param handle transport handle id
     * @param session_id session that owns the handle
     * @param user_id user the handle belongs to
     * @param user_number room-scoped number, recorded so later leaves can
     *        clear typing without a directory lookup
     * @return true if the user had no handle in the room before this call
     *
     * @details Also queues a last_online update in queue:usermeta.
     */
    bool join(const std::string& handle, const std::string& session_id, int64_t user_id,
              int user_number = kUnknownUserNumber);

    /**
     * @brief Refresh the liveness record of a handle
     * @throws PingTimeoutException if the handle left the online map or its
     *         liveness record expired
     */
    void ping(const std::string& handle);

    /**
     * @brief Remove one handle and clear the user's typing state
     * @param user_number kUnknownUserNumber falls back to the number recorded
     *        by join
     * @return true if this was the last handle of its user
     */
    bool leave_handle(const std::string& handle, int user_number);

    /**
     * @brief Remove every handle of a user
     * @return true if at least one handle was removed
     */
    bool leave_user(int64_t user_id, int user_number);

    std::set<int64_t> online_user_ids();

    // One pipelined round-trip for many rooms
    static std::map<int64_t, std::set<int64_t>> multi_online_user_ids(
            db::RedisManager& redis, const std::vector<int64_t>& room_ids);

    // Both return whether membership changed
    bool start_typing(int user_number);
    bool stop_typing(int user_number);

    std::set<int> typing_user_numbers();

    /**
     * @brief Handles whose liveness record expired without a clean leave
     *
     * @details Detection only; the caller decides whether to leave_handle.
     */
    std::vector<HandleEntry> inconsistent_entries();

    bool session_has_open_handle(const std::string& session_id, int64_t user_id);

    /**
     * @brief Visit the id of every room whose online map is non-empty
     *
     * @details Keys are walked with SCAN in batches; each room is visited
     *          once and no pooled connection is held while the visitor runs.
     */
    static void scan_active_rooms(db::RedisManager& redis,
                                  const std::function<void(int64_t)>& visitor);
    static std::vector<int64_t> scan_active_rooms(db::RedisManager& redis);

    int64_t room_id() const { return room_id_; }

private:
    db::RedisManager& redis_;
    int64_t room_id_;
    PresenceOptions options_;
    std::string online_key_;
    std::string typing_key_;
    std::string numbers_key_;
};

}  // namespace chatlive::live

#endif  // CHATLIVE_USER_LIST_STORE_HPP
