#ifndef CHATLIVE_LUA_SCRIPTS_HPP
#define CHATLIVE_LUA_SCRIPTS_HPP

/******************************************************************************
 *
 * @file       lua_scripts.hpp
 * @brief      Lua scripts run with EVAL for every compound state transition
 *
 * @details    Redis runs a script atomically with respect to every other
 *             command, so no caller ever observes a half-applied transition.
 *             Scripts reply with integers or flat string arrays only.
 *
 *****************************************************************************/

namespace chatlive::live::scripts {

// KEYS: reverse, new forward
// ARGV: forward prefix, user_id, chat_id, session_id, token, ttl_ms
inline constexpr const char* kCreateToken = R"lua(
local existing = redis.call("GET", KEYS[1])
if existing then
    redis.call("DEL", ARGV[1] .. existing)
end
redis.call("DEL", KEYS[2])
redis.call("HSET", KEYS[2], "user_id", ARGV[2], "chat_id", ARGV[3], "session_id", ARGV[4])
redis.call("PEXPIRE", KEYS[2], ARGV[6])
redis.call("SET", KEYS[1], ARGV[5], "PX", ARGV[6])
return 1
)lua";

// KEYS: forward
// ARGV: reverse prefix, token
// Reply: {user_id, chat_id, session_id}, or {} when the token is unknown
inline constexpr const char* kRedeemToken = R"lua(
local fields = redis.call("HMGET", KEYS[1], "user_id", "chat_id", "session_id")
if not fields[1] or not fields[2] or not fields[3] then
    return {}
end
redis.call("DEL", KEYS[1])
local reverse = ARGV[1] .. fields[1] .. ":" .. fields[2]
if redis.call("GET", reverse) == ARGV[2] then
    redis.call("DEL", reverse)
end
return fields
)lua";

// KEYS: reverse
// ARGV: forward prefix
inline constexpr const char* kInvalidateToken = R"lua(
local token = redis.call("GET", KEYS[1])
if not token then
    return 0
end
redis.call("DEL", KEYS[1], ARGV[1] .. token)
return 1
)lua";

// KEYS: online, liveness, usermeta queue, numbers
// ARGV: handle, user_id, session_id, ttl_ms, usermeta field, usermeta json,
//       user_number (-1 when unknown)
// Reply: 1 when the user had no handle before this join
inline constexpr const char* kJoin = R"lua(
local was_online = false
for _, uid in ipairs(redis.call("HVALS", KEYS[1])) do
    if uid == ARGV[2] then
        was_online = true
        break
    end
end
redis.call("HSET", KEYS[3], ARGV[5], ARGV[6])
redis.call("HSET", KEYS[1], ARGV[1], ARGV[2])
redis.call("SET", KEYS[2], ARGV[3], "PX", ARGV[4])
if tonumber(ARGV[7]) >= 0 then
    redis.call("HSET", KEYS[4], ARGV[2], ARGV[7])
end
if was_online then
    return 0
end
return 1
)lua";

// KEYS: online, liveness
// ARGV: handle, ttl_ms
inline constexpr const char* kPing = R"lua(
if not redis.call("HGET", KEYS[1], ARGV[1]) then
    return 0
end
return redis.call("PEXPIRE", KEYS[2], ARGV[2])
)lua";

// KEYS: online, liveness, typing, numbers
// ARGV: handle, user_number (-1: use the number recorded at join)
// Reply: 1 when the owner of the handle has no handle left
inline constexpr const char* kLeaveHandle = R"lua(
local uid = redis.call("HGET", KEYS[1], ARGV[1])
redis.call("HDEL", KEYS[1], ARGV[1])
redis.call("DEL", KEYS[2])
local number = ARGV[2]
if uid and tonumber(number) < 0 then
    number = redis.call("HGET", KEYS[4], uid) or number
end
redis.call("SREM", KEYS[3], number)
if not uid then
    return 0
end
for _, other in ipairs(redis.call("HVALS", KEYS[1])) do
    if other == uid then
        return 0
    end
end
redis.call("HDEL", KEYS[4], uid)
return 1
)lua";

// KEYS: online, typing, numbers
// ARGV: user_id, user_number (-1: use the number recorded at join)
// Reply: number of handles removed
inline constexpr const char* kLeaveUser = R"lua(
local removed = 0
local entries = redis.call("HGETALL", KEYS[1])
for i = 1, #entries, 2 do
    if entries[i + 1] == ARGV[1] then
        redis.call("HDEL", KEYS[1], entries[i])
        redis.call("DEL", KEYS[1] .. ":" .. entries[i])
        removed = removed + 1
    end
end
local number = ARGV[2]
if tonumber(number) < 0 then
    number = redis.call("HGET", KEYS[3], ARGV[1]) or number
end
redis.call("SREM", KEYS[2], number)
redis.call("HDEL", KEYS[3], ARGV[1])
return removed
)lua";

// KEYS: online
// Reply: flat {handle, user_id, ...} of handles without a liveness record
inline constexpr const char* kInconsistentEntries = R"lua(
local result = {}
local entries = redis.call("HGETALL", KEYS[1])
for i = 1, #entries, 2 do
    if redis.call("EXISTS", KEYS[1] .. ":" .. entries[i]) == 0 then
        table.insert(result, entries[i])
        table.insert(result, entries[i + 1])
    end
end
return result
)lua";

// KEYS: online
// ARGV: session_id, user_id
inline constexpr const char* kSessionHasOpenHandle = R"lua(
local entries = redis.call("HGETALL", KEYS[1])
for i = 1, #entries, 2 do
    if entries[i + 1] == ARGV[2] and
            redis.call("GET", KEYS[1] .. ":" .. entries[i]) == ARGV[1] then
        return 1
    end
end
return 0
)lua";

// KEYS: usermeta queue
// Reply: flat {field, json, ...}
inline constexpr const char* kDrainQueue = R"lua(
local entries = redis.call("HGETALL", KEYS[1])
redis.call("DEL", KEYS[1])
return entries
)lua";

}  // namespace chatlive::live::scripts

#endif  // CHATLIVE_LUA_SCRIPTS_HPP
