#include "connection_token_store.hpp"

#include <uuid/uuid.h>
#include <iterator>
#include <vector>

#include "common/utils/log_manager.hpp"
#include "live/live_keys.hpp"
#include "live/lua_scripts.hpp"

namespace chatlive::live {

using chatlive::utils::LogManager;

namespace {

constexpr size_t kUuidTextLength = 36;

std::string generate_token() {
    uuid_t uuid;
    uuid_generate(uuid);
    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);
    return std::string(uuid_str);
}

}  // namespace

ConnectionTokenStore::ConnectionTokenStore(db::RedisManager& redis, TokenOptions options)
        : redis_(redis), options_(options) {}

std::string ConnectionTokenStore::create(int64_t user_id, int64_t chat_id,
                                         const std::string& session_id) {
    auto token = generate_token();
    auto reverse_key = keys::token_reverse(user_id, chat_id);
    auto forward_key = keys::token_forward(token);
    auto ttl = std::to_string(options_.ttl.count());

    redis_.execute([&](sw::redis::Redis& redis) {
        return redis.eval<long long>(
                scripts::kCreateToken, {reverse_key, forward_key},
                {keys::kTokenForwardPrefix, std::to_string(user_id), std::to_string(chat_id),
                 session_id, token, ttl});
    });

    LogManager::GetLogger("token_store")
            ->debug("Issued connection token for user {} in chat {}", user_id, chat_id);
    return token;
}

TokenIdentity ConnectionTokenStore::redeem(const std::string& token) {
    if (!is_well_formed(token)) {
        throw InvalidToken("Malformed connection token");
    }

    auto forward_key = keys::token_forward(token);
    std::vector<std::string> fields;
    redis_.execute([&](sw::redis::Redis& redis) {
        redis.eval(scripts::kRedeemToken, {forward_key}, {keys::kTokenReversePrefix, token},
                   std::back_inserter(fields));
    });

    if (fields.size() != 3) {
        throw InvalidToken("Unknown or expired connection token");
    }

    TokenIdentity identity;
    try {
        identity.user_id = std::stoll(fields[0]);
        identity.chat_id = std::stoll(fields[1]);
    } catch (const std::exception& e) {
        LogManager::GetLogger("token_store")
                ->error("Corrupt token record {}: {}", forward_key, e.what());
        throw InvalidToken("Corrupt connection token record");
    }
    identity.session_id = fields[2];
    return identity;
}

bool ConnectionTokenStore::invalidate(int64_t user_id, int64_t chat_id) {
    auto reverse_key = keys::token_reverse(user_id, chat_id);
    return redis_.execute(
            [&](sw::redis::Redis& redis) { return invalidate_key(redis, reverse_key); });
}

size_t ConnectionTokenStore::invalidate_all(int64_t user_id) {
    auto pattern = keys::token_reverse_pattern(user_id);
    size_t invalidated = 0;

    redis_.execute([&](sw::redis::Redis& redis) {
        long long cursor = 0;
        do {
            std::vector<std::string> reverse_keys;
            cursor = redis.scan(cursor, pattern, 100, std::back_inserter(reverse_keys));
            for (const auto& key : reverse_keys) {
                if (invalidate_key(redis, key)) {
                    ++invalidated;
                }
            }
        } while (cursor != 0);
    });

    LogManager::GetLogger("token_store")
            ->info("Invalidated {} connection tokens of user {}", invalidated, user_id);
    return invalidated;
}

bool ConnectionTokenStore::is_well_formed(const std::string& token) {
    if (token.size() != kUuidTextLength) {
        return false;
    }
    uuid_t parsed;
    return uuid_parse(token.c_str(), parsed) == 0;
}

bool ConnectionTokenStore::invalidate_key(sw::redis::Redis& redis,
                                          const std::string& reverse_key) {
    return redis.eval<long long>(scripts::kInvalidateToken, {reverse_key},
                                 {keys::kTokenForwardPrefix}) == 1;
}

}  // namespace chatlive::live
