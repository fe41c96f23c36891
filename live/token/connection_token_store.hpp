#ifndef CHATLIVE_CONNECTION_TOKEN_STORE_HPP
#define CHATLIVE_CONNECTION_TOKEN_STORE_HPP

/******************************************************************************
 *
 * @file       connection_token_store.hpp
 * @brief      Single-use handoff tokens between the authenticated request
 *             layer and the live transport
 *
 * @details    A token is a lowercase RFC 4122 UUID. Two records are kept in
 *             lockstep: the forward hash token:forward:{token} and the reverse
 *             string token:reverse:{user_id}:{chat_id}. Both carry the token
 *             window as their expiry, so an expired token reads as unknown.
 *
 *****************************************************************************/

#include <chrono>
#include <cstdint>
#include <string>

#include "common/database/redis_mgr.hpp"
#include "live/live_errors.hpp"

namespace chatlive::live {

struct TokenOptions {
    std::chrono::milliseconds ttl{10000};
};

// Identity a token was issued for
struct TokenIdentity {
    int64_t user_id = 0;
    int64_t chat_id = 0;
    std::string session_id;
};

class ConnectionTokenStore {
public:
    explicit ConnectionTokenStore(db::RedisManager& redis, TokenOptions options = {});

    /**
     * @brief Issue a fresh token for (user_id, chat_id)
     * @return the new token
     *
     * @details The previous token of the pair, if any, is deleted in the same
     *          atomic step, so at most one token per pair is ever live.
     */
    std::string create(int64_t user_id, int64_t chat_id, const std::string& session_id);

    /**
     * @brief Consume a token
     * @throws InvalidToken if the token is malformed, unknown, expired or was
     *         already redeemed
     */
    TokenIdentity redeem(const std::string& token);

    /**
     * @brief Delete the live token of (user_id, chat_id), if any
     * @return true if a token was invalidated
     */
    bool invalidate(int64_t user_id, int64_t chat_id);

    /**
     * @brief Delete every live token of a user across all chats
     * @return number of tokens invalidated
     *
     * @details Each forward/reverse pair is removed atomically; the sweep as a
     *          whole is not.
     */
    size_t invalidate_all(int64_t user_id);

    static bool is_well_formed(const std::string& token);

    const TokenOptions& options() const { return options_; }

private:
    static bool invalidate_key(sw::redis::Redis& redis, const std::string& reverse_key);

    db::RedisManager& redis_;
    TokenOptions options_;
};

}  // namespace chatlive::live

#endif  // CHATLIVE_CONNECTION_TOKEN_STORE_HPP
