#ifndef CHATLIVE_PRESENCE_GATE_HPP
#define CHATLIVE_PRESENCE_GATE_HPP

/******************************************************************************
 *
 * @file       presence_gate.hpp
 * @brief      Middleware between a transport and the presence registry
 *
 * @details    A transport redeems its connection token with attach(), wraps
 *             each request handler with mark_alive(), and reports the end of
 *             the connection with close_handle() or quit(). The gate publishes
 *             join, disconnect and typing events as the registry reports state
 *             changes.
 *
 *****************************************************************************/

#include <cstdint>
#include <functional>
#include <string>

#include "common/database/redis_mgr.hpp"
#include "live/delivery/chat_event.hpp"
#include "live/delivery/chat_publisher.hpp"
#include "live/directory/user_directory.hpp"
#include "live/presence/user_list_store.hpp"
#include "live/token/connection_token_store.hpp"

namespace chatlive::live {

// Per-connection request context
struct LiveContext {
    int64_t chat_id = 0;
    int64_t user_id = 0;
    std::string session_id;
    std::string handle;
    int user_number = kUnknownUserNumber;
    bool joined = false;  // set by the first mark_alive request
};

using LiveHandler = std::function<std::string(LiveContext&)>;

class PresenceGate {
public:
    PresenceGate(db::RedisManager& redis, ConnectionTokenStore& tokens, ChatPublisher& publisher,
                 UserDirectory& directory, PresenceOptions options = {});

    /**
     * @brief Redeem a connection token for a new transport handle
     * @throws InvalidToken if the token cannot be redeemed
     * @throws std::runtime_error if the user is not a member of the chat
     */
    LiveContext attach(const std::string& token, const std::string& handle);

    /**
     * @brief Wrap a request handler with presence bookkeeping
     *
     * @details The first call on a context joins the room and publishes a
     *          join event if the user was offline; later calls ping and let
     *          PingTimeoutException reach the transport, which must then drop
     *          the connection.
     */
    LiveHandler mark_alive(LiveHandler handler);

    /**
     * @brief The transport closed its handle
     * @return true if the user went offline
     */
    bool close_handle(LiveContext& ctx);

    /**
     * @brief The user left the room from every handle
     * @return true if any handle was removed
     */
    bool quit(LiveContext& ctx);

    bool start_typing(LiveContext& ctx);
    bool stop_typing(LiveContext& ctx);

private:
    using EventFactory = ChatEvent (*)(int64_t, const ChatUser&);

    void before_request(LiveContext& ctx);
    void publish_presence(const LiveContext& ctx, EventFactory factory);
    void publish_typing(UserListStore& store, int64_t chat_id);

    db::RedisManager& redis_;
    ConnectionTokenStore& tokens_;
    ChatPublisher& publisher_;
    UserDirectory& directory_;
    PresenceOptions options_;
};

}  // namespace chatlive::live

#endif  // CHATLIVE_PRESENCE_GATE_HPP
