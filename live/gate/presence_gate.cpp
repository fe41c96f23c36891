#include "presence_gate.hpp"

#include "common/utils/log_manager.hpp"

namespace chatlive::live {

using chatlive::utils::LogManager;

PresenceGate::PresenceGate(db::RedisManager& redis, ConnectionTokenStore& tokens,
                           ChatPublisher& publisher, UserDirectory& directory,
                           PresenceOptions options)
        : redis_(redis),
          tokens_(tokens),
          publisher_(publisher),
          directory_(directory),
          options_(options) {}

LiveContext PresenceGate::attach(const std::string& token, const std::string& handle) {
    auto identity = tokens_.redeem(token);

    auto user = directory_.find_user(identity.chat_id, identity.user_id);
    if (!user) {
        LogManager::GetLogger("presence_gate")
                ->warn("User {} redeemed a token for chat {} but is not a member",
                       identity.user_id, identity.chat_id);
        throw std::runtime_error("User " + std::to_string(identity.user_id) +
                                 " is not a member of chat " + std::to_string(identity.chat_id));
    }

    LiveContext ctx;
    ctx.chat_id = identity.chat_id;
    ctx.user_id = identity.user_id;
    ctx.session_id = std::move(identity.session_id);
    ctx.handle = handle;
    ctx.user_number = user->number;
    return ctx;
}

LiveHandler PresenceGate::mark_alive(LiveHandler handler) {
    return [this, handler = std::move(handler)](LiveContext& ctx) {
        before_request(ctx);
        return handler(ctx);
    };
}

bool PresenceGate::close_handle(LiveContext& ctx) {
    UserListStore store(redis_, ctx.chat_id, options_);
    bool went_offline = store.leave_handle(ctx.handle, ctx.user_number);
    ctx.joined = false;
    if (went_offline) {
        publish_presence(ctx, &make_disconnect_event);
    }
    return went_offline;
}

bool PresenceGate::quit(LiveContext& ctx) {
    UserListStore store(redis_, ctx.chat_id, options_);
    bool removed = store.leave_user(ctx.user_id, ctx.user_number);
    ctx.joined = false;
    if (removed) {
        publish_presence(ctx, &make_disconnect_event);
    }
    return removed;
}

bool PresenceGate::start_typing(LiveContext& ctx) {
    UserListStore store(redis_, ctx.chat_id, options_);
    bool changed = store.start_typing(ctx.user_number);
    if (changed) {
        publish_typing(store, ctx.chat_id);
    }
    return changed;
}

bool PresenceGate::stop_typing(LiveContext& ctx) {
    UserListStore store(redis_, ctx.chat_id, options_);
    bool changed = store.stop_typing(ctx.user_number);
    if (changed) {
        publish_typing(store, ctx.chat_id);
    }
    return changed;
}

void PresenceGate::before_request(LiveContext& ctx) {
    UserListStore store(redis_, ctx.chat_id, options_);
    if (ctx.joined) {
        store.ping(ctx.handle);
        return;
    }

    if (store.join(ctx.handle, ctx.session_id, ctx.user_id, ctx.user_number)) {
        publish_presence(ctx, &make_join_event);
    }
    ctx.joined = true;
}

void PresenceGate::publish_presence(const LiveContext& ctx, EventFactory factory) {
    auto user = directory_.find_user(ctx.chat_id, ctx.user_id);
    if (!user) {
        LogManager::GetLogger("presence_gate")
                ->warn("No profile for user {} in chat {}, presence event dropped", ctx.user_id,
                       ctx.chat_id);
        return;
    }
    publisher_.send(factory(ctx.chat_id, *user));
}

void PresenceGate::publish_typing(UserListStore& store, int64_t chat_id) {
    publisher_.send_typing(chat_id, store.typing_user_numbers());
}

}  // namespace chatlive::live
