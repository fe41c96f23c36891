#include "message_listener.hpp"

#include "common/utils/log_manager.hpp"
#include "live/live_keys.hpp"

namespace chatlive::live {

using chatlive::utils::LogManager;

MessageListener::MessageListener(db::RedisManager& redis, int64_t chat_id, int64_t user_id,
                                 std::chrono::milliseconds poll_interval)
        : redis_(redis), chat_id_(chat_id), user_id_(user_id), poll_interval_(poll_interval) {}

std::optional<std::string> MessageListener::wait(std::chrono::milliseconds timeout) {
    auto logger = LogManager::GetLogger("message_listener");
    if (cancelled_.load()) {
        return std::nullopt;
    }

    auto opts = redis_.config().to_connection_options();
    opts.socket_timeout = poll_interval_;
    // Lazily connected; only the subscriber below opens a socket
    sw::redis::Redis client(opts);
    auto subscriber = client.subscriber();

    std::optional<std::string> message;
    subscriber.on_message([&message](std::string /*channel*/, std::string payload) {
        if (!message) {
            message = std::move(payload);
        }
    });
    subscriber.subscribe(
            {keys::broadcast_channel(chat_id_), keys::private_channel(chat_id_, user_id_)});

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!message && !cancelled_.load() && std::chrono::steady_clock::now() < deadline) {
        try {
            subscriber.consume();
        } catch (const sw::redis::TimeoutError&) {
            // poll interval elapsed, re-check deadline and cancel
        }
    }

    if (!message) {
        logger->debug("Listener for user {} in chat {} returned without a message", user_id_,
                      chat_id_);
    }
    return message;
}

}  // namespace chatlive::live
