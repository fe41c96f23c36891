#ifndef CHATLIVE_LIVE_TEST_SUPPORT_HPP
#define CHATLIVE_LIVE_TEST_SUPPORT_HPP

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "live/directory/user_directory.hpp"
#include "test/redis_test_support.hpp"

namespace chatlive::live::test {

class MockUserDirectory : public UserDirectory {
public:
    MOCK_METHOD(std::optional<ChatUser>, find_user, (int64_t chat_id, int64_t user_id),
                (override));
    MOCK_METHOD(nlohmann::json, user_list,
                (int64_t chat_id, const std::set<int64_t>& online_user_ids), (override));
};

inline ChatUser MakeUser(int64_t user_id, int number, const std::string& name,
                         const std::string& acronym) {
    ChatUser user;
    user.user_id = user_id;
    user.number = number;
    user.name = name;
    user.acronym = acronym;
    user.color = "336699";
    return user;
}

/**
 * Subscribes to one channel and waits for the server to confirm, so nothing
 * published afterwards can be missed
 */
class ChannelProbe {
public:
    explicit ChannelProbe(const std::string& channel) {
        auto opts = chatlive::test::TestRedisConfig().to_connection_options();
        opts.socket_timeout = std::chrono::milliseconds(50);
        client_ = std::make_unique<sw::redis::Redis>(opts);
        subscriber_ = std::make_unique<sw::redis::Subscriber>(client_->subscriber());

        subscriber_->on_message([this](std::string, std::string payload) {
            if (!message_) {
                message_ = std::move(payload);
            }
        });
        subscriber_->on_meta([this](sw::redis::Subscriber::MsgType type,
                                    sw::redis::OptionalString, long long) {
            if (type == sw::redis::Subscriber::MsgType::SUBSCRIBE) {
                subscribed_ = true;
            }
        });
        subscriber_->subscribe(channel);

        Pump(std::chrono::milliseconds(2000), [this] { return subscribed_; });
        if (!subscribed_) {
            throw std::runtime_error("Subscription to " + channel + " was not confirmed");
        }
    }

    // Next payload on the channel, std::nullopt if none arrives in time
    std::optional<std::string> Next(std::chrono::milliseconds timeout) {
        Pump(timeout, [this] { return message_.has_value(); });
        auto result = std::move(message_);
        message_.reset();
        return result;
    }

    std::optional<nlohmann::json> NextJson(std::chrono::milliseconds timeout) {
        auto payload = Next(timeout);
        if (!payload) {
            return std::nullopt;
        }
        return nlohmann::json::parse(*payload);
    }

private:
    template <typename Done>
    void Pump(std::chrono::milliseconds timeout, Done done) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!done() && std::chrono::steady_clock::now() < deadline) {
            try {
                subscriber_->consume();
            } catch (const sw::redis::TimeoutError&) {
                // nothing yet
            }
        }
    }

    std::unique_ptr<sw::redis::Redis> client_;
    std::unique_ptr<sw::redis::Subscriber> subscriber_;
    std::optional<std::string> message_;
    bool subscribed_ = false;
};

}  // namespace chatlive::live::test

#endif  // CHATLIVE_LIVE_TEST_SUPPORT_HPP
