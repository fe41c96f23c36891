#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <future>
#include <thread>
#include "live/delivery/chat_publisher.hpp"
#include "live/delivery/message_listener.hpp"
#include "live/live_keys.hpp"
#include "live/presence/user_list_store.hpp"
#include "test/live/live_test_support.hpp"

namespace chatlive::live::test {

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;

class ChatPublisherTest : public chatlive::test::RedisFixture {
protected:
    ::testing::NiceMock<MockUserDirectory> directory_;
};

TEST_F(ChatPublisherTest, NoSubscribers) {
    ChatPublisher publisher(redis_, directory_);
    ChatEvent event;
    event.chat_id = 42;
    event.type = "message";
    event.text = "hello";
    EXPECT_EQ(publisher.send(event), 0);
}

TEST_F(ChatPublisherTest, PlainEventHasNoUserList) {
    ChatPublisher publisher(redis_, directory_);
    ChannelProbe probe(keys::broadcast_channel(42));
    EXPECT_CALL(directory_, user_list(_, _)).Times(0);

    ChatEvent event;
    event.chat_id = 42;
    event.user_id = 7;
    event.type = "message";
    event.text = "hello";
    EXPECT_EQ(publisher.send(event), 1);

    auto payload = probe.NextJson(2s);
    ASSERT_TRUE(payload);
    EXPECT_FALSE(payload->contains("users"));
    ASSERT_EQ((*payload)["messages"].size(), 1u);
    EXPECT_EQ((*payload)["messages"][0]["text"], "hello");
    EXPECT_EQ((*payload)["messages"][0]["user_id"], 7);
}

TEST_F(ChatPublisherTest, UserlistEventCarriesOnlineUsers) {
    UserListStore(redis_, 42).join("h1", "s1", 7);
    UserListStore(redis_, 42).join("h2", "s2", 8);

    auto users = nlohmann::json::array({MakeUser(7, 1, "Ann", "AN").to_json(),
                                        MakeUser(8, 2, "Bob", "BO").to_json()});
    EXPECT_CALL(directory_, user_list(42, std::set<int64_t>{7, 8})).WillOnce(Return(users));

    ChatPublisher publisher(redis_, directory_);
    ChannelProbe probe(keys::broadcast_channel(42));
    publisher.send(make_join_event(42, MakeUser(8, 2, "Bob", "BO")));

    auto payload = probe.NextJson(2s);
    ASSERT_TRUE(payload);
    EXPECT_EQ((*payload)["users"], users);
    EXPECT_EQ((*payload)["messages"][0]["type"], "join");
}

TEST_F(ChatPublisherTest, UserlistEventInEmptyRoomSkipsDirectory) {
    EXPECT_CALL(directory_, user_list(_, _)).Times(0);

    ChatPublisher publisher(redis_, directory_);
    ChannelProbe probe(keys::broadcast_channel(42));
    publisher.send(make_timeout_event(42, MakeUser(7, 1, "Ann", "AN")));

    auto payload = probe.NextJson(2s);
    ASSERT_TRUE(payload);
    EXPECT_EQ((*payload)["users"], nlohmann::json::array());
}

TEST_F(ChatPublisherTest, PrivateEventReachesOnlyThatUser) {
    ChatPublisher publisher(redis_, directory_);
    ChannelProbe mine(keys::private_channel(42, 7));
    ChannelProbe broadcast(keys::broadcast_channel(42));

    ChatEvent event;
    event.chat_id = 42;
    event.type = "kick";
    event.text = "bye";
    EXPECT_EQ(publisher.send_private(event, 7), 1);

    auto payload = mine.NextJson(2s);
    ASSERT_TRUE(payload);
    EXPECT_EQ((*payload)["messages"][0]["type"], "kick");
    EXPECT_FALSE(broadcast.Next(200ms));
}

TEST_F(ChatPublisherTest, TypingPayload) {
    ChatPublisher publisher(redis_, directory_);
    ChannelProbe probe(keys::broadcast_channel(42));
    publisher.send_typing(42, {2, 1});

    auto payload = probe.NextJson(2s);
    ASSERT_TRUE(payload);
    EXPECT_EQ(*payload, nlohmann::json::parse(R"({"typing":[1,2]})"));
}

class MessageListenerTest : public ChatPublisherTest {
protected:
    // Publish until the listener's subscription is in place
    long long PublishUntilReceived(const std::function<long long()>& publish) {
        auto deadline = std::chrono::steady_clock::now() + 3s;
        while (std::chrono::steady_clock::now() < deadline) {
            auto receivers = publish();
            if (receivers > 0) {
                return receivers;
            }
            std::this_thread::sleep_for(20ms);
        }
        return 0;
    }
};

TEST_F(MessageListenerTest, ReceivesBroadcast) {
    ChatPublisher publisher(redis_, directory_);
    MessageListener listener(redis_, 42, 7);
    auto result = std::async(std::launch::async, [&] { return listener.wait(5s); });

    ChatEvent event;
    event.chat_id = 42;
    event.type = "message";
    event.text = "hello";
    ASSERT_GT(PublishUntilReceived([&] { return publisher.send(event); }), 0);

    auto payload = result.get();
    ASSERT_TRUE(payload);
    EXPECT_EQ(nlohmann::json::parse(*payload)["messages"][0]["text"], "hello");
}

TEST_F(MessageListenerTest, ReceivesPrivate) {
    ChatPublisher publisher(redis_, directory_);
    MessageListener listener(redis_, 42, 7);
    auto result = std::async(std::launch::async, [&] { return listener.wait(5s); });

    ChatEvent event;
    event.chat_id = 42;
    event.type = "ban";
    ASSERT_GT(PublishUntilReceived([&] { return publisher.send_private(event, 7); }), 0);

    auto payload = result.get();
    ASSERT_TRUE(payload);
    EXPECT_EQ(nlohmann::json::parse(*payload)["messages"][0]["type"], "ban");
}

TEST_F(MessageListenerTest, TimesOutWithoutMessage) {
    MessageListener listener(redis_, 42, 7);
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(listener.wait(300ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 300ms);
}

TEST_F(MessageListenerTest, OtherUsersPrivateChannelIgnored) {
    ChatPublisher publisher(redis_, directory_);
    MessageListener listener(redis_, 42, 7);
    auto result = std::async(std::launch::async, [&] { return listener.wait(500ms); });

    ChatEvent event;
    event.chat_id = 42;
    event.type = "kick";
    auto deadline = std::chrono::steady_clock::now() + 400ms;
    while (std::chrono::steady_clock::now() < deadline) {
        publisher.send_private(event, 8);
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_FALSE(result.get());
}

TEST_F(MessageListenerTest, CancelEndsWait) {
    MessageListener listener(redis_, 42, 7);
    auto result = std::async(std::launch::async, [&] { return listener.wait(10s); });

    std::this_thread::sleep_for(200ms);
    listener.cancel();
    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(result.get());
    EXPECT_TRUE(listener.is_cancelled());

    EXPECT_FALSE(listener.wait(1s));
}

TEST_F(MessageListenerTest, HoldsNoPooledConnection) {
    MessageListener listener(redis_, 42, 7);
    auto before = redis_.get_pool_stats().active_connections;
    auto result = std::async(std::launch::async, [&] { return listener.wait(500ms); });

    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(redis_.get_pool_stats().active_connections, before);
    result.get();
}

}  // namespace chatlive::live::test
