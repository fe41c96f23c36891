#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <future>
#include <thread>
#include <unordered_map>
#include <vector>
#include "common/database/redis_mgr.hpp"
#include "test/redis_test_support.hpp"

namespace chatlive::db::test {

using chatlive::test::IsRedisAvailable;
using chatlive::test::RedisFixture;
using chatlive::test::TestRedisConfig;

class RedisManagerTest : public RedisFixture {};

// Config-only tests, no server needed
class RedisConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::ofstream config_file("test_redis_config.json");
        config_file << R"({
            "redis": {
                "host": "10.1.2.3",
                "port": 6390,
                "password": "",
                "db": 3,
                "pool_size": 5,
                "connect_timeout": 2000,
                "socket_timeout": 2500,
                "acquire_timeout": 400
            }
        })";
    }

    void TearDown() override {
        std::remove("test_redis_config.json");
        unsetenv("REDIS_HOST");
    }
};

// =========================== RedisConfig ===========================

TEST_F(RedisConfigTest, DefaultValues) {
    RedisConfig config;

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 6379);
    EXPECT_EQ(config.password, "");
    EXPECT_EQ(config.db, 0);
    EXPECT_EQ(config.pool_size, 10);
    EXPECT_EQ(config.connect_timeout, 1000);
    EXPECT_EQ(config.socket_timeout, 1000);
    EXPECT_EQ(config.acquire_timeout, 3000);
}

TEST_F(RedisConfigTest, FromFile) {
    unsetenv("REDIS_HOST");
    unsetenv("REDIS_PORT");
    auto config = RedisConfig::from_file("test_redis_config.json");

    EXPECT_EQ(config.host, "10.1.2.3");
    EXPECT_EQ(config.port, 6390);
    EXPECT_EQ(config.db, 3);
    EXPECT_EQ(config.pool_size, 5);
    EXPECT_EQ(config.connect_timeout, 2000);
    EXPECT_EQ(config.socket_timeout, 2500);
    EXPECT_EQ(config.acquire_timeout, 400);
}

TEST_F(RedisConfigTest, EnvironmentOverridesHost) {
    setenv("REDIS_HOST", "redis.example", 1);
    auto config = RedisConfig::from_file("test_redis_config.json");
    EXPECT_EQ(config.host, "redis.example");
}

TEST_F(RedisConfigTest, FromMissingFileUsesDefaults) {
    unsetenv("REDIS_HOST");
    auto config = RedisConfig::from_file("nonexistent_config.json");

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.db, 0);
    EXPECT_EQ(config.pool_size, 10);
}

TEST_F(RedisConfigTest, ToConnectionOptions) {
    RedisConfig config;
    config.host = "localhost";
    config.port = 6380;
    config.password = "secret";
    config.db = 2;
    config.connect_timeout = 5000;
    config.socket_timeout = 3000;

    auto opts = config.to_connection_options();

    EXPECT_EQ(opts.host, "localhost");
    EXPECT_EQ(opts.port, 6380);
    EXPECT_EQ(opts.password, "secret");
    EXPECT_EQ(opts.db, 2);
    EXPECT_EQ(opts.connect_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(opts.socket_timeout, std::chrono::milliseconds(3000));
}

TEST_F(RedisConfigTest, InitializeUnreachableServer) {
    RedisConfig config;
    config.host = "127.0.0.1";
    config.port = 1;  // nothing listens here
    config.pool_size = 2;
    config.connect_timeout = 100;
    config.socket_timeout = 100;

    RedisManager mgr;
    EXPECT_FALSE(mgr.initialize(config));
    EXPECT_THROW(mgr.get_connection(), std::runtime_error);
    EXPECT_FALSE(mgr.is_healthy());
}

TEST_F(RedisConfigTest, GetConnectionNotInitialized) {
    RedisManager mgr;
    EXPECT_THROW(mgr.get_connection(), std::runtime_error);
    auto stats = mgr.get_pool_stats();
    EXPECT_EQ(stats.total_connections, 0u);
}

TEST_F(RedisConfigTest, SafeExecuteReturnsDefaultOnFailure) {
    RedisManager mgr;
    auto value = mgr.safe_execute([](sw::redis::Redis& redis) { return redis.exists("k"); }, -1LL);
    EXPECT_EQ(value, -1);
}

// =========================== RedisManager ===========================

TEST_F(RedisManagerTest, AlreadyInitialized) {
    EXPECT_TRUE(redis_.is_healthy());
    EXPECT_TRUE(redis_.initialize(TestRedisConfig()));
}

TEST_F(RedisManagerTest, ConnectionReturnedOnScopeExit) {
    auto initial = redis_.get_pool_stats();
    EXPECT_EQ(initial.total_connections, 8u);

    {
        auto conn = redis_.get_connection();
        ASSERT_TRUE(conn.is_valid());
        EXPECT_NO_THROW(conn->ping());

        auto current = redis_.get_pool_stats();
        EXPECT_EQ(current.active_connections, initial.active_connections + 1);
        EXPECT_EQ(current.available_connections, initial.available_connections - 1);
    }

    auto final_stats = redis_.get_pool_stats();
    EXPECT_EQ(final_stats.active_connections, initial.active_connections);
    EXPECT_EQ(final_stats.available_connections, initial.available_connections);
}

TEST_F(RedisManagerTest, MovedConnectionReleasedOnce) {
    {
        auto conn = redis_.get_connection();
        auto moved = std::move(conn);
        EXPECT_FALSE(conn.is_valid());
        EXPECT_TRUE(moved.is_valid());
    }
    EXPECT_EQ(redis_.get_pool_stats().available_connections, 8u);
}

TEST_F(RedisManagerTest, ExecuteStringAndHashOperations) {
    redis_.execute([](sw::redis::Redis& redis) {
        redis.set("test:string:key1", "value1");
        redis.hset("test:hash:user1", "name", "John");
    });

    auto value = redis_.execute([](sw::redis::Redis& redis) { return redis.get("test:string:key1"); });
    ASSERT_TRUE(bool(value));
    EXPECT_EQ(*value, "value1");

    auto profile = redis_.execute([](sw::redis::Redis& redis) {
        std::unordered_map<std::string, std::string> result;
        redis.hgetall("test:hash:user1", std::inserter(result, result.begin()));
        return result;
    });
    EXPECT_EQ(profile.size(), 1u);
    EXPECT_EQ(profile["name"], "John");
}

TEST_F(RedisManagerTest, ExecutePropagatesReplyError) {
    redis_.execute([](sw::redis::Redis& redis) { redis.set("test:string:plain", "x"); });
    EXPECT_THROW(redis_.execute([](sw::redis::Redis& redis) {
        return redis.hget("test:string:plain", "field");
    }),
                 sw::redis::ReplyError);
}

TEST_F(RedisManagerTest, ExecuteWithRetrySucceedsAfterTransientFailure) {
    int calls = 0;
    auto value = redis_.execute_with_retry(
            [&calls](sw::redis::Redis& redis) {
                if (++calls < 3) {
                    throw sw::redis::IoError("simulated disconnect");
                }
                return redis.exists("test:missing");
            },
            3, std::chrono::milliseconds(1));
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(value, 0);
}

TEST_F(RedisManagerTest, ExecuteWithRetryGivesUp) {
    int calls = 0;
    EXPECT_THROW(redis_.execute_with_retry(
                         [&calls](sw::redis::Redis&) -> long long {
                             ++calls;
                             throw sw::redis::TimeoutError("simulated timeout");
                         },
                         2, std::chrono::milliseconds(1)),
                 sw::redis::TimeoutError);
    EXPECT_EQ(calls, 2);
}

TEST_F(RedisManagerTest, ExecuteWithRetryDoesNotRetryReplyErrors) {
    int calls = 0;
    EXPECT_THROW(redis_.execute_with_retry(
                         [&calls](sw::redis::Redis&) -> long long {
                             ++calls;
                             throw sw::redis::ReplyError("WRONGTYPE");
                         },
                         3, std::chrono::milliseconds(1)),
                 sw::redis::ReplyError);
    EXPECT_EQ(calls, 1);
}

TEST_F(RedisManagerTest, ConcurrentExecute) {
    std::vector<std::future<long long>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(std::async(std::launch::async, [this]() {
            return redis_.execute(
                    [](sw::redis::Redis& redis) { return redis.incr("test:counter:concurrent"); });
        }));
    }
    for (auto& f : futures) {
        f.get();
    }

    auto value = redis_.execute(
            [](sw::redis::Redis& redis) { return redis.get("test:counter:concurrent"); });
    ASSERT_TRUE(bool(value));
    EXPECT_EQ(*value, "20");
    EXPECT_EQ(redis_.get_pool_stats().available_connections, 8u);
}

TEST_F(RedisManagerTest, ShutdownRejectsNewConnections) {
    redis_.shutdown();
    EXPECT_THROW(redis_.get_connection(), std::runtime_error);
    EXPECT_FALSE(redis_.is_healthy());
}

}  // namespace chatlive::db::test
