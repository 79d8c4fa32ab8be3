#include <gtest/gtest.h>

#include "common/config.hpp"
#include "realtime/redis_client.hpp"
#include "realtime/redis_notifier.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <memory>
#include <string>

using collab::core::ChangeEvent;
using collab::core::ChangeType;

TEST(RedisNotifierTest, ChannelPerChat) {
    collab::realtime::RedisNotifier notifier(nullptr, "collab:chat");
    EXPECT_EQ(notifier.ChannelFor("chat_abc"), "collab:chat:chat_abc");
}

TEST(RedisNotifierTest, EncodesEvent) {
    ChangeEvent event{ChangeType::kParticipantRemoved, "chat_1", "owner", "alice", 1234};
    auto payload = nlohmann::json::parse(collab::realtime::RedisNotifier::Encode(event));
    EXPECT_EQ(payload["type"].get<std::string>(), "participant_removed");
    EXPECT_EQ(payload["chat_id"].get<std::string>(), "chat_1");
    EXPECT_EQ(payload["user_id"].get<std::string>(), "owner");
    EXPECT_EQ(payload["target_user_id"].get<std::string>(), "alice");
    EXPECT_EQ(payload["at"].get<long long>(), 1234);
}

TEST(RedisNotifierTest, OmitsEmptyTarget) {
    ChangeEvent event{ChangeType::kLockAcquired, "chat_1", "alice", "", 1};
    auto payload = nlohmann::json::parse(collab::realtime::RedisNotifier::Encode(event));
    EXPECT_EQ(payload["type"].get<std::string>(), "lock_acquired");
    EXPECT_FALSE(payload.contains("target_user_id"));
}

TEST(RedisNotifierTest, DisabledClientDoesNotThrow) {
    collab::common::RedisConfig cfg;
    cfg.enabled = false;
    auto client = std::make_shared<collab::realtime::RedisClient>(cfg);
    EXPECT_EQ(client->Publish("collab:chat:x", "{}").GetStatus().Code(), collab::common::StatusCode::kUnavailable);

    collab::realtime::RedisNotifier notifier(client, "collab:chat");
    EXPECT_NO_THROW(notifier.Publish(ChangeEvent{ChangeType::kInviteCreated, "chat_1", "owner", "", 1}));
}

TEST(RedisNotifierTest, PublishToLiveRedis) {
    const char* host = std::getenv("REDIS_HOST");
    if (host == nullptr) {
        GTEST_SKIP() << "REDIS_HOST not set";
    }
    collab::common::RedisConfig cfg;
    cfg.enabled = true;
    cfg.host = host;
    if (const char* port = std::getenv("REDIS_PORT")) cfg.port = std::atoi(port);
    if (const char* pass = std::getenv("REDIS_PASSWORD")) cfg.password = pass;
    collab::realtime::RedisClient client(cfg);

    auto ping = client.Ping();
    ASSERT_TRUE(ping.IsOk()) << ping.Message();

    auto published = client.Publish("collab:chat:test", "{}");
    ASSERT_TRUE(published.IsOk()) << published.GetStatus().Message();
    EXPECT_GE(published.Value(), 0);
}
