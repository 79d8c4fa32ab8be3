#pragma once

#include "core/session/notifier.hpp"
#include "realtime/redis_client.hpp"

#include <memory>
#include <string>

namespace collab {
namespace realtime {

// 通过 Redis PUBLISH 把变更事件推给订阅了会话频道的客户端
// 频道名: {channel_prefix}:{chat_id}
class RedisNotifier : public core::Notifier {
public:
    RedisNotifier(std::shared_ptr<RedisClient> client, std::string channel_prefix);

    void Publish(const core::ChangeEvent& event) override;

    std::string ChannelFor(const std::string& chat_id) const;
    // {"type", "chat_id", "user_id", "target_user_id"?, "at"}
    static std::string Encode(const core::ChangeEvent& event);

private:
    std::shared_ptr<RedisClient> client_;
    std::string channel_prefix_;
};

} // namespace realtime
} // namespace collab
