#include "realtime/redis_notifier.hpp"

#include "common/logger.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace collab {
namespace realtime {

RedisNotifier::RedisNotifier(std::shared_ptr<RedisClient> client, std::string channel_prefix)
    : client_(std::move(client)), channel_prefix_(std::move(channel_prefix)) {}

std::string RedisNotifier::ChannelFor(const std::string& chat_id) const {
    return channel_prefix_ + ":" + chat_id;
}

std::string RedisNotifier::Encode(const core::ChangeEvent& event) {
    nlohmann::json payload{
        {"type", core::ChangeTypeToString(event.type)},
        {"chat_id", event.chat_id},
        {"user_id", event.user_id},
        {"at", event.at},
    };
    if (!event.target_user_id.empty()) {
        payload["target_user_id"] = event.target_user_id;
    }
    return payload.dump();
}

void RedisNotifier::Publish(const core::ChangeEvent& event) {
    if (!client_) {
        return;
    }
    auto published = client_->Publish(ChannelFor(event.chat_id), Encode(event));
    if (!published.IsOk()) {
        // 通知是尽力而为, 客户端会在下次拉取时看到最新状态
        COLLAB_LOG_WARN("[Realtime] publish {} for chat {} failed: {}",
                        core::ChangeTypeToString(event.type), event.chat_id, published.GetStatus().Message());
        return;
    }
    COLLAB_LOG_DEBUG("[Realtime] {} on chat {} delivered to {} subscriber(s)",
                     core::ChangeTypeToString(event.type), event.chat_id, published.Value());
}

} // namespace realtime
} // namespace collab
