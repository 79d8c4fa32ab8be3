#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

#include <sw/redis++/redis++.h>

#include <memory>
#include <mutex>
#include <string>

namespace collab {
namespace realtime {

// Redis 连接, 只用于发布变更事件
class RedisClient {
public:
    explicit RedisClient(const common::RedisConfig& config);
    ~RedisClient();

    // 建立连接池, 重复调用直接返回
    common::Status Connect();

    // 发布消息, 返回收到消息的订阅者数量
    common::StatusOr<long long> Publish(const std::string& channel, const std::string& message);

    common::Status Ping();

private:
    common::RedisConfig config_;
    std::mutex mutex_; // 保护 redis_ 的初始化
    std::shared_ptr<sw::redis::Redis> redis_;
};

} // namespace realtime
} // namespace collab
