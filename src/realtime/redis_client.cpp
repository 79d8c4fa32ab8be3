#include "realtime/redis_client.hpp"

#include <chrono>

namespace collab {
namespace realtime {

RedisClient::RedisClient(const common::RedisConfig& config)
    : config_(config) {}

RedisClient::~RedisClient() = default;

common::Status RedisClient::Connect() {
    if (!config_.enabled) {
        return common::Status::Unavailable("Redis is disabled in the configuration.");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (redis_) {
        return common::Status::OK();
    }

    try {
        sw::redis::ConnectionOptions opts;
        opts.host = config_.host;
        opts.port = config_.port;
        if (!config_.password.empty()) {
            opts.password = config_.password;
        }
        opts.db = config_.db;
        opts.connect_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);
        opts.socket_timeout = std::chrono::milliseconds(config_.socket_timeout_ms);

        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = static_cast<std::size_t>(config_.pool_size);
        pool_opts.wait_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);

        redis_ = std::make_shared<sw::redis::Redis>(opts, pool_opts);
        return common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return common::Status::Unavailable("Failed to connect to Redis: " + std::string(err.what()));
    }
}

common::StatusOr<long long> RedisClient::Publish(const std::string& channel, const std::string& message) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        auto receivers = redis_->publish(channel, message);
        return common::StatusOr<long long>(receivers);
    } catch (const sw::redis::Error& err) {
        return common::Status::Unavailable("Failed to publish to Redis channel " + channel + ": " + err.what());
    }
}

common::Status RedisClient::Ping() {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        redis_->ping();
        return common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return common::Status::Unavailable("Redis ping failed: " + std::string(err.what()));
    }
}

} // namespace realtime
} // namespace collab
