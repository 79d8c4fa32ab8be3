#include "storage/mysql/connection_pool.hpp"

#include "common/logger.hpp"

#include <chrono>
#include <utility>

namespace collab {
namespace storage {

ConnectionPool::ConnectionPool(Options options): options_(std::move(options)) {
    if (options_.pool_size == 0) {
        options_.pool_size = 1;
    }
}

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection)
    : pool_(pool), connection_(std::move(connection)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)), discard_(other.discard_) {
    other.pool_ = nullptr;
    other.discard_ = false;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        pool_ = other.pool_;
        connection_ = std::move(other.connection_);
        discard_ = other.discard_;
        other.pool_ = nullptr;
        other.discard_ = false;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    Release();
}

void ConnectionPool::Lease::Release() noexcept {
    if (pool_ && connection_) {
        pool_->Return(std::move(connection_), discard_);
    }
    pool_ = nullptr;
    discard_ = false;
}

common::StatusOr<ConnectionPool::Lease> ConnectionPool::Acquire() {
    const auto deadline = std::chrono::steady_clock::now() + options_.acquire_timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        // 空闲连接: 取出后校验, 已断开则丢弃重试
        if (!idle_.empty()) {
            auto connection = std::move(idle_.front());
            idle_.pop_front();
            lock.unlock();
            if (mysql_ping(connection->Raw()) == 0) {
                return common::StatusOr<Lease>(Lease(this, std::move(connection)));
            }
            COLLAB_LOG_WARN("[MySqlPool] dropping stale connection: {}", mysql_error(connection->Raw()));
            connection.reset();
            lock.lock();
            --total_connections_;
            continue;
        }

        // 未达上限: 在锁外建立新连接
        if (total_connections_ < options_.pool_size) {
            ++total_connections_;
            lock.unlock();
            auto created = Connection::Create(options_);
            if (!created.IsOk()) {
                std::lock_guard<std::mutex> guard(mutex_);
                --total_connections_;
                cv_.notify_one();
                return created.GetStatus();
            }
            return common::StatusOr<Lease>(Lease(this, std::move(created).Value()));
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout && idle_.empty() &&
            total_connections_ >= options_.pool_size) {
            return common::Status::Unavailable("Acquire MySQL connection timeout.");
        }
    }
}

void ConnectionPool::Return(std::unique_ptr<Connection> connection, bool discard) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (discard) {
            --total_connections_;
        } else {
            idle_.push_back(std::move(connection));
        }
    }
    cv_.notify_one();
}

} // namespace storage
} // namespace collab
