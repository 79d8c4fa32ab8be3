#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/connection.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

namespace collab {
namespace storage {

// 固定上限的 MySQL 连接池, 连接按需创建
class ConnectionPool {
public:
    explicit ConnectionPool(Options options);

    // 连接租约, 析构时归还
    class Lease {
    public:
        Lease() = default;
        Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection);
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Connection* operator->() noexcept { return connection_.get(); }
        MYSQL* Raw() const noexcept { return connection_ ? connection_->Raw() : nullptr; }
        explicit operator bool() const noexcept { return connection_ != nullptr; }

        // 连接状态不可信时丢弃而不是归还
        void Discard() noexcept { discard_ = true; }

    private:
        void Release() noexcept;

        ConnectionPool* pool_ = nullptr;
        std::unique_ptr<Connection> connection_;
        bool discard_ = false;
    };

    // 空闲连接优先; 未达上限时新建; 否则等待 acquire_timeout
    common::StatusOr<Lease> Acquire();

    const Options& GetOptions() const noexcept { return options_; }

private:
    void Return(std::unique_ptr<Connection> connection, bool discard);

    Options options_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<Connection>> idle_;
    std::size_t total_connections_ = 0; // 已创建且未丢弃的连接数
};

} // namespace storage
} // namespace collab
