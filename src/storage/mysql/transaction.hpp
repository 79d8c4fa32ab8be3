#pragma once

#include "common/status.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace collab {
namespace storage {

// MySQL 事务, 析构时未提交则回滚
class Transaction {
public:
    explicit Transaction(std::shared_ptr<ConnectionPool> pool);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    common::Status Begin();
    common::Status Commit();
    common::Status Rollback();

    bool Active() const noexcept { return active_; }
    MYSQL* Raw() const noexcept { return conn_; }

private:
    std::shared_ptr<ConnectionPool> pool_;
    ConnectionPool::Lease lease_;
    MYSQL* conn_ = nullptr;
    bool active_ = false;
};

}
}
