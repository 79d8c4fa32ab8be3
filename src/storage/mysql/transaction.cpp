#include "storage/mysql/transaction.hpp"

#include "common/logger.hpp"

#include <utility>

namespace collab {
namespace storage {

Transaction::Transaction(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

Transaction::~Transaction() {
    if (active_) {
        auto status = Rollback();
        if (!status.IsOk()) {
            COLLAB_LOG_WARN("[MySqlTxn] rollback on destruction failed: {}", status.Message());
        }
    }
}

common::Status Transaction::Begin() {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    lease_ = std::move(lease_or).Value();
    conn_ = lease_.Raw();
    // READ COMMITTED 下不加间隙锁, 并发创建会话不会互相死锁
    static constexpr const char* kStatements[] = {
        "SET TRANSACTION ISOLATION LEVEL READ COMMITTED",
        "START TRANSACTION",
    };
    for (const char* sql : kStatements) {
        if (mysql_query(conn_, sql) != 0) {
            auto status = MapMySqlError(conn_);
            lease_.Discard();
            return status;
        }
    }
    active_ = true;
    return common::Status::OK();
}

common::Status Transaction::Commit() {
    if (!active_) {
        return common::Status::OK();
    }
    active_ = false;
    if (mysql_commit(conn_) != 0) {
        auto status = MapMySqlError(conn_);
        // 提交失败后连接状态不确定
        lease_.Discard();
        return status;
    }
    return common::Status::OK();
}

common::Status Transaction::Rollback() {
    if (!active_) {
        return common::Status::OK();
    }
    active_ = false;
    if (mysql_rollback(conn_) != 0) {
        auto status = MapMySqlError(conn_);
        lease_.Discard();
        return status;
    }
    return common::Status::OK();
}

}
}
