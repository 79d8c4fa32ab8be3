#pragma once

#include "core/session/store.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/transaction.hpp"

#include <memory>
#include <string>

namespace collab {
namespace storage {

// MySQL 后端, 表结构见 sql/schema.sql
// 时间戳均为毫秒 BIGINT, 由应用时钟写入
class MySqlRecordStore : public core::RecordStore {
public:
    explicit MySqlRecordStore(std::shared_ptr<ConnectionPool> pool);

    // 开启事务并 SELECT ... FOR UPDATE 锁住会话行
    common::StatusOr<std::unique_ptr<core::StoreTxn>> BeginTransaction(const std::string& chat_id) override;
    // 借出一个连接, 每条语句自动提交
    common::StatusOr<std::unique_ptr<core::StoreTxn>> OpenAutoCommit() override;
    // 四张表都是 InnoDB 时支持事务
    common::StatusOr<bool> DetectTransactionSupport() override;

private:
    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace storage
} // namespace collab
