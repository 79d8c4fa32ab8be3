#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/store.hpp"

#include <functional>
#include <memory>
#include <string>

namespace collab {
namespace core {

enum class StoreMode {
    kAtomic = 0,   // 真实事务, 锁定会话行
    kOptimistic,   // 自动提交 + 条件写, 冲突时重试一次
};

const char* StoreModeToString(StoreMode mode);

// 多步变更的执行策略
// work 内部的读写都经过传入的 StoreTxn; work 返回非 OK 时本次变更整体放弃
class TransactionalStore {
public:
    using Work = std::function<common::Status(StoreTxn&)>;

    virtual ~TransactionalStore() = default;

    // 在 chat_id 范围内执行一次多步变更, op 仅用于日志
    virtual common::Status Execute(const std::string& chat_id, const char* op, const Work& work) = 0;
    // 只读查询或单条原子写, 不加锁不重试
    virtual common::Status Direct(const Work& work) = 0;

    virtual StoreMode Mode() const = 0;
};

// 后端支持事务: 开启事务并锁住会话行, work 出错即回滚
class AtomicTransaction final : public TransactionalStore {
public:
    explicit AtomicTransaction(std::shared_ptr<RecordStore> backend);

    common::Status Execute(const std::string& chat_id, const char* op, const Work& work) override;
    common::Status Direct(const Work& work) override;
    StoreMode Mode() const override { return StoreMode::kAtomic; }

private:
    std::shared_ptr<RecordStore> backend_;
};

// 后端不支持事务: 每步独立提交, 依靠条件写发现并发修改
// 首次 kAborted 时整体重读重试一次, 再次冲突返回 kAborted
// 每一步都可以单独生效, 中途失败时前面已生效的步骤不会撤销
class OptimisticRetry final : public TransactionalStore {
public:
    explicit OptimisticRetry(std::shared_ptr<RecordStore> backend);

    common::Status Execute(const std::string& chat_id, const char* op, const Work& work) override;
    common::Status Direct(const Work& work) override;
    StoreMode Mode() const override { return StoreMode::kOptimistic; }

private:
    std::shared_ptr<RecordStore> backend_;
};

// 启动时选择策略, mode 为 "auto" / "atomic" / "optimistic"
// auto 根据后端探测结果选择; 强制 atomic 而后端不支持事务时返回 kFailedPrecondition
common::StatusOr<std::shared_ptr<TransactionalStore>> SelectTransactionalStore(
    std::shared_ptr<RecordStore> backend, const std::string& mode);

} // namespace core
} // namespace collab
