#pragma once

#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/notifier.hpp"
#include "core/session/session_types.hpp"
#include "core/session/transactional_store.hpp"

#include <memory>
#include <optional>
#include <string>

namespace collab {
namespace core {

struct AcquireLockCommand {
    Caller      caller;   // 调用方
    std::string chat_id;  // 会话ID
};

struct ReleaseLockCommand {
    Caller      caller;
    std::string chat_id;
};

struct AcquireResult {
    bool                    acquired = false;
    std::optional<ChatLock> holder;  // 未拿到锁时的当前持有者
    ChatLock                lock;    // 拿到锁时的新锁行
};

enum class PromptAvailability {
    kOk = 0,
    kLocked,      // 他人持有未过期的锁
    kNotMember,   // 非 owner 也非 accepted 参与者
};

struct PromptCheck {
    PromptAvailability      availability = PromptAvailability::kOk;
    std::optional<ChatLock> holder;
};

struct LockStatus {
    std::optional<ChatLock> lock;  // 未过期的锁, 为空表示空闲
    bool held_by_caller = false;
};

// 每个会话一把带租约的发言锁
// 锁行过期后视为不存在; 获取在无锁, 已过期或调用方本就持有时成功, 持有者重复获取会续期
class LockManager {
public:
    using Status = common::Status;

    LockManager(std::shared_ptr<TransactionalStore> store,
                common::CollabConfig config = common::CollabConfig{},
                std::shared_ptr<Notifier> notifier = nullptr,
                std::shared_ptr<common::Clock> clock = nullptr);

    common::StatusOr<AcquireResult> Acquire(const AcquireLockCommand& command);
    // 返回是否真的删除了锁; 非持有者释放不报错
    common::StatusOr<bool> Release(const ReleaseLockCommand& command);
    common::StatusOr<PromptCheck> CanPrompt(const Caller& caller, const std::string& chat_id);
    common::StatusOr<LockStatus> GetLockStatus(const Caller& caller, const std::string& chat_id);

    std::int64_t LeaseMillis() const;
    int LeaseSeconds() const { return config_.lock_lease_seconds; }

private:
    // 读取仍有效的锁, 无锁或已过期返回空
    static common::StatusOr<std::optional<ChatLock>> LiveLock(StoreTxn& txn, const std::string& chat_id, std::int64_t now);

private:
    std::shared_ptr<TransactionalStore> store_;
    common::CollabConfig config_;
    std::shared_ptr<Notifier> notifier_;
    std::shared_ptr<common::Clock> clock_;
};

} // namespace core
} // namespace collab
