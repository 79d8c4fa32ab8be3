#include "core/session/lock_manager.hpp"
#include "core/session/participant_registry.hpp"

#include "common/logger.hpp"

#include <utility>

namespace collab {
namespace core {

using common::StatusCode;
using common::StatusOr;

LockManager::LockManager(std::shared_ptr<TransactionalStore> store,
                         common::CollabConfig config,
                         std::shared_ptr<Notifier> notifier,
                         std::shared_ptr<common::Clock> clock)
    : store_(std::move(store))
    , config_(std::move(config))
    , notifier_(std::move(notifier))
    , clock_(std::move(clock)) {
    if (!notifier_) {
        notifier_ = std::make_shared<NullNotifier>();
    }
    if (!clock_) {
        clock_ = common::DefaultClock();
    }
}

std::int64_t LockManager::LeaseMillis() const {
    return static_cast<std::int64_t>(config_.lock_lease_seconds) * 1000;
}

StatusOr<std::optional<ChatLock>> LockManager::LiveLock(StoreTxn& txn, const std::string& chat_id, std::int64_t now) {
    auto lock = txn.GetLock(chat_id);
    if (!lock.IsOk()) {
        if (lock.GetStatus().Code() == StatusCode::kNotFound) {
            return StatusOr<std::optional<ChatLock>>(std::optional<ChatLock>());
        }
        return lock.GetStatus();
    }
    if (!lock.Value().IsLiveAt(now)) {
        return StatusOr<std::optional<ChatLock>>(std::optional<ChatLock>());
    }
    return StatusOr<std::optional<ChatLock>>(std::optional<ChatLock>(lock.Value()));
}

StatusOr<AcquireResult> LockManager::Acquire(const AcquireLockCommand& command) {
    auto auth = RequireAuthenticated(command.caller);
    if (!auth.IsOk()) {
        return auth;
    }
    if (command.chat_id.empty()) {
        return Status::InvalidArgument("Chat ID cannot be empty.");
    }

    const auto now = clock_->NowMillis();
    AcquireResult result;
    auto status = store_->Direct([&](StoreTxn& txn) {
        auto session = txn.GetSession(command.chat_id);
        if (!session.IsOk()) {
            return session.GetStatus();
        }
        // 非协作会话的 owner 也可以取锁
        if (session.Value().owner_id != command.caller.user_id) {
            auto participant = txn.FindParticipant(command.chat_id, command.caller.user_id);
            if (!participant.IsOk() && participant.GetStatus().Code() != StatusCode::kNotFound) {
                return participant.GetStatus();
            }
            if (!participant.IsOk() || !participant.Value().IsAccepted()) {
                return Status::PermissionDenied("Not a participant of this chat.");
            }
        }

        ChatLock lock;
        lock.chat_id = command.chat_id;
        lock.locked_by = command.caller.user_id;
        lock.locked_at = now;
        lock.expires_at = now + LeaseMillis();
        // 成员资格在写入语句内再次校验
        auto acquired = txn.TryAcquireLock(lock, now);
        if (!acquired.IsOk()) {
            return acquired.GetStatus();
        }
        result.acquired = acquired.Value();
        if (result.acquired) {
            result.lock = lock;
            return Status::OK();
        }
        auto holder = LiveLock(txn, command.chat_id, now);
        if (!holder.IsOk()) {
            return holder.GetStatus();
        }
        // 同一毫秒内重复取锁时行内容不变, 写入计数为 0, 但锁仍属于调用方
        if (holder.Value() && holder.Value()->locked_by == command.caller.user_id) {
            result.acquired = true;
            result.lock = *holder.Value();
            return Status::OK();
        }
        result.holder = holder.Value();
        return Status::OK();
    });
    if (!status.IsOk()) {
        return status;
    }

    if (result.acquired) {
        COLLAB_LOG_DEBUG("[LockManager] {} acquired lock on chat {} until {}",
                         command.caller.user_id, command.chat_id, result.lock.expires_at);
        notifier_->Publish(ChangeEvent{ChangeType::kLockAcquired, command.chat_id, command.caller.user_id, "", now});
    }
    return StatusOr<AcquireResult>(std::move(result));
}

StatusOr<bool> LockManager::Release(const ReleaseLockCommand& command) {
    auto auth = RequireAuthenticated(command.caller);
    if (!auth.IsOk()) {
        return auth;
    }
    if (command.chat_id.empty()) {
        return Status::InvalidArgument("Chat ID cannot be empty.");
    }

    bool released = false;
    auto status = store_->Direct([&](StoreTxn& txn) {
        auto deleted = txn.ReleaseLock(command.chat_id, command.caller.user_id);
        if (!deleted.IsOk()) {
            return deleted.GetStatus();
        }
        released = deleted.Value();
        return Status::OK();
    });
    if (!status.IsOk()) {
        return status;
    }
    if (released) {
        COLLAB_LOG_DEBUG("[LockManager] {} released lock on chat {}", command.caller.user_id, command.chat_id);
        notifier_->Publish(ChangeEvent{ChangeType::kLockReleased, command.chat_id, command.caller.user_id, "",
                                       clock_->NowMillis()});
    }
    return StatusOr<bool>(released);
}

StatusOr<PromptCheck> LockManager::CanPrompt(const Caller& caller, const std::string& chat_id) {
    auto auth = RequireAuthenticated(caller);
    if (!auth.IsOk()) {
        return auth;
    }
    if (chat_id.empty()) {
        return Status::InvalidArgument("Chat ID cannot be empty.");
    }

    const auto now = clock_->NowMillis();
    PromptCheck check;
    auto status = store_->Direct([&](StoreTxn& txn) {
        auto roster = ParticipantRegistry::LoadRoster(txn, chat_id);
        if (!roster.IsOk()) {
            return roster.GetStatus();
        }
        if (!roster.Value().IsMember(caller.user_id)) {
            check.availability = PromptAvailability::kNotMember;
            return Status::OK();
        }
        auto live = LiveLock(txn, chat_id, now);
        if (!live.IsOk()) {
            return live.GetStatus();
        }
        if (live.Value() && live.Value()->locked_by != caller.user_id) {
            check.availability = PromptAvailability::kLocked;
            check.holder = live.Value();
        }
        return Status::OK();
    });
    if (!status.IsOk()) {
        return status;
    }
    return StatusOr<PromptCheck>(std::move(check));
}

StatusOr<LockStatus> LockManager::GetLockStatus(const Caller& caller, const std::string& chat_id) {
    auto auth = RequireAuthenticated(caller);
    if (!auth.IsOk()) {
        return auth;
    }
    if (chat_id.empty()) {
        return Status::InvalidArgument("Chat ID cannot be empty.");
    }

    const auto now = clock_->NowMillis();
    LockStatus lock_status;
    auto status = store_->Direct([&](StoreTxn& txn) {
        auto roster = ParticipantRegistry::LoadRoster(txn, chat_id);
        if (!roster.IsOk()) {
            return roster.GetStatus();
        }
        if (!roster.Value().IsMember(caller.user_id)) {
            return Status::PermissionDenied("Not a participant of this chat.");
        }
        auto live = LiveLock(txn, chat_id, now);
        if (!live.IsOk()) {
            return live.GetStatus();
        }
        lock_status.lock = live.Value();
        lock_status.held_by_caller = live.Value() && live.Value()->locked_by == caller.user_id;
        return Status::OK();
    });
    if (!status.IsOk()) {
        return status;
    }
    return StatusOr<LockStatus>(std::move(lock_status));
}

} // namespace core
} // namespace collab
