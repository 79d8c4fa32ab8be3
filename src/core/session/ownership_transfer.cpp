#include "core/session/ownership_transfer.hpp"
#include "core/session/participant_registry.hpp"

#include "common/logger.hpp"

#include <cstdint>
#include <optional>
#include <utility>

namespace collab {
namespace core {

OwnershipTransfer::OwnershipTransfer(std::shared_ptr<TransactionalStore> store,
                                     std::shared_ptr<Notifier> notifier,
                                     std::shared_ptr<common::Clock> clock)
    : store_(std::move(store))
    , notifier_(std::move(notifier))
    , clock_(std::move(clock)) {
    if (!notifier_) {
        notifier_ = std::make_shared<NullNotifier>();
    }
    if (!clock_) {
        clock_ = common::DefaultClock();
    }
}

// 自动提交模式下撤回已生效的一步; 行已被他人改动时放弃并留下告警
void OwnershipTransfer::Revert(StoreTxn& txn, const Participant& original, const Participant& written) {
    auto undo = txn.CompareAndSetParticipant(original, written);
    if (!undo.IsOk()) {
        COLLAB_LOG_WARN("[Ownership] chat {} could not restore row of {}: {}",
                        original.chat_id, original.user_id, undo.Message());
    }
}

OwnershipTransfer::Status OwnershipTransfer::Transfer(const TransferOwnershipCommand& command) {
    auto auth = RequireAuthenticated(command.caller);
    if (!auth.IsOk()) {
        return auth;
    }
    if (command.chat_id.empty()) {
        return Status::InvalidArgument("Chat ID cannot be empty.");
    }
    if (command.new_owner_id.empty()) {
        return Status::InvalidArgument("New owner ID cannot be empty.");
    }
    if (command.new_owner_id == command.caller.user_id) {
        return Status::InvalidArgument("Already the owner of this chat.");
    }

    auto status = store_->Execute(command.chat_id, "transfer_ownership", [&](StoreTxn& txn) {
        auto roster_or = ParticipantRegistry::LoadRoster(txn, command.chat_id);
        if (!roster_or.IsOk()) {
            return roster_or.GetStatus();
        }
        const auto& roster = roster_or.Value();
        if (!roster.session.is_collaborative) {
            return Status::FailedPrecondition("Chat is not collaborative.");
        }
        if (!roster.IsOwner(command.caller.user_id)) {
            return Status::PermissionDenied("Only the owner can transfer ownership.");
        }
        const auto* next = roster.Find(command.new_owner_id);
        if (next == nullptr || !next->IsAccepted()) {
            return Status::FailedPrecondition("New owner must be an active participant.");
        }
        const auto* current = roster.Find(command.caller.user_id);
        const int vacated_color = next->color_index;

        // 先只推进版本占位, owner_id 留到最后一步再改
        // 中途失败时会话仍归原 owner, 重试读到的权限判断不受影响
        auto claim = txn.CompareAndSetSession(roster.session, roster.session.version);
        if (!claim.IsOk()) {
            return claim;
        }
        const std::uint64_t claimed_version = roster.session.version + 1;

        Participant promoted = *next;
        promoted.role = ParticipantRole::kOwner;
        promoted.color_index = kOwnerColorIndex;
        auto promote = txn.CompareAndSetParticipant(promoted, *next);
        if (!promote.IsOk()) {
            return promote;
        }

        std::optional<Participant> demoted;
        // 原 owner 行缺失时只更新会话与新 owner
        if (current != nullptr && current->IsAccepted()) {
            demoted = *current;
            demoted->role = ParticipantRole::kParticipant;
            demoted->color_index = vacated_color;
            auto demote = txn.CompareAndSetParticipant(*demoted, *current);
            if (!demote.IsOk()) {
                Revert(txn, *next, promoted);
                return demote;
            }
        }

        ChatSession updated = roster.session;
        updated.owner_id = command.new_owner_id;
        auto handover = txn.CompareAndSetSession(updated, claimed_version);
        if (!handover.IsOk()) {
            if (demoted) {
                Revert(txn, *current, *demoted);
            }
            Revert(txn, *next, promoted);
            return handover;
        }
        return Status::OK();
    });
    if (!status.IsOk()) {
        return status;
    }

    COLLAB_LOG_INFO("[Ownership] chat {} transferred from {} to {}",
                    command.chat_id, command.caller.user_id, command.new_owner_id);
    notifier_->Publish(ChangeEvent{ChangeType::kOwnershipTransferred, command.chat_id, command.caller.user_id,
                                   command.new_owner_id, clock_->NowMillis()});
    return Status::OK();
}

} // namespace core
} // namespace collab
