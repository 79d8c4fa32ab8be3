#include "core/session/membership_coordinator.hpp"
#include "core/session/invite_codes.hpp"

#include "common/logger.hpp"

#include <utility>

namespace collab {
namespace core {

using common::StatusCode;
using common::StatusOr;

MembershipCoordinator::MembershipCoordinator(std::shared_ptr<TransactionalStore> store,
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

MembershipCoordinator::Status MembershipCoordinator::CheckInviteUsable(const Invite& invite, std::int64_t now) const {
    if (!invite.is_active) {
        return Status::NotFound("Invalid or expired invite code.");
    }
    if (invite.IsExpiredAt(now)) {
        return Status::NotFound("Invite has expired.");
    }
    if (invite.IsExhausted()) {
        return Status::ResourceExhausted("Invite has reached maximum uses.");
    }
    return Status::OK();
}

StatusOr<InviteSummary> MembershipCoordinator::ValidateInvite(const std::string& code) {
    if (code.empty()) {
        return Status::InvalidArgument("Invite code cannot be empty.");
    }

    const auto now = clock_->NowMillis();
    InviteSummary summary;
    auto status = store_->Direct([&](StoreTxn& txn) {
        auto invite = txn.FindInviteByCode(code);
        if (!invite.IsOk()) {
            if (invite.GetStatus().Code() == StatusCode::kNotFound) {
                return Status::NotFound("Invalid or expired invite code.");
            }
            return invite.GetStatus();
        }
        auto usable = CheckInviteUsable(invite.Value(), now);
        if (!usable.IsOk()) {
            return usable;
        }
        auto roster = ParticipantRegistry::LoadRoster(txn, invite.Value().chat_id);
        if (!roster.IsOk()) {
            return roster.GetStatus();
        }
        if (!roster.Value().session.is_collaborative) {
            return Status::NotFound("Chat is not collaborative.");
        }
        auto accepted = static_cast<int>(CountAccepted(roster.Value().participants));
        if (accepted >= roster.Value().session.max_participants) {
            return Status::ResourceExhausted("Chat is at maximum capacity.");
        }
        summary.session = roster.Value().session;
        summary.invite = invite.Value();
        summary.participant_count = accepted;
        return Status::OK();
    });
    if (!status.IsOk()) {
        return status;
    }
    return StatusOr<InviteSummary>(std::move(summary));
}

StatusOr<JoinResult> MembershipCoordinator::Join(const JoinCommand& command) {
    auto auth = RequireAuthenticated(command.caller);
    if (!auth.IsOk()) {
        return auth;
    }
    if (command.chat_id.empty()) {
        return Status::InvalidArgument("Chat ID cannot be empty.");
    }
    if (command.invite_code.empty()) {
        return Status::InvalidArgument("Invite code cannot be empty.");
    }

    const auto& user_id = command.caller.user_id;
    JoinResult result;
    auto status = store_->Execute(command.chat_id, "join", [&](StoreTxn& txn) {
        const auto now = clock_->NowMillis();
        auto roster_or = ParticipantRegistry::LoadRoster(txn, command.chat_id);
        if (!roster_or.IsOk()) {
            return roster_or.GetStatus();
        }
        const auto& roster = roster_or.Value();
        const auto& session = roster.session;
        if (!session.is_collaborative) {
            return Status::NotFound("Chat is not collaborative.");
        }

        auto invite_or = txn.FindInviteByCode(command.invite_code);
        if (!invite_or.IsOk()) {
            if (invite_or.GetStatus().Code() == StatusCode::kNotFound) {
                return Status::NotFound("Invalid or expired invite code.");
            }
            return invite_or.GetStatus();
        }
        const auto& invite = invite_or.Value();
        if (invite.chat_id != command.chat_id) {
            return Status::NotFound("Invalid or expired invite code.");
        }
        auto usable = CheckInviteUsable(invite, now);
        if (!usable.IsOk()) {
            return usable;
        }

        const auto* existing = roster.Find(user_id);
        if (session.owner_id == user_id || (existing != nullptr && existing->IsAccepted())) {
            return Status::AlreadyExists("Already a participant of this chat.");
        }
        if (static_cast<int>(CountAccepted(roster.participants)) >= session.max_participants) {
            return Status::ResourceExhausted("Chat is at maximum capacity.");
        }
        auto color = existing != nullptr
            ? ParticipantRegistry::PickColor(roster.participants, session.max_participants, existing->color_index)
            : ParticipantRegistry::LowestFreeColor(roster.participants, session.max_participants);
        if (!color.IsOk()) {
            return Status::ResourceExhausted("Chat is at maximum capacity.");
        }

        // 先推进会话版本占位, 并发变更中只有一个能继续
        auto claim = txn.CompareAndSetSession(session, session.version);
        if (!claim.IsOk()) {
            return claim;
        }
        auto use = txn.ClaimInviteUse(invite.invite_id, invite.use_count);
        if (!use.IsOk()) {
            return use;
        }

        Participant participant;
        if (existing != nullptr) {
            // 复用旧行, 保留最初的加入时间
            participant = *existing;
        } else {
            participant.chat_id = command.chat_id;
            participant.user_id = user_id;
            participant.joined_at = now;
        }
        participant.role = ParticipantRole::kParticipant;
        participant.status = ParticipantStatus::kAccepted;
        participant.color_index = color.Value();
        participant.invited_by = invite.created_by;
        auto admit = txn.AdmitParticipant(participant, session.max_participants, existing != nullptr);
        if (!admit.IsOk()) {
            return admit;
        }
        result.participant = participant;
        result.rejoined = existing != nullptr;
        return Status::OK();
    });
    if (!status.IsOk()) {
        COLLAB_LOG_DEBUG("[Membership] join chat {} by {} failed: {}", command.chat_id, user_id, status.Message());
        return status;
    }

    COLLAB_LOG_INFO("[Membership] {} joined chat {} with color {}{}",
                    user_id, command.chat_id, result.participant.color_index, result.rejoined ? " (rejoin)" : "");
    notifier_->Publish(ChangeEvent{ChangeType::kParticipantJoined, command.chat_id, user_id, "", clock_->NowMillis()});
    return StatusOr<JoinResult>(std::move(result));
}

MembershipCoordinator::Status MembershipCoordinator::RemoveAccepted(StoreTxn& txn,
                                                                    const Roster& roster,
                                                                    const Participant& participant,
                                                                    bool* released_lock) {
    auto claim = txn.CompareAndSetSession(roster.session, roster.session.version);
    if (!claim.IsOk()) {
        return claim;
    }
    Participant removed = participant;
    removed.status = ParticipantStatus::kRemoved;
    auto update = txn.CompareAndSetParticipant(removed, participant);
    if (!update.IsOk()) {
        return update;
    }
    auto released = txn.ReleaseLock(roster.session.chat_id, participant.user_id);
    if (!released.IsOk()) {
        return released.GetStatus();
    }
    if (released_lock != nullptr) {
        *released_lock = released.Value();
    }
    return Status::OK();
}

StatusOr<LeaveResult> MembershipCoordinator::Leave(const LeaveCommand& command) {
    auto auth = RequireAuthenticated(command.caller);
    if (!auth.IsOk()) {
        return auth;
    }
    if (command.chat_id.empty()) {
        return Status::InvalidArgument("Chat ID cannot be empty.");
    }

    const auto& user_id = command.caller.user_id;
    LeaveResult result;
    auto status = store_->Execute(command.chat_id, "leave", [&](StoreTxn& txn) {
        result = LeaveResult{};
        auto roster_or = ParticipantRegistry::LoadRoster(txn, command.chat_id);
        if (!roster_or.IsOk()) {
            return roster_or.GetStatus();
        }
        const auto& roster = roster_or.Value();

        if (roster.IsOwner(user_id)) {
            if (!roster.session.is_collaborative) {
                return Status::FailedPrecondition("Chat is not collaborative.");
            }
            for (const auto& p : roster.participants) {
                if (p.IsAccepted() && p.user_id != user_id) {
                    return Status::FailedPrecondition("Owner must transfer ownership before leaving.");
                }
            }
            // owner 独自离开: 会话退回普通会话
            ChatSession dissolved = roster.session;
            dissolved.is_collaborative = false;
            auto update = txn.CompareAndSetSession(dissolved, roster.session.version);
            if (!update.IsOk()) {
                return update;
            }
            auto removed = txn.DeleteParticipant(command.chat_id, user_id);
            if (!removed.IsOk() && removed.Code() != StatusCode::kNotFound) {
                return removed;
            }
            auto cleared = txn.ClearLock(command.chat_id);
            if (!cleared.IsOk()) {
                return cleared;
            }
            auto deactivated = txn.DeactivateInvites(command.chat_id, "");
            if (!deactivated.IsOk()) {
                return deactivated;
            }
            result.dissolved = true;
            return Status::OK();
        }

        const auto* self = roster.Find(user_id);
        if (self == nullptr || !self->IsAccepted()) {
            return Status::NotFound("Not a participant of this chat.");
        }
        return RemoveAccepted(txn, roster, *self, &result.released_lock);
    });
    if (!status.IsOk()) {
        return status;
    }

    const auto now = clock_->NowMillis();
    if (result.dissolved) {
        COLLAB_LOG_INFO("[Membership] owner {} left chat {}, collaboration dissolved", user_id, command.chat_id);
        notifier_->Publish(ChangeEvent{ChangeType::kSessionDissolved, command.chat_id, user_id, "", now});
    } else {
        COLLAB_LOG_INFO("[Membership] {} left chat {}", user_id, command.chat_id);
        notifier_->Publish(ChangeEvent{ChangeType::kParticipantLeft, command.chat_id, user_id, "", now});
        if (result.released_lock) {
            notifier_->Publish(ChangeEvent{ChangeType::kLockReleased, command.chat_id, user_id, "", now});
        }
    }
    return StatusOr<LeaveResult>(result);
}

MembershipCoordinator::Status MembershipCoordinator::RemoveParticipant(const RemoveParticipantCommand& command) {
    auto auth = RequireAuthenticated(command.caller);
    if (!auth.IsOk()) {
        return auth;
    }
    if (command.chat_id.empty()) {
        return Status::InvalidArgument("Chat ID cannot be empty.");
    }
    if (command.target_user_id.empty()) {
        return Status::InvalidArgument("Target user ID cannot be empty.");
    }
    const bool self_removal = command.target_user_id == command.caller.user_id;

    bool released_lock = false;
    auto status = store_->Execute(command.chat_id, "remove_participant", [&](StoreTxn& txn) {
        released_lock = false;
        auto roster_or = ParticipantRegistry::LoadRoster(txn, command.chat_id);
        if (!roster_or.IsOk()) {
            return roster_or.GetStatus();
        }
        const auto& roster = roster_or.Value();
        if (!roster.session.is_collaborative) {
            return Status::FailedPrecondition("Chat is not collaborative.");
        }
        const auto* target = roster.Find(command.target_user_id);
        // owner 不能被移除, 包括 owner 自己
        if (roster.IsOwner(command.target_user_id) || (target != nullptr && target->IsOwner())) {
            return Status::PermissionDenied("The owner cannot be removed.");
        }
        // 参与者可以移除自己
        if (!self_removal && !roster.IsOwner(command.caller.user_id)) {
            return Status::PermissionDenied("Only the owner can remove participants.");
        }
        if (target == nullptr || !target->IsAccepted()) {
            return Status::NotFound("Participant not found.");
        }
        return RemoveAccepted(txn, roster, *target, &released_lock);
    });
    if (!status.IsOk()) {
        return status;
    }

    const auto now = clock_->NowMillis();
    COLLAB_LOG_INFO("[Membership] {} removed {} from chat {}",
                    command.caller.user_id, command.target_user_id, command.chat_id);
    notifier_->Publish(ChangeEvent{self_removal ? ChangeType::kParticipantLeft : ChangeType::kParticipantRemoved,
                                   command.chat_id, command.caller.user_id, command.target_user_id, now});
    if (released_lock) {
        notifier_->Publish(ChangeEvent{ChangeType::kLockReleased, command.chat_id, command.target_user_id, "", now});
    }
    return Status::OK();
}

StatusOr<Invite> MembershipCoordinator::CreateInvite(const CreateInviteCommand& command) {
    auto auth = RequireAuthenticated(command.caller);
    if (!auth.IsOk()) {
        return auth;
    }
    if (command.chat_id.empty()) {
        return Status::InvalidArgument("Chat ID cannot be empty.");
    }

    Invite created;
    auto status = store_->Execute(command.chat_id, "create_invite", [&](StoreTxn& txn) {
        const auto now = clock_->NowMillis();
        auto roster_or = ParticipantRegistry::LoadRoster(txn, command.chat_id);
        if (!roster_or.IsOk()) {
            return roster_or.GetStatus();
        }
        const auto& roster = roster_or.Value();
        if (!roster.IsOwner(command.caller.user_id)) {
            return Status::PermissionDenied("Only the owner can create invites.");
        }
        if (!roster.session.is_collaborative) {
            return Status::FailedPrecondition("Chat is not collaborative.");
        }
        auto accepted = static_cast<int>(CountAccepted(roster.participants));
        auto remaining = roster.session.max_participants - accepted;
        if (remaining <= 0) {
            return Status::ResourceExhausted("Chat is at maximum capacity.");
        }

        auto claim = txn.CompareAndSetSession(roster.session, roster.session.version);
        if (!claim.IsOk()) {
            return claim;
        }
        // 同一时刻只保留一个有效邀请
        auto deactivated = txn.DeactivateInvites(command.chat_id, "");
        if (!deactivated.IsOk()) {
            return deactivated;
        }
        auto invite = IssueInvite(txn, roster.session, command.caller.user_id, remaining, now, config_);
        if (!invite.IsOk()) {
            return invite.GetStatus();
        }
        created = invite.Value();
        return Status::OK();
    });
    if (!status.IsOk()) {
        return status;
    }

    COLLAB_LOG_INFO("[Membership] invite {} created for chat {} (max uses {})",
                    created.invite_id, command.chat_id, created.max_uses.value_or(0));
    notifier_->Publish(ChangeEvent{ChangeType::kInviteCreated, command.chat_id, command.caller.user_id, "",
                                   created.created_at});
    return StatusOr<Invite>(std::move(created));
}

MembershipCoordinator::Status MembershipCoordinator::RevokeInvite(const RevokeInviteCommand& command) {
    auto auth = RequireAuthenticated(command.caller);
    if (!auth.IsOk()) {
        return auth;
    }
    if (command.chat_id.empty()) {
        return Status::InvalidArgument("Chat ID cannot be empty.");
    }
    if (command.invite_id.empty()) {
        return Status::InvalidArgument("Invite ID cannot be empty.");
    }

    auto status = store_->Execute(command.chat_id, "revoke_invite", [&](StoreTxn& txn) {
        auto session = txn.GetSession(command.chat_id);
        if (!session.IsOk()) {
            return session.GetStatus();
        }
        if (session.Value().owner_id != command.caller.user_id) {
            return Status::PermissionDenied("Only the owner can revoke invites.");
        }
        return txn.DeactivateInvites(command.chat_id, command.invite_id);
    });
    if (!status.IsOk()) {
        return status;
    }

    COLLAB_LOG_INFO("[Membership] invite {} revoked on chat {}", command.invite_id, command.chat_id);
    notifier_->Publish(ChangeEvent{ChangeType::kInviteRevoked, command.chat_id, command.caller.user_id, "",
                                   clock_->NowMillis()});
    return Status::OK();
}

StatusOr<std::vector<Invite>> MembershipCoordinator::ListInvites(const Caller& caller, const std::string& chat_id) {
    auto auth = RequireAuthenticated(caller);
    if (!auth.IsOk()) {
        return auth;
    }
    if (chat_id.empty()) {
        return Status::InvalidArgument("Chat ID cannot be empty.");
    }

    std::vector<Invite> invites;
    auto status = store_->Direct([&](StoreTxn& txn) {
        auto session = txn.GetSession(chat_id);
        if (!session.IsOk()) {
            return session.GetStatus();
        }
        if (session.Value().owner_id != caller.user_id) {
            return Status::PermissionDenied("Only the owner can view invites.");
        }
        auto listed = txn.ListInvites(chat_id);
        if (!listed.IsOk()) {
            return listed.GetStatus();
        }
        invites = std::move(listed).Value();
        return Status::OK();
    });
    if (!status.IsOk()) {
        return status;
    }
    return StatusOr<std::vector<Invite>>(std::move(invites));
}

} // namespace core
} // namespace collab
