#include "core/session/session_manager.hpp"
#include "core/session/invite_codes.hpp"
#include "core/session/participant_registry.hpp"

#include "common/logger.hpp"

#include <utility>

namespace collab {
namespace core {

using common::StatusCode;
using common::StatusOr;

SessionManager::SessionManager(std::shared_ptr<TransactionalStore> store,
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

StatusOr<int> SessionManager::ResolveCapacity(int requested) const {
    int capacity = requested == 0 ? config_.default_max_participants : requested;
    if (capacity < 2 || capacity > config_.hard_max_participants) {
        return Status::InvalidArgument("Max participants must be between 2 and " +
                                       std::to_string(config_.hard_max_participants) + ".");
    }
    return StatusOr<int>(capacity);
}

SessionManager::Status SessionManager::SeedCollaboration(StoreTxn& txn,
                                                         const ChatSession& session,
                                                         std::int64_t now,
                                                         SessionWithInvite& out) {
    Participant owner;
    owner.chat_id = session.chat_id;
    owner.user_id = session.owner_id;
    owner.role = ParticipantRole::kOwner;
    owner.status = ParticipantStatus::kAccepted;
    owner.color_index = kOwnerColorIndex;
    owner.joined_at = now;

    auto existing = txn.FindParticipant(session.chat_id, session.owner_id);
    if (!existing.IsOk() && existing.GetStatus().Code() != StatusCode::kNotFound) {
        return existing.GetStatus();
    }
    Status admit;
    if (!existing.IsOk()) {
        admit = txn.AdmitParticipant(owner, session.max_participants, false);
    } else if (!existing.Value().IsAccepted()) {
        owner.joined_at = existing.Value().joined_at;
        admit = txn.AdmitParticipant(owner, session.max_participants, true);
    } else if (existing.Value().IsOwner() && existing.Value().color_index == kOwnerColorIndex) {
        admit = Status::OK();
    } else {
        owner.joined_at = existing.Value().joined_at;
        admit = txn.CompareAndSetParticipant(owner, existing.Value());
    }
    if (!admit.IsOk()) {
        return admit;
    }

    auto invite = IssueInvite(txn, session, session.owner_id, session.max_participants - 1, now, config_);
    if (!invite.IsOk()) {
        return invite.GetStatus();
    }
    out.invite = invite.Value();
    return Status::OK();
}

StatusOr<SessionWithInvite> SessionManager::CreateSession(const CreateSessionCommand& command) {
    auto auth = RequireAuthenticated(command.caller);
    if (!auth.IsOk()) {
        return auth;
    }
    if (command.title.size() > kMaxTitleLength) {
        return Status::InvalidArgument("Title is too long.");
    }
    auto capacity = ResolveCapacity(command.max_participants);
    if (!capacity.IsOk()) {
        return capacity.GetStatus();
    }
    auto chat_id = GenerateId("chat_");
    if (!chat_id.IsOk()) {
        return chat_id.GetStatus();
    }

    SessionWithInvite created;
    auto status = store_->Execute(chat_id.Value(), "create_session", [&](StoreTxn& txn) {
        const auto now = clock_->NowMillis();
        ChatSession session;
        session.chat_id = chat_id.Value();
        session.owner_id = command.caller.user_id;
        session.is_collaborative = !command.personal;
        session.max_participants = capacity.Value();
        session.title = command.title.empty() ? kDefaultTitle : command.title;
        session.version = 0;
        session.created_at = now;

        created = SessionWithInvite{};
        created.session = session;
        auto inserted = txn.InsertSession(session);
        if (!inserted.IsOk()) {
            return inserted;
        }
        if (command.personal) {
            return Status::OK();
        }
        return SeedCollaboration(txn, session, now, created);
    });
    if (!status.IsOk()) {
        return status;
    }

    COLLAB_LOG_INFO("[SessionManager] {} created {} chat {} (max {})",
                    command.caller.user_id, command.personal ? "personal" : "collaborative",
                    created.session.chat_id, created.session.max_participants);
    notifier_->Publish(ChangeEvent{ChangeType::kSessionCreated, created.session.chat_id, command.caller.user_id, "",
                                   created.session.created_at});
    return StatusOr<SessionWithInvite>(std::move(created));
}

StatusOr<SessionWithInvite> SessionManager::ConvertToCollaborative(const ConvertSessionCommand& command) {
    auto auth = RequireAuthenticated(command.caller);
    if (!auth.IsOk()) {
        return auth;
    }
    if (command.chat_id.empty()) {
        return Status::InvalidArgument("Chat ID cannot be empty.");
    }
    auto capacity = ResolveCapacity(command.max_participants);
    if (!capacity.IsOk()) {
        return capacity.GetStatus();
    }

    SessionWithInvite converted;
    auto status = store_->Execute(command.chat_id, "convert_session", [&](StoreTxn& txn) {
        const auto now = clock_->NowMillis();
        auto session = txn.GetSession(command.chat_id);
        if (!session.IsOk()) {
            return session.GetStatus();
        }
        // 不属于调用方的会话按不存在处理
        if (session.Value().owner_id != command.caller.user_id) {
            return Status::NotFound("Chat not found.");
        }
        if (session.Value().is_collaborative) {
            return Status::AlreadyExists("Chat is already collaborative.");
        }

        ChatSession updated = session.Value();
        updated.is_collaborative = true;
        updated.max_participants = capacity.Value();
        auto claim = txn.CompareAndSetSession(updated, session.Value().version);
        if (!claim.IsOk()) {
            return claim;
        }
        updated.version = session.Value().version + 1;

        converted = SessionWithInvite{};
        converted.session = updated;
        // 旧的邀请不再可用
        auto deactivated = txn.DeactivateInvites(command.chat_id, "");
        if (!deactivated.IsOk()) {
            return deactivated;
        }
        return SeedCollaboration(txn, updated, now, converted);
    });
    if (!status.IsOk()) {
        return status;
    }

    COLLAB_LOG_INFO("[SessionManager] chat {} converted to collaborative by {}",
                    command.chat_id, command.caller.user_id);
    notifier_->Publish(ChangeEvent{ChangeType::kSessionConverted, command.chat_id, command.caller.user_id, "",
                                   clock_->NowMillis()});
    return StatusOr<SessionWithInvite>(std::move(converted));
}

StatusOr<std::vector<ChatSummary>> SessionManager::ListMyChats(const Caller& caller) {
    auto auth = RequireAuthenticated(caller);
    if (!auth.IsOk()) {
        return auth;
    }

    std::vector<ChatSummary> chats;
    auto status = store_->Direct([&](StoreTxn& txn) {
        auto sessions = txn.ListSessionsForUser(caller.user_id);
        if (!sessions.IsOk()) {
            return sessions.GetStatus();
        }
        for (const auto& session : sessions.Value()) {
            auto participants = txn.ListParticipants(session.chat_id);
            if (!participants.IsOk()) {
                return participants.GetStatus();
            }
            ChatSummary summary;
            summary.session = session;
            summary.is_owner = session.owner_id == caller.user_id;
            summary.participant_count = static_cast<int>(CountAccepted(participants.Value()));
            for (const auto& p : participants.Value()) {
                if (p.user_id == caller.user_id) {
                    summary.membership = p;
                    break;
                }
            }
            chats.push_back(std::move(summary));
        }
        return Status::OK();
    });
    if (!status.IsOk()) {
        return status;
    }
    return StatusOr<std::vector<ChatSummary>>(std::move(chats));
}

} // namespace core
} // namespace collab
