#include "core/session/participant_registry.hpp"

#include <algorithm>
#include <utility>

namespace collab {
namespace core {

using common::Status;
using common::StatusOr;

namespace {

bool ColorTaken(const std::vector<Participant>& participants, int color) {
    return std::any_of(participants.begin(), participants.end(), [&](const Participant& p) {
        return p.IsAccepted() && p.color_index == color;
    });
}

} // namespace

std::vector<Participant> Roster::Accepted() const {
    std::vector<Participant> accepted;
    for (const auto& p : participants) {
        if (p.IsAccepted()) {
            accepted.push_back(p);
        }
    }
    return accepted;
}

const Participant* Roster::Find(const std::string& user_id) const {
    for (const auto& p : participants) {
        if (p.user_id == user_id) {
            return &p;
        }
    }
    return nullptr;
}

bool Roster::IsMember(const std::string& user_id) const {
    if (IsOwner(user_id)) {
        return true;
    }
    const auto* p = Find(user_id);
    return p != nullptr && p->IsAccepted();
}

Status RequireAuthenticated(const Caller& caller) {
    if (!caller.is_authenticated || caller.user_id.empty()) {
        return Status::Unauthenticated("authentication required");
    }
    return Status::OK();
}

ParticipantRegistry::ParticipantRegistry(std::shared_ptr<TransactionalStore> store)
    : store_(std::move(store)) {}

StatusOr<Roster> ParticipantRegistry::ListParticipants(const Caller& caller, const std::string& chat_id) {
    auto auth = RequireAuthenticated(caller);
    if (!auth.IsOk()) {
        return auth;
    }
    if (chat_id.empty()) {
        return Status::InvalidArgument("chat_id is required");
    }
    Roster roster;
    auto status = store_->Direct([&](StoreTxn& txn) {
        auto loaded = LoadRoster(txn, chat_id);
        if (!loaded.IsOk()) {
            return loaded.GetStatus();
        }
        roster = std::move(loaded).Value();
        return Status::OK();
    });
    if (!status.IsOk()) {
        return status;
    }
    if (!roster.IsMember(caller.user_id)) {
        return Status::PermissionDenied("not a participant of this chat");
    }
    roster.participants = roster.Accepted();
    return StatusOr<Roster>(std::move(roster));
}

StatusOr<Roster> ParticipantRegistry::LoadRoster(StoreTxn& txn, const std::string& chat_id) {
    auto session = txn.GetSession(chat_id);
    if (!session.IsOk()) {
        return session.GetStatus();
    }
    auto participants = txn.ListParticipants(chat_id);
    if (!participants.IsOk()) {
        return participants.GetStatus();
    }
    Roster roster;
    roster.session = std::move(session).Value();
    roster.participants = std::move(participants).Value();
    return StatusOr<Roster>(std::move(roster));
}

StatusOr<int> ParticipantRegistry::LowestFreeColor(const std::vector<Participant>& participants,
                                                   int max_participants) {
    // 颜色 0 留给 owner
    for (int color = kOwnerColorIndex + 1; color < max_participants; ++color) {
        if (!ColorTaken(participants, color)) {
            return StatusOr<int>(color);
        }
    }
    return Status::ResourceExhausted("no free color slot");
}

StatusOr<int> ParticipantRegistry::PickColor(const std::vector<Participant>& participants,
                                             int max_participants,
                                             int preferred) {
    if (preferred > kOwnerColorIndex && preferred < max_participants && !ColorTaken(participants, preferred)) {
        return StatusOr<int>(preferred);
    }
    return LowestFreeColor(participants, max_participants);
}

} // namespace core
} // namespace collab
