#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/session_types.hpp"
#include "core/session/store.hpp"
#include "core/session/transactional_store.hpp"

#include <memory>
#include <string>
#include <vector>

namespace collab {
namespace core {

// 会话及其全部参与者行的快照
struct Roster {
    ChatSession session;
    std::vector<Participant> participants; // 含 removed, 按 joined_at 升序

    std::vector<Participant> Accepted() const;
    // 查找任意状态的行
    const Participant* Find(const std::string& user_id) const;
    // owner 或 accepted 参与者
    bool IsMember(const std::string& user_id) const;
    bool IsOwner(const std::string& user_id) const { return session.owner_id == user_id; }
};

// 未认证调用方返回 kUnauthenticated
common::Status RequireAuthenticated(const Caller& caller);

// 参与者名册, 负责成员判定与颜色分配
class ParticipantRegistry {
public:
    explicit ParticipantRegistry(std::shared_ptr<TransactionalStore> store);

    // 列出 accepted 参与者, 调用方须为 owner 或 accepted 参与者
    common::StatusOr<Roster> ListParticipants(const Caller& caller, const std::string& chat_id);

    // 工作单元内读取名册
    static common::StatusOr<Roster> LoadRoster(StoreTxn& txn, const std::string& chat_id);

    // [1, max_participants) 中未被 accepted 行占用的最小颜色, 无空位返回 kResourceExhausted
    static common::StatusOr<int> LowestFreeColor(const std::vector<Participant>& participants, int max_participants);

    // preferred 仍空闲时沿用, 否则取最小空闲颜色
    static common::StatusOr<int> PickColor(const std::vector<Participant>& participants,
                                           int max_participants,
                                           int preferred);

private:
    std::shared_ptr<TransactionalStore> store_;
};

} // namespace core
} // namespace collab
