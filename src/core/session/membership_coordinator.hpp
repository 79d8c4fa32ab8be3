#pragma once

#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/notifier.hpp"
#include "core/session/participant_registry.hpp"
#include "core/session/session_types.hpp"
#include "core/session/transactional_store.hpp"

#include <memory>
#include <string>
#include <vector>

namespace collab {
namespace core {

struct JoinCommand {
    Caller      caller;       // 加入者
    std::string chat_id;      // 会话ID
    std::string invite_code;  // 邀请码
};

struct LeaveCommand {
    Caller      caller;
    std::string chat_id;
};

struct RemoveParticipantCommand {
    Caller      caller;          // 发起移除的用户
    std::string chat_id;
    std::string target_user_id;  // 被移除的用户
};

struct CreateInviteCommand {
    Caller      caller;
    std::string chat_id;
};

struct RevokeInviteCommand {
    Caller      caller;
    std::string chat_id;
    std::string invite_id;
};

// 邀请预览
struct InviteSummary {
    ChatSession session;
    Invite      invite;
    int         participant_count = 0;  // 当前 accepted 人数
};

struct JoinResult {
    Participant participant;
    bool        rejoined = false;  // 复用了之前被移除的行
};

struct LeaveResult {
    bool dissolved = false;      // owner 独自离开, 会话退出协作模式
    bool released_lock = false;  // 同时释放了离开者持有的锁
};

// 邀请与成员变更
// 所有多步变更都经 TransactionalStore::Execute 执行, 人数与颜色约束在写入时再校验
class MembershipCoordinator {
public:
    using Status = common::Status;

    MembershipCoordinator(std::shared_ptr<TransactionalStore> store,
                          common::CollabConfig config = common::CollabConfig{},
                          std::shared_ptr<Notifier> notifier = nullptr,
                          std::shared_ptr<common::Clock> clock = nullptr);

    // 不需要登录即可预览邀请
    common::StatusOr<InviteSummary> ValidateInvite(const std::string& code);
    common::StatusOr<JoinResult> Join(const JoinCommand& command);
    common::StatusOr<LeaveResult> Leave(const LeaveCommand& command);
    Status RemoveParticipant(const RemoveParticipantCommand& command);

    // owner 签发新邀请, 旧邀请全部失效, 可用次数为剩余名额
    common::StatusOr<Invite> CreateInvite(const CreateInviteCommand& command);
    Status RevokeInvite(const RevokeInviteCommand& command);
    // owner 查看全部邀请, 新的在前
    common::StatusOr<std::vector<Invite>> ListInvites(const Caller& caller, const std::string& chat_id);

private:
    // 邀请是否仍可使用
    Status CheckInviteUsable(const Invite& invite, std::int64_t now) const;
    // 把 accepted 参与者标记为 removed 并释放其锁
    Status RemoveAccepted(StoreTxn& txn, const Roster& roster, const Participant& participant, bool* released_lock);

private:
    std::shared_ptr<TransactionalStore> store_;
    common::CollabConfig config_;
    std::shared_ptr<Notifier> notifier_;
    std::shared_ptr<common::Clock> clock_;
};

} // namespace core
} // namespace collab
