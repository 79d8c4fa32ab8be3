#pragma once

#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/notifier.hpp"
#include "core/session/session_types.hpp"
#include "core/session/transactional_store.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace collab {
namespace core {

struct CreateSessionCommand {
    Caller      caller;                // 创建者, 成为 owner
    std::string title;                 // 为空时使用默认标题
    int         max_participants = 0;  // 0 表示使用默认上限
    bool        personal = false;      // true 时创建普通会话, 之后可转换
};

struct ConvertSessionCommand {
    Caller      caller;
    std::string chat_id;
    int         max_participants = 0;
};

// 新建或转换后的会话及其初始邀请
struct SessionWithInvite {
    ChatSession           session;
    std::optional<Invite> invite;
};

struct ChatSummary {
    ChatSession session;
    bool        is_owner = false;
    int         participant_count = 0;
    Participant membership;  // 调用方自己的参与者行
};

// 协作会话的创建、转换与查询
class SessionManager {
public:
    using Status = common::Status;

    SessionManager(std::shared_ptr<TransactionalStore> store,
                   common::CollabConfig config = common::CollabConfig{},
                   std::shared_ptr<Notifier> notifier = nullptr,
                   std::shared_ptr<common::Clock> clock = nullptr);

    common::StatusOr<SessionWithInvite> CreateSession(const CreateSessionCommand& command);
    // 把调用方拥有的普通会话转换为协作会话
    common::StatusOr<SessionWithInvite> ConvertToCollaborative(const ConvertSessionCommand& command);
    // 调用方以 accepted 身份参与的协作会话, 新的在前
    common::StatusOr<std::vector<ChatSummary>> ListMyChats(const Caller& caller);

    static constexpr const char* kDefaultTitle = "Collaborative Chat";
    static constexpr std::size_t kMaxTitleLength = 200;

private:
    common::StatusOr<int> ResolveCapacity(int requested) const;
    // 写入 owner 行并签发初始邀请
    Status SeedCollaboration(StoreTxn& txn, const ChatSession& session, std::int64_t now, SessionWithInvite& out);

private:
    std::shared_ptr<TransactionalStore> store_;
    common::CollabConfig config_;
    std::shared_ptr<Notifier> notifier_;
    std::shared_ptr<common::Clock> clock_;
};

} // namespace core
} // namespace collab
