#pragma once

#include <cstdint>
#include <string>

namespace collab {
namespace core {

enum class ChangeType {
    kSessionCreated = 0,
    kSessionConverted,
    kSessionDissolved,
    kParticipantJoined,
    kParticipantLeft,
    kParticipantRemoved,
    kOwnershipTransferred,
    kLockAcquired,
    kLockReleased,
    kInviteCreated,
    kInviteRevoked,
};

inline const char* ChangeTypeToString(ChangeType type) {
    switch (type) {
        case ChangeType::kSessionCreated: return "session_created";
        case ChangeType::kSessionConverted: return "session_converted";
        case ChangeType::kSessionDissolved: return "session_dissolved";
        case ChangeType::kParticipantJoined: return "participant_joined";
        case ChangeType::kParticipantLeft: return "participant_left";
        case ChangeType::kParticipantRemoved: return "participant_removed";
        case ChangeType::kOwnershipTransferred: return "ownership_transferred";
        case ChangeType::kLockAcquired: return "lock_acquired";
        case ChangeType::kLockReleased: return "lock_released";
        case ChangeType::kInviteCreated: return "invite_created";
        case ChangeType::kInviteRevoked: return "invite_revoked";
    }
    return "unknown";
}

// 会话状态变更事件, 提交成功后才会发布
struct ChangeEvent {
    ChangeType   type = ChangeType::kSessionCreated;
    std::string  chat_id;
    std::string  user_id;         // 操作者
    std::string  target_user_id;  // 被移除者 / 新 owner, 可为空
    std::int64_t at = 0;          // 毫秒
};

// 变更通知出口
// 发布失败只记录日志, 不影响已提交的操作
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void Publish(const ChangeEvent& event) = 0;
};

class NullNotifier : public Notifier {
public:
    void Publish(const ChangeEvent& /*event*/) override {}
};

} // namespace core
} // namespace collab
