#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace collab {
namespace core {

enum class ParticipantRole {
    kOwner = 0,
    kParticipant,
};

enum class ParticipantStatus {
    kAccepted = 0,
    kRemoved,
};

// 调用方身份, 由上游认证后传入
struct Caller {
    std::string user_id;
    bool        is_authenticated = false;
};

// 颜色 0 专属于当前 owner
constexpr int kOwnerColorIndex = 0;

struct ChatSession {
    std::string   chat_id;                  // 会话ID
    std::string   owner_id;                 // 当前 owner 用户ID
    bool          is_collaborative = false; // 是否为协作会话
    int           max_participants = 3;     // 人数硬上限(含 owner)
    std::string   title;                    // 会话标题
    std::uint64_t version = 0;              // 条件写入使用的版本号
    std::int64_t  created_at = 0;           // 创建时间(毫秒)
};

struct Participant {
    std::string       chat_id;
    std::string       user_id;
    ParticipantRole   role = ParticipantRole::kParticipant;
    ParticipantStatus status = ParticipantStatus::kAccepted;
    int               color_index = 1;
    std::string       invited_by;
    std::int64_t      joined_at = 0;

    bool IsAccepted() const { return status == ParticipantStatus::kAccepted; }
    bool IsOwner() const { return role == ParticipantRole::kOwner; }
};

// 发言锁, 每个会话最多一行; expires_at 已过即视为不存在
struct ChatLock {
    std::string  chat_id;
    std::string  locked_by;
    std::int64_t locked_at = 0;
    std::int64_t expires_at = 0;

    bool IsLiveAt(std::int64_t now_ms) const { return expires_at > now_ms; }
};

struct Invite {
    std::string                 invite_id;
    std::string                 chat_id;
    std::string                 code;
    std::string                 created_by;
    std::optional<int>          max_uses;    // 空表示不限次数
    int                         use_count = 0;
    bool                        is_active = true;
    std::optional<std::int64_t> expires_at;  // 空表示永不过期
    std::int64_t                created_at = 0;

    bool IsExpiredAt(std::int64_t now_ms) const {
        return expires_at.has_value() && *expires_at <= now_ms;
    }
    bool IsExhausted() const {
        return max_uses.has_value() && use_count >= *max_uses;
    }
};

inline const char* RoleToString(ParticipantRole role) {
    return role == ParticipantRole::kOwner ? "owner" : "participant";
}

inline const char* StatusToString(ParticipantStatus status) {
    return status == ParticipantStatus::kAccepted ? "accepted" : "removed";
}

inline std::size_t CountAccepted(const std::vector<Participant>& participants) {
    std::size_t count = 0;
    for (const auto& p : participants) {
        if (p.IsAccepted()) {
            ++count;
        }
    }
    return count;
}

} // namespace core
} // namespace collab
