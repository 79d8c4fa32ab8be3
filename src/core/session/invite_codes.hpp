#pragma once

#include "common/config.hpp"
#include "common/status_or.hpp"
#include "core/session/session_types.hpp"
#include "core/session/store.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace collab {
namespace core {

// 由 [0-9A-Za-z] 组成的随机串, 随机源为 OpenSSL
common::StatusOr<std::string> RandomToken(std::size_t length);

// 会话/邀请ID: prefix + 20 位随机串
common::StatusOr<std::string> GenerateId(const std::string& prefix);

// 签发邀请并写入存储, 邀请码冲突时换码重试
common::StatusOr<Invite> IssueInvite(StoreTxn& txn,
                                     const ChatSession& session,
                                     const std::string& created_by,
                                     std::optional<int> max_uses,
                                     std::int64_t now_ms,
                                     const common::CollabConfig& config);

} // namespace core
} // namespace collab
