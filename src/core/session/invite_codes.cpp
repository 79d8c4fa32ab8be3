#include "core/session/invite_codes.hpp"

#include "common/logger.hpp"

#include <openssl/rand.h>

#include <array>
#include <utility>

namespace collab {
namespace core {

using common::Status;
using common::StatusCode;
using common::StatusOr;

namespace {

constexpr char kAlphabet[] =
    "0123456789"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz";
constexpr std::size_t kAlphabetSize = sizeof(kAlphabet) - 1;
// 62 * 4 = 248, 丢弃 >= 248 的字节以避免取模偏差
constexpr unsigned int kRejectThreshold = 256 - (256 % kAlphabetSize);
constexpr std::size_t kIdLength = 20;
constexpr int kMaxCodeAttempts = 3;

} // namespace

StatusOr<std::string> RandomToken(std::size_t length) {
    std::string token;
    token.reserve(length);
    std::array<unsigned char, 32> buffer{};
    while (token.size() < length) {
        if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
            return Status::Internal("Secure random generator failed.");
        }
        for (unsigned char byte : buffer) {
            if (byte >= kRejectThreshold) {
                continue;
            }
            token.push_back(kAlphabet[byte % kAlphabetSize]);
            if (token.size() == length) {
                break;
            }
        }
    }
    return StatusOr<std::string>(std::move(token));
}

StatusOr<std::string> GenerateId(const std::string& prefix) {
    auto token = RandomToken(kIdLength);
    if (!token.IsOk()) {
        return token.GetStatus();
    }
    return StatusOr<std::string>(prefix + token.Value());
}

StatusOr<Invite> IssueInvite(StoreTxn& txn,
                             const ChatSession& session,
                             const std::string& created_by,
                             std::optional<int> max_uses,
                             std::int64_t now_ms,
                             const common::CollabConfig& config) {
    Invite invite;
    invite.chat_id = session.chat_id;
    invite.created_by = created_by;
    invite.max_uses = max_uses;
    invite.use_count = 0;
    invite.is_active = true;
    invite.created_at = now_ms;
    if (config.invite_ttl_seconds > 0) {
        invite.expires_at = now_ms + static_cast<std::int64_t>(config.invite_ttl_seconds) * 1000;
    }

    for (int attempt = 0; attempt < kMaxCodeAttempts; ++attempt) {
        auto id = GenerateId("inv_");
        if (!id.IsOk()) {
            return id.GetStatus();
        }
        auto code = RandomToken(static_cast<std::size_t>(config.invite_code_length));
        if (!code.IsOk()) {
            return code.GetStatus();
        }
        invite.invite_id = id.Value();
        invite.code = code.Value();
        auto status = txn.InsertInvite(invite);
        if (status.IsOk()) {
            return StatusOr<Invite>(std::move(invite));
        }
        if (status.Code() != StatusCode::kAlreadyExists) {
            return status;
        }
        COLLAB_LOG_WARN("[Invite] invite code collision on chat {}, regenerating", session.chat_id);
    }
    return Status::Internal("Failed to generate a unique invite code.");
}

} // namespace core
} // namespace collab
