#include "storage/mysql/collab_store.hpp"

#include "common/logger.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <set>
#include <utility>

namespace collab {
namespace storage {

using common::Status;
using common::StatusOr;
using core::ChatLock;
using core::ChatSession;
using core::Invite;
using core::Participant;

namespace {

struct ResultDeleter {
    void operator()(MYSQL_RES* res) const { mysql_free_result(res); }
};
using ResultPtr = std::unique_ptr<MYSQL_RES, ResultDeleter>;

constexpr const char* kSessionColumns =
    "id, owner_id, is_collaborative, max_participants, title, version, created_at";
constexpr const char* kParticipantColumns =
    "chat_id, user_id, role, status, color_index, invited_by, joined_at";
constexpr const char* kInviteColumns =
    "id, chat_id, code, created_by, max_uses, use_count, is_active, expires_at, created_at";
constexpr const char* kLockColumns = "chat_id, locked_by, locked_at, expires_at";

constexpr int kAcceptedStatus = static_cast<int>(core::ParticipantStatus::kAccepted);
constexpr int kRemovedStatus = static_cast<int>(core::ParticipantStatus::kRemoved);

std::int64_t ParseInt64(const char* field) {
    if (!field) return 0;
    return std::strtoll(field, nullptr, 10);
}

std::uint64_t ParseUInt64(const char* field) {
    if (!field) return 0;
    return static_cast<std::uint64_t>(std::strtoull(field, nullptr, 10));
}

std::string ParseString(const char* field) {
    return field ? std::string(field) : std::string();
}

ChatSession ParseSession(MYSQL_ROW row) {
    ChatSession session;
    session.chat_id = ParseString(row[0]);
    session.owner_id = ParseString(row[1]);
    session.is_collaborative = ParseInt64(row[2]) != 0;
    session.max_participants = static_cast<int>(ParseInt64(row[3]));
    session.title = ParseString(row[4]);
    session.version = ParseUInt64(row[5]);
    session.created_at = ParseInt64(row[6]);
    return session;
}

Participant ParseParticipant(MYSQL_ROW row) {
    Participant p;
    p.chat_id = ParseString(row[0]);
    p.user_id = ParseString(row[1]);
    p.role = static_cast<core::ParticipantRole>(ParseInt64(row[2]));
    p.status = static_cast<core::ParticipantStatus>(ParseInt64(row[3]));
    p.color_index = static_cast<int>(ParseInt64(row[4]));
    p.invited_by = ParseString(row[5]);
    p.joined_at = ParseInt64(row[6]);
    return p;
}

Invite ParseInvite(MYSQL_ROW row) {
    Invite invite;
    invite.invite_id = ParseString(row[0]);
    invite.chat_id = ParseString(row[1]);
    invite.code = ParseString(row[2]);
    invite.created_by = ParseString(row[3]);
    if (row[4]) {
        invite.max_uses = static_cast<int>(ParseInt64(row[4]));
    }
    invite.use_count = static_cast<int>(ParseInt64(row[5]));
    invite.is_active = ParseInt64(row[6]) != 0;
    if (row[7]) {
        invite.expires_at = ParseInt64(row[7]);
    }
    invite.created_at = ParseInt64(row[8]);
    return invite;
}

ChatLock ParseLock(MYSQL_ROW row) {
    ChatLock lock;
    lock.chat_id = ParseString(row[0]);
    lock.locked_by = ParseString(row[1]);
    lock.locked_at = ParseInt64(row[2]);
    lock.expires_at = ParseInt64(row[3]);
    return lock;
}

// 单个连接上的工作单元
// transaction 非空时所有语句在该事务内执行, 否则每条语句自动提交
class MySqlTxn : public core::StoreTxn {
public:
    explicit MySqlTxn(std::unique_ptr<Transaction> transaction)
        : transaction_(std::move(transaction)), conn_(transaction_->Raw()) {}

    explicit MySqlTxn(ConnectionPool::Lease lease)
        : lease_(std::move(lease)), conn_(lease_.Raw()) {}

    StatusOr<ChatSession> GetSession(const std::string& chat_id) override {
        auto sql = fmt::format("SELECT {} FROM chat_sessions WHERE id = {} LIMIT 1",
                               kSessionColumns, Quote(chat_id));
        auto result = Query(sql);
        if (!result.IsOk()) {
            return result.GetStatus();
        }
        MYSQL_ROW row = mysql_fetch_row(result.Value().get());
        if (!row) {
            return Status::NotFound("chat not found");
        }
        return StatusOr<ChatSession>(ParseSession(row));
    }

    StatusOr<Participant> FindParticipant(const std::string& chat_id, const std::string& user_id) override {
        auto sql = fmt::format("SELECT {} FROM chat_participants WHERE chat_id = {} AND user_id = {} LIMIT 1",
                               kParticipantColumns, Quote(chat_id), Quote(user_id));
        auto result = Query(sql);
        if (!result.IsOk()) {
            return result.GetStatus();
        }
        MYSQL_ROW row = mysql_fetch_row(result.Value().get());
        if (!row) {
            return Status::NotFound("participant not found");
        }
        return StatusOr<Participant>(ParseParticipant(row));
    }

    StatusOr<std::vector<Participant>> ListParticipants(const std::string& chat_id) override {
        auto sql = fmt::format("SELECT {} FROM chat_participants WHERE chat_id = {} ORDER BY joined_at ASC, user_id ASC",
                               kParticipantColumns, Quote(chat_id));
        auto result = Query(sql);
        if (!result.IsOk()) {
            return result.GetStatus();
        }
        std::vector<Participant> participants;
        while (MYSQL_ROW row = mysql_fetch_row(result.Value().get())) {
            participants.push_back(ParseParticipant(row));
        }
        return StatusOr<std::vector<Participant>>(std::move(participants));
    }

    StatusOr<ChatLock> GetLock(const std::string& chat_id) override {
        auto sql = fmt::format("SELECT {} FROM chat_locks WHERE chat_id = {} LIMIT 1", kLockColumns, Quote(chat_id));
        auto result = Query(sql);
        if (!result.IsOk()) {
            return result.GetStatus();
        }
        MYSQL_ROW row = mysql_fetch_row(result.Value().get());
        if (!row) {
            return Status::NotFound("no lock");
        }
        return StatusOr<ChatLock>(ParseLock(row));
    }

    StatusOr<Invite> FindInviteByCode(const std::string& code) override {
        auto sql = fmt::format("SELECT {} FROM chat_invites WHERE code = {} LIMIT 1", kInviteColumns, Quote(code));
        auto result = Query(sql);
        if (!result.IsOk()) {
            return result.GetStatus();
        }
        MYSQL_ROW row = mysql_fetch_row(result.Value().get());
        if (!row) {
            return Status::NotFound("invite not found");
        }
        return StatusOr<Invite>(ParseInvite(row));
    }

    StatusOr<std::vector<Invite>> ListInvites(const std::string& chat_id) override {
        auto sql = fmt::format("SELECT {} FROM chat_invites WHERE chat_id = {} ORDER BY created_at DESC, id DESC",
                               kInviteColumns, Quote(chat_id));
        auto result = Query(sql);
        if (!result.IsOk()) {
            return result.GetStatus();
        }
        std::vector<Invite> invites;
        while (MYSQL_ROW row = mysql_fetch_row(result.Value().get())) {
            invites.push_back(ParseInvite(row));
        }
        return StatusOr<std::vector<Invite>>(std::move(invites));
    }

    StatusOr<std::vector<ChatSession>> ListSessionsForUser(const std::string& user_id) override {
        auto sql = fmt::format(
            "SELECT s.id, s.owner_id, s.is_collaborative, s.max_participants, s.title, s.version, s.created_at "
            "FROM chat_sessions s JOIN chat_participants p ON p.chat_id = s.id "
            "WHERE p.user_id = {} AND p.status = {} AND s.is_collaborative = 1 "
            "ORDER BY s.created_at DESC",
            Quote(user_id), kAcceptedStatus);
        auto result = Query(sql);
        if (!result.IsOk()) {
            return result.GetStatus();
        }
        std::vector<ChatSession> sessions;
        while (MYSQL_ROW row = mysql_fetch_row(result.Value().get())) {
            sessions.push_back(ParseSession(row));
        }
        return StatusOr<std::vector<ChatSession>>(std::move(sessions));
    }

    Status InsertSession(const ChatSession& session) override {
        auto sql = fmt::format(
            "INSERT INTO chat_sessions (id, owner_id, is_collaborative, max_participants, title, version, created_at) "
            "VALUES ({}, {}, {}, {}, {}, {}, {})",
            Quote(session.chat_id), Quote(session.owner_id), session.is_collaborative ? 1 : 0,
            session.max_participants, Quote(session.title), session.version, session.created_at);
        return Exec(sql);
    }

    Status CompareAndSetSession(const ChatSession& updated, std::uint64_t expected_version) override {
        auto sql = fmt::format(
            "UPDATE chat_sessions SET owner_id = {}, is_collaborative = {}, max_participants = {}, title = {}, "
            "version = version + 1 WHERE id = {} AND version = {}",
            Quote(updated.owner_id), updated.is_collaborative ? 1 : 0, updated.max_participants,
            Quote(updated.title), Quote(updated.chat_id), expected_version);
        auto status = Exec(sql);
        if (!status.IsOk()) {
            return status;
        }
        if (mysql_affected_rows(conn_) == 0) {
            return Status::Aborted("chat session changed concurrently");
        }
        return Status::OK();
    }

    Status AdmitParticipant(const Participant& p, int max_accepted, bool reactivate) override {
        const auto chat = Quote(p.chat_id);
        std::string sql;
        if (reactivate) {
            // 派生表先物化, 避免 UPDATE 子查询引用自身表 (1093)
            sql = fmt::format(
                "UPDATE chat_participants SET role = {role}, status = {accepted}, color_index = {color}, "
                "invited_by = {invited_by}, joined_at = {joined_at} "
                "WHERE chat_id = {chat} AND user_id = {user} AND status = {removed} "
                "AND (SELECT cnt FROM (SELECT COUNT(*) AS cnt FROM chat_participants "
                "WHERE chat_id = {chat} AND status = {accepted}) AS accepted_count) < {max} "
                "AND (SELECT used FROM (SELECT COUNT(*) AS used FROM chat_participants "
                "WHERE chat_id = {chat} AND status = {accepted} AND color_index = {color}) AS color_use) = 0",
                fmt::arg("role", static_cast<int>(p.role)), fmt::arg("accepted", kAcceptedStatus),
                fmt::arg("color", p.color_index), fmt::arg("invited_by", Quote(p.invited_by)),
                fmt::arg("joined_at", p.joined_at), fmt::arg("chat", chat), fmt::arg("user", Quote(p.user_id)),
                fmt::arg("removed", kRemovedStatus), fmt::arg("max", max_accepted));
        } else {
            sql = fmt::format(
                "INSERT INTO chat_participants (chat_id, user_id, role, status, color_index, invited_by, joined_at) "
                "SELECT {chat}, {user}, {role}, {accepted}, {color}, {invited_by}, {joined_at} FROM DUAL "
                "WHERE (SELECT COUNT(*) FROM chat_participants WHERE chat_id = {chat} AND status = {accepted}) < {max} "
                "AND NOT EXISTS (SELECT 1 FROM chat_participants "
                "WHERE chat_id = {chat} AND status = {accepted} AND color_index = {color})",
                fmt::arg("chat", chat), fmt::arg("user", Quote(p.user_id)), fmt::arg("role", static_cast<int>(p.role)),
                fmt::arg("accepted", kAcceptedStatus), fmt::arg("color", p.color_index),
                fmt::arg("invited_by", Quote(p.invited_by)), fmt::arg("joined_at", p.joined_at),
                fmt::arg("max", max_accepted));
        }
        auto status = Exec(sql);
        if (!status.IsOk()) {
            // 并发插入同一用户
            if (status.Code() == common::StatusCode::kAlreadyExists) {
                return Status::Aborted("participant already exists");
            }
            return status;
        }
        if (mysql_affected_rows(conn_) == 0) {
            return Status::Aborted("capacity or color guard rejected participant");
        }
        return Status::OK();
    }

    Status CompareAndSetParticipant(const Participant& updated, const Participant& expected) override {
        auto sql = fmt::format(
            "UPDATE chat_participants SET role = {}, status = {}, color_index = {}, invited_by = {}, joined_at = {} "
            "WHERE chat_id = {} AND user_id = {} AND role = {} AND status = {} AND color_index = {}",
            static_cast<int>(updated.role), static_cast<int>(updated.status), updated.color_index,
            Quote(updated.invited_by), updated.joined_at, Quote(updated.chat_id), Quote(updated.user_id),
            static_cast<int>(expected.role), static_cast<int>(expected.status), expected.color_index);
        auto status = Exec(sql);
        if (!status.IsOk()) {
            return status;
        }
        if (mysql_affected_rows(conn_) == 0) {
            return Status::Aborted("participant changed concurrently");
        }
        return Status::OK();
    }

    Status DeleteParticipant(const std::string& chat_id, const std::string& user_id) override {
        auto sql = fmt::format("DELETE FROM chat_participants WHERE chat_id = {} AND user_id = {}",
                               Quote(chat_id), Quote(user_id));
        auto status = Exec(sql);
        if (!status.IsOk()) {
            return status;
        }
        if (mysql_affected_rows(conn_) == 0) {
            return Status::NotFound("participant not found");
        }
        return Status::OK();
    }

    Status InsertInvite(const Invite& invite) override {
        auto sql = fmt::format(
            "INSERT INTO chat_invites (id, chat_id, code, created_by, max_uses, use_count, is_active, expires_at, created_at) "
            "VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {})",
            Quote(invite.invite_id), Quote(invite.chat_id), Quote(invite.code), Quote(invite.created_by),
            invite.max_uses ? std::to_string(*invite.max_uses) : std::string("NULL"),
            invite.use_count, invite.is_active ? 1 : 0,
            invite.expires_at ? std::to_string(*invite.expires_at) : std::string("NULL"),
            invite.created_at);
        return Exec(sql);
    }

    Status ClaimInviteUse(const std::string& invite_id, int expected_use_count) override {
        auto sql = fmt::format(
            "UPDATE chat_invites SET use_count = use_count + 1 "
            "WHERE id = {} AND use_count = {} AND is_active = 1 AND (max_uses IS NULL OR use_count < max_uses)",
            Quote(invite_id), expected_use_count);
        auto status = Exec(sql);
        if (!status.IsOk()) {
            return status;
        }
        if (mysql_affected_rows(conn_) == 0) {
            return Status::Aborted("invite changed concurrently");
        }
        return Status::OK();
    }

    Status DeactivateInvites(const std::string& chat_id, const std::string& invite_id) override {
        if (invite_id.empty()) {
            return Exec(fmt::format("UPDATE chat_invites SET is_active = 0 WHERE chat_id = {}", Quote(chat_id)));
        }
        // 先确认邀请属于该会话, 已失效的邀请重复撤销视为成功
        auto check = Query(fmt::format("SELECT id FROM chat_invites WHERE chat_id = {} AND id = {} LIMIT 1",
                                       Quote(chat_id), Quote(invite_id)));
        if (!check.IsOk()) {
            return check.GetStatus();
        }
        if (!mysql_fetch_row(check.Value().get())) {
            return Status::NotFound("invite not found");
        }
        return Exec(fmt::format("UPDATE chat_invites SET is_active = 0 WHERE chat_id = {} AND id = {}",
                                Quote(chat_id), Quote(invite_id)));
    }

    StatusOr<bool> TryAcquireLock(const ChatLock& lock, std::int64_t now_ms) override {
        // 单条语句: 无锁行时插入; 已有行过期或属于本人时整行替换; 否则不变
        // 赋值按顺序生效: locked_by 先改, 之后的条件对本人判断结果不变; expires_at 必须最后赋值
        auto sql = fmt::format(
            "INSERT INTO chat_locks (chat_id, locked_by, locked_at, expires_at) "
            "SELECT {chat}, {user}, {locked_at}, {expires_at} FROM DUAL "
            "WHERE EXISTS (SELECT 1 FROM chat_sessions WHERE id = {chat} AND owner_id = {user}) "
            "OR EXISTS (SELECT 1 FROM chat_participants "
            "WHERE chat_id = {chat} AND user_id = {user} AND status = {accepted}) "
            "ON DUPLICATE KEY UPDATE "
            "locked_by = IF(chat_locks.expires_at <= {now} OR chat_locks.locked_by = {user}, "
            "{user}, chat_locks.locked_by), "
            "locked_at = IF(chat_locks.expires_at <= {now} OR chat_locks.locked_by = {user}, "
            "{locked_at}, chat_locks.locked_at), "
            "expires_at = IF(chat_locks.expires_at <= {now} OR chat_locks.locked_by = {user}, "
            "{expires_at}, chat_locks.expires_at)",
            fmt::arg("chat", Quote(lock.chat_id)), fmt::arg("user", Quote(lock.locked_by)),
            fmt::arg("locked_at", lock.locked_at), fmt::arg("expires_at", lock.expires_at),
            fmt::arg("accepted", kAcceptedStatus), fmt::arg("now", now_ms));
        auto status = Exec(sql);
        if (!status.IsOk()) {
            return status;
        }
        return StatusOr<bool>(mysql_affected_rows(conn_) > 0);
    }

    StatusOr<bool> ReleaseLock(const std::string& chat_id, const std::string& user_id) override {
        auto status = Exec(fmt::format("DELETE FROM chat_locks WHERE chat_id = {} AND locked_by = {}",
                                       Quote(chat_id), Quote(user_id)));
        if (!status.IsOk()) {
            return status;
        }
        return StatusOr<bool>(mysql_affected_rows(conn_) > 0);
    }

    Status ClearLock(const std::string& chat_id) override {
        return Exec(fmt::format("DELETE FROM chat_locks WHERE chat_id = {}", Quote(chat_id)));
    }

    Status Commit() override {
        if (!transaction_) {
            return Status::OK();
        }
        return transaction_->Commit();
    }

private:
    std::string Quote(const std::string& value) const {
        return EscapeAndQuote(conn_, value);
    }

    Status Exec(const std::string& sql) {
        if (mysql_real_query(conn_, sql.c_str(), sql.size()) != 0) {
            auto status = MapMySqlError(conn_);
            COLLAB_LOG_DEBUG("[MySqlStore] statement failed: {}", status.Message());
            return status;
        }
        return Status::OK();
    }

    StatusOr<ResultPtr> Query(const std::string& sql) {
        auto status = Exec(sql);
        if (!status.IsOk()) {
            return status;
        }
        MYSQL_RES* res = mysql_store_result(conn_);
        if (!res) {
            return MapMySqlError(conn_);
        }
        return StatusOr<ResultPtr>(ResultPtr(res));
    }

    std::unique_ptr<Transaction> transaction_;
    ConnectionPool::Lease lease_;
    MYSQL* conn_ = nullptr;
};

} // namespace

MySqlRecordStore::MySqlRecordStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

StatusOr<std::unique_ptr<core::StoreTxn>> MySqlRecordStore::BeginTransaction(const std::string& chat_id) {
    auto transaction = std::make_unique<Transaction>(pool_);
    auto status = transaction->Begin();
    if (!status.IsOk()) {
        return status;
    }
    MYSQL* conn = transaction->Raw();
    // 锁住会话行, 同一会话的多步变更串行执行
    auto sql = fmt::format("SELECT id FROM chat_sessions WHERE id = {} FOR UPDATE", EscapeAndQuote(conn, chat_id));
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn);
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
        return MapMySqlError(conn);
    }
    mysql_free_result(res);

    std::unique_ptr<core::StoreTxn> txn = std::make_unique<MySqlTxn>(std::move(transaction));
    return StatusOr<std::unique_ptr<core::StoreTxn>>(std::move(txn));
}

StatusOr<std::unique_ptr<core::StoreTxn>> MySqlRecordStore::OpenAutoCommit() {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    std::unique_ptr<core::StoreTxn> txn = std::make_unique<MySqlTxn>(std::move(lease).Value());
    return StatusOr<std::unique_ptr<core::StoreTxn>>(std::move(txn));
}

StatusOr<bool> MySqlRecordStore::DetectTransactionSupport() {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or).Value();
    MYSQL* conn = lease.Raw();
    static constexpr char kSql[] =
        "SELECT TABLE_NAME, ENGINE FROM information_schema.TABLES "
        "WHERE TABLE_SCHEMA = DATABASE() "
        "AND TABLE_NAME IN ('chat_sessions', 'chat_participants', 'chat_locks', 'chat_invites')";
    if (mysql_real_query(conn, kSql, sizeof(kSql) - 1) != 0) {
        return MapMySqlError(conn);
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
        return MapMySqlError(conn);
    }
    ResultPtr cleanup(res);

    std::set<std::string> tables;
    bool transactional = true;
    while (MYSQL_ROW row = mysql_fetch_row(res)) {
        std::string table = ParseString(row[0]);
        std::string engine = ParseString(row[1]);
        tables.insert(table);
        if (engine != "InnoDB") {
            COLLAB_LOG_WARN("[MySqlStore] table {} uses engine {}, transactions unavailable", table, engine);
            transactional = false;
        }
    }
    if (tables.size() < 4) {
        return Status::FailedPrecondition("Collaboration schema is incomplete, apply sql/schema.sql first.");
    }
    return StatusOr<bool>(transactional);
}

} // namespace storage
} // namespace collab
