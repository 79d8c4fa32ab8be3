#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/session_types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace collab {
namespace core {

// 工作单元内可用的读写原语
// 每个写操作都是一条原子条件写: 期望状态不匹配时返回 kAborted, 不做任何修改
class StoreTxn {
public:
    virtual ~StoreTxn() = default;

    // 读取会话, 不存在返回 kNotFound
    virtual common::StatusOr<ChatSession> GetSession(const std::string& chat_id) = 0;
    // 读取 (chat_id, user_id) 的参与者行, 任意状态
    virtual common::StatusOr<Participant> FindParticipant(const std::string& chat_id, const std::string& user_id) = 0;
    // 列出会话全部参与者行(含 removed), 按加入时间升序
    virtual common::StatusOr<std::vector<Participant>> ListParticipants(const std::string& chat_id) = 0;
    // 读取锁行, 无行返回 kNotFound; 是否过期由调用方判断
    virtual common::StatusOr<ChatLock> GetLock(const std::string& chat_id) = 0;
    virtual common::StatusOr<Invite> FindInviteByCode(const std::string& code) = 0;
    // 列出会话全部邀请, 按创建时间降序
    virtual common::StatusOr<std::vector<Invite>> ListInvites(const std::string& chat_id) = 0;
    // 用户以 accepted 身份参与的协作会话
    virtual common::StatusOr<std::vector<ChatSession>> ListSessionsForUser(const std::string& user_id) = 0;

    virtual common::Status InsertSession(const ChatSession& session) = 0;
    // version == expected_version 时写入 updated 并将版本加一
    virtual common::Status CompareAndSetSession(const ChatSession& updated, std::uint64_t expected_version) = 0;
    // 以 accepted 身份写入参与者: reactivate 为 false 时插入新行, 为 true 时把 removed 行改回 accepted
    // 写入条件: 当前 accepted 人数 < max_accepted 且 color_index 未被 accepted 行占用
    virtual common::Status AdmitParticipant(const Participant& participant, int max_accepted, bool reactivate) = 0;
    // 仅当行的 (role, status, color_index) 与 expected 一致时写入
    virtual common::Status CompareAndSetParticipant(const Participant& updated, const Participant& expected) = 0;
    virtual common::Status DeleteParticipant(const std::string& chat_id, const std::string& user_id) = 0;
    virtual common::Status InsertInvite(const Invite& invite) = 0;
    // use_count == expected_use_count 且邀请有效未用尽时加一
    virtual common::Status ClaimInviteUse(const std::string& invite_id, int expected_use_count) = 0;
    // invite_id 为空时停用会话全部邀请
    virtual common::Status DeactivateInvites(const std::string& chat_id, const std::string& invite_id) = 0;
    // 锁行不存在, 已过期或本就属于该用户, 且用户是会话 owner 或 accepted 参与者时写入, 返回是否写入
    virtual common::StatusOr<bool> TryAcquireLock(const ChatLock& lock, std::int64_t now_ms) = 0;
    // 仅当 locked_by == user_id 时删除, 返回是否删除
    virtual common::StatusOr<bool> ReleaseLock(const std::string& chat_id, const std::string& user_id) = 0;
    virtual common::Status ClearLock(const std::string& chat_id) = 0;

    // 提交; 自动提交视图下为空操作. 未提交即析构视为回滚
    virtual common::Status Commit() = 0;
};

// 存储后端
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // 打开锁定 chat_id 会话行的事务, 不支持事务的后端返回 kFailedPrecondition
    virtual common::StatusOr<std::unique_ptr<StoreTxn>> BeginTransaction(const std::string& chat_id) = 0;
    // 打开自动提交视图, 每条写操作独立生效
    virtual common::StatusOr<std::unique_ptr<StoreTxn>> OpenAutoCommit() = 0;
    // 探测是否支持多语句事务
    virtual common::StatusOr<bool> DetectTransactionSupport() = 0;
};

namespace detail {

struct ChatRows {
    std::optional<ChatSession> session;
    std::vector<Participant> participants;
    std::optional<ChatLock> lock;
    std::vector<Invite> invites;
};

struct ChatShard {
    std::mutex mutex;
    ChatRows rows;
};

} // namespace detail

// 进程内存储, 用于未启用 MySQL 的部署与单元测试
// 每个会话一个分片锁; 事务期间持有分片锁并在回滚时恢复快照
class InMemoryRecordStore : public RecordStore {
public:
    explicit InMemoryRecordStore(bool supports_transactions = true);

    common::StatusOr<std::unique_ptr<StoreTxn>> BeginTransaction(const std::string& chat_id) override;
    common::StatusOr<std::unique_ptr<StoreTxn>> OpenAutoCommit() override;
    common::StatusOr<bool> DetectTransactionSupport() override;

    // 以下供工作单元实现使用
    std::shared_ptr<detail::ChatShard> Shard(const std::string& chat_id, bool create);
    // 登记事务中新建的分片, 已有同名分片时返回 false
    bool AdoptShard(const std::string& chat_id, std::shared_ptr<detail::ChatShard> shard);
    std::vector<std::shared_ptr<detail::ChatShard>> AllShards();
    std::size_t ShardCount();
    std::optional<std::string> ChatForInviteCode(const std::string& code);
    bool RegisterInviteCode(const std::string& code, const std::string& chat_id);
    void UnregisterInviteCode(const std::string& code);
    std::optional<std::string> ChatForInviteId(const std::string& invite_id);
    void RegisterInviteId(const std::string& invite_id, const std::string& chat_id);
    void UnregisterInviteId(const std::string& invite_id);

private:
    bool supports_transactions_;
    std::mutex index_mutex_; // 保护以下索引
    std::unordered_map<std::string, std::shared_ptr<detail::ChatShard>> shards_;
    std::unordered_map<std::string, std::string> invite_codes_; // 邀请码 -> 会话ID
    std::unordered_map<std::string, std::string> invite_ids_;   // 邀请ID -> 会话ID
};

} // namespace core
} // namespace collab
