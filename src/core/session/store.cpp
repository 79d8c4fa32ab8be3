#include "core/session/store.hpp"

#include <algorithm>
#include <utility>

namespace collab {
namespace core {

using common::Status;
using common::StatusOr;

namespace {

std::vector<Participant>::iterator FindRow(detail::ChatRows& rows, const std::string& user_id) {
    return std::find_if(rows.participants.begin(), rows.participants.end(),
                        [&](const Participant& p) { return p.user_id == user_id; });
}

// owner 或 accepted 参与者
bool IsMemberRow(const detail::ChatRows& rows, const std::string& user_id) {
    if (rows.session && rows.session->owner_id == user_id) {
        return true;
    }
    return std::any_of(rows.participants.begin(), rows.participants.end(), [&](const Participant& p) {
        return p.user_id == user_id && p.IsAccepted();
    });
}

// 进程内工作单元
// locked 非空时持有该会话分片锁直到提交, 未提交析构则恢复快照
class InMemoryTxn : public StoreTxn {
public:
    // detached 为 true 时 locked 是尚未登记的新分片, 提交时插入了会话才登记
    InMemoryTxn(InMemoryRecordStore& store,
                std::string chat_id,
                std::shared_ptr<detail::ChatShard> locked,
                bool detached = false)
        : store_(store), locked_chat_(std::move(chat_id)), locked_(std::move(locked)), detached_(detached) {
        if (locked_) {
            guard_ = std::unique_lock<std::mutex>(locked_->mutex);
            snapshot_ = locked_->rows;
        }
    }

    ~InMemoryTxn() override {
        if (locked_ && !committed_) {
            locked_->rows = std::move(snapshot_);
            for (const auto& code : registered_codes_) {
                store_.UnregisterInviteCode(code);
            }
            for (const auto& invite_id : registered_ids_) {
                store_.UnregisterInviteId(invite_id);
            }
        }
    }

    StatusOr<ChatSession> GetSession(const std::string& chat_id) override {
        return WithRows(chat_id, false, [&](detail::ChatRows& rows) -> StatusOr<ChatSession> {
            if (!rows.session) {
                return Status::NotFound("chat not found");
            }
            return StatusOr<ChatSession>(*rows.session);
        });
    }

    StatusOr<Participant> FindParticipant(const std::string& chat_id, const std::string& user_id) override {
        return WithRows(chat_id, false, [&](detail::ChatRows& rows) -> StatusOr<Participant> {
            auto it = FindRow(rows, user_id);
            if (it == rows.participants.end()) {
                return Status::NotFound("participant not found");
            }
            return StatusOr<Participant>(*it);
        });
    }

    StatusOr<std::vector<Participant>> ListParticipants(const std::string& chat_id) override {
        return WithRows(chat_id, false, [&](detail::ChatRows& rows) -> StatusOr<std::vector<Participant>> {
            auto list = rows.participants;
            std::sort(list.begin(), list.end(), [](const Participant& a, const Participant& b) {
                if (a.joined_at != b.joined_at) {
                    return a.joined_at < b.joined_at;
                }
                return a.user_id < b.user_id;
            });
            return StatusOr<std::vector<Participant>>(std::move(list));
        });
    }

    StatusOr<ChatLock> GetLock(const std::string& chat_id) override {
        return WithRows(chat_id, false, [&](detail::ChatRows& rows) -> StatusOr<ChatLock> {
            if (!rows.lock) {
                return Status::NotFound("no lock");
            }
            return StatusOr<ChatLock>(*rows.lock);
        });
    }

    StatusOr<Invite> FindInviteByCode(const std::string& code) override {
        auto chat_id = store_.ChatForInviteCode(code);
        // 锁定其他会话的工作单元看不到本会话以外的邀请
        if (!chat_id || (locked_ && *chat_id != locked_chat_)) {
            return Status::NotFound("invite not found");
        }
        return WithRows(*chat_id, false, [&](detail::ChatRows& rows) -> StatusOr<Invite> {
            for (const auto& invite : rows.invites) {
                if (invite.code == code) {
                    return StatusOr<Invite>(invite);
                }
            }
            return Status::NotFound("invite not found");
        });
    }

    StatusOr<std::vector<Invite>> ListInvites(const std::string& chat_id) override {
        return WithRows(chat_id, false, [&](detail::ChatRows& rows) -> StatusOr<std::vector<Invite>> {
            auto list = rows.invites;
            std::sort(list.begin(), list.end(), [](const Invite& a, const Invite& b) {
                if (a.created_at != b.created_at) {
                    return a.created_at > b.created_at;
                }
                return a.invite_id > b.invite_id;
            });
            return StatusOr<std::vector<Invite>>(std::move(list));
        });
    }

    StatusOr<std::vector<ChatSession>> ListSessionsForUser(const std::string& user_id) override {
        std::vector<ChatSession> sessions;
        auto collect = [&](const detail::ChatRows& rows) {
            if (!rows.session || !rows.session->is_collaborative) {
                return;
            }
            for (const auto& p : rows.participants) {
                if (p.user_id == user_id && p.IsAccepted()) {
                    sessions.push_back(*rows.session);
                    return;
                }
            }
        };
        for (const auto& shard : store_.AllShards()) {
            if (shard == locked_) {
                collect(shard->rows);
                continue;
            }
            std::lock_guard<std::mutex> lock(shard->mutex);
            collect(shard->rows);
        }
        std::sort(sessions.begin(), sessions.end(), [](const ChatSession& a, const ChatSession& b) {
            return a.created_at > b.created_at;
        });
        return StatusOr<std::vector<ChatSession>>(std::move(sessions));
    }

    Status InsertSession(const ChatSession& session) override {
        return WithRows(session.chat_id, true, [&](detail::ChatRows& rows) {
            if (rows.session) {
                return Status::AlreadyExists("chat already exists");
            }
            rows.session = session;
            return Status::OK();
        });
    }

    Status CompareAndSetSession(const ChatSession& updated, std::uint64_t expected_version) override {
        return WithRows(updated.chat_id, false, [&](detail::ChatRows& rows) {
            if (!rows.session) {
                return Status::NotFound("chat not found");
            }
            if (rows.session->version != expected_version) {
                return Status::Aborted("chat session changed concurrently");
            }
            rows.session = updated;
            rows.session->version = expected_version + 1;
            return Status::OK();
        });
    }

    Status AdmitParticipant(const Participant& participant, int max_accepted, bool reactivate) override {
        return WithRows(participant.chat_id, false, [&](detail::ChatRows& rows) {
            if (!rows.session) {
                return Status::NotFound("chat not found");
            }
            auto it = FindRow(rows, participant.user_id);
            if (reactivate) {
                if (it == rows.participants.end() || it->IsAccepted()) {
                    return Status::Aborted("participant row changed concurrently");
                }
            } else if (it != rows.participants.end()) {
                return Status::Aborted("participant already exists");
            }
            if (static_cast<int>(CountAccepted(rows.participants)) >= max_accepted) {
                return Status::Aborted("chat is at capacity");
            }
            for (const auto& p : rows.participants) {
                if (p.IsAccepted() && p.color_index == participant.color_index) {
                    return Status::Aborted("color index already taken");
                }
            }
            Participant admitted = participant;
            admitted.status = ParticipantStatus::kAccepted;
            if (reactivate) {
                *it = admitted;
            } else {
                rows.participants.push_back(admitted);
            }
            return Status::OK();
        });
    }

    Status CompareAndSetParticipant(const Participant& updated, const Participant& expected) override {
        return WithRows(updated.chat_id, false, [&](detail::ChatRows& rows) {
            auto it = FindRow(rows, updated.user_id);
            if (it == rows.participants.end()) {
                return Status::NotFound("participant not found");
            }
            if (it->role != expected.role || it->status != expected.status ||
                it->color_index != expected.color_index) {
                return Status::Aborted("participant changed concurrently");
            }
            *it = updated;
            return Status::OK();
        });
    }

    Status DeleteParticipant(const std::string& chat_id, const std::string& user_id) override {
        return WithRows(chat_id, false, [&](detail::ChatRows& rows) {
            auto it = FindRow(rows, user_id);
            if (it == rows.participants.end()) {
                return Status::NotFound("participant not found");
            }
            rows.participants.erase(it);
            return Status::OK();
        });
    }

    Status InsertInvite(const Invite& invite) override {
        return WithRows(invite.chat_id, false, [&](detail::ChatRows& rows) {
            if (!rows.session) {
                return Status::NotFound("chat not found");
            }
            if (!store_.RegisterInviteCode(invite.code, invite.chat_id)) {
                return Status::AlreadyExists("invite code already exists");
            }
            store_.RegisterInviteId(invite.invite_id, invite.chat_id);
            if (locked_) {
                registered_codes_.push_back(invite.code);
                registered_ids_.push_back(invite.invite_id);
            }
            rows.invites.push_back(invite);
            return Status::OK();
        });
    }

    Status ClaimInviteUse(const std::string& invite_id, int expected_use_count) override {
        auto chat_id = store_.ChatForInviteId(invite_id);
        if (!chat_id) {
            return Status::NotFound("invite not found");
        }
        return WithRows(*chat_id, false, [&](detail::ChatRows& rows) {
            for (auto& invite : rows.invites) {
                if (invite.invite_id != invite_id) {
                    continue;
                }
                if (!invite.is_active || invite.use_count != expected_use_count || invite.IsExhausted()) {
                    return Status::Aborted("invite changed concurrently");
                }
                ++invite.use_count;
                return Status::OK();
            }
            return Status::NotFound("invite not found");
        });
    }

    Status DeactivateInvites(const std::string& chat_id, const std::string& invite_id) override {
        return WithRows(chat_id, false, [&](detail::ChatRows& rows) {
            bool found = false;
            for (auto& invite : rows.invites) {
                if (invite_id.empty() || invite.invite_id == invite_id) {
                    invite.is_active = false;
                    found = true;
                }
            }
            if (!invite_id.empty() && !found) {
                return Status::NotFound("invite not found");
            }
            return Status::OK();
        });
    }

    StatusOr<bool> TryAcquireLock(const ChatLock& lock, std::int64_t now_ms) override {
        return WithRows(lock.chat_id, false, [&](detail::ChatRows& rows) -> StatusOr<bool> {
            if (!IsMemberRow(rows, lock.locked_by)) {
                return StatusOr<bool>(false);
            }
            // 持有者再次取锁时续租
            if (rows.lock && rows.lock->IsLiveAt(now_ms) && rows.lock->locked_by != lock.locked_by) {
                return StatusOr<bool>(false);
            }
            rows.lock = lock;
            return StatusOr<bool>(true);
        });
    }

    StatusOr<bool> ReleaseLock(const std::string& chat_id, const std::string& user_id) override {
        return WithRows(chat_id, false, [&](detail::ChatRows& rows) -> StatusOr<bool> {
            if (!rows.lock || rows.lock->locked_by != user_id) {
                return StatusOr<bool>(false);
            }
            rows.lock.reset();
            return StatusOr<bool>(true);
        });
    }

    Status ClearLock(const std::string& chat_id) override {
        return WithRows(chat_id, false, [&](detail::ChatRows& rows) {
            rows.lock.reset();
            return Status::OK();
        });
    }

    Status Commit() override {
        if (detached_ && locked_ && locked_->rows.session &&
            !store_.AdoptShard(locked_chat_, locked_)) {
            // 析构时回滚
            return Status::AlreadyExists("chat already exists");
        }
        committed_ = true;
        if (guard_.owns_lock()) {
            guard_.unlock();
        }
        return Status::OK();
    }

private:
    // 在会话行上执行 fn: 锁定模式直接访问, 自动提交模式临时加分片锁
    template <typename Fn>
    auto WithRows(const std::string& chat_id, bool create, Fn&& fn) -> decltype(fn(std::declval<detail::ChatRows&>())) {
        if (locked_) {
            if (committed_) {
                return Status::FailedPrecondition("unit of work already committed");
            }
            if (chat_id != locked_chat_) {
                return Status::FailedPrecondition("chat outside the locked unit of work");
            }
            return fn(locked_->rows);
        }
        auto shard = store_.Shard(chat_id, create);
        if (!shard) {
            detail::ChatRows empty;
            return fn(empty);
        }
        std::lock_guard<std::mutex> lock(shard->mutex);
        return fn(shard->rows);
    }

    InMemoryRecordStore& store_;
    std::string locked_chat_;
    std::shared_ptr<detail::ChatShard> locked_;
    std::unique_lock<std::mutex> guard_;
    detail::ChatRows snapshot_;
    std::vector<std::string> registered_codes_;
    std::vector<std::string> registered_ids_;
    bool detached_ = false;
    bool committed_ = false;
};

} // namespace

InMemoryRecordStore::InMemoryRecordStore(bool supports_transactions)
    : supports_transactions_(supports_transactions) {}

StatusOr<std::unique_ptr<StoreTxn>> InMemoryRecordStore::BeginTransaction(const std::string& chat_id) {
    if (!supports_transactions_) {
        return Status::FailedPrecondition("record store does not support transactions");
    }
    // 不存在的会话不登记分片, 只有提交了 InsertSession 的事务才会留下
    auto shard = Shard(chat_id, false);
    const bool detached = shard == nullptr;
    if (detached) {
        shard = std::make_shared<detail::ChatShard>();
    }
    std::unique_ptr<StoreTxn> txn = std::make_unique<InMemoryTxn>(*this, chat_id, std::move(shard), detached);
    return StatusOr<std::unique_ptr<StoreTxn>>(std::move(txn));
}

StatusOr<std::unique_ptr<StoreTxn>> InMemoryRecordStore::OpenAutoCommit() {
    std::unique_ptr<StoreTxn> txn = std::make_unique<InMemoryTxn>(*this, std::string(), nullptr);
    return StatusOr<std::unique_ptr<StoreTxn>>(std::move(txn));
}

StatusOr<bool> InMemoryRecordStore::DetectTransactionSupport() {
    return StatusOr<bool>(supports_transactions_);
}

std::shared_ptr<detail::ChatShard> InMemoryRecordStore::Shard(const std::string& chat_id, bool create) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = shards_.find(chat_id);
    if (it != shards_.end()) {
        return it->second;
    }
    if (!create) {
        return nullptr;
    }
    auto shard = std::make_shared<detail::ChatShard>();
    shards_.emplace(chat_id, shard);
    return shard;
}

bool InMemoryRecordStore::AdoptShard(const std::string& chat_id, std::shared_ptr<detail::ChatShard> shard) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    return shards_.emplace(chat_id, std::move(shard)).second;
}

std::size_t InMemoryRecordStore::ShardCount() {
    std::lock_guard<std::mutex> lock(index_mutex_);
    return shards_.size();
}

std::vector<std::shared_ptr<detail::ChatShard>> InMemoryRecordStore::AllShards() {
    std::lock_guard<std::mutex> lock(index_mutex_);
    std::vector<std::shared_ptr<detail::ChatShard>> shards;
    shards.reserve(shards_.size());
    for (const auto& [chat_id, shard] : shards_) {
        shards.push_back(shard);
    }
    return shards;
}

std::optional<std::string> InMemoryRecordStore::ChatForInviteCode(const std::string& code) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = invite_codes_.find(code);
    if (it == invite_codes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryRecordStore::RegisterInviteCode(const std::string& code, const std::string& chat_id) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    return invite_codes_.emplace(code, chat_id).second;
}

void InMemoryRecordStore::UnregisterInviteCode(const std::string& code) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    invite_codes_.erase(code);
}

std::optional<std::string> InMemoryRecordStore::ChatForInviteId(const std::string& invite_id) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = invite_ids_.find(invite_id);
    if (it == invite_ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryRecordStore::RegisterInviteId(const std::string& invite_id, const std::string& chat_id) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    invite_ids_[invite_id] = chat_id;
}

void InMemoryRecordStore::UnregisterInviteId(const std::string& invite_id) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    invite_ids_.erase(invite_id);
}

} // namespace core
} // namespace collab
