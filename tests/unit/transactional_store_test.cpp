#include "common/logger.hpp"
#include "core/session/store.hpp"
#include "core/session/transactional_store.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include <memory>
#include <sstream>
#include <string>

using namespace collab::core;
using namespace collab::common;

namespace {

ChatSession MakeSession(const std::string& chat_id) {
    ChatSession session;
    session.chat_id = chat_id;
    session.owner_id = "owner";
    session.is_collaborative = true;
    session.title = "t";
    session.created_at = 1;
    return session;
}

} // namespace

class TransactionalStoreTest : public ::testing::Test {
protected:
    std::shared_ptr<TransactionalStore> Select(bool supports_transactions, const std::string& mode) {
        backend_ = std::make_shared<InMemoryRecordStore>(supports_transactions);
        auto selected = SelectTransactionalStore(backend_, mode);
        EXPECT_TRUE(selected.IsOk()) << selected.GetStatus().Message();
        return selected.Value();
    }

    bool SessionExists(TransactionalStore& store, const std::string& chat_id) {
        bool found = false;
        auto status = store.Direct([&](StoreTxn& txn) {
            auto session = txn.GetSession(chat_id);
            found = session.IsOk();
            return Status::OK();
        });
        EXPECT_TRUE(status.IsOk());
        return found;
    }

    std::shared_ptr<InMemoryRecordStore> backend_;
};

TEST_F(TransactionalStoreTest, AutoModeFollowsDetectedSupport) {
    EXPECT_EQ(Select(true, "auto")->Mode(), StoreMode::kAtomic);
    EXPECT_EQ(Select(false, "auto")->Mode(), StoreMode::kOptimistic);
    EXPECT_EQ(Select(true, "optimistic")->Mode(), StoreMode::kOptimistic);
    EXPECT_EQ(Select(true, "atomic")->Mode(), StoreMode::kAtomic);
}

TEST_F(TransactionalStoreTest, ForcedAtomicWithoutSupportFails) {
    auto selected = SelectTransactionalStore(std::make_shared<InMemoryRecordStore>(false), "atomic");
    EXPECT_EQ(selected.GetStatus().Code(), StatusCode::kFailedPrecondition);
}

TEST_F(TransactionalStoreTest, RejectsUnknownModeAndNullBackend) {
    EXPECT_EQ(SelectTransactionalStore(std::make_shared<InMemoryRecordStore>(), "eventual").GetStatus().Code(),
              StatusCode::kInvalidArgument);
    EXPECT_EQ(SelectTransactionalStore(nullptr, "auto").GetStatus().Code(), StatusCode::kInvalidArgument);
}

TEST_F(TransactionalStoreTest, OptimisticRetriesOnceThenGivesUp) {
    auto store = Select(false, "optimistic");
    int attempts = 0;
    auto status = store->Execute("chat_x", "test", [&](StoreTxn&) {
        ++attempts;
        return Status::Aborted("version mismatch");
    });
    EXPECT_EQ(attempts, 2);
    EXPECT_EQ(status.Code(), StatusCode::kAborted);
    EXPECT_EQ(status.Message(), "concurrent update on chat, please retry");
}

TEST_F(TransactionalStoreTest, OptimisticSecondAttemptCanSucceed) {
    auto store = Select(false, "optimistic");
    int attempts = 0;
    auto status = store->Execute("chat_x", "test", [&](StoreTxn&) {
        return ++attempts == 1 ? Status::Aborted("version mismatch") : Status::OK();
    });
    EXPECT_TRUE(status.IsOk());
    EXPECT_EQ(attempts, 2);
}

TEST_F(TransactionalStoreTest, OptimisticDoesNotRetryOtherErrors) {
    auto store = Select(false, "optimistic");
    int attempts = 0;
    auto status = store->Execute("chat_x", "test", [&](StoreTxn&) {
        ++attempts;
        return Status::ResourceExhausted("full");
    });
    EXPECT_EQ(attempts, 1);
    EXPECT_EQ(status.Code(), StatusCode::kResourceExhausted);
}

TEST_F(TransactionalStoreTest, OptimisticKeepsEarlierSteps) {
    auto store = Select(false, "optimistic");
    auto status = store->Execute("chat_a", "test", [&](StoreTxn& txn) {
        auto inserted = txn.InsertSession(MakeSession("chat_a"));
        if (!inserted.IsOk()) {
            return inserted;
        }
        return Status::FailedPrecondition("later step failed");
    });
    EXPECT_EQ(status.Code(), StatusCode::kFailedPrecondition);
    EXPECT_TRUE(SessionExists(*store, "chat_a"));
}

TEST_F(TransactionalStoreTest, AtomicRollsBackOnError) {
    auto store = Select(true, "atomic");
    int attempts = 0;
    auto status = store->Execute("chat_a", "test", [&](StoreTxn& txn) {
        ++attempts;
        auto inserted = txn.InsertSession(MakeSession("chat_a"));
        if (!inserted.IsOk()) {
            return inserted;
        }
        return Status::Aborted("later step failed");
    });
    EXPECT_EQ(attempts, 1);
    EXPECT_EQ(status.Code(), StatusCode::kAborted);
    EXPECT_FALSE(SessionExists(*store, "chat_a"));
}

TEST_F(TransactionalStoreTest, AtomicCommitsOnSuccess) {
    auto store = Select(true, "atomic");
    auto status = store->Execute("chat_a", "test", [&](StoreTxn& txn) {
        return txn.InsertSession(MakeSession("chat_a"));
    });
    ASSERT_TRUE(status.IsOk()) << status.Message();
    EXPECT_TRUE(SessionExists(*store, "chat_a"));
}

TEST_F(TransactionalStoreTest, AtomicUnitIsScopedToOneChat) {
    auto store = Select(true, "atomic");
    auto status = store->Execute("chat_a", "test", [&](StoreTxn& txn) {
        return txn.InsertSession(MakeSession("chat_b"));
    });
    EXPECT_EQ(status.Code(), StatusCode::kFailedPrecondition);
}

TEST_F(TransactionalStoreTest, SessionVersionCompareAndSet) {
    auto store = Select(true, "atomic");
    ASSERT_TRUE(store->Direct([&](StoreTxn& txn) { return txn.InsertSession(MakeSession("chat_a")); }).IsOk());

    auto status = store->Direct([&](StoreTxn& txn) {
        auto session = txn.GetSession("chat_a");
        if (!session.IsOk()) {
            return session.GetStatus();
        }
        auto first = txn.CompareAndSetSession(session.Value(), session.Value().version);
        if (!first.IsOk()) {
            return first;
        }
        // 同一版本号再次写入必定失败
        return txn.CompareAndSetSession(session.Value(), session.Value().version);
    });
    EXPECT_EQ(status.Code(), StatusCode::kAborted);
}

TEST_F(TransactionalStoreTest, AtomicRollbackForgetsInviteIndexes) {
    auto store = Select(true, "atomic");
    ASSERT_TRUE(store->Execute("chat_a", "test", [&](StoreTxn& txn) {
        return txn.InsertSession(MakeSession("chat_a"));
    }).IsOk());

    Invite invite;
    invite.invite_id = "inv_rolled_back";
    invite.chat_id = "chat_a";
    invite.code = "ROLLBACKCODE";
    invite.created_by = "owner";
    auto status = store->Execute("chat_a", "test", [&](StoreTxn& txn) {
        auto inserted = txn.InsertInvite(invite);
        if (!inserted.IsOk()) {
            return inserted;
        }
        return Status::Aborted("later step failed");
    });
    EXPECT_EQ(status.Code(), StatusCode::kAborted);
    EXPECT_FALSE(backend_->ChatForInviteCode("ROLLBACKCODE").has_value());
    EXPECT_FALSE(backend_->ChatForInviteId("inv_rolled_back").has_value());
}

TEST_F(TransactionalStoreTest, UnknownChatLeavesNoShard) {
    auto store = Select(true, "atomic");
    for (int i = 0; i < 100; ++i) {
        auto status = store->Execute("chat_missing_" + std::to_string(i), "test", [&](StoreTxn& txn) {
            return txn.GetSession("chat_missing_" + std::to_string(i)).GetStatus();
        });
        EXPECT_EQ(status.Code(), StatusCode::kNotFound);
    }
    EXPECT_EQ(backend_->ShardCount(), 0u);

    // 插入会话并提交后才登记
    ASSERT_TRUE(store->Execute("chat_a", "test", [&](StoreTxn& txn) {
        return txn.InsertSession(MakeSession("chat_a"));
    }).IsOk());
    EXPECT_EQ(backend_->ShardCount(), 1u);
    EXPECT_TRUE(SessionExists(*store, "chat_a"));
}

TEST_F(TransactionalStoreTest, ConcurrentCreateOfSameChatConflicts) {
    Select(true, "atomic");
    auto backend = backend_;
    // 两个事务都在会话不存在时开启, 后提交的一方失败
    auto first = backend->BeginTransaction("chat_a");
    auto second = backend->BeginTransaction("chat_a");
    ASSERT_TRUE(first.IsOk());
    ASSERT_TRUE(second.IsOk());
    ASSERT_TRUE(first.Value()->InsertSession(MakeSession("chat_a")).IsOk());
    ASSERT_TRUE(second.Value()->InsertSession(MakeSession("chat_a")).IsOk());
    ASSERT_TRUE(first.Value()->Commit().IsOk());
    EXPECT_EQ(second.Value()->Commit().Code(), StatusCode::kAlreadyExists);
    EXPECT_EQ(backend->ShardCount(), 1u);
}

// 存储故障以 error 级别记录, 业务拒绝不记 error
class StoreFailureLogTest : public TransactionalStoreTest {
protected:
    void SetUp() override {
        LoggingConfig config;
        config.console = false;
        config.level = "info";
        InitLogger(config);
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured_);
        sink->set_pattern("%l|%v");
        GetLogger()->sinks().push_back(sink);
    }

    void TearDown() override {
        GetLogger()->sinks().clear();
    }

    std::string Captured() {
        GetLogger()->flush();
        return captured_.str();
    }

    std::ostringstream captured_;
};

TEST_F(StoreFailureLogTest, UnavailableIsLoggedAsError) {
    auto store = Select(true, "atomic");
    auto status = store->Execute("chat_a", "join", [&](StoreTxn&) {
        return Status::Unavailable("lost connection to mysql");
    });
    EXPECT_EQ(status.Code(), StatusCode::kUnavailable);
    auto output = Captured();
    EXPECT_NE(output.find("error|[Store] join on chat chat_a failed: lost connection to mysql"), std::string::npos)
        << output;
}

TEST_F(StoreFailureLogTest, InternalFromDirectReadIsLoggedAsError) {
    auto store = Select(false, "optimistic");
    auto status = store->Direct([&](StoreTxn&) { return Status::Internal("bad row"); });
    EXPECT_EQ(status.Code(), StatusCode::kInternal);
    EXPECT_NE(Captured().find("error|[Store] direct"), std::string::npos);
}

TEST_F(StoreFailureLogTest, BusinessRejectionIsNotAnError) {
    auto store = Select(true, "atomic");
    auto status = store->Execute("chat_a", "join", [&](StoreTxn&) {
        return Status::ResourceExhausted("Chat is at maximum capacity.");
    });
    EXPECT_EQ(status.Code(), StatusCode::kResourceExhausted);
    EXPECT_EQ(Captured().find("error|"), std::string::npos);
}
