#include "test_support.hpp"
#include "core/session/errors.hpp"

#include <gtest/gtest.h>

using namespace collab::core;
using namespace collab::common;
using testutils::User;

class OwnershipTransferTest : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override {
        harness_ = std::make_unique<testutils::CollabHarness>(GetParam());
        std::tie(chat_id_, code_) = harness_->CreateCollab("owner");
        ASSERT_TRUE(harness_->Join("alice", chat_id_, code_).IsOk());
        ASSERT_TRUE(harness_->Join("bob", chat_id_, code_).IsOk());
    }

    Status Transfer(const std::string& from, const std::string& to) {
        return harness_->ownership_.Transfer(TransferOwnershipCommand{User(from), chat_id_, to});
    }

    const Participant* FindIn(const std::vector<Participant>& list, const std::string& user_id) {
        for (const auto& p : list) {
            if (p.user_id == user_id) {
                return &p;
            }
        }
        return nullptr;
    }

    std::unique_ptr<testutils::CollabHarness> harness_;
    std::string chat_id_;
    std::string code_;
};

TEST_P(OwnershipTransferTest, SwapsRolesAndColors) {
    auto status = Transfer("owner", "bob");
    ASSERT_TRUE(status.IsOk()) << status.Message();

    auto roster = harness_->registry_.ListParticipants(User("bob"), chat_id_);
    ASSERT_TRUE(roster.IsOk());
    EXPECT_EQ(roster.Value().session.owner_id, "bob");
    const auto& participants = roster.Value().participants;
    ASSERT_EQ(participants.size(), 3u);

    const auto* bob = FindIn(participants, "bob");
    const auto* old_owner = FindIn(participants, "owner");
    ASSERT_NE(bob, nullptr);
    ASSERT_NE(old_owner, nullptr);
    EXPECT_EQ(bob->role, ParticipantRole::kOwner);
    EXPECT_EQ(bob->color_index, kOwnerColorIndex);
    EXPECT_EQ(old_owner->role, ParticipantRole::kParticipant);
    EXPECT_EQ(old_owner->color_index, 2);
    EXPECT_EQ(FindIn(participants, "alice")->color_index, 1);
}

TEST_P(OwnershipTransferTest, NewOwnerGainsOwnerPowers) {
    ASSERT_TRUE(Transfer("owner", "alice").IsOk());

    // 原 owner 不再拥有管理权限
    auto invite = harness_->membership_.CreateInvite(CreateInviteCommand{User("owner"), chat_id_});
    EXPECT_EQ(invite.GetStatus().Code(), StatusCode::kPermissionDenied);

    auto removed = harness_->membership_.RemoveParticipant(RemoveParticipantCommand{User("alice"), chat_id_, "owner"});
    ASSERT_TRUE(removed.IsOk()) << removed.Message();
    EXPECT_EQ(harness_->Accepted("alice", chat_id_).size(), 2u);
}

TEST_P(OwnershipTransferTest, OldOwnerCanLeaveAfterTransfer) {
    ASSERT_TRUE(Transfer("owner", "alice").IsOk());
    auto left = harness_->membership_.Leave(LeaveCommand{User("owner"), chat_id_});
    ASSERT_TRUE(left.IsOk()) << left.GetStatus().Message();
    EXPECT_FALSE(left.Value().dissolved);
}

TEST_P(OwnershipTransferTest, OnlyOwnerMayTransfer) {
    EXPECT_EQ(Transfer("alice", "bob").Code(), StatusCode::kPermissionDenied);
}

TEST_P(OwnershipTransferTest, TargetMustBeActiveParticipant) {
    EXPECT_EQ(Transfer("owner", "stranger").Code(), StatusCode::kFailedPrecondition);

    ASSERT_TRUE(harness_->membership_.Leave(LeaveCommand{User("bob"), chat_id_}).IsOk());
    auto status = Transfer("owner", "bob");
    EXPECT_EQ(status.Code(), StatusCode::kFailedPrecondition);
    EXPECT_EQ(MapStatus(status), CollabErrorCode::kState);
}

TEST_P(OwnershipTransferTest, TransferToSelfRejected) {
    EXPECT_EQ(Transfer("owner", "owner").Code(), StatusCode::kInvalidArgument);
    EXPECT_EQ(Transfer("owner", "").Code(), StatusCode::kInvalidArgument);
}

TEST_P(OwnershipTransferTest, PublishesTransferEvent) {
    harness_->notifier_->Clear();
    ASSERT_TRUE(Transfer("owner", "bob").IsOk());
    auto events = harness_->notifier_->Events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, ChangeType::kOwnershipTransferred);
    EXPECT_EQ(events[0].user_id, "owner");
    EXPECT_EQ(events[0].target_user_id, "bob");
}

INSTANTIATE_TEST_SUITE_P(StoreModes, OwnershipTransferTest, ::testing::Values(true, false), testutils::ModeName);

// 乐观模式下在转让的各步之间插入并发写, 检查 owner 不变量
class OwnershipTransferInterleavingTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<InMemoryRecordStore>(false);
        intercepting_ = std::make_shared<testutils::InterceptingRecordStore>(backend_);
        auto selected = SelectTransactionalStore(intercepting_, "optimistic");
        ASSERT_TRUE(selected.IsOk()) << selected.GetStatus().Message();
        store_ = selected.Value();
        clock_ = std::make_shared<testutils::ManualClock>();
        sessions_ = std::make_unique<SessionManager>(store_, config_, nullptr, clock_);
        membership_ = std::make_unique<MembershipCoordinator>(store_, config_, nullptr, clock_);
        ownership_ = std::make_unique<OwnershipTransfer>(store_, nullptr, clock_);

        CreateSessionCommand create;
        create.caller = User("owner");
        create.title = "Shared";
        auto created = sessions_->CreateSession(create);
        ASSERT_TRUE(created.IsOk()) << created.GetStatus().Message();
        chat_id_ = created.Value().session.chat_id;
        const auto code = created.Value().invite->code;
        ASSERT_TRUE(membership_->Join(JoinCommand{User("alice"), chat_id_, code}).IsOk());
        ASSERT_TRUE(membership_->Join(JoinCommand{User("bob"), chat_id_, code}).IsOk());
    }

    Status Transfer(const std::string& to) {
        return ownership_->Transfer(TransferOwnershipCommand{User("owner"), chat_id_, to});
    }

    // 绕过包装直接改底层存储
    std::unique_ptr<StoreTxn> Raw() {
        auto txn = backend_->OpenAutoCommit();
        EXPECT_TRUE(txn.IsOk());
        return std::move(txn).Value();
    }

    void ForceRemoved(const std::string& user_id) {
        auto raw = Raw();
        auto row = raw->FindParticipant(chat_id_, user_id);
        ASSERT_TRUE(row.IsOk());
        Participant removed = row.Value();
        removed.status = ParticipantStatus::kRemoved;
        ASSERT_TRUE(raw->CompareAndSetParticipant(removed, row.Value()).IsOk());
    }

    void BumpSessionVersion() {
        auto raw = Raw();
        auto session = raw->GetSession(chat_id_);
        ASSERT_TRUE(session.IsOk());
        ASSERT_TRUE(raw->CompareAndSetSession(session.Value(), session.Value().version).IsOk());
    }

    ChatSession Session() {
        auto session = Raw()->GetSession(chat_id_);
        EXPECT_TRUE(session.IsOk());
        return session.IsOk() ? session.Value() : ChatSession{};
    }

    Participant Row(const std::string& user_id) {
        auto row = Raw()->FindParticipant(chat_id_, user_id);
        EXPECT_TRUE(row.IsOk());
        return row.IsOk() ? row.Value() : Participant{};
    }

    void ExpectOwnedBy(const std::string& user_id) {
        EXPECT_EQ(Session().owner_id, user_id);
        auto owners = testutils::OwnerRows(*backend_, chat_id_);
        ASSERT_EQ(owners.size(), 1u);
        EXPECT_EQ(owners[0].user_id, user_id);
        EXPECT_EQ(owners[0].color_index, kOwnerColorIndex);
    }

    CollabConfig config_;
    std::shared_ptr<InMemoryRecordStore> backend_;
    std::shared_ptr<testutils::InterceptingRecordStore> intercepting_;
    std::shared_ptr<TransactionalStore> store_;
    std::shared_ptr<testutils::ManualClock> clock_;
    std::unique_ptr<SessionManager> sessions_;
    std::unique_ptr<MembershipCoordinator> membership_;
    std::unique_ptr<OwnershipTransfer> ownership_;
    std::string chat_id_;
};

TEST_F(OwnershipTransferInterleavingTest, TargetLeavesRightAfterVersionClaim) {
    bool fired = false;
    intercepting_->SetHook([&](const std::string& step, const std::string&) {
        if (step == "session" && !fired) {
            fired = true;
            ForceRemoved("alice");
        }
    });

    auto status = Transfer("alice");
    intercepting_->SetHook(nullptr);
    EXPECT_EQ(status.Code(), StatusCode::kFailedPrecondition) << status.Message();
    ExpectOwnedBy("owner");
    EXPECT_EQ(Row("alice").status, ParticipantStatus::kRemoved);

    // 原 owner 仍握有管理权限, 不能当作普通成员离开
    auto left = membership_->Leave(LeaveCommand{User("owner"), chat_id_});
    EXPECT_EQ(left.GetStatus().Code(), StatusCode::kFailedPrecondition);
    EXPECT_TRUE(membership_->CreateInvite(CreateInviteCommand{User("owner"), chat_id_}).IsOk());
}

TEST_F(OwnershipTransferInterleavingTest, LostHandoverIsRevertedAndRetried) {
    bool fired = false;
    intercepting_->SetHook([&](const std::string& step, const std::string& subject) {
        if (step == "participant" && subject == "alice" && !fired) {
            fired = true;
            BumpSessionVersion();
        }
    });

    auto status = Transfer("alice");
    intercepting_->SetHook(nullptr);
    ASSERT_TRUE(status.IsOk()) << status.Message();
    ExpectOwnedBy("alice");
    EXPECT_EQ(Row("owner").role, ParticipantRole::kParticipant);
    EXPECT_EQ(Row("owner").color_index, 1);
    EXPECT_EQ(Row("bob").color_index, 2);
}

TEST_F(OwnershipTransferInterleavingTest, RepeatedConflictLeavesRolesUntouched) {
    intercepting_->SetHook([&](const std::string& step, const std::string& subject) {
        if (step == "participant" && subject == "alice") {
            BumpSessionVersion();
        }
    });

    auto status = Transfer("alice");
    intercepting_->SetHook(nullptr);
    EXPECT_EQ(status.Code(), StatusCode::kAborted);
    EXPECT_EQ(MapStatus(status), CollabErrorCode::kConflict);

    ExpectOwnedBy("owner");
    EXPECT_EQ(Row("alice").role, ParticipantRole::kParticipant);
    EXPECT_EQ(Row("alice").color_index, 1);
    EXPECT_EQ(Row("alice").status, ParticipantStatus::kAccepted);

    // 冲突过后可以正常转让
    ASSERT_TRUE(Transfer("alice").IsOk());
    ExpectOwnedBy("alice");
}
