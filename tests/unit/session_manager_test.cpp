#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace collab::core;
using namespace collab::common;
using testutils::User;

class SessionManagerTest : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override {
        CollabConfig config;
        config.hard_max_participants = 5;
        harness_ = std::make_unique<testutils::CollabHarness>(GetParam(), config);
    }

    SessionManager& sessions() { return harness_->sessions_; }

    std::unique_ptr<testutils::CollabHarness> harness_;
};

TEST_P(SessionManagerTest, CreateCollaborativeSession) {
    CreateSessionCommand command;
    command.caller = User("owner");
    auto created = sessions().CreateSession(command);
    ASSERT_TRUE(created.IsOk()) << created.GetStatus().Message();

    const auto& session = created.Value().session;
    EXPECT_EQ(session.chat_id.rfind("chat_", 0), 0u);
    EXPECT_EQ(session.owner_id, "owner");
    EXPECT_TRUE(session.is_collaborative);
    EXPECT_EQ(session.max_participants, 3);
    EXPECT_EQ(session.title, SessionManager::kDefaultTitle);

    ASSERT_TRUE(created.Value().invite.has_value());
    const auto& invite = *created.Value().invite;
    EXPECT_EQ(invite.chat_id, session.chat_id);
    EXPECT_EQ(invite.created_by, "owner");
    EXPECT_EQ(invite.max_uses.value_or(-1), 2);
    EXPECT_EQ(invite.use_count, 0);
    EXPECT_TRUE(invite.is_active);
    ASSERT_TRUE(invite.expires_at.has_value());
    EXPECT_EQ(*invite.expires_at - invite.created_at, 604800LL * 1000);

    auto roster = harness_->registry_.ListParticipants(User("owner"), session.chat_id);
    ASSERT_TRUE(roster.IsOk());
    ASSERT_EQ(roster.Value().participants.size(), 1u);
    EXPECT_EQ(roster.Value().participants[0].role, ParticipantRole::kOwner);
    EXPECT_EQ(roster.Value().participants[0].color_index, kOwnerColorIndex);
}

TEST_P(SessionManagerTest, CapacityValidation) {
    CreateSessionCommand command;
    command.caller = User("owner");
    command.max_participants = 1;
    EXPECT_EQ(sessions().CreateSession(command).GetStatus().Code(), StatusCode::kInvalidArgument);

    command.max_participants = 6;
    EXPECT_EQ(sessions().CreateSession(command).GetStatus().Code(), StatusCode::kInvalidArgument);

    command.max_participants = 5;
    auto created = sessions().CreateSession(command);
    ASSERT_TRUE(created.IsOk());
    EXPECT_EQ(created.Value().invite->max_uses.value_or(-1), 4);
}

TEST_P(SessionManagerTest, TitleValidation) {
    CreateSessionCommand command;
    command.caller = User("owner");
    command.title = std::string(SessionManager::kMaxTitleLength + 1, 'x');
    EXPECT_EQ(sessions().CreateSession(command).GetStatus().Code(), StatusCode::kInvalidArgument);
}

TEST_P(SessionManagerTest, RequiresAuthentication) {
    CreateSessionCommand command;
    command.caller = testutils::Anonymous();
    EXPECT_EQ(sessions().CreateSession(command).GetStatus().Code(), StatusCode::kUnauthenticated);
    EXPECT_EQ(sessions().ListMyChats(testutils::Anonymous()).GetStatus().Code(), StatusCode::kUnauthenticated);
}

TEST_P(SessionManagerTest, PersonalChatHasNoInvite) {
    CreateSessionCommand command;
    command.caller = User("owner");
    command.personal = true;
    auto created = sessions().CreateSession(command);
    ASSERT_TRUE(created.IsOk());
    EXPECT_FALSE(created.Value().session.is_collaborative);
    EXPECT_FALSE(created.Value().invite.has_value());

    auto chats = sessions().ListMyChats(User("owner"));
    ASSERT_TRUE(chats.IsOk());
    EXPECT_TRUE(chats.Value().empty());
}

TEST_P(SessionManagerTest, ConvertPersonalChat) {
    CreateSessionCommand command;
    command.caller = User("owner");
    command.personal = true;
    auto created = sessions().CreateSession(command);
    ASSERT_TRUE(created.IsOk());
    const auto chat_id = created.Value().session.chat_id;

    auto converted = sessions().ConvertToCollaborative(ConvertSessionCommand{User("owner"), chat_id, 4});
    ASSERT_TRUE(converted.IsOk()) << converted.GetStatus().Message();
    EXPECT_TRUE(converted.Value().session.is_collaborative);
    EXPECT_EQ(converted.Value().session.max_participants, 4);
    ASSERT_TRUE(converted.Value().invite.has_value());
    EXPECT_EQ(converted.Value().invite->max_uses.value_or(-1), 3);

    auto again = sessions().ConvertToCollaborative(ConvertSessionCommand{User("owner"), chat_id, 0});
    EXPECT_EQ(again.GetStatus().Code(), StatusCode::kAlreadyExists);
}

TEST_P(SessionManagerTest, ConvertForeignChatIsNotFound) {
    CreateSessionCommand command;
    command.caller = User("owner");
    command.personal = true;
    auto created = sessions().CreateSession(command);
    ASSERT_TRUE(created.IsOk());

    auto converted = sessions().ConvertToCollaborative(
        ConvertSessionCommand{User("intruder"), created.Value().session.chat_id, 0});
    EXPECT_EQ(converted.GetStatus().Code(), StatusCode::kNotFound);

    auto missing = sessions().ConvertToCollaborative(ConvertSessionCommand{User("owner"), "chat_missing", 0});
    EXPECT_EQ(missing.GetStatus().Code(), StatusCode::kNotFound);
}

TEST_P(SessionManagerTest, ListMyChatsNewestFirst) {
    auto first = harness_->CreateCollab("owner");
    harness_->clock_->Advance(5000);
    auto second = harness_->CreateCollab("friend");
    ASSERT_TRUE(harness_->Join("owner", second.first, second.second).IsOk());

    auto chats = sessions().ListMyChats(User("owner"));
    ASSERT_TRUE(chats.IsOk());
    ASSERT_EQ(chats.Value().size(), 2u);

    const auto& newest = chats.Value()[0];
    EXPECT_EQ(newest.session.chat_id, second.first);
    EXPECT_FALSE(newest.is_owner);
    EXPECT_EQ(newest.participant_count, 2);
    EXPECT_EQ(newest.membership.color_index, 1);

    const auto& oldest = chats.Value()[1];
    EXPECT_EQ(oldest.session.chat_id, first.first);
    EXPECT_TRUE(oldest.is_owner);
    EXPECT_EQ(oldest.membership.role, ParticipantRole::kOwner);
}

TEST_P(SessionManagerTest, RemovedChatsDisappearFromList) {
    auto chat = harness_->CreateCollab("owner");
    ASSERT_TRUE(harness_->Join("alice", chat.first, chat.second).IsOk());
    ASSERT_EQ(sessions().ListMyChats(User("alice")).Value().size(), 1u);

    ASSERT_TRUE(harness_->membership_.Leave(LeaveCommand{User("alice"), chat.first}).IsOk());
    EXPECT_TRUE(sessions().ListMyChats(User("alice")).Value().empty());
}

INSTANTIATE_TEST_SUITE_P(StoreModes, SessionManagerTest, ::testing::Values(true, false), testutils::ModeName);
