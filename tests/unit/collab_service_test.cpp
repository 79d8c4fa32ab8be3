#include "server/collab_service_impl.hpp"
#include "collab_service.grpc.pb.h"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace collab::server;
using collab::core::CollabErrorCode;

class CollabServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto backend = std::make_shared<collab::core::InMemoryRecordStore>();
        auto store = testutils::MakeStore(backend, true);
        clock_ = std::make_shared<testutils::ManualClock>();
        service_ = std::make_unique<CollabServiceImpl>(store, collab::common::CollabConfig{}, nullptr, clock_);
    }

    static void SetCaller(proto::common::Caller* caller, const std::string& user_id) {
        caller->set_user_id(user_id);
        caller->set_is_authenticated(true);
    }

    // 创建协作会话, 返回 chat_id 与邀请码
    std::pair<std::string, std::string> CreateChat(const std::string& owner) {
        proto::collab::CreateSessionRequest request;
        SetCaller(request.mutable_caller(), owner);
        request.set_title("Pairing");
        proto::collab::CreateSessionResponse response;
        grpc::ServerContext ctx;
        auto status = service_->CreateSession(&ctx, &request, &response);
        EXPECT_TRUE(status.ok()) << status.error_message();
        EXPECT_EQ(response.error().code(), 0) << response.error().message();
        return {response.session().chat_id(), response.invite().code()};
    }

    grpc::Status Join(const std::string& user, const std::string& chat_id, const std::string& code,
                      proto::collab::JoinSessionResponse* response) {
        proto::collab::JoinSessionRequest request;
        SetCaller(request.mutable_caller(), user);
        request.set_chat_id(chat_id);
        request.set_invite_code(code);
        grpc::ServerContext ctx;
        return service_->JoinSession(&ctx, &request, response);
    }

    std::shared_ptr<testutils::ManualClock> clock_;
    std::unique_ptr<CollabServiceImpl> service_;
    grpc::ServerContext context_;
};

TEST_F(CollabServiceTest, CreateSessionSuccess) {
    proto::collab::CreateSessionRequest request;
    SetCaller(request.mutable_caller(), "owner");
    request.set_title("Pairing");
    proto::collab::CreateSessionResponse response;
    auto status = service_->CreateSession(&context_, &request, &response);

    EXPECT_TRUE(status.ok());
    EXPECT_EQ(response.error().code(), 0);
    EXPECT_EQ(response.error().kind(), "ok");
    EXPECT_EQ(response.session().title(), "Pairing");
    EXPECT_EQ(response.session().owner_id(), "owner");
    EXPECT_TRUE(response.session().is_collaborative());
    EXPECT_EQ(response.session().max_participants(), 3);
    EXPECT_TRUE(response.invite().has_max_uses());
    EXPECT_EQ(response.invite().max_uses(), 2);
    EXPECT_EQ(response.invite().code().size(), 12u);
}

TEST_F(CollabServiceTest, UnauthenticatedCallerRejected) {
    proto::collab::CreateSessionRequest request;
    request.mutable_caller()->set_user_id("owner");
    proto::collab::CreateSessionResponse response;
    auto status = service_->CreateSession(&context_, &request, &response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);
    EXPECT_EQ(response.error().code(), static_cast<int>(CollabErrorCode::kAuth));
    EXPECT_EQ(response.error().kind(), "auth_error");
}

TEST_F(CollabServiceTest, InvalidCapacityIsValidationError) {
    proto::collab::CreateSessionRequest request;
    SetCaller(request.mutable_caller(), "owner");
    request.set_max_participants(10);
    proto::collab::CreateSessionResponse response;
    auto status = service_->CreateSession(&context_, &request, &response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(response.error().kind(), "validation_error");
}

TEST_F(CollabServiceTest, JoinAndListParticipants) {
    auto [chat_id, code] = CreateChat("owner");

    proto::collab::ValidateInviteRequest preview;
    preview.set_code(code);
    proto::collab::ValidateInviteResponse preview_response;
    ASSERT_TRUE(service_->ValidateInvite(&context_, &preview, &preview_response).ok());
    EXPECT_EQ(preview_response.session().chat_id(), chat_id);
    EXPECT_EQ(preview_response.participant_count(), 1);

    proto::collab::JoinSessionResponse joined;
    auto status = Join("alice", chat_id, code, &joined);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(joined.participant().color_index(), 1);
    EXPECT_EQ(joined.participant().role(), "participant");
    EXPECT_EQ(joined.participant().status(), "accepted");
    EXPECT_FALSE(joined.rejoined());

    proto::collab::ListParticipantsRequest request;
    SetCaller(request.mutable_caller(), "alice");
    request.set_chat_id(chat_id);
    proto::collab::ListParticipantsResponse response;
    ASSERT_TRUE(service_->ListParticipants(&context_, &request, &response).ok());
    EXPECT_EQ(response.owner_id(), "owner");
    EXPECT_FALSE(response.is_owner());
    ASSERT_EQ(response.participants_size(), 2);
    EXPECT_EQ(response.participants(0).role(), "owner");

    proto::collab::JoinSessionResponse again;
    auto duplicate = Join("alice", chat_id, code, &again);
    EXPECT_EQ(duplicate.error_code(), grpc::StatusCode::ALREADY_EXISTS);
    EXPECT_EQ(again.error().kind(), "conflict");
}

TEST_F(CollabServiceTest, LockLifecycle) {
    auto [chat_id, code] = CreateChat("owner");
    proto::collab::JoinSessionResponse joined;
    ASSERT_TRUE(Join("alice", chat_id, code, &joined).ok());

    proto::collab::AcquireLockRequest acquire;
    SetCaller(acquire.mutable_caller(), "alice");
    acquire.set_chat_id(chat_id);
    proto::collab::AcquireLockResponse acquired;
    ASSERT_TRUE(service_->AcquireLock(&context_, &acquire, &acquired).ok());
    EXPECT_TRUE(acquired.locked());
    EXPECT_EQ(acquired.holder().locked_by(), "alice");
    EXPECT_EQ(acquired.lease_seconds(), 120);

    SetCaller(acquire.mutable_caller(), "owner");
    proto::collab::AcquireLockResponse busy;
    ASSERT_TRUE(service_->AcquireLock(&context_, &acquire, &busy).ok());
    EXPECT_FALSE(busy.locked());
    EXPECT_EQ(busy.holder().locked_by(), "alice");

    proto::collab::CanPromptRequest prompt;
    SetCaller(prompt.mutable_caller(), "owner");
    prompt.set_chat_id(chat_id);
    proto::collab::CanPromptResponse prompt_response;
    ASSERT_TRUE(service_->CanPrompt(&context_, &prompt, &prompt_response).ok());
    EXPECT_EQ(prompt_response.state(), proto::collab::PROMPT_LOCKED);

    proto::collab::GetLockStatusRequest status_request;
    SetCaller(status_request.mutable_caller(), "owner");
    status_request.set_chat_id(chat_id);
    proto::collab::GetLockStatusResponse status_response;
    ASSERT_TRUE(service_->GetLockStatus(&context_, &status_request, &status_response).ok());
    EXPECT_TRUE(status_response.is_locked());
    EXPECT_FALSE(status_response.held_by_caller());
    EXPECT_EQ(status_response.lock().expires_at_ms() - status_response.lock().locked_at_ms(), 120000);

    proto::collab::ReleaseLockRequest release;
    SetCaller(release.mutable_caller(), "alice");
    release.set_chat_id(chat_id);
    proto::collab::ReleaseLockResponse released;
    ASSERT_TRUE(service_->ReleaseLock(&context_, &release, &released).ok());
    EXPECT_TRUE(released.released());

    proto::collab::CanPromptResponse free_response;
    ASSERT_TRUE(service_->CanPrompt(&context_, &prompt, &free_response).ok());
    EXPECT_EQ(free_response.state(), proto::collab::PROMPT_OK);
}

TEST_F(CollabServiceTest, NonMemberPromptState) {
    auto chat = CreateChat("owner");
    proto::collab::CanPromptRequest prompt;
    SetCaller(prompt.mutable_caller(), "stranger");
    prompt.set_chat_id(chat.first);
    proto::collab::CanPromptResponse response;
    ASSERT_TRUE(service_->CanPrompt(&context_, &prompt, &response).ok());
    EXPECT_EQ(response.state(), proto::collab::PROMPT_NOT_MEMBER);
}

TEST_F(CollabServiceTest, OwnerLeaveWithParticipantsIsStateError) {
    auto [chat_id, code] = CreateChat("owner");
    proto::collab::JoinSessionResponse joined;
    ASSERT_TRUE(Join("alice", chat_id, code, &joined).ok());

    proto::collab::LeaveSessionRequest leave;
    SetCaller(leave.mutable_caller(), "owner");
    leave.set_chat_id(chat_id);
    proto::collab::LeaveSessionResponse response;
    auto status = service_->LeaveSession(&context_, &leave, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(response.error().kind(), "state_error");

    proto::collab::TransferOwnershipRequest transfer;
    SetCaller(transfer.mutable_caller(), "owner");
    transfer.set_chat_id(chat_id);
    transfer.set_new_owner_id("alice");
    proto::collab::TransferOwnershipResponse transferred;
    ASSERT_TRUE(service_->TransferOwnership(&context_, &transfer, &transferred).ok());

    proto::collab::LeaveSessionResponse left;
    ASSERT_TRUE(service_->LeaveSession(&context_, &leave, &left).ok());
    EXPECT_FALSE(left.dissolved());
}

TEST_F(CollabServiceTest, InviteManagement) {
    auto [chat_id, code] = CreateChat("owner");
    clock_->Advance(1000);

    proto::collab::CreateInviteRequest create;
    SetCaller(create.mutable_caller(), "owner");
    create.set_chat_id(chat_id);
    proto::collab::CreateInviteResponse created;
    ASSERT_TRUE(service_->CreateInvite(&context_, &create, &created).ok());
    EXPECT_TRUE(created.invite().is_active());
    EXPECT_NE(created.invite().code(), code);

    proto::collab::ListInvitesRequest list;
    SetCaller(list.mutable_caller(), "owner");
    list.set_chat_id(chat_id);
    proto::collab::ListInvitesResponse listed;
    ASSERT_TRUE(service_->ListInvites(&context_, &list, &listed).ok());
    ASSERT_EQ(listed.invites_size(), 2);
    EXPECT_EQ(listed.invites(0).invite_id(), created.invite().invite_id());
    EXPECT_FALSE(listed.invites(1).is_active());

    proto::collab::RevokeInviteRequest revoke;
    SetCaller(revoke.mutable_caller(), "owner");
    revoke.set_chat_id(chat_id);
    revoke.set_invite_id(created.invite().invite_id());
    proto::collab::RevokeInviteResponse revoked;
    ASSERT_TRUE(service_->RevokeInvite(&context_, &revoke, &revoked).ok());

    proto::collab::ValidateInviteRequest preview;
    preview.set_code(created.invite().code());
    proto::collab::ValidateInviteResponse preview_response;
    auto status = service_->ValidateInvite(&context_, &preview, &preview_response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(preview_response.error().kind(), "not_found");
}

TEST_F(CollabServiceTest, RemoveParticipantByOwner) {
    auto [chat_id, code] = CreateChat("owner");
    proto::collab::JoinSessionResponse joined;
    ASSERT_TRUE(Join("alice", chat_id, code, &joined).ok());

    proto::collab::RemoveParticipantRequest remove;
    SetCaller(remove.mutable_caller(), "alice");
    remove.set_chat_id(chat_id);
    remove.set_target_user_id("owner");
    proto::collab::RemoveParticipantResponse denied;
    EXPECT_EQ(service_->RemoveParticipant(&context_, &remove, &denied).error_code(),
              grpc::StatusCode::PERMISSION_DENIED);

    SetCaller(remove.mutable_caller(), "owner");
    remove.set_target_user_id("alice");
    proto::collab::RemoveParticipantResponse removed;
    ASSERT_TRUE(service_->RemoveParticipant(&context_, &remove, &removed).ok());
    EXPECT_EQ(removed.error().code(), 0);
}

TEST_F(CollabServiceTest, PersonalChatConversionAndListing) {
    proto::collab::CreateSessionRequest request;
    SetCaller(request.mutable_caller(), "owner");
    request.set_personal(true);
    proto::collab::CreateSessionResponse created;
    ASSERT_TRUE(service_->CreateSession(&context_, &request, &created).ok());
    EXPECT_FALSE(created.session().is_collaborative());
    EXPECT_FALSE(created.has_invite());

    proto::collab::ListMyChatsRequest list;
    SetCaller(list.mutable_caller(), "owner");
    proto::collab::ListMyChatsResponse before;
    ASSERT_TRUE(service_->ListMyChats(&context_, &list, &before).ok());
    EXPECT_EQ(before.chats_size(), 0);

    proto::collab::ConvertToCollaborativeRequest convert;
    SetCaller(convert.mutable_caller(), "owner");
    convert.set_chat_id(created.session().chat_id());
    proto::collab::ConvertToCollaborativeResponse converted;
    ASSERT_TRUE(service_->ConvertToCollaborative(&context_, &convert, &converted).ok());
    EXPECT_TRUE(converted.session().is_collaborative());
    EXPECT_EQ(converted.invite().max_uses(), 2);

    proto::collab::ListMyChatsResponse after;
    ASSERT_TRUE(service_->ListMyChats(&context_, &list, &after).ok());
    ASSERT_EQ(after.chats_size(), 1);
    EXPECT_TRUE(after.chats(0).is_owner());
    EXPECT_EQ(after.chats(0).my_role(), "owner");
    EXPECT_EQ(after.chats(0).my_color_index(), 0);
    EXPECT_EQ(after.chats(0).participant_count(), 1);

    proto::collab::ConvertToCollaborativeResponse twice;
    auto status = service_->ConvertToCollaborative(&context_, &convert, &twice);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::ALREADY_EXISTS);
    EXPECT_EQ(twice.error().kind(), "conflict");
}
