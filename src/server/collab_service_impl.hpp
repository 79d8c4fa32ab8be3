#pragma once

#include "common/clock.hpp"
#include "common/config.hpp"
#include "core/session/errors.hpp"
#include "core/session/lock_manager.hpp"
#include "core/session/membership_coordinator.hpp"
#include "core/session/notifier.hpp"
#include "core/session/ownership_transfer.hpp"
#include "core/session/participant_registry.hpp"
#include "core/session/session_manager.hpp"
#include "core/session/transactional_store.hpp"

#include "collab_service.grpc.pb.h"

#include <grpcpp/grpcpp.h>
#include <memory>
#include <string>

namespace collab {
namespace server {

class CollabServiceImpl final : public proto::collab::CollabService::Service {
public:
    // 按配置装配存储后端与通知通道, 装配失败抛出 std::runtime_error
    explicit CollabServiceImpl(const common::AppConfig& config);
    CollabServiceImpl(std::shared_ptr<core::TransactionalStore> store,
                      common::CollabConfig config,
                      std::shared_ptr<core::Notifier> notifier = nullptr,
                      std::shared_ptr<common::Clock> clock = nullptr);
    ~CollabServiceImpl() override;

    grpc::Status CreateSession(grpc::ServerContext* context
                               , const proto::collab::CreateSessionRequest* request
                               , proto::collab::CreateSessionResponse* response) override;

    grpc::Status ConvertToCollaborative(grpc::ServerContext* context
                                        , const proto::collab::ConvertToCollaborativeRequest* request
                                        , proto::collab::ConvertToCollaborativeResponse* response) override;

    grpc::Status ListMyChats(grpc::ServerContext* context
                             , const proto::collab::ListMyChatsRequest* request
                             , proto::collab::ListMyChatsResponse* response) override;

    grpc::Status AcquireLock(grpc::ServerContext* context
                             , const proto::collab::AcquireLockRequest* request
                             , proto::collab::AcquireLockResponse* response) override;

    grpc::Status ReleaseLock(grpc::ServerContext* context
                             , const proto::collab::ReleaseLockRequest* request
                             , proto::collab::ReleaseLockResponse* response) override;

    grpc::Status CanPrompt(grpc::ServerContext* context
                           , const proto::collab::CanPromptRequest* request
                           , proto::collab::CanPromptResponse* response) override;

    grpc::Status GetLockStatus(grpc::ServerContext* context
                               , const proto::collab::GetLockStatusRequest* request
                               , proto::collab::GetLockStatusResponse* response) override;

    grpc::Status ValidateInvite(grpc::ServerContext* context
                                , const proto::collab::ValidateInviteRequest* request
                                , proto::collab::ValidateInviteResponse* response) override;

    grpc::Status JoinSession(grpc::ServerContext* context
                             , const proto::collab::JoinSessionRequest* request
                             , proto::collab::JoinSessionResponse* response) override;

    grpc::Status LeaveSession(grpc::ServerContext* context
                              , const proto::collab::LeaveSessionRequest* request
                              , proto::collab::LeaveSessionResponse* response) override;

    grpc::Status RemoveParticipant(grpc::ServerContext* context
                                   , const proto::collab::RemoveParticipantRequest* request
                                   , proto::collab::RemoveParticipantResponse* response) override;

    grpc::Status TransferOwnership(grpc::ServerContext* context
                                   , const proto::collab::TransferOwnershipRequest* request
                                   , proto::collab::TransferOwnershipResponse* response) override;

    grpc::Status ListParticipants(grpc::ServerContext* context
                                  , const proto::collab::ListParticipantsRequest* request
                                  , proto::collab::ListParticipantsResponse* response) override;

    grpc::Status CreateInvite(grpc::ServerContext* context
                              , const proto::collab::CreateInviteRequest* request
                              , proto::collab::CreateInviteResponse* response) override;

    grpc::Status RevokeInvite(grpc::ServerContext* context
                              , const proto::collab::RevokeInviteRequest* request
                              , proto::collab::RevokeInviteResponse* response) override;

    grpc::Status ListInvites(grpc::ServerContext* context
                             , const proto::collab::ListInvitesRequest* request
                             , proto::collab::ListInvitesResponse* response) override;

    core::StoreMode Mode() const { return store_->Mode(); }

private:
    static grpc::Status ToGrpcStatus(const common::Status& status);
    void Wire(common::CollabConfig config, std::shared_ptr<common::Clock> clock);

private:
    std::shared_ptr<core::TransactionalStore> store_;  // 多步变更执行策略
    std::shared_ptr<core::Notifier> notifier_;          // 实时通知
    std::unique_ptr<core::SessionManager> sessions_;
    std::unique_ptr<core::LockManager> locks_;
    std::unique_ptr<core::MembershipCoordinator> membership_;
    std::unique_ptr<core::OwnershipTransfer> ownership_;
    std::unique_ptr<core::ParticipantRegistry> registry_;
};

} // namespace server
} // namespace collab
