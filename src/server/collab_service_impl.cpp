#include "server/collab_service_impl.hpp"

#include "common/logger.hpp"
#include "core/session/store.hpp"
#include "realtime/redis_client.hpp"
#include "realtime/redis_notifier.hpp"
#include "storage/mysql/collab_store.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/options.hpp"

#include <stdexcept>
#include <utility>

namespace collab {
namespace server {

namespace {

using common::Status;
using common::StatusCode;

// 根据配置创建记录存储
std::shared_ptr<core::RecordStore> CreateRecordStore(const common::StorageConfig& config) {
    if (!config.mysql.enabled) {
        COLLAB_LOG_WARN("[CollabService] MySQL backend disabled; using in-memory store");
        return std::make_shared<core::InMemoryRecordStore>();
    }
    auto pool = std::make_shared<storage::ConnectionPool>(storage::Options::FromConfig(config.mysql));
    auto test_conn = pool->Acquire();
    if (!test_conn.IsOk()) {
        // 协作数据不能静默落到内存里
        COLLAB_LOG_ERROR("[CollabService] Failed to initialize MySQL connection: {}", test_conn.GetStatus().Message());
        throw std::runtime_error("mysql unavailable: " + test_conn.GetStatus().Message());
    }
    return std::make_shared<storage::MySqlRecordStore>(std::move(pool));
}

std::shared_ptr<core::TransactionalStore> CreateTransactionalStore(const common::StorageConfig& config) {
    auto selected = core::SelectTransactionalStore(CreateRecordStore(config), config.mode);
    if (!selected.IsOk()) {
        COLLAB_LOG_ERROR("[CollabService] storage mode '{}' rejected: {}", config.mode, selected.GetStatus().Message());
        throw std::runtime_error("storage init failed: " + selected.GetStatus().Message());
    }
    return std::move(selected).Value();
}

// 根据配置创建通知通道, Redis 不可用时不推送
std::shared_ptr<core::Notifier> CreateNotifier(const common::RealtimeConfig& config) {
    if (!config.redis.enabled) {
        return std::make_shared<core::NullNotifier>();
    }
    auto client = std::make_shared<realtime::RedisClient>(config.redis);
    auto status = client->Ping();
    if (!status.IsOk()) {
        COLLAB_LOG_WARN("[CollabService] Redis init failed, realtime events disabled: {}", status.Message());
        return std::make_shared<core::NullNotifier>();
    }
    return std::make_shared<realtime::RedisNotifier>(std::move(client), config.redis.channel_prefix);
}

core::Caller ToCaller(const proto::common::Caller& caller) {
    core::Caller out;
    out.user_id = caller.user_id();
    out.is_authenticated = caller.is_authenticated();
    return out;
}

void FillSession(const core::ChatSession& session, proto::common::SessionInfo* info) {
    info->set_chat_id(session.chat_id);
    info->set_owner_id(session.owner_id);
    info->set_is_collaborative(session.is_collaborative);
    info->set_max_participants(session.max_participants);
    info->set_title(session.title);
    info->set_created_at_ms(session.created_at);
}

void FillParticipant(const core::Participant& participant, proto::common::ParticipantInfo* info) {
    info->set_user_id(participant.user_id);
    info->set_role(core::RoleToString(participant.role));
    info->set_status(core::StatusToString(participant.status));
    info->set_color_index(participant.color_index);
    info->set_invited_by(participant.invited_by);
    info->set_joined_at_ms(participant.joined_at);
}

void FillLock(const core::ChatLock& lock, proto::common::LockInfo* info) {
    info->set_locked_by(lock.locked_by);
    info->set_locked_at_ms(lock.locked_at);
    info->set_expires_at_ms(lock.expires_at);
}

void FillInvite(const core::Invite& invite, proto::common::InviteInfo* info) {
    info->set_invite_id(invite.invite_id);
    info->set_chat_id(invite.chat_id);
    info->set_code(invite.code);
    info->set_created_by(invite.created_by);
    info->set_has_max_uses(invite.max_uses.has_value());
    info->set_max_uses(invite.max_uses.value_or(0));
    info->set_use_count(invite.use_count);
    info->set_is_active(invite.is_active);
    info->set_expires_at_ms(invite.expires_at.value_or(0));
    info->set_created_at_ms(invite.created_at);
}

template <typename Response>
void SetOk(Response* response) {
    core::ErrorToProto(core::CollabErrorCode::kOk, Status::OK(), response->mutable_error());
}

template <typename Response>
void SetError(const Status& status, Response* response) {
    core::ErrorToProto(core::MapStatus(status), status, response->mutable_error());
}

} // namespace

CollabServiceImpl::CollabServiceImpl(const common::AppConfig& config)
    : store_(CreateTransactionalStore(config.storage))
    , notifier_(CreateNotifier(config.realtime)) {
    Wire(config.collab, nullptr);
}

CollabServiceImpl::CollabServiceImpl(std::shared_ptr<core::TransactionalStore> store,
                                     common::CollabConfig config,
                                     std::shared_ptr<core::Notifier> notifier,
                                     std::shared_ptr<common::Clock> clock)
    : store_(std::move(store))
    , notifier_(notifier ? std::move(notifier) : std::make_shared<core::NullNotifier>()) {
    Wire(std::move(config), std::move(clock));
}

CollabServiceImpl::~CollabServiceImpl() = default;

void CollabServiceImpl::Wire(common::CollabConfig config, std::shared_ptr<common::Clock> clock) {
    sessions_ = std::make_unique<core::SessionManager>(store_, config, notifier_, clock);
    locks_ = std::make_unique<core::LockManager>(store_, config, notifier_, clock);
    membership_ = std::make_unique<core::MembershipCoordinator>(store_, config, notifier_, clock);
    ownership_ = std::make_unique<core::OwnershipTransfer>(store_, notifier_, clock);
    registry_ = std::make_unique<core::ParticipantRegistry>(store_);
}

grpc::Status CollabServiceImpl::CreateSession(grpc::ServerContext* context
                                              , const proto::collab::CreateSessionRequest* request
                                              , proto::collab::CreateSessionResponse* response) {
    (void)context; // 未使用
    core::CreateSessionCommand command;
    command.caller = ToCaller(request->caller());
    command.title = request->title();
    command.max_participants = request->max_participants();
    command.personal = request->personal();

    COLLAB_LOG_INFO("[CollabService] CreateSession by {} personal={}", command.caller.user_id, command.personal);
    auto result = sessions_->CreateSession(command);
    if (!result.IsOk()) {
        SetError(result.GetStatus(), response);
        return ToGrpcStatus(result.GetStatus());
    }
    const auto& created = result.Value();
    FillSession(created.session, response->mutable_session());
    if (created.invite.has_value()) {
        FillInvite(*created.invite, response->mutable_invite());
    }
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::ConvertToCollaborative(grpc::ServerContext* context
                                                       , const proto::collab::ConvertToCollaborativeRequest* request
                                                       , proto::collab::ConvertToCollaborativeResponse* response) {
    (void)context; // 未使用
    core::ConvertSessionCommand command;
    command.caller = ToCaller(request->caller());
    command.chat_id = request->chat_id();
    command.max_participants = request->max_participants();

    COLLAB_LOG_INFO("[CollabService] ConvertToCollaborative chat={} by {}", command.chat_id, command.caller.user_id);
    auto result = sessions_->ConvertToCollaborative(command);
    if (!result.IsOk()) {
        SetError(result.GetStatus(), response);
        return ToGrpcStatus(result.GetStatus());
    }
    const auto& converted = result.Value();
    FillSession(converted.session, response->mutable_session());
    if (converted.invite.has_value()) {
        FillInvite(*converted.invite, response->mutable_invite());
    }
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::ListMyChats(grpc::ServerContext* context
                                            , const proto::collab::ListMyChatsRequest* request
                                            , proto::collab::ListMyChatsResponse* response) {
    (void)context; // 未使用
    auto result = sessions_->ListMyChats(ToCaller(request->caller()));
    if (!result.IsOk()) {
        SetError(result.GetStatus(), response);
        return ToGrpcStatus(result.GetStatus());
    }
    for (const auto& summary : result.Value()) {
        auto* chat = response->add_chats();
        FillSession(summary.session, chat->mutable_session());
        chat->set_is_owner(summary.is_owner);
        chat->set_participant_count(summary.participant_count);
        chat->set_my_role(core::RoleToString(summary.membership.role));
        chat->set_my_color_index(summary.membership.color_index);
    }
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::AcquireLock(grpc::ServerContext* context
                                            , const proto::collab::AcquireLockRequest* request
                                            , proto::collab::AcquireLockResponse* response) {
    (void)context; // 未使用
    core::AcquireLockCommand command;
    command.caller = ToCaller(request->caller());
    command.chat_id = request->chat_id();

    auto result = locks_->Acquire(command);
    if (!result.IsOk()) {
        SetError(result.GetStatus(), response);
        return ToGrpcStatus(result.GetStatus());
    }
    const auto& acquire = result.Value();
    response->set_locked(acquire.acquired);
    response->set_lease_seconds(locks_->LeaseSeconds());
    if (acquire.acquired) {
        FillLock(acquire.lock, response->mutable_holder());
    } else if (acquire.holder.has_value()) {
        // 锁被占用不是错误, 客户端根据 holder 展示等待状态
        FillLock(*acquire.holder, response->mutable_holder());
    }
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::ReleaseLock(grpc::ServerContext* context
                                            , const proto::collab::ReleaseLockRequest* request
                                            , proto::collab::ReleaseLockResponse* response) {
    (void)context; // 未使用
    core::ReleaseLockCommand command;
    command.caller = ToCaller(request->caller());
    command.chat_id = request->chat_id();

    auto result = locks_->Release(command);
    if (!result.IsOk()) {
        SetError(result.GetStatus(), response);
        return ToGrpcStatus(result.GetStatus());
    }
    response->set_released(result.Value());
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::CanPrompt(grpc::ServerContext* context
                                          , const proto::collab::CanPromptRequest* request
                                          , proto::collab::CanPromptResponse* response) {
    (void)context; // 未使用
    auto result = locks_->CanPrompt(ToCaller(request->caller()), request->chat_id());
    if (!result.IsOk()) {
        SetError(result.GetStatus(), response);
        return ToGrpcStatus(result.GetStatus());
    }
    const auto& check = result.Value();
    switch (check.availability) {
        case core::PromptAvailability::kOk:
            response->set_state(proto::collab::PROMPT_OK);
            break;
        case core::PromptAvailability::kLocked:
            response->set_state(proto::collab::PROMPT_LOCKED);
            break;
        case core::PromptAvailability::kNotMember:
            response->set_state(proto::collab::PROMPT_NOT_MEMBER);
            break;
    }
    if (check.holder.has_value()) {
        FillLock(*check.holder, response->mutable_holder());
    }
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::GetLockStatus(grpc::ServerContext* context
                                              , const proto::collab::GetLockStatusRequest* request
                                              , proto::collab::GetLockStatusResponse* response) {
    (void)context; // 未使用
    auto result = locks_->GetLockStatus(ToCaller(request->caller()), request->chat_id());
    if (!result.IsOk()) {
        SetError(result.GetStatus(), response);
        return ToGrpcStatus(result.GetStatus());
    }
    const auto& status = result.Value();
    response->set_is_locked(status.lock.has_value());
    if (status.lock.has_value()) {
        FillLock(*status.lock, response->mutable_lock());
    }
    response->set_held_by_caller(status.held_by_caller);
    response->set_lease_seconds(locks_->LeaseSeconds());
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::ValidateInvite(grpc::ServerContext* context
                                               , const proto::collab::ValidateInviteRequest* request
                                               , proto::collab::ValidateInviteResponse* response) {
    (void)context; // 未使用
    auto result = membership_->ValidateInvite(request->code());
    if (!result.IsOk()) {
        SetError(result.GetStatus(), response);
        return ToGrpcStatus(result.GetStatus());
    }
    const auto& summary = result.Value();
    FillSession(summary.session, response->mutable_session());
    FillInvite(summary.invite, response->mutable_invite());
    response->set_participant_count(summary.participant_count);
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::JoinSession(grpc::ServerContext* context
                                            , const proto::collab::JoinSessionRequest* request
                                            , proto::collab::JoinSessionResponse* response) {
    (void)context; // 未使用
    core::JoinCommand command;
    command.caller = ToCaller(request->caller());
    command.chat_id = request->chat_id();
    command.invite_code = request->invite_code();

    COLLAB_LOG_INFO("[CollabService] JoinSession chat={} user={}", command.chat_id, command.caller.user_id);
    auto result = membership_->Join(command);
    if (!result.IsOk()) {
        SetError(result.GetStatus(), response);
        return ToGrpcStatus(result.GetStatus());
    }
    FillParticipant(result.Value().participant, response->mutable_participant());
    response->set_rejoined(result.Value().rejoined);
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::LeaveSession(grpc::ServerContext* context
                                             , const proto::collab::LeaveSessionRequest* request
                                             , proto::collab::LeaveSessionResponse* response) {
    (void)context; // 未使用
    core::LeaveCommand command;
    command.caller = ToCaller(request->caller());
    command.chat_id = request->chat_id();

    COLLAB_LOG_INFO("[CollabService] LeaveSession chat={} user={}", command.chat_id, command.caller.user_id);
    auto result = membership_->Leave(command);
    if (!result.IsOk()) {
        SetError(result.GetStatus(), response);
        return ToGrpcStatus(result.GetStatus());
    }
    response->set_dissolved(result.Value().dissolved);
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::RemoveParticipant(grpc::ServerContext* context
                                                  , const proto::collab::RemoveParticipantRequest* request
                                                  , proto::collab::RemoveParticipantResponse* response) {
    (void)context; // 未使用
    core::RemoveParticipantCommand command;
    command.caller = ToCaller(request->caller());
    command.chat_id = request->chat_id();
    command.target_user_id = request->target_user_id();

    COLLAB_LOG_INFO("[CollabService] RemoveParticipant chat={} target={} by {}",
                    command.chat_id, command.target_user_id, command.caller.user_id);
    auto status = membership_->RemoveParticipant(command);
    if (!status.IsOk()) {
        SetError(status, response);
        return ToGrpcStatus(status);
    }
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::TransferOwnership(grpc::ServerContext* context
                                                  , const proto::collab::TransferOwnershipRequest* request
                                                  , proto::collab::TransferOwnershipResponse* response) {
    (void)context; // 未使用
    core::TransferOwnershipCommand command;
    command.caller = ToCaller(request->caller());
    command.chat_id = request->chat_id();
    command.new_owner_id = request->new_owner_id();

    COLLAB_LOG_INFO("[CollabService] TransferOwnership chat={} {} -> {}",
                    command.chat_id, command.caller.user_id, command.new_owner_id);
    auto status = ownership_->Transfer(command);
    if (!status.IsOk()) {
        SetError(status, response);
        return ToGrpcStatus(status);
    }
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::ListParticipants(grpc::ServerContext* context
                                                 , const proto::collab::ListParticipantsRequest* request
                                                 , proto::collab::ListParticipantsResponse* response) {
    (void)context; // 未使用
    auto caller = ToCaller(request->caller());
    auto result = registry_->ListParticipants(caller, request->chat_id());
    if (!result.IsOk()) {
        SetError(result.GetStatus(), response);
        return ToGrpcStatus(result.GetStatus());
    }
    const auto& roster = result.Value();
    response->set_owner_id(roster.session.owner_id);
    response->set_is_owner(roster.IsOwner(caller.user_id));
    for (const auto& participant : roster.participants) {
        FillParticipant(participant, response->add_participants());
    }
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::CreateInvite(grpc::ServerContext* context
                                             , const proto::collab::CreateInviteRequest* request
                                             , proto::collab::CreateInviteResponse* response) {
    (void)context; // 未使用
    core::CreateInviteCommand command;
    command.caller = ToCaller(request->caller());
    command.chat_id = request->chat_id();

    auto result = membership_->CreateInvite(command);
    if (!result.IsOk()) {
        SetError(result.GetStatus(), response);
        return ToGrpcStatus(result.GetStatus());
    }
    FillInvite(result.Value(), response->mutable_invite());
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::RevokeInvite(grpc::ServerContext* context
                                             , const proto::collab::RevokeInviteRequest* request
                                             , proto::collab::RevokeInviteResponse* response) {
    (void)context; // 未使用
    core::RevokeInviteCommand command;
    command.caller = ToCaller(request->caller());
    command.chat_id = request->chat_id();
    command.invite_id = request->invite_id();

    auto status = membership_->RevokeInvite(command);
    if (!status.IsOk()) {
        SetError(status, response);
        return ToGrpcStatus(status);
    }
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::ListInvites(grpc::ServerContext* context
                                            , const proto::collab::ListInvitesRequest* request
                                            , proto::collab::ListInvitesResponse* response) {
    (void)context; // 未使用
    auto result = membership_->ListInvites(ToCaller(request->caller()), request->chat_id());
    if (!result.IsOk()) {
        SetError(result.GetStatus(), response);
        return ToGrpcStatus(result.GetStatus());
    }
    for (const auto& invite : result.Value()) {
        FillInvite(invite, response->add_invites());
    }
    SetOk(response);
    return grpc::Status::OK;
}

grpc::Status CollabServiceImpl::ToGrpcStatus(const common::Status& status) {
    switch (status.Code()) {
        case StatusCode::kOk:
            return grpc::Status::OK;
        case StatusCode::kInvalidArgument:
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, status.Message());
        case StatusCode::kUnauthenticated:
            return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, status.Message());
        case StatusCode::kPermissionDenied:
            return grpc::Status(grpc::StatusCode::PERMISSION_DENIED, status.Message());
        case StatusCode::kNotFound:
            return grpc::Status(grpc::StatusCode::NOT_FOUND, status.Message());
        case StatusCode::kAlreadyExists:
            return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, status.Message());
        case StatusCode::kResourceExhausted:
            return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED, status.Message());
        case StatusCode::kFailedPrecondition:
            return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, status.Message());
        case StatusCode::kAborted:
            return grpc::Status(grpc::StatusCode::ABORTED, status.Message());
        case StatusCode::kUnavailable:
            return grpc::Status(grpc::StatusCode::UNAVAILABLE, status.Message());
        case StatusCode::kInternal:
            return grpc::Status(grpc::StatusCode::INTERNAL, status.Message());
    }
    return grpc::Status(grpc::StatusCode::UNKNOWN, status.Message());
}

} // namespace server
} // namespace collab
