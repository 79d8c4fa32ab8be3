#pragma once

#include "common/status.hpp"
#include "common.pb.h"

namespace collab {
namespace core {

// 对外错误分类
enum class CollabErrorCode {
    kOk = 0,
    kValidation = 1,          // 参数缺失或格式错误
    kAuth = 2,                // 未认证或无权限
    kNotFound = 3,            // 会话/邀请/参与者不存在
    kConflict = 4,            // 已是成员、已满、邀请用尽、并发冲突
    kState = 5,               // 当前状态下不允许的操作
    kServiceUnavailable = 6,  // 存储不可用
};

inline const char* ErrorCodeToString(CollabErrorCode code) {
    switch (code) {
        case CollabErrorCode::kOk: return "ok";
        case CollabErrorCode::kValidation: return "validation_error";
        case CollabErrorCode::kAuth: return "auth_error";
        case CollabErrorCode::kNotFound: return "not_found";
        case CollabErrorCode::kConflict: return "conflict";
        case CollabErrorCode::kState: return "state_error";
        case CollabErrorCode::kServiceUnavailable: return "service_unavailable";
    }
    return "unknown";
}

// 状态码映射
inline CollabErrorCode MapStatus(const common::Status& status) {
    using common::StatusCode;
    switch (status.Code()) {
        case StatusCode::kOk:
            return CollabErrorCode::kOk;
        case StatusCode::kInvalidArgument:
            return CollabErrorCode::kValidation;
        case StatusCode::kUnauthenticated:
        case StatusCode::kPermissionDenied:
            return CollabErrorCode::kAuth;
        case StatusCode::kNotFound:
            return CollabErrorCode::kNotFound;
        case StatusCode::kAlreadyExists:
        case StatusCode::kResourceExhausted:
        case StatusCode::kAborted:
            return CollabErrorCode::kConflict;
        case StatusCode::kFailedPrecondition:
            return CollabErrorCode::kState;
        case StatusCode::kUnavailable:
        case StatusCode::kInternal:
            return CollabErrorCode::kServiceUnavailable;
    }
    return CollabErrorCode::kServiceUnavailable;
}

inline void ErrorToProto(CollabErrorCode code
                        , const common::Status& status
                        , proto::common::Error* error_proto) {
    if (error_proto == nullptr) {
        return;
    }
    error_proto->set_code(static_cast<int32_t>(code));
    error_proto->set_message(status.Message());
    error_proto->set_kind(ErrorCodeToString(code));
}

} // namespace core
} // namespace collab
