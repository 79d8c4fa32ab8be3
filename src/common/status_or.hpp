#pragma once

#include "common/status.hpp"

#include <type_traits>
#include <utility>

namespace collab {
namespace common {

// 业务调用的返回值: 失败时只带 Status, 成功时带值
template <typename T>
class StatusOr {
public:
    StatusOr(const Status& status) : status_(RequireError(status)) {}
    StatusOr(Status&& status) : status_(RequireError(std::move(status))) {}

    template <class U = T, std::enable_if_t<std::is_constructible_v<T, U&&>, int> = 0>
    explicit StatusOr(U&& value)
        : status_(Status::OK()), value_(std::forward<U>(value)) {}

    bool IsOk() const { return status_.IsOk(); }
    const Status& GetStatus() const { return status_; }

    T& Value() & { return value_; }
    T&& Value() && { return std::move(value_); }
    const T& Value() const& { return value_; }
    const T&& Value() const&& = delete;

private:
    // 成功但没有值属于调用方写错, 统一降级为内部错误
    static Status RequireError(Status status) {
        if (status.IsOk()) {
            return Status::Internal("StatusOr built from OK status without value");
        }
        return status;
    }

    Status status_;
    T value_{};
};

}
}
