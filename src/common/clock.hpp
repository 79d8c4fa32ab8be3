#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

namespace collab {
namespace common {

// 时间源接口, 租约与邀请过期都按毫秒时间戳比较
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::int64_t NowMillis() const = 0;
};

class SystemClock : public Clock {
public:
    std::int64_t NowMillis() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

inline std::shared_ptr<Clock> DefaultClock() {
    static auto clock = std::make_shared<SystemClock>();
    return clock;
}

}
}
