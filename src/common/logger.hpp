#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>

namespace collab {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();

// 日志宏定义
#define COLLAB_LOG_DEBUG(...) ::collab::common::GetLogger()->debug(__VA_ARGS__)
#define COLLAB_LOG_INFO(...)  ::collab::common::GetLogger()->info(__VA_ARGS__)
#define COLLAB_LOG_WARN(...)  ::collab::common::GetLogger()->warn(__VA_ARGS__)
#define COLLAB_LOG_ERROR(...) ::collab::common::GetLogger()->error(__VA_ARGS__)

}
}
