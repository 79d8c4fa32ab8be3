#include "common/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <algorithm>
#include <cctype>
#include <array>
#include <string_view>
#include <vector>

namespace collab {
namespace common {

namespace {

std::shared_ptr<spdlog::logger> g_logger;

struct LevelAlias {
    std::string_view name;
    spdlog::level::level_enum level;
};

// 配置里常见的写法都接受, 大小写不敏感
constexpr std::array<LevelAlias, 9> kLevelAliases{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"err", spdlog::level::err},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

spdlog::level::level_enum ResolveLevel(const std::string& level,
                                       spdlog::level::level_enum fallback) noexcept {
    std::string lowered(level.size(), '\0');
    std::transform(level.begin(), level.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (const auto& alias : kLevelAliases) {
        if (alias.name == lowered) {
            return alias.level;
        }
    }
    // 日志器尚未建立, 只能直接写 stderr
    std::fprintf(stderr,
                 "collab_server logger: unknown level \"%s\", using %s\n",
                 level.c_str(),
                 spdlog::level::to_string_view(fallback).data());
    return fallback;
}

void EnsureParentDirectory(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw std::runtime_error("Failed to create log directory " + parent.string() + ": " + ec.message());
    }
}

} // namespace

void InitLogger(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    // 控制台与文件都关闭时仍保留一个空日志器, 宏调用不必判空
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.file.empty()) {
        std::filesystem::path log_path{config.file};
        EnsureParentDirectory(log_path);
        if (config.max_file_size_mb > 0) {
            // 按大小滚动, 保留 max_files 个历史文件
            auto max_bytes = static_cast<std::size_t>(config.max_file_size_mb) * 1024 * 1024;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path.string(), max_bytes, static_cast<std::size_t>(std::max(config.max_files, 1))));
        } else {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), true));
        }
    }
    g_logger = std::make_shared<spdlog::logger>("collab_server", sinks.begin(), sinks.end());
    g_logger->set_level(ResolveLevel(config.level, spdlog::level::info));
    g_logger->set_pattern(config.pattern);
    // 与 spdlog 默认日志器共享, 第三方调用 spdlog::info 时格式一致
    spdlog::set_default_logger(g_logger);
}

void ShutdownLogger() {
    if (g_logger) {
        g_logger->flush();
    }
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> GetLogger() {
    if (!g_logger) {
        g_logger = spdlog::default_logger();
    }
    return g_logger;
}

}
}