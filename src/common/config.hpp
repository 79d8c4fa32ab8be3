#pragma once

#include <string>
#include <string_view>

namespace collab {
namespace common {

// 服务器配置结构体
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 50061;
};

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
    int max_file_size_mb = 0;   // 0 表示不滚动
    int max_files = 3;
};

// Mysql配置结构体
struct MysqlConfig {
    std::string host = "127.0.0.1";
    int port = 3306;
    std::string user = "dev";
    std::string password = "";
    std::string database = "collab";
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int read_timeout_ms = 2000;
    int write_timeout_ms = 2000;
    bool enabled = false;
};

// 存储配置结构体
struct StorageConfig {
    MysqlConfig mysql;
    // auto: 启动时探测事务能力; atomic / optimistic: 强制指定
    std::string mode = "auto";
};

// Redis配置结构体, 用于实时通知的发布通道
struct RedisConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password = "";
    int db = 0;
    int pool_size = 2;
    int connection_timeout_ms = 200;
    int socket_timeout_ms = 200;
    bool enabled = false;
    std::string channel_prefix = "collab:chat";
};

// 实时通知配置结构体
struct RealtimeConfig {
    RedisConfig redis;
};

// 单个协作会话人数的绝对上限, 配置只能在此之下收紧
constexpr int kParticipantCeiling = 3;

// 协作会话业务参数
struct CollabConfig {
    int lock_lease_seconds = 120;           // 发言锁租约时长
    int default_max_participants = 3;       // 创建会话时默认人数上限
    int hard_max_participants = 3;          // 人数上限的硬上限
    long long invite_ttl_seconds = 604800;  // 邀请有效期, 0 表示永不过期
    int invite_code_length = 12;            // 邀请码长度
};

// 应用配置结构体
struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    StorageConfig storage;
    RealtimeConfig realtime;
    CollabConfig collab;
};

}
}
