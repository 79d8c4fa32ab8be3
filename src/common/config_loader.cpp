#include "common/config_loader.hpp"

#include "config_path.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace collab {
namespace common {

namespace {
AppConfig g_config;
bool g_config_initialized = false; // 全局配置初始化标志

// 检测配置文件路径
std::string DetectConfigPath() {
    if (const char* env = std::getenv("COLLAB_SERVER_CONFIG")) {
        return env;
    }
    return GetConfigPath("app.example.json");
}

void LoadMysql(const nlohmann::json& mysql, MysqlConfig& cfg) {
    cfg.host = mysql.value("host", cfg.host);
    cfg.port = mysql.value("port", cfg.port);
    cfg.user = mysql.value("user", cfg.user);
    cfg.password = mysql.value("password", cfg.password);
    cfg.database = mysql.value("database", cfg.database);
    cfg.pool_size = mysql.value("pool_size", cfg.pool_size);
    cfg.connection_timeout_ms = mysql.value("connection_timeout_ms", cfg.connection_timeout_ms);
    cfg.read_timeout_ms = mysql.value("read_timeout_ms", cfg.read_timeout_ms);
    cfg.write_timeout_ms = mysql.value("write_timeout_ms", cfg.write_timeout_ms);
    cfg.enabled = mysql.value("enabled", cfg.enabled);
}

void LoadRedis(const nlohmann::json& redis, RedisConfig& cfg) {
    cfg.host = redis.value("host", cfg.host);
    cfg.port = redis.value("port", cfg.port);
    cfg.password = redis.value("password", cfg.password);
    cfg.db = redis.value("db", cfg.db);
    cfg.pool_size = redis.value("pool_size", cfg.pool_size);
    cfg.connection_timeout_ms = redis.value("connection_timeout_ms", cfg.connection_timeout_ms);
    cfg.socket_timeout_ms = redis.value("socket_timeout_ms", cfg.socket_timeout_ms);
    cfg.enabled = redis.value("enabled", cfg.enabled);
    cfg.channel_prefix = redis.value("channel_prefix", cfg.channel_prefix);
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    return FromJson(json);
}

AppConfig ConfigLoader::LoadFromEnvOrDefault() {
    return Load(DetectConfigPath());
}

const AppConfig& GlobalConfig() {
    if (!g_config_initialized) {
        g_config = ConfigLoader::LoadFromEnvOrDefault();
        g_config_initialized = true;
    }
    return g_config;
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    return nlohmann::json::parse(ifs, nullptr, true, true);
}

// 从JSON对象构建配置结构体
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    // Server配置
    if (j.contains("server")) {
        const auto& server = j["server"];
        cfg.server.host = server.value("host", cfg.server.host);
        cfg.server.port = server.value("port", cfg.server.port);
    }
    // Logging配置
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
        cfg.logging.max_file_size_mb = logging.value("max_file_size_mb", cfg.logging.max_file_size_mb);
        cfg.logging.max_files = logging.value("max_files", cfg.logging.max_files);
    }
    // Storage配置
    if (j.contains("storage")) {
        const auto& storage = j["storage"];
        cfg.storage.mode = storage.value("mode", cfg.storage.mode);
        if (storage.contains("mysql")) {
            LoadMysql(storage["mysql"], cfg.storage.mysql);
        }
    }
    // Realtime配置
    if (j.contains("realtime")) {
        const auto& realtime = j["realtime"];
        if (realtime.contains("redis")) {
            LoadRedis(realtime["redis"], cfg.realtime.redis);
        }
    }
    // 协作会话参数
    if (j.contains("collab")) {
        const auto& collab = j["collab"];
        cfg.collab.lock_lease_seconds = collab.value("lock_lease_seconds", cfg.collab.lock_lease_seconds);
        cfg.collab.default_max_participants =
            collab.value("default_max_participants", cfg.collab.default_max_participants);
        cfg.collab.hard_max_participants = collab.value("hard_max_participants", cfg.collab.hard_max_participants);
        cfg.collab.invite_ttl_seconds = collab.value("invite_ttl_seconds", cfg.collab.invite_ttl_seconds);
        cfg.collab.invite_code_length = collab.value("invite_code_length", cfg.collab.invite_code_length);
    }
    if (cfg.collab.lock_lease_seconds <= 0) {
        throw std::runtime_error("collab.lock_lease_seconds must be positive");
    }
    if (cfg.collab.hard_max_participants < 2 || cfg.collab.hard_max_participants > kParticipantCeiling) {
        throw std::runtime_error("collab.hard_max_participants must be within [2, "
                                 + std::to_string(kParticipantCeiling) + "]");
    }
    if (cfg.collab.default_max_participants < 2
        || cfg.collab.default_max_participants > cfg.collab.hard_max_participants) {
        throw std::runtime_error("collab.default_max_participants must be within [2, hard_max_participants]");
    }
    if (cfg.collab.invite_ttl_seconds < 0) {
        throw std::runtime_error("collab.invite_ttl_seconds must not be negative");
    }
    if (cfg.collab.invite_code_length < 8 || cfg.collab.invite_code_length > 64) {
        throw std::runtime_error("collab.invite_code_length must be within [8, 64]");
    }
    return cfg;
}

}
}
