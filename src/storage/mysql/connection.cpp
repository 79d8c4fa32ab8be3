#include "storage/mysql/connection.hpp"

#include <fmt/format.h>

namespace collab {
namespace storage {

namespace {

// 客户端侧的连接类错误
bool IsConnectionError(unsigned int err) {
    switch (err) {
        case 2002: // CR_CONNECTION_ERROR
        case 2003: // CR_CONN_HOST_ERROR
        case 2006: // CR_SERVER_GONE_ERROR
        case 2013: // CR_SERVER_LOST
            return true;
        default:
            return false;
    }
}

// 超时秒数, 不足一秒按一秒
unsigned int ToSeconds(std::chrono::milliseconds timeout) {
    auto seconds = static_cast<unsigned int>((timeout.count() + 999) / 1000);
    return seconds == 0 ? 1 : seconds;
}

} // namespace

common::Status MapMySqlError(MYSQL* conn) {
    if (conn == nullptr) {
        return common::Status::Unavailable("MySQL connection is not available.");
    }
    unsigned int err = mysql_errno(conn);
    if (err == 1062) { // Duplicate entry
        return common::Status::AlreadyExists("Duplicate entry.");
    }
    if (err == 1213 || err == 1205) { // 死锁 / 锁等待超时
        return common::Status::Aborted(mysql_error(conn));
    }
    if (IsConnectionError(err)) {
        return common::Status::Unavailable(mysql_error(conn));
    }
    return common::Status::Internal(fmt::format("MySQL error {}: {}", err, mysql_error(conn)));
}

std::string EscapeAndQuote(MYSQL* conn, const std::string& value) {
    std::string buf;
    buf.resize(value.size() * 2 + 1);
    unsigned long escaped_len = mysql_real_escape_string(conn, buf.data(), value.data(), value.size());
    buf.resize(escaped_len);
    return fmt::format("'{}'", buf);
}

Connection::Connection(MYSQL* handle, Options options): handle_(handle), options_(std::move(options)) {}

Connection::~Connection() {
    if (handle_ != nullptr) {
        mysql_close(handle_);
        handle_ = nullptr;
    }
}

common::StatusOr<std::unique_ptr<Connection>> Connection::Create(const Options& options) {
    MYSQL* handle = mysql_init(nullptr);
    if (handle == nullptr) {
        return common::Status::Internal("mysql_init failed");
    }

    unsigned int connect_timeout = ToSeconds(options.connect_timeout);
    unsigned int read_timeout = ToSeconds(options.read_timeout);
    unsigned int write_timeout = ToSeconds(options.write_timeout);
    mysql_options(handle, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout);
    mysql_options(handle, MYSQL_OPT_READ_TIMEOUT, &read_timeout);
    mysql_options(handle, MYSQL_OPT_WRITE_TIMEOUT, &write_timeout);

    // 不开启 CLIENT_MULTI_STATEMENTS, 每次只执行一条语句
    if (!mysql_real_connect(handle,
                           options.host.c_str(),
                           options.user.c_str(),
                           options.password.c_str(),
                           options.database.c_str(),
                           options.port,
                           nullptr,
                           0)) {
        auto status = common::Status::Unavailable(
            fmt::format("mysql_real_connect to {}:{} failed: {}", options.host, options.port, mysql_error(handle)));
        mysql_close(handle);
        return status;
    }

    if (!options.charset.empty() && mysql_set_character_set(handle, options.charset.c_str()) != 0) {
        auto status = common::Status::Internal(
            fmt::format("set charset {} failed: {}", options.charset, mysql_error(handle)));
        mysql_close(handle);
        return status;
    }

    return common::StatusOr<std::unique_ptr<Connection>>(std::unique_ptr<Connection>(new Connection(handle, options)));
}

} // namespace storage
} // namespace collab
