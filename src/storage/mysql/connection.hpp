#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/options.hpp"

#include <mysql/mysql.h>
#include <memory>
#include <string>

namespace collab {
namespace storage {

// 将 MySQL 错误码映射到 Status
// 1062 重复键 -> kAlreadyExists; 死锁/锁等待超时 -> kAborted; 连接类错误 -> kUnavailable
common::Status MapMySqlError(MYSQL* conn);

// 转义并加单引号
std::string EscapeAndQuote(MYSQL* conn, const std::string& value);

class Connection {
public:
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection();

    static common::StatusOr<std::unique_ptr<Connection>> Create(const Options& options);

    MYSQL* Raw() const noexcept {return handle_;}
    const Options& GetOptions() const noexcept {return options_;}
private:
    Connection(MYSQL* handle, Options options);

    MYSQL* handle_ = nullptr;
    Options options_;
};

}
}
