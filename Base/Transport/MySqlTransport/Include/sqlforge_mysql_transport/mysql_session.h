#pragma once

#include <mysql/mysql.h>

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sqlforge/error.h"
#include "sqlforge/mysql/mysql_value.h"
#include "sqlforge/row.h"
#include "sqlforge/types.h"

namespace sqlforge_mysql_transport {

    struct MySqlEndpoint {
        std::string host = "localhost";
        unsigned int port = 3306;
        std::string user;
        std::string password;
        std::string database;
        std::string charset = "utf8mb4";
        std::optional<unsigned int> connect_timeout_seconds;
        std::optional<unsigned int> read_timeout_seconds;
        std::optional<unsigned int> write_timeout_seconds;
    };

    // 一条已认证的 MySQL 连接. 语句都走服务端预处理, 结果列按文本取回
    class MySqlSession {
      public:
        static std::expected<std::unique_ptr<MySqlSession>, sqlforge::Error> connect(const MySqlEndpoint& endpoint);

        ~MySqlSession();
        MySqlSession(const MySqlSession&) = delete;
        MySqlSession& operator=(const MySqlSession&) = delete;

        std::expected<void, sqlforge::Error> ping();

        std::expected<void, sqlforge::Error> begin();
        std::expected<void, sqlforge::Error> commit();
        std::expected<void, sqlforge::Error> rollback();

        std::expected<std::vector<sqlforge::Row>, sqlforge::Error> query(const std::string& sql, const std::vector<sqlforge::mysql::Value>& params);
        std::expected<sqlforge::ExecResult, sqlforge::Error> execute(const std::string& sql, const std::vector<sqlforge::mysql::Value>& params);

      private:
        explicit MySqlSession(MYSQL* handle) : m_handle(handle) {
        }

        sqlforge::Error lastError(const std::string& context, sqlforge::ErrorCode fallback) const;

        MYSQL* m_handle;
    };

}  // namespace sqlforge_mysql_transport
