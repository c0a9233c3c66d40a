// sqlforge_sqldriver/mysql_executor.h
#pragma once

#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "sqlforge/error.h"
#include "sqlforge/mysql/mysql_value.h"
#include "sqlforge/query_executor.h"
#include "sqlforge/row.h"
#include "sqlforge/types.h"
#include "sqlforge_mysql_transport/mysql_session.h"
#include "sqlforge_sqldriver/connection_parameters.h"
#include "sqlforge_sqldriver/connection_pool.h"

namespace sqlforge_sqldriver {

    using MySqlConnection = sqlforge_mysql_transport::MySqlSession;
    using MySqlPool = ConnectionPool<MySqlConnection>;

    // 未填写的主机, 端口与字符集取 localhost, 3306, utf8mb4
    sqlforge_mysql_transport::MySqlEndpoint toMySqlEndpoint(const ConnectionParameters& params);

    class MySqlTransaction : public sqlforge::ITransaction<sqlforge::mysql::Value> {
      public:
        explicit MySqlTransaction(PooledConnection<MySqlConnection> connection);
        ~MySqlTransaction() override;

        std::expected<std::vector<sqlforge::Row>, sqlforge::Error> fetchRows(const std::string& sql, const std::vector<sqlforge::mysql::Value>& params) override;
        std::expected<sqlforge::ExecResult, sqlforge::Error> executeStatement(const std::string& sql, const std::vector<sqlforge::mysql::Value>& params) override;
        std::expected<void, sqlforge::Error> commit() override;
        std::expected<void, sqlforge::Error> rollback() override;
        bool isActive() const override {
            return m_active;
        }

      private:
        PooledConnection<MySqlConnection> m_connection;
        bool m_active = true;
    };

    // 基于 libmysqlclient 预处理语句的执行器
    class MySqlExecutor : public sqlforge::IQueryExecutor<sqlforge::mysql::Value> {
      public:
        static std::expected<std::shared_ptr<MySqlExecutor>, sqlforge::Error> open(const ConnectionParameters& params);

        explicit MySqlExecutor(std::shared_ptr<MySqlPool> pool) : m_pool(std::move(pool)) {
        }

        std::expected<std::vector<sqlforge::Row>, sqlforge::Error> fetchRows(const std::string& sql, const std::vector<sqlforge::mysql::Value>& params) override;
        std::expected<sqlforge::ExecResult, sqlforge::Error> executeStatement(const std::string& sql, const std::vector<sqlforge::mysql::Value>& params) override;
        std::expected<std::unique_ptr<sqlforge::ITransaction<sqlforge::mysql::Value>>, sqlforge::Error> beginTransaction() override;

        const std::shared_ptr<MySqlPool>& pool() const {
            return m_pool;
        }
        void close();

      private:
        std::expected<PooledConnection<MySqlConnection>, sqlforge::Error> acquire();

        std::shared_ptr<MySqlPool> m_pool;
    };

}  // namespace sqlforge_sqldriver
