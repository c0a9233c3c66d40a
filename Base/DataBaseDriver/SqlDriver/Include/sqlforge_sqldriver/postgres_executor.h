// sqlforge_sqldriver/postgres_executor.h
#pragma once

#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "sqlforge/error.h"
#include "sqlforge/postgres/postgres_value.h"
#include "sqlforge/query_executor.h"
#include "sqlforge/row.h"
#include "sqlforge/types.h"
#include "sqlforge_sqldriver/connection_parameters.h"
#include "sqlforge_sqldriver/connection_pool.h"

typedef struct pg_conn PGconn;

namespace sqlforge_sqldriver {

    // 单个 libpq 连接; 语句中的 ? 在发送前改写为 $N
    class PostgresConnection {
      public:
        static std::expected<std::unique_ptr<PostgresConnection>, sqlforge::Error> open(const ConnectionParameters& params);
        static std::string buildConnInfo(const ConnectionParameters& params);
        ~PostgresConnection();

        PostgresConnection(const PostgresConnection&) = delete;
        PostgresConnection& operator=(const PostgresConnection&) = delete;

        std::expected<std::vector<sqlforge::Row>, sqlforge::Error> query(const std::string& sql, const std::vector<sqlforge::postgres::Value>& params);
        std::expected<sqlforge::ExecResult, sqlforge::Error> execute(const std::string& sql, const std::vector<sqlforge::postgres::Value>& params);
        std::expected<void, sqlforge::Error> executeSimple(const std::string& sql);

        bool isHealthy() const;
        PGconn* nativeHandle() const {
            return m_conn;
        }

      private:
        explicit PostgresConnection(PGconn* conn) : m_conn(conn) {
        }

        PGconn* m_conn;
    };

    using PostgresPool = ConnectionPool<PostgresConnection>;

    class PostgresTransaction : public sqlforge::ITransaction<sqlforge::postgres::Value> {
      public:
        explicit PostgresTransaction(PooledConnection<PostgresConnection> connection);
        ~PostgresTransaction() override;

        std::expected<std::vector<sqlforge::Row>, sqlforge::Error> fetchRows(const std::string& sql, const std::vector<sqlforge::postgres::Value>& params) override;
        std::expected<sqlforge::ExecResult, sqlforge::Error> executeStatement(const std::string& sql, const std::vector<sqlforge::postgres::Value>& params) override;
        std::expected<void, sqlforge::Error> commit() override;
        std::expected<void, sqlforge::Error> rollback() override;
        bool isActive() const override {
            return m_active;
        }

      private:
        std::expected<void, sqlforge::Error> finish(const char* statement);

        PooledConnection<PostgresConnection> m_connection;
        bool m_active = true;
    };

    // 基于 libpq 的执行器, 参数以文本格式发送并附带类型 OID
    class PostgresExecutor : public sqlforge::IQueryExecutor<sqlforge::postgres::Value> {
      public:
        static std::expected<std::shared_ptr<PostgresExecutor>, sqlforge::Error> open(const ConnectionParameters& params);

        explicit PostgresExecutor(std::shared_ptr<PostgresPool> pool) : m_pool(std::move(pool)) {
        }

        std::expected<std::vector<sqlforge::Row>, sqlforge::Error> fetchRows(const std::string& sql, const std::vector<sqlforge::postgres::Value>& params) override;
        std::expected<sqlforge::ExecResult, sqlforge::Error> executeStatement(const std::string& sql, const std::vector<sqlforge::postgres::Value>& params) override;
        std::expected<std::unique_ptr<sqlforge::ITransaction<sqlforge::postgres::Value>>, sqlforge::Error> beginTransaction() override;

        const std::shared_ptr<PostgresPool>& pool() const {
            return m_pool;
        }
        void close();

      private:
        std::expected<PooledConnection<PostgresConnection>, sqlforge::Error> acquire();

        std::shared_ptr<PostgresPool> m_pool;
    };

}  // namespace sqlforge_sqldriver
