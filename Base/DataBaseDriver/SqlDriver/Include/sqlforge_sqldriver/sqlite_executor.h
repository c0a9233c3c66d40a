// sqlforge_sqldriver/sqlite_executor.h
#pragma once

#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "sqlforge/error.h"
#include "sqlforge/query_executor.h"
#include "sqlforge/row.h"
#include "sqlforge/sqlite/sqlite_value.h"
#include "sqlforge/types.h"
#include "sqlforge_sqldriver/connection_parameters.h"
#include "sqlforge_sqldriver/connection_pool.h"

struct sqlite3;

namespace sqlforge_sqldriver {

    // 单个 sqlite3 句柄
    class SqliteConnection {
      public:
        static std::expected<std::unique_ptr<SqliteConnection>, sqlforge::Error> open(const ConnectionParameters& params);
        ~SqliteConnection();

        SqliteConnection(const SqliteConnection&) = delete;
        SqliteConnection& operator=(const SqliteConnection&) = delete;

        std::expected<std::vector<sqlforge::Row>, sqlforge::Error> query(const std::string& sql, const std::vector<sqlforge::sqlite::Value>& params);
        std::expected<sqlforge::ExecResult, sqlforge::Error> execute(const std::string& sql, const std::vector<sqlforge::sqlite::Value>& params);
        std::expected<void, sqlforge::Error> executeSimple(const std::string& sql);

        sqlite3* nativeHandle() const {
            return m_db;
        }

      private:
        explicit SqliteConnection(sqlite3* db) : m_db(db) {
        }

        sqlforge::Error lastError(sqlforge::ErrorCode code, const std::string& context) const;

        sqlite3* m_db;
    };

    using SqlitePool = ConnectionPool<SqliteConnection>;

    class SqliteTransaction : public sqlforge::ITransaction<sqlforge::sqlite::Value> {
      public:
        explicit SqliteTransaction(PooledConnection<SqliteConnection> connection);
        ~SqliteTransaction() override;

        std::expected<std::vector<sqlforge::Row>, sqlforge::Error> fetchRows(const std::string& sql, const std::vector<sqlforge::sqlite::Value>& params) override;
        std::expected<sqlforge::ExecResult, sqlforge::Error> executeStatement(const std::string& sql, const std::vector<sqlforge::sqlite::Value>& params) override;
        std::expected<void, sqlforge::Error> commit() override;
        std::expected<void, sqlforge::Error> rollback() override;
        bool isActive() const override {
            return m_active;
        }

      private:
        std::expected<void, sqlforge::Error> finish(const char* statement);

        PooledConnection<SqliteConnection> m_connection;
        bool m_active = true;
    };

    // 基于 libsqlite3 的执行器; :memory: 数据库每个连接各自独立, 连接池上限应设为 1
    class SqliteExecutor : public sqlforge::IQueryExecutor<sqlforge::sqlite::Value> {
      public:
        static std::expected<std::shared_ptr<SqliteExecutor>, sqlforge::Error> open(const ConnectionParameters& params);

        explicit SqliteExecutor(std::shared_ptr<SqlitePool> pool) : m_pool(std::move(pool)) {
        }

        std::expected<std::vector<sqlforge::Row>, sqlforge::Error> fetchRows(const std::string& sql, const std::vector<sqlforge::sqlite::Value>& params) override;
        std::expected<sqlforge::ExecResult, sqlforge::Error> executeStatement(const std::string& sql, const std::vector<sqlforge::sqlite::Value>& params) override;
        std::expected<std::unique_ptr<sqlforge::ITransaction<sqlforge::sqlite::Value>>, sqlforge::Error> beginTransaction() override;

        const std::shared_ptr<SqlitePool>& pool() const {
            return m_pool;
        }
        void close();

      private:
        std::expected<PooledConnection<SqliteConnection>, sqlforge::Error> acquire();

        std::shared_ptr<SqlitePool> m_pool;
    };

}  // namespace sqlforge_sqldriver
