// Source/mysql_executor.cpp
#include "sqlforge_sqldriver/mysql_executor.h"

#include "sqlforge_sqldriver/driver_logger.h"

namespace sqlforge_sqldriver {

    namespace {

        void logFailure(const sqlforge::Error& error) {
            if (auto logger = get_or_create_logger()) {
                logger->error("MySQL: {}", error.toString());
            }
        }

        // 连接已断开的失败不再把连接还给池
        template <typename T>
        void dropIfDisconnected(const std::expected<T, sqlforge::Error>& result, PooledConnection<MySqlConnection>& connection) {
            if (!result && result.error().code == sqlforge::ErrorCode::ConnectionFailed) connection.invalidate();
        }

    }  // namespace

    sqlforge_mysql_transport::MySqlEndpoint toMySqlEndpoint(const ConnectionParameters& params) {
        sqlforge_mysql_transport::MySqlEndpoint endpoint;
        if (!params.host.empty()) endpoint.host = params.host;
        if (params.port) endpoint.port = static_cast<unsigned int>(*params.port);
        endpoint.user = params.user.value_or("");
        endpoint.password = params.password.value_or("");
        endpoint.database = params.database;
        if (params.charset) endpoint.charset = *params.charset;
        if (params.timeouts.connect_seconds) endpoint.connect_timeout_seconds = static_cast<unsigned int>(*params.timeouts.connect_seconds);
        if (params.timeouts.read_seconds) endpoint.read_timeout_seconds = static_cast<unsigned int>(*params.timeouts.read_seconds);
        if (params.timeouts.write_seconds) endpoint.write_timeout_seconds = static_cast<unsigned int>(*params.timeouts.write_seconds);
        return endpoint;
    }

    // --- MySqlTransaction ---
    MySqlTransaction::MySqlTransaction(PooledConnection<MySqlConnection> connection) : m_connection(std::move(connection)) {
    }

    MySqlTransaction::~MySqlTransaction() {
        if (m_active) {
            auto rolled_back = rollback();
            if (!rolled_back) logFailure(rolled_back.error());
        }
    }

    std::expected<std::vector<sqlforge::Row>, sqlforge::Error> MySqlTransaction::fetchRows(const std::string& sql, const std::vector<sqlforge::mysql::Value>& params) {
        if (!m_active) return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::TransactionError, "Transaction is no longer active"));
        if (auto logger = get_or_create_logger()) logger->debug("MySQL tx fetch: {} [{} params]", sql, params.size());
        auto rows = m_connection->query(sql, params);
        if (!rows) logFailure(rows.error());
        dropIfDisconnected(rows, m_connection);
        return rows;
    }

    std::expected<sqlforge::ExecResult, sqlforge::Error> MySqlTransaction::executeStatement(const std::string& sql, const std::vector<sqlforge::mysql::Value>& params) {
        if (!m_active) return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::TransactionError, "Transaction is no longer active"));
        if (auto logger = get_or_create_logger()) logger->debug("MySQL tx execute: {} [{} params]", sql, params.size());
        auto result = m_connection->execute(sql, params);
        if (!result) logFailure(result.error());
        dropIfDisconnected(result, m_connection);
        return result;
    }

    std::expected<void, sqlforge::Error> MySqlTransaction::commit() {
        if (!m_active) return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::TransactionError, "Transaction is no longer active"));
        m_active = false;
        auto committed = m_connection->commit();
        if (!committed) m_connection.invalidate();
        return committed;
    }

    std::expected<void, sqlforge::Error> MySqlTransaction::rollback() {
        if (!m_active) return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::TransactionError, "Transaction is no longer active"));
        m_active = false;
        auto rolled_back = m_connection->rollback();
        if (!rolled_back) m_connection.invalidate();
        return rolled_back;
    }

    // --- MySqlExecutor ---
    std::expected<std::shared_ptr<MySqlExecutor>, sqlforge::Error> MySqlExecutor::open(const ConnectionParameters& params) {
        auto endpoint = toMySqlEndpoint(params);
        auto pool = MySqlPool::create(
            [endpoint]() {
                return MySqlConnection::connect(endpoint);
            },
            params.pool);
        auto first = pool->acquire();
        if (!first) {
            logFailure(first.error());
            return std::unexpected(first.error());
        }
        if (auto logger = get_or_create_logger()) logger->info("MySQL pool ready for {}:{}/{}", endpoint.host, endpoint.port, endpoint.database);
        return std::make_shared<MySqlExecutor>(std::move(pool));
    }

    std::expected<PooledConnection<MySqlConnection>, sqlforge::Error> MySqlExecutor::acquire() {
        if (!m_pool) return std::unexpected(sqlforge::errors::dbPoolNotInitialized());
        auto connection = m_pool->acquire();
        if (!connection) {
            logFailure(connection.error());
            return connection;
        }
        // 断开的连接丢弃后重新获取一次
        if (auto alive = (*connection)->ping(); !alive) {
            if (auto logger = get_or_create_logger()) logger->warn("MySQL: dropping stale connection: {}", alive.error().toString());
            connection->invalidate();
            *connection = PooledConnection<MySqlConnection>();
            connection = m_pool->acquire();
            if (!connection) logFailure(connection.error());
        }
        return connection;
    }

    std::expected<std::vector<sqlforge::Row>, sqlforge::Error> MySqlExecutor::fetchRows(const std::string& sql, const std::vector<sqlforge::mysql::Value>& params) {
        auto connection = acquire();
        if (!connection) return std::unexpected(connection.error());
        if (auto logger = get_or_create_logger()) logger->debug("MySQL fetch: {} [{} params]", sql, params.size());
        auto rows = (*connection)->query(sql, params);
        if (!rows) logFailure(rows.error());
        dropIfDisconnected(rows, *connection);
        return rows;
    }

    std::expected<sqlforge::ExecResult, sqlforge::Error> MySqlExecutor::executeStatement(const std::string& sql, const std::vector<sqlforge::mysql::Value>& params) {
        auto connection = acquire();
        if (!connection) return std::unexpected(connection.error());
        if (auto logger = get_or_create_logger()) logger->debug("MySQL execute: {} [{} params]", sql, params.size());
        auto result = (*connection)->execute(sql, params);
        if (!result) logFailure(result.error());
        dropIfDisconnected(result, *connection);
        return result;
    }

    std::expected<std::unique_ptr<sqlforge::ITransaction<sqlforge::mysql::Value>>, sqlforge::Error> MySqlExecutor::beginTransaction() {
        auto connection = acquire();
        if (!connection) return std::unexpected(connection.error());
        auto begun = (*connection)->begin();
        if (!begun) {
            logFailure(begun.error());
            connection->invalidate();
            return std::unexpected(begun.error());
        }
        return std::make_unique<MySqlTransaction>(std::move(*connection));
    }

    void MySqlExecutor::close() {
        if (m_pool) m_pool->close();
    }

}  // namespace sqlforge_sqldriver
