// Source/sqlite_executor.cpp
#include "sqlforge_sqldriver/sqlite_executor.h"

#include <sqlite3.h>

#include <type_traits>
#include <variant>

#include "sqlforge_sqldriver/driver_logger.h"

namespace sqlforge_sqldriver {

    namespace {

        // sqlite3_stmt 的 RAII 包装
        struct StatementGuard {
            sqlite3_stmt* stmt = nullptr;
            ~StatementGuard() {
                if (stmt) sqlite3_finalize(stmt);
            }
        };

        void logFailure(const sqlforge::Error& error) {
            if (auto logger = get_or_create_logger()) {
                logger->error("SQLite: {}", error.toString());
            }
        }

        QVariant columnValue(sqlite3_stmt* stmt, int index) {
            switch (sqlite3_column_type(stmt, index)) {
                case SQLITE_INTEGER:
                    return QVariant::fromValue(static_cast<qlonglong>(sqlite3_column_int64(stmt, index)));
                case SQLITE_FLOAT:
                    return QVariant(sqlite3_column_double(stmt, index));
                case SQLITE_TEXT: {
                    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
                    return QVariant(QString::fromUtf8(text, sqlite3_column_bytes(stmt, index)));
                }
                case SQLITE_BLOB: {
                    const auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt, index));
                    return QVariant(QByteArray(blob, sqlite3_column_bytes(stmt, index)));
                }
                default:
                    return QVariant();
            }
        }

    }  // namespace

    // --- SqliteConnection ---
    std::expected<std::unique_ptr<SqliteConnection>, sqlforge::Error> SqliteConnection::open(const ConnectionParameters& params) {
        const std::string& path = params.database;
        if (path.empty()) {
            return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::InvalidConfiguration, "SQLite database path not set"));
        }

        sqlite3* db = nullptr;
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI | SQLITE_OPEN_NOMUTEX;
        int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
        if (rc != SQLITE_OK) {
            std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
            if (db) sqlite3_close(db);
            return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::ConnectionFailed, "Failed to open SQLite database " + path + ": " + message, rc));
        }

        int timeout_seconds = params.timeouts.connect_seconds.value_or(5);
        sqlite3_busy_timeout(db, timeout_seconds * 1000);

        std::unique_ptr<SqliteConnection> connection(new SqliteConnection(db));
        auto fk = connection->executeSimple("PRAGMA foreign_keys = ON");
        if (!fk) return std::unexpected(fk.error());
        return connection;
    }

    SqliteConnection::~SqliteConnection() {
        if (m_db) {
            sqlite3_close_v2(m_db);
            m_db = nullptr;
        }
    }

    sqlforge::Error SqliteConnection::lastError(sqlforge::ErrorCode code, const std::string& context) const {
        return sqlforge::Error(code, context + ": " + sqlite3_errmsg(m_db), sqlite3_extended_errcode(m_db));
    }

    std::expected<void, sqlforge::Error> SqliteConnection::executeSimple(const std::string& sql) {
        char* error_message = nullptr;
        if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &error_message) != SQLITE_OK) {
            std::string message = error_message ? error_message : "unknown error";
            sqlite3_free(error_message);
            return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::QueryExecutionError, sql + ": " + message, sqlite3_extended_errcode(m_db)));
        }
        return {};
    }

    std::expected<std::vector<sqlforge::Row>, sqlforge::Error> SqliteConnection::query(const std::string& sql, const std::vector<sqlforge::sqlite::Value>& params) {
        StatementGuard guard;
        if (sqlite3_prepare_v2(m_db, sql.c_str(), static_cast<int>(sql.size()), &guard.stmt, nullptr) != SQLITE_OK) {
            return std::unexpected(lastError(sqlforge::ErrorCode::StatementPreparationError, "Failed to prepare '" + sql + "'"));
        }

        int expected_params = sqlite3_bind_parameter_count(guard.stmt);
        if (expected_params != static_cast<int>(params.size())) {
            return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::StatementPreparationError,
                                                   "Parameter count mismatch for '" + sql + "': expected " + std::to_string(expected_params) + ", got " + std::to_string(params.size())));
        }

        for (size_t i = 0; i < params.size(); ++i) {
            int index = static_cast<int>(i) + 1;
            int rc = std::visit(
                [&](const auto& encoded) -> int {
                    using T = std::decay_t<decltype(encoded)>;
                    if constexpr (std::is_same_v<T, std::monostate>) {
                        return sqlite3_bind_null(guard.stmt, index);
                    } else if constexpr (std::is_same_v<T, qint64>) {
                        return sqlite3_bind_int64(guard.stmt, index, encoded);
                    } else if constexpr (std::is_same_v<T, double>) {
                        return sqlite3_bind_double(guard.stmt, index, encoded);
                    } else if constexpr (std::is_same_v<T, std::string>) {
                        return sqlite3_bind_text(guard.stmt, index, encoded.data(), static_cast<int>(encoded.size()), SQLITE_TRANSIENT);
                    } else {
                        return sqlite3_bind_blob(guard.stmt, index, encoded.constData(), static_cast<int>(encoded.size()), SQLITE_TRANSIENT);
                    }
                },
                params[i].encode());
            if (rc != SQLITE_OK) {
                return std::unexpected(lastError(sqlforge::ErrorCode::StatementPreparationError, "Failed to bind parameter " + std::to_string(index)));
            }
        }

        std::vector<std::string> columns;
        int column_count = sqlite3_column_count(guard.stmt);
        columns.reserve(column_count);
        for (int i = 0; i < column_count; ++i) {
            const char* name = sqlite3_column_name(guard.stmt, i);
            columns.emplace_back(name ? name : "");
        }

        std::vector<sqlforge::Row> rows;
        while (true) {
            int rc = sqlite3_step(guard.stmt);
            if (rc == SQLITE_DONE) break;
            if (rc != SQLITE_ROW) {
                return std::unexpected(lastError(sqlforge::ErrorCode::QueryExecutionError, "Failed to execute '" + sql + "'"));
            }
            std::vector<QVariant> values;
            values.reserve(column_count);
            for (int i = 0; i < column_count; ++i) {
                values.push_back(columnValue(guard.stmt, i));
            }
            rows.emplace_back(columns, std::move(values));
        }
        return rows;
    }

    std::expected<sqlforge::ExecResult, sqlforge::Error> SqliteConnection::execute(const std::string& sql, const std::vector<sqlforge::sqlite::Value>& params) {
        // RETURNING 产生的行在 query 中被读完, 语句随之执行结束
        auto rows = query(sql, params);
        if (!rows) return std::unexpected(rows.error());
        sqlforge::ExecResult result;
        result.rows_affected = static_cast<std::uint64_t>(sqlite3_changes64(m_db));
        result.last_insert_id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(m_db));
        return result;
    }

    // --- SqliteTransaction ---
    SqliteTransaction::SqliteTransaction(PooledConnection<SqliteConnection> connection) : m_connection(std::move(connection)) {
    }

    SqliteTransaction::~SqliteTransaction() {
        if (m_active) {
            auto rolled_back = rollback();
            if (!rolled_back) logFailure(rolled_back.error());
        }
    }

    std::expected<std::vector<sqlforge::Row>, sqlforge::Error> SqliteTransaction::fetchRows(const std::string& sql, const std::vector<sqlforge::sqlite::Value>& params) {
        if (!m_active) return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::TransactionError, "Transaction is no longer active"));
        if (auto logger = get_or_create_logger()) logger->debug("SQLite tx fetch: {} [{} params]", sql, params.size());
        auto rows = m_connection->query(sql, params);
        if (!rows) logFailure(rows.error());
        return rows;
    }

    std::expected<sqlforge::ExecResult, sqlforge::Error> SqliteTransaction::executeStatement(const std::string& sql, const std::vector<sqlforge::sqlite::Value>& params) {
        if (!m_active) return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::TransactionError, "Transaction is no longer active"));
        if (auto logger = get_or_create_logger()) logger->debug("SQLite tx execute: {} [{} params]", sql, params.size());
        auto result = m_connection->execute(sql, params);
        if (!result) logFailure(result.error());
        return result;
    }

    std::expected<void, sqlforge::Error> SqliteTransaction::finish(const char* statement) {
        if (!m_active) return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::TransactionError, "Transaction is no longer active"));
        m_active = false;
        auto done = m_connection->executeSimple(statement);
        if (!done) {
            // 连接状态未知, 不再归还
            m_connection.invalidate();
            return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::TransactionError, done.error().message, done.error().native_db_error_code));
        }
        return {};
    }

    std::expected<void, sqlforge::Error> SqliteTransaction::commit() {
        return finish("COMMIT");
    }

    std::expected<void, sqlforge::Error> SqliteTransaction::rollback() {
        return finish("ROLLBACK");
    }

    // --- SqliteExecutor ---
    std::expected<std::shared_ptr<SqliteExecutor>, sqlforge::Error> SqliteExecutor::open(const ConnectionParameters& params) {
        if (params.database.empty()) {
            return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::InvalidConfiguration, "SQLite database path not set"));
        }
        auto pool = SqlitePool::create(
            [params]() {
                return SqliteConnection::open(params);
            },
            params.pool);
        // 先建立一个连接, 尽早暴露配置错误
        auto first = pool->acquire();
        if (!first) return std::unexpected(first.error());
        return std::make_shared<SqliteExecutor>(std::move(pool));
    }

    std::expected<PooledConnection<SqliteConnection>, sqlforge::Error> SqliteExecutor::acquire() {
        if (!m_pool) return std::unexpected(sqlforge::errors::dbPoolNotInitialized());
        auto connection = m_pool->acquire();
        if (!connection) logFailure(connection.error());
        return connection;
    }

    std::expected<std::vector<sqlforge::Row>, sqlforge::Error> SqliteExecutor::fetchRows(const std::string& sql, const std::vector<sqlforge::sqlite::Value>& params) {
        auto connection = acquire();
        if (!connection) return std::unexpected(connection.error());
        if (auto logger = get_or_create_logger()) logger->debug("SQLite fetch: {} [{} params]", sql, params.size());
        auto rows = (*connection)->query(sql, params);
        if (!rows) logFailure(rows.error());
        return rows;
    }

    std::expected<sqlforge::ExecResult, sqlforge::Error> SqliteExecutor::executeStatement(const std::string& sql, const std::vector<sqlforge::sqlite::Value>& params) {
        auto connection = acquire();
        if (!connection) return std::unexpected(connection.error());
        if (auto logger = get_or_create_logger()) logger->debug("SQLite execute: {} [{} params]", sql, params.size());
        auto result = (*connection)->execute(sql, params);
        if (!result) logFailure(result.error());
        return result;
    }

    std::expected<std::unique_ptr<sqlforge::ITransaction<sqlforge::sqlite::Value>>, sqlforge::Error> SqliteExecutor::beginTransaction() {
        auto connection = acquire();
        if (!connection) return std::unexpected(connection.error());
        auto begun = (*connection)->executeSimple("BEGIN");
        if (!begun) {
            logFailure(begun.error());
            return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::TransactionError, begun.error().message, begun.error().native_db_error_code));
        }
        return std::make_unique<SqliteTransaction>(std::move(*connection));
    }

    void SqliteExecutor::close() {
        if (m_pool) m_pool->close();
    }

}  // namespace sqlforge_sqldriver
