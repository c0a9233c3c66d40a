// Source/postgres_executor.cpp
#include "sqlforge_sqldriver/postgres_executor.h"

#include <libpq-fe.h>

#include <QDate>
#include <QDateTime>
#include <QTime>
#include <QStringList>
#include <QTimeZone>
#include <algorithm>
#include <cstdlib>
#include <optional>

#include "sqlforge/postgres/placeholder_rewriter.h"
#include "sqlforge_sqldriver/driver_logger.h"

namespace sqlforge_sqldriver {

    namespace {

        // pg_type.h 中的内置类型 OID
        constexpr Oid kBoolOid = 16;
        constexpr Oid kByteaOid = 17;
        constexpr Oid kInt8Oid = 20;
        constexpr Oid kInt2Oid = 21;
        constexpr Oid kInt4Oid = 23;
        constexpr Oid kOidOid = 26;
        constexpr Oid kFloat4Oid = 700;
        constexpr Oid kFloat8Oid = 701;
        constexpr Oid kDateOid = 1082;
        constexpr Oid kTimeOid = 1083;
        constexpr Oid kTimestampOid = 1114;
        constexpr Oid kTimestamptzOid = 1184;

        struct ResultGuard {
            PGresult* result = nullptr;
            ~ResultGuard() {
                if (result) PQclear(result);
            }
        };

        void logFailure(const sqlforge::Error& error) {
            if (auto logger = get_or_create_logger()) {
                logger->error("PostgreSQL: {}", error.toString());
            }
        }

        sqlforge::Error resultError(PGresult* result, PGconn* conn, sqlforge::ErrorCode code, const std::string& context) {
            std::string message = result ? PQresultErrorMessage(result) : PQerrorMessage(conn);
            while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) message.pop_back();
            std::string state;
            if (result) {
                const char* sqlstate = PQresultErrorField(result, PG_DIAG_SQLSTATE);
                if (sqlstate) state = sqlstate;
            }
            return sqlforge::Error(code, context + ": " + message, 0, state);
        }

        // 小数秒截断到毫秒
        QTime parseTime(const QString& text) {
            QString base = text;
            int msec = 0;
            int dot = text.indexOf('.');
            if (dot >= 0) {
                base = text.left(dot);
                msec = text.mid(dot + 1, 3).leftJustified(3, '0').toInt();
            }
            QTime time = QTime::fromString(base, QStringLiteral("HH:mm:ss"));
            if (!time.isValid()) return time;
            return time.addMSecs(msec);
        }

        // "2024-01-02 03:04:05.123456[+08[:30]]"
        std::optional<QDateTime> parseTimestamp(const QString& text, bool with_zone) {
            int space = text.indexOf(' ');
            if (space < 0) return std::nullopt;
            QDate date = QDate::fromString(text.left(space), QStringLiteral("yyyy-MM-dd"));
            QString rest = text.mid(space + 1);
            int offset_seconds = 0;
            if (with_zone) {
                int sign_pos = std::max(rest.lastIndexOf('+'), rest.lastIndexOf('-'));
                if (sign_pos < 0) return std::nullopt;
                QString zone = rest.mid(sign_pos + 1);
                int sign = rest[sign_pos] == '-' ? -1 : 1;
                const QStringList parts = zone.split(':');
                offset_seconds = parts.value(0).toInt() * 3600 + parts.value(1).toInt() * 60 + parts.value(2).toInt();
                offset_seconds *= sign;
                rest = rest.left(sign_pos);
            }
            QTime time = parseTime(rest);
            if (!date.isValid() || !time.isValid()) return std::nullopt;
            if (!with_zone) return QDateTime(date, time);
            return QDateTime(date, time, QTimeZone(offset_seconds)).toUTC();
        }

        QVariant cellToVariant(PGresult* result, int row, int column) {
            if (PQgetisnull(result, row, column)) return QVariant();
            const char* raw = PQgetvalue(result, row, column);
            const int length = PQgetlength(result, row, column);
            const QString text = QString::fromUtf8(raw, length);
            switch (PQftype(result, column)) {
                case kBoolOid:
                    return QVariant(raw[0] == 't');
                case kInt2Oid:
                case kInt4Oid:
                case kInt8Oid:
                case kOidOid:
                    return QVariant::fromValue(text.toLongLong());
                case kFloat4Oid:
                case kFloat8Oid:
                    return QVariant(text.toDouble());
                case kByteaOid: {
                    size_t size = 0;
                    unsigned char* bytes = PQunescapeBytea(reinterpret_cast<const unsigned char*>(raw), &size);
                    if (!bytes) return QVariant(text);
                    QByteArray out(reinterpret_cast<const char*>(bytes), static_cast<qsizetype>(size));
                    PQfreemem(bytes);
                    return QVariant(out);
                }
                case kDateOid:
                    return QVariant(QDate::fromString(text, QStringLiteral("yyyy-MM-dd")));
                case kTimeOid:
                    return QVariant(parseTime(text));
                case kTimestampOid:
                case kTimestamptzOid: {
                    auto parsed = parseTimestamp(text, PQftype(result, column) == kTimestamptzOid);
                    if (!parsed) return QVariant(text);
                    return QVariant(*parsed);
                }
                default:
                    return QVariant(text);
            }
        }

        std::string quoteConnInfoValue(const std::string& value) {
            std::string out = "'";
            for (char c : value) {
                if (c == '\'' || c == '\\') out += '\\';
                out += c;
            }
            out += '\'';
            return out;
        }

        // 执行 PQexecParams, 返回的结果由调用方释放
        std::expected<PGresult*, sqlforge::Error> run(PGconn* conn, const std::string& sql, const std::vector<sqlforge::postgres::Value>& params) {
            const std::string rewritten = sqlforge::postgres::rewritePlaceholders(sql);

            std::vector<Oid> types;
            std::vector<std::optional<std::string>> texts;
            std::vector<const char*> values;
            types.reserve(params.size());
            texts.reserve(params.size());
            values.reserve(params.size());
            for (const auto& param : params) {
                types.push_back(static_cast<Oid>(param.typeOid()));
                texts.push_back(param.isNull() ? std::nullopt : std::optional<std::string>(param.toString()));
            }
            for (const auto& text : texts) {
                values.push_back(text ? text->c_str() : nullptr);
            }

            PGresult* result = PQexecParams(conn, rewritten.c_str(), static_cast<int>(params.size()), types.empty() ? nullptr : types.data(), values.empty() ? nullptr : values.data(), nullptr, nullptr, 0);
            ExecStatusType status = result ? PQresultStatus(result) : PGRES_FATAL_ERROR;
            if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
                auto error = resultError(result, conn, sqlforge::ErrorCode::QueryExecutionError, "Failed to execute '" + rewritten + "'");
                if (result) PQclear(result);
                return std::unexpected(error);
            }
            return result;
        }

    }  // namespace

    // --- PostgresConnection ---
    std::string PostgresConnection::buildConnInfo(const ConnectionParameters& params) {
        std::string conninfo;
        auto append = [&conninfo](const char* key, const std::string& value) {
            if (value.empty()) return;
            if (!conninfo.empty()) conninfo += ' ';
            conninfo += key;
            conninfo += '=';
            conninfo += quoteConnInfoValue(value);
        };
        append("host", params.host);
        if (params.port) append("port", std::to_string(*params.port));
        append("dbname", params.database);
        append("user", params.user.value_or(""));
        append("password", params.password.value_or(""));
        if (params.timeouts.connect_seconds) append("connect_timeout", std::to_string(*params.timeouts.connect_seconds));
        append("client_encoding", params.charset.value_or(""));
        append("application_name", params.application_name.value_or(""));
        for (const auto& [key, value] : params.extra_options) {
            append(key.c_str(), value);
        }
        return conninfo;
    }

    std::expected<std::unique_ptr<PostgresConnection>, sqlforge::Error> PostgresConnection::open(const ConnectionParameters& params) {
        PGconn* conn = PQconnectdb(buildConnInfo(params).c_str());
        if (!conn) {
            return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::ConnectionFailed, "PQconnectdb returned null (out of memory?)"));
        }
        if (PQstatus(conn) != CONNECTION_OK) {
            std::string message = PQerrorMessage(conn);
            PQfinish(conn);
            return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::ConnectionFailed, "Failed to connect to PostgreSQL: " + message));
        }
        return std::unique_ptr<PostgresConnection>(new PostgresConnection(conn));
    }

    PostgresConnection::~PostgresConnection() {
        if (m_conn) {
            PQfinish(m_conn);
            m_conn = nullptr;
        }
    }

    bool PostgresConnection::isHealthy() const {
        return m_conn && PQstatus(m_conn) == CONNECTION_OK;
    }

    std::expected<void, sqlforge::Error> PostgresConnection::executeSimple(const std::string& sql) {
        ResultGuard guard{PQexec(m_conn, sql.c_str())};
        if (!guard.result || PQresultStatus(guard.result) != PGRES_COMMAND_OK) {
            return std::unexpected(resultError(guard.result, m_conn, sqlforge::ErrorCode::QueryExecutionError, sql));
        }
        return {};
    }

    std::expected<std::vector<sqlforge::Row>, sqlforge::Error> PostgresConnection::query(const std::string& sql, const std::vector<sqlforge::postgres::Value>& params) {
        auto executed = run(m_conn, sql, params);
        if (!executed) return std::unexpected(executed.error());
        ResultGuard guard{*executed};

        const int field_count = PQnfields(guard.result);
        const int row_count = PQntuples(guard.result);
        std::vector<std::string> columns;
        columns.reserve(field_count);
        for (int i = 0; i < field_count; ++i) {
            columns.emplace_back(PQfname(guard.result, i));
        }

        std::vector<sqlforge::Row> rows;
        rows.reserve(row_count);
        for (int r = 0; r < row_count; ++r) {
            std::vector<QVariant> values;
            values.reserve(field_count);
            for (int c = 0; c < field_count; ++c) {
                values.push_back(cellToVariant(guard.result, r, c));
            }
            rows.emplace_back(columns, std::move(values));
        }
        return rows;
    }

    std::expected<sqlforge::ExecResult, sqlforge::Error> PostgresConnection::execute(const std::string& sql, const std::vector<sqlforge::postgres::Value>& params) {
        auto executed = run(m_conn, sql, params);
        if (!executed) return std::unexpected(executed.error());
        ResultGuard guard{*executed};

        // PostgreSQL 没有 last insert id, 需要时使用 RETURNING
        sqlforge::ExecResult result;
        const char* tuples = PQcmdTuples(guard.result);
        if (tuples && *tuples) result.rows_affected = std::strtoull(tuples, nullptr, 10);
        return result;
    }

    // --- PostgresTransaction ---
    PostgresTransaction::PostgresTransaction(PooledConnection<PostgresConnection> connection) : m_connection(std::move(connection)) {
    }

    PostgresTransaction::~PostgresTransaction() {
        if (m_active) {
            auto rolled_back = rollback();
            if (!rolled_back) logFailure(rolled_back.error());
        }
    }

    std::expected<std::vector<sqlforge::Row>, sqlforge::Error> PostgresTransaction::fetchRows(const std::string& sql, const std::vector<sqlforge::postgres::Value>& params) {
        if (!m_active) return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::TransactionError, "Transaction is no longer active"));
        if (auto logger = get_or_create_logger()) logger->debug("PostgreSQL tx fetch: {} [{} params]", sql, params.size());
        auto rows = m_connection->query(sql, params);
        if (!rows) logFailure(rows.error());
        return rows;
    }

    std::expected<sqlforge::ExecResult, sqlforge::Error> PostgresTransaction::executeStatement(const std::string& sql, const std::vector<sqlforge::postgres::Value>& params) {
        if (!m_active) return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::TransactionError, "Transaction is no longer active"));
        if (auto logger = get_or_create_logger()) logger->debug("PostgreSQL tx execute: {} [{} params]", sql, params.size());
        auto result = m_connection->execute(sql, params);
        if (!result) logFailure(result.error());
        return result;
    }

    std::expected<void, sqlforge::Error> PostgresTransaction::finish(const char* statement) {
        if (!m_active) return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::TransactionError, "Transaction is no longer active"));
        m_active = false;
        auto done = m_connection->executeSimple(statement);
        if (!done) {
            m_connection.invalidate();
            return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::TransactionError, done.error().message, 0, done.error().sql_state));
        }
        return {};
    }

    std::expected<void, sqlforge::Error> PostgresTransaction::commit() {
        return finish("COMMIT");
    }

    std::expected<void, sqlforge::Error> PostgresTransaction::rollback() {
        return finish("ROLLBACK");
    }

    // --- PostgresExecutor ---
    std::expected<std::shared_ptr<PostgresExecutor>, sqlforge::Error> PostgresExecutor::open(const ConnectionParameters& params) {
        auto pool = PostgresPool::create(
            [params]() {
                return PostgresConnection::open(params);
            },
            params.pool);
        auto first = pool->acquire();
        if (!first) {
            logFailure(first.error());
            return std::unexpected(first.error());
        }
        return std::make_shared<PostgresExecutor>(std::move(pool));
    }

    std::expected<PooledConnection<PostgresConnection>, sqlforge::Error> PostgresExecutor::acquire() {
        if (!m_pool) return std::unexpected(sqlforge::errors::dbPoolNotInitialized());
        auto connection = m_pool->acquire();
        if (!connection) {
            logFailure(connection.error());
            return connection;
        }
        if (!(*connection)->isHealthy()) {
            connection->invalidate();
            *connection = PooledConnection<PostgresConnection>();
            connection = m_pool->acquire();
            if (!connection) logFailure(connection.error());
        }
        return connection;
    }

    std::expected<std::vector<sqlforge::Row>, sqlforge::Error> PostgresExecutor::fetchRows(const std::string& sql, const std::vector<sqlforge::postgres::Value>& params) {
        auto connection = acquire();
        if (!connection) return std::unexpected(connection.error());
        if (auto logger = get_or_create_logger()) logger->debug("PostgreSQL fetch: {} [{} params]", sql, params.size());
        auto rows = (*connection)->query(sql, params);
        if (!rows) logFailure(rows.error());
        return rows;
    }

    std::expected<sqlforge::ExecResult, sqlforge::Error> PostgresExecutor::executeStatement(const std::string& sql, const std::vector<sqlforge::postgres::Value>& params) {
        auto connection = acquire();
        if (!connection) return std::unexpected(connection.error());
        if (auto logger = get_or_create_logger()) logger->debug("PostgreSQL execute: {} [{} params]", sql, params.size());
        auto result = (*connection)->execute(sql, params);
        if (!result) logFailure(result.error());
        return result;
    }

    std::expected<std::unique_ptr<sqlforge::ITransaction<sqlforge::postgres::Value>>, sqlforge::Error> PostgresExecutor::beginTransaction() {
        auto connection = acquire();
        if (!connection) return std::unexpected(connection.error());
        auto begun = (*connection)->executeSimple("BEGIN");
        if (!begun) {
            logFailure(begun.error());
            connection->invalidate();
            return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::TransactionError, begun.error().message, 0, begun.error().sql_state));
        }
        return std::make_unique<PostgresTransaction>(std::move(*connection));
    }

    void PostgresExecutor::close() {
        if (m_pool) m_pool->close();
    }

}  // namespace sqlforge_sqldriver
