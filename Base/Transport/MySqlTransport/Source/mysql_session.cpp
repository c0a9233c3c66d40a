#include "sqlforge_mysql_transport/mysql_session.h"

#include <cstdint>
#include <cstring>
#include <mutex>

#include "sqlforge_mysql_transport/mysql_bind.h"

namespace sqlforge_mysql_transport {

    using sqlforge::Error;
    using sqlforge::ErrorCode;

    namespace {

        // mysql_library_init 进程内只调用一次, 不再配对 mysql_library_end
        std::expected<void, Error> initLibrary() {
            static std::once_flag once;
            static int status = 0;
            std::call_once(once, [] {
                status = mysql_library_init(0, nullptr, nullptr);
            });
            if (status != 0) return std::unexpected(Error(ErrorCode::ConnectionFailed, "mysql_library_init failed"));
            return {};
        }

        class PreparedStatement {
          public:
            explicit PreparedStatement(MYSQL_STMT* stmt) : m_stmt(stmt) {
            }
            ~PreparedStatement() {
                mysql_stmt_close(m_stmt);
            }
            PreparedStatement(const PreparedStatement&) = delete;
            PreparedStatement& operator=(const PreparedStatement&) = delete;

            MYSQL_STMT* get() const {
                return m_stmt;
            }

            Error error(const std::string& context, ErrorCode fallback) const {
                return makeError(mysql_stmt_errno(m_stmt), mysql_stmt_sqlstate(m_stmt), mysql_stmt_error(m_stmt), context, fallback);
            }

            std::expected<void, Error> bind(const std::vector<sqlforge::mysql::Value>& params) {
                unsigned long expected = mysql_stmt_param_count(m_stmt);
                if (expected != params.size()) {
                    return std::unexpected(Error(ErrorCode::StatementPreparationError, "Parameter count mismatch: expected " + std::to_string(expected) + ", got " + std::to_string(params.size())));
                }
                m_params.emplace(params);
                if (m_params->size() > 0 && mysql_stmt_bind_param(m_stmt, m_params->binds())) {
                    return std::unexpected(error("mysql_stmt_bind_param failed", ErrorCode::StatementPreparationError));
                }
                return {};
            }

            std::expected<void, Error> run() {
                if (mysql_stmt_execute(m_stmt) != 0) return std::unexpected(error("mysql_stmt_execute failed", ErrorCode::QueryExecutionError));
                return {};
            }

          private:
            MYSQL_STMT* m_stmt;
            // 执行结束前参数缓冲区必须存活
            std::optional<ParamBuffers> m_params;
        };

        std::expected<std::unique_ptr<PreparedStatement>, Error> prepare(MYSQL* handle, const std::string& sql, const std::vector<sqlforge::mysql::Value>& params) {
            MYSQL_STMT* raw = mysql_stmt_init(handle);
            if (!raw) return std::unexpected(makeError(mysql_errno(handle), mysql_sqlstate(handle), mysql_error(handle), "mysql_stmt_init failed", ErrorCode::StatementPreparationError));
            auto statement = std::make_unique<PreparedStatement>(raw);
            if (mysql_stmt_prepare(raw, sql.c_str(), sql.size()) != 0) {
                return std::unexpected(statement->error("Failed to prepare '" + sql + "'", ErrorCode::StatementPreparationError));
            }
            auto bound = statement->bind(params);
            if (!bound) return std::unexpected(bound.error());
            return statement;
        }

        // 离开作用域时释放服务端结果集
        struct ResultGuard {
            MYSQL_STMT* stmt;
            ~ResultGuard() {
                mysql_stmt_free_result(stmt);
            }
        };

        std::expected<std::vector<sqlforge::Row>, Error> fetchAll(PreparedStatement& statement) {
            MYSQL_STMT* stmt = statement.get();
            MYSQL_RES* meta = mysql_stmt_result_metadata(stmt);
            if (!meta) {
                if (mysql_stmt_errno(stmt) != 0) return std::unexpected(statement.error("mysql_stmt_result_metadata failed", ErrorCode::QueryExecutionError));
                return std::vector<sqlforge::Row>{};
            }

            const unsigned int count = mysql_num_fields(meta);
            std::vector<ColumnMeta> columns(count);
            std::vector<std::string> names(count);
            MYSQL_FIELD* fields = mysql_fetch_fields(meta);
            for (unsigned int i = 0; i < count; ++i) {
                columns[i].name = fields[i].name ? fields[i].name : "";
                columns[i].type = fields[i].type;
                columns[i].flags = fields[i].flags;
                names[i] = columns[i].name;
            }
            mysql_free_result(meta);

            // 每列先给固定大小的缓冲区, 放不下的单元格再用 mysql_stmt_fetch_column 取全
            constexpr unsigned long kCellBuffer = 256;
            std::vector<std::vector<char>> buffers(count, std::vector<char>(kCellBuffer));
            std::vector<unsigned long> lengths(count, 0);
            std::unique_ptr<bool[]> nulls(new bool[count]());
            std::unique_ptr<bool[]> truncated(new bool[count]());
            std::vector<MYSQL_BIND> binds(count);
            for (unsigned int i = 0; i < count; ++i) {
                std::memset(&binds[i], 0, sizeof(MYSQL_BIND));
                binds[i].buffer_type = MYSQL_TYPE_STRING;
                binds[i].buffer = buffers[i].data();
                binds[i].buffer_length = kCellBuffer;
                binds[i].length = &lengths[i];
                binds[i].is_null = &nulls[i];
                binds[i].error = &truncated[i];
            }

            ResultGuard guard{stmt};
            if (count > 0 && mysql_stmt_bind_result(stmt, binds.data())) {
                return std::unexpected(statement.error("mysql_stmt_bind_result failed", ErrorCode::QueryExecutionError));
            }

            std::vector<sqlforge::Row> rows;
            for (;;) {
                int status = mysql_stmt_fetch(stmt);
                if (status == MYSQL_NO_DATA) break;
                if (status == 1) return std::unexpected(statement.error("mysql_stmt_fetch failed", ErrorCode::QueryExecutionError));

                std::vector<QVariant> values(count);
                for (unsigned int i = 0; i < count; ++i) {
                    if (nulls[i]) continue;
                    if (lengths[i] <= kCellBuffer) {
                        values[i] = cellToVariant(columns[i], std::string_view(buffers[i].data(), lengths[i]));
                        continue;
                    }
                    std::vector<char> full(lengths[i]);
                    MYSQL_BIND column;
                    std::memset(&column, 0, sizeof(column));
                    column.buffer_type = MYSQL_TYPE_STRING;
                    column.buffer = full.data();
                    column.buffer_length = lengths[i];
                    if (mysql_stmt_fetch_column(stmt, &column, i, 0) != 0) {
                        return std::unexpected(statement.error("mysql_stmt_fetch_column failed for " + columns[i].name, ErrorCode::QueryExecutionError));
                    }
                    values[i] = cellToVariant(columns[i], std::string_view(full.data(), full.size()));
                }
                rows.emplace_back(names, std::move(values));
            }
            return rows;
        }

    }  // namespace

    std::expected<std::unique_ptr<MySqlSession>, Error> MySqlSession::connect(const MySqlEndpoint& endpoint) {
        auto ready = initLibrary();
        if (!ready) return std::unexpected(ready.error());

        MYSQL* handle = mysql_init(nullptr);
        if (!handle) return std::unexpected(Error(ErrorCode::ConnectionFailed, "mysql_init failed"));
        std::unique_ptr<MySqlSession> session(new MySqlSession(handle));

        auto setTimeout = [handle](enum mysql_option option, const std::optional<unsigned int>& seconds) {
            if (!seconds) return true;
            unsigned int value = *seconds;
            return mysql_options(handle, option, &value) == 0;
        };
        if (!setTimeout(MYSQL_OPT_CONNECT_TIMEOUT, endpoint.connect_timeout_seconds) || !setTimeout(MYSQL_OPT_READ_TIMEOUT, endpoint.read_timeout_seconds) ||
            !setTimeout(MYSQL_OPT_WRITE_TIMEOUT, endpoint.write_timeout_seconds)) {
            return std::unexpected(session->lastError("Failed to apply connection timeouts", ErrorCode::InvalidConfiguration));
        }

        auto orNull = [](const std::string& text) {
            return text.empty() ? nullptr : text.c_str();
        };
        if (!mysql_real_connect(handle, orNull(endpoint.host), orNull(endpoint.user), orNull(endpoint.password), orNull(endpoint.database), endpoint.port, nullptr, 0)) {
            return std::unexpected(session->lastError("Failed to connect to " + endpoint.host + ":" + std::to_string(endpoint.port), ErrorCode::ConnectionFailed));
        }
        if (!endpoint.charset.empty() && mysql_set_character_set(handle, endpoint.charset.c_str()) != 0) {
            return std::unexpected(session->lastError("Failed to set client charset to " + endpoint.charset, ErrorCode::ConnectionFailed));
        }
        return session;
    }

    MySqlSession::~MySqlSession() {
        mysql_close(m_handle);
    }

    Error MySqlSession::lastError(const std::string& context, ErrorCode fallback) const {
        return makeError(mysql_errno(m_handle), mysql_sqlstate(m_handle), mysql_error(m_handle), context, fallback);
    }

    std::expected<void, Error> MySqlSession::ping() {
        if (mysql_ping(m_handle) != 0) return std::unexpected(lastError("mysql_ping failed", ErrorCode::ConnectionFailed));
        return {};
    }

    std::expected<void, Error> MySqlSession::begin() {
        static const std::string kStart = "START TRANSACTION";
        if (mysql_real_query(m_handle, kStart.c_str(), kStart.size()) != 0) return std::unexpected(lastError("START TRANSACTION failed", ErrorCode::TransactionError));
        return {};
    }

    std::expected<void, Error> MySqlSession::commit() {
        if (mysql_commit(m_handle)) return std::unexpected(lastError("COMMIT failed", ErrorCode::TransactionError));
        return {};
    }

    std::expected<void, Error> MySqlSession::rollback() {
        if (mysql_rollback(m_handle)) return std::unexpected(lastError("ROLLBACK failed", ErrorCode::TransactionError));
        return {};
    }

    std::expected<std::vector<sqlforge::Row>, Error> MySqlSession::query(const std::string& sql, const std::vector<sqlforge::mysql::Value>& params) {
        auto statement = prepare(m_handle, sql, params);
        if (!statement) return std::unexpected(statement.error());
        auto ran = (*statement)->run();
        if (!ran) return std::unexpected(ran.error());
        return fetchAll(**statement);
    }

    std::expected<sqlforge::ExecResult, Error> MySqlSession::execute(const std::string& sql, const std::vector<sqlforge::mysql::Value>& params) {
        auto statement = prepare(m_handle, sql, params);
        if (!statement) return std::unexpected(statement.error());
        auto ran = (*statement)->run();
        if (!ran) return std::unexpected(ran.error());

        sqlforge::ExecResult result;
        result.rows_affected = static_cast<std::uint64_t>(mysql_stmt_affected_rows((*statement)->get()));
        result.last_insert_id = static_cast<std::uint64_t>(mysql_stmt_insert_id((*statement)->get()));
        return result;
    }

}  // namespace sqlforge_mysql_transport
