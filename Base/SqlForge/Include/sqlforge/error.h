#ifndef sqlforge_ERROR_H
#define sqlforge_ERROR_H

#include <cstddef>
#include <string>

namespace sqlforge {

    // 错误码枚举
    enum class ErrorCode {
        Ok = 0,
        // 构建期错误 (builder / facade)
        NoEntitiesProvided,
        ColumnsListEmpty,
        PrimaryKeyNotFound,
        NoPrimaryKeyDefined,
        ValueInvalid,
        SingleKeyTypeInvalid,
        CompositeKeyTypeInvalid,
        PageNumberInvalid,
        LimitInvalid,
        EmptyInList,
        InvalidColumnName,
        DuplicateWhereClause,
        // 软删除
        SoftDeleteConfigNotSet,
        SoftDeleteColumnTypeInvalid,
        RestoreOperationNotSupported,
        // 关系校验
        RelationValueEmpty,
        RelationValueMismatch,
        // 驱动 / 执行期错误
        DBPoolNotInitialized,
        ConnectionFailed,
        InvalidConfiguration,
        QueryExecutionError,
        StatementPreparationError,
        TransactionError,
        RecordNotFound,
        MappingError,
        UnsupportedFeature,
        // 其他
        InternalError,
        UnknownError,
    };

    const char *errorCodeName(ErrorCode code);

    // Error 结构体，用于封装错误信息
    struct Error {
        ErrorCode code = ErrorCode::Ok;
        std::string message;
        int native_db_error_code = 0;  // 可选的数据库原生错误码
        std::string sql_state;         // 可选的 SQLSTATE

        Error() = default;
        Error(ErrorCode c, std::string msg = "", int native_code = 0, std::string state = "")
            : code(c), message(std::move(msg)), native_db_error_code(native_code), sql_state(std::move(state)) {
        }

        bool isOk() const {
            return code == ErrorCode::Ok;
        }

        // 允许在布尔上下文中使用 (if (error))
        explicit operator bool() const {
            return !isOk();
        }

        bool operator==(const Error &other) const {
            return code == other.code && message == other.message;
        }

        std::string toString() const;
    };

    inline Error make_ok() {
        return Error(ErrorCode::Ok);
    }

    // 带有固定消息的错误工厂
    namespace errors {
        Error noEntitiesProvided();
        Error columnsListEmpty();
        Error primaryKeyNotFound(const std::string &key_name);
        Error noPrimaryKeyDefined();
        Error valueInvalid(const std::string &field_name);
        Error singleKeyTypeInvalid();
        Error compositeKeyTypeInvalid(std::size_t expected, std::size_t actual);
        Error pageNumberInvalid();
        Error limitInvalid();
        Error emptyInList(const std::string &column);
        Error invalidColumnName();
        Error duplicateWhereClause();
        Error softDeleteConfigNotSet();
        Error softDeleteColumnTypeInvalid(const std::string &column);
        Error restoreOperationNotSupported(const std::string &table);
        Error relationValueEmpty(std::size_t count);
        Error relationValueMismatch(std::size_t index, const std::string &expected, const std::string &actual);
        Error dbPoolNotInitialized();
        Error recordNotFound();
        Error unsupportedFeature(const std::string &what);
    }  // namespace errors

}  // namespace sqlforge

#endif  // sqlforge_ERROR_H
