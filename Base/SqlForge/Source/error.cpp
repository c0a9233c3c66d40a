#include "sqlforge/error.h"

#include <format>

namespace sqlforge {

    const char *errorCodeName(ErrorCode code) {
        switch (code) {
            case ErrorCode::Ok:
                return "Ok";
            case ErrorCode::NoEntitiesProvided:
                return "NoEntitiesProvided";
            case ErrorCode::ColumnsListEmpty:
                return "ColumnsListEmpty";
            case ErrorCode::PrimaryKeyNotFound:
                return "PrimaryKeyNotFound";
            case ErrorCode::NoPrimaryKeyDefined:
                return "NoPrimaryKeyDefined";
            case ErrorCode::ValueInvalid:
                return "ValueInvalid";
            case ErrorCode::SingleKeyTypeInvalid:
                return "SingleKeyTypeInvalid";
            case ErrorCode::CompositeKeyTypeInvalid:
                return "CompositeKeyTypeInvalid";
            case ErrorCode::PageNumberInvalid:
                return "PageNumberInvalid";
            case ErrorCode::LimitInvalid:
                return "LimitInvalid";
            case ErrorCode::EmptyInList:
                return "EmptyInList";
            case ErrorCode::InvalidColumnName:
                return "InvalidColumnName";
            case ErrorCode::DuplicateWhereClause:
                return "DuplicateWhereClause";
            case ErrorCode::SoftDeleteConfigNotSet:
                return "SoftDeleteConfigNotSet";
            case ErrorCode::SoftDeleteColumnTypeInvalid:
                return "SoftDeleteColumnTypeInvalid";
            case ErrorCode::RestoreOperationNotSupported:
                return "RestoreOperationNotSupported";
            case ErrorCode::RelationValueEmpty:
                return "RelationValueEmpty";
            case ErrorCode::RelationValueMismatch:
                return "RelationValueMismatch";
            case ErrorCode::DBPoolNotInitialized:
                return "DBPoolNotInitialized";
            case ErrorCode::ConnectionFailed:
                return "ConnectionFailed";
            case ErrorCode::InvalidConfiguration:
                return "InvalidConfiguration";
            case ErrorCode::QueryExecutionError:
                return "QueryExecutionError";
            case ErrorCode::StatementPreparationError:
                return "StatementPreparationError";
            case ErrorCode::TransactionError:
                return "TransactionError";
            case ErrorCode::RecordNotFound:
                return "RecordNotFound";
            case ErrorCode::MappingError:
                return "MappingError";
            case ErrorCode::UnsupportedFeature:
                return "UnsupportedFeature";
            case ErrorCode::InternalError:
                return "InternalError";
            case ErrorCode::UnknownError:
                return "UnknownError";
        }
        return "UnknownError";
    }

    std::string Error::toString() const {
        std::string err_str = std::string("Error Code: ") + errorCodeName(code);
        if (!message.empty()) {
            err_str += ", Message: " + message;
        }
        if (native_db_error_code != 0) {
            err_str += ", DB Error: " + std::to_string(native_db_error_code);
        }
        if (!sql_state.empty()) {
            err_str += ", SQLState: " + sql_state;
        }
        return err_str;
    }

    namespace errors {

        Error noEntitiesProvided() {
            return Error(ErrorCode::NoEntitiesProvided, "No entities provided");
        }

        Error columnsListEmpty() {
            return Error(ErrorCode::ColumnsListEmpty, "No valid fields provided");
        }

        Error primaryKeyNotFound(const std::string &key_name) {
            return Error(ErrorCode::PrimaryKeyNotFound, std::format("Primary key '{}' not found", key_name));
        }

        Error noPrimaryKeyDefined() {
            return Error(ErrorCode::NoPrimaryKeyDefined, "No primary key defined");
        }

        Error valueInvalid(const std::string &field_name) {
            return Error(ErrorCode::ValueInvalid, std::format("Field {} has an invalid value", field_name));
        }

        Error singleKeyTypeInvalid() {
            return Error(ErrorCode::SingleKeyTypeInvalid, "Primary key must be a single key");
        }

        Error compositeKeyTypeInvalid(std::size_t expected, std::size_t actual) {
            return Error(ErrorCode::CompositeKeyTypeInvalid, std::format("Composite key expects {} values, got {}", expected, actual));
        }

        Error pageNumberInvalid() {
            return Error(ErrorCode::PageNumberInvalid, "Page number and page size must be greater than 0");
        }

        Error limitInvalid() {
            return Error(ErrorCode::LimitInvalid, "Limit must be greater than 0");
        }

        Error emptyInList(const std::string &column) {
            return Error(ErrorCode::EmptyInList, std::format("IN list for column '{}' must not be empty", column));
        }

        Error invalidColumnName() {
            return Error(ErrorCode::InvalidColumnName, "Column name must not be empty");
        }

        Error duplicateWhereClause() {
            return Error(ErrorCode::DuplicateWhereClause, "Duplicate WHERE clause");
        }

        Error softDeleteConfigNotSet() {
            return Error(ErrorCode::SoftDeleteConfigNotSet, "Soft delete config is not set");
        }

        Error softDeleteColumnTypeInvalid(const std::string &column) {
            return Error(ErrorCode::SoftDeleteColumnTypeInvalid, std::format("Soft delete column '{}' must be a boolean field", column));
        }

        Error restoreOperationNotSupported(const std::string &table) {
            return Error(ErrorCode::RestoreOperationNotSupported, std::format("Restore is not supported on table '{}'", table));
        }

        Error relationValueEmpty(std::size_t count) {
            return Error(ErrorCode::RelationValueEmpty, std::format("Expected non-empty values, got {}", count));
        }

        Error relationValueMismatch(std::size_t index, const std::string &expected, const std::string &actual) {
            return Error(ErrorCode::RelationValueMismatch, std::format("Value mismatch: index {}, expected {}, got {}", index, expected, actual));
        }

        Error dbPoolNotInitialized() {
            return Error(ErrorCode::DBPoolNotInitialized, "Database pool not initialized");
        }

        Error recordNotFound() {
            return Error(ErrorCode::RecordNotFound, "No rows returned by a query that expected to return at least one row");
        }

        Error unsupportedFeature(const std::string &what) {
            return Error(ErrorCode::UnsupportedFeature, what);
        }

    }  // namespace errors

}  // namespace sqlforge
