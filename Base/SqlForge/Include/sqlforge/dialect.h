#ifndef sqlforge_DIALECT_H
#define sqlforge_DIALECT_H

#include "sqlforge/mysql/mysql_value.h"
#include "sqlforge/postgres/postgres_value.h"
#include "sqlforge/sqlite/sqlite_value.h"

namespace sqlforge {

    enum class UpsertStyle { OnConflict, OnDuplicateKey };

    // 方言差异只体现在: 值类型, upsert 尾部语法, 占位符改写
    template <typename V>
    struct Dialect;

    template <>
    struct Dialect<sqlite::Value> {
        static constexpr const char *name = "sqlite";
        // SQLite 不支持 VALUES 中的 DEFAULT, 自增主键传 NULL
        static constexpr const char *default_keyword = "NULL";
        static constexpr bool supports_returning = true;
        static constexpr UpsertStyle upsert_style = UpsertStyle::OnConflict;
        static constexpr bool numbered_placeholders = false;
    };

    template <>
    struct Dialect<mysql::Value> {
        static constexpr const char *name = "mysql";
        static constexpr const char *default_keyword = "DEFAULT";
        static constexpr bool supports_returning = false;
        static constexpr UpsertStyle upsert_style = UpsertStyle::OnDuplicateKey;
        static constexpr bool numbered_placeholders = false;
    };

    template <>
    struct Dialect<postgres::Value> {
        static constexpr const char *name = "postgres";
        static constexpr const char *default_keyword = "DEFAULT";
        static constexpr bool supports_returning = true;
        static constexpr UpsertStyle upsert_style = UpsertStyle::OnConflict;
        static constexpr bool numbered_placeholders = true;
    };

}  // namespace sqlforge

#endif  // sqlforge_DIALECT_H
