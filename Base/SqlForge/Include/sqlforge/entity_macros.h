#ifndef sqlforge_ENTITY_MACROS_H
#define sqlforge_ENTITY_MACROS_H

#include <optional>
#include <string>
#include <typeindex>

#include "sqlforge/entity.h"

// --- Helper Macros ---
#define sqlforge_STRINGIFY_DETAIL(x) #x
#define sqlforge_STRINGIFY(x) sqlforge_STRINGIFY_DETAIL(x)
#define sqlforge_CONCAT_DETAIL(x, y) x##y
#define sqlforge_CONCAT(x, y) sqlforge_CONCAT_DETAIL(x, y)

// 显式指定表名
#define sqlforge_ENTITY_TABLE(CurrentClassName, TableNameStr)                                                                                                       \
    using _sqlforgeThisEntityClass = CurrentClassName;                                                                                                              \
    friend class sqlforge::Entity<CurrentClassName>;                                                                                                                \
                                                                                                                                                                    \
  private:                                                                                                                                                          \
    inline static const bool sqlforge_CONCAT(_sqlforge_tbl_init_, __COUNTER__) = (sqlforge::Entity<CurrentClassName>::_initTableName(TableNameStr), true);          \
                                                                                                                                                                    \
  public:

#define sqlforge_ENTITY_BEGIN(CurrentClassName)                                                                                                                     \
    using _sqlforgeThisEntityClass = CurrentClassName;                                                                                                              \
    friend class sqlforge::Entity<CurrentClassName>;                                                                                                                \
                                                                                                                                                                    \
  private:                                                                                                                                                          \
    inline static const std::string _sqlforge_default_table_name = sqlforge::toSnakeCase(sqlforge_STRINGIFY(CurrentClassName));                                     \
    inline static const bool sqlforge_CONCAT(_sqlforge_tbl_init_, __COUNTER__) = (sqlforge::Entity<CurrentClassName>::_initTableName(_sqlforge_default_table_name.c_str()), true); \
                                                                                                                                                                    \
  public:

#define sqlforge_FIELD(CppType, CppName, DbNameStr, ...)                                                                                                                              \
  public:                                                                                                                                                                             \
    CppType CppName{};                                                                                                                                                                \
                                                                                                                                                                                      \
  private:                                                                                                                                                                            \
    inline static const bool sqlforge_CONCAT(_f_prov_reg_, CppName) = (sqlforge::Entity<_sqlforgeThisEntityClass>::_addPendingFieldMetaProvider([]() -> sqlforge::FieldMeta {        \
                                                                           auto g = &sqlforge::Entity<_sqlforgeThisEntityClass>::template _sqlforge_generated_getter<CppType, &_sqlforgeThisEntityClass::CppName>;      \
                                                                           auto s = &sqlforge::Entity<_sqlforgeThisEntityClass>::template _sqlforge_generated_row_setter<CppType, &_sqlforgeThisEntityClass::CppName>;  \
                                                                           return sqlforge::FieldMeta(DbNameStr,                                                                      \
                                                                                                      sqlforge_STRINGIFY(CppName),                                                    \
                                                                                                      typeid(CppType),                                                                \
                                                                                                      typeid(sqlforge::internal::unwrap_optional_t<CppType>),                         \
                                                                                                      sqlforge::internal::is_optional<CppType>::value,                                \
                                                                                                      sqlforge::combine_flags(sqlforge::FieldFlag::None, ##__VA_ARGS__),              \
                                                                                                      g,                                                                              \
                                                                                                      s);                                                                             \
                                                                       }),                                                                                                            \
                                                                       true);                                                                                                         \
                                                                                                                                                                                      \
  public:

#define sqlforge_PRIMARY_KEY(CppType, CppName, DbNameStr, ...) sqlforge_FIELD(CppType, CppName, DbNameStr, sqlforge::FieldFlag::PrimaryKey, ##__VA_ARGS__)

#define sqlforge_AUTO_INCREMENT_PRIMARY_KEY(CppType, CppName, DbNameStr) sqlforge_PRIMARY_KEY(CppType, CppName, DbNameStr, sqlforge::FieldFlag::AutoIncrement)

#endif  // sqlforge_ENTITY_MACROS_H
