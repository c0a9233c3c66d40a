#ifndef sqlforge_ENTITY_H
#define sqlforge_ENTITY_H

#include <QDebug>
#include <expected>
#include <functional>
#include <mutex>
#include <typeinfo>
#include <vector>

#include "sqlforge/conversion.h"
#include "sqlforge/entity_meta.h"
#include "sqlforge/error.h"
#include "sqlforge/row.h"

namespace sqlforge {

    using FieldMetaProvider = std::function<FieldMeta()>;

    // 实体基类; 字段元数据由 sqlforge_FIELD 在静态初始化阶段登记, 首次访问时汇总
    template <typename Derived>
    class Entity {
      public:
        inline static const char *_table_name = nullptr;
        inline static std::vector<FieldMetaProvider> *_pending_field_meta_providers = nullptr;
        inline static std::mutex _meta_init_mutex;

        static void _initTableName(const char *tableNameFromMacro) {
            std::lock_guard<std::mutex> lock(Entity<Derived>::_meta_init_mutex);
            if (!Entity<Derived>::_table_name && tableNameFromMacro) Entity<Derived>::_table_name = tableNameFromMacro;
        }

        static void _addPendingFieldMetaProvider(FieldMetaProvider provider) {
            std::lock_guard<std::mutex> lock(Entity<Derived>::_meta_init_mutex);
            if (!Entity<Derived>::_pending_field_meta_providers) Entity<Derived>::_pending_field_meta_providers = new std::vector<FieldMetaProvider>();
            Entity<Derived>::_pending_field_meta_providers->push_back(std::move(provider));
        }

        static const EntityMeta &getEntityMeta() {
            static const EntityMeta meta = Entity<Derived>::_buildEntityMeta();
            return meta;
        }

        static const std::string &tableName() {
            return getEntityMeta().table_name;
        }

        template <typename FieldType, FieldType Derived::*MemberPtr>
        static std::any _sqlforge_generated_getter(const void *obj_ptr) {
            return internal::toAny(static_cast<const Derived *>(obj_ptr)->*MemberPtr);
        }

        template <typename FieldType, FieldType Derived::*MemberPtr>
        static bool _sqlforge_generated_row_setter(void *obj_ptr, const QVariant &value) {
            FieldType converted{};
            if (!internal::fromQVariant(value, converted)) {
                qWarning() << "sqlforge Entity::row_setter: cannot convert" << value << "to" << typeid(FieldType).name();
                return false;
            }
            (static_cast<Derived *>(obj_ptr)->*MemberPtr) = std::move(converted);
            return true;
        }

      private:
        static EntityMeta _buildEntityMeta() {
            std::lock_guard<std::mutex> lock(Entity<Derived>::_meta_init_mutex);
            EntityMeta s_meta;
            s_meta.table_name = Entity<Derived>::_table_name ? Entity<Derived>::_table_name : "";
            if (Entity<Derived>::_pending_field_meta_providers) {
                for (const auto &provider_func : *Entity<Derived>::_pending_field_meta_providers) {
                    if (!provider_func) continue;
                    auto field_meta_obj = provider_func();
                    if (s_meta.findFieldByCppName(field_meta_obj.cpp_name)) continue;
                    s_meta.fields.push_back(std::move(field_meta_obj));
                    const auto &added_field_meta = s_meta.fields.back();
                    if (added_field_meta.isPrimaryKey() && !added_field_meta.db_name.empty()) s_meta.primary_keys_db_names.push_back(added_field_meta.db_name);
                }
                delete Entity<Derived>::_pending_field_meta_providers;
                Entity<Derived>::_pending_field_meta_providers = nullptr;
            }
            return s_meta;
        }
    };

    // 驱动行 -> 实体; 行中缺失的列保持默认值
    template <typename T>
    std::expected<T, Error> fromRow(const Row &row) {
        T entity{};
        for (const auto &field : T::getEntityMeta().fields) {
            const QVariant *value = row.value(field.db_name);
            if (!value || !field.row_setter) continue;
            if (!field.row_setter(&entity, *value)) {
                return std::unexpected(Error(ErrorCode::MappingError, "Cannot map column " + field.db_name + " of table " + T::tableName()));
            }
        }
        return entity;
    }

    template <typename T>
    std::expected<std::vector<T>, Error> fromRows(const std::vector<Row> &rows) {
        std::vector<T> entities;
        entities.reserve(rows.size());
        for (const auto &row : rows) {
            auto entity = fromRow<T>(row);
            if (!entity) return std::unexpected(entity.error());
            entities.push_back(std::move(*entity));
        }
        return entities;
    }

}  // namespace sqlforge

#endif  // sqlforge_ENTITY_H
