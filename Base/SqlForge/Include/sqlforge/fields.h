#ifndef sqlforge_FIELDS_H
#define sqlforge_FIELDS_H

#include <algorithm>
#include <expected>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "sqlforge/conversion.h"
#include "sqlforge/entity_meta.h"
#include "sqlforge/error.h"

namespace sqlforge {

    // 列名与值一一对应
    template <typename V>
    struct ExtractedFields {
        std::vector<std::string> names;
        std::vector<V> values;
    };

    template <typename V>
    struct ExtractedRows {
        std::vector<std::string> names;
        std::vector<std::vector<V>> rows;
    };

    namespace internal {
        inline bool isExcluded(const std::vector<std::string> &exclude, const std::string &column) {
            return std::find(exclude.begin(), exclude.end(), column) != exclude.end();
        }
    }  // namespace internal

    // 依次访问保留下来的字段; 不修改实体
    template <typename V, typename T>
    void extractWithBind(const T &entity, const std::vector<std::string> &exclude, bool skip_null, const std::function<void(const std::string &, V)> &callback) {
        for (const auto &field : T::getEntityMeta().fields) {
            if (internal::isExcluded(exclude, field.db_name)) continue;
            std::any raw = field.getter ? field.getter(&entity) : std::any();
            if (skip_null && isEmptyOrNone(raw)) continue;
            callback(field.db_name, V::convert(raw));
        }
    }

    template <typename V, typename T>
    ExtractedFields<V> extractWithFilter(const T &entity, const std::vector<std::string> &exclude, bool skip_null) {
        ExtractedFields<V> result;
        extractWithBind<V>(entity, exclude, skip_null, [&result](const std::string &name, V value) {
            result.names.push_back(name);
            result.values.push_back(std::move(value));
        });
        return result;
    }

    template <typename V, typename T>
    ExtractedFields<V> extractAll(const T &entity) {
        return extractWithFilter<V>(entity, {}, false);
    }

    // 列名取第一个实体的; 所有实体需有相同的字段布局
    template <typename V, typename T>
    ExtractedRows<V> batchExtract(const std::vector<T> &entities, const std::vector<std::string> &exclude, bool skip_null) {
        ExtractedRows<V> result;
        for (size_t i = 0; i < entities.size(); ++i) {
            auto extracted = extractWithFilter<V>(entities[i], exclude, skip_null);
            if (i == 0) result.names = std::move(extracted.names);
            result.rows.push_back(std::move(extracted.values));
        }
        return result;
    }

    // 读取单列
    template <typename V, typename T>
    std::expected<V, Error> getValue(const T &entity, const std::string &column) {
        const FieldMeta *field = T::getEntityMeta().findFieldByDbName(column);
        if (!field || !field->getter) return std::unexpected(errors::primaryKeyNotFound(column));
        return V::convert(field->getter(&entity));
    }

    template <typename V, typename T>
    std::expected<std::vector<V>, Error> getValues(const T &entity, const std::vector<std::string> &columns) {
        std::vector<V> values;
        values.reserve(columns.size());
        for (const auto &column : columns) {
            auto value = getValue<V>(entity, column);
            if (!value) return std::unexpected(value.error());
            values.push_back(std::move(*value));
        }
        return values;
    }

}  // namespace sqlforge

#endif  // sqlforge_FIELDS_H
