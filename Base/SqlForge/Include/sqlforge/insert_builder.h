#ifndef sqlforge_INSERT_BUILDER_H
#define sqlforge_INSERT_BUILDER_H

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sqlforge/builder_parts/statement_tail_mixin.h"
#include "sqlforge/dialect.h"
#include "sqlforge/expr.h"

namespace sqlforge {

    // 冲突处理尾部
    template <typename V>
    struct UpsertTail {
        enum class Kind { None, DoUpdate, DoNothing, DuplicateKey };
        Kind kind = Kind::None;
        std::vector<std::string> conflict_columns;
        std::vector<std::string> update_columns;
        Expr<V> condition;
    };

    // INSERT 语句构建器
    template <typename V>
    class InsertBuilder : public StatementTailMixin<InsertBuilder<V>, V> {
      public:
        using value_type = V;

        InsertBuilder() = default;

        static InsertBuilder Into(std::string table) {
            InsertBuilder b;
            b.m_table = std::move(table);
            return b;
        }

        InsertBuilder &Columns(std::vector<std::string> columns) {
            m_columns = std::move(columns);
            return *this;
        }

        // 替换全部行
        InsertBuilder &Values(std::vector<std::vector<V>> rows) {
            m_rows.clear();
            m_literals.clear();
            m_error.reset();
            if (rows.empty()) {
                m_error = errors::noEntitiesProvided();
                return *this;
            }
            for (auto &row : rows) {
                AddRow(std::move(row));
            }
            return *this;
        }

        InsertBuilder &AddRow(std::vector<V> row) {
            if (!m_columns.empty() && row.size() != m_columns.size()) {
                m_error = rowWidthMismatch(row.size(), m_columns.size());
                return *this;
            }
            m_rows.push_back(std::move(row));
            return *this;
        }

        // 将展平后第 flat_index 个参数换成字面量 (如 DEFAULT); 下标始终指向原始位置
        InsertBuilder &ReplaceWithLiteral(size_t flat_index, std::string literal) {
            m_literals[flat_index] = std::move(literal);
            return *this;
        }

        // ON CONFLICT (c..) DO UPDATE SET u = EXCLUDED.u [WHERE ...]
        InsertBuilder &OnConflictDoUpdate(std::vector<std::string> conflict_columns, std::vector<std::string> update_columns, Expr<V> where = {}) {
            m_upsert.kind = UpsertTail<V>::Kind::DoUpdate;
            m_upsert.conflict_columns = std::move(conflict_columns);
            m_upsert.update_columns = std::move(update_columns);
            m_upsert.condition = std::move(where);
            return *this;
        }

        InsertBuilder &OnConflictDoNothing(std::vector<std::string> conflict_columns = {}) {
            m_upsert.kind = UpsertTail<V>::Kind::DoNothing;
            m_upsert.conflict_columns = std::move(conflict_columns);
            m_upsert.update_columns.clear();
            m_upsert.condition = {};
            return *this;
        }

        // ON DUPLICATE KEY UPDATE u = VALUES(u); 带条件时为 u = IF(cond, VALUES(u), u)
        InsertBuilder &OnDuplicateKeyUpdate(std::vector<std::string> update_columns, Expr<V> condition = {}) {
            m_upsert.kind = UpsertTail<V>::Kind::DuplicateKey;
            m_upsert.conflict_columns.clear();
            m_upsert.update_columns = std::move(update_columns);
            m_upsert.condition = std::move(condition);
            return *this;
        }

        const std::string &table() const {
            return m_table;
        }
        const std::vector<std::string> &columns() const {
            return m_columns;
        }

        BuildResult<V> Build() const;

        BuildResult<V> BuildMut() {
            auto result = Build();
            *this = InsertBuilder();
            return result;
        }

        TailState<V> &getTailState_() {
            return m_tail;
        }

      private:
        static Error rowWidthMismatch(size_t actual, size_t expected) {
            return Error(ErrorCode::ValueInvalid, "Row has " + std::to_string(actual) + " values, expected " + std::to_string(expected));
        }

        std::optional<Error> renderUpsert(std::string &sql, std::vector<V> &values) const;

        std::string m_table;
        std::vector<std::string> m_columns;
        std::vector<std::vector<V>> m_rows;
        std::map<size_t, std::string> m_literals;
        UpsertTail<V> m_upsert;
        TailState<V> m_tail;
        std::optional<Error> m_error;
    };

    template <typename V>
    std::optional<Error> InsertBuilder<V>::renderUpsert(std::string &sql, std::vector<V> &values) const {
        using Kind = typename UpsertTail<V>::Kind;
        if (m_upsert.kind == Kind::None) return std::nullopt;
        if (m_upsert.condition.hasError()) return *m_upsert.condition.error();

        if (m_upsert.kind == Kind::DuplicateKey) {
            if constexpr (Dialect<V>::upsert_style != UpsertStyle::OnDuplicateKey) {
                return errors::unsupportedFeature(std::string("ON DUPLICATE KEY UPDATE is not supported by ") + Dialect<V>::name);
            }
            if (m_upsert.update_columns.empty()) return errors::columnsListEmpty();
            sql += " ON DUPLICATE KEY UPDATE ";
            for (size_t i = 0; i < m_upsert.update_columns.size(); ++i) {
                const auto &column = m_upsert.update_columns[i];
                if (i > 0) sql += ", ";
                if (m_upsert.condition.isEmpty()) {
                    sql += column + " = VALUES(" + column + ")";
                } else {
                    sql += column + " = IF(" + m_upsert.condition.clause() + ", VALUES(" + column + "), " + column + ")";
                    values.insert(values.end(), m_upsert.condition.values().begin(), m_upsert.condition.values().end());
                }
            }
            return std::nullopt;
        }

        if constexpr (Dialect<V>::upsert_style != UpsertStyle::OnConflict) {
            return errors::unsupportedFeature(std::string("ON CONFLICT is not supported by ") + Dialect<V>::name);
        }
        sql += " ON CONFLICT";
        if (!m_upsert.conflict_columns.empty()) {
            sql += " (";
            for (size_t i = 0; i < m_upsert.conflict_columns.size(); ++i) {
                if (i > 0) sql += ", ";
                sql += m_upsert.conflict_columns[i];
            }
            sql += ")";
        }
        if (m_upsert.kind == Kind::DoNothing) {
            sql += " DO NOTHING";
            return std::nullopt;
        }
        if (m_upsert.conflict_columns.empty()) return errors::noPrimaryKeyDefined();
        if (m_upsert.update_columns.empty()) return errors::columnsListEmpty();
        sql += " DO UPDATE SET ";
        for (size_t i = 0; i < m_upsert.update_columns.size(); ++i) {
            if (i > 0) sql += ", ";
            sql += m_upsert.update_columns[i] + " = EXCLUDED." + m_upsert.update_columns[i];
        }
        if (!m_upsert.condition.isEmpty()) {
            sql += " WHERE " + m_upsert.condition.clause();
            values.insert(values.end(), m_upsert.condition.values().begin(), m_upsert.condition.values().end());
        }
        return std::nullopt;
    }

    template <typename V>
    BuildResult<V> InsertBuilder<V>::Build() const {
        if (m_error) return std::unexpected(*m_error);
        if (m_table.empty()) return std::unexpected(Error(ErrorCode::InvalidConfiguration, "INSERT requires a table name"));
        if (m_columns.empty()) return std::unexpected(errors::columnsListEmpty());
        if (m_rows.empty()) return std::unexpected(errors::noEntitiesProvided());
        // Values() 可能先于 Columns() 调用
        for (const auto &row : m_rows) {
            if (row.size() != m_columns.size()) return std::unexpected(rowWidthMismatch(row.size(), m_columns.size()));
        }

        std::string sql;
        std::vector<V> values;
        if (auto err = m_tail.renderPrefix(sql, values)) return std::unexpected(*err);

        sql += "INSERT INTO " + m_table + " (";
        for (size_t i = 0; i < m_columns.size(); ++i) {
            if (i > 0) sql += ", ";
            sql += m_columns[i];
        }
        sql += ") VALUES ";

        size_t flat_index = 0;
        for (size_t r = 0; r < m_rows.size(); ++r) {
            if (r > 0) sql += ", ";
            sql += "(";
            for (size_t c = 0; c < m_rows[r].size(); ++c, ++flat_index) {
                if (c > 0) sql += ", ";
                auto literal = m_literals.find(flat_index);
                if (literal != m_literals.end()) {
                    sql += literal->second;
                } else {
                    sql += "?";
                    values.push_back(m_rows[r][c]);
                }
            }
            sql += ")";
        }

        if (auto err = renderUpsert(sql, values)) return std::unexpected(*err);
        if (auto err = m_tail.renderReturning(sql)) return std::unexpected(*err);
        m_tail.renderAppends(sql, values);
        return std::make_pair(std::move(sql), std::move(values));
    }

    extern template class InsertBuilder<sqlite::Value>;
    extern template class InsertBuilder<mysql::Value>;
    extern template class InsertBuilder<postgres::Value>;

}  // namespace sqlforge

#endif  // sqlforge_INSERT_BUILDER_H
