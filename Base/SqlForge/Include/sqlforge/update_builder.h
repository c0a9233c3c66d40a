#ifndef sqlforge_UPDATE_BUILDER_H
#define sqlforge_UPDATE_BUILDER_H

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sqlforge/builder_parts/case_when.h"
#include "sqlforge/builder_parts/join.h"
#include "sqlforge/builder_parts/statement_tail_mixin.h"
#include "sqlforge/builder_parts/where_mixin.h"
#include "sqlforge/dialect.h"
#include "sqlforge/expr.h"

namespace sqlforge {

    // UPDATE 语句构建器; SET 按首次出现顺序输出, 同一列再次设置时原位替换
    template <typename V>
    class UpdateBuilder : public WhereMixin<UpdateBuilder<V>, V>, public StatementTailMixin<UpdateBuilder<V>, V> {
      public:
        using value_type = V;

        UpdateBuilder() = default;

        static UpdateBuilder Table(std::string table) {
            UpdateBuilder b;
            b.m_table = std::move(table);
            return b;
        }

        // col = ?
        UpdateBuilder &Set(const std::string &column, V value) {
            return assign(column, Expr<V>("?", {std::move(value)}));
        }

        // col = <sql>, 不带参数, 例如 views = views + 1
        UpdateBuilder &SetExpr(const std::string &column, std::string sql) {
            return assign(column, Expr<V>::FromStr(std::move(sql)));
        }

        // col = <带参数的 sql>
        UpdateBuilder &SetRaw(const std::string &column, std::string sql, std::vector<V> values) {
            return assign(column, Expr<V>::Raw(std::move(sql), std::move(values)));
        }

        // 列与值数量不一致时不做任何设置
        UpdateBuilder &SetCols(const std::vector<std::string> &columns, const std::vector<V> &values) {
            if (columns.size() != values.size()) return *this;
            for (size_t i = 0; i < columns.size(); ++i) {
                Set(columns[i], values[i]);
            }
            return *this;
        }

        UpdateBuilder &SetCase(const std::string &column, const CaseWhen<V> &case_when) {
            auto built = case_when.BuildExpression();
            if (!built) return assign(column, Expr<V>::FromError(built.error()));
            return assign(column, Expr<V>::Raw(std::move(built->first), std::move(built->second)));
        }

        UpdateBuilder &Join(JoinClause<V> join) {
            m_joins.push_back(std::move(join));
            return *this;
        }

        const std::string &table() const {
            return m_table;
        }

        BuildResult<V> Build() const;

        BuildResult<V> BuildMut() {
            auto result = Build();
            *this = UpdateBuilder();
            return result;
        }

        WhereState<V> &getWhereState_() {
            return m_where;
        }
        TailState<V> &getTailState_() {
            return m_tail;
        }

      private:
        UpdateBuilder &assign(const std::string &column, Expr<V> value) {
            for (auto &entry : m_assignments) {
                if (entry.first == column) {
                    entry.second = std::move(value);
                    return *this;
                }
            }
            m_assignments.emplace_back(column, std::move(value));
            return *this;
        }

        std::string m_table;
        std::vector<std::pair<std::string, Expr<V>>> m_assignments;
        std::vector<JoinClause<V>> m_joins;
        WhereState<V> m_where;
        TailState<V> m_tail;
    };

    template <typename V>
    BuildResult<V> UpdateBuilder<V>::Build() const {
        if (auto err = m_where.firstError()) return std::unexpected(*err);
        if (m_table.empty()) return std::unexpected(Error(ErrorCode::InvalidConfiguration, "UPDATE requires a table name"));
        if (m_assignments.empty()) return std::unexpected(errors::columnsListEmpty());

        std::string sql;
        std::vector<V> values;
        if (auto err = m_tail.renderPrefix(sql, values)) return std::unexpected(*err);

        sql += "UPDATE " + m_table;
        for (const auto &join : m_joins) {
            auto built = join.Build();
            if (!built) return std::unexpected(built.error());
            sql += " " + built->first;
            values.insert(values.end(), built->second.begin(), built->second.end());
        }

        sql += " SET ";
        for (size_t i = 0; i < m_assignments.size(); ++i) {
            const auto &[column, value] = m_assignments[i];
            if (value.hasError()) return std::unexpected(*value.error());
            if (i > 0) sql += ", ";
            sql += column + " = " + value.clause();
            values.insert(values.end(), value.values().begin(), value.values().end());
        }

        m_where.render(sql, values);
        if (auto err = m_tail.renderReturning(sql)) return std::unexpected(*err);
        m_tail.renderAppends(sql, values);
        return std::make_pair(std::move(sql), std::move(values));
    }

    extern template class UpdateBuilder<sqlite::Value>;
    extern template class UpdateBuilder<mysql::Value>;
    extern template class UpdateBuilder<postgres::Value>;

}  // namespace sqlforge

#endif  // sqlforge_UPDATE_BUILDER_H
