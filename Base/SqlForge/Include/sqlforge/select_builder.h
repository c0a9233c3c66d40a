#ifndef sqlforge_SELECT_BUILDER_H
#define sqlforge_SELECT_BUILDER_H

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sqlforge/builder_parts/aggregate.h"
#include "sqlforge/builder_parts/case_when.h"
#include "sqlforge/builder_parts/join.h"
#include "sqlforge/builder_parts/statement_tail_mixin.h"
#include "sqlforge/builder_parts/where_mixin.h"
#include "sqlforge/dialect.h"
#include "sqlforge/expr.h"
#include "sqlforge/types.h"

namespace sqlforge {

    // 已渲染的语句片段, 保留构建时出现的错误
    template <typename V>
    struct RenderedFragment {
        std::string sql;
        std::vector<V> values;
        std::optional<Error> error;

        template <typename Query>
        static RenderedFragment of(const Query &query) {
            RenderedFragment fragment;
            auto built = query.Build();
            if (!built) {
                fragment.error = built.error();
            } else {
                fragment.sql = std::move(built->first);
                fragment.values = std::move(built->second);
            }
            return fragment;
        }
    };

    template <typename V>
    struct SelectState {
        std::optional<std::pair<std::string, std::vector<V>>> raw_head;
        bool distinct = false;
        std::vector<std::string> columns;
        std::vector<CaseWhen<V>> case_whens;
        std::vector<std::pair<RenderedFragment<V>, std::string>> subquery_columns;
        std::string from;
        std::optional<std::pair<RenderedFragment<V>, std::string>> from_subquery;
        std::vector<JoinClause<V>> joins;
        WhereState<V> where;
        AggregateClause<V> aggregate;
        std::vector<std::pair<RenderedFragment<V>, bool>> unions;  // bool: UNION ALL
        std::vector<std::pair<std::string, Order>> order_by;
        std::optional<V> limit;
        std::optional<V> offset;
        TailState<V> tail;
    };

    // SELECT 语句构建器
    // 子句按固定顺序输出: WITH, SELECT, FROM, JOIN, WHERE, GROUP BY, HAVING, UNION, ORDER BY, LIMIT/OFFSET
    template <typename V>
    class SelectBuilder : public WhereMixin<SelectBuilder<V>, V>, public StatementTailMixin<SelectBuilder<V>, V> {
      public:
        using value_type = V;

        SelectBuilder() = default;

        static SelectBuilder Columns(std::vector<std::string> columns) {
            SelectBuilder b;
            b.m_state.columns = std::move(columns);
            return b;
        }

        // 以原始 SQL 替换 "SELECT ... FROM ..." 头部
        static SelectBuilder Raw(std::string head, std::vector<V> values = {}) {
            SelectBuilder b;
            b.m_state.raw_head = std::make_pair(std::move(head), std::move(values));
            return b;
        }

        SelectBuilder &Distinct() {
            m_state.distinct = true;
            return *this;
        }

        SelectBuilder &AddColumns(const std::vector<std::string> &columns) {
            m_state.columns.insert(m_state.columns.end(), columns.begin(), columns.end());
            return *this;
        }

        SelectBuilder &From(std::string table) {
            m_state.from = std::move(table);
            return *this;
        }

        // FROM (subquery) AS alias
        template <typename Query>
        SelectBuilder &FromSubquery(const Query &subquery, std::string alias) {
            m_state.from_subquery = std::make_pair(RenderedFragment<V>::of(subquery), std::move(alias));
            return *this;
        }

        // (subquery) AS alias 作为投影列
        template <typename Query>
        SelectBuilder &SubqueryColumn(const Query &subquery, std::string alias) {
            m_state.subquery_columns.emplace_back(RenderedFragment<V>::of(subquery), std::move(alias));
            return *this;
        }

        SelectBuilder &Join(JoinClause<V> join) {
            m_state.joins.push_back(std::move(join));
            return *this;
        }

        SelectBuilder &Aggregate(const AggregateClause<V> &aggregate) {
            m_state.aggregate.Merge(aggregate);
            return *this;
        }

        SelectBuilder &GroupBy(std::vector<std::string> columns) {
            m_state.aggregate.GroupBy(std::move(columns));
            return *this;
        }

        SelectBuilder &Having(Expr<V> condition) {
            m_state.aggregate.Having(std::move(condition));
            return *this;
        }
        SelectBuilder &AndHaving(Expr<V> condition) {
            m_state.aggregate.AndHaving(std::move(condition));
            return *this;
        }
        SelectBuilder &OrHaving(Expr<V> condition) {
            m_state.aggregate.OrHaving(std::move(condition));
            return *this;
        }

        SelectBuilder &SelectCase(CaseWhen<V> case_when) {
            m_state.case_whens.push_back(std::move(case_when));
            return *this;
        }

        // 同一列再次排序时只更新方向, 位置不变
        SelectBuilder &OrderBy(const std::string &column, Order order = Order::Asc) {
            for (auto &entry : m_state.order_by) {
                if (entry.first == column) {
                    entry.second = order;
                    return *this;
                }
            }
            m_state.order_by.emplace_back(column, order);
            return *this;
        }

        // LIMIT ? [OFFSET ?], 两者都作为参数绑定; 再次调用覆盖之前的设置
        SelectBuilder &LimitOffset(V limit, std::optional<V> offset = std::nullopt) {
            m_state.limit = std::move(limit);
            m_state.offset = std::move(offset);
            return *this;
        }

        // 去掉 ORDER BY 与 LIMIT/OFFSET; 由同一条件派生计数查询时使用
        SelectBuilder &ClearOrderAndLimit() {
            m_state.order_by.clear();
            m_state.limit.reset();
            m_state.offset.reset();
            return *this;
        }

        // 游标分页: WHERE pk > ? ORDER BY pk ASC LIMIT ? (降序时为 < 与 DESC)
        SelectBuilder &Cursor(const std::string &pk_column, Order order, std::optional<V> cursor, V limit) {
            if (cursor) {
                auto column = Expr<V>::Col(pk_column);
                this->AndWhere(order == Order::Asc ? column.Gt(std::move(*cursor)) : column.Lt(std::move(*cursor)));
            }
            OrderBy(pk_column, order);
            return LimitOffset(std::move(limit));
        }

        SelectBuilder &Union(const SelectBuilder &other) {
            m_state.unions.emplace_back(RenderedFragment<V>::of(other), false);
            return *this;
        }

        SelectBuilder &UnionAll(const SelectBuilder &other) {
            m_state.unions.emplace_back(RenderedFragment<V>::of(other), true);
            return *this;
        }

        const std::string &table() const {
            return m_state.from;
        }

        BuildResult<V> Build() const;

        // 构建后清空内部状态, 构建器可以重新装配
        BuildResult<V> BuildMut() {
            auto result = Build();
            m_state = SelectState<V>();
            return result;
        }

        // CRTP mixin 访问器
        WhereState<V> &getWhereState_() {
            return m_state.where;
        }
        TailState<V> &getTailState_() {
            return m_state.tail;
        }

      private:
        std::optional<Error> renderProjection(std::string &sql, std::vector<V> &values) const;

        SelectState<V> m_state;
    };

    template <typename V>
    std::optional<Error> SelectBuilder<V>::renderProjection(std::string &sql, std::vector<V> &values) const {
        std::vector<std::string> items = m_state.columns;
        items.insert(items.end(), m_state.aggregate.projections().begin(), m_state.aggregate.projections().end());
        std::vector<V> projection_values;
        for (const auto &case_when : m_state.case_whens) {
            auto built = case_when.Build();
            if (!built) return built.error();
            items.push_back(std::move(built->first));
            projection_values.insert(projection_values.end(), built->second.begin(), built->second.end());
        }
        for (const auto &[fragment, alias] : m_state.subquery_columns) {
            if (fragment.error) return fragment.error;
            items.push_back("(" + fragment.sql + ") AS " + alias);
            projection_values.insert(projection_values.end(), fragment.values.begin(), fragment.values.end());
        }
        if (items.empty()) {
            sql += "*";
        }
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) sql += ", ";
            sql += items[i];
        }
        values.insert(values.end(), projection_values.begin(), projection_values.end());
        return std::nullopt;
    }

    template <typename V>
    BuildResult<V> SelectBuilder<V>::Build() const {
        if (auto err = m_state.where.firstError()) return std::unexpected(*err);

        std::string sql;
        std::vector<V> values;
        if (auto err = m_state.tail.renderPrefix(sql, values)) return std::unexpected(*err);

        if (m_state.raw_head) {
            sql += m_state.raw_head->first;
            values.insert(values.end(), m_state.raw_head->second.begin(), m_state.raw_head->second.end());
        } else {
            sql += m_state.distinct ? "SELECT DISTINCT " : "SELECT ";
            if (auto err = renderProjection(sql, values)) return std::unexpected(*err);
            if (m_state.from_subquery) {
                const auto &[fragment, alias] = *m_state.from_subquery;
                if (fragment.error) return std::unexpected(*fragment.error);
                sql += " FROM (" + fragment.sql + ") AS " + alias;
                values.insert(values.end(), fragment.values.begin(), fragment.values.end());
            } else if (!m_state.from.empty()) {
                sql += " FROM " + m_state.from;
            }
        }

        for (const auto &join : m_state.joins) {
            auto built = join.Build();
            if (!built) return std::unexpected(built.error());
            sql += " " + built->first;
            values.insert(values.end(), built->second.begin(), built->second.end());
        }

        m_state.where.render(sql, values);

        auto tail = m_state.aggregate.BuildTail();
        if (!tail) return std::unexpected(tail.error());
        sql += tail->first;
        values.insert(values.end(), tail->second.begin(), tail->second.end());

        for (const auto &[fragment, all] : m_state.unions) {
            if (fragment.error) return std::unexpected(*fragment.error);
            sql += all ? " UNION ALL " : " UNION ";
            sql += fragment.sql;
            values.insert(values.end(), fragment.values.begin(), fragment.values.end());
        }

        if (!m_state.order_by.empty()) {
            sql += " ORDER BY ";
            for (size_t i = 0; i < m_state.order_by.size(); ++i) {
                if (i > 0) sql += ", ";
                sql += m_state.order_by[i].first + " " + orderToString(m_state.order_by[i].second);
            }
        }

        if (m_state.limit) {
            sql += " LIMIT ?";
            values.push_back(*m_state.limit);
            if (m_state.offset) {
                sql += " OFFSET ?";
                values.push_back(*m_state.offset);
            }
        }

        m_state.tail.renderAppends(sql, values);
        return std::make_pair(std::move(sql), std::move(values));
    }

    extern template class SelectBuilder<sqlite::Value>;
    extern template class SelectBuilder<mysql::Value>;
    extern template class SelectBuilder<postgres::Value>;

}  // namespace sqlforge

#endif  // sqlforge_SELECT_BUILDER_H
