#ifndef sqlforge_BUILDER_PARTS_AGGREGATE_H
#define sqlforge_BUILDER_PARTS_AGGREGATE_H

#include <string>
#include <vector>

#include "sqlforge/expr.h"

namespace sqlforge {

    // 聚合投影 FUNC(col) [AS alias] + GROUP BY + HAVING
    template <typename V>
    class AggregateClause {
      public:
        AggregateClause() = default;

        AggregateClause &Func(const std::string &function, const std::string &column, const std::string &alias = "") {
            std::string projection = function + "(" + column + ")";
            if (!alias.empty()) projection += " AS " + alias;
            m_projections.push_back(std::move(projection));
            return *this;
        }

        AggregateClause &Count(const std::string &column, const std::string &alias = "") {
            return Func("COUNT", column, alias);
        }
        AggregateClause &Sum(const std::string &column, const std::string &alias = "") {
            return Func("SUM", column, alias);
        }
        AggregateClause &Avg(const std::string &column, const std::string &alias = "") {
            return Func("AVG", column, alias);
        }
        AggregateClause &Min(const std::string &column, const std::string &alias = "") {
            return Func("MIN", column, alias);
        }
        AggregateClause &Max(const std::string &column, const std::string &alias = "") {
            return Func("MAX", column, alias);
        }

        AggregateClause &GroupBy(std::vector<std::string> columns) {
            m_group_by = std::move(columns);
            return *this;
        }

        AggregateClause &Having(Expr<V> condition) {
            return AndHaving(std::move(condition));
        }
        AggregateClause &AndHaving(Expr<V> condition) {
            m_having = m_having.And(std::move(condition));
            return *this;
        }
        AggregateClause &OrHaving(Expr<V> condition) {
            m_having = Expr<V>::JoinBareOr(std::move(m_having), std::move(condition));
            return *this;
        }

        // 合并另一个聚合子句: 投影追加, GROUP BY 以非空者为准, HAVING 以 AND 连接
        AggregateClause &Merge(const AggregateClause &other) {
            m_projections.insert(m_projections.end(), other.m_projections.begin(), other.m_projections.end());
            if (!other.m_group_by.empty()) m_group_by = other.m_group_by;
            m_having = m_having.And(other.m_having);
            return *this;
        }

        const std::vector<std::string> &projections() const {
            return m_projections;
        }
        const std::vector<std::string> &groupBy() const {
            return m_group_by;
        }
        const Expr<V> &having() const {
            return m_having;
        }

        bool isEmpty() const {
            return m_projections.empty() && m_group_by.empty() && m_having.isEmpty();
        }

        // 渲染 " GROUP BY ..." 与 " HAVING ..." 两段
        BuildResult<V> BuildTail() const {
            if (m_having.hasError()) return std::unexpected(*m_having.error());
            if (!m_having.isEmpty() && m_group_by.empty() && m_projections.empty()) {
                return std::unexpected(Error(ErrorCode::InvalidConfiguration, "HAVING requires GROUP BY or an aggregate"));
            }
            std::string sql;
            if (!m_group_by.empty()) {
                sql += " GROUP BY ";
                for (size_t i = 0; i < m_group_by.size(); ++i) {
                    if (i > 0) sql += ", ";
                    sql += m_group_by[i];
                }
            }
            std::vector<V> values;
            if (!m_having.isEmpty()) {
                sql += " HAVING " + m_having.clause();
                values = m_having.values();
            }
            return std::make_pair(std::move(sql), std::move(values));
        }

      private:
        std::vector<std::string> m_projections;
        std::vector<std::string> m_group_by;
        Expr<V> m_having;
    };

}  // namespace sqlforge

#endif  // sqlforge_BUILDER_PARTS_AGGREGATE_H
