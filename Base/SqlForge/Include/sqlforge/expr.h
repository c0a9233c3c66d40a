#ifndef sqlforge_EXPR_H
#define sqlforge_EXPR_H

#include <expected>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "sqlforge/error.h"

namespace sqlforge {

    template <typename V>
    using BuildResult = std::expected<std::pair<std::string, std::vector<V>>, Error>;

    template <typename V>
    class ColumnExpr;

    // 带 ? 占位符的 SQL 片段 + 与之一一对应的参数列表
    // 任何叶子产生的错误会一直传递到最终的 Build()
    template <typename V>
    class Expr {
      public:
        using value_type = V;

        Expr() = default;
        Expr(std::string clause, std::vector<V> values) : m_clause(std::move(clause)), m_values(std::move(values)) {
        }

        static ColumnExpr<V> Col(std::string name) {
            return ColumnExpr<V>(std::move(name));
        }

        static Expr FromStr(std::string sql) {
            return Expr(std::move(sql), {});
        }

        static Expr Raw(std::string sql, std::vector<V> values) {
            return Expr(std::move(sql), std::move(values));
        }

        static Expr FromError(Error error) {
            Expr e;
            e.m_error = std::move(error);
            return e;
        }

        template <typename Query>
        static Expr Exists(const Query &subquery) {
            return wrapSubquery("EXISTS ", subquery);
        }

        template <typename Query>
        static Expr NotExists(const Query &subquery) {
            return wrapSubquery("NOT EXISTS ", subquery);
        }

        // a AND b; 语句级累积出来的裸 OR 会先加括号
        Expr And(Expr other) const {
            if (m_error) return *this;
            if (other.m_error) return other;
            if (isEmpty()) return other;
            if (other.isEmpty()) return *this;
            Expr result(guarded() + " AND " + other.guarded(), m_values);
            result.m_values.insert(result.m_values.end(), std::make_move_iterator(other.m_values.begin()), std::make_move_iterator(other.m_values.end()));
            return result;
        }

        // (a OR b)
        Expr Or(Expr other) const {
            if (m_error) return *this;
            if (other.m_error) return other;
            if (isEmpty()) return other;
            if (other.isEmpty()) return *this;
            Expr result("(" + m_clause + " OR " + other.m_clause + ")", m_values);
            result.m_values.insert(result.m_values.end(), std::make_move_iterator(other.m_values.begin()), std::make_move_iterator(other.m_values.end()));
            return result;
        }

        Expr Not() const {
            if (m_error || isEmpty()) return *this;
            return Expr("NOT (" + m_clause + ")", m_values);
        }

        Expr Paren() const {
            if (m_error || isEmpty()) return *this;
            return Expr("(" + m_clause + ")", m_values);
        }

        // 语句级 OrWhere 使用: 不加括号地拼接, 结果标记为裸 OR
        static Expr JoinBareOr(Expr lhs, Expr rhs) {
            if (lhs.m_error) return lhs;
            if (rhs.m_error) return rhs;
            if (lhs.isEmpty()) return rhs;
            if (rhs.isEmpty()) return lhs;
            Expr result(lhs.m_clause + " OR " + rhs.m_clause, std::move(lhs.m_values));
            result.m_values.insert(result.m_values.end(), std::make_move_iterator(rhs.m_values.begin()), std::make_move_iterator(rhs.m_values.end()));
            result.m_bare_or = true;
            return result;
        }

        bool isEmpty() const {
            return m_clause.empty() && !m_error;
        }
        bool isBareOr() const {
            return m_bare_or;
        }
        bool hasError() const {
            return m_error.has_value();
        }
        const std::optional<Error> &error() const {
            return m_error;
        }
        const std::string &clause() const {
            return m_clause;
        }
        const std::vector<V> &values() const {
            return m_values;
        }

        // 裸 OR 在与其他条件拼接时需要括号
        std::string guarded() const {
            return m_bare_or ? "(" + m_clause + ")" : m_clause;
        }

        BuildResult<V> Build() const {
            if (m_error) return std::unexpected(*m_error);
            return std::make_pair(m_clause, m_values);
        }

      private:
        template <typename Query>
        static Expr wrapSubquery(const char *prefix, const Query &subquery) {
            auto built = subquery.Build();
            if (!built) return FromError(built.error());
            return Expr(std::string(prefix) + "(" + built->first + ")", std::move(built->second));
        }

        std::string m_clause;
        std::vector<V> m_values;
        bool m_bare_or = false;
        std::optional<Error> m_error;
    };

    // Expr::Col(name) 的中间产物, 由比较运算符收尾
    template <typename V>
    class ColumnExpr {
      public:
        explicit ColumnExpr(std::string name) : m_name(std::move(name)) {
        }

        // table.column
        ColumnExpr Qualify(const std::string &table) const {
            if (m_name.empty() || table.empty()) return *this;
            return ColumnExpr(table + "." + m_name);
        }

        const std::string &name() const {
            return m_name;
        }

        Expr<V> Eq(V value) const {
            return binary("=", std::move(value));
        }
        Expr<V> Ne(V value) const {
            return binary("!=", std::move(value));
        }
        Expr<V> Lt(V value) const {
            return binary("<", std::move(value));
        }
        Expr<V> Lte(V value) const {
            return binary("<=", std::move(value));
        }
        Expr<V> Gt(V value) const {
            return binary(">", std::move(value));
        }
        Expr<V> Gte(V value) const {
            return binary(">=", std::move(value));
        }
        Expr<V> Like(V value) const {
            return binary("LIKE", std::move(value));
        }

        Expr<V> IsNull() const {
            if (m_name.empty()) return Expr<V>::FromError(errors::invalidColumnName());
            return Expr<V>(m_name + " IS NULL", {});
        }
        Expr<V> IsNotNull() const {
            if (m_name.empty()) return Expr<V>::FromError(errors::invalidColumnName());
            return Expr<V>(m_name + " IS NOT NULL", {});
        }

        Expr<V> In(std::vector<V> values) const {
            return inList("IN", std::move(values));
        }
        Expr<V> NotIn(std::vector<V> values) const {
            return inList("NOT IN", std::move(values));
        }

        template <typename T, std::enable_if_t<!std::is_same_v<T, V>, int> = 0>
        Expr<V> In(const std::vector<T> &values) const {
            return In(std::vector<V>(values.begin(), values.end()));
        }
        template <typename T, std::enable_if_t<!std::is_same_v<T, V>, int> = 0>
        Expr<V> NotIn(const std::vector<T> &values) const {
            return NotIn(std::vector<V>(values.begin(), values.end()));
        }

        Expr<V> Between(V low, V high) const {
            if (m_name.empty()) return Expr<V>::FromError(errors::invalidColumnName());
            return Expr<V>(m_name + " BETWEEN ? AND ?", {std::move(low), std::move(high)});
        }

        template <typename Query>
        Expr<V> InSubquery(const Query &subquery) const {
            return subqueryPredicate(" IN ", subquery);
        }
        template <typename Query>
        Expr<V> NotInSubquery(const Query &subquery) const {
            return subqueryPredicate(" NOT IN ", subquery);
        }

      private:
        Expr<V> binary(const char *op, V value) const {
            if (m_name.empty()) return Expr<V>::FromError(errors::invalidColumnName());
            std::string clause;
            clause.reserve(m_name.size() + 8);
            clause.append(m_name).append(" ").append(op).append(" ?");
            return Expr<V>(std::move(clause), {std::move(value)});
        }

        Expr<V> inList(const char *op, std::vector<V> values) const {
            if (m_name.empty()) return Expr<V>::FromError(errors::invalidColumnName());
            if (values.empty()) return Expr<V>::FromError(errors::emptyInList(m_name));
            std::string placeholders;
            placeholders.reserve(values.size() * 3);
            for (size_t i = 0; i < values.size(); ++i) {
                placeholders += (i == 0 ? "?" : ", ?");
            }
            return Expr<V>(m_name + " " + op + " (" + placeholders + ")", std::move(values));
        }

        template <typename Query>
        Expr<V> subqueryPredicate(const char *op, const Query &subquery) const {
            if (m_name.empty()) return Expr<V>::FromError(errors::invalidColumnName());
            auto built = subquery.Build();
            if (!built) return Expr<V>::FromError(built.error());
            return Expr<V>(m_name + op + "(" + built->first + ")", std::move(built->second));
        }

        std::string m_name;
    };

}  // namespace sqlforge

#endif  // sqlforge_EXPR_H
