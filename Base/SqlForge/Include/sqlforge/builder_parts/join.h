#ifndef sqlforge_BUILDER_PARTS_JOIN_H
#define sqlforge_BUILDER_PARTS_JOIN_H

#include <string>

#include "sqlforge/expr.h"
#include "sqlforge/types.h"

namespace sqlforge {

    // <KIND> JOIN <table> [ON <expr>]
    template <typename V>
    class JoinClause {
      public:
        JoinClause(JoinType type, std::string table) : m_type(type), m_table(std::move(table)) {
        }

        static JoinClause Inner(std::string table) {
            return JoinClause(JoinType::Inner, std::move(table));
        }
        static JoinClause Left(std::string table) {
            return JoinClause(JoinType::Left, std::move(table));
        }
        static JoinClause Right(std::string table) {
            return JoinClause(JoinType::Right, std::move(table));
        }
        static JoinClause Full(std::string table) {
            return JoinClause(JoinType::Full, std::move(table));
        }
        static JoinClause Cross(std::string table) {
            return JoinClause(JoinType::Cross, std::move(table));
        }

        JoinClause &On(Expr<V> condition) {
            m_on = m_on.And(std::move(condition));
            return *this;
        }
        JoinClause &On(std::string raw_condition) {
            return On(Expr<V>::FromStr(std::move(raw_condition)));
        }
        JoinClause &And(Expr<V> condition) {
            return On(std::move(condition));
        }
        JoinClause &Or(Expr<V> condition) {
            m_on = Expr<V>::JoinBareOr(std::move(m_on), std::move(condition));
            return *this;
        }

        JoinType type() const {
            return m_type;
        }
        const std::string &table() const {
            return m_table;
        }

        BuildResult<V> Build() const {
            if (m_table.empty()) {
                return std::unexpected(Error(ErrorCode::InvalidConfiguration, "JOIN requires a target table"));
            }
            if (m_on.hasError()) return std::unexpected(*m_on.error());
            std::string sql = std::string(joinTypeToString(m_type)) + " " + m_table;
            if (m_type == JoinType::Cross) {
                return std::make_pair(std::move(sql), std::vector<V>{});
            }
            if (m_on.isEmpty()) {
                return std::unexpected(Error(ErrorCode::InvalidConfiguration, "JOIN on table '" + m_table + "' requires an ON condition"));
            }
            sql += " ON " + m_on.clause();
            return std::make_pair(std::move(sql), m_on.values());
        }

      private:
        JoinType m_type;
        std::string m_table;
        Expr<V> m_on;
    };

}  // namespace sqlforge

#endif  // sqlforge_BUILDER_PARTS_JOIN_H
