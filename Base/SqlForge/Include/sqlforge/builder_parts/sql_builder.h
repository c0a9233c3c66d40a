#ifndef sqlforge_BUILDER_PARTS_SQL_BUILDER_H
#define sqlforge_BUILDER_PARTS_SQL_BUILDER_H

#include <string>
#include <vector>

#include "sqlforge/expr.h"

namespace sqlforge {

    // 手写 SQL 语句; 也用作事务批次中已构建好的语句
    template <typename V>
    class SqlBuilder {
      public:
        SqlBuilder() = default;

        static SqlBuilder Raw(std::string sql, std::vector<V> values = {}) {
            SqlBuilder b;
            b.m_sql = std::move(sql);
            b.m_values = std::move(values);
            return b;
        }

        // 从任意构建器得到的结果构造
        template <typename Builder>
        static std::expected<SqlBuilder, Error> From(const Builder &builder) {
            auto built = builder.Build();
            if (!built) return std::unexpected(built.error());
            return Raw(std::move(built->first), std::move(built->second));
        }

        SqlBuilder &Prepend(const std::string &sql, std::vector<V> values = {}) {
            m_sql = m_sql.empty() ? sql : sql + " " + m_sql;
            values.insert(values.end(), std::make_move_iterator(m_values.begin()), std::make_move_iterator(m_values.end()));
            m_values = std::move(values);
            return *this;
        }

        SqlBuilder &Append(const std::string &sql, std::vector<V> values = {}) {
            m_sql = m_sql.empty() ? sql : m_sql + " " + sql;
            m_values.insert(m_values.end(), std::make_move_iterator(values.begin()), std::make_move_iterator(values.end()));
            return *this;
        }

        const std::string &sql() const {
            return m_sql;
        }
        const std::vector<V> &values() const {
            return m_values;
        }

        BuildResult<V> Build() const {
            if (m_sql.empty()) return std::unexpected(Error(ErrorCode::InvalidConfiguration, "Empty SQL statement"));
            return std::make_pair(m_sql, m_values);
        }

      private:
        std::string m_sql;
        std::vector<V> m_values;
    };

}  // namespace sqlforge

#endif  // sqlforge_BUILDER_PARTS_SQL_BUILDER_H
