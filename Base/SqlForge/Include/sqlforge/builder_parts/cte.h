#ifndef sqlforge_BUILDER_PARTS_CTE_H
#define sqlforge_BUILDER_PARTS_CTE_H

#include <optional>
#include <string>
#include <vector>

#include "sqlforge/expr.h"

namespace sqlforge {

    // name[(c1, c2)] AS (body)
    // 定义时立即构建 body, 之后只保存渲染结果
    template <typename V>
    class Cte {
      public:
        template <typename Query>
        Cte(std::string name, const Query &body, std::vector<std::string> columns = {}) : m_name(std::move(name)), m_columns(std::move(columns)) {
            auto built = body.Build();
            if (!built) {
                m_error = built.error();
                return;
            }
            m_body = std::move(built->first);
            m_values = std::move(built->second);
        }

        const std::string &name() const {
            return m_name;
        }

        BuildResult<V> Build() const {
            if (m_error) return std::unexpected(*m_error);
            if (m_name.empty()) return std::unexpected(Error(ErrorCode::InvalidConfiguration, "CTE requires a name"));
            std::string sql = m_name;
            if (!m_columns.empty()) {
                sql += "(";
                for (size_t i = 0; i < m_columns.size(); ++i) {
                    if (i > 0) sql += ", ";
                    sql += m_columns[i];
                }
                sql += ")";
            }
            sql += " AS (" + m_body + ")";
            return std::make_pair(std::move(sql), m_values);
        }

      private:
        std::string m_name;
        std::vector<std::string> m_columns;
        std::string m_body;
        std::vector<V> m_values;
        std::optional<Error> m_error;
    };

    // WITH c1 AS (...), c2 AS (...)
    template <typename V>
    class WithCte {
      public:
        WithCte() = default;

        WithCte &Add(Cte<V> cte) {
            for (const auto &existing : m_ctes) {
                if (existing.name() == cte.name()) {
                    m_error = Error(ErrorCode::InvalidConfiguration, "Duplicate CTE name '" + cte.name() + "'");
                    return *this;
                }
            }
            m_ctes.push_back(std::move(cte));
            return *this;
        }

        template <typename Query>
        WithCte &Add(std::string name, const Query &body, std::vector<std::string> columns = {}) {
            return Add(Cte<V>(std::move(name), body, std::move(columns)));
        }

        bool isEmpty() const {
            return m_ctes.empty() && !m_error;
        }

        BuildResult<V> Build() const {
            if (m_error) return std::unexpected(*m_error);
            std::string sql = "WITH ";
            std::vector<V> values;
            for (size_t i = 0; i < m_ctes.size(); ++i) {
                auto built = m_ctes[i].Build();
                if (!built) return built;
                if (i > 0) sql += ", ";
                sql += built->first;
                values.insert(values.end(), std::make_move_iterator(built->second.begin()), std::make_move_iterator(built->second.end()));
            }
            return std::make_pair(std::move(sql), std::move(values));
        }

      private:
        std::vector<Cte<V>> m_ctes;
        std::optional<Error> m_error;
    };

}  // namespace sqlforge

#endif  // sqlforge_BUILDER_PARTS_CTE_H
