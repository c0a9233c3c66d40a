#ifndef sqlforge_BUILDER_PARTS_SUBQUERY_H
#define sqlforge_BUILDER_PARTS_SUBQUERY_H

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "sqlforge/expr.h"

namespace sqlforge {

    // 可嵌入的受限 SELECT
    // 只记录 文本/绑定 片段序列, 追加到外层语句时由外层统一编号
    template <typename V>
    class Subquery {
      public:
        using Part = std::variant<std::string, V>;

        Subquery() = default;

        Subquery &Select(const std::vector<std::string> &columns) {
            std::string text = "SELECT ";
            if (columns.empty()) {
                text += "*";
            }
            for (size_t i = 0; i < columns.size(); ++i) {
                if (i > 0) text += ", ";
                text += columns[i];
            }
            m_parts.emplace_back(std::move(text));
            return *this;
        }

        // 投影实体的全部列
        template <typename Entity>
        Subquery &SelectDefault() {
            std::vector<std::string> columns;
            for (const auto &field : Entity::getEntityMeta().fields) {
                columns.push_back(field.db_name);
            }
            return Select(columns);
        }

        Subquery &From(const std::string &table) {
            m_parts.emplace_back(" FROM " + table);
            return *this;
        }

        // 只允许一个 WHERE
        Subquery &Where(const Expr<V> &condition) {
            if (condition.hasError()) {
                setError(*condition.error());
                return *this;
            }
            if (condition.isEmpty()) return *this;
            if (m_has_where) {
                setError(errors::duplicateWhereClause());
                return *this;
            }
            m_has_where = true;
            m_parts.emplace_back(std::string(" WHERE "));
            pushClause(condition.clause(), condition.values());
            return *this;
        }

        Subquery &PushSql(std::string text) {
            m_parts.emplace_back(std::move(text));
            return *this;
        }

        Subquery &PushBind(V value) {
            m_parts.emplace_back(std::move(value));
            return *this;
        }

        const std::vector<Part> &parts() const {
            return m_parts;
        }

        // 以 " (...) " 的形式追加到外层片段序列
        std::optional<Error> AppendTo(std::vector<Part> &target) const {
            if (m_error) return m_error;
            target.emplace_back(std::string(" ("));
            target.insert(target.end(), m_parts.begin(), m_parts.end());
            target.emplace_back(std::string(") "));
            return std::nullopt;
        }

        BuildResult<V> Build() const {
            if (m_error) return std::unexpected(*m_error);
            std::string sql;
            std::vector<V> values;
            for (const auto &part : m_parts) {
                if (const auto *text = std::get_if<std::string>(&part)) {
                    sql += *text;
                } else {
                    sql += "?";
                    values.push_back(std::get<V>(part));
                }
            }
            return std::make_pair(std::move(sql), std::move(values));
        }

      private:
        // 按 ? 拆分为文本与绑定片段
        void pushClause(const std::string &clause, const std::vector<V> &values) {
            size_t value_index = 0;
            std::string text;
            for (char c : clause) {
                if (c == '?' && value_index < values.size()) {
                    if (!text.empty()) m_parts.emplace_back(std::exchange(text, std::string()));
                    m_parts.emplace_back(values[value_index++]);
                } else {
                    text += c;
                }
            }
            if (!text.empty()) m_parts.emplace_back(std::move(text));
        }

        void setError(Error error) {
            if (!m_error) m_error = std::move(error);
        }

        std::vector<Part> m_parts;
        bool m_has_where = false;
        std::optional<Error> m_error;
    };

}  // namespace sqlforge

#endif  // sqlforge_BUILDER_PARTS_SUBQUERY_H
