#ifndef sqlforge_BUILDER_PARTS_CASE_WHEN_H
#define sqlforge_BUILDER_PARTS_CASE_WHEN_H

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sqlforge/expr.h"

namespace sqlforge {

    // CASE WHEN p1 THEN r1 ... [ELSE e] END [AS alias]
    // 结果值都以参数形式绑定
    template <typename V>
    class CaseWhen {
      public:
        CaseWhen() = default;

        CaseWhen &When(Expr<V> condition, V result) {
            m_arms.emplace_back(std::move(condition), std::move(result));
            return *this;
        }

        CaseWhen &Else(V value) {
            m_else = std::move(value);
            return *this;
        }

        CaseWhen &As(std::string alias) {
            m_alias = std::move(alias);
            return *this;
        }

        const std::string &alias() const {
            return m_alias;
        }

        // 不带别名的 CASE 表达式, 用于 UPDATE ... SET col = CASE ...
        BuildResult<V> BuildExpression() const {
            if (m_arms.empty()) {
                return std::unexpected(Error(ErrorCode::InvalidConfiguration, "CASE requires at least one WHEN arm"));
            }
            std::string sql = "CASE";
            std::vector<V> values;
            for (const auto &[condition, result] : m_arms) {
                if (condition.hasError()) return std::unexpected(*condition.error());
                if (condition.isEmpty()) {
                    return std::unexpected(Error(ErrorCode::InvalidConfiguration, "CASE WHEN arm requires a condition"));
                }
                sql += " WHEN " + condition.clause() + " THEN ?";
                values.insert(values.end(), condition.values().begin(), condition.values().end());
                values.push_back(result);
            }
            if (m_else) {
                sql += " ELSE ?";
                values.push_back(*m_else);
            }
            sql += " END";
            return std::make_pair(std::move(sql), std::move(values));
        }

        BuildResult<V> Build() const {
            auto built = BuildExpression();
            if (!built) return built;
            if (!m_alias.empty()) built->first += " AS " + m_alias;
            return built;
        }

      private:
        std::vector<std::pair<Expr<V>, V>> m_arms;
        std::optional<V> m_else;
        std::string m_alias;
    };

}  // namespace sqlforge

#endif  // sqlforge_BUILDER_PARTS_CASE_WHEN_H
