#ifndef sqlforge_DELETE_BUILDER_H
#define sqlforge_DELETE_BUILDER_H

#include <string>
#include <utility>
#include <vector>

#include "sqlforge/builder_parts/statement_tail_mixin.h"
#include "sqlforge/builder_parts/where_mixin.h"
#include "sqlforge/dialect.h"
#include "sqlforge/expr.h"

namespace sqlforge {

    // DELETE 语句构建器
    template <typename V>
    class DeleteBuilder : public WhereMixin<DeleteBuilder<V>, V>, public StatementTailMixin<DeleteBuilder<V>, V> {
      public:
        using value_type = V;

        DeleteBuilder() = default;

        static DeleteBuilder From(std::string table) {
            DeleteBuilder b;
            b.m_table = std::move(table);
            return b;
        }

        // WHERE k1 = ? AND k2 = ?, 按主键声明顺序绑定
        DeleteBuilder &ByPrimaryKey(const std::vector<std::string> &keys, const std::vector<V> &values) {
            if (keys.empty()) {
                this->AndWhere(Expr<V>::FromError(errors::noPrimaryKeyDefined()));
                return *this;
            }
            if (keys.size() != values.size()) {
                this->AndWhere(Expr<V>::FromError(errors::compositeKeyTypeInvalid(keys.size(), values.size())));
                return *this;
            }
            for (size_t i = 0; i < keys.size(); ++i) {
                this->AndWhere(Expr<V>::Col(keys[i]).Eq(values[i]));
            }
            return *this;
        }

        const std::string &table() const {
            return m_table;
        }

        BuildResult<V> Build() const {
            if (auto err = m_where.firstError()) return std::unexpected(*err);
            if (m_table.empty()) return std::unexpected(Error(ErrorCode::InvalidConfiguration, "DELETE requires a table name"));

            std::string sql;
            std::vector<V> values;
            if (auto err = m_tail.renderPrefix(sql, values)) return std::unexpected(*err);
            sql += "DELETE FROM " + m_table;
            m_where.render(sql, values);
            if (auto err = m_tail.renderReturning(sql)) return std::unexpected(*err);
            m_tail.renderAppends(sql, values);
            return std::make_pair(std::move(sql), std::move(values));
        }

        BuildResult<V> BuildMut() {
            auto result = Build();
            *this = DeleteBuilder();
            return result;
        }

        WhereState<V> &getWhereState_() {
            return m_where;
        }
        TailState<V> &getTailState_() {
            return m_tail;
        }

      private:
        std::string m_table;
        WhereState<V> m_where;
        TailState<V> m_tail;
    };

    extern template class DeleteBuilder<sqlite::Value>;
    extern template class DeleteBuilder<mysql::Value>;
    extern template class DeleteBuilder<postgres::Value>;

}  // namespace sqlforge

#endif  // sqlforge_DELETE_BUILDER_H
