#ifndef sqlforge_BUILDER_PARTS_WHERE_MIXIN_H
#define sqlforge_BUILDER_PARTS_WHERE_MIXIN_H

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sqlforge/expr.h"

namespace sqlforge {

    // WHERE 子句状态: 一组以 AND 连接的顶层条件组
    template <typename V>
    struct WhereState {
        std::vector<Expr<V>> groups;

        void where(Expr<V> condition) {
            if (condition.isEmpty()) return;
            groups.push_back(std::move(condition));
        }

        void andWhere(Expr<V> condition) {
            if (condition.isEmpty()) return;
            if (groups.empty()) {
                groups.push_back(std::move(condition));
            } else {
                groups.back() = groups.back().And(std::move(condition));
            }
        }

        void orWhere(Expr<V> condition) {
            if (condition.isEmpty()) return;
            if (groups.empty()) {
                groups.push_back(std::move(condition));
            } else {
                groups.back() = Expr<V>::JoinBareOr(std::move(groups.back()), std::move(condition));
            }
        }

        bool isEmpty() const {
            return groups.empty();
        }

        std::optional<Error> firstError() const {
            for (const auto &g : groups) {
                if (g.hasError()) return *g.error();
            }
            return std::nullopt;
        }

        // 追加 " WHERE ..." 到 sql, 参数追加到 values
        void render(std::string &sql, std::vector<V> &values) const {
            if (groups.empty()) return;
            sql += " WHERE ";
            for (size_t i = 0; i < groups.size(); ++i) {
                if (i > 0) sql += " AND ";
                sql += groups.size() > 1 ? groups[i].guarded() : groups[i].clause();
                values.insert(values.end(), groups[i].values().begin(), groups[i].values().end());
            }
        }
    };

    // 为语句构建器提供 Where / AndWhere / OrWhere / TakeWhere
    template <typename Derived, typename V>
    class WhereMixin {
      protected:
        WhereState<V> &_whereState() {
            return static_cast<Derived *>(this)->getWhereState_();
        }

      public:
        // 开启一个新的顶层条件组
        Derived &Where(Expr<V> condition) {
            _whereState().where(std::move(condition));
            return static_cast<Derived &>(*this);
        }

        Derived &AndWhere(Expr<V> condition) {
            _whereState().andWhere(std::move(condition));
            return static_cast<Derived &>(*this);
        }

        Derived &OrWhere(Expr<V> condition) {
            _whereState().orWhere(std::move(condition));
            return static_cast<Derived &>(*this);
        }

        // 取出全部 WHERE 条件组, 构建器中的 WHERE 被清空
        std::vector<Expr<V>> TakeWhere() {
            return std::exchange(_whereState().groups, {});
        }
    };

}  // namespace sqlforge

#endif  // sqlforge_BUILDER_PARTS_WHERE_MIXIN_H
