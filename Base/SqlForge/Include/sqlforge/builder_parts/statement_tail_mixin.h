#ifndef sqlforge_BUILDER_PARTS_STATEMENT_TAIL_MIXIN_H
#define sqlforge_BUILDER_PARTS_STATEMENT_TAIL_MIXIN_H

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sqlforge/builder_parts/cte.h"
#include "sqlforge/dialect.h"

namespace sqlforge {

    // WITH 前缀, RETURNING 以及原样追加的尾部片段
    template <typename V>
    struct TailState {
        std::optional<WithCte<V>> with;
        std::vector<std::string> returning;
        std::vector<std::pair<std::string, std::vector<V>>> appends;

        // 渲染 "WITH ... " 前缀
        std::optional<Error> renderPrefix(std::string &sql, std::vector<V> &values) const {
            if (!with || with->isEmpty()) return std::nullopt;
            auto built = with->Build();
            if (!built) return built.error();
            sql += built->first + " ";
            values.insert(values.end(), std::make_move_iterator(built->second.begin()), std::make_move_iterator(built->second.end()));
            return std::nullopt;
        }

        std::optional<Error> renderReturning(std::string &sql) const {
            if (returning.empty()) return std::nullopt;
            if constexpr (!Dialect<V>::supports_returning) {
                return errors::unsupportedFeature(std::string("RETURNING is not supported by ") + Dialect<V>::name);
            }
            sql += " RETURNING ";
            for (size_t i = 0; i < returning.size(); ++i) {
                if (i > 0) sql += ", ";
                sql += returning[i];
            }
            return std::nullopt;
        }

        void renderAppends(std::string &sql, std::vector<V> &values) const {
            for (const auto &[text, params] : appends) {
                if (text.empty()) continue;
                if (text.front() != ' ') sql += " ";
                sql += text;
                values.insert(values.end(), params.begin(), params.end());
            }
        }
    };

    template <typename Derived, typename V>
    class StatementTailMixin {
      protected:
        TailState<V> &_tailState() {
            return static_cast<Derived *>(this)->getTailState_();
        }

      public:
        Derived &With(WithCte<V> with) {
            _tailState().with = std::move(with);
            return static_cast<Derived &>(*this);
        }

        Derived &With(Cte<V> cte) {
            WithCte<V> with;
            with.Add(std::move(cte));
            return With(std::move(with));
        }

        Derived &Returning(std::vector<std::string> columns) {
            _tailState().returning = std::move(columns);
            return static_cast<Derived &>(*this);
        }

        // 原样追加到语句末尾
        Derived &Append(std::string sql, std::vector<V> values = {}) {
            _tailState().appends.emplace_back(std::move(sql), std::move(values));
            return static_cast<Derived &>(*this);
        }
    };

}  // namespace sqlforge

#endif  // sqlforge_BUILDER_PARTS_STATEMENT_TAIL_MIXIN_H
