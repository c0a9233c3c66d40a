#ifndef sqlforge_TYPES_H
#define sqlforge_TYPES_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sqlforge {

    enum class Order { Asc, Desc };

    inline const char *orderToString(Order order) {
        return order == Order::Asc ? "ASC" : "DESC";
    }

    enum class JoinType { Inner, Left, Right, Full, Cross };

    inline const char *joinTypeToString(JoinType type) {
        switch (type) {
            case JoinType::Inner:
                return "INNER JOIN";
            case JoinType::Left:
                return "LEFT JOIN";
            case JoinType::Right:
                return "RIGHT JOIN";
            case JoinType::Full:
                return "FULL OUTER JOIN";
            case JoinType::Cross:
                return "CROSS JOIN";
        }
        return "JOIN";
    }

    // 主键描述: 单列(可自增) 或 复合(至少两列)
    class PrimaryKey {
      public:
        static PrimaryKey Single(std::string name, bool auto_generate = true) {
            PrimaryKey pk;
            pk.m_names.push_back(std::move(name));
            pk.m_auto_generate = auto_generate;
            pk.m_composite = false;
            return pk;
        }

        static PrimaryKey Composite(std::vector<std::string> names) {
            PrimaryKey pk;
            pk.m_names = std::move(names);
            pk.m_composite = true;
            return pk;
        }

        bool isSingle() const {
            return !m_composite;
        }
        bool isComposite() const {
            return m_composite;
        }
        const std::vector<std::string> &keys() const {
            return m_names;
        }
        const std::string &name() const {
            return m_names.front();
        }
        // 复合主键从不自增
        bool autoGenerate() const {
            return !m_composite && m_auto_generate;
        }

        bool isValid() const {
            if (m_names.empty()) return false;
            if (m_composite && m_names.size() < 2) return false;
            for (const auto &n : m_names) {
                if (n.empty()) return false;
            }
            return true;
        }

        bool contains(const std::string &column) const {
            for (const auto &n : m_names) {
                if (n == column) return true;
            }
            return false;
        }

      private:
        PrimaryKey() = default;

        std::vector<std::string> m_names;
        bool m_auto_generate = false;
        bool m_composite = false;
    };

    template <typename T>
    struct PaginatedResult {
        std::vector<T> data;
        std::uint64_t total = 0;
        std::uint64_t page_number = 0;
        std::uint64_t page_size = 0;
    };

    template <typename T, typename C>
    struct CursorPaginatedResult {
        std::vector<T> data;
        std::optional<C> next_cursor;
        std::optional<C> prev_cursor;
        std::uint64_t limit = 0;
        Order sort_order = Order::Asc;

        CursorPaginatedResult() = default;
        CursorPaginatedResult(std::vector<T> rows, std::uint64_t page_limit, Order order) : data(std::move(rows)), limit(page_limit), sort_order(order) {
        }

        bool hasNextPage() const {
            return next_cursor.has_value() && !data.empty();
        }
        bool hasPrevPage() const {
            return prev_cursor.has_value() && !data.empty();
        }

        // 只有取满一页时才生成游标
        void genCursors(const std::function<C(const T &)> &extractor) {
            if (data.empty() || data.size() != limit) return;
            const T &first = data.front();
            const T &last = data.back();
            if (sort_order == Order::Asc) {
                next_cursor = extractor(last);
                prev_cursor = extractor(first);
            } else {
                next_cursor = extractor(first);
                prev_cursor = extractor(last);
            }
        }
    };

    // 软删除配置: 字段名 + 不启用软删除的表
    struct SoftDeleteConfig {
        std::string field;
        std::vector<std::string> exclude_tables;

        bool excludes(const std::string &table) const {
            for (const auto &t : exclude_tables) {
                if (t == table) return true;
            }
            return false;
        }
    };

    // 执行结果
    struct ExecResult {
        std::uint64_t rows_affected = 0;
        std::uint64_t last_insert_id = 0;
    };

}  // namespace sqlforge

#endif  // sqlforge_TYPES_H
