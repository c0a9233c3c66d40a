#ifndef sqlforge_SINGLE_KEY_TABLE_H
#define sqlforge_SINGLE_KEY_TABLE_H

#include "sqlforge/keyed_table.h"

namespace sqlforge {

    // 单列主键表门面
    template <typename T, typename V>
    class SingleKeyTable : public KeyedTable<T, V> {
      public:
        SingleKeyTable(std::shared_ptr<IQueryExecutor<V>> executor, std::string table, std::string primary_key, bool auto_generate = true, TableScope<V> scope = TableScope<V>::fromGlobal())
            : KeyedTable<T, V>(std::move(executor), TableQuery<T, V>(std::move(table), PrimaryKey::Single(std::move(primary_key), auto_generate), std::move(scope))) {
        }

        explicit SingleKeyTable(std::shared_ptr<IQueryExecutor<V>> executor, TableScope<V> scope = TableScope<V>::fromGlobal())
            : KeyedTable<T, V>(std::move(executor), TableQuery<T, V>::ForEntity(std::move(scope))) {
        }

        std::expected<ExecResult, Error> DeleteByPk(const V &key) {
            return this->run(this->m_query.DeleteByPk({key}));
        }
        std::expected<ExecResult, Error> DeleteMany(const std::vector<V> &keys) {
            return this->run(this->m_query.DeleteMany(keys));
        }
        // 未配置软删除时返回 SoftDeleteConfigNotSet, 不会退化为物理删除
        std::expected<ExecResult, Error> SoftDeleteByPk(const V &key) {
            return this->run(this->m_query.SoftDeleteByPk({key}));
        }
        std::expected<ExecResult, Error> RestoreByPk(const V &key) {
            return this->run(this->m_query.RestoreByPk({key}));
        }
        std::expected<ExecResult, Error> RestoreMany(const std::vector<V> &keys) {
            return this->run(this->m_query.RestoreMany(keys));
        }
        std::expected<std::optional<T>, Error> GetOneByPk(const V &key) {
            return this->fetchOptional(this->m_query.GetOneByPk({key}));
        }

        using KeyedTable<T, V>::GetListByCursor;

        // 以主键为游标: WHERE pk > ? ORDER BY pk ASC LIMIT ?
        std::expected<CursorPaginatedResult<T, V>, Error> GetListByCursor(std::uint64_t limit, std::optional<V> cursor, Order order, const typename KeyedTable<T, V>::SelectCondition &condition) {
            auto builder = this->m_query.GetListByCursor(limit, order, std::move(cursor), condition);
            if (!builder) return std::unexpected(builder.error());
            const std::string pk = this->m_query.primaryKey().name();
            std::function<V(const T &)> cursor_fn = [pk](const T &entity) {
                auto value = getValue<V>(entity, pk);
                return value ? *value : V();
            };
            return this->template fetchCursorPage<V>(*builder, limit, cursor_fn, order);
        }
    };

}  // namespace sqlforge

#endif  // sqlforge_SINGLE_KEY_TABLE_H
