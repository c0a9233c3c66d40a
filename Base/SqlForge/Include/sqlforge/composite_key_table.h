#ifndef sqlforge_COMPOSITE_KEY_TABLE_H
#define sqlforge_COMPOSITE_KEY_TABLE_H

#include "sqlforge/keyed_table.h"

namespace sqlforge {

    // 复合主键表门面; 键值按主键声明顺序传入
    template <typename T, typename V>
    class CompositeKeyTable : public KeyedTable<T, V> {
      public:
        CompositeKeyTable(std::shared_ptr<IQueryExecutor<V>> executor, std::string table, std::vector<std::string> primary_keys, TableScope<V> scope = TableScope<V>::fromGlobal())
            : KeyedTable<T, V>(std::move(executor), TableQuery<T, V>(std::move(table), PrimaryKey::Composite(std::move(primary_keys)), std::move(scope))) {
        }

        std::expected<ExecResult, Error> DeleteByPk(const std::vector<V> &keys) {
            return this->run(this->m_query.DeleteByPk(keys));
        }
        std::expected<ExecResult, Error> SoftDeleteByPk(const std::vector<V> &keys) {
            return this->run(this->m_query.SoftDeleteByPk(keys));
        }
        std::expected<ExecResult, Error> RestoreByPk(const std::vector<V> &keys) {
            return this->run(this->m_query.RestoreByPk(keys));
        }
        std::expected<std::optional<T>, Error> GetOneByPk(const std::vector<V> &keys) {
            return this->fetchOptional(this->m_query.GetOneByPk(keys));
        }
    };

}  // namespace sqlforge

#endif  // sqlforge_COMPOSITE_KEY_TABLE_H
