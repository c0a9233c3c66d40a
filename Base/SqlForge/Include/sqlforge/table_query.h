#ifndef sqlforge_TABLE_QUERY_H
#define sqlforge_TABLE_QUERY_H

#include <expected>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include "sqlforge/builder_parts/aggregate.h"
#include "sqlforge/delete_builder.h"
#include "sqlforge/dialect.h"
#include "sqlforge/fields.h"
#include "sqlforge/global_config.h"
#include "sqlforge/insert_builder.h"
#include "sqlforge/select_builder.h"
#include "sqlforge/types.h"
#include "sqlforge/update_builder.h"

namespace sqlforge {

    // 物理删除或软删除替换后的 UPDATE
    template <typename V>
    class DeleteStatement {
      public:
        explicit DeleteStatement(DeleteBuilder<V> builder) : m_builder(std::move(builder)) {
        }
        explicit DeleteStatement(UpdateBuilder<V> builder) : m_builder(std::move(builder)) {
        }

        bool isSoftDelete() const {
            return std::holds_alternative<UpdateBuilder<V>>(m_builder);
        }
        DeleteBuilder<V> *asDelete() {
            return std::get_if<DeleteBuilder<V>>(&m_builder);
        }
        UpdateBuilder<V> *asUpdate() {
            return std::get_if<UpdateBuilder<V>>(&m_builder);
        }

        BuildResult<V> Build() const {
            return std::visit([](const auto &builder) { return builder.Build(); }, m_builder);
        }

      private:
        std::variant<DeleteBuilder<V>, UpdateBuilder<V>> m_builder;
    };

    // upsert 语句以及方言尾部需要的列名与主键名
    template <typename V>
    struct UpsertStatement {
        InsertBuilder<V> builder;
        std::vector<std::string> columns;
        std::vector<std::string> primary_keys;

        BuildResult<V> Build() const {
            return builder.Build();
        }
    };

    // 分页: 数据查询与计数查询共享同一组条件
    template <typename V>
    struct PageQuery {
        SelectBuilder<V> data;
        SelectBuilder<V> count;
        std::uint64_t page_number = 0;
        std::uint64_t page_size = 0;
    };

    // 单表语句工厂: 只构建语句, 不执行
    template <typename T, typename V>
    class TableQuery {
      public:
        using SelectCondition = std::function<void(SelectBuilder<V> &)>;
        using UpdateCondition = std::function<void(UpdateBuilder<V> &)>;
        using DeleteCondition = std::function<void(DeleteBuilder<V> &)>;

        TableQuery(std::string table, PrimaryKey primary_key, TableScope<V> scope = TableScope<V>::fromGlobal())
            : m_table(std::move(table)), m_primary_key(std::move(primary_key)), m_scope(std::move(scope)) {
        }

        // 表名与主键取自实体元数据
        static TableQuery ForEntity(TableScope<V> scope = TableScope<V>::fromGlobal()) {
            const auto &meta = T::getEntityMeta();
            auto pk_fields = meta.getPrimaryKeyFields();
            PrimaryKey pk = pk_fields.size() > 1 ? PrimaryKey::Composite(meta.primary_keys_db_names)
                                                 : PrimaryKey::Single(pk_fields.empty() ? std::string("id") : pk_fields.front()->db_name,
                                                                      !pk_fields.empty() && has_flag(pk_fields.front()->flags, FieldFlag::AutoIncrement));
            return TableQuery(meta.table_name, std::move(pk), std::move(scope));
        }

        const std::string &table() const {
            return m_table;
        }
        const PrimaryKey &primaryKey() const {
            return m_primary_key;
        }
        const TableScope<V> &scope() const {
            return m_scope;
        }

        bool IsSoftDeleteEnabled() const {
            return m_scope.softDeleteEnabled(m_table);
        }

        // --- Insert ---
        std::expected<InsertBuilder<V>, Error> InsertOne(const T &entity) const {
            return InsertMany(std::vector<T>{entity});
        }

        std::expected<InsertBuilder<V>, Error> InsertMany(const std::vector<T> &entities) const {
            if (entities.empty()) return std::unexpected(errors::noEntitiesProvided());
            std::vector<std::string> exclude;
            if (m_primary_key.autoGenerate()) exclude.push_back(m_primary_key.name());
            if (auto err = checkNotNull(entities, exclude)) return std::unexpected(*err);

            auto extracted = batchExtract<V>(entities, exclude, false);
            if (extracted.names.empty()) return std::unexpected(errors::columnsListEmpty());
            auto builder = InsertBuilder<V>::Into(m_table);
            builder.Columns(std::move(extracted.names)).Values(std::move(extracted.rows));
            return builder;
        }

        // --- Upsert ---
        std::expected<UpsertStatement<V>, Error> UpsertOne(const T &entity) const {
            return UpsertMany(std::vector<T>{entity});
        }

        // 自增主键为默认值的行以 DEFAULT(SQLite 为 NULL) 代替参数
        // 冲突时只覆盖每个实体都填写了的非主键列, 未填写的列保留库中原值
        std::expected<UpsertStatement<V>, Error> UpsertMany(const std::vector<T> &entities) const {
            if (entities.empty()) return std::unexpected(errors::noEntitiesProvided());
            if (auto err = checkNotNull(entities, m_primary_key.keys())) return std::unexpected(*err);

            auto extracted = batchExtract<V>(entities, {}, false);
            if (extracted.names.empty()) return std::unexpected(errors::columnsListEmpty());

            std::vector<std::string> update_columns;
            for (const auto &name : extracted.names) {
                if (!m_primary_key.contains(name) && populatedInAll(entities, name)) update_columns.push_back(name);
            }
            if (update_columns.empty()) return std::unexpected(errors::columnsListEmpty());

            UpsertStatement<V> statement{InsertBuilder<V>::Into(m_table), extracted.names, m_primary_key.keys()};
            statement.builder.Columns(extracted.names).Values(extracted.rows);

            if (m_primary_key.autoGenerate()) {
                size_t pk_index = extracted.names.size();
                for (size_t i = 0; i < extracted.names.size(); ++i) {
                    if (extracted.names[i] == m_primary_key.name()) pk_index = i;
                }
                if (pk_index < extracted.names.size()) {
                    for (size_t r = 0; r < extracted.rows.size(); ++r) {
                        if (extracted.rows[r][pk_index].isDefaultValue() || extracted.rows[r][pk_index].isNull()) {
                            statement.builder.ReplaceWithLiteral(r * extracted.names.size() + pk_index, Dialect<V>::default_keyword);
                        }
                    }
                }
            }

            if constexpr (Dialect<V>::upsert_style == UpsertStyle::OnDuplicateKey) {
                statement.builder.OnDuplicateKeyUpdate(update_columns);
            } else {
                statement.builder.OnConflictDoUpdate(m_primary_key.keys(), update_columns);
            }
            return statement;
        }

        // --- Update ---
        // 主键列进入 WHERE, 其余已填写的列进入 SET
        std::expected<UpdateBuilder<V>, Error> UpdateOne(const T &entity) const {
            auto keys = getValues<V>(entity, m_primary_key.keys());
            if (!keys) return std::unexpected(keys.error());

            auto builder = UpdateBuilder<V>::Table(m_table);
            size_t set_count = 0;
            extractWithBind<V>(entity, m_primary_key.keys(), true, [&](const std::string &name, V value) {
                builder.Set(name, std::move(value));
                ++set_count;
            });
            if (set_count == 0) return std::unexpected(errors::columnsListEmpty());
            for (size_t i = 0; i < keys->size(); ++i) {
                builder.AndWhere(Expr<V>::Col(m_primary_key.keys()[i]).Eq((*keys)[i]));
            }
            m_scope.applyGlobalFilter(builder, m_table);
            return builder;
        }

        std::expected<UpdateBuilder<V>, Error> UpdateByCond(const UpdateCondition &condition) const {
            auto builder = UpdateBuilder<V>::Table(m_table);
            if (condition) condition(builder);
            m_scope.applyGlobalFilter(builder, m_table);
            return builder;
        }

        // --- Delete ---
        std::expected<DeleteStatement<V>, Error> DeleteByPk(const std::vector<V> &keys) const {
            auto predicate = keyPredicate(keys);
            if (!predicate) return std::unexpected(predicate.error());
            if (IsSoftDeleteEnabled()) {
                auto update = prepareSoftDelete(true);
                if (!update) return std::unexpected(update.error());
                update->Where(std::move(*predicate));
                m_scope.applyGlobalFilter(*update, m_table);
                return DeleteStatement<V>(std::move(*update));
            }
            auto builder = DeleteBuilder<V>::From(m_table);
            builder.Where(std::move(*predicate));
            m_scope.applyGlobalFilters(builder, m_table);
            return DeleteStatement<V>(std::move(builder));
        }

        // pk IN (...), 仅单列主键
        std::expected<DeleteStatement<V>, Error> DeleteMany(const std::vector<V> &keys) const {
            auto predicate = inPredicate(keys);
            if (!predicate) return std::unexpected(predicate.error());
            if (IsSoftDeleteEnabled()) {
                auto update = prepareSoftDelete(true);
                if (!update) return std::unexpected(update.error());
                update->Where(std::move(*predicate));
                m_scope.applyGlobalFilter(*update, m_table);
                return DeleteStatement<V>(std::move(*update));
            }
            auto builder = DeleteBuilder<V>::From(m_table);
            builder.Where(std::move(*predicate));
            m_scope.applyGlobalFilters(builder, m_table);
            return DeleteStatement<V>(std::move(builder));
        }

        std::expected<DeleteStatement<V>, Error> DeleteByCond(const DeleteCondition &condition) const {
            if (IsSoftDeleteEnabled()) {
                auto update = SoftDeleteByCond(condition);
                if (!update) return std::unexpected(update.error());
                return DeleteStatement<V>(std::move(*update));
            }
            auto builder = DeleteBuilder<V>::From(m_table);
            if (condition) condition(builder);
            m_scope.applyGlobalFilters(builder, m_table);
            return DeleteStatement<V>(std::move(builder));
        }

        // --- Soft delete ---
        std::expected<UpdateBuilder<V>, Error> SoftDeleteByPk(const std::vector<V> &keys) const {
            auto predicate = keyPredicate(keys);
            if (!predicate) return std::unexpected(predicate.error());
            auto update = prepareSoftDelete(true);
            if (!update) return std::unexpected(update.error());
            update->Where(std::move(*predicate));
            m_scope.applyGlobalFilter(*update, m_table);
            return update;
        }

        // 条件先写入一个 DELETE 构建器, 再把其 WHERE 移入 UPDATE
        std::expected<UpdateBuilder<V>, Error> SoftDeleteByCond(const DeleteCondition &condition) const {
            auto update = prepareSoftDelete(true);
            if (!update) return std::unexpected(update.error());
            moveWhereWithFilter(condition, *update);
            return update;
        }

        // --- Restore ---
        std::expected<UpdateBuilder<V>, Error> RestoreByPk(const std::vector<V> &keys) const {
            auto predicate = keyPredicate(keys);
            if (!predicate) return std::unexpected(predicate.error());
            auto update = prepareRestore();
            if (!update) return std::unexpected(update.error());
            update->Where(std::move(*predicate));
            m_scope.applyGlobalFilter(*update, m_table);
            return update;
        }

        std::expected<UpdateBuilder<V>, Error> RestoreMany(const std::vector<V> &keys) const {
            auto predicate = inPredicate(keys);
            if (!predicate) return std::unexpected(predicate.error());
            auto update = prepareRestore();
            if (!update) return std::unexpected(update.error());
            update->Where(std::move(*predicate));
            m_scope.applyGlobalFilter(*update, m_table);
            return update;
        }

        std::expected<UpdateBuilder<V>, Error> RestoreByCond(const DeleteCondition &condition) const {
            auto update = prepareRestore();
            if (!update) return std::unexpected(update.error());
            moveWhereWithFilter(condition, *update);
            return update;
        }

        // --- Select ---
        std::expected<SelectBuilder<V>, Error> GetOneByPk(const std::vector<V> &keys) const {
            auto predicate = keyPredicate(keys);
            if (!predicate) return std::unexpected(predicate.error());
            auto builder = selectBuilder();
            builder.Where(std::move(*predicate));
            m_scope.applyGlobalFilters(builder, m_table);
            return builder;
        }

        SelectBuilder<V> GetOneByCond(const SelectCondition &condition) const {
            return GetListByCond(condition);
        }

        SelectBuilder<V> GetListByCond(const SelectCondition &condition) const {
            auto builder = selectBuilder();
            if (condition) condition(builder);
            m_scope.applyGlobalFilters(builder, m_table);
            return builder;
        }

        // offset = (page_number - 1) * page_size, 两者都须落在 qint64 范围内
        // 计数查询沿用同一条件, 但不带 ORDER BY 与 LIMIT
        std::expected<PageQuery<V>, Error> GetListPaginated(std::uint64_t page_number, std::uint64_t page_size, const SelectCondition &condition) const {
            constexpr auto max_value = static_cast<std::uint64_t>(std::numeric_limits<qint64>::max());
            if (page_number == 0 || page_size == 0 || page_size > max_value) return std::unexpected(errors::pageNumberInvalid());
            if (page_number - 1 > max_value / page_size) return std::unexpected(errors::pageNumberInvalid());
            PageQuery<V> query{GetListByCond(condition), Count(condition), page_number, page_size};
            query.count.ClearOrderAndLimit();
            query.data.LimitOffset(V(static_cast<qint64>(page_size)), V(static_cast<qint64>((page_number - 1) * page_size)));
            return query;
        }

        std::expected<SelectBuilder<V>, Error> GetListByCursor(std::uint64_t limit, const SelectCondition &condition) const {
            if (limit == 0) return std::unexpected(errors::limitInvalid());
            auto builder = GetListByCond(condition);
            builder.LimitOffset(V(static_cast<qint64>(limit)));
            return builder;
        }

        // 单列主键游标: WHERE pk > ? ORDER BY pk ASC LIMIT ?
        std::expected<SelectBuilder<V>, Error> GetListByCursor(std::uint64_t limit, Order order, std::optional<V> cursor, const SelectCondition &condition) const {
            if (limit == 0) return std::unexpected(errors::limitInvalid());
            if (!m_primary_key.isSingle()) return std::unexpected(errors::singleKeyTypeInvalid());
            auto builder = GetListByCond(condition);
            builder.Cursor(m_primary_key.name(), order, std::move(cursor), V(static_cast<qint64>(limit)));
            return builder;
        }

        SelectBuilder<V> Exists(const SelectCondition &condition) const {
            auto builder = SelectBuilder<V>::Columns({"1"});
            builder.From(m_table);
            if (condition) condition(builder);
            m_scope.applyGlobalFilters(builder, m_table);
            return builder;
        }

        SelectBuilder<V> Count(const SelectCondition &condition) const {
            AggregateClause<V> aggregate;
            aggregate.Count("*");
            auto builder = SelectBuilder<V>::Columns({});
            builder.Aggregate(aggregate).From(m_table);
            if (condition) condition(builder);
            m_scope.applyGlobalFilters(builder, m_table);
            return builder;
        }

      private:
        SelectBuilder<V> selectBuilder() const {
            auto builder = SelectBuilder<V>::Columns(T::getEntityMeta().columnNames());
            builder.From(m_table);
            return builder;
        }

        // k1 = ? AND k2 = ?
        std::expected<Expr<V>, Error> keyPredicate(const std::vector<V> &keys) const {
            if (keys.empty() || !m_primary_key.isValid()) return std::unexpected(errors::noPrimaryKeyDefined());
            if (m_primary_key.isSingle()) {
                if (keys.size() != 1) return std::unexpected(errors::singleKeyTypeInvalid());
                if (keys.front().isNull() || keys.front().isDefaultValue()) return std::unexpected(errors::primaryKeyNotFound(m_primary_key.name()));
                return Expr<V>::Col(m_primary_key.name()).Eq(keys.front());
            }
            if (keys.size() == 1) return std::unexpected(errors::singleKeyTypeInvalid());
            if (keys.size() != m_primary_key.keys().size()) return std::unexpected(errors::compositeKeyTypeInvalid(m_primary_key.keys().size(), keys.size()));
            Expr<V> predicate;
            for (size_t i = 0; i < keys.size(); ++i) {
                predicate = predicate.And(Expr<V>::Col(m_primary_key.keys()[i]).Eq(keys[i]));
            }
            return predicate;
        }

        std::expected<Expr<V>, Error> inPredicate(const std::vector<V> &keys) const {
            if (keys.empty()) return std::unexpected(errors::noPrimaryKeyDefined());
            if (!m_primary_key.isSingle()) return std::unexpected(errors::singleKeyTypeInvalid());
            return Expr<V>::Col(m_primary_key.name()).In(keys);
        }

        std::optional<Error> checkSoftDeleteColumn() const {
            const FieldMeta *field = T::getEntityMeta().findFieldByDbName(m_scope.soft_delete->field);
            if (field && field->value_type != typeid(bool)) return errors::softDeleteColumnTypeInvalid(field->db_name);
            return std::nullopt;
        }

        // UPDATE t SET <soft_delete_field> = ?
        std::expected<UpdateBuilder<V>, Error> prepareSoftDelete(bool flag) const {
            if (!IsSoftDeleteEnabled()) return std::unexpected(errors::softDeleteConfigNotSet());
            if (auto err = checkSoftDeleteColumn()) return std::unexpected(*err);
            auto builder = UpdateBuilder<V>::Table(m_table);
            builder.Set(m_scope.soft_delete->field, V(flag));
            return builder;
        }

        std::expected<UpdateBuilder<V>, Error> prepareRestore() const {
            if (!IsSoftDeleteEnabled()) return std::unexpected(errors::restoreOperationNotSupported(m_table));
            return prepareSoftDelete(false);
        }

        void moveWhereWithFilter(const DeleteCondition &condition, UpdateBuilder<V> &update) const {
            auto scratch = DeleteBuilder<V>::From(m_table);
            if (condition) condition(scratch);
            for (auto &group : scratch.TakeWhere()) {
                update.Where(std::move(group));
            }
            m_scope.applyGlobalFilter(update, m_table);
        }

        bool populatedInAll(const std::vector<T> &entities, const std::string &column) const {
            const FieldMeta *field = T::getEntityMeta().findFieldByDbName(column);
            if (!field || !field->getter) return false;
            for (const auto &entity : entities) {
                if (isEmptyOrNone(field->getter(&entity))) return false;
            }
            return true;
        }

        // NotNull 字段不能为空值
        std::optional<Error> checkNotNull(const std::vector<T> &entities, const std::vector<std::string> &skip) const {
            for (const auto &field : T::getEntityMeta().fields) {
                if (!has_flag(field.flags, FieldFlag::NotNull) || internal::isExcluded(skip, field.db_name) || !field.getter) continue;
                for (const auto &entity : entities) {
                    if (isEmptyOrNone(field.getter(&entity))) return errors::valueInvalid(field.db_name);
                }
            }
            return std::nullopt;
        }

        std::string m_table;
        PrimaryKey m_primary_key;
        TableScope<V> m_scope;
    };

}  // namespace sqlforge

#endif  // sqlforge_TABLE_QUERY_H
