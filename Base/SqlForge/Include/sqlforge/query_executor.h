#ifndef sqlforge_QUERY_EXECUTOR_H
#define sqlforge_QUERY_EXECUTOR_H

#include <QDebug>
#include <QVariant>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sqlforge/builder_parts/sql_builder.h"
#include "sqlforge/entity.h"
#include "sqlforge/error.h"
#include "sqlforge/row.h"
#include "sqlforge/types.h"

namespace sqlforge {

    // 驱动事务; 未提交就析构时回滚
    template <typename V>
    class ITransaction {
      public:
        virtual ~ITransaction() = default;

        virtual std::expected<std::vector<Row>, Error> fetchRows(const std::string &sql, const std::vector<V> &params) = 0;
        virtual std::expected<ExecResult, Error> executeStatement(const std::string &sql, const std::vector<V> &params) = 0;
        virtual std::expected<void, Error> commit() = 0;
        virtual std::expected<void, Error> rollback() = 0;
        virtual bool isActive() const = 0;

        template <typename Builder>
        std::expected<ExecResult, Error> execute(const Builder &builder) {
            auto built = builder.Build();
            if (!built) return std::unexpected(built.error());
            return executeStatement(built->first, built->second);
        }
    };

    // 语句执行接口; 任何提供 Build() -> (sql, params) 的对象都可以执行
    template <typename V>
    class IQueryExecutor {
      public:
        virtual ~IQueryExecutor() = default;

        virtual std::expected<std::vector<Row>, Error> fetchRows(const std::string &sql, const std::vector<V> &params) = 0;
        virtual std::expected<ExecResult, Error> executeStatement(const std::string &sql, const std::vector<V> &params) = 0;
        virtual std::expected<std::unique_ptr<ITransaction<V>>, Error> beginTransaction() = 0;

        template <typename T, typename Builder>
        std::expected<std::vector<T>, Error> fetchAll(const Builder &builder) {
            auto rows = fetchBuilt(builder);
            if (!rows) return std::unexpected(rows.error());
            return fromRows<T>(*rows);
        }

        // 没有结果时返回 RecordNotFound
        template <typename T, typename Builder>
        std::expected<T, Error> fetchOne(const Builder &builder) {
            auto found = fetchOptional<T>(builder);
            if (!found) return std::unexpected(found.error());
            if (!found->has_value()) return std::unexpected(errors::recordNotFound());
            return std::move(**found);
        }

        template <typename T, typename Builder>
        std::expected<std::optional<T>, Error> fetchOptional(const Builder &builder) {
            auto rows = fetchBuilt(builder);
            if (!rows) return std::unexpected(rows.error());
            if (rows->empty()) return std::optional<T>();
            auto entity = fromRow<T>(rows->front());
            if (!entity) return std::unexpected(entity.error());
            return std::optional<T>(std::move(*entity));
        }

        // 第一行第一列, 用于 COUNT 与 EXISTS
        template <typename Builder>
        std::expected<std::optional<QVariant>, Error> fetchScalar(const Builder &builder) {
            auto rows = fetchBuilt(builder);
            if (!rows) return std::unexpected(rows.error());
            if (rows->empty() || rows->front().empty()) return std::optional<QVariant>();
            return std::optional<QVariant>(rows->front().at(0));
        }

        template <typename Builder>
        std::expected<ExecResult, Error> execute(const Builder &builder) {
            auto built = builder.Build();
            if (!built) return std::unexpected(built.error());
            return executeStatement(built->first, built->second);
        }

        // 全部成功才提交, 第一个错误即回滚并原样返回
        std::expected<std::vector<ExecResult>, Error> executeWithTransaction(const std::vector<SqlBuilder<V>> &statements) {
            auto transaction = beginTransaction();
            if (!transaction) return std::unexpected(transaction.error());
            std::vector<ExecResult> results;
            results.reserve(statements.size());
            for (const auto &statement : statements) {
                auto result = (*transaction)->execute(statement);
                if (!result) {
                    auto rolled_back = (*transaction)->rollback();
                    if (!rolled_back) qWarning() << "sqlforge IQueryExecutor: rollback failed:" << QString::fromStdString(rolled_back.error().toString());
                    return std::unexpected(result.error());
                }
                results.push_back(*result);
            }
            auto committed = (*transaction)->commit();
            if (!committed) return std::unexpected(committed.error());
            return results;
        }

      private:
        template <typename Builder>
        std::expected<std::vector<Row>, Error> fetchBuilt(const Builder &builder) {
            auto built = builder.Build();
            if (!built) return std::unexpected(built.error());
            return fetchRows(built->first, built->second);
        }
    };

}  // namespace sqlforge

#endif  // sqlforge_QUERY_EXECUTOR_H
