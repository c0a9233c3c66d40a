#ifndef sqlforge_KEYED_TABLE_H
#define sqlforge_KEYED_TABLE_H

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "sqlforge/query_executor.h"
#include "sqlforge/table_query.h"

namespace sqlforge {

    namespace internal {
        // 分页时数据与计数查询并发执行所用的线程池
        boost::asio::thread_pool &paginationPool();

        std::expected<std::uint64_t, Error> scalarToCount(const std::optional<QVariant> &scalar);
    }  // namespace internal

    // 单列主键与复合主键门面的公共部分: 构建语句并交给执行器
    template <typename T, typename V>
    class KeyedTable {
      public:
        using SelectCondition = typename TableQuery<T, V>::SelectCondition;
        using UpdateCondition = typename TableQuery<T, V>::UpdateCondition;
        using DeleteCondition = typename TableQuery<T, V>::DeleteCondition;

        const TableQuery<T, V> &query() const {
            return m_query;
        }
        const std::shared_ptr<IQueryExecutor<V>> &executor() const {
            return m_executor;
        }
        bool IsSoftDeleteEnabled() const {
            return m_query.IsSoftDeleteEnabled();
        }

        std::expected<ExecResult, Error> InsertOne(const T &entity) {
            return run(m_query.InsertOne(entity));
        }
        std::expected<ExecResult, Error> InsertMany(const std::vector<T> &entities) {
            return run(m_query.InsertMany(entities));
        }
        std::expected<ExecResult, Error> UpsertOne(const T &entity) {
            return run(m_query.UpsertOne(entity));
        }
        std::expected<ExecResult, Error> UpsertMany(const std::vector<T> &entities) {
            return run(m_query.UpsertMany(entities));
        }
        std::expected<ExecResult, Error> UpdateOne(const T &entity) {
            return run(m_query.UpdateOne(entity));
        }
        std::expected<ExecResult, Error> UpdateByCond(const UpdateCondition &condition) {
            return run(m_query.UpdateByCond(condition));
        }
        std::expected<ExecResult, Error> DeleteByCond(const DeleteCondition &condition) {
            return run(m_query.DeleteByCond(condition));
        }
        std::expected<ExecResult, Error> SoftDeleteByCond(const DeleteCondition &condition) {
            return run(m_query.SoftDeleteByCond(condition));
        }
        std::expected<ExecResult, Error> RestoreByCond(const DeleteCondition &condition) {
            return run(m_query.RestoreByCond(condition));
        }

        std::expected<std::optional<T>, Error> GetOneByCond(const SelectCondition &condition) {
            if (!m_executor) return std::unexpected(errors::dbPoolNotInitialized());
            return m_executor->template fetchOptional<T>(m_query.GetOneByCond(condition));
        }

        std::expected<std::vector<T>, Error> GetListByCond(const SelectCondition &condition) {
            if (!m_executor) return std::unexpected(errors::dbPoolNotInitialized());
            return m_executor->template fetchAll<T>(m_query.GetListByCond(condition));
        }

        // 数据与总数两条查询并发执行, 两者都完成后返回
        std::expected<PaginatedResult<T>, Error> GetListPaginated(std::uint64_t page_number, std::uint64_t page_size, const SelectCondition &condition) {
            auto page = m_query.GetListPaginated(page_number, page_size, condition);
            if (!page) return std::unexpected(page.error());
            if (!m_executor) return std::unexpected(errors::dbPoolNotInitialized());

            auto executor = m_executor;
            std::packaged_task<std::expected<std::vector<T>, Error>()> data_task([executor, data = page->data]() { return executor->template fetchAll<T>(data); });
            std::packaged_task<std::expected<std::optional<QVariant>, Error>()> count_task([executor, count = page->count]() { return executor->fetchScalar(count); });
            auto data_future = data_task.get_future();
            auto count_future = count_task.get_future();
            boost::asio::post(internal::paginationPool(), std::move(data_task));
            boost::asio::post(internal::paginationPool(), std::move(count_task));

            auto data = data_future.get();
            auto count = count_future.get();
            if (!data) return std::unexpected(data.error());
            if (!count) return std::unexpected(count.error());
            auto total = internal::scalarToCount(*count);
            if (!total) return std::unexpected(total.error());
            return PaginatedResult<T>{std::move(*data), *total, page_number, page_size};
        }

        // 游标列由调用方通过 cursor_fn 决定
        template <typename C>
        std::expected<CursorPaginatedResult<T, C>, Error> GetListByCursor(std::uint64_t limit, const SelectCondition &condition, const std::function<C(const T &)> &cursor_fn, Order order = Order::Asc) {
            auto builder = m_query.GetListByCursor(limit, condition);
            if (!builder) return std::unexpected(builder.error());
            return fetchCursorPage<C>(*builder, limit, cursor_fn, order);
        }

        std::expected<bool, Error> Exists(const SelectCondition &condition) {
            if (!m_executor) return std::unexpected(errors::dbPoolNotInitialized());
            auto scalar = m_executor->fetchScalar(m_query.Exists(condition));
            if (!scalar) return std::unexpected(scalar.error());
            return scalar->has_value();
        }

        std::expected<std::uint64_t, Error> Count(const SelectCondition &condition) {
            if (!m_executor) return std::unexpected(errors::dbPoolNotInitialized());
            auto scalar = m_executor->fetchScalar(m_query.Count(condition));
            if (!scalar) return std::unexpected(scalar.error());
            return internal::scalarToCount(*scalar);
        }

      protected:
        KeyedTable(std::shared_ptr<IQueryExecutor<V>> executor, TableQuery<T, V> query) : m_executor(std::move(executor)), m_query(std::move(query)) {
        }

        template <typename Statement>
        std::expected<ExecResult, Error> run(const std::expected<Statement, Error> &statement) {
            if (!statement) return std::unexpected(statement.error());
            if (!m_executor) return std::unexpected(errors::dbPoolNotInitialized());
            return m_executor->execute(*statement);
        }

        std::expected<std::optional<T>, Error> fetchOptional(const std::expected<SelectBuilder<V>, Error> &builder) {
            if (!builder) return std::unexpected(builder.error());
            if (!m_executor) return std::unexpected(errors::dbPoolNotInitialized());
            return m_executor->template fetchOptional<T>(*builder);
        }

        template <typename C>
        std::expected<CursorPaginatedResult<T, C>, Error> fetchCursorPage(const SelectBuilder<V> &builder, std::uint64_t limit, const std::function<C(const T &)> &cursor_fn, Order order) {
            if (!m_executor) return std::unexpected(errors::dbPoolNotInitialized());
            auto rows = m_executor->template fetchAll<T>(builder);
            if (!rows) return std::unexpected(rows.error());
            CursorPaginatedResult<T, C> result(std::move(*rows), limit, order);
            if (cursor_fn) result.genCursors(cursor_fn);
            return result;
        }

        std::shared_ptr<IQueryExecutor<V>> m_executor;
        TableQuery<T, V> m_query;
    };

}  // namespace sqlforge

#endif  // sqlforge_KEYED_TABLE_H
