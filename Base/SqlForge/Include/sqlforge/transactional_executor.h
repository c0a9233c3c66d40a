#ifndef sqlforge_TRANSACTIONAL_EXECUTOR_H
#define sqlforge_TRANSACTIONAL_EXECUTOR_H

#include <QDebug>
#include <expected>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "sqlforge/builder_parts/sql_builder.h"
#include "sqlforge/query_executor.h"

namespace sqlforge {

    // begin() 与 commit() 之间的写操作先入队, commit() 时在一个驱动事务中按入队顺序执行
    template <typename V>
    class TransactionalExecutor {
      public:
        explicit TransactionalExecutor(std::shared_ptr<IQueryExecutor<V>> executor) : m_executor(std::move(executor)) {
        }

        const std::shared_ptr<IQueryExecutor<V>> &executor() const {
            return m_executor;
        }

        std::expected<void, Error> begin() {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_in_transaction) return std::unexpected(Error(ErrorCode::TransactionError, "Transaction already started"));
            m_in_transaction = true;
            return {};
        }

        bool isInTransaction() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_in_transaction;
        }

        size_t pendingCount() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_pending.size();
        }

        // 事务中返回 nullopt 表示已入队; 否则立即执行
        template <typename Builder>
        std::expected<std::optional<ExecResult>, Error> execute(const Builder &builder) {
            auto statement = SqlBuilder<V>::From(builder);
            if (!statement) return std::unexpected(statement.error());
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_in_transaction) {
                    m_pending.push_back(std::move(*statement));
                    return std::optional<ExecResult>();
                }
            }
            if (!m_executor) return std::unexpected(errors::dbPoolNotInitialized());
            auto result = m_executor->execute(*statement);
            if (!result) return std::unexpected(result.error());
            return std::optional<ExecResult>(*result);
        }

        // 队列在锁内取出, 在锁外执行
        std::expected<std::vector<ExecResult>, Error> commit() {
            std::vector<SqlBuilder<V>> batch;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (!m_in_transaction) return std::unexpected(Error(ErrorCode::TransactionError, "No transaction in progress"));
                batch = std::exchange(m_pending, {});
                m_in_transaction = false;
            }
            if (batch.empty()) return std::vector<ExecResult>();
            if (!m_executor) return std::unexpected(errors::dbPoolNotInitialized());
            return m_executor->executeWithTransaction(batch);
        }

        // 丢弃队列
        void rollback() {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_pending.empty()) qDebug() << "sqlforge TransactionalExecutor: discarding" << m_pending.size() << "pending statements";
            m_pending.clear();
            m_in_transaction = false;
        }

      private:
        std::shared_ptr<IQueryExecutor<V>> m_executor;
        mutable std::mutex m_mutex;
        bool m_in_transaction = false;
        std::vector<SqlBuilder<V>> m_pending;
    };

}  // namespace sqlforge

#endif  // sqlforge_TRANSACTIONAL_EXECUTOR_H
