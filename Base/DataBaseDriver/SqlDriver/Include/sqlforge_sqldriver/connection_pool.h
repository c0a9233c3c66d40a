// sqlforge_sqldriver/connection_pool.h
#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "sqlforge/error.h"
#include "sqlforge_sqldriver/connection_parameters.h"

namespace sqlforge_sqldriver {

    inline constexpr int kDefaultPoolMaxSize = 10;
    inline constexpr long long kDefaultPoolAcquireTimeoutMs = 30000;

    template <typename Connection>
    class ConnectionPool;

    // 借出的连接; 析构时归还连接池, invalidate() 之后直接丢弃
    template <typename Connection>
    class PooledConnection {
      public:
        PooledConnection() = default;
        PooledConnection(std::shared_ptr<ConnectionPool<Connection>> pool, std::unique_ptr<Connection> connection) : m_pool(std::move(pool)), m_connection(std::move(connection)) {
        }
        ~PooledConnection() {
            release();
        }

        PooledConnection(const PooledConnection&) = delete;
        PooledConnection& operator=(const PooledConnection&) = delete;
        PooledConnection(PooledConnection&& other) noexcept = default;
        PooledConnection& operator=(PooledConnection&& other) noexcept {
            if (this != &other) {
                release();
                m_pool = std::move(other.m_pool);
                m_connection = std::move(other.m_connection);
                m_broken = other.m_broken;
            }
            return *this;
        }

        Connection* operator->() const {
            return m_connection.get();
        }
        Connection& operator*() const {
            return *m_connection;
        }
        Connection* get() const {
            return m_connection.get();
        }
        explicit operator bool() const {
            return static_cast<bool>(m_connection);
        }

        void invalidate() {
            m_broken = true;
        }

      private:
        void release() {
            if (m_pool && m_connection) {
                m_pool->giveBack(std::move(m_connection), m_broken);
            }
            m_pool.reset();
        }

        std::shared_ptr<ConnectionPool<Connection>> m_pool;
        std::unique_ptr<Connection> m_connection;
        bool m_broken = false;
    };

    // 有上限的连接池: 空闲连接复用, 不足时按需创建, 达到上限后最多等待 acquire timeout
    template <typename Connection>
    class ConnectionPool : public std::enable_shared_from_this<ConnectionPool<Connection>> {
      public:
        using Factory = std::function<std::expected<std::unique_ptr<Connection>, sqlforge::Error>()>;

        static std::shared_ptr<ConnectionPool> create(Factory factory, const PoolSettings& settings) {
            std::size_t max_size = static_cast<std::size_t>(std::max(settings.max_size.value_or(kDefaultPoolMaxSize), 1));
            auto timeout = std::chrono::milliseconds(settings.acquire_timeout_ms.value_or(kDefaultPoolAcquireTimeoutMs));
            return std::shared_ptr<ConnectionPool>(new ConnectionPool(std::move(factory), max_size, timeout));
        }

        std::expected<PooledConnection<Connection>, sqlforge::Error> acquire() {
            std::unique_lock<std::mutex> lock(m_mutex);
            bool ready = m_cv.wait_for(lock, m_acquire_timeout, [this] {
                return m_closed || !m_idle.empty() || m_total < m_max_size;
            });
            if (m_closed) return std::unexpected(sqlforge::errors::dbPoolNotInitialized());
            if (!ready) {
                return std::unexpected(sqlforge::Error(sqlforge::ErrorCode::ConnectionFailed, "Timed out waiting for a pooled connection"));
            }
            if (!m_idle.empty()) {
                auto connection = std::move(m_idle.back());
                m_idle.pop_back();
                return PooledConnection<Connection>(this->shared_from_this(), std::move(connection));
            }

            // 先占位, 创建连接时不持锁
            ++m_total;
            lock.unlock();
            auto created = m_factory();
            if (!created) {
                lock.lock();
                --m_total;
                m_cv.notify_one();
                return std::unexpected(created.error());
            }
            return PooledConnection<Connection>(this->shared_from_this(), std::move(*created));
        }

        // 关闭后空闲连接被释放, 后续 acquire 返回 DBPoolNotInitialized
        void close() {
            std::vector<std::unique_ptr<Connection>> idle;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_closed = true;
                m_total -= m_idle.size();
                idle.swap(m_idle);
            }
            m_cv.notify_all();
        }

        std::size_t maxSize() const {
            return m_max_size;
        }
        std::size_t idleCount() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_idle.size();
        }
        std::size_t totalCount() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_total;
        }

      private:
        friend class PooledConnection<Connection>;

        ConnectionPool(Factory factory, std::size_t max_size, std::chrono::milliseconds acquire_timeout) : m_factory(std::move(factory)), m_max_size(max_size), m_acquire_timeout(acquire_timeout) {
        }

        void giveBack(std::unique_ptr<Connection> connection, bool broken) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (broken || m_closed) {
                    --m_total;
                } else {
                    m_idle.push_back(std::move(connection));
                }
            }
            m_cv.notify_one();
        }

        Factory m_factory;
        const std::size_t m_max_size;
        const std::chrono::milliseconds m_acquire_timeout;

        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::vector<std::unique_ptr<Connection>> m_idle;
        std::size_t m_total = 0;
        bool m_closed = false;
    };

}  // namespace sqlforge_sqldriver
