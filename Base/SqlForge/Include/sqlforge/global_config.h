#ifndef sqlforge_GLOBAL_CONFIG_H
#define sqlforge_GLOBAL_CONFIG_H

#include <QDebug>
#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sqlforge/expr.h"
#include "sqlforge/types.h"

namespace sqlforge {

    // 全局过滤条件, 对 exclude_tables 之外的所有表生效
    template <typename V>
    struct GlobalFilter {
        Expr<V> expression;
        std::vector<std::string> exclude_tables;

        bool excludes(const std::string &table) const {
            for (const auto &t : exclude_tables) {
                if (t == table) return true;
            }
            return false;
        }
    };

    // 进程级配置, 每个方言值类型一份; 只能写一次, 之后的写入被忽略
    // 写入后配置不再变化, 读取只做一次原子加载
    template <typename V>
    class GlobalConfig {
      public:
        static GlobalConfig &instance() {
            static GlobalConfig config;
            return config;
        }

        // 返回是否写入成功
        bool setSoftDeleteField(std::string field, std::vector<std::string> exclude_tables = {}) {
            auto desired = std::make_shared<const SoftDeleteConfig>(SoftDeleteConfig{std::move(field), std::move(exclude_tables)});
            std::shared_ptr<const SoftDeleteConfig> expected;
            if (!m_soft_delete.compare_exchange_strong(expected, desired)) {
                qDebug() << "sqlforge GlobalConfig: soft delete field already set to" << QString::fromStdString(expected->field) << ", ignoring" << QString::fromStdString(desired->field);
                return false;
            }
            return true;
        }

        bool setGlobalFilter(Expr<V> expression, std::vector<std::string> exclude_tables = {}) {
            auto desired = std::make_shared<const GlobalFilter<V>>(GlobalFilter<V>{std::move(expression), std::move(exclude_tables)});
            std::shared_ptr<const GlobalFilter<V>> expected;
            if (!m_global_filter.compare_exchange_strong(expected, desired)) {
                qDebug() << "sqlforge GlobalConfig: global filter already set, ignoring" << QString::fromStdString(desired->expression.clause());
                return false;
            }
            return true;
        }

        std::shared_ptr<const SoftDeleteConfig> softDelete() const {
            return m_soft_delete.load(std::memory_order_acquire);
        }

        std::shared_ptr<const GlobalFilter<V>> globalFilter() const {
            return m_global_filter.load(std::memory_order_acquire);
        }

      private:
        GlobalConfig() = default;

        std::atomic<std::shared_ptr<const SoftDeleteConfig>> m_soft_delete;
        std::atomic<std::shared_ptr<const GlobalFilter<V>>> m_global_filter;
    };

    template <typename V>
    bool setGlobalSoftDeleteField(std::string field, std::vector<std::string> exclude_tables = {}) {
        return GlobalConfig<V>::instance().setSoftDeleteField(std::move(field), std::move(exclude_tables));
    }

    template <typename V>
    bool setGlobalFilter(Expr<V> expression, std::vector<std::string> exclude_tables = {}) {
        return GlobalConfig<V>::instance().setGlobalFilter(std::move(expression), std::move(exclude_tables));
    }

    // 表门面看到的软删除与全局过滤配置
    template <typename V>
    struct TableScope {
        std::shared_ptr<const SoftDeleteConfig> soft_delete;
        std::shared_ptr<const GlobalFilter<V>> global_filter;

        static TableScope fromGlobal() {
            const auto &config = GlobalConfig<V>::instance();
            return TableScope{config.softDelete(), config.globalFilter()};
        }

        bool softDeleteEnabled(const std::string &table) const {
            return soft_delete && !soft_delete->field.empty() && !soft_delete->excludes(table);
        }

        // 读路径: AND <soft_delete_field> = false AND <global filter>
        template <typename Builder>
        void applyGlobalFilters(Builder &builder, const std::string &table) const {
            if (softDeleteEnabled(table)) {
                builder.AndWhere(Expr<V>::Col(soft_delete->field).Eq(V(false)));
            }
            applyGlobalFilter(builder, table);
        }

        // 写路径 (UPDATE, 软删除, 恢复) 只追加全局过滤条件
        template <typename Builder>
        void applyGlobalFilter(Builder &builder, const std::string &table) const {
            if (global_filter && !global_filter->excludes(table)) {
                builder.AndWhere(global_filter->expression);
            }
        }
    };

}  // namespace sqlforge

#endif  // sqlforge_GLOBAL_CONFIG_H
