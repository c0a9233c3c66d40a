#pragma once

#include <mysql/mysql.h>

#include <QVariant>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "sqlforge/error.h"
#include "sqlforge/mysql/mysql_value.h"

namespace sqlforge_mysql_transport {

    // 预处理语句的输入参数. MYSQL_BIND 指向本对象持有的缓冲区, 所以只能移动
    class ParamBuffers {
      public:
        explicit ParamBuffers(const std::vector<sqlforge::mysql::Value>& values);

        ParamBuffers(const ParamBuffers&) = delete;
        ParamBuffers& operator=(const ParamBuffers&) = delete;
        ParamBuffers(ParamBuffers&&) noexcept = default;
        ParamBuffers& operator=(ParamBuffers&&) noexcept = default;

        MYSQL_BIND* binds() {
            return m_binds.empty() ? nullptr : m_binds.data();
        }
        std::size_t size() const {
            return m_binds.size();
        }
        const MYSQL_BIND& operator[](std::size_t index) const {
            return m_binds[index];
        }

      private:
        void bindOne(std::size_t index, const sqlforge::mysql::Value& value);

        std::vector<std::vector<unsigned char>> m_storage;
        std::vector<unsigned long> m_lengths;
        std::vector<MYSQL_BIND> m_binds;
    };

    struct ColumnMeta {
        std::string name;
        enum enum_field_types type = MYSQL_TYPE_NULL;
        unsigned int flags = 0;
    };

    // 文本协议取回的非 NULL 单元格
    QVariant cellToVariant(const ColumnMeta& column, std::string_view cell);

    // 客户端错误 (CR_*) 一律视为连接失败, 服务端错误使用 fallback
    sqlforge::Error makeError(unsigned int mysql_errno_value, const char* sqlstate, const char* message, const std::string& context, sqlforge::ErrorCode fallback);

}  // namespace sqlforge_mysql_transport
