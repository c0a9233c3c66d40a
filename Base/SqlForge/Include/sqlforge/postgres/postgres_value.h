#ifndef sqlforge_POSTGRES_VALUE_H
#define sqlforge_POSTGRES_VALUE_H

#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QTime>
#include <QUuid>
#include <any>
#include <array>
#include <boost/asio/ip/address.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "sqlforge/decimal.h"

namespace sqlforge::postgres {

    // INTERVAL: 月, 日, 微秒三段独立保存, 与服务端表示一致
    struct Interval {
        qint32 months = 0;
        qint32 days = 0;
        qint64 microseconds = 0;

        bool operator==(const Interval &other) const = default;
        std::string toString() const;
    };

    // CIDR 网段
    struct Network {
        boost::asio::ip::address address;
        unsigned short prefix_length = 0;

        bool operator==(const Network &other) const = default;
        std::string toString() const;
    };

    struct MacAddress {
        std::array<std::uint8_t, 6> bytes{};

        bool operator==(const MacAddress &other) const = default;
        std::string toString() const;
    };

    // PostgreSQL 方言下可绑定的单个标量
    class Value {
      public:
        enum class Kind { Null, Bool, Int2, Int4, Int8, Float4, Float8, Numeric, Text, Bytea, Date, Time, Timestamp, Timestamptz, Interval, Inet, Cidr, MacAddr, Uuid, Json };

        using Storage = std::variant<std::monostate, bool, qint64, float, double, sqlforge::Decimal, QString, QByteArray, QDate, QTime, QDateTime, postgres::Interval, boost::asio::ip::address, Network, MacAddress, QUuid, QJsonValue>;

        Value() = default;
        Value(std::nullptr_t) {
        }
        Value(std::nullopt_t) {
        }
        Value(bool v) : m_kind(Kind::Bool), m_storage(v) {
        }

        // 无符号类型提升到下一个更宽的有符号类型, u64 只能落在 NUMERIC
        template <typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
        Value(T v) {
            if constexpr (std::is_unsigned_v<T> && sizeof(T) == 8) {
                m_kind = Kind::Numeric;
                m_storage = sqlforge::Decimal(std::to_string(v));
            } else {
                constexpr std::size_t width = std::is_unsigned_v<T> ? sizeof(T) * 2 : sizeof(T);
                m_kind = width <= 2 ? Kind::Int2 : width <= 4 ? Kind::Int4 : Kind::Int8;
                m_storage = static_cast<qint64>(v);
            }
        }

        Value(float v) : m_kind(Kind::Float4), m_storage(v) {
        }
        Value(double v) : m_kind(Kind::Float8), m_storage(v) {
        }

        Value(const char *v);
        Value(const std::string &v);
        Value(std::string_view v);
        Value(const QString &v) : m_kind(Kind::Text), m_storage(v) {
        }
        Value(const QByteArray &v) : m_kind(Kind::Bytea), m_storage(v) {
        }
        Value(const std::vector<std::uint8_t> &v);
        Value(const sqlforge::Decimal &v) : m_kind(Kind::Numeric), m_storage(v) {
        }
        Value(const QDate &v) : m_kind(Kind::Date), m_storage(v) {
        }
        Value(const QTime &v) : m_kind(Kind::Time), m_storage(v) {
        }
        // UTC 时间映射为 TIMESTAMPTZ, 其余为 TIMESTAMP
        Value(const QDateTime &v);
        Value(const postgres::Interval &v) : m_kind(Kind::Interval), m_storage(v) {
        }
        Value(const boost::asio::ip::address &v) : m_kind(Kind::Inet), m_storage(v) {
        }
        Value(const boost::asio::ip::address_v4 &v) : Value(boost::asio::ip::address(v)) {
        }
        Value(const boost::asio::ip::address_v6 &v) : Value(boost::asio::ip::address(v)) {
        }
        Value(const Network &v) : m_kind(Kind::Cidr), m_storage(v) {
        }
        Value(const MacAddress &v) : m_kind(Kind::MacAddr), m_storage(v) {
        }
        Value(const QUuid &v) : m_kind(Kind::Uuid), m_storage(v) {
        }
        Value(const QJsonValue &v) : m_kind(Kind::Json), m_storage(v) {
        }
        Value(const QJsonObject &v) : Value(QJsonValue(v)) {
        }
        Value(const QJsonArray &v) : Value(QJsonValue(v)) {
        }
        Value(const QJsonDocument &v);

        template <typename T>
        Value(const std::optional<T> &v) : Value(v ? Value(*v) : Value()) {
        }

        Kind kind() const {
            return m_kind;
        }
        bool isNull() const {
            return m_kind == Kind::Null;
        }
        const Storage &storage() const {
            return m_storage;
        }
        template <typename T>
        const T *getIf() const {
            return std::get_if<T>(&m_storage);
        }

        const char *kindName() const;
        // Null 返回 "UNKNOWN", 由服务端推断参数类型
        const char *sqlTypeName() const;
        // 参数类型 OID, Null 为 0 (unspecified)
        unsigned int typeOid() const;
        bool isDefaultValue() const;
        // 文本协议下的参数表示
        std::string toString() const;

        bool operator==(const Value &other) const {
            return m_kind == other.m_kind && m_storage == other.m_storage;
        }

        static Value convert(const std::any &value);

      private:
        Kind m_kind = Kind::Null;
        Storage m_storage;
    };

    std::ostream &operator<<(std::ostream &os, const Value &value);

}  // namespace sqlforge::postgres

#endif  // sqlforge_POSTGRES_VALUE_H
