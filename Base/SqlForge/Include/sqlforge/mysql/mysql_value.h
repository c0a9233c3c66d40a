#ifndef sqlforge_MYSQL_VALUE_H
#define sqlforge_MYSQL_VALUE_H

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

namespace sqlforge::mysql {

    // MySQL 方言下可绑定的单个标量
    class Value {
      public:
        enum class Kind {
            Null,
            Bool,
            TinyInt,
            SmallInt,
            Int,
            BigInt,
            TinyUnsigned,
            SmallUnsigned,
            IntUnsigned,
            BigUnsigned,
            Float,
            Double,
            Decimal,
            Text,
            Blob,
            Date,
            Time,
            DateTime,
            Timestamp,
            Json,
            Uuid,
            IpAddr,
            Ipv4,
            Ipv6
        };

        // 有符号整数统一存为 qint64, 无符号统一存为 quint64, 宽度由 Kind 区分
        using Storage = std::variant<std::monostate, bool, qint64, quint64, float, double, sqlforge::Decimal, QString, QByteArray, QDate, QTime, QDateTime, QJsonValue, QUuid, boost::asio::ip::address>;

        Value() = default;
        Value(std::nullptr_t) {
        }
        Value(std::nullopt_t) {
        }
        Value(bool v) : m_kind(Kind::Bool), m_storage(v) {
        }

        template <typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
        Value(T v) {
            if constexpr (std::is_signed_v<T>) {
                m_storage = static_cast<qint64>(v);
                m_kind = sizeof(T) == 1 ? Kind::TinyInt : sizeof(T) == 2 ? Kind::SmallInt : sizeof(T) == 4 ? Kind::Int : Kind::BigInt;
            } else {
                m_storage = static_cast<quint64>(v);
                m_kind = sizeof(T) == 1 ? Kind::TinyUnsigned : sizeof(T) == 2 ? Kind::SmallUnsigned : sizeof(T) == 4 ? Kind::IntUnsigned : Kind::BigUnsigned;
            }
        }

        Value(float v) : m_kind(Kind::Float), m_storage(v) {
        }
        Value(double v) : m_kind(Kind::Double), m_storage(v) {
        }

        Value(const char *v);
        Value(const std::string &v);
        Value(std::string_view v);
        Value(const QString &v) : m_kind(Kind::Text), m_storage(v) {
        }
        Value(const QByteArray &v) : m_kind(Kind::Blob), m_storage(v) {
        }
        Value(const std::vector<std::uint8_t> &v);
        Value(const sqlforge::Decimal &v) : m_kind(Kind::Decimal), m_storage(v) {
        }
        Value(const QDate &v) : m_kind(Kind::Date), m_storage(v) {
        }
        Value(const QTime &v) : m_kind(Kind::Time), m_storage(v) {
        }
        // UTC 时间映射为 TIMESTAMP, 其余为 DATETIME
        Value(const QDateTime &v);
        Value(const QJsonValue &v) : m_kind(Kind::Json), m_storage(v) {
        }
        Value(const QJsonObject &v) : Value(QJsonValue(v)) {
        }
        Value(const QJsonArray &v) : Value(QJsonValue(v)) {
        }
        Value(const QJsonDocument &v);
        Value(const QUuid &v) : m_kind(Kind::Uuid), m_storage(v) {
        }
        Value(const boost::asio::ip::address &v) : m_kind(Kind::IpAddr), m_storage(v) {
        }
        Value(const boost::asio::ip::address_v4 &v) : m_kind(Kind::Ipv4), m_storage(boost::asio::ip::address(v)) {
        }
        Value(const boost::asio::ip::address_v6 &v) : m_kind(Kind::Ipv6), m_storage(boost::asio::ip::address(v)) {
        }

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

        bool isUnsigned() const {
            return m_kind == Kind::TinyUnsigned || m_kind == Kind::SmallUnsigned || m_kind == Kind::IntUnsigned || m_kind == Kind::BigUnsigned;
        }

        const char *kindName() const;
        const char *sqlTypeName() const;
        bool isDefaultValue() const;
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

}  // namespace sqlforge::mysql

#endif  // sqlforge_MYSQL_VALUE_H
