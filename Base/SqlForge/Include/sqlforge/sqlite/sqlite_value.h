#ifndef sqlforge_SQLITE_VALUE_H
#define sqlforge_SQLITE_VALUE_H

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
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "sqlforge/decimal.h"

namespace sqlforge::sqlite {

    // SQLite 方言下可绑定的单个标量
    class Value {
      public:
        enum class Kind { Null, Text, Integer, Real, Bool, Blob, DateTime, DateTimeUtc, Date, Time, Json, Uuid };

        using Storage = std::variant<std::monostate, QString, qint64, double, bool, QByteArray, QDateTime, QDate, QTime, QJsonValue, QUuid>;

        Value() = default;
        Value(std::nullptr_t) {
        }
        Value(std::nullopt_t) {
        }
        Value(bool v) : m_kind(Kind::Bool), m_storage(v) {
        }

        template <typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
        Value(T v) : m_kind(Kind::Integer), m_storage(static_cast<qint64>(v)) {
        }

        template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
        Value(T v) : m_kind(Kind::Real), m_storage(static_cast<double>(v)) {
        }

        Value(const char *v);
        Value(const std::string &v);
        Value(std::string_view v);
        Value(const QString &v) : m_kind(Kind::Text), m_storage(v) {
        }
        Value(const QByteArray &v) : m_kind(Kind::Blob), m_storage(v) {
        }
        Value(const std::vector<std::uint8_t> &v);
        Value(const QDateTime &v);
        Value(const QDate &v) : m_kind(Kind::Date), m_storage(v) {
        }
        Value(const QTime &v) : m_kind(Kind::Time), m_storage(v) {
        }
        Value(const QJsonValue &v) : m_kind(Kind::Json), m_storage(v) {
        }
        Value(const QJsonObject &v) : Value(QJsonValue(v)) {
        }
        Value(const QJsonArray &v) : Value(QJsonValue(v)) {
        }
        Value(const QJsonDocument &v);
        Value(const QUuid &v) : m_kind(Kind::Uuid), m_storage(v) {
        }
        // SQLite 无原生定点数，按文本存储
        Value(const Decimal &v);

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
        // 声明的 SQL 类型; Null 返回中性类型 "NULL"
        const char *sqlTypeName() const;
        bool isDefaultValue() const;
        std::string toString() const;

        // 绑定到驱动时使用的编码: bool -> 整数, 日期时间 -> ISO-8601 文本, Json/Uuid -> 文本
        std::variant<std::monostate, qint64, double, std::string, QByteArray> encode() const;

        bool operator==(const Value &other) const {
            return m_kind == other.m_kind && m_storage == other.m_storage;
        }

        // 从运行时类型擦除的值转换, 无法识别时返回 Null
        static Value convert(const std::any &value);

      private:
        Kind m_kind = Kind::Null;
        Storage m_storage;
    };

    std::ostream &operator<<(std::ostream &os, const Value &value);

}  // namespace sqlforge::sqlite

#endif  // sqlforge_SQLITE_VALUE_H
