#include "sqlforge/mysql/mysql_value.h"

#include <QVariant>

#include "sqlforge/conversion.h"

namespace sqlforge::mysql {

    Value::Value(const char *v) {
        if (v) {
            m_kind = Kind::Text;
            m_storage = QString::fromUtf8(v);
        }
    }

    Value::Value(const std::string &v) : m_kind(Kind::Text), m_storage(QString::fromStdString(v)) {
    }

    Value::Value(std::string_view v) : m_kind(Kind::Text), m_storage(QString::fromUtf8(v.data(), static_cast<qsizetype>(v.size()))) {
    }

    Value::Value(const std::vector<std::uint8_t> &v) : m_kind(Kind::Blob), m_storage(QByteArray(reinterpret_cast<const char *>(v.data()), static_cast<qsizetype>(v.size()))) {
    }

    Value::Value(const QDateTime &v) : m_kind(v.timeSpec() == Qt::UTC ? Kind::Timestamp : Kind::DateTime), m_storage(v) {
    }

    Value::Value(const QJsonDocument &v) : m_kind(Kind::Json) {
        if (v.isArray()) {
            m_storage = QJsonValue(v.array());
        } else if (v.isObject()) {
            m_storage = QJsonValue(v.object());
        } else {
            m_storage = QJsonValue();
        }
    }

    const char *Value::kindName() const {
        switch (m_kind) {
            case Kind::Null:
                return "Null";
            case Kind::Bool:
                return "Bool";
            case Kind::TinyInt:
                return "TinyInt";
            case Kind::SmallInt:
                return "SmallInt";
            case Kind::Int:
                return "Int";
            case Kind::BigInt:
                return "BigInt";
            case Kind::TinyUnsigned:
                return "TinyUnsigned";
            case Kind::SmallUnsigned:
                return "SmallUnsigned";
            case Kind::IntUnsigned:
                return "IntUnsigned";
            case Kind::BigUnsigned:
                return "BigUnsigned";
            case Kind::Float:
                return "Float";
            case Kind::Double:
                return "Double";
            case Kind::Decimal:
                return "Decimal";
            case Kind::Text:
                return "Text";
            case Kind::Blob:
                return "Blob";
            case Kind::Date:
                return "Date";
            case Kind::Time:
                return "Time";
            case Kind::DateTime:
                return "DateTime";
            case Kind::Timestamp:
                return "Timestamp";
            case Kind::Json:
                return "Json";
            case Kind::Uuid:
                return "Uuid";
            case Kind::IpAddr:
                return "IpAddr";
            case Kind::Ipv4:
                return "Ipv4";
            case Kind::Ipv6:
                return "Ipv6";
        }
        return "Null";
    }

    const char *Value::sqlTypeName() const {
        switch (m_kind) {
            case Kind::Null:
                return "NULL";
            case Kind::Bool:
                return "BOOLEAN";
            case Kind::TinyInt:
                return "TINYINT";
            case Kind::SmallInt:
                return "SMALLINT";
            case Kind::Int:
                return "INT";
            case Kind::BigInt:
                return "BIGINT";
            case Kind::TinyUnsigned:
                return "TINYINT UNSIGNED";
            case Kind::SmallUnsigned:
                return "SMALLINT UNSIGNED";
            case Kind::IntUnsigned:
                return "INT UNSIGNED";
            case Kind::BigUnsigned:
                return "BIGINT UNSIGNED";
            case Kind::Float:
                return "FLOAT";
            case Kind::Double:
                return "DOUBLE";
            case Kind::Decimal:
                return "DECIMAL";
            case Kind::Text:
                return "TEXT";
            case Kind::Blob:
                return "BLOB";
            case Kind::Date:
                return "DATE";
            case Kind::Time:
                return "TIME";
            case Kind::DateTime:
                return "DATETIME";
            case Kind::Timestamp:
                return "TIMESTAMP";
            case Kind::Json:
                return "JSON";
            case Kind::Uuid:
                return "CHAR(36)";
            case Kind::IpAddr:
            case Kind::Ipv4:
            case Kind::Ipv6:
                return "VARCHAR(45)";
        }
        return "NULL";
    }

    bool Value::isDefaultValue() const {
        if (const auto *i = std::get_if<qint64>(&m_storage)) return *i == 0;
        if (const auto *u = std::get_if<quint64>(&m_storage)) return *u == 0;
        if (m_kind == Kind::Text) return std::get<QString>(m_storage).isEmpty();
        if (m_kind == Kind::Uuid) return std::get<QUuid>(m_storage).isNull();
        return false;
    }

    std::string Value::toString() const {
        switch (m_kind) {
            case Kind::Null:
                return "NULL";
            case Kind::Bool:
                return std::get<bool>(m_storage) ? "true" : "false";
            case Kind::TinyInt:
            case Kind::SmallInt:
            case Kind::Int:
            case Kind::BigInt:
                return std::to_string(std::get<qint64>(m_storage));
            case Kind::TinyUnsigned:
            case Kind::SmallUnsigned:
            case Kind::IntUnsigned:
            case Kind::BigUnsigned:
                return std::to_string(std::get<quint64>(m_storage));
            case Kind::Float:
                return QString::number(std::get<float>(m_storage)).toStdString();
            case Kind::Double:
                return QString::number(std::get<double>(m_storage)).toStdString();
            case Kind::Decimal:
                return std::get<sqlforge::Decimal>(m_storage).toString();
            case Kind::Text:
                return std::get<QString>(m_storage).toStdString();
            case Kind::Blob:
                return "x'" + std::get<QByteArray>(m_storage).toHex().toStdString() + "'";
            case Kind::Date:
                return std::get<QDate>(m_storage).toString(QStringLiteral("yyyy-MM-dd")).toStdString();
            case Kind::Time:
                return std::get<QTime>(m_storage).toString(QStringLiteral("HH:mm:ss.zzz")).toStdString();
            case Kind::DateTime:
            case Kind::Timestamp:
                return std::get<QDateTime>(m_storage).toString(QStringLiteral("yyyy-MM-dd HH:mm:ss.zzz")).toStdString();
            case Kind::Json: {
                const QJsonValue &json = std::get<QJsonValue>(m_storage);
                if (json.isObject()) return QJsonDocument(json.toObject()).toJson(QJsonDocument::Compact).toStdString();
                if (json.isArray()) return QJsonDocument(json.toArray()).toJson(QJsonDocument::Compact).toStdString();
                return json.toVariant().toString().toStdString();
            }
            case Kind::Uuid:
                return std::get<QUuid>(m_storage).toString(QUuid::WithoutBraces).toStdString();
            case Kind::IpAddr:
            case Kind::Ipv4:
            case Kind::Ipv6:
                return std::get<boost::asio::ip::address>(m_storage).to_string();
        }
        return "NULL";
    }

    Value Value::convert(const std::any &value) {
        return internal::convertAny<Value, bool, char, signed char, unsigned char, short, unsigned short, int, unsigned int, long, unsigned long, long long, unsigned long long, float, double, std::string, std::string_view, const char *, QString, QByteArray, std::vector<std::uint8_t>,
                                    sqlforge::Decimal, QDate, QTime, QDateTime, QJsonValue, QJsonObject, QJsonArray, QJsonDocument, QUuid, boost::asio::ip::address, boost::asio::ip::address_v4, boost::asio::ip::address_v6>(value);
    }

    std::ostream &operator<<(std::ostream &os, const Value &value) {
        return os << value.kindName() << "(" << value.toString() << ")";
    }

}  // namespace sqlforge::mysql
