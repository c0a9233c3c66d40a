#include "sqlforge/postgres/postgres_value.h"

#include <QVariant>
#include <format>

#include "sqlforge/conversion.h"

namespace sqlforge::postgres {

    std::string Interval::toString() const {
        // ISO 8601 与 PostgreSQL 输入格式都接受 "N mons N days N microseconds"
        return std::format("{} mons {} days {} microseconds", months, days, microseconds);
    }

    std::string Network::toString() const {
        return address.to_string() + "/" + std::to_string(prefix_length);
    }

    std::string MacAddress::toString() const {
        return std::format("{:02x}:{:02x}:{:02x}:{:02x}:{:02x}:{:02x}", bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
    }

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

    Value::Value(const std::vector<std::uint8_t> &v) : m_kind(Kind::Bytea), m_storage(QByteArray(reinterpret_cast<const char *>(v.data()), static_cast<qsizetype>(v.size()))) {
    }

    Value::Value(const QDateTime &v) : m_kind(v.timeSpec() == Qt::UTC ? Kind::Timestamptz : Kind::Timestamp), m_storage(v) {
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
            case Kind::Int2:
                return "Int2";
            case Kind::Int4:
                return "Int4";
            case Kind::Int8:
                return "Int8";
            case Kind::Float4:
                return "Float4";
            case Kind::Float8:
                return "Float8";
            case Kind::Numeric:
                return "Numeric";
            case Kind::Text:
                return "Text";
            case Kind::Bytea:
                return "Bytea";
            case Kind::Date:
                return "Date";
            case Kind::Time:
                return "Time";
            case Kind::Timestamp:
                return "Timestamp";
            case Kind::Timestamptz:
                return "Timestamptz";
            case Kind::Interval:
                return "Interval";
            case Kind::Inet:
                return "Inet";
            case Kind::Cidr:
                return "Cidr";
            case Kind::MacAddr:
                return "MacAddr";
            case Kind::Uuid:
                return "Uuid";
            case Kind::Json:
                return "Json";
        }
        return "Null";
    }

    const char *Value::sqlTypeName() const {
        switch (m_kind) {
            case Kind::Null:
                return "UNKNOWN";
            case Kind::Bool:
                return "BOOL";
            case Kind::Int2:
                return "INT2";
            case Kind::Int4:
                return "INT4";
            case Kind::Int8:
                return "INT8";
            case Kind::Float4:
                return "FLOAT4";
            case Kind::Float8:
                return "FLOAT8";
            case Kind::Numeric:
                return "NUMERIC";
            case Kind::Text:
                return "TEXT";
            case Kind::Bytea:
                return "BYTEA";
            case Kind::Date:
                return "DATE";
            case Kind::Time:
                return "TIME";
            case Kind::Timestamp:
                return "TIMESTAMP";
            case Kind::Timestamptz:
                return "TIMESTAMPTZ";
            case Kind::Interval:
                return "INTERVAL";
            case Kind::Inet:
                return "INET";
            case Kind::Cidr:
                return "CIDR";
            case Kind::MacAddr:
                return "MACADDR";
            case Kind::Uuid:
                return "UUID";
            case Kind::Json:
                return "JSONB";
        }
        return "UNKNOWN";
    }

    unsigned int Value::typeOid() const {
        // 取自 pg_type.dat
        switch (m_kind) {
            case Kind::Null:
                return 0;
            case Kind::Bool:
                return 16;
            case Kind::Int2:
                return 21;
            case Kind::Int4:
                return 23;
            case Kind::Int8:
                return 20;
            case Kind::Float4:
                return 700;
            case Kind::Float8:
                return 701;
            case Kind::Numeric:
                return 1700;
            case Kind::Text:
                return 25;
            case Kind::Bytea:
                return 17;
            case Kind::Date:
                return 1082;
            case Kind::Time:
                return 1083;
            case Kind::Timestamp:
                return 1114;
            case Kind::Timestamptz:
                return 1184;
            case Kind::Interval:
                return 1186;
            case Kind::Inet:
                return 869;
            case Kind::Cidr:
                return 650;
            case Kind::MacAddr:
                return 829;
            case Kind::Uuid:
                return 2950;
            case Kind::Json:
                return 3802;
        }
        return 0;
    }

    bool Value::isDefaultValue() const {
        switch (m_kind) {
            case Kind::Int2:
            case Kind::Int4:
            case Kind::Int8:
                return std::get<qint64>(m_storage) == 0;
            case Kind::Text:
                return std::get<QString>(m_storage).isEmpty();
            case Kind::Uuid:
                return std::get<QUuid>(m_storage).isNull();
            default:
                return false;
        }
    }

    std::string Value::toString() const {
        switch (m_kind) {
            case Kind::Null:
                return "NULL";
            case Kind::Bool:
                return std::get<bool>(m_storage) ? "t" : "f";
            case Kind::Int2:
            case Kind::Int4:
            case Kind::Int8:
                return std::to_string(std::get<qint64>(m_storage));
            case Kind::Float4:
                return QString::number(std::get<float>(m_storage), 'g', 9).toStdString();
            case Kind::Float8:
                return QString::number(std::get<double>(m_storage), 'g', 17).toStdString();
            case Kind::Numeric:
                return std::get<sqlforge::Decimal>(m_storage).toString();
            case Kind::Text:
                return std::get<QString>(m_storage).toStdString();
            case Kind::Bytea:
                return "\\x" + std::get<QByteArray>(m_storage).toHex().toStdString();
            case Kind::Date:
                return std::get<QDate>(m_storage).toString(Qt::ISODate).toStdString();
            case Kind::Time:
                return std::get<QTime>(m_storage).toString(QStringLiteral("HH:mm:ss.zzz")).toStdString();
            case Kind::Timestamp:
            case Kind::Timestamptz:
                return std::get<QDateTime>(m_storage).toString(Qt::ISODateWithMs).toStdString();
            case Kind::Interval:
                return std::get<postgres::Interval>(m_storage).toString();
            case Kind::Inet:
                return std::get<boost::asio::ip::address>(m_storage).to_string();
            case Kind::Cidr:
                return std::get<Network>(m_storage).toString();
            case Kind::MacAddr:
                return std::get<MacAddress>(m_storage).toString();
            case Kind::Uuid:
                return std::get<QUuid>(m_storage).toString(QUuid::WithoutBraces).toStdString();
            case Kind::Json: {
                const QJsonValue &json = std::get<QJsonValue>(m_storage);
                if (json.isObject()) return QJsonDocument(json.toObject()).toJson(QJsonDocument::Compact).toStdString();
                if (json.isArray()) return QJsonDocument(json.toArray()).toJson(QJsonDocument::Compact).toStdString();
                if (json.isString()) return "\"" + json.toString().toStdString() + "\"";
                return json.toVariant().toString().toStdString();
            }
        }
        return "NULL";
    }

    Value Value::convert(const std::any &value) {
        return internal::convertAny<Value, bool, char, signed char, unsigned char, short, unsigned short, int, unsigned int, long, unsigned long, long long, unsigned long long, float, double, std::string, std::string_view, const char *, QString, QByteArray, std::vector<std::uint8_t>,
                                    sqlforge::Decimal, QDate, QTime, QDateTime, postgres::Interval, boost::asio::ip::address, boost::asio::ip::address_v4, boost::asio::ip::address_v6, Network, MacAddress, QUuid, QJsonValue, QJsonObject, QJsonArray, QJsonDocument>(value);
    }

    std::ostream &operator<<(std::ostream &os, const Value &value) {
        return os << value.kindName() << "(" << value.toString() << ")";
    }

}  // namespace sqlforge::postgres
