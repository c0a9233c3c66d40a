#include "sqlforge/sqlite/sqlite_value.h"

#include <QVariant>

#include "sqlforge/conversion.h"

namespace sqlforge::sqlite {

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

    Value::Value(const QDateTime &v) : m_kind(v.timeSpec() == Qt::UTC ? Kind::DateTimeUtc : Kind::DateTime), m_storage(v) {
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

    Value::Value(const Decimal &v) : m_kind(Kind::Text), m_storage(QString::fromStdString(v.toString())) {
    }

    const char *Value::kindName() const {
        switch (m_kind) {
            case Kind::Null:
                return "Null";
            case Kind::Text:
                return "Text";
            case Kind::Integer:
                return "Integer";
            case Kind::Real:
                return "Real";
            case Kind::Bool:
                return "Bool";
            case Kind::Blob:
                return "Blob";
            case Kind::DateTime:
                return "DateTime";
            case Kind::DateTimeUtc:
                return "DateTimeUtc";
            case Kind::Date:
                return "Date";
            case Kind::Time:
                return "Time";
            case Kind::Json:
                return "Json";
            case Kind::Uuid:
                return "Uuid";
        }
        return "Null";
    }

    const char *Value::sqlTypeName() const {
        switch (m_kind) {
            case Kind::Null:
                return "NULL";
            case Kind::Text:
            case Kind::Json:
            case Kind::Uuid:
                return "TEXT";
            case Kind::Integer:
                return "INTEGER";
            case Kind::Real:
                return "REAL";
            case Kind::Bool:
                return "BOOLEAN";
            case Kind::Blob:
                return "BLOB";
            case Kind::DateTime:
            case Kind::DateTimeUtc:
                return "DATETIME";
            case Kind::Date:
                return "DATE";
            case Kind::Time:
                return "TIME";
        }
        return "NULL";
    }

    bool Value::isDefaultValue() const {
        switch (m_kind) {
            case Kind::Integer:
                return std::get<qint64>(m_storage) == 0;
            case Kind::Text:
                return std::get<QString>(m_storage).isEmpty();
            case Kind::Uuid:
                return std::get<QUuid>(m_storage).isNull();
            default:
                return false;
        }
    }

    std::variant<std::monostate, qint64, double, std::string, QByteArray> Value::encode() const {
        switch (m_kind) {
            case Kind::Null:
                return std::monostate{};
            case Kind::Text:
                return std::get<QString>(m_storage).toStdString();
            case Kind::Integer:
                return std::get<qint64>(m_storage);
            case Kind::Real:
                return std::get<double>(m_storage);
            case Kind::Bool:
                return static_cast<qint64>(std::get<bool>(m_storage) ? 1 : 0);
            case Kind::Blob:
                return std::get<QByteArray>(m_storage);
            case Kind::DateTime:
            case Kind::DateTimeUtc:
                return std::get<QDateTime>(m_storage).toString(Qt::ISODateWithMs).toStdString();
            case Kind::Date:
                return std::get<QDate>(m_storage).toString(QStringLiteral("yyyy-MM-dd")).toStdString();
            case Kind::Time:
                return std::get<QTime>(m_storage).toString(QStringLiteral("HH:mm:ss.zzz")).toStdString();
            case Kind::Json: {
                const QJsonValue &json = std::get<QJsonValue>(m_storage);
                if (json.isObject()) return QJsonDocument(json.toObject()).toJson(QJsonDocument::Compact).toStdString();
                if (json.isArray()) return QJsonDocument(json.toArray()).toJson(QJsonDocument::Compact).toStdString();
                return json.toVariant().toString().toStdString();
            }
            case Kind::Uuid:
                return std::get<QUuid>(m_storage).toString(QUuid::WithoutBraces).toStdString();
        }
        return std::monostate{};
    }

    std::string Value::toString() const {
        auto encoded = encode();
        if (std::holds_alternative<std::monostate>(encoded)) return "NULL";
        if (m_kind == Kind::Bool) return std::get<bool>(m_storage) ? "true" : "false";
        if (const auto *i = std::get_if<qint64>(&encoded)) return std::to_string(*i);
        if (const auto *d = std::get_if<double>(&encoded)) return QString::number(*d).toStdString();
        if (const auto *s = std::get_if<std::string>(&encoded)) return *s;
        return "x'" + std::get<QByteArray>(encoded).toHex().toStdString() + "'";
    }

    Value Value::convert(const std::any &value) {
        return internal::convertAny<Value, bool, char, signed char, unsigned char, short, unsigned short, int, unsigned int, long, unsigned long, long long, unsigned long long, float, double, std::string, std::string_view, const char *, QString, QByteArray, std::vector<std::uint8_t>,
                                    QDateTime, QDate, QTime, QJsonValue, QJsonObject, QJsonArray, QJsonDocument, QUuid, Decimal>(value);
    }

    std::ostream &operator<<(std::ostream &os, const Value &value) {
        return os << value.kindName() << "(" << value.toString() << ")";
    }

}  // namespace sqlforge::sqlite
