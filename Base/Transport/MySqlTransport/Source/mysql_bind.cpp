#include "sqlforge_mysql_transport/mysql_bind.h"

#include <mysql/errmsg.h>

#include <QDate>
#include <QDateTime>
#include <QTime>
#include <QTimeZone>
#include <cstring>

namespace sqlforge_mysql_transport {

    namespace {

        template <typename T>
        std::vector<unsigned char> bytesOf(const T& value) {
            std::vector<unsigned char> bytes(sizeof(T));
            std::memcpy(bytes.data(), &value, sizeof(T));
            return bytes;
        }

        MYSQL_TIME makeTime(const QDate& date, const QTime& time, enum enum_mysql_timestamp_type type) {
            MYSQL_TIME out;
            std::memset(&out, 0, sizeof(out));
            if (date.isValid()) {
                out.year = static_cast<unsigned int>(date.year());
                out.month = static_cast<unsigned int>(date.month());
                out.day = static_cast<unsigned int>(date.day());
            }
            if (time.isValid()) {
                out.hour = static_cast<unsigned int>(time.hour());
                out.minute = static_cast<unsigned int>(time.minute());
                out.second = static_cast<unsigned int>(time.second());
                out.second_part = static_cast<unsigned long>(time.msec()) * 1000;
            }
            out.time_type = type;
            return out;
        }

        // HH:mm:ss[.ffffff], 小数部分保留到毫秒
        QTime parseClock(QStringView text) {
            int msec = 0;
            qsizetype dot = text.indexOf(u'.');
            if (dot >= 0) {
                msec = text.mid(dot + 1, 3).toString().leftJustified(3, u'0').toInt();
                text = text.left(dot);
            }
            QTime time = QTime::fromString(text.toString(), QStringLiteral("HH:mm:ss"));
            return time.isValid() ? time.addMSecs(msec) : time;
        }

    }  // namespace

    ParamBuffers::ParamBuffers(const std::vector<sqlforge::mysql::Value>& values) : m_storage(values.size()), m_lengths(values.size(), 0), m_binds(values.size()) {
        for (std::size_t i = 0; i < values.size(); ++i) {
            bindOne(i, values[i]);
        }
    }

    void ParamBuffers::bindOne(std::size_t index, const sqlforge::mysql::Value& value) {
        using Kind = sqlforge::mysql::Value::Kind;
        MYSQL_BIND& bind = m_binds[index];
        std::memset(&bind, 0, sizeof(bind));
        std::vector<unsigned char>& storage = m_storage[index];

        switch (value.kind()) {
            case Kind::Null:
                bind.buffer_type = MYSQL_TYPE_NULL;
                return;
            case Kind::Bool:
                bind.buffer_type = MYSQL_TYPE_TINY;
                storage = bytesOf<signed char>(*value.getIf<bool>() ? 1 : 0);
                break;
            case Kind::TinyInt:
            case Kind::SmallInt:
            case Kind::Int:
            case Kind::BigInt:
                bind.buffer_type = MYSQL_TYPE_LONGLONG;
                storage = bytesOf(static_cast<long long>(*value.getIf<qint64>()));
                break;
            case Kind::TinyUnsigned:
            case Kind::SmallUnsigned:
            case Kind::IntUnsigned:
            case Kind::BigUnsigned:
                bind.buffer_type = MYSQL_TYPE_LONGLONG;
                bind.is_unsigned = true;
                storage = bytesOf(static_cast<unsigned long long>(*value.getIf<quint64>()));
                break;
            case Kind::Float:
                bind.buffer_type = MYSQL_TYPE_FLOAT;
                storage = bytesOf(*value.getIf<float>());
                break;
            case Kind::Double:
                bind.buffer_type = MYSQL_TYPE_DOUBLE;
                storage = bytesOf(*value.getIf<double>());
                break;
            case Kind::Blob: {
                const QByteArray& blob = *value.getIf<QByteArray>();
                bind.buffer_type = MYSQL_TYPE_BLOB;
                storage.assign(blob.begin(), blob.end());
                break;
            }
            case Kind::Date:
                bind.buffer_type = MYSQL_TYPE_DATE;
                storage = bytesOf(makeTime(*value.getIf<QDate>(), QTime(), MYSQL_TIMESTAMP_DATE));
                break;
            case Kind::Time:
                bind.buffer_type = MYSQL_TYPE_TIME;
                storage = bytesOf(makeTime(QDate(), *value.getIf<QTime>(), MYSQL_TIMESTAMP_TIME));
                break;
            case Kind::DateTime:
            case Kind::Timestamp: {
                const QDateTime& stamp = *value.getIf<QDateTime>();
                bind.buffer_type = value.kind() == Kind::Timestamp ? MYSQL_TYPE_TIMESTAMP : MYSQL_TYPE_DATETIME;
                storage = bytesOf(makeTime(stamp.date(), stamp.time(), MYSQL_TIMESTAMP_DATETIME));
                break;
            }
            case Kind::Decimal:
            case Kind::Text:
            case Kind::Json:
            case Kind::Uuid:
            case Kind::IpAddr:
            case Kind::Ipv4:
            case Kind::Ipv6: {
                std::string text = value.toString();
                bind.buffer_type = MYSQL_TYPE_STRING;
                storage.assign(text.begin(), text.end());
                break;
            }
        }

        bind.buffer = storage.empty() ? nullptr : storage.data();
        bind.buffer_length = static_cast<unsigned long>(storage.size());
        if (bind.buffer_type == MYSQL_TYPE_STRING || bind.buffer_type == MYSQL_TYPE_BLOB) {
            m_lengths[index] = static_cast<unsigned long>(storage.size());
            bind.length = &m_lengths[index];
        }
    }

    QVariant cellToVariant(const ColumnMeta& column, std::string_view cell) {
        const QString text = QString::fromUtf8(cell.data(), static_cast<qsizetype>(cell.size()));
        switch (column.type) {
            case MYSQL_TYPE_TINY:
            case MYSQL_TYPE_SHORT:
            case MYSQL_TYPE_INT24:
            case MYSQL_TYPE_LONG:
            case MYSQL_TYPE_LONGLONG:
            case MYSQL_TYPE_YEAR:
                if (column.flags & UNSIGNED_FLAG) return QVariant::fromValue(text.toULongLong());
                return QVariant::fromValue(text.toLongLong());
            case MYSQL_TYPE_FLOAT:
            case MYSQL_TYPE_DOUBLE:
                return QVariant(text.toDouble());
            case MYSQL_TYPE_DATE:
                return QVariant(QDate::fromString(text, QStringLiteral("yyyy-MM-dd")));
            case MYSQL_TYPE_TIME:
                return QVariant(parseClock(text));
            case MYSQL_TYPE_DATETIME:
            case MYSQL_TYPE_TIMESTAMP: {
                qsizetype space = text.indexOf(u' ');
                if (space < 0) return QVariant(text);
                QDate date = QDate::fromString(text.left(space), QStringLiteral("yyyy-MM-dd"));
                QTime time = parseClock(QStringView(text).mid(space + 1));
                if (!date.isValid() || !time.isValid()) return QVariant(text);
                // TIMESTAMP 按 UTC 存储
                if (column.type == MYSQL_TYPE_TIMESTAMP) return QVariant(QDateTime(date, time, QTimeZone::utc()));
                return QVariant(QDateTime(date, time));
            }
            case MYSQL_TYPE_BIT:
            case MYSQL_TYPE_TINY_BLOB:
            case MYSQL_TYPE_MEDIUM_BLOB:
            case MYSQL_TYPE_LONG_BLOB:
            case MYSQL_TYPE_BLOB:
            case MYSQL_TYPE_STRING:
            case MYSQL_TYPE_VAR_STRING:
                if (column.flags & BINARY_FLAG) return QVariant(QByteArray(cell.data(), static_cast<qsizetype>(cell.size())));
                return QVariant(text);
            default:
                return QVariant(text);
        }
    }

    sqlforge::Error makeError(unsigned int mysql_errno_value, const char* sqlstate, const char* message, const std::string& context, sqlforge::ErrorCode fallback) {
        bool client_side = mysql_errno_value >= CR_MIN_ERROR && mysql_errno_value <= CR_MAX_ERROR;
        std::string text = context;
        if (message && *message) text += ": " + std::string(message);
        std::string state = sqlstate && std::strcmp(sqlstate, "00000") != 0 ? sqlstate : "";
        return sqlforge::Error(client_side ? sqlforge::ErrorCode::ConnectionFailed : fallback, std::move(text), static_cast<int>(mysql_errno_value), std::move(state));
    }

}  // namespace sqlforge_mysql_transport
