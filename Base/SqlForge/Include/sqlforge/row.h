#ifndef sqlforge_ROW_H
#define sqlforge_ROW_H

#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QJsonValue>
#include <QString>
#include <QTime>
#include <QUuid>
#include <QVariant>
#include <boost/asio/ip/address.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "sqlforge/conversion.h"
#include "sqlforge/decimal.h"

namespace sqlforge {

    // 驱动返回的一行: 列名 + 值, 按列序保存
    class Row {
      public:
        Row() = default;
        Row(std::vector<std::string> columns, std::vector<QVariant> values) : m_columns(std::move(columns)), m_values(std::move(values)) {
        }

        void append(std::string column, QVariant value) {
            m_columns.push_back(std::move(column));
            m_values.push_back(std::move(value));
        }

        size_t size() const {
            return m_values.size();
        }
        bool empty() const {
            return m_values.empty();
        }
        const std::vector<std::string> &columns() const {
            return m_columns;
        }
        const QVariant &at(size_t index) const {
            return m_values.at(index);
        }

        // 列不存在时返回 nullptr
        const QVariant *value(const std::string &column) const {
            for (size_t i = 0; i < m_columns.size(); ++i) {
                if (m_columns[i] == column) return &m_values[i];
            }
            return nullptr;
        }

      private:
        std::vector<std::string> m_columns;
        std::vector<QVariant> m_values;
    };

    namespace internal {

        bool jsonFromVariant(const QVariant &variant, QJsonValue &out);
        bool bytesFromVariant(const QVariant &variant, QByteArray &out);

        // QVariant -> 字段类型; 无法转换时返回 false, out 不变
        template <typename T>
        bool fromQVariant(const QVariant &variant, T &out) {
            if constexpr (is_optional<T>::value) {
                if (variant.isNull()) {
                    out = std::nullopt;
                    return true;
                }
                typename T::value_type inner{};
                if (!fromQVariant(variant, inner)) return false;
                out = std::move(inner);
                return true;
            } else if constexpr (std::is_same_v<T, bool>) {
                if (variant.isNull()) return false;
                if (variant.typeId() == QMetaType::QString) {
                    const QString text = variant.toString().trimmed().toLower();
                    if (text == "t" || text == "true" || text == "1") {
                        out = true;
                        return true;
                    }
                    if (text == "f" || text == "false" || text == "0") {
                        out = false;
                        return true;
                    }
                    return false;
                }
                out = variant.toBool();
                return true;
            } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
                bool ok = false;
                const qlonglong v = variant.toLongLong(&ok);
                if (!ok) return false;
                out = static_cast<T>(v);
                return true;
            } else if constexpr (std::is_integral_v<T>) {
                bool ok = false;
                const qulonglong v = variant.toULongLong(&ok);
                if (!ok) return false;
                out = static_cast<T>(v);
                return true;
            } else if constexpr (std::is_floating_point_v<T>) {
                bool ok = false;
                const double v = variant.toDouble(&ok);
                if (!ok) return false;
                out = static_cast<T>(v);
                return true;
            } else if constexpr (std::is_same_v<T, std::string>) {
                if (variant.isNull()) return false;
                out = variant.toString().toStdString();
                return true;
            } else if constexpr (std::is_same_v<T, QString>) {
                if (variant.isNull()) return false;
                out = variant.toString();
                return true;
            } else if constexpr (std::is_same_v<T, QByteArray>) {
                return bytesFromVariant(variant, out);
            } else if constexpr (std::is_same_v<T, std::vector<std::uint8_t>>) {
                QByteArray bytes;
                if (!bytesFromVariant(variant, bytes)) return false;
                out.assign(bytes.begin(), bytes.end());
                return true;
            } else if constexpr (std::is_same_v<T, QDateTime>) {
                QDateTime v = variant.toDateTime();
                if (!v.isValid()) v = QDateTime::fromString(variant.toString(), Qt::ISODateWithMs);
                if (!v.isValid()) return false;
                out = v;
                return true;
            } else if constexpr (std::is_same_v<T, QDate>) {
                QDate v = variant.toDate();
                if (!v.isValid()) v = QDate::fromString(variant.toString(), Qt::ISODate);
                if (!v.isValid()) return false;
                out = v;
                return true;
            } else if constexpr (std::is_same_v<T, QTime>) {
                QTime v = variant.toTime();
                if (!v.isValid()) v = QTime::fromString(variant.toString(), Qt::ISODateWithMs);
                if (!v.isValid()) return false;
                out = v;
                return true;
            } else if constexpr (std::is_same_v<T, QJsonValue>) {
                return jsonFromVariant(variant, out);
            } else if constexpr (std::is_same_v<T, QUuid>) {
                if (variant.isNull()) return false;
                out = QUuid::fromString(variant.toString());
                return true;
            } else if constexpr (std::is_same_v<T, Decimal>) {
                if (variant.isNull()) return false;
                out = Decimal(variant.toString().toStdString());
                return true;
            } else if constexpr (std::is_same_v<T, boost::asio::ip::address>) {
                boost::system::error_code ec;
                auto address = boost::asio::ip::make_address(variant.toString().toStdString(), ec);
                if (ec) return false;
                out = address;
                return true;
            } else {
                return false;
            }
        }

    }  // namespace internal

}  // namespace sqlforge

#endif  // sqlforge_ROW_H
