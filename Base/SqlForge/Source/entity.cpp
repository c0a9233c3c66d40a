#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <cctype>

#include "sqlforge/entity_meta.h"
#include "sqlforge/row.h"

namespace sqlforge {

    std::string toSnakeCase(const std::string &name) {
        std::string result;
        result.reserve(name.size() + 4);
        for (size_t i = 0; i < name.size(); ++i) {
            const unsigned char c = static_cast<unsigned char>(name[i]);
            if (std::isupper(c)) {
                if (i > 0) {
                    const unsigned char prev = static_cast<unsigned char>(name[i - 1]);
                    if (std::islower(prev) || std::isdigit(prev)) result += '_';
                }
                result += static_cast<char>(std::tolower(c));
            } else {
                result += static_cast<char>(c);
            }
        }
        return result;
    }

    namespace internal {

        bool jsonFromVariant(const QVariant &variant, QJsonValue &out) {
            if (variant.isNull()) {
                out = QJsonValue(QJsonValue::Null);
                return true;
            }
            if (variant.typeId() == QMetaType::QJsonValue) {
                out = variant.toJsonValue();
                return true;
            }
            if (variant.typeId() == QMetaType::QJsonDocument) {
                const QJsonDocument doc = variant.toJsonDocument();
                out = doc.isArray() ? QJsonValue(doc.array()) : QJsonValue(doc.object());
                return true;
            }
            const QByteArray text = variant.toByteArray();
            QJsonParseError parse_error;
            const QJsonDocument doc = QJsonDocument::fromJson(text, &parse_error);
            if (parse_error.error == QJsonParseError::NoError) {
                out = doc.isArray() ? QJsonValue(doc.array()) : QJsonValue(doc.object());
                return true;
            }
            // 标量 JSON (数字, 字符串, true/false) 包成数组后再解析
            const QJsonDocument wrapped = QJsonDocument::fromJson("[" + text + "]", &parse_error);
            if (parse_error.error != QJsonParseError::NoError || !wrapped.isArray() || wrapped.array().size() != 1) return false;
            out = wrapped.array().at(0);
            return true;
        }

        bool bytesFromVariant(const QVariant &variant, QByteArray &out) {
            if (variant.isNull()) return false;
            const QByteArray bytes = variant.toByteArray();
            // PostgreSQL 文本协议的 bytea 为 \x 十六进制
            if (variant.typeId() == QMetaType::QString && bytes.startsWith("\\x")) {
                out = QByteArray::fromHex(bytes.mid(2));
                return true;
            }
            out = bytes;
            return true;
        }

    }  // namespace internal

}  // namespace sqlforge
