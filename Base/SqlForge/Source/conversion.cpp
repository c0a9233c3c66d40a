#include "sqlforge/conversion.h"

#include <QByteArray>
#include <QString>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "sqlforge/decimal.h"

namespace sqlforge {

    namespace {

        bool isNullText(std::string_view text) {
            if (text.empty()) return true;
            if (text.size() != 4) return false;
            std::string lowered(text);
            std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return lowered == "null";
        }

        // 返回 std::nullopt 表示类型不匹配
        template <typename T>
        std::optional<bool> checkValue(const T &value) {
            if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>) {
                return isNullText(value);
            } else if constexpr (std::is_same_v<T, const char *>) {
                return value == nullptr || isNullText(value);
            } else if constexpr (std::is_same_v<T, QString>) {
                return value.isEmpty() || value.compare(QStringLiteral("null"), Qt::CaseInsensitive) == 0;
            } else if constexpr (std::is_same_v<T, QByteArray>) {
                return value.isEmpty();
            } else if constexpr (std::is_same_v<T, std::vector<std::uint8_t>>) {
                return value.empty();
            } else if constexpr (std::is_same_v<T, Decimal>) {
                return value.isEmpty();
            } else {
                return false;
            }
        }

        template <typename T>
        std::optional<bool> probe(const std::any &value) {
            if (const T *p = std::any_cast<T>(&value)) {
                return checkValue(*p);
            }
            if (const auto *p = std::any_cast<std::optional<T>>(&value)) {
                return *p ? checkValue(**p) : std::optional<bool>(true);
            }
            if (const auto *p = std::any_cast<std::optional<std::optional<T>>>(&value)) {
                return (*p && **p) ? checkValue(***p) : std::optional<bool>(true);
            }
            return std::nullopt;
        }

        template <typename... Ts>
        std::optional<bool> probeAll(const std::any &value) {
            std::optional<bool> result;
            ((result = probe<Ts>(value)) || ...);
            return result;
        }

    }  // namespace

    bool isEmptyOrNone(const std::any &value) {
        if (!value.has_value()) {
            return true;
        }
        auto result = probeAll<std::string, std::string_view, const char *, QString, QByteArray, std::vector<std::uint8_t>, Decimal, bool, int, long, long long, unsigned int, unsigned long, unsigned long long, short, unsigned short, double, float>(value);
        // 未识别的类型视为有值
        return result.value_or(false);
    }

}  // namespace sqlforge
