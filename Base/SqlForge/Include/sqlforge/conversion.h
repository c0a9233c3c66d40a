#ifndef sqlforge_CONVERSION_H
#define sqlforge_CONVERSION_H

#include <any>
#include <optional>
#include <type_traits>

namespace sqlforge {

    // true 表示值等价于 NULL: 空 any, 任意层的 nullopt, 空字符串,
    // 字符串 "null"(不区分大小写), 空字节数组
    bool isEmptyOrNone(const std::any &value);

    namespace internal {

        template <typename T>
        struct is_optional : std::false_type {};
        template <typename T>
        struct is_optional<std::optional<T>> : std::true_type {};

        template <typename T>
        struct unwrap_optional {
            using type = T;
        };
        template <typename T>
        struct unwrap_optional<std::optional<T>> {
            using type = typename unwrap_optional<T>::type;
        };
        template <typename T>
        using unwrap_optional_t = typename unwrap_optional<T>::type;

        // 编译期剥离任意层 optional，nullopt 得到空 any
        template <typename T>
        std::any toAny(const T &value) {
            if constexpr (is_optional<T>::value) {
                if (!value) return std::any();
                return toAny(*value);
            } else {
                return std::any(value);
            }
        }

        template <typename V, typename T>
        bool probeAs(const std::any &a, std::optional<V> &out) {
            if (const T *p = std::any_cast<T>(&a)) {
                out.emplace(V(*p));
                return true;
            }
            if (const auto *p = std::any_cast<std::optional<T>>(&a)) {
                out.emplace(*p ? V(**p) : V());
                return true;
            }
            if (const auto *p = std::any_cast<std::optional<std::optional<T>>>(&a)) {
                out.emplace((*p && **p) ? V(***p) : V());
                return true;
            }
            return false;
        }

        // 依次尝试 Ts... 中的宿主类型; 都不匹配时返回 Null
        template <typename V, typename... Ts>
        V convertAny(const std::any &a) {
            if (!a.has_value()) return V();
            std::optional<V> out;
            (probeAs<V, Ts>(a, out) || ...);
            if (!out) return V();
            return std::move(*out);
        }

    }  // namespace internal

}  // namespace sqlforge

#endif  // sqlforge_CONVERSION_H
