#ifndef sqlforge_ENTITY_META_H
#define sqlforge_ENTITY_META_H

#include <QVariant>
#include <algorithm>
#include <any>
#include <cstdint>
#include <functional>
#include <string>
#include <typeindex>
#include <vector>

namespace sqlforge {

    // --- Field Flags ---
    enum class FieldFlag : uint32_t { None = 0, PrimaryKey = 1 << 0, AutoIncrement = 1 << 1, NotNull = 1 << 2 };

    inline FieldFlag operator|(FieldFlag a, FieldFlag b) {
        return static_cast<FieldFlag>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
    }
    inline FieldFlag operator&(FieldFlag a, FieldFlag b) {
        return static_cast<FieldFlag>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
    }
    inline FieldFlag &operator|=(FieldFlag &a, FieldFlag b) {
        a = a | b;
        return a;
    }
    inline bool has_flag(FieldFlag flags, FieldFlag flag_to_check) {
        return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag_to_check)) != 0;
    }

    template <typename... Flags>
    constexpr FieldFlag combine_flags(FieldFlag base, Flags... flags) {
        if constexpr (sizeof...(flags) == 0) {
            return base;
        } else {
            return (base | ... | flags);
        }
    }

    // --- Field Metadata ---
    struct FieldMeta {
        std::string db_name;
        std::string cpp_name;
        std::type_index cpp_type;
        // 剥离 optional 之后的类型
        std::type_index value_type;
        bool nullable = false;
        FieldFlag flags = FieldFlag::None;

        // 读取字段, optional 在编译期解包, nullopt 得到空 any
        std::function<std::any(const void *)> getter;
        // 从驱动返回的 QVariant 写入字段, 类型无法转换时返回 false
        std::function<bool(void *, const QVariant &)> row_setter;

        FieldMeta(std::string dbName,
                  std::string cppName,
                  std::type_index cppType,
                  std::type_index valueType,
                  bool isNullable,
                  FieldFlag fieldFlags = FieldFlag::None,
                  std::function<std::any(const void *)> g = nullptr,
                  std::function<bool(void *, const QVariant &)> s = nullptr)
            : db_name(std::move(dbName)),
              cpp_name(std::move(cppName)),
              cpp_type(cppType),
              value_type(valueType),
              nullable(isNullable),
              flags(fieldFlags),
              getter(std::move(g)),
              row_setter(std::move(s)) {
        }

        bool isPrimaryKey() const {
            return has_flag(flags, FieldFlag::PrimaryKey);
        }
    };

    // --- EntityMeta Definition ---
    struct EntityMeta {
        std::string table_name;
        std::vector<FieldMeta> fields;
        std::vector<std::string> primary_keys_db_names;

        const FieldMeta *findFieldByDbName(const std::string &name) const {
            for (const auto &f : fields)
                if (f.db_name == name && !f.db_name.empty()) return &f;
            return nullptr;
        }
        const FieldMeta *findFieldByCppName(const std::string &name) const {
            for (const auto &f : fields)
                if (f.cpp_name == name) return &f;
            return nullptr;
        }
        std::vector<const FieldMeta *> getPrimaryKeyFields() const {
            std::vector<const FieldMeta *> pks;
            pks.reserve(primary_keys_db_names.size());
            for (const auto &pk_name : primary_keys_db_names) {
                if (auto *f = findFieldByDbName(pk_name)) pks.push_back(f);
            }
            return pks;
        }
        const FieldMeta *findFieldWithFlag(FieldFlag flag_to_find) const {
            auto it = std::find_if(fields.begin(), fields.end(), [flag_to_find](const FieldMeta &fm) {
                return has_flag(fm.flags, flag_to_find);
            });
            return (it == fields.end()) ? nullptr : &(*it);
        }
        std::vector<std::string> columnNames() const {
            std::vector<std::string> names;
            names.reserve(fields.size());
            for (const auto &f : fields) names.push_back(f.db_name);
            return names;
        }
    };

    // ArticleTag -> article_tag
    std::string toSnakeCase(const std::string &name);

}  // namespace sqlforge

#endif  // sqlforge_ENTITY_META_H
