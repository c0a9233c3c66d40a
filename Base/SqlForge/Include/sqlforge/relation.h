#ifndef sqlforge_RELATION_H
#define sqlforge_RELATION_H

#include <expected>
#include <sstream>
#include <string>
#include <vector>

#include "sqlforge/error.h"

namespace sqlforge {

    // 跨实体关联校验: 关联方提供的外键值都必须等于本方主键
    template <typename V>
    class EntitiesRelation {
      public:
        enum class Kind { OneToOne, OneToMany, ManyToMany };

        static EntitiesRelation OneToOne(V key) {
            return EntitiesRelation(Kind::OneToOne, std::move(key));
        }
        static EntitiesRelation OneToMany(V key) {
            return EntitiesRelation(Kind::OneToMany, std::move(key));
        }
        static EntitiesRelation ManyToMany(V key) {
            return EntitiesRelation(Kind::ManyToMany, std::move(key));
        }

        Kind kind() const {
            return m_kind;
        }
        const V &key() const {
            return m_key;
        }

        std::expected<void, Error> validate(const std::vector<V> &values) const {
            if (values.empty() || (m_kind == Kind::OneToOne && values.size() != 1)) {
                return std::unexpected(errors::relationValueEmpty(values.size()));
            }
            for (size_t i = 0; i < values.size(); ++i) {
                if (!(values[i] == m_key)) {
                    return std::unexpected(errors::relationValueMismatch(i, describe(m_key), describe(values[i])));
                }
            }
            return {};
        }

      private:
        EntitiesRelation(Kind kind, V key) : m_kind(kind), m_key(std::move(key)) {
        }

        static std::string describe(const V &value) {
            std::ostringstream os;
            os << value;
            return os.str();
        }

        Kind m_kind;
        V m_key;
    };

}  // namespace sqlforge

#endif  // sqlforge_RELATION_H
