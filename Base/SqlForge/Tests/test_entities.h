#ifndef sqlforge_TESTS_TEST_ENTITIES_H
#define sqlforge_TESTS_TEST_ENTITIES_H

#include <QtGlobal>
#include <optional>
#include <string>

#include "sqlforge/entity.h"
#include "sqlforge/entity_macros.h"

namespace sqlforge_test {

    class User : public sqlforge::Entity<User> {
      public:
        sqlforge_ENTITY_TABLE(User, "users")
        sqlforge_AUTO_INCREMENT_PRIMARY_KEY(qint64, id, "id")
        sqlforge_FIELD(std::string, name, "name", sqlforge::FieldFlag::NotNull)
        sqlforge_FIELD(int, age, "age")
        sqlforge_FIELD(std::optional<std::string>, email, "email")
    };

    class Article : public sqlforge::Entity<Article> {
      public:
        sqlforge_ENTITY_TABLE(Article, "article")
        sqlforge_AUTO_INCREMENT_PRIMARY_KEY(qint64, id, "id")
        sqlforge_FIELD(std::string, title, "title")
        sqlforge_FIELD(bool, deleted, "deleted")
    };

    // 表名由类名推导: article_tag
    class ArticleTag : public sqlforge::Entity<ArticleTag> {
      public:
        sqlforge_ENTITY_BEGIN(ArticleTag)
        sqlforge_PRIMARY_KEY(qint64, article_id, "article_id")
        sqlforge_PRIMARY_KEY(qint64, tag_id, "tag_id")
        sqlforge_FIELD(std::string, note, "note")
    };

    // 软删除列类型错误
    class Memo : public sqlforge::Entity<Memo> {
      public:
        sqlforge_ENTITY_TABLE(Memo, "memo")
        sqlforge_AUTO_INCREMENT_PRIMARY_KEY(qint64, id, "id")
        sqlforge_FIELD(int, deleted, "deleted")
    };

    inline User makeUser(qint64 id, std::string name, int age, std::optional<std::string> email = std::nullopt) {
        User user;
        user.id = id;
        user.name = std::move(name);
        user.age = age;
        user.email = std::move(email);
        return user;
    }

}  // namespace sqlforge_test

#endif  // sqlforge_TESTS_TEST_ENTITIES_H
