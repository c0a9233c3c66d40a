#include <gtest/gtest.h>

#include "sqlforge/fields.h"
#include "sqlforge/relation.h"
#include "sqlforge/sqlite/sqlite_value.h"
#include "test_entities.h"

namespace {

    using sqlforge::ErrorCode;
    using sqlforge::sqlite::Value;
    using sqlforge_test::Article;
    using sqlforge_test::ArticleTag;
    using sqlforge_test::User;
    using Params = std::vector<Value>;

    TEST(EntityTest, SnakeCase) {
        EXPECT_EQ(sqlforge::toSnakeCase("ArticleTag"), "article_tag");
        EXPECT_EQ(sqlforge::toSnakeCase("User"), "user");
        EXPECT_EQ(sqlforge::toSnakeCase("already_snake"), "already_snake");
        EXPECT_EQ(sqlforge::toSnakeCase("Order2Item"), "order2_item");
    }

    TEST(EntityTest, MetadataFromMacros) {
        const auto &users = User::getEntityMeta();
        EXPECT_EQ(users.table_name, "users");
        EXPECT_EQ(users.columnNames(), (std::vector<std::string>{"id", "name", "age", "email"}));
        ASSERT_EQ(users.getPrimaryKeyFields().size(), 1u);
        EXPECT_TRUE(sqlforge::has_flag(users.getPrimaryKeyFields().front()->flags, sqlforge::FieldFlag::AutoIncrement));
        EXPECT_TRUE(users.findFieldByDbName("email")->nullable);
        EXPECT_TRUE(sqlforge::has_flag(users.findFieldByDbName("name")->flags, sqlforge::FieldFlag::NotNull));

        EXPECT_EQ(ArticleTag::tableName(), "article_tag");
        EXPECT_EQ(ArticleTag::getEntityMeta().primary_keys_db_names, (std::vector<std::string>{"article_id", "tag_id"}));
    }

    TEST(EntityTest, FromRowMapsColumnsByName) {
        sqlforge::Row row({"email", "id", "name", "age", "extra"}, {QVariant(), QVariant(qlonglong(7)), QVariant(QString("John")), QVariant(30), QVariant(1)});
        auto user = sqlforge::fromRow<User>(row);
        ASSERT_TRUE(user.has_value()) << user.error().toString();
        EXPECT_EQ(user->id, 7);
        EXPECT_EQ(user->name, "John");
        EXPECT_EQ(user->age, 30);
        EXPECT_FALSE(user->email.has_value());

        sqlforge::Row partial({"name"}, {QVariant(QString("Jane"))});
        auto jane = sqlforge::fromRow<User>(partial);
        ASSERT_TRUE(jane.has_value());
        EXPECT_EQ(jane->id, 0);
        EXPECT_EQ(jane->name, "Jane");
    }

    TEST(EntityTest, FromRowConvertsDriverRepresentations) {
        sqlforge::Row row({"id", "title", "deleted"}, {QVariant(QString("12")), QVariant(QString("hello")), QVariant(QString("t"))});
        auto article = sqlforge::fromRow<Article>(row);
        ASSERT_TRUE(article.has_value());
        EXPECT_EQ(article->id, 12);
        EXPECT_TRUE(article->deleted);
    }

    TEST(EntityTest, FromRowReportsUnconvertibleValues) {
        sqlforge::Row row({"id", "age"}, {QVariant(qlonglong(1)), QVariant(QString("abc"))});
        auto user = sqlforge::fromRow<User>(row);
        ASSERT_FALSE(user.has_value());
        EXPECT_EQ(user.error().code, ErrorCode::MappingError);

        std::vector<sqlforge::Row> rows{sqlforge::Row({"id"}, {QVariant(qlonglong(1))}), row};
        EXPECT_FALSE(sqlforge::fromRows<User>(rows).has_value());
    }

    TEST(FieldsTest, ExtractWithFilter) {
        auto user = sqlforge_test::makeUser(3, "John", 30);
        auto all = sqlforge::extractAll<Value>(user);
        EXPECT_EQ(all.names, (std::vector<std::string>{"id", "name", "age", "email"}));
        EXPECT_EQ(all.values, (Params{3, "John", 30, Value()}));

        auto filtered = sqlforge::extractWithFilter<Value>(user, {"id"}, true);
        EXPECT_EQ(filtered.names, (std::vector<std::string>{"name", "age"}));
        EXPECT_EQ(filtered.values, (Params{"John", 30}));

        user.email = "null";
        EXPECT_EQ(sqlforge::extractWithFilter<Value>(user, {}, true).names.size(), 3u);
        user.email = "john@example.com";
        EXPECT_EQ(sqlforge::extractWithFilter<Value>(user, {}, true).names.size(), 4u);
    }

    TEST(FieldsTest, ExtractWithBindVisitsInOrder) {
        auto user = sqlforge_test::makeUser(3, "", 30, "a@b.c");
        std::vector<std::string> visited;
        sqlforge::extractWithBind<Value>(user, {"age"}, true, [&visited](const std::string &name, Value) { visited.push_back(name); });
        EXPECT_EQ(visited, (std::vector<std::string>{"id", "email"}));
    }

    TEST(FieldsTest, BatchExtractUsesFirstEntityNames) {
        std::vector<User> users{sqlforge_test::makeUser(0, "John", 30), sqlforge_test::makeUser(0, "Jane", 25, "jane@x.io")};
        auto batch = sqlforge::batchExtract<Value>(users, {"id"}, false);
        EXPECT_EQ(batch.names, (std::vector<std::string>{"name", "age", "email"}));
        ASSERT_EQ(batch.rows.size(), 2u);
        EXPECT_EQ(batch.rows[1], (Params{"Jane", 25, "jane@x.io"}));
    }

    TEST(FieldsTest, GetValues) {
        ArticleTag tag;
        tag.article_id = 4;
        tag.tag_id = 9;
        auto keys = sqlforge::getValues<Value>(tag, {"article_id", "tag_id"});
        ASSERT_TRUE(keys.has_value());
        EXPECT_EQ(*keys, (Params{4, 9}));

        auto missing = sqlforge::getValue<Value>(tag, "nope");
        ASSERT_FALSE(missing.has_value());
        EXPECT_EQ(missing.error().code, ErrorCode::PrimaryKeyNotFound);
    }

    TEST(RelationTest, ValidatesForeignKeyValues) {
        using Relation = sqlforge::EntitiesRelation<Value>;

        EXPECT_TRUE(Relation::OneToOne(5).validate({5}).has_value());
        EXPECT_TRUE(Relation::OneToMany(5).validate({5, 5, 5}).has_value());

        auto empty = Relation::OneToMany(5).validate({});
        ASSERT_FALSE(empty.has_value());
        EXPECT_EQ(empty.error().code, ErrorCode::RelationValueEmpty);

        auto too_many = Relation::OneToOne(5).validate({5, 5});
        ASSERT_FALSE(too_many.has_value());
        EXPECT_EQ(too_many.error().code, ErrorCode::RelationValueEmpty);

        auto mismatch = Relation::ManyToMany(5).validate({5, 6});
        ASSERT_FALSE(mismatch.has_value());
        EXPECT_EQ(mismatch.error().code, ErrorCode::RelationValueMismatch);
        EXPECT_NE(mismatch.error().message.find("6"), std::string::npos);
    }

}  // namespace
