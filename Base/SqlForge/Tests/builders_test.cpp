#include <gtest/gtest.h>

#include <algorithm>

#include "sqlforge/builder_parts/aggregate.h"
#include "sqlforge/builder_parts/case_when.h"
#include "sqlforge/builder_parts/cte.h"
#include "sqlforge/builder_parts/join.h"
#include "sqlforge/builder_parts/sql_builder.h"
#include "sqlforge/delete_builder.h"
#include "sqlforge/insert_builder.h"
#include "sqlforge/mysql/mysql_value.h"
#include "sqlforge/postgres/placeholder_rewriter.h"
#include "sqlforge/postgres/postgres_value.h"
#include "sqlforge/select_builder.h"
#include "sqlforge/sqlite/sqlite_value.h"
#include "sqlforge/update_builder.h"

namespace {

    using sqlforge::ErrorCode;
    using sqlforge::Order;
    using sqlforge::sqlite::Value;
    using Expr = sqlforge::Expr<Value>;
    using Select = sqlforge::SelectBuilder<Value>;
    using Insert = sqlforge::InsertBuilder<Value>;
    using Update = sqlforge::UpdateBuilder<Value>;
    using Delete = sqlforge::DeleteBuilder<Value>;
    using Params = std::vector<Value>;

    size_t countPlaceholders(const std::string &sql) {
        return static_cast<size_t>(std::count(sql.begin(), sql.end(), '?'));
    }

    // --- 端到端场景 ---

    TEST(SelectBuilderTest, MixedFiltersAndOrdering) {
        auto builder = Select::Columns({"id", "name"});
        builder.From("users")
            .AndWhere(Expr::Col("age").Eq(23))
            .AndWhere(Expr::Col("salary").Gt(45))
            .OrWhere(Expr::Col("status").In({"A", "B"}))
            .OrderBy("name", Order::Asc)
            .OrderBy("age", Order::Desc);

        auto built = builder.Build();
        ASSERT_TRUE(built.has_value()) << built.error().toString();
        EXPECT_EQ(built->first, "SELECT id, name FROM users WHERE age = ? AND salary > ? OR status IN (?, ?) ORDER BY name ASC, age DESC");
        EXPECT_EQ(built->second, (Params{23, 45, "A", "B"}));
    }

    TEST(InsertBuilderTest, MultiRowInsert) {
        auto built = Insert::Into("users").Columns({"name", "age"}).Values({{"John", 30}, {"Jane", 25}}).Build();
        ASSERT_TRUE(built.has_value()) << built.error().toString();
        EXPECT_EQ(built->first, "INSERT INTO users (name, age) VALUES (?, ?), (?, ?)");
        EXPECT_EQ(built->second, (Params{"John", 30, "Jane", 25}));
    }

    TEST(UpdateBuilderTest, SetExpression) {
        auto built = Update::Table("article").SetExpr("views", "views + 1").Where(Expr::Col("id").Eq(1)).Build();
        ASSERT_TRUE(built.has_value()) << built.error().toString();
        EXPECT_EQ(built->first, "UPDATE article SET views = views + 1 WHERE id = ?");
        EXPECT_EQ(built->second, (Params{1}));
    }

    TEST(UpdateBuilderTest, CteEmbeddedUpdate) {
        auto adults = Select::Columns({"id", "name"});
        adults.From("users").Where(Expr::Col("age").Gt(18));

        auto built = Update::Table("employees")
                         .With(sqlforge::Cte<Value>("adult_users", adults))
                         .Set("salary", 10000)
                         .Where(Expr::FromStr("id IN (SELECT id FROM adult_users)"))
                         .Build();
        ASSERT_TRUE(built.has_value()) << built.error().toString();
        EXPECT_EQ(built->first.rfind("WITH adult_users AS (SELECT id, name FROM users WHERE age > ?) UPDATE employees SET salary = ? WHERE id IN (SELECT id FROM adult_users)", 0), 0u);
        EXPECT_EQ(built->second, (Params{18, 10000}));
    }

    TEST(PlaceholderRewriterTest, NumbersPlaceholdersLeftToRight) {
        EXPECT_EQ(sqlforge::postgres::rewritePlaceholders("SELECT * FROM t WHERE a = ? AND b = ?"), "SELECT * FROM t WHERE a = $1 AND b = $2");
        EXPECT_EQ(sqlforge::postgres::rewritePlaceholders("SELECT 1"), "SELECT 1");

        const std::string sql = "INSERT INTO t (a, b, c) VALUES (?, ?, ?), (?, ?, ?), (?, ?, ?), (?, ?, ?)";
        const std::string rewritten = sqlforge::postgres::rewritePlaceholders(sql);
        EXPECT_EQ(std::count(rewritten.begin(), rewritten.end(), '$'), std::count(sql.begin(), sql.end(), '?'));
        EXPECT_NE(rewritten.find("$12)"), std::string::npos);
        EXPECT_EQ(rewritten.find("$13"), std::string::npos);
    }

    TEST(PlaceholderRewriterTest, LeavesQuotedTextAndCommentsAlone) {
        EXPECT_EQ(sqlforge::postgres::rewritePlaceholders("SELECT * FROM t WHERE a = 'a?b' AND b = ?"), "SELECT * FROM t WHERE a = 'a?b' AND b = $1");
        EXPECT_EQ(sqlforge::postgres::rewritePlaceholders("SELECT \"odd?col\" FROM t WHERE a = ?"), "SELECT \"odd?col\" FROM t WHERE a = $1");
        EXPECT_EQ(sqlforge::postgres::rewritePlaceholders("SELECT 'it''s?' , ? -- why?\nFROM t /* ? */ WHERE b = ?"), "SELECT 'it''s?' , $1 -- why?\nFROM t /* ? */ WHERE b = $2");
    }

    // --- SELECT ---

    TEST(SelectBuilderTest, DefaultsToStar) {
        auto built = Select::Columns({}).From("users").Build();
        ASSERT_TRUE(built.has_value());
        EXPECT_EQ(built->first, "SELECT * FROM users");
        EXPECT_TRUE(built->second.empty());
    }

    TEST(SelectBuilderTest, SeparateWhereGroupsAreAnded) {
        auto builder = Select::Columns({"id"});
        builder.From("users").Where(Expr::Col("a").Eq(1)).OrWhere(Expr::Col("b").Eq(2)).Where(Expr::Col("c").Eq(3));
        auto built = builder.Build();
        ASSERT_TRUE(built.has_value());
        EXPECT_EQ(built->first, "SELECT id FROM users WHERE (a = ? OR b = ?) AND c = ?");
        EXPECT_EQ(built->second, (Params{1, 2, 3}));
    }

    TEST(SelectBuilderTest, RepeatedSettersKeepLastValue) {
        auto builder = Select::Columns({"id"});
        builder.From("users").OrderBy("name", Order::Asc).OrderBy("id", Order::Asc).OrderBy("name", Order::Desc).LimitOffset(10, 20).LimitOffset(5);
        auto built = builder.Build();
        ASSERT_TRUE(built.has_value());
        EXPECT_EQ(built->first, "SELECT id FROM users ORDER BY name DESC, id ASC LIMIT ?");
        EXPECT_EQ(built->second, (Params{5}));
    }

    TEST(SelectBuilderTest, JoinAggregateAndHaving) {
        sqlforge::AggregateClause<Value> aggregate;
        aggregate.Count("o.id", "orders").Sum("o.total", "spent").GroupBy({"u.id"}).Having(Expr::Col("SUM(o.total)").Gt(100));

        auto builder = Select::Columns({"u.id"});
        builder.From("users u").Join(sqlforge::JoinClause<Value>::Left("orders o").On("o.user_id = u.id")).Where(Expr::Col("u.active").Eq(true)).Aggregate(aggregate);

        auto built = builder.Build();
        ASSERT_TRUE(built.has_value()) << built.error().toString();
        EXPECT_EQ(built->first, "SELECT u.id, COUNT(o.id) AS orders, SUM(o.total) AS spent FROM users u LEFT JOIN orders o ON o.user_id = u.id WHERE u.active = ? GROUP BY u.id HAVING SUM(o.total) > ?");
        EXPECT_EQ(built->second, (Params{true, 100}));
    }

    TEST(SelectBuilderTest, JoinWithParameters) {
        auto join = sqlforge::JoinClause<Value>::Inner("orders o");
        join.On("o.user_id = u.id").And(Expr::Col("o.status").Eq("paid"));

        auto builder = Select::Columns({"u.id"});
        builder.From("users u").Join(join).Where(Expr::Col("u.age").Gt(30));
        auto built = builder.Build();
        ASSERT_TRUE(built.has_value());
        EXPECT_EQ(built->first, "SELECT u.id FROM users u INNER JOIN orders o ON o.user_id = u.id AND o.status = ? WHERE u.age > ?");
        EXPECT_EQ(built->second, (Params{"paid", 30}));
    }

    TEST(SelectBuilderTest, JoinWithoutConditionFails) {
        auto builder = Select::Columns({"id"});
        builder.From("users").Join(sqlforge::JoinClause<Value>::Inner("orders"));
        auto built = builder.Build();
        ASSERT_FALSE(built.has_value());
        EXPECT_EQ(built.error().code, ErrorCode::InvalidConfiguration);

        auto cross = Select::Columns({"*"});
        cross.From("a").Join(sqlforge::JoinClause<Value>::Cross("b"));
        ASSERT_TRUE(cross.Build().has_value());
        EXPECT_EQ(cross.Build()->first, "SELECT * FROM a CROSS JOIN b");
    }

    TEST(SelectBuilderTest, HavingWithoutGroupByFails) {
        auto builder = Select::Columns({"id"});
        builder.From("users").Having(Expr::Col("id").Gt(1));
        auto built = builder.Build();
        ASSERT_FALSE(built.has_value());
        EXPECT_EQ(built.error().code, ErrorCode::InvalidConfiguration);
    }

    TEST(SelectBuilderTest, CaseWhenProjection) {
        sqlforge::CaseWhen<Value> bucket;
        bucket.When(Expr::Col("age").Lt(18), "minor").When(Expr::Col("age").Lt(65), "adult").Else("senior").As("bucket");

        auto builder = Select::Columns({"id"});
        builder.From("users").SelectCase(bucket).Where(Expr::Col("active").Eq(true));
        auto built = builder.Build();
        ASSERT_TRUE(built.has_value()) << built.error().toString();
        EXPECT_EQ(built->first, "SELECT id, CASE WHEN age < ? THEN ? WHEN age < ? THEN ? ELSE ? END AS bucket FROM users WHERE active = ?");
        EXPECT_EQ(built->second, (Params{18, "minor", 65, "adult", "senior", true}));
    }

    TEST(SelectBuilderTest, CaseWithoutArmsFails) {
        sqlforge::CaseWhen<Value> empty;
        auto built = empty.Build();
        ASSERT_FALSE(built.has_value());
        EXPECT_EQ(built.error().code, ErrorCode::InvalidConfiguration);
    }

    TEST(SelectBuilderTest, SubqueryInFromAndProjection) {
        auto inner = Select::Columns({"user_id"});
        inner.From("orders").Where(Expr::Col("total").Gt(50));

        auto count = Select::Columns({"COUNT(*)"});
        count.From("orders o").Where(Expr::FromStr("o.user_id = big.user_id"));

        auto builder = Select::Columns({"big.user_id"});
        builder.FromSubquery(inner, "big").SubqueryColumn(count, "order_count").Where(Expr::Col("big.user_id").Ne(0));
        auto built = builder.Build();
        ASSERT_TRUE(built.has_value()) << built.error().toString();
        EXPECT_EQ(built->first,
                  "SELECT big.user_id, (SELECT COUNT(*) FROM orders o WHERE o.user_id = big.user_id) AS order_count FROM (SELECT user_id FROM orders WHERE total > ?) AS big WHERE big.user_id != ?");
        EXPECT_EQ(built->second, (Params{50, 0}));
    }

    TEST(SelectBuilderTest, UnionAndDistinct) {
        auto active = Select::Columns({"email"});
        active.From("users").Where(Expr::Col("active").Eq(true));
        auto invited = Select::Columns({"email"});
        invited.From("invites").Where(Expr::Col("accepted").Eq(false));

        active.Distinct().UnionAll(invited).OrderBy("email");
        auto built = active.Build();
        ASSERT_TRUE(built.has_value());
        EXPECT_EQ(built->first, "SELECT DISTINCT email FROM users WHERE active = ? UNION ALL SELECT email FROM invites WHERE accepted = ? ORDER BY email ASC");
        EXPECT_EQ(built->second, (Params{true, false}));
    }

    TEST(SelectBuilderTest, CursorPagination) {
        auto asc = Select::Columns({"id"});
        asc.From("users").Cursor("id", Order::Asc, Value(10), Value(3));
        auto built = asc.Build();
        ASSERT_TRUE(built.has_value());
        EXPECT_EQ(built->first, "SELECT id FROM users WHERE id > ? ORDER BY id ASC LIMIT ?");
        EXPECT_EQ(built->second, (Params{10, 3}));

        auto desc = Select::Columns({"id"});
        desc.From("users").Cursor("id", Order::Desc, Value(10), Value(3));
        EXPECT_EQ(desc.Build()->first, "SELECT id FROM users WHERE id < ? ORDER BY id DESC LIMIT ?");

        auto first_page = Select::Columns({"id"});
        first_page.From("users").Cursor("id", Order::Asc, std::nullopt, Value(3));
        EXPECT_EQ(first_page.Build()->first, "SELECT id FROM users ORDER BY id ASC LIMIT ?");
    }

    TEST(SelectBuilderTest, WithCteAndAppend) {
        auto recent = Select::Columns({"id"});
        recent.From("orders").Where(Expr::Col("created_at").Gt("2024-01-01"));

        sqlforge::WithCte<Value> with;
        with.Add("recent", recent, {"order_id"});

        auto builder = Select::Columns({"order_id"});
        builder.With(with).From("recent").Append("FOR UPDATE");
        auto built = builder.Build();
        ASSERT_TRUE(built.has_value()) << built.error().toString();
        EXPECT_EQ(built->first, "WITH recent(order_id) AS (SELECT id FROM orders WHERE created_at > ?) SELECT order_id FROM recent FOR UPDATE");
        EXPECT_EQ(built->second, (Params{"2024-01-01"}));
    }

    TEST(SelectBuilderTest, DuplicateCteNameFails) {
        auto body = Select::Columns({"1"});
        sqlforge::WithCte<Value> with;
        with.Add("x", body).Add("x", body);
        auto builder = Select::Columns({"*"});
        builder.With(with).From("x");
        auto built = builder.Build();
        ASSERT_FALSE(built.has_value());
        EXPECT_EQ(built.error().code, ErrorCode::InvalidConfiguration);
    }

    TEST(SelectBuilderTest, ExpressionErrorSurfacesAtBuild) {
        auto builder = Select::Columns({"id"});
        builder.From("users").Where(Expr::Col("id").In(std::vector<Value>{}));
        auto built = builder.Build();
        ASSERT_FALSE(built.has_value());
        EXPECT_EQ(built.error().code, ErrorCode::EmptyInList);
    }

    TEST(SelectBuilderTest, BuildMutDrainsState) {
        auto builder = Select::Columns({"id"});
        builder.From("users").Where(Expr::Col("id").Eq(1));
        auto first = builder.BuildMut();
        ASSERT_TRUE(first.has_value());
        EXPECT_EQ(first->first, "SELECT id FROM users WHERE id = ?");

        auto second = builder.Build();
        ASSERT_TRUE(second.has_value());
        EXPECT_EQ(second->first, "SELECT *");
        EXPECT_TRUE(second->second.empty());
    }

    TEST(SelectBuilderTest, TakeWhereEmptiesWhereClause) {
        auto builder = Select::Columns({"id"});
        builder.From("users").Where(Expr::Col("a").Eq(1)).Where(Expr::Col("b").Eq(2));
        auto groups = builder.TakeWhere();
        EXPECT_EQ(groups.size(), 2u);
        EXPECT_EQ(builder.Build()->first, "SELECT id FROM users");
    }

    // --- INSERT ---

    TEST(InsertBuilderTest, RowLengthMismatchFails) {
        auto built = Insert::Into("users").Columns({"name", "age"}).Values({{"John", 30}, {"Jane"}}).Build();
        ASSERT_FALSE(built.has_value());
        EXPECT_EQ(built.error().code, ErrorCode::ValueInvalid);
    }

    TEST(InsertBuilderTest, RowLengthCheckedWhenColumnsComeLast) {
        auto built = Insert::Into("users").Values({{"John", 30, "x"}, {"Jane", 25, "y"}}).Columns({"name", "age"}).Build();
        ASSERT_FALSE(built.has_value());
        EXPECT_EQ(built.error().code, ErrorCode::ValueInvalid);

        auto matching = Insert::Into("users").Values({{"John", 30}}).Columns({"name", "age"}).Build();
        ASSERT_TRUE(matching.has_value());
        EXPECT_EQ(matching->first, "INSERT INTO users (name, age) VALUES (?, ?)");
    }

    TEST(InsertBuilderTest, MissingColumnsOrRowsFail) {
        auto no_columns = Insert::Into("users").Build();
        ASSERT_FALSE(no_columns.has_value());
        EXPECT_EQ(no_columns.error().code, ErrorCode::ColumnsListEmpty);

        auto no_rows = Insert::Into("users").Columns({"name"}).Values({}).Build();
        ASSERT_FALSE(no_rows.has_value());
        EXPECT_EQ(no_rows.error().code, ErrorCode::NoEntitiesProvided);
    }

    TEST(InsertBuilderTest, LiteralReplacesParameter) {
        auto built = Insert::Into("users").Columns({"id", "name"}).Values({{0, "John"}, {7, "Jane"}}).ReplaceWithLiteral(0, "NULL").Build();
        ASSERT_TRUE(built.has_value());
        EXPECT_EQ(built->first, "INSERT INTO users (id, name) VALUES (NULL, ?), (?, ?)");
        EXPECT_EQ(built->second, (Params{"John", 7, "Jane"}));
    }

    TEST(InsertBuilderTest, OnConflictClauses) {
        auto update = Insert::Into("users").Columns({"id", "name", "age"}).Values({{1, "John", 30}}).OnConflictDoUpdate({"id"}, {"name", "age"}, Expr::Col("users.age").Lt(30)).Build();
        ASSERT_TRUE(update.has_value()) << update.error().toString();
        EXPECT_EQ(update->first, "INSERT INTO users (id, name, age) VALUES (?, ?, ?) ON CONFLICT (id) DO UPDATE SET name = EXCLUDED.name, age = EXCLUDED.age WHERE users.age < ?");
        EXPECT_EQ(update->second, (Params{1, "John", 30, 30}));

        auto nothing = Insert::Into("users").Columns({"id"}).Values({{1}}).OnConflictDoNothing().Build();
        ASSERT_TRUE(nothing.has_value());
        EXPECT_EQ(nothing->first, "INSERT INTO users (id) VALUES (?) ON CONFLICT DO NOTHING");
    }

    TEST(InsertBuilderTest, DuplicateKeyIsMySqlOnly) {
        auto sqlite_built = Insert::Into("users").Columns({"id", "name"}).Values({{1, "John"}}).OnDuplicateKeyUpdate({"name"}).Build();
        ASSERT_FALSE(sqlite_built.has_value());
        EXPECT_EQ(sqlite_built.error().code, ErrorCode::UnsupportedFeature);

        using MyValue = sqlforge::mysql::Value;
        auto mysql_built = sqlforge::InsertBuilder<MyValue>::Into("users").Columns({"id", "name"}).Values({{1, "John"}}).OnDuplicateKeyUpdate({"name"}).Build();
        ASSERT_TRUE(mysql_built.has_value()) << mysql_built.error().toString();
        EXPECT_EQ(mysql_built->first, "INSERT INTO users (id, name) VALUES (?, ?) ON DUPLICATE KEY UPDATE name = VALUES(name)");

        auto conditional = sqlforge::InsertBuilder<MyValue>::Into("users")
                               .Columns({"id", "name"})
                               .Values({{1, "John"}})
                               .OnDuplicateKeyUpdate({"name"}, sqlforge::Expr<MyValue>::Col("version").Lt(3))
                               .Build();
        ASSERT_TRUE(conditional.has_value());
        EXPECT_EQ(conditional->first, "INSERT INTO users (id, name) VALUES (?, ?) ON DUPLICATE KEY UPDATE name = IF(version < ?, VALUES(name), name)");
        EXPECT_EQ(conditional->second.size(), 3u);

        auto on_conflict = sqlforge::InsertBuilder<MyValue>::Into("users").Columns({"id"}).Values({{1}}).OnConflictDoNothing().Build();
        ASSERT_FALSE(on_conflict.has_value());
        EXPECT_EQ(on_conflict.error().code, ErrorCode::UnsupportedFeature);
    }

    TEST(InsertBuilderTest, ReturningDependsOnDialect) {
        auto sqlite_built = Insert::Into("users").Columns({"name"}).Values({{"John"}}).Returning({"id"}).Build();
        ASSERT_TRUE(sqlite_built.has_value());
        EXPECT_EQ(sqlite_built->first, "INSERT INTO users (name) VALUES (?) RETURNING id");

        using PgValue = sqlforge::postgres::Value;
        auto pg_built = sqlforge::InsertBuilder<PgValue>::Into("users").Columns({"name"}).Values({{"John"}}).Returning({"id", "created_at"}).Build();
        ASSERT_TRUE(pg_built.has_value());
        EXPECT_EQ(pg_built->first, "INSERT INTO users (name) VALUES (?) RETURNING id, created_at");

        using MyValue = sqlforge::mysql::Value;
        auto mysql_built = sqlforge::InsertBuilder<MyValue>::Into("users").Columns({"name"}).Values({{"John"}}).Returning({"id"}).Build();
        ASSERT_FALSE(mysql_built.has_value());
        EXPECT_EQ(mysql_built.error().code, ErrorCode::UnsupportedFeature);
    }

    TEST(InsertBuilderTest, BuildMutResetsBuilder) {
        auto builder = Insert::Into("users");
        builder.Columns({"name"}).Values({{"John"}});
        ASSERT_TRUE(builder.BuildMut().has_value());
        EXPECT_FALSE(builder.Build().has_value());
    }

    // --- UPDATE ---

    TEST(UpdateBuilderTest, SetVariants) {
        sqlforge::CaseWhen<Value> level;
        level.When(Expr::Col("score").Gte(90), "gold").Else("silver");

        auto builder = Update::Table("members");
        builder.Set("name", "John")
            .SetRaw("score", "score + ?", {5})
            .SetCols({"age", "city"}, {31, "Paris"})
            .SetCase("level", level)
            .Set("name", "Johnny")
            .Where(Expr::Col("id").Eq(9));
        auto built = builder.Build();
        ASSERT_TRUE(built.has_value()) << built.error().toString();
        EXPECT_EQ(built->first, "UPDATE members SET name = ?, score = score + ?, age = ?, city = ?, level = CASE WHEN score >= ? THEN ? ELSE ? END WHERE id = ?");
        EXPECT_EQ(built->second, (Params{"Johnny", 5, 31, "Paris", 90, "gold", "silver", 9}));
        EXPECT_EQ(countPlaceholders(built->first), built->second.size());
    }

    TEST(UpdateBuilderTest, SetColsLengthMismatchIsIgnored) {
        auto builder = Update::Table("t");
        builder.SetCols({"a", "b"}, {1});
        auto built = builder.Build();
        ASSERT_FALSE(built.has_value());
        EXPECT_EQ(built.error().code, ErrorCode::ColumnsListEmpty);
    }

    TEST(UpdateBuilderTest, JoinAndReturning) {
        auto builder = Update::Table("orders o");
        builder.Join(sqlforge::JoinClause<Value>::Inner("users u").On("u.id = o.user_id")).Set("o.status", "vip").Where(Expr::Col("u.level").Eq("gold")).Returning({"o.id"});
        auto built = builder.Build();
        ASSERT_TRUE(built.has_value());
        EXPECT_EQ(built->first, "UPDATE orders o INNER JOIN users u ON u.id = o.user_id SET o.status = ? WHERE u.level = ? RETURNING o.id");
        EXPECT_EQ(built->second, (Params{"vip", "gold"}));
    }

    // --- DELETE ---

    TEST(DeleteBuilderTest, ByPrimaryKey) {
        auto builder = Delete::From("article_tag");
        builder.ByPrimaryKey({"article_id", "tag_id"}, {1, 2});
        auto built = builder.Build();
        ASSERT_TRUE(built.has_value());
        EXPECT_EQ(built->first, "DELETE FROM article_tag WHERE article_id = ? AND tag_id = ?");
        EXPECT_EQ(built->second, (Params{1, 2}));

        auto mismatch = Delete::From("article_tag");
        mismatch.ByPrimaryKey({"article_id", "tag_id"}, {1});
        ASSERT_FALSE(mismatch.Build().has_value());
        EXPECT_EQ(mismatch.Build().error().code, ErrorCode::CompositeKeyTypeInvalid);

        auto none = Delete::From("t");
        none.ByPrimaryKey({}, {});
        EXPECT_EQ(none.Build().error().code, ErrorCode::NoPrimaryKeyDefined);
    }

    TEST(DeleteBuilderTest, WhereAndReturning) {
        using PgValue = sqlforge::postgres::Value;
        auto builder = sqlforge::DeleteBuilder<PgValue>::From("sessions");
        builder.Where(sqlforge::Expr<PgValue>::Col("expires_at").Lt("2024-01-01")).OrWhere(sqlforge::Expr<PgValue>::Col("revoked").Eq(true)).Returning({"id"});
        auto built = builder.Build();
        ASSERT_TRUE(built.has_value());
        EXPECT_EQ(built->first, "DELETE FROM sessions WHERE expires_at < ? OR revoked = ? RETURNING id");
        EXPECT_EQ(sqlforge::postgres::rewritePlaceholders(built->first), "DELETE FROM sessions WHERE expires_at < $1 OR revoked = $2 RETURNING id");
    }

    TEST(DeleteBuilderTest, WithoutWhereDeletesAll) {
        auto built = Delete::From("logs").Build();
        ASSERT_TRUE(built.has_value());
        EXPECT_EQ(built->first, "DELETE FROM logs");
    }

    // --- SqlBuilder ---

    TEST(SqlBuilderTest, RawPrependAppend) {
        auto builder = sqlforge::SqlBuilder<Value>::Raw("SELECT * FROM users WHERE age > ?", {18});
        builder.Prepend("EXPLAIN").Append("LIMIT ?", {5});
        auto built = builder.Build();
        ASSERT_TRUE(built.has_value());
        EXPECT_EQ(built->first, "EXPLAIN SELECT * FROM users WHERE age > ? LIMIT ?");
        EXPECT_EQ(built->second, (Params{18, 5}));

        EXPECT_FALSE(sqlforge::SqlBuilder<Value>().Build().has_value());
    }

    TEST(SqlBuilderTest, FromAnyBuilder) {
        auto statement = sqlforge::SqlBuilder<Value>::From(Delete::From("logs").Where(Expr::Col("level").Eq("debug")));
        ASSERT_TRUE(statement.has_value());
        EXPECT_EQ(statement->sql(), "DELETE FROM logs WHERE level = ?");
        EXPECT_EQ(statement->values(), (Params{"debug"}));

        auto failed = sqlforge::SqlBuilder<Value>::From(Update::Table("t"));
        ASSERT_FALSE(failed.has_value());
        EXPECT_EQ(failed.error().code, ErrorCode::ColumnsListEmpty);
    }

    TEST(PlaceholderCountTest, MatchesParameterCount) {
        auto select = Select::Columns({"id"});
        select.From("t").Where(Expr::Col("a").In({1, 2, 3}).And(Expr::Col("b").Between(4, 5))).OrWhere(Expr::Col("c").IsNull()).LimitOffset(10, 0);
        auto insert = Insert::Into("t").Columns({"a", "b"}).Values({{1, 2}, {3, 4}, {5, 6}});
        auto update = Update::Table("t").Set("a", 1).SetExpr("b", "b * 2").Where(Expr::Col("c").Like("%x%"));

        for (const auto &built : {select.Build(), insert.Build(), update.Build()}) {
            ASSERT_TRUE(built.has_value());
            EXPECT_EQ(countPlaceholders(built->first), built->second.size()) << built->first;
        }
    }

}  // namespace
