#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sqlforge/composite_key_table.h"
#include "sqlforge/single_key_table.h"
#include "sqlforge/sqlite/sqlite_value.h"
#include "sqlforge/transactional_executor.h"
#include "test_entities.h"

namespace {

    using sqlforge::ErrorCode;
    using sqlforge::ExecResult;
    using sqlforge::Row;
    using sqlforge::sqlite::Value;
    using sqlforge_test::ArticleTag;
    using sqlforge_test::User;
    using Expr = sqlforge::Expr<Value>;
    using Scope = sqlforge::TableScope<Value>;

    // 记录所有语句; 分页时会被两个线程同时调用
    struct StatementLog {
        std::mutex mutex;
        std::vector<std::string> sql;

        void record(const std::string &statement) {
            std::lock_guard<std::mutex> lock(mutex);
            sql.push_back(statement);
        }
        std::vector<std::string> snapshot() {
            std::lock_guard<std::mutex> lock(mutex);
            return sql;
        }
    };

    class FakeTransaction : public sqlforge::ITransaction<Value> {
      public:
        FakeTransaction(std::shared_ptr<StatementLog> log, std::string fail_marker) : m_log(std::move(log)), m_fail_marker(std::move(fail_marker)) {
            m_log->record("BEGIN");
        }

        std::expected<std::vector<Row>, sqlforge::Error> fetchRows(const std::string &sql, const std::vector<Value> &) override {
            m_log->record(sql);
            return std::vector<Row>();
        }

        std::expected<ExecResult, sqlforge::Error> executeStatement(const std::string &sql, const std::vector<Value> &) override {
            m_log->record(sql);
            if (!m_fail_marker.empty() && sql.find(m_fail_marker) != std::string::npos) {
                return std::unexpected(sqlforge::Error(ErrorCode::QueryExecutionError, "forced failure", 1062, "23000"));
            }
            return ExecResult{1, 0};
        }

        std::expected<void, sqlforge::Error> commit() override {
            m_log->record("COMMIT");
            m_active = false;
            return {};
        }

        std::expected<void, sqlforge::Error> rollback() override {
            m_log->record("ROLLBACK");
            m_active = false;
            return {};
        }

        bool isActive() const override {
            return m_active;
        }

      private:
        std::shared_ptr<StatementLog> m_log;
        std::string m_fail_marker;
        bool m_active = true;
    };

    class FakeExecutor : public sqlforge::IQueryExecutor<Value> {
      public:
        std::shared_ptr<StatementLog> log = std::make_shared<StatementLog>();
        std::vector<Row> rows;
        QVariant count = QVariant(qlonglong(0));
        std::string fail_marker;

        std::expected<std::vector<Row>, sqlforge::Error> fetchRows(const std::string &sql, const std::vector<Value> &params) override {
            log->record(sql);
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_params.push_back(params);
            }
            if (sql.rfind("SELECT COUNT(*)", 0) == 0) return std::vector<Row>{Row({"COUNT(*)"}, {count})};
            if (sql.rfind("SELECT 1 ", 0) == 0) {
                if (rows.empty()) return std::vector<Row>();
                return std::vector<Row>{Row({"1"}, {QVariant(1)})};
            }
            return rows;
        }

        std::expected<ExecResult, sqlforge::Error> executeStatement(const std::string &sql, const std::vector<Value> &params) override {
            log->record(sql);
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_params.push_back(params);
            }
            return ExecResult{1, 42};
        }

        std::expected<std::unique_ptr<sqlforge::ITransaction<Value>>, sqlforge::Error> beginTransaction() override {
            return std::unique_ptr<sqlforge::ITransaction<Value>>(std::make_unique<FakeTransaction>(log, fail_marker));
        }

        std::vector<std::vector<Value>> params() {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_params;
        }

      private:
        std::mutex m_mutex;
        std::vector<std::vector<Value>> m_params;
    };

    Row userRow(qint64 id, const QString &name, int age) {
        return Row({"id", "name", "age", "email"}, {QVariant(id), QVariant(name), QVariant(age), QVariant()});
    }

    class SingleKeyTableTest : public ::testing::Test {
      protected:
        std::shared_ptr<FakeExecutor> executor = std::make_shared<FakeExecutor>();
        sqlforge::SingleKeyTable<User, Value> users{executor, "users", "id", true, Scope{}};
    };

    TEST_F(SingleKeyTableTest, GetOneByPk) {
        executor->rows = {userRow(5, "John", 30)};
        auto user = users.GetOneByPk(5);
        ASSERT_TRUE(user.has_value()) << user.error().toString();
        ASSERT_TRUE(user->has_value());
        EXPECT_EQ((*user)->name, "John");
        EXPECT_EQ(executor->log->snapshot().back(), "SELECT id, name, age, email FROM users WHERE id = ?");

        executor->rows.clear();
        auto missing = users.GetOneByPk(6);
        ASSERT_TRUE(missing.has_value());
        EXPECT_FALSE(missing->has_value());

        auto invalid = users.GetOneByPk(0);
        ASSERT_FALSE(invalid.has_value());
        EXPECT_EQ(invalid.error().code, ErrorCode::PrimaryKeyNotFound);
    }

    TEST_F(SingleKeyTableTest, WritesGoThroughExecutor) {
        auto inserted = users.InsertOne(sqlforge_test::makeUser(0, "John", 30));
        ASSERT_TRUE(inserted.has_value());
        EXPECT_EQ(inserted->last_insert_id, 42u);
        EXPECT_EQ(executor->log->snapshot().back(), "INSERT INTO users (name, age, email) VALUES (?, ?, ?)");

        ASSERT_TRUE(users.DeleteMany({1, 2}).has_value());
        EXPECT_EQ(executor->log->snapshot().back(), "DELETE FROM users WHERE id IN (?, ?)");

        auto invalid = users.InsertOne(sqlforge_test::makeUser(0, "", 30));
        ASSERT_FALSE(invalid.has_value());
        EXPECT_EQ(invalid.error().code, ErrorCode::ValueInvalid);
        EXPECT_EQ(executor->log->snapshot().size(), 2u);
    }

    TEST_F(SingleKeyTableTest, PaginatedRunsDataAndCount) {
        executor->rows = {userRow(11, "A", 20), userRow(12, "B", 21)};
        executor->count = QVariant(qlonglong(12));
        auto page = users.GetListPaginated(2, 10, [](sqlforge::SelectBuilder<Value> &b) { b.Where(Expr::Col("age").Gt(18)); });
        ASSERT_TRUE(page.has_value()) << page.error().toString();
        EXPECT_EQ(page->data.size(), 2u);
        EXPECT_EQ(page->total, 12u);
        EXPECT_EQ(page->page_number, 2u);
        EXPECT_EQ(page->page_size, 10u);

        auto statements = executor->log->snapshot();
        ASSERT_EQ(statements.size(), 2u);
        EXPECT_NE(std::find(statements.begin(), statements.end(), "SELECT id, name, age, email FROM users WHERE age > ? LIMIT ? OFFSET ?"), statements.end());
        EXPECT_NE(std::find(statements.begin(), statements.end(), "SELECT COUNT(*) FROM users WHERE age > ?"), statements.end());

        EXPECT_EQ(users.GetListPaginated(0, 10, nullptr).error().code, ErrorCode::PageNumberInvalid);
    }

    TEST_F(SingleKeyTableTest, CursorPage) {
        executor->rows = {userRow(11, "A", 20), userRow(12, "B", 21)};
        auto page = users.GetListByCursor(2, Value(10), sqlforge::Order::Asc, nullptr);
        ASSERT_TRUE(page.has_value()) << page.error().toString();
        EXPECT_EQ(page->data.size(), 2u);
        ASSERT_TRUE(page->hasNextPage());
        EXPECT_EQ(*page->next_cursor, Value(12));
        EXPECT_EQ(*page->prev_cursor, Value(11));
        EXPECT_EQ(executor->log->snapshot().back(), "SELECT id, name, age, email FROM users WHERE id > ? ORDER BY id ASC LIMIT ?");

        // 不满一页时没有游标
        auto short_page = users.GetListByCursor(5, Value(10), sqlforge::Order::Desc, nullptr);
        ASSERT_TRUE(short_page.has_value());
        EXPECT_FALSE(short_page->hasNextPage());
        EXPECT_EQ(executor->log->snapshot().back(), "SELECT id, name, age, email FROM users WHERE id < ? ORDER BY id DESC LIMIT ?");

        std::function<std::string(const User &)> by_name = [](const User &u) { return u.name; };
        auto generic = users.GetListByCursor<std::string>(2, nullptr, by_name, sqlforge::Order::Desc);
        ASSERT_TRUE(generic.has_value());
        EXPECT_EQ(*generic->next_cursor, "A");
        EXPECT_EQ(*generic->prev_cursor, "B");
    }

    TEST_F(SingleKeyTableTest, CountAndExists) {
        executor->count = QVariant(qlonglong(3));
        auto count = users.Count(nullptr);
        ASSERT_TRUE(count.has_value());
        EXPECT_EQ(*count, 3u);

        executor->count = QVariant();
        EXPECT_EQ(*users.Count(nullptr), 0u);

        executor->count = QVariant(QString("many"));
        EXPECT_EQ(users.Count(nullptr).error().code, ErrorCode::MappingError);

        auto none = users.Exists([](sqlforge::SelectBuilder<Value> &b) { b.Where(Expr::Col("name").Eq("x")); });
        ASSERT_TRUE(none.has_value());
        EXPECT_FALSE(*none);
        executor->rows = {userRow(1, "x", 1)};
        EXPECT_TRUE(*users.Exists(nullptr));
    }

    TEST(FacadeTest, SoftDeleteVerbs) {
        auto executor = std::make_shared<FakeExecutor>();
        auto filter = std::make_shared<const sqlforge::GlobalFilter<Value>>(sqlforge::GlobalFilter<Value>{Expr::Col("tenant_id").Eq(3), {}});
        Scope scope{std::make_shared<const sqlforge::SoftDeleteConfig>(sqlforge::SoftDeleteConfig{"deleted", {}}), filter};
        sqlforge::SingleKeyTable<sqlforge_test::Article, Value> articles(executor, scope);

        ASSERT_TRUE(articles.SoftDeleteByPk(5).has_value());
        EXPECT_EQ(executor->log->snapshot().back(), "UPDATE article SET deleted = ? WHERE id = ? AND tenant_id = ?");
        EXPECT_EQ(executor->params().back(), (std::vector<Value>{true, 5, 3}));

        ASSERT_TRUE(articles.SoftDeleteByCond([](sqlforge::DeleteBuilder<Value> &b) { b.Where(Expr::Col("title").Eq("old")); }).has_value());
        EXPECT_EQ(executor->log->snapshot().back(), "UPDATE article SET deleted = ? WHERE title = ? AND tenant_id = ?");

        ASSERT_TRUE(articles.UpdateByCond([](sqlforge::UpdateBuilder<Value> &b) { b.Set("title", "t"); }).has_value());
        EXPECT_EQ(executor->log->snapshot().back(), "UPDATE article SET title = ? WHERE tenant_id = ?");

        // 未配置软删除时不执行任何语句
        sqlforge::SingleKeyTable<User, Value> users(executor, "users", "id", true, Scope{});
        const auto before = executor->log->snapshot().size();
        EXPECT_EQ(users.SoftDeleteByPk(1).error().code, ErrorCode::SoftDeleteConfigNotSet);
        EXPECT_EQ(users.SoftDeleteByCond(nullptr).error().code, ErrorCode::SoftDeleteConfigNotSet);
        EXPECT_EQ(executor->log->snapshot().size(), before);

        sqlforge::CompositeKeyTable<ArticleTag, Value> tags(executor, "article_tag", {"article_id", "tag_id"}, Scope{});
        EXPECT_EQ(tags.SoftDeleteByPk({1, 2}).error().code, ErrorCode::SoftDeleteConfigNotSet);
    }

    TEST(FacadeTest, NullExecutorReportsPoolNotInitialized) {
        sqlforge::SingleKeyTable<User, Value> users(nullptr, "users", "id", true, Scope{});
        EXPECT_EQ(users.GetOneByPk(1).error().code, ErrorCode::DBPoolNotInitialized);
        EXPECT_EQ(users.InsertOne(sqlforge_test::makeUser(0, "a", 1)).error().code, ErrorCode::DBPoolNotInitialized);
        EXPECT_EQ(users.Count(nullptr).error().code, ErrorCode::DBPoolNotInitialized);
        // 构建错误先于执行器检查
        EXPECT_EQ(users.DeleteByPk(0).error().code, ErrorCode::PrimaryKeyNotFound);
    }

    TEST(FacadeTest, CompositeKeyTable) {
        auto executor = std::make_shared<FakeExecutor>();
        sqlforge::CompositeKeyTable<ArticleTag, Value> tags(executor, "article_tag", {"article_id", "tag_id"}, Scope{});
        executor->rows = {Row({"article_id", "tag_id", "note"}, {QVariant(qlonglong(1)), QVariant(qlonglong(2)), QVariant(QString("n"))})};

        auto tag = tags.GetOneByPk({1, 2});
        ASSERT_TRUE(tag.has_value());
        ASSERT_TRUE(tag->has_value());
        EXPECT_EQ((*tag)->note, "n");
        EXPECT_EQ(executor->log->snapshot().back(), "SELECT article_id, tag_id, note FROM article_tag WHERE article_id = ? AND tag_id = ?");

        ASSERT_TRUE(tags.DeleteByPk({1, 2}).has_value());
        EXPECT_EQ(executor->log->snapshot().back(), "DELETE FROM article_tag WHERE article_id = ? AND tag_id = ?");

        EXPECT_EQ(tags.DeleteByPk({1}).error().code, ErrorCode::SingleKeyTypeInvalid);
        EXPECT_EQ(tags.GetOneByPk({1, 2, 3}).error().code, ErrorCode::CompositeKeyTypeInvalid);
        EXPECT_EQ(tags.RestoreByPk({1, 2}).error().code, ErrorCode::RestoreOperationNotSupported);
    }

    TEST(QueryExecutorTest, FetchOneAndScalar) {
        FakeExecutor executor;
        auto query = sqlforge::SelectBuilder<Value>::Columns({"id", "name", "age", "email"});
        query.From("users");

        auto missing = executor.fetchOne<User>(query);
        ASSERT_FALSE(missing.has_value());
        EXPECT_EQ(missing.error().code, ErrorCode::RecordNotFound);

        executor.rows = {userRow(1, "a", 1), userRow(2, "b", 2)};
        auto first = executor.fetchOne<User>(query);
        ASSERT_TRUE(first.has_value());
        EXPECT_EQ(first->id, 1);
        EXPECT_EQ(executor.fetchAll<User>(query)->size(), 2u);

        auto scalar = executor.fetchScalar(query);
        ASSERT_TRUE(scalar.has_value());
        ASSERT_TRUE(scalar->has_value());
        EXPECT_EQ((*scalar)->toLongLong(), 1);

        auto bad = sqlforge::SelectBuilder<Value>::Columns({});
        bad.From("t").Where(Expr::Col("x").In(std::vector<Value>{}));
        EXPECT_EQ(executor.fetchAll<User>(bad).error().code, ErrorCode::EmptyInList);
        EXPECT_EQ(executor.params().size(), 4u);
    }

    TEST(QueryExecutorTest, TransactionRollsBackOnFirstError) {
        FakeExecutor executor;
        executor.fail_marker = "bad_table";
        std::vector<sqlforge::SqlBuilder<Value>> statements{sqlforge::SqlBuilder<Value>::Raw("INSERT INTO a VALUES (?)", {1}),
                                                           sqlforge::SqlBuilder<Value>::Raw("INSERT INTO bad_table VALUES (?)", {2}),
                                                           sqlforge::SqlBuilder<Value>::Raw("INSERT INTO c VALUES (?)", {3})};
        auto result = executor.executeWithTransaction(statements);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, ErrorCode::QueryExecutionError);
        EXPECT_EQ(result.error().native_db_error_code, 1062);
        EXPECT_EQ(executor.log->snapshot(), (std::vector<std::string>{"BEGIN", "INSERT INTO a VALUES (?)", "INSERT INTO bad_table VALUES (?)", "ROLLBACK"}));

        executor.fail_marker.clear();
        executor.log = std::make_shared<StatementLog>();
        auto ok = executor.executeWithTransaction(statements);
        ASSERT_TRUE(ok.has_value());
        EXPECT_EQ(ok->size(), 3u);
        EXPECT_EQ(executor.log->snapshot().back(), "COMMIT");
    }

    TEST(TransactionalExecutorTest, QueuesUntilCommit) {
        auto executor = std::make_shared<FakeExecutor>();
        sqlforge::TransactionalExecutor<Value> tx(executor);

        // 事务外立即执行
        auto direct = tx.execute(sqlforge::SqlBuilder<Value>::Raw("DELETE FROM a", {}));
        ASSERT_TRUE(direct.has_value());
        ASSERT_TRUE(direct->has_value());
        EXPECT_EQ(executor->log->snapshot().size(), 1u);

        ASSERT_TRUE(tx.begin().has_value());
        EXPECT_TRUE(tx.isInTransaction());
        EXPECT_EQ(tx.begin().error().code, ErrorCode::TransactionError);

        auto update = sqlforge::UpdateBuilder<Value>::Table("users");
        update.Set("age", 31).Where(Expr::Col("id").Eq(1));
        auto queued = tx.execute(update);
        ASSERT_TRUE(queued.has_value());
        EXPECT_FALSE(queued->has_value());
        ASSERT_TRUE(tx.execute(sqlforge::SqlBuilder<Value>::Raw("DELETE FROM b WHERE id = ?", {2})).has_value());
        EXPECT_EQ(tx.pendingCount(), 2u);
        EXPECT_EQ(executor->log->snapshot().size(), 1u);

        auto committed = tx.commit();
        ASSERT_TRUE(committed.has_value());
        EXPECT_EQ(committed->size(), 2u);
        EXPECT_FALSE(tx.isInTransaction());
        EXPECT_EQ(executor->log->snapshot(), (std::vector<std::string>{"DELETE FROM a", "BEGIN", "UPDATE users SET age = ? WHERE id = ?", "DELETE FROM b WHERE id = ?", "COMMIT"}));
    }

    TEST(TransactionalExecutorTest, CommitAndRollbackEdges) {
        auto executor = std::make_shared<FakeExecutor>();
        sqlforge::TransactionalExecutor<Value> tx(executor);
        EXPECT_EQ(tx.commit().error().code, ErrorCode::TransactionError);

        ASSERT_TRUE(tx.begin().has_value());
        auto empty = tx.commit();
        ASSERT_TRUE(empty.has_value());
        EXPECT_TRUE(empty->empty());

        ASSERT_TRUE(tx.begin().has_value());
        ASSERT_TRUE(tx.execute(sqlforge::SqlBuilder<Value>::Raw("DELETE FROM a", {})).has_value());
        tx.rollback();
        EXPECT_EQ(tx.pendingCount(), 0u);
        EXPECT_FALSE(tx.isInTransaction());
        EXPECT_TRUE(executor->log->snapshot().empty());
    }

}  // namespace
