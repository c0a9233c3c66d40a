#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "sqlforge/sqlforge.h"
#include "sqlforge/sqlite/sqlite_value.h"
#include "sqlforge_sqldriver/driver_logger.h"
#include "sqlforge_sqldriver/sqlite_executor.h"

namespace {

    using Value = sqlforge::sqlite::Value;
    using Expr = sqlforge::Expr<Value>;

    class Book : public sqlforge::Entity<Book> {
      public:
        sqlforge_ENTITY_TABLE(Book, "books")
        sqlforge_AUTO_INCREMENT_PRIMARY_KEY(qint64, id, "id")
        sqlforge_FIELD(std::string, title, "title", sqlforge::FieldFlag::NotNull)
        sqlforge_FIELD(std::optional<std::string>, author, "author")
        sqlforge_FIELD(int, year, "year")
        sqlforge_FIELD(bool, deleted, "deleted")
    };

    Book makeBook(std::string title, std::optional<std::string> author, int year) {
        Book book;
        book.title = std::move(title);
        book.author = std::move(author);
        book.year = year;
        return book;
    }

    void printBooks(const std::string& heading, const std::vector<Book>& books) {
        std::cout << heading << " (" << books.size() << ")" << std::endl;
        for (const auto& book : books) {
            std::cout << "  #" << book.id << " " << book.title << " by " << book.author.value_or("unknown") << ", " << book.year << std::endl;
        }
    }

}  // namespace

int main(int argc, char** argv) {
    const std::string url = argc > 1 ? argv[1] : "sqlite://:memory:?pool_max_size=1";

    sqlforge_sqldriver::set_driver_log_level(spdlog::level::debug);
    sqlforge::setGlobalSoftDeleteField<Value>("deleted");

    std::cout << "SqlForge SQLite Example" << std::endl;
    std::cout << "-----------------------" << std::endl;

    auto params = sqlforge_sqldriver::ConnectionParameters::fromUrl(url);
    if (!params) {
        std::cerr << params.error().toString() << std::endl;
        return 1;
    }
    auto executor = sqlforge_sqldriver::SqliteExecutor::open(*params);
    if (!executor) {
        std::cerr << executor.error().toString() << std::endl;
        return 1;
    }

    auto created = (*executor)->execute(sqlforge::SqlBuilder<Value>::Raw(
        "CREATE TABLE IF NOT EXISTS books (id INTEGER PRIMARY KEY AUTOINCREMENT, title TEXT NOT NULL, author TEXT, year INTEGER, deleted INTEGER NOT NULL DEFAULT 0)"));
    if (!created) {
        std::cerr << created.error().toString() << std::endl;
        return 1;
    }

    sqlforge::SingleKeyTable<Book, Value> books(*executor);

    // --- 1. 批量插入 ---
    auto inserted = books.InsertMany({makeBook("The Pragmatic Programmer", "Hunt", 1999), makeBook("Refactoring", "Fowler", 1999), makeBook("Anonymous Notes", std::nullopt, 2021)});
    if (!inserted) {
        std::cerr << inserted.error().toString() << std::endl;
        return 1;
    }
    std::cout << "Inserted " << inserted->rows_affected << " books" << std::endl;

    // --- 2. 条件查询 ---
    auto classics = books.GetListByCond([](sqlforge::SelectBuilder<Value>& b) { b.Where(Expr::Col("year").Lt(2000)).OrderBy("title"); });
    if (!classics) {
        std::cerr << classics.error().toString() << std::endl;
        return 1;
    }
    printBooks("Books before 2000", *classics);

    // --- 3. 软删除后分页 ---
    if (auto removed = books.DeleteByPk(2); !removed) {
        std::cerr << removed.error().toString() << std::endl;
        return 1;
    }
    auto page = books.GetListPaginated(1, 10, nullptr);
    if (!page) {
        std::cerr << page.error().toString() << std::endl;
        return 1;
    }
    std::cout << "Page 1 holds " << page->data.size() << " of " << page->total << " visible books" << std::endl;

    // --- 4. 事务 ---
    sqlforge::TransactionalExecutor<Value> tx(*executor);
    if (auto begun = tx.begin(); !begun) {
        std::cerr << begun.error().toString() << std::endl;
        return 1;
    }
    auto restore = books.query().RestoreByPk({2});
    auto retitle = books.query().UpdateByCond([](sqlforge::UpdateBuilder<Value>& b) { b.Set("author", "Fowler, M.").Where(Expr::Col("id").Eq(2)); });
    if (!restore || !retitle) {
        std::cerr << (restore ? retitle.error() : restore.error()).toString() << std::endl;
        return 1;
    }
    if (auto queued = tx.execute(*restore); !queued) {
        std::cerr << queued.error().toString() << std::endl;
        return 1;
    }
    if (auto queued = tx.execute(*retitle); !queued) {
        std::cerr << queued.error().toString() << std::endl;
        return 1;
    }
    auto committed = tx.commit();
    if (!committed) {
        std::cerr << committed.error().toString() << std::endl;
        return 1;
    }
    std::cout << "Committed " << committed->size() << " statements" << std::endl;

    auto all = books.GetListByCond(nullptr);
    if (all) printBooks("All visible books", *all);

    (*executor)->close();
    return 0;
}
