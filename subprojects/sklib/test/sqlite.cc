#include <gtest/gtest.h>
#include <sklib/sqlite.hh>
#include <sklib/temporary_directory.hh>

namespace {

sqlite::Connection in_memory_db() {
    sqlite::Connection db(":memory:", SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    db.execute("CREATE TABLE t (id INTEGER UNIQUE, name TEXT, value REAL)");
    return db;
}

} // namespace

// NOLINTNEXTLINE
TEST(sqlite, bind_and_read_back) {
    auto db = in_memory_db();
    db.prepare("INSERT INTO t (id, name, value) VALUES (?, ?, ?)")
        .bind_all(int64_t{1} << 40, std::string{"abc"}, 2.5)
        .step();
    db.prepare("INSERT INTO t (id, name, value) VALUES (?, ?, ?)")
        .bind_all(7, std::nullopt, std::optional<double>{})
        .step();

    auto stmt = db.prepare("SELECT id, name, value FROM t ORDER BY id");
    ASSERT_TRUE(stmt.next());
    EXPECT_EQ(stmt.get_int(0), 7);
    EXPECT_TRUE(stmt.is_null(1));
    EXPECT_EQ(stmt.get_str(1), "");
    EXPECT_EQ(stmt.get_opt_int64(2), std::nullopt);
    ASSERT_TRUE(stmt.next());
    EXPECT_EQ(stmt.get_int64(0), int64_t{1} << 40);
    EXPECT_EQ(stmt.get_str(1), "abc");
    EXPECT_EQ(stmt.get_double(2), 2.5);
    EXPECT_FALSE(stmt.next());
}

// NOLINTNEXTLINE
TEST(sqlite, query_int64) {
    auto db = in_memory_db();
    EXPECT_EQ(db.query_int64("SELECT COUNT(*) FROM t"), 0);
    db.execute("PRAGMA user_version = 3");
    EXPECT_EQ(db.query_int64("PRAGMA user_version"), 3);
}

// NOLINTNEXTLINE
TEST(sqlite, errors_carry_code) {
    auto db = in_memory_db();
    db.execute("INSERT INTO t (id) VALUES (1)");
    try {
        db.execute("INSERT INTO t (id) VALUES (1)");
        FAIL() << "expected sqlite::Error";
    } catch (const sqlite::Error& e) {
        EXPECT_EQ(e.code(), SQLITE_CONSTRAINT_UNIQUE);
    }
    EXPECT_THROW((void)db.prepare("SELECT * FROM no_such_table"), sqlite::Error);
}

// NOLINTNEXTLINE
TEST(sqlite, transaction_rolls_back_unless_committed) {
    auto db = in_memory_db();
    {
        auto transaction = db.start_transaction();
        db.execute("INSERT INTO t (id) VALUES (1)");
        EXPECT_TRUE(transaction.is_active());
    }
    EXPECT_EQ(db.query_int64("SELECT COUNT(*) FROM t"), 0);

    {
        auto transaction = db.start_transaction();
        db.execute("INSERT INTO t (id) VALUES (2)");
        transaction.commit();
        EXPECT_FALSE(transaction.is_active());
    }
    EXPECT_EQ(db.query_int64("SELECT COUNT(*) FROM t"), 1);
}

// NOLINTNEXTLINE
TEST(sqlite, open_failure) {
    TemporaryDirectory tmp_dir("/tmp/sklib-sqlite-test.XXXXXX");
    EXPECT_THROW(
        (void)sqlite::Connection(tmp_dir.path() + "no/such/dir/db.sqlite", SQLITE_OPEN_READWRITE),
        sqlite::Error
    );
}
