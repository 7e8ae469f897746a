#include <sklib/debug.hh>
#include <sklib/sqlite.hh>

namespace sqlite {

void throw_error(sqlite3* db, std::string_view operation) {
    int code = (db ? sqlite3_extended_errcode(db) : SQLITE_MISUSE);
    const char* msg = (db ? sqlite3_errmsg(db) : "no database connection");
    throw Error(code, concat_tostr(operation, " - ", code, ": ", msg));
}

int Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_DONE or rc == SQLITE_ROW) {
        return rc;
    }

    throw_error(db_handle(), "sqlite3_step()");
}

void Statement::bind_null(int idx) {
    if (sqlite3_bind_null(stmt_, idx)) {
        throw_error(db_handle(), "sqlite3_bind_null()");
    }
}

void Statement::bind_text(int idx, std::string_view val) {
    if (sqlite3_bind_text(
            stmt_, idx, val.data(), static_cast<int>(val.size()), SQLITE_TRANSIENT
        ))
    {
        throw_error(db_handle(), "sqlite3_bind_text()");
    }
}

void Statement::bind_int64(int idx, sqlite3_int64 val) {
    if (sqlite3_bind_int64(stmt_, idx, val)) {
        throw_error(db_handle(), "sqlite3_bind_int64()");
    }
}

void Statement::bind_double(int idx, double val) {
    if (sqlite3_bind_double(stmt_, idx, val)) {
        throw_error(db_handle(), "sqlite3_bind_double()");
    }
}

Connection::Connection(const std::string& file, int flags) {
    if (sqlite3_open_v2(file.c_str(), &db_, flags, nullptr)) {
        // db_ may be non-null even on failure and has to be closed then
        Connection guard;
        guard.db_ = std::exchange(db_, nullptr);
        throw_error(guard.db_, concat_tostr("sqlite3_open_v2('", file, "')"));
    }
    (void)sqlite3_extended_result_codes(db_, 1);
}

void Connection::execute(const std::string& sql) {
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr)) {
        throw_error(db_, "sqlite3_exec()");
    }
}

Statement Connection::prepare(std::string_view sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr)) {
        throw_error(db_, "sqlite3_prepare_v2()");
    }
    return Statement{stmt};
}

int64_t Connection::query_int64(std::string_view sql) {
    auto stmt = prepare(sql);
    if (not stmt.next()) {
        THROW("query returned no rows: ", sql);
    }
    return stmt.get_int64(0);
}

Transaction::Transaction(Connection& conn)
: conn_(&conn) {
    conn.execute("BEGIN IMMEDIATE");
}

void Transaction::rollback() noexcept {
    if (conn_ == nullptr) {
        return;
    }

    auto* conn = std::exchange(conn_, nullptr);
    if (sqlite3_get_autocommit(*conn) == 0 and
        sqlite3_exec(*conn, "ROLLBACK", nullptr, nullptr, nullptr))
    {
        errlog("Transaction rollback failed: ", sqlite3_errmsg(*conn));
    }
}

void Transaction::commit() {
    throw_assert(conn_ != nullptr);
    conn_->execute("COMMIT");
    conn_ = nullptr;
}

} // namespace sqlite
