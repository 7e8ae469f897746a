#pragma once

#include <cstdint>
#include <optional>
#include <sklib/concat_tostr.hh>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace sqlite {

class Error : public std::runtime_error {
    int code_;

public:
    Error(int code, const std::string& msg)
    : std::runtime_error(msg)
    , code_(code) {}

    [[nodiscard]] int code() const noexcept { return code_; }
};

// Throws sqlite::Error describing the last error on @p db
[[noreturn]] void throw_error(sqlite3* db, std::string_view operation);

class Statement {
    sqlite3_stmt* stmt_ = nullptr;

    explicit Statement(sqlite3_stmt* stmt) noexcept
    : stmt_(stmt) {}

    friend class Connection;

    [[nodiscard]] sqlite3* db_handle() const noexcept { return sqlite3_db_handle(stmt_); }

    void bind_one(int idx, std::nullopt_t /*unused*/) { bind_null(idx); }

    void bind_one(int idx, std::string_view val) { bind_text(idx, val); }

    void bind_one(int idx, const std::string& val) { bind_text(idx, val); }

    void bind_one(int idx, const char* val) { bind_text(idx, val); }

    void bind_one(int idx, double val) { bind_double(idx, val); }

    template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
    void bind_one(int idx, T val) {
        bind_int64(idx, static_cast<sqlite3_int64>(val));
    }

    template <class T>
    void bind_one(int idx, const std::optional<T>& val) {
        if (val) {
            bind_one(idx, *val);
        } else {
            bind_null(idx);
        }
    }

public:
    Statement() noexcept = default;

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& s) noexcept
    : stmt_(std::exchange(s.stmt_, nullptr)) {}

    Statement& operator=(Statement&& s) noexcept {
        if (stmt_) {
            (void)sqlite3_finalize(stmt_);
        }
        stmt_ = std::exchange(s.stmt_, nullptr);
        return *this;
    }

    ~Statement() { (void)sqlite3_finalize(stmt_); }

    // Returns SQLITE_ROW or SQLITE_DONE, throws on any other result
    int step();

    // Returns true iff a row is available
    bool next() { return step() == SQLITE_ROW; }

    void reset() noexcept {
        (void)sqlite3_reset(stmt_);
        (void)sqlite3_clear_bindings(stmt_);
    }

    void bind_null(int idx);
    void bind_text(int idx, std::string_view val);
    void bind_int64(int idx, sqlite3_int64 val);
    void bind_double(int idx, double val);

    // Binds @p args to consecutive parameters starting from 1
    template <class... Args>
    Statement& bind_all(Args&&... args) {
        int idx = 0;
        (bind_one(++idx, std::forward<Args>(args)), ...);
        return *this;
    }

    [[nodiscard]] bool is_null(int col) noexcept {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

    [[nodiscard]] int get_int(int col) noexcept { return sqlite3_column_int(stmt_, col); }

    [[nodiscard]] int64_t get_int64(int col) noexcept {
        return sqlite3_column_int64(stmt_, col);
    }

    [[nodiscard]] double get_double(int col) noexcept { return sqlite3_column_double(stmt_, col); }

    [[nodiscard]] std::string get_str(int col) {
        const auto* text = sqlite3_column_text(stmt_, col);
        if (text == nullptr) {
            return {};
        }
        return {reinterpret_cast<const char*>(text),
                static_cast<size_t>(sqlite3_column_bytes(stmt_, col))};
    }

    [[nodiscard]] std::optional<int64_t> get_opt_int64(int col) noexcept {
        if (is_null(col)) {
            return std::nullopt;
        }
        return get_int64(col);
    }
};

class Connection;

// Rolls back in the destructor unless commit() was called
class Transaction {
    friend class Connection;

    Connection* conn_;

    explicit Transaction(Connection& conn);

public:
    Transaction() noexcept
    : conn_(nullptr) {}

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Transaction(Transaction&& trans) noexcept
    : conn_(std::exchange(trans.conn_, nullptr)) {}

    Transaction& operator=(Transaction&& trans) noexcept {
        rollback();
        conn_ = std::exchange(trans.conn_, nullptr);
        return *this;
    }

    [[nodiscard]] bool is_active() const noexcept { return conn_ != nullptr; }

    void rollback() noexcept;

    void commit();

    ~Transaction() { rollback(); }
};

class Connection {
    sqlite3* db_ = nullptr;

public:
    Connection() noexcept = default;

    Connection(const std::string& file, int flags);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Connection(Connection&& c) noexcept
    : db_(std::exchange(c.db_, nullptr)) {}

    Connection& operator=(Connection&& c) noexcept {
        close();
        db_ = std::exchange(c.db_, nullptr);
        return *this;
    }

    ~Connection() { close(); }

    [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator sqlite3*() noexcept { return db_; }

    void close() noexcept {
        (void)sqlite3_close_v2(db_);
        db_ = nullptr;
    }

    // Executes one or more ';'-separated statements that return no rows
    void execute(const std::string& sql);

    Statement prepare(std::string_view sql);

    // Runs a query that returns a single integer, e.g. "PRAGMA user_version"
    int64_t query_int64(std::string_view sql);

    Transaction start_transaction() { return Transaction{*this}; }

    [[nodiscard]] int changes() noexcept { return sqlite3_changes(db_); }
};

} // namespace sqlite
