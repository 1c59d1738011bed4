#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atrium::storage {

/**
 * Map a SQLite result code to an Error. BUSY and LOCKED become Conflict so
 * callers can tell lock contention from genuine failures.
 */
[[nodiscard]] Error sqlite_error(int rc, std::string message);

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3_stmt* stmt, sqlite3* db) : stmt_(stmt, sqlite3_finalize), db_(db) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers. A failed bind is remembered and reported by the next
    // step(), so call sites can bind a full row before checking once.
    Statement& bind_text(int index, std::string_view text);
    Statement& bind_int(int index, int value);
    Statement& bind_int64(int index, int64_t value);
    Statement& bind_null(int index);
    Statement& bind_optional_text(int index, const std::optional<std::string>& text);
    Statement& bind_optional_int64(int index, const std::optional<int64_t>& value);

    // Column getters
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] double column_double(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
    [[nodiscard]] std::optional<int64_t> column_optional_int64(int index) const;

    // Execute
    Result<bool, Error> step();  // Returns true if there's a row
    Result<void, Error> run();   // Step a statement that returns no rows
    Result<void, Error> reset();

private:
    void record_bind(int rc, const char* what);

    std::shared_ptr<sqlite3_stmt> stmt_;
    sqlite3* db_ = nullptr;
    std::optional<Error> bind_error_;
};

/**
 * Database - One SQLite connection.
 *
 * A connection must not be used from two threads at once; concurrent request
 * handlers each open their own connection to the same file and rely on
 * SQLite's locking (WAL, busy timeout, immediate write transactions).
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open a database connection.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path,
                                                      int busy_timeout_ms = 5000);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    /**
     * Prepare a SQL statement.
     */
    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Execute one or more SQL statements without results.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Execute a SQL statement and process results with a callback.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }

        return Result<void, Error>::ok();
    }

    /**
     * Begin a deferred transaction (takes the write lock on first write).
     */
    [[nodiscard]] Result<void, Error> begin_transaction();

    /**
     * Begin a transaction that takes the write lock immediately. Writers
     * using this are serialized; a writer that cannot get the lock within
     * the busy timeout fails with ErrorKind::Conflict.
     */
    [[nodiscard]] Result<void, Error> begin_immediate();

    [[nodiscard]] Result<void, Error> commit();

    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Execute a function within a transaction.
     * Commits on success, rolls back on failure.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        return run_in_transaction(false, std::forward<F>(f));
    }

    /**
     * Like transaction(), but holding the write lock from the start.
     */
    template<typename F>
    [[nodiscard]] auto write_transaction(F&& f) -> decltype(f()) {
        return run_in_transaction(true, std::forward<F>(f));
    }

    [[nodiscard]] int64_t last_insert_rowid() const;

    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    template<typename F>
    auto run_in_transaction(bool immediate, F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = immediate ? begin_immediate() : begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                auto error = result.unwrap_err();
                error.message += " (rollback failed: " + rollback_result.unwrap_err().message + ")";
                return ResultType::err(std::move(error));
            }
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            auto error = commit_result.unwrap_err();
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                error.message += " (rollback failed: " + rollback_result.unwrap_err().message + ")";
            }
            return ResultType::err(std::move(error));
        }

        return result;
    }

    sqlite3* db_ = nullptr;
};

} // namespace atrium::storage
