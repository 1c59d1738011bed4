#include "storage/database.hpp"

namespace atrium::storage {

Error sqlite_error(int rc, std::string message) {
    const int primary = rc & 0xff;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
        return Error{ErrorKind::Conflict, std::move(message), rc};
    }
    return Error{ErrorKind::Storage, std::move(message), rc};
}

// ============================================================================
// Statement implementation
// ============================================================================

void Statement::record_bind(int rc, const char* what) {
    if (rc == SQLITE_OK || bind_error_) return;
    std::string message = std::string("Failed to bind ") + what;
    if (db_) {
        message += ": ";
        message += sqlite3_errmsg(db_);
    }
    bind_error_ = sqlite_error(rc, std::move(message));
}

Statement& Statement::bind_text(int index, std::string_view text) {
    record_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                  static_cast<int>(text.size()), SQLITE_TRANSIENT),
                "text");
    return *this;
}

Statement& Statement::bind_int(int index, int value) {
    record_bind(sqlite3_bind_int(stmt_.get(), index, value), "int");
    return *this;
}

Statement& Statement::bind_int64(int index, int64_t value) {
    record_bind(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
    return *this;
}

Statement& Statement::bind_null(int index) {
    record_bind(sqlite3_bind_null(stmt_.get(), index), "null");
    return *this;
}

Statement& Statement::bind_optional_text(int index, const std::optional<std::string>& text) {
    if (text) return bind_text(index, *text);
    return bind_null(index);
}

Statement& Statement::bind_optional_int64(int index, const std::optional<int64_t>& value) {
    if (value) return bind_int64(index, *value);
    return bind_null(index);
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

double Statement::column_double(int index) const {
    return sqlite3_column_double(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_text(index);
}

std::optional<int64_t> Statement::column_optional_int64(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_int64(index);
}

Result<bool, Error> Statement::step() {
    if (bind_error_) {
        return Result<bool, Error>::err(*bind_error_);
    }
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    std::string message = "Step failed";
    if (db_) {
        message += ": ";
        message += sqlite3_errmsg(db_);
    }
    return Result<bool, Error>::err(sqlite_error(rc, std::move(message)));
}

Result<void, Error> Statement::run() {
    auto step_result = step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::reset() {
    bind_error_.reset();
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error(rc, "Reset failed"));
    }
    rc = sqlite3_clear_bindings(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error(rc, "Clearing bindings failed"));
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path, int busy_timeout_ms) {
    sqlite3* handle = nullptr;
    int rc = sqlite3_open(path.c_str(), &handle);
    if (rc != SQLITE_OK) {
        std::string error = handle ? sqlite3_errmsg(handle) : "Unknown error";
        if (handle) sqlite3_close(handle);
        return Result<Database, Error>::err(sqlite_error(rc, "Cannot open " + path + ": " + error));
    }

    Database db(handle);

    rc = sqlite3_busy_timeout(handle, busy_timeout_ms);
    if (rc != SQLITE_OK) {
        return Result<Database, Error>::err(sqlite_error(rc, db.last_error()));
    }

    // Blocks reference realms with ON DELETE CASCADE
    auto fk = db.execute("PRAGMA foreign_keys = ON;");
    if (fk.is_err()) {
        return Result<Database, Error>::err(fk.unwrap_err());
    }

    // WAL lets readers proceed while a structural write holds the lock.
    // In-memory databases silently stay in "memory" mode.
    auto wal = db.execute("PRAGMA journal_mode = WAL;");
    if (wal.is_err()) {
        return Result<Database, Error>::err(wal.unwrap_err());
    }

    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(sqlite_error(rc, last_error()));
    }
    return Result<Statement, Error>::ok(Statement(stmt, db_));
}

Result<void, Error> Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(sqlite_error(rc, std::move(error)));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN TRANSACTION;");
}

Result<void, Error> Database::begin_immediate() {
    return execute("BEGIN IMMEDIATE;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace atrium::storage
