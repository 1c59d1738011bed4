#include "storage/migrations.hpp"

#include <chrono>

namespace atrium::storage {

Result<void, Error> MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<int, Error> MigrationRunner::current_version() {
    auto ensured = ensure_migrations_table();
    if (ensured.is_err()) {
        return Result<int, Error>::err(ensured.unwrap_err());
    }

    auto stmt_result = db_.prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(stmt.column_int(0));
}

Result<void, Error> MigrationRunner::apply(const Migration& m) {
    auto exec_result = db_.execute(m.sql);
    if (exec_result.is_err()) {
        auto error = exec_result.unwrap_err();
        error.message = "Migration " + std::to_string(m.version) + " (" + m.name + ") failed: " +
                        error.message;
        return Result<void, Error>::err(std::move(error));
    }

    auto stmt_result = db_.prepare(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int(1, m.version).bind_text(2, m.name).bind_int64(3, now);
    return stmt.run();
}

Result<void, Error> MigrationRunner::migrate() {
    auto ensured = ensure_migrations_table();
    if (ensured.is_err()) return ensured;

    return db_.write_transaction([&]() -> Result<void, Error> {
        auto current = current_version();
        if (current.is_err()) {
            return Result<void, Error>::err(current.unwrap_err());
        }
        const int version = current.unwrap();
        if (version > latest_version()) {
            return Result<void, Error>::err(Error{
                "Database schema version " + std::to_string(version) +
                " is newer than this build supports (" + std::to_string(latest_version()) + ")"});
        }

        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version <= version) continue;
            auto applied = apply(m);
            if (applied.is_err()) return applied;
        }
        return Result<void, Error>::ok();
    });
}

} // namespace atrium::storage
