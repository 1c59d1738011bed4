#include "storage/sync_status_repository.hpp"

namespace atrium::storage {

Result<HarvestCursor, Error> SyncStatusRepository::load_cursor() {
    auto stmt_result = db_.prepare("SELECT harvest_cursor FROM sync_status WHERE id = 1;");
    if (stmt_result.is_err()) {
        return Result<HarvestCursor, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<HarvestCursor, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<HarvestCursor, Error>::ok(HarvestCursor{});
    }
    return Result<HarvestCursor, Error>::ok(HarvestCursor{stmt.column_text(0)});
}

Result<void, Error> SyncStatusRepository::save_cursor(const HarvestCursor& cursor) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto stmt_result = db_.prepare(R"SQL(
            INSERT INTO sync_status (id, harvest_cursor, updated_at) VALUES (1, ?, ?)
            ON CONFLICT(id) DO UPDATE SET
                harvest_cursor = excluded.harvest_cursor,
                updated_at = excluded.updated_at;
        )SQL");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        stmt.bind_text(1, cursor.token).bind_int64(2, Timestamp::now().millis());
        return stmt.run();
    });
}

Result<Timestamp, Error> SyncStatusRepository::last_advanced() {
    auto stmt_result = db_.prepare("SELECT updated_at FROM sync_status WHERE id = 1;");
    if (stmt_result.is_err()) {
        return Result<Timestamp, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<Timestamp, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<Timestamp, Error>::ok(Timestamp{});
    }
    return Result<Timestamp, Error>::ok(Timestamp(stmt.column_int64(0)));
}

} // namespace atrium::storage
