#include "storage/index_queue_repository.hpp"

namespace atrium::storage {

Result<std::vector<QueueItem>, Error> IndexQueueRepository::peek(int limit) {
    using R = Result<std::vector<QueueItem>, Error>;
    auto stmt_result = db_.prepare(
        "SELECT id, item_kind, item_key FROM search_index_queue ORDER BY id LIMIT ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int(1, limit);

    std::vector<QueueItem> items;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return R::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        auto kind = parse_entity_kind(stmt.column_text(1));
        if (!kind) {
            return R::err(Error{"Unknown item kind in search_index_queue: " + stmt.column_text(1)});
        }
        items.push_back(QueueItem{
            .id = stmt.column_int64(0),
            .kind = *kind,
            .key = stmt.column_int64(2)
        });
    }
    return R::ok(std::move(items));
}

Result<void, Error> IndexQueueRepository::remove(const std::vector<QueueItem>& items) {
    if (items.empty()) {
        return Result<void, Error>::ok();
    }
    return db_.transaction([&]() -> Result<void, Error> {
        auto stmt_result = db_.prepare("DELETE FROM search_index_queue WHERE id = ?;");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        for (const auto& item : items) {
            stmt.bind_int64(1, item.id);
            auto run_result = stmt.run();
            if (run_result.is_err()) return run_result;
            auto reset_result = stmt.reset();
            if (reset_result.is_err()) return reset_result;
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> IndexQueueRepository::clear() {
    return db_.execute("DELETE FROM search_index_queue;");
}

Result<int64_t, Error> IndexQueueRepository::high_water_mark() {
    auto stmt_result = db_.prepare("SELECT COALESCE(MAX(id), 0) FROM search_index_queue;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

Result<void, Error> IndexQueueRepository::remove_through(int64_t id) {
    auto stmt_result = db_.prepare("DELETE FROM search_index_queue WHERE id <= ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id);
    return stmt.run();
}

Result<int64_t, Error> IndexQueueRepository::size() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM search_index_queue;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

} // namespace atrium::storage
