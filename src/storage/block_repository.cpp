#include "storage/block_repository.hpp"

namespace atrium::storage {

using namespace blocks;

namespace {

constexpr const char* BLOCK_COLUMNS =
    "id, realm_id, idx, type, text_content, series_key, event_key, show_title, "
    "show_metadata, videolist_order";

} // namespace

Block BlockRepository::row_to_block(Statement& stmt) {
    Block block;
    block.id = stmt.column_int64(0);
    block.realm_id = stmt.column_int64(1);
    block.index = stmt.column_int(2);

    const auto type = parse_type(stmt.column_text(3)).value_or(BlockType::Text);
    switch (type) {
        case BlockType::Title:
            block.content = Title{stmt.column_text(4)};
            break;
        case BlockType::Text:
            block.content = Text{stmt.column_text(4)};
            break;
        case BlockType::Series:
            block.content = SeriesRef{
                .series = stmt.column_optional_int64(5),
                .show_title = stmt.column_int(7) != 0,
                .show_metadata = stmt.column_int(8) != 0,
                .order = parse_order(stmt.column_text(9)).value_or(VideoListOrder::NewToOld)
            };
            break;
        case BlockType::Video:
            block.content = VideoRef{
                .event = stmt.column_optional_int64(6),
                .show_title = stmt.column_int(7) != 0
            };
            break;
    }
    return block;
}

// Binds text_content, series_key, event_key, show_title, show_metadata and
// videolist_order starting at parameter `first`.
void BlockRepository::bind_content(Statement& stmt, int first, const BlockContent& content) {
    std::visit([&](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Title> || std::is_same_v<T, Text>) {
            stmt.bind_text(first, c.text)
                .bind_null(first + 1)
                .bind_null(first + 2)
                .bind_int(first + 3, 1)
                .bind_int(first + 4, 0)
                .bind_text(first + 5, order_name(VideoListOrder::NewToOld));
        } else if constexpr (std::is_same_v<T, SeriesRef>) {
            stmt.bind_null(first)
                .bind_optional_int64(first + 1, c.series)
                .bind_null(first + 2)
                .bind_int(first + 3, c.show_title ? 1 : 0)
                .bind_int(first + 4, c.show_metadata ? 1 : 0)
                .bind_text(first + 5, order_name(c.order));
        } else if constexpr (std::is_same_v<T, VideoRef>) {
            stmt.bind_null(first)
                .bind_null(first + 1)
                .bind_optional_int64(first + 2, c.event)
                .bind_int(first + 3, c.show_title ? 1 : 0)
                .bind_int(first + 4, 0)
                .bind_text(first + 5, order_name(VideoListOrder::NewToOld));
        }
    }, content);
}

Result<void, Error> BlockRepository::run(const std::string& sql, Key realm_id, int index) {
    auto stmt_result = db_.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, realm_id).bind_int(2, index);
    return stmt.run();
}

Result<std::optional<Block>, Error> BlockRepository::get(Key id) {
    using R = Result<std::optional<Block>, Error>;
    auto stmt_result = db_.prepare(std::string("SELECT ") + BLOCK_COLUMNS +
                                   " FROM blocks WHERE id = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(row_to_block(stmt));
}

Result<std::vector<Block>, Error> BlockRepository::get_by_realm(Key realm_id) {
    using R = Result<std::vector<Block>, Error>;
    auto stmt_result = db_.prepare(std::string("SELECT ") + BLOCK_COLUMNS +
                                   " FROM blocks WHERE realm_id = ? ORDER BY idx;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, realm_id);

    std::vector<Block> list;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return R::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        list.push_back(row_to_block(stmt));
    }
    return R::ok(std::move(list));
}

Result<int, Error> BlockRepository::count_by_realm(Key realm_id) {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM blocks WHERE realm_id = ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, realm_id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(stmt.column_int(0));
}

Result<Block, Error> BlockRepository::insert_at(
    Key realm_id,
    int index,
    const BlockContent& content
) {
    // idx -> -(idx + 1) -> idx + 1
    auto shifted = run("UPDATE blocks SET idx = -idx - 1 WHERE realm_id = ? AND idx >= ?;",
                       realm_id, index);
    if (shifted.is_err()) {
        return Result<Block, Error>::err(shifted.unwrap_err());
    }
    shifted = run("UPDATE blocks SET idx = -idx WHERE realm_id = ? AND idx < ?;", realm_id, 0);
    if (shifted.is_err()) {
        return Result<Block, Error>::err(shifted.unwrap_err());
    }

    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO blocks (realm_id, idx, type, text_content, series_key, event_key,
                            show_title, show_metadata, videolist_order)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<Block, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, realm_id)
        .bind_int(2, index)
        .bind_text(3, type_name(get_type(content)));
    bind_content(stmt, 4, content);

    auto run_result = stmt.run();
    if (run_result.is_err()) {
        return Result<Block, Error>::err(run_result.unwrap_err());
    }

    return Result<Block, Error>::ok(Block{
        .id = db_.last_insert_rowid(),
        .realm_id = realm_id,
        .index = index,
        .content = content
    });
}

Result<void, Error> BlockRepository::remove_at(Key realm_id, int index) {
    auto result = run("DELETE FROM blocks WHERE realm_id = ? AND idx = ?;", realm_id, index);
    if (result.is_err()) return result;
    if (db_.changes() == 0) {
        return Result<void, Error>::err(Error::not_found(
            "No block at position " + std::to_string(index)));
    }

    // idx -> -idx -> idx - 1
    result = run("UPDATE blocks SET idx = -idx WHERE realm_id = ? AND idx > ?;", realm_id, index);
    if (result.is_err()) return result;
    return run("UPDATE blocks SET idx = -idx - 1 WHERE realm_id = ? AND idx < ?;", realm_id, 0);
}

Result<void, Error> BlockRepository::swap(Key realm_id, int a, int b) {
    if (a == b) {
        return Result<void, Error>::ok();
    }

    auto stmt_result = db_.prepare(R"SQL(
        UPDATE blocks SET idx = ?3 WHERE realm_id = ?1 AND idx = ?2;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();

    // a -> -1, b -> a, -1 -> b
    const int moves[3][2] = {{a, -1}, {b, a}, {-1, b}};
    for (const auto& move : moves) {
        stmt.bind_int64(1, realm_id).bind_int(2, move[0]).bind_int(3, move[1]);
        auto run_result = stmt.run();
        if (run_result.is_err()) return run_result;
        auto reset_result = stmt.reset();
        if (reset_result.is_err()) return reset_result;
    }
    return Result<void, Error>::ok();
}

Result<void, Error> BlockRepository::update_content(Key id, const BlockContent& content) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE blocks SET text_content = ?, series_key = ?, event_key = ?,
                          show_title = ?, show_metadata = ?, videolist_order = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    bind_content(stmt, 1, content);
    stmt.bind_int64(7, id);
    return stmt.run();
}

} // namespace atrium::storage
