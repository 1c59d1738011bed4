#include "storage/mirror_repository.hpp"

namespace atrium::storage {

namespace {

constexpr const char* SERIES_COLUMNS =
    "key, external_id, title, description, updated, deleted";

constexpr const char* EVENT_SELECT = R"SQL(
    SELECT e.key, e.external_id, e.part_of, e.title, e.description, e.duration_ms,
           e.created, e.thumbnail, e.updated, e.deleted, s.key
    FROM events e
    LEFT JOIN series s ON s.external_id = e.part_of
)SQL";

const char* table_of(EntityKind kind) {
    return kind == EntityKind::Series ? "series" : "events";
}

} // namespace

// ============================================================================
// Reconciliation
// ============================================================================

Result<ApplyStats, Error> MirrorRepository::apply_batch(const std::vector<ChangeRecord>& records) {
    return db_.transaction([&]() -> Result<ApplyStats, Error> {
        ApplyStats stats;
        for (const auto& record : records) {
            auto result = apply(record);
            if (result.is_err()) {
                return Result<ApplyStats, Error>::err(result.unwrap_err());
            }
            if (result.unwrap()) {
                ++stats.applied;
            } else {
                ++stats.skipped;
            }
        }
        return Result<ApplyStats, Error>::ok(stats);
    });
}

Result<bool, Error> MirrorRepository::apply(const ChangeRecord& record) {
    return std::visit([this](const auto& r) -> Result<bool, Error> {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, UpsertSeries>) return upsert_series(r.series);
        else if constexpr (std::is_same_v<T, UpsertEvent>) return upsert_event(r.event);
        else if constexpr (std::is_same_v<T, DeleteEntity>) return remove(r);
    }, record);
}

Result<std::optional<StoredRevision>, Error> MirrorRepository::stored_revision(
    EntityKind kind,
    const std::string& external_id
) {
    using R = Result<std::optional<StoredRevision>, Error>;
    auto stmt_result = db_.prepare(std::string("SELECT updated, deleted FROM ") + table_of(kind) +
                                   " WHERE external_id = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, external_id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(StoredRevision{
        .updated = Timestamp(stmt.column_int64(0)),
        .deleted = stmt.column_int(1) != 0
    });
}

Result<bool, Error> MirrorRepository::upsert_series(const SeriesData& series) {
    auto stored = stored_revision(EntityKind::Series, series.external_id);
    if (stored.is_err()) {
        return Result<bool, Error>::err(stored.unwrap_err());
    }
    if (!should_apply_upsert(stored.unwrap(), series.updated)) {
        return Result<bool, Error>::ok(false);
    }

    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO series (external_id, title, description, updated, deleted)
        VALUES (?, ?, ?, ?, 0)
        ON CONFLICT(external_id) DO UPDATE SET
            title = excluded.title,
            description = excluded.description,
            updated = excluded.updated,
            deleted = 0;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<bool, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, series.external_id)
        .bind_text(2, series.title)
        .bind_optional_text(3, series.description)
        .bind_int64(4, series.updated.millis());

    auto run_result = stmt.run();
    if (run_result.is_err()) {
        return Result<bool, Error>::err(run_result.unwrap_err());
    }

    auto key = key_of(EntityKind::Series, series.external_id);
    if (key.is_err()) {
        return Result<bool, Error>::err(key.unwrap_err());
    }
    auto queued = enqueue(EntityKind::Series, key.unwrap());
    if (queued.is_err()) {
        return Result<bool, Error>::err(queued.unwrap_err());
    }
    queued = enqueue_events_of_series(series.external_id);
    if (queued.is_err()) {
        return Result<bool, Error>::err(queued.unwrap_err());
    }
    return Result<bool, Error>::ok(true);
}

Result<bool, Error> MirrorRepository::upsert_event(const EventData& event) {
    auto stored = stored_revision(EntityKind::Event, event.external_id);
    if (stored.is_err()) {
        return Result<bool, Error>::err(stored.unwrap_err());
    }
    if (!should_apply_upsert(stored.unwrap(), event.updated)) {
        return Result<bool, Error>::ok(false);
    }

    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO events (external_id, part_of, title, description, duration_ms,
                            created, thumbnail, updated, deleted)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, 0)
        ON CONFLICT(external_id) DO UPDATE SET
            part_of = excluded.part_of,
            title = excluded.title,
            description = excluded.description,
            duration_ms = excluded.duration_ms,
            created = excluded.created,
            thumbnail = excluded.thumbnail,
            updated = excluded.updated,
            deleted = 0;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<bool, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, event.external_id)
        .bind_optional_text(2, event.part_of)
        .bind_text(3, event.title)
        .bind_optional_text(4, event.description)
        .bind_optional_int64(5, event.duration_ms)
        .bind_int64(6, event.created.millis())
        .bind_optional_text(7, event.thumbnail)
        .bind_int64(8, event.updated.millis());

    auto run_result = stmt.run();
    if (run_result.is_err()) {
        return Result<bool, Error>::err(run_result.unwrap_err());
    }

    auto key = key_of(EntityKind::Event, event.external_id);
    if (key.is_err()) {
        return Result<bool, Error>::err(key.unwrap_err());
    }
    auto details = replace_event_details(key.unwrap(), event);
    if (details.is_err()) {
        return Result<bool, Error>::err(details.unwrap_err());
    }
    auto queued = enqueue(EntityKind::Event, key.unwrap());
    if (queued.is_err()) {
        return Result<bool, Error>::err(queued.unwrap_err());
    }
    return Result<bool, Error>::ok(true);
}

Result<bool, Error> MirrorRepository::remove(const DeleteEntity& del) {
    auto stored = stored_revision(del.kind, del.external_id);
    if (stored.is_err()) {
        return Result<bool, Error>::err(stored.unwrap_err());
    }
    if (!should_apply_delete(stored.unwrap(), del.updated)) {
        return Result<bool, Error>::ok(false);
    }

    // A delete for an unknown entity leaves a tombstone row behind so that an
    // older upsert arriving later cannot bring it back.
    std::string sql = std::string("INSERT INTO ") + table_of(del.kind) +
        " (external_id, updated, deleted) VALUES (?, ?, 1)"
        " ON CONFLICT(external_id) DO UPDATE SET updated = excluded.updated, deleted = 1;";
    auto stmt_result = db_.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<bool, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, del.external_id).bind_int64(2, del.updated.millis());
    auto run_result = stmt.run();
    if (run_result.is_err()) {
        return Result<bool, Error>::err(run_result.unwrap_err());
    }

    auto key = key_of(del.kind, del.external_id);
    if (key.is_err()) {
        return Result<bool, Error>::err(key.unwrap_err());
    }
    auto queued = enqueue(del.kind, key.unwrap());
    if (queued.is_err()) {
        return Result<bool, Error>::err(queued.unwrap_err());
    }
    if (del.kind == EntityKind::Series) {
        queued = enqueue_events_of_series(del.external_id);
        if (queued.is_err()) {
            return Result<bool, Error>::err(queued.unwrap_err());
        }
    }
    return Result<bool, Error>::ok(true);
}

Result<Key, Error> MirrorRepository::key_of(EntityKind kind, const std::string& external_id) {
    auto stmt_result = db_.prepare(std::string("SELECT key FROM ") + table_of(kind) +
                                   " WHERE external_id = ?;");
    if (stmt_result.is_err()) {
        return Result<Key, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, external_id);
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<Key, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<Key, Error>::err(Error::not_found(
            std::string(entity_kind_name(kind)) + " " + external_id + " vanished during apply"));
    }
    return Result<Key, Error>::ok(stmt.column_int64(0));
}

Result<void, Error> MirrorRepository::replace_event_details(Key key, const EventData& event) {
    for (const char* table : {"event_creators", "event_roles", "event_tracks"}) {
        auto stmt_result = db_.prepare(std::string("DELETE FROM ") + table + " WHERE event_key = ?;");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        stmt.bind_int64(1, key);
        auto run_result = stmt.run();
        if (run_result.is_err()) {
            return run_result;
        }
    }

    auto creators = db_.prepare(
        "INSERT INTO event_creators (event_key, position, name) VALUES (?, ?, ?);");
    if (creators.is_err()) {
        return Result<void, Error>::err(creators.unwrap_err());
    }
    auto creator_stmt = std::move(creators).unwrap();
    for (size_t i = 0; i < event.creators.size(); ++i) {
        creator_stmt.bind_int64(1, key)
            .bind_int(2, static_cast<int>(i))
            .bind_text(3, event.creators[i]);
        auto run_result = creator_stmt.run();
        if (run_result.is_err()) return run_result;
        auto reset_result = creator_stmt.reset();
        if (reset_result.is_err()) return reset_result;
    }

    auto roles = db_.prepare(
        "INSERT INTO event_roles (event_key, action, position, role) VALUES (?, ?, ?, ?);");
    if (roles.is_err()) {
        return Result<void, Error>::err(roles.unwrap_err());
    }
    auto role_stmt = std::move(roles).unwrap();
    auto insert_roles = [&](const char* action, const std::vector<std::string>& list) {
        for (size_t i = 0; i < list.size(); ++i) {
            role_stmt.bind_int64(1, key)
                .bind_text(2, action)
                .bind_int(3, static_cast<int>(i))
                .bind_text(4, list[i]);
            auto run_result = role_stmt.run();
            if (run_result.is_err()) return run_result;
            auto reset_result = role_stmt.reset();
            if (reset_result.is_err()) return reset_result;
        }
        return Result<void, Error>::ok();
    };
    auto read_result = insert_roles("read", event.acl.read_roles);
    if (read_result.is_err()) return read_result;
    auto write_result = insert_roles("write", event.acl.write_roles);
    if (write_result.is_err()) return write_result;

    auto tracks = db_.prepare(R"SQL(
        INSERT INTO event_tracks (event_key, position, uri, flavor, mimetype, width, height)
        VALUES (?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (tracks.is_err()) {
        return Result<void, Error>::err(tracks.unwrap_err());
    }
    auto track_stmt = std::move(tracks).unwrap();
    for (size_t i = 0; i < event.tracks.size(); ++i) {
        const auto& track = event.tracks[i];
        track_stmt.bind_int64(1, key)
            .bind_int(2, static_cast<int>(i))
            .bind_text(3, track.uri)
            .bind_text(4, track.flavor)
            .bind_optional_text(5, track.mimetype);
        if (track.resolution) {
            track_stmt.bind_int(6, track.resolution->first).bind_int(7, track.resolution->second);
        } else {
            track_stmt.bind_null(6).bind_null(7);
        }
        auto run_result = track_stmt.run();
        if (run_result.is_err()) return run_result;
        auto reset_result = track_stmt.reset();
        if (reset_result.is_err()) return reset_result;
    }

    return Result<void, Error>::ok();
}

// REPLACE gives a re-queued entity a fresh id, so a reader that already took
// the old row cannot acknowledge the newer change by deleting it.
Result<void, Error> MirrorRepository::enqueue(EntityKind kind, Key key) {
    auto stmt_result = db_.prepare(
        "INSERT OR REPLACE INTO search_index_queue (item_kind, item_key) VALUES (?, ?);");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, entity_kind_name(kind)).bind_int64(2, key);
    return stmt.run();
}

Result<void, Error> MirrorRepository::enqueue_events_of_series(const std::string& series_id) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT OR REPLACE INTO search_index_queue (item_kind, item_key)
        SELECT 'event', key FROM events WHERE part_of = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, series_id);
    return stmt.run();
}

// ============================================================================
// Reads
// ============================================================================

Series MirrorRepository::row_to_series(Statement& stmt) {
    return Series{
        .key = stmt.column_int64(0),
        .data = SeriesData{
            .external_id = stmt.column_text(1),
            .title = stmt.column_text(2),
            .description = stmt.column_optional_text(3),
            .updated = Timestamp(stmt.column_int64(4))
        },
        .deleted = stmt.column_int(5) != 0
    };
}

Event MirrorRepository::row_to_event(Statement& stmt) {
    Event event;
    event.key = stmt.column_int64(0);
    event.data.external_id = stmt.column_text(1);
    event.data.part_of = stmt.column_optional_text(2);
    event.data.title = stmt.column_text(3);
    event.data.description = stmt.column_optional_text(4);
    event.data.duration_ms = stmt.column_optional_int64(5);
    event.data.created = Timestamp(stmt.column_int64(6));
    event.data.thumbnail = stmt.column_optional_text(7);
    event.data.updated = Timestamp(stmt.column_int64(8));
    event.deleted = stmt.column_int(9) != 0;
    event.series_key = stmt.column_optional_int64(10);
    return event;
}

Result<std::optional<Series>, Error> MirrorRepository::series_by_key(Key key) {
    using R = Result<std::optional<Series>, Error>;
    auto stmt_result = db_.prepare(std::string("SELECT ") + SERIES_COLUMNS +
                                   " FROM series WHERE key = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, key);
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(row_to_series(stmt));
}

Result<std::optional<Series>, Error> MirrorRepository::series_by_external_id(const std::string& id) {
    using R = Result<std::optional<Series>, Error>;
    auto stmt_result = db_.prepare(std::string("SELECT ") + SERIES_COLUMNS +
                                   " FROM series WHERE external_id = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, id);
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(row_to_series(stmt));
}

Result<std::vector<Series>, Error> MirrorRepository::all_live_series() {
    std::vector<Series> out;
    auto result = db_.query(std::string("SELECT ") + SERIES_COLUMNS +
                            " FROM series WHERE deleted = 0 ORDER BY key;",
                            [&](Statement& stmt) { out.push_back(row_to_series(stmt)); });
    if (result.is_err()) {
        return Result<std::vector<Series>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<Series>, Error>::ok(std::move(out));
}

Result<std::optional<Event>, Error> MirrorRepository::event_by_key(Key key) {
    using R = Result<std::optional<Event>, Error>;
    auto events = load_events("e.key = ?", std::to_string(key));
    if (events.is_err()) {
        return R::err(events.unwrap_err());
    }
    auto& list = events.unwrap();
    if (list.empty()) {
        return R::ok(std::nullopt);
    }
    return R::ok(std::move(list.front()));
}

Result<std::optional<Event>, Error> MirrorRepository::event_by_external_id(const std::string& id) {
    using R = Result<std::optional<Event>, Error>;
    auto events = load_events("e.external_id = ?", id);
    if (events.is_err()) {
        return R::err(events.unwrap_err());
    }
    auto& list = events.unwrap();
    if (list.empty()) {
        return R::ok(std::nullopt);
    }
    return R::ok(std::move(list.front()));
}

Result<std::vector<Event>, Error> MirrorRepository::live_events_of_series(const std::string& series_id) {
    return load_events("e.part_of = ? AND e.deleted = 0", series_id);
}

Result<std::vector<Event>, Error> MirrorRepository::all_live_events() {
    return load_events("e.deleted = 0", std::nullopt);
}

Result<std::vector<Event>, Error> MirrorRepository::load_events(
    const std::string& where,
    const std::optional<std::string>& arg
) {
    using R = Result<std::vector<Event>, Error>;
    auto stmt_result = db_.prepare(std::string(EVENT_SELECT) + " WHERE " + where +
                                   " ORDER BY e.created, e.key;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    if (arg) {
        stmt.bind_text(1, *arg);
    }

    std::vector<Event> events;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return R::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        events.push_back(row_to_event(stmt));
    }

    for (auto& event : events) {
        auto details = load_event_details(event);
        if (details.is_err()) {
            return R::err(details.unwrap_err());
        }
    }
    return R::ok(std::move(events));
}

Result<void, Error> MirrorRepository::load_event_details(Event& event) {
    const std::string key = std::to_string(event.key);

    auto result = db_.query(
        "SELECT name FROM event_creators WHERE event_key = " + key + " ORDER BY position;",
        [&](Statement& stmt) { event.data.creators.push_back(stmt.column_text(0)); });
    if (result.is_err()) return result;

    result = db_.query(
        "SELECT action, role FROM event_roles WHERE event_key = " + key +
        " ORDER BY action, position;",
        [&](Statement& stmt) {
            auto& list = stmt.column_text(0) == "read" ? event.data.acl.read_roles
                                                       : event.data.acl.write_roles;
            list.push_back(stmt.column_text(1));
        });
    if (result.is_err()) return result;

    return db_.query(
        "SELECT uri, flavor, mimetype, width, height FROM event_tracks WHERE event_key = " + key +
        " ORDER BY position;",
        [&](Statement& stmt) {
            Track track{
                .uri = stmt.column_text(0),
                .flavor = stmt.column_text(1),
                .mimetype = stmt.column_optional_text(2),
                .resolution = std::nullopt
            };
            if (!stmt.column_is_null(3) && !stmt.column_is_null(4)) {
                track.resolution = std::make_pair(stmt.column_int(3), stmt.column_int(4));
            }
            event.data.tracks.push_back(std::move(track));
        });
}

} // namespace atrium::storage
