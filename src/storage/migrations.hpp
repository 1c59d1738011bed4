#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace atrium::storage {

/**
 * One forward-only schema step. Applied versions are recorded in
 * `schema_migrations`.
 */
struct Migration {
    int version;
    std::string name;
    std::string sql;
};

/**
 * Schema history, ascending by version.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "mirror",
        .sql = R"SQL(
            -- Harvest progress. Exactly one row.
            CREATE TABLE IF NOT EXISTS sync_status (
                id INTEGER PRIMARY KEY CHECK (id = 1),
                harvest_cursor TEXT NOT NULL DEFAULT '',
                updated_at INTEGER NOT NULL DEFAULT 0
            );
            INSERT OR IGNORE INTO sync_status (id, harvest_cursor, updated_at) VALUES (1, '', 0);

            CREATE TABLE IF NOT EXISTS series (
                key INTEGER PRIMARY KEY AUTOINCREMENT,
                external_id TEXT NOT NULL UNIQUE,
                title TEXT NOT NULL DEFAULT '',
                description TEXT,
                updated INTEGER NOT NULL,
                deleted INTEGER NOT NULL DEFAULT 0
            );

            CREATE TABLE IF NOT EXISTS events (
                key INTEGER PRIMARY KEY AUTOINCREMENT,
                external_id TEXT NOT NULL UNIQUE,
                part_of TEXT,
                title TEXT NOT NULL DEFAULT '',
                description TEXT,
                duration_ms INTEGER,
                created INTEGER NOT NULL DEFAULT 0,
                thumbnail TEXT,
                updated INTEGER NOT NULL,
                deleted INTEGER NOT NULL DEFAULT 0
            );
            CREATE INDEX IF NOT EXISTS idx_events_part_of ON events(part_of);

            CREATE TABLE IF NOT EXISTS event_creators (
                event_key INTEGER NOT NULL REFERENCES events(key) ON DELETE CASCADE,
                position INTEGER NOT NULL,
                name TEXT NOT NULL,
                PRIMARY KEY (event_key, position)
            );

            -- action is 'read' or 'write'
            CREATE TABLE IF NOT EXISTS event_roles (
                event_key INTEGER NOT NULL REFERENCES events(key) ON DELETE CASCADE,
                action TEXT NOT NULL CHECK (action IN ('read', 'write')),
                position INTEGER NOT NULL,
                role TEXT NOT NULL,
                PRIMARY KEY (event_key, action, position)
            );
            CREATE INDEX IF NOT EXISTS idx_event_roles_role ON event_roles(role);

            CREATE TABLE IF NOT EXISTS event_tracks (
                event_key INTEGER NOT NULL REFERENCES events(key) ON DELETE CASCADE,
                position INTEGER NOT NULL,
                uri TEXT NOT NULL,
                flavor TEXT NOT NULL,
                mimetype TEXT,
                width INTEGER,
                height INTEGER,
                PRIMARY KEY (event_key, position)
            );

            -- Entities whose search document is out of date.
            CREATE TABLE IF NOT EXISTS search_index_queue (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                item_kind TEXT NOT NULL CHECK (item_kind IN ('series', 'event')),
                item_key INTEGER NOT NULL,
                UNIQUE (item_kind, item_key)
            );
        )SQL"
    },
    {
        .version = 2,
        .name = "realm_tree",
        .sql = R"SQL(
            CREATE TABLE IF NOT EXISTS realms (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                parent INTEGER REFERENCES realms(id) ON DELETE CASCADE,
                name TEXT NOT NULL,
                path_segment TEXT NOT NULL,
                full_path TEXT NOT NULL UNIQUE,
                child_order TEXT NOT NULL DEFAULT 'alphabetic:asc'
                    CHECK (child_order IN ('alphabetic:asc', 'alphabetic:desc', 'by_index')),
                idx INTEGER NOT NULL DEFAULT 0,
                CHECK ((id = 0) = (parent IS NULL))
            );
            CREATE UNIQUE INDEX IF NOT EXISTS idx_realms_sibling_segment
                ON realms(parent, path_segment);

            -- The root realm
            INSERT OR IGNORE INTO realms (id, parent, name, path_segment, full_path)
                VALUES (0, NULL, '', '', '');

            CREATE TABLE IF NOT EXISTS blocks (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                realm_id INTEGER NOT NULL REFERENCES realms(id) ON DELETE CASCADE,
                idx INTEGER NOT NULL,
                type TEXT NOT NULL CHECK (type IN ('title', 'text', 'series', 'video')),
                text_content TEXT,
                series_key INTEGER REFERENCES series(key) ON DELETE SET NULL,
                event_key INTEGER REFERENCES events(key) ON DELETE SET NULL,
                show_title INTEGER NOT NULL DEFAULT 1,
                show_metadata INTEGER NOT NULL DEFAULT 0,
                videolist_order TEXT NOT NULL DEFAULT 'new_to_old'
                    CHECK (videolist_order IN ('new_to_old', 'old_to_new')),
                UNIQUE (realm_id, idx)
            );
            CREATE INDEX IF NOT EXISTS idx_blocks_series ON blocks(series_key);
            CREATE INDEX IF NOT EXISTS idx_blocks_event ON blocks(event_key);
        )SQL"
    }
};

/**
 * MigrationRunner - Brings a database up to the schema this build expects.
 *
 * All pending migrations run in one write transaction, so two processes
 * opening the same file cannot both apply them. A database whose schema is
 * newer than this build is refused rather than written to.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> migrate();

    /** 0 for a fresh database. */
    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> apply(const Migration& m);
};

[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace atrium::storage
