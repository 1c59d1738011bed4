#pragma once

#include "storage/database.hpp"
#include "core/mirror.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace atrium::storage {

/**
 * Counts reported after applying a harvest batch.
 */
struct ApplyStats {
    int applied{0};
    int skipped{0};  // stale or duplicate records

    bool operator==(const ApplyStats&) const = default;
};

/**
 * MirrorRepository - Local mirror of series and events.
 *
 * Every write goes through reconciliation: a record is applied only if its
 * revision wins against the stored one, so harvest batches can be replayed
 * any number of times. Each applied change also enqueues the affected
 * entities into search_index_queue within the caller's transaction.
 */
class MirrorRepository {
public:
    explicit MirrorRepository(Database& db) : db_(db) {}

    /**
     * Apply a whole harvest batch atomically.
     */
    [[nodiscard]] Result<ApplyStats, Error> apply_batch(const std::vector<ChangeRecord>& records);

    /**
     * Apply a single record. Returns false if the record lost reconciliation.
     * Must run inside a transaction.
     */
    [[nodiscard]] Result<bool, Error> apply(const ChangeRecord& record);

    // Reads. Tombstoned entities are returned with `deleted` set.
    [[nodiscard]] Result<std::optional<Series>, Error> series_by_key(Key key);
    [[nodiscard]] Result<std::optional<Series>, Error> series_by_external_id(const std::string& id);
    [[nodiscard]] Result<std::optional<Event>, Error> event_by_key(Key key);
    [[nodiscard]] Result<std::optional<Event>, Error> event_by_external_id(const std::string& id);

    /**
     * Live events whose part_of names the given series, oldest first.
     */
    [[nodiscard]] Result<std::vector<Event>, Error> live_events_of_series(const std::string& series_id);

    [[nodiscard]] Result<std::vector<Event>, Error> all_live_events();
    [[nodiscard]] Result<std::vector<Series>, Error> all_live_series();

    /**
     * Stored revision of an entity, if any row exists for it.
     */
    [[nodiscard]] Result<std::optional<StoredRevision>, Error> stored_revision(
        EntityKind kind, const std::string& external_id);

private:
    Database& db_;

    [[nodiscard]] Result<bool, Error> upsert_series(const SeriesData& series);
    [[nodiscard]] Result<bool, Error> upsert_event(const EventData& event);
    [[nodiscard]] Result<bool, Error> remove(const DeleteEntity& del);

    [[nodiscard]] Result<Key, Error> key_of(EntityKind kind, const std::string& external_id);
    [[nodiscard]] Result<void, Error> replace_event_details(Key key, const EventData& event);
    [[nodiscard]] Result<void, Error> enqueue(EntityKind kind, Key key);
    [[nodiscard]] Result<void, Error> enqueue_events_of_series(const std::string& series_id);

    [[nodiscard]] Result<std::vector<Event>, Error> load_events(const std::string& where,
                                                                const std::optional<std::string>& arg);
    [[nodiscard]] Result<void, Error> load_event_details(Event& event);

    [[nodiscard]] Series row_to_series(Statement& stmt);
    [[nodiscard]] Event row_to_event(Statement& stmt);
};

} // namespace atrium::storage
