#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace atrium {

/**
 * Acl - Paired read/write role sets attached to an event.
 */
struct Acl {
    std::vector<std::string> read_roles;
    std::vector<std::string> write_roles;

    bool operator==(const Acl&) const = default;
};

struct Track {
    std::string uri;
    std::string flavor;
    std::optional<std::string> mimetype;
    std::optional<std::pair<int, int>> resolution;

    bool operator==(const Track&) const = default;
};

/**
 * SeriesData / EventData - Entity payloads as delivered by the harvest
 * protocol, keyed by the external system's stable id.
 */
struct SeriesData {
    std::string external_id;
    std::string title;
    std::optional<std::string> description;
    Timestamp updated;

    bool operator==(const SeriesData&) const = default;
};

struct EventData {
    std::string external_id;
    std::optional<std::string> part_of;  // external id of the owning series
    std::string title;
    std::optional<std::string> description;
    std::optional<int64_t> duration_ms;
    Timestamp created;
    std::vector<std::string> creators;
    std::optional<std::string> thumbnail;
    std::vector<Track> tracks;
    Acl acl;
    Timestamp updated;

    bool operator==(const EventData&) const = default;
};

/**
 * Series / Event - Mirrored entities as stored locally.
 *
 * `updated` is the revision marker. A tombstoned entity keeps its row so that
 * block references resolve to a "deleted" marker instead of dangling.
 */
struct Series {
    Key key{0};
    SeriesData data;
    bool deleted{false};

    bool operator==(const Series&) const = default;
};

struct Event {
    Key key{0};
    EventData data;
    std::optional<Key> series_key;  // resolved from data.part_of, if mirrored
    bool deleted{false};

    bool operator==(const Event&) const = default;
};

enum class EntityKind {
    Series,
    Event
};

[[nodiscard]] constexpr std::string_view entity_kind_name(EntityKind kind) {
    switch (kind) {
        case EntityKind::Series: return "series";
        case EntityKind::Event: return "event";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<EntityKind> parse_entity_kind(std::string_view name) {
    if (name == "series") return EntityKind::Series;
    if (name == "event") return EntityKind::Event;
    return std::nullopt;
}

// ============================================================================
// Harvest change records
// ============================================================================

struct UpsertSeries {
    SeriesData series;
    bool operator==(const UpsertSeries&) const = default;
};

struct UpsertEvent {
    EventData event;
    bool operator==(const UpsertEvent&) const = default;
};

struct DeleteEntity {
    EntityKind kind;
    std::string external_id;
    Timestamp updated;
    bool operator==(const DeleteEntity&) const = default;
};

/**
 * ChangeRecord - One item of a harvest batch.
 */
using ChangeRecord = std::variant<UpsertSeries, UpsertEvent, DeleteEntity>;

[[nodiscard]] inline EntityKind record_kind(const ChangeRecord& record) {
    return std::visit([](const auto& r) -> EntityKind {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, UpsertSeries>) return EntityKind::Series;
        else if constexpr (std::is_same_v<T, UpsertEvent>) return EntityKind::Event;
        else if constexpr (std::is_same_v<T, DeleteEntity>) return r.kind;
    }, record);
}

[[nodiscard]] inline const std::string& record_external_id(const ChangeRecord& record) {
    return std::visit([](const auto& r) -> const std::string& {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, UpsertSeries>) return r.series.external_id;
        else if constexpr (std::is_same_v<T, UpsertEvent>) return r.event.external_id;
        else if constexpr (std::is_same_v<T, DeleteEntity>) return r.external_id;
    }, record);
}

[[nodiscard]] inline Timestamp record_revision(const ChangeRecord& record) {
    return std::visit([](const auto& r) -> Timestamp {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, UpsertSeries>) return r.series.updated;
        else if constexpr (std::is_same_v<T, UpsertEvent>) return r.event.updated;
        else if constexpr (std::is_same_v<T, DeleteEntity>) return r.updated;
    }, record);
}

/**
 * HarvestBatch - Response to one harvest fetch.
 */
struct HarvestBatch {
    std::vector<ChangeRecord> records;
    HarvestCursor next_cursor;
    bool has_more{false};
};

// ============================================================================
// Reconciliation rules
// ============================================================================

/**
 * Stored state of an entity relevant for reconciliation.
 */
struct StoredRevision {
    Timestamp updated;
    bool deleted{false};

    bool operator==(const StoredRevision&) const = default;
};

/**
 * Last-writer-wins by revision: an upsert applies to a new entity, or when it
 * is strictly newer than what is stored. Equal revisions are no-ops so that
 * re-applying a batch changes nothing.
 */
[[nodiscard]] constexpr bool should_apply_upsert(
    const std::optional<StoredRevision>& stored,
    Timestamp incoming
) noexcept {
    return !stored || incoming > stored->updated;
}

/**
 * A delete tombstones a live entity unless the stored revision is newer than
 * the deletion. Unknown entities get a tombstone row as well. On an existing
 * tombstone only a strictly newer delete applies, raising its revision.
 */
[[nodiscard]] constexpr bool should_apply_delete(
    const std::optional<StoredRevision>& stored,
    Timestamp incoming
) noexcept {
    if (!stored) return true;
    if (stored->deleted) return incoming > stored->updated;
    return incoming >= stored->updated;
}

} // namespace atrium
