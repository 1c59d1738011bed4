#pragma once

#include "storage/database.hpp"
#include "core/mirror.hpp"
#include "core/result.hpp"
#include <vector>

namespace atrium::storage {

/**
 * QueueItem - An entity whose search document must be refreshed.
 */
struct QueueItem {
    int64_t id{0};
    EntityKind kind{EntityKind::Event};
    Key key{0};

    bool operator==(const QueueItem&) const = default;
};

/**
 * IndexQueueRepository - Access to search_index_queue.
 *
 * Rows are written by MirrorRepository in the same transaction as the change
 * they describe, and removed by the indexer only once the search backend has
 * accepted the corresponding documents.
 */
class IndexQueueRepository {
public:
    explicit IndexQueueRepository(Database& db) : db_(db) {}

    /**
     * Oldest `limit` queued items.
     */
    [[nodiscard]] Result<std::vector<QueueItem>, Error> peek(int limit);

    [[nodiscard]] Result<void, Error> remove(const std::vector<QueueItem>& items);

    [[nodiscard]] Result<void, Error> clear();

    /**
     * Highest queue id so far (0 if the queue was never used). A rebuild
     * reads the mirror after taking this mark and then drops everything up
     * to it, so changes queued meanwhile survive.
     */
    [[nodiscard]] Result<int64_t, Error> high_water_mark();

    [[nodiscard]] Result<void, Error> remove_through(int64_t id);

    [[nodiscard]] Result<int64_t, Error> size();

private:
    Database& db_;
};

} // namespace atrium::storage
