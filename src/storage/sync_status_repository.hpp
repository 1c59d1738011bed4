#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

namespace atrium::storage {

/**
 * SyncStatusRepository - The persisted harvest cursor.
 *
 * The cursor is written in its own transaction, strictly after the batch it
 * covers has been committed to the mirror.
 */
class SyncStatusRepository {
public:
    explicit SyncStatusRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<HarvestCursor, Error> load_cursor();

    [[nodiscard]] Result<void, Error> save_cursor(const HarvestCursor& cursor);

    /**
     * When the cursor was last advanced (epoch if never).
     */
    [[nodiscard]] Result<Timestamp, Error> last_advanced();

private:
    Database& db_;
};

} // namespace atrium::storage
