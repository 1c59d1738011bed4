#pragma once

#include "search/search_backend.hpp"
#include "storage/database.hpp"

#include <string>

namespace atrium::search {

/**
 * FtsIndex - SearchBackend on an SQLite FTS5 table.
 *
 * Lives in its own database file so it can be wiped and rebuilt without
 * touching the mirror. Every storage failure is reported as
 * ErrorKind::Indexing.
 */
class FtsIndex : public SearchBackend {
public:
    [[nodiscard]] static Result<FtsIndex> open(const std::string& path, int busy_timeout_ms = 5000);
    [[nodiscard]] static Result<FtsIndex> open_memory();

    FtsIndex(FtsIndex&&) noexcept = default;
    FtsIndex& operator=(FtsIndex&&) noexcept = default;

    [[nodiscard]] Result<void> upsert(const std::vector<SearchDocument>& documents) override;
    [[nodiscard]] Result<void> remove(const std::vector<std::string>& doc_ids) override;
    [[nodiscard]] Result<void> clear() override;
    [[nodiscard]] Result<std::vector<SearchHit>> search(const std::string& text,
                                                        int limit, int offset) override;
    [[nodiscard]] Result<int64_t> document_count() override;

private:
    explicit FtsIndex(storage::Database db) : db_(std::move(db)) {}

    [[nodiscard]] Result<void> ensure_schema();
    [[nodiscard]] Result<void> remove_one(const std::string& doc_id);
    [[nodiscard]] Result<void> insert_one(const SearchDocument& doc);

    storage::Database db_;
};

} // namespace atrium::search
