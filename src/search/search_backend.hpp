#pragma once

#include "core/result.hpp"
#include "core/search.hpp"

#include <string>
#include <vector>

namespace atrium::search {

/**
 * SearchBackend - Document store the indexer writes to.
 *
 * The index is eventually consistent with the mirror and carries no
 * transactional guarantee relative to it. Implementations report an
 * unavailable backend as ErrorKind::Indexing.
 */
class SearchBackend {
public:
    virtual ~SearchBackend() = default;

    /**
     * Insert or replace documents by doc_id.
     */
    [[nodiscard]] virtual Result<void> upsert(const std::vector<SearchDocument>& documents) = 0;

    /**
     * Remove documents by doc_id. Unknown ids are ignored.
     */
    [[nodiscard]] virtual Result<void> remove(const std::vector<std::string>& doc_ids) = 0;

    /**
     * Drop every document, in preparation of a rebuild.
     */
    [[nodiscard]] virtual Result<void> clear() = 0;

    /**
     * Ranked matches for free text, best first, without access filtering.
     */
    [[nodiscard]] virtual Result<std::vector<SearchHit>> search(const std::string& text,
                                                                int limit, int offset) = 0;

    [[nodiscard]] virtual Result<int64_t> document_count() = 0;
};

} // namespace atrium::search
