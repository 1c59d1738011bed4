#pragma once

#include "core/backoff.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "search/search_backend.hpp"
#include "storage/database.hpp"
#include "storage/index_queue_repository.hpp"
#include "storage/mirror_repository.hpp"

#include <optional>
#include <random>

namespace atrium::search {

struct IndexerConfig {
    int batch_size = 200;
    BackoffConfig backoff;
};

/**
 * Outcome of one indexer pass.
 */
struct IndexRun {
    int upserted{0};
    int removed{0};
    bool deferred{false};  // skipped because the backoff window is still open

    bool operator==(const IndexRun&) const = default;
};

/**
 * Indexer - Drains search_index_queue into a SearchBackend.
 *
 * Queue rows are deleted only after the backend accepted the documents. A
 * backend failure opens a backoff window owned by the indexer; the harvest
 * cursor never waits for it.
 */
class Indexer {
public:
    Indexer(storage::Database& db, SearchBackend& backend, IndexerConfig config = {});

    /**
     * Process queued items batch by batch until the queue is empty.
     * Inside the backoff window this returns a deferred run without work.
     */
    [[nodiscard]] Result<IndexRun> process_queue(Timestamp now = Timestamp::now());

    /**
     * Re-derive every document from the mirror. Ignores the backoff window.
     */
    [[nodiscard]] Result<IndexRun> rebuild();

    [[nodiscard]] bool in_backoff(Timestamp now) const;
    [[nodiscard]] int consecutive_failures() const { return failures_; }
    [[nodiscard]] std::optional<Timestamp> retry_at() const { return retry_at_; }

private:
    SearchBackend& backend_;
    IndexerConfig config_;
    storage::MirrorRepository mirror_;
    storage::IndexQueueRepository queue_;

    int failures_{0};
    std::optional<Timestamp> retry_at_;
    std::mt19937 rng_{std::random_device{}()};

    [[nodiscard]] Result<IndexRun> process_batch(const std::vector<storage::QueueItem>& items);
    [[nodiscard]] Result<SearchDocument> event_document(const Event& event);
    void record_failure(Timestamp now, const Error& error);
    void record_success();
};

} // namespace atrium::search
