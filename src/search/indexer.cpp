#include "search/indexer.hpp"

#include <QLoggingCategory>

namespace atrium::search {

Q_LOGGING_CATEGORY(atriumSearchLog, "atrium.search")

Indexer::Indexer(storage::Database& db, SearchBackend& backend, IndexerConfig config)
    : backend_(backend)
    , config_(config)
    , mirror_(db)
    , queue_(db) {}

bool Indexer::in_backoff(Timestamp now) const {
    return retry_at_ && now < *retry_at_;
}

void Indexer::record_failure(Timestamp now, const Error& error) {
    ++failures_;
    std::uniform_real_distribution<double> jitter(0.0, 1.0);
    const auto delay = backoff_delay(config_.backoff, failures_, jitter(rng_));
    retry_at_ = now + delay;
    qCWarning(atriumSearchLog) << "Indexing failed, attempt" << failures_ << "- retrying in"
                               << delay.count() << "ms:" << error.describe().c_str();
}

void Indexer::record_success() {
    if (failures_ > 0) {
        qCInfo(atriumSearchLog) << "Search backend recovered after" << failures_ << "failures";
    }
    failures_ = 0;
    retry_at_.reset();
}

Result<SearchDocument> Indexer::event_document(const Event& event) {
    std::optional<Series> series;
    if (event.series_key) {
        auto found = mirror_.series_by_key(*event.series_key);
        if (found.is_err()) return Result<SearchDocument>::err(found.unwrap_err());
        series = std::move(found).unwrap();
    }
    return Result<SearchDocument>::ok(make_document(event, series));
}

Result<IndexRun> Indexer::process_batch(const std::vector<storage::QueueItem>& items) {
    std::vector<SearchDocument> upserts;
    std::vector<std::string> removals;

    for (const auto& item : items) {
        if (item.kind == EntityKind::Series) {
            auto series = mirror_.series_by_key(item.key);
            if (series.is_err()) return Result<IndexRun>::err(series.unwrap_err());
            if (!series.unwrap()) continue;
            const auto& s = *series.unwrap();
            if (s.deleted) {
                removals.push_back(document_id(EntityKind::Series, s.data.external_id));
            } else {
                upserts.push_back(make_document(s));
            }
        } else {
            auto event = mirror_.event_by_key(item.key);
            if (event.is_err()) return Result<IndexRun>::err(event.unwrap_err());
            if (!event.unwrap()) continue;
            const auto& e = *event.unwrap();
            if (e.deleted) {
                removals.push_back(document_id(EntityKind::Event, e.data.external_id));
            } else {
                auto doc = event_document(e);
                if (doc.is_err()) return Result<IndexRun>::err(doc.unwrap_err());
                upserts.push_back(std::move(doc).unwrap());
            }
        }
    }

    if (!upserts.empty()) {
        auto result = backend_.upsert(upserts);
        if (result.is_err()) return Result<IndexRun>::err(result.unwrap_err());
    }
    if (!removals.empty()) {
        auto result = backend_.remove(removals);
        if (result.is_err()) return Result<IndexRun>::err(result.unwrap_err());
    }

    auto acked = queue_.remove(items);
    if (acked.is_err()) return Result<IndexRun>::err(acked.unwrap_err());

    return Result<IndexRun>::ok(IndexRun{
        .upserted = static_cast<int>(upserts.size()),
        .removed = static_cast<int>(removals.size())
    });
}

Result<IndexRun> Indexer::process_queue(Timestamp now) {
    if (in_backoff(now)) {
        return Result<IndexRun>::ok(IndexRun{.deferred = true});
    }

    IndexRun total;
    while (true) {
        auto items = queue_.peek(config_.batch_size);
        if (items.is_err()) return Result<IndexRun>::err(items.unwrap_err());
        if (items.unwrap().empty()) break;

        auto run = process_batch(items.unwrap());
        if (run.is_err()) {
            auto error = run.unwrap_err();
            if (error.kind == ErrorKind::Indexing) {
                record_failure(now, error);
            }
            return Result<IndexRun>::err(std::move(error));
        }
        total.upserted += run.unwrap().upserted;
        total.removed += run.unwrap().removed;
    }

    record_success();
    if (total.upserted > 0 || total.removed > 0) {
        qCDebug(atriumSearchLog) << "Indexed" << total.upserted << "documents, removed"
                                 << total.removed;
    }
    return Result<IndexRun>::ok(total);
}

Result<IndexRun> Indexer::rebuild() {
    qCInfo(atriumSearchLog) << "Rebuilding search index from the mirror";

    auto mark = queue_.high_water_mark();
    if (mark.is_err()) return Result<IndexRun>::err(mark.unwrap_err());

    auto cleared = backend_.clear();
    if (cleared.is_err()) return Result<IndexRun>::err(cleared.unwrap_err());

    IndexRun total;
    auto flush = [&](std::vector<SearchDocument>& docs) -> Result<void> {
        if (docs.empty()) return Result<void>::ok();
        auto result = backend_.upsert(docs);
        if (result.is_err()) return result;
        total.upserted += static_cast<int>(docs.size());
        docs.clear();
        return Result<void>::ok();
    };

    std::vector<SearchDocument> pending;
    auto series = mirror_.all_live_series();
    if (series.is_err()) return Result<IndexRun>::err(series.unwrap_err());
    for (const auto& s : series.unwrap()) {
        pending.push_back(make_document(s));
        if (static_cast<int>(pending.size()) >= config_.batch_size) {
            auto flushed = flush(pending);
            if (flushed.is_err()) return Result<IndexRun>::err(flushed.unwrap_err());
        }
    }

    auto events = mirror_.all_live_events();
    if (events.is_err()) return Result<IndexRun>::err(events.unwrap_err());
    for (const auto& e : events.unwrap()) {
        auto doc = event_document(e);
        if (doc.is_err()) return Result<IndexRun>::err(doc.unwrap_err());
        pending.push_back(std::move(doc).unwrap());
        if (static_cast<int>(pending.size()) >= config_.batch_size) {
            auto flushed = flush(pending);
            if (flushed.is_err()) return Result<IndexRun>::err(flushed.unwrap_err());
        }
    }
    auto flushed = flush(pending);
    if (flushed.is_err()) return Result<IndexRun>::err(flushed.unwrap_err());

    auto dropped = queue_.remove_through(mark.unwrap());
    if (dropped.is_err()) return Result<IndexRun>::err(dropped.unwrap_err());

    record_success();
    qCInfo(atriumSearchLog) << "Search index rebuilt with" << total.upserted << "documents";
    return Result<IndexRun>::ok(total);
}

} // namespace atrium::search
