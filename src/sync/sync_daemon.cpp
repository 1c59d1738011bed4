#include "sync/sync_daemon.hpp"

#include <QLoggingCategory>

#include <algorithm>
#include <deque>
#include <type_traits>

namespace atrium::sync {

Q_LOGGING_CATEGORY(atriumSyncLog, "atrium.sync")

namespace {
constexpr std::chrono::milliseconds kStopPollSlice{100};
}

SyncDaemon::SyncDaemon(storage::Database& db, HarvestSource& source, search::Indexer& indexer,
                       SyncConfig config)
    : mirror_(db)
    , status_(db)
    , source_(source)
    , indexer_(indexer)
    , config_(std::move(config)) {}

void SyncDaemon::request_stop() noexcept {
    stop_flag_.store(true);
    wait_cv_.notify_all();
}

void SyncDaemon::feed(const SyncEvent& event, std::vector<SyncEffect>& queue) {
    std::uniform_real_distribution<double> jitter(0.0, 1.0);
    const auto before = context_.state;
    auto transition = step(context_, event, config_, jitter(rng_));
    context_ = std::move(transition.context);
    if (context_.state != before) {
        qCDebug(atriumSyncLog) << "State" << state_name(before).data() << "->"
                               << state_name(context_.state).data();
    }
    queue.insert(queue.end(), transition.effects.begin(), transition.effects.end());
}

void SyncDaemon::deliver_stop_if_requested(std::vector<SyncEffect>& queue) {
    if (stop_delivered_ || !stop_flag_.load()) {
        return;
    }
    stop_delivered_ = true;
    qCInfo(atriumSyncLog) << "Stop requested in state" << state_name(context_.state).data();
    feed(events::Stop{}, queue);
}

Result<SyncState> SyncDaemon::run(RunMode mode) {
    auto cursor = status_.load_cursor();
    if (cursor.is_err()) {
        return Result<SyncState>::err(cursor.unwrap_err());
    }

    context_ = SyncContext{};
    context_.cursor = std::move(cursor).unwrap();
    batch_.reset();
    qCInfo(atriumSyncLog) << "Starting sync from cursor"
                          << (context_.cursor.is_initial()
                                  ? QStringLiteral("<beginning>")
                                  : QString::fromStdString(context_.cursor.token));

    std::vector<SyncEffect> pending;
    deliver_stop_if_requested(pending);
    feed(events::Tick{}, pending);

    std::deque<SyncEffect> queue(pending.begin(), pending.end());
    // Every state but Stopped and Halted schedules a follow-up effect.
    while (!queue.empty()) {
        SyncEffect effect = std::move(queue.front());
        queue.pop_front();

        if (mode == RunMode::UntilCaughtUp) {
            if (const auto* wait = std::get_if<effects::Wait>(&effect);
                wait && wait->delay.count() > 0) {
                qCInfo(atriumSyncLog) << "Caught up, state" << state_name(context_.state).data();
                return Result<SyncState>::ok(context_.state);
            }
        }

        auto event = execute(effect);

        pending.clear();
        deliver_stop_if_requested(pending);
        if (event) {
            feed(*event, pending);
        }
        queue.insert(queue.end(), pending.begin(), pending.end());
    }

    qCInfo(atriumSyncLog) << "Sync loop ended in state" << state_name(context_.state).data();
    return Result<SyncState>::ok(context_.state);
}

std::optional<SyncEvent> SyncDaemon::execute(const SyncEffect& effect) {
    return std::visit([this](const auto& e) -> std::optional<SyncEvent> {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, effects::FetchBatch>) {
            auto result = source_.fetch(e.cursor);
            if (result.is_err()) {
                const auto& error = result.unwrap_err();
                if (error.kind != ErrorKind::Protocol) {
                    qCWarning(atriumSyncLog) << "Harvest failed:" << error.describe().c_str();
                }
                return events::FetchFailed{error};
            }
            batch_ = std::move(result).unwrap();
            qCDebug(atriumSyncLog) << "Fetched" << batch_->records.size() << "records";
            return events::Fetched{batch_->next_cursor, batch_->has_more};
        } else if constexpr (std::is_same_v<T, effects::ApplyBatch>) {
            if (!batch_) {
                return events::ApplyFailed{Error{ErrorKind::Storage, "No batch to apply"}};
            }
            auto stats = mirror_.apply_batch(batch_->records);
            batch_.reset();
            if (stats.is_err()) {
                qCWarning(atriumSyncLog) << "Applying batch failed:"
                                         << stats.unwrap_err().describe().c_str();
                return events::ApplyFailed{stats.unwrap_err()};
            }
            qCInfo(atriumSyncLog) << "Applied" << stats.unwrap().applied << "records, skipped"
                                  << stats.unwrap().skipped;
            return events::Applied{};
        } else if constexpr (std::is_same_v<T, effects::RunIndexer>) {
            auto run = indexer_.process_queue();
            if (run.is_err()) {
                return events::IndexFailed{run.unwrap_err()};
            }
            return events::Indexed{};
        } else if constexpr (std::is_same_v<T, effects::PersistCursor>) {
            auto saved = status_.save_cursor(e.cursor);
            if (saved.is_err()) {
                qCWarning(atriumSyncLog) << "Persisting cursor failed:"
                                         << saved.unwrap_err().describe().c_str();
                return events::PersistFailed{saved.unwrap_err()};
            }
            qCDebug(atriumSyncLog) << "Cursor advanced to" << e.cursor.token.c_str();
            return events::Persisted{};
        } else if constexpr (std::is_same_v<T, effects::Wait>) {
            if (context_.state == SyncState::Backoff) {
                qCWarning(atriumSyncLog) << "Retrying harvest in" << e.delay.count()
                                         << "ms, attempt" << context_.failed_attempts;
            }
            sleep_for(e.delay);
            return events::Tick{};
        } else if constexpr (std::is_same_v<T, effects::RaiseAlert>) {
            qCCritical(atriumSyncLog) << "ALERT: harvest halted until operator intervention:"
                                      << e.error.describe().c_str();
            return std::nullopt;
        }
    }, effect);
}

void SyncDaemon::sleep_for(std::chrono::milliseconds delay) {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    std::unique_lock lock(wait_mutex_);
    while (!stop_flag_.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        // Sliced so a flag set from a signal handler is noticed.
        const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now,
                                                                         kStopPollSlice);
        wait_cv_.wait_for(lock, slice, [this] { return stop_flag_.load(); });
    }
}

} // namespace atrium::sync
