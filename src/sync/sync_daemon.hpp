#pragma once

#include "core/result.hpp"
#include "search/indexer.hpp"
#include "storage/database.hpp"
#include "storage/mirror_repository.hpp"
#include "storage/sync_status_repository.hpp"
#include "sync/harvest.hpp"
#include "sync/state_machine.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <random>

namespace atrium::sync {

enum class RunMode {
    Forever,       // poll until stopped or halted
    UntilCaughtUp  // return at the first non-zero wait
};

/**
 * SyncDaemon - Drives the state machine against a harvest source, the
 * mirror and the search indexer.
 *
 * One logical worker: harvest, apply, index and cursor persistence run
 * strictly in sequence on the calling thread. request_stop() may be called
 * from any thread or from a signal handler; the current batch is applied
 * and its cursor persisted before run() returns.
 */
class SyncDaemon {
public:
    SyncDaemon(storage::Database& db, HarvestSource& source, search::Indexer& indexer,
               SyncConfig config);

    /**
     * Run the loop. Returns the final state (Stopped, Halted, or with
     * UntilCaughtUp also Idle or Backoff). Fails only if the persisted
     * cursor cannot be read.
     */
    [[nodiscard]] Result<SyncState> run(RunMode mode = RunMode::Forever);

    void request_stop() noexcept;

    /**
     * Async-signal-safe variant of request_stop(): only sets the flag, the
     * loop notices it within one sleep slice.
     */
    void signal_stop() noexcept { stop_flag_.store(true); }

    [[nodiscard]] const SyncContext& context() const { return context_; }

private:
    storage::MirrorRepository mirror_;
    storage::SyncStatusRepository status_;
    HarvestSource& source_;
    search::Indexer& indexer_;
    SyncConfig config_;

    SyncContext context_;
    std::optional<HarvestBatch> batch_;

    std::atomic<bool> stop_flag_{false};
    bool stop_delivered_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::mt19937 rng_{std::random_device{}()};

    void feed(const SyncEvent& event, std::vector<SyncEffect>& queue);
    [[nodiscard]] std::optional<SyncEvent> execute(const SyncEffect& effect);
    void sleep_for(std::chrono::milliseconds delay);
    void deliver_stop_if_requested(std::vector<SyncEffect>& queue);
};

} // namespace atrium::sync
