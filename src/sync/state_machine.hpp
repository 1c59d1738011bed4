#pragma once

#include "core/backoff.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace atrium::sync {

/**
 * SyncState - Where the sync loop is within a harvest cycle.
 *
 *   Idle -> Fetching -> Applying -> Indexing -> Committing -> Idle
 *
 * Any transient failure leads to Backoff, which returns to Fetching from the
 * persisted cursor. A protocol error halts the source until an operator
 * steps in.
 */
enum class SyncState {
    Idle,
    Fetching,
    Applying,
    Indexing,
    Committing,
    Backoff,
    Halted,
    Stopped
};

[[nodiscard]] constexpr std::string_view state_name(SyncState state) {
    switch (state) {
        case SyncState::Idle: return "idle";
        case SyncState::Fetching: return "fetching";
        case SyncState::Applying: return "applying";
        case SyncState::Indexing: return "indexing";
        case SyncState::Committing: return "committing";
        case SyncState::Backoff: return "backoff";
        case SyncState::Halted: return "halted";
        case SyncState::Stopped: return "stopped";
    }
    return "unknown";
}

struct SyncConfig {
    std::chrono::milliseconds poll_interval{30000};
    BackoffConfig backoff;
};

// ============================================================================
// Events fed into the machine
// ============================================================================

namespace events {

struct Tick {};

struct Fetched {
    HarvestCursor next_cursor;
    bool has_more{false};
};

struct FetchFailed {
    Error error;
};

struct Applied {};

struct ApplyFailed {
    Error error;
};

struct Indexed {};

/** The indexer failed; it retries on its own, the cycle carries on. */
struct IndexFailed {
    Error error;
};

struct Persisted {};

struct PersistFailed {
    Error error;
};

struct Stop {};

} // namespace events

using SyncEvent = std::variant<
    events::Tick,
    events::Fetched,
    events::FetchFailed,
    events::Applied,
    events::ApplyFailed,
    events::Indexed,
    events::IndexFailed,
    events::Persisted,
    events::PersistFailed,
    events::Stop
>;

// ============================================================================
// Effects the loop has to carry out
// ============================================================================

namespace effects {

struct FetchBatch {
    HarvestCursor cursor;
    bool operator==(const FetchBatch&) const = default;
};

struct ApplyBatch {
    bool operator==(const ApplyBatch&) const = default;
};

struct RunIndexer {
    bool operator==(const RunIndexer&) const = default;
};

struct PersistCursor {
    HarvestCursor cursor;
    bool operator==(const PersistCursor&) const = default;
};

/** Sleep, then feed a Tick. A zero delay continues right away. */
struct Wait {
    std::chrono::milliseconds delay{0};
    bool operator==(const Wait&) const = default;
};

struct RaiseAlert {
    Error error;
    bool operator==(const RaiseAlert&) const = default;
};

} // namespace effects

using SyncEffect = std::variant<
    effects::FetchBatch,
    effects::ApplyBatch,
    effects::RunIndexer,
    effects::PersistCursor,
    effects::Wait,
    effects::RaiseAlert
>;

/**
 * SyncContext - Everything the loop knows, passed explicitly through every
 * transition so independent sources never share state.
 */
struct SyncContext {
    SyncState state{SyncState::Idle};
    HarvestCursor cursor;                       // last persisted cursor
    std::optional<HarvestCursor> pending_cursor;  // cursor of the batch in flight
    bool has_more{false};
    int failed_attempts{0};
    bool stop_requested{false};
    std::optional<Error> halt_reason;
};

struct Transition {
    SyncContext context;
    std::vector<SyncEffect> effects;
};

/**
 * Pure transition function.
 *
 * `jitter_sample` in [0, 1) feeds the backoff jitter. Events that make no
 * sense in the current state leave it unchanged and produce no effects.
 */
[[nodiscard]] Transition step(const SyncContext& context, const SyncEvent& event,
                              const SyncConfig& config, double jitter_sample = 0.5);

} // namespace atrium::sync
