#include "sync/state_machine.hpp"

#include <type_traits>

namespace atrium::sync {

namespace {

Transition stay(const SyncContext& context) {
    return Transition{context, {}};
}

Transition enter_backoff(SyncContext next, const SyncConfig& config, double jitter_sample) {
    next.state = SyncState::Backoff;
    next.pending_cursor.reset();
    next.failed_attempts += 1;
    const auto delay = backoff_delay(config.backoff, next.failed_attempts, jitter_sample);
    return Transition{std::move(next), {effects::Wait{delay}}};
}

Transition halt(SyncContext next, const Error& error) {
    next.state = SyncState::Halted;
    next.pending_cursor.reset();
    next.halt_reason = error;
    return Transition{std::move(next), {effects::RaiseAlert{error}}};
}

Transition on_stop(const SyncContext& context) {
    SyncContext next = context;
    switch (context.state) {
        case SyncState::Applying:
        case SyncState::Indexing:
        case SyncState::Committing:
            // Finish the batch and persist its cursor first.
            next.stop_requested = true;
            return Transition{std::move(next), {}};
        case SyncState::Fetching:
        case SyncState::Idle:
        case SyncState::Backoff:
        case SyncState::Halted:
            next.state = SyncState::Stopped;
            next.pending_cursor.reset();
            return Transition{std::move(next), {}};
        case SyncState::Stopped:
            break;
    }
    return stay(context);
}

} // namespace

Transition step(const SyncContext& context, const SyncEvent& event,
                const SyncConfig& config, double jitter_sample) {
    if (context.state == SyncState::Stopped) {
        return stay(context);
    }

    return std::visit([&](const auto& ev) -> Transition {
        using T = std::decay_t<decltype(ev)>;
        SyncContext next = context;

        if constexpr (std::is_same_v<T, events::Stop>) {
            return on_stop(context);
        } else if constexpr (std::is_same_v<T, events::Tick>) {
            if (context.state != SyncState::Idle && context.state != SyncState::Backoff) {
                return stay(context);
            }
            next.state = SyncState::Fetching;
            return Transition{std::move(next), {effects::FetchBatch{context.cursor}}};
        } else if constexpr (std::is_same_v<T, events::Fetched>) {
            if (context.state != SyncState::Fetching) return stay(context);
            next.state = SyncState::Applying;
            next.pending_cursor = ev.next_cursor;
            next.has_more = ev.has_more;
            return Transition{std::move(next), {effects::ApplyBatch{}}};
        } else if constexpr (std::is_same_v<T, events::FetchFailed>) {
            if (context.state != SyncState::Fetching) return stay(context);
            if (ev.error.kind == ErrorKind::Protocol) {
                return halt(std::move(next), ev.error);
            }
            return enter_backoff(std::move(next), config, jitter_sample);
        } else if constexpr (std::is_same_v<T, events::Applied>) {
            if (context.state != SyncState::Applying) return stay(context);
            next.state = SyncState::Indexing;
            return Transition{std::move(next), {effects::RunIndexer{}}};
        } else if constexpr (std::is_same_v<T, events::ApplyFailed>) {
            if (context.state != SyncState::Applying) return stay(context);
            if (ev.error.kind == ErrorKind::Protocol) {
                return halt(std::move(next), ev.error);
            }
            // Nothing was committed; the batch is fetched again from the old cursor.
            if (context.stop_requested) {
                next.state = SyncState::Stopped;
                next.pending_cursor.reset();
                return Transition{std::move(next), {}};
            }
            return enter_backoff(std::move(next), config, jitter_sample);
        } else if constexpr (std::is_same_v<T, events::Indexed> ||
                             std::is_same_v<T, events::IndexFailed>) {
            if (context.state != SyncState::Indexing || !context.pending_cursor) {
                return stay(context);
            }
            next.state = SyncState::Committing;
            return Transition{std::move(next), {effects::PersistCursor{*context.pending_cursor}}};
        } else if constexpr (std::is_same_v<T, events::Persisted>) {
            if (context.state != SyncState::Committing || !context.pending_cursor) {
                return stay(context);
            }
            next.cursor = *context.pending_cursor;
            next.pending_cursor.reset();
            next.failed_attempts = 0;
            if (context.stop_requested) {
                next.state = SyncState::Stopped;
                return Transition{std::move(next), {}};
            }
            next.state = SyncState::Idle;
            const auto delay = context.has_more ? std::chrono::milliseconds{0}
                                                : config.poll_interval;
            return Transition{std::move(next), {effects::Wait{delay}}};
        } else if constexpr (std::is_same_v<T, events::PersistFailed>) {
            if (context.state != SyncState::Committing) return stay(context);
            if (context.stop_requested) {
                next.state = SyncState::Stopped;
                next.pending_cursor.reset();
                return Transition{std::move(next), {}};
            }
            return enter_backoff(std::move(next), config, jitter_sample);
        }
    }, event);
}

} // namespace atrium::sync
