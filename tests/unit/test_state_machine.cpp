#include <catch2/catch_test_macros.hpp>
#include "sync/state_machine.hpp"

using namespace atrium;
using namespace atrium::sync;
using namespace std::chrono_literals;

namespace {

SyncConfig test_config() {
    SyncConfig config;
    config.poll_interval = 30000ms;
    config.backoff = BackoffConfig{.initial_delay = 1000ms, .max_delay = 8000ms,
                                   .multiplier = 2.0, .jitter_factor = 0.0};
    return config;
}

SyncContext in_state(SyncState state, std::string cursor = "100") {
    SyncContext context;
    context.state = state;
    context.cursor = HarvestCursor{std::move(cursor)};
    return context;
}

} // namespace

TEST_CASE("A full cycle fetches, applies, indexes and then persists", "[sync][state]") {
    const auto config = test_config();
    auto context = in_state(SyncState::Idle);

    auto t = step(context, events::Tick{}, config);
    REQUIRE(t.context.state == SyncState::Fetching);
    REQUIRE(t.effects == std::vector<SyncEffect>{effects::FetchBatch{HarvestCursor{"100"}}});

    t = step(t.context, events::Fetched{HarvestCursor{"200"}, false}, config);
    REQUIRE(t.context.state == SyncState::Applying);
    REQUIRE(t.context.cursor.token == "100");
    REQUIRE(t.effects == std::vector<SyncEffect>{effects::ApplyBatch{}});

    t = step(t.context, events::Applied{}, config);
    REQUIRE(t.context.state == SyncState::Indexing);
    REQUIRE(t.effects == std::vector<SyncEffect>{effects::RunIndexer{}});

    t = step(t.context, events::Indexed{}, config);
    REQUIRE(t.context.state == SyncState::Committing);
    REQUIRE(t.context.cursor.token == "100");
    REQUIRE(t.effects == std::vector<SyncEffect>{effects::PersistCursor{HarvestCursor{"200"}}});

    t = step(t.context, events::Persisted{}, config);
    REQUIRE(t.context.state == SyncState::Idle);
    REQUIRE(t.context.cursor.token == "200");
    REQUIRE_FALSE(t.context.pending_cursor.has_value());
    REQUIRE(t.effects == std::vector<SyncEffect>{effects::Wait{30000ms}});
}

TEST_CASE("has_more continues without waiting", "[sync][state]") {
    const auto config = test_config();
    auto context = in_state(SyncState::Committing);
    context.pending_cursor = HarvestCursor{"300"};
    context.has_more = true;

    auto t = step(context, events::Persisted{}, config);
    REQUIRE(t.context.state == SyncState::Idle);
    REQUIRE(t.effects == std::vector<SyncEffect>{effects::Wait{0ms}});
}

TEST_CASE("An indexing failure does not block cursor advancement", "[sync][state]") {
    const auto config = test_config();
    auto context = in_state(SyncState::Indexing);
    context.pending_cursor = HarvestCursor{"250"};

    auto t = step(context, events::IndexFailed{Error::indexing("backend down")}, config);
    REQUIRE(t.context.state == SyncState::Committing);
    REQUIRE(t.effects == std::vector<SyncEffect>{effects::PersistCursor{HarvestCursor{"250"}}});
}

TEST_CASE("Transient fetch failures back off exponentially", "[sync][state]") {
    const auto config = test_config();
    auto context = in_state(SyncState::Fetching);

    auto t = step(context, events::FetchFailed{Error::transient("timeout")}, config);
    REQUIRE(t.context.state == SyncState::Backoff);
    REQUIRE(t.context.failed_attempts == 1);
    REQUIRE(t.effects == std::vector<SyncEffect>{effects::Wait{1000ms}});

    t = step(t.context, events::Tick{}, config);
    REQUIRE(t.context.state == SyncState::Fetching);
    REQUIRE(t.effects == std::vector<SyncEffect>{effects::FetchBatch{HarvestCursor{"100"}}});

    t = step(t.context, events::FetchFailed{Error::transient("timeout")}, config);
    REQUIRE(t.effects == std::vector<SyncEffect>{effects::Wait{2000ms}});

    for (int i = 0; i < 5; ++i) {
        t = step(t.context, events::Tick{}, config);
        t = step(t.context, events::FetchFailed{Error::transient("timeout")}, config);
    }
    REQUIRE(t.effects == std::vector<SyncEffect>{effects::Wait{8000ms}});
}

TEST_CASE("A successful cycle resets the failure count", "[sync][state]") {
    const auto config = test_config();
    auto context = in_state(SyncState::Committing);
    context.pending_cursor = HarvestCursor{"400"};
    context.failed_attempts = 4;

    auto t = step(context, events::Persisted{}, config);
    REQUIRE(t.context.failed_attempts == 0);
}

TEST_CASE("A protocol error halts with an alert", "[sync][state]") {
    const auto config = test_config();
    const auto error = Error::protocol("field 'id' must be a string");

    auto t = step(in_state(SyncState::Fetching), events::FetchFailed{error}, config);
    REQUIRE(t.context.state == SyncState::Halted);
    REQUIRE(t.context.halt_reason == error);
    REQUIRE(t.effects == std::vector<SyncEffect>{effects::RaiseAlert{error}});

    // Halted ignores ticks until an operator restarts it.
    auto again = step(t.context, events::Tick{}, config);
    REQUIRE(again.context.state == SyncState::Halted);
    REQUIRE(again.effects.empty());
}

TEST_CASE("Apply and persist failures keep the old cursor", "[sync][state]") {
    const auto config = test_config();

    auto applying = in_state(SyncState::Applying);
    applying.pending_cursor = HarvestCursor{"500"};
    auto t = step(applying, events::ApplyFailed{Error::conflict("database is locked")}, config);
    REQUIRE(t.context.state == SyncState::Backoff);
    REQUIRE(t.context.cursor.token == "100");
    REQUIRE_FALSE(t.context.pending_cursor.has_value());

    auto committing = in_state(SyncState::Committing);
    committing.pending_cursor = HarvestCursor{"500"};
    t = step(committing, events::PersistFailed{Error{ErrorKind::Storage, "disk full"}}, config);
    REQUIRE(t.context.state == SyncState::Backoff);
    REQUIRE(t.context.cursor.token == "100");

    // Retrying starts from the persisted cursor.
    t = step(t.context, events::Tick{}, config);
    REQUIRE(t.effects == std::vector<SyncEffect>{effects::FetchBatch{HarvestCursor{"100"}}});
}

TEST_CASE("Stop waits for the batch in flight", "[sync][state]") {
    const auto config = test_config();
    auto context = in_state(SyncState::Applying);
    context.pending_cursor = HarvestCursor{"600"};

    auto t = step(context, events::Stop{}, config);
    REQUIRE(t.context.state == SyncState::Applying);
    REQUIRE(t.context.stop_requested);
    REQUIRE(t.effects.empty());

    t = step(t.context, events::Applied{}, config);
    t = step(t.context, events::Indexed{}, config);
    REQUIRE(t.effects == std::vector<SyncEffect>{effects::PersistCursor{HarvestCursor{"600"}}});

    t = step(t.context, events::Persisted{}, config);
    REQUIRE(t.context.state == SyncState::Stopped);
    REQUIRE(t.context.cursor.token == "600");
    REQUIRE(t.effects.empty());
}

TEST_CASE("Stop outside a batch is immediate", "[sync][state]") {
    const auto config = test_config();

    for (auto state : {SyncState::Idle, SyncState::Backoff, SyncState::Fetching,
                       SyncState::Halted}) {
        auto t = step(in_state(state), events::Stop{}, config);
        REQUIRE(t.context.state == SyncState::Stopped);
        REQUIRE(t.context.cursor.token == "100");
    }
}

TEST_CASE("Stopped ignores every event", "[sync][state]") {
    const auto config = test_config();
    auto t = step(in_state(SyncState::Stopped), events::Tick{}, config);
    REQUIRE(t.context.state == SyncState::Stopped);
    REQUIRE(t.effects.empty());
}

TEST_CASE("Out of place events are ignored", "[sync][state]") {
    const auto config = test_config();

    auto t = step(in_state(SyncState::Idle), events::Applied{}, config);
    REQUIRE(t.context.state == SyncState::Idle);
    REQUIRE(t.effects.empty());

    t = step(in_state(SyncState::Applying), events::Tick{}, config);
    REQUIRE(t.context.state == SyncState::Applying);
    REQUIRE(t.effects.empty());
}
