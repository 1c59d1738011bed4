#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "storage/mirror_repository.hpp"

#include "support/test_data.hpp"

#include <algorithm>
#include <map>

using namespace atrium;
using namespace atrium::storage;

namespace {

struct Op {
    int type = 0;      // 0/1 upsert series/event, 2/3 delete series/event
    int id = 0;
    int64_t revision = 0;
};

EntityKind kind_of(const Op& op) {
    return (op.type % 2 == 0) ? EntityKind::Series : EntityKind::Event;
}

std::string id_of(const Op& op) {
    return (kind_of(op) == EntityKind::Series ? "s" : "e") + std::to_string(op.id);
}

ChangeRecord to_record(const Op& op) {
    switch (op.type) {
        case 0: return test::upsert(test::series_data(id_of(op), op.revision));
        case 1: return test::upsert(test::event_data(id_of(op), op.revision,
                                                     "s" + std::to_string(op.id)));
        default: return test::deletion(kind_of(op), id_of(op), op.revision);
    }
}

rc::Gen<Op> gen_op() {
    return rc::gen::build<Op>(
        rc::gen::set(&Op::type, rc::gen::inRange(0, 4)),
        rc::gen::set(&Op::id, rc::gen::inRange(0, 3)),
        rc::gen::set(&Op::revision, rc::gen::inRange<int64_t>(0, 12)));
}

using Snapshot = std::map<std::pair<EntityKind, std::string>, StoredRevision>;

Snapshot snapshot(MirrorRepository& mirror) {
    Snapshot out;
    for (auto kind : {EntityKind::Series, EntityKind::Event}) {
        for (int i = 0; i < 3; ++i) {
            const std::string id = (kind == EntityKind::Series ? "s" : "e") + std::to_string(i);
            auto stored = mirror.stored_revision(kind, id).unwrap();
            if (stored) out[{kind, id}] = *stored;
        }
    }
    return out;
}

} // namespace

TEST_CASE("Property: re-applying a batch changes nothing", "[property][mirror]") {
    rc::check("apply(batch); apply(batch) == apply(batch)", [] {
        const auto ops = *rc::gen::container<std::vector<Op>>(gen_op());
        std::vector<ChangeRecord> batch;
        for (const auto& op : ops) batch.push_back(to_record(op));

        auto db = test::migrated_memory_db();
        MirrorRepository mirror(db);
        RC_ASSERT(mirror.apply_batch(batch).is_ok());
        const auto once = snapshot(mirror);
        const auto events = mirror.all_live_events().unwrap();

        auto again = mirror.apply_batch(batch);
        RC_ASSERT(again.is_ok());
        RC_ASSERT(again.unwrap().applied == 0);
        RC_ASSERT(snapshot(mirror) == once);
        RC_ASSERT(mirror.all_live_events().unwrap() == events);
    });
}

TEST_CASE("Property: stored revisions never go backwards", "[property][mirror]") {
    rc::check("stored revision is the highest revision seen, batch by batch", [] {
        const auto batches = *rc::gen::container<std::vector<std::vector<Op>>>(
            rc::gen::container<std::vector<Op>>(gen_op()));

        auto db = test::migrated_memory_db();
        MirrorRepository mirror(db);
        std::map<std::pair<EntityKind, std::string>, int64_t> highest;

        for (const auto& ops : batches) {
            std::vector<ChangeRecord> batch;
            for (const auto& op : ops) {
                batch.push_back(to_record(op));
                auto& seen = highest.try_emplace({kind_of(op), id_of(op)}, op.revision).first->second;
                seen = std::max(seen, op.revision);
            }
            RC_ASSERT(mirror.apply_batch(batch).is_ok());

            const auto stored = snapshot(mirror);
            RC_ASSERT(stored.size() == highest.size());
            for (const auto& [entity, revision] : highest) {
                RC_ASSERT(stored.at(entity).updated == Timestamp(revision));
            }
        }
    });
}

TEST_CASE("Property: a stale upsert never overwrites", "[property][mirror]") {
    rc::check("upsert with revision below the stored one is skipped", [] {
        const auto stored_rev = *rc::gen::inRange<int64_t>(1, 1000);
        const auto stale_rev = *rc::gen::inRange<int64_t>(0, stored_rev + 1);

        auto db = test::migrated_memory_db();
        MirrorRepository mirror(db);
        RC_ASSERT(mirror.apply_batch({test::upsert(
            test::event_data("e", stored_rev, std::nullopt, "current"))}).is_ok());

        auto stats = mirror.apply_batch({test::upsert(
            test::event_data("e", stale_rev, std::nullopt, "stale"))});
        RC_ASSERT(stats.unwrap().skipped == 1);
        RC_ASSERT(mirror.event_by_external_id("e").unwrap()->data.title == "current");
    });
}
