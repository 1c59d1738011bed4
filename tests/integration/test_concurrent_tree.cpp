#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "tree/query.hpp"
#include "tree/tree_service.hpp"

#include "support/test_data.hpp"

#include <atomic>
#include <filesystem>
#include <random>
#include <thread>

using namespace atrium;
using atrium::test::admin;

namespace {

// A database file shared by several connections, removed afterwards.
struct SharedDatabaseFile {
    std::filesystem::path path;

    SharedDatabaseFile() {
        std::random_device rd;
        path = std::filesystem::temp_directory_path() /
               ("atrium_concurrent_" + std::to_string(rd()) + ".db");
        auto db = storage::Database::open(path.string()).unwrap();
        auto migrated = storage::initialize_database(db);
        REQUIRE(migrated.is_ok());
    }

    ~SharedDatabaseFile() {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(path.string() + suffix, ec);
        }
    }

    storage::Database connect() const {
        return storage::Database::open(path.string(), 5000).unwrap();
    }
};

int64_t scalar(storage::Database& db, const std::string& sql) {
    int64_t value = -1;
    auto result = db.query(sql, [&](storage::Statement& row) { value = row.column_int64(0); });
    REQUIRE(result.is_ok());
    return value;
}

void require_consistent_tree(storage::Database& db) {
    // Every realm has a live parent and a full path derived from it.
    REQUIRE(scalar(db, "SELECT COUNT(*) FROM realms r WHERE r.parent IS NOT NULL AND NOT EXISTS "
                       "(SELECT 1 FROM realms p WHERE p.id = r.parent);") == 0);
    REQUIRE(scalar(db, "SELECT COUNT(*) FROM realms r JOIN realms p ON p.id = r.parent "
                       "WHERE r.full_path != p.full_path || '/' || r.path_segment;") == 0);
    REQUIRE(scalar(db, "SELECT COUNT(*) FROM blocks b WHERE NOT EXISTS "
                       "(SELECT 1 FROM realms r WHERE r.id = b.realm_id);") == 0);
}

bool acceptable_loss(const Error& error) {
    return error.kind == ErrorKind::NotFound || error.kind == ErrorKind::Conflict;
}

} // namespace

TEST_CASE("Concurrent structural mutations serialize", "[integration][tree]") {
    SharedDatabaseFile file;
    auto setup = file.connect();
    tree::TreeService setup_tree(setup, acl::Resolver{});
    auto a = setup_tree.add_child(admin(), ROOT_REALM_ID, "A", "aa").unwrap();
    auto b = setup_tree.add_child(admin(), a.id, "B", "bb").unwrap();
    REQUIRE(setup_tree.insert_block(admin(), b.id, 0, blocks::Title{"B"}).is_ok());

    std::atomic<bool> go{false};
    auto run = [&](auto mutation) {
        return std::thread([&, mutation]() mutable {
            auto db = file.connect();
            tree::TreeService tree(db, acl::Resolver{});
            while (!go.load()) std::this_thread::yield();
            mutation(tree);
        });
    };

    SECTION("Overlapping deletes") {
        std::optional<Result<Realm>> outer;
        std::optional<Result<Realm>> inner;
        auto t1 = run([&](tree::TreeService& tree) { outer = tree.remove(admin(), a.id); });
        auto t2 = run([&](tree::TreeService& tree) { inner = tree.remove(admin(), b.id); });
        go.store(true);
        t1.join();
        t2.join();

        REQUIRE(outer->is_ok());
        if (inner->is_err()) {
            REQUIRE(acceptable_loss(inner->unwrap_err()));
        }
        tree::Query query(setup, acl::Resolver{});
        REQUIRE(query.children(ROOT_REALM_ID).unwrap().empty());
        require_consistent_tree(setup);
    }

    SECTION("Adding below a realm that is being deleted") {
        std::optional<Result<Realm>> removed;
        std::optional<Result<Realm>> added;
        auto t1 = run([&](tree::TreeService& tree) { removed = tree.remove(admin(), a.id); });
        auto t2 = run([&](tree::TreeService& tree) {
            added = tree.add_child(admin(), b.id, "C", "cc");
        });
        go.store(true);
        t1.join();
        t2.join();

        REQUIRE(removed->is_ok());
        if (added->is_err()) {
            REQUIRE(acceptable_loss(added->unwrap_err()));
        }
        REQUIRE(scalar(setup, "SELECT COUNT(*) FROM realms;") == 1);
        require_consistent_tree(setup);
    }

    SECTION("Renaming a path while adding below it") {
        std::optional<Result<Realm>> moved;
        std::optional<Result<Realm>> added;
        auto t1 = run([&](tree::TreeService& tree) {
            moved = tree.change_path_segment(admin(), a.id, "zz");
        });
        auto t2 = run([&](tree::TreeService& tree) {
            added = tree.add_child(admin(), b.id, "C", "cc");
        });
        go.store(true);
        t1.join();
        t2.join();

        REQUIRE(moved->is_ok());
        if (added->is_ok()) {
            tree::Query query(setup, acl::Resolver{});
            REQUIRE(query.realm_by_path("/zz/bb/cc").unwrap().has_value());
        } else {
            REQUIRE(acceptable_loss(added->unwrap_err()));
        }
        require_consistent_tree(setup);
    }
}
