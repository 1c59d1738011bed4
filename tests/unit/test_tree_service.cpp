#include <catch2/catch_test_macros.hpp>
#include "storage/block_repository.hpp"
#include "storage/mirror_repository.hpp"
#include "tree/query.hpp"
#include "tree/tree_service.hpp"

#include "support/test_data.hpp"

using namespace atrium;
using namespace atrium::blocks;
using atrium::test::admin;
using atrium::test::plain_user;

namespace {

std::vector<std::string> names_of(const std::vector<Realm>& realms) {
    std::vector<std::string> names;
    for (const auto& realm : realms) names.push_back(realm.name);
    return names;
}

} // namespace

TEST_CASE("Adding children builds full paths", "[tree]") {
    auto db = test::migrated_memory_db();
    tree::TreeService tree(db, acl::Resolver{});
    tree::Query query(db, acl::Resolver{});

    auto lectures = tree.add_child(admin(), ROOT_REALM_ID, "Lectures", "lectures").unwrap();
    REQUIRE(lectures.full_path == "/lectures");
    REQUIRE(lectures.parent_id == ROOT_REALM_ID);

    auto math = tree.add_child(admin(), lectures.id, "Mathematics", "math").unwrap();
    REQUIRE(math.full_path == "/lectures/math");

    auto found = query.realm_by_path("/lectures/math").unwrap();
    REQUIRE(found.has_value());
    REQUIRE(found->id == math.id);
}

TEST_CASE("Sibling path segments must be unique", "[tree]") {
    auto db = test::migrated_memory_db();
    tree::TreeService tree(db, acl::Resolver{});
    tree::Query query(db, acl::Resolver{});

    auto lectures = tree.add_child(admin(), ROOT_REALM_ID, "Lectures", "lectures").unwrap();
    REQUIRE(tree.add_child(admin(), lectures.id, "Math", "math").is_ok());

    auto second = tree.add_child(admin(), lectures.id, "Math", "math");
    REQUIRE(second.is_err());
    REQUIRE(second.unwrap_err().kind == ErrorKind::Validation);
    REQUIRE(second.unwrap_err().rule == ValidationRule::SiblingCollision);
    REQUIRE(query.children(lectures.id).unwrap().size() == 1);

    // The same segment below another parent is fine.
    REQUIRE(tree.add_child(admin(), ROOT_REALM_ID, "Math", "math").is_ok());
}

TEST_CASE("Invalid names and segments are rejected", "[tree]") {
    auto db = test::migrated_memory_db();
    tree::TreeService tree(db, acl::Resolver{});

    auto rule_of = [&](const std::string& name, const std::string& segment) {
        auto result = tree.add_child(admin(), ROOT_REALM_ID, name, segment);
        REQUIRE(result.is_err());
        return result.unwrap_err().rule;
    };

    REQUIRE(rule_of("  ", "valid") == ValidationRule::NameEmpty);
    REQUIRE(rule_of("Name", "") == ValidationRule::PathEmpty);
    REQUIRE(rule_of("Name", "x") == ValidationRule::PathTooShort);
    REQUIRE(rule_of("Name", "a b") == ValidationRule::Whitespace);
    REQUIRE(rule_of("Name", "a/b") == ValidationRule::IllegalChar);
    REQUIRE(rule_of("Name", "@me") == ValidationRule::ReservedLeadingChar);
    REQUIRE(rule_of("Name", "ab\xff") == ValidationRule::InvalidValue);
    REQUIRE(rule_of("Bad \xed\xa0\x80", "valid") == ValidationRule::InvalidValue);

    auto children = tree::Query(db, acl::Resolver{}).children(ROOT_REALM_ID).unwrap();
    REQUIRE(children.empty());
}

TEST_CASE("Writing realms requires the right roles", "[tree][acl]") {
    auto db = test::migrated_memory_db();
    tree::TreeService tree(db, acl::Resolver{});
    auto lectures = tree.add_child(admin(), ROOT_REALM_ID, "Lectures", "lectures").unwrap();

    SECTION("Plain users may not modify shared realms") {
        auto result = tree.add_child(plain_user("bob"), lectures.id, "Mine", "mine");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::NotAuthorized);
    }

    SECTION("Moderators may modify shared realms") {
        const auto moderator = plain_user("mod", {std::string(acl::DEFAULT_MODERATOR_ROLE)});
        REQUIRE(tree.add_child(moderator, lectures.id, "Physics", "physics").is_ok());
    }

    SECTION("Users own their user realm") {
        auto bob = plain_user("bob");
        auto home = tree.create_user_realm(bob).unwrap();
        REQUIRE(home.full_path == "/@bob");
        REQUIRE(tree.add_child(bob, home.id, "Talks", "talks").unwrap().full_path == "/@bob/talks");

        auto foreign = tree.add_child(plain_user("eve"), home.id, "Spam", "spam");
        REQUIRE(foreign.is_err());
        REQUIRE(foreign.unwrap_err().kind == ErrorKind::NotAuthorized);
    }

    SECTION("Anonymous users have no user realm") {
        REQUIRE(tree.create_user_realm(acl::User::anonymous()).unwrap_err().kind ==
                ErrorKind::NotAuthorized);
    }

    SECTION("Unknown realms are not found") {
        REQUIRE(tree.rename(admin(), 4242, "Nope").unwrap_err().kind == ErrorKind::NotFound);
    }
}

TEST_CASE("The root realm is immutable", "[tree]") {
    auto db = test::migrated_memory_db();
    tree::TreeService tree(db, acl::Resolver{});

    REQUIRE(tree.rename(admin(), ROOT_REALM_ID, "Home").unwrap_err().rule ==
            ValidationRule::RootImmutable);
    REQUIRE(tree.change_path_segment(admin(), ROOT_REALM_ID, "home").unwrap_err().rule ==
            ValidationRule::RootImmutable);
    REQUIRE(tree.remove(admin(), ROOT_REALM_ID).unwrap_err().rule ==
            ValidationRule::RootImmutable);

    // Ordering the root's children is allowed.
    REQUIRE(tree.set_child_order(admin(), ROOT_REALM_ID, ChildOrder::AlphabeticDesc).is_ok());
}

TEST_CASE("Renaming keeps the path", "[tree]") {
    auto db = test::migrated_memory_db();
    tree::TreeService tree(db, acl::Resolver{});
    tree::Query query(db, acl::Resolver{});
    auto realm = tree.add_child(admin(), ROOT_REALM_ID, "Lectures", "lectures").unwrap();

    auto renamed = tree.rename(admin(), realm.id, "All lectures").unwrap();
    REQUIRE(renamed.name == "All lectures");
    REQUIRE(renamed.full_path == "/lectures");
    REQUIRE(query.realm_by_id(realm.id).unwrap()->name == "All lectures");
}

TEST_CASE("Changing a path segment rewrites the subtree", "[tree]") {
    auto db = test::migrated_memory_db();
    tree::TreeService tree(db, acl::Resolver{});
    tree::Query query(db, acl::Resolver{});

    auto lectures = tree.add_child(admin(), ROOT_REALM_ID, "Lectures", "lectures").unwrap();
    auto math = tree.add_child(admin(), lectures.id, "Math", "math").unwrap();
    auto algebra = tree.add_child(admin(), math.id, "Algebra", "algebra").unwrap();
    // A sibling sharing the prefix must not be touched.
    auto other = tree.add_child(admin(), ROOT_REALM_ID, "Lectures 2", "lectures2").unwrap();
    REQUIRE(tree.add_child(admin(), other.id, "Math", "math").is_ok());

    auto moved = tree.change_path_segment(admin(), lectures.id, "courses").unwrap();
    REQUIRE(moved.full_path == "/courses");
    REQUIRE(query.realm_by_id(math.id).unwrap()->full_path == "/courses/math");
    REQUIRE(query.realm_by_id(algebra.id).unwrap()->full_path == "/courses/math/algebra");
    REQUIRE(query.realm_by_path("/lectures2/math").unwrap().has_value());
    REQUIRE_FALSE(query.realm_by_path("/lectures/math").unwrap().has_value());

    SECTION("Collisions with siblings are rejected") {
        auto clash = tree.change_path_segment(admin(), other.id, "courses");
        REQUIRE(clash.unwrap_err().rule == ValidationRule::SiblingCollision);
        REQUIRE(query.realm_by_id(other.id).unwrap()->full_path == "/lectures2");
    }
}

TEST_CASE("Deleting a realm removes its subtree and blocks", "[tree]") {
    auto db = test::migrated_memory_db();
    tree::TreeService tree(db, acl::Resolver{});
    tree::Query query(db, acl::Resolver{});
    storage::BlockRepository blocks(db);

    auto a = tree.add_child(admin(), ROOT_REALM_ID, "A", "aa").unwrap();
    auto b = tree.add_child(admin(), a.id, "B", "bb").unwrap();
    auto c = tree.add_child(admin(), b.id, "C", "cc").unwrap();
    auto keep = tree.add_child(admin(), ROOT_REALM_ID, "Keep", "keep").unwrap();
    REQUIRE(tree.insert_block(admin(), c.id, 0, Title{"Deep"}).is_ok());
    REQUIRE(tree.insert_block(admin(), keep.id, 0, Title{"Stays"}).is_ok());

    auto parent = tree.remove(admin(), a.id).unwrap();
    REQUIRE(parent.id == ROOT_REALM_ID);

    REQUIRE_FALSE(query.realm_by_id(a.id).unwrap().has_value());
    REQUIRE_FALSE(query.realm_by_id(b.id).unwrap().has_value());
    REQUIRE_FALSE(query.realm_by_id(c.id).unwrap().has_value());
    REQUIRE(blocks.count_by_realm(c.id).unwrap() == 0);
    REQUIRE(blocks.count_by_realm(keep.id).unwrap() == 1);
    REQUIRE(names_of(query.children(ROOT_REALM_ID).unwrap()) == std::vector<std::string>{"Keep"});

    SECTION("Deleting again reports the realm as missing") {
        REQUIRE(tree.remove(admin(), a.id).unwrap_err().kind == ErrorKind::NotFound);
    }
}

TEST_CASE("Child order", "[tree]") {
    auto db = test::migrated_memory_db();
    tree::TreeService tree(db, acl::Resolver{});
    tree::Query query(db, acl::Resolver{});
    auto b = tree.add_child(admin(), ROOT_REALM_ID, "Beta", "beta").unwrap();
    auto a = tree.add_child(admin(), ROOT_REALM_ID, "Alpha", "alpha").unwrap();
    auto c = tree.add_child(admin(), ROOT_REALM_ID, "Gamma", "gamma").unwrap();

    SECTION("Alphabetic by default") {
        REQUIRE(names_of(query.children(ROOT_REALM_ID).unwrap()) ==
                std::vector<std::string>{"Alpha", "Beta", "Gamma"});
    }

    SECTION("Alphabetic descending") {
        REQUIRE(tree.set_child_order(admin(), ROOT_REALM_ID, ChildOrder::AlphabeticDesc).is_ok());
        REQUIRE(names_of(query.children(ROOT_REALM_ID).unwrap()) ==
                std::vector<std::string>{"Gamma", "Beta", "Alpha"});
    }

    SECTION("Manual order takes a permutation") {
        auto ordered = tree.reorder_children(admin(), ROOT_REALM_ID, {c.id, a.id, b.id}).unwrap();
        REQUIRE(names_of(ordered) == std::vector<std::string>{"Gamma", "Alpha", "Beta"});
        REQUIRE(query.realm_by_id(ROOT_REALM_ID).unwrap()->child_order == ChildOrder::ByIndex);
        REQUIRE(names_of(query.children(ROOT_REALM_ID).unwrap()) ==
                std::vector<std::string>{"Gamma", "Alpha", "Beta"});
    }

    SECTION("Anything but a permutation is rejected") {
        const std::vector<std::vector<Key>> invalid{
            {a.id, b.id},
            {a.id, b.id, c.id, c.id},
            {a.id, b.id, 999},
        };
        for (const auto& ids : invalid) {
            auto result = tree.reorder_children(admin(), ROOT_REALM_ID, ids);
            REQUIRE(result.is_err());
            REQUIRE(result.unwrap_err().rule == ValidationRule::NotAPermutation);
        }
        REQUIRE(query.realm_by_id(ROOT_REALM_ID).unwrap()->child_order == ChildOrder::AlphabeticAsc);
    }
}
