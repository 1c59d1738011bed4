#include <catch2/catch_test_macros.hpp>
#include "core/acl.hpp"

using namespace atrium;
using namespace atrium::acl;

namespace {

User user(std::string name, std::vector<std::string> roles) {
    return User{std::move(name), std::move(roles)};
}

Event event_with_acl(Acl acl) {
    Event e;
    e.key = 1;
    e.data.external_id = "ev-1";
    e.data.title = "Lecture";
    e.data.acl = std::move(acl);
    return e;
}

Realm realm_at(std::string path) {
    Realm r;
    r.id = 5;
    r.parent_id = 0;
    r.full_path = std::move(path);
    return r;
}

} // namespace

TEST_CASE("Admin may read and write everything", "[acl]") {
    Resolver resolver;
    const auto admin = user("root", {"ROLE_ADMIN"});
    const auto locked = event_with_acl(Acl{{"ROLE_SECRET"}, {"ROLE_SECRET"}});

    REQUIRE(resolver.can_read(admin, locked));
    REQUIRE(resolver.can_write(admin, locked));
    REQUIRE(resolver.can_write_realm(admin, realm_at("/@someone/else")));
}

TEST_CASE("Event access requires intersecting roles", "[acl]") {
    Resolver resolver;
    const auto ev = event_with_acl(Acl{{"ROLE_ANONYMOUS", "ROLE_STUDENT"}, {"ROLE_LECTURER"}});

    REQUIRE(resolver.can_read(User::anonymous(), ev));
    REQUIRE_FALSE(resolver.can_write(User::anonymous(), ev));

    const auto lecturer = user("t", {"ROLE_USER", "ROLE_LECTURER"});
    REQUIRE(resolver.can_write(lecturer, ev));

    const auto other = user("o", {"ROLE_USER"});
    REQUIRE_FALSE(resolver.can_read(other, event_with_acl(Acl{{"ROLE_STUDENT"}, {}})));
}

TEST_CASE("Entities without an ACL are public and owner writable", "[acl]") {
    Resolver resolver;
    const AccessTarget unowned{std::nullopt, std::nullopt};
    const AccessTarget owned{std::nullopt, std::string("jdoe")};

    REQUIRE(resolver.can_read(User::anonymous(), unowned));
    REQUIRE_FALSE(resolver.can_write(user("jdoe", {}), unowned));
    REQUIRE(resolver.can_write(user("jdoe", {}), owned));
    REQUIRE_FALSE(resolver.can_write(user("mallory", {}), owned));
    REQUIRE_FALSE(resolver.can_write(User::anonymous(), owned));
}

TEST_CASE("Realm write permission", "[acl][realm]") {
    Resolver resolver;
    const auto moderator = user("mod", {"ROLE_TOBIRA_MODERATOR"});
    const auto jdoe = user("jdoe", {"ROLE_USER"});

    SECTION("Realms are publicly readable") {
        REQUIRE(resolver.can_read_realm(User::anonymous(), realm_at("/talks")));
        REQUIRE(resolver.can_read_realm(User::anonymous(), realm_at("/@jdoe")));
    }

    SECTION("Moderators edit the main tree but not user realms") {
        REQUIRE(resolver.can_write_realm(moderator, realm_at("/talks")));
        REQUIRE_FALSE(resolver.can_write_realm(moderator, realm_at("/@jdoe/notes")));
    }

    SECTION("Users own their user realm subtree") {
        REQUIRE(resolver.can_write_realm(jdoe, realm_at("/@jdoe")));
        REQUIRE(resolver.can_write_realm(jdoe, realm_at("/@jdoe/notes")));
        REQUIRE_FALSE(resolver.can_write_realm(jdoe, realm_at("/@other")));
        REQUIRE_FALSE(resolver.can_write_realm(jdoe, realm_at("/talks")));
    }
}

TEST_CASE("Admin and moderator roles are configurable", "[acl]") {
    Resolver resolver(RoleConfig{"ROLE_SUPER", "ROLE_EDITOR"});

    REQUIRE(resolver.is_admin(user("a", {"ROLE_SUPER"})));
    REQUIRE_FALSE(resolver.is_admin(user("b", {"ROLE_ADMIN"})));
    REQUIRE(resolver.can_write_realm(user("e", {"ROLE_EDITOR"}), realm_at("/talks")));
}
