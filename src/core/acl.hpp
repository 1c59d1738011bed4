#pragma once

#include "core/mirror.hpp"
#include "core/realm.hpp"

#include <optional>
#include <string>
#include <vector>

namespace atrium::acl {

inline constexpr std::string_view DEFAULT_ADMIN_ROLE = "ROLE_ADMIN";
inline constexpr std::string_view DEFAULT_MODERATOR_ROLE = "ROLE_TOBIRA_MODERATOR";
inline constexpr std::string_view ROLE_ANONYMOUS = "ROLE_ANONYMOUS";

/**
 * User - The acting principal: a stable username plus its effective roles.
 * An anonymous visitor has no username and only ROLE_ANONYMOUS.
 */
struct User {
    std::optional<std::string> username;
    std::vector<std::string> roles;

    [[nodiscard]] static User anonymous() {
        return User{std::nullopt, {std::string(ROLE_ANONYMOUS)}};
    }

    [[nodiscard]] bool has_role(std::string_view role) const;
};

/**
 * Roles that carry global meaning. Both are configurable.
 */
struct RoleConfig {
    std::string admin_role{DEFAULT_ADMIN_ROLE};
    std::string moderator_role{DEFAULT_MODERATOR_ROLE};
};

/**
 * AccessTarget - What the resolver needs to know about an entity.
 *
 * An entity without its own ACL has the unrestricted default: everyone may
 * read it, and writing requires being its owner (or admin).
 */
struct AccessTarget {
    std::optional<Acl> acl;
    std::optional<std::string> owner;
};

/**
 * Pure access resolver. Holds only configuration, no state derived from
 * storage, so it can be shared freely between request handlers.
 */
class Resolver {
public:
    Resolver() = default;
    explicit Resolver(RoleConfig roles) : roles_(std::move(roles)) {}

    [[nodiscard]] bool is_admin(const User& user) const;
    [[nodiscard]] bool is_moderator(const User& user) const;

    [[nodiscard]] bool can_read(const User& user, const AccessTarget& target) const;
    [[nodiscard]] bool can_write(const User& user, const AccessTarget& target) const;

    [[nodiscard]] bool can_read(const User& user, const Event& event) const;
    [[nodiscard]] bool can_write(const User& user, const Event& event) const;

    /**
     * Realms are publicly readable. Writing requires admin, moderator (outside
     * of user realms), or ownership of the enclosing user realm
     * ("/@<username>/...").
     */
    [[nodiscard]] bool can_read_realm(const User& user, const Realm& realm) const;
    [[nodiscard]] bool can_write_realm(const User& user, const Realm& realm) const;

    [[nodiscard]] const RoleConfig& roles() const { return roles_; }

private:
    RoleConfig roles_;
};

/**
 * True if any role of the user appears in `roles`.
 */
[[nodiscard]] bool intersects(const std::vector<std::string>& user_roles,
                              const std::vector<std::string>& roles);

} // namespace atrium::acl
