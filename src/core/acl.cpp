#include "core/acl.hpp"

#include <algorithm>

namespace atrium::acl {

bool User::has_role(std::string_view role) const {
    return std::find(roles.begin(), roles.end(), role) != roles.end();
}

bool intersects(const std::vector<std::string>& user_roles,
                const std::vector<std::string>& roles) {
    return std::any_of(user_roles.begin(), user_roles.end(), [&](const std::string& r) {
        return std::find(roles.begin(), roles.end(), r) != roles.end();
    });
}

bool Resolver::is_admin(const User& user) const {
    return user.has_role(roles_.admin_role);
}

bool Resolver::is_moderator(const User& user) const {
    return user.has_role(roles_.moderator_role);
}

bool Resolver::can_read(const User& user, const AccessTarget& target) const {
    if (is_admin(user)) return true;
    if (!target.acl) return true;
    return intersects(user.roles, target.acl->read_roles);
}

bool Resolver::can_write(const User& user, const AccessTarget& target) const {
    if (is_admin(user)) return true;
    if (target.acl) {
        return intersects(user.roles, target.acl->write_roles);
    }
    return target.owner && user.username && *target.owner == *user.username;
}

bool Resolver::can_read(const User& user, const Event& event) const {
    return can_read(user, AccessTarget{event.data.acl, std::nullopt});
}

bool Resolver::can_write(const User& user, const Event& event) const {
    return can_write(user, AccessTarget{event.data.acl, std::nullopt});
}

bool Resolver::can_read_realm(const User& user, const Realm& realm) const {
    return can_read(user, AccessTarget{std::nullopt, realm_path::user_realm_owner(realm.full_path)});
}

bool Resolver::can_write_realm(const User& user, const Realm& realm) const {
    if (is_moderator(user) && !realm_path::user_realm_owner(realm.full_path)) {
        return true;
    }
    return can_write(user, AccessTarget{std::nullopt, realm_path::user_realm_owner(realm.full_path)});
}

} // namespace atrium::acl
