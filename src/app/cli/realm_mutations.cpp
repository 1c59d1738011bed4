#include "app/cli/realm_mutations.hpp"

namespace atrium::app {

namespace {

Result<Realm> resolve_path(tree::Query& query, const QString& path) {
    const auto key = path.trimmed().toStdString();
    auto realm = query.realm_by_path(key);
    if (realm.is_err()) {
        return Result<Realm>::err(realm.unwrap_err());
    }
    if (!realm.unwrap()) {
        return Result<Realm>::err(Error::not_found("No realm at path '" + key + "'"));
    }
    return Result<Realm>::ok(*realm.unwrap());
}

} // namespace

Result<Realm> add_child(tree::Query& query, tree::TreeService& tree, const acl::User& user,
                        const AddChildOptions& options) {
    auto parent = resolve_path(query, options.parent_path);
    if (parent.is_err()) {
        return parent;
    }
    return tree.add_child(user, parent.unwrap().id, options.name.toStdString(),
                          options.path_segment.toStdString());
}

Result<Realm> delete_realm(tree::Query& query, tree::TreeService& tree, const acl::User& user,
                           const DeleteRealmOptions& options) {
    auto realm = resolve_path(query, options.path);
    if (realm.is_err()) {
        return realm;
    }
    return tree.remove(user, realm.unwrap().id);
}

} // namespace atrium::app
