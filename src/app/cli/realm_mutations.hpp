#pragma once

#include <QString>

#include "core/acl.hpp"
#include "core/result.hpp"
#include "tree/query.hpp"
#include "tree/tree_service.hpp"

namespace atrium::app {

struct AddChildOptions {
    QString parent_path;   // "/" for the root
    QString path_segment;
    QString name;
};

struct DeleteRealmOptions {
    QString path;
};

// Path based wrappers around the tree mutation API for the command line.
[[nodiscard]] Result<Realm> add_child(tree::Query& query, tree::TreeService& tree,
                                      const acl::User& user, const AddChildOptions& options);
[[nodiscard]] Result<Realm> delete_realm(tree::Query& query, tree::TreeService& tree,
                                         const acl::User& user, const DeleteRealmOptions& options);

} // namespace atrium::app
