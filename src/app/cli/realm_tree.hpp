#pragma once

#include <QString>

#include "core/result.hpp"
#include "tree/query.hpp"

namespace atrium::app {

struct RealmTreeOptions {
    bool include_ids = false;
    int max_depth = -1;  // -1 = unlimited
};

// Walks the realm tree from the root, children in their configured order:
//
//   / (Root)
//     - Lectures [/lectures]
//       - Math [/lectures/math]
[[nodiscard]] Result<QString> format_realm_tree(tree::Query& query,
                                                const RealmTreeOptions& options = {});

// JSON output:
// { "id"?, "name", "path", "childOrder", "children": [ ... ] }
[[nodiscard]] Result<QString> format_realm_tree_json(tree::Query& query,
                                                     const RealmTreeOptions& options = {});

} // namespace atrium::app
