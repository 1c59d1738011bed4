#pragma once

#include "storage/database.hpp"
#include "core/realm.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace atrium::storage {

/**
 * RealmRepository - Data access layer for the realm tree.
 *
 * Structural writes (insert, change_segment, remove_subtree) do not open a
 * transaction themselves; the tree service runs them inside an immediate
 * write transaction together with the reads they depend on.
 */
class RealmRepository {
public:
    explicit RealmRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<Realm>, Error> get(Key id);

    [[nodiscard]] Result<std::optional<Realm>, Error> get_by_path(const std::string& full_path);

    /**
     * Direct children ordered by their manual index.
     */
    [[nodiscard]] Result<std::vector<Realm>, Error> children(Key parent_id);

    /**
     * Every realm ordered by full path (parents before their children).
     */
    [[nodiscard]] Result<std::vector<Realm>, Error> all();

    [[nodiscard]] Result<bool, Error> segment_taken(Key parent_id,
                                                    const std::string& segment,
                                                    std::optional<Key> except = std::nullopt);

    /**
     * Insert a child below `parent`, appended at the end of manual order.
     */
    [[nodiscard]] Result<Realm, Error> insert(const Realm& parent,
                                              const std::string& name,
                                              const std::string& segment);

    [[nodiscard]] Result<void, Error> set_name(Key id, const std::string& name);

    /**
     * Change the segment of `realm` and rewrite the full path of every realm
     * in its subtree.
     */
    [[nodiscard]] Result<void, Error> change_segment(const Realm& realm, const std::string& segment);

    /**
     * Remove `realm` and its whole subtree. Returns the number of realms
     * removed. Blocks go with their realm through ON DELETE CASCADE.
     */
    [[nodiscard]] Result<int, Error> remove_subtree(const Realm& realm);

    [[nodiscard]] Result<void, Error> set_child_order(Key id, ChildOrder order);

    [[nodiscard]] Result<void, Error> set_index(Key id, int index);

    [[nodiscard]] Result<int64_t, Error> descendant_count(const Realm& realm);

private:
    Database& db_;

    [[nodiscard]] Result<std::optional<Realm>, Error> fetch_one(Statement& stmt);
    [[nodiscard]] Result<std::vector<Realm>, Error> fetch_all(Statement& stmt);
    [[nodiscard]] Realm row_to_realm(Statement& stmt);
};

} // namespace atrium::storage
