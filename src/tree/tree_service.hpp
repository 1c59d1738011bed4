#pragma once

#include "core/acl.hpp"
#include "core/block_types.hpp"
#include "core/realm.hpp"
#include "core/result.hpp"
#include "storage/block_repository.hpp"
#include "storage/database.hpp"
#include "storage/mirror_repository.hpp"
#include "storage/realm_repository.hpp"

#include <string>
#include <vector>

namespace atrium::tree {

/**
 * A realm together with its block list, as returned by block mutations.
 */
struct RealmBlocks {
    Realm realm;
    std::vector<blocks::Block> blocks;

    bool operator==(const RealmBlocks&) const = default;
};

/**
 * TreeService - Write side of the realm tree.
 *
 * Every mutation checks write access through the resolver, validates its
 * input and runs in an immediate write transaction that re-reads the target
 * realm first. Two structural mutations on overlapping subtrees therefore
 * serialize; the loser sees the winner's result (typically NotFound) or,
 * if it could not get the lock within the busy timeout, a Conflict.
 *
 * One TreeService per connection; concurrent request handlers each use their
 * own Database and TreeService.
 */
class TreeService {
public:
    TreeService(storage::Database& db, acl::Resolver resolver);

    // ------------------------------------------------------------------------
    // Realms
    // ------------------------------------------------------------------------

    [[nodiscard]] Result<Realm> add_child(const acl::User& user, Key parent_id,
                                          const std::string& name,
                                          const std::string& path_segment);

    /**
     * Create "/@<username>" below the root for the acting user.
     */
    [[nodiscard]] Result<Realm> create_user_realm(const acl::User& user);

    [[nodiscard]] Result<Realm> rename(const acl::User& user, Key id, const std::string& name);

    /**
     * Change the segment and rewrite the paths of the whole subtree.
     */
    [[nodiscard]] Result<Realm> change_path_segment(const acl::User& user, Key id,
                                                    const std::string& path_segment);

    /**
     * Remove a realm with its subtree and all their blocks. Returns the parent.
     */
    [[nodiscard]] Result<Realm> remove(const acl::User& user, Key id);

    [[nodiscard]] Result<Realm> set_child_order(const acl::User& user, Key id, ChildOrder order);

    /**
     * Switch to manual order with the given sequence, which must be a
     * permutation of the current children. Returns the children in order.
     */
    [[nodiscard]] Result<std::vector<Realm>> reorder_children(const acl::User& user, Key id,
                                                              const std::vector<Key>& child_ids);

    // ------------------------------------------------------------------------
    // Blocks
    // ------------------------------------------------------------------------

    [[nodiscard]] Result<RealmBlocks> insert_block(const acl::User& user, Key realm_id, int index,
                                                   const blocks::BlockContent& content);

    [[nodiscard]] Result<RealmBlocks> remove_block(const acl::User& user, Key realm_id, int index);

    /**
     * Exchange two positions. Only "move up" / "move down" are exposed, so
     * this is the only reordering of blocks.
     */
    [[nodiscard]] Result<RealmBlocks> swap_blocks(const acl::User& user, Key realm_id,
                                                  int index_a, int index_b);

    [[nodiscard]] Result<RealmBlocks> move_block_up(const acl::User& user, Key realm_id, int index);
    [[nodiscard]] Result<RealmBlocks> move_block_down(const acl::User& user, Key realm_id, int index);

    [[nodiscard]] Result<RealmBlocks> update_title_block(const acl::User& user, Key block_id,
                                                         const blocks::Title& title);
    [[nodiscard]] Result<RealmBlocks> update_text_block(const acl::User& user, Key block_id,
                                                        const blocks::Text& text);
    [[nodiscard]] Result<RealmBlocks> update_series_block(const acl::User& user, Key block_id,
                                                          const blocks::SeriesRef& series);
    [[nodiscard]] Result<RealmBlocks> update_video_block(const acl::User& user, Key block_id,
                                                         const blocks::VideoRef& video);

    [[nodiscard]] const acl::Resolver& resolver() const { return resolver_; }

private:
    storage::Database& db_;
    acl::Resolver resolver_;
    storage::RealmRepository realms_;
    storage::BlockRepository blocks_;
    storage::MirrorRepository mirror_;

    [[nodiscard]] Result<Realm> load_writable(const acl::User& user, Key id);
    [[nodiscard]] Result<void> check_sibling_free(Key parent_id, const std::string& segment,
                                                  std::optional<Key> except);
    [[nodiscard]] Result<void> check_references(const blocks::BlockContent& content);
    [[nodiscard]] Result<RealmBlocks> realm_blocks(const Realm& realm);
    [[nodiscard]] Result<RealmBlocks> update_block(const acl::User& user, Key block_id,
                                                   const blocks::BlockContent& content);
};

} // namespace atrium::tree
