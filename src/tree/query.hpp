#pragma once

#include "core/acl.hpp"
#include "core/block_types.hpp"
#include "core/mirror.hpp"
#include "core/realm.hpp"
#include "core/result.hpp"
#include "storage/block_repository.hpp"
#include "storage/database.hpp"
#include "storage/mirror_repository.hpp"
#include "storage/realm_repository.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atrium::tree {

/**
 * How a block's reference resolved for the viewing user.
 *
 * Deleted covers both a null reference and a tombstoned entity. Forbidden
 * means the entity exists but the user may not read it. In both cases no
 * entity data is returned.
 */
enum class RefState {
    None,       // title and text blocks
    Live,
    Deleted,
    Forbidden
};

[[nodiscard]] constexpr std::string_view ref_state_name(RefState state) {
    switch (state) {
        case RefState::None: return "none";
        case RefState::Live: return "live";
        case RefState::Deleted: return "deleted";
        case RefState::Forbidden: return "forbidden";
    }
    return "unknown";
}

struct ResolvedBlock {
    blocks::Block block;
    RefState state{RefState::None};
    std::optional<Series> series;
    std::optional<Event> event;
    std::vector<Event> events;  // series blocks: readable live events, in block order
};

struct RealmContent {
    Realm realm;
    std::vector<ResolvedBlock> blocks;
};

/**
 * Query - Read side of the realm tree.
 *
 * Never fails because a referenced entity is missing; such references
 * resolve to RefState::Deleted.
 */
class Query {
public:
    Query(storage::Database& db, acl::Resolver resolver);

    [[nodiscard]] Result<std::optional<Realm>> realm_by_id(Key id);
    [[nodiscard]] Result<std::optional<Realm>> realm_by_path(const std::string& full_path);

    /**
     * Children ordered according to the realm's child order.
     */
    [[nodiscard]] Result<std::vector<Realm>> children(Key id);

    /**
     * The realm with its blocks, references resolved for `user`.
     */
    [[nodiscard]] Result<std::optional<RealmContent>> realm_content(const acl::User& user, Key id);
    [[nodiscard]] Result<std::optional<RealmContent>> realm_content_by_path(
        const acl::User& user, const std::string& full_path);

    /**
     * Ancestors from the root down to the parent (breadcrumbs).
     */
    [[nodiscard]] Result<std::vector<Realm>> ancestors(Key id);

    [[nodiscard]] Result<int64_t> descendant_count(Key id);

private:
    storage::Database& db_;
    acl::Resolver resolver_;
    storage::RealmRepository realms_;
    storage::BlockRepository blocks_;
    storage::MirrorRepository mirror_;

    [[nodiscard]] Result<RealmContent> load_content(const acl::User& user, const Realm& realm);
    [[nodiscard]] Result<ResolvedBlock> resolve(const acl::User& user, blocks::Block block);
};

} // namespace atrium::tree
