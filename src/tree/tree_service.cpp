#include "tree/tree_service.hpp"

#include <set>

namespace atrium::tree {

using namespace blocks;

TreeService::TreeService(storage::Database& db, acl::Resolver resolver)
    : db_(db)
    , resolver_(std::move(resolver))
    , realms_(db)
    , blocks_(db)
    , mirror_(db) {}

// ============================================================================
// Helpers
// ============================================================================

Result<Realm> TreeService::load_writable(const acl::User& user, Key id) {
    auto realm = realms_.get(id);
    if (realm.is_err()) {
        return Result<Realm>::err(realm.unwrap_err());
    }
    if (!realm.unwrap()) {
        return Result<Realm>::err(Error::not_found("Realm " + std::to_string(id) + " does not exist"));
    }
    if (!resolver_.can_write_realm(user, *realm.unwrap())) {
        return Result<Realm>::err(Error::not_authorized(
            "Not allowed to modify realm '" + realm.unwrap()->full_path + "'"));
    }
    return Result<Realm>::ok(*realm.unwrap());
}

Result<void> TreeService::check_sibling_free(
    Key parent_id,
    const std::string& segment,
    std::optional<Key> except
) {
    auto taken = realms_.segment_taken(parent_id, segment, except);
    if (taken.is_err()) {
        return Result<void>::err(taken.unwrap_err());
    }
    if (taken.unwrap()) {
        return Result<void>::err(Error::validation(
            ValidationRule::SiblingCollision,
            "A sibling realm with the path segment '" + segment + "' already exists"));
    }
    return Result<void>::ok();
}

Result<void> TreeService::check_references(const BlockContent& content) {
    if (const auto* series = std::get_if<SeriesRef>(&content)) {
        if (!series->series) {
            return Result<void>::err(Error::validation(
                ValidationRule::InvalidValue, "Series block needs a series"));
        }
        auto found = mirror_.series_by_key(*series->series);
        if (found.is_err()) {
            return Result<void>::err(found.unwrap_err());
        }
        if (!found.unwrap() || found.unwrap()->deleted) {
            return Result<void>::err(Error::not_found(
                "Series " + std::to_string(*series->series) + " does not exist"));
        }
    } else if (const auto* video = std::get_if<VideoRef>(&content)) {
        if (!video->event) {
            return Result<void>::err(Error::validation(
                ValidationRule::InvalidValue, "Video block needs a video"));
        }
        auto found = mirror_.event_by_key(*video->event);
        if (found.is_err()) {
            return Result<void>::err(found.unwrap_err());
        }
        if (!found.unwrap() || found.unwrap()->deleted) {
            return Result<void>::err(Error::not_found(
                "Event " + std::to_string(*video->event) + " does not exist"));
        }
    }
    return Result<void>::ok();
}

Result<RealmBlocks> TreeService::realm_blocks(const Realm& realm) {
    auto list = blocks_.get_by_realm(realm.id);
    if (list.is_err()) {
        return Result<RealmBlocks>::err(list.unwrap_err());
    }
    return Result<RealmBlocks>::ok(RealmBlocks{realm, std::move(list).unwrap()});
}

// ============================================================================
// Realms
// ============================================================================

Result<Realm> TreeService::add_child(
    const acl::User& user,
    Key parent_id,
    const std::string& name,
    const std::string& path_segment
) {
    auto valid = realm_path::validate_name(name);
    if (valid.is_err()) return Result<Realm>::err(valid.unwrap_err());
    valid = realm_path::validate_segment(path_segment);
    if (valid.is_err()) return Result<Realm>::err(valid.unwrap_err());

    return db_.write_transaction([&]() -> Result<Realm> {
        auto parent = load_writable(user, parent_id);
        if (parent.is_err()) return parent;

        auto sibling = check_sibling_free(parent_id, path_segment, std::nullopt);
        if (sibling.is_err()) return Result<Realm>::err(sibling.unwrap_err());

        return realms_.insert(parent.unwrap(), name, path_segment);
    });
}

Result<Realm> TreeService::create_user_realm(const acl::User& user) {
    if (!user.username || user.username->empty()) {
        return Result<Realm>::err(Error::not_authorized("Anonymous users have no user realm"));
    }
    const std::string segment = realm_path::user_realm_segment(*user.username);
    auto valid = realm_path::validate_segment(segment, true);
    if (valid.is_err()) return Result<Realm>::err(valid.unwrap_err());

    return db_.write_transaction([&]() -> Result<Realm> {
        auto root = realms_.get(ROOT_REALM_ID);
        if (root.is_err()) return Result<Realm>::err(root.unwrap_err());
        if (!root.unwrap()) {
            return Result<Realm>::err(Error::not_found("Root realm missing"));
        }

        auto sibling = check_sibling_free(ROOT_REALM_ID, segment, std::nullopt);
        if (sibling.is_err()) return Result<Realm>::err(sibling.unwrap_err());

        return realms_.insert(*root.unwrap(), *user.username, segment);
    });
}

Result<Realm> TreeService::rename(const acl::User& user, Key id, const std::string& name) {
    auto valid = realm_path::validate_name(name);
    if (valid.is_err()) return Result<Realm>::err(valid.unwrap_err());

    return db_.write_transaction([&]() -> Result<Realm> {
        auto realm = load_writable(user, id);
        if (realm.is_err()) return realm;
        if (realm.unwrap().is_root()) {
            return Result<Realm>::err(Error::validation(
                ValidationRule::RootImmutable, "The root realm cannot be renamed"));
        }

        auto updated = realms_.set_name(id, name);
        if (updated.is_err()) return Result<Realm>::err(updated.unwrap_err());

        auto out = std::move(realm).unwrap();
        out.name = name;
        return Result<Realm>::ok(std::move(out));
    });
}

Result<Realm> TreeService::change_path_segment(
    const acl::User& user,
    Key id,
    const std::string& path_segment
) {
    auto valid = realm_path::validate_segment(path_segment);
    if (valid.is_err()) return Result<Realm>::err(valid.unwrap_err());

    return db_.write_transaction([&]() -> Result<Realm> {
        auto realm = load_writable(user, id);
        if (realm.is_err()) return realm;
        const auto& current = realm.unwrap();
        if (current.is_root()) {
            return Result<Realm>::err(Error::validation(
                ValidationRule::RootImmutable, "The root realm has no path segment"));
        }
        if (current.path_segment == path_segment) {
            return realm;
        }

        auto sibling = check_sibling_free(*current.parent_id, path_segment, current.id);
        if (sibling.is_err()) return Result<Realm>::err(sibling.unwrap_err());

        auto changed = realms_.change_segment(current, path_segment);
        if (changed.is_err()) return Result<Realm>::err(changed.unwrap_err());

        auto reloaded = realms_.get(id);
        if (reloaded.is_err()) return Result<Realm>::err(reloaded.unwrap_err());
        if (!reloaded.unwrap()) {
            return Result<Realm>::err(Error::not_found("Realm vanished while moving it"));
        }
        return Result<Realm>::ok(*reloaded.unwrap());
    });
}

Result<Realm> TreeService::remove(const acl::User& user, Key id) {
    return db_.write_transaction([&]() -> Result<Realm> {
        auto realm = load_writable(user, id);
        if (realm.is_err()) return realm;
        const auto& target = realm.unwrap();
        if (target.is_root()) {
            return Result<Realm>::err(Error::validation(
                ValidationRule::RootImmutable, "The root realm cannot be deleted"));
        }

        auto parent = realms_.get(*target.parent_id);
        if (parent.is_err()) return Result<Realm>::err(parent.unwrap_err());
        if (!parent.unwrap()) {
            return Result<Realm>::err(Error::not_found("Parent of realm vanished"));
        }

        auto removed = realms_.remove_subtree(target);
        if (removed.is_err()) return Result<Realm>::err(removed.unwrap_err());

        return Result<Realm>::ok(*parent.unwrap());
    });
}

Result<Realm> TreeService::set_child_order(const acl::User& user, Key id, ChildOrder order) {
    return db_.write_transaction([&]() -> Result<Realm> {
        auto realm = load_writable(user, id);
        if (realm.is_err()) return realm;

        auto updated = realms_.set_child_order(id, order);
        if (updated.is_err()) return Result<Realm>::err(updated.unwrap_err());

        auto out = std::move(realm).unwrap();
        out.child_order = order;
        return Result<Realm>::ok(std::move(out));
    });
}

Result<std::vector<Realm>> TreeService::reorder_children(
    const acl::User& user,
    Key id,
    const std::vector<Key>& child_ids
) {
    using R = Result<std::vector<Realm>>;
    return db_.write_transaction([&]() -> R {
        auto realm = load_writable(user, id);
        if (realm.is_err()) return R::err(realm.unwrap_err());

        auto children = realms_.children(id);
        if (children.is_err()) return R::err(children.unwrap_err());
        auto& current = children.unwrap();

        std::set<Key> expected;
        for (const auto& child : current) expected.insert(child.id);
        const std::set<Key> given(child_ids.begin(), child_ids.end());
        if (given.size() != child_ids.size() || given != expected) {
            return R::err(Error::validation(
                ValidationRule::NotAPermutation,
                "Child order must list every child of the realm exactly once"));
        }

        for (size_t i = 0; i < child_ids.size(); ++i) {
            auto updated = realms_.set_index(child_ids[i], static_cast<int>(i));
            if (updated.is_err()) return R::err(updated.unwrap_err());
        }
        auto mode = realms_.set_child_order(id, ChildOrder::ByIndex);
        if (mode.is_err()) return R::err(mode.unwrap_err());

        return realms_.children(id);
    });
}

// ============================================================================
// Blocks
// ============================================================================

Result<RealmBlocks> TreeService::insert_block(
    const acl::User& user,
    Key realm_id,
    int index,
    const BlockContent& content
) {
    return db_.write_transaction([&]() -> Result<RealmBlocks> {
        auto realm = load_writable(user, realm_id);
        if (realm.is_err()) return Result<RealmBlocks>::err(realm.unwrap_err());

        auto count = blocks_.count_by_realm(realm_id);
        if (count.is_err()) return Result<RealmBlocks>::err(count.unwrap_err());
        if (index < 0 || index > count.unwrap()) {
            return Result<RealmBlocks>::err(Error::validation(
                ValidationRule::IndexOutOfRange,
                "Block position " + std::to_string(index) + " is out of range"));
        }

        auto refs = check_references(content);
        if (refs.is_err()) return Result<RealmBlocks>::err(refs.unwrap_err());

        auto inserted = blocks_.insert_at(realm_id, index, content);
        if (inserted.is_err()) return Result<RealmBlocks>::err(inserted.unwrap_err());

        return realm_blocks(realm.unwrap());
    });
}

Result<RealmBlocks> TreeService::remove_block(const acl::User& user, Key realm_id, int index) {
    return db_.write_transaction([&]() -> Result<RealmBlocks> {
        auto realm = load_writable(user, realm_id);
        if (realm.is_err()) return Result<RealmBlocks>::err(realm.unwrap_err());

        auto count = blocks_.count_by_realm(realm_id);
        if (count.is_err()) return Result<RealmBlocks>::err(count.unwrap_err());
        if (index < 0 || index >= count.unwrap()) {
            return Result<RealmBlocks>::err(Error::validation(
                ValidationRule::IndexOutOfRange,
                "Block position " + std::to_string(index) + " is out of range"));
        }

        auto removed = blocks_.remove_at(realm_id, index);
        if (removed.is_err()) return Result<RealmBlocks>::err(removed.unwrap_err());

        return realm_blocks(realm.unwrap());
    });
}

Result<RealmBlocks> TreeService::swap_blocks(
    const acl::User& user,
    Key realm_id,
    int index_a,
    int index_b
) {
    return db_.write_transaction([&]() -> Result<RealmBlocks> {
        auto realm = load_writable(user, realm_id);
        if (realm.is_err()) return Result<RealmBlocks>::err(realm.unwrap_err());

        auto count = blocks_.count_by_realm(realm_id);
        if (count.is_err()) return Result<RealmBlocks>::err(count.unwrap_err());
        const int n = count.unwrap();
        if (index_a < 0 || index_a >= n || index_b < 0 || index_b >= n) {
            return Result<RealmBlocks>::err(Error::validation(
                ValidationRule::IndexOutOfRange, "Block positions out of range"));
        }

        auto swapped = blocks_.swap(realm_id, index_a, index_b);
        if (swapped.is_err()) return Result<RealmBlocks>::err(swapped.unwrap_err());

        return realm_blocks(realm.unwrap());
    });
}

Result<RealmBlocks> TreeService::move_block_up(const acl::User& user, Key realm_id, int index) {
    return swap_blocks(user, realm_id, index, index - 1);
}

Result<RealmBlocks> TreeService::move_block_down(const acl::User& user, Key realm_id, int index) {
    return swap_blocks(user, realm_id, index, index + 1);
}

Result<RealmBlocks> TreeService::update_block(
    const acl::User& user,
    Key block_id,
    const BlockContent& content
) {
    return db_.write_transaction([&]() -> Result<RealmBlocks> {
        auto block = blocks_.get(block_id);
        if (block.is_err()) return Result<RealmBlocks>::err(block.unwrap_err());
        if (!block.unwrap()) {
            return Result<RealmBlocks>::err(Error::not_found(
                "Block " + std::to_string(block_id) + " does not exist"));
        }
        const auto& stored = *block.unwrap();
        if (get_type(stored.content) != get_type(content)) {
            return Result<RealmBlocks>::err(Error::validation(
                ValidationRule::InvalidValue,
                "Block " + std::to_string(block_id) + " is a " +
                std::string(type_name(get_type(stored.content))) + " block"));
        }

        auto realm = load_writable(user, stored.realm_id);
        if (realm.is_err()) return Result<RealmBlocks>::err(realm.unwrap_err());

        auto refs = check_references(content);
        if (refs.is_err()) return Result<RealmBlocks>::err(refs.unwrap_err());

        auto updated = blocks_.update_content(block_id, content);
        if (updated.is_err()) return Result<RealmBlocks>::err(updated.unwrap_err());

        return realm_blocks(realm.unwrap());
    });
}

Result<RealmBlocks> TreeService::update_title_block(const acl::User& user, Key block_id,
                                                    const Title& title) {
    return update_block(user, block_id, title);
}

Result<RealmBlocks> TreeService::update_text_block(const acl::User& user, Key block_id,
                                                   const Text& text) {
    return update_block(user, block_id, text);
}

Result<RealmBlocks> TreeService::update_series_block(const acl::User& user, Key block_id,
                                                     const SeriesRef& series) {
    return update_block(user, block_id, series);
}

Result<RealmBlocks> TreeService::update_video_block(const acl::User& user, Key block_id,
                                                    const VideoRef& video) {
    return update_block(user, block_id, video);
}

} // namespace atrium::tree
