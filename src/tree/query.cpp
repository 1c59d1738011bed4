#include "tree/query.hpp"

#include <algorithm>

namespace atrium::tree {

using namespace blocks;

Query::Query(storage::Database& db, acl::Resolver resolver)
    : db_(db)
    , resolver_(std::move(resolver))
    , realms_(db)
    , blocks_(db)
    , mirror_(db) {}

Result<std::optional<Realm>> Query::realm_by_id(Key id) {
    return realms_.get(id);
}

Result<std::optional<Realm>> Query::realm_by_path(const std::string& full_path) {
    // "/" and "" both address the root
    if (full_path == "/") {
        return realms_.get_by_path("");
    }
    if (full_path.size() > 1 && full_path.back() == '/') {
        return realms_.get_by_path(full_path.substr(0, full_path.size() - 1));
    }
    return realms_.get_by_path(full_path);
}

Result<std::vector<Realm>> Query::children(Key id) {
    using R = Result<std::vector<Realm>>;
    auto realm = realms_.get(id);
    if (realm.is_err()) return R::err(realm.unwrap_err());
    if (!realm.unwrap()) {
        return R::err(Error::not_found("Realm " + std::to_string(id) + " does not exist"));
    }

    auto list = realms_.children(id);
    if (list.is_err()) return list;
    auto out = std::move(list).unwrap();
    sort_children(out, realm.unwrap()->child_order);
    return R::ok(std::move(out));
}

Result<std::optional<RealmContent>> Query::realm_content(const acl::User& user, Key id) {
    using R = Result<std::optional<RealmContent>>;
    return db_.transaction([&]() -> R {
        auto realm = realms_.get(id);
        if (realm.is_err()) return R::err(realm.unwrap_err());
        if (!realm.unwrap()) return R::ok(std::nullopt);

        auto content = load_content(user, *realm.unwrap());
        if (content.is_err()) return R::err(content.unwrap_err());
        return R::ok(std::move(content).unwrap());
    });
}

Result<std::optional<RealmContent>> Query::realm_content_by_path(
    const acl::User& user,
    const std::string& full_path
) {
    using R = Result<std::optional<RealmContent>>;
    return db_.transaction([&]() -> R {
        auto realm = realm_by_path(full_path);
        if (realm.is_err()) return R::err(realm.unwrap_err());
        if (!realm.unwrap()) return R::ok(std::nullopt);

        auto content = load_content(user, *realm.unwrap());
        if (content.is_err()) return R::err(content.unwrap_err());
        return R::ok(std::move(content).unwrap());
    });
}

Result<RealmContent> Query::load_content(const acl::User& user, const Realm& realm) {
    auto list = blocks_.get_by_realm(realm.id);
    if (list.is_err()) return Result<RealmContent>::err(list.unwrap_err());

    RealmContent content{realm, {}};
    for (auto& block : list.unwrap()) {
        auto resolved = resolve(user, std::move(block));
        if (resolved.is_err()) return Result<RealmContent>::err(resolved.unwrap_err());
        content.blocks.push_back(std::move(resolved).unwrap());
    }
    return Result<RealmContent>::ok(std::move(content));
}

Result<ResolvedBlock> Query::resolve(const acl::User& user, Block block) {
    ResolvedBlock out{.block = std::move(block)};

    if (const auto* series_ref = std::get_if<SeriesRef>(&out.block.content)) {
        out.state = RefState::Deleted;
        if (!series_ref->series) return Result<ResolvedBlock>::ok(std::move(out));

        auto series = mirror_.series_by_key(*series_ref->series);
        if (series.is_err()) return Result<ResolvedBlock>::err(series.unwrap_err());
        if (!series.unwrap() || series.unwrap()->deleted) {
            return Result<ResolvedBlock>::ok(std::move(out));
        }

        auto events = mirror_.live_events_of_series(series.unwrap()->data.external_id);
        if (events.is_err()) return Result<ResolvedBlock>::err(events.unwrap_err());
        for (auto& event : events.unwrap()) {
            if (resolver_.can_read(user, event)) {
                out.events.push_back(std::move(event));
            }
        }
        // Stored oldest first
        if (series_ref->order == VideoListOrder::NewToOld) {
            std::reverse(out.events.begin(), out.events.end());
        }

        out.state = RefState::Live;
        out.series = std::move(*series.unwrap());
    } else if (const auto* video_ref = std::get_if<VideoRef>(&out.block.content)) {
        out.state = RefState::Deleted;
        if (!video_ref->event) return Result<ResolvedBlock>::ok(std::move(out));

        auto event = mirror_.event_by_key(*video_ref->event);
        if (event.is_err()) return Result<ResolvedBlock>::err(event.unwrap_err());
        if (!event.unwrap() || event.unwrap()->deleted) {
            return Result<ResolvedBlock>::ok(std::move(out));
        }
        if (!resolver_.can_read(user, *event.unwrap())) {
            out.state = RefState::Forbidden;
            return Result<ResolvedBlock>::ok(std::move(out));
        }

        out.state = RefState::Live;
        out.event = std::move(*event.unwrap());
    }

    return Result<ResolvedBlock>::ok(std::move(out));
}

Result<std::vector<Realm>> Query::ancestors(Key id) {
    using R = Result<std::vector<Realm>>;
    auto realm = realms_.get(id);
    if (realm.is_err()) return R::err(realm.unwrap_err());
    if (!realm.unwrap()) {
        return R::err(Error::not_found("Realm " + std::to_string(id) + " does not exist"));
    }

    std::vector<Realm> chain;
    auto parent_id = realm.unwrap()->parent_id;
    while (parent_id) {
        auto parent = realms_.get(*parent_id);
        if (parent.is_err()) return R::err(parent.unwrap_err());
        if (!parent.unwrap()) break;
        parent_id = parent.unwrap()->parent_id;
        chain.push_back(std::move(*parent.unwrap()));
    }
    std::reverse(chain.begin(), chain.end());
    return R::ok(std::move(chain));
}

Result<int64_t> Query::descendant_count(Key id) {
    auto realm = realms_.get(id);
    if (realm.is_err()) return Result<int64_t>::err(realm.unwrap_err());
    if (!realm.unwrap()) {
        return Result<int64_t>::err(Error::not_found("Realm " + std::to_string(id) + " does not exist"));
    }
    return realms_.descendant_count(*realm.unwrap());
}

} // namespace atrium::tree
