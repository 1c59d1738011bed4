#include "storage/realm_repository.hpp"

namespace atrium::storage {

namespace {

constexpr const char* REALM_COLUMNS =
    "id, parent, name, path_segment, full_path, child_order, idx";

// Matches every strict descendant of the realm whose full path is bound to ?1.
// substr instead of LIKE, since segments may contain '_' and '%'.
constexpr const char* IN_SUBTREE = "substr(full_path, 1, length(?1) + 1) = ?1 || '/'";

} // namespace

Realm RealmRepository::row_to_realm(Statement& stmt) {
    return Realm{
        .id = stmt.column_int64(0),
        .parent_id = stmt.column_optional_int64(1),
        .name = stmt.column_text(2),
        .path_segment = stmt.column_text(3),
        .full_path = stmt.column_text(4),
        .child_order = parse_child_order(stmt.column_text(5)).value_or(ChildOrder::AlphabeticAsc),
        .index = stmt.column_int(6)
    };
}

Result<std::optional<Realm>, Error> RealmRepository::fetch_one(Statement& stmt) {
    using R = Result<std::optional<Realm>, Error>;
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(row_to_realm(stmt));
}

Result<std::vector<Realm>, Error> RealmRepository::fetch_all(Statement& stmt) {
    using R = Result<std::vector<Realm>, Error>;
    std::vector<Realm> realms;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return R::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        realms.push_back(row_to_realm(stmt));
    }
    return R::ok(std::move(realms));
}

Result<std::optional<Realm>, Error> RealmRepository::get(Key id) {
    auto stmt_result = db_.prepare(std::string("SELECT ") + REALM_COLUMNS +
                                   " FROM realms WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Realm>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id);
    return fetch_one(stmt);
}

Result<std::optional<Realm>, Error> RealmRepository::get_by_path(const std::string& full_path) {
    auto stmt_result = db_.prepare(std::string("SELECT ") + REALM_COLUMNS +
                                   " FROM realms WHERE full_path = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Realm>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, full_path);
    return fetch_one(stmt);
}

Result<std::vector<Realm>, Error> RealmRepository::children(Key parent_id) {
    auto stmt_result = db_.prepare(std::string("SELECT ") + REALM_COLUMNS +
                                   " FROM realms WHERE parent = ? ORDER BY idx, id;");
    if (stmt_result.is_err()) {
        return Result<std::vector<Realm>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, parent_id);
    return fetch_all(stmt);
}

Result<std::vector<Realm>, Error> RealmRepository::all() {
    auto stmt_result = db_.prepare(std::string("SELECT ") + REALM_COLUMNS +
                                   " FROM realms ORDER BY full_path;");
    if (stmt_result.is_err()) {
        return Result<std::vector<Realm>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return fetch_all(stmt);
}

Result<bool, Error> RealmRepository::segment_taken(
    Key parent_id,
    const std::string& segment,
    std::optional<Key> except
) {
    auto stmt_result = db_.prepare(
        "SELECT 1 FROM realms WHERE parent = ? AND path_segment = ? AND id IS NOT ?;");
    if (stmt_result.is_err()) {
        return Result<bool, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, parent_id).bind_text(2, segment).bind_optional_int64(3, except);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<bool, Error>::err(step_result.unwrap_err());
    }
    return Result<bool, Error>::ok(step_result.unwrap());
}

Result<Realm, Error> RealmRepository::insert(
    const Realm& parent,
    const std::string& name,
    const std::string& segment
) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO realms (parent, name, path_segment, full_path, child_order, idx)
        VALUES (?1, ?2, ?3, ?4, 'alphabetic:asc',
                (SELECT COALESCE(MAX(idx) + 1, 0) FROM realms WHERE parent = ?1));
    )SQL");
    if (stmt_result.is_err()) {
        return Result<Realm, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, parent.id)
        .bind_text(2, name)
        .bind_text(3, segment)
        .bind_text(4, realm_path::join(parent.full_path, segment));
    auto run_result = stmt.run();
    if (run_result.is_err()) {
        return Result<Realm, Error>::err(run_result.unwrap_err());
    }

    auto inserted = get(db_.last_insert_rowid());
    if (inserted.is_err()) {
        return Result<Realm, Error>::err(inserted.unwrap_err());
    }
    if (!inserted.unwrap()) {
        return Result<Realm, Error>::err(Error{"Inserted realm not found"});
    }
    return Result<Realm, Error>::ok(*inserted.unwrap());
}

Result<void, Error> RealmRepository::set_name(Key id, const std::string& name) {
    auto stmt_result = db_.prepare("UPDATE realms SET name = ? WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, name).bind_int64(2, id);
    return stmt.run();
}

Result<void, Error> RealmRepository::change_segment(const Realm& realm, const std::string& segment) {
    const std::string parent_path = realm.full_path.substr(
        0, realm.full_path.size() - realm.path_segment.size() - 1);
    const std::string new_path = realm_path::join(parent_path, segment);

    auto self = db_.prepare("UPDATE realms SET path_segment = ?, full_path = ? WHERE id = ?;");
    if (self.is_err()) {
        return Result<void, Error>::err(self.unwrap_err());
    }
    auto self_stmt = std::move(self).unwrap();
    self_stmt.bind_text(1, segment).bind_text(2, new_path).bind_int64(3, realm.id);
    auto run_result = self_stmt.run();
    if (run_result.is_err()) return run_result;

    auto subtree = db_.prepare(std::string(
        "UPDATE realms SET full_path = ?2 || substr(full_path, length(?1) + 1) WHERE ") +
        IN_SUBTREE + ";");
    if (subtree.is_err()) {
        return Result<void, Error>::err(subtree.unwrap_err());
    }
    auto subtree_stmt = std::move(subtree).unwrap();
    subtree_stmt.bind_text(1, realm.full_path).bind_text(2, new_path);
    return subtree_stmt.run();
}

Result<int, Error> RealmRepository::remove_subtree(const Realm& realm) {
    auto stmt_result = db_.prepare(std::string("DELETE FROM realms WHERE id = ?2 OR ") +
                                   IN_SUBTREE + ";");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, realm.full_path).bind_int64(2, realm.id);
    auto run_result = stmt.run();
    if (run_result.is_err()) {
        return Result<int, Error>::err(run_result.unwrap_err());
    }
    return Result<int, Error>::ok(db_.changes());
}

Result<void, Error> RealmRepository::set_child_order(Key id, ChildOrder order) {
    auto stmt_result = db_.prepare("UPDATE realms SET child_order = ? WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, child_order_name(order)).bind_int64(2, id);
    return stmt.run();
}

Result<void, Error> RealmRepository::set_index(Key id, int index) {
    auto stmt_result = db_.prepare("UPDATE realms SET idx = ? WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int(1, index).bind_int64(2, id);
    return stmt.run();
}

Result<int64_t, Error> RealmRepository::descendant_count(const Realm& realm) {
    auto stmt_result = db_.prepare(std::string("SELECT COUNT(*) FROM realms WHERE ") +
                                   IN_SUBTREE + ";");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, realm.full_path);
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

} // namespace atrium::storage
