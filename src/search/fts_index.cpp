#include "search/fts_index.hpp"

namespace atrium::search {

namespace {

Error as_indexing(Error error) {
    error.kind = ErrorKind::Indexing;
    return error;
}

template<typename T>
Result<T> indexing_result(Result<T> result) {
    if (result.is_err()) {
        return Result<T>::err(as_indexing(result.unwrap_err()));
    }
    return result;
}

constexpr const char* SCHEMA = R"SQL(
    CREATE TABLE IF NOT EXISTS documents (
        rowid INTEGER PRIMARY KEY,
        doc_id TEXT NOT NULL UNIQUE,
        kind TEXT NOT NULL,
        item_key INTEGER NOT NULL,
        external_id TEXT NOT NULL,
        title TEXT NOT NULL,
        description TEXT NOT NULL,
        creators TEXT NOT NULL,
        series_title TEXT NOT NULL,
        public INTEGER NOT NULL,
        thumbnail TEXT,
        duration_ms INTEGER,
        created INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS document_roles (
        doc_rowid INTEGER NOT NULL REFERENCES documents(rowid) ON DELETE CASCADE,
        role TEXT NOT NULL,
        PRIMARY KEY (doc_rowid, role)
    );

    CREATE VIRTUAL TABLE IF NOT EXISTS documents_fts USING fts5(
        title,
        description,
        creators,
        series_title,
        tokenize='unicode61 remove_diacritics 2'
    );
)SQL";

} // namespace

Result<FtsIndex> FtsIndex::open(const std::string& path, int busy_timeout_ms) {
    auto db = storage::Database::open(path, busy_timeout_ms);
    if (db.is_err()) {
        return Result<FtsIndex>::err(as_indexing(db.unwrap_err()));
    }
    FtsIndex index(std::move(db).unwrap());
    auto schema = index.ensure_schema();
    if (schema.is_err()) {
        return Result<FtsIndex>::err(schema.unwrap_err());
    }
    return Result<FtsIndex>::ok(std::move(index));
}

Result<FtsIndex> FtsIndex::open_memory() {
    return open(":memory:");
}

Result<void> FtsIndex::ensure_schema() {
    return indexing_result(db_.execute(SCHEMA));
}

Result<void> FtsIndex::remove_one(const std::string& doc_id) {
    auto stmt_result = db_.prepare(R"SQL(
        DELETE FROM documents_fts WHERE rowid = (SELECT rowid FROM documents WHERE doc_id = ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }
    auto fts = std::move(stmt_result).unwrap();
    fts.bind_text(1, doc_id);
    auto run_result = fts.run();
    if (run_result.is_err()) return run_result;

    stmt_result = db_.prepare("DELETE FROM documents WHERE doc_id = ?;");
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }
    auto docs = std::move(stmt_result).unwrap();
    docs.bind_text(1, doc_id);
    return docs.run();
}

Result<void> FtsIndex::insert_one(const SearchDocument& doc) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO documents (doc_id, kind, item_key, external_id, title, description,
                               creators, series_title, public, thumbnail, duration_ms, created)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, doc.doc_id)
        .bind_text(2, entity_kind_name(doc.kind))
        .bind_int64(3, doc.key)
        .bind_text(4, doc.external_id)
        .bind_text(5, doc.title)
        .bind_text(6, doc.description)
        .bind_text(7, doc.creators)
        .bind_text(8, doc.series_title)
        .bind_int(9, doc.read_roles ? 0 : 1)
        .bind_optional_text(10, doc.thumbnail)
        .bind_optional_int64(11, doc.duration_ms)
        .bind_int64(12, doc.created.millis());
    auto run_result = stmt.run();
    if (run_result.is_err()) return run_result;

    const int64_t rowid = db_.last_insert_rowid();

    if (doc.read_roles) {
        auto roles = db_.prepare(
            "INSERT OR IGNORE INTO document_roles (doc_rowid, role) VALUES (?, ?);");
        if (roles.is_err()) {
            return Result<void>::err(roles.unwrap_err());
        }
        auto role_stmt = std::move(roles).unwrap();
        for (const auto& role : *doc.read_roles) {
            role_stmt.bind_int64(1, rowid).bind_text(2, role);
            auto role_result = role_stmt.run();
            if (role_result.is_err()) return role_result;
            auto reset_result = role_stmt.reset();
            if (reset_result.is_err()) return reset_result;
        }
    }

    auto fts_result = db_.prepare(R"SQL(
        INSERT INTO documents_fts (rowid, title, description, creators, series_title)
        VALUES (?, ?, ?, ?, ?);
    )SQL");
    if (fts_result.is_err()) {
        return Result<void>::err(fts_result.unwrap_err());
    }
    auto fts = std::move(fts_result).unwrap();
    fts.bind_int64(1, rowid)
        .bind_text(2, doc.title)
        .bind_text(3, doc.description)
        .bind_text(4, doc.creators)
        .bind_text(5, doc.series_title);
    return fts.run();
}

Result<void> FtsIndex::upsert(const std::vector<SearchDocument>& documents) {
    return indexing_result(db_.transaction([&]() -> Result<void> {
        for (const auto& doc : documents) {
            auto removed = remove_one(doc.doc_id);
            if (removed.is_err()) return removed;
            auto inserted = insert_one(doc);
            if (inserted.is_err()) return inserted;
        }
        return Result<void>::ok();
    }));
}

Result<void> FtsIndex::remove(const std::vector<std::string>& doc_ids) {
    return indexing_result(db_.transaction([&]() -> Result<void> {
        for (const auto& id : doc_ids) {
            auto removed = remove_one(id);
            if (removed.is_err()) return removed;
        }
        return Result<void>::ok();
    }));
}

Result<void> FtsIndex::clear() {
    return indexing_result(db_.transaction([&]() -> Result<void> {
        return db_.execute(R"SQL(
            DELETE FROM documents_fts;
            DELETE FROM document_roles;
            DELETE FROM documents;
        )SQL");
    }));
}

Result<std::vector<SearchHit>> FtsIndex::search(const std::string& text, int limit, int offset) {
    using R = Result<std::vector<SearchHit>>;
    const auto query = to_fts_query(text);
    if (query.empty()) {
        return R::ok({});
    }

    // Column weights: title, description, creators, series title
    auto stmt_result = db_.prepare(R"SQL(
        SELECT d.rowid, d.doc_id, d.kind, d.item_key, d.external_id, d.title, d.description,
               d.creators, d.series_title, d.public, d.thumbnail, d.duration_ms, d.created,
               bm25(documents_fts, 10.0, 2.0, 4.0, 3.0) AS rank
        FROM documents_fts
        JOIN documents d ON d.rowid = documents_fts.rowid
        WHERE documents_fts MATCH ?
        ORDER BY rank
        LIMIT ? OFFSET ?;
    )SQL");
    if (stmt_result.is_err()) {
        return R::err(as_indexing(stmt_result.unwrap_err()));
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, query).bind_int(2, limit).bind_int(3, offset);

    std::vector<SearchHit> hits;
    std::vector<int64_t> rowids;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return R::err(as_indexing(step_result.unwrap_err()));
        }
        if (!step_result.unwrap()) break;

        SearchDocument doc;
        rowids.push_back(stmt.column_int64(0));
        doc.doc_id = stmt.column_text(1);
        doc.kind = parse_entity_kind(stmt.column_text(2)).value_or(EntityKind::Event);
        doc.key = stmt.column_int64(3);
        doc.external_id = stmt.column_text(4);
        doc.title = stmt.column_text(5);
        doc.description = stmt.column_text(6);
        doc.creators = stmt.column_text(7);
        doc.series_title = stmt.column_text(8);
        if (stmt.column_int(9) == 0) {
            doc.read_roles = std::vector<std::string>{};
        }
        doc.thumbnail = stmt.column_optional_text(10);
        doc.duration_ms = stmt.column_optional_int64(11);
        doc.created = Timestamp(stmt.column_int64(12));

        SearchHit hit;
        hit.snippet = create_snippet(doc.description.empty() ? doc.title : doc.description, text);
        hit.rank = stmt.column_double(13);
        hit.document = std::move(doc);
        hits.push_back(std::move(hit));
    }

    for (size_t i = 0; i < hits.size(); ++i) {
        auto& roles = hits[i].document.read_roles;
        if (!roles) continue;
        auto result = db_.query(
            "SELECT role FROM document_roles WHERE doc_rowid = " + std::to_string(rowids[i]) +
            " ORDER BY role;",
            [&](storage::Statement& row) { roles->push_back(row.column_text(0)); });
        if (result.is_err()) {
            return R::err(as_indexing(result.unwrap_err()));
        }
    }

    return R::ok(std::move(hits));
}

Result<int64_t> FtsIndex::document_count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM documents;");
    if (stmt_result.is_err()) {
        return Result<int64_t>::err(as_indexing(stmt_result.unwrap_err()));
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t>::err(as_indexing(step_result.unwrap_err()));
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

} // namespace atrium::search
