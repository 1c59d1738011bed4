#include <catch2/catch_test_macros.hpp>
#include "search/fts_index.hpp"
#include "search/searcher.hpp"

#include <algorithm>

#include "support/test_data.hpp"

using namespace atrium;
using namespace atrium::search;

namespace {

SearchDocument event_doc(const std::string& id, const std::string& title,
                         const std::string& description,
                         std::optional<std::vector<std::string>> roles = std::nullopt) {
    SearchDocument doc;
    doc.doc_id = document_id(EntityKind::Event, id);
    doc.kind = EntityKind::Event;
    doc.key = static_cast<Key>(id.size());
    doc.external_id = id;
    doc.title = title;
    doc.description = description;
    doc.creators = "Ada Lovelace";
    doc.read_roles = std::move(roles);
    doc.duration_ms = 1000;
    doc.created = Timestamp(42);
    return doc;
}

std::vector<std::string> ids_of(const std::vector<SearchHit>& hits) {
    std::vector<std::string> ids;
    for (const auto& hit : hits) ids.push_back(hit.document.external_id);
    return ids;
}

} // namespace

TEST_CASE("FTS index stores and finds documents", "[search][fts]") {
    auto index = FtsIndex::open_memory().unwrap();
    REQUIRE(index.upsert({
        event_doc("e1", "Quantum mechanics", "Introduction to wave functions"),
        event_doc("e2", "Classical mechanics", "Newton and friends"),
        event_doc("e3", "Cooking", "Bread and butter"),
    }).is_ok());
    REQUIRE(index.document_count().unwrap() == 3);

    SECTION("Prefix terms match") {
        auto hits = index.search("mech", 10, 0).unwrap();
        REQUIRE(hits.size() == 2);
    }

    SECTION("Title matches outrank description matches") {
        REQUIRE(index.upsert({event_doc("e4", "Lecture", "Not quantum at all")}).is_ok());
        auto hits = index.search("quantum", 10, 0).unwrap();
        REQUIRE(ids_of(hits) == std::vector<std::string>{"e1", "e4"});
    }

    SECTION("Documents round trip through a hit") {
        auto hits = index.search("cooking", 10, 0).unwrap();
        REQUIRE(hits.size() == 1);
        REQUIRE(hits[0].document == event_doc("e3", "Cooking", "Bread and butter"));
        REQUIRE(hits[0].snippet == "Bread and butter");
    }

    SECTION("Upsert replaces by doc id") {
        REQUIRE(index.upsert({event_doc("e3", "Baking", "Sourdough")}).is_ok());
        REQUIRE(index.document_count().unwrap() == 3);
        REQUIRE(index.search("cooking", 10, 0).unwrap().empty());
        REQUIRE(index.search("sourdough", 10, 0).unwrap().size() == 1);
    }

    SECTION("Remove and clear") {
        REQUIRE(index.remove({document_id(EntityKind::Event, "e1"), "event:unknown"}).is_ok());
        REQUIRE(index.document_count().unwrap() == 2);
        REQUIRE(index.search("quantum", 10, 0).unwrap().empty());

        REQUIRE(index.clear().is_ok());
        REQUIRE(index.document_count().unwrap() == 0);
    }

    SECTION("Query syntax in user input is treated as text") {
        REQUIRE(index.search("\"quantum OR (", 10, 0).is_ok());
        REQUIRE(index.search("   ", 10, 0).unwrap().empty());
    }

    SECTION("Paging") {
        auto first = index.search("mechanics", 1, 0).unwrap();
        auto second = index.search("mechanics", 1, 1).unwrap();
        REQUIRE(first.size() == 1);
        REQUIRE(second.size() == 1);
        REQUIRE(first[0].document.doc_id != second[0].document.doc_id);
    }
}

TEST_CASE("Read roles survive indexing", "[search][fts]") {
    auto index = FtsIndex::open_memory().unwrap();
    REQUIRE(index.upsert({event_doc("e1", "Exam", "Solutions",
                                    std::vector<std::string>{"ROLE_LECTURER", "ROLE_ADMIN"})})
                .is_ok());

    auto hits = index.search("exam", 10, 0).unwrap();
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].document.read_roles ==
            std::vector<std::string>{"ROLE_ADMIN", "ROLE_LECTURER"});
}

TEST_CASE("Searcher filters hits by read access", "[search][acl]") {
    auto index = FtsIndex::open_memory().unwrap();
    REQUIRE(index.upsert({
        event_doc("open", "Lecture open", "", std::vector<std::string>{"ROLE_ANONYMOUS"}),
        event_doc("closed", "Lecture closed", "", std::vector<std::string>{"ROLE_STAFF"}),
    }).is_ok());

    SearchDocument series;
    series.doc_id = document_id(EntityKind::Series, "s1");
    series.kind = EntityKind::Series;
    series.external_id = "s1";
    series.title = "Lecture series";
    REQUIRE(index.upsert({series}).is_ok());

    Searcher searcher(index, acl::Resolver{});

    SECTION("Anonymous users see public events and series") {
        auto hits = searcher.search("lecture", acl::User::anonymous()).unwrap();
        auto ids = ids_of(hits);
        std::sort(ids.begin(), ids.end());
        REQUIRE(ids == std::vector<std::string>{"open", "s1"});
    }

    SECTION("Matching roles unlock events") {
        auto hits = searcher.search("closed", test::plain_user("sue", {"ROLE_STAFF"})).unwrap();
        REQUIRE(ids_of(hits) == std::vector<std::string>{"closed"});
    }

    SECTION("Admins see everything") {
        REQUIRE(searcher.search("lecture", test::admin()).unwrap().size() == 3);
    }

    SECTION("The limit applies after filtering") {
        REQUIRE(searcher.search("lecture", acl::User::anonymous(), 1).unwrap().size() == 1);
        REQUIRE(searcher.search("lecture", acl::User::anonymous(), 0).unwrap().empty());
    }
}
