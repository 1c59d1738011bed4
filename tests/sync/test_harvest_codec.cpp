#include <catch2/catch_test_macros.hpp>

#include <QUrlQuery>

#include "sync/harvest_codec.hpp"

using namespace atrium;
using namespace atrium::sync;

namespace {

const QByteArray full_response = R"({
    "includesItemsUntil": 1700000000000,
    "hasMore": true,
    "items": [
        {
            "kind": "series",
            "id": "s1",
            "title": "Linear Algebra",
            "description": null,
            "updated": 1600000000000
        },
        {
            "kind": "event",
            "id": "e1",
            "title": "Lecture 1",
            "description": "Vectors",
            "partOf": "s1",
            "duration": 3600000,
            "created": 1500000000000,
            "creators": ["Ada Lovelace", "Alan Turing"],
            "thumbnail": "https://media.example/e1.jpg",
            "tracks": [
                {"uri": "https://media.example/e1.mp4", "flavor": "presenter/preparing",
                 "mimetype": "video/mp4", "resolution": [1920, 1080]},
                {"uri": "https://media.example/e1.m3u8", "flavor": "presentation/preparing",
                 "mimetype": null, "resolution": null}
            ],
            "acl": {"read": ["ROLE_ANONYMOUS"], "write": ["ROLE_LECTURER"]},
            "updated": 1600000000001
        },
        {"kind": "event-deleted", "id": "e0", "updated": 1600000000002},
        {"kind": "series-deleted", "id": "s0", "updated": 1600000000003}
    ]
})";

} // namespace

TEST_CASE("Harvest codec: decodes a full response", "[sync][harvest]") {
    auto batch = decode_harvest_response(full_response);
    REQUIRE(batch.is_ok());
    const auto& b = batch.unwrap();

    REQUIRE(b.has_more);
    REQUIRE(b.next_cursor == HarvestCursor{"1700000000000"});
    REQUIRE(b.records.size() == 4);

    const auto& series = std::get<UpsertSeries>(b.records[0]).series;
    REQUIRE(series.external_id == "s1");
    REQUIRE(series.title == "Linear Algebra");
    REQUIRE_FALSE(series.description.has_value());
    REQUIRE(series.updated == Timestamp(1600000000000));

    const auto& event = std::get<UpsertEvent>(b.records[1]).event;
    REQUIRE(event.external_id == "e1");
    REQUIRE(event.part_of == std::optional<std::string>("s1"));
    REQUIRE(event.duration_ms == std::optional<int64_t>(3600000));
    REQUIRE(event.created == Timestamp(1500000000000));
    REQUIRE(event.creators == std::vector<std::string>{"Ada Lovelace", "Alan Turing"});
    REQUIRE(event.thumbnail == std::optional<std::string>("https://media.example/e1.jpg"));
    REQUIRE(event.tracks.size() == 2);
    REQUIRE(event.tracks[0].resolution == std::optional<std::pair<int, int>>({1920, 1080}));
    REQUIRE_FALSE(event.tracks[1].mimetype.has_value());
    REQUIRE_FALSE(event.tracks[1].resolution.has_value());
    REQUIRE(event.acl.read_roles == std::vector<std::string>{"ROLE_ANONYMOUS"});
    REQUIRE(event.acl.write_roles == std::vector<std::string>{"ROLE_LECTURER"});

    REQUIRE(b.records[2] == ChangeRecord{DeleteEntity{EntityKind::Event, "e0",
                                                      Timestamp(1600000000002)}});
    REQUIRE(b.records[3] == ChangeRecord{DeleteEntity{EntityKind::Series, "s0",
                                                      Timestamp(1600000000003)}});
}

TEST_CASE("Harvest codec: empty pages and unknown kinds", "[sync][harvest]") {
    SECTION("No items") {
        auto batch = decode_harvest_response(
            R"({"includesItemsUntil": 5, "hasMore": false, "items": []})").unwrap();
        REQUIRE(batch.records.empty());
        REQUIRE_FALSE(batch.has_more);
        REQUIRE(batch.next_cursor == HarvestCursor{"5"});
    }

    SECTION("Unknown kinds are skipped") {
        auto batch = decode_harvest_response(R"({
            "includesItemsUntil": 5, "hasMore": false,
            "items": [
                {"kind": "playlist", "id": "p1", "updated": 1},
                {"kind": "series-deleted", "id": "s1", "updated": 2}
            ]})").unwrap();
        REQUIRE(batch.records.size() == 1);
        REQUIRE(record_external_id(batch.records[0]) == "s1");
    }
}

TEST_CASE("Harvest codec: malformed responses are protocol errors", "[sync][harvest]") {
    const std::vector<QByteArray> bodies{
        "not json",
        "[]",
        R"({"hasMore": false, "items": []})",
        R"({"includesItemsUntil": "5", "hasMore": false, "items": []})",
        R"({"includesItemsUntil": 5, "items": []})",
        R"({"includesItemsUntil": 5, "hasMore": false, "items": {}})",
        R"({"includesItemsUntil": 5, "hasMore": false, "items": [42]})",
        R"({"includesItemsUntil": 5, "hasMore": false,
            "items": [{"kind": "series", "id": "s1", "updated": 1}]})",
        R"({"includesItemsUntil": 5, "hasMore": false,
            "items": [{"kind": "event", "id": "e1", "title": "t", "created": 1, "updated": 1}]})",
        R"({"includesItemsUntil": 5, "hasMore": false,
            "items": [{"kind": "event", "id": "e1", "title": "t", "created": 1, "updated": 1,
                       "acl": {"read": [1]}}]})",
        R"({"includesItemsUntil": 5, "hasMore": false,
            "items": [{"kind": "event", "id": "e1", "title": "t", "created": 1, "updated": 1,
                       "acl": {}, "tracks": [{"uri": "u", "flavor": "f", "resolution": [1]}]}]})",
    };

    for (const auto& body : bodies) {
        auto result = decode_harvest_response(body);
        INFO(body.toStdString());
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Protocol);
        REQUIRE_FALSE(result.unwrap_err().is_retryable());
    }
}

TEST_CASE("Harvest codec: numbers must be whole and in range", "[sync][harvest]") {
    SECTION("Fractional revision") {
        auto result = decode_harvest_response(R"({"includesItemsUntil": 1, "hasMore": false,
            "items": [{"kind": "series", "id": "s", "updated": 1.5, "title": "t"}]})");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Protocol);
        REQUIRE(result.unwrap_err().message.find("updated") != std::string::npos);
    }

    SECTION("Cursor beyond 64 bits does not rewind to the beginning") {
        auto result = decode_harvest_response(
            R"({"includesItemsUntil": 1e30, "hasMore": false, "items": []})");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Protocol);
    }

    SECTION("Fractional duration") {
        auto result = decode_harvest_response(R"({"includesItemsUntil": 5, "hasMore": false,
            "items": [{"kind": "event", "id": "e1", "title": "t", "created": 1, "updated": 1,
                       "duration": 2.25, "acl": {}}]})");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Protocol);
    }

    SECTION("Resolution out of int range") {
        auto result = decode_harvest_response(R"({"includesItemsUntil": 5, "hasMore": false,
            "items": [{"kind": "event", "id": "e1", "title": "t", "created": 1, "updated": 1,
                       "acl": {}, "tracks": [{"uri": "u", "flavor": "f",
                                              "resolution": [1920.5, 5000000000]}]}]})");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Protocol);
    }

    SECTION("Whole numbers written with an exponent are accepted") {
        auto result = decode_harvest_response(
            R"({"includesItemsUntil": 1.7e12, "hasMore": false, "items": []})");
        REQUIRE(result.is_ok());
        REQUIRE(cursor_since(result.unwrap().next_cursor).unwrap() == 1700000000000);
    }
}

TEST_CASE("Harvest codec: HTTP status classification", "[sync][harvest]") {
    REQUIRE(check_http_status(200).is_ok());
    REQUIRE(check_http_status(204).is_ok());

    for (int status : {408, 429, 500, 502, 503, 504}) {
        INFO(status);
        auto result = check_http_status(status);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::TransientHarvest);
        REQUIRE(result.unwrap_err().code == status);
    }

    for (int status : {301, 400, 401, 403, 404}) {
        INFO(status);
        auto result = check_http_status(status);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Protocol);
        REQUIRE_FALSE(result.unwrap_err().is_retryable());
    }
}

TEST_CASE("Harvest codec: cursors", "[sync][harvest]") {
    REQUIRE(cursor_since(HarvestCursor{}).unwrap() == 0);
    REQUIRE(cursor_since(cursor_from_since(1234)).unwrap() == 1234);
    REQUIRE(cursor_since(HarvestCursor{"12ab"}).unwrap_err().kind == ErrorKind::Protocol);
    REQUIRE(cursor_since(HarvestCursor{"-3"}).is_err());
}

TEST_CASE("Harvest codec: request URL", "[sync][harvest]") {
    auto url = harvest_url(QUrl(QStringLiteral("https://oc.example/base/")),
                           cursor_from_since(99), 250).unwrap();
    REQUIRE(url.path() == QStringLiteral("/base/tobira/harvest"));

    const QUrlQuery query(url);
    REQUIRE(query.queryItemValue(QStringLiteral("since")) == QStringLiteral("99"));
    REQUIRE(query.queryItemValue(QStringLiteral("preferredAmount")) == QStringLiteral("250"));

    auto initial = harvest_url(QUrl(QStringLiteral("http://oc.example")), HarvestCursor{}, 10);
    REQUIRE(QUrlQuery(initial.unwrap()).queryItemValue(QStringLiteral("since")) ==
            QStringLiteral("0"));
}
