#include <catch2/catch_test_macros.hpp>

#include <QFile>
#include <QTemporaryDir>

#include "app/config.hpp"

using namespace atrium;
using namespace atrium::app;

namespace {

struct CleanEnvironment {
    CleanEnvironment() { clear(); }
    ~CleanEnvironment() { clear(); }

    static void clear() {
        qunsetenv("ATRIUM_DB_PATH");
        qunsetenv("ATRIUM_INDEX_PATH");
        qunsetenv("ATRIUM_HARVEST_URL");
    }
};

} // namespace

TEST_CASE("Config: defaults without a file", "[config]") {
    CleanEnvironment env;
    auto config = load_config(QString{});
    REQUIRE(config.is_ok());
    const auto& c = config.unwrap();
    REQUIRE(c.database_path == QStringLiteral("atrium.db"));
    REQUIRE(c.index_path == QStringLiteral("atrium-index.db"));
    REQUIRE(c.harvest.preferred_amount == 500);
    REQUIRE(c.sync.poll_interval == std::chrono::milliseconds(30000));
    REQUIRE(c.sync.backoff.initial_delay == std::chrono::milliseconds(1000));
    REQUIRE(c.indexer.backoff.max_delay == c.sync.backoff.max_delay);
    REQUIRE(c.roles.admin_role == "ROLE_ADMIN");

    // Sync needs a source; other commands do not.
    REQUIRE(require_harvest_source(c).is_err());
}

TEST_CASE("Config: reads an INI file", "[config]") {
    CleanEnvironment env;
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("atrium.ini"));
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly | QIODevice::Text));
    file.write(
        "[database]\n"
        "path=/var/lib/atrium/mirror.db\n"
        "busy_timeout_ms=250\n"
        "[harvest]\n"
        "base_url=https://opencast.example\n"
        "user=tobira\n"
        "preferred_amount=100\n"
        "[sync]\n"
        "poll_interval_ms=5000\n"
        "backoff_initial_ms=200\n"
        "backoff_max_ms=4000\n"
        "jitter_factor=0\n"
        "[auth]\n"
        "admin_role=ROLE_SUPERUSER\n");
    file.close();

    auto config = load_config(path);
    REQUIRE(config.is_ok());
    const auto& c = config.unwrap();
    REQUIRE(c.database_path == QStringLiteral("/var/lib/atrium/mirror.db"));
    REQUIRE(c.busy_timeout_ms == 250);
    REQUIRE(c.harvest.base_url == QUrl(QStringLiteral("https://opencast.example")));
    REQUIRE(c.harvest.user == QStringLiteral("tobira"));
    REQUIRE(c.harvest.preferred_amount == 100);
    REQUIRE(c.sync.poll_interval == std::chrono::milliseconds(5000));
    REQUIRE(c.sync.backoff.initial_delay == std::chrono::milliseconds(200));
    REQUIRE(c.indexer.backoff.initial_delay == std::chrono::milliseconds(200));
    REQUIRE(c.sync.backoff.jitter_factor == 0.0);
    REQUIRE(c.roles.admin_role == "ROLE_SUPERUSER");
    REQUIRE(require_harvest_source(c).is_ok());
}

TEST_CASE("Config: invalid values name the key", "[config]") {
    CleanEnvironment env;

    auto rejected = [](const QVariantMap& values) {
        auto config = config_from_values(values);
        REQUIRE(config.is_err());
        REQUIRE(config.unwrap_err().kind == ErrorKind::Validation);
        return config.unwrap_err().message;
    };

    REQUIRE(rejected({{QStringLiteral("harvest/preferred_amount"), QStringLiteral("many")}})
                .find("harvest/preferred_amount") != std::string::npos);
    REQUIRE(rejected({{QStringLiteral("sync/poll_interval_ms"), QStringLiteral("-1")}})
                .find("sync/poll_interval_ms") != std::string::npos);
    REQUIRE(rejected({{QStringLiteral("sync/jitter_factor"), QStringLiteral("1.5")}})
                .find("sync/jitter_factor") != std::string::npos);
    REQUIRE(rejected({{QStringLiteral("sync/backoff_initial_ms"), QStringLiteral("5000")},
                      {QStringLiteral("sync/backoff_max_ms"), QStringLiteral("1000")}})
                .find("sync/backoff_max_ms") != std::string::npos);
    REQUIRE(rejected({{QStringLiteral("auth/admin_role"), QString{}}})
                .find("auth/admin_role") != std::string::npos);
}

TEST_CASE("Config: environment overrides", "[config]") {
    CleanEnvironment env;
    qputenv("ATRIUM_DB_PATH", "/tmp/override.db");
    qputenv("ATRIUM_HARVEST_URL", "http://localhost:8080");

    auto config = config_from_values({{QStringLiteral("database/path"), QStringLiteral("file.db")}});
    REQUIRE(config.is_ok());
    REQUIRE(config.unwrap().database_path == QStringLiteral("/tmp/override.db"));
    REQUIRE(config.unwrap().harvest.base_url.host() == QStringLiteral("localhost"));
}

TEST_CASE("Config: a missing file is an error", "[config]") {
    CleanEnvironment env;
    auto config = load_config(QStringLiteral("/nonexistent/atrium.ini"));
    REQUIRE(config.is_err());
    REQUIRE(config.unwrap_err().kind == ErrorKind::NotFound);
}

TEST_CASE("Config: harvest URLs must be http", "[config]") {
    CleanEnvironment env;
    auto config = config_from_values({{QStringLiteral("harvest/base_url"),
                                       QStringLiteral("ftp://opencast.example")}});
    REQUIRE(config.is_ok());
    REQUIRE(require_harvest_source(config.unwrap()).is_err());
}
