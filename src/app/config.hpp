#pragma once

#include "core/acl.hpp"
#include "core/result.hpp"
#include "search/indexer.hpp"
#include "sync/http_harvest_client.hpp"
#include "sync/state_machine.hpp"

#include <QString>
#include <QVariantMap>

namespace atrium::app {

/**
 * AppConfig - Everything atriumd reads from its INI file.
 */
struct AppConfig {
    QString database_path = QStringLiteral("atrium.db");
    int busy_timeout_ms = 5000;
    QString index_path = QStringLiteral("atrium-index.db");
    search::IndexerConfig indexer;
    sync::HarvestClientConfig harvest;
    sync::SyncConfig sync;
    acl::RoleConfig roles;
    QString log_file;
};

/**
 * Load the INI file at `path` (defaults only if empty) and apply the
 * ATRIUM_DB_PATH, ATRIUM_INDEX_PATH and ATRIUM_HARVEST_URL overrides.
 *
 * Fails with NotFound if an explicitly given file does not exist, and with a
 * Validation error naming the key if a value is out of range.
 */
[[nodiscard]] Result<AppConfig> load_config(const QString& path);

/**
 * Build a config from "group/key" values, then apply the environment
 * overrides. load_config() reads the file into such a map.
 */
[[nodiscard]] Result<AppConfig> config_from_values(const QVariantMap& values);

/**
 * Checks what only the sync command needs: a usable harvest URL.
 */
[[nodiscard]] Result<void> require_harvest_source(const AppConfig& config);

} // namespace atrium::app
