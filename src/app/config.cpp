#include "app/config.hpp"

#include <QFileInfo>
#include <QSettings>
#include <QVariantMap>
#include <QtGlobal>

namespace atrium::app {
namespace {

Error invalid(const char* key, const std::string& detail) {
    return Error::validation(ValidationRule::InvalidValue,
                             std::string("config key '") + key + "' " + detail);
}

Result<int> read_int(const QVariantMap& values, const char* key, int fallback, int min, int max) {
    const auto value = values.value(QLatin1String(key));
    if (!value.isValid()) {
        return Result<int>::ok(fallback);
    }
    bool ok = false;
    const int parsed = value.toString().trimmed().toInt(&ok);
    if (!ok) {
        return Result<int>::err(invalid(key, "is not an integer"));
    }
    if (parsed < min || parsed > max) {
        return Result<int>::err(invalid(key, "must be between " + std::to_string(min) +
                                                 " and " + std::to_string(max)));
    }
    return Result<int>::ok(parsed);
}

Result<double> read_double(const QVariantMap& values, const char* key, double fallback,
                           double min, double max) {
    const auto value = values.value(QLatin1String(key));
    if (!value.isValid()) {
        return Result<double>::ok(fallback);
    }
    bool ok = false;
    const double parsed = value.toString().trimmed().toDouble(&ok);
    if (!ok) {
        return Result<double>::err(invalid(key, "is not a number"));
    }
    if (parsed < min || parsed > max) {
        return Result<double>::err(invalid(key, "must be between " + std::to_string(min) +
                                                    " and " + std::to_string(max)));
    }
    return Result<double>::ok(parsed);
}

QString read_string(const QVariantMap& values, const char* key, const QString& fallback) {
    return values.value(QLatin1String(key), fallback).toString();
}

} // namespace

Result<AppConfig> load_config(const QString& path) {
    QVariantMap values;
    if (!path.isEmpty()) {
        if (!QFileInfo::exists(path)) {
            return Result<AppConfig>::err(
                Error::not_found("Config file not found: " + path.toStdString()));
        }
        QSettings settings(path, QSettings::IniFormat);
        if (settings.status() != QSettings::NoError) {
            return Result<AppConfig>::err(Error::validation(
                ValidationRule::InvalidValue, "Config file is not valid INI: " + path.toStdString()));
        }
        for (const auto& key : settings.allKeys()) {
            values.insert(key, settings.value(key));
        }
    }
    return config_from_values(values);
}

Result<AppConfig> config_from_values(const QVariantMap& values) {
    AppConfig config;
    config.database_path = read_string(values, "database/path", config.database_path);
    config.index_path = read_string(values, "search/index_path", config.index_path);
    config.log_file = read_string(values, "log/file", QString{});

    auto busy = read_int(values, "database/busy_timeout_ms", 5000, 0, 600000);
    if (busy.is_err()) return Result<AppConfig>::err(busy.unwrap_err());
    config.busy_timeout_ms = busy.unwrap();

    auto batch = read_int(values, "search/batch_size", 200, 1, 10000);
    if (batch.is_err()) return Result<AppConfig>::err(batch.unwrap_err());
    config.indexer.batch_size = batch.unwrap();

    config.harvest.base_url = QUrl(read_string(values, "harvest/base_url", QString{}));
    config.harvest.user = read_string(values, "harvest/user", QString{});
    config.harvest.password = read_string(values, "harvest/password", QString{});

    auto amount = read_int(values, "harvest/preferred_amount", 500, 1, 100000);
    if (amount.is_err()) return Result<AppConfig>::err(amount.unwrap_err());
    config.harvest.preferred_amount = amount.unwrap();

    auto timeout = read_int(values, "harvest/timeout_ms", 30000, 100, 3600000);
    if (timeout.is_err()) return Result<AppConfig>::err(timeout.unwrap_err());
    config.harvest.timeout = std::chrono::milliseconds(timeout.unwrap());

    auto poll = read_int(values, "sync/poll_interval_ms", 30000, 0, 86400000);
    if (poll.is_err()) return Result<AppConfig>::err(poll.unwrap_err());
    config.sync.poll_interval = std::chrono::milliseconds(poll.unwrap());

    auto initial = read_int(values, "sync/backoff_initial_ms", 1000, 1, 3600000);
    if (initial.is_err()) return Result<AppConfig>::err(initial.unwrap_err());
    auto max = read_int(values, "sync/backoff_max_ms", 300000, 1, 86400000);
    if (max.is_err()) return Result<AppConfig>::err(max.unwrap_err());
    if (max.unwrap() < initial.unwrap()) {
        return Result<AppConfig>::err(
            invalid("sync/backoff_max_ms", "must not be smaller than sync/backoff_initial_ms"));
    }
    auto multiplier = read_double(values, "sync/backoff_multiplier", 2.0, 1.0, 10.0);
    if (multiplier.is_err()) return Result<AppConfig>::err(multiplier.unwrap_err());
    auto jitter = read_double(values, "sync/jitter_factor", 0.2, 0.0, 1.0);
    if (jitter.is_err()) return Result<AppConfig>::err(jitter.unwrap_err());

    config.sync.backoff = BackoffConfig{
        .initial_delay = std::chrono::milliseconds(initial.unwrap()),
        .max_delay = std::chrono::milliseconds(max.unwrap()),
        .multiplier = multiplier.unwrap(),
        .jitter_factor = jitter.unwrap(),
    };
    config.indexer.backoff = config.sync.backoff;

    config.roles.admin_role =
        read_string(values, "auth/admin_role", QString::fromStdString(config.roles.admin_role))
            .toStdString();
    config.roles.moderator_role =
        read_string(values, "auth/moderator_role",
                    QString::fromStdString(config.roles.moderator_role))
            .toStdString();
    if (config.roles.admin_role.empty()) {
        return Result<AppConfig>::err(invalid("auth/admin_role", "must not be empty"));
    }

    if (const auto db = qEnvironmentVariable("ATRIUM_DB_PATH"); !db.isEmpty()) {
        config.database_path = db;
    }
    if (const auto index = qEnvironmentVariable("ATRIUM_INDEX_PATH"); !index.isEmpty()) {
        config.index_path = index;
    }
    if (const auto url = qEnvironmentVariable("ATRIUM_HARVEST_URL"); !url.isEmpty()) {
        config.harvest.base_url = QUrl(url);
    }

    if (config.database_path.isEmpty()) {
        return Result<AppConfig>::err(invalid("database/path", "must not be empty"));
    }
    if (config.index_path.isEmpty()) {
        return Result<AppConfig>::err(invalid("search/index_path", "must not be empty"));
    }

    return Result<AppConfig>::ok(std::move(config));
}

Result<void> require_harvest_source(const AppConfig& config) {
    const auto& url = config.harvest.base_url;
    if (url.isEmpty()) {
        return Result<void>::err(invalid("harvest/base_url", "is required for sync"));
    }
    if (!url.isValid() || (url.scheme() != QLatin1String("http") &&
                           url.scheme() != QLatin1String("https"))) {
        return Result<void>::err(invalid("harvest/base_url", "must be an http(s) URL"));
    }
    return Result<void>::ok();
}

} // namespace atrium::app
