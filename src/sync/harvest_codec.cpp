#include "sync/harvest_codec.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QLoggingCategory>
#include <QUrlQuery>

#include <charconv>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace atrium::sync {

Q_LOGGING_CATEGORY(atriumHarvestLog, "atrium.harvest")

namespace {

Error field_error(const QString& context, const char* key, const char* expected) {
    return Error::protocol(context.toStdString() + ": field '" + key + "' must be " + expected);
}

Result<std::string> required_string(const QJsonObject& obj, const char* key,
                                    const QString& context) {
    const auto value = obj.value(QLatin1String(key));
    if (!value.isString()) {
        return Result<std::string>::err(field_error(context, key, "a string"));
    }
    return Result<std::string>::ok(value.toString().toStdString());
}

Result<std::optional<std::string>> optional_string(const QJsonObject& obj, const char* key,
                                                   const QString& context) {
    const auto value = obj.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    if (!value.isString()) {
        return Result<std::optional<std::string>>::err(
            field_error(context, key, "a string or null"));
    }
    return Result<std::optional<std::string>>::ok(value.toString().toStdString());
}

// Qt maps fractional or out-of-range numbers to 0 in toInteger().
std::optional<int64_t> whole_number(const QJsonValue& value) {
    if (!value.isDouble()) return std::nullopt;
    const qint64 n = value.toInteger();
    if (static_cast<double>(n) != value.toDouble()) return std::nullopt;
    return n;
}

Result<int64_t> required_integer(const QJsonObject& obj, const char* key,
                                 const QString& context) {
    const auto value = obj.value(QLatin1String(key));
    const auto n = whole_number(value);
    if (!n) {
        return Result<int64_t>::err(field_error(context, key, "an integer"));
    }
    return Result<int64_t>::ok(*n);
}

Result<std::optional<int64_t>> optional_integer(const QJsonObject& obj, const char* key,
                                                const QString& context) {
    const auto value = obj.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        return Result<std::optional<int64_t>>::ok(std::nullopt);
    }
    const auto n = whole_number(value);
    if (!n) {
        return Result<std::optional<int64_t>>::err(
            field_error(context, key, "an integer or null"));
    }
    return Result<std::optional<int64_t>>::ok(*n);
}

Result<std::vector<std::string>> string_array(const QJsonValue& value, const char* key,
                                              const QString& context) {
    if (value.isUndefined() || value.isNull()) {
        return Result<std::vector<std::string>>::ok({});
    }
    if (!value.isArray()) {
        return Result<std::vector<std::string>>::err(
            field_error(context, key, "an array of strings"));
    }
    std::vector<std::string> out;
    for (const auto& entry : value.toArray()) {
        if (!entry.isString()) {
            return Result<std::vector<std::string>>::err(
                field_error(context, key, "an array of strings"));
        }
        out.push_back(entry.toString().toStdString());
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<std::vector<Track>> decode_tracks(const QJsonObject& obj, const QString& context) {
    const auto value = obj.value(QLatin1String("tracks"));
    if (value.isUndefined() || value.isNull()) {
        return Result<std::vector<Track>>::ok({});
    }
    if (!value.isArray()) {
        return Result<std::vector<Track>>::err(field_error(context, "tracks", "an array"));
    }

    std::vector<Track> tracks;
    for (const auto& entry : value.toArray()) {
        if (!entry.isObject()) {
            return Result<std::vector<Track>>::err(
                field_error(context, "tracks", "an array of objects"));
        }
        const auto t = entry.toObject();

        auto uri = required_string(t, "uri", context);
        if (uri.is_err()) return Result<std::vector<Track>>::err(uri.unwrap_err());
        auto flavor = required_string(t, "flavor", context);
        if (flavor.is_err()) return Result<std::vector<Track>>::err(flavor.unwrap_err());
        auto mimetype = optional_string(t, "mimetype", context);
        if (mimetype.is_err()) return Result<std::vector<Track>>::err(mimetype.unwrap_err());

        Track track{
            .uri = std::move(uri).unwrap(),
            .flavor = std::move(flavor).unwrap(),
            .mimetype = std::move(mimetype).unwrap(),
            .resolution = std::nullopt,
        };

        const auto resolution = t.value(QLatin1String("resolution"));
        if (!resolution.isUndefined() && !resolution.isNull()) {
            const auto dims = resolution.toArray();
            const auto width = dims.size() == 2 ? whole_number(dims[0]) : std::nullopt;
            const auto height = dims.size() == 2 ? whole_number(dims[1]) : std::nullopt;
            constexpr int64_t max_dim = std::numeric_limits<int>::max();
            if (!resolution.isArray() || !width || !height || *width < 0 || *height < 0 ||
                *width > max_dim || *height > max_dim) {
                return Result<std::vector<Track>>::err(
                    field_error(context, "resolution", "a [width, height] pair"));
            }
            track.resolution = std::make_pair(static_cast<int>(*width), static_cast<int>(*height));
        }
        tracks.push_back(std::move(track));
    }
    return Result<std::vector<Track>>::ok(std::move(tracks));
}

Result<ChangeRecord> decode_event(const QJsonObject& obj, const QString& context) {
    auto id = required_string(obj, "id", context);
    if (id.is_err()) return Result<ChangeRecord>::err(id.unwrap_err());
    auto updated = required_integer(obj, "updated", context);
    if (updated.is_err()) return Result<ChangeRecord>::err(updated.unwrap_err());
    auto title = required_string(obj, "title", context);
    if (title.is_err()) return Result<ChangeRecord>::err(title.unwrap_err());
    auto description = optional_string(obj, "description", context);
    if (description.is_err()) return Result<ChangeRecord>::err(description.unwrap_err());
    auto part_of = optional_string(obj, "partOf", context);
    if (part_of.is_err()) return Result<ChangeRecord>::err(part_of.unwrap_err());
    auto duration = optional_integer(obj, "duration", context);
    if (duration.is_err()) return Result<ChangeRecord>::err(duration.unwrap_err());
    auto created = required_integer(obj, "created", context);
    if (created.is_err()) return Result<ChangeRecord>::err(created.unwrap_err());
    auto creators = string_array(obj.value(QLatin1String("creators")), "creators", context);
    if (creators.is_err()) return Result<ChangeRecord>::err(creators.unwrap_err());
    auto thumbnail = optional_string(obj, "thumbnail", context);
    if (thumbnail.is_err()) return Result<ChangeRecord>::err(thumbnail.unwrap_err());
    auto tracks = decode_tracks(obj, context);
    if (tracks.is_err()) return Result<ChangeRecord>::err(tracks.unwrap_err());

    const auto acl_value = obj.value(QLatin1String("acl"));
    if (!acl_value.isObject()) {
        return Result<ChangeRecord>::err(field_error(context, "acl", "an object"));
    }
    const auto acl_obj = acl_value.toObject();
    auto read = string_array(acl_obj.value(QLatin1String("read")), "acl.read", context);
    if (read.is_err()) return Result<ChangeRecord>::err(read.unwrap_err());
    auto write = string_array(acl_obj.value(QLatin1String("write")), "acl.write", context);
    if (write.is_err()) return Result<ChangeRecord>::err(write.unwrap_err());

    EventData event{
        .external_id = std::move(id).unwrap(),
        .part_of = std::move(part_of).unwrap(),
        .title = std::move(title).unwrap(),
        .description = std::move(description).unwrap(),
        .duration_ms = duration.unwrap(),
        .created = Timestamp(created.unwrap()),
        .creators = std::move(creators).unwrap(),
        .thumbnail = std::move(thumbnail).unwrap(),
        .tracks = std::move(tracks).unwrap(),
        .acl = Acl{
            .read_roles = std::move(read).unwrap(),
            .write_roles = std::move(write).unwrap(),
        },
        .updated = Timestamp(updated.unwrap()),
    };
    return Result<ChangeRecord>::ok(UpsertEvent{std::move(event)});
}

Result<ChangeRecord> decode_series(const QJsonObject& obj, const QString& context) {
    auto id = required_string(obj, "id", context);
    if (id.is_err()) return Result<ChangeRecord>::err(id.unwrap_err());
    auto updated = required_integer(obj, "updated", context);
    if (updated.is_err()) return Result<ChangeRecord>::err(updated.unwrap_err());
    auto title = required_string(obj, "title", context);
    if (title.is_err()) return Result<ChangeRecord>::err(title.unwrap_err());
    auto description = optional_string(obj, "description", context);
    if (description.is_err()) return Result<ChangeRecord>::err(description.unwrap_err());

    SeriesData series{
        .external_id = std::move(id).unwrap(),
        .title = std::move(title).unwrap(),
        .description = std::move(description).unwrap(),
        .updated = Timestamp(updated.unwrap()),
    };
    return Result<ChangeRecord>::ok(UpsertSeries{std::move(series)});
}

Result<ChangeRecord> decode_deletion(EntityKind kind, const QJsonObject& obj,
                                     const QString& context) {
    auto id = required_string(obj, "id", context);
    if (id.is_err()) return Result<ChangeRecord>::err(id.unwrap_err());
    auto updated = required_integer(obj, "updated", context);
    if (updated.is_err()) return Result<ChangeRecord>::err(updated.unwrap_err());

    return Result<ChangeRecord>::ok(DeleteEntity{
        .kind = kind,
        .external_id = std::move(id).unwrap(),
        .updated = Timestamp(updated.unwrap()),
    });
}

enum class ItemKind {
    Event,
    EventDeleted,
    Series,
    SeriesDeleted
};

std::optional<ItemKind> parse_item_kind(const QString& name) {
    if (name == QLatin1String("event")) return ItemKind::Event;
    if (name == QLatin1String("event-deleted")) return ItemKind::EventDeleted;
    if (name == QLatin1String("series")) return ItemKind::Series;
    if (name == QLatin1String("series-deleted")) return ItemKind::SeriesDeleted;
    return std::nullopt;
}

Result<ChangeRecord> decode_item(ItemKind kind, const QJsonObject& item, const QString& context) {
    switch (kind) {
        case ItemKind::Event: return decode_event(item, context);
        case ItemKind::EventDeleted: return decode_deletion(EntityKind::Event, item, context);
        case ItemKind::Series: return decode_series(item, context);
        case ItemKind::SeriesDeleted: return decode_deletion(EntityKind::Series, item, context);
    }
    return Result<ChangeRecord>::err(Error::protocol(context.toStdString() + ": bad kind"));
}

} // namespace

Result<HarvestBatch> decode_harvest_response(const QByteArray& body) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(body, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return Result<HarvestBatch>::err(Error::protocol(
            "Harvest response is not valid JSON: " + parse_error.errorString().toStdString()));
    }
    if (!doc.isObject()) {
        return Result<HarvestBatch>::err(
            Error::protocol("Harvest response is not a JSON object"));
    }
    const auto root = doc.object();
    const QString root_context = QStringLiteral("harvest response");

    auto until = required_integer(root, "includesItemsUntil", root_context);
    if (until.is_err()) return Result<HarvestBatch>::err(until.unwrap_err());

    const auto has_more = root.value(QLatin1String("hasMore"));
    if (!has_more.isBool()) {
        return Result<HarvestBatch>::err(field_error(root_context, "hasMore", "a boolean"));
    }

    const auto items = root.value(QLatin1String("items"));
    if (!items.isArray()) {
        return Result<HarvestBatch>::err(field_error(root_context, "items", "an array"));
    }

    HarvestBatch batch;
    batch.next_cursor = cursor_from_since(until.unwrap());
    batch.has_more = has_more.toBool();

    const auto array = items.toArray();
    for (qsizetype i = 0; i < array.size(); ++i) {
        const QString context = QStringLiteral("item %1").arg(i);
        if (!array[i].isObject()) {
            return Result<HarvestBatch>::err(
                Error::protocol(context.toStdString() + " is not an object"));
        }
        const auto item = array[i].toObject();
        const auto kind_name = item.value(QLatin1String("kind")).toString();
        const auto kind = parse_item_kind(kind_name);
        if (!kind) {
            qCWarning(atriumHarvestLog) << "Skipping harvest item of unknown kind" << kind_name
                                        << "at index" << i;
            continue;
        }

        auto record = decode_item(*kind, item, context);
        if (record.is_err()) {
            return Result<HarvestBatch>::err(record.unwrap_err());
        }
        batch.records.push_back(std::move(record).unwrap());
    }

    qCDebug(atriumHarvestLog) << "Decoded" << batch.records.size() << "records until"
                              << until.unwrap() << "hasMore" << batch.has_more;
    return Result<HarvestBatch>::ok(std::move(batch));
}

Result<void> check_http_status(int status) {
    if (status >= 200 && status < 300) {
        return Result<void>::ok();
    }
    if (status == 408 || status == 429 || status >= 500) {
        return Result<void>::err(Error::transient(
            "Harvest endpoint unavailable (HTTP " + std::to_string(status) + ")", status));
    }
    return Result<void>::err(Error::protocol(
        "Harvest endpoint answered HTTP " + std::to_string(status), status));
}

Result<int64_t> cursor_since(const HarvestCursor& cursor) {
    if (cursor.is_initial()) {
        return Result<int64_t>::ok(0);
    }
    int64_t since = 0;
    const auto* first = cursor.token.data();
    const auto* last = first + cursor.token.size();
    const auto [ptr, ec] = std::from_chars(first, last, since);
    if (ec != std::errc{} || ptr != last || since < 0) {
        return Result<int64_t>::err(
            Error::protocol("Stored harvest cursor is not a timestamp: '" + cursor.token + "'"));
    }
    return Result<int64_t>::ok(since);
}

HarvestCursor cursor_from_since(int64_t since) {
    return HarvestCursor{std::to_string(since)};
}

Result<QUrl> harvest_url(const QUrl& base, const HarvestCursor& cursor, int preferred_amount) {
    auto since = cursor_since(cursor);
    if (since.is_err()) {
        return Result<QUrl>::err(since.unwrap_err());
    }

    QUrl url(base);
    QString path = url.path();
    if (path.endsWith(QLatin1Char('/'))) {
        path.chop(1);
    }
    url.setPath(path + QStringLiteral("/tobira/harvest"));

    QUrlQuery query;
    query.addQueryItem(QStringLiteral("since"), QString::number(since.unwrap()));
    query.addQueryItem(QStringLiteral("preferredAmount"), QString::number(preferred_amount));
    url.setQuery(query);
    return Result<QUrl>::ok(url);
}

} // namespace atrium::sync
