#include "app/cli/search_output.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace atrium::app {

QString format_search_hits(const std::vector<SearchHit>& hits) {
    if (hits.empty()) {
        return QStringLiteral("No results.\n");
    }
    QStringList lines;
    for (const auto& hit : hits) {
        const auto& doc = hit.document;
        lines.append(QString::fromUtf8(entity_kind_name(doc.kind).data()) + QLatin1Char(' ') +
                     QString::fromStdString(doc.external_id) + QStringLiteral("  ") +
                     QString::fromStdString(doc.title));
        if (!hit.snippet.empty()) {
            lines.append(QStringLiteral("    ") + QString::fromStdString(hit.snippet));
        }
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_search_hits_json(const std::vector<SearchHit>& hits) {
    QJsonArray items;
    for (const auto& hit : hits) {
        const auto& doc = hit.document;
        QJsonObject obj;
        obj.insert(QStringLiteral("kind"), QString::fromUtf8(entity_kind_name(doc.kind).data()));
        obj.insert(QStringLiteral("id"), QString::fromStdString(doc.external_id));
        obj.insert(QStringLiteral("title"), QString::fromStdString(doc.title));
        obj.insert(QStringLiteral("snippet"), QString::fromStdString(hit.snippet));
        if (!doc.series_title.empty()) {
            obj.insert(QStringLiteral("seriesTitle"), QString::fromStdString(doc.series_title));
        }
        if (doc.duration_ms) {
            obj.insert(QStringLiteral("durationMs"), static_cast<qint64>(*doc.duration_ms));
        }
        items.append(obj);
    }
    QJsonObject root;
    root.insert(QStringLiteral("hits"), items);
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

} // namespace atrium::app
