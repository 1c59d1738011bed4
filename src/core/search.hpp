#pragma once

#include "core/mirror.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atrium {

/**
 * SearchDocument - Denormalized subset of a mirrored entity used for ranking
 * and snippeting. `doc_id` is "<kind>:<external id>".
 */
struct SearchDocument {
    std::string doc_id;
    EntityKind kind{EntityKind::Event};
    Key key{0};
    std::string external_id;
    std::string title;
    std::string description;
    std::string creators;       // space separated
    std::string series_title;   // events only
    std::optional<std::vector<std::string>> read_roles;  // nullopt = public
    std::optional<std::string> thumbnail;
    std::optional<int64_t> duration_ms;
    Timestamp created;

    bool operator==(const SearchDocument&) const = default;
};

/**
 * SearchHit - A single search result.
 */
struct SearchHit {
    SearchDocument document;
    std::string snippet;
    double rank{0.0};  // bm25, lower is better

    bool operator==(const SearchHit&) const = default;
};

[[nodiscard]] inline std::string document_id(EntityKind kind, std::string_view external_id) {
    std::string out(entity_kind_name(kind));
    out += ':';
    out += external_id;
    return out;
}

[[nodiscard]] inline SearchDocument make_document(const Series& series) {
    SearchDocument doc;
    doc.doc_id = document_id(EntityKind::Series, series.data.external_id);
    doc.kind = EntityKind::Series;
    doc.key = series.key;
    doc.external_id = series.data.external_id;
    doc.title = series.data.title;
    doc.description = series.data.description.value_or("");
    doc.created = series.data.updated;
    return doc;
}

[[nodiscard]] inline SearchDocument make_document(const Event& event,
                                                  const std::optional<Series>& series) {
    SearchDocument doc;
    doc.doc_id = document_id(EntityKind::Event, event.data.external_id);
    doc.kind = EntityKind::Event;
    doc.key = event.key;
    doc.external_id = event.data.external_id;
    doc.title = event.data.title;
    doc.description = event.data.description.value_or("");
    for (const auto& c : event.data.creators) {
        if (!doc.creators.empty()) doc.creators += ' ';
        doc.creators += c;
    }
    if (series && !series->deleted) {
        doc.series_title = series->data.title;
    }
    doc.read_roles = event.data.acl.read_roles;
    doc.thumbnail = event.data.thumbnail;
    doc.duration_ms = event.data.duration_ms;
    doc.created = event.data.created;
    return doc;
}

/**
 * Turn free text into an FTS5 query: every whitespace separated word becomes
 * a quoted prefix term, so user input can never be parsed as FTS syntax.
 */
[[nodiscard]] inline std::string to_fts_query(std::string_view text) {
    std::string out;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i == start) break;

        std::string term;
        for (char c : text.substr(start, i - start)) {
            if (c == '"') term += "\"\"";
            else term += c;
        }
        if (!out.empty()) out += ' ';
        out += '"';
        out += term;
        out += "\"*";
    }
    return out;
}

/**
 * Move `pos` back to the start of the UTF-8 sequence it points into.
 */
[[nodiscard]] inline size_t utf8_boundary(std::string_view text, size_t pos) {
    if (pos >= text.size()) return text.size();
    while (pos > 0 && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) --pos;
    return pos;
}

/**
 * Create a snippet around the first match of any query word.
 *
 * @param text The full text
 * @param query The user's query
 * @param context_chars Number of characters before/after match to include
 * @return Snippet with ellipsis if truncated
 */
[[nodiscard]] inline std::string create_snippet(
    std::string_view text,
    std::string_view query,
    size_t context_chars = 50
) {
    auto beginning = [&]() {
        if (text.size() <= context_chars * 2) {
            return std::string(text);
        }
        return std::string(text.substr(0, utf8_boundary(text, context_chars * 2))) + "...";
    };

    if (query.empty() || text.empty()) {
        return beginning();
    }

    auto lower = [](std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    };

    const auto lower_text = lower(text);
    size_t match_pos = std::string::npos;
    size_t match_len = 0;

    size_t i = 0;
    while (i < query.size()) {
        while (i < query.size() && std::isspace(static_cast<unsigned char>(query[i]))) ++i;
        size_t start = i;
        while (i < query.size() && !std::isspace(static_cast<unsigned char>(query[i]))) ++i;
        if (i == start) break;
        const auto word = lower(query.substr(start, i - start));
        auto pos = lower_text.find(word);
        if (pos != std::string::npos && pos < match_pos) {
            match_pos = pos;
            match_len = word.size();
        }
    }

    if (match_pos == std::string::npos) {
        return beginning();
    }

    size_t start = utf8_boundary(text, (match_pos > context_chars) ? match_pos - context_chars : 0);
    size_t end = utf8_boundary(text, match_pos + match_len + context_chars);

    std::string snippet;
    if (start > 0) snippet += "...";
    snippet += text.substr(start, end - start);
    if (end < text.size()) snippet += "...";

    return snippet;
}

} // namespace atrium
