#pragma once

#include "core/mirror.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>
#include <QUrl>

#include <cstdint>

namespace atrium::sync {

/**
 * Decode one harvest response body.
 *
 * Unknown item kinds are skipped with a warning. A known item with a missing
 * or mistyped required field, or a body that is not the expected JSON
 * object, fails with ErrorKind::Protocol.
 */
[[nodiscard]] Result<HarvestBatch> decode_harvest_response(const QByteArray& body);

/**
 * Classify the HTTP status of a harvest reply. 2xx passes; 408, 429 and
 * 5xx are transient; any other status is a protocol error.
 */
[[nodiscard]] Result<void> check_http_status(int status);

/**
 * The `since` timestamp a cursor stands for; 0 for the initial cursor.
 */
[[nodiscard]] Result<int64_t> cursor_since(const HarvestCursor& cursor);

[[nodiscard]] HarvestCursor cursor_from_since(int64_t since);

/**
 * `<base>/tobira/harvest?since=<ms>&preferredAmount=<n>`
 */
[[nodiscard]] Result<QUrl> harvest_url(const QUrl& base, const HarvestCursor& cursor,
                                       int preferred_amount);

} // namespace atrium::sync
