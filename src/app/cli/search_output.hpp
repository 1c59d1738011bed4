#pragma once

#include <QString>

#include "core/search.hpp"

#include <vector>

namespace atrium::app {

// One block per hit: "<kind> <external id>  <title>" followed by the
// indented snippet, if any.
[[nodiscard]] QString format_search_hits(const std::vector<SearchHit>& hits);

[[nodiscard]] QString format_search_hits_json(const std::vector<SearchHit>& hits);

} // namespace atrium::app
