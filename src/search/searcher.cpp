#include "search/searcher.hpp"

#include <algorithm>

namespace atrium::search {

bool Searcher::visible(const SearchHit& hit, const acl::User& user) const {
    const auto& doc = hit.document;
    if (doc.kind == EntityKind::Series || !doc.read_roles) {
        return true;
    }
    return resolver_.can_read(user, acl::AccessTarget{Acl{*doc.read_roles, {}}, std::nullopt});
}

Result<std::vector<SearchHit>> Searcher::search(
    const std::string& text,
    const acl::User& user,
    int limit
) {
    using R = Result<std::vector<SearchHit>>;
    std::vector<SearchHit> out;
    if (limit <= 0) {
        return R::ok(std::move(out));
    }

    // Filtering happens after ranking, so fetch pages until enough hits
    // survive or the backend runs dry.
    const int page = std::max(limit * 2, 20);
    int offset = 0;
    while (static_cast<int>(out.size()) < limit) {
        auto hits = backend_.search(text, page, offset);
        if (hits.is_err()) return hits;

        for (auto& hit : hits.unwrap()) {
            if (!visible(hit, user)) continue;
            out.push_back(std::move(hit));
            if (static_cast<int>(out.size()) == limit) break;
        }
        if (static_cast<int>(hits.unwrap().size()) < page) break;
        offset += page;
    }
    return R::ok(std::move(out));
}

} // namespace atrium::search
