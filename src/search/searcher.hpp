#pragma once

#include "core/acl.hpp"
#include "core/result.hpp"
#include "core/search.hpp"
#include "search/search_backend.hpp"

#include <string>
#include <vector>

namespace atrium::search {

/**
 * Searcher - Access-filtered search over a SearchBackend.
 *
 * Series documents are public. Event documents carry the event's read roles
 * and are only returned to users the resolver lets read them.
 */
class Searcher {
public:
    Searcher(SearchBackend& backend, acl::Resolver resolver)
        : backend_(backend), resolver_(std::move(resolver)) {}

    [[nodiscard]] Result<std::vector<SearchHit>> search(const std::string& text,
                                                        const acl::User& user,
                                                        int limit = 20);

private:
    SearchBackend& backend_;
    acl::Resolver resolver_;

    [[nodiscard]] bool visible(const SearchHit& hit, const acl::User& user) const;
};

} // namespace atrium::search
