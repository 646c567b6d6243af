#include "pagination.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <iostream>
#include <iterator>
#include <utility>

namespace camper {

namespace {

const char* kindName(ResourceKind kind) {
    return kind == ResourceKind::Wishlist ? "wishlist" : "collection";
}

} // namespace

Paginator::Paginator(ApiClient& client, bool verbose)
    : Paginator([&client](const QueryRequest& request) {
                    return client.fetchPage(request);
                },
                verbose) {}

Paginator::Paginator(FetchPage fetch, bool verbose, Clock clock)
    : mFetch(std::move(fetch))
    , mClock(std::move(clock))
    , mVerbose(verbose) {}

// ---------------------------------------------------------------------------
// Public: paginated fetch
// ---------------------------------------------------------------------------

std::vector<CatalogItem> Paginator::list(ResourceKind kind,
                                         std::uint32_t fanId,
                                         const std::string& identity)
{
    std::vector<CatalogItem> allItems;
    mStats = Stats{};

    QueryRequest request;
    request.kind              = kind;
    request.fanId             = fanId;
    request.identity          = identity;
    request.continuationToken = makeContinuationToken(mClock());

    // Termination is driven solely by more_available; an empty page with
    // more_available=true keeps going.
    while (true) {
        if (mCancelled.exchange(false)) {
            throw QueryError(QueryError::Kind::Cancelled,
                             std::string("Listing ") + kindName(kind) +
                             " cancelled after " +
                             std::to_string(mStats.totalRequests) + " pages");
        }

        if (mVerbose) {
            std::cerr << "[Paginator] Fetching " << kindName(kind)
                      << " page: fan_id=" << fanId
                      << ", token=" << request.continuationToken << "\n";
        }

        Page page = mFetch(request);
        ++mStats.totalRequests;

        allItems.insert(allItems.end(),
                        std::make_move_iterator(page.items.begin()),
                        std::make_move_iterator(page.items.end()));

        if (mVerbose) {
            std::cerr << "[Paginator] Got " << page.items.size()
                      << " items (total so far: " << allItems.size() << ")\n";
        }

        request.continuationToken = std::move(page.continuationToken);

        if (!page.moreAvailable) {
            if (mVerbose) {
                std::cerr << "[Paginator] No more pages.\n";
            }
            break;
        }
    }

    mCancelled.store(false);
    mStats.totalFetched = static_cast<int>(allItems.size());
    return allItems;
}

} // namespace camper
