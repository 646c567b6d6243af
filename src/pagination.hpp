#pragma once

#include "api_client.hpp"
#include "models.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace camper {

/// Drains a collection or wishlist by following continuation tokens until
/// the server reports that no more pages are available.
///
/// One instance serves one list() at a time; run independent queries on
/// separate instances. Stats describe the most recent list() call.
class Paginator {
public:
    using FetchPage = std::function<Page(const QueryRequest&)>;
    using Clock     = std::function<std::chrono::system_clock::time_point()>;

    struct Stats {
        int totalFetched  = 0;
        int totalRequests = 0;
    };

    /// Fetch pages through @p client.
    explicit Paginator(ApiClient& client, bool verbose = false);

    /// Fetch pages through an arbitrary page source. @p clock seeds the
    /// first continuation token.
    Paginator(FetchPage fetch, bool verbose = false, Clock clock = systemClock);

    /// Return every item of the fan's collection or wishlist in server order.
    /// The identity cookie is passed through untouched; it is needed only to
    /// see private or hidden items.
    /// @throws QueryError on any transport / decode failure or after cancel();
    ///         no partial result is returned.
    std::vector<CatalogItem> list(ResourceKind kind,
                                  std::uint32_t fanId,
                                  const std::string& identity = "");

    /// Stop before the next page fetch. Safe to call from another thread.
    /// The request is consumed by the list() it cancels, or cleared when
    /// that list() completes; a cancel issued before list() applies to it.
    void cancel() { mCancelled.store(true); }

    Stats getStats() const { return mStats; }

    static std::chrono::system_clock::time_point systemClock() {
        return std::chrono::system_clock::now();
    }

private:
    FetchPage         mFetch;
    Clock             mClock;
    bool              mVerbose;
    Stats             mStats{};
    std::atomic<bool> mCancelled{false};
};

} // namespace camper
