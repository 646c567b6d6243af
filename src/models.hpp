#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace camper {

/// The two fan-collection resources exposed by the API.
enum class ResourceKind {
    Collection,
    Wishlist,
};

/// One purchased or wishlisted release; usually an album, sometimes a track.
struct CatalogItem {
    std::chrono::system_clock::time_point added;   // UTC
    std::string   artistName;                      // wire: band_name
    std::uint32_t itemId = 0;                      // wire: album_id
    std::string   itemTitle;                       // wire: album_title
};

/// One page of results returned by a collection or wishlist query.
struct Page {
    std::vector<CatalogItem> items;
    std::string              continuationToken;    // wire: last_token
    bool                     moreAvailable = false;
};

/// Parameters for a single page fetch.
struct QueryRequest {
    /// Matches what the Bandcamp web client sends; larger values make the
    /// server misbehave.
    static constexpr std::uint32_t kPageSize = 20;

    ResourceKind  kind = ResourceKind::Collection;
    std::uint32_t fanId = 0;
    std::string   continuationToken;
    std::string   identity;    // opaque session cookie, may be empty
};

} // namespace camper
