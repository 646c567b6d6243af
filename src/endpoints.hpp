#pragma once

#include "models.hpp"

#include <string>

namespace camper {
namespace endpoints {

inline const std::string kDefaultBaseUrl = "https://bandcamp.com";

inline const std::string kCollectionItems = "/api/fancollection/1/collection_items";
inline const std::string kWishlistItems   = "/api/fancollection/1/wishlist_items";

/// Request path for the given resource kind.
inline const std::string& pathFor(ResourceKind kind) {
    switch (kind) {
    case ResourceKind::Wishlist:
        return kWishlistItems;
    case ResourceKind::Collection:
        return kCollectionItems;
    }
    return kCollectionItems;
}

} // namespace endpoints
} // namespace camper
