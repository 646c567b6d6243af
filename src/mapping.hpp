#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>

namespace camper {

/// Map a single collection/wishlist item JSON object into a CatalogItem.
/// Throws QueryError(Decode) if a field is missing, mistyped, or the
/// "added" date is not valid RFC-2822.
CatalogItem parseCatalogItem(const nlohmann::json& node);

/// Parse a full collection/wishlist response body into a Page.
/// A single bad item fails the whole page.
/// Throws QueryError(Decode) if the expected shape is missing.
Page parsePage(const nlohmann::json& responseBody);

/// JSON request body for one page fetch. The identity is never part of it.
nlohmann::json buildQueryBody(const QueryRequest& request);

} // namespace camper
