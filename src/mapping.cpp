#include "mapping.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace camper {

namespace {

const nlohmann::json& requireField(const nlohmann::json& node,
                                   const char* name) {
    if (!node.is_object() || !node.contains(name)) {
        throw QueryError(QueryError::Kind::Decode,
                         std::string("Response missing '") + name + "' field");
    }
    return node[name];
}

std::string requireString(const nlohmann::json& node, const char* name) {
    const auto& value = requireField(node, name);
    if (!value.is_string()) {
        throw QueryError(QueryError::Kind::Decode,
                         std::string("Field '") + name + "' is not a string");
    }
    return value.get<std::string>();
}

} // namespace

CatalogItem parseCatalogItem(const nlohmann::json& node) {
    CatalogItem item;

    const std::string added = requireString(node, "added");
    try {
        item.added = parseRfc2822DateTime(added);
    } catch (const std::invalid_argument& e) {
        throw QueryError(QueryError::Kind::Decode, e.what());
    }

    item.artistName = requireString(node, "band_name");
    item.itemTitle  = requireString(node, "album_title");

    // Literals built in code are signed; parsed text is unsigned.
    const auto& id = requireField(node, "album_id");
    const bool inRange =
        id.is_number_unsigned()
            ? id.get<std::uint64_t>() <= std::numeric_limits<std::uint32_t>::max()
            : id.is_number_integer() && id.get<std::int64_t>() >= 0 &&
                  id.get<std::int64_t>() <= std::numeric_limits<std::uint32_t>::max();
    if (!inRange) {
        throw QueryError(QueryError::Kind::Decode,
                         "Field 'album_id' is not an unsigned 32-bit integer");
    }
    item.itemId = id.get<std::uint32_t>();

    return item;
}

Page parsePage(const nlohmann::json& responseBody) {
    Page page;

    const auto& items = requireField(responseBody, "items");
    if (!items.is_array()) {
        throw QueryError(QueryError::Kind::Decode, "Field 'items' is not an array");
    }
    page.items.reserve(items.size());
    for (const auto& node : items) {
        page.items.push_back(parseCatalogItem(node));
    }

    page.continuationToken = requireString(responseBody, "last_token");

    const auto& more = requireField(responseBody, "more_available");
    if (!more.is_boolean()) {
        throw QueryError(QueryError::Kind::Decode,
                         "Field 'more_available' is not a boolean");
    }
    page.moreAvailable = more.get<bool>();

    return page;
}

nlohmann::json buildQueryBody(const QueryRequest& request) {
    nlohmann::json body;
    body["fan_id"]           = request.fanId;
    body["older_than_token"] = request.continuationToken;
    body["count"]            = QueryRequest::kPageSize;
    return body;
}

} // namespace camper
