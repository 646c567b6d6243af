#pragma once

#include "endpoints.hpp"
#include "models.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace camper {

/// HTTP client for the fan-collection API, built on Boost.Beast.
/// Sends one JSON-encoded POST per call; nothing is retried.
class ApiClient {
public:
    struct Response {
        unsigned int httpStatus = 0;
        std::string  body;
    };

    /// @param baseUrl    Scheme and host, optionally with a port and path
    ///                   prefix, e.g. "https://bandcamp.com"
    /// @param timeoutMs  Per-operation timeout in milliseconds
    explicit ApiClient(const std::string& baseUrl = endpoints::kDefaultBaseUrl,
                       int timeoutMs = 10000);

    /// POST @p payload to @p path (appended to the base URL's path).
    /// A non-empty @p identity is sent verbatim as the "identity" cookie.
    /// @throws QueryError(Transport) on resolve / connect / TLS / timeout errors.
    Response post(const std::string& path,
                  const nlohmann::json& payload,
                  const std::string& identity = "");

    /// Fetch and decode one page of collection or wishlist items.
    /// @throws QueryError(Transport) on network errors or a non-2xx status,
    ///         QueryError(Decode) when the body does not decode.
    Page fetchPage(const QueryRequest& request);

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mHost;
    std::string mPort;
    std::string mPathPrefix;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    Response doHttpRequest(const std::string& target,
                           const std::string& requestBody,
                           const std::string& identity);
    Response doHttpsRequest(const std::string& target,
                            const std::string& requestBody,
                            const std::string& identity);
};

} // namespace camper
