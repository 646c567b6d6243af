#include "api_client.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "util.hpp"
#include "version.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef CAMPER_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace camper {

namespace {

http::request<http::string_body>
makeRequest(const std::string& host,
            const std::string& target,
            const std::string& requestBody,
            const std::string& identity) {
    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, kUserAgent);
    if (!identity.empty()) {
        req.set(http::field::cookie, "identity=" + identity);
    }
    req.body() = requestBody;
    req.prepare_payload();
    return req;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

ApiClient::ApiClient(const std::string& baseUrl, int timeoutMs)
    : mTimeoutMs(timeoutMs)
{
    auto parts  = parseUrl(baseUrl);
    mHost       = parts.host;
    mPort       = parts.port;
    mPathPrefix = parts.target;
    mUseSsl     = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef CAMPER_HAS_SSL
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

ApiClient::Response
ApiClient::post(const std::string& path,
                const nlohmann::json& payload,
                const std::string& identity)
{
    const std::string target = mPathPrefix + path;
    const std::string body   = payload.dump();

    if (mVerbose) {
        std::cerr << "[ApiClient] POST " << mHost << ":" << mPort
                  << target << "\n";
        std::cerr << "[ApiClient] Body: " << body << "\n";
    }

    try {
        return mUseSsl ? doHttpsRequest(target, body, identity)
                       : doHttpRequest(target, body, identity);
    } catch (const boost::system::system_error& e) {
        throw QueryError(QueryError::Kind::Transport,
                         "Request to " + mHost + target + " failed: " + e.what());
    }
}

Page ApiClient::fetchPage(const QueryRequest& request)
{
    const std::string& path = endpoints::pathFor(request.kind);
    const Response resp = post(path, buildQueryBody(request), request.identity);

    if (resp.httpStatus < 200 || resp.httpStatus >= 300) {
        throw QueryError(QueryError::Kind::Transport,
                         "HTTP " + std::to_string(resp.httpStatus) +
                         " from " + mHost + mPathPrefix + path);
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw QueryError(QueryError::Kind::Decode,
                         std::string("Failed to parse JSON response: ") + e.what());
    }

    return parsePage(body);
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

ApiClient::Response
ApiClient::doHttpRequest(const std::string& target,
                         const std::string& requestBody,
                         const std::string& identity)
{
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(mHost, mPort);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    auto req = makeRequest(mHost, target, requestBody, identity);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    Response response;
    response.httpStatus = res.result_int();
    response.body       = std::move(res.body());

    if (mVerbose) {
        std::cerr << "[ApiClient] HTTP " << response.httpStatus << "\n";
    }

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected && mVerbose) {
        std::cerr << "[ApiClient] Shutdown: " << ec.message() << "\n";
    }

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

ApiClient::Response
ApiClient::doHttpsRequest(const std::string& target,
                          const std::string& requestBody,
                          const std::string& identity)
{
#ifdef CAMPER_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw QueryError(QueryError::Kind::Transport, "Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(mHost, mPort);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto req = makeRequest(mHost, target, requestBody, identity);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    Response response;
    response.httpStatus = res.result_int();
    response.body       = std::move(res.body());

    if (mVerbose) {
        std::cerr << "[ApiClient] HTTPS " << response.httpStatus << "\n";
    }

    // Many servers close without a close_notify.
    beast::error_code ec;
    stream.shutdown(ec);
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated &&
        mVerbose) {
        std::cerr << "[ApiClient] TLS shutdown: " << ec.message() << "\n";
    }

    return response;
#else
    (void)target;
    (void)requestBody;
    (void)identity;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace camper
