#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace camper {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path component (e.g. "/api")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Parse a timeout in milliseconds; accepts 1 .. INT_MAX.
/// Throws std::invalid_argument on anything else.
int parseTimeoutMs(const std::string& text);

/// Parse an RFC-2822 date-time ("Mon, 02 Jan 2006 15:04:05 -0700") and
/// normalise it to UTC. The day-of-week and seconds are optional; the
/// zone may be numeric or one of UT, GMT, Z and the US zone names.
/// Throws std::invalid_argument when the text is not a valid date-time.
std::chrono::system_clock::time_point
parseRfc2822DateTime(const std::string& text);

/// Format a time point as "YYYY-MM-DD HH:MM:SS" in UTC.
std::string formatUtc(std::chrono::system_clock::time_point tp);

/// Synthetic first-page cursor, "<unix_seconds>:0:a::", as seeded by the
/// Bandcamp web client.
std::string makeContinuationToken(std::chrono::system_clock::time_point now);

} // namespace camper
