#include "util.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace camper {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
    }

    // A base URL's trailing slash would double up with endpoint paths.
    while (!parts.target.empty() && parts.target.back() == '/') {
        parts.target.pop_back();
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    if (parts.port.empty()) {
        throw std::invalid_argument("Invalid URL (empty port): " + url);
    }
    return parts;
}

int parseTimeoutMs(const std::string& text) {
    const bool digitsOnly = !text.empty() &&
        std::all_of(text.begin(), text.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
    if (!digitsOnly || text.size() > 10) {
        throw std::invalid_argument("Invalid timeout: " + text);
    }

    const long long value = std::stoll(text);
    if (value < 1 || value > std::numeric_limits<int>::max()) {
        throw std::invalid_argument("Invalid timeout: " + text);
    }
    return static_cast<int>(value);
}

// ---------------------------------------------------------------------------
// Calendar helpers (proleptic Gregorian, days relative to 1970-01-01)
// ---------------------------------------------------------------------------

namespace {

constexpr std::array<const char*, 7> kDayNames = {
    "sun", "mon", "tue", "wed", "thu", "fri", "sat"};

constexpr std::array<const char*, 12> kMonthNames = {
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec"};

int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t  era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t  era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp  = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
}

// 0 = Sunday
unsigned weekdayFromDays(int64_t z) {
    return static_cast<unsigned>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
}

unsigned daysInMonth(int64_t y, unsigned m) {
    static constexpr std::array<unsigned, 12> kDays = {
        31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    return (m == 2 && leap) ? 29 : kDays[m - 1];
}

/// Minimal cursor over the date text; every failure is reported against
/// the original input.
class DateScanner {
public:
    explicit DateScanner(const std::string& text) : mText(text) {}

    [[noreturn]] void fail(const std::string& why) const {
        throw std::invalid_argument(
            "Invalid RFC-2822 date-time '" + mText + "': " + why);
    }

    void skipSpace() {
        while (mPos < mText.size() && (mText[mPos] == ' ' || mText[mPos] == '\t')) {
            ++mPos;
        }
    }

    bool atEnd() const { return mPos >= mText.size(); }
    char peek() const { return atEnd() ? '\0' : mText[mPos]; }

    bool accept(char c) {
        if (peek() != c) return false;
        ++mPos;
        return true;
    }

    void expect(char c, const char* what) {
        if (!accept(c)) fail(std::string("expected ") + what);
    }

    std::string word() {
        std::string out;
        while (!atEnd() && std::isalpha(static_cast<unsigned char>(peek()))) {
            out.push_back(static_cast<char>(
                std::tolower(static_cast<unsigned char>(mText[mPos++]))));
        }
        return out;
    }

    int64_t number(std::size_t minDigits, std::size_t maxDigits, const char* what) {
        std::size_t count = 0;
        int64_t     value = 0;
        while (!atEnd() && std::isdigit(static_cast<unsigned char>(peek())) &&
               count < maxDigits) {
            value = value * 10 + (mText[mPos++] - '0');
            ++count;
        }
        if (count < minDigits) fail(std::string("expected ") + what);
        return value;
    }

    std::size_t digitsAhead() const {
        std::size_t n = 0;
        while (mPos + n < mText.size() &&
               std::isdigit(static_cast<unsigned char>(mText[mPos + n]))) {
            ++n;
        }
        return n;
    }

private:
    const std::string& mText;
    std::size_t        mPos = 0;
};

template <std::size_t N>
int indexOf(const std::array<const char*, N>& names, const std::string& w) {
    for (std::size_t i = 0; i < N; ++i) {
        if (w == names[i]) return static_cast<int>(i);
    }
    return -1;
}

/// Offset east of UTC in minutes for the obsolete named zones.
bool namedZoneOffset(const std::string& zone, int& minutes) {
    struct Zone { const char* name; int offset; };
    static constexpr std::array<Zone, 11> kZones = {{
        {"ut", 0},         {"gmt", 0},        {"z", 0},
        {"est", -5 * 60},  {"edt", -4 * 60},
        {"cst", -6 * 60},  {"cdt", -5 * 60},
        {"mst", -7 * 60},  {"mdt", -6 * 60},
        {"pst", -8 * 60},  {"pdt", -7 * 60},
    }};
    for (const auto& z : kZones) {
        if (zone == z.name) {
            minutes = z.offset;
            return true;
        }
    }
    return false;
}

} // namespace

std::chrono::system_clock::time_point
parseRfc2822DateTime(const std::string& text) {
    DateScanner in(text);
    in.skipSpace();

    // --- [ day-of-week "," ] ---
    int weekday = -1;
    if (std::isalpha(static_cast<unsigned char>(in.peek()))) {
        weekday = indexOf(kDayNames, in.word());
        if (weekday < 0) in.fail("unknown day of week");
        in.skipSpace();
        in.expect(',', "',' after day of week");
        in.skipSpace();
    }

    // --- date ---
    const auto day = static_cast<unsigned>(in.number(1, 2, "day"));
    in.skipSpace();

    const int monthIndex = indexOf(kMonthNames, in.word());
    if (monthIndex < 0) in.fail("unknown month");
    const auto month = static_cast<unsigned>(monthIndex + 1);
    in.skipSpace();

    const std::size_t yearDigits = in.digitsAhead();
    int64_t year = in.number(2, 9, "year");
    if (yearDigits == 2) {
        year += (year < 50) ? 2000 : 1900;
    } else if (yearDigits == 3) {
        year += 1900;
    }
    in.skipSpace();

    // --- time ---
    const int64_t hour = in.number(2, 2, "hour");
    in.expect(':', "':' after hour");
    const int64_t minute = in.number(2, 2, "minute");
    int64_t second = 0;
    if (in.accept(':')) {
        second = in.number(2, 2, "second");
    }
    in.skipSpace();

    // --- zone ---
    int offsetMinutes = 0;
    if (in.peek() == '+' || in.peek() == '-') {
        const bool negative = in.peek() == '-';
        in.accept(in.peek());
        const int64_t hhmm = in.number(4, 4, "four-digit zone offset");
        if (hhmm % 100 > 59) in.fail("zone minutes out of range");
        offsetMinutes = static_cast<int>((hhmm / 100) * 60 + hhmm % 100);
        if (negative) offsetMinutes = -offsetMinutes;
    } else {
        const std::string zone = in.word();
        if (zone.empty()) in.fail("missing zone");
        if (!namedZoneOffset(zone, offsetMinutes)) in.fail("unknown zone");
    }

    in.skipSpace();
    if (!in.atEnd()) in.fail("trailing characters");

    // --- validation ---
    if (day < 1 || day > daysInMonth(year, month)) in.fail("day out of range");
    if (hour > 23)   in.fail("hour out of range");
    if (minute > 59) in.fail("minute out of range");
    if (second > 60) in.fail("second out of range");
    if (year < 1900) in.fail("year before 1900");

    const int64_t days = daysFromCivil(year, month, day);
    if (weekday >= 0 && static_cast<unsigned>(weekday) != weekdayFromDays(days)) {
        in.fail("day of week does not match date");
    }

    const int64_t epoch = days * 86400 + hour * 3600 + minute * 60 + second
                        - static_cast<int64_t>(offsetMinutes) * 60;

    // system_clock may count nanoseconds, which spans only ~292 years.
    using std::chrono::duration_cast;
    using std::chrono::seconds;
    using std::chrono::system_clock;
    const int64_t lowest  = duration_cast<seconds>(system_clock::duration::min()).count();
    const int64_t highest = duration_cast<seconds>(system_clock::duration::max()).count();
    if (epoch <= lowest || epoch >= highest) in.fail("date out of range");

    return std::chrono::system_clock::time_point(std::chrono::seconds(epoch));
}

std::string formatUtc(std::chrono::system_clock::time_point tp) {
    const int64_t secs = std::chrono::duration_cast<std::chrono::seconds>(
                             tp.time_since_epoch()).count();
    int64_t days = secs / 86400;
    int64_t rem  = secs % 86400;
    if (rem < 0) {
        rem  += 86400;
        days -= 1;
    }

    int64_t  y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civilFromDays(days, y, m, d);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02lld:%02lld:%02lld",
                  static_cast<long long>(y), m, d,
                  static_cast<long long>(rem / 3600),
                  static_cast<long long>((rem % 3600) / 60),
                  static_cast<long long>(rem % 60));
    return buf;
}

std::string makeContinuationToken(std::chrono::system_clock::time_point now) {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                          now.time_since_epoch()).count();
    return std::to_string(secs) + ":0:a::";
}

} // namespace camper
