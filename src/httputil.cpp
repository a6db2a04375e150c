#include "httputil.hpp"

#include "http.hpp"
#include "log.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <cstring>
#include <ctime>

namespace
{
const char* const month_names[] = {"Jan",
                                   "Feb",
                                   "Mar",
                                   "Apr",
                                   "May",
                                   "Jun",
                                   "Jul",
                                   "Aug",
                                   "Sep",
                                   "Oct",
                                   "Nov",
                                   "Dec"};

const char* const day_names[] = {
        "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};

int parse_month(const char* name)
{
    for (int i = 0; i < 12; ++i)
        if (strncmp(name, month_names[i], 3) == 0)
            return i;
    return -1;
}

std::optional<int64_t> make_time(
        int year, int month, int day, int hour, int minute, int second)
{
    if (month < 0 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60)
        return std::nullopt;

    struct tm tm
    {
    };
    tm.tm_year = year - 1900;
    tm.tm_mon = month;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return static_cast<int64_t>(timegm(&tm));
}
}

Url dlsync_parse_url(const std::string& url)
{
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0)
        throw formatEx<HttpError>("invalid url {}", url);

    Url result;
    result.scheme = url.substr(0, scheme_end);

    const auto host_start = scheme_end + 3;
    const auto path_start = url.find('/', host_start);
    std::string authority = url.substr(
            host_start,
            path_start == std::string::npos ? std::string::npos
                                            : path_start - host_start);
    result.target =
            path_start == std::string::npos ? "/" : url.substr(path_start);

    const auto at = authority.rfind('@');
    if (at != std::string::npos)
        authority.erase(0, at + 1);

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos)
    {
        result.host = authority.substr(0, colon);
        result.port = authority.substr(colon + 1);
    }
    else
    {
        result.host = authority;
    }

    if (result.host.size() > 2 && result.host.front() == '[' &&
        result.host.back() == ']')
        result.host = result.host.substr(1, result.host.size() - 2);

    if (result.host.empty())
        throw formatEx<HttpError>("invalid url {}: missing host", url);

    if (result.port.empty())
        result.port = result.scheme == "https" ? "443" : "80";

    return result;
}

std::string dlsync_resolve_location(
        const std::string& base, const std::string& location)
{
    if (location.find("://") != std::string::npos)
        return location;

    const auto url = dlsync_parse_url(base);
    const auto origin = fmt::format("{}://{}:{}", url.scheme, url.host, url.port);

    if (location.compare(0, 2, "//") == 0)
        return fmt::format("{}:{}", url.scheme, location);
    if (!location.empty() && location[0] == '/')
        return origin + location;

    std::string dir = url.target;
    const auto query = dir.find('?');
    if (query != std::string::npos)
        dir.erase(query);
    dir.erase(dir.rfind('/') + 1);
    return origin + dir + location;
}

std::optional<int64_t> dlsync_parse_http_date(const std::string& value)
{
    char day[16] = {0};
    char month[4] = {0};
    int mday, year, hour, minute, second;

    // IMF-fixdate: Sun, 06 Nov 1994 08:49:37 GMT
    if (sscanf(value.c_str(),
               "%3s, %d %3s %d %d:%d:%d GMT",
               day,
               &mday,
               month,
               &year,
               &hour,
               &minute,
               &second) == 7)
        return make_time(year, parse_month(month), mday, hour, minute, second);

    // obsolete RFC 850: Sunday, 06-Nov-94 08:49:37 GMT
    if (sscanf(value.c_str(),
               "%15[A-Za-z], %d-%3s-%d %d:%d:%d GMT",
               day,
               &mday,
               month,
               &year,
               &hour,
               &minute,
               &second) == 7)
    {
        if (year < 100)
            year += year < 70 ? 2000 : 1900;
        return make_time(year, parse_month(month), mday, hour, minute, second);
    }

    // asctime: Sun Nov  6 08:49:37 1994
    if (sscanf(value.c_str(),
               "%3s %3s %d %d:%d:%d %d",
               day,
               month,
               &mday,
               &hour,
               &minute,
               &second,
               &year) == 7)
        return make_time(year, parse_month(month), mday, hour, minute, second);

    return std::nullopt;
}

std::string dlsync_format_http_date(int64_t seconds)
{
    const time_t t = static_cast<time_t>(seconds);
    struct tm tm;
    gmtime_r(&t, &tm);
    return fmt::format(
            "{}, {:02} {} {:04} {:02}:{:02}:{:02} GMT",
            day_names[tm.tm_wday],
            tm.tm_mday,
            month_names[tm.tm_mon],
            tm.tm_year + 1900,
            tm.tm_hour,
            tm.tm_min,
            tm.tm_sec);
}

std::optional<int64_t> dlsync_parse_content_length(const std::string& value)
{
    if (value.empty())
        return std::nullopt;

    int64_t result = 0;
    for (const char ch : value)
    {
        if (ch < '0' || ch > '9')
            return std::nullopt;
        if (result > (INT64_MAX - 9) / 10)
            return std::nullopt;
        result = result * 10 + (ch - '0');
    }
    return result;
}

bool dlsync_is_file_url(const std::string& url)
{
    return url.compare(0, 7, "file://") == 0 ||
           url.find("://") == std::string::npos;
}

std::string dlsync_file_url_path(const std::string& url)
{
    if (url.compare(0, 7, "file://") == 0)
        return url.substr(7);
    return url;
}
