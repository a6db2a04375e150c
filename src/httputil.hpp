#pragma once

#include <optional>
#include <string>

#include <cstdint>

struct Url
{
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

// throws HttpError when url is not of the form scheme://host[:port][/target]
Url dlsync_parse_url(const std::string& url);

// resolves a Location header value against the url it was received from
std::string dlsync_resolve_location(
        const std::string& base, const std::string& location);

// parses an IMF-fixdate ("Sun, 06 Nov 1994 08:49:37 GMT") into unix seconds
std::optional<int64_t> dlsync_parse_http_date(const std::string& value);
std::string dlsync_format_http_date(int64_t seconds);

std::optional<int64_t> dlsync_parse_content_length(const std::string& value);

// "file://path" -> "path", plain paths are returned as is
std::string dlsync_file_url_path(const std::string& url);
bool dlsync_is_file_url(const std::string& url);
