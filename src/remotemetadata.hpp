#pragma once

#include "http.hpp"

#include <optional>
#include <stdexcept>
#include <string>

#include <cstdint>

class ResolutionError : public std::exception
{
public:
    ResolutionError(std::string msg) : _msg(std::move(msg))
    {
    }

    virtual const char* what() const noexcept override
    {
        return _msg.c_str();
    }

private:
    std::string _msg;
};

struct RemoteMetadata
{
    // unix seconds, empty when the server sent no usable Last-Modified
    std::optional<int64_t> last_modified;
    uint64_t size{0};
    bool accept_ranges{false};
    // url that answered the probe, after redirects
    std::string url;
};

// Probes url without transferring its body. Throws ResolutionError when the
// host is unreachable, the status is not 2xx or the size is unknown.
RemoteMetadata dlsync_resolve_remote(Http& http, const std::string& url);
