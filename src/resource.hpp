#pragma once

#include "cacheentry.hpp"
#include "config.hpp"
#include "http.hpp"
#include "policy.hpp"
#include "remotemetadata.hpp"
#include "transfer.hpp"

#include <functional>
#include <memory>
#include <string>

using HttpFactory =
        std::function<std::unique_ptr<Http>(const std::string& url)>;

// FileHttp for file:// urls and plain paths, BeastHttp otherwise
std::unique_ptr<Http> dlsync_make_http(
        const std::string& url, const Config& config);

// A remote resource and the local file that caches it. The remote is probed
// once, in the constructor; a failed probe throws ResolutionError.
class CachedResource
{
public:
    using ProgressCallback = std::function<void(
            uint64_t download_offset, uint64_t download_size)>;

    CachedResource(
            ResourceDescriptor descriptor,
            const Config& config = {},
            HttpFactory http_factory = {});

    const ResourceDescriptor& descriptor() const
    {
        return _descriptor;
    }

    const RemoteMetadata& remote() const
    {
        return _remote;
    }

    // re-read from disk on every call
    LocalCacheState local() const;

    TransferDecision plan() const;

    // Plans and executes a transfer, returns the executed decision.
    TransferDecision fetch(
            ProgressCallback progress = {},
            std::function<bool()> is_canceled = {});

    // true when the local file can be handed to an artifact loader
    bool is_ready() const;

    // file:// uri of the local copy
    std::string local_uri() const;

private:
    ResourceDescriptor _descriptor;
    Config _config;
    HttpFactory _http_factory;
    RemoteMetadata _remote;
};
