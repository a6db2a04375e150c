#include "resource.hpp"

#include "beasthttp.hpp"
#include "file.hpp"
#include "filehttp.hpp"
#include "httputil.hpp"
#include "log.hpp"

#include <filesystem>

std::unique_ptr<Http> dlsync_make_http(
        const std::string& url, const Config& config)
{
    if (dlsync_is_file_url(url))
        return std::make_unique<FileHttp>();
    return std::make_unique<BeastHttp>(config);
}

CachedResource::CachedResource(
        ResourceDescriptor descriptor,
        const Config& config,
        HttpFactory http_factory)
    : _descriptor(std::move(descriptor))
    , _config(config)
    , _http_factory(std::move(http_factory))
{
    if (!_http_factory)
    {
        _http_factory = [config](const std::string& url) {
            return dlsync_make_http(url, config);
        };
    }

    LOGF("new resource {} -> {}", _descriptor.url, _descriptor.path);
    const auto http = _http_factory(_descriptor.url);
    _remote = dlsync_resolve_remote(*http, _descriptor.url);
}

LocalCacheState CachedResource::local() const
{
    return dlsync_inspect_cache(_descriptor.path);
}

TransferDecision CachedResource::plan() const
{
    return dlsync_decide(_remote, local(), _config.missing_timestamp);
}

TransferDecision CachedResource::fetch(
        ProgressCallback progress, std::function<bool()> is_canceled)
{
    const auto decision = plan();
    LOGF("{}: {} ({})",
         _descriptor.path,
         action_to_string(decision.action),
         reason_to_string(decision.reason));

    if (decision.action != TransferAction::Skip)
    {
        const auto parent =
                std::filesystem::path(_descriptor.path).parent_path();
        if (!parent.empty())
            dlsync_mkdirs(parent.string());
    }

    TransferSession session(_http_factory(_descriptor.url), _config);
    session.update_progress_cb = std::move(progress);
    session.is_canceled = std::move(is_canceled);
    session.run(_descriptor, _remote, decision);

    return decision;
}

bool CachedResource::is_ready() const
{
    const auto state = local();
    return state.exists && state.size == _remote.size &&
           !dlsync_is_outdated(_remote, state, _config.missing_timestamp);
}

std::string CachedResource::local_uri() const
{
    return "file://" +
           std::filesystem::absolute(_descriptor.path).lexically_normal().string();
}
