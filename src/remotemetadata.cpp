#include "remotemetadata.hpp"

#include "httputil.hpp"
#include "log.hpp"

RemoteMetadata dlsync_resolve_remote(Http& http, const std::string& url)
{
    LOGF("probing {}", url);

    HttpResponseHead head;
    try
    {
        head = http.head(url);
    }
    catch (const HttpError& e)
    {
        throw formatEx<ResolutionError>("cannot probe {}: {}", url, e.what());
    }

    if (head.status < 200 || head.status >= 300)
        throw formatEx<ResolutionError>(
                "cannot probe {}: HTTP status {}", url, head.status);

    if (head.length < 0)
        throw formatEx<ResolutionError>(
                "cannot probe {}: response has unknown length", url);

    RemoteMetadata remote;
    remote.size = head.length;
    remote.last_modified = head.last_modified;
    remote.accept_ranges = head.accept_ranges;
    remote.url = head.url.empty() ? url : head.url;

    if (remote.last_modified)
        LOGF("remote {}: size = {}, last modified = {}",
             remote.url,
             remote.size,
             dlsync_format_http_date(*remote.last_modified));
    else
        LOGF("remote {}: size = {}, no last modified time",
             remote.url,
             remote.size);

    return remote;
}
