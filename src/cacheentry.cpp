#include "cacheentry.hpp"

#include "file.hpp"
#include "log.hpp"

LocalCacheState dlsync_inspect_cache(const std::string& path)
{
    const auto st = dlsync_stat(path);
    if (!st.exists)
    {
        LOGF("cache entry {} does not exist", path);
        return LocalCacheState{false, 0, 0};
    }

    if (!st.regular)
        throw formatEx<IoError>("cache entry {} is not a regular file", path);

    LOGF("cache entry {}: size = {}, mtime = {}",
         path,
         st.size,
         st.last_modified);
    return LocalCacheState{true, st.size, st.last_modified};
}
