#pragma once

#include <string>

#include <cstdint>

struct LocalCacheState
{
    bool exists;
    uint64_t size;
    int64_t last_modified; // unix seconds, 0 when the entry does not exist
};

// Reads the state of the cache entry at path. A missing entry is not an
// error; permission and device failures raise IoError, as does a path that
// is not a regular file.
LocalCacheState dlsync_inspect_cache(const std::string& path);
