#include "pathlock.hpp"

#include "log.hpp"

#include <filesystem>
#include <mutex>
#include <set>

namespace
{
std::mutex g_locks_mutex;
std::set<std::string> g_locked_paths;

std::string lock_key(const std::string& path)
{
    return std::filesystem::absolute(path).lexically_normal().string();
}
}

PathLock::PathLock(const std::string& path) : _key(lock_key(path))
{
    std::lock_guard<std::mutex> lock(g_locks_mutex);
    if (!g_locked_paths.insert(_key).second)
        throw formatEx<TransferBusyError>(
                "another transfer to {} is in progress", _key);
    LOGF("locked {}", _key);
}

PathLock::~PathLock()
{
    std::lock_guard<std::mutex> lock(g_locks_mutex);
    g_locked_paths.erase(_key);
    LOGF("unlocked {}", _key);
}

bool dlsync_is_path_locked(const std::string& path)
{
    const auto key = lock_key(path);
    std::lock_guard<std::mutex> lock(g_locks_mutex);
    return g_locked_paths.count(key) != 0;
}
