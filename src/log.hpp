#pragma once

#include <fmt/format.h>

#include <functional>
#include <stdexcept>
#include <string>

#ifdef DLSYNC_ENABLE_LOGGING
#define LOG(msg, ...)                   \
    do                                  \
    {                                   \
        dlsync_log(msg, ##__VA_ARGS__); \
    } while (0)
#define LOGF(msg, ...)                                             \
    do                                                             \
    {                                                              \
        dlsync_log("%s", fmt::format(msg, ##__VA_ARGS__).c_str()); \
    } while (0)
#else
#define LOG(...) \
    do           \
    {            \
    } while (0)
#define LOGF(...) \
    do            \
    {             \
    } while (0)
#endif

// warnings are always compiled in
#define WARNF(msg, ...)                                       \
    do                                                        \
    {                                                         \
        dlsync_warn(fmt::format(msg, ##__VA_ARGS__).c_str()); \
    } while (0)

template <typename E = std::runtime_error, typename... Args>
[[nodiscard]] E formatEx(Args&&... args) {
    return E(fmt::format(std::forward<Args>(args)...));
}

enum class LogLevel
{
    Info,
    Warning,
};

using LogHandler = std::function<void(LogLevel level, const std::string& msg)>;

void dlsync_log(const char* msg, ...);
void dlsync_warn(const char* msg);

// replaces the stderr sink, pass an empty handler to restore it
void dlsync_set_log_handler(LogHandler handler);
