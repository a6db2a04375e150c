#include "log.hpp"

#include <mutex>

#include <stdarg.h>
#include <stdio.h>

namespace
{
std::mutex g_log_mutex;
LogHandler g_log_handler;

void emit(LogLevel level, const char* text)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_handler)
    {
        g_log_handler(level, text);
        return;
    }
    if (level == LogLevel::Warning)
        fprintf(stderr, "warning: %s\n", text);
    else
        fprintf(stderr, "%s\n", text);
}
}

void dlsync_log(const char* msg, ...)
{
    char buffer[1024];

    va_list args;
    va_start(args, msg);
    vsnprintf(buffer, sizeof(buffer), msg, args);
    va_end(args);

    emit(LogLevel::Info, buffer);
}

void dlsync_warn(const char* msg)
{
    emit(LogLevel::Warning, msg);
}

void dlsync_set_log_handler(LogHandler handler)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_handler = std::move(handler);
}
