#pragma once

#include "policy.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include <cstdint>

class ConfigError : public std::exception
{
public:
    ConfigError(std::string msg) : _msg(std::move(msg))
    {
    }

    virtual const char* what() const noexcept override
    {
        return _msg.c_str();
    }

private:
    std::string _msg;
};

struct Config
{
    // bytes read, written and flushed at once
    uint64_t chunk_size{1024 * 1024};
    // bound on waiting for the response headers of a transfer
    std::chrono::milliseconds header_timeout{30 * 1000};
    // bound on a single body read that makes no progress
    std::chrono::milliseconds stall_timeout{60 * 1000};
    MissingTimestamp missing_timestamp{MissingTimestamp::AlwaysOutdated};
    uint32_t max_redirects{5};
    std::string user_agent{"dlsync/1.0"};
};

// returns the defaults when path does not exist
Config dlsync_load_config(const std::string& path);
void dlsync_save_config(const std::string& path, const Config& config);
