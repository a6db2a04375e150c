#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <cstdint>

class IoError : public std::exception
{
public:
    IoError(std::string msg) : _msg("IoError: " + std::move(msg))
    {
    }

    virtual const char* what() const noexcept override
    {
        return _msg.c_str();
    }

private:
    std::string _msg;
};

struct FileStat
{
    bool exists;
    uint64_t size;
    int64_t last_modified; // unix seconds
    bool regular;
};

// throws IoError for everything except a missing path
FileStat dlsync_stat(const std::string& path);

void dlsync_mkdirs(const std::string& path);
void dlsync_rm(const std::string& path);
int64_t dlsync_get_size(const std::string& path);
bool dlsync_file_exists(const std::string& path);

// creates file (if it exists, truncates size to 0)
void* dlsync_create(const std::string& path);
// open file for writing, next write will append data to end of it
void* dlsync_append(const std::string& path);

void dlsync_close(void* f);

// writes the whole buffer, returns false on failure (errno is kept)
bool dlsync_write(void* f, const void* buffer, uint32_t size);
// flushes written data to the device
bool dlsync_sync(void* f);
bool dlsync_truncate(void* f, uint64_t size);

std::vector<uint8_t> dlsync_load(const std::string& path);
void dlsync_save(const std::string& path, const void* data, uint32_t size);
