#include "file.hpp"

#include "log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <stdint.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

FileStat dlsync_stat(const std::string& path)
{
    struct stat s;
    if (stat(path.c_str(), &s) < 0)
    {
        if (errno == ENOENT || errno == ENOTDIR)
            return FileStat{false, 0, 0, false};
        throw formatEx<IoError>("stat({}) failed: {}", path, strerror(errno));
    }

    return FileStat{
            true,
            static_cast<uint64_t>(s.st_size),
            static_cast<int64_t>(s.st_mtime),
            S_ISREG(s.st_mode) != 0};
}

bool dlsync_file_exists(const std::string& path)
{
    struct stat s;
    return stat(path.c_str(), &s) == 0;
}

int64_t dlsync_get_size(const std::string& path)
{
    struct stat s;
    if (stat(path.c_str(), &s) < 0)
        return -1;
    return s.st_size;
}

void dlsync_mkdirs(const std::string& ppath)
{
    std::string path = ppath;
    path.push_back('/');
    auto ptr = path.begin();
    if (ptr != path.end() && *ptr == '/')
        ++ptr;
    while (true)
    {
        ptr = std::find(ptr, path.end(), '/');
        if (ptr == path.end())
            break;

        char last = *ptr;
        *ptr = 0;
        LOG("mkdir %s", path.c_str());
        int err = mkdir(path.c_str(), 0777);
        if (err < 0 && errno != EEXIST)
            throw formatEx<IoError>(
                    "mkdir({}) failed: {}", path.c_str(), strerror(errno));
        *ptr = last;
        ++ptr;
    }
}

void dlsync_rm(const std::string& path)
{
    if (unlink(path.c_str()) < 0 && errno != ENOENT)
        throw formatEx<IoError>("unlink({}) failed: {}", path, strerror(errno));
}

void* dlsync_create(const std::string& path)
{
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0666);
    if (fd < 0)
        return NULL;

    return (void*)(intptr_t)fd;
}

void* dlsync_append(const std::string& path)
{
    int fd = open(path.c_str(), O_WRONLY | O_APPEND);
    if (fd < 0)
        return NULL;

    return (void*)(intptr_t)fd;
}

void dlsync_close(void* f)
{
    close((intptr_t)f);
}

bool dlsync_write(void* f, const void* buffer, uint32_t size)
{
    const char* data8 = static_cast<const char*>(buffer);
    while (size != 0)
    {
        const auto written = write((intptr_t)f, data8, size);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        if (written == 0)
        {
            errno = ENOSPC;
            return false;
        }
        data8 += written;
        size -= written;
    }
    return true;
}

bool dlsync_sync(void* f)
{
    return fdatasync((intptr_t)f) == 0;
}

bool dlsync_truncate(void* f, uint64_t size)
{
    return ftruncate((intptr_t)f, size) == 0;
}

std::vector<uint8_t> dlsync_load(const std::string& path)
{
    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0)
        throw formatEx<IoError>("open({}) failed: {}", path, strerror(errno));

    const auto size = lseek(fd, 0, SEEK_END);
    lseek(fd, 0, SEEK_SET);

    std::vector<uint8_t> data(size);

    size_t total = 0;
    while (total < data.size())
    {
        const auto readsize = read(fd, data.data() + total, data.size() - total);
        if (readsize < 0)
        {
            const int err = errno;
            close(fd);
            throw formatEx<IoError>("read({}) failed: {}", path, strerror(err));
        }
        if (readsize == 0)
            break;
        total += readsize;
    }

    data.resize(total);

    close(fd);

    return data;
}

void dlsync_save(const std::string& path, const void* data, uint32_t size)
{
    void* f = dlsync_create(path);
    if (!f)
        throw formatEx<IoError>("open({}) failed: {}", path, strerror(errno));

    const bool ok = dlsync_write(f, data, size);
    const int err = errno;
    dlsync_close(f);

    if (!ok)
        throw formatEx<IoError>("write({}) failed: {}", path, strerror(err));
}
