#pragma once

#include <stdexcept>
#include <string>

class TransferBusyError : public std::exception
{
public:
    TransferBusyError(std::string msg) : _msg(std::move(msg))
    {
    }

    virtual const char* what() const noexcept override
    {
        return _msg.c_str();
    }

private:
    std::string _msg;
};

// Claims a local path for one transfer session within this process. Throws
// TransferBusyError if another session holds it already.
class PathLock
{
public:
    PathLock(const PathLock&) = delete;
    PathLock(PathLock&&) = delete;
    PathLock& operator=(const PathLock&) = delete;
    PathLock& operator=(PathLock&&) = delete;

    explicit PathLock(const std::string& path);
    ~PathLock();

    const std::string& key() const
    {
        return _key;
    }

private:
    std::string _key;
};

bool dlsync_is_path_locked(const std::string& path);
