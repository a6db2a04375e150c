#pragma once

#include "http.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <stdlib.h>
#include <sys/stat.h>

class TempDir
{
public:
    TempDir()
    {
        char name[] = "/tmp/dlsync-test-XXXXXX";
        REQUIRE(mkdtemp(name) != nullptr);
        _path = name;
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path(const std::string& name) const
    {
        return _path + "/" + name;
    }

private:
    std::string _path;
};

inline std::vector<uint8_t> make_content(size_t size)
{
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i)
        data[i] = static_cast<uint8_t>((i * 31 + 7) % 251);
    return data;
}

inline void write_file(const std::string& path, const std::vector<uint8_t>& data)
{
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(data.data()), data.size());
    REQUIRE(f.good());
}

inline std::vector<uint8_t> read_file(const std::string& path)
{
    std::ifstream f(path, std::ios::binary);
    return std::vector<uint8_t>(
            std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

inline void set_mtime(const std::string& path, int64_t seconds)
{
    struct timespec times[2];
    times[0].tv_sec = seconds;
    times[0].tv_nsec = 0;
    times[1] = times[0];
    REQUIRE(utimensat(AT_FDCWD, path.c_str(), times, 0) == 0);
}

// In memory server for one resource. The script is shared so that a test can
// look at the recorded requests after the session consumed the Http object.
struct Script
{
    std::vector<uint8_t> data;
    std::optional<int64_t> last_modified;

    int head_status{200};
    // answer range requests with the full body and status 200
    bool ignore_range{false};
    // overrides the status of GET responses when non zero
    int get_status{0};
    // overrides the Content-Length of GET responses when >= 0
    int64_t get_length{-1};
    // body bytes served before the connection breaks, -1 never breaks
    int64_t fail_after{-1};
    // GET headers never arrive
    bool never_respond{false};
    // head() and start() throw
    bool unreachable{false};
    // most bytes handed out by a single read()
    uint64_t read_step{7};

    int head_requests{0};
    std::vector<std::pair<uint64_t, uint64_t>> ranges;
};

class ScriptedHttp : public Http
{
public:
    explicit ScriptedHttp(std::shared_ptr<Script> script)
        : _script(std::move(script))
    {
    }

    HttpResponseHead head(const std::string& url) override
    {
        ++_script->head_requests;
        if (_script->unreachable)
            throw HttpError("connect failed: connection refused");

        HttpResponseHead head;
        head.status = _script->head_status;
        head.url = url;
        if (head.status == 200)
        {
            head.length = _script->data.size();
            head.last_modified = _script->last_modified;
            head.accept_ranges = !_script->ignore_range;
        }
        return head;
    }

    std::future<HttpResponseHead> start(
            const std::string& url, uint64_t first, uint64_t last) override
    {
        if (_started)
            throw HttpError("HTTP connection already started");
        if (_script->unreachable)
            throw HttpError("connect failed: connection refused");

        _started = true;
        _script->ranges.emplace_back(first, last);
        _promise.emplace();
        auto future = _promise->get_future();

        if (_script->never_respond)
            return future;

        const uint64_t size = _script->data.size();
        HttpResponseHead head;
        head.url = url;
        head.last_modified = _script->last_modified;
        if (_script->ignore_range || (first == 0 && last + 1 >= size))
        {
            head.status = 200;
            _pos = 0;
            _end = size;
        }
        else
        {
            head.status = 206;
            _pos = std::min(first, size);
            _end = std::min(last + 1, size);
        }
        head.length = _end - _pos;

        if (_script->get_status)
            head.status = _script->get_status;
        if (_script->get_length >= 0)
            head.length = _script->get_length;

        _promise->set_value(head);
        return future;
    }

    int64_t read(uint8_t* buffer, uint64_t size) override
    {
        if (!_started)
            throw HttpError("HTTP connection not started");

        if (_script->fail_after >= 0 &&
            _served >= static_cast<uint64_t>(_script->fail_after))
            throw HttpError("connection reset by peer");

        uint64_t count = std::min({size, _script->read_step, _end - _pos});
        if (_script->fail_after >= 0)
            count = std::min(
                    count,
                    static_cast<uint64_t>(_script->fail_after) - _served);

        std::copy_n(_script->data.data() + _pos, count, buffer);
        _pos += count;
        _served += count;
        return count;
    }

    void abort() override
    {
        _promise.reset();
        _started = false;
    }

    explicit operator bool() const override
    {
        return _started;
    }

private:
    std::shared_ptr<Script> _script;
    std::optional<std::promise<HttpResponseHead>> _promise;
    bool _started{false};
    uint64_t _pos{0};
    uint64_t _end{0};
    uint64_t _served{0};
};

inline std::unique_ptr<Http> scripted_http(const std::shared_ptr<Script>& script)
{
    return std::make_unique<ScriptedHttp>(script);
}
