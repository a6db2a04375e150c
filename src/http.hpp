#pragma once

#include <future>
#include <optional>
#include <stdexcept>
#include <string>

#include <cstdint>

class HttpError : public std::exception
{
public:
    HttpError(std::string msg) : _msg("HttpError: " + std::move(msg))
    {
    }

    virtual const char* what() const noexcept override
    {
        return _msg.c_str();
    }

private:
    std::string _msg;
};

struct HttpResponseHead
{
    int status{0};
    // Content-Length of this response, -1 when the server did not send one
    int64_t length{-1};
    // Last-Modified in unix seconds, empty when absent or unparsable
    std::optional<int64_t> last_modified;
    bool accept_ranges{false};
    // url that answered, after redirects
    std::string url;
};

class Http
{
public:
    virtual ~Http()
    {
    }

    // metadata only request, no body is transferred
    virtual HttpResponseHead head(const std::string& url) = 0;

    // Sends a GET for bytes [first, last] of url. The returned future becomes
    // ready once response headers arrived, or holds an HttpError.
    virtual std::future<HttpResponseHead> start(
            const std::string& url, uint64_t first, uint64_t last) = 0;

    // Reads up to size bytes of the body started by start(). Returns 0 at the
    // end of the body, throws HttpError on a connection failure.
    virtual int64_t read(uint8_t* buffer, uint64_t size) = 0;

    // releases the request, may be called at any point after start()
    virtual void abort() = 0;

    virtual explicit operator bool() const = 0;
};
