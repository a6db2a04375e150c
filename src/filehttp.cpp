#include "filehttp.hpp"

#include "file.hpp"
#include "httputil.hpp"
#include "log.hpp"

#include <algorithm>

FileHttp::FileHttp(const std::string& path) : override_path(path)
{
}

std::string FileHttp::path_for(const std::string& url) const
{
    if (!override_path.empty())
        return override_path;
    return dlsync_file_url_path(url);
}

HttpResponseHead FileHttp::head(const std::string& url)
{
    const auto path = path_for(url);
    const auto st = dlsync_stat(path);

    HttpResponseHead head;
    head.url = url;
    if (!st.exists || !st.regular)
    {
        head.status = 404;
        return head;
    }

    head.status = 200;
    head.length = st.size;
    head.last_modified = st.last_modified;
    head.accept_ranges = true;
    return head;
}

std::future<HttpResponseHead> FileHttp::start(
        const std::string& url, uint64_t first, uint64_t last)
{
    if (f.is_open())
        throw HttpError("HTTP connection already started");

    std::promise<HttpResponseHead> promise;

    auto head = this->head(url);
    if (head.status != 200)
    {
        promise.set_value(head);
        return promise.get_future();
    }

    const uint64_t size = head.length;
    if (first >= size || last < first)
    {
        head.status = 416;
        head.length = 0;
        promise.set_value(head);
        return promise.get_future();
    }

    last = std::min(last, size - 1);

    f.open(path_for(url), std::ios::binary);
    if (!f)
    {
        promise.set_exception(std::make_exception_ptr(
                formatEx<HttpError>("cannot open {}", path_for(url))));
        return promise.get_future();
    }
    f.seekg(first, std::ios::beg);

    remaining = last - first + 1;
    head.status = first == 0 && last == size - 1 ? 200 : 206;
    head.length = remaining;
    promise.set_value(head);
    return promise.get_future();
}

int64_t FileHttp::read(uint8_t* buffer, uint64_t size)
{
    if (!f.is_open())
        throw HttpError("HTTP connection not started");

    size = std::min(size, remaining);
    if (size == 0)
        return 0;

    f.read(reinterpret_cast<char*>(buffer), size);
    const auto got = f.gcount();
    if (got == 0 && f.bad())
        throw HttpError("read failed");
    remaining -= got;
    return got;
}

void FileHttp::abort()
{
    if (f.is_open())
        f.close();
    remaining = 0;
}

FileHttp::operator bool() const
{
    return f.is_open();
}
