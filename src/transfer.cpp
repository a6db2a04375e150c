#include "transfer.hpp"

#include "file.hpp"
#include "log.hpp"
#include "pathlock.hpp"

#include <fmt/format.h>

#include <boost/scope_exit.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

std::string state_to_string(TransferState state)
{
    switch (state)
    {
    case TransferState::Idle:
        return "idle";
    case TransferState::RequestSent:
        return "request sent";
    case TransferState::Streaming:
        return "streaming";
    case TransferState::Completed:
        return "completed";
    case TransferState::Failed:
        return "failed";
    }
    return "unknown";
}

TransferSession::TransferSession(
        std::unique_ptr<Http> http, const Config& config)
    : _http(std::move(http))
    , _chunk_size(config.chunk_size)
    , _header_timeout(config.header_timeout)
{
    if (_chunk_size == 0 || _chunk_size > UINT32_MAX)
        throw formatEx<ConfigError>(
                "invalid chunk_size value: {}", config.chunk_size);
}

void TransferSession::update_progress()
{
    if (update_progress_cb)
        update_progress_cb(_download_offset, _download_size);
}

void TransferSession::open_output(const TransferDecision& decision)
{
    if (decision.action == TransferAction::Restart)
    {
        LOGF("restarting download of {}: {}",
             _path,
             reason_to_string(decision.reason));
        dlsync_rm(_path);

        LOGF("creating {} file", _path);
        _item_file = dlsync_create(_path);
        if (!_item_file)
            throw formatEx<IoError>(
                    "cannot create file {}: {}", _path, strerror(errno));
        _download_offset = 0;
        return;
    }

    const auto size = dlsync_get_size(_path);
    if (size < 0 || static_cast<uint64_t>(size) != decision.offset)
        throw formatEx<IoError>(
                "cache entry {} changed since the transfer was planned ({} "
                "bytes, expected {})",
                _path,
                size,
                decision.offset);

    LOGF("opening {} file for resume", _path);
    _item_file = dlsync_append(_path);
    if (!_item_file)
        throw formatEx<IoError>(
                "cannot open file {}: {}", _path, strerror(errno));
    _download_offset = decision.offset;
}

void TransferSession::start_download()
{
    _state = TransferState::RequestSent;

    LOGF("requesting {} @ {}", _url, _download_offset);

    std::future<HttpResponseHead> headers;
    try
    {
        headers = _http->start(_url, _download_offset, _download_size - 1);
    }
    catch (const HttpError& e)
    {
        throw formatEx<TransportError>(
                "cannot request {}: {}", _url, e.what());
    }

    if (headers.wait_for(_header_timeout) != std::future_status::ready)
    {
        _http->abort();
        throw formatEx<TransferTimeoutError>(
                "no response from {} within {} ms",
                _url,
                _header_timeout.count());
    }

    HttpResponseHead head;
    try
    {
        head = headers.get();
    }
    catch (const HttpError& e)
    {
        throw formatEx<TransportError>(
                "request for {} failed: {}", _url, e.what());
    }

    if (_download_offset > 0 && head.status != 206)
        throw formatEx<TransportError>(
                "server did not respond with 206 Partial Content for a "
                "resume request, status {}",
                head.status);
    if (head.status != 200 && head.status != 206)
        throw formatEx<TransportError>(
                "HTTP status {} for {}", head.status, _url);

    const uint64_t expected = _download_size - _download_offset;
    if (head.length >= 0 && static_cast<uint64_t>(head.length) != expected)
        throw formatEx<TransportError>(
                "HTTP response length {} does not match the {} bytes "
                "expected",
                head.length,
                expected);

    LOGF("http response length = {}, total size = {}",
         expected,
         _download_size);
}

void TransferSession::download_chunk(uint32_t size)
{
    if (is_canceled && is_canceled())
        throw formatEx<TransferCanceledError>(
                "transfer of {} was canceled at offset {}",
                _path,
                _download_offset);

    {
        size_t pos = 0;
        while (pos < size)
        {
            int64_t read;
            try
            {
                read = _http->read(_buffer.data() + pos, size - pos);
            }
            catch (const HttpError& e)
            {
                throw formatEx<TransportError>(
                        "connection failed at offset {}: {}",
                        _download_offset + pos,
                        e.what());
            }
            if (read == 0)
                throw formatEx<TransportError>(
                        "HTTP connection closed at offset {} of {}",
                        _download_offset + pos,
                        _download_size);
            pos += read;
        }
    }

    if (!dlsync_write(_item_file, _buffer.data(), size) ||
        !dlsync_sync(_item_file))
    {
        const int err = errno;
        // drop the bytes of the failed chunk
        if (!dlsync_truncate(_item_file, _download_offset))
            WARNF("cannot truncate {} back to {} bytes: {}",
                  _path,
                  _download_offset,
                  strerror(errno));
        throw formatEx<IoError>(
                "failed to write to {}: {}", _path, strerror(err));
    }

    _download_offset += size;
    _bytes_written += size;

    update_progress();
}

void TransferSession::run(
        const ResourceDescriptor& resource,
        const RemoteMetadata& remote,
        const TransferDecision& decision)
{
    if (_state != TransferState::Idle)
        throw std::runtime_error("transfer session can only run once");

    _url = resource.url;
    _path = resource.path;
    _download_size = remote.size;

    if (decision.action == TransferAction::Skip)
    {
        LOGF("{} is up to date, nothing to transfer", _path);
        _download_offset = remote.size;
        _state = TransferState::Completed;
        return;
    }

    try
    {
        PathLock lock(_path);

        if (decision.reason == DecisionReason::Oversized)
            WARNF("cache entry {} is larger than the remote resource ({} "
                  "bytes), restarting from the beginning",
                  _path,
                  remote.size);

        {
            open_output(decision);

            BOOST_SCOPE_EXIT_ALL(&)
            {
                dlsync_close(_item_file);
                _item_file = nullptr;
                _http->abort();
            };

            update_progress();

            if (_download_offset < _download_size)
            {
                start_download();

                _state = TransferState::Streaming;
                _buffer.resize(std::min(_chunk_size, _download_size));

                while (_download_offset < _download_size)
                {
                    const uint32_t size = static_cast<uint32_t>(std::min(
                            _chunk_size, _download_size - _download_offset));
                    download_chunk(size);
                }
            }
        }

        const auto size = dlsync_get_size(_path);
        if (size < 0 || static_cast<uint64_t>(size) != _download_size)
            throw formatEx<IoError>(
                    "{} has {} bytes after the transfer, expected {}",
                    _path,
                    size,
                    _download_size);

        _state = TransferState::Completed;
        LOGF("download of {} completed, {} bytes written",
             _path,
             _bytes_written);
    }
    catch (const std::exception& e)
    {
        LOGF("transfer of {} failed: {}", _path, e.what());
        _state = TransferState::Failed;
        throw;
    }
}
