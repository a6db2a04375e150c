#pragma once

#include "config.hpp"
#include "http.hpp"
#include "policy.hpp"
#include "remotemetadata.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <cstdint>

class TransferTimeoutError : public std::exception
{
public:
    TransferTimeoutError(std::string msg) : _msg(std::move(msg))
    {
    }

    virtual const char* what() const noexcept override
    {
        return _msg.c_str();
    }

private:
    std::string _msg;
};

class TransportError : public std::exception
{
public:
    TransportError(std::string msg) : _msg(std::move(msg))
    {
    }

    virtual const char* what() const noexcept override
    {
        return _msg.c_str();
    }

private:
    std::string _msg;
};

class TransferCanceledError : public std::exception
{
public:
    TransferCanceledError(std::string msg) : _msg(std::move(msg))
    {
    }

    virtual const char* what() const noexcept override
    {
        return _msg.c_str();
    }

private:
    std::string _msg;
};

struct ResourceDescriptor
{
    std::string url;
    std::string path;
};

enum class TransferState
{
    Idle,
    RequestSent,
    Streaming,
    Completed,
    Failed,
};

std::string state_to_string(TransferState state);

// One execution of a TransferDecision. A session runs once; whatever happens,
// the output file and the response are closed when run() returns and the
// file holds a prefix of the remote resource made of whole chunks.
class TransferSession
{
public:
    std::function<void(uint64_t download_offset, uint64_t download_size)>
            update_progress_cb;
    std::function<bool()> is_canceled;

    TransferSession(std::unique_ptr<Http> http, const Config& config = {});

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    void run(const ResourceDescriptor& resource,
             const RemoteMetadata& remote,
             const TransferDecision& decision);

    TransferState state() const
    {
        return _state;
    }

    // bytes written by this session
    uint64_t bytes_written() const
    {
        return _bytes_written;
    }

    // size of the output file as far as this session knows it
    uint64_t download_offset() const
    {
        return _download_offset;
    }

private:
    std::unique_ptr<Http> _http;
    uint64_t _chunk_size;
    std::chrono::milliseconds _header_timeout;

    TransferState _state{TransferState::Idle};
    uint64_t _bytes_written{0};
    uint64_t _download_offset{0};
    uint64_t _download_size{0};

    std::string _url;
    std::string _path;
    void* _item_file{nullptr};
    std::vector<uint8_t> _buffer;

    void open_output(const TransferDecision& decision);
    void start_download();
    void download_chunk(uint32_t size);
    void update_progress();
};
