#pragma once

#include "config.hpp"
#include "http.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>

#include <optional>
#include <thread>

// http:// transport. The header exchange of start() runs on a worker thread
// that fulfils the returned future, body reads run on the calling thread.
// The header timeout covers connect, write and header read but not the name
// lookup: getaddrinfo cannot be interrupted, so a hung lookup delays head()
// and abort() until it returns.
class BeastHttp : public Http
{
public:
    BeastHttp(const Config& config = {});
    ~BeastHttp();

    BeastHttp(const BeastHttp&) = delete;
    BeastHttp& operator=(const BeastHttp&) = delete;

    HttpResponseHead head(const std::string& url) override;
    std::future<HttpResponseHead> start(
            const std::string& url, uint64_t first, uint64_t last) override;
    int64_t read(uint8_t* buffer, uint64_t size) override;
    void abort() override;

    explicit operator bool() const override;

private:
    using Parser = boost::beast::http::response_parser<
            boost::beast::http::buffer_body>;

    std::chrono::milliseconds _header_timeout;
    std::chrono::milliseconds _stall_timeout;
    uint32_t _max_redirects;
    std::string _user_agent;

    boost::asio::io_context _ioc;
    boost::asio::ip::tcp::resolver _resolver;
    boost::beast::tcp_stream _stream;
    boost::beast::flat_buffer _buffer;
    boost::beast::http::request<boost::beast::http::empty_body> _request;
    std::optional<Parser> _parser;
    std::optional<std::promise<HttpResponseHead>> _promise;
    std::thread _worker;

    std::string _url;
    std::string _range;
    uint32_t _redirects{0};
    bool _started{false};

    std::future<HttpResponseHead> begin(
            boost::beast::http::verb method, const std::string& url);
    void send_request();
    void on_resolve(
            boost::beast::error_code ec,
            boost::asio::ip::tcp::resolver::results_type results);
    void on_connect(
            boost::beast::error_code ec,
            boost::asio::ip::tcp::endpoint endpoint);
    void on_write(boost::beast::error_code ec, std::size_t);
    void on_header(boost::beast::error_code ec, std::size_t);
    void fail(const char* what, boost::beast::error_code ec);
    void close_stream();
    void join();
};
