#include "beasthttp.hpp"

#include "httputil.hpp"
#include "log.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <boost/scope_exit.hpp>

#include <fmt/format.h>

#include <limits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace
{
std::string to_std(beast::string_view value)
{
    return std::string(value.data(), value.size());
}

template <typename Message>
std::string field_value(const Message& message, http::field field)
{
    return to_std(message[field]);
}

bool is_redirect(int status)
{
    return status == 301 || status == 302 || status == 303 || status == 307 ||
           status == 308;
}
}

BeastHttp::BeastHttp(const Config& config)
    : _header_timeout(config.header_timeout)
    , _stall_timeout(config.stall_timeout)
    , _max_redirects(config.max_redirects)
    , _user_agent(config.user_agent)
    , _resolver(_ioc)
    , _stream(_ioc)
{
}

BeastHttp::~BeastHttp()
{
    abort();
}

HttpResponseHead BeastHttp::head(const std::string& url)
{
    _range.clear();
    auto head = begin(http::verb::head, url);

    BOOST_SCOPE_EXIT_ALL(&)
    {
        close_stream();
        _parser.reset();
        _promise.reset();
        _started = false;
    };

    _ioc.run();

    if (head.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
        throw formatEx<HttpError>("HEAD {} did not complete", url);

    return head.get();
}

std::future<HttpResponseHead> BeastHttp::start(
        const std::string& url, uint64_t first, uint64_t last)
{
    _range = fmt::format("bytes={}-{}", first, last);
    auto headers = begin(http::verb::get, url);

    _worker = std::thread([this] {
        try
        {
            _ioc.run();
        }
        catch (const std::exception& e)
        {
            LOGF("http worker terminated: {}", e.what());
        }
    });

    return headers;
}

std::future<HttpResponseHead> BeastHttp::begin(
        http::verb method, const std::string& url)
{
    if (_started)
        throw HttpError("HTTP connection already started");

    _started = true;
    _redirects = 0;
    _url = url;

    _promise.emplace();
    auto future = _promise->get_future();

    _request = http::request<http::empty_body>();
    _request.method(method);

    _ioc.restart();
    send_request();

    return future;
}

void BeastHttp::send_request()
{
    Url url;
    try
    {
        url = dlsync_parse_url(_url);
    }
    catch (const HttpError&)
    {
        _promise->set_exception(std::current_exception());
        return;
    }

    if (url.scheme != "http")
    {
        _promise->set_exception(std::make_exception_ptr(formatEx<HttpError>(
                "unsupported url scheme {}", url.scheme)));
        return;
    }

    LOGF("starting http {} request for {} {}",
         to_std(http::to_string(_request.method())),
         _url,
         _range);

    _request.version(11);
    _request.target(url.target);
    _request.set(
            http::field::host,
            url.port == "80" ? url.host
                             : fmt::format("{}:{}", url.host, url.port));
    _request.set(http::field::user_agent, _user_agent);
    _request.set(http::field::accept_encoding, "identity");
    if (_range.empty())
        _request.erase(http::field::range);
    else
        _request.set(http::field::range, _range);
    _request.keep_alive(false);

    _buffer.clear();
    _parser.emplace();
    _parser->body_limit((std::numeric_limits<std::uint64_t>::max)());
    if (_request.method() == http::verb::head)
        _parser->skip(true);

    // the wait for GET headers is bounded by the caller through the future
    if (_request.method() == http::verb::head)
        _stream.expires_after(_header_timeout);
    else
        _stream.expires_never();
    _resolver.async_resolve(
            url.host,
            url.port,
            beast::bind_front_handler(&BeastHttp::on_resolve, this));
}

void BeastHttp::on_resolve(
        beast::error_code ec, tcp::resolver::results_type results)
{
    if (ec)
        return fail("resolve", ec);

    _stream.async_connect(
            results, beast::bind_front_handler(&BeastHttp::on_connect, this));
}

void BeastHttp::on_connect(beast::error_code ec, tcp::endpoint)
{
    if (ec)
        return fail("connect", ec);

    http::async_write(
            _stream,
            _request,
            beast::bind_front_handler(&BeastHttp::on_write, this));
}

void BeastHttp::on_write(beast::error_code ec, std::size_t)
{
    if (ec)
        return fail("write", ec);

    http::async_read_header(
            _stream,
            _buffer,
            *_parser,
            beast::bind_front_handler(&BeastHttp::on_header, this));
}

void BeastHttp::on_header(beast::error_code ec, std::size_t)
{
    if (ec)
        return fail("read header", ec);

    const auto& response = _parser->get();
    const int status = response.result_int();

    if (is_redirect(status))
    {
        const auto location = field_value(response, http::field::location);
        if (!location.empty())
        {
            if (_redirects >= _max_redirects)
            {
                _promise->set_exception(std::make_exception_ptr(formatEx<
                                                                HttpError>(
                        "too many redirects, last one to {}", location)));
                return;
            }
            ++_redirects;
            close_stream();
            try
            {
                _url = dlsync_resolve_location(_url, location);
            }
            catch (const HttpError&)
            {
                _promise->set_exception(std::current_exception());
                return;
            }
            LOGF("redirected to {}", _url);
            return send_request();
        }
    }

    HttpResponseHead head;
    head.status = status;
    head.url = _url;
    head.length =
            dlsync_parse_content_length(
                    field_value(response, http::field::content_length))
                    .value_or(-1);
    head.last_modified = dlsync_parse_http_date(
            field_value(response, http::field::last_modified));
    head.accept_ranges = beast::iequals(
            field_value(response, http::field::accept_ranges), "bytes");

    LOGF("http response status = {}, length = {}", head.status, head.length);

    _stream.expires_never();
    _promise->set_value(std::move(head));
}

void BeastHttp::fail(const char* what, beast::error_code ec)
{
    _promise->set_exception(std::make_exception_ptr(formatEx<HttpError>(
            "{} {} failed: {}", what, _url, ec.message())));
}

int64_t BeastHttp::read(uint8_t* buffer, uint64_t size)
{
    join();

    if (!_parser || !_parser->is_header_done())
        throw HttpError("HTTP connection not started");

    if (_parser->is_done() || size == 0)
        return 0;

    auto& body = _parser->get().body();
    body.data = buffer;
    body.size = size;

    // each read_some is bounded by the stall timeout, return as soon as body
    // bytes arrived
    while (true)
    {
        beast::error_code result;
        _stream.expires_after(_stall_timeout);
        http::async_read_some(
                _stream,
                _buffer,
                *_parser,
                [&result](beast::error_code ec, std::size_t) { result = ec; });
        _ioc.restart();
        _ioc.run();
        _stream.expires_never();

        if (result == http::error::need_buffer)
            result = {};
        if (result)
            throw formatEx<HttpError>(
                    "reading {} failed: {}", _url, result.message());

        const auto got = size - body.size;
        if (got > 0 || _parser->is_done())
            return got;
    }
}

void BeastHttp::abort()
{
    if (_worker.joinable())
    {
        asio::post(_ioc, [this] {
            _resolver.cancel();
            close_stream();
        });
        _worker.join();
        _ioc.restart();
        _ioc.poll();
    }

    close_stream();
    _parser.reset();
    _promise.reset();
    _buffer.clear();
    _started = false;
}

BeastHttp::operator bool() const
{
    return _started;
}

void BeastHttp::close_stream()
{
    beast::error_code ec;
    _stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    _stream.close();
}

void BeastHttp::join()
{
    if (_worker.joinable())
        _worker.join();
}
