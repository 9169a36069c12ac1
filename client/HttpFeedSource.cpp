#include <iostream>
#include <memory>
#include <stdexcept>
#include "Errors.hpp"
#include "HttpFeedSource.hpp"

namespace
{
    // GTFS-realtime snapshots of large agencies run to tens of megabytes
    constexpr std::uint64_t kMaxBodyBytes = 64ull * 1024 * 1024;

    // Shared with the resolve handler, which may complete after a timeout
    struct PendingResolve
    {
        boost::asio::ip::tcp::resolver resolver;
        boost::asio::steady_timer deadline;
        boost::system::error_code ec;
        boost::asio::ip::tcp::resolver::results_type results;
        bool done = false;

        explicit PendingResolve(boost::asio::io_context& ioc) : resolver(ioc), deadline(ioc) {}
    };
}

HttpFeedSource::HttpFeedSource(boost::asio::io_context& ioc, std::string feedUrl, HeaderList requestHeaders, std::chrono::seconds requestTimeout)
        : ioContext(ioc)
        , sslContext(boost::asio::ssl::context::tlsv12_client)
        , endpoint(parseUrl(feedUrl))
        , url(std::move(feedUrl))
        , headers(std::move(requestHeaders))
        , timeout(requestTimeout)
    {
        sslContext.set_options(
            boost::asio::ssl::context::default_workarounds
            | boost::asio::ssl::context::no_sslv2
            | boost::asio::ssl::context::single_dh_use
        );

        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(boost::asio::ssl::verify_peer);
    }

FeedUrl HttpFeedSource::parseUrl(std::string const& url)
{
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos)
        throw std::invalid_argument("feed url without scheme: " + url);

    std::string scheme = url.substr(0, schemeEnd);
    FeedUrl out;
    if (scheme == "https")
        out.secure = true;
    else if (scheme != "http")
        throw std::invalid_argument("unsupported feed url scheme '" + scheme + "'");

    std::string rest = url.substr(schemeEnd + 3);
    auto pathStart = rest.find_first_of("/?");
    std::string authority = rest.substr(0, pathStart);

    if (pathStart == std::string::npos)
        out.target = "/";
    else if (rest[pathStart] == '?')
        out.target = "/" + rest.substr(pathStart);
    else
        out.target = rest.substr(pathStart);

    auto colon = authority.find(':');
    if (colon != std::string::npos)
    {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    }
    else
    {
        out.host = authority;
        out.port = out.secure ? "443" : "80";
    }

    if (out.host.empty() || out.port.empty())
        throw std::invalid_argument("feed url without host: " + url);

    return out;
}

void HttpFeedSource::configureTlsStream(TlsStream& stream)
{
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str()))
    {
        throw boost::beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()),"Failed to set SNI");
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(endpoint.host));
}

boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> HttpFeedSource::resolve()
{
    // getaddrinfo cannot be interrupted, so wait on a timer the handler cancels
    auto pending = std::make_shared<PendingResolve>(ioContext);
    pending->deadline.expires_after(timeout);

    pending->resolver.async_resolve(endpoint.host, endpoint.port,
        [pending](boost::system::error_code ec, boost::asio::ip::tcp::resolver::results_type results)
        {
            pending->ec = ec;
            pending->results = std::move(results);
            pending->done = true;
            pending->deadline.cancel();
        });

    boost::system::error_code waitEc;
    co_await pending->deadline.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, waitEc));

    if (!pending->done)
    {
        pending->resolver.cancel();
        throw boost::system::system_error(boost::beast::error::timeout, "resolve " + endpoint.host);
    }
    if (pending->ec)
        throw boost::system::system_error(pending->ec, "resolve " + endpoint.host);

    co_return pending->results;
}

boost::beast::http::request<boost::beast::http::string_body> HttpFeedSource::buildGetRequest() const
{
    boost::beast::http::request<boost::beast::http::string_body> request(boost::beast::http::verb::get, endpoint.target, 11);
    request.set(boost::beast::http::field::host, endpoint.host);
    request.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(boost::beast::http::field::accept, "application/x-protobuf, application/octet-stream");

    for (const auto& header : headers)
        request.set(header.first, header.second);

    return request;
}

template <class Stream>
boost::asio::awaitable<HttpFeedSource::Response> HttpFeedSource::exchange(Stream& stream)
{
    boost::beast::http::request<boost::beast::http::string_body> request = buildGetRequest();

    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await boost::beast::http::async_write(stream, request, boost::asio::use_awaitable);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response_parser<boost::beast::http::string_body> parser;
    parser.body_limit(kMaxBodyBytes);

    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await boost::beast::http::async_read(stream, buffer, parser, boost::asio::use_awaitable);
    co_return parser.release();
}

boost::asio::awaitable<HttpFeedSource::Response> HttpFeedSource::fetchPlain()
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::beast::tcp_stream stream(executor);

    boost::asio::ip::tcp::resolver::results_type results = co_await resolve();
    stream.expires_after(timeout);
    co_await stream.async_connect(results, boost::asio::use_awaitable);

    Response response = co_await exchange(stream);

    boost::system::error_code ignore;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    co_return response;
}

boost::asio::awaitable<HttpFeedSource::Response> HttpFeedSource::fetchTls()
{
    auto executor = co_await boost::asio::this_coro::executor;
    TlsStream stream(executor, sslContext);

    configureTlsStream(stream);
    boost::asio::ip::tcp::resolver::results_type results = co_await resolve();

    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await boost::beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);
    co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);

    Response response = co_await exchange(stream);

    // Many servers drop the connection instead of answering close_notify
    boost::system::error_code ec;
    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return response;
}

boost::asio::awaitable<std::string> HttpFeedSource::fetch()
{
    Response response;
    try
    {
        if (endpoint.secure)
            response = co_await fetchTls();
        else
            response = co_await fetchPlain();
    }
    catch (boost::system::system_error const& e)
    {
        throw FetchError("GET " + url + " failed: " + e.what());
    }

    unsigned status = response.result_int();
    if (status < 200 || status > 299)
    {
        throw FetchError("GET " + url + " returned " + std::to_string(status), status, response.body());
    }

    co_return std::move(response.body());
}

std::string HttpFeedSource::describe() const
{
    return url;
}
