#pragma once
#include <string>
#include <chrono>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include "FeedSource.hpp"

struct FeedUrl
{
    bool secure = false;
    std::string host;
    std::string port;
    std::string target;
};

class HttpFeedSource : public FeedSource
{
private:
    boost::asio::io_context& ioContext;
    boost::asio::ssl::context sslContext;
    FeedUrl endpoint;
    std::string url;
    HeaderList headers;
    std::chrono::seconds timeout;

    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    void configureTlsStream(TlsStream& stream);
    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve();
    boost::beast::http::request<boost::beast::http::string_body> buildGetRequest() const;
    boost::asio::awaitable<Response> fetchPlain();
    boost::asio::awaitable<Response> fetchTls();

    template <class Stream>
    boost::asio::awaitable<Response> exchange(Stream& stream);

public:
    HttpFeedSource(boost::asio::io_context& ioc, std::string feedUrl, HeaderList requestHeaders, std::chrono::seconds requestTimeout);

    boost::asio::awaitable<std::string> fetch() override;
    std::string describe() const override;

    // Splits http(s)://host[:port]/target; throws std::invalid_argument.
    static FeedUrl parseUrl(std::string const& url);
};
