#pragma once
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/this_coro.hpp>

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Where one raw GTFS-realtime buffer comes from.
class FeedSource
{
public:
    virtual ~FeedSource() = default;

    // Throws FetchError on any failure to obtain the buffer.
    virtual boost::asio::awaitable<std::string> fetch() = 0;
    virtual std::string describe() const = 0;
};

class FileFeedSource : public FeedSource
{
private:
    std::string path;

public:
    explicit FileFeedSource(std::string filePath);
    boost::asio::awaitable<std::string> fetch() override;
    std::string describe() const override;
};

// "file://..." and bare paths read from disk, anything else goes over HTTP(S).
std::unique_ptr<FeedSource> makeFeedSource(boost::asio::io_context& ioc,
                                           std::string const& url,
                                           HeaderList const& headers,
                                           std::chrono::seconds timeout);
