#include "FeedSource.hpp"
#include <fstream>
#include <sstream>
#include "Errors.hpp"
#include "HttpFeedSource.hpp"

FileFeedSource::FileFeedSource(std::string filePath)
    : path(std::move(filePath))
{
}

boost::asio::awaitable<std::string> FileFeedSource::fetch()
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        throw FetchError("Failed to open feed file: " + path);

    std::ostringstream data;
    data << file.rdbuf();
    if (file.bad())
        throw FetchError("Failed to read feed file: " + path);

    co_return data.str();
}

std::string FileFeedSource::describe() const
{
    return path;
}

std::unique_ptr<FeedSource> makeFeedSource(boost::asio::io_context& ioc,
                                           std::string const& url,
                                           HeaderList const& headers,
                                           std::chrono::seconds timeout)
{
    static const std::string filePrefix = "file://";

    if (url.compare(0, filePrefix.size(), filePrefix) == 0)
        return std::make_unique<FileFeedSource>(url.substr(filePrefix.size()));

    if (url.find("://") == std::string::npos)
        return std::make_unique<FileFeedSource>(url);

    return std::make_unique<HttpFeedSource>(ioc, url, headers, timeout);
}
