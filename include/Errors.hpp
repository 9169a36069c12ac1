#pragma once
#include <string>
#include <stdexcept>
#include <utility>

// Upstream answered with a non-2xx status, or the transport failed (status 0).
class FetchError : public std::runtime_error
{
private:
    unsigned statusCode;
    std::string responseBody;

public:
    FetchError(std::string const& what, unsigned status = 0, std::string body = {})
        : std::runtime_error(what)
        , statusCode(status)
        , responseBody(std::move(body))
    {
    }

    unsigned status() const noexcept { return statusCode; }
    std::string const& body() const noexcept { return responseBody; }
};

// The buffer is not a well-formed FeedMessage.
class DecodeError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
