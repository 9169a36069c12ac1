#pragma once
#include <string>
#include <vector>
#include <istream>
#include <chrono>
#include "Types.hpp"
#include "FeedSource.hpp"

class ConfigurationManager
{
private:
    std::string tripUpdateUrl;
    std::string vehiclePositionUrl;
    HeaderList headers;
    std::chrono::seconds minRefreshInterval{60};
    std::chrono::seconds requestTimeout{30};
    std::string timeZone;
    std::vector<Departure> departures;

public:
    explicit ConfigurationManager(std::string const& departuresPath);

    static inline const std::string DEFAULT_NAME = "Next Bus";

    // One of the key styles, or free-form "Name: value;Name: value" headers.
    // More than one set is a configuration error.
    static HeaderList resolveHeaders(char const* authorization, char const* apikey,
                                     char const* xApiKey, char const* custom);
    static std::vector<Departure> parseDepartures(std::istream& in);

    [[nodiscard]] std::string const& getTripUpdateUrl() const noexcept;
    [[nodiscard]] std::string const& getVehiclePositionUrl() const noexcept;
    [[nodiscard]] HeaderList const& getHeaders() const noexcept;
    [[nodiscard]] std::chrono::seconds getMinRefreshInterval() const noexcept;
    [[nodiscard]] std::chrono::seconds getRequestTimeout() const noexcept;
    // How often the polling loop asks the store to refresh: the rate limit, capped at 30 s, at least 1 s.
    [[nodiscard]] std::chrono::seconds getPollInterval() const noexcept;
    [[nodiscard]] std::string const& getTimeZone() const noexcept;
    [[nodiscard]] std::vector<Departure> const& getDepartures() const noexcept;
};
