#include <cstdlib>
#include <stdexcept>
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include "ConfigurationManager.hpp"

namespace
{
    std::string trim(std::string const& s)
    {
        auto begin = s.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
            return {};
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(begin, end - begin + 1);
    }

    std::chrono::seconds secondsFromEnv(char const* name, std::chrono::seconds fallback)
    {
        const char* value = std::getenv(name);
        if (!value || !*value)
            return fallback;

        try
        {
            long seconds = std::stol(value);
            if (seconds < 0)
                throw std::out_of_range(value);
            return std::chrono::seconds(seconds);
        }
        catch (std::logic_error const&)
        {
            throw std::runtime_error(std::string(name) + " is not a number of seconds: " + value);
        }
    }
}

ConfigurationManager::ConfigurationManager(std::string const& departuresPath)
{
    const char* envTripUrl = std::getenv("GTFS_RT_TRIP_UPDATE_URL");
    if (!envTripUrl || !*envTripUrl) throw std::runtime_error("GTFS_RT_TRIP_UPDATE_URL not set.");
    tripUpdateUrl = envTripUrl;

    if (const char* envVehicleUrl = std::getenv("GTFS_RT_VEHICLE_POSITION_URL"))
        vehiclePositionUrl = envVehicleUrl;

    headers = resolveHeaders(std::getenv("GTFS_RT_API_KEY"),
                             std::getenv("GTFS_RT_APIKEY"),
                             std::getenv("GTFS_RT_X_API_KEY"),
                             std::getenv("GTFS_RT_HEADERS"));

    minRefreshInterval = secondsFromEnv("GTFS_RT_MIN_REFRESH_SECONDS", minRefreshInterval);
    requestTimeout     = secondsFromEnv("GTFS_RT_REQUEST_TIMEOUT_SECONDS", requestTimeout);

    if (const char* envZone = std::getenv("GTFS_RT_TIMEZONE"))
        timeZone = envZone;

    std::ifstream file(departuresPath);
    if (!file.is_open())
        throw std::runtime_error("Could not open departures file " + departuresPath);

    departures = parseDepartures(file);
    std::cout << "Loaded " << departures.size() << " departures from " << departuresPath << "\n";
}

HeaderList ConfigurationManager::resolveHeaders(char const* authorization, char const* apikey,
                                                char const* xApiKey, char const* custom)
{
    auto isSet = [](char const* v) { return v && *v; };

    int styles = isSet(authorization) + isSet(apikey) + isSet(xApiKey) + isSet(custom);
    if (styles > 1)
        throw std::runtime_error("At most one of GTFS_RT_API_KEY, GTFS_RT_APIKEY, GTFS_RT_X_API_KEY, GTFS_RT_HEADERS may be set.");

    if (isSet(authorization)) return {{"Authorization", authorization}};
    if (isSet(apikey))        return {{"apikey", apikey}};
    if (isSet(xApiKey))       return {{"x-api-key", xApiKey}};

    HeaderList out;
    if (!isSet(custom))
        return out;

    std::stringstream ss(custom);
    std::string item;
    while (std::getline(ss, item, ';'))
    {
        if (trim(item).empty()) continue;

        auto colon = item.find(':');
        std::string name = trim(item.substr(0, colon));
        if (colon == std::string::npos || name.empty())
            throw std::runtime_error("Malformed header in GTFS_RT_HEADERS: " + item);

        out.emplace_back(name, trim(item.substr(colon + 1)));
    }
    return out;
}

std::vector<Departure> ConfigurationManager::parseDepartures(std::istream& in)
{
    std::vector<Departure> out;

    std::string line;
    std::getline(in, line);

    while (std::getline(in, line))
    {
        if (trim(line).empty()) continue;

        std::stringstream ss(line);
        std::string name, stopId, route;

        std::getline(ss, name, ',');
        std::getline(ss, stopId, ',');
        std::getline(ss, route, ',');

        Departure d{trim(name), trim(stopId), trim(route)};
        if (d.stopId.empty() || d.route.empty())
        {
            std::cerr << "Warning: ignoring departure without stop id or route: " << line << "\n";
            continue;
        }
        if (d.name.empty())
            d.name = DEFAULT_NAME;

        out.push_back(std::move(d));
    }

    return out;
}

std::string const& ConfigurationManager::getTripUpdateUrl() const noexcept { return tripUpdateUrl; }
std::string const& ConfigurationManager::getVehiclePositionUrl() const noexcept { return vehiclePositionUrl; }
HeaderList const& ConfigurationManager::getHeaders() const noexcept { return headers; }
std::chrono::seconds ConfigurationManager::getMinRefreshInterval() const noexcept { return minRefreshInterval; }
std::chrono::seconds ConfigurationManager::getRequestTimeout() const noexcept { return requestTimeout; }
std::chrono::seconds ConfigurationManager::getPollInterval() const noexcept
{
    return std::clamp(minRefreshInterval, std::chrono::seconds(1), std::chrono::seconds(30));
}

std::string const& ConfigurationManager::getTimeZone() const noexcept { return timeZone; }
std::vector<Departure> const& ConfigurationManager::getDepartures() const noexcept { return departures; }
