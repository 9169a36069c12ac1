#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <optional>
#include <ctime>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include "Types.hpp"
#include "FeedSource.hpp"

// Owns the latest PredictionTable. A refresh builds a complete table off to
// the side and swaps it in; readers hold on to whichever table was current.
class PredictionStore
{
private:
    std::unique_ptr<FeedSource> tripSource;
    std::unique_ptr<FeedSource> vehicleSource;
    std::chrono::seconds minInterval;

    mutable std::mutex mutex;
    std::shared_ptr<const PredictionTable> table;
    std::time_t tableTimestamp = 0;

    std::optional<std::time_t> lastAttempt;
    bool refreshing = false;

    void install(std::shared_ptr<const PredictionTable> next, std::time_t timestamp);

public:
    // vehicles may be null: arrivals then carry no position or occupancy.
    PredictionStore(std::unique_ptr<FeedSource> tripUpdates,
                    std::unique_ptr<FeedSource> vehicles,
                    std::chrono::seconds minRefreshInterval);

    // Returns true when a new table was installed. Calls inside the minimum
    // interval of the previous attempt, or while one is in flight, do nothing.
    // Fetch and decode failures are logged and leave the current table as is.
    boost::asio::awaitable<bool> refresh();

    [[nodiscard]] std::vector<Arrival> get(std::string const& route, std::string const& stop) const;
    [[nodiscard]] std::shared_ptr<const PredictionTable> snapshot() const;
    [[nodiscard]] std::time_t lastUpdated() const;
};
