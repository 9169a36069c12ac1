#include "FeedDecoder.hpp"
#include "PredictionStore.hpp"
#include <iostream>
#include "Errors.hpp"
#include "VehicleIndex.hpp"
#include "ArrivalProjector.hpp"
#include "VirtualClock.hpp"

namespace
{
    struct RefreshGuard
    {
        bool& flag;
        explicit RefreshGuard(bool& f) : flag(f) { flag = true; }
        ~RefreshGuard() { flag = false; }
    };
}

PredictionStore::PredictionStore(std::unique_ptr<FeedSource> tripUpdates,
                                 std::unique_ptr<FeedSource> vehicles,
                                 std::chrono::seconds minRefreshInterval)
    : tripSource(std::move(tripUpdates))
    , vehicleSource(std::move(vehicles))
    , minInterval(minRefreshInterval)
    , table(std::make_shared<const PredictionTable>())
{
}

boost::asio::awaitable<bool> PredictionStore::refresh()
{
    std::time_t now = VirtualClock::now();

    if (refreshing)
        co_return false;
    if (lastAttempt && now - *lastAttempt < static_cast<std::time_t>(minInterval.count()))
        co_return false;

    lastAttempt = now;
    RefreshGuard guard(refreshing);

    std::cout << "\n[T=" << now << "] --- Feed Refresh ---" << std::endl;

    try
    {
        // Vehicle positions first: a failure there aborts the whole cycle
        VehicleIndex vehicles;
        if (vehicleSource)
        {
            std::string data = co_await vehicleSource->fetch();
            vehicles = VehicleIndex::build(FeedDecoder::decode(data).vehicles);
        }

        std::string data = co_await tripSource->fetch();
        FeedEntities feed = FeedDecoder::decode(data);

        auto next = std::make_shared<const PredictionTable>(ArrivalProjector::project(feed.tripUpdates, vehicles, now));
        install(std::move(next), now);
    }
    catch (FetchError const& e)
    {
        std::cerr << "[Refresh] " << e.what();
        if (e.status() != 0)
            std::cerr << ": " << e.body();
        std::cerr << " (keeping previous predictions)" << std::endl;
        co_return false;
    }
    catch (DecodeError const& e)
    {
        std::cerr << "[Refresh] Decode failed: " << e.what() << " (keeping previous predictions)" << std::endl;
        co_return false;
    }

    co_return true;
}

void PredictionStore::install(std::shared_ptr<const PredictionTable> next, std::time_t timestamp)
{
    std::lock_guard<std::mutex> lock(mutex);
    table = std::move(next);
    tableTimestamp = timestamp;
}

std::vector<Arrival> PredictionStore::get(std::string const& route, std::string const& stop) const
{
    std::shared_ptr<const PredictionTable> current = snapshot();

    auto routeIt = current->find(route);
    if (routeIt == current->end())
        return {};

    auto stopIt = routeIt->second.find(stop);
    if (stopIt == routeIt->second.end())
        return {};

    return stopIt->second;
}

std::shared_ptr<const PredictionTable> PredictionStore::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return table;
}

std::time_t PredictionStore::lastUpdated() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return tableTimestamp;
}
