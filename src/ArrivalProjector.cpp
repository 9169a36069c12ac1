#include "ArrivalProjector.hpp"
#include <algorithm>
#include <iostream>

VehicleState const* ArrivalProjector::resolveVehicle(TripUpdateRecord const& tu, VehicleIndex const& vehicles)
{
    std::string const* vehicleId = &tu.vehicleId;

    if (vehicleId->empty())
    {
        auto link = vehicles.tripToVehicle.find(tu.tripId);
        if (link == vehicles.tripToVehicle.end())
            return nullptr;
        vehicleId = &link->second;
    }

    auto it = vehicles.snapshot.find(*vehicleId);
    if (it == vehicles.snapshot.end())
        return nullptr;

    return &it->second;
}

PredictionTable ArrivalProjector::project(std::vector<TripUpdateRecord> const& tripUpdates,
                                          VehicleIndex const& vehicles,
                                          std::time_t now)
{
    PredictionTable table;
    std::size_t kept = 0;

    for (const auto& tu : tripUpdates)
    {
        VehicleState const* vehicle = resolveVehicle(tu, vehicles);

        for (const auto& st : tu.stopTimeUpdates)
        {
            if (st.stopId.empty())
            {
                std::cerr << "[Projector] Trip '" << tu.tripId
                          << "': stop time update without stop id skipped\n";
                continue;
            }

            // Feeds keep passed stops around; they would show as negative waits
            if (!st.arrivalTime || *st.arrivalTime <= now)
                continue;

            Arrival arrival;
            arrival.arrivalTime = *st.arrivalTime;
            if (vehicle)
            {
                arrival.position  = vehicle->position;
                arrival.occupancy = vehicle->occupancy;
            }

            table[tu.routeId][st.stopId].push_back(arrival);
            ++kept;
        }
    }

    for (auto& route : table)
    {
        for (auto& stop : route.second)
        {
            std::stable_sort(stop.second.begin(), stop.second.end(),
                [](Arrival const& a, Arrival const& b)
                {
                    return a.arrivalTime < b.arrivalTime;
                });
        }
    }

    std::cout << "   | Trip updates: " << tripUpdates.size() << " trips, "
              << kept << " upcoming arrivals." << std::endl;

    return table;
}
