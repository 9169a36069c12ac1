#pragma once
#include <vector>
#include <ctime>
#include "Types.hpp"
#include "VehicleIndex.hpp"

class ArrivalProjector
{
public:
    // Builds route -> stop -> arrivals, keeping only arrivals strictly after
    // `now`, each list sorted by time with feed order kept on ties.
    static PredictionTable project(std::vector<TripUpdateRecord> const& tripUpdates,
                                   VehicleIndex const& vehicles,
                                   std::time_t now);

private:
    static VehicleState const* resolveVehicle(TripUpdateRecord const& tu, VehicleIndex const& vehicles);
};
