#pragma once
#include <vector>
#include "Types.hpp"

// Lookup structures built from one vehicle-position feed.
struct VehicleIndex
{
    VehicleSnapshot snapshot;
    TripToVehicle tripToVehicle;

    // Indexes vehicles in revenue service. Entities with an invalid occupancy
    // code are logged and left out; the rest of the batch is still indexed.
    static VehicleIndex build(std::vector<VehicleRecord> const& vehicles);
};
