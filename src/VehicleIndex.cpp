#include "VehicleIndex.hpp"
#include <iostream>
#include "Occupancy.hpp"

VehicleIndex VehicleIndex::build(std::vector<VehicleRecord> const& vehicles)
{
    VehicleIndex index;
    std::size_t skipped = 0;

    for (const auto& v : vehicles)
    {
        if (v.routeId.empty())
            continue;

        VehicleState state;
        state.position = v.position;

        if (v.occupancyCode)
        {
            state.occupancy = occupancyFromCode(*v.occupancyCode);
            if (!state.occupancy)
            {
                std::cerr << "[Vehicles] Skipping vehicle '" << v.vehicleId
                          << "': invalid occupancy code " << *v.occupancyCode << "\n";
                ++skipped;
                continue;
            }
        }

        index.snapshot[v.vehicleId] = state;
        index.tripToVehicle[v.tripId] = v.vehicleId;
    }

    std::cout << "   | Vehicles: " << index.snapshot.size() << " in service";
    if (skipped > 0)
        std::cout << ", " << skipped << " skipped";
    std::cout << "." << std::endl;

    return index;
}
