#include "Occupancy.hpp"

std::optional<OccupancyStatus> occupancyFromCode(int32_t code) noexcept
{
    if (code < static_cast<int32_t>(OccupancyStatus::EMPTY) ||
        code > static_cast<int32_t>(OccupancyStatus::NOT_BOARDABLE))
        return std::nullopt;

    return static_cast<OccupancyStatus>(code);
}

std::string occupancyName(OccupancyStatus status)
{
    switch (status)
    {
        case OccupancyStatus::EMPTY:                      return "EMPTY";
        case OccupancyStatus::MANY_SEATS_AVAILABLE:       return "MANY_SEATS_AVAILABLE";
        case OccupancyStatus::FEW_SEATS_AVAILABLE:        return "FEW_SEATS_AVAILABLE";
        case OccupancyStatus::STANDING_ROOM_ONLY:         return "STANDING_ROOM_ONLY";
        case OccupancyStatus::CRUSHED_STANDING_ROOM_ONLY: return "CRUSHED_STANDING_ROOM_ONLY";
        case OccupancyStatus::FULL:                       return "FULL";
        case OccupancyStatus::NOT_ACCEPTING_PASSENGERS:   return "NOT_ACCEPTING_PASSENGERS";
        case OccupancyStatus::NO_DATA_AVAILABLE:          return "NO_DATA_AVAILABLE";
        case OccupancyStatus::NOT_BOARDABLE:              return "NOT_BOARDABLE";
    }
    return "UNKNOWN";
}
