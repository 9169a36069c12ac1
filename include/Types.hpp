#pragma once
#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <optional>
#include <cstdint>
#include <ctime>

struct Position
{
    double latitude  = 0.0;
    double longitude = 0.0;
};

// Values match the VehiclePosition.OccupancyStatus codes of the feed.
enum class OccupancyStatus : int32_t
{
    EMPTY                      = 0,
    MANY_SEATS_AVAILABLE       = 1,
    FEW_SEATS_AVAILABLE        = 2,
    STANDING_ROOM_ONLY         = 3,
    CRUSHED_STANDING_ROOM_ONLY = 4,
    FULL                       = 5,
    NOT_ACCEPTING_PASSENGERS   = 6,
    NO_DATA_AVAILABLE          = 7,
    NOT_BOARDABLE              = 8
};

// One predicted arrival of one vehicle at one stop.
struct Arrival
{
    std::time_t arrivalTime = 0;
    std::optional<Position> position;
    std::optional<OccupancyStatus> occupancy;
};

struct StopTimeUpdateRecord
{
    std::string stopId;
    std::optional<std::time_t> arrivalTime;
};

struct TripUpdateRecord
{
    std::string tripId;
    std::string routeId;
    std::string vehicleId;   // Empty when the producer left it out
    std::vector<StopTimeUpdateRecord> stopTimeUpdates;
};

struct VehicleRecord
{
    std::string vehicleId;
    std::string tripId;
    std::string routeId;     // Empty while the vehicle is out of revenue service
    std::optional<Position> position;
    std::optional<int32_t> occupancyCode;   // Raw code, may be out of range
};

// Decoded content of one FeedMessage, in feed order.
struct FeedEntities
{
    uint64_t timestamp = 0;
    std::vector<TripUpdateRecord> tripUpdates;
    std::vector<VehicleRecord> vehicles;
};

struct VehicleState
{
    std::optional<Position> position;
    std::optional<OccupancyStatus> occupancy;
};

using VehicleSnapshot = std::unordered_map<std::string, VehicleState>;
using TripToVehicle   = std::unordered_map<std::string, std::string>;

// route id -> stop id -> arrivals sorted by arrivalTime
using StopArrivals    = std::map<std::string, std::vector<Arrival>>;
using PredictionTable = std::map<std::string, StopArrivals>;

// One configured (name, stop, route) triple, i.e. one queryable prediction.
struct Departure
{
    std::string name;
    std::string stopId;
    std::string route;
};
