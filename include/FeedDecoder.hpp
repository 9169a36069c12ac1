#pragma once
#include <string>
#include "gtfs-realtime.pb.h"
#include "Types.hpp"

class FeedDecoder
{
public:
    // Throws DecodeError when the buffer is not a well-formed FeedMessage.
    static FeedEntities decode(std::string const& data);

private:
    static TripUpdateRecord toRecord(transit_realtime::TripUpdate const& tu);
    static VehicleRecord toRecord(transit_realtime::VehiclePosition const& v);
    static std::optional<int32_t> occupancyCode(transit_realtime::VehiclePosition const& v);
};
