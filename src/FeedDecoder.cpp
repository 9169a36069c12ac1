#include "FeedDecoder.hpp"
#include <google/protobuf/unknown_field_set.h>
#include "Errors.hpp"

FeedEntities FeedDecoder::decode(std::string const& data)
{
    if (data.empty())
        throw DecodeError("empty feed buffer");

    // Some producers answer 200 with an HTML error page
    if (data[0] == '<')
        throw DecodeError("feed buffer is markup, not a protocol buffer");

    transit_realtime::FeedMessage feed;
    if (!feed.ParseFromString(data))
        throw DecodeError("malformed FeedMessage (" + std::to_string(data.size()) + " bytes)");

    FeedEntities out;
    out.timestamp = feed.header().timestamp();

    for (const auto& entity : feed.entity())
    {
        if (entity.has_trip_update())
            out.tripUpdates.push_back(toRecord(entity.trip_update()));

        if (entity.has_vehicle())
            out.vehicles.push_back(toRecord(entity.vehicle()));
    }

    return out;
}

TripUpdateRecord FeedDecoder::toRecord(transit_realtime::TripUpdate const& tu)
{
    TripUpdateRecord rec;
    rec.tripId    = tu.trip().trip_id();
    rec.routeId   = tu.trip().route_id();
    rec.vehicleId = tu.vehicle().id();

    rec.stopTimeUpdates.reserve(tu.stop_time_update_size());
    for (int i = 0; i < tu.stop_time_update_size(); ++i)
    {
        const auto& st = tu.stop_time_update(i);

        StopTimeUpdateRecord stop;
        stop.stopId = st.stop_id();

        // Departure-only updates (typically a trip's first stop) carry no arrival
        if (st.has_arrival() && st.arrival().has_time())
            stop.arrivalTime = static_cast<std::time_t>(st.arrival().time());

        rec.stopTimeUpdates.push_back(std::move(stop));
    }

    return rec;
}

VehicleRecord FeedDecoder::toRecord(transit_realtime::VehiclePosition const& v)
{
    VehicleRecord rec;
    rec.vehicleId = v.vehicle().id();
    rec.tripId    = v.trip().trip_id();
    rec.routeId   = v.trip().route_id();

    if (v.has_position())
        rec.position = Position{v.position().latitude(), v.position().longitude()};

    rec.occupancyCode = occupancyCode(v);
    return rec;
}

std::optional<int32_t> FeedDecoder::occupancyCode(transit_realtime::VehiclePosition const& v)
{
    if (v.has_occupancy_status())
        return static_cast<int32_t>(v.occupancy_status());

    // proto2 keeps enum values it does not know as unknown fields
    const google::protobuf::UnknownFieldSet& unknown = v.GetReflection()->GetUnknownFields(v);
    std::optional<int32_t> code;
    for (int i = 0; i < unknown.field_count(); ++i)
    {
        const google::protobuf::UnknownField& field = unknown.field(i);
        if (field.number() == transit_realtime::VehiclePosition::kOccupancyStatusFieldNumber &&
            field.type() == google::protobuf::UnknownField::TYPE_VARINT)
        {
            code = static_cast<int32_t>(field.varint());
        }
    }
    return code;
}
