#include "gtest/gtest.h"

#include "ArrivalProjector.hpp"

namespace
{
    constexpr std::time_t kNow = 1700000000;

    TripUpdateRecord trip(std::string tripId, std::string routeId, std::string vehicleId,
                          std::vector<StopTimeUpdateRecord> stops)
    {
        return TripUpdateRecord{std::move(tripId), std::move(routeId), std::move(vehicleId), std::move(stops)};
    }

    VehicleIndex twoVehicles()
    {
        VehicleIndex index;
        index.snapshot["V1"] = VehicleState{Position{53.3, -6.2}, OccupancyStatus::FEW_SEATS_AVAILABLE};
        index.snapshot["V2"] = VehicleState{Position{51.5, -0.1}, OccupancyStatus::FULL};
        index.tripToVehicle["T1"] = "V1";
        index.tripToVehicle["T2"] = "V2";
        return index;
    }
}

TEST(arrival_projector, keeps_future_arrivals_in_ascending_order)
{
    auto table = ArrivalProjector::project({
        trip("T1", "R1", "", {{"S1", kNow + 600}, {"S1", kNow + 120}, {"S1", kNow - 60}})
    }, VehicleIndex{}, kNow);

    auto const& arrivals = table.at("R1").at("S1");
    ASSERT_EQ(2u, arrivals.size());
    EXPECT_EQ(kNow + 120, arrivals[0].arrivalTime);
    EXPECT_EQ(kNow + 600, arrivals[1].arrivalTime);
}

TEST(arrival_projector, drops_arrivals_at_or_before_now)
{
    auto table = ArrivalProjector::project({
        trip("T1", "R1", "", {{"S1", kNow}, {"S2", kNow - 1}, {"S3", kNow + 1}})
    }, VehicleIndex{}, kNow);

    EXPECT_EQ(0u, table.at("R1").count("S1"));
    EXPECT_EQ(0u, table.at("R1").count("S2"));
    ASSERT_EQ(1u, table.at("R1").at("S3").size());

    for (auto const& route : table)
        for (auto const& stop : route.second)
            for (auto const& a : stop.second)
                EXPECT_GT(a.arrivalTime, kNow);
}

TEST(arrival_projector, groups_across_trips_and_sorts_per_stop)
{
    auto table = ArrivalProjector::project({
        trip("T1", "R1", "", {{"S1", kNow + 900}, {"S2", kNow + 1000}}),
        trip("T2", "R1", "", {{"S1", kNow + 300}}),
        trip("T3", "R2", "", {{"S1", kNow + 100}})
    }, VehicleIndex{}, kNow);

    ASSERT_EQ(2u, table.size());
    auto const& s1 = table.at("R1").at("S1");
    ASSERT_EQ(2u, s1.size());
    EXPECT_EQ(kNow + 300, s1[0].arrivalTime);
    EXPECT_EQ(kNow + 900, s1[1].arrivalTime);
    EXPECT_EQ(1u, table.at("R1").at("S2").size());
    EXPECT_EQ(1u, table.at("R2").at("S1").size());
}

TEST(arrival_projector, ties_keep_feed_order)
{
    auto table = ArrivalProjector::project({
        trip("T2", "R1", "", {{"S1", kNow + 300}}),
        trip("T1", "R1", "", {{"S1", kNow + 300}})
    }, twoVehicles(), kNow);

    auto const& arrivals = table.at("R1").at("S1");
    ASSERT_EQ(2u, arrivals.size());
    EXPECT_EQ(OccupancyStatus::FULL, arrivals[0].occupancy);
    EXPECT_EQ(OccupancyStatus::FEW_SEATS_AVAILABLE, arrivals[1].occupancy);
}

TEST(arrival_projector, resolves_vehicle_through_trip_when_id_missing)
{
    auto table = ArrivalProjector::project({
        trip("T1", "R1", "", {{"S1", kNow + 300}}),
        trip("T7", "R1", "", {{"S2", kNow + 300}})
    }, twoVehicles(), kNow);

    Arrival const& linked = table.at("R1").at("S1").front();
    ASSERT_TRUE(linked.position.has_value());
    EXPECT_DOUBLE_EQ(53.3, linked.position->latitude);
    EXPECT_EQ(OccupancyStatus::FEW_SEATS_AVAILABLE, linked.occupancy);

    Arrival const& unlinked = table.at("R1").at("S2").front();
    EXPECT_FALSE(unlinked.position.has_value());
    EXPECT_FALSE(unlinked.occupancy.has_value());
}

TEST(arrival_projector, explicit_vehicle_id_wins_over_trip_link)
{
    auto table = ArrivalProjector::project({
        trip("T1", "R1", "V2", {{"S1", kNow + 300}}),
        trip("T2", "R1", "V404", {{"S2", kNow + 300}})
    }, twoVehicles(), kNow);

    EXPECT_EQ(OccupancyStatus::FULL, table.at("R1").at("S1").front().occupancy);
    EXPECT_FALSE(table.at("R1").at("S2").front().occupancy.has_value());
}

TEST(arrival_projector, tolerates_empty_and_incomplete_trip_updates)
{
    StopTimeUpdateRecord noStop{"", kNow + 300};
    StopTimeUpdateRecord noTime{"S2", std::nullopt};

    auto table = ArrivalProjector::project({
        trip("T1", "R1", "", {}),
        trip("T2", "R1", "", {noStop, noTime, {"S3", kNow + 60}}),
        trip("T3", "", "", {{"S1", kNow + 60}})
    }, VehicleIndex{}, kNow);

    EXPECT_EQ(0u, table.at("R1").count(""));
    EXPECT_EQ(0u, table.at("R1").count("S2"));
    EXPECT_EQ(1u, table.at("R1").at("S3").size());
    EXPECT_EQ(1u, table.at("").at("S1").size());
}
