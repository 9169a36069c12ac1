#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "gtest/gtest.h"

#include "ConfigurationManager.hpp"

namespace
{
    class configuration_manager : public ::testing::Test
    {
    protected:
        std::string path = ::testing::TempDir() + "departures.txt";

        void SetUp() override
        {
            clear();
            std::ofstream out(path);
            out << "name,stopid,route\n"
                << "Bus to City,S1,R1\n"
                << ",S2,R2\n";
        }

        void TearDown() override { clear(); }

        static void clear()
        {
            for (char const* name : {"GTFS_RT_TRIP_UPDATE_URL", "GTFS_RT_VEHICLE_POSITION_URL",
                                     "GTFS_RT_API_KEY", "GTFS_RT_APIKEY", "GTFS_RT_X_API_KEY",
                                     "GTFS_RT_HEADERS", "GTFS_RT_MIN_REFRESH_SECONDS",
                                     "GTFS_RT_REQUEST_TIMEOUT_SECONDS", "GTFS_RT_TIMEZONE"})
                ::unsetenv(name);
        }
    };
}

TEST(configuration_parse, departures_csv)
{
    std::istringstream in("name,stopid,route\n"
                          "Bus to City, S1 ,R1\r\n"
                          "\n"
                          ",S2,R2\n"
                          "Broken,,R3\n"
                          "Also broken,S4\n");

    auto departures = ConfigurationManager::parseDepartures(in);

    ASSERT_EQ(2u, departures.size());
    EXPECT_EQ("Bus to City", departures[0].name);
    EXPECT_EQ("S1", departures[0].stopId);
    EXPECT_EQ("R1", departures[0].route);
    EXPECT_EQ(ConfigurationManager::DEFAULT_NAME, departures[1].name);
    EXPECT_EQ("S2", departures[1].stopId);
}

TEST(configuration_parse, auth_header_styles)
{
    HeaderList authorization{{"Authorization", "k1"}};
    HeaderList apikey{{"apikey", "k2"}};
    HeaderList xApiKey{{"x-api-key", "k3"}};
    HeaderList custom{{"Ocp-Apim-Subscription-Key", "abc"}, {"X-Client", "home"}};

    EXPECT_EQ(authorization, ConfigurationManager::resolveHeaders("k1", nullptr, nullptr, nullptr));
    EXPECT_EQ(apikey, ConfigurationManager::resolveHeaders(nullptr, "k2", nullptr, nullptr));
    EXPECT_EQ(xApiKey, ConfigurationManager::resolveHeaders(nullptr, nullptr, "k3", ""));
    EXPECT_EQ(custom, ConfigurationManager::resolveHeaders(nullptr, nullptr, nullptr,
                                                           "Ocp-Apim-Subscription-Key: abc; X-Client:home"));
    EXPECT_TRUE(ConfigurationManager::resolveHeaders(nullptr, nullptr, nullptr, nullptr).empty());
}

TEST(configuration_parse, auth_styles_are_exclusive)
{
    EXPECT_THROW(ConfigurationManager::resolveHeaders("k1", "k2", nullptr, nullptr), std::runtime_error);
    EXPECT_THROW(ConfigurationManager::resolveHeaders(nullptr, nullptr, "k3", "A: b"), std::runtime_error);
    EXPECT_THROW(ConfigurationManager::resolveHeaders(nullptr, nullptr, nullptr, "no colon"), std::runtime_error);
}

TEST_F(configuration_manager, requires_trip_update_url)
{
    EXPECT_THROW(ConfigurationManager config(path), std::runtime_error);
}

TEST_F(configuration_manager, reads_environment_and_departures)
{
    ::setenv("GTFS_RT_TRIP_UPDATE_URL", "https://example.org/gtfsr/trips", 1);
    ::setenv("GTFS_RT_VEHICLE_POSITION_URL", "https://example.org/gtfsr/vehicles", 1);
    ::setenv("GTFS_RT_X_API_KEY", "secret", 1);
    ::setenv("GTFS_RT_MIN_REFRESH_SECONDS", "90", 1);
    ::setenv("GTFS_RT_TIMEZONE", "Europe/Dublin", 1);

    ConfigurationManager config(path);

    EXPECT_EQ("https://example.org/gtfsr/trips", config.getTripUpdateUrl());
    EXPECT_EQ("https://example.org/gtfsr/vehicles", config.getVehiclePositionUrl());
    HeaderList expected{{"x-api-key", "secret"}};
    EXPECT_EQ(expected, config.getHeaders());
    EXPECT_EQ(std::chrono::seconds(90), config.getMinRefreshInterval());
    EXPECT_EQ(std::chrono::seconds(30), config.getRequestTimeout());
    EXPECT_EQ(std::chrono::seconds(30), config.getPollInterval());
    EXPECT_EQ("Europe/Dublin", config.getTimeZone());
    ASSERT_EQ(2u, config.getDepartures().size());
    EXPECT_EQ("Next Bus", config.getDepartures()[1].name);
}

TEST_F(configuration_manager, defaults)
{
    ::setenv("GTFS_RT_TRIP_UPDATE_URL", "file:///tmp/trips.pb", 1);

    ConfigurationManager config(path);

    EXPECT_TRUE(config.getVehiclePositionUrl().empty());
    EXPECT_TRUE(config.getHeaders().empty());
    EXPECT_EQ(std::chrono::seconds(60), config.getMinRefreshInterval());
    EXPECT_TRUE(config.getTimeZone().empty());
}

TEST_F(configuration_manager, rejects_bad_interval_and_missing_file)
{
    ::setenv("GTFS_RT_TRIP_UPDATE_URL", "file:///tmp/trips.pb", 1);

    EXPECT_THROW(ConfigurationManager config(::testing::TempDir() + "missing/departures.txt"), std::runtime_error);

    ::setenv("GTFS_RT_MIN_REFRESH_SECONDS", "soon", 1);
    EXPECT_THROW(ConfigurationManager config(path), std::runtime_error);
}

TEST_F(configuration_manager, poll_interval_follows_short_refresh_interval)
{
    ::setenv("GTFS_RT_TRIP_UPDATE_URL", "file:///tmp/trips.pb", 1);

    ::setenv("GTFS_RT_MIN_REFRESH_SECONDS", "10", 1);
    EXPECT_EQ(std::chrono::seconds(10), ConfigurationManager(path).getPollInterval());

    ::setenv("GTFS_RT_MIN_REFRESH_SECONDS", "0", 1);
    EXPECT_EQ(std::chrono::seconds(1), ConfigurationManager(path).getPollInterval());

    ::setenv("GTFS_RT_MIN_REFRESH_SECONDS", "600", 1);
    EXPECT_EQ(std::chrono::seconds(30), ConfigurationManager(path).getPollInterval());
}
