#pragma once
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <ctime>
#include <date/tz.h>
#include "Types.hpp"

struct ArrivalView
{
    int dueInMinutes = 0;
    std::string dueAt;        // "%H:%M" in the presenter's zone
    std::string occupancy;    // Enumerator name, "-" without data
    std::optional<Position> position;
};

// Soonest and second-soonest arrival at one stop; empty means unknown.
struct DepartureView
{
    std::optional<ArrivalView> next;
    std::optional<ArrivalView> following;
};

using AttributeList = std::vector<std::pair<std::string, std::string>>;

class Presenter
{
private:
    date::time_zone const* zone;

public:
    // Empty name selects the host's zone. Unknown names throw std::runtime_error.
    explicit Presenter(std::string const& timeZone = {});

    DepartureView present(std::vector<Arrival> const& arrivals, std::time_t now) const;
    std::string formatClock(std::time_t t) const;

    static int minutesUntil(std::time_t t, std::time_t now) noexcept;
    static AttributeList attributes(Departure const& departure, DepartureView const& view);
    static std::string state(DepartureView const& view);

    static inline const std::string UNKNOWN = "-";
};
