#include "Presenter.hpp"
#include <sstream>
#include <chrono>
#include <limits>
#include "Occupancy.hpp"

Presenter::Presenter(std::string const& timeZone)
    : zone(timeZone.empty() ? date::current_zone() : date::locate_zone(timeZone))
{
}

int Presenter::minutesUntil(std::time_t t, std::time_t now) noexcept
{
    std::time_t diff = t - now;
    std::time_t minutes = diff >= 0 ? diff / 60 : -((-diff + 59) / 60);

    // Feeds occasionally carry nonsense timestamps; saturate instead of wrapping
    if (minutes > std::numeric_limits<int>::max())
        return std::numeric_limits<int>::max();
    if (minutes < std::numeric_limits<int>::min())
        return std::numeric_limits<int>::min();
    return static_cast<int>(minutes);
}

std::string Presenter::formatClock(std::time_t t) const
{
    auto tp = date::floor<std::chrono::seconds>(std::chrono::system_clock::from_time_t(t));
    date::zoned_time<std::chrono::seconds> local{zone, tp};
    return date::format("%H:%M", local);
}

DepartureView Presenter::present(std::vector<Arrival> const& arrivals, std::time_t now) const
{
    auto makeView = [&](Arrival const& a)
    {
        ArrivalView v;
        v.dueInMinutes = minutesUntil(a.arrivalTime, now);
        v.dueAt        = formatClock(a.arrivalTime);
        v.occupancy    = a.occupancy ? occupancyName(*a.occupancy) : UNKNOWN;
        return v;
    };

    DepartureView view;
    if (!arrivals.empty())
    {
        view.next = makeView(arrivals[0]);
        view.next->position = arrivals[0].position;
    }
    if (arrivals.size() > 1)
        view.following = makeView(arrivals[1]);

    return view;
}

std::string Presenter::state(DepartureView const& view)
{
    return view.next ? std::to_string(view.next->dueInMinutes) : UNKNOWN;
}

AttributeList Presenter::attributes(Departure const& departure, DepartureView const& view)
{
    AttributeList attrs = {
        {"Due in",  state(view)},
        {"Stop ID", departure.stopId},
        {"Route",   departure.route}
    };

    if (view.next)
    {
        attrs.emplace_back("Due at", view.next->dueAt);
        attrs.emplace_back("Occupancy", view.next->occupancy);
        if (view.next->position)
        {
            std::ostringstream lat, lon;
            lat << view.next->position->latitude;
            lon << view.next->position->longitude;
            attrs.emplace_back("latitude", lat.str());
            attrs.emplace_back("longitude", lon.str());
        }
    }

    if (view.following)
    {
        attrs.emplace_back("Next bus", view.following->dueAt);
        attrs.emplace_back("Next bus due in", std::to_string(view.following->dueInMinutes));
        attrs.emplace_back("Next bus occupancy", view.following->occupancy);
    }

    return attrs;
}
