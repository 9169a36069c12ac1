#include <sstream>
#include <ctime>
#include "Types.hpp"
#include "PredictionStore.hpp"
#include "Presenter.hpp"
#include "VirtualClock.hpp"
#include "Dashboard.hpp"

namespace
{
    std::string escape(std::string const& s)
    {
        std::string out;
        out.reserve(s.size());
        for (char c : s)
        {
            switch (c)
            {
                case '<':  out += "&lt;";   break;
                case '>':  out += "&gt;";   break;
                case '&':  out += "&amp;";  break;
                case '\'': out += "&#39;";  break;
                case '"':  out += "&quot;"; break;
                default:   out += c;
            }
        }
        return out;
    }
}

std::string Dashboard::buildHtmlHead(std::size_t departureCount, std::time_t updatedAt, Presenter const& presenter)
{
    std::stringstream ss;

    ss << "<html><head><title>Transit Arrivals</title>"
       << "<style>"
       << "body { font-family: sans-serif; background: #1a1a1a; color: #ddd; padding: 20px; }"
       << "h1 { color: #3498db; border-bottom: 2px solid #444; padding-bottom: 10px; }"
       << "table { width: 100%; border-collapse: collapse; margin-top: 20px; }"
       << "th { text-align: left; background: #333; padding: 10px; border-bottom: 2px solid #555; }"
       << "td { padding: 10px; border-bottom: 1px solid #333; }"
       << "tr:hover { background: #2c2c2c; }"
       << ".due { font-weight: bold; font-size: 1.2em; }"
       << ".muted { color: #777; }"
       << ".badge { background: #444; padding: 2px 5px; border-radius: 3px; "
                     "font-size: 0.8em; margin-right:5px;}"
       << "</style>"
       << "<meta charset='UTF-8'>"
       << "<meta http-equiv='refresh' content='30'>"
       << "</head><body>";

    ss << "<h1>Upcoming Arrivals</h1>";
    ss << "<p>" << departureCount << " departures tracked. Last update: "
       << (updatedAt > 0 ? presenter.formatClock(updatedAt) : std::string("never"))
       << "</p>";

    return ss.str();
}

std::string Dashboard::buildTableHeader()
{
    std::stringstream ss;
    ss << "<table><thead><tr>"
       << "<th>Name</th>"
       << "<th>Route</th>"
       << "<th>Stop</th>"
       << "<th>Due In</th>"
       << "<th>Due At</th>"
       << "<th>Occupancy</th>"
       << "<th>Position</th>"
       << "<th>Next Bus</th>"
       << "<th>Next Due In</th>"
       << "<th>Next Occupancy</th>"
       << "</tr></thead><tbody>";
    return ss.str();
}

std::string Dashboard::formatPosition(DepartureView const& view)
{
    if (!view.next || !view.next->position)
        return "<span class='muted'>" + Presenter::UNKNOWN + "</span>";

    std::stringstream ss;
    ss << view.next->position->latitude << ", " << view.next->position->longitude;
    return ss.str();
}

std::string Dashboard::buildRow(Departure const& d, DepartureView const& view)
{
    auto orUnknown = [](std::optional<ArrivalView> const& v, auto field) -> std::string
    {
        return v ? field(*v) : Presenter::UNKNOWN;
    };

    std::stringstream ss;
    ss << "<tr>"
       << "<td>" << escape(d.name) << "</td>"
       << "<td><b style='font-size:1.2em'>" << escape(d.route) << "</b></td>"
       << "<td><span class='badge'>" << escape(d.stopId) << "</span></td>"
       << "<td class='due'>" << Presenter::state(view) << (view.next ? " min" : "") << "</td>"
       << "<td>" << orUnknown(view.next, [](ArrivalView const& a) { return a.dueAt; }) << "</td>"
       << "<td>" << orUnknown(view.next, [](ArrivalView const& a) { return a.occupancy; }) << "</td>"
       << "<td>" << formatPosition(view) << "</td>"
       << "<td>" << orUnknown(view.following, [](ArrivalView const& a) { return a.dueAt; }) << "</td>"
       << "<td>" << orUnknown(view.following, [](ArrivalView const& a) { return std::to_string(a.dueInMinutes); }) << "</td>"
       << "<td>" << orUnknown(view.following, [](ArrivalView const& a) { return a.occupancy; }) << "</td>"
       << "</tr>";

    return ss.str();
}

std::string Dashboard::generate(std::vector<Departure> const& departures,
                                PredictionStore const& store,
                                Presenter const& presenter)
{
    std::time_t now = VirtualClock::now();

    std::stringstream ss;
    ss << buildHtmlHead(departures.size(), store.lastUpdated(), presenter);
    ss << buildTableHeader();

    for (const auto& d : departures)
    {
        DepartureView view = presenter.present(store.get(d.route, d.stopId), now);
        ss << buildRow(d, view);
    }

    ss << "</tbody></table></body></html>";

    return ss.str();
}
