#pragma once
#include <string>
#include <vector>
#include <ctime>
#include "Types.hpp"

class PredictionStore;
class Presenter;
struct DepartureView;

class Dashboard
{
public:
    static std::string generate(std::vector<Departure> const& departures,
                                PredictionStore const& store,
                                Presenter const& presenter);

private:
    static std::string buildHtmlHead(std::size_t departureCount, std::time_t updatedAt, Presenter const& presenter);
    static std::string buildTableHeader();
    static std::string formatPosition(DepartureView const& view);
    static std::string buildRow(Departure const& d, DepartureView const& view);
};
