#pragma once
#include <string>
#include <optional>
#include <cstdint>
#include "Types.hpp"

std::optional<OccupancyStatus> occupancyFromCode(int32_t code) noexcept;
std::string occupancyName(OccupancyStatus status);
