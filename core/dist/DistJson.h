#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "DistTypes.h"

namespace dist {

nlohmann::json meterToJson(const IndividualMeter& m);

// indent < 0: JSON compact
std::string resultsToJson(const DistributionResults& r, int indent = -1);

} // namespace dist
