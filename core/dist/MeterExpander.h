#pragma once
#include <vector>

#include "DistTypes.h"

namespace dist {

// Un MeterGroup de N compteurs -> N compteurs individuels "{groupId}_{index}".
// count <= 0 est rejeté en amont (MeterCatalog::makeMeterGroup).
std::vector<IndividualMeter> expandMeterGroups(const std::vector<MeterGroup>& groups);

} // namespace dist
