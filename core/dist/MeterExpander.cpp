#include "MeterExpander.h"

#include <string>

namespace dist {

std::vector<IndividualMeter> expandMeterGroups(const std::vector<MeterGroup>& groups) {
    std::size_t total = 0;
    for (const auto& g : groups)
        total += g.count > 0 ? static_cast<std::size_t>(g.count) : 0;

    std::vector<IndividualMeter> out;
    out.reserve(total);
    for (const auto& g : groups) {
        for (int i = 0; i < g.count; ++i) {
            IndividualMeter m;
            m.id = MeterId::whole(std::to_string(g.id) + "_" + std::to_string(i));
            m.groupId = g.id;
            m.type = g.type;
            m.typeName = g.typeName;
            m.capacity = g.capacity;
            m.cdl = g.cdlPerMeter;
            m.category = g.category;
            m.timePattern = g.timePattern;
            out.push_back(std::move(m));
        }
    }
    return out;
}

} // namespace dist
