#include "DistJson.h"

using namespace dist;
using nlohmann::json;

json dist::meterToJson(const IndividualMeter& m) {
    json j;
    j["id"] = m.id.str();
    j["baseId"] = m.id.base;
    j["part"] = toString(m.id.part);
    j["groupId"] = m.groupId;
    j["type"] = m.type;
    j["typeName"] = m.typeName;
    j["capacity"] = m.capacity;
    j["cdl"] = m.cdl;
    j["category"] = m.category;
    j["timePattern"] = m.timePattern;
    if (m.id.isSplitHalf()) j["note"] = m.note();
    return j;
}

std::string dist::resultsToJson(const DistributionResults& r, int indent) {
    json root;
    root["totalLoad"] = r.totalLoad;
    root["balanceScore"] = r.balanceScore;

    const DistributionSummary& s = r.summary;
    json js;
    js["totalTransformers"] = s.totalTransformers;
    js["totalBreakers"] = s.totalBreakers;
    js["distributionEntries"] = s.distributionEntries;
    js["totalMeters"] = s.totalMeters;
    js["totalLoad"] = s.totalLoad;
    js["totalLoadKVA"] = s.totalLoadKva;
    js["overloadedBreakers"] = s.overloadedBreakers;
    js["overloadedTransformers"] = s.overloadedTransformers;
    js["maxUtilization"] = s.maxUtilization;
    js["minUtilization"] = s.minUtilization;
    js["avgUtilization"] = s.avgUtilization;
    js["balanceScore"] = s.balanceScore;
    js["efficiency"] = s.efficiency;
    js["transformerDetails"] = json::array();
    for (const auto& d : s.transformerDetails)
        js["transformerDetails"].push_back({{"kva", d.first}, {"count", d.second}});
    root["summary"] = std::move(js);

    root["transformers"] = json::array();
    for (const auto& t : r.transformers) {
        json jt;
        jt["id"] = t.id;
        jt["type"] = t.type ? t.type->name : std::string();
        jt["capacityKva"] = t.type ? t.type->capacityKva : 0.0;
        jt["safeLoad"] = t.type ? t.type->safeLoad : 0.0;
        jt["assignedLoad"] = t.assignedLoad;
        if (t.dedicated) jt["dedicatedFor"] = t.dedicatedFor;
        jt["breakers"] = json::array();
        for (const auto& b : t.breakers) {
            if (b.empty()) continue;
            json jb;
            jb["number"] = b.number;
            jb["load"] = b.load;
            jb["utilizationPercent"] = b.utilizationPercent;
            if (b.dedicated) jb["dedicatedFor"] = b.dedicatedFor;
            jb["meterTypes"] = b.meterTypes;
            jb["categories"] = b.categories;
            jb["timePatterns"] = b.timePatterns;
            jb["meters"] = json::array();
            for (const auto& m : b.meters) jb["meters"].push_back(meterToJson(m));
            jt["breakers"].push_back(std::move(jb));
        }
        root["transformers"].push_back(std::move(jt));
    }

    if (!r.diagnostics.empty()) {
        root["diagnostics"] = json::array();
        for (const auto& d : r.diagnostics)
            root["diagnostics"].push_back({{"code", toString(d.code)}, {"location", d.location}, {"message", d.message}});
    }
    return root.dump(indent);
}

