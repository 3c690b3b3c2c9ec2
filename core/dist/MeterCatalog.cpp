#include "MeterCatalog.h"

#include <cmath>
#include <sstream>

using namespace dist;

namespace {

const char* kResidential = "Residential";
const char* kCommercial = "Commercial";
const char* kPublic = "Public";
const char* kInfrastructure = "Infrastructure";
const char* kIndustrial = "Industrial";

const char* kDaytime = "Daytime";
const char* kNight = "Night";
const char* kMixed = "Mixed";
const char* kContinuous = "Continuous";

std::vector<MeterTypeInfo> buildTypes() {
    return {
        {"C1", "Residential (standard)", 0.5, kResidential, kNight},
        {"C2", "Shops", 0.6, kCommercial, kDaytime},
        {"C3", "Furnished apartments / staff housing", 0.6, kResidential, kNight},
        {"C4", "Hotels", 0.65, kCommercial, kNight},
        {"C5", "Malls / shopping centres", 0.6, kCommercial, kMixed},
        {"C6", "Restaurants / cafes", 0.6, kCommercial, kNight},
        {"C7", "Offices (government / commercial)", 0.6, kCommercial, kDaytime},
        {"C8", "Schools / nurseries", 0.7, kPublic, kDaytime},
        {"C9", "Mosques", 0.8, kPublic, kMixed},
        {"C10", "Hotel mezzanine", 0.65, kMixed, kMixed},
        {"C11", "Shared building services", 0.7, kInfrastructure, kMixed},
        {"C12", "Public utilities", 0.65, kInfrastructure, kContinuous},
        {"C13", "Indoor car parks", 0.7, kInfrastructure, kContinuous},
        {"C14", "Outdoor car parks", 0.8, kInfrastructure, kContinuous},
        {"C15", "Street lighting", 0.8, kInfrastructure, kContinuous},
        {"C16", "Gardens and parks", 0.7, kInfrastructure, kContinuous},
        {"C17", "Open squares", 0.8, kInfrastructure, kContinuous},
        {"C18", "Hospitals / medical facilities", 0.7, kPublic, kMixed},
        {"C19", "Medical clinics", 0.6, kPublic, kDaytime},
        {"C20", "Universities / institutes", 0.7, kPublic, kDaytime},
        {"C21", "Light industry", 0.8, kIndustrial, kMixed},
        {"C22", "Workshops", 0.8, kIndustrial, kDaytime},
        {"C23", "Cold stores", 0.8, kIndustrial, kMixed},
        {"C24", "Warehouses", 0.6, kIndustrial, kMixed},
        {"C25", "Event halls", 0.7, kPublic, kNight},
        {"C26", "Entertainment venues", 0.7, kPublic, kNight},
        {"C27", "Farms / agricultural facilities", 0.8, kIndustrial, kMixed},
        {"C28", "Fuel stations", 0.6, kIndustrial, kMixed},
        {"C29", "Large factories", 0.8, kIndustrial, kMixed},
    };
}

} // namespace

const std::vector<MeterTypeInfo>& MeterCatalog::types() {
    static const std::vector<MeterTypeInfo> kTypes = buildTypes();
    return kTypes;
}

const MeterTypeInfo* MeterCatalog::find(const std::string& code) {
    for (const auto& t : types())
        if (t.code == code) return &t;
    return nullptr;
}

const std::vector<double>& MeterCatalog::standardCapacities() {
    static const std::vector<double> kCaps {20, 30, 40, 50, 70, 100, 125, 150, 200,
                                            250, 300, 400, 500, 600, 800, 1600, 2500};
    return kCaps;
}

double MeterCatalog::coincidenceFactor(int count, const std::string& code) {
    if (code == "C2" || count == 1)
        return 1.0;
    return (0.67 + (0.33 / std::sqrt(static_cast<double>(count)))) / 1.25;
}

Result<MeterGroup> MeterCatalog::makeMeterGroup(int id, const MeterGroupSpec& spec) {
    const MeterTypeInfo* info = find(spec.type);
    if (!info)
        return Result<MeterGroup>::Fail(ErrorCode::InvalidInput, "unknown meter type '" + spec.type + "'");
    if (spec.count <= 0) {
        std::ostringstream oss;
        oss << "group " << id << " (" << spec.type << "): meter count must be > 0, got " << spec.count;
        return Result<MeterGroup>::Fail(ErrorCode::InvalidInput, oss.str());
    }
    if (spec.capacity <= 0.0) {
        std::ostringstream oss;
        oss << "group " << id << " (" << spec.type << "): capacity must be > 0";
        return Result<MeterGroup>::Fail(ErrorCode::InvalidInput, oss.str());
    }
    if (spec.demandFactorOverride < 0.0 || spec.demandFactorOverride > 1.0) {
        std::ostringstream oss;
        oss << "group " << id << " (" << spec.type << "): demand factor override must be in [0,1], 0 = catalog value";
        return Result<MeterGroup>::Fail(ErrorCode::InvalidInput, oss.str());
    }

    MeterGroup g;
    g.id = id;
    g.type = info->code;
    g.typeName = info->name;
    g.count = spec.count;
    g.capacity = spec.capacity;
    g.demandFactor = spec.demandFactorOverride > 0.0 ? spec.demandFactorOverride : info->demandFactor;
    g.coincidenceFactor = coincidenceFactor(spec.count, spec.type);
    g.totalCDL = g.count * (g.capacity * g.demandFactor) * g.coincidenceFactor;
    g.cdlPerMeter = g.totalCDL / g.count;
    g.category = info->category;
    g.timePattern = info->timePattern;
    return g;
}

Result<std::vector<MeterGroup>> MeterCatalog::makeMeterGroups(const std::vector<MeterGroupSpec>& specs) {
    std::vector<MeterGroup> out;
    out.reserve(specs.size());
    int id = 1;
    for (const auto& s : specs) {
        auto g = makeMeterGroup(id++, s);
        if (!g)
            return Result<std::vector<MeterGroup>>(g.error());
        out.push_back(std::move(g.value()));
    }
    return out;
}

std::vector<MeterGroupSpec> MeterCatalog::sampleSpecs() {
    return {
        {"C1", 35, 30.0, 0.0},
        {"C2", 25, 70.0, 0.0},
        {"C1", 30, 50.0, 0.0},
        {"C6", 15, 100.0, 0.0},
        {"C3", 20, 40.0, 0.0},
        {"C7", 18, 50.0, 0.0},
    };
}
