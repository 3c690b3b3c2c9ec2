#include "AllocationWorkspace.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <sstream>

using namespace dist;

namespace {

double stdDev(const std::vector<double>& xs) {
    if (xs.empty()) return 0.0;
    double sum = 0.0;
    for (double x : xs) sum += x;
    const double avg = sum / xs.size();
    double acc = 0.0;
    for (double x : xs) acc += (x - avg) * (x - avg);
    return std::sqrt(acc / xs.size());
}

std::string location(const Transformer& t, const Breaker* b = nullptr) {
    std::ostringstream oss;
    oss << "T" << t.id;
    if (b) oss << "/B" << b->number;
    return oss.str();
}

// Départ dédié à un compteur géant entier (1600A, 2500A...)
bool hostsGiantMeter(const Breaker& b, const BalancingConfig& cfg) {
    if (!b.dedicated || b.meters.size() != 1) return false;
    const IndividualMeter& m = b.meters.front();
    return !m.id.isSplitHalf() && m.capacity >= cfg.dedicatedThresholdA;
}

} // namespace

AllocationWorkspace::AllocationWorkspace(BalancingConfig cfg) : cfg_(std::move(cfg)) {}

std::size_t AllocationWorkspace::createTransformer(const TypeRef& type) {
    Transformer t;
    t.id = nextId_++;
    t.type = type;
    const int n = type ? type->breakers : 0;
    t.breakers.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
        Breaker b;
        b.id = i + 1;
        b.number = i + 1;
        t.breakers.push_back(std::move(b));
    }
    transformers_.push_back(std::move(t));
    return transformers_.size() - 1;
}

std::size_t AllocationWorkspace::createDedicatedTransformer(const TypeRef& type, IndividualMeter meter) {
    std::ostringstream reason;
    reason << "for " << meter.capacity << "A meter";

    Transformer t;
    t.id = nextId_++;
    t.type = type;
    t.dedicated = true;
    t.dedicatedFor = reason.str();
    t.dedicatedCapacity = meter.capacity;

    Breaker b;
    b.id = 1;
    b.number = 1;
    b.dedicated = true;
    b.dedicatedFor = reason.str();
    b.meters.push_back(std::move(meter));
    t.breakers.push_back(std::move(b));

    transformers_.push_back(std::move(t));
    Transformer& added = transformers_.back();
    refreshBreaker(added.breakers.front());
    refreshTransformer(added);
    return transformers_.size() - 1;
}

void AllocationWorkspace::commitAdd(const BreakerRef& ref, IndividualMeter meter) {
    Transformer& t = transformers_.at(ref.tx);
    Breaker& b = t.breakers.at(ref.br);
    b.meters.push_back(std::move(meter));
    refreshBreaker(b);
    refreshTransformer(t);
}

Status AllocationWorkspace::commitMove(const BreakerRef& from, const MeterId& id, const BreakerRef& to) {
    if (from == to)
        return Status::Ok();
    Breaker& src = breaker(from);
    auto it = std::find_if(src.meters.begin(), src.meters.end(),
                           [&](const IndividualMeter& m) { return m.id == id; });
    if (it == src.meters.end())
        return Status::Fail(ErrorCode::LogicError, "commitMove: meter " + id.str() + " not on source breaker");

    IndividualMeter moved = std::move(*it);
    src.meters.erase(it);
    breaker(to).meters.push_back(std::move(moved));

    refreshBreaker(breaker(from));
    refreshBreaker(breaker(to));
    refreshTransformer(transformers_.at(from.tx));
    if (to.tx != from.tx)
        refreshTransformer(transformers_.at(to.tx));
    return Status::Ok();
}

void AllocationWorkspace::dedicate(const BreakerRef& ref, std::string reason) {
    Breaker& b = breaker(ref);
    b.dedicated = true;
    b.dedicatedFor = std::move(reason);
    refreshBreaker(b);
}

double AllocationWorkspace::effectiveCapacity(const Breaker& b) const {
    if (hostsGiantMeter(b, cfg_))
        return b.meters.front().capacity;
    return cfg_.breakerCapacityA;
}

void AllocationWorkspace::refreshBreaker(Breaker& b) const {
    b.load = 0.0;
    b.meterTypes.clear();
    b.categories.clear();
    b.timePatterns.clear();
    for (const auto& m : b.meters) {
        b.load += m.cdl;
        b.meterTypes.insert(m.typeName);
        b.categories.insert(m.category);
        b.timePatterns.insert(m.timePattern);
    }
    const double cap = effectiveCapacity(b);
    b.utilizationPercent = cap > 0.0 ? (b.load / cap) * 100.0 : 0.0;
}

void AllocationWorkspace::refreshTransformer(Transformer& t) const {
    t.assignedLoad = 0.0;
    for (const auto& b : t.breakers)
        t.assignedLoad += b.load;
}

void AllocationWorkspace::refreshAll() {
    for (auto& t : transformers_) {
        for (auto& b : t.breakers)
            refreshBreaker(b);
        refreshTransformer(t);
    }
}

bool AllocationWorkspace::isBreakerOverloaded(const Breaker& b) const {
    if (hostsGiantMeter(b, cfg_))
        return b.load > b.meters.front().capacity;
    return b.load > cfg_.safeBreakerCapacity();
}

bool AllocationWorkspace::isTransformerOverloaded(const Transformer& t) const {
    if (t.dedicated)
        return t.assignedLoad > t.dedicatedCapacity + cfg_.overloadTolerance;
    const double safe = t.type ? t.type->safeLoad : 0.0;
    return t.assignedLoad > safe + cfg_.overloadTolerance;
}

void AllocationWorkspace::compact() {
    transformers_.erase(std::remove_if(transformers_.begin(), transformers_.end(),
                                       [](const Transformer& t) { return !t.isActive(); }),
                        transformers_.end());
    int id = 1;
    for (auto& t : transformers_)
        t.id = id++;
    nextId_ = id;
}

double AllocationWorkspace::totalAssignedLoad() const {
    double s = 0.0;
    for (const auto& t : transformers_) s += t.assignedLoad;
    return s;
}

double AllocationWorkspace::balanceScore() const {
    std::vector<double> utils;
    for (const auto& t : transformers_) {
        if (t.dedicated) continue;
        for (const auto& b : t.breakers)
            if (!b.empty() && !b.dedicated) utils.push_back(b.utilizationPercent);
    }
    if (utils.size() < 2)
        return 100.0;
    return std::max(0.0, std::min(100.0, 100.0 - stdDev(utils) * 2.0));
}

double AllocationWorkspace::efficiency() const {
    double used = 0.0;
    double capacity = 0.0;
    for (const auto& t : transformers_) {
        used += t.assignedLoad;
        capacity += t.type ? t.type->safeLoad : 0.0;
    }
    return capacity > 0.0 ? used / capacity * 100.0 : 0.0;
}

DistributionSummary AllocationWorkspace::summarize(const std::vector<MeterGroup>& groups) const {
    DistributionSummary s;
    std::vector<double> utils;
    std::set<std::string> splitPairs;
    std::map<double, int> byKva;

    for (const auto& t : transformers_) {
        if (t.type) byKva[t.type->capacityKva] += 1;
        if (isTransformerOverloaded(t)) ++s.overloadedTransformers;
        for (const auto& b : t.breakers) {
            if (b.empty()) continue;
            ++s.totalBreakers;
            utils.push_back(b.utilizationPercent);
            if (isBreakerOverloaded(b)) ++s.overloadedBreakers;
            for (const auto& m : b.meters)
                if (m.id.part == SplitPart::Second) splitPairs.insert(m.id.base);
        }
    }

    s.totalTransformers = static_cast<int>(transformers_.size());
    s.distributionEntries = s.totalBreakers - static_cast<int>(splitPairs.size());
    for (const auto& g : groups) {
        s.totalMeters += g.count;
        s.totalLoad += g.totalCDL;
    }
    s.totalLoadKva = s.totalLoad * cfg_.kvaPerAmp;

    if (!utils.empty()) {
        s.maxUtilization = *std::max_element(utils.begin(), utils.end());
        s.minUtilization = *std::min_element(utils.begin(), utils.end());
        double sum = 0.0;
        for (double u : utils) sum += u;
        s.avgUtilization = sum / utils.size();
    }
    s.balanceScore = balanceScore();
    s.efficiency = efficiency();

    for (auto it = byKva.rbegin(); it != byKva.rend(); ++it)
        s.transformerDetails.emplace_back(it->first, it->second);
    return s;
}

std::vector<Diag> AllocationWorkspace::overloadDiagnostics() const {
    std::vector<Diag> out;
    for (const auto& t : transformers_) {
        if (isTransformerOverloaded(t)) {
            std::ostringstream oss;
            oss << "transformer load " << t.assignedLoad << "A exceeds safe load "
                << (t.dedicated ? t.dedicatedCapacity : (t.type ? t.type->safeLoad : 0.0)) << "A";
            out.push_back({ErrorCode::Overload, location(t), oss.str()});
        }
        for (const auto& b : t.breakers) {
            if (b.empty() || !isBreakerOverloaded(b)) continue;
            std::ostringstream oss;
            oss << "breaker load " << b.load << "A exceeds safe ceiling";
            if (b.meters.size() == 1) oss << " (single meter " << b.meters.front().id.str() << ")";
            out.push_back({ErrorCode::Overload, location(t, &b), oss.str()});
        }
    }
    return out;
}

std::vector<Transformer> AllocationWorkspace::release() {
    std::vector<Transformer> out = std::move(transformers_);
    transformers_.clear();
    nextId_ = 1;
    return out;
}
