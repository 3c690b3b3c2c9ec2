#include "TransformerCatalog.h"

#include <algorithm>
#include <cmath>
#include <sstream>

using namespace dist;

TransformerCatalog::TransformerCatalog(std::vector<TransformerType> types) {
    types_.reserve(types.size());
    for (auto& t : types) {
        if (t.name.empty()) {
            std::ostringstream oss;
            oss << t.capacityKva << " KVA";
            t.name = oss.str();
        }
        types_.push_back(std::make_shared<const TransformerType>(std::move(t)));
    }
    std::stable_sort(types_.begin(), types_.end(),
                     [](const TypeRef& a, const TypeRef& b) { return a->safeLoad < b->safeLoad; });
}

TransformerCatalog TransformerCatalog::standard() {
    return TransformerCatalog(std::vector<TransformerType>{
        {500.0, 721.0, 4, "500 KVA", 576.80, 576.80, 216.0},
        {1000.0, 1443.0, 8, "1000 KVA", 1154.40, 1154.40, 433.0},
        {1500.0, 2164.0, 10, "1500 KVA", 2164.20, 1731.20, 800.0},
    });
}

Result<TypeRef> TransformerCatalog::pickForLoad(double load) const {
    if (types_.empty())
        return Result<TypeRef>::Fail(ErrorCode::CapacityInfeasible, "transformer catalog is empty");
    for (const auto& t : types_) {
        if (t->safeLoad >= load)
            return t;
    }
    return types_.back();
}

Result<TypeRef> TransformerCatalog::findByKva(double kva) const {
    for (const auto& t : types_) {
        if (std::abs(t->capacityKva - kva) < 1e-6)
            return t;
    }
    std::ostringstream oss;
    oss << "no transformer type of " << kva << " kVA in catalog";
    return Result<TypeRef>::Fail(ErrorCode::CapacityInfeasible, oss.str());
}

Result<TypeRef> TransformerCatalog::dedicatedTypeFor(double meterCapacity,
                                                     const BalancingConfig &cfg) const {
    const double kva = meterCapacity <= cfg.dedicatedSmallMaxA ? cfg.dedicatedSmallKva
                                                               : cfg.dedicatedLargeKva;
    auto res = findByKva(kva);
    if (!res) {
        std::ostringstream oss;
        oss << "cannot host dedicated " << meterCapacity << "A meter: " << res.error().message;
        return Result<TypeRef>::Fail(ErrorCode::CapacityInfeasible, oss.str());
    }
    return res;
}

Status TransformerCatalog::validate() const {
    if (types_.empty())
        return Status::Fail(ErrorCode::InvalidInput, "transformer catalog is empty");
    for (const auto& t : types_) {
        if (t->breakers < 1)
            return Status::Fail(ErrorCode::InvalidInput, t->name + ": breaker count must be >= 1");
        if (t->safeLoad <= 0.0)
            return Status::Fail(ErrorCode::InvalidInput, t->name + ": safe load must be > 0");
    }
    return Status::Ok();
}
