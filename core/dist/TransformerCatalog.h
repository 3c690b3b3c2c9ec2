#pragma once
#include <vector>

#include "DistTypes.h"

namespace dist {

// Catalogue des types de transformateurs, trié par charge admissible croissante.
// Les types sont partagés (TypeRef) par tous les transformateurs de ce type.
class TransformerCatalog {
public:
    TransformerCatalog() = default;
    explicit TransformerCatalog(std::vector<TransformerType> types);

    // 500 / 1000 / 1500 kVA
    static TransformerCatalog standard();

    bool empty() const { return types_.empty(); }
    const std::vector<TypeRef>& types() const { return types_; }

    // Plus petit type dont safeLoad >= load, sinon le plus gros (surcharge signalée en aval)
    Result<TypeRef> pickForLoad(double load) const;

    Result<TypeRef> findByKva(double kva) const;

    // Type d'un transformateur dédié à un compteur géant
    Result<TypeRef> dedicatedTypeFor(double meterCapacity, const BalancingConfig& cfg) const;

    Status validate() const;

private:
    std::vector<TypeRef> types_;
};

} // namespace dist
