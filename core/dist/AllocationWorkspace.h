#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "DistTypes.h"

namespace dist {

// Adresse stable d'un départ dans l'espace de travail (indices, pas de pointeurs)
struct BreakerRef {
    std::size_t tx {0};
    std::size_t br {0};

    bool operator==(const BreakerRef& o) const { return tx == o.tx && br == o.br; }
    bool operator!=(const BreakerRef& o) const { return !(*this == o); }
};

// Espace de travail d'un calcul: possède tous les transformateurs et départs.
// Toute modification d'appartenance passe par commitAdd / commitMove qui
// recalculent immédiatement les statistiques des départs et transfos touchés.
class AllocationWorkspace {
public:
    explicit AllocationWorkspace(BalancingConfig cfg = {});

    const BalancingConfig& config() const { return cfg_; }

    // Transformateur vide à type.breakers départs; retourne son indice
    std::size_t createTransformer(const TypeRef& type);

    // Transformateur à un seul départ, réservé au compteur géant
    std::size_t createDedicatedTransformer(const TypeRef& type, IndividualMeter meter);

    std::vector<Transformer>& transformers() { return transformers_; }
    const std::vector<Transformer>& transformers() const { return transformers_; }
    Transformer& transformer(std::size_t tx) { return transformers_.at(tx); }
    const Transformer& transformer(std::size_t tx) const { return transformers_.at(tx); }
    Breaker& breaker(const BreakerRef& ref) { return transformers_.at(ref.tx).breakers.at(ref.br); }
    const Breaker& breaker(const BreakerRef& ref) const { return transformers_.at(ref.tx).breakers.at(ref.br); }

    // --- Mutations
    void commitAdd(const BreakerRef& ref, IndividualMeter meter);
    Status commitMove(const BreakerRef& from, const MeterId& id, const BreakerRef& to);
    void dedicate(const BreakerRef& ref, std::string reason);

    // --- Statistiques (StatsAggregator)
    double effectiveCapacity(const Breaker& b) const;
    void refreshBreaker(Breaker& b) const;
    void refreshTransformer(Transformer& t) const;
    void refreshAll();

    bool isBreakerOverloaded(const Breaker& b) const;
    bool isTransformerOverloaded(const Transformer& t) const;

    // Supprime les transformateurs vides et renumérote les ids à partir de 1
    void compact();

    double totalAssignedLoad() const;
    double balanceScore() const;
    double efficiency() const;
    DistributionSummary summarize(const std::vector<MeterGroup>& groups) const;
    std::vector<Diag> overloadDiagnostics() const;

    std::vector<Transformer> release();

private:
    BalancingConfig cfg_;
    std::vector<Transformer> transformers_;
    int nextId_ {1};
};

} // namespace dist
