#pragma once
#include <cstddef>

#include "AllocationWorkspace.h"

namespace dist {

// Optimisation locale après placement, bornée en nombre de tours.
class Rebalancer {
public:
    explicit Rebalancer(BalancingConfig cfg = {});

    // Déplace le plus petit compteur mobile du départ le plus chargé vers le
    // moins chargé, au plus rebalanceRounds fois. Retourne le nombre de moves.
    Result<int> balanceInternally(AllocationWorkspace& ws, std::size_t tx) const;
    Result<int> balanceAll(AllocationWorkspace& ws) const;

    // Regroupe les départs à compteur unique (20A..300A) sur d'autres départs
    // occupés, y compris d'un autre transformateur. Retourne le nombre de moves.
    Result<int> consolidate(AllocationWorkspace& ws) const;

private:
    bool isMovableSingle_(const Breaker& b) const;

    BalancingConfig cfg_;
};

} // namespace dist
