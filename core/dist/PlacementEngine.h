#pragma once
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "AllocationWorkspace.h"
#include "TransformerCatalog.h"

namespace dist {

// Placement des compteurs individuels sur transformateurs + départs.
//
// 1) Compteurs géants (>= seuil dédié): un transformateur mono-départ chacun.
// 2) File générale (split d'abord, puis CDL décroissante): un transformateur
//    à la fois, dimensionné sur la charge restante; split sur la paire de
//    départs la moins chargée, normaux par score (cible, écart-type,
//    diversité, remplissage). Les non placés repartent dans la file.
class PlacementEngine {
public:
    PlacementEngine(BalancingConfig cfg, TransformerCatalog catalog);

    bool isDedicated(const IndividualMeter& m) const;
    bool needsSplit(const IndividualMeter& m) const;

    void sortQueue(std::vector<IndividualMeter>& queue) const;

    Status place(const std::vector<IndividualMeter>& meters, AllocationWorkspace& ws) const;

    // Paire (b1, b2) de départs non dédiés, charge cumulée minimale
    std::optional<std::pair<std::size_t, std::size_t>>
    findBestBreakerPair(const Transformer& t, const IndividualMeter& m) const;

    double scoreBreaker(const AllocationWorkspace& ws, const BreakerRef& candidate,
                        const std::vector<BreakerRef>& targets, const IndividualMeter& m,
                        double targetLoad) const;

private:
    Status placeDedicated_(const IndividualMeter& m, AllocationWorkspace& ws) const;
    bool placeSplit_(std::size_t tx, const IndividualMeter& m, AllocationWorkspace& ws) const;
    std::vector<IndividualMeter> placeNormal_(std::size_t tx, const std::vector<IndividualMeter>& normals,
                                              AllocationWorkspace& ws) const;

    BalancingConfig cfg_;
    TransformerCatalog catalog_;
};

} // namespace dist
