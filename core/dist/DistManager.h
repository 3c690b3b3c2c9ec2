#pragma once
#include <string>
#include <vector>

#include "DistJson.h"
#include "DistTypes.h"
#include "TransformerCatalog.h"

namespace dist {

// Calcul complet: expansion, placement, rééquilibrage, statistiques.
// Déterministe pour un même ordre d'entrée, sans I/O.
Result<DistributionResults> performBalancedDistribution(const std::vector<MeterGroup>& groups,
                                                        const BalancingConfig& cfg = {},
                                                        const TransformerCatalog& catalog = TransformerCatalog::standard());

class DistManager {
public:
    explicit DistManager(BalancingConfig cfg = {},
                         TransformerCatalog catalog = TransformerCatalog::standard());

    Status run(const std::vector<MeterGroup>& groups);

    bool hasResults() const { return hasResults_; }
    const DistributionResults& results() const { return results_; }

    // Debug helpers
    Status printTransformers() const;
    Status printSummary() const;
    Status printDiagnostics() const;

    std::string toJson(int indent = -1) const { return resultsToJson(results_, indent); }

private:
    BalancingConfig cfg_{};
    TransformerCatalog catalog_;
    DistributionResults results_;
    bool hasResults_ {false};
};

} // namespace dist
