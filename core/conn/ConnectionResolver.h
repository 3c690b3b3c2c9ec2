#pragma once
#include <vector>

#include "ConnTypes.h"

namespace conn {

// Du plan équilibré au schéma de raccordement BT.
//
// 1) recombine: les deux moitiés d'un compteur split redeviennent un seul
//    compteur sur un départ logique "n1 & n2".
// 2) par départ logique: lourds (SS, un raccordement chacun), légers
//    (bin-packing best-fit sur sorties DP), moyens (sortie DP CT individuelle).
class ConnectionResolver {
public:
    explicit ConnectionResolver(ConnectionRules rules = {});

    const ConnectionRules& rules() const { return rules_; }

    // Départs logiques triés par transformateur puis numéro de tête.
    // Une moitié sans sa jumelle sur le même transformateur est une LogicError.
    dist::Result<std::vector<LogicalBreaker>> recombine(const std::vector<dist::Transformer>& transformers) const;

    MeterTier classify(const IndividualMeter& m) const;

    // Best-fit décroissant, plafond rules().binCeilingA
    std::vector<MeterBin> packLight(std::vector<IndividualMeter> meters) const;

    static ConnectionConfig dpConfig(double cdl);
    ConnectionConfig ssConfig(double cdl) const;
    static std::string heavyMeterBox(double capacity);

    dist::Result<std::vector<FinalConnection>> resolve(const std::vector<dist::Transformer>& transformers) const;

private:
    void emitGroup_(const LogicalBreaker& lb, std::vector<FinalConnection>& out) const;

    ConnectionRules rules_;
};

dist::Result<std::vector<FinalConnection>> calculateFinalConnections(const std::vector<dist::Transformer>& transformers,
                                                                     const ConnectionRules& rules = {});

ConnectionTotals computeTotals(const std::vector<FinalConnection>& connections);

} // namespace conn
