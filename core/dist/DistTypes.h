#pragma once
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "Result.h"

namespace dist {

// --- Identité d'un compteur individuel
// Un compteur est soit entier, soit l'une des deux moitiés d'un compteur
// réparti sur deux départs (split).
enum class SplitPart { Whole, First, Second };

inline const char* toString(SplitPart p) {
    switch (p) {
    case SplitPart::Whole: return "Whole";
    case SplitPart::First: return "First";
    case SplitPart::Second: return "Second";
    }
    return "?";
}

struct MeterId {
    std::string base;                 // "{groupId}_{index}"
    SplitPart part {SplitPart::Whole};

    static MeterId whole(std::string base) { return MeterId{std::move(base), SplitPart::Whole}; }
    MeterId half(SplitPart p) const { return MeterId{base, p}; }

    bool isSplitHalf() const { return part != SplitPart::Whole; }

    // Forme texte stable: "4_2", "4_2_p1", "4_2_p2"
    std::string str() const {
        switch (part) {
        case SplitPart::First: return base + "_p1";
        case SplitPart::Second: return base + "_p2";
        case SplitPart::Whole: break;
        }
        return base;
    }

    bool operator==(const MeterId& o) const { return base == o.base && part == o.part; }
    bool operator!=(const MeterId& o) const { return !(*this == o); }
};

// --- Groupe de compteurs saisi (entrée du moteur)
// Invariant amont: cdlPerMeter * count == totalCDL
struct MeterGroup {
    int id {0};
    std::string type;            // code C1..C29
    std::string typeName;
    int count {0};
    double capacity {0.0};       // calibre nominal (A)
    double demandFactor {1.0};
    double coincidenceFactor {1.0};
    double cdlPerMeter {0.0};    // A
    double totalCDL {0.0};       // A
    std::string category;
    std::string timePattern;
};

struct IndividualMeter {
    MeterId id;
    int groupId {0};
    std::string type;
    std::string typeName;
    double capacity {0.0};
    double cdl {0.0};
    std::string category;
    std::string timePattern;

    // "part 1" / "part 2" pour les moitiés, vide sinon
    std::string note() const {
        switch (id.part) {
        case SplitPart::First: return "part 1";
        case SplitPart::Second: return "part 2";
        case SplitPart::Whole: break;
        }
        return {};
    }
};

// --- Départ (breaker) d'un transformateur
// load / utilizationPercent / ensembles descriptifs sont dérivés: ils ne sont
// modifiés que par AllocationWorkspace au moment du commit.
struct Breaker {
    int id {0};
    int number {0};
    std::vector<IndividualMeter> meters;
    double load {0.0};
    double utilizationPercent {0.0};
    std::set<std::string> meterTypes;
    std::set<std::string> categories;
    std::set<std::string> timePatterns;

    bool dedicated {false};
    std::string dedicatedFor;    // libellé lisible

    bool empty() const { return meters.empty(); }
    bool hasCategory(const std::string& c) const { return categories.count(c) > 0; }
};

struct TransformerType {
    double capacityKva {0.0};
    double maxCurrent {0.0};
    int breakers {0};
    std::string name;            // "1000 KVA"
    double maxLoad {0.0};
    double safeLoad {0.0};
    double minLoad {0.0};
};

using TypeRef = std::shared_ptr<const TransformerType>;

struct Transformer {
    int id {0};
    TypeRef type;
    double assignedLoad {0.0};
    std::vector<Breaker> breakers;

    bool dedicated {false};
    std::string dedicatedFor;
    double dedicatedCapacity {0.0}; // calibre du compteur hébergé si dedicated

    bool isActive() const {
        for (const auto& b : breakers)
            if (!b.empty()) return true;
        return false;
    }
};

// --- Diagnostics non bloquants (surcharges, etc.)
struct Diag {
    ErrorCode code {ErrorCode::None};
    std::string location;        // "T2/B5"
    std::string message;
};

struct DistributionSummary {
    int totalTransformers {0};
    int totalBreakers {0};
    int distributionEntries {0};
    int totalMeters {0};
    double totalLoad {0.0};
    double totalLoadKva {0.0};
    int overloadedBreakers {0};
    int overloadedTransformers {0};
    double maxUtilization {0.0};
    double minUtilization {0.0};
    double avgUtilization {0.0};
    double balanceScore {100.0};
    double efficiency {0.0};
    // (kVA, nombre) trié par kVA décroissant
    std::vector<std::pair<double, int>> transformerDetails;
};

struct DistributionResults {
    double totalLoad {0.0};
    std::vector<Transformer> transformers;
    double balanceScore {100.0};
    DistributionSummary summary;
    std::vector<Diag> diagnostics;
};

// --- Paramétrage de l'algorithme
// Les poids du score de placement sont empiriques: on les garde réglables.
struct ScoringWeights {
    double targetWeight {1.0};
    double balanceWeight {1.0};
    double diversityWeight {1.0};
    double fillWeight {1.0};

    double targetBase {1000.0};     // 1000 - |newLoad - target|
    double balanceBase {50.0};      // (50 - stdDev) * 10
    double balanceScale {10.0};
    double diversityBonus {25.0};   // catégorie absente du départ
    double fillBase {50.0};         // 50 - load
};

struct BalancingConfig {
    double breakerCapacityA {310.0};
    double breakerSafeFactor {0.8};

    double dedicatedThresholdA {1600.0};
    double splitThresholdA {400.0};

    // Compteurs géants: calibre <= dedicatedSmallMaxA -> dedicatedSmallKva, sinon dedicatedLargeKva
    double dedicatedSmallMaxA {1600.0};
    double dedicatedSmallKva {1000.0};
    double dedicatedLargeKva {1500.0};

    int rebalanceRounds {5};
    double imbalanceThresholdA {20.0};

    bool enableConsolidation {false};
    int consolidationIterations {20};
    double consolidationMinCapacityA {20.0};
    double consolidationMaxCapacityA {300.0};

    double kvaPerAmp {0.4 * 1.73};
    double overloadTolerance {0.01};

    ScoringWeights scoring;

    double safeBreakerCapacity() const { return breakerCapacityA * breakerSafeFactor; }

    Status validate() const {
        if (breakerCapacityA <= 0.0 || breakerSafeFactor <= 0.0 || breakerSafeFactor > 1.0)
            return Status::Fail(ErrorCode::InvalidInput, "breaker capacity/safe factor out of range");
        if (splitThresholdA <= 0.0 || dedicatedThresholdA <= splitThresholdA)
            return Status::Fail(ErrorCode::InvalidInput, "split threshold must be below dedicated threshold");
        if (rebalanceRounds < 0 || consolidationIterations < 0)
            return Status::Fail(ErrorCode::InvalidInput, "iteration caps must be >= 0");
        if (imbalanceThresholdA < 0.0)
            return Status::Fail(ErrorCode::InvalidInput, "imbalance threshold must be >= 0");
        return Status::Ok();
    }
};

} // namespace dist
