#pragma once
#include <string>
#include <vector>

#include "DistTypes.h"

namespace conn {

using dist::IndividualMeter;

enum class FeedSource { DP, SS };

inline const char* toString(FeedSource s) {
    switch (s) {
    case FeedSource::DP: return "DP";
    case FeedSource::SS: return "SS";
    }
    return "?";
}

// Classement par calibre nominal
enum class MeterTier { Light, Medium, Heavy };

inline const char* toString(MeterTier t) {
    switch (t) {
    case MeterTier::Light: return "Light";
    case MeterTier::Medium: return "Medium";
    case MeterTier::Heavy: return "Heavy";
    }
    return "?";
}

struct ConnectionConfig {
    FeedSource source {FeedSource::DP};
    int fuses {1};
    int customerCableCount {1};
    std::string customerCableSize;   // "70 mm²"
    std::string mainFeederInfo;      // "1x 300 mm²" / "Direct Feeder"
};

// Départ logique: un départ physique, ou une paire de départs split recombinée
struct LogicalBreaker {
    std::string id;                  // "t2-b5" ou id de base du compteur split
    int transformerId {0};
    int leadingNumber {0};
    std::string label;               // "5" ou "1 & 2"
    std::string idLabel;             // "5" ou "1-2"
    bool recombined {false};
    std::vector<IndividualMeter> meters;
};

struct MeterBin {
    std::vector<IndividualMeter> meters;
    double load {0.0};
};

struct FinalConnection {
    std::string id;                  // "t1-b3-m4_2", "t1-b3-o4-5"
    int transformerId {0};
    std::string transformerName;
    std::string breakerNumber;       // libellé du départ logique
    std::string dpOutletNumber;      // vide pour les départs SS
    MeterTier tier {MeterTier::Light};
    double totalCDL {0.0};
    std::vector<IndividualMeter> meters;
    std::string meterBoxes;
    ConnectionConfig configuration;
};

// Seuils du résolveur (A)
struct ConnectionRules {
    double binCeilingA {248.0};      // charge max d'une sortie DP partagée
    double heavyThresholdA {300.0};  // calibre >= : alimentation directe SS
    double mediumThresholdA {200.0}; // calibre >= : sortie DP individuelle CT
    double ssCableCapacityA {248.0}; // charge par câble 300 mm² côté SS

    dist::Status validate() const {
        if (binCeilingA <= 0.0 || ssCableCapacityA <= 0.0)
            return dist::Status::Fail(dist::ErrorCode::InvalidInput, "bin and cable ceilings must be > 0");
        if (mediumThresholdA <= 0.0 || heavyThresholdA <= mediumThresholdA)
            return dist::Status::Fail(dist::ErrorCode::InvalidInput, "heavy threshold must be above medium threshold");
        return dist::Status::Ok();
    }
};

struct ConnectionTotals {
    int dpConnections {0};
    int ssConnections {0};
    int fuses {0};
    int cables {0};
    int dpOutlets {0};
    double totalCDL {0.0};
};

} // namespace conn
