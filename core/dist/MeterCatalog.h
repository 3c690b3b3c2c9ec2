#pragma once
#include <string>
#include <vector>

#include "DistTypes.h"

namespace dist {

struct MeterTypeInfo {
    std::string code;          // "C1"
    std::string name;
    double demandFactor {1.0};
    std::string category;
    std::string timePattern;
};

// Ligne brute d'un projet avant calcul des facteurs
struct MeterGroupSpec {
    std::string type;
    int count {0};
    double capacity {0.0};
    double demandFactorOverride {0.0}; // 0 = valeur du catalogue
};

namespace MeterCatalog {

const std::vector<MeterTypeInfo>& types();
const MeterTypeInfo* find(const std::string& code);

// Calibres normalisés proposés à la saisie (A)
const std::vector<double>& standardCapacities();

// 1 pour C2 ou N == 1, sinon (0.67 + 0.33 / sqrt(N)) / 1.25
double coincidenceFactor(int count, const std::string& code);

// Construit un MeterGroup complet (CDL, catégorie, profil horaire).
// Rejette count <= 0, calibre <= 0 et code inconnu.
Result<MeterGroup> makeMeterGroup(int id, const MeterGroupSpec& spec);

Result<std::vector<MeterGroup>> makeMeterGroups(const std::vector<MeterGroupSpec>& specs);

// Jeu d'essai intégré (6 groupes)
std::vector<MeterGroupSpec> sampleSpecs();

} // namespace MeterCatalog

} // namespace dist
