#pragma once
#include <string>
#include <vector>

#include "DistTypes.h"
#include "MeterCatalog.h"
#include "TransformerCatalog.h"

namespace dist {

// Projet complet: groupes de compteurs, réglages, catalogue de transformateurs
struct ProjectInput {
    std::string name;
    std::vector<MeterGroupSpec> specs;
    std::vector<MeterGroup> groups;       // calculés depuis specs
    BalancingConfig config;
    TransformerCatalog catalog {TransformerCatalog::standard()};
};

// Lecture des fichiers projet XML <FeederPlan> (pugixml)
class ProjectParser {
public:
    ProjectParser();
    Result<ProjectInput> parseFile(const std::string& path);
    Result<ProjectInput> parseString(const std::string& xml);

    // Projet d'exemple intégré
    static Result<ProjectInput> sampleProject();
};

} // namespace dist
