#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "DistManager.h"
#include "ProjectParser.h"
#include "TestSupport.h"

#ifndef FEEDERPLAN_SAMPLE_DIR
#define FEEDERPLAN_SAMPLE_DIR "samples"
#endif

namespace {

using dist::ErrorCode;
using dist::ProjectParser;
using testsupport::TestCase;
using testsupport::almostEqual;
using testsupport::fail;

const char* kProject = R"(<?xml version="1.0" encoding="UTF-8"?>
<FeederPlan name="Block A">
  <Settings consolidate="true" rebalanceRounds="3" imbalanceThreshold="15">
    <Scoring diversityBonus="40" fill="0.5"/>
  </Settings>
  <Catalog>
    <TransformerType kva="1000" maxCurrent="1443" breakers="8" maxLoad="1154.4" safeLoad="1154.4" minLoad="433"/>
    <TransformerType kva="500" maxCurrent="721" breakers="4" safeLoad="576.8"/>
  </Catalog>
  <Meters>
    <Group type="C1" count="10" capacity="50"/>
    <Group type="C9" count="1" capacity="600" demandFactor="0.9"/>
  </Meters>
</FeederPlan>)";

// Intent: a complete project reads settings, catalog and meter groups.
bool test_parse_full_project() {
    ProjectParser parser;
    auto res = parser.parseString(kProject);
    if (!res) return fail(res.error().describe());
    const auto& p = res.value();
    if (p.name != "Block A" || p.groups.size() != 2 || p.specs.size() != 2) return fail("header/groups wrong");
    if (!p.config.enableConsolidation || p.config.rebalanceRounds != 3 ||
        !almostEqual(p.config.imbalanceThresholdA, 15.0) ||
        !almostEqual(p.config.scoring.diversityBonus, 40.0) || !almostEqual(p.config.scoring.fillWeight, 0.5))
        return fail("settings not applied");
    const auto& types = p.catalog.types();
    if (types.size() != 2 || !almostEqual(types[0]->capacityKva, 500.0) || types[0]->name != "500 KVA" ||
        !almostEqual(types[0]->maxLoad, 576.8))
        return fail("catalog not sorted or defaults missing");
    return p.groups[0].id == 1 && p.groups[1].id == 2 && almostEqual(p.groups[1].cdlPerMeter, 540.0) &&
           p.groups[0].category == "Residential";
}

// Intent: without <Settings> and <Catalog> the defaults apply.
bool test_parse_defaults() {
    ProjectParser parser;
    auto res = parser.parseString(
        "<FeederPlan><Meters><Group type='C2' count='2' capacity='70'/></Meters></FeederPlan>");
    if (!res) return fail(res.error().describe());
    const auto& p = res.value();
    return p.catalog.types().size() == 3 && !p.config.enableConsolidation &&
           p.config.rebalanceRounds == 5 && almostEqual(p.groups[0].totalCDL, 84.0);
}

// Intent: malformed XML reports XmlParseError.
bool test_malformed_xml() {
    ProjectParser parser;
    auto res = parser.parseString("<FeederPlan><Meters><Group type='C1'</Meters>");
    return !res && res.error().code == ErrorCode::XmlParseError;
}

// Intent: missing root, section or attribute reports MissingMandatoryField.
bool test_missing_fields() {
    ProjectParser parser;
    auto noRoot = parser.parseString("<Plan/>");
    auto noMeters = parser.parseString("<FeederPlan name='x'/>");
    auto noCount = parser.parseString("<FeederPlan><Meters><Group type='C1' capacity='30'/></Meters></FeederPlan>");
    auto noBreakers = parser.parseString(
        "<FeederPlan><Catalog><TransformerType kva='500' safeLoad='576.8'/></Catalog>"
        "<Meters><Group type='C1' count='1' capacity='30'/></Meters></FeederPlan>");
    return !noRoot && noRoot.error().code == ErrorCode::MissingMandatoryField &&
           !noMeters && noMeters.error().code == ErrorCode::MissingMandatoryField &&
           !noCount && noCount.error().code == ErrorCode::MissingMandatoryField &&
           noCount.error().message.find("count") != std::string::npos &&
           !noBreakers && noBreakers.error().code == ErrorCode::MissingMandatoryField;
}

// Intent: invalid values report InvalidInput.
bool test_invalid_values() {
    ProjectParser parser;
    auto unknown = parser.parseString("<FeederPlan><Meters><Group type='C77' count='1' capacity='30'/></Meters></FeederPlan>");
    auto zero = parser.parseString("<FeederPlan><Meters><Group type='C1' count='0' capacity='30'/></Meters></FeederPlan>");
    auto empty = parser.parseString("<FeederPlan><Meters/></FeederPlan>");
    auto badSettings = parser.parseString(
        "<FeederPlan><Settings breakerSafeFactor='1.5'/>"
        "<Meters><Group type='C1' count='1' capacity='30'/></Meters></FeederPlan>");
    auto badCatalog = parser.parseString(
        "<FeederPlan><Catalog><TransformerType kva='500' breakers='0' safeLoad='576.8'/></Catalog>"
        "<Meters><Group type='C1' count='1' capacity='30'/></Meters></FeederPlan>");
    return !unknown && unknown.error().code == ErrorCode::InvalidInput &&
           !zero && zero.error().code == ErrorCode::InvalidInput &&
           !empty && empty.error().code == ErrorCode::InvalidInput &&
           !badSettings && badSettings.error().code == ErrorCode::InvalidInput &&
           !badCatalog && badCatalog.error().code == ErrorCode::InvalidInput;
}

// Intent: a missing file reports FileNotFound.
bool test_missing_file() {
    ProjectParser parser;
    auto res = parser.parseFile("/nonexistent/dir/project.xml");
    return !res && res.error().code == ErrorCode::FileNotFound;
}

// Intent: the bundled sample file matches the built-in sample project.
bool test_sample_file_matches_builtin() {
    ProjectParser parser;
    auto file = parser.parseFile(std::string(FEEDERPLAN_SAMPLE_DIR) + "/sample_project.xml");
    auto builtin = ProjectParser::sampleProject();
    if (!file) return fail(file.error().describe());
    if (!builtin) return fail(builtin.error().describe());
    const auto& a = file.value().groups;
    const auto& b = builtin.value().groups;
    if (a.size() != b.size()) return fail("group count differs");
    for (std::size_t i = 0; i < a.size(); ++i)
        if (a[i].type != b[i].type || a[i].count != b[i].count || !almostEqual(a[i].totalCDL, b[i].totalCDL))
            return fail("group " + std::to_string(i + 1) + " differs");
    return true;
}

// Intent: the results JSON exposes summary, transformers and split notes.
bool test_results_json() {
    ProjectParser parser;
    auto project = parser.parseString(kProject);
    if (!project) return fail(project.error().describe());
    const auto& p = project.value();
    auto res = dist::performBalancedDistribution(p.groups, p.config, p.catalog);
    if (!res) return fail(res.error().describe());

    const auto doc = nlohmann::json::parse(dist::resultsToJson(res.value(), 2));
    const auto& summary = doc["summary"];
    if (summary["totalTransformers"].get<int>() != res.value().summary.totalTransformers ||
        doc["transformers"].size() != res.value().transformers.size() ||
        summary["totalMeters"].get<int>() != 11)
        return fail("summary mismatch");

    int notes = 0;
    for (const auto& t : doc["transformers"])
        for (const auto& b : t["breakers"])
            for (const auto& m : b["meters"])
                if (m.contains("note")) ++notes;
    return notes == 2 && almostEqual(doc["totalLoad"].get<double>(), res.value().totalLoad);
}

} // namespace

int main() {
    const std::vector<TestCase> tests = {
        {"Input_FullProject", "Settings, catalog and groups parsed", test_parse_full_project},
        {"Input_Defaults", "Defaults without optional sections", test_parse_defaults},
        {"Input_MalformedXml", "Malformed XML rejected", test_malformed_xml},
        {"Input_MissingFields", "Missing root/section/attribute rejected", test_missing_fields},
        {"Input_InvalidValues", "Invalid values rejected", test_invalid_values},
        {"Input_MissingFile", "Missing file reported", test_missing_file},
        {"Input_SampleFile", "Sample file equals built-in sample", test_sample_file_matches_builtin},
        {"Output_ResultsJson", "Results JSON export", test_results_json},
    };
    return testsupport::runAll("input", tests);
}
