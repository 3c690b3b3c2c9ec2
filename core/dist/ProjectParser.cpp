#include "ProjectParser.h"

#include <pugixml.hpp>

#include <fstream>
#include <sstream>

using namespace dist;

namespace {

// Attribut obligatoire: absent -> MissingMandatoryField
bool requireAttr(const pugi::xml_node& node, const char* name, Error& err) {
    if (node.attribute(name))
        return true;
    std::ostringstream oss;
    oss << "<" << node.name() << "> (offset " << node.offset_debug() << "): missing attribute '" << name << "'";
    err = Error{ErrorCode::MissingMandatoryField, oss.str()};
    return false;
}

Status readSettings(const pugi::xml_node& node, BalancingConfig& cfg) {
    if (!node)
        return Status::Ok();
    cfg.enableConsolidation = node.attribute("consolidate").as_bool(cfg.enableConsolidation);
    cfg.rebalanceRounds = node.attribute("rebalanceRounds").as_int(cfg.rebalanceRounds);
    cfg.imbalanceThresholdA = node.attribute("imbalanceThreshold").as_double(cfg.imbalanceThresholdA);
    cfg.consolidationIterations = node.attribute("consolidationIterations").as_int(cfg.consolidationIterations);
    cfg.breakerCapacityA = node.attribute("breakerCapacity").as_double(cfg.breakerCapacityA);
    cfg.breakerSafeFactor = node.attribute("breakerSafeFactor").as_double(cfg.breakerSafeFactor);
    cfg.splitThresholdA = node.attribute("splitThreshold").as_double(cfg.splitThresholdA);
    cfg.dedicatedThresholdA = node.attribute("dedicatedThreshold").as_double(cfg.dedicatedThresholdA);

    if (auto sc = node.child("Scoring")) {
        ScoringWeights& w = cfg.scoring;
        w.targetWeight = sc.attribute("target").as_double(w.targetWeight);
        w.balanceWeight = sc.attribute("balance").as_double(w.balanceWeight);
        w.diversityWeight = sc.attribute("diversity").as_double(w.diversityWeight);
        w.fillWeight = sc.attribute("fill").as_double(w.fillWeight);
        w.diversityBonus = sc.attribute("diversityBonus").as_double(w.diversityBonus);
    }
    auto st = cfg.validate();
    if (!st)
        return Status(withContext("<Settings>", st.error()));
    return Status::Ok();
}

Result<TransformerCatalog> readCatalog(const pugi::xml_node& node) {
    std::vector<TransformerType> types;
    for (auto tt : node.children("TransformerType")) {
        Error err;
        if (!requireAttr(tt, "kva", err) || !requireAttr(tt, "breakers", err) ||
            !requireAttr(tt, "safeLoad", err))
            return Result<TransformerCatalog>(err);

        TransformerType t;
        t.capacityKva = tt.attribute("kva").as_double();
        t.breakers = tt.attribute("breakers").as_int();
        t.safeLoad = tt.attribute("safeLoad").as_double();
        t.maxCurrent = tt.attribute("maxCurrent").as_double(0.0);
        t.maxLoad = tt.attribute("maxLoad").as_double(t.safeLoad);
        t.minLoad = tt.attribute("minLoad").as_double(0.0);
        t.name = tt.attribute("name").as_string("");
        types.push_back(std::move(t));
    }
    TransformerCatalog catalog(std::move(types));
    auto st = catalog.validate();
    if (!st)
        return Result<TransformerCatalog>(withContext("<Catalog>", st.error()));
    return catalog;
}

Result<std::vector<MeterGroupSpec>> readMeters(const pugi::xml_node& node) {
    std::vector<MeterGroupSpec> specs;
    for (auto g : node.children("Group")) {
        Error err;
        if (!requireAttr(g, "type", err) || !requireAttr(g, "count", err) || !requireAttr(g, "capacity", err))
            return Result<std::vector<MeterGroupSpec>>(err);

        MeterGroupSpec s;
        s.type = g.attribute("type").as_string();
        s.count = g.attribute("count").as_int();
        s.capacity = g.attribute("capacity").as_double();
        s.demandFactorOverride = g.attribute("demandFactor").as_double(0.0);
        specs.push_back(std::move(s));
    }
    return specs;
}

Result<ProjectInput> parseDoc(const pugi::xml_document& doc) {
    pugi::xml_node root = doc.child("FeederPlan");
    if (!root)
        return Result<ProjectInput>::Fail(ErrorCode::MissingMandatoryField, "root <FeederPlan> not found");

    ProjectInput project;
    project.name = root.attribute("name").as_string("");

    auto st = readSettings(root.child("Settings"), project.config);
    if (!st)
        return Result<ProjectInput>(st.error());

    if (auto cat = root.child("Catalog")) {
        auto res = readCatalog(cat);
        if (!res)
            return Result<ProjectInput>(res.error());
        project.catalog = std::move(res.value());
    }

    pugi::xml_node meters = root.child("Meters");
    if (!meters)
        return Result<ProjectInput>::Fail(ErrorCode::MissingMandatoryField, "<Meters> section not found");
    auto specs = readMeters(meters);
    if (!specs)
        return Result<ProjectInput>(specs.error());
    if (specs.value().empty())
        return Result<ProjectInput>::Fail(ErrorCode::InvalidInput, "<Meters> contains no <Group>");

    auto groups = MeterCatalog::makeMeterGroups(specs.value());
    if (!groups)
        return Result<ProjectInput>(withContext("<Meters>", groups.error()));

    project.specs = std::move(specs.value());
    project.groups = std::move(groups.value());
    return project;
}

} // namespace

ProjectParser::ProjectParser() = default;

Result<ProjectInput> ProjectParser::parseFile(const std::string& path) {
    if (!std::ifstream(path).good())
        return Result<ProjectInput>::Fail(ErrorCode::FileNotFound, "cannot open '" + path + "'");

    pugi::xml_document doc;
    pugi::xml_parse_result ok = doc.load_file(path.c_str());
    if (!ok) {
        std::ostringstream oss;
        oss << "XML parse error: " << ok.description() << ", offset=" << ok.offset;
        return Result<ProjectInput>::Fail(ErrorCode::XmlParseError, oss.str());
    }
    return parseDoc(doc);
}

Result<ProjectInput> ProjectParser::parseString(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result ok = doc.load_string(xml.c_str());
    if (!ok) {
        std::ostringstream oss;
        oss << "XML parse error: " << ok.description() << ", offset=" << ok.offset;
        return Result<ProjectInput>::Fail(ErrorCode::XmlParseError, oss.str());
    }
    return parseDoc(doc);
}

Result<ProjectInput> ProjectParser::sampleProject() {
    ProjectInput project;
    project.name = "sample";
    project.specs = MeterCatalog::sampleSpecs();
    auto groups = MeterCatalog::makeMeterGroups(project.specs);
    if (!groups)
        return Result<ProjectInput>(groups.error());
    project.groups = std::move(groups.value());
    return project;
}
