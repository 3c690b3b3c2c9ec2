#include "DistManager.h"

#include "AllocationWorkspace.h"
#include "DistJson.h"
#include "MeterExpander.h"
#include "PlacementEngine.h"
#include "Rebalancer.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

using namespace dist;

namespace {

constexpr double kConservationTolerance = 1e-6;

// Aucun compteur perdu, aucune charge créée
Status checkConservation(const std::vector<IndividualMeter>& expanded,
                         const std::vector<Transformer>& transformers) {
    double expectedLoad = 0.0;
    std::set<std::string> expectedIds;
    for (const auto& m : expanded) {
        expectedLoad += m.cdl;
        expectedIds.insert(m.id.base);
    }

    double placedLoad = 0.0;
    std::set<std::string> placedIds;
    for (const auto& t : transformers) {
        placedLoad += t.assignedLoad;
        for (const auto& b : t.breakers)
            for (const auto& m : b.meters) placedIds.insert(m.id.base);
    }

    if (placedIds != expectedIds) {
        std::ostringstream oss;
        oss << "placed " << placedIds.size() << " distinct meters, expected " << expectedIds.size();
        return Status::Fail(ErrorCode::LogicError, oss.str());
    }
    if (std::abs(placedLoad - expectedLoad) > kConservationTolerance * std::max(1.0, expectedLoad)) {
        std::ostringstream oss;
        oss << "placed load " << placedLoad << "A differs from input load " << expectedLoad << "A";
        return Status::Fail(ErrorCode::LogicError, oss.str());
    }
    return Status::Ok();
}

} // namespace

Result<DistributionResults> dist::performBalancedDistribution(const std::vector<MeterGroup>& groups,
                                                              const BalancingConfig& cfg,
                                                              const TransformerCatalog& catalog) {
    auto st = cfg.validate();
    if (!st) return Result<DistributionResults>(st.error());
    st = catalog.validate();
    if (!st) return Result<DistributionResults>(st.error());
    for (const auto& g : groups) {
        if (g.count <= 0) {
            std::ostringstream oss;
            oss << "group " << g.id << ": meter count must be > 0";
            return Result<DistributionResults>::Fail(ErrorCode::InvalidInput, oss.str());
        }
    }

    const std::vector<IndividualMeter> meters = expandMeterGroups(groups);

    AllocationWorkspace ws(cfg);
    PlacementEngine engine(cfg, catalog);
    st = engine.place(meters, ws);
    if (!st)
        return Result<DistributionResults>(st.error());
    ws.refreshAll();

    Rebalancer rebalancer(cfg);
    auto moves = rebalancer.balanceAll(ws);
    if (!moves)
        return Result<DistributionResults>(moves.error());
    if (cfg.enableConsolidation) {
        moves = rebalancer.consolidate(ws);
        if (!moves)
            return Result<DistributionResults>(moves.error());
    }

    ws.compact();
    ws.refreshAll();

    st = checkConservation(meters, ws.transformers());
    if (!st)
        return Result<DistributionResults>(withContext("performBalancedDistribution", st.error()));

    DistributionResults r;
    r.summary = ws.summarize(groups);
    r.totalLoad = r.summary.totalLoad;
    r.balanceScore = r.summary.balanceScore;
    r.diagnostics = ws.overloadDiagnostics();
    r.transformers = ws.release();
    return r;
}

DistManager::DistManager(BalancingConfig cfg, TransformerCatalog catalog)
    : cfg_(std::move(cfg)), catalog_(std::move(catalog)) {}

Status DistManager::run(const std::vector<MeterGroup>& groups) {
    hasResults_ = false;
    auto res = performBalancedDistribution(groups, cfg_, catalog_);
    if (!res)
        return Status(withContext("run", res.error()));
    results_ = std::move(res.value());
    hasResults_ = true;
    return Status::Ok();
}

Status DistManager::printTransformers() const {
    if (!hasResults_)
        return Status::Fail(ErrorCode::LogicError, "no distribution computed");
    std::cout << "[TRANSFORMERS] count=" << results_.transformers.size() << "\n";
    std::cout << std::fixed << std::setprecision(1);
    for (const auto& t : results_.transformers) {
        std::cout << "  T" << t.id << "  " << (t.type ? t.type->name : "?")
                  << "  load=" << t.assignedLoad << "A / safe=" << (t.type ? t.type->safeLoad : 0.0) << "A";
        if (t.dedicated) std::cout << "  [dedicated " << t.dedicatedFor << "]";
        std::cout << "\n";
        for (const auto& b : t.breakers) {
            if (b.empty()) continue;
            std::cout << "    B" << b.number << "  load=" << b.load << "A  util=" << b.utilizationPercent << "%";
            if (b.dedicated) std::cout << "  [" << b.dedicatedFor << "]";
            std::cout << "  meters:";
            for (const auto& m : b.meters) std::cout << " " << m.id.str() << "(" << m.cdl << ")";
            std::cout << "\n";
        }
    }
    std::cout.unsetf(std::ios::floatfield);
    return Status::Ok();
}

Status DistManager::printSummary() const {
    if (!hasResults_)
        return Status::Fail(ErrorCode::LogicError, "no distribution computed");
    const DistributionSummary& s = results_.summary;
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "[SUMMARY] transformers=" << s.totalTransformers
              << ", breakers=" << s.totalBreakers
              << ", entries=" << s.distributionEntries
              << ", meters=" << s.totalMeters
              << ", load=" << s.totalLoad << "A (" << s.totalLoadKva << " kVA)"
              << ", overloadedBreakers=" << s.overloadedBreakers
              << ", overloadedTransformers=" << s.overloadedTransformers << "\n";
    std::cout << "  util min/avg/max=" << s.minUtilization << "/" << s.avgUtilization << "/" << s.maxUtilization
              << "%  balance=" << s.balanceScore << "  efficiency=" << s.efficiency << "%\n";
    for (const auto& d : s.transformerDetails)
        std::cout << "  " << d.second << "x " << d.first << " KVA\n";
    std::cout.unsetf(std::ios::floatfield);
    return Status::Ok();
}

Status DistManager::printDiagnostics() const {
    if (results_.diagnostics.empty()) {
        std::cout << "[DIAGNOSTICS] none\n";
        return Status::Ok();
    }
    std::cout << "[DIAGNOSTICS] count=" << results_.diagnostics.size() << "\n";
    for (const auto& d : results_.diagnostics)
        std::cout << "  " << toString(d.code) << "  " << d.location << "  " << d.message << "\n";
    return Status::Ok();
}
