#include "PlacementEngine.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

using namespace dist;

namespace {

constexpr double kEps = 1e-9;

double sumCdl(const std::vector<IndividualMeter>& ms) {
    double s = 0.0;
    for (const auto& m : ms) s += m.cdl;
    return s;
}

IndividualMeter makeHalf(const IndividualMeter& m, SplitPart part) {
    IndividualMeter h = m;
    h.id = m.id.half(part);
    h.cdl = m.cdl / 2.0;
    return h;
}

} // namespace

PlacementEngine::PlacementEngine(BalancingConfig cfg, TransformerCatalog catalog)
    : cfg_(std::move(cfg)), catalog_(std::move(catalog)) {}

bool PlacementEngine::isDedicated(const IndividualMeter& m) const {
    return m.capacity >= cfg_.dedicatedThresholdA;
}

bool PlacementEngine::needsSplit(const IndividualMeter& m) const {
    if (isDedicated(m)) return false;
    return m.capacity >= cfg_.splitThresholdA || m.cdl > cfg_.safeBreakerCapacity() + kEps;
}

void PlacementEngine::sortQueue(std::vector<IndividualMeter>& queue) const {
    std::stable_sort(queue.begin(), queue.end(),
                     [this](const IndividualMeter& a, const IndividualMeter& b) {
                         const bool sa = needsSplit(a);
                         const bool sb = needsSplit(b);
                         if (sa != sb) return sa;
                         return a.cdl > b.cdl;
                     });
}

Status PlacementEngine::place(const std::vector<IndividualMeter>& meters, AllocationWorkspace& ws) const {
    std::vector<IndividualMeter> general;
    general.reserve(meters.size());

    // --- Compteurs géants
    for (const auto& m : meters) {
        if (isDedicated(m)) {
            auto st = placeDedicated_(m, ws);
            if (!st) return st;
        } else {
            general.push_back(m);
        }
    }

    sortQueue(general);

    // --- Remplissage itératif, un transformateur par tour
    while (!general.empty()) {
        const double remaining = sumCdl(general);
        auto type = catalog_.pickForLoad(remaining);
        if (!type)
            return Status(withContext("place", type.error()));

        const std::size_t tx = ws.createTransformer(type.value());
        const double safeLoad = type.value()->safeLoad;

        std::vector<IndividualMeter> batch;
        std::vector<IndividualMeter> next;
        double batchLoad = 0.0;
        for (auto& m : general) {
            if (batchLoad + m.cdl <= safeLoad + kEps) {
                batchLoad += m.cdl;
                batch.push_back(std::move(m));
            } else {
                next.push_back(std::move(m));
            }
        }

        if (batch.empty()) {
            std::ostringstream oss;
            oss << "meter " << next.front().id.str() << " (" << next.front().cdl
                << "A) exceeds the largest transformer safe load " << safeLoad << "A";
            return Status::Fail(ErrorCode::CapacityInfeasible, oss.str());
        }

        std::vector<IndividualMeter> splits;
        std::vector<IndividualMeter> normals;
        for (auto& m : batch) {
            if (needsSplit(m)) splits.push_back(std::move(m));
            else normals.push_back(std::move(m));
        }
        const std::size_t batchSize = splits.size() + normals.size();

        std::vector<IndividualMeter> unplaced;
        for (const auto& m : splits) {
            if (!placeSplit_(tx, m, ws))
                unplaced.push_back(m);
        }
        auto left = placeNormal_(tx, normals, ws);
        unplaced.insert(unplaced.end(), left.begin(), left.end());

        // Un transformateur neuf qui n'accueille rien: le catalogue ne peut pas héberger ces compteurs
        if (unplaced.size() == batchSize) {
            std::ostringstream oss;
            oss << "no meter of the batch fits a new " << type.value()->name
                << " transformer (first: " << unplaced.front().id.str() << ", "
                << unplaced.front().capacity << "A)";
            return Status::Fail(ErrorCode::CapacityInfeasible, oss.str());
        }

        general = std::move(next);
        general.insert(general.end(), unplaced.begin(), unplaced.end());
        sortQueue(general);
    }
    return Status::Ok();
}

Status PlacementEngine::placeDedicated_(const IndividualMeter& m, AllocationWorkspace& ws) const {
    auto type = catalog_.dedicatedTypeFor(m.capacity, cfg_);
    if (!type)
        return Status(type.error());
    ws.createDedicatedTransformer(type.value(), m);
    return Status::Ok();
}

std::optional<std::pair<std::size_t, std::size_t>>
PlacementEngine::findBestBreakerPair(const Transformer& t, const IndividualMeter& m) const {
    const double half = m.cdl / 2.0;
    const double safe = cfg_.safeBreakerCapacity();
    // Moitié plus grosse que le plafond: seulement des départs vides (seul occupant)
    const bool oversizedHalf = half > safe + kEps;

    std::vector<std::size_t> slots;
    for (std::size_t i = 0; i < t.breakers.size(); ++i) {
        const Breaker& b = t.breakers[i];
        if (b.dedicated) continue;
        if (oversizedHalf ? b.empty() : (b.load + half <= safe + kEps))
            slots.push_back(i);
    }
    if (slots.size() < 2)
        return std::nullopt;

    std::optional<std::pair<std::size_t, std::size_t>> best;
    double bestScore = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < slots.size(); ++i) {
        for (std::size_t j = i + 1; j < slots.size(); ++j) {
            const double combined = t.breakers[slots[i]].load + t.breakers[slots[j]].load;
            if (combined < bestScore) {
                bestScore = combined;
                best = std::make_pair(slots[i], slots[j]);
            }
        }
    }
    return best;
}

bool PlacementEngine::placeSplit_(std::size_t tx, const IndividualMeter& m, AllocationWorkspace& ws) const {
    auto pair = findBestBreakerPair(ws.transformer(tx), m);
    if (!pair)
        return false;

    const BreakerRef r1 {tx, pair->first};
    const BreakerRef r2 {tx, pair->second};
    ws.commitAdd(r1, makeHalf(m, SplitPart::First));
    ws.commitAdd(r2, makeHalf(m, SplitPart::Second));

    std::ostringstream reason;
    reason << "for split " << m.capacity << "A meter";
    ws.dedicate(r1, reason.str());
    ws.dedicate(r2, reason.str());
    return true;
}

double PlacementEngine::scoreBreaker(const AllocationWorkspace& ws, const BreakerRef& candidate,
                                     const std::vector<BreakerRef>& targets, const IndividualMeter& m,
                                     double targetLoad) const {
    const ScoringWeights& w = cfg_.scoring;
    const Breaker& b = ws.breaker(candidate);
    const double newLoad = b.load + m.cdl;

    const double targetScore = w.targetBase - std::abs(newLoad - targetLoad);

    // Écart-type des charges de l'ensemble cible après ajout
    std::vector<double> loads;
    loads.reserve(targets.size());
    for (const auto& r : targets)
        if (r != candidate) loads.push_back(ws.breaker(r).load);
    loads.push_back(newLoad);
    double sum = 0.0;
    for (double l : loads) sum += l;
    const double avg = sum / loads.size();
    double acc = 0.0;
    for (double l : loads) acc += (l - avg) * (l - avg);
    const double sd = std::sqrt(acc / loads.size());
    const double balanceScore = (w.balanceBase - sd) * w.balanceScale;

    const double diversityScore = b.hasCategory(m.category) ? 0.0 : w.diversityBonus;
    const double fillScore = w.fillBase - b.load;

    return w.targetWeight * targetScore + w.balanceWeight * balanceScore +
           w.diversityWeight * diversityScore + w.fillWeight * fillScore;
}

std::vector<IndividualMeter> PlacementEngine::placeNormal_(std::size_t tx,
                                                           const std::vector<IndividualMeter>& normals,
                                                           AllocationWorkspace& ws) const {
    if (normals.empty())
        return {};

    const double safe = cfg_.safeBreakerCapacity();
    const double totalLoad = sumCdl(normals);

    std::vector<BreakerRef> available;
    const Transformer& t = ws.transformer(tx);
    for (std::size_t i = 0; i < t.breakers.size(); ++i)
        if (!t.breakers[i].dedicated) available.push_back({tx, i});

    // Nombre minimal de départs pour porter le lot
    const std::size_t needed = static_cast<std::size_t>(std::ceil(totalLoad / safe - kEps));
    const std::size_t n = std::min(std::max<std::size_t>(needed, 1), available.size());
    if (n == 0)
        return normals;

    const std::vector<BreakerRef> targets(available.begin(), available.begin() + n);
    const double targetLoad = totalLoad / n;

    std::vector<IndividualMeter> unplaced;
    for (const auto& m : normals) {
        std::optional<BreakerRef> best;
        double bestScore = -std::numeric_limits<double>::infinity();
        for (const auto& r : targets) {
            if (ws.breaker(r).load + m.cdl > safe + kEps) continue;
            const double score = scoreBreaker(ws, r, targets, m, targetLoad);
            if (score > bestScore) {
                bestScore = score;
                best = r;
            }
        }
        if (best)
            ws.commitAdd(*best, m);
        else
            unplaced.push_back(m);
    }
    return unplaced;
}
