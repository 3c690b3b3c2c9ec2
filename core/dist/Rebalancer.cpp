#include "Rebalancer.h"

#include <algorithm>
#include <limits>
#include <optional>
#include <vector>

using namespace dist;

namespace {

constexpr double kEps = 1e-9;

} // namespace

Rebalancer::Rebalancer(BalancingConfig cfg) : cfg_(std::move(cfg)) {}

Result<int> Rebalancer::balanceInternally(AllocationWorkspace& ws, std::size_t tx) const {
    if (ws.transformer(tx).dedicated)
        return 0;

    const double safe = cfg_.safeBreakerCapacity();
    int moves = 0;
    for (int round = 0; round < cfg_.rebalanceRounds; ++round) {
        const Transformer& t = ws.transformer(tx);
        std::vector<std::size_t> eligible;
        for (std::size_t i = 0; i < t.breakers.size(); ++i)
            if (!t.breakers[i].empty() && !t.breakers[i].dedicated) eligible.push_back(i);
        if (eligible.size() < 2)
            break;

        std::stable_sort(eligible.begin(), eligible.end(), [&t](std::size_t a, std::size_t b) {
            return t.breakers[a].load < t.breakers[b].load;
        });
        const BreakerRef least {tx, eligible.front()};
        const BreakerRef most {tx, eligible.back()};
        const Breaker& lb = ws.breaker(least);
        const Breaker& mb = ws.breaker(most);
        if (mb.load - lb.load < cfg_.imbalanceThresholdA)
            break;

        // Plus petit compteur du départ chargé qui tient sur le départ léger
        std::vector<const IndividualMeter*> candidates;
        for (const auto& m : mb.meters) candidates.push_back(&m);
        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const IndividualMeter* a, const IndividualMeter* b) { return a->cdl < b->cdl; });
        std::optional<MeterId> movable;
        for (const auto* m : candidates) {
            if (lb.load + m->cdl <= safe + kEps) {
                movable = m->id;
                break;
            }
        }
        if (!movable)
            break;

        auto st = ws.commitMove(most, *movable, least);
        if (!st)
            return Result<int>(withContext("balanceInternally", st.error()));
        ++moves;
    }
    return moves;
}

Result<int> Rebalancer::balanceAll(AllocationWorkspace& ws) const {
    int moves = 0;
    for (std::size_t tx = 0; tx < ws.transformers().size(); ++tx) {
        auto res = balanceInternally(ws, tx);
        if (!res)
            return res;
        moves += res.value();
    }
    return moves;
}

bool Rebalancer::isMovableSingle_(const Breaker& b) const {
    if (b.dedicated || b.meters.size() != 1)
        return false;
    const IndividualMeter& m = b.meters.front();
    return !m.id.isSplitHalf() &&
           m.capacity >= cfg_.consolidationMinCapacityA &&
           m.capacity < cfg_.consolidationMaxCapacityA;
}

Result<int> Rebalancer::consolidate(AllocationWorkspace& ws) const {
    const double safe = cfg_.safeBreakerCapacity();
    auto& txs = ws.transformers();
    int moves = 0;

    for (int iter = 0; iter < cfg_.consolidationIterations; ++iter) {
        bool moved = false;
        for (std::size_t stx = 0; stx < txs.size() && !moved; ++stx) {
            if (txs[stx].dedicated) continue;
            for (std::size_t sbr = 0; sbr < txs[stx].breakers.size() && !moved; ++sbr) {
                const Breaker& src = txs[stx].breakers[sbr];
                if (!isMovableSingle_(src)) continue;
                const IndividualMeter& m = src.meters.front();

                // Cible: départ occupé le moins chargé qui garde de la marge
                std::optional<BreakerRef> best;
                double bestLoad = std::numeric_limits<double>::infinity();
                for (std::size_t ttx = 0; ttx < txs.size(); ++ttx) {
                    const Transformer& tt = txs[ttx];
                    if (tt.dedicated) continue;
                    if (ttx != stx && tt.type && tt.assignedLoad + m.cdl > tt.type->safeLoad + kEps)
                        continue;
                    for (std::size_t tbr = 0; tbr < tt.breakers.size(); ++tbr) {
                        if (ttx == stx && tbr == sbr) continue;
                        const Breaker& tb = tt.breakers[tbr];
                        if (tb.dedicated || tb.empty()) continue;
                        if (tb.load + m.cdl > safe + kEps) continue;
                        if (tb.load < bestLoad) {
                            bestLoad = tb.load;
                            best = BreakerRef{ttx, tbr};
                        }
                    }
                }
                if (!best) continue;

                const MeterId id = m.id;
                auto st = ws.commitMove({stx, sbr}, id, *best);
                if (!st)
                    return Result<int>(withContext("consolidate", st.error()));
                ++moves;
                moved = true;
            }
        }
        if (!moved)
            break;
    }
    return moves;
}
