#include "ConnectionResolver.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <sstream>
#include <utility>

using namespace conn;
using dist::ErrorCode;
using dist::Result;
using dist::SplitPart;
using dist::Transformer;

namespace {

constexpr double kEps = 1e-9;

std::string location(const Transformer& t, int breakerNumber) {
    std::ostringstream oss;
    oss << "T" << t.id << "/B" << breakerNumber;
    return oss.str();
}

std::string transformerName(int id) {
    return "Transformer " + std::to_string(id);
}

// Numéro(s) de sortie DP: "4" ou "4 & 5" si deux câbles
std::string takeOutlets(int& counter, int cables) {
    std::string display = std::to_string(counter);
    if (cables == 2) {
        display += " & " + std::to_string(counter + 1);
        counter += 2;
    } else {
        counter += 1;
    }
    return display;
}

std::string outletIdPart(const std::string& display) {
    std::string s = display;
    const auto pos = s.find(" & ");
    if (pos != std::string::npos) s.replace(pos, 3, "-");
    return s;
}

} // namespace

ConnectionResolver::ConnectionResolver(ConnectionRules rules) : rules_(std::move(rules)) {}

Result<std::vector<LogicalBreaker>>
ConnectionResolver::recombine(const std::vector<Transformer>& transformers) const {
    using Out = Result<std::vector<LogicalBreaker>>;
    std::vector<LogicalBreaker> out;

    for (const auto& t : transformers) {
        std::vector<bool> consumed(t.breakers.size(), false);

        // id de base -> (départ, compteur) de la partie 1
        std::map<std::string, std::pair<std::size_t, std::size_t>> firsts;
        for (std::size_t i = 0; i < t.breakers.size(); ++i) {
            const auto& ms = t.breakers[i].meters;
            for (std::size_t j = 0; j < ms.size(); ++j) {
                if (ms[j].id.part != SplitPart::First) continue;
                if (!firsts.emplace(ms[j].id.base, std::make_pair(i, j)).second)
                    return Out::Fail(ErrorCode::LogicError,
                                     "duplicate part 1 of meter " + ms[j].id.base + " at " +
                                         location(t, t.breakers[i].number));
            }
        }

        for (std::size_t i2 = 0; i2 < t.breakers.size(); ++i2) {
            const auto& b2 = t.breakers[i2];
            for (std::size_t j2 = 0; j2 < b2.meters.size(); ++j2) {
                const IndividualMeter& second = b2.meters[j2];
                if (second.id.part != SplitPart::Second) continue;

                auto it = firsts.find(second.id.base);
                if (it == firsts.end())
                    return Out::Fail(ErrorCode::LogicError,
                                     "part 2 of meter " + second.id.base + " at " + location(t, b2.number) +
                                         " has no part 1 on the same transformer");
                const std::size_t i1 = it->second.first;
                const std::size_t j1 = it->second.second;
                if (i1 == i2 || consumed[i1] || consumed[i2])
                    return Out::Fail(ErrorCode::LogicError,
                                     "split meter " + second.id.base + " shares a breaker with another split half");

                const auto& b1 = t.breakers[i1];
                const IndividualMeter& first = b1.meters[j1];

                IndividualMeter whole = first;
                whole.id = dist::MeterId::whole(first.id.base);
                whole.cdl = first.cdl + second.cdl;

                LogicalBreaker lb;
                lb.id = first.id.base;
                lb.transformerId = t.id;
                lb.leadingNumber = b1.number;
                lb.label = std::to_string(b1.number) + " & " + std::to_string(b2.number);
                lb.idLabel = std::to_string(b1.number) + "-" + std::to_string(b2.number);
                lb.recombined = true;
                lb.meters.push_back(std::move(whole));
                for (std::size_t j = 0; j < b1.meters.size(); ++j)
                    if (j != j1) lb.meters.push_back(b1.meters[j]);
                for (std::size_t j = 0; j < b2.meters.size(); ++j)
                    if (j != j2) lb.meters.push_back(b2.meters[j]);

                consumed[i1] = true;
                consumed[i2] = true;
                firsts.erase(it);
                out.push_back(std::move(lb));
            }
        }

        if (!firsts.empty()) {
            const auto& orphan = *firsts.begin();
            return Out::Fail(ErrorCode::LogicError,
                             "part 1 of meter " + orphan.first + " at " +
                                 location(t, t.breakers[orphan.second.first].number) + " has no part 2");
        }

        for (std::size_t i = 0; i < t.breakers.size(); ++i) {
            const auto& b = t.breakers[i];
            if (consumed[i] || b.empty()) continue;
            LogicalBreaker lb;
            lb.id = "t" + std::to_string(t.id) + "-b" + std::to_string(b.number);
            lb.transformerId = t.id;
            lb.leadingNumber = b.number;
            lb.label = std::to_string(b.number);
            lb.idLabel = lb.label;
            lb.meters = b.meters;
            out.push_back(std::move(lb));
        }
    }

    std::stable_sort(out.begin(), out.end(), [](const LogicalBreaker& a, const LogicalBreaker& b) {
        if (a.transformerId != b.transformerId) return a.transformerId < b.transformerId;
        return a.leadingNumber < b.leadingNumber;
    });
    return out;
}

MeterTier ConnectionResolver::classify(const IndividualMeter& m) const {
    if (m.capacity >= rules_.heavyThresholdA) return MeterTier::Heavy;
    if (m.capacity >= rules_.mediumThresholdA) return MeterTier::Medium;
    return MeterTier::Light;
}

std::vector<MeterBin> ConnectionResolver::packLight(std::vector<IndividualMeter> meters) const {
    std::stable_sort(meters.begin(), meters.end(),
                     [](const IndividualMeter& a, const IndividualMeter& b) { return a.cdl > b.cdl; });

    std::vector<MeterBin> bins;
    for (auto& m : meters) {
        std::size_t best = bins.size();
        double minRemaining = std::numeric_limits<double>::infinity();
        for (std::size_t i = 0; i < bins.size(); ++i) {
            const double remaining = rules_.binCeilingA - bins[i].load;
            if (m.cdl <= remaining + kEps && remaining < minRemaining) {
                minRemaining = remaining;
                best = i;
            }
        }
        if (best == bins.size()) {
            bins.emplace_back();
            best = bins.size() - 1;
        }
        bins[best].load += m.cdl;
        bins[best].meters.push_back(std::move(m));
    }
    return bins;
}

ConnectionConfig ConnectionResolver::dpConfig(double cdl) {
    ConnectionConfig c;
    c.source = FeedSource::DP;
    c.mainFeederInfo = "1x 300 mm²";
    if (cdl <= 108.0) {
        c.fuses = 1; c.customerCableCount = 1; c.customerCableSize = "70 mm²";
    } else if (cdl <= 184.0) {
        c.fuses = 1; c.customerCableCount = 1; c.customerCableSize = "185 mm²";
    } else if (cdl <= 216.0) {
        c.fuses = 2; c.customerCableCount = 2; c.customerCableSize = "70 mm²";
    } else {
        c.fuses = 2; c.customerCableCount = 2; c.customerCableSize = "185 mm²";
    }
    return c;
}

ConnectionConfig ConnectionResolver::ssConfig(double cdl) const {
    const double perCable = rules_.ssCableCapacityA;
    int n = 1;
    if (cdl <= perCable) n = 1;
    else if (cdl <= 2.0 * perCable) n = 2;
    else n = static_cast<int>(std::ceil(cdl / perCable));

    ConnectionConfig c;
    c.source = FeedSource::SS;
    c.fuses = n;
    c.customerCableCount = n;
    c.customerCableSize = "300 mm²";
    c.mainFeederInfo = "Direct Feeder";
    return c;
}

std::string ConnectionResolver::heavyMeterBox(double capacity) {
    if (capacity <= 400.0) return "1 CT box (300/400A)";
    if (capacity <= 600.0) return "1 CT box (500/600A)";
    if (capacity >= 800.0) return "1 CT box (Remote)";
    return "1 CT box (dedicated)";
}

void ConnectionResolver::emitGroup_(const LogicalBreaker& lb, std::vector<FinalConnection>& out) const {
    std::vector<IndividualMeter> heavy;
    std::vector<IndividualMeter> medium;
    std::vector<IndividualMeter> light;
    for (const auto& m : lb.meters) {
        switch (classify(m)) {
        case MeterTier::Heavy: heavy.push_back(m); break;
        case MeterTier::Medium: medium.push_back(m); break;
        case MeterTier::Light: light.push_back(m); break;
        }
    }

    const std::string prefix = "t" + std::to_string(lb.transformerId) + "-b" + lb.idLabel;
    auto base = [&lb](MeterTier tier, double cdl) {
        FinalConnection fc;
        fc.transformerId = lb.transformerId;
        fc.transformerName = transformerName(lb.transformerId);
        fc.breakerNumber = lb.label;
        fc.tier = tier;
        fc.totalCDL = cdl;
        return fc;
    };

    // --- SS direct
    for (auto& m : heavy) {
        FinalConnection fc = base(MeterTier::Heavy, m.cdl);
        fc.id = prefix + "-m" + m.id.str();
        fc.meterBoxes = heavyMeterBox(m.capacity);
        fc.configuration = ssConfig(m.cdl);
        fc.meters.push_back(std::move(m));
        out.push_back(std::move(fc));
    }

    int outlet = 1;

    // --- Sorties DP partagées
    for (auto& bin : packLight(std::move(light))) {
        FinalConnection fc = base(MeterTier::Light, bin.load);
        fc.configuration = dpConfig(bin.load);
        fc.dpOutletNumber = takeOutlets(outlet, fc.configuration.customerCableCount);
        fc.id = prefix + "-o" + outletIdPart(fc.dpOutletNumber);
        const auto boxes = (bin.meters.size() + 1) / 2;
        fc.meterBoxes = std::to_string(boxes) + " double box";
        fc.meters = std::move(bin.meters);
        out.push_back(std::move(fc));
    }

    // --- Sorties DP individuelles CT
    std::stable_sort(medium.begin(), medium.end(),
                     [](const IndividualMeter& a, const IndividualMeter& b) { return a.cdl > b.cdl; });
    for (auto& m : medium) {
        FinalConnection fc = base(MeterTier::Medium, m.cdl);
        fc.configuration = dpConfig(m.cdl);
        fc.dpOutletNumber = takeOutlets(outlet, fc.configuration.customerCableCount);
        fc.id = prefix + "-m" + m.id.str();
        fc.meterBoxes = "1 CT box (200/250A)";
        fc.meters.push_back(std::move(m));
        out.push_back(std::move(fc));
    }
}

Result<std::vector<FinalConnection>>
ConnectionResolver::resolve(const std::vector<Transformer>& transformers) const {
    auto st = rules_.validate();
    if (!st)
        return Result<std::vector<FinalConnection>>(st.error());

    auto groups = recombine(transformers);
    if (!groups)
        return Result<std::vector<FinalConnection>>(dist::withContext("recombine", groups.error()));

    std::vector<FinalConnection> out;
    for (const auto& lb : groups.value())
        emitGroup_(lb, out);
    return out;
}

Result<std::vector<FinalConnection>> conn::calculateFinalConnections(const std::vector<Transformer>& transformers,
                                                                     const ConnectionRules& rules) {
    return ConnectionResolver(rules).resolve(transformers);
}

ConnectionTotals conn::computeTotals(const std::vector<FinalConnection>& connections) {
    ConnectionTotals t;
    for (const auto& c : connections) {
        if (c.configuration.source == FeedSource::DP) {
            ++t.dpConnections;
            t.dpOutlets += c.configuration.customerCableCount;
        } else {
            ++t.ssConnections;
        }
        t.fuses += c.configuration.fuses;
        t.cables += c.configuration.customerCableCount;
        t.totalCDL += c.totalCDL;
    }
    return t;
}
