#include "ConnManager.h"

#include "DistJson.h"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <iostream>

using namespace conn;
using dist::ErrorCode;
using dist::Status;
using nlohmann::json;

std::string conn::connectionsToJson(const std::vector<FinalConnection>& connections, int indent) {
    json root;
    root["connections"] = json::array();
    for (const auto& c : connections) {
        json jc;
        jc["id"] = c.id;
        jc["transformerId"] = c.transformerId;
        jc["transformerName"] = c.transformerName;
        jc["breakerNumber"] = c.breakerNumber;
        if (!c.dpOutletNumber.empty()) jc["dpOutletNumber"] = c.dpOutletNumber;
        jc["tier"] = toString(c.tier);
        jc["totalCDL"] = c.totalCDL;
        jc["meterBoxes"] = c.meterBoxes;

        const ConnectionConfig& cfg = c.configuration;
        jc["configuration"] = {
            {"source", toString(cfg.source)},
            {"fuses", cfg.fuses},
            {"customerCableCount", cfg.customerCableCount},
            {"customerCableSize", cfg.customerCableSize},
            {"mainFeederInfo", cfg.mainFeederInfo},
        };

        jc["meters"] = json::array();
        for (const auto& m : c.meters) jc["meters"].push_back(dist::meterToJson(m));
        root["connections"].push_back(std::move(jc));
    }

    const ConnectionTotals t = computeTotals(connections);
    root["totals"] = {
        {"dpConnections", t.dpConnections},
        {"ssConnections", t.ssConnections},
        {"fuses", t.fuses},
        {"cables", t.cables},
        {"dpOutlets", t.dpOutlets},
        {"totalCDL", t.totalCDL},
    };
    return root.dump(indent);
}

ConnManager::ConnManager(ConnectionRules rules) : resolver_(std::move(rules)) {}

Status ConnManager::build(const std::vector<dist::Transformer>& transformers) {
    built_ = false;
    connections_.clear();
    auto res = resolver_.resolve(transformers);
    if (!res)
        return Status(dist::withContext("build", res.error()));
    connections_ = std::move(res.value());
    built_ = true;
    return Status::Ok();
}

Status ConnManager::printConnections() const {
    if (!built_)
        return Status::Fail(ErrorCode::LogicError, "connections not built");
    std::cout << "[CONNECTIONS] count=" << connections_.size() << "\n";
    std::cout << std::fixed << std::setprecision(1);
    for (const auto& c : connections_) {
        const ConnectionConfig& cfg = c.configuration;
        std::cout << "  " << c.id << "  " << c.transformerName << "  B" << c.breakerNumber;
        if (!c.dpOutletNumber.empty()) std::cout << "  outlet " << c.dpOutletNumber;
        std::cout << "  " << toString(cfg.source) << "  cdl=" << c.totalCDL << "A"
                  << "  fuses=" << cfg.fuses
                  << "  cables=" << cfg.customerCableCount << "x " << cfg.customerCableSize
                  << "  feeder=" << cfg.mainFeederInfo
                  << "  boxes=" << c.meterBoxes
                  << "  meters=" << c.meters.size() << "\n";
    }
    std::cout.unsetf(std::ios::floatfield);
    return Status::Ok();
}

Status ConnManager::printTotals() const {
    if (!built_)
        return Status::Fail(ErrorCode::LogicError, "connections not built");
    const ConnectionTotals t = totals();
    std::cout << "[CONNECTION TOTALS] DP=" << t.dpConnections << " (outlets=" << t.dpOutlets << ")"
              << ", SS=" << t.ssConnections
              << ", fuses=" << t.fuses
              << ", cables=" << t.cables
              << ", cdl=" << t.totalCDL << "A\n";
    return Status::Ok();
}
