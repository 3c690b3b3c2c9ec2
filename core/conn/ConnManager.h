#pragma once
#include <string>
#include <vector>

#include "ConnectionResolver.h"

namespace conn {

// Export JSON (nlohmann) des raccordements + totaux
std::string connectionsToJson(const std::vector<FinalConnection>& connections, int indent = -1);

class ConnManager {
public:
    explicit ConnManager(ConnectionRules rules = {});

    dist::Status build(const std::vector<dist::Transformer>& transformers);

    bool isBuilt() const { return built_; }
    const std::vector<FinalConnection>& connections() const { return connections_; }
    ConnectionTotals totals() const { return computeTotals(connections_); }

    dist::Status printConnections() const;
    dist::Status printTotals() const;

    std::string toJson(int indent = -1) const { return connectionsToJson(connections_, indent); }

private:
    ConnectionResolver resolver_;
    std::vector<FinalConnection> connections_;
    bool built_ {false};
};

} // namespace conn
