#pragma once

#include "nodegraph/graph/graph_types.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace nodegraph {

struct HistoryEntry {
    struct NodeChange {
        std::string id;
        bool existedBefore = false;
        bool existedAfter = false;
        Node before;
        Node after;
    };

    struct ConnectionChange {
        std::string id;
        bool existedBefore = false;
        bool existedAfter = false;
        Connection before;
        Connection after;
    };

    std::vector<NodeChange> nodes;
    std::vector<ConnectionChange> connections;

    bool hasNodeOrderChange = false;
    std::vector<std::string> nodeOrderBefore;
    std::vector<std::string> nodeOrderAfter;

    bool hasConnectionOrderChange = false;
    std::vector<std::string> connectionOrderBefore;
    std::vector<std::string> connectionOrderAfter;

    std::uint32_t nextIdBefore = 1;
    std::uint32_t nextIdAfter = 1;
    std::uint32_t generation = 0;
};

struct HistoryTransaction {
    bool active = false;
    // Open startAction() scopes; zero for a single-operation entry.
    std::uint32_t actionDepth = 0;
    HistoryEntry entry;
    std::unordered_map<std::string, std::size_t> nodeIndex;
    std::unordered_map<std::string, std::size_t> connectionIndex;
};

} // namespace nodegraph
