#pragma once

#include "nodegraph/component/component_types.h"
#include "nodegraph/core/types.h"
#include "nodegraph/graph/graph_types.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace nodegraph {

constexpr std::uint32_t kSnapshotMagic = 0x4E53474Eu; // "NGSN"
constexpr std::uint32_t kSnapshotVersion = 1;

struct SnapshotData {
    std::uint32_t version = kSnapshotVersion;
    std::vector<Node> nodes;
    std::vector<Connection> connections;
    std::vector<ComponentDefinition> definitions;
    std::uint32_t nextId = 1;
    std::uint32_t nextDefinitionId = 1;
};

GraphError parseSnapshot(const std::uint8_t* src, std::size_t byteCount, SnapshotData& out);
std::vector<std::uint8_t> buildSnapshotBytes(const SnapshotData& data);

} // namespace nodegraph
