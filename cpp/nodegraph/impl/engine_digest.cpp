// Document digest: FNV-1a over nodes and connections in store order.
// Registry contents are session state, not document state, and are excluded.

#include "nodegraph/core/hash.h"
#include "nodegraph/engine.h"

namespace nodegraph {

namespace {
std::uint64_t hashPorts(std::uint64_t h, const std::vector<PortSpec>& ports) {
    h = hashU32(h, static_cast<std::uint32_t>(ports.size()));
    for (const auto& port : ports) {
        h = hashString(h, port.id);
        h = hashString(h, port.label);
    }
    return h;
}

std::uint64_t hashOptional(std::uint64_t h, const std::optional<float>& v) {
    h = hashU32(h, v ? 1u : 0u);
    return v ? hashF32(h, *v) : h;
}
} // namespace

std::uint64_t GraphEngine::getDocumentDigest() const noexcept {
    std::uint64_t h = kDigestOffset;
    h = hashU32(h, 0x4850524Eu); // "NRPH" marker

    h = hashU32(h, static_cast<std::uint32_t>(store_.nodeCount()));
    for (const auto& node : store_.nodes()) {
        h = hashString(h, node.id);
        h = hashString(h, node.type);
        h = hashF32(h, node.position.x);
        h = hashF32(h, node.position.y);
        h = hashOptional(h, node.data.width);
        h = hashOptional(h, node.data.height);
        h = hashString(h, node.data.customName);
        h = hashString(h, node.data.componentId);
        h = hashPorts(h, node.data.inputs);
        h = hashPorts(h, node.data.outputs);
        h = hashU32(h, static_cast<std::uint32_t>(node.data.childNodeIds.size()));
        for (const auto& child : node.data.childNodeIds) h = hashString(h, child);
        h = hashU32(h, static_cast<std::uint32_t>(node.data.params.size()));
        for (const auto& kv : node.data.params) {
            h = hashString(h, kv.first);
            h = hashF32(h, kv.second);
        }
    }

    h = hashU32(h, static_cast<std::uint32_t>(store_.connectionCount()));
    for (const auto& conn : store_.connections()) {
        h = hashString(h, conn.id);
        h = hashString(h, conn.sourceNodeId);
        h = hashString(h, conn.sourcePort);
        h = hashString(h, conn.targetNodeId);
        h = hashString(h, conn.targetPort);
        h = hashU32(h, (conn.isDashed ? 1u : 0u) | (conn.isGhost ? 2u : 0u));
    }
    return h;
}

} // namespace nodegraph
