#include "nodegraph/persistence/snapshot.h"
#include "nodegraph/core/util.h"
#include "nodegraph/persistence/snapshot_internal.h"
#include <cstring>

namespace nodegraph {
using namespace snapshot::detail;

namespace {

void writePorts(SectionWriter& w, const std::vector<PortSpec>& ports) {
    w.u32(static_cast<std::uint32_t>(ports.size()));
    for (const auto& port : ports) {
        w.str(port.id);
        w.str(port.label);
    }
}

void writeNode(SectionWriter& w, const Node& node) {
    w.str(node.id);
    w.str(node.type);
    w.f32(node.position.x);
    w.f32(node.position.y);
    std::uint32_t flags = 0;
    if (node.data.width) flags |= kNodeHasWidth;
    if (node.data.height) flags |= kNodeHasHeight;
    w.u32(flags);
    w.f32(node.data.width.value_or(0.0f));
    w.f32(node.data.height.value_or(0.0f));
    w.str(node.data.customName);
    w.str(node.data.componentId);
    writePorts(w, node.data.inputs);
    writePorts(w, node.data.outputs);
    w.u32(static_cast<std::uint32_t>(node.data.childNodeIds.size()));
    for (const auto& child : node.data.childNodeIds) w.str(child);
    w.u32(static_cast<std::uint32_t>(node.data.params.size()));
    for (const auto& kv : node.data.params) {
        w.str(kv.first);
        w.f32(kv.second);
    }
}

void writeConnection(SectionWriter& w, const Connection& conn) {
    w.str(conn.id);
    w.str(conn.sourceNodeId);
    w.str(conn.sourcePort);
    w.str(conn.targetNodeId);
    w.str(conn.targetPort);
    std::uint32_t flags = 0;
    if (conn.isDashed) flags |= kConnDashed;
    if (conn.isGhost) flags |= kConnGhost;
    w.u32(flags);
}

void writeBindings(SectionWriter& w, const std::vector<PortBinding>& bindings) {
    w.u32(static_cast<std::uint32_t>(bindings.size()));
    for (const auto& b : bindings) {
        w.str(b.componentPortId);
        w.str(b.nodeId);
        w.str(b.portId);
    }
}

} // namespace

std::vector<std::uint8_t> buildSnapshotBytes(const SnapshotData& data) {
    struct SectionBytes {
        std::uint32_t tag;
        std::vector<std::uint8_t> bytes;
    };

    std::vector<SectionBytes> sections;
    sections.reserve(4);

    // NODE
    {
        SectionBytes sec{TAG_NODE, {}};
        SectionWriter w{sec.bytes};
        w.u32(static_cast<std::uint32_t>(data.nodes.size()));
        for (const auto& node : data.nodes) writeNode(w, node);
        sections.push_back(std::move(sec));
    }

    // CONN
    {
        SectionBytes sec{TAG_CONN, {}};
        SectionWriter w{sec.bytes};
        w.u32(static_cast<std::uint32_t>(data.connections.size()));
        for (const auto& conn : data.connections) writeConnection(w, conn);
        sections.push_back(std::move(sec));
    }

    // COMP
    {
        SectionBytes sec{TAG_COMP, {}};
        SectionWriter w{sec.bytes};
        w.u32(static_cast<std::uint32_t>(data.definitions.size()));
        for (const auto& def : data.definitions) {
            w.str(def.id);
            w.str(def.name);
            w.f32(def.origin.x);
            w.f32(def.origin.y);
            writePorts(w, def.inputPorts);
            writePorts(w, def.outputPorts);
            w.u32(static_cast<std::uint32_t>(def.internalNodes.size()));
            for (const auto& node : def.internalNodes) writeNode(w, node);
            w.u32(static_cast<std::uint32_t>(def.internalConnections.size()));
            for (const auto& conn : def.internalConnections) writeConnection(w, conn);
            writeBindings(w, def.inputBindings);
            writeBindings(w, def.outputBindings);
        }
        sections.push_back(std::move(sec));
    }

    // NIDX
    {
        SectionBytes sec{TAG_NIDX, {}};
        SectionWriter w{sec.bytes};
        w.u32(data.nextId);
        w.u32(data.nextDefinitionId);
        sections.push_back(std::move(sec));
    }

    const std::size_t tableBytes = sections.size() * snapshotSectionEntryBytes;
    std::size_t total = snapshotHeaderBytes + tableBytes;
    for (const auto& sec : sections) total += sec.bytes.size();

    std::vector<std::uint8_t> out(total);
    writeU32LE(out.data(), 0, kSnapshotMagic);
    writeU32LE(out.data(), 4, kSnapshotVersion);
    writeU32LE(out.data(), 8, static_cast<std::uint32_t>(sections.size()));

    std::size_t offset = snapshotHeaderBytes + tableBytes;
    for (std::size_t i = 0; i < sections.size(); ++i) {
        const auto& sec = sections[i];
        const std::size_t entry = snapshotHeaderBytes + i * snapshotSectionEntryBytes;
        const std::uint32_t size = static_cast<std::uint32_t>(sec.bytes.size());
        writeU32LE(out.data(), entry + 0, sec.tag);
        writeU32LE(out.data(), entry + 4, static_cast<std::uint32_t>(offset));
        writeU32LE(out.data(), entry + 8, size);
        writeU32LE(out.data(), entry + 12, crc32(sec.bytes.data(), sec.bytes.size()));
        if (size > 0) std::memcpy(out.data() + offset, sec.bytes.data(), size);
        offset += size;
    }
    return out;
}

} // namespace nodegraph
