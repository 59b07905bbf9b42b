#include "nodegraph/persistence/snapshot.h"
#include "nodegraph/core/util.h"
#include "nodegraph/persistence/snapshot_internal.h"
#include <unordered_map>

namespace {
struct SectionView {
    const std::uint8_t* data{nullptr};
    std::uint32_t size{0};
};
} // namespace

namespace nodegraph {
using namespace snapshot::detail;

namespace {

// Smallest encodings, used to bound counts before reserving.
constexpr std::size_t kMinPortBytes = 8;
constexpr std::size_t kMinNodeBytes = 4 * 4 + 4 * 3 + 4 * 4;
constexpr std::size_t kMinConnectionBytes = 5 * 4 + 4;
constexpr std::size_t kMinBindingBytes = 3 * 4;
constexpr std::size_t kMinDefinitionBytes = 2 * 4 + 2 * 4 + 6 * 4;

std::vector<PortSpec> readPorts(SectionReader& r) {
    const std::uint32_t n = r.count(kMinPortBytes);
    std::vector<PortSpec> ports;
    ports.reserve(n);
    for (std::uint32_t i = 0; i < n && r.ok; ++i) {
        PortSpec port{};
        port.id = r.str();
        port.label = r.str();
        ports.push_back(std::move(port));
    }
    return ports;
}

Node readNode(SectionReader& r) {
    Node node{};
    node.id = r.str();
    node.type = r.str();
    node.position.x = r.f32();
    node.position.y = r.f32();
    const std::uint32_t flags = r.u32();
    const float width = r.f32();
    const float height = r.f32();
    if (flags & kNodeHasWidth) node.data.width = width;
    if (flags & kNodeHasHeight) node.data.height = height;
    node.data.customName = r.str();
    node.data.componentId = r.str();
    node.data.inputs = readPorts(r);
    node.data.outputs = readPorts(r);
    const std::uint32_t children = r.count(4);
    for (std::uint32_t i = 0; i < children && r.ok; ++i) node.data.childNodeIds.push_back(r.str());
    const std::uint32_t params = r.count(8);
    for (std::uint32_t i = 0; i < params && r.ok; ++i) {
        std::string key = r.str();
        const float value = r.f32();
        node.data.params[std::move(key)] = value;
    }
    return node;
}

Connection readConnection(SectionReader& r) {
    Connection conn{};
    conn.id = r.str();
    conn.sourceNodeId = r.str();
    conn.sourcePort = r.str();
    conn.targetNodeId = r.str();
    conn.targetPort = r.str();
    const std::uint32_t flags = r.u32();
    conn.isDashed = (flags & kConnDashed) != 0;
    conn.isGhost = (flags & kConnGhost) != 0;
    return conn;
}

std::vector<PortBinding> readBindings(SectionReader& r) {
    const std::uint32_t n = r.count(kMinBindingBytes);
    std::vector<PortBinding> out;
    out.reserve(n);
    for (std::uint32_t i = 0; i < n && r.ok; ++i) {
        PortBinding b{};
        b.componentPortId = r.str();
        b.nodeId = r.str();
        b.portId = r.str();
        out.push_back(std::move(b));
    }
    return out;
}

} // namespace

GraphError parseSnapshot(const std::uint8_t* src, std::size_t byteCount, SnapshotData& out) {
    if (!src || byteCount < snapshotHeaderBytes) {
        return GraphError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != kSnapshotMagic) return GraphError::InvalidMagic;

    const std::uint32_t version = readU32(src, 4);
    if (version != kSnapshotVersion) return GraphError::UnsupportedVersion;
    out.version = version;

    const std::uint32_t sectionCount = readU32(src, 8);
    const std::size_t tableBytes = static_cast<std::size_t>(sectionCount) * snapshotSectionEntryBytes;
    std::size_t headerPlusTable = 0;
    if (!tryAdd(snapshotHeaderBytes, tableBytes, headerPlusTable)) {
        return GraphError::InvalidPayloadSize;
    }
    if (byteCount < headerPlusTable) {
        return GraphError::BufferTruncated;
    }

    std::unordered_map<std::uint32_t, SectionView> sections;
    sections.reserve(sectionCount);

    for (std::uint32_t i = 0; i < sectionCount; ++i) {
        const std::size_t base = snapshotHeaderBytes + i * snapshotSectionEntryBytes;
        const std::uint32_t tag = readU32(src, base + 0);
        const std::uint32_t offset = readU32(src, base + 4);
        const std::uint32_t size = readU32(src, base + 8);
        const std::uint32_t expectedCrc = readU32(src, base + 12);

        std::size_t end = 0;
        if (!tryAdd(static_cast<std::size_t>(offset), static_cast<std::size_t>(size), end)) {
            return GraphError::InvalidPayloadSize;
        }
        if (offset < headerPlusTable) return GraphError::InvalidPayloadSize;
        if (end > byteCount) return GraphError::BufferTruncated;

        const std::uint8_t* payload = src + offset;
        if (crc32(payload, size) != expectedCrc) return GraphError::InvalidPayloadSize;

        if (sections.find(tag) == sections.end()) {
            sections.emplace(tag, SectionView{payload, size});
        }
    }

    const auto findSection = [&](std::uint32_t tag) -> const SectionView* {
        auto it = sections.find(tag);
        if (it == sections.end()) return nullptr;
        return &it->second;
    };

    const SectionView* node = findSection(TAG_NODE);
    const SectionView* conn = findSection(TAG_CONN);
    const SectionView* comp = findSection(TAG_COMP);
    const SectionView* nidx = findSection(TAG_NIDX);
    if (!node || !conn || !comp || !nidx) {
        return GraphError::InvalidPayloadSize;
    }

    // NODE
    {
        SectionReader r{node->data, node->size};
        const std::uint32_t count = r.count(kMinNodeBytes);
        out.nodes.clear();
        out.nodes.reserve(count);
        for (std::uint32_t i = 0; i < count && r.ok; ++i) out.nodes.push_back(readNode(r));
        if (!r.ok) return GraphError::BufferTruncated;
    }

    // CONN
    {
        SectionReader r{conn->data, conn->size};
        const std::uint32_t count = r.count(kMinConnectionBytes);
        out.connections.clear();
        out.connections.reserve(count);
        for (std::uint32_t i = 0; i < count && r.ok; ++i) out.connections.push_back(readConnection(r));
        if (!r.ok) return GraphError::BufferTruncated;
    }

    // COMP
    {
        SectionReader r{comp->data, comp->size};
        const std::uint32_t count = r.count(kMinDefinitionBytes);
        out.definitions.clear();
        out.definitions.reserve(count);
        for (std::uint32_t i = 0; i < count && r.ok; ++i) {
            ComponentDefinition def{};
            def.id = r.str();
            def.name = r.str();
            def.origin.x = r.f32();
            def.origin.y = r.f32();
            def.inputPorts = readPorts(r);
            def.outputPorts = readPorts(r);
            const std::uint32_t nodes = r.count(kMinNodeBytes);
            for (std::uint32_t k = 0; k < nodes && r.ok; ++k) def.internalNodes.push_back(readNode(r));
            const std::uint32_t conns = r.count(kMinConnectionBytes);
            for (std::uint32_t k = 0; k < conns && r.ok; ++k) def.internalConnections.push_back(readConnection(r));
            def.inputBindings = readBindings(r);
            def.outputBindings = readBindings(r);
            out.definitions.push_back(std::move(def));
        }
        if (!r.ok) return GraphError::BufferTruncated;
    }

    // NIDX
    {
        SectionReader r{nidx->data, nidx->size};
        out.nextId = r.u32();
        out.nextDefinitionId = r.u32();
        if (!r.ok) return GraphError::BufferTruncated;
    }

    return GraphError::Ok;
}

} // namespace nodegraph
