#pragma once

#include <cstdint>
#include <string>

namespace nodegraph {

enum class GraphEventType : std::uint32_t {
    NodeCreated = 1,
    NodeChanged = 2,
    NodeDeleted = 3,
    ConnectionCreated = 4,
    ConnectionChanged = 5,
    ConnectionDeleted = 6,
    OrderChanged = 7,
    HistoryChanged = 8,
    DefinitionPublished = 9,
    DocumentReloaded = 10,
    // Queue overflowed; the host must resync from the store.
    Overflow = 11,
};

struct GraphEvent {
    GraphEventType type{GraphEventType::NodeChanged};
    std::string id;
};

} // namespace nodegraph
