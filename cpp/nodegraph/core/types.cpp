#include "nodegraph/core/types.h"

namespace nodegraph {

const char* graphErrorName(GraphError err) noexcept {
    switch (err) {
        case GraphError::Ok: return "Ok";
        case GraphError::NotFound: return "NotFound";
        case GraphError::InvalidOperation: return "InvalidOperation";
        case GraphError::DuplicateId: return "DuplicateId";
        case GraphError::RoleMismatch: return "RoleMismatch";
        case GraphError::DuplicateConnection: return "DuplicateConnection";
        case GraphError::UnknownPort: return "UnknownPort";
        case GraphError::UnresolvedDefinition: return "UnresolvedDefinition";
        case GraphError::RecursiveStructure: return "RecursiveStructure";
        case GraphError::InvalidMagic: return "InvalidMagic";
        case GraphError::UnsupportedVersion: return "UnsupportedVersion";
        case GraphError::BufferTruncated: return "BufferTruncated";
        case GraphError::InvalidPayloadSize: return "InvalidPayloadSize";
    }
    return "Unknown";
}

} // namespace nodegraph
