#include "nodegraph/core/diagnostics.h"
#include "nodegraph/core/logging.h"
#include <utility>

namespace nodegraph {

DiagnosticLog::DiagnosticLog(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ > 0) entries_.reserve(capacity_ < 64 ? capacity_ : 64);
}

void DiagnosticLog::record(DiagnosticOp op, GraphError error, std::string subjectId, std::string detail) {
    NODEGRAPH_LOG_WARN("%s failed on '%s': %s %s",
        diagnosticOpName(op), subjectId.c_str(), graphErrorName(error), detail.c_str());
    if (overflowed_) return;
    if (entries_.size() >= capacity_) {
        overflowed_ = true;
        return;
    }
    entries_.push_back(DiagnosticEntry{op, error, std::move(subjectId), std::move(detail)});
}

void DiagnosticLog::clear() {
    entries_.clear();
    overflowed_ = false;
}

void DiagnosticLog::setCapacity(std::size_t capacity) {
    capacity_ = capacity;
    if (entries_.size() > capacity_) {
        entries_.resize(capacity_);
        overflowed_ = true;
    }
}

const char* diagnosticOpName(DiagnosticOp op) noexcept {
    switch (op) {
        case DiagnosticOp::Connect: return "connect";
        case DiagnosticOp::DeleteConnection: return "deleteConnection";
        case DiagnosticOp::Compile: return "compile";
        case DiagnosticOp::Expand: return "expand";
        case DiagnosticOp::Undo: return "undo";
        case DiagnosticOp::Redo: return "redo";
        case DiagnosticOp::NodeEdit: return "nodeEdit";
        case DiagnosticOp::Group: return "group";
        case DiagnosticOp::Snapshot: return "snapshot";
        case DiagnosticOp::Sync: return "sync";
    }
    return "unknown";
}

} // namespace nodegraph
