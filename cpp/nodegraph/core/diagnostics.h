#pragma once

#include "nodegraph/core/types.h"
#include <cstddef>
#include <string>
#include <vector>

namespace nodegraph {

enum class DiagnosticOp : std::uint32_t {
    Connect = 0,
    DeleteConnection = 1,
    Compile = 2,
    Expand = 3,
    Undo = 4,
    Redo = 5,
    NodeEdit = 6,
    Group = 7,
    Snapshot = 8,
    Sync = 9,
};

struct DiagnosticEntry {
    DiagnosticOp op{DiagnosticOp::Connect};
    GraphError error{GraphError::Ok};
    std::string subjectId;
    std::string detail;
};

// Bounded record of rejected or partially applied operations. Recording stops
// once capacity is reached; the overflow flag stays set until clear().
class DiagnosticLog {
public:
    explicit DiagnosticLog(std::size_t capacity = 256);

    void record(DiagnosticOp op, GraphError error, std::string subjectId, std::string detail = {});
    void clear();
    void setCapacity(std::size_t capacity);

    const std::vector<DiagnosticEntry>& entries() const noexcept { return entries_; }
    bool overflowed() const noexcept { return overflowed_; }
    std::size_t capacity() const noexcept { return capacity_; }

private:
    std::vector<DiagnosticEntry> entries_;
    std::size_t capacity_;
    bool overflowed_ = false;
};

const char* diagnosticOpName(DiagnosticOp op) noexcept;

} // namespace nodegraph
