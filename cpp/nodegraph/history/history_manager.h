#pragma once

#include "nodegraph/history/history_types.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nodegraph {

class GraphStore;

// Receives every element touched while an entry is re-applied.
class HistoryObserver {
public:
    virtual ~HistoryObserver() = default;
    virtual void onNodeRestored(const std::string& id, bool existed, bool exists) = 0;
    virtual void onConnectionRestored(const std::string& id, bool existed, bool exists) = 0;
    virtual void onOrderRestored() = 0;
    virtual void onNextIdRestored(std::uint32_t nextId) = 0;
};

class HistoryManager {
public:
    explicit HistoryManager(GraphStore& store, std::size_t maxEntries = 500);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    // Both return false (and change nothing) on an empty stack or while an
    // action is open.
    bool undo(HistoryObserver& observer);
    bool redo(HistoryObserver& observer);

    // Transaction management. beginEntry returns false when a transaction is
    // already open, so nested operations fold into the outer entry.
    bool beginEntry(std::uint32_t nextId);
    void discardEntry();
    bool commitEntry(std::uint32_t nextId);

    // Batching: everything between the outermost startAction/endAction pair
    // commits as one entry. endAction returns true when an entry was pushed.
    void startAction(std::uint32_t nextId);
    bool endAction(std::uint32_t nextId);
    bool isActionOpen() const noexcept { return transaction_.actionDepth > 0; }

    // Record pre-mutation state; the first mark per id wins.
    void markNodeChange(const std::string& id);
    void markConnectionChange(const std::string& id);

    void clear();
    void setMaxEntries(std::size_t maxEntries);
    std::size_t getMaxEntries() const noexcept { return maxEntries_; }

    std::uint32_t getGeneration() const noexcept { return historyGeneration_; }
    void setSuppressed(bool suppressed) { suppressed_ = suppressed; }
    bool isSuppressed() const { return suppressed_; }
    bool isRestoring() const noexcept { return restoring_; }
    bool isTransactionActive() const { return transaction_.active; }
    std::size_t getHistorySize() const noexcept { return history_.size(); }
    std::size_t getCursor() const noexcept { return cursor_; }
    std::size_t getUndoDepth() const noexcept { return cursor_; }
    std::size_t getRedoDepth() const noexcept { return history_.size() - cursor_; }

    void pushHistoryEntry(HistoryEntry&& entry);

private:
    void finalizeHistoryEntry(HistoryEntry& entry, std::uint32_t nextId);
    void applyHistoryEntry(const HistoryEntry& entry, bool useAfter, HistoryObserver& observer);

    GraphStore& store_;

    std::vector<HistoryEntry> history_;
    std::size_t cursor_ = 0;
    std::size_t maxEntries_;
    std::uint32_t historyGeneration_ = 0;
    bool suppressed_ = false;
    bool restoring_ = false;
    HistoryTransaction transaction_;
};

} // namespace nodegraph
