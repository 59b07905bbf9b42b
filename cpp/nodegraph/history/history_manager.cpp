#include "nodegraph/history/history_manager.h"
#include "nodegraph/core/logging.h"
#include "nodegraph/graph/graph_store.h"
#include <algorithm>

namespace nodegraph {

HistoryManager::HistoryManager(GraphStore& store, std::size_t maxEntries)
    : store_(store), maxEntries_(maxEntries == 0 ? 1 : maxEntries) {}

void HistoryManager::clear() {
    history_.clear();
    cursor_ = 0;
    transaction_ = HistoryTransaction{};
    historyGeneration_++;
}

void HistoryManager::setMaxEntries(std::size_t maxEntries) {
    maxEntries_ = maxEntries == 0 ? 1 : maxEntries;
    if (history_.size() <= maxEntries_) return;
    const std::size_t drop = history_.size() - maxEntries_;
    history_.erase(history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(drop));
    cursor_ = cursor_ > drop ? cursor_ - drop : 0;
    historyGeneration_++;
}

bool HistoryManager::canUndo() const noexcept {
    return cursor_ > 0;
}

bool HistoryManager::canRedo() const noexcept {
    return cursor_ < history_.size();
}

bool HistoryManager::beginEntry(std::uint32_t nextId) {
    if (suppressed_ || restoring_ || transaction_.active) return false;
    transaction_.active = true;
    transaction_.actionDepth = 0;
    transaction_.entry = HistoryEntry{};
    transaction_.entry.nextIdBefore = nextId;
    transaction_.entry.nextIdAfter = nextId;
    transaction_.nodeIndex.clear();
    transaction_.connectionIndex.clear();
    return true;
}

void HistoryManager::discardEntry() {
    transaction_ = HistoryTransaction{};
}

void HistoryManager::pushHistoryEntry(HistoryEntry&& entry) {
    if (suppressed_) return;
    if (cursor_ < history_.size()) {
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(cursor_), history_.end());
    }
    history_.push_back(std::move(entry));
    if (history_.size() > maxEntries_) {
        history_.erase(history_.begin());
    }
    cursor_ = history_.size();
    historyGeneration_++;
}

void HistoryManager::markNodeChange(const std::string& id) {
    if (!transaction_.active || suppressed_) return;
    auto& entry = transaction_.entry;
    if (!entry.hasNodeOrderChange) {
        entry.nodeOrderBefore = store_.nodeOrder();
        entry.hasNodeOrderChange = true;
    }
    auto [it, inserted] = transaction_.nodeIndex.emplace(id, entry.nodes.size());
    if (!inserted) return;

    HistoryEntry::NodeChange change{};
    change.id = id;
    if (const Node* node = store_.findNode(id)) {
        change.existedBefore = true;
        change.before = *node;
    }
    entry.nodes.push_back(std::move(change));
}

void HistoryManager::markConnectionChange(const std::string& id) {
    if (!transaction_.active || suppressed_) return;
    auto& entry = transaction_.entry;
    if (!entry.hasConnectionOrderChange) {
        entry.connectionOrderBefore = store_.connectionOrder();
        entry.hasConnectionOrderChange = true;
    }
    auto [it, inserted] = transaction_.connectionIndex.emplace(id, entry.connections.size());
    if (!inserted) return;

    HistoryEntry::ConnectionChange change{};
    change.id = id;
    if (const Connection* conn = store_.findConnection(id)) {
        change.existedBefore = true;
        change.before = *conn;
    }
    entry.connections.push_back(std::move(change));
}

void HistoryManager::finalizeHistoryEntry(HistoryEntry& entry, std::uint32_t nextId) {
    entry.nextIdAfter = nextId;
    for (auto& change : entry.nodes) {
        if (const Node* node = store_.findNode(change.id)) {
            change.existedAfter = true;
            change.after = *node;
        }
    }
    for (auto& change : entry.connections) {
        if (const Connection* conn = store_.findConnection(change.id)) {
            change.existedAfter = true;
            change.after = *conn;
        }
    }
    if (entry.hasNodeOrderChange) entry.nodeOrderAfter = store_.nodeOrder();
    if (entry.hasConnectionOrderChange) entry.connectionOrderAfter = store_.connectionOrder();
}

bool HistoryManager::commitEntry(std::uint32_t nextId) {
    if (!transaction_.active) return false;
    HistoryEntry entry = std::move(transaction_.entry);
    transaction_ = HistoryTransaction{};

    finalizeHistoryEntry(entry, nextId);

    entry.nodes.erase(std::remove_if(entry.nodes.begin(), entry.nodes.end(), [](const HistoryEntry::NodeChange& c) {
        if (c.existedBefore != c.existedAfter) return false;
        return !c.existedBefore || c.before == c.after;
    }), entry.nodes.end());

    entry.connections.erase(std::remove_if(entry.connections.begin(), entry.connections.end(), [](const HistoryEntry::ConnectionChange& c) {
        if (c.existedBefore != c.existedAfter) return false;
        return !c.existedBefore || c.before == c.after;
    }), entry.connections.end());

    if (entry.hasNodeOrderChange && entry.nodeOrderBefore == entry.nodeOrderAfter) {
        entry.hasNodeOrderChange = false;
        entry.nodeOrderBefore.clear();
        entry.nodeOrderAfter.clear();
    }

    if (entry.hasConnectionOrderChange && entry.connectionOrderBefore == entry.connectionOrderAfter) {
        entry.hasConnectionOrderChange = false;
        entry.connectionOrderBefore.clear();
        entry.connectionOrderAfter.clear();
    }

    if (entry.nodes.empty() && entry.connections.empty()
        && !entry.hasNodeOrderChange && !entry.hasConnectionOrderChange) {
        return false;
    }

    std::sort(entry.nodes.begin(), entry.nodes.end(), [](const HistoryEntry::NodeChange& a, const HistoryEntry::NodeChange& b) {
        return a.id < b.id;
    });
    std::sort(entry.connections.begin(), entry.connections.end(), [](const HistoryEntry::ConnectionChange& a, const HistoryEntry::ConnectionChange& b) {
        return a.id < b.id;
    });

    entry.generation = historyGeneration_;
    pushHistoryEntry(std::move(entry));
    return true;
}

void HistoryManager::startAction(std::uint32_t nextId) {
    if (suppressed_ || restoring_) return;
    if (!transaction_.active) {
        beginEntry(nextId);
    } else if (transaction_.actionDepth == 0) {
        NODEGRAPH_LOG_WARN("startAction inside an uncommitted entry; folding into it");
    }
    transaction_.actionDepth++;
}

bool HistoryManager::endAction(std::uint32_t nextId) {
    if (transaction_.actionDepth == 0) {
        NODEGRAPH_LOG_WARN("endAction without matching startAction");
        return false;
    }
    transaction_.actionDepth--;
    if (transaction_.actionDepth > 0) return false;
    return commitEntry(nextId);
}

bool HistoryManager::undo(HistoryObserver& observer) {
    if (transaction_.active) {
        NODEGRAPH_LOG_WARN("undo ignored while a transaction is open");
        return false;
    }
    if (cursor_ == 0) {
        NODEGRAPH_LOG_DEBUG("undo: history empty");
        return false;
    }
    cursor_--;
    applyHistoryEntry(history_[cursor_], false, observer);
    historyGeneration_++;
    return true;
}

bool HistoryManager::redo(HistoryObserver& observer) {
    if (transaction_.active) {
        NODEGRAPH_LOG_WARN("redo ignored while a transaction is open");
        return false;
    }
    if (cursor_ >= history_.size()) {
        NODEGRAPH_LOG_DEBUG("redo: nothing to redo");
        return false;
    }
    const auto& entry = history_[cursor_];
    cursor_++;
    applyHistoryEntry(entry, true, observer);
    historyGeneration_++;
    return true;
}

void HistoryManager::applyHistoryEntry(const HistoryEntry& entry, bool useAfter, HistoryObserver& observer) {
    const bool wasRestoring = restoring_;
    restoring_ = true;

    for (const auto& change : entry.connections) {
        const bool exists = useAfter ? change.existedAfter : change.existedBefore;
        if (exists) {
            store_.upsertConnection(useAfter ? change.after : change.before);
        } else {
            store_.eraseConnection(change.id);
        }
        observer.onConnectionRestored(change.id, useAfter ? change.existedBefore : change.existedAfter, exists);
    }

    for (const auto& change : entry.nodes) {
        const bool exists = useAfter ? change.existedAfter : change.existedBefore;
        if (exists) {
            store_.upsertNode(useAfter ? change.after : change.before);
        } else {
            store_.eraseNode(change.id);
        }
        observer.onNodeRestored(change.id, useAfter ? change.existedBefore : change.existedAfter, exists);
    }

    if (entry.hasNodeOrderChange) {
        store_.applyNodeOrder(useAfter ? entry.nodeOrderAfter : entry.nodeOrderBefore);
    }
    if (entry.hasConnectionOrderChange) {
        store_.applyConnectionOrder(useAfter ? entry.connectionOrderAfter : entry.connectionOrderBefore);
    }
    if (entry.hasNodeOrderChange || entry.hasConnectionOrderChange) {
        observer.onOrderRestored();
    }

    observer.onNextIdRestored(useAfter ? entry.nextIdAfter : entry.nextIdBefore);
    restoring_ = wasRestoring;
}

} // namespace nodegraph
