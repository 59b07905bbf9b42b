// GraphEngine change events. Changes coalesce per element until the host
// polls; the queue is bounded and collapses to a single Overflow event.

#include "nodegraph/engine.h"
#include <iterator>
#include <utility>

namespace nodegraph {

namespace {
template <typename PendingMap, typename Kind>
void markCreated(PendingMap& pending, const std::string& id, Kind created, Kind changed, Kind deleted) {
    auto it = pending.find(id);
    if (it != pending.end() && it->second == deleted) {
        it->second = changed;
        return;
    }
    pending[id] = created;
}

template <typename PendingMap, typename Kind>
void markChanged(PendingMap& pending, const std::string& id, Kind changed) {
    pending.emplace(id, changed);
}

template <typename PendingMap, typename Kind>
void markDeleted(PendingMap& pending, const std::string& id, Kind created, Kind deleted) {
    auto it = pending.find(id);
    if (it != pending.end() && it->second == created) {
        pending.erase(it);
        return;
    }
    pending[id] = deleted;
}
} // namespace

void GraphEngine::clearEventState() {
    events_.clear();
    eventOverflowed_ = false;
    pendingNodes_.clear();
    pendingConnections_.clear();
    pendingDefinitions_.clear();
    pendingOrderChanged_ = false;
    pendingHistoryChanged_ = false;
    pendingReload_ = false;
}

void GraphEngine::recordNodeCreated(const std::string& id) {
    markCreated(pendingNodes_, id, Pending::Created, Pending::Changed, Pending::Deleted);
}

void GraphEngine::recordNodeChanged(const std::string& id) {
    markChanged(pendingNodes_, id, Pending::Changed);
}

void GraphEngine::recordNodeDeleted(const std::string& id) {
    markDeleted(pendingNodes_, id, Pending::Created, Pending::Deleted);
}

void GraphEngine::recordConnectionCreated(const std::string& id) {
    markCreated(pendingConnections_, id, Pending::Created, Pending::Changed, Pending::Deleted);
}

void GraphEngine::recordConnectionChanged(const std::string& id) {
    markChanged(pendingConnections_, id, Pending::Changed);
}

void GraphEngine::recordConnectionDeleted(const std::string& id) {
    markDeleted(pendingConnections_, id, Pending::Created, Pending::Deleted);
}

void GraphEngine::recordOrderChanged() {
    pendingOrderChanged_ = true;
}

void GraphEngine::recordHistoryChanged() {
    pendingHistoryChanged_ = true;
}

void GraphEngine::recordDefinitionPublished(const std::string& id) {
    pendingDefinitions_.push_back(id);
}

bool GraphEngine::hasPendingEvents() const noexcept {
    return !events_.empty() || !pendingNodes_.empty() || !pendingConnections_.empty()
        || !pendingDefinitions_.empty() || pendingOrderChanged_ || pendingHistoryChanged_ || pendingReload_;
}

void GraphEngine::pushEvent(GraphEventType type, const std::string& id) {
    if (eventOverflowed_) return;
    if (events_.size() >= config_.maxEvents) {
        events_.clear();
        events_.push_back(GraphEvent{GraphEventType::Overflow, {}});
        eventOverflowed_ = true;
        return;
    }
    events_.push_back(GraphEvent{type, id});
}

void GraphEngine::flushPendingEvents() {
    if (pendingReload_) {
        const bool history = pendingHistoryChanged_;
        const bool overflowed = eventOverflowed_;
        auto queued = std::move(events_);
        clearEventState();
        events_ = std::move(queued);
        eventOverflowed_ = overflowed;
        pushEvent(GraphEventType::DocumentReloaded, {});
        if (history) pushEvent(GraphEventType::HistoryChanged, {});
        return;
    }

    for (const auto& id : pendingDefinitions_) pushEvent(GraphEventType::DefinitionPublished, id);
    for (const auto& kv : pendingNodes_) {
        if (kv.second == Pending::Created) pushEvent(GraphEventType::NodeCreated, kv.first);
    }
    for (const auto& kv : pendingConnections_) {
        if (kv.second == Pending::Created) pushEvent(GraphEventType::ConnectionCreated, kv.first);
    }
    for (const auto& kv : pendingNodes_) {
        if (kv.second == Pending::Changed) pushEvent(GraphEventType::NodeChanged, kv.first);
    }
    for (const auto& kv : pendingConnections_) {
        if (kv.second == Pending::Changed) pushEvent(GraphEventType::ConnectionChanged, kv.first);
    }
    for (const auto& kv : pendingConnections_) {
        if (kv.second == Pending::Deleted) pushEvent(GraphEventType::ConnectionDeleted, kv.first);
    }
    for (const auto& kv : pendingNodes_) {
        if (kv.second == Pending::Deleted) pushEvent(GraphEventType::NodeDeleted, kv.first);
    }
    if (pendingOrderChanged_) pushEvent(GraphEventType::OrderChanged, {});
    if (pendingHistoryChanged_) pushEvent(GraphEventType::HistoryChanged, {});

    pendingNodes_.clear();
    pendingConnections_.clear();
    pendingDefinitions_.clear();
    pendingOrderChanged_ = false;
    pendingHistoryChanged_ = false;
}

std::vector<GraphEvent> GraphEngine::pollEvents() {
    flushPendingEvents();
    std::vector<GraphEvent> out(std::make_move_iterator(events_.begin()), std::make_move_iterator(events_.end()));
    events_.clear();
    eventOverflowed_ = false;
    return out;
}

} // namespace nodegraph
