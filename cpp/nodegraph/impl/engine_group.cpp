// GraphEngine group operations: create, membership, fit.

#include "nodegraph/engine.h"
#include "nodegraph/graph/node_catalog.h"
#include <algorithm>
#include <cmath>
#include <set>

namespace nodegraph {

using namespace layout_constants;

namespace {
bool nearlyEqual(float a, float b) {
    return std::fabs(a - b) < 1.0f;
}

bool containsId(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}
} // namespace

std::string GraphEngine::createGroup(const std::vector<std::string>& nodeIds) {
    std::set<std::string> seen;
    std::vector<const Node*> members;
    for (const auto& node : store_.nodes()) {
        if (!containsId(nodeIds, node.id) || !seen.insert(node.id).second) continue;
        members.push_back(&node);
    }
    if (members.size() < 2) {
        reportFailure(DiagnosticOp::Group, GraphError::InvalidOperation, {}, "a group needs at least two nodes");
        return {};
    }

    const GroupFrame frame = frameAround(unionBounds(members), kGroupPadding, kGroupPaddingBottom, kGroupHeaderHeight);

    Node group{};
    group.type = node_types::kGroup;
    group.position = frame.position;
    group.data.width = frame.width;
    group.data.height = frame.height;
    group.data.customName = "Group(" + std::to_string(members.size()) + ")";
    for (const Node* m : members) group.data.childNodeIds.push_back(m->id);

    const bool historyStarted = beginHistoryEntry();
    group.id = allocateNodeId("group");
    const std::string id = group.id;
    // First in node order: groups render behind their members.
    insertNodeTracked(std::move(group), 0);
    if (historyStarted) commitHistoryEntry();
    setError(GraphError::Ok);
    return id;
}

bool GraphEngine::joinGroup(const std::string& nodeId, const std::string& groupId) {
    const Node* node = store_.findNode(nodeId);
    const Node* group = store_.findNode(groupId);
    if (!node || !group) {
        setError(GraphError::NotFound);
        return false;
    }
    if (!group->isGroup() || nodeId == groupId) {
        reportFailure(DiagnosticOp::Group, GraphError::InvalidOperation, nodeId, groupId);
        return false;
    }
    if (node->isGroup()) {
        reportFailure(DiagnosticOp::Group, GraphError::RecursiveStructure, nodeId, "groups do not nest");
        return false;
    }

    const bool historyStarted = beginHistoryEntry();
    for (const auto& otherId : store_.groupsContaining(nodeId)) {
        if (otherId == groupId) continue;
        Node other = *store_.findNode(otherId);
        auto& children = other.data.childNodeIds;
        children.erase(std::remove(children.begin(), children.end(), nodeId), children.end());
        replaceNodeTracked(other);
    }
    Node target = *store_.findNode(groupId);
    if (!containsId(target.data.childNodeIds, nodeId)) {
        target.data.childNodeIds.push_back(nodeId);
        replaceNodeTracked(target);
    }
    fitGroupToChildren(groupId);
    if (historyStarted) commitHistoryEntry();
    setError(GraphError::Ok);
    return true;
}

bool GraphEngine::leaveGroup(const std::string& nodeId) {
    if (!store_.hasNode(nodeId)) {
        setError(GraphError::NotFound);
        return false;
    }
    const auto parents = store_.groupsContaining(nodeId);
    if (parents.empty()) {
        setError(GraphError::InvalidOperation);
        return false;
    }
    const bool historyStarted = beginHistoryEntry();
    replaceChildReference(nodeId, {});
    for (const auto& groupId : parents) fitGroupToChildren(groupId);
    if (historyStarted) commitHistoryEntry();
    setError(GraphError::Ok);
    return true;
}

bool GraphEngine::fitGroupToChildren(const std::string& groupId) {
    const Node* group = store_.findNode(groupId);
    if (!group || !group->isGroup()) {
        setError(GraphError::NotFound);
        return false;
    }
    std::vector<const Node*> children;
    for (const auto& childId : group->data.childNodeIds) {
        if (const Node* child = store_.findNode(childId)) children.push_back(child);
    }
    if (children.empty()) {
        setError(GraphError::InvalidOperation);
        return false;
    }

    const GroupFrame frame = frameAround(unionBounds(children), kGroupPadding, kGroupPaddingBottom, kGroupHeaderHeight);
    if (nearlyEqual(group->data.width.value_or(0.0f), frame.width)
        && nearlyEqual(group->data.height.value_or(0.0f), frame.height)
        && nearlyEqual(group->position.x, frame.position.x)
        && nearlyEqual(group->position.y, frame.position.y)) {
        return true;
    }

    Node fitted = *group;
    fitted.position = frame.position;
    fitted.data.width = frame.width;
    fitted.data.height = frame.height;
    const bool historyStarted = beginHistoryEntry();
    replaceNodeTracked(fitted);
    if (historyStarted) commitHistoryEntry();
    return true;
}

bool GraphEngine::isNodeOverlappingGroup(const std::string& nodeId, const std::string& groupId) const {
    const Node* node = store_.findNode(nodeId);
    const Node* group = store_.findNode(groupId);
    if (!node || !group || !group->isGroup()) return false;
    return nodegraph::isNodeOverlappingGroup(*node, *group);
}

} // namespace nodegraph
