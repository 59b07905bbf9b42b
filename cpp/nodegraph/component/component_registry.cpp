#include "nodegraph/component/component_registry.h"
#include "nodegraph/core/logging.h"
#include <set>
#include <utility>

namespace nodegraph {

bool operator==(const ComponentDefinition& a, const ComponentDefinition& b) {
    return a.id == b.id
        && a.name == b.name
        && a.inputPorts == b.inputPorts
        && a.outputPorts == b.outputPorts
        && a.internalNodes == b.internalNodes
        && a.internalConnections == b.internalConnections
        && a.inputBindings == b.inputBindings
        && a.outputBindings == b.outputBindings
        && a.origin == b.origin;
}

std::string ComponentRegistry::publish(ComponentDefinition def) {
    std::string id;
    do {
        id = "component-" + std::to_string(nextId_++);
    } while (definitions_.count(id) != 0);
    def.id = id;
    NODEGRAPH_LOG_DEBUG("published %s (%zu nodes, %zu in, %zu out)",
        id.c_str(), def.internalNodes.size(), def.inputPorts.size(), def.outputPorts.size());
    definitions_.emplace(id, std::move(def));
    return id;
}

std::optional<ComponentDefinition> ComponentRegistry::resolve(const std::string& id) const {
    const auto it = definitions_.find(id);
    if (it == definitions_.end()) return std::nullopt;
    return it->second;
}

GraphError ComponentRegistry::restore(std::vector<ComponentDefinition> defs, std::uint32_t nextId) {
    std::map<std::string, ComponentDefinition> previous;
    previous.swap(definitions_);
    for (auto& def : defs) {
        if (def.id.empty() || definitions_.count(def.id) != 0) {
            definitions_.swap(previous);
            return GraphError::DuplicateId;
        }
        std::string id = def.id;
        definitions_.emplace(std::move(id), std::move(def));
    }
    for (const auto& kv : definitions_) {
        if (reachesItself(kv.first)) {
            NODEGRAPH_LOG_WARN("definition %s contains an instance of itself", kv.first.c_str());
            definitions_.swap(previous);
            return GraphError::RecursiveStructure;
        }
    }
    nextId_ = nextId == 0 ? 1 : nextId;
    return GraphError::Ok;
}

bool ComponentRegistry::reachesItself(const std::string& id) const {
    std::vector<std::string> stack{id};
    std::set<std::string> visited;
    while (!stack.empty()) {
        const std::string current = stack.back();
        stack.pop_back();
        const auto it = definitions_.find(current);
        if (it == definitions_.end()) continue;
        for (const auto& node : it->second.internalNodes) {
            if (!node.isComponent()) continue;
            const std::string& ref = node.data.componentId;
            if (ref == id) return true;
            if (visited.insert(ref).second) stack.push_back(ref);
        }
    }
    return false;
}

void ComponentRegistry::clear() {
    definitions_.clear();
    nextId_ = 1;
}

} // namespace nodegraph
