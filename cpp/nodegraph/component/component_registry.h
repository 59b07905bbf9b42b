#pragma once

#include "nodegraph/component/component_types.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nodegraph {

// Session-lifetime store of published definitions. Entries are immutable once
// published; resolve() hands out copies so callers never alias registry state.
class ComponentRegistry {
public:
    // Assigns a fresh "component-N" id, overwriting def.id, and returns it.
    std::string publish(ComponentDefinition def);

    std::optional<ComponentDefinition> resolve(const std::string& id) const;
    bool contains(const std::string& id) const { return definitions_.count(id) != 0; }
    std::size_t size() const noexcept { return definitions_.size(); }
    const std::map<std::string, ComponentDefinition>& definitions() const noexcept { return definitions_; }

    std::uint32_t getNextId() const noexcept { return nextId_; }

    // Snapshot load path. Rejects duplicate ids and definitions that reach
    // themselves through nested component instances.
    GraphError restore(std::vector<ComponentDefinition> defs, std::uint32_t nextId);
    void clear();

private:
    bool reachesItself(const std::string& id) const;

    std::map<std::string, ComponentDefinition> definitions_;
    std::uint32_t nextId_ = 1;
};

} // namespace nodegraph
