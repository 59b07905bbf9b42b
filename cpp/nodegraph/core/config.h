#pragma once

#include <cstddef>

namespace nodegraph {

struct RouterOptions {
    // Classify an undeclared port by its id ("input"/"in-" prefix means input).
    // Declared membership always takes precedence.
    bool legacyRoleFallback = false;
};

struct EngineConfig {
    std::size_t maxHistoryEntries = 500;
    std::size_t diagnosticCapacity = 256;
    std::size_t maxEvents = 2048;
    RouterOptions router{};
};

} // namespace nodegraph
