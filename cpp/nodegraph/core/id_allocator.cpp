#include "nodegraph/core/id_allocator.h"

namespace nodegraph {

std::string IdAllocator::allocate(const std::string& prefix, const TakenFn& isTaken) {
    for (;;) {
        std::string id = prefix + "-" + std::to_string(next_++);
        if (!isTaken || !isTaken(id)) return id;
    }
}

} // namespace nodegraph
