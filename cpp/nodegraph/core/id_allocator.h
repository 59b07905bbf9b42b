#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace nodegraph {

// Sequential "<prefix>-<n>" ids from one shared cursor. The cursor is part of
// document state: history restores it and snapshots persist it.
class IdAllocator {
public:
    using TakenFn = std::function<bool(const std::string&)>;

    std::string allocate(const std::string& prefix, const TakenFn& isTaken);

    std::uint32_t getNext() const noexcept { return next_; }
    void setNext(std::uint32_t next) noexcept { next_ = next; }
    void reset() noexcept { next_ = 1; }

private:
    std::uint32_t next_ = 1;
};

} // namespace nodegraph
