#ifndef PLOTINDEX_CORE_TYPES_H
#define PLOTINDEX_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Index layout defaults shared by the packed tree and its callers.

namespace plotindex {

// Fanout of the packed tree. Any small value keeps queries sublinear.
static constexpr std::uint32_t defaultNodeSize = 16;
static constexpr std::uint32_t minNodeSize = 2;
static constexpr std::uint32_t maxNodeSize = 65535;

// Doubles per stored box: minX, minY, maxX, maxY.
static constexpr std::size_t boxStride = 4;

static inline std::uint32_t clampNodeSize(std::uint32_t nodeSize) noexcept {
    if (nodeSize < minNodeSize) return minNodeSize;
    if (nodeSize > maxNodeSize) return maxNodeSize;
    return nodeSize;
}

} // namespace plotindex

#endif // PLOTINDEX_CORE_TYPES_H
