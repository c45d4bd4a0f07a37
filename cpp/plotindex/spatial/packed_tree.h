#pragma once

#include "plotindex/core/types.h"
#include "plotindex/geometry/bbox.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace plotindex {

// Static bulk-loaded R-tree stored as flat arrays.
//
// boxes_ holds numItems leaf boxes in insertion order followed by the node
// boxes of each upper level, four doubles per box. Positions ("offsets")
// are counted in doubles, so box k starts at offset 4*k. indices_ is keyed by
// box number: a leaf maps to its insertion position, a node to the offset of
// its first child. levelBounds_ stores the offset one past the end of each
// level, lowest level first; the root is the last box.
class PackedTree {
public:
    using SearchVisitor = std::function<void(std::uint32_t index, const Rect& box)>;

    explicit PackedTree(std::uint32_t numItems, std::uint32_t nodeSize = defaultNodeSize);

    std::uint32_t add(double minX, double minY, double maxX, double maxY);
    void finish();

    // Calls visitor once for every leaf box intersecting query. Visit order is
    // deterministic for a given tree and query but otherwise unspecified.
    void search(const Rect& query, const SearchVisitor& visitor) const;

    std::uint32_t numItems() const noexcept { return numItems_; }
    std::uint32_t nodeSize() const noexcept { return nodeSize_; }
    bool isFinished() const noexcept { return finished_; }
    std::size_t boxCount() const noexcept { return boxes_.size() / boxStride; }
    const std::vector<std::size_t>& levelBounds() const noexcept { return levelBounds_; }

    // Running extent of every added box. Empty boxes do not contribute.
    Rect extent() const noexcept { return Rect{minX_, minY_, maxX_, maxY_}; }

private:
    std::size_t upperBound(std::size_t offset) const;
    std::size_t groupEnd(std::size_t start) const;
    Rect boxAt(std::size_t offset) const;

    std::uint32_t numItems_;
    std::uint32_t nodeSize_;
    std::vector<double> boxes_;
    std::vector<std::size_t> indices_;
    std::vector<std::size_t> levelBounds_;
    std::size_t pos_ = 0;
    bool finished_ = false;

    double minX_;
    double minY_;
    double maxX_;
    double maxY_;
};

} // namespace plotindex
