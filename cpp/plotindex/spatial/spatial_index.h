#pragma once

#include "plotindex/core/types.h"
#include "plotindex/geometry/bbox.h"
#include "plotindex/spatial/indices.h"
#include "plotindex/spatial/packed_tree.h"

#include <cstdint>
#include <optional>

namespace plotindex {

// Per-glyph spatial index. Rows are added in data order, sealed once with
// finish(), then queried on every pan/zoom/hover/selection event.
//
// A size of 0 produces an absent index: every add/finish is a no-op and every
// query returns an empty result.
class SpatialIndex {
public:
    explicit SpatialIndex(std::uint32_t size, std::uint32_t nodeSize = defaultNodeSize);

    // Non-finite coordinates store the empty box so the row keeps its slot
    // but never matches a query.
    void addRect(double x0, double y0, double x1, double y1);
    void addPoint(double x, double y);
    void addEmpty();

    void finish();

    bool isAbsent() const noexcept { return !tree_.has_value(); }
    std::uint32_t size() const noexcept { return tree_ ? tree_->numItems() : 0u; }

    Rect bbox() const;
    Indices indices(const Rect& rect) const;

    // Tightest extent of the matches that still lies inside rect, per edge.
    Rect bounds(const Rect& rect) const;

    // Extent restricted to strictly positive coordinates, for log scales.
    Rect logBounds() const;

    void search(const Rect& rect, const PackedTree::SearchVisitor& visitor) const;

private:
    std::optional<PackedTree> tree_;
};

} // namespace plotindex
