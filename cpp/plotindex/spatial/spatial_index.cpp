#include "plotindex/spatial/spatial_index.h"

#include <cmath>

namespace plotindex {

SpatialIndex::SpatialIndex(std::uint32_t size, std::uint32_t nodeSize) {
    if (size > 0) {
        tree_.emplace(size, nodeSize);
    }
}

void SpatialIndex::addRect(double x0, double y0, double x1, double y1) {
    if (!tree_) return;
    if (!plotindex::bbox::isFinite(Rect{x0, y0, x1, y1})) {
        addEmpty();
        return;
    }
    const Rect r = plotindex::bbox::normalize(Rect{x0, y0, x1, y1});
    tree_->add(r.x0, r.y0, r.x1, r.y1);
}

void SpatialIndex::addPoint(double x, double y) {
    if (!tree_) return;
    if (!std::isfinite(x) || !std::isfinite(y)) {
        addEmpty();
        return;
    }
    tree_->add(x, y, x, y);
}

void SpatialIndex::addEmpty() {
    if (!tree_) return;
    const Rect e = plotindex::bbox::empty();
    tree_->add(e.x0, e.y0, e.x1, e.y1);
}

void SpatialIndex::finish() {
    if (tree_) tree_->finish();
}

Rect SpatialIndex::bbox() const {
    if (!tree_) return plotindex::bbox::empty();
    const Rect extent = tree_->extent();
    return plotindex::bbox::isEmpty(extent) ? plotindex::bbox::empty() : extent;
}

Indices SpatialIndex::indices(const Rect& rect) const {
    if (!tree_) return Indices(0);

    Indices result(tree_->numItems());
    tree_->search(plotindex::bbox::normalize(rect), [&result](std::uint32_t index, const Rect&) {
        result.setWithoutBoundsCheck(index);
    });
    return result;
}

Rect SpatialIndex::bounds(const Rect& rect) const {
    if (!tree_) return plotindex::bbox::empty();

    const Rect q = plotindex::bbox::normalize(rect);
    Rect result = plotindex::bbox::empty();
    tree_->search(q, [&q, &result](std::uint32_t, const Rect& box) {
        if (box.x0 >= q.x0 && box.x0 < result.x0) result.x0 = box.x0;
        if (box.x1 <= q.x1 && box.x1 > result.x1) result.x1 = box.x1;
        if (box.y0 >= q.y0 && box.y0 < result.y0) result.y0 = box.y0;
        if (box.y1 <= q.y1 && box.y1 > result.y1) result.y1 = box.y1;
    });
    return result;
}

Rect SpatialIndex::logBounds() const {
    const Rect xs = bounds(plotindex::bbox::positiveX());
    const Rect ys = bounds(plotindex::bbox::positiveY());
    return Rect{xs.x0, ys.y0, xs.x1, ys.y1};
}

void SpatialIndex::search(const Rect& rect, const PackedTree::SearchVisitor& visitor) const {
    if (!tree_) return;
    tree_->search(plotindex::bbox::normalize(rect), visitor);
}

} // namespace plotindex
