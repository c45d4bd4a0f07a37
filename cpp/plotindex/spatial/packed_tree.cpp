#include "plotindex/spatial/packed_tree.h"
#include "plotindex/core/logging.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace plotindex {

PackedTree::PackedTree(std::uint32_t numItems, std::uint32_t nodeSize)
    : numItems_(numItems), nodeSize_(clampNodeSize(nodeSize)) {
    if (numItems == 0) {
        throw std::runtime_error("PackedTree requires at least one item");
    }

    const Rect e = bbox::empty();
    minX_ = e.x0;
    minY_ = e.y0;
    maxX_ = e.x1;
    maxY_ = e.y1;

    // Level sizes shrink by the fanout until a single root remains.
    std::size_t n = numItems;
    std::size_t numNodes = n;
    levelBounds_.push_back(n * boxStride);
    do {
        n = (n + nodeSize_ - 1) / nodeSize_;
        numNodes += n;
        levelBounds_.push_back(numNodes * boxStride);
    } while (n != 1);

    boxes_.assign(numNodes * boxStride, 0.0);
    indices_.assign(numNodes, 0);

    PLOTINDEX_LOG_DEBUG("packed tree: %u items, node size %u, %zu levels, %zu boxes",
        numItems_, nodeSize_, levelBounds_.size(), numNodes);
}

std::uint32_t PackedTree::add(double minX, double minY, double maxX, double maxY) {
    if (finished_) {
        PLOTINDEX_LOG_WARN("add() after finish()");
        throw std::runtime_error("Cannot add items to a finished index");
    }
    const std::size_t index = pos_ / boxStride;
    if (index >= numItems_) {
        PLOTINDEX_LOG_WARN("add() past declared capacity %u", numItems_);
        throw std::runtime_error("Index capacity of " + std::to_string(numItems_) + " items exceeded");
    }

    indices_[index] = index;
    boxes_[pos_++] = minX;
    boxes_[pos_++] = minY;
    boxes_[pos_++] = maxX;
    boxes_[pos_++] = maxY;

    if (minX < minX_) minX_ = minX;
    if (minY < minY_) minY_ = minY;
    if (maxX > maxX_) maxX_ = maxX;
    if (maxY > maxY_) maxY_ = maxY;

    return static_cast<std::uint32_t>(index);
}

void PackedTree::finish() {
    if (finished_) {
        throw std::runtime_error("Index already finished");
    }
    const std::size_t added = pos_ / boxStride;
    if (added != numItems_) {
        PLOTINDEX_LOG_WARN("finish() after %zu of %u items", added, numItems_);
        throw std::runtime_error("Added " + std::to_string(added) + " items when expected " + std::to_string(numItems_) + ".");
    }

    // Group consecutive boxes of each level into parent nodes, bottom-up.
    // pos walks the level being read, pos_ appends to the level above.
    std::size_t pos = 0;
    for (std::size_t level = 0; level + 1 < levelBounds_.size(); ++level) {
        const std::size_t end = levelBounds_[level];
        while (pos < end) {
            const std::size_t firstChild = pos;

            double nodeMinX = boxes_[pos++];
            double nodeMinY = boxes_[pos++];
            double nodeMaxX = boxes_[pos++];
            double nodeMaxY = boxes_[pos++];
            for (std::uint32_t j = 1; j < nodeSize_ && pos < end; ++j) {
                nodeMinX = std::min(nodeMinX, boxes_[pos++]);
                nodeMinY = std::min(nodeMinY, boxes_[pos++]);
                nodeMaxX = std::max(nodeMaxX, boxes_[pos++]);
                nodeMaxY = std::max(nodeMaxY, boxes_[pos++]);
            }

            indices_[pos_ / boxStride] = firstChild;
            boxes_[pos_++] = nodeMinX;
            boxes_[pos_++] = nodeMinY;
            boxes_[pos_++] = nodeMaxX;
            boxes_[pos_++] = nodeMaxY;
        }
    }

    finished_ = true;
}

std::size_t PackedTree::upperBound(std::size_t offset) const {
    const auto it = std::upper_bound(levelBounds_.begin(), levelBounds_.end(), offset);
    return it == levelBounds_.end() ? levelBounds_.back() : *it;
}

std::size_t PackedTree::groupEnd(std::size_t start) const {
    return std::min(start + static_cast<std::size_t>(nodeSize_) * boxStride, upperBound(start));
}

Rect PackedTree::boxAt(std::size_t offset) const {
    return Rect{boxes_[offset], boxes_[offset + 1], boxes_[offset + 2], boxes_[offset + 3]};
}

void PackedTree::search(const Rect& query, const SearchVisitor& visitor) const {
    if (!finished_) {
        PLOTINDEX_LOG_WARN("search() before finish()");
        throw std::runtime_error("Data not yet indexed - call finish().");
    }
    if (bbox::isEmpty(query)) return;

    const double minX = query.x0;
    const double minY = query.y0;
    const double maxX = query.x1;
    const double maxY = query.y1;
    const std::size_t leafEnd = static_cast<std::size_t>(numItems_) * boxStride;

    std::vector<std::size_t> stack;
    std::size_t nodeIndex = boxes_.size() - boxStride;

    for (;;) {
        const std::size_t end = groupEnd(nodeIndex);

        for (std::size_t pos = nodeIndex; pos < end; pos += boxStride) {
            const double nodeMinX = boxes_[pos + 0];
            const double nodeMinY = boxes_[pos + 1];
            const double nodeMaxX = boxes_[pos + 2];
            const double nodeMaxY = boxes_[pos + 3];

            if (maxX < nodeMinX || maxY < nodeMinY || minX > nodeMaxX || minY > nodeMaxY) {
                continue;
            }
            // Empty leaf, or a node whose whole subtree is empty.
            if (!(nodeMinX <= nodeMaxX && nodeMinY <= nodeMaxY)) {
                continue;
            }

            if (minX <= nodeMinX && minY <= nodeMinY && maxX >= nodeMaxX && maxY >= nodeMaxY) {
                // Fully contained: follow the first and last child pointers down
                // to the contiguous leaf range and report it without further tests.
                std::size_t posStart = pos;
                std::size_t posEnd = pos;
                while (posStart >= leafEnd) {
                    posStart = indices_[posStart / boxStride];
                    posEnd = groupEnd(indices_[posEnd / boxStride]) - boxStride;
                }

                for (std::size_t leafPos = posStart; leafPos <= posEnd; leafPos += boxStride) {
                    const Rect leaf = boxAt(leafPos);
                    if (bbox::isEmpty(leaf)) continue;
                    visitor(static_cast<std::uint32_t>(indices_[leafPos / boxStride]), leaf);
                }
                continue;
            }

            const std::size_t index = indices_[pos / boxStride];
            if (nodeIndex < leafEnd) {
                visitor(static_cast<std::uint32_t>(index), Rect{nodeMinX, nodeMinY, nodeMaxX, nodeMaxY});
            } else {
                stack.push_back(index);
            }
        }

        if (stack.empty()) break;
        nodeIndex = stack.back();
        stack.pop_back();
    }
}

} // namespace plotindex
