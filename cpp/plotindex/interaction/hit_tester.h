#pragma once

#include <cstdint>
#include <optional>
#include "plotindex/geometry/bbox.h"
#include "plotindex/spatial/indices.h"
#include "plotindex/spatial/spatial_index.h"

namespace plotindex {

enum class Dimension : std::uint8_t {
    Width = 0,   // vertical line, x = value
    Height = 1,  // horizontal line, y = value
};

enum class MarqueeMode : std::uint32_t {
    Window = 0,    // box must lie fully inside the marquee
    Crossing = 1,  // box only has to touch the marquee
};

struct HitStats {
    std::uint32_t queries;
    std::uint32_t candidates;
};

// Broad-phase hit tests for one glyph renderer. Answers are supersets of the
// exact geometric hits; the renderer refines them against its own shapes.
// The index is borrowed and must outlive the tester.
class HitTester {
public:
    explicit HitTester(const SpatialIndex& index);

    Indices hitPoint(double x, double y, double tolerance) const;
    Indices hitSpan(Dimension dim, double value) const;
    Indices hitRect(const Rect& rect, MarqueeMode mode) const;

    // Top-most row under the cursor. Rows added later draw on top.
    std::optional<std::uint32_t> pick(double x, double y, double tolerance) const;

    HitStats getLastStats() const { return lastStats_; }

private:
    const SpatialIndex& index_;
    mutable HitStats lastStats_{0, 0};

    Indices collect(const Rect& query) const;
};

} // namespace plotindex
