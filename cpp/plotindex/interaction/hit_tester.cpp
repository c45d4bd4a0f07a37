#include "plotindex/interaction/hit_tester.h"
#include <algorithm>
#include <limits>

namespace plotindex {

static Rect toleranceBox(double x, double y, double tolerance) {
    const double tol = std::max(0.0, tolerance);
    return Rect{x - tol, y - tol, x + tol, y + tol};
}

HitTester::HitTester(const SpatialIndex& index) : index_(index) {}

Indices HitTester::collect(const Rect& query) const {
    Indices result = index_.indices(query);
    lastStats_ = HitStats{1, result.count()};
    return result;
}

Indices HitTester::hitPoint(double x, double y, double tolerance) const {
    return collect(toleranceBox(x, y, tolerance));
}

Indices HitTester::hitSpan(Dimension dim, double value) const {
    constexpr double inf = std::numeric_limits<double>::infinity();
    if (dim == Dimension::Width) {
        return collect(Rect{value, -inf, value, inf});
    }
    return collect(Rect{-inf, value, inf, value});
}

Indices HitTester::hitRect(const Rect& rect, MarqueeMode mode) const {
    if (mode == MarqueeMode::Crossing) {
        return collect(rect);
    }

    // Window: the candidate set is the same, only fully enclosed boxes survive.
    const Rect marquee = bbox::normalize(rect);
    Indices result(index_.size());
    std::uint32_t candidates = 0;
    index_.search(marquee, [&](std::uint32_t index, const Rect& box) {
        ++candidates;
        if (bbox::contains(marquee, box)) {
            result.setWithoutBoundsCheck(index);
        }
    });
    lastStats_ = HitStats{1, candidates};
    return result;
}

std::optional<std::uint32_t> HitTester::pick(double x, double y, double tolerance) const {
    std::optional<std::uint32_t> best;
    std::uint32_t candidates = 0;
    index_.search(toleranceBox(x, y, tolerance), [&](std::uint32_t index, const Rect&) {
        ++candidates;
        if (!best || index > *best) best = index;
    });
    lastStats_ = HitStats{1, candidates};
    return best;
}

} // namespace plotindex
