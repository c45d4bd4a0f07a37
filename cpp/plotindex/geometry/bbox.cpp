#include "plotindex/geometry/bbox.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace plotindex {
namespace bbox {

namespace {
constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kTiny = std::numeric_limits<double>::denorm_min();
} // namespace

Rect positiveX() { return Rect{kTiny, -kInf, kInf, kInf}; }
Rect positiveY() { return Rect{-kInf, kTiny, kInf, kInf}; }
Rect negativeX() { return Rect{-kInf, -kInf, -kTiny, kInf}; }
Rect negativeY() { return Rect{-kInf, -kInf, kInf, -kTiny}; }

Rect xRange(double x0, double x1) { return Rect{x0, -kInf, x1, kInf}; }
Rect yRange(double y0, double y1) { return Rect{-kInf, y0, kInf, y1}; }

bool isEmpty(const Rect& r) {
    // Written as a negation so NaN bounds count as empty.
    return !(r.x0 <= r.x1 && r.y0 <= r.y1);
}

bool isFinite(const Rect& r) {
    return std::isfinite(r.x0) && std::isfinite(r.y0) && std::isfinite(r.x1) && std::isfinite(r.y1);
}

bool intersects(const Rect& a, const Rect& b) {
    if (isEmpty(a) || isEmpty(b)) return false;
    return !(a.x1 < b.x0 || a.y1 < b.y0 || a.x0 > b.x1 || a.y0 > b.y1);
}

bool contains(const Rect& outer, const Rect& inner) {
    if (isEmpty(outer) || isEmpty(inner)) return false;
    return outer.x0 <= inner.x0 && outer.y0 <= inner.y0 && outer.x1 >= inner.x1 && outer.y1 >= inner.y1;
}

Rect unite(const Rect& a, const Rect& b) {
    if (isEmpty(a)) return isEmpty(b) ? empty() : b;
    if (isEmpty(b)) return a;
    return Rect{
        std::min(a.x0, b.x0),
        std::min(a.y0, b.y0),
        std::max(a.x1, b.x1),
        std::max(a.y1, b.y1),
    };
}

Rect normalize(const Rect& r) {
    Rect out = r;
    if (out.x0 > out.x1 && std::isfinite(out.x0) && std::isfinite(out.x1)) {
        std::swap(out.x0, out.x1);
    }
    if (out.y0 > out.y1 && std::isfinite(out.y0) && std::isfinite(out.y1)) {
        std::swap(out.y0, out.y1);
    }
    return out;
}

} // namespace bbox
} // namespace plotindex
