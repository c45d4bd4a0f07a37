#pragma once

#include <limits>

namespace plotindex {

// Axis-aligned box. After normalize(): x0 <= x1 and y0 <= y1 unless a pair
// carries non-finite markers (the empty box keeps +Inf/-Inf on purpose).
struct Rect {
    double x0, y0, x1, y1;
};

inline bool operator==(const Rect& a, const Rect& b) {
    return a.x0 == b.x0 && a.y0 == b.y0 && a.x1 == b.x1 && a.y1 == b.y1;
}

inline bool operator!=(const Rect& a, const Rect& b) { return !(a == b); }

namespace bbox {

inline Rect empty() {
    constexpr double inf = std::numeric_limits<double>::infinity();
    return Rect{inf, inf, -inf, -inf};
}

inline Rect full() {
    constexpr double inf = std::numeric_limits<double>::infinity();
    return Rect{-inf, -inf, inf, inf};
}

// Half planes exclude the axis itself.
Rect positiveX();
Rect positiveY();
Rect negativeX();
Rect negativeY();

Rect xRange(double x0, double x1);
Rect yRange(double y0, double y1);

bool isEmpty(const Rect& r);
bool isFinite(const Rect& r);

// Closed-interval tests; an empty box never intersects or contains anything.
bool intersects(const Rect& a, const Rect& b);
bool contains(const Rect& outer, const Rect& inner);

Rect unite(const Rect& a, const Rect& b);
Rect normalize(const Rect& r);

} // namespace bbox
} // namespace plotindex
