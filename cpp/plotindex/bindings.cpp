#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Public index API exposed to the JS renderers.
#include "plotindex/spatial/spatial_index.h"
#include "plotindex/interaction/hit_tester.h"

#include <cstdint>
#include <vector>

#ifdef EMSCRIPTEN
EMSCRIPTEN_BINDINGS(plotindex_module) {
    using namespace plotindex;

    emscripten::register_vector<std::uint32_t>("IndexVector");

    emscripten::value_object<Rect>("Rect")
        .field("x0", &Rect::x0)
        .field("y0", &Rect::y0)
        .field("x1", &Rect::x1)
        .field("y1", &Rect::y1);

    emscripten::enum_<Dimension>("Dimension")
        .value("Width", Dimension::Width)
        .value("Height", Dimension::Height);

    emscripten::enum_<MarqueeMode>("MarqueeMode")
        .value("Window", MarqueeMode::Window)
        .value("Crossing", MarqueeMode::Crossing);

    emscripten::class_<SpatialIndex>("SpatialIndex")
        .constructor<std::uint32_t>()
        .constructor<std::uint32_t, std::uint32_t>()
        .function("add_rect", &SpatialIndex::addRect)
        .function("add_point", &SpatialIndex::addPoint)
        .function("add_empty", &SpatialIndex::addEmpty)
        .function("finish", &SpatialIndex::finish)
        .function("size", &SpatialIndex::size)
        .function("bbox", &SpatialIndex::bbox)
        .function("bounds", &SpatialIndex::bounds)
        .function("log_bounds", &SpatialIndex::logBounds)
        .function("indices", emscripten::optional_override([](const SpatialIndex& self, const Rect& rect) {
            return self.indices(rect).toVector();
        }));

    // A HitTester borrows its SpatialIndex: JS must keep the index alive
    // (no delete()) until the tester itself is deleted.
    emscripten::class_<HitTester>("HitTester")
        .constructor<const SpatialIndex&>()
        .function("hit_point", emscripten::optional_override([](const HitTester& self, double x, double y, double tolerance) {
            return self.hitPoint(x, y, tolerance).toVector();
        }))
        .function("hit_span", emscripten::optional_override([](const HitTester& self, Dimension dim, double value) {
            return self.hitSpan(dim, value).toVector();
        }))
        .function("hit_rect", emscripten::optional_override([](const HitTester& self, const Rect& rect, MarqueeMode mode) {
            return self.hitRect(rect, mode).toVector();
        }))
        .function("pick", emscripten::optional_override([](const HitTester& self, double x, double y, double tolerance) {
            const auto hit = self.pick(x, y, tolerance);
            return hit ? static_cast<double>(*hit) : -1.0;
        }));
}
#endif
