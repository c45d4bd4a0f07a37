#pragma once

#include <cstdint>
#include <optional>
#include "plotindex/spatial/indices.h"

namespace plotindex {

// Selected rows of one data source, updated from hit-test results.
class SelectionManager {
public:
    enum class Mode : std::uint32_t { Replace = 0, Append = 1, Intersect = 2, Subtract = 3, Xor = 4 };

    // Keyboard modifiers override the tool's configured mode.
    static Mode modeFromModifiers(bool shift, bool ctrl, Mode defaultMode);

    explicit SelectionManager(std::uint32_t size);

    // Hits outside [0, size) are ignored; the selection never grows past its source.
    bool update(const Indices& hits, Mode mode);
    // A pick at or past size() is ignored and reports no change.
    bool selectByPick(std::optional<std::uint32_t> pick, Mode mode);
    void invert();
    void clear();

    const Indices& selected() const { return selected_; }
    bool isSelected(std::uint32_t index) const;
    bool isEmpty() const { return selected_.empty(); }
    std::uint32_t generation() const { return generation_; }

private:
    Indices clipToSource(const Indices& hits) const;

    Indices selected_;
    std::uint32_t generation_ = 0;
};

} // namespace plotindex
