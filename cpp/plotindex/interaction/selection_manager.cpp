#include "plotindex/interaction/selection_manager.h"
#include "plotindex/core/logging.h"

#include <utility>

namespace plotindex {

SelectionManager::Mode SelectionManager::modeFromModifiers(bool shift, bool ctrl, Mode defaultMode) {
    if (shift && ctrl) return Mode::Subtract;
    if (shift) return Mode::Append;
    if (ctrl) return Mode::Intersect;
    return defaultMode;
}

SelectionManager::SelectionManager(std::uint32_t size) : selected_(size) {}

Indices SelectionManager::clipToSource(const Indices& hits) const {
    Indices out(selected_.size());
    for (const std::uint32_t i : hits) {
        if (i >= out.size()) break;
        out.setWithoutBoundsCheck(i);
    }
    return out;
}

bool SelectionManager::update(const Indices& hits, Mode mode) {
    const Indices clipped = clipToSource(hits);
    Indices next = selected_;
    switch (mode) {
        case Mode::Replace:
            next = clipped;
            break;
        case Mode::Append:
            next.add(clipped);
            break;
        case Mode::Intersect:
            next.intersect(clipped);
            break;
        case Mode::Subtract:
            next.subtract(clipped);
            break;
        case Mode::Xor:
            next.symmetricDifference(clipped);
            break;
    }

    if (next == selected_) return false;
    selected_ = std::move(next);
    generation_++;
    return true;
}

bool SelectionManager::selectByPick(std::optional<std::uint32_t> pick, Mode mode) {
    if (!pick) {
        if (mode == Mode::Replace && !selected_.empty()) {
            selected_.clear();
            generation_++;
            return true;
        }
        return false;
    }

    if (*pick >= selected_.size()) {
        PLOTINDEX_LOG_WARN("selectByPick: row %u outside source of %u rows", *pick, selected_.size());
        return false;
    }

    Indices hit(selected_.size());
    hit.set(*pick);
    return update(hit, mode);
}

void SelectionManager::invert() {
    if (selected_.size() == 0) return;
    selected_.invert();
    generation_++;
}

void SelectionManager::clear() {
    if (selected_.empty()) return;
    selected_.clear();
    generation_++;
}

bool SelectionManager::isSelected(std::uint32_t index) const {
    return index < selected_.size() && selected_.get(index);
}

} // namespace plotindex
