#include "hitindex/hit_test/hit_test_system.h"
#include "hitindex/core/logging.h"
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace hitindex {

namespace {

void sortByPaintOrder(std::vector<ElementHandle>& handles) {
    std::sort(handles.begin(), handles.end(), paintsAbove);
}

} // namespace

void HitTestSystem::requireIndexable(const ElementHandle& handle, const Rect& bounds) {
    if (handle.isNull()) {
        throw std::invalid_argument("HitTestSystem: null element handle");
    }
    validateInterval(bounds.x, bounds.right());
    validateInterval(bounds.y, bounds.bottom());
}

void HitTestSystem::indexInto(IntervalTree<ElementHandle>& xTree, IntervalTree<ElementHandle>& yTree,
                              const ElementHandle& handle, const Rect& bounds) {
    xTree.insert(bounds.x, bounds.right(), handle);
    try {
        yTree.insert(bounds.y, bounds.bottom(), handle);
    } catch (...) {
        xTree.remove(bounds.x, bounds.right(), handle);
        throw;
    }
}

// Mutations

void HitTestSystem::insertWidget(const ElementHandle& handle) {
    const Rect bounds = handle.bounds();
    requireIndexable(handle, bounds);
    indexInto(xTree_, yTree_, handle, bounds);
    ++count_;
}

void HitTestSystem::removeWidget(const ElementHandle& handle) {
    if (handle.isNull()) return;

    const Rect bounds = handle.bounds();
    const bool removedX = xTree_.remove(bounds.x, bounds.right(), handle);
    const bool removedY = yTree_.remove(bounds.y, bounds.bottom(), handle);

    if (!removedX && !removedY) {
        HITINDEX_LOG_WARN("removeWidget: element %u not indexed at its current bounds", handle.id());
        return;
    }
    if (removedX != removedY) {
        HITINDEX_LOG_WARN("removeWidget: element %u found on one axis only; index is stale", handle.id());
    }
    if (count_ > 0) --count_;
}

void HitTestSystem::updateWidget(const ElementHandle& handle, const Rect& oldBounds) {
    const Rect bounds = handle.bounds();
    requireIndexable(handle, bounds);

    const bool removedX = xTree_.remove(oldBounds.x, oldBounds.right(), handle);
    const bool removedY = yTree_.remove(oldBounds.y, oldBounds.bottom(), handle);
    if (!removedX || !removedY) {
        HITINDEX_LOG_WARN("updateWidget: element %u not found at the given old bounds", handle.id());
    }

    indexInto(xTree_, yTree_, handle, bounds);
}

void HitTestSystem::rebuildFromWidgets(const std::vector<ElementHandle>& handles) {
    IntervalTree<ElementHandle> xTree;
    IntervalTree<ElementHandle> yTree;
    for (const ElementHandle& handle : handles) {
        const Rect bounds = handle.bounds();
        requireIndexable(handle, bounds);
        indexInto(xTree, yTree, handle, bounds);
    }

    xTree_ = std::move(xTree);
    yTree_ = std::move(yTree);
    count_ = handles.size();
    HITINDEX_LOG_DEBUG("rebuildFromWidgets: %zu elements", count_);
}

void HitTestSystem::clear() noexcept {
    xTree_.clear();
    yTree_.clear();
    count_ = 0;
    lastStats_ = {0, 0, 0};
}

// Queries

std::vector<ElementHandle> HitTestSystem::findWidgetsAt(float x, float y) const {
    lastStats_ = {0, 0, 0};
    std::vector<ElementHandle> result;
    if (xTree_.isEmpty() || yTree_.isEmpty()) return result;

    std::unordered_set<ElementHandle> yCandidates;
    yTree_.visitContaining(y, [&](const Interval<ElementHandle>& interval) {
        yCandidates.insert(interval.payload);
        ++lastStats_.yCandidates;
    });
    if (yCandidates.empty()) return result;

    xTree_.visitContaining(x, [&](const Interval<ElementHandle>& interval) {
        ++lastStats_.xCandidates;
        // erase() also drops duplicates left behind by stale entries.
        if (yCandidates.erase(interval.payload) == 0) return;
        if (interval.payload.bounds().contains(x, y)) {
            result.push_back(interval.payload);
        }
    });

    sortByPaintOrder(result);
    lastStats_.matches = static_cast<std::uint32_t>(result.size());
    return result;
}

std::vector<ElementHandle> HitTestSystem::findWidgetsInRect(const Rect& rect) const {
    lastStats_ = {0, 0, 0};
    std::vector<ElementHandle> result;
    if (xTree_.isEmpty() || yTree_.isEmpty()) return result;

    std::unordered_set<ElementHandle> yCandidates;
    yTree_.visitOverlapping(rect.y, rect.bottom(), [&](const Interval<ElementHandle>& interval) {
        yCandidates.insert(interval.payload);
        ++lastStats_.yCandidates;
    });
    if (yCandidates.empty()) return result;

    xTree_.visitOverlapping(rect.x, rect.right(), [&](const Interval<ElementHandle>& interval) {
        ++lastStats_.xCandidates;
        if (yCandidates.erase(interval.payload) == 0) return;
        if (interval.payload.bounds().overlaps(rect)) {
            result.push_back(interval.payload);
        }
    });

    sortByPaintOrder(result);
    lastStats_.matches = static_cast<std::uint32_t>(result.size());
    return result;
}

std::optional<ElementHandle> HitTestSystem::findTopWidgetAt(float x, float y) const {
    std::vector<ElementHandle> hits = findWidgetsAt(x, y);
    if (hits.empty()) return std::nullopt;
    return hits.front();
}

// Diagnostics

bool HitTestSystem::verifyIntegrity() const noexcept {
    if (xTree_.size() != yTree_.size()) return false;
    if (count_ != xTree_.size()) return false;
    return xTree_.validate() && yTree_.validate();
}

std::string HitTestSystem::getStats() const {
    std::ostringstream out;
    out << "HitTestSystem Stats:\n";
    out << "  Widget count: " << count_ << "\n";
    out << "  X-tree size: " << xTree_.size() << " (height " << xTree_.height() << ")\n";
    out << "  Y-tree size: " << yTree_.size() << " (height " << yTree_.height() << ")\n";
    out << "  X-tree balanced: " << (xTree_.isBalanced() ? "true" : "false") << "\n";
    out << "  Y-tree balanced: " << (yTree_.isBalanced() ? "true" : "false") << "\n";
    out << "  Integrity: " << (verifyIntegrity() ? "ok" : "FAILED") << "\n";
    return out.str();
}

} // namespace hitindex
