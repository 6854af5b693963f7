#pragma once

#include "hitindex/types.h"
#include "hitindex/interval/interval_tree.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hitindex {

// Dual-axis hit-test index. Each element is stored twice: its horizontal
// extent [x, x + width] in xTree_ and its vertical extent [y, y + height] in
// yTree_. A 2D query intersects the two per-axis candidate sets, re-checks
// the element's current bounds and sorts by paint order (see paintsAbove).
//
// Elements are owned by the caller. Whenever an element's bounds change the
// caller must report the previous bounds through updateWidget(); the index
// cannot find a stale entry by itself.
//
// Single-threaded; no internal locking.
class HitTestSystem {
public:
    struct QueryStats {
        std::uint32_t xCandidates;
        std::uint32_t yCandidates;
        std::uint32_t matches;
    };

    HitTestSystem() = default;
    HitTestSystem(const HitTestSystem&) = delete;
    HitTestSystem& operator=(const HitTestSystem&) = delete;
    HitTestSystem(HitTestSystem&&) noexcept = default;
    HitTestSystem& operator=(HitTestSystem&&) noexcept = default;

    // Throws InvalidIntervalError for negative or NaN extents and
    // std::invalid_argument for a null handle. Nothing is indexed on failure.
    void insertWidget(const ElementHandle& handle);

    // Uses the element's current bounds. Unknown elements are ignored.
    void removeWidget(const ElementHandle& handle);

    // Moves the element from oldBounds to its current bounds.
    void updateWidget(const ElementHandle& handle, const Rect& oldBounds);

    // Replaces the whole index. On failure the previous contents are kept.
    void rebuildFromWidgets(const std::vector<ElementHandle>& handles);

    // Front-to-back list of elements whose bounds contain (x, y).
    std::vector<ElementHandle> findWidgetsAt(float x, float y) const;

    // Front-to-back list of elements whose bounds overlap rect.
    std::vector<ElementHandle> findWidgetsInRect(const Rect& rect) const;

    std::optional<ElementHandle> findTopWidgetAt(float x, float y) const;

    // What is under the cursor.
    std::optional<ElementHandle> getWidgetAt(float x, float y) const { return findTopWidgetAt(x, y); }

    std::size_t size() const noexcept { return count_; }
    bool isEmpty() const noexcept { return count_ == 0; }
    void clear() noexcept;

    // Debug check: tree sizes agree with the element count and both trees
    // are balanced with valid aggregates. Never throws.
    bool verifyIntegrity() const noexcept;
    std::string getStats() const;

    QueryStats getLastStats() const { return lastStats_; }

    const IntervalTree<ElementHandle>& xTree() const noexcept { return xTree_; }
    const IntervalTree<ElementHandle>& yTree() const noexcept { return yTree_; }

private:
    static void requireIndexable(const ElementHandle& handle, const Rect& bounds);
    static void indexInto(IntervalTree<ElementHandle>& xTree, IntervalTree<ElementHandle>& yTree,
                          const ElementHandle& handle, const Rect& bounds);

    IntervalTree<ElementHandle> xTree_;
    IntervalTree<ElementHandle> yTree_;
    std::size_t count_ = 0;
    mutable QueryStats lastStats_{0, 0, 0};
};

} // namespace hitindex
