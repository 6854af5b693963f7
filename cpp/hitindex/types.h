#ifndef HITINDEX_TYPES_H
#define HITINDEX_TYPES_H

#include <cstdint>
#include <cstddef>
#include <functional>

// Geometry and element handle types shared by the hit-test index.

namespace hitindex {

// Axis-aligned rectangle. Edges are inclusive: a point on the right or bottom
// edge is inside.
struct Rect {
    float x;
    float y;
    float width;
    float height;

    float right() const noexcept { return x + width; }
    float bottom() const noexcept { return y + height; }

    bool contains(float px, float py) const noexcept {
        return px >= x && px <= right() &&
               py >= y && py <= bottom();
    }

    bool overlaps(const Rect& other) const noexcept {
        return x <= other.right() && right() >= other.x &&
               y <= other.bottom() && bottom() >= other.y;
    }

    bool operator==(const Rect& other) const noexcept {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const Rect& other) const noexcept { return !(*this == other); }
};

// Implemented by whatever owns on-screen elements (widgets, shapes...).
// The index only reads from it.
class HitTestElement {
public:
    virtual ~HitTestElement() = default;

    virtual std::uint32_t elementId() const = 0;
    virtual Rect bounds() const = 0;
    // Higher paints on top.
    virtual std::int32_t zIndex() const = 0;
};

// Non-owning reference to a HitTestElement. Two handles are equal when they
// refer to the same element id.
class ElementHandle {
public:
    ElementHandle() = default;
    explicit ElementHandle(const HitTestElement* element) noexcept : element_(element) {}
    ElementHandle(const HitTestElement& element) noexcept : element_(&element) {}

    const HitTestElement* element() const noexcept { return element_; }
    bool isNull() const noexcept { return element_ == nullptr; }
    explicit operator bool() const noexcept { return element_ != nullptr; }

    std::uint32_t id() const { return element_ ? element_->elementId() : 0; }
    Rect bounds() const { return element_ ? element_->bounds() : Rect{0.0f, 0.0f, 0.0f, 0.0f}; }
    std::int32_t zIndex() const { return element_ ? element_->zIndex() : 0; }

    friend bool operator==(const ElementHandle& a, const ElementHandle& b) {
        if (a.element_ == b.element_) return true;
        if (!a.element_ || !b.element_) return false;
        return a.id() == b.id();
    }
    friend bool operator!=(const ElementHandle& a, const ElementHandle& b) { return !(a == b); }

private:
    const HitTestElement* element_ = nullptr;
};

// Paint order used for query results: higher zIndex first, then higher id
// first so that equal layers still resolve deterministically.
inline bool paintsAbove(const ElementHandle& a, const ElementHandle& b) {
    const std::int32_t za = a.zIndex();
    const std::int32_t zb = b.zIndex();
    if (za != zb) {
        return za > zb;
    }
    return a.id() > b.id();
}

} // namespace hitindex

namespace std {
template <>
struct hash<hitindex::ElementHandle> {
    std::size_t operator()(const hitindex::ElementHandle& handle) const {
        return std::hash<std::uint32_t>{}(handle.id());
    }
};
} // namespace std

#endif // HITINDEX_TYPES_H
