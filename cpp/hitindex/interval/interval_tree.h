#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace hitindex {

class InvalidIntervalError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Throws InvalidIntervalError unless start <= end. NaN bounds fail too.
inline void validateInterval(float start, float end) {
    if (!(start <= end)) {
        throw InvalidIntervalError("Invalid interval: start must be <= end");
    }
}

// Closed interval [start, end] carrying a payload.
template <typename T>
struct Interval {
    float start;
    float end;
    T payload;

    bool contains(float point) const noexcept {
        return start <= point && point <= end;
    }

    bool overlaps(float otherStart, float otherEnd) const noexcept {
        return start <= otherEnd && otherStart <= end;
    }
};

template <typename T>
Interval<T> makeInterval(float start, float end, T payload) {
    validateInterval(start, end);
    return Interval<T>{start, end, std::move(payload)};
}

// AVL-balanced interval tree keyed on interval start. Every node caches the
// largest end in its subtree (maxEnd) so containment and overlap queries can
// skip whole subtrees: O(log n + k) per query, O(log n) per insert/remove.
//
// Duplicate starts are allowed. Equal starts descend right on insert, but
// rotations can later move them to either side of each other, so exact-match
// removal checks both subtrees on a start tie.
//
// Payload equality (operator==) is only needed by remove(start, end, payload).
template <typename T>
class IntervalTree {
public:
    using IntervalType = Interval<T>;

    IntervalTree() = default;
    IntervalTree(const IntervalTree&) = delete;
    IntervalTree& operator=(const IntervalTree&) = delete;
    IntervalTree(IntervalTree&& other) noexcept
        : root_(std::move(other.root_)), size_(other.size_) {
        other.size_ = 0;
    }
    IntervalTree& operator=(IntervalTree&& other) noexcept {
        if (this != &other) {
            root_ = std::move(other.root_);
            size_ = other.size_;
            other.size_ = 0;
        }
        return *this;
    }
    ~IntervalTree() = default;

    // Throws InvalidIntervalError if start > end; the tree is left untouched.
    void insert(float start, float end, T payload);

    // Removes one entry whose bounds match exactly. Returns false (and does
    // nothing) when there is no such entry.
    bool remove(float start, float end);

    // Same as above, additionally requiring entry.payload == payload.
    bool remove(float start, float end, const T& payload);

    // Payloads of all intervals containing point, in ascending start order.
    std::vector<T> query(float point) const;

    // Payloads of all intervals [s, e] with s <= end && start <= e.
    // An inverted range matches nothing.
    std::vector<T> findOverlaps(float start, float end) const;

    template <typename Visitor>
    void visitContaining(float point, Visitor&& visitor) const {
        if (std::isnan(point)) return;
        visitContainingNode(root_.get(), point, visitor);
    }

    template <typename Visitor>
    void visitOverlapping(float start, float end, Visitor&& visitor) const {
        if (!(start <= end)) return;
        visitOverlappingNode(root_.get(), start, end, visitor);
    }

    // In-order snapshot of every stored interval.
    std::vector<IntervalType> intervals() const;

    void clear() noexcept {
        root_.reset();
        size_ = 0;
    }

    std::size_t size() const noexcept { return size_; }
    bool isEmpty() const noexcept { return root_ == nullptr; }
    int height() const noexcept { return heightOf(root_.get()); }

    // Recomputes heights and checks |balance| <= 1 at every node.
    bool isBalanced() const;

    // Full structural check: cached heights and maxEnd, start ordering,
    // balance and node count.
    bool validate() const;

private:
    struct Node {
        explicit Node(IntervalType&& value)
            : interval(std::move(value)), maxEnd(interval.end), height(1) {}

        IntervalType interval;
        float maxEnd;
        int height;
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;
    };
    using NodePtr = std::unique_ptr<Node>;

    static int heightOf(const Node* node) noexcept { return node ? node->height : 0; }

    static int balanceFactor(const Node& node) noexcept {
        return heightOf(node.left.get()) - heightOf(node.right.get());
    }

    static void refresh(Node& node) noexcept {
        node.height = 1 + std::max(heightOf(node.left.get()), heightOf(node.right.get()));
        node.maxEnd = node.interval.end;
        if (node.left) node.maxEnd = std::max(node.maxEnd, node.left->maxEnd);
        if (node.right) node.maxEnd = std::max(node.maxEnd, node.right->maxEnd);
    }

    static void rotateRight(NodePtr& slot) noexcept;
    static void rotateLeft(NodePtr& slot) noexcept;
    static void rebalance(NodePtr& slot) noexcept;

    static void insertNode(NodePtr& slot, IntervalType&& interval);

    template <typename Match>
    static bool removeNode(NodePtr& slot, float start, float end, const Match& match);
    static void unlinkNode(NodePtr& slot) noexcept;
    static NodePtr detachMin(NodePtr& slot) noexcept;

    template <typename Visitor>
    static void visitContainingNode(const Node* node, float point, Visitor& visitor) {
        if (!node || node->maxEnd < point) return;
        visitContainingNode(node->left.get(), point, visitor);
        if (node->interval.contains(point)) {
            visitor(node->interval);
        }
        // Everything to the right starts at or after node->interval.start.
        if (point < node->interval.start) return;
        visitContainingNode(node->right.get(), point, visitor);
    }

    template <typename Visitor>
    static void visitOverlappingNode(const Node* node, float start, float end, Visitor& visitor) {
        if (!node || node->maxEnd < start) return;
        visitOverlappingNode(node->left.get(), start, end, visitor);
        if (node->interval.overlaps(start, end)) {
            visitor(node->interval);
        }
        if (end < node->interval.start) return;
        visitOverlappingNode(node->right.get(), start, end, visitor);
    }

    static void collect(const Node* node, std::vector<IntervalType>& out);
    static int balancedHeight(const Node* node);
    static int checkNode(const Node* node, const Node*& previous, std::size_t& count);

    NodePtr root_;
    std::size_t size_ = 0;
};

// ---------------------------------------------------------------------------
// Rotations and rebalancing

template <typename T>
void IntervalTree<T>::rotateRight(NodePtr& slot) noexcept {
    NodePtr pivot = std::move(slot->left);
    slot->left = std::move(pivot->right);
    refresh(*slot);
    pivot->right = std::move(slot);
    refresh(*pivot);
    slot = std::move(pivot);
}

template <typename T>
void IntervalTree<T>::rotateLeft(NodePtr& slot) noexcept {
    NodePtr pivot = std::move(slot->right);
    slot->right = std::move(pivot->left);
    refresh(*slot);
    pivot->left = std::move(slot);
    refresh(*pivot);
    slot = std::move(pivot);
}

// The rotation case is picked from the heavy child's balance factor, never by
// comparing starts, so duplicate starts cannot select the wrong case.
template <typename T>
void IntervalTree<T>::rebalance(NodePtr& slot) noexcept {
    if (!slot) return;
    refresh(*slot);

    const int balance = balanceFactor(*slot);
    if (balance > 1) {
        if (balanceFactor(*slot->left) < 0) {
            rotateLeft(slot->left);     // left-right
        }
        rotateRight(slot);              // left-left
    } else if (balance < -1) {
        if (balanceFactor(*slot->right) > 0) {
            rotateRight(slot->right);   // right-left
        }
        rotateLeft(slot);               // right-right
    }
}

// ---------------------------------------------------------------------------
// Insert

template <typename T>
void IntervalTree<T>::insertNode(NodePtr& slot, IntervalType&& interval) {
    if (!slot) {
        slot = std::make_unique<Node>(std::move(interval));
        return;
    }
    if (interval.start < slot->interval.start) {
        insertNode(slot->left, std::move(interval));
    } else {
        insertNode(slot->right, std::move(interval));
    }
    rebalance(slot);
}

template <typename T>
void IntervalTree<T>::insert(float start, float end, T payload) {
    insertNode(root_, makeInterval(start, end, std::move(payload)));
    ++size_;
}

// ---------------------------------------------------------------------------
// Remove

template <typename T>
typename IntervalTree<T>::NodePtr IntervalTree<T>::detachMin(NodePtr& slot) noexcept {
    if (!slot->left) {
        NodePtr min = std::move(slot);
        slot = std::move(min->right);
        return min;
    }
    NodePtr min = detachMin(slot->left);
    rebalance(slot);
    return min;
}

template <typename T>
void IntervalTree<T>::unlinkNode(NodePtr& slot) noexcept {
    NodePtr doomed = std::move(slot);
    if (!doomed->left) {
        slot = std::move(doomed->right);
        return;
    }
    if (!doomed->right) {
        slot = std::move(doomed->left);
        return;
    }
    // Two children: the in-order successor takes the removed node's place.
    NodePtr successor = detachMin(doomed->right);
    successor->left = std::move(doomed->left);
    successor->right = std::move(doomed->right);
    slot = std::move(successor);
    rebalance(slot);
}

template <typename T>
template <typename Match>
bool IntervalTree<T>::removeNode(NodePtr& slot, float start, float end, const Match& match) {
    if (!slot) return false;

    Node& node = *slot;
    bool removed = false;
    if (start < node.interval.start) {
        removed = removeNode(node.left, start, end, match);
    } else if (node.interval.start < start) {
        removed = removeNode(node.right, start, end, match);
    } else if (node.interval.end == end && match(node.interval.payload)) {
        unlinkNode(slot);
        return true;
    } else {
        // Start tie without a match: duplicates may live on either side.
        if (node.left && node.left->maxEnd >= end) {
            removed = removeNode(node.left, start, end, match);
        }
        if (!removed) {
            removed = removeNode(node.right, start, end, match);
        }
    }

    if (removed) {
        rebalance(slot);
    }
    return removed;
}

template <typename T>
bool IntervalTree<T>::remove(float start, float end) {
    if (!(start <= end)) return false;
    const bool removed = removeNode(root_, start, end, [](const T&) { return true; });
    if (removed) --size_;
    return removed;
}

template <typename T>
bool IntervalTree<T>::remove(float start, float end, const T& payload) {
    if (!(start <= end)) return false;
    const bool removed = removeNode(root_, start, end,
        [&payload](const T& candidate) { return candidate == payload; });
    if (removed) --size_;
    return removed;
}

// ---------------------------------------------------------------------------
// Queries

template <typename T>
std::vector<T> IntervalTree<T>::query(float point) const {
    std::vector<T> result;
    visitContaining(point, [&result](const IntervalType& interval) {
        result.push_back(interval.payload);
    });
    return result;
}

template <typename T>
std::vector<T> IntervalTree<T>::findOverlaps(float start, float end) const {
    std::vector<T> result;
    visitOverlapping(start, end, [&result](const IntervalType& interval) {
        result.push_back(interval.payload);
    });
    return result;
}

template <typename T>
void IntervalTree<T>::collect(const Node* node, std::vector<IntervalType>& out) {
    if (!node) return;
    collect(node->left.get(), out);
    out.push_back(node->interval);
    collect(node->right.get(), out);
}

template <typename T>
std::vector<typename IntervalTree<T>::IntervalType> IntervalTree<T>::intervals() const {
    std::vector<IntervalType> out;
    out.reserve(size_);
    collect(root_.get(), out);
    return out;
}

// ---------------------------------------------------------------------------
// Diagnostics

// Returns the real subtree height, or -1 if any node is out of balance.
template <typename T>
int IntervalTree<T>::balancedHeight(const Node* node) {
    if (!node) return 0;
    const int lh = balancedHeight(node->left.get());
    if (lh < 0) return -1;
    const int rh = balancedHeight(node->right.get());
    if (rh < 0) return -1;
    if (std::abs(lh - rh) > 1) return -1;
    return 1 + std::max(lh, rh);
}

template <typename T>
bool IntervalTree<T>::isBalanced() const {
    return balancedHeight(root_.get()) >= 0;
}

// In-order walk. Returns the subtree height, or -1 on the first broken
// invariant.
template <typename T>
int IntervalTree<T>::checkNode(const Node* node, const Node*& previous, std::size_t& count) {
    if (!node) return 0;

    const int lh = checkNode(node->left.get(), previous, count);
    if (lh < 0) return -1;

    const IntervalType& interval = node->interval;
    if (!(interval.start <= interval.end)) return -1;
    if (previous && interval.start < previous->interval.start) return -1;
    previous = node;
    ++count;

    const int rh = checkNode(node->right.get(), previous, count);
    if (rh < 0) return -1;

    if (std::abs(lh - rh) > 1) return -1;
    if (node->height != 1 + std::max(lh, rh)) return -1;

    float maxEnd = interval.end;
    if (node->left) maxEnd = std::max(maxEnd, node->left->maxEnd);
    if (node->right) maxEnd = std::max(maxEnd, node->right->maxEnd);
    if (node->maxEnd != maxEnd) return -1;

    return node->height;
}

template <typename T>
bool IntervalTree<T>::validate() const {
    const Node* previous = nullptr;
    std::size_t count = 0;
    if (checkNode(root_.get(), previous, count) < 0) return false;
    return count == size_;
}

} // namespace hitindex
