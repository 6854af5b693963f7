#include "tests/hit_test_common.h"
#include <chrono>
#include <iostream>

using namespace hitindex_test;

namespace {
ElementList makeGrid(std::uint32_t count) {
    ElementList elements;
    elements.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        const float x = static_cast<float>(i % 100) * 4.0f;
        const float y = static_cast<float>(i / 100) * 4.0f;
        elements.push_back(std::make_unique<TestElement>(i + 1, Rect{x, y, 2.0f, 2.0f}, static_cast<std::int32_t>(i % 7)));
    }
    return elements;
}
} // namespace

TEST(PerfBaselineTest, RebuildBaseline) {
    constexpr std::uint32_t kElementCount = 10000;
    constexpr int kIterations = 20;
    const ElementList elements = makeGrid(kElementCount);
    const std::vector<ElementHandle> handles = handlesOf(elements);

    HitTestSystem system;
    const auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < kIterations; ++i) {
        system.rebuildFromWidgets(handles);
    }
    const auto end = std::chrono::steady_clock::now();

    EXPECT_EQ(system.size(), kElementCount);
    EXPECT_TRUE(system.verifyIntegrity());

    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "[PerfBaseline] rebuildFromWidgets " << kIterations << "x" << kElementCount
              << ": " << elapsedMs << " ms\n";
}

TEST(PerfBaselineTest, PointQueryBaseline) {
    constexpr std::uint32_t kElementCount = 10000;
    constexpr int kQueryIterations = 20000;
    const ElementList elements = makeGrid(kElementCount);

    HitTestSystem system;
    system.rebuildFromWidgets(handlesOf(elements));

    std::uint32_t hits = 0;
    const auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < kQueryIterations; ++i) {
        const float x = static_cast<float>(i % 100) * 4.0f + 1.0f;
        const float y = static_cast<float>((i / 100) % 100) * 4.0f + 1.0f;
        if (system.getWidgetAt(x, y)) ++hits;
    }
    const auto end = std::chrono::steady_clock::now();

    EXPECT_EQ(hits, static_cast<std::uint32_t>(kQueryIterations));

    const auto elapsedUs = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    std::cout << "[PerfBaseline] getWidgetAt " << kQueryIterations << "x: " << elapsedUs << " us\n";
}

TEST(PerfBaselineTest, IncrementalUpdateBaseline) {
    constexpr std::uint32_t kElementCount = 10000;
    ElementList elements = makeGrid(kElementCount);

    HitTestSystem system;
    system.rebuildFromWidgets(handlesOf(elements));

    const auto start = std::chrono::steady_clock::now();
    for (auto& e : elements) {
        const Rect oldBounds = e->bounds();
        e->setBounds(Rect{oldBounds.x + 1.0f, oldBounds.y, oldBounds.width, oldBounds.height});
        system.updateWidget(ElementHandle(*e), oldBounds);
    }
    const auto end = std::chrono::steady_clock::now();

    EXPECT_TRUE(system.verifyIntegrity());
    EXPECT_EQ(system.findWidgetsAt(2.5f, 1.0f).size(), 1u);

    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "[PerfBaseline] updateWidget " << kElementCount << "x: " << elapsedMs << " ms\n";
}
