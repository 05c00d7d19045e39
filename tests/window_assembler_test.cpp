#include "audio/window_assembler.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace loopscribe;

TEST(WindowAssemblerTest, SizesComeFromDurations) {
    WindowAssembler wa = WindowAssembler::fromDurations(2.0, 0.5, 16000);
    EXPECT_EQ(wa.chunkSamples(), 32000u);
    EXPECT_EQ(wa.overlapSamples(), 8000u);

    // Truncated, not rounded.
    WindowAssembler odd = WindowAssembler::fromDurations(0.1, 0.05, 44101);
    EXPECT_EQ(odd.chunkSamples(), 4410u);
    EXPECT_EQ(odd.overlapSamples(), 2205u);
}

TEST(WindowAssemblerTest, RejectsInvalidGeometry) {
    EXPECT_THROW(WindowAssembler(100, 100), std::invalid_argument);
    EXPECT_THROW(WindowAssembler(100, 150), std::invalid_argument);
    EXPECT_THROW(WindowAssembler(0, 0), std::invalid_argument);
    EXPECT_THROW(WindowAssembler::fromDurations(1.0, 1.0, 16000), std::invalid_argument);
    EXPECT_THROW(WindowAssembler::fromDurations(1.0, 0.5, 0), std::invalid_argument);
    EXPECT_NO_THROW(WindowAssembler(100, 0));
}

TEST(WindowAssemblerTest, SingleWindowLeavesOverlapPlusRemainder) {
    WindowAssembler wa = WindowAssembler::fromDurations(2.0, 0.5, 16000);
    const std::vector<float> pushed = test::ramp(40000);

    auto window = wa.push(pushed);
    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(window->size(), 32000u);
    EXPECT_EQ(std::vector<float>(pushed.begin(), pushed.begin() + 32000), *window);
    EXPECT_EQ(wa.bufferedSamples(), 40000u - 32000u + 8000u);
    EXPECT_FALSE(wa.next().has_value());

    auto rest = wa.flush();
    ASSERT_TRUE(rest.has_value());
    ASSERT_EQ(rest->size(), 16000u);
    EXPECT_EQ(std::vector<float>(pushed.begin() + 24000, pushed.end()), *rest);
    EXPECT_FALSE(wa.flush().has_value());
    EXPECT_EQ(wa.bufferedSamples(), 0u);
}

TEST(WindowAssemblerTest, NothingEmittedBeforeAFullChunk) {
    WindowAssembler wa(100, 20);
    EXPECT_FALSE(wa.push(test::ramp(60)).has_value());
    EXPECT_FALSE(wa.push(test::ramp(39, 60)).has_value());
    EXPECT_EQ(wa.bufferedSamples(), 99u);

    auto window = wa.push(std::vector<float>{99.0f});
    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(*window, test::ramp(100));
    EXPECT_EQ(wa.bufferedSamples(), 20u);
}

TEST(WindowAssemblerTest, ConsecutiveWindowsShareTheOverlap) {
    WindowAssembler wa(1000, 250);
    const std::vector<float> signal = test::ramp(10000);

    std::vector<std::vector<float>> windows;
    for (std::size_t pos = 0; pos < signal.size(); pos += 333) {
        const std::size_t end = std::min(pos + 333, signal.size());
        auto w = wa.push(std::vector<float>(signal.begin() + pos, signal.begin() + end));
        while (w) {
            windows.push_back(*w);
            w = wa.next();
        }
    }

    ASSERT_GE(windows.size(), 2u);
    for (std::size_t i = 0; i < windows.size(); ++i) {
        ASSERT_EQ(windows[i].size(), 1000u);
        // Window i starts at i * (chunk - overlap) of the original signal.
        EXPECT_FLOAT_EQ(windows[i].front(), static_cast<float>(i * 750));
        if (i + 1 < windows.size()) {
            EXPECT_TRUE(std::equal(windows[i].end() - 250, windows[i].end(), windows[i + 1].begin()));
        }
    }
}

TEST(WindowAssemblerTest, LargePushDrainsThroughNext) {
    WindowAssembler wa(100, 0);
    auto first = wa.push(test::ramp(350));
    ASSERT_TRUE(first.has_value());
    int emitted = 1;
    while (wa.next()) ++emitted;
    EXPECT_EQ(emitted, 3);
    EXPECT_EQ(wa.bufferedSamples(), 50u);
}

TEST(WindowAssemblerTest, FlushOnEmptyReturnsNothing) {
    WindowAssembler wa(100, 10);
    EXPECT_FALSE(wa.flush().has_value());
    wa.push(test::ramp(5));
    auto rest = wa.flush();
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(*rest, test::ramp(5));
}
