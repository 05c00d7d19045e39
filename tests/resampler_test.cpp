#include "audio/resampler.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdlib>
#include <vector>

using namespace loopscribe;

TEST(ResamplerTest, SameRateIsIdentity) {
    const std::vector<float> in = test::sine(480, 48000);
    for (int rate : {8000, 16000, 44100, 48000}) {
        bool degraded = true;
        EXPECT_EQ(resample(in, rate, rate, &degraded), in);
        EXPECT_FALSE(degraded);
    }
}

TEST(ResamplerTest, EmptyInputStaysEmpty) {
    EXPECT_TRUE(resample({}, 48000, 16000).empty());
}

TEST(ResamplerTest, OutputLengthFollowsRateRatio) {
    struct Case { std::size_t n; int from; int to; };
    for (const Case& c : {Case{1024, 48000, 16000}, Case{1024, 44100, 16000}, Case{441, 44100, 16000},
                          Case{1000, 22050, 16000}, Case{333, 16000, 48000}}) {
        const std::vector<float> out = resample(test::sine(c.n, c.from), c.from, c.to);
        const double expected = std::round(static_cast<double>(c.n) * c.to / c.from);
        EXPECT_LE(std::abs(static_cast<double>(out.size()) - expected), 1.0)
            << c.n << " samples " << c.from << " -> " << c.to;
    }
}

TEST(ResamplerTest, DownsamplingKeepsEndpointsAndInterpolatesLinearly) {
    // 0, 1, 2, ... 8 at 9 Hz -> 3 Hz gives round(9 * 3 / 9) = 3 positions over [0, 8].
    const std::vector<float> out = resample(test::ramp(9), 9, 3);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_FLOAT_EQ(out[0], 0.0f);
    EXPECT_FLOAT_EQ(out[1], 4.0f);
    EXPECT_FLOAT_EQ(out[2], 8.0f);
}

TEST(ResamplerTest, UpsamplingInsertsIntermediateValues) {
    const std::vector<float> in = {0.0f, 1.0f};
    const std::vector<float> out = resample(in, 1, 2);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_FLOAT_EQ(out[0], 0.0f);
    EXPECT_NEAR(out[1], 1.0f / 3.0f, 1e-6);
    EXPECT_NEAR(out[2], 2.0f / 3.0f, 1e-6);
    EXPECT_FLOAT_EQ(out[3], 1.0f);
}

TEST(ResamplerTest, TooShortTargetReturnsInput) {
    const std::vector<float> in = {0.25f, -0.25f};
    bool degraded = true;
    EXPECT_EQ(resample(in, 48000, 16000, &degraded), in);
    EXPECT_FALSE(degraded);
}

TEST(ResamplerTest, InvalidRateDegradesToPassThrough) {
    const std::vector<float> in = test::sine(256, 16000);
    bool degraded = false;
    EXPECT_EQ(resample(in, 0, 16000, &degraded), in);
    EXPECT_TRUE(degraded);
    EXPECT_THROW(resampledLength(10, -1, 16000), std::invalid_argument);
}

TEST(ResamplerTest, DownmixAveragesChannels) {
    const std::vector<float> stereo = {1.0f, 0.0f, 0.5f, 0.5f, -1.0f, 1.0f};
    const std::vector<float> mono = downmixToMono(stereo.data(), 3, 2);
    ASSERT_EQ(mono.size(), 3u);
    EXPECT_FLOAT_EQ(mono[0], 0.5f);
    EXPECT_FLOAT_EQ(mono[1], 0.5f);
    EXPECT_FLOAT_EQ(mono[2], 0.0f);

    const std::vector<float> single = {0.1f, 0.2f};
    EXPECT_EQ(downmixToMono(single.data(), 2, 1), single);
    EXPECT_TRUE(downmixToMono(nullptr, 4, 2).empty());
}
