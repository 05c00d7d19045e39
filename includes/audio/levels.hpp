#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace loopscribe {

inline float computeRms(const float* samples, std::size_t n) {
    if (!samples || n == 0) return 0.0f;
    double acc = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double s = static_cast<double>(samples[i]);
        acc += s * s;
    }
    const double mean = acc / static_cast<double>(n);
    return static_cast<float>(std::sqrt(mean));
}

inline float computeRms(const std::vector<float>& samples) {
    return computeRms(samples.data(), samples.size());
}

inline float peakAmplitude(const std::vector<float>& samples) {
    float peak = 0.0f;
    for (float s : samples) peak = std::max(peak, std::fabs(s));
    return peak;
}

} // namespace loopscribe
