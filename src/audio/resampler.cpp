#include "audio/resampler.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace loopscribe {

namespace {

std::vector<float> interpolateLinear(const std::vector<float>& in, std::size_t outLength) {
    std::vector<float> out(outLength);
    const std::size_t last = in.size() - 1;
    const double step = static_cast<double>(last) / static_cast<double>(outLength - 1);

    for (std::size_t i = 0; i < outLength; ++i) {
        const double pos = (i == outLength - 1) ? static_cast<double>(last) : step * static_cast<double>(i);
        const std::size_t left = static_cast<std::size_t>(pos);
        if (left >= last) {
            out[i] = in[last];
            continue;
        }
        const double frac = pos - static_cast<double>(left);
        const double a = static_cast<double>(in[left]);
        const double b = static_cast<double>(in[left + 1]);
        out[i] = static_cast<float>(a + (b - a) * frac);
    }
    return out;
}

} // namespace

std::size_t resampledLength(std::size_t n, int fromRate, int toRate) {
    if (fromRate <= 0 || toRate <= 0) {
        throw std::invalid_argument("sample rates must be positive");
    }
    const double target = std::round(static_cast<double>(n) * static_cast<double>(toRate)
                                     / static_cast<double>(fromRate));
    if (!std::isfinite(target) || target > static_cast<double>(std::numeric_limits<std::size_t>::max() / 2)) {
        throw std::overflow_error("resampled length out of range");
    }
    return static_cast<std::size_t>(target);
}

std::vector<float> resample(const std::vector<float>& samples, int fromRate, int toRate, bool* degraded) {
    if (degraded) *degraded = false;
    if (fromRate == toRate || samples.empty()) {
        return samples;
    }

    try {
        const std::size_t target = resampledLength(samples.size(), fromRate, toRate);
        if (target <= 1) {
            return samples;
        }
        return interpolateLinear(samples, target);
    } catch (const std::exception& e) {
        std::cerr << "Warning: resampling " << samples.size() << " samples from " << fromRate
                  << " Hz to " << toRate << " Hz failed (" << e.what()
                  << "), passing audio through unresampled" << std::endl;
        if (degraded) *degraded = true;
        return samples;
    }
}

std::vector<float> downmixToMono(const float* interleaved, std::size_t frames, int channels) {
    if (!interleaved || frames == 0) return {};
    if (channels <= 1) {
        return std::vector<float>(interleaved, interleaved + frames);
    }

    std::vector<float> mono(frames);
    const double scale = 1.0 / static_cast<double>(channels);
    for (std::size_t f = 0; f < frames; ++f) {
        const float* frame = interleaved + f * static_cast<std::size_t>(channels);
        double sum = 0.0;
        for (int c = 0; c < channels; ++c) sum += frame[c];
        mono[f] = static_cast<float>(sum * scale);
    }
    return mono;
}

} // namespace loopscribe
