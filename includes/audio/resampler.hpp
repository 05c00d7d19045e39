#pragma once
#include <cstddef>
#include <vector>

namespace loopscribe {

// Linear-interpolation resampler for mono float32 blocks.
//
// Returns the input unchanged when the rates match, the input is empty, or
// the target length would be <= 1 sample. Interpolation runs in double
// precision. If it fails for any reason the original samples are returned
// and *degraded (when given) is set to true; otherwise *degraded is false.
std::vector<float> resample(const std::vector<float>& samples,
                            int fromRate,
                            int toRate,
                            bool* degraded = nullptr);

// round(n * toRate / fromRate), the output length resample() aims for.
std::size_t resampledLength(std::size_t n, int fromRate, int toRate);

// Unweighted average of `channels` interleaved channels into one.
std::vector<float> downmixToMono(const float* interleaved, std::size_t frames, int channels);

} // namespace loopscribe
