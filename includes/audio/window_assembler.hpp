#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace loopscribe {

// Turns an unbounded run of samples into fixed-size windows. Each window
// starts `overlapSamples` before the end of the previous one, so consecutive
// windows share exactly that many samples.
class WindowAssembler {
public:
    // Throws std::invalid_argument unless 0 <= overlapSamples < chunkSamples.
    WindowAssembler(std::size_t chunkSamples, std::size_t overlapSamples);

    // Sizes are int(duration * sampleRate), truncated like the configured
    // durations always have been.
    static WindowAssembler fromDurations(double chunkSeconds, double overlapSeconds, int sampleRate);

    // Appends and emits at most one window.
    std::optional<std::vector<float>> push(const std::vector<float>& samples);
    std::optional<std::vector<float>> push(const float* samples, std::size_t count);

    // Emits another window if the buffer still holds a full one.
    std::optional<std::vector<float>> next();

    // Everything that is left, in order; empties the buffer.
    std::optional<std::vector<float>> flush();

    std::size_t bufferedSamples() const;
    std::size_t chunkSamples() const { return chunkSamples_; }
    std::size_t overlapSamples() const { return overlapSamples_; }

private:
    std::optional<std::vector<float>> extractLocked();

    const std::size_t chunkSamples_;
    const std::size_t overlapSamples_;

    mutable std::mutex mutex_;
    std::vector<float> accumulated_;
};

} // namespace loopscribe
