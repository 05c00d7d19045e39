#include "audio/window_assembler.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace loopscribe {

WindowAssembler::WindowAssembler(std::size_t chunkSamples, std::size_t overlapSamples)
    : chunkSamples_(chunkSamples), overlapSamples_(overlapSamples) {
    if (chunkSamples_ == 0) {
        throw std::invalid_argument("window chunk size must be positive");
    }
    if (overlapSamples_ >= chunkSamples_) {
        throw std::invalid_argument("window overlap (" + std::to_string(overlapSamples_)
                                    + " samples) must be smaller than the chunk ("
                                    + std::to_string(chunkSamples_) + " samples)");
    }
    accumulated_.reserve(chunkSamples_ * 2);
}

WindowAssembler WindowAssembler::fromDurations(double chunkSeconds, double overlapSeconds, int sampleRate) {
    if (sampleRate <= 0) {
        throw std::invalid_argument("sample rate must be positive");
    }
    if (!std::isfinite(chunkSeconds) || !std::isfinite(overlapSeconds)
        || chunkSeconds <= 0.0 || overlapSeconds < 0.0) {
        throw std::invalid_argument("chunk duration must be positive and overlap non-negative");
    }
    const auto chunk = static_cast<std::size_t>(chunkSeconds * sampleRate);
    const auto overlap = static_cast<std::size_t>(overlapSeconds * sampleRate);
    return WindowAssembler(chunk, overlap);
}

std::optional<std::vector<float>> WindowAssembler::push(const std::vector<float>& samples) {
    return push(samples.data(), samples.size());
}

std::optional<std::vector<float>> WindowAssembler::push(const float* samples, std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples && count) {
        accumulated_.insert(accumulated_.end(), samples, samples + count);
    }
    return extractLocked();
}

std::optional<std::vector<float>> WindowAssembler::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    return extractLocked();
}

std::optional<std::vector<float>> WindowAssembler::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (accumulated_.empty()) {
        return std::nullopt;
    }
    std::vector<float> rest;
    rest.swap(accumulated_);
    return rest;
}

std::size_t WindowAssembler::bufferedSamples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accumulated_.size();
}

std::optional<std::vector<float>> WindowAssembler::extractLocked() {
    if (accumulated_.size() < chunkSamples_) {
        return std::nullopt;
    }
    const auto chunkEnd = accumulated_.begin() + static_cast<std::ptrdiff_t>(chunkSamples_);
    std::vector<float> window(accumulated_.begin(), chunkEnd);

    // Keep the overlap tail of the window plus everything after it.
    const auto keepFrom = chunkEnd - static_cast<std::ptrdiff_t>(overlapSamples_);
    accumulated_.erase(accumulated_.begin(), keepFrom);
    return window;
}

} // namespace loopscribe
