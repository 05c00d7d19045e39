#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace loopscribe {

using JsonValue = nlohmann::json;

// Result of transcribing one window. Only `text` decides whether the record
// is forwarded to the transport; everything else is carried through.
struct TranscriptRecord {
    std::string text;
    double confidence{0.0};
    double processingTime{0.0}; // seconds
    std::string language;
    double volume{0.0};         // RMS of the window
    double maxAmplitude{0.0};
    double audioLength{0.0};    // seconds
    std::optional<std::string> skipped;
    std::optional<std::string> error;

    bool deliverable() const { return !text.empty() && !skipped && !error; }
};

// Speech-to-text collaborator. Called with one window at a time from the
// consumer context. Implementations never throw: failures are reported
// through TranscriptRecord::error.
class TranscriptionSink {
public:
    virtual ~TranscriptionSink() = default;

    virtual TranscriptRecord transcribe(const std::vector<float>& samples, int sampleRate) = 0;
};

JsonValue toJson(const TranscriptRecord& record);

// {"type": "transcription", "data": {...}, "timestamp": <processing time>}
JsonValue transportMessage(const TranscriptRecord& record);

JsonValue statusMessage(bool isCapturing,
                        const std::string& message,
                        std::size_t queuedBlocks,
                        std::size_t queuedTranscripts);

} // namespace loopscribe
