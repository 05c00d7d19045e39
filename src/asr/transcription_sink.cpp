#include "asr/transcription_sink.hpp"

namespace loopscribe {

JsonValue toJson(const TranscriptRecord& record) {
    JsonValue json = {
        {"text", record.text},
        {"confidence", record.confidence},
        {"processing_time", record.processingTime},
        {"volume", record.volume},
        {"max_amplitude", record.maxAmplitude},
    };
    if (!record.language.empty()) {
        json["language"] = record.language;
    }
    if (record.audioLength > 0.0) {
        json["audio_length"] = record.audioLength;
    }
    if (record.skipped) {
        json["skipped"] = *record.skipped;
    }
    if (record.error) {
        json["error"] = *record.error;
    }
    return json;
}

JsonValue transportMessage(const TranscriptRecord& record) {
    return {
        {"type", "transcription"},
        {"data", toJson(record)},
        {"timestamp", record.processingTime},
    };
}

JsonValue statusMessage(bool isCapturing,
                        const std::string& message,
                        std::size_t queuedBlocks,
                        std::size_t queuedTranscripts) {
    return {
        {"type", "status"},
        {"data", {
            {"is_capturing", isCapturing},
            {"message", message},
            {"queue_size", queuedBlocks},
            {"transcription_queue_size", queuedTranscripts},
        }},
    };
}

} // namespace loopscribe
