#pragma once
#include "asr/transcription_sink.hpp"
#include <string>
#include <vector>
#include "whisper.h"

namespace loopscribe {

class WhisperTranscriber : public TranscriptionSink {
public:
    static constexpr int WHISPER_SAMPLE_RATE = 16000;

    struct Config {
        std::string modelPath = "models/ggml-tiny.bin";
        std::string language = "es";
        bool translateToEnglish = false;
        int threadCount = 4;
        // A window is only sent to the model when both levels are exceeded.
        double rmsThreshold = 0.01;
        double amplitudeThreshold = 0.02;
    };

    explicit WhisperTranscriber(const Config& config);
    ~WhisperTranscriber() override;

    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    bool init();
    bool isLoaded() const { return ctx_ != nullptr; }
    const Config& config() const { return config_; }

    TranscriptRecord transcribe(const std::vector<float>& samples, int sampleRate) override;

private:
    std::string runModel(const std::vector<float>& samples);

    Config config_;
    struct whisper_context* ctx_{nullptr};
};

} // namespace loopscribe
