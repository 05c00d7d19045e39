#include "asr/whisper_transcriber.hpp"
#include "audio/levels.hpp"
#include "audio/resampler.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace loopscribe {

namespace {

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

WhisperTranscriber::WhisperTranscriber(const Config& config) : config_(config) {}

WhisperTranscriber::~WhisperTranscriber() {
    if (ctx_) {
        whisper_free(ctx_);
    }
}

bool WhisperTranscriber::init() {
    std::vector<std::filesystem::path> possiblePaths = {
        config_.modelPath,
        std::filesystem::current_path() / config_.modelPath,
        std::filesystem::current_path() / ".." / config_.modelPath,
        std::filesystem::current_path() / "../.." / config_.modelPath
    };

    for (const auto& path : possiblePaths) {
        if (std::filesystem::exists(path)) {
            whisper_context_params cparams = whisper_context_default_params();
            ctx_ = whisper_init_from_file_with_params(path.string().c_str(), cparams);
            if (ctx_) {
                std::cout << "Loaded Whisper model from: " << path << std::endl;
                return true;
            }
        }
    }

    std::cerr << "Failed to load Whisper model. Tried paths:\n";
    for (const auto& path : possiblePaths) {
        std::cerr << "  " << path << "\n";
    }
    return false;
}

TranscriptRecord WhisperTranscriber::transcribe(const std::vector<float>& samples, int sampleRate) {
    TranscriptRecord record;
    if (samples.empty()) {
        return record;
    }

    const auto start = std::chrono::steady_clock::now();
    try {
        if (sampleRate <= 0) {
            throw std::invalid_argument("sample rate must be positive");
        }

        std::vector<float> audio = samples;
        const float peak = peakAmplitude(audio);
        if (peak > 1.0f) {
            for (float& s : audio) s /= peak;
        }

        record.language = config_.language;
        record.volume = computeRms(audio);
        record.maxAmplitude = peakAmplitude(audio);

        if (record.volume <= config_.rmsThreshold || record.maxAmplitude <= config_.amplitudeThreshold) {
            record.skipped = "no_voice_activity";
            record.processingTime = secondsSince(start);
            return record;
        }

        if (!ctx_) {
            throw std::runtime_error("Whisper model not initialized");
        }

        if (sampleRate != WHISPER_SAMPLE_RATE) {
            audio = resample(audio, sampleRate, WHISPER_SAMPLE_RATE);
        }

        record.text = runModel(audio);
        record.confidence = std::min(1.0, static_cast<double>(record.text.size()) / 50.0);
        record.audioLength = static_cast<double>(samples.size()) / sampleRate;
        record.processingTime = secondsSince(start);
    } catch (const std::exception& e) {
        std::cerr << "Error: transcription failed: " << e.what() << std::endl;
        TranscriptRecord failed;
        failed.error = e.what();
        return failed;
    }
    return record;
}

std::string WhisperTranscriber::runModel(const std::vector<float>& samples) {
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = config_.translateToEnglish;
    wparams.language         = config_.language.c_str();
    wparams.n_threads        = config_.threadCount;
    wparams.offset_ms        = 0;
    wparams.duration_ms      = 0;
    wparams.single_segment   = true;

    if (whisper_full(ctx_, wparams, samples.data(), static_cast<int>(samples.size())) != 0) {
        throw std::runtime_error("Failed to process audio with Whisper");
    }

    std::string result;
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text(ctx_, i);
        if (text) {
            result += text;
        }
    }

    // Segments come with a leading space.
    const auto first = result.find_first_not_of(" \t\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = result.find_last_not_of(" \t\n");
    return result.substr(first, last - first + 1);
}

} // namespace loopscribe
