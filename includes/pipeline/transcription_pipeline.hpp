#pragma once
#include "asr/transcription_sink.hpp"
#include "audio/audio_capture.hpp"
#include "audio/blocking_queue.hpp"
#include "audio/window_assembler.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <thread>
#include <vector>

namespace loopscribe {

using TranscriptQueue = BlockingQueue<TranscriptRecord>;

// The consumer side of a capture session: pops Frame Blocks, assembles
// overlapping windows and hands each one to the TranscriptionSink.
// Single consumer: either drive it with processBlock()/pumpOnce() or run the
// worker with start(), never both at once.
class TranscriptionPipeline {
public:
    struct Config {
        double chunkDuration = 3.0;   // seconds
        double overlapDuration = 0.5; // seconds
        int sampleRate = 16000;
        double blockGate = 0.001;     // blocks at or below this RMS are dropped
        std::chrono::milliseconds pollTimeout{100};
    };

    struct Stats {
        std::uint64_t blocksConsumed{0};
        std::uint64_t blocksGated{0};
        std::uint64_t windowsTranscribed{0};
        std::uint64_t transcriptsQueued{0};
        std::uint64_t sinkFailures{0};
    };

    using TranscriptCallback = std::function<void(const TranscriptRecord&)>;

    TranscriptionPipeline(DeliveryQueue& blocks, TranscriptionSink& sink, const Config& config);
    ~TranscriptionPipeline();

    TranscriptionPipeline(const TranscriptionPipeline&) = delete;
    TranscriptionPipeline& operator=(const TranscriptionPipeline&) = delete;

    // Returns the number of windows transcribed because of this block.
    std::size_t processBlock(const FrameBlock& block);

    // Waits up to `timeout` for one block; false when none arrived.
    bool pumpOnce(std::chrono::milliseconds timeout);

    void start();
    // Joins the worker, drains pending blocks and transcribes the final
    // partial window.
    void stop();
    bool isRunning() const { return running_; }

    // Transcribes what is left in the assembler, if anything.
    std::optional<TranscriptRecord> flush();

    // Transport side.
    std::optional<TranscriptRecord> nextTranscript(std::chrono::milliseconds timeout);
    std::size_t pendingTranscripts() const { return transcripts_.size(); }
    std::size_t clearTranscripts() { return transcripts_.clear(); }

    // Invoked on the consumer thread for every queued transcript.
    void setTranscriptCallback(TranscriptCallback callback) {
        transcriptCallback_ = std::move(callback);
    }

    Stats stats() const;
    const Config& config() const { return config_; }
    const WindowAssembler& assembler() const { return assembler_; }

private:
    TranscriptRecord transcribeWindow(const std::vector<float>& window);
    void deliver(TranscriptRecord&& record);
    void workerLoop();

    Config config_;
    DeliveryQueue& blocks_;
    TranscriptionSink& sink_;
    WindowAssembler assembler_;
    TranscriptQueue transcripts_;
    TranscriptCallback transcriptCallback_;

    std::atomic<bool> running_{false};
    std::thread worker_;

    std::atomic<std::uint64_t> blocksConsumed_{0};
    std::atomic<std::uint64_t> blocksGated_{0};
    std::atomic<std::uint64_t> windowsTranscribed_{0};
    std::atomic<std::uint64_t> transcriptsQueued_{0};
    std::atomic<std::uint64_t> sinkFailures_{0};
};

} // namespace loopscribe
