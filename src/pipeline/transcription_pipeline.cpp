#include "pipeline/transcription_pipeline.hpp"
#include "audio/levels.hpp"
#include "audio/resampler.hpp"
#include <iomanip>
#include <iostream>

namespace loopscribe {

TranscriptionPipeline::TranscriptionPipeline(DeliveryQueue& blocks,
                                             TranscriptionSink& sink,
                                             const Config& config)
    : config_(config),
      blocks_(blocks),
      sink_(sink),
      assembler_(WindowAssembler::fromDurations(config.chunkDuration,
                                                config.overlapDuration,
                                                config.sampleRate)) {
    std::cout << "Transcription windows: " << assembler_.chunkSamples() << " samples, overlap "
              << assembler_.overlapSamples() << " samples @ " << config_.sampleRate << " Hz" << std::endl;
}

TranscriptionPipeline::~TranscriptionPipeline() {
    if (running_) {
        running_ = false;
        if (worker_.joinable()) worker_.join();
    }
}

std::size_t TranscriptionPipeline::processBlock(const FrameBlock& block) {
    ++blocksConsumed_;
    if (block.samples.empty()) {
        return 0;
    }
    if (computeRms(block.samples) <= config_.blockGate) {
        ++blocksGated_;
        return 0;
    }

    std::optional<std::vector<float>> window;
    if (block.sampleRate > 0 && block.sampleRate != config_.sampleRate) {
        window = assembler_.push(resample(block.samples, block.sampleRate, config_.sampleRate));
    } else {
        window = assembler_.push(block.samples);
    }

    std::size_t emitted = 0;
    while (window) {
        deliver(transcribeWindow(*window));
        ++emitted;
        window = assembler_.next();
    }
    return emitted;
}

bool TranscriptionPipeline::pumpOnce(std::chrono::milliseconds timeout) {
    std::optional<FrameBlock> block = blocks_.pop(timeout);
    if (!block) {
        return false;
    }
    processBlock(*block);
    return true;
}

void TranscriptionPipeline::start() {
    if (running_) {
        std::cerr << "Warning: transcription pipeline already running" << std::endl;
        return;
    }
    running_ = true;
    worker_ = std::thread(&TranscriptionPipeline::workerLoop, this);
}

void TranscriptionPipeline::stop() {
    running_ = false;
    if (worker_.joinable()) {
        worker_.join();
    }

    std::size_t drained = 0;
    while (std::optional<FrameBlock> block = blocks_.tryPop()) {
        processBlock(*block);
        ++drained;
    }
    if (drained) {
        std::cout << "Drained " << drained << " pending audio blocks" << std::endl;
    }

    if (std::optional<TranscriptRecord> last = flush()) {
        std::cout << "Final window transcribed (" << last->text.size() << " chars)" << std::endl;
    }
}

std::optional<TranscriptRecord> TranscriptionPipeline::flush() {
    std::optional<std::vector<float>> rest = assembler_.flush();
    if (!rest) {
        return std::nullopt;
    }
    TranscriptRecord record = transcribeWindow(*rest);
    if (!record.deliverable()) {
        return std::nullopt;
    }
    deliver(TranscriptRecord(record));
    return record;
}

std::optional<TranscriptRecord> TranscriptionPipeline::nextTranscript(std::chrono::milliseconds timeout) {
    return transcripts_.pop(timeout);
}

TranscriptionPipeline::Stats TranscriptionPipeline::stats() const {
    Stats stats;
    stats.blocksConsumed = blocksConsumed_;
    stats.blocksGated = blocksGated_;
    stats.windowsTranscribed = windowsTranscribed_;
    stats.transcriptsQueued = transcriptsQueued_;
    stats.sinkFailures = sinkFailures_;
    return stats;
}

TranscriptRecord TranscriptionPipeline::transcribeWindow(const std::vector<float>& window) {
    ++windowsTranscribed_;
    TranscriptRecord record;
    try {
        record = sink_.transcribe(window, config_.sampleRate);
    } catch (const std::exception& e) {
        // Sinks are expected to report errors in the record; keep going anyway.
        std::cerr << "Error: transcription sink threw: " << e.what() << std::endl;
        record = TranscriptRecord{};
        record.error = e.what();
    }
    if (record.error) {
        ++sinkFailures_;
    }
    return record;
}

void TranscriptionPipeline::deliver(TranscriptRecord&& record) {
    if (!record.deliverable()) {
        return;
    }
    std::cout << "Transcript: \"" << record.text << "\" (conf: " << std::fixed << std::setprecision(2)
              << record.confidence << ", time: " << record.processingTime << "s)"
              << std::defaultfloat << std::endl;
    if (transcriptCallback_) {
        transcriptCallback_(record);
    }
    transcripts_.push(std::move(record));
    ++transcriptsQueued_;
}

void TranscriptionPipeline::workerLoop() {
    while (running_) {
        pumpOnce(config_.pollTimeout);
    }
}

} // namespace loopscribe
