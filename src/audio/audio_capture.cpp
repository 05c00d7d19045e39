#include "audio/audio_capture.hpp"
#include "audio/resampler.hpp"
#include <algorithm>
#include <condition_variable>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace loopscribe {

using namespace std::chrono_literals;

struct AudioCapture::SessionState {
    int targetSampleRate{0};
    unsigned long chunkSize{0};
    std::chrono::milliseconds stopTimeout{2000};
    BlockSink sink;

    // Written by the capture thread before `ready` is fulfilled.
    DeviceDescriptor device;
    ResolutionRule rule{ResolutionRule::None};

    // Written before the stream starts, read on the audio thread.
    std::atomic<int> deviceSampleRate{0};
    std::atomic<int> channels{1};

    std::atomic<bool> active{false};
    std::atomic<bool> stopRequested{false};
    std::atomic<bool> abortRequested{false};
    std::mutex wakeMutex;
    std::condition_variable wake;

    // Guards `sink`; once detached, late platform callbacks are dropped.
    std::mutex sinkMutex;
    bool sinkDetached{false};

    std::promise<CaptureResult> ready;
    std::promise<void> finished;
    std::future<void> finishedFuture;

    std::atomic<std::uint64_t> blocksDelivered{0};
    std::atomic<std::uint64_t> samplesDelivered{0};
    std::atomic<std::uint64_t> callbackFaults{0};
    std::atomic<std::uint64_t> resampleDegradations{0};
    std::atomic<std::uint64_t> inputOverflows{0};
};

namespace {

std::string joinTrace(const std::vector<std::string>& steps) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        if (i) oss << "; ";
        oss << steps[i];
    }
    return oss.str();
}

std::vector<int> candidateRates(int target, int deviceDefault) {
    std::vector<int> rates;
    auto add = [&rates](int rate) {
        if (rate > 0 && std::find(rates.begin(), rates.end(), rate) == rates.end()) {
            rates.push_back(rate);
        }
    };
    add(target);
    add(deviceDefault);
    for (int rate : AudioCapture::FALLBACK_SAMPLE_RATES) add(rate);
    return rates;
}

} // namespace

const char* toString(CaptureStatus status) {
    switch (status) {
        case CaptureStatus::Started:          return "started";
        case CaptureStatus::AlreadyActive:    return "already active";
        case CaptureStatus::Stopped:          return "stopped";
        case CaptureStatus::NotActive:        return "not active";
        case CaptureStatus::StopTimeout:      return "stop timeout";
        case CaptureStatus::DeviceNotFound:   return "device not found";
        case CaptureStatus::StreamOpenFailed: return "stream open failed";
    }
    return "unknown";
}

AudioCapture::AudioCapture(std::shared_ptr<CaptureBackend> backend)
    : backend_(std::move(backend)),
      queue_(std::make_shared<DeliveryQueue>()) {
    if (!backend_) {
        throw std::invalid_argument("AudioCapture requires a capture backend");
    }
    std::cout << "Audio capture using " << backend_->name() << " backend" << std::endl;
}

AudioCapture::~AudioCapture() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_) {
        CaptureResult result;
        retireSession(state_->stopTimeout, result);
    }
}

CaptureResult AudioCapture::startCapture(const CaptureOptions& options) {
    if (isCapturing()) {
        std::cerr << "Warning: capture is already active" << std::endl;
        return {CaptureStatus::AlreadyActive, "Capture already active"};
    }
    DeviceResolver resolver(*backend_);
    std::optional<int> resolved = resolver.resolve(options.inputDevice, options.outputDevice);
    return start(options.sampleRate, options.chunkSize, resolved, {}, options.stopTimeout);
}

CaptureResult AudioCapture::start(int targetSampleRate,
                                  unsigned long chunkSize,
                                  std::optional<int> resolvedDevice,
                                  BlockSink sink,
                                  std::chrono::milliseconds stopTimeout) {
    if (targetSampleRate <= 0 || chunkSize == 0) {
        throw std::invalid_argument("sample rate and chunk size must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ && state_->active) {
        std::cerr << "Warning: capture is already active" << std::endl;
        return {CaptureStatus::AlreadyActive, "Capture already active"};
    }
    if (state_) {
        // Previous stream ended by itself; reap its thread before starting over.
        CaptureResult ignored;
        retireSession(state_->stopTimeout, ignored);
    }

    auto state = std::make_shared<SessionState>();
    state->targetSampleRate = targetSampleRate;
    state->chunkSize = chunkSize;
    state->stopTimeout = stopTimeout;
    if (sink) {
        state->sink = std::move(sink);
    } else {
        state->sink = [queue = queue_](FrameBlock&& block) { queue->push(std::move(block)); };
    }
    state->finishedFuture = state->finished.get_future();
    std::future<CaptureResult> ready = state->ready.get_future();

    thread_ = std::thread(&AudioCapture::captureLoop, state, backend_, resolvedDevice);
    CaptureResult result = ready.get();

    if (result.status != CaptureStatus::Started) {
        thread_.join();
        std::cerr << "Error: " << result.message << std::endl;
        return result;
    }

    state_ = std::move(state);
    std::cout << result.message << std::endl;
    return result;
}

CaptureResult AudioCapture::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_) {
        std::cerr << "Warning: capture is not active" << std::endl;
        return {CaptureStatus::NotActive, "Capture not active"};
    }
    CaptureResult result{CaptureStatus::Stopped, "Capture stopped"};
    retireSession(state_->stopTimeout, result);
    std::cout << result.message << std::endl;
    return result;
}

void AudioCapture::retireSession(std::chrono::milliseconds timeout, CaptureResult& result) {
    {
        std::lock_guard<std::mutex> wakeLock(state_->wakeMutex);
        state_->stopRequested = true;
    }
    state_->wake.notify_all();

    if (state_->finishedFuture.wait_for(timeout) == std::future_status::ready) {
        thread_.join();
    } else {
        // The thread keeps its own references to the session, the backend and
        // the queue, so it can finish releasing the stream on its own.
        state_->abortRequested = true;
        {
            std::lock_guard<std::mutex> sinkLock(state_->sinkMutex);
            state_->sinkDetached = true;
        }
        thread_.detach();
        state_->active = false;
        result = {CaptureStatus::StopTimeout,
                  "Capture thread did not finish within " + std::to_string(timeout.count())
                      + " ms; session marked inactive"};
        std::cerr << "Warning: " << result.message << std::endl;
    }

    retiredStats_.blocksDelivered += state_->blocksDelivered;
    retiredStats_.samplesDelivered += state_->samplesDelivered;
    retiredStats_.callbackFaults += state_->callbackFaults;
    retiredStats_.resampleDegradations += state_->resampleDegradations;
    retiredStats_.inputOverflows += state_->inputOverflows;
    state_.reset();
}

bool AudioCapture::isCapturing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ && state_->active;
}

std::optional<CaptureSession> AudioCapture::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_) return std::nullopt;

    CaptureSession session;
    session.targetSampleRate = state_->targetSampleRate;
    session.chunkSize = state_->chunkSize;
    session.deviceSampleRate = state_->deviceSampleRate;
    session.device = state_->device;
    session.rule = state_->rule;
    session.active = state_->active;
    return session;
}

CaptureStats AudioCapture::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CaptureStats stats = retiredStats_;
    if (state_) {
        stats.blocksDelivered += state_->blocksDelivered;
        stats.samplesDelivered += state_->samplesDelivered;
        stats.callbackFaults += state_->callbackFaults;
        stats.resampleDegradations += state_->resampleDegradations;
        stats.inputOverflows += state_->inputOverflows;
    }
    return stats;
}

std::vector<DeviceDescriptor> AudioCapture::listDevices() const {
    return backend_->devices();
}

std::optional<FrameBlock> AudioCapture::getAudioChunk(std::chrono::milliseconds timeout) {
    return queue_->pop(timeout);
}

void AudioCapture::captureLoop(std::shared_ptr<SessionState> state,
                               std::shared_ptr<CaptureBackend> backend,
                               std::optional<int> resolvedDevice) {
    std::unique_ptr<CaptureStream> stream;
    CaptureResult result;
    try {
        DeviceResolver resolver(*backend);
        DeviceResolution resolution = resolver.resolveForCapture(resolvedDevice);
        if (!resolution) {
            result = {CaptureStatus::DeviceNotFound,
                      "No usable input device on " + backend->name() + " (" + joinTrace(resolution.trace) + ")"};
        } else {
            result = openStream(*state, *backend, resolution, stream);
        }
    } catch (const std::exception& e) {
        stream.reset();
        result = {CaptureStatus::StreamOpenFailed, std::string("Capture setup failed: ") + e.what()};
    }

    if (result.status != CaptureStatus::Started) {
        state->ready.set_value(result);
        state->finished.set_value();
        return;
    }

    state->active = true;
    state->ready.set_value(result);

    {
        std::unique_lock<std::mutex> lock(state->wakeMutex);
        while (!state->stopRequested) {
            state->wake.wait_for(lock, 100ms, [&state] { return state->stopRequested.load(); });
            if (!state->stopRequested && !stream->isActive()) {
                std::cerr << "Warning: capture stream on '" << state->device.name
                          << "' ended unexpectedly" << std::endl;
                break;
            }
        }
    }

    try {
        if (state->abortRequested) {
            stream->abort();
        } else {
            stream->stop();
        }
    } catch (const StreamError& e) {
        std::cerr << "Warning: " << e.what() << std::endl;
    }
    stream.reset();
    state->active = false;
    std::cout << "Capture stream on '" << state->device.name << "' closed" << std::endl;
    state->finished.set_value();
}

CaptureResult AudioCapture::openStream(SessionState& state,
                                       CaptureBackend& backend,
                                       const DeviceResolution& resolution,
                                       std::unique_ptr<CaptureStream>& stream) {
    const DeviceDescriptor& device = *resolution.device;
    state.device = device;
    state.rule = resolution.rule;

    StreamRequest request;
    request.deviceIndex = device.index;
    request.channels = std::clamp(device.maxInputChannels, 1, MAX_CAPTURE_CHANNELS);
    request.framesPerBuffer = state.chunkSize;

    const std::vector<int> rates = candidateRates(state.targetSampleRate, device.defaultSampleRate);
    std::string lastError = "format not supported";
    SessionState* raw = &state;

    for (int rate : rates) {
        request.sampleRate = rate;
        if (!backend.isFormatSupported(request)) {
            std::cerr << "Warning: " << device.name << " does not support " << request.channels
                      << " ch @ " << rate << " Hz" << std::endl;
            continue;
        }

        state.deviceSampleRate = rate;
        state.channels = request.channels;
        try {
            stream = backend.openStream(request, [raw](const float* in, std::size_t frames, bool overflow) {
                handleFrames(*raw, in, frames, overflow);
            });
            state.deviceSampleRate = stream->sampleRate();
            state.channels = stream->channels();
            stream->start();
        } catch (const StreamError& e) {
            stream.reset();
            lastError = e.what();
            std::cerr << "Warning: opening " << device.name << " at " << rate << " Hz failed: "
                      << lastError << std::endl;
            continue;
        }

        std::ostringstream oss;
        oss << "Capturing from " << describeDevice(device) << " via " << backend.name()
            << " (" << toString(resolution.rule) << ") at " << state.deviceSampleRate.load() << " Hz, target "
            << state.targetSampleRate << " Hz, " << state.chunkSize << " frames per buffer";
        return {CaptureStatus::Started, oss.str()};
    }

    std::ostringstream oss;
    oss << "Could not open '" << device.name << "' (index " << device.index << ") via "
        << backend.name() << " at any of";
    for (int rate : rates) oss << " " << rate;
    oss << " Hz: " << lastError << " [" << joinTrace(resolution.trace) << "]";
    state.deviceSampleRate = 0;
    return {CaptureStatus::StreamOpenFailed, oss.str()};
}

void AudioCapture::handleFrames(SessionState& state,
                                const float* interleaved,
                                std::size_t frames,
                                bool inputOverflow) {
    if (state.abortRequested) return;
    try {
        if (inputOverflow) {
            ++state.inputOverflows;
            std::cerr << "Warning: input overflow on '" << state.device.name << "'" << std::endl;
        }

        std::vector<float> mono = downmixToMono(interleaved, frames, state.channels);
        if (mono.empty()) return;

        const int deviceRate = state.deviceSampleRate;
        int rate = deviceRate;
        if (deviceRate > 0 && deviceRate != state.targetSampleRate) {
            bool degraded = false;
            const std::size_t expected = resampledLength(mono.size(), deviceRate, state.targetSampleRate);
            mono = resample(mono, deviceRate, state.targetSampleRate, &degraded);
            if (degraded) {
                ++state.resampleDegradations;
            } else if (mono.size() == expected) {
                rate = state.targetSampleRate;
            }
            // Otherwise the block was too short to resample and stays at the device rate.
        }

        const std::size_t count = mono.size();
        std::lock_guard<std::mutex> sinkLock(state.sinkMutex);
        if (state.sinkDetached) return;
        state.sink(FrameBlock{std::move(mono), rate});
        ++state.blocksDelivered;
        state.samplesDelivered += count;
    } catch (const std::exception& e) {
        ++state.callbackFaults;
        std::cerr << "Error: audio callback fault, block dropped: " << e.what() << std::endl;
    }
}

} // namespace loopscribe
