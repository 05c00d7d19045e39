#pragma once
#include "audio/blocking_queue.hpp"
#include "audio/capture_backend.hpp"
#include "audio/device_resolver.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace loopscribe {

// A contiguous run of mono samples at one sample rate. Always an independent
// copy of what the platform delivered.
struct FrameBlock {
    std::vector<float> samples;
    int sampleRate{0};
};

using DeliveryQueue = BlockingQueue<FrameBlock>;

enum class CaptureStatus {
    Started,
    AlreadyActive,
    Stopped,
    NotActive,
    StopTimeout,
    DeviceNotFound,
    StreamOpenFailed
};

const char* toString(CaptureStatus status);

struct CaptureResult {
    CaptureStatus status{CaptureStatus::NotActive};
    std::string message;

    bool failed() const {
        return status == CaptureStatus::DeviceNotFound || status == CaptureStatus::StreamOpenFailed;
    }
};

struct CaptureOptions {
    int sampleRate{16000};
    unsigned long chunkSize{1024};
    std::optional<int> inputDevice;
    std::optional<int> outputDevice;
    std::chrono::milliseconds stopTimeout{2000};
};

// Snapshot of the running session.
struct CaptureSession {
    int targetSampleRate{0};
    unsigned long chunkSize{0};
    int deviceSampleRate{0};
    DeviceDescriptor device;
    ResolutionRule rule{ResolutionRule::None};
    bool active{false};
};

struct CaptureStats {
    std::uint64_t blocksDelivered{0};
    std::uint64_t samplesDelivered{0};
    std::uint64_t callbackFaults{0};
    std::uint64_t resampleDegradations{0};
    std::uint64_t inputOverflows{0};
};

// Owns at most one capture session: a dedicated thread that resolves the
// device, opens the platform stream and keeps it alive until stop().
// Every delivered block is downmixed to mono and resampled to the target rate
// before it reaches the sink.
class AudioCapture {
public:
    using BlockSink = std::function<void(FrameBlock&&)>;

    static constexpr int FALLBACK_SAMPLE_RATES[] = {48000, 44100, 32000, 22050, 16000};
    static constexpr int MAX_CAPTURE_CHANNELS = 2;

    explicit AudioCapture(std::shared_ptr<CaptureBackend> backend);
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    // Resolves the preferred devices and starts delivering into the own queue.
    CaptureResult startCapture(const CaptureOptions& options);

    // Starts delivering to `sink`; an empty sink means the own delivery queue.
    CaptureResult start(int targetSampleRate,
                        unsigned long chunkSize,
                        std::optional<int> resolvedDevice,
                        BlockSink sink = {},
                        std::chrono::milliseconds stopTimeout = std::chrono::milliseconds(2000));

    CaptureResult stop();

    bool isCapturing() const;
    std::optional<CaptureSession> session() const;
    CaptureStats stats() const;

    std::vector<DeviceDescriptor> listDevices() const;
    const CaptureBackend& backend() const { return *backend_; }

    // Transport-facing access to the delivery queue.
    std::optional<FrameBlock> getAudioChunk(std::chrono::milliseconds timeout);
    std::size_t bufferSize() const { return queue_->size(); }
    std::size_t clearBuffer() { return queue_->clear(); }
    DeliveryQueue& deliveryQueue() { return *queue_; }

private:
    struct SessionState;

    static void captureLoop(std::shared_ptr<SessionState> state,
                            std::shared_ptr<CaptureBackend> backend,
                            std::optional<int> resolvedDevice);
    static CaptureResult openStream(SessionState& state,
                                    CaptureBackend& backend,
                                    const DeviceResolution& resolution,
                                    std::unique_ptr<CaptureStream>& stream);
    static void handleFrames(SessionState& state,
                             const float* interleaved,
                             std::size_t frames,
                             bool inputOverflow);
    void retireSession(std::chrono::milliseconds timeout, CaptureResult& result);

    std::shared_ptr<CaptureBackend> backend_;
    // Shared with the capture thread, which may outlive a timed-out stop().
    std::shared_ptr<DeliveryQueue> queue_;

    mutable std::mutex mutex_;
    std::shared_ptr<SessionState> state_;
    std::thread thread_;
    CaptureStats retiredStats_;
};

} // namespace loopscribe
