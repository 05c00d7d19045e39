#pragma once
#include "audio/audio_device.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace loopscribe {

// Raised by the platform layer when a stream cannot be opened, started or stopped.
class StreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct StreamRequest {
    int deviceIndex{-1};
    int channels{1};
    int sampleRate{16000};
    unsigned long framesPerBuffer{1024};
};

// Called on the platform's audio thread with interleaved float32 frames.
// The buffer is owned by the platform and only valid for the duration of the call.
using FrameCallback = std::function<void(const float* interleaved,
                                         std::size_t frames,
                                         bool inputOverflow)>;

// An open capture stream. Closing happens in the destructor.
class CaptureStream {
public:
    virtual ~CaptureStream() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    // Stops without draining pending buffers.
    virtual void abort() = 0;
    virtual bool isActive() const = 0;

    virtual int sampleRate() const = 0;
    virtual int channels() const = 0;
};

// Platform capability: device enumeration plus stream construction.
// Enumeration is never cached; every call queries the platform again.
class CaptureBackend {
public:
    virtual ~CaptureBackend() = default;

    virtual std::string name() const = 0;
    virtual std::vector<DeviceDescriptor> devices() const = 0;
    virtual std::optional<int> defaultInputDevice() const = 0;

    // Host API whose input devices are preferred when nothing else matches
    // (WASAPI on Windows, ALSA on Linux, CoreAudio on macOS).
    virtual int preferredHostApi() const = 0;

    virtual bool isFormatSupported(const StreamRequest& request) const = 0;

    // Throws StreamError when the platform rejects the request.
    virtual std::unique_ptr<CaptureStream> openStream(const StreamRequest& request,
                                                      FrameCallback callback) = 0;
};

// Picks the backend variant for the platform this binary was built for.
std::shared_ptr<CaptureBackend> makePlatformBackend();

} // namespace loopscribe
