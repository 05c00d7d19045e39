#pragma once
#include "audio/capture_backend.hpp"
#include <portaudio.h>
#include <memory>
#include <string>
#include <vector>

#ifdef _WIN32
#include <pa_win_wasapi.h>
#endif

namespace loopscribe {

class PortAudioStream : public CaptureStream {
public:
    PortAudioStream(const PaStreamParameters& params,
                    const StreamRequest& request,
                    FrameCallback callback);
    ~PortAudioStream() override;

    PortAudioStream(const PortAudioStream&) = delete;
    PortAudioStream& operator=(const PortAudioStream&) = delete;

    void start() override;
    void stop() override;
    void abort() override;
    bool isActive() const override;

    int sampleRate() const override { return sampleRate_; }
    int channels() const override { return channels_; }

private:
    static int paCallback(const void* input, void* output,
                          unsigned long frameCount,
                          const PaStreamCallbackTimeInfo* timeInfo,
                          PaStreamCallbackFlags statusFlags,
                          void* userData);

    PaStream* stream_{nullptr};
    FrameCallback callback_;
    int sampleRate_{0};
    int channels_{1};
};

// Shared PortAudio implementation. Owns one Pa_Initialize/Pa_Terminate pair.
class PortAudioBackend : public CaptureBackend {
public:
    PortAudioBackend();
    ~PortAudioBackend() override;

    PortAudioBackend(const PortAudioBackend&) = delete;
    PortAudioBackend& operator=(const PortAudioBackend&) = delete;

    std::vector<DeviceDescriptor> devices() const override;
    std::optional<int> defaultInputDevice() const override;
    bool isFormatSupported(const StreamRequest& request) const override;
    std::unique_ptr<CaptureStream> openStream(const StreamRequest& request,
                                              FrameCallback callback) override;

protected:
    virtual bool isLoopbackDevice(int index, const std::string& name) const;

    // Host-API specific stream info, or nullptr. Must stay valid until the
    // call that received it returns.
    virtual void* hostApiStreamInfo(const StreamRequest& request) const;

    PaStreamParameters inputParameters(const StreamRequest& request) const;
};

class WasapiBackend final : public PortAudioBackend {
public:
    WasapiBackend();

    std::string name() const override { return "WASAPI"; }
    int preferredHostApi() const override { return paWASAPI; }

protected:
    bool isLoopbackDevice(int index, const std::string& name) const override;
    void* hostApiStreamInfo(const StreamRequest& request) const override;

#ifdef _WIN32
private:
    mutable PaWasapiStreamInfo wasapiInfo_{};
#endif
};

class AlsaPulseBackend final : public PortAudioBackend {
public:
    std::string name() const override { return "ALSA/PulseAudio"; }
    int preferredHostApi() const override { return paALSA; }

protected:
    // PulseAudio exposes what a sink renders as a "Monitor of <sink>" source.
    bool isLoopbackDevice(int index, const std::string& name) const override;
};

class CoreAudioBackend final : public PortAudioBackend {
public:
    std::string name() const override { return "CoreAudio"; }
    int preferredHostApi() const override { return paCoreAudio; }

protected:
    // macOS has no native loopback; BlackHole and Soundflower provide one.
    bool isLoopbackDevice(int index, const std::string& name) const override;
};

} // namespace loopscribe
