#include "audio/portaudio_backend.hpp"
#include <iostream>

namespace loopscribe {

namespace {

std::string paError(const std::string& what, PaError err) {
    return what + ": " + Pa_GetErrorText(err);
}

} // namespace

// --- PortAudioStream -------------------------------------------------------

PortAudioStream::PortAudioStream(const PaStreamParameters& params,
                                 const StreamRequest& request,
                                 FrameCallback callback)
    : callback_(std::move(callback)),
      sampleRate_(request.sampleRate),
      channels_(params.channelCount) {
    PaError err = Pa_OpenStream(&stream_,
                                &params,
                                nullptr,
                                static_cast<double>(request.sampleRate),
                                request.framesPerBuffer,
                                paClipOff,
                                &PortAudioStream::paCallback,
                                this);
    if (err != paNoError) {
        stream_ = nullptr;
        throw StreamError(paError("Pa_OpenStream failed at " + std::to_string(request.sampleRate) + " Hz", err));
    }

    if (const PaStreamInfo* info = Pa_GetStreamInfo(stream_)) {
        sampleRate_ = static_cast<int>(info->sampleRate + 0.5);
    }
}

PortAudioStream::~PortAudioStream() {
    if (stream_) {
        if (Pa_IsStreamStopped(stream_) == 0) {
            Pa_AbortStream(stream_);
        }
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
}

void PortAudioStream::start() {
    PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        throw StreamError(paError("Pa_StartStream failed", err));
    }
}

void PortAudioStream::stop() {
    PaError err = Pa_StopStream(stream_);
    if (err != paNoError && err != paStreamIsStopped) {
        throw StreamError(paError("Pa_StopStream failed", err));
    }
}

void PortAudioStream::abort() {
    PaError err = Pa_AbortStream(stream_);
    if (err != paNoError && err != paStreamIsStopped) {
        throw StreamError(paError("Pa_AbortStream failed", err));
    }
}

bool PortAudioStream::isActive() const {
    return Pa_IsStreamActive(stream_) == 1;
}

int PortAudioStream::paCallback(const void* input, void* output,
                                unsigned long frameCount,
                                const PaStreamCallbackTimeInfo* timeInfo,
                                PaStreamCallbackFlags statusFlags,
                                void* userData) {
    (void)output;
    (void)timeInfo;

    auto* self = static_cast<PortAudioStream*>(userData);
    const float* in = static_cast<const float*>(input);
    if (self && in && self->callback_) {
        self->callback_(in, static_cast<std::size_t>(frameCount), (statusFlags & paInputOverflow) != 0);
    }
    return paContinue;
}

// --- PortAudioBackend ------------------------------------------------------

PortAudioBackend::PortAudioBackend() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw std::runtime_error(paError("Failed to initialize PortAudio", err));
    }
}

PortAudioBackend::~PortAudioBackend() {
    Pa_Terminate();
}

std::vector<DeviceDescriptor> PortAudioBackend::devices() const {
    std::vector<DeviceDescriptor> devices;
    const int numDevices = Pa_GetDeviceCount();
    if (numDevices < 0) {
        std::cerr << "Error: Pa_GetDeviceCount returned " << numDevices
                  << " (" << Pa_GetErrorText(numDevices) << ")" << std::endl;
        return devices;
    }

    const PaDeviceIndex defaultInput = Pa_GetDefaultInputDevice();
    for (int i = 0; i < numDevices; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;

        DeviceDescriptor device;
        device.index = i;
        device.name = info->name ? info->name : "";
        device.maxInputChannels = info->maxInputChannels;
        device.maxOutputChannels = info->maxOutputChannels;
        device.defaultSampleRate = static_cast<int>(info->defaultSampleRate + 0.5);
        if (const PaHostApiInfo* api = Pa_GetHostApiInfo(info->hostApi)) {
            device.hostApiId = api->type;
            device.hostApiName = api->name ? api->name : "";
        }
        device.isLoopback = isLoopbackDevice(i, device.name);
        device.isDefaultInput = (i == defaultInput);
        devices.push_back(std::move(device));
    }
    return devices;
}

std::optional<int> PortAudioBackend::defaultInputDevice() const {
    const PaDeviceIndex device = Pa_GetDefaultInputDevice();
    if (device == paNoDevice) return std::nullopt;
    return device;
}

PaStreamParameters PortAudioBackend::inputParameters(const StreamRequest& request) const {
    const PaDeviceInfo* info = Pa_GetDeviceInfo(request.deviceIndex);
    if (!info) {
        throw StreamError("No device info for device " + std::to_string(request.deviceIndex));
    }

    PaStreamParameters params{};
    params.device = request.deviceIndex;
    params.channelCount = request.channels;
    params.sampleFormat = paFloat32; // [-1,1]
    params.suggestedLatency = info->defaultLowInputLatency;
    params.hostApiSpecificStreamInfo = hostApiStreamInfo(request);
    return params;
}

bool PortAudioBackend::isFormatSupported(const StreamRequest& request) const {
    if (!Pa_GetDeviceInfo(request.deviceIndex)) return false;
    const PaStreamParameters params = inputParameters(request);
    return Pa_IsFormatSupported(&params, nullptr, static_cast<double>(request.sampleRate)) == paFormatIsSupported;
}

std::unique_ptr<CaptureStream> PortAudioBackend::openStream(const StreamRequest& request,
                                                            FrameCallback callback) {
    const PaStreamParameters params = inputParameters(request);
    return std::make_unique<PortAudioStream>(params, request, std::move(callback));
}

bool PortAudioBackend::isLoopbackDevice(int index, const std::string& name) const {
    (void)index;
    return containsIgnoreCase(name, "loopback");
}

void* PortAudioBackend::hostApiStreamInfo(const StreamRequest& request) const {
    (void)request;
    return nullptr;
}

// --- Platform variants -----------------------------------------------------

WasapiBackend::WasapiBackend() {
#ifdef _WIN32
    wasapiInfo_.size = sizeof(PaWasapiStreamInfo);
    wasapiInfo_.hostApiType = paWASAPI;
    wasapiInfo_.version = 1;
    wasapiInfo_.flags = paWinWasapiAutoConvert;
#endif
}

bool WasapiBackend::isLoopbackDevice(int index, const std::string& name) const {
#ifdef _WIN32
    int isLoopback = PaWasapi_IsLoopback(index);
    if (isLoopback == 1) return true;
    if (isLoopback < 0) {
        std::cerr << "Warning: checking if device " << index << " is loopback failed: "
                  << Pa_GetErrorText(isLoopback) << std::endl;
    }
#endif
    return PortAudioBackend::isLoopbackDevice(index, name);
}

void* WasapiBackend::hostApiStreamInfo(const StreamRequest& request) const {
#ifdef _WIN32
    const PaDeviceInfo* info = Pa_GetDeviceInfo(request.deviceIndex);
    const PaHostApiInfo* api = info ? Pa_GetHostApiInfo(info->hostApi) : nullptr;
    if (api && api->type == paWASAPI) {
        return &wasapiInfo_;
    }
#endif
    return PortAudioBackend::hostApiStreamInfo(request);
}

bool AlsaPulseBackend::isLoopbackDevice(int index, const std::string& name) const {
    return PortAudioBackend::isLoopbackDevice(index, name) || containsIgnoreCase(name, "monitor");
}

bool CoreAudioBackend::isLoopbackDevice(int index, const std::string& name) const {
    return PortAudioBackend::isLoopbackDevice(index, name)
        || containsIgnoreCase(name, "blackhole")
        || containsIgnoreCase(name, "soundflower");
}

std::shared_ptr<CaptureBackend> makePlatformBackend() {
#if defined(_WIN32)
    return std::make_shared<WasapiBackend>();
#elif defined(__APPLE__)
    return std::make_shared<CoreAudioBackend>();
#else
    return std::make_shared<AlsaPulseBackend>();
#endif
}

} // namespace loopscribe
