#pragma once
#include "audio/audio_device.hpp"
#include "audio/capture_backend.hpp"
#include <optional>
#include <string>
#include <vector>

namespace loopscribe {

enum class ResolutionRule {
    PreferredInput,   // caller's input index, input-capable
    OutputLoopback,   // loopback twin of the caller's output device
    LoopbackDevice,   // any input device flagged as loopback
    PreferredHostApi, // any input device on the backend's preferred host API
    PlatformDefault,  // the platform default input
    None
};

const char* toString(ResolutionRule rule);

struct DeviceResolution {
    std::optional<DeviceDescriptor> device;
    ResolutionRule rule{ResolutionRule::None};
    std::vector<std::string> trace; // human-readable steps, for error reports

    explicit operator bool() const { return device.has_value(); }
};

// Chooses the capture endpoint. Every call enumerates the backend afresh;
// indices from a previous call are never trusted. Read-only, so it may run
// concurrently with an active capture session.
class DeviceResolver {
public:
    explicit DeviceResolver(const CaptureBackend& backend) : backend_(backend) {}

    // Preferred input (if input-capable), then the loopback device mirroring
    // the preferred output. std::nullopt lets the capture engine fall back.
    std::optional<int> resolve(std::optional<int> preferredInput,
                               std::optional<int> preferredOutput) const;

    // Used by the capture engine: re-validates `resolvedIndex` against a fresh
    // enumeration, then falls back to loopback, preferred host API and the
    // platform default, in that order.
    DeviceResolution resolveForCapture(std::optional<int> resolvedIndex) const;

private:
    const CaptureBackend& backend_;
};

} // namespace loopscribe
