#pragma once
#include <string>
#include <vector>

namespace loopscribe {

// Snapshot of one endpoint as reported by the platform at enumeration time.
// Indices are only meaningful until the OS audio topology changes.
struct DeviceDescriptor {
    int index{-1};
    std::string name;
    int maxInputChannels{0};
    int maxOutputChannels{0};
    int defaultSampleRate{0};
    int hostApiId{-1};           // PaHostApiTypeId of the owning host API
    std::string hostApiName;
    bool isLoopback{false};
    bool isDefaultInput{false};

    bool canCapture() const { return maxInputChannels > 0; }
};

// One-line summary: "[3] Speakers (Realtek) [Loopback] — API: Windows WASAPI, inCh: 2, ..."
std::string describeDevice(const DeviceDescriptor& device);

// Case-insensitive substring test used by the loopback heuristics.
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

} // namespace loopscribe
