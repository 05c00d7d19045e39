#include "audio/audio_device.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace loopscribe {

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a))
                                  == std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

std::string describeDevice(const DeviceDescriptor& device) {
    std::ostringstream oss;
    oss << "[" << device.index << "] " << device.name
        << " — API: " << (device.hostApiName.empty() ? "?" : device.hostApiName)
        << ", inCh: " << device.maxInputChannels
        << ", outCh: " << device.maxOutputChannels
        << ", defaultSR: " << device.defaultSampleRate;
    if (device.isLoopback) oss << " [loopback]";
    if (device.isDefaultInput) oss << " [default input]";
    return oss.str();
}

} // namespace loopscribe
