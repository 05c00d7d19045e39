#include "audio/device_resolver.hpp"
#include <algorithm>
#include <iostream>

namespace loopscribe {

namespace {

const DeviceDescriptor* findByIndex(const std::vector<DeviceDescriptor>& devices, int index) {
    auto it = std::find_if(devices.begin(), devices.end(),
                           [index](const DeviceDescriptor& d) { return d.index == index; });
    return it == devices.end() ? nullptr : &*it;
}

} // namespace

const char* toString(ResolutionRule rule) {
    switch (rule) {
        case ResolutionRule::PreferredInput:   return "preferred input";
        case ResolutionRule::OutputLoopback:   return "output loopback";
        case ResolutionRule::LoopbackDevice:   return "loopback device";
        case ResolutionRule::PreferredHostApi: return "preferred host API";
        case ResolutionRule::PlatformDefault:  return "platform default";
        case ResolutionRule::None:             return "none";
    }
    return "none";
}

std::optional<int> DeviceResolver::resolve(std::optional<int> preferredInput,
                                           std::optional<int> preferredOutput) const {
    const std::vector<DeviceDescriptor> devices = backend_.devices();

    if (preferredInput) {
        const DeviceDescriptor* device = findByIndex(devices, *preferredInput);
        if (device && device->canCapture()) {
            std::cout << "Using preferred input device: " << describeDevice(*device) << std::endl;
            return device->index;
        }
        std::cerr << "Warning: preferred input device " << *preferredInput
                  << (device ? " has no input channels" : " does not exist") << ", ignoring" << std::endl;
    }

    if (preferredOutput) {
        const DeviceDescriptor* output = findByIndex(devices, *preferredOutput);
        if (!output) {
            std::cerr << "Warning: preferred output device " << *preferredOutput
                      << " does not exist, ignoring" << std::endl;
        } else {
            for (const auto& device : devices) {
                if (device.canCapture()
                    && containsIgnoreCase(device.name, output->name)
                    && containsIgnoreCase(device.name, "loopback")) {
                    std::cout << "Using loopback of output '" << output->name << "': "
                              << describeDevice(device) << std::endl;
                    return device.index;
                }
            }
            std::cerr << "Warning: no loopback device found for output '" << output->name << "'" << std::endl;
        }
    }

    return std::nullopt;
}

DeviceResolution DeviceResolver::resolveForCapture(std::optional<int> resolvedIndex) const {
    DeviceResolution result;
    const std::vector<DeviceDescriptor> devices = backend_.devices();
    result.trace.push_back("backend " + backend_.name() + ": " + std::to_string(devices.size()) + " devices");

    if (resolvedIndex) {
        const DeviceDescriptor* device = findByIndex(devices, *resolvedIndex);
        if (device && device->canCapture()) {
            result.device = *device;
            result.rule = ResolutionRule::PreferredInput;
            result.trace.push_back("index " + std::to_string(*resolvedIndex) + " accepted");
            return result;
        }
        result.trace.push_back("index " + std::to_string(*resolvedIndex)
                               + (device ? " has no input channels" : " not found"));
    }

    for (const auto& device : devices) {
        if (device.canCapture() && containsIgnoreCase(device.name, "loopback")) {
            result.device = device;
            result.rule = ResolutionRule::LoopbackDevice;
            result.trace.push_back("loopback device " + std::to_string(device.index));
            return result;
        }
    }
    // Platform-specific loopback flags (monitor sources, virtual drivers) rank
    // below an explicit "loopback" name.
    for (const auto& device : devices) {
        if (device.canCapture() && device.isLoopback) {
            result.device = device;
            result.rule = ResolutionRule::LoopbackDevice;
            result.trace.push_back("loopback-flagged device " + std::to_string(device.index));
            return result;
        }
    }
    result.trace.push_back("no loopback input device");

    const int hostApi = backend_.preferredHostApi();
    for (const auto& device : devices) {
        if (device.canCapture() && device.hostApiId == hostApi) {
            result.device = device;
            result.rule = ResolutionRule::PreferredHostApi;
            result.trace.push_back("host API device " + std::to_string(device.index));
            return result;
        }
    }
    result.trace.push_back("no input device on preferred host API " + std::to_string(hostApi));

    if (auto fallback = backend_.defaultInputDevice()) {
        const DeviceDescriptor* device = findByIndex(devices, *fallback);
        if (device && device->canCapture()) {
            result.device = *device;
            result.rule = ResolutionRule::PlatformDefault;
            result.trace.push_back("platform default " + std::to_string(*fallback));
            return result;
        }
        result.trace.push_back("platform default " + std::to_string(*fallback) + " unusable");
    } else {
        result.trace.push_back("no platform default input");
    }
    return result;
}

} // namespace loopscribe
