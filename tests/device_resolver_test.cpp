#include "audio/device_resolver.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace loopscribe;
using loopscribe::test::FakeBackend;
using loopscribe::test::makeDevice;

namespace {

void fillWindowsLike(FakeBackend& backend) {
    backend.hostApi = 13;
    backend.deviceTable = {
        makeDevice(0, "Microsoft Sound Mapper - Input", 2, 0, 44100, 2),
        makeDevice(1, "Microphone (USB Audio)", 1, 0, 48000, 2),
        makeDevice(2, "Speakers (Realtek)", 0, 2, 48000, 13),
        makeDevice(3, "Headphones (USB Audio)", 0, 2, 48000, 13),
        makeDevice(4, "Speakers (Realtek) [Loopback]", 2, 0, 48000, 13),
    };
    backend.defaultInput = 1;
}

} // namespace

TEST(DeviceResolverTest, PreferredInputWins) {
    FakeBackend backend;
    fillWindowsLike(backend);
    DeviceResolver resolver(backend);
    EXPECT_EQ(resolver.resolve(1, 2), 1);
}

TEST(DeviceResolverTest, PreferredInputWithoutChannelsFallsThrough) {
    FakeBackend backend;
    fillWindowsLike(backend);
    DeviceResolver resolver(backend);
    EXPECT_EQ(resolver.resolve(2, std::nullopt), std::nullopt);
    EXPECT_EQ(resolver.resolve(3, 2), 4);
}

TEST(DeviceResolverTest, OutputMapsToItsLoopbackTwin) {
    FakeBackend backend;
    fillWindowsLike(backend);
    DeviceResolver resolver(backend);
    EXPECT_EQ(resolver.resolve(std::nullopt, 2), 4);
}

TEST(DeviceResolverTest, OutputWithoutLoopbackTwinResolvesToNothing) {
    FakeBackend backend;
    fillWindowsLike(backend);
    DeviceResolver resolver(backend);
    EXPECT_EQ(resolver.resolve(std::nullopt, 3), std::nullopt);
}

TEST(DeviceResolverTest, OutputMatchIsCaseInsensitive) {
    FakeBackend backend;
    fillWindowsLike(backend);
    backend.deviceTable[4].name = "SPEAKERS (REALTEK) LOOPBACK";
    DeviceResolver resolver(backend);
    EXPECT_EQ(resolver.resolve(std::nullopt, 2), 4);
}

TEST(DeviceResolverTest, NonexistentIndicesAreIgnored) {
    FakeBackend backend;
    fillWindowsLike(backend);
    DeviceResolver resolver(backend);
    EXPECT_EQ(resolver.resolve(42, 99), std::nullopt);
    EXPECT_EQ(resolver.resolve(42, 2), 4);
}

TEST(DeviceResolverTest, EveryCallEnumeratesAgain) {
    FakeBackend backend;
    fillWindowsLike(backend);
    DeviceResolver resolver(backend);
    resolver.resolve(1, std::nullopt);
    resolver.resolve(1, std::nullopt);
    EXPECT_EQ(backend.enumerations.load(), 2);

    // Topology change between calls: index 1 is gone now.
    backend.setDevices({makeDevice(0, "Microsoft Sound Mapper - Input", 2, 0)});
    EXPECT_EQ(resolver.resolve(1, std::nullopt), std::nullopt);
}

TEST(DeviceResolverTest, CaptureFallbackPrefersLoopbackName) {
    FakeBackend backend;
    fillWindowsLike(backend);
    DeviceResolver resolver(backend);
    DeviceResolution r = resolver.resolveForCapture(std::nullopt);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.device->index, 4);
    EXPECT_EQ(r.rule, ResolutionRule::LoopbackDevice);
}

TEST(DeviceResolverTest, CaptureFallbackUsesLoopbackFlag) {
    FakeBackend backend;
    backend.deviceTable = {
        makeDevice(0, "Built-in Microphone", 1, 0, 44100, 5),
        makeDevice(1, "BlackHole 2ch", 2, 2, 48000, 5),
    };
    backend.deviceTable[1].isLoopback = true;
    DeviceResolver resolver(backend);
    DeviceResolution r = resolver.resolveForCapture(std::nullopt);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.device->index, 1);
    EXPECT_EQ(r.rule, ResolutionRule::LoopbackDevice);
}

TEST(DeviceResolverTest, CaptureFallbackThenHostApiThenDefault) {
    FakeBackend backend;
    backend.hostApi = 8;
    backend.deviceTable = {
        makeDevice(0, "hw:0,0", 2, 0, 44100, 3),
        makeDevice(1, "default", 2, 2, 44100, 8),
    };
    backend.defaultInput = 0;
    DeviceResolver resolver(backend);

    DeviceResolution byApi = resolver.resolveForCapture(std::nullopt);
    ASSERT_TRUE(byApi);
    EXPECT_EQ(byApi.device->index, 1);
    EXPECT_EQ(byApi.rule, ResolutionRule::PreferredHostApi);

    backend.hostApi = 99;
    DeviceResolution byDefault = resolver.resolveForCapture(std::nullopt);
    ASSERT_TRUE(byDefault);
    EXPECT_EQ(byDefault.device->index, 0);
    EXPECT_EQ(byDefault.rule, ResolutionRule::PlatformDefault);
}

TEST(DeviceResolverTest, CaptureRevalidatesResolvedIndex) {
    FakeBackend backend;
    fillWindowsLike(backend);
    DeviceResolver resolver(backend);

    DeviceResolution accepted = resolver.resolveForCapture(1);
    ASSERT_TRUE(accepted);
    EXPECT_EQ(accepted.device->index, 1);
    EXPECT_EQ(accepted.rule, ResolutionRule::PreferredInput);

    // An output-only index is not trusted; the loopback fallback takes over.
    DeviceResolution fallback = resolver.resolveForCapture(2);
    ASSERT_TRUE(fallback);
    EXPECT_EQ(fallback.device->index, 4);
}

TEST(DeviceResolverTest, NoUsableDeviceReportsTrace) {
    FakeBackend backend;
    backend.deviceTable = {makeDevice(0, "Speakers", 0, 2)};
    DeviceResolver resolver(backend);
    DeviceResolution r = resolver.resolveForCapture(7);
    EXPECT_FALSE(r);
    EXPECT_EQ(r.rule, ResolutionRule::None);
    ASSERT_GE(r.trace.size(), 3u);
    EXPECT_NE(r.trace[1].find("7"), std::string::npos);
}
