#include <cassert>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "audio/capture_engine.hpp"
#include "audio/device_registry.hpp"
#include "audio/synthetic_backend.hpp"

static SyntheticBackend::Config unpaced() {
    SyntheticBackend::Config config;
    config.devices.push_back(SyntheticBackend::defaultSyntheticDevice());
    config.realtime = false;
    return config;
}

static void testNoDevices() {
    SyntheticBackend backend{SyntheticBackend::Config()};
    DeviceRegistry registry(backend);
    assert(registry.listDevices().empty());
    assert(!registry.defaultDevice());

    CaptureEngine engine(backend);
    bool threw = false;
    try {
        engine.open(std::nullopt);
    } catch (const DeviceEnumerationError& e) {
        threw = std::string(e.what()).find("no input device available") != std::string::npos;
    }
    assert(threw);
}

static void testEnumerationFailure() {
    SyntheticBackend::Config config = unpaced();
    config.failEnumeration = true;
    SyntheticBackend backend(config);
    DeviceRegistry registry(backend);

    bool threw = false;
    try {
        registry.listDevices();
    } catch (const DeviceEnumerationError&) {
        threw = true;
    }
    assert(threw);
}

static void testRegistryLookup() {
    SyntheticBackend::Config config = unpaced();
    Device usb;
    usb.index = 3;
    usb.name = "USB Mic";
    usb.channelCount = 1;
    usb.defaultSampleRate = 44100;
    config.devices.insert(config.devices.begin(), usb);
    SyntheticBackend backend(config);
    DeviceRegistry registry(backend);

    const auto devices = registry.listDevices();
    assert(devices.size() == 2);
    assert(devices[0].index == 0 && devices[1].index == 3);
    assert(registry.findDevice(3) && registry.findDevice(3)->name == "USB Mic");
    assert(!registry.findDevice(7));
}

// Pull mode stops at the duration bound, whole chunks only
static void testPullDuration() {
    SyntheticBackend backend(unpaced());
    CaptureEngine engine(backend);

    CaptureConfig config;
    config.overflow = OverflowPolicy::Block;
    config.maxDuration = 0.5;                 // 8000 frames -> 31 chunks of 256
    auto handle = engine.open(std::nullopt, config);

    AudioChunk chunk;
    uint64_t expected = 0;
    while (handle->next(chunk)) {
        assert(chunk.sequence == expected);
        assert(chunk.samples.size() == 256);
        ++expected;
    }
    assert(expected == 31);
    assert(handle->droppedChunks() == 0);
    handle->close();
}

// Device runs at 48 kHz stereo; chunks still come out at the requested format
static void testConversion() {
    SyntheticBackend::Config synth = unpaced();
    synth.honourRequest = false;
    SyntheticBackend backend(synth);
    CaptureEngine engine(backend);

    CaptureConfig config;
    config.overflow = OverflowPolicy::Block;
    config.maxDuration = 0.1;
    auto handle = engine.open(std::nullopt, config);
    assert(handle->deviceFormat().sampleRate == 48000);
    assert(handle->deviceFormat().channels == 2);
    assert(handle->format().sampleRate == 16000 && handle->format().channels == 1);

    AudioChunk chunk;
    int count = 0;
    while (handle->next(chunk)) {
        assert(chunk.samples.size() == 256);
        ++count;
    }
    assert(count == 6);
}

// A handler slower than the producer loses the oldest chunks, never the order
static void testSlowPushHandler() {
    SyntheticBackend::Config synth = unpaced();
    synth.framesPerCallback = 256;
    synth.totalFrames = 256 * 10;
    SyntheticBackend backend(synth);
    CaptureEngine engine(backend);

    CaptureConfig config;
    config.queueCapacity = 2;
    auto handle = engine.open(std::nullopt, config);
    CaptureHandle* raw = handle.get();

    std::mutex mutex;
    std::vector<uint64_t> received;
    std::atomic<bool> sawLast{false};

    handle->start([&](AudioChunk&& chunk) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            received.push_back(chunk.sequence);
        }
        if (chunk.sequence == 9) sawLast.store(true);
        while (raw->chunksProduced() < 10) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!sawLast.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(sawLast.load());
    handle->stop();

    std::lock_guard<std::mutex> lock(mutex);
    assert(received.size() + handle->droppedChunks() == 10);
    assert(handle->droppedChunks() >= 7);
    bool gap = false;
    for (size_t i = 1; i < received.size(); ++i) {
        assert(received[i] > received[i - 1]);
        if (received[i] != received[i - 1] + 1) gap = true;
    }
    assert(gap || received.front() != 0);
    handle->close();
}

static void testDeviceLostPull() {
    SyntheticBackend::Config synth = unpaced();
    synth.totalFrames = 256 * 3;
    synth.loseAtEnd = true;
    SyntheticBackend backend(synth);
    CaptureEngine engine(backend);

    CaptureConfig config;
    config.overflow = OverflowPolicy::Block;
    auto handle = engine.open(std::nullopt, config);

    AudioChunk chunk;
    int count = 0;
    bool lost = false;
    try {
        while (handle->next(chunk)) ++count;
    } catch (const DeviceLostError&) {
        lost = true;
    }
    assert(lost);
    assert(count == 3);
    assert(!handle->next(chunk));
}

static void testDeviceLostPush() {
    SyntheticBackend::Config synth = unpaced();
    synth.totalFrames = 256 * 4;
    synth.loseAtEnd = true;
    SyntheticBackend backend(synth);
    CaptureEngine engine(backend);

    CaptureConfig config;
    config.overflow = OverflowPolicy::Block;
    auto handle = engine.open(std::nullopt, config);

    std::atomic<int> errors{0};
    handle->start([](AudioChunk&&) {}, [&](const StreamError& e) {
        assert(dynamic_cast<const DeviceLostError*>(&e) != nullptr);
        errors.fetch_add(1);
    });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (errors.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    handle->close();
    assert(errors.load() == 1);
}

// A device that silently stops calling back is reported as lost
static void testStalledDevice() {
    SyntheticBackend::Config synth = unpaced();
    synth.framesPerCallback = 256;
    synth.totalFrames = 256 * 2;
    SyntheticBackend backend(synth);
    CaptureEngine engine(backend);

    CaptureConfig config;
    config.overflow = OverflowPolicy::Block;
    config.stallTimeoutMs = 200;
    auto handle = engine.open(std::nullopt, config);

    AudioChunk chunk;
    int count = 0;
    bool lost = false;
    const auto started = std::chrono::steady_clock::now();
    try {
        while (handle->next(chunk)) ++count;
    } catch (const DeviceLostError& e) {
        lost = std::string(e.what()).find("no audio from the device") != std::string::npos;
    }
    assert(lost);
    assert(count == 2);
    assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(3));
    handle->close();
}

// Stalled push consumers hear about it through the error handler
static void testStalledDevicePush() {
    SyntheticBackend::Config synth = unpaced();
    synth.framesPerCallback = 256;
    synth.totalFrames = 256;
    SyntheticBackend backend(synth);
    CaptureEngine engine(backend);

    CaptureConfig config;
    config.stallTimeoutMs = 200;
    auto handle = engine.open(std::nullopt, config);

    std::atomic<int> chunks{0};
    std::atomic<int> errors{0};
    handle->start([&](AudioChunk&&) { chunks.fetch_add(1); },
                  [&](const StreamError& e) {
                      assert(dynamic_cast<const DeviceLostError*>(&e) != nullptr);
                      errors.fetch_add(1);
                  });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (errors.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(errors.load() == 1);
    assert(chunks.load() == 1);
    assert(handle->waitDrained(std::chrono::milliseconds(0)));
    handle->close();
}

// halt() returns at once; waitDrained() reports whether delivery caught up
static void testHaltThenDrain() {
    SyntheticBackend::Config synth = unpaced();
    synth.framesPerCallback = 256;
    synth.totalFrames = 256 * 4;
    SyntheticBackend backend(synth);
    CaptureEngine engine(backend);

    CaptureConfig config;
    config.overflow = OverflowPolicy::Block;
    config.queueCapacity = 8;
    auto handle = engine.open(std::nullopt, config);
    assert(handle->waitDrained(std::chrono::milliseconds(0)));

    std::atomic<bool> release{false};
    std::atomic<int> delivered{0};
    handle->start([&](AudioChunk&&) {
        while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        delivered.fetch_add(1);
    });
    while (handle->chunksProduced() < 4) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    const auto started = std::chrono::steady_clock::now();
    handle->halt();
    assert(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(500));
    assert(!handle->waitDrained(std::chrono::milliseconds(50)));

    release.store(true);
    assert(handle->waitDrained(std::chrono::seconds(3)));
    assert(delivered.load() == 4);
    handle->stop();
    handle->close();
}

static void testCloseIdempotent() {
    SyntheticBackend backend(unpaced());
    CaptureEngine engine(backend);
    auto handle = engine.open(std::nullopt);
    assert(handle->isOpen());

    std::thread other([&] { handle->close(); });
    handle->close();
    other.join();
    handle->close();
    assert(!handle->isOpen());

    AudioChunk chunk;
    assert(!handle->next(chunk));
}

int main() {
    testNoDevices();
    testEnumerationFailure();
    testRegistryLookup();
    testPullDuration();
    testConversion();
    testSlowPushHandler();
    testDeviceLostPull();
    testDeviceLostPush();
    testStalledDevice();
    testStalledDevicePush();
    testHaltThenDrain();
    testCloseIdempotent();
    return 0;
}
