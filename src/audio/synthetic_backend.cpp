#include "audio/synthetic_backend.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <thread>
#include <utility>

namespace {

constexpr double kTwoPi = 6.283185307179586;

class SyntheticStream : public AudioStream {
public:
    SyntheticStream(const SyntheticBackend::Config& config, const StreamFormat& format,
                    AudioBackend::SamplesCallback onSamples, AudioBackend::LostCallback onLost)
        : config_(config), format_(format),
          onSamples_(std::move(onSamples)), onLost_(std::move(onLost)) {}

    ~SyntheticStream() override { stop(); }

    void start() override {
        if (running_.exchange(true)) return;
        thread_ = std::thread(&SyntheticStream::run, this);
    }

    void stop() override {
        running_.store(false);
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
            thread_.join();
        }
    }

    StreamFormat nativeFormat() const override { return format_; }

private:
    void run() {
        const int frames = std::max(1, config_.framesPerCallback);
        const double step = kTwoPi * config_.toneHz / format_.sampleRate;
        const double peak = std::min(1.0, std::max(0.0, config_.amplitude)) * 32767.0;

        std::vector<int16_t> buff((size_t)frames * format_.channels);
        auto nextCallback = std::chrono::steady_clock::now();

        while (running_.load()) {
            size_t toWrite = (size_t)frames;
            if (config_.totalFrames > 0) {
                if (produced_ >= config_.totalFrames) break;
                toWrite = std::min(toWrite, config_.totalFrames - produced_);
            }

            for (size_t i = 0; i < toWrite; ++i) {
                const auto v = (int16_t)std::lround(peak * std::sin(phase_));
                phase_ += step;
                for (int c = 0; c < format_.channels; ++c) buff[i * format_.channels + c] = v;
            }
            produced_ += toWrite;

            if (onSamples_) onSamples_(buff.data(), toWrite);

            if (config_.realtime) {
                nextCallback += std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                    std::chrono::duration<double>((double)toWrite / format_.sampleRate));
                std::this_thread::sleep_until(nextCallback);
            }
        }

        if (running_.load() && config_.loseAtEnd && onLost_) {
            onLost_("synthetic device unplugged");
        }
    }

    SyntheticBackend::Config config_;
    StreamFormat format_;
    AudioBackend::SamplesCallback onSamples_;
    AudioBackend::LostCallback onLost_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    size_t produced_ = 0;
    double phase_ = 0.0;
};

} // namespace

Device SyntheticBackend::defaultSyntheticDevice() {
    Device device;
    device.index = 0;
    device.name = "Synthetic Tone";
    device.channelCount = 2;
    device.defaultSampleRate = 48000;
    return device;
}

SyntheticBackend::SyntheticBackend() {
    config_.devices.push_back(defaultSyntheticDevice());
}

SyntheticBackend::SyntheticBackend(Config config) : config_(std::move(config)) {}

std::vector<Device> SyntheticBackend::listDevices() {
    if (config_.failEnumeration) {
        throw DeviceEnumerationError("synthetic audio subsystem unavailable");
    }
    return config_.devices;
}

std::optional<Device> SyntheticBackend::defaultDevice() {
    if (config_.failEnumeration) {
        throw DeviceEnumerationError("synthetic audio subsystem unavailable");
    }
    if (config_.devices.empty()) return std::nullopt;
    return config_.devices.front();
}

std::unique_ptr<AudioStream> SyntheticBackend::openStream(const Device& device,
                                                          const StreamFormat& requested,
                                                          int framesPerBuffer,
                                                          SamplesCallback onSamples,
                                                          LostCallback onLost) {
    auto it = std::find_if(config_.devices.begin(), config_.devices.end(),
                           [&](const Device& d) { return d.index == device.index; });
    if (it == config_.devices.end()) {
        throw DeviceEnumerationError("input device " + std::to_string(device.index) + " is no longer available");
    }

    StreamFormat format = requested;
    if (!config_.honourRequest) {
        format.sampleRate = config_.nativeSampleRate;
        format.channels = config_.nativeChannels;
    }

    Config streamConfig = config_;
    if (streamConfig.framesPerCallback <= 0) streamConfig.framesPerCallback = framesPerBuffer;
    return std::make_unique<SyntheticStream>(streamConfig, format, std::move(onSamples), std::move(onLost));
}
