#include "audio/portaudio_backend.hpp"
#include "core/errors.hpp"

#include <portaudio.h>

#include <algorithm>
#include <atomic>
#include <iostream>
#include <utility>

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw DeviceEnumerationError(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

namespace {

// Pairs Pa_Initialize with Pa_Terminate; PortAudio reference-counts these.
class PaLibrary {
public:
    PaLibrary() { pa_check(Pa_Initialize(), "Pa_Initialize"); }
    ~PaLibrary() { Pa_Terminate(); }

    PaLibrary(const PaLibrary&) = delete;
    PaLibrary& operator=(const PaLibrary&) = delete;
};

Device toDevice(PaDeviceIndex index, const PaDeviceInfo* info) {
    Device device;
    device.index = index;
    device.name = info->name ? info->name : "(unknown)";
    device.channelCount = info->maxInputChannels;
    device.defaultSampleRate = (int)info->defaultSampleRate;
    return device;
}

class PortAudioStream : public AudioStream {
public:
    PortAudioStream(const Device& device, const StreamFormat& requested, int framesPerBuffer,
                    AudioBackend::SamplesCallback onSamples, AudioBackend::LostCallback onLost)
        : onSamples_(std::move(onSamples)), onLost_(std::move(onLost)) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(device.index);
        if (!info || info->maxInputChannels <= 0) {
            throw DeviceEnumerationError("input device " + std::to_string(device.index) + " is no longer available");
        }

        PaStreamParameters inParams{};
        inParams.device = device.index;
        inParams.channelCount = requested.channels;
        inParams.sampleFormat = paInt16;
        inParams.suggestedLatency = info->defaultLowInputLatency;
        inParams.hostApiSpecificStreamInfo = nullptr;

        format_ = requested;
        if (requested.channels > info->maxInputChannels ||
            Pa_IsFormatSupported(&inParams, nullptr, requested.sampleRate) != paFormatIsSupported) {
            // Fall back to what the hardware offers; the capture engine converts.
            format_.channels = std::min(std::max(1, requested.channels), info->maxInputChannels);
            format_.sampleRate = (int)info->defaultSampleRate;
            inParams.channelCount = format_.channels;
            std::cout << "[Devices] [INFO] " << info->name << " cannot open at " << requested.sampleRate
                      << " Hz / " << requested.channels << " ch, using " << format_.sampleRate
                      << " Hz / " << format_.channels << " ch\n";
        }

        pa_check(
            Pa_OpenStream(&stream_, &inParams, nullptr,
                          format_.sampleRate, framesPerBuffer,
                          paNoFlag, &PortAudioStream::paCallback, this),
            "Pa_OpenStream"
        );
        pa_check(Pa_SetStreamFinishedCallback(stream_, &PortAudioStream::paFinished), "Pa_SetStreamFinishedCallback");
    }

    ~PortAudioStream() override {
        stop();
        if (stream_) {
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
    }

    void start() override {
        stopping_.store(false);
        pa_check(Pa_StartStream(stream_), "Pa_StartStream");
    }

    void stop() override {
        if (stopping_.exchange(true)) return;
        if (stream_ && Pa_IsStreamActive(stream_) == 1) {
            PaError e = Pa_StopStream(stream_);
            if (e != paNoError) {
                std::cerr << "[Devices] [ERROR] Pa_StopStream: " << Pa_GetErrorText(e) << "\n";
            }
        }
        if (overflows_.load() > 0) {
            std::cout << "[Devices] [WARN] input overflowed " << overflows_.load() << " time(s)\n";
        }
    }

    StreamFormat nativeFormat() const override { return format_; }

private:
    static int paCallback(const void* input, void*, unsigned long frames,
                          const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags flags, void* userData) {
        auto* self = static_cast<PortAudioStream*>(userData);
        if (flags & paInputOverflow) {
            self->overflows_.fetch_add(1);
        }
        if (input && self->onSamples_) {
            self->onSamples_(static_cast<const int16_t*>(input), (size_t)frames);
        }
        return paContinue;
    }

    static void paFinished(void* userData) {
        auto* self = static_cast<PortAudioStream*>(userData);
        if (!self->stopping_.load() && self->onLost_) {
            self->onLost_("input stream finished unexpectedly");
        }
    }

    PaLibrary library_;
    PaStream* stream_ = nullptr;
    StreamFormat format_;
    AudioBackend::SamplesCallback onSamples_;
    AudioBackend::LostCallback onLost_;
    std::atomic<bool> stopping_{true};
    std::atomic<unsigned> overflows_{0};
};

} // namespace

std::vector<Device> PortAudioBackend::listDevices() {
    PaLibrary library;

    const PaDeviceIndex count = Pa_GetDeviceCount();
    if (count < 0) {
        throw DeviceEnumerationError(std::string("Pa_GetDeviceCount: ") + Pa_GetErrorText(count));
    }

    std::vector<Device> devices;
    for (PaDeviceIndex i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) {
            devices.push_back(toDevice(i, info));
        }
    }
    return devices;
}

std::optional<Device> PortAudioBackend::defaultDevice() {
    PaLibrary library;

    const PaDeviceIndex index = Pa_GetDefaultInputDevice();
    if (index == paNoDevice) return std::nullopt;

    const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
    if (!info || info->maxInputChannels <= 0) return std::nullopt;
    return toDevice(index, info);
}

std::unique_ptr<AudioStream> PortAudioBackend::openStream(const Device& device,
                                                          const StreamFormat& requested,
                                                          int framesPerBuffer,
                                                          SamplesCallback onSamples,
                                                          LostCallback onLost) {
    return std::make_unique<PortAudioStream>(device, requested, framesPerBuffer,
                                             std::move(onSamples), std::move(onLost));
}
