#ifndef AUDIO_BACKEND_HPP
#define AUDIO_BACKEND_HPP

#include "audio/device.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Open input stream on a host audio device. Samples are delivered from the
// backend's own thread in the stream's native format.
class AudioStream {
public:
    virtual ~AudioStream() = default;

    virtual void start() = 0;
    virtual void stop() = 0;

    virtual StreamFormat nativeFormat() const = 0;
};

// Host audio layer: enumeration plus raw-sample capture.
class AudioBackend {
public:
    // Interleaved frames in the stream's native format.
    using SamplesCallback = std::function<void(const int16_t* samples, size_t frames)>;
    // Called once when the device stops delivering without stop() being called.
    using LostCallback = std::function<void(const std::string& reason)>;

    virtual ~AudioBackend() = default;

    virtual std::vector<Device> listDevices() = 0;
    virtual std::optional<Device> defaultDevice() = 0;

    // Opens at `requested` when the device supports it, otherwise at the
    // closest format the device offers.
    virtual std::unique_ptr<AudioStream> openStream(const Device& device,
                                                    const StreamFormat& requested,
                                                    int framesPerBuffer,
                                                    SamplesCallback onSamples,
                                                    LostCallback onLost) = 0;
};

#endif
