#ifndef SYNTHETIC_BACKEND_HPP
#define SYNTHETIC_BACKEND_HPP

#include "audio/audio_backend.hpp"

#include <cstddef>

// Scripted audio layer: reports a fixed device list and generates a sine tone
// from a background thread, optionally paced in real time. Used by tests and
// the --synthetic mode of the CLI.
class SyntheticBackend : public AudioBackend {
public:
    struct Config {
        std::vector<Device> devices;
        bool failEnumeration = false;

        // When false the stream opens at the native format below and the
        // capture engine has to convert.
        bool honourRequest = true;
        int nativeSampleRate = 48000;
        int nativeChannels = 2;

        int framesPerCallback = 480;
        bool realtime = true;

        double toneHz = 440.0;
        double amplitude = 0.25;   // fraction of full scale

        size_t totalFrames = 0;    // 0 = unlimited
        bool loseAtEnd = false;    // report the device as lost after totalFrames
    };

    SyntheticBackend();
    explicit SyntheticBackend(Config config);

    std::vector<Device> listDevices() override;
    std::optional<Device> defaultDevice() override;

    std::unique_ptr<AudioStream> openStream(const Device& device,
                                            const StreamFormat& requested,
                                            int framesPerBuffer,
                                            SamplesCallback onSamples,
                                            LostCallback onLost) override;

    static Device defaultSyntheticDevice();

private:
    Config config_;
};

#endif
