#ifndef PORTAUDIO_BACKEND_HPP
#define PORTAUDIO_BACKEND_HPP

#include "audio/audio_backend.hpp"

// Host audio through PortAudio. Every enumeration initializes PortAudio
// afresh so hot-plugged devices show up between calls.
class PortAudioBackend : public AudioBackend {
public:
    std::vector<Device> listDevices() override;
    std::optional<Device> defaultDevice() override;

    std::unique_ptr<AudioStream> openStream(const Device& device,
                                            const StreamFormat& requested,
                                            int framesPerBuffer,
                                            SamplesCallback onSamples,
                                            LostCallback onLost) override;
};

#endif
