#ifndef DEVICE_HPP
#define DEVICE_HPP

#include <string>

// Snapshot of one input-capable device. The index is only meaningful for the
// enumeration that produced it.
struct Device {
    int index = -1;
    std::string name;
    int channelCount = 0;
    int defaultSampleRate = 0;
};

// Sample layout of a PCM16 stream.
struct StreamFormat {
    int sampleRate = 16000;
    int channels = 1;

    bool operator==(const StreamFormat& other) const {
        return sampleRate == other.sampleRate && channels == other.channels;
    }
    bool operator!=(const StreamFormat& other) const { return !(*this == other); }
};

#endif
