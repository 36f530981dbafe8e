#ifndef AUDIO_CHUNK_HPP
#define AUDIO_CHUNK_HPP

#include <chrono>
#include <cstdint>
#include <vector>

// Fixed-size block of PCM16 samples, little-endian, interleaved when the
// capture format has more than one channel. Not modified after creation.
struct AudioChunk {
    std::vector<int16_t> samples;
    uint64_t sequence = 0;
    std::chrono::steady_clock::time_point capturedAt;

    size_t byteSize() const { return samples.size() * sizeof(int16_t); }
};

#endif
