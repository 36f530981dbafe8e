#ifndef LEVEL_METER_HPP
#define LEVEL_METER_HPP

#include "audio/audio_chunk.hpp"

#include <cstddef>
#include <cstdint>

namespace level_meter {

// Display gain applied to the RMS before clamping.
constexpr float kGain = 10.0f;

// Root-mean-square amplitude normalized to full scale (32768).
float rms(const int16_t* samples, size_t n);

// Loudness for feedback display: clamp(rms * kGain, 0, 1). An empty chunk is 0.
float level(const AudioChunk& chunk);

} // namespace level_meter

#endif
