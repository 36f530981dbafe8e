#include "audio/level_meter.hpp"

#include <algorithm>
#include <cmath>

namespace level_meter {

float rms(const int16_t* samples, size_t n) {
    if (!samples || n == 0) return 0.0f;
    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double x = (double)samples[i] / 32768.0;
        acc += x * x;
    }
    acc /= (double)n;
    return (float)std::sqrt(acc);
}

float level(const AudioChunk& chunk) {
    const float r = rms(chunk.samples.data(), chunk.samples.size());
    return std::min(1.0f, std::max(0.0f, r * kGain));
}

} // namespace level_meter
