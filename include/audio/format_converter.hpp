#ifndef FORMAT_CONVERTER_HPP
#define FORMAT_CONVERTER_HPP

#include "audio/device.hpp"

#include <cstdint>
#include <functional>
#include <vector>

// Turns a device's native PCM16 stream into fixed-size chunks of the
// requested format: channel down/up-mixing followed by linear resampling.
// Interpolation state carries across feed() calls so chunk boundaries do not
// click. Only whole chunks are emitted; a trailing remainder is never flushed.
class FormatConverter {
public:
    using ChunkSink = std::function<void(std::vector<int16_t>&& samples)>;

    FormatConverter(const StreamFormat& input, const StreamFormat& output, size_t framesPerChunk);

    void feed(const int16_t* samples, size_t frames, const ChunkSink& sink);

    bool passthrough() const { return input_ == output_; }
    const StreamFormat& input() const { return input_; }
    const StreamFormat& output() const { return output_; }

private:
    void mixFrame(const int16_t* in, float* out) const;
    void append(const float* frame);
    void appendRaw(const int16_t* frame);
    void emitFull(const ChunkSink& sink);

    StreamFormat input_;
    StreamFormat output_;
    size_t framesPerChunk_;

    double ratio_;                 // input frames per output frame
    double position_ = 0.0;        // next output time, in frames of history_
    std::vector<float> history_;   // mixed, not yet consumed input frames

    std::vector<int16_t> pending_;
};

#endif
