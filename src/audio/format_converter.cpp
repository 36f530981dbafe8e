#include "audio/format_converter.hpp"

#include <algorithm>
#include <cmath>

static int16_t toPcm16(float v) {
    long s = std::lround(v);
    if (s > 32767) s = 32767; else if (s < -32768) s = -32768;
    return static_cast<int16_t>(s);
}

// Constructor
FormatConverter::FormatConverter(const StreamFormat& input, const StreamFormat& output, size_t framesPerChunk)
    : input_(input), output_(output), framesPerChunk_(framesPerChunk == 0 ? 1 : framesPerChunk) {
    if (input_.channels < 1) input_.channels = 1;
    if (output_.channels < 1) output_.channels = 1;
    ratio_ = (double)input_.sampleRate / (double)output_.sampleRate;
    pending_.reserve(framesPerChunk_ * output_.channels);
}

void FormatConverter::mixFrame(const int16_t* in, float* out) const {
    const int inCh = input_.channels;
    const int outCh = output_.channels;

    if (outCh == 1) {
        float sum = 0.0f;
        for (int c = 0; c < inCh; ++c) sum += in[c];
        out[0] = sum / inCh;
    } else if (inCh == 1) {
        for (int c = 0; c < outCh; ++c) out[c] = in[0];
    } else {
        for (int c = 0; c < outCh; ++c) out[c] = in[std::min(c, inCh - 1)];
    }
}

void FormatConverter::append(const float* frame) {
    for (int c = 0; c < output_.channels; ++c) pending_.push_back(toPcm16(frame[c]));
}

void FormatConverter::appendRaw(const int16_t* frame) {
    pending_.insert(pending_.end(), frame, frame + output_.channels);
}

void FormatConverter::emitFull(const ChunkSink& sink) {
    const size_t chunkSamples = framesPerChunk_ * output_.channels;
    while (pending_.size() >= chunkSamples) {
        std::vector<int16_t> chunk(pending_.begin(), pending_.begin() + chunkSamples);
        pending_.erase(pending_.begin(), pending_.begin() + chunkSamples);
        sink(std::move(chunk));
    }
}

void FormatConverter::feed(const int16_t* samples, size_t frames, const ChunkSink& sink) {
    if (!samples || frames == 0) return;

    const int outCh = output_.channels;

    if (passthrough()) {
        for (size_t i = 0; i < frames; ++i) appendRaw(samples + i * input_.channels);
        emitFull(sink);
        return;
    }

    std::vector<float> mixed(outCh);
    for (size_t i = 0; i < frames; ++i) {
        mixFrame(samples + i * input_.channels, mixed.data());
        history_.insert(history_.end(), mixed.begin(), mixed.end());
    }

    if (input_.sampleRate == output_.sampleRate) {
        for (size_t i = 0; i < history_.size(); i += outCh) append(&history_[i]);
        history_.clear();
        emitFull(sink);
        return;
    }

    // Linear interpolation between neighbouring input frames
    const size_t available = history_.size() / outCh;
    std::vector<float> frame(outCh);
    while (position_ + 1.0 < (double)available) {
        const size_t i = (size_t)position_;
        const float frac = (float)(position_ - (double)i);
        for (int c = 0; c < outCh; ++c) {
            const float a = history_[i * outCh + c];
            const float b = history_[(i + 1) * outCh + c];
            frame[c] = a + (b - a) * frac;
        }
        append(frame.data());
        position_ += ratio_;
    }

    const size_t consumed = std::min((size_t)position_, available);
    history_.erase(history_.begin(), history_.begin() + consumed * outCh);
    position_ -= (double)consumed;

    emitFull(sink);
}
