#ifndef CAPTURE_ENGINE_HPP
#define CAPTURE_ENGINE_HPP

#include "audio/audio_backend.hpp"
#include "audio/audio_chunk.hpp"
#include "audio/chunk_channel.hpp"
#include "audio/format_converter.hpp"
#include "core/errors.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

struct CaptureConfig {
    int sampleRate = 16000;
    int channels = 1;
    int chunkSize = 256;             // frames per chunk

    size_t queueCapacity = 32;       // chunks buffered between device and consumer
    OverflowPolicy overflow = OverflowPolicy::DropOldest;

    double maxDuration = 0.0;        // seconds of audio to deliver, 0 = until closed

    // A device that stops calling back for this long is treated as lost.
    // 0 disables the check.
    int stallTimeoutMs = 2000;
};

// One open input device. Chunks are produced from the device callback into a
// bounded channel and consumed either by pulling with next() or by a handler
// running on a dedicated delivery thread after start(). The two modes are
// exclusive for the lifetime of the handle. The handle must not be destroyed
// from inside its own chunk or error handler.
class CaptureHandle {
public:
    using ChunkHandler = std::function<void(AudioChunk&& chunk)>;
    using ErrorHandler = std::function<void(const StreamError& error)>;

    ~CaptureHandle();

    CaptureHandle(const CaptureHandle&) = delete;
    CaptureHandle& operator=(const CaptureHandle&) = delete;

    // Pull mode. Blocks until a chunk is ready. Returns false once the
    // duration bound is reached or the handle is closed. Throws
    // DeviceLostError once, after the chunks captured before the loss.
    bool next(AudioChunk& chunk);

    // Push mode. `onChunk` must return within chunkSeconds(); when it does
    // not, queued chunks pile up and the oldest is dropped.
    void start(ChunkHandler onChunk, ErrorHandler onError = nullptr);

    // Stops the device and lets the consumer drain what was already
    // captured. Push-mode delivery has finished when this returns. The device
    // stays open until close().
    void stop();

    // stop() without waiting for delivery.
    void halt();

    // Push mode: waits until every chunk captured before halt() went through
    // the handler. True immediately when push mode was never started.
    bool waitDrained(std::chrono::milliseconds timeout);

    // Idempotent; may be called from any thread. Discards queued chunks and
    // releases the device.
    void close();

    bool isOpen() const { return !closed_.load(); }
    const Device& device() const { return device_; }
    StreamFormat format() const;
    StreamFormat deviceFormat() const;
    double chunkSeconds() const;

    uint64_t chunksProduced() const { return produced_.load(); }
    size_t droppedChunks() const { return channel_.droppedCount(); }

private:
    friend class CaptureEngine;

    enum class Mode { None, Pull, Push };

    CaptureHandle(Device device, const CaptureConfig& config);

    void onSamples(const int16_t* samples, size_t frames);
    void onLost(const std::string& reason);
    void emitChunk(std::vector<int16_t>&& samples);
    void deliver(ChunkHandler onChunk, ErrorHandler onError);
    void claimMode(Mode mode);
    void joinDelivery();
    void checkStalled();
    void logDrops();

    Device device_;
    CaptureConfig config_;
    uint64_t maxChunks_ = 0;

    std::mutex stream_mutex_;
    std::unique_ptr<AudioStream> stream_;
    std::unique_ptr<FormatConverter> converter_;
    ChunkChannel<AudioChunk> channel_;

    std::thread delivery_;
    std::mutex join_mutex_;             // guards delivery_
    std::atomic<std::thread::id> deliveryId_{};
    std::mutex delivered_mutex_;
    std::condition_variable delivered_cv_;
    bool delivered_ = false;
    std::mutex mode_mutex_;
    Mode mode_ = Mode::None;

    std::atomic<bool> stopped_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> exhausted_{false};
    std::atomic<uint64_t> produced_{0};
    std::atomic<std::chrono::steady_clock::rep> lastCallback_{0};
    size_t dropsLogged_ = 0;            // consumer side only

    std::mutex lost_mutex_;
    bool lost_ = false;
    bool lostReported_ = false;
    std::string lostReason_;
};

class CaptureEngine {
public:
    explicit CaptureEngine(AudioBackend& backend);

    // Opens `device`, or the default input when none is given. Throws
    // DeviceEnumerationError when there is no input device to open.
    std::unique_ptr<CaptureHandle> open(const std::optional<Device>& device,
                                        const CaptureConfig& config = CaptureConfig());

private:
    AudioBackend& backend_;
};

#endif
