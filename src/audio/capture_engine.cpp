#include "audio/capture_engine.hpp"
#include "audio/device_registry.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

// How often a waiting consumer checks that the device still calls back
static constexpr int kWatchdogPollMs = 100;

// Constructor
CaptureHandle::CaptureHandle(Device device, const CaptureConfig& config)
    : device_(std::move(device)), config_(config),
      channel_(config.queueCapacity, config.overflow) {
    if (config_.maxDuration > 0.0) {
        maxChunks_ = (uint64_t)(config_.maxDuration * config_.sampleRate / config_.chunkSize);
    }
}

// Destructor
CaptureHandle::~CaptureHandle() {
    close();
    joinDelivery();
}

StreamFormat CaptureHandle::format() const {
    StreamFormat format;
    format.sampleRate = config_.sampleRate;
    format.channels = config_.channels;
    return format;
}

StreamFormat CaptureHandle::deviceFormat() const {
    return converter_ ? converter_->input() : format();
}

double CaptureHandle::chunkSeconds() const {
    return (double)config_.chunkSize / config_.sampleRate;
}

// Device callback context: convert, slice into chunks, hand over
void CaptureHandle::onSamples(const int16_t* samples, size_t frames) {
    lastCallback_.store(std::chrono::steady_clock::now().time_since_epoch().count());
    if (closed_.load() || exhausted_.load()) return;
    converter_->feed(samples, frames, [this](std::vector<int16_t>&& chunk) {
        emitChunk(std::move(chunk));
    });
}

void CaptureHandle::emitChunk(std::vector<int16_t>&& samples) {
    if (exhausted_.load()) return;

    AudioChunk chunk;
    chunk.samples = std::move(samples);
    chunk.sequence = produced_.load();
    chunk.capturedAt = std::chrono::steady_clock::now();

    channel_.push(std::move(chunk));
    const uint64_t produced = produced_.fetch_add(1) + 1;

    if (maxChunks_ > 0 && produced >= maxChunks_) {
        exhausted_.store(true);
        channel_.close();
    }
}

void CaptureHandle::onLost(const std::string& reason) {
    if (stopped_.load() || closed_.load()) return;
    {
        std::lock_guard<std::mutex> lock(lost_mutex_);
        if (lost_) return;
        lost_ = true;
        lostReason_ = reason;
    }
    std::cerr << "[Capture] [ERROR] device " << device_.index << " lost: " << reason << "\n";
    channel_.close();
}

void CaptureHandle::claimMode(Mode mode) {
    std::lock_guard<std::mutex> lock(mode_mutex_);
    if (mode_ != Mode::None && mode_ != mode) {
        throw std::logic_error("capture handle is already consumed in the other mode");
    }
    if (mode == Mode::Push && mode_ == Mode::Push) {
        throw std::logic_error("capture handle already has a chunk handler");
    }
    mode_ = mode;
}

// Consumer side, so the device callback never writes to the log
void CaptureHandle::logDrops() {
    const size_t dropped = channel_.droppedCount();
    if (dropped != dropsLogged_) {
        std::cout << "[Capture] [WARN] consumer fell behind, dropped " << (dropped - dropsLogged_)
                  << " oldest chunk(s) (" << dropped << " total)\n";
        dropsLogged_ = dropped;
    }
}

// Hosts that lose a device often just stop calling back
void CaptureHandle::checkStalled() {
    if (config_.stallTimeoutMs <= 0 || stopped_.load() || closed_.load() || exhausted_.load()) return;

    const std::chrono::steady_clock::duration last(lastCallback_.load());
    const auto silent = std::chrono::steady_clock::now().time_since_epoch() - last;
    if (silent > std::chrono::milliseconds(config_.stallTimeoutMs)) {
        onLost("no audio from the device for " +
               std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(silent).count()) + " ms");
    }
}

bool CaptureHandle::next(AudioChunk& chunk) {
    claimMode(Mode::Pull);

    while (true) {
        const PopStatus status = channel_.popFor(chunk, std::chrono::milliseconds(kWatchdogPollMs));
        if (status == PopStatus::Item) {
            logDrops();
            return true;
        }
        if (status == PopStatus::Closed) break;
        checkStalled();
    }

    std::lock_guard<std::mutex> lock(lost_mutex_);
    if (lost_ && !lostReported_ && !closed_.load()) {
        lostReported_ = true;
        throw DeviceLostError("input device lost: " + lostReason_);
    }
    return false;
}

void CaptureHandle::start(ChunkHandler onChunk, ErrorHandler onError) {
    claimMode(Mode::Push);
    std::lock_guard<std::mutex> lock(join_mutex_);
    delivery_ = std::thread(&CaptureHandle::deliver, this, std::move(onChunk), std::move(onError));
    deliveryId_.store(delivery_.get_id());
}

// Delivery thread for push mode
void CaptureHandle::deliver(ChunkHandler onChunk, ErrorHandler onError) {
    AudioChunk chunk;
    while (true) {
        const PopStatus status = channel_.popFor(chunk, std::chrono::milliseconds(kWatchdogPollMs));
        if (status == PopStatus::Closed) break;
        if (status == PopStatus::Timeout) {
            checkStalled();
            continue;
        }

        logDrops();
        try {
            if (onChunk) onChunk(std::move(chunk));
        } catch (const std::exception& e) {
            std::cerr << "[Capture] [ERROR] chunk handler threw: " << e.what() << "\n";
        }
    }

    {
        std::lock_guard<std::mutex> lock(delivered_mutex_);
        delivered_ = true;
    }
    delivered_cv_.notify_all();

    std::string reason;
    {
        std::lock_guard<std::mutex> lock(lost_mutex_);
        if (!lost_ || lostReported_ || closed_.load()) return;
        lostReported_ = true;
        reason = lostReason_;
    }
    if (onError) onError(DeviceLostError("input device lost: " + reason));
}

// Safe from any thread, including the delivery thread itself
void CaptureHandle::joinDelivery() {
    if (std::this_thread::get_id() == deliveryId_.load()) return;

    std::lock_guard<std::mutex> lock(join_mutex_);
    if (delivery_.joinable() && delivery_.get_id() != std::this_thread::get_id()) {
        delivery_.join();
    }
}

void CaptureHandle::halt() {
    if (stopped_.exchange(true)) return;

    exhausted_.store(true);
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        if (stream_) stream_->stop();
    }
    channel_.close();
    std::cout << "[Capture] [INFO] stopped device " << device_.index << "\n";
}

bool CaptureHandle::waitDrained(std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(mode_mutex_);
        if (mode_ != Mode::Push) return true;
    }
    std::unique_lock<std::mutex> lock(delivered_mutex_);
    return delivered_cv_.wait_for(lock, timeout, [this] { return delivered_; });
}

void CaptureHandle::stop() {
    halt();
    joinDelivery();
}

void CaptureHandle::close() {
    if (closed_.exchange(true)) return;
    stopped_.store(true);

    // Cancel first so a producer parked in a blocking push can return
    channel_.cancel();
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        if (stream_) stream_->stop();
    }

    joinDelivery();
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        stream_.reset();
    }

    std::cout << "[Capture] [INFO] released device " << device_.index << " after "
              << produced_.load() << " chunk(s), " << channel_.droppedCount() << " dropped\n";
}

// Constructor
CaptureEngine::CaptureEngine(AudioBackend& backend) : backend_(backend) {}

std::unique_ptr<CaptureHandle> CaptureEngine::open(const std::optional<Device>& device,
                                                   const CaptureConfig& config) {
    if (config.sampleRate <= 0 || config.channels <= 0 || config.chunkSize <= 0) {
        throw std::invalid_argument("capture format must have a positive rate, channel count and chunk size");
    }

    Device target;
    if (device) {
        target = *device;
    } else {
        DeviceRegistry registry(backend_);
        std::optional<Device> fallback = registry.defaultDevice();
        if (!fallback) throw DeviceEnumerationError("no input device available");
        target = *fallback;
    }

    std::unique_ptr<CaptureHandle> handle(new CaptureHandle(target, config));
    CaptureHandle* raw = handle.get();

    StreamFormat requested;
    requested.sampleRate = config.sampleRate;
    requested.channels = config.channels;

    handle->stream_ = backend_.openStream(
        target, requested, config.chunkSize,
        [raw](const int16_t* samples, size_t frames) { raw->onSamples(samples, frames); },
        [raw](const std::string& reason) { raw->onLost(reason); });

    handle->converter_ = std::make_unique<FormatConverter>(handle->stream_->nativeFormat(), requested,
                                                           (size_t)config.chunkSize);

    std::cout << "[Capture] [INFO] opened " << target.name << " (" << target.index << "): "
              << config.sampleRate << " Hz, " << config.channels << " ch, chunk " << config.chunkSize
              << " frames";
    if (!handle->converter_->passthrough()) {
        const StreamFormat native = handle->converter_->input();
        std::cout << ", converting from " << native.sampleRate << " Hz / " << native.channels << " ch";
    }
    std::cout << "\n";

    handle->lastCallback_.store(std::chrono::steady_clock::now().time_since_epoch().count());
    handle->stream_->start();
    return handle;
}
