#include "session/session_controller.hpp"
#include "audio/device_registry.hpp"
#include "audio/level_meter.hpp"
#include "core/errors.hpp"

#include <chrono>
#include <iostream>
#include <utility>

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::RequestingDevice: return "requesting_device";
        case SessionState::Connecting: return "connecting";
        case SessionState::Streaming: return "streaming";
        case SessionState::Stopping: return "stopping";
        case SessionState::Stopped: return "stopped";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

// Constructor
SessionController::SessionController(AudioBackend& backend, ChannelFactory channelFactory, Config config)
    : backend_(backend), channelFactory_(std::move(channelFactory)), config_(std::move(config)) {}

// Destructor
SessionController::~SessionController() {
    stop();
    joinReceiver();
    transport_.reset();
    capture_.reset();
}

void SessionController::selectDevice(std::optional<int> index) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    selectedDevice_ = index;
}

void SessionController::setUpdateCallback(UpdateCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    onUpdate_ = std::move(callback);
}

SessionState SessionController::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void SessionController::setState(SessionState state) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = state;
    }
    std::cout << "[Session] [INFO] " << toString(state) << "\n";
    state_cv_.notify_all();
    notify();
}

void SessionController::notify() {
    UpdateCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = onUpdate_;
    }
    if (callback) callback(snapshot());
}

SessionSnapshot SessionController::snapshot() const {
    SessionSnapshot s;
    const TranscriptState transcriptState = assembler_.snapshot();
    s.transcript = transcript::render(transcriptState);
    s.finalText = transcript::finalText(transcriptState);
    s.level = level_.load();

    std::lock_guard<std::mutex> lock(state_mutex_);
    s.state = state_;
    s.lastError = lastError_;
    s.deviceIndex = activeDevice_;

    std::chrono::steady_clock::duration elapsed{0};
    if (state_ == SessionState::Streaming || state_ == SessionState::Stopping) {
        elapsed = std::chrono::steady_clock::now() - startedAt_;
    } else if (endedAt_ > startedAt_ && startedAt_.time_since_epoch().count() != 0) {
        elapsed = endedAt_ - startedAt_;
    }
    s.stats = transcript::stats(transcriptState, elapsed, transport_ ? transport_->bytesSent() : 0);
    return s;
}

bool SessionController::waitUntilEnded(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [this] {
        return !terminating_ && (state_ == SessionState::Stopped || state_ == SessionState::Failed);
    });
}

void SessionController::joinReceiver() {
    if (receiver_.joinable() && receiver_.get_id() != std::this_thread::get_id()) {
        receiver_.join();
    }
}

void SessionController::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (terminating_ || (state_ != SessionState::Idle && state_ != SessionState::Stopped &&
                             state_ != SessionState::Failed)) {
            throw SessionBusyError(std::string("a session is already active (") + toString(state_) + ")");
        }
    }

    // Retire the previous session before building a new one
    joinReceiver();
    std::unique_ptr<TransportSession> oldTransport;
    std::unique_ptr<CaptureHandle> oldCapture;
    std::optional<int> selected;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        oldTransport = std::move(transport_);
        oldCapture = std::move(capture_);
        state_ = SessionState::Idle;
        lastError_.clear();
        activeDevice_.reset();
        receiveDone_ = false;
        backendFinished_ = false;
        startedAt_ = std::chrono::steady_clock::time_point();
        endedAt_ = std::chrono::steady_clock::time_point();
        selected = selectedDevice_;
    }
    oldTransport.reset();
    oldCapture.reset();
    assembler_.reset();
    level_.store(0.0f);

    setState(SessionState::RequestingDevice);
    std::unique_ptr<CaptureHandle> capture;
    try {
        std::optional<Device> device;
        if (selected) {
            DeviceRegistry registry(backend_);
            device = registry.findDevice(*selected);
            if (!device) throw DeviceEnumerationError("input device " + std::to_string(*selected) + " not found");
        }
        CaptureEngine engine(backend_);
        capture = engine.open(device, config_.capture);
    } catch (const std::exception& e) {
        failSession(e.what());
        throw;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        activeDevice_ = capture->device().index;
        capture_ = std::move(capture);
    }

    setState(SessionState::Connecting);
    std::unique_ptr<TransportSession> transport;
    try {
        TransportConfig transportConfig = config_.transport;
        transportConfig.recognition.sampleRate = config_.capture.sampleRate;
        transportConfig.recognition.numChannels = config_.capture.channels;
        transport = TransportSession::connect(config_.endpoint, transportConfig, channelFactory_());
    } catch (const std::exception& e) {
        failSession(e.what());
        throw;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        transport_ = std::move(transport);
        startedAt_ = std::chrono::steady_clock::now();
    }

    setState(SessionState::Streaming);
    TransportSession* sink = transport_.get();
    try {
        receiver_ = std::thread(&SessionController::receiveLoop, this);
        capture_->start(
            [this, sink](AudioChunk&& chunk) {
                level_.store(level_meter::level(chunk));
                sink->send(std::move(chunk));
            },
            [this](const StreamError& error) { failSession(error.what()); });
    } catch (const std::exception& e) {
        failSession(e.what());
        throw;
    }
}

static std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

void SessionController::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::Streaming || terminating_) return;
    }
    setState(SessionState::Stopping);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.drainGraceMs);

    // Fixed order: device, end of audio, drain, transport, release.
    // Every wait shares one deadline so a stalled socket cannot hold stop().
    capture_->halt();
    if (!capture_->waitDrained(remaining(deadline))) {
        std::cout << "[Session] [WARN] captured audio still queued after " << config_.drainGraceMs
                  << " ms, dropping the rest\n";
    }
    transport_->finish();
    capture_->stop();

    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        const bool drained = state_cv_.wait_until(lock, deadline,
                                                  [this] { return receiveDone_ || backendFinished_; });
        if (!drained) {
            std::cout << "[Session] [WARN] no end of stream after " << config_.drainGraceMs
                      << " ms, closing anyway\n";
        }
    }

    transport_->close();
    joinReceiver();
    capture_->close();

    bool stopped = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Stopping && !terminating_) {
            state_ = SessionState::Stopped;
            endedAt_ = std::chrono::steady_clock::now();
            stopped = true;
        }
    }
    if (stopped) {
        const SessionSnapshot s = snapshot();
        std::cout << "[Session] [INFO] stopped: " << s.stats.wordCount << " word(s), "
                  << s.stats.bytesSent << " bytes in " << s.stats.elapsedSeconds << " s\n";
    }
    state_cv_.notify_all();
    notify();
}

void SessionController::failSession(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (terminating_ || state_ == SessionState::Failed || state_ == SessionState::Stopped) return;
        terminating_ = true;
        lastError_ = message;
    }
    std::cerr << "[Session] [ERROR] " << message << "\n";

    // Transport first so a delivery thread parked in send() can return
    if (transport_) transport_->close();
    if (capture_) capture_->close();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = SessionState::Failed;
        endedAt_ = std::chrono::steady_clock::now();
        terminating_ = false;
    }
    state_cv_.notify_all();
    notify();
}

// Receive path: the only writer of the transcript
void SessionController::receiveLoop() {
    StreamEvent event;
    try {
        while (transport_->receive(event)) {
            if (const auto* token = std::get_if<Token>(&event)) {
                assembler_.apply(*token);
                notify();
                continue;
            }

            const auto& control = std::get<ControlEvent>(event);
            if (control.kind == ControlEvent::Kind::Ready) {
                std::cout << "[Session] [INFO] backend ready\n";
            } else if (control.kind == ControlEvent::Kind::Finished) {
                std::cout << "[Session] [INFO] backend delivered all final tokens\n";
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    backendFinished_ = true;
                }
                state_cv_.notify_all();
            } else if (message_codec::isAuthFailure(control.code)) {
                failSession(AuthError("authentication rejected: " + control.message).what());
            } else {
                failSession(BackendError(control.message).what());
            }
        }
    } catch (const ProtocolError& e) {
        failSession(e.what());
    } catch (const std::exception& e) {
        std::cerr << "[Session] [ERROR] receive thread: " << e.what() << "\n";
        failSession(e.what());
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        receiveDone_ = true;
    }
    state_cv_.notify_all();
}
