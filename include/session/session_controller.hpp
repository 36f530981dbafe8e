#ifndef SESSION_CONTROLLER_HPP
#define SESSION_CONTROLLER_HPP

#include "audio/audio_backend.hpp"
#include "audio/capture_engine.hpp"
#include "stt/transport_session.hpp"
#include "transcript/token_assembler.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

enum class SessionState { Idle, RequestingDevice, Connecting, Streaming, Stopping, Stopped, Failed };

const char* toString(SessionState state);

// What the presentation layer reads.
struct SessionSnapshot {
    SessionState state = SessionState::Idle;
    std::string transcript;         // finalized text plus trailing partial
    std::string finalText;
    TranscriptStats stats;
    float level = 0.0f;             // of the most recent chunk
    std::optional<int> deviceIndex;
    std::string lastError;
};

// Runs one capture -> transport -> assembler pipeline at a time. start()
// and stop() are called from the presentation side; audio and results move on
// the capture, send and receive threads.
class SessionController {
public:
    struct Config {
        std::string endpoint = "wss://stt-rt.soniox.com/transcribe-websocket";
        CaptureConfig capture;
        TransportConfig transport;
        int drainGraceMs = 5000;    // wait for final tokens after end of audio
    };

    using ChannelFactory = std::function<std::unique_ptr<MessageChannel>()>;
    using UpdateCallback = std::function<void(const SessionSnapshot& snapshot)>;

    SessionController(AudioBackend& backend, ChannelFactory channelFactory, Config config);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Device used by the next start(); none means the host default.
    void selectDevice(std::optional<int> index);

    // Opens the device, connects and begins streaming. Throws
    // SessionBusyError while a session is live; any other failure leaves the
    // session Failed and is rethrown.
    void start();

    // Graceful teardown: stop capture, finish, drain tokens for up to
    // drainGraceMs, close the transport, release the device. No-op unless
    // streaming.
    void stop();

    SessionState state() const;
    SessionSnapshot snapshot() const;

    // Waits until the current session is Stopped or Failed.
    bool waitUntilEnded(std::chrono::milliseconds timeout);

    // Called from internal threads after every transcript or state change.
    void setUpdateCallback(UpdateCallback callback);

private:
    void receiveLoop();
    void failSession(const std::string& message);
    void setState(SessionState state);
    void notify();
    void joinReceiver();

    AudioBackend& backend_;
    ChannelFactory channelFactory_;
    Config config_;

    std::mutex lifecycle_mutex_;         // serializes start/stop

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    SessionState state_ = SessionState::Idle;
    std::string lastError_;
    std::optional<int> selectedDevice_;
    std::optional<int> activeDevice_;
    std::chrono::steady_clock::time_point startedAt_;
    std::chrono::steady_clock::time_point endedAt_;
    bool receiveDone_ = false;
    bool backendFinished_ = false;
    bool terminating_ = false;        // failSession() teardown in progress

    std::mutex callback_mutex_;
    UpdateCallback onUpdate_;

    std::unique_ptr<CaptureHandle> capture_;
    std::unique_ptr<TransportSession> transport_;
    TokenAssembler assembler_;
    std::thread receiver_;
    std::atomic<float> level_{0.0f};
};

#endif
