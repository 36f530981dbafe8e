#ifndef TRANSPORT_SESSION_HPP
#define TRANSPORT_SESSION_HPP

#include "audio/audio_chunk.hpp"
#include "audio/chunk_channel.hpp"
#include "stt/message_channel.hpp"
#include "stt/message_codec.hpp"
#include "stt/stream_event.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

enum class TransportState { Idle, Connecting, Streaming, Finishing, Closed, Failed };

const char* toString(TransportState state);

struct TransportConfig {
    RecognitionConfig recognition;
    size_t sendQueueCapacity = 64;   // chunks; send() waits for room beyond this
};

// One connection to the recognition backend. Audio goes out through a
// dedicated send thread in submission order; results come back through
// receive(), which has a single consumer.
class TransportSession {
public:
    // Connects `channel` to `endpoint` and sends the recognition config.
    // Throws ConnectionError or AuthError; there is no retry.
    static std::unique_ptr<TransportSession> connect(const std::string& endpoint,
                                                     const TransportConfig& config,
                                                     std::unique_ptr<MessageChannel> channel);

    ~TransportSession();

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    // Queues the chunk for transmission, waiting while the send queue is
    // full. Returns false, without queueing, when the session no longer
    // accepts audio (finishing, closed or failed); a wait in progress is
    // abandoned as soon as finish() or close() is called.
    bool send(AudioChunk&& chunk);

    // Signals end of audio. Never waits for the network. Repeated calls have
    // no effect.
    void finish();

    // Next token or control event. Returns false when the sequence ends.
    // An unexpected disconnect yields one ControlEvent error, then false.
    // Throws ProtocolError for a malformed backend message.
    bool receive(StreamEvent& event);

    // Idempotent. Audio still queued is discarded.
    void close();

    TransportState state() const;
    std::string lastError() const;

    uint64_t bytesSent() const { return bytes_sent_.load(); }
    uint64_t chunksSent() const { return chunks_sent_.load(); }
    uint64_t sequenceGaps() const { return sequence_gaps_.load(); }

private:
    struct OutboundFrame {
        AudioChunk chunk;
        bool endOfAudio = false;
    };

    TransportSession(const TransportConfig& config, std::unique_ptr<MessageChannel> channel);

    void sendLoop();
    bool transition(TransportState to);
    void fail(const std::string& message);
    bool terminate(StreamEvent& event, const std::string& message);

    TransportConfig config_;
    std::unique_ptr<MessageChannel> channel_;

    mutable std::mutex state_mutex_;
    TransportState state_ = TransportState::Idle;
    std::string last_error_;

    ChunkChannel<OutboundFrame> outbound_;
    std::thread send_thread_;
    std::mutex send_mutex_;
    std::atomic<bool> closing_{false};
    std::atomic<bool> finish_requested_{false};

    std::deque<StreamEvent> pending_;
    bool receive_done_ = false;

    bool have_sequence_ = false;
    uint64_t last_sequence_ = 0;

    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<uint64_t> chunks_sent_{0};
    std::atomic<uint64_t> sequence_gaps_{0};
};

#endif
